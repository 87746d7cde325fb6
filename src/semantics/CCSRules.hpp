// CCSRules.hpp ---
//
// Filename: CCSRules.hpp
// Author: Abhishek Udupa
// Created: Sat Mar 26 20:23:49 2015 (-0500)
//
//
// Copyright (c) 2013, Abhishek Udupa, University of Pennsylvania
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. All advertising materials mentioning features or use of this software
//    must display the following acknowledgement:
//    This product includes software developed by The University of Pennsylvania
// 4. Neither the name of the University of Pennsylvania nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDER ''AS IS'' AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//
//

// Code:

// Parallel composition in CCS: free interleaving, plus a silent
// handshake between complementary actions of the two operands.

#if !defined PAV_SEMANTICS_CCSRULES_HPP_
#define PAV_SEMANTICS_CCSRULES_HPP_

#include "SOSRules.hpp"

namespace PAV {
    namespace Sem {

        class CCSInterleavingRule : public ParallelRuleBase
        {
        public:
            CCSInterleavingRule();
            virtual ~CCSInterleavingRule();

            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;
        };

        class CCSCommunicationRule : public ParallelRuleBase
        {
        public:
            CCSCommunicationRule();
            virtual ~CCSCommunicationRule();

            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;
        };

    } /* end namespace Sem */
} /* end namespace PAV */

#endif /* PAV_SEMANTICS_CCSRULES_HPP_ */

//
// CCSRules.hpp ends here
