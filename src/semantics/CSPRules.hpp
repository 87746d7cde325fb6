// CSPRules.hpp ---
//
// Filename: CSPRules.hpp
// Author: Abhishek Udupa
// Created: Mon Mar 13 16:57:51 2015 (-0500)
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

// Choice and parallel composition in CSP. A choice is external:
// silent steps of a branch are resolved internally and leave the
// choice in place. Actions in the synchronization alphabet need
// every participant to offer them and stay visible; all other
// actions (the silent one included) interleave.

#if !defined PAV_SEMANTICS_CSPRULES_HPP_
#define PAV_SEMANTICS_CSPRULES_HPP_

#include <set>

#include "SOSRules.hpp"

namespace PAV {
    namespace Sem {

        using Terms::Action;

        class CSPExternalChoiceRule : public ChoiceRule
        {
        public:
            CSPExternalChoiceRule();
            virtual ~CSPExternalChoiceRule();

            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;
        };

        class CSPInterleavingRule : public ParallelRuleBase
        {
        private:
            set<Action> SyncAlphabet;

        public:
            CSPInterleavingRule(const set<Action>& SyncAlphabet);
            virtual ~CSPInterleavingRule();

            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;
        };

        class CSPSynchronizationRule : public ParallelRuleBase
        {
        private:
            set<Action> SyncAlphabet;

        public:
            CSPSynchronizationRule(const set<Action>& SyncAlphabet);
            virtual ~CSPSynchronizationRule();

            const set<Action>& GetSyncAlphabet() const;

            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;
        };

        // Throws ConfigurationError if the alphabet names the silent
        // action or an ill formed action
        extern void ValidateSyncAlphabet(const set<Action>& SyncAlphabet);

    } /* end namespace Sem */
} /* end namespace PAV */

#endif /* PAV_SEMANTICS_CSPRULES_HPP_ */

//
// CSPRules.hpp ends here
