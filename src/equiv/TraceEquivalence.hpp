// TraceEquivalence.hpp ---
//
// Filename: TraceEquivalence.hpp
// Author: Abhishek Udupa
// Created: Fri Apr  4 22:03:09 2015 (-0400)
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

#if !defined PAV_EQUIV_TRACEEQUIVALENCE_HPP_
#define PAV_EQUIV_TRACEEQUIVALENCE_HPP_

#include <set>

#include "../common/PAVFwdDecls.hpp"

#include "EquivTypes.hpp"

namespace PAV {
    namespace Equiv {

        using LTS::LabelledTS;

        class TraceChecker
        {
        private:
            u32 MaxDepth;

        public:
            TraceChecker(u32 MaxDepth = EquivalenceOptionsT::DefaultMaxDepth);
            ~TraceChecker();

            u32 GetMaxDepth() const;

            // The non empty visible traces of length at most Depth
            static set<TraceT> ComputeTraces(const LabelledTS* TheLTS, u32 Depth);

            EquivalenceResult Check(const LabelledTS* LTS1, const LabelledTS* LTS2) const;
            // Every trace of Impl is a trace of Spec
            EquivalenceResult CheckInclusion(const LabelledTS* Spec,
                                             const LabelledTS* Impl) const;
        };

    } /* end namespace Equiv */
} /* end namespace PAV */

#endif /* PAV_EQUIV_TRACEEQUIVALENCE_HPP_ */

//
// TraceEquivalence.hpp ends here
