// FailuresEquivalence.hpp ---
//
// Filename: FailuresEquivalence.hpp
// Author: Abhishek Udupa
// Created: Thu Apr 19 10:45:15 2015 (-0400)
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

// Stable failures equivalence and refinement. A failure is a pair
// of a visible trace and a set of visible actions that a stable
// state reached by the trace refuses. Refusals are represented by
// the maximal ones: the complements of the initials of the stable
// states reached.

#if !defined PAV_EQUIV_FAILURESEQUIVALENCE_HPP_
#define PAV_EQUIV_FAILURESEQUIVALENCE_HPP_

#include <map>
#include <set>

#include "../common/PAVFwdDecls.hpp"

#include "EquivTypes.hpp"

namespace PAV {
    namespace Equiv {

        using LTS::LabelledTS;

        typedef map<TraceT, ActionSetFamilyT> FailuresMapT;

        class FailuresChecker
        {
        private:
            u32 MaxDepth;

        public:
            FailuresChecker(u32 MaxDepth = EquivalenceOptionsT::DefaultMaxDepth);
            ~FailuresChecker();

            u32 GetMaxDepth() const;

            // Maps every trace of length at most Depth, the empty one
            // included, to its maximal refusals relative to Alphabet
            static FailuresMapT ComputeFailures(const LabelledTS* TheLTS, u32 Depth,
                                                const set<Action>& Alphabet);
            // Relative to the visible actions of TheLTS
            static FailuresMapT ComputeFailures(const LabelledTS* TheLTS, u32 Depth);

            EquivalenceResult Check(const LabelledTS* LTS1, const LabelledTS* LTS2) const;
            // Every failure of Impl is a failure of Spec
            EquivalenceResult CheckRefinement(const LabelledTS* Spec,
                                              const LabelledTS* Impl) const;
        };

    } /* end namespace Equiv */
} /* end namespace PAV */

#endif /* PAV_EQUIV_FAILURESEQUIVALENCE_HPP_ */

//
// FailuresEquivalence.hpp ends here
