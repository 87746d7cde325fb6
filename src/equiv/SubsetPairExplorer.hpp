// SubsetPairExplorer.hpp ---
//
// Filename: SubsetPairExplorer.hpp
// Author: Abhishek Udupa
// Created: Wed Apr 17 12:29:07 2015 (-0400)
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

// Bounded, cycle safe exploration of the pairs of silent closed
// state sets that two LTSs reach on the same visible trace.
// This is the common core of the trace, testing and failures
// checkers, which differ only in what they compare at each pair.

#if !defined PAV_EQUIV_SUBSETPAIREXPLORER_HPP_
#define PAV_EQUIV_SUBSETPAIREXPLORER_HPP_

#include <functional>
#include <set>

#include "../common/PAVFwdDecls.hpp"

#include "EquivTypes.hpp"

namespace PAV {
    namespace Equiv {

        using LTS::LabelledTS;
        using LTS::StateSetT;

        class SubsetPairExplorer
        {
        public:
            // Inspects the sets reached by Trace. Returns false and
            // fills in the witness when the two sides differ.
            typedef function<bool(const StateSetT& Set1, const StateSetT& Set2,
                                  const TraceT& Trace, Witness& TheWitness)> PairCheckT;
            // Returns false for a pair whose successors need not be
            // explored. An empty function expands every pair.
            typedef function<bool(const StateSetT& Set1,
                                  const StateSetT& Set2)> PairExpandT;

        private:
            const LabelledTS* LTS1;
            const LabelledTS* LTS2;
            u32 MaxDepth;
            string LogTag;

            bool Truncated;
            u64 NumPairsVisited;

        public:
            SubsetPairExplorer(const LabelledTS* LTS1, const LabelledTS* LTS2,
                               u32 MaxDepth, const string& LogTag = "Trace.Exploration");
            ~SubsetPairExplorer();

            // Equivalent if every reachable pair passed and the pair
            // space was exhausted within the bound, NotEquivalent on
            // the first failing pair, Inconclusive otherwise.
            EquivalenceResult Explore(const PairCheckT& Check,
                                      const PairExpandT& Expand = PairExpandT());

            bool WasTruncated() const;
            u64 GetNumPairsVisited() const;
            u32 GetMaxDepth() const;
        };

    } /* end namespace Equiv */
} /* end namespace PAV */

#endif /* PAV_EQUIV_SUBSETPAIREXPLORER_HPP_ */

//
// SubsetPairExplorer.hpp ends here
