// Bisimulation.hpp ---
//
// Filename: Bisimulation.hpp
// Author: Abhishek Udupa
// Created: Sun Apr 18 18:37:11 2015 (-0400)
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

// Strong and weak bisimulation by signature based partition
// refinement over the disjoint union of the two LTSs. The
// signature of a state is the set of (action, block of target)
// pairs of its transitions; blocks are split until every member
// of a block has the same signature. Weak bisimulation runs the
// same refinement on the saturated relation, where a visible
// step is tau* a tau* and a silent step is tau* (possibly empty).

#if !defined PAV_EQUIV_BISIMULATION_HPP_
#define PAV_EQUIV_BISIMULATION_HPP_

#include <vector>

#include "../common/PAVFwdDecls.hpp"

#include "EquivTypes.hpp"

namespace PAV {
    namespace Equiv {

        using LTS::LabelledTS;

        namespace Detail {

            // Adjacency lists of a graph with dense state numbers
            typedef vector<vector<pair<Action, u32>>> GraphT;

            // Block number per state of the coarsest stable partition
            extern vector<u32> RefinePartition(const GraphT& Graph, const string& LogTag);

        } /* end namespace Detail */

        class BisimulationChecker
        {
        private:
            // Appends the (optionally saturated) graph of TheLTS,
            // with state numbers shifted by Offset
            static void AppendGraph(const LabelledTS* TheLTS, u32 Offset, bool Saturate,
                                    Detail::GraphT& Graph);

            static EquivalenceResult Check(const LabelledTS* LTS1, const LabelledTS* LTS2,
                                           bool Weak);

        public:
            BisimulationChecker();
            ~BisimulationChecker();

            // Block number per state of TheLTS
            static vector<u32> ComputeStrongPartition(const LabelledTS* TheLTS);
            static vector<u32> ComputeWeakPartition(const LabelledTS* TheLTS);
            static u32 CountBlocks(const vector<u32>& Partition);

            EquivalenceResult CheckStrong(const LabelledTS* LTS1, const LabelledTS* LTS2) const;
            EquivalenceResult CheckWeak(const LabelledTS* LTS1, const LabelledTS* LTS2) const;
        };

    } /* end namespace Equiv */
} /* end namespace PAV */

#endif /* PAV_EQUIV_BISIMULATION_HPP_ */

//
// Bisimulation.hpp ends here
