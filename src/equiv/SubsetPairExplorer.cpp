// SubsetPairExplorer.cpp ---
//
// Filename: SubsetPairExplorer.cpp
// Author: Abhishek Udupa
// Created: Thu Apr 24 17:46:38 2015 (-0400)
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

#include <deque>

#include "../lts/LabelledTS.hpp"
#include "../lts/LTSAnalyses.hpp"
#include "../utils/LogManager.hpp"

#include "SubsetPairExplorer.hpp"

namespace PAV {
    namespace Equiv {

        using namespace LTS;

        namespace Detail {

            struct PairEntryT
            {
                StateSetT Set1;
                StateSetT Set2;
                TraceT Trace;

                inline PairEntryT(const StateSetT& Set1, const StateSetT& Set2,
                                  const TraceT& Trace)
                    : Set1(Set1), Set2(Set2), Trace(Trace)
                {
                    // Nothing here
                }
            };

            static inline string StateSetToString(const StateSetT& States)
            {
                ostringstream sstr;
                sstr << "{";
                bool First = true;
                for (auto State : States) {
                    if (!First) {
                        sstr << ", ";
                    }
                    First = false;
                    sstr << State;
                }
                sstr << "}";
                return sstr.str();
            }

        } /* end namespace Detail */

        SubsetPairExplorer::SubsetPairExplorer(const LabelledTS* LTS1, const LabelledTS* LTS2,
                                               u32 MaxDepth, const string& LogTag)
            : LTS1(LTS1), LTS2(LTS2), MaxDepth(MaxDepth), LogTag(LogTag),
              Truncated(false), NumPairsVisited(0)
        {
            // Nothing here
        }

        SubsetPairExplorer::~SubsetPairExplorer()
        {
            // Nothing here
        }

        EquivalenceResult SubsetPairExplorer::Explore(const PairCheckT& Check,
                                                     const PairExpandT& Expand)
        {
            Truncated = false;
            NumPairsVisited = 0;

            set<pair<StateSetT, StateSetT>> Visited;
            deque<Detail::PairEntryT> BFSQueue;

            auto Init1 = TauClosure(LTS1, LTS1->GetInitialState());
            auto Init2 = TauClosure(LTS2, LTS2->GetInitialState());
            Visited.insert(make_pair(Init1, Init2));
            BFSQueue.push_back(Detail::PairEntryT(Init1, Init2, TraceT()));

            while (BFSQueue.size() > 0) {
                auto CurEntry = BFSQueue.front();
                BFSQueue.pop_front();
                ++NumPairsVisited;

                PAV_LOG_SHORT(LogTag,
                              Out_ << "[Pairs] <" << TraceToString(CurEntry.Trace) << "> : "
                                   << Detail::StateSetToString(CurEntry.Set1) << " vs "
                                   << Detail::StateSetToString(CurEntry.Set2) << endl;);

                Witness TheWitness(CurEntry.Trace);
                if (!Check(CurEntry.Set1, CurEntry.Set2, CurEntry.Trace, TheWitness)) {
                    return EquivalenceResult(VerdictT::NotEquivalent, TheWitness);
                }

                if (Expand && !Expand(CurEntry.Set1, CurEntry.Set2)) {
                    continue;
                }

                bool AtBound = (CurEntry.Trace.size() >= MaxDepth);

                auto Actions = VisibleInitials(LTS1, CurEntry.Set1);
                auto&& Actions2 = VisibleInitials(LTS2, CurEntry.Set2);
                Actions.insert(Actions2.begin(), Actions2.end());

                for (auto const& TheAction : Actions) {
                    auto Next1 = WeakAfter(LTS1, CurEntry.Set1, TheAction);
                    auto Next2 = WeakAfter(LTS2, CurEntry.Set2, TheAction);
                    // A one sided move is the business of the check
                    // on the current pair
                    if (Next1.size() == 0 || Next2.size() == 0) {
                        continue;
                    }
                    auto NextPair = make_pair(Next1, Next2);
                    if (Visited.find(NextPair) != Visited.end()) {
                        continue;
                    }
                    if (AtBound) {
                        Truncated = true;
                        continue;
                    }
                    Visited.insert(NextPair);
                    TraceT NextTrace(CurEntry.Trace);
                    NextTrace.push_back(TheAction);
                    BFSQueue.push_back(Detail::PairEntryT(Next1, Next2, NextTrace));
                }
            }

            PAV_LOG_SHORT(LogTag,
                          Out_ << "[Pairs] Explored " << NumPairsVisited << " pairs"
                               << (Truncated ? ", truncated at depth " +
                                   to_string(MaxDepth) : string("")) << endl;);

            if (Truncated) {
                return EquivalenceResult(VerdictT::Inconclusive,
                                         (string)"no difference found on traces of length " +
                                         "up to " + to_string(MaxDepth) + ", but the " +
                                         "exploration did not saturate");
            }
            return EquivalenceResult(VerdictT::Equivalent);
        }

        bool SubsetPairExplorer::WasTruncated() const
        {
            return Truncated;
        }

        u64 SubsetPairExplorer::GetNumPairsVisited() const
        {
            return NumPairsVisited;
        }

        u32 SubsetPairExplorer::GetMaxDepth() const
        {
            return MaxDepth;
        }

    } /* end namespace Equiv */
} /* end namespace PAV */

//
// SubsetPairExplorer.cpp ends here
