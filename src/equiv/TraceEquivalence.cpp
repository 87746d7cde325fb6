// TraceEquivalence.cpp ---
//
// Filename: TraceEquivalence.cpp
// Author: Abhishek Udupa
// Created: Sat Apr 11 13:20:40 2015 (-0400)
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

#include "../lts/LabelledTS.hpp"
#include "../lts/LTSAnalyses.hpp"

#include "SubsetPairExplorer.hpp"
#include "TraceEquivalence.hpp"

namespace PAV {
    namespace Equiv {

        using namespace LTS;

        namespace Detail {

            // Extends Trace along every visible action, keeping one
            // closed state set per branch so that no partial trace
            // is expanded twice
            static void CollectTraces(const LabelledTS* TheLTS, const StateSetT& States,
                                      TraceT& Trace, u32 Depth, set<TraceT>& Traces)
            {
                if (Trace.size() >= Depth) {
                    return;
                }
                for (auto const& TheAction : VisibleInitials(TheLTS, States)) {
                    auto Next = WeakAfter(TheLTS, States, TheAction);
                    Trace.push_back(TheAction);
                    if (Traces.insert(Trace).second) {
                        CollectTraces(TheLTS, Next, Trace, Depth, Traces);
                    }
                    Trace.pop_back();
                }
            }

            static inline Action FirstDifference(const set<Action>& Actions1,
                                                 const set<Action>& Actions2)
            {
                for (auto const& TheAction : Actions1) {
                    if (Actions2.find(TheAction) == Actions2.end()) {
                        return TheAction;
                    }
                }
                return "";
            }

        } /* end namespace Detail */

        TraceChecker::TraceChecker(u32 MaxDepth)
            : MaxDepth(MaxDepth)
        {
            // Nothing here
        }

        TraceChecker::~TraceChecker()
        {
            // Nothing here
        }

        u32 TraceChecker::GetMaxDepth() const
        {
            return MaxDepth;
        }

        set<TraceT> TraceChecker::ComputeTraces(const LabelledTS* TheLTS, u32 Depth)
        {
            set<TraceT> Retval;
            TraceT Trace;
            Detail::CollectTraces(TheLTS, TauClosure(TheLTS, TheLTS->GetInitialState()),
                                  Trace, Depth, Retval);
            return Retval;
        }

        EquivalenceResult TraceChecker::Check(const LabelledTS* LTS1,
                                              const LabelledTS* LTS2) const
        {
            SubsetPairExplorer Explorer(LTS1, LTS2, MaxDepth, "Trace.Exploration");
            return Explorer.Explore([&] (const StateSetT& Set1, const StateSetT& Set2,
                                         const TraceT& Trace, Witness& TheWitness) -> bool
                                    {
                                        auto Initials1 = VisibleInitials(LTS1, Set1);
                                        auto Initials2 = VisibleInitials(LTS2, Set2);
                                        if (Initials1 == Initials2) {
                                            return true;
                                        }
                                        auto Diff = Detail::FirstDifference(Initials1,
                                                                            Initials2);
                                        if (Diff == "") {
                                            Diff = Detail::FirstDifference(Initials2,
                                                                           Initials1);
                                        }
                                        TheWitness.Trace.push_back(Diff);
                                        return false;
                                    });
        }

        EquivalenceResult TraceChecker::CheckInclusion(const LabelledTS* Spec,
                                                       const LabelledTS* Impl) const
        {
            SubsetPairExplorer Explorer(Spec, Impl, MaxDepth, "Trace.Exploration");
            return Explorer.Explore([&] (const StateSetT& SpecSet, const StateSetT& ImplSet,
                                         const TraceT& Trace, Witness& TheWitness) -> bool
                                    {
                                        auto Diff =
                                            Detail::FirstDifference(VisibleInitials(Impl,
                                                                                    ImplSet),
                                                                    VisibleInitials(Spec,
                                                                                    SpecSet));
                                        if (Diff == "") {
                                            return true;
                                        }
                                        TheWitness.Trace.push_back(Diff);
                                        return false;
                                    });
        }

    } /* end namespace Equiv */
} /* end namespace PAV */

//
// TraceEquivalence.cpp ends here
