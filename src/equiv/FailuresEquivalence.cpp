// FailuresEquivalence.cpp ---
//
// Filename: FailuresEquivalence.cpp
// Author: Abhishek Udupa
// Created: Fri Apr 26 15:02:46 2015 (-0400)
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

#include <boost/algorithm/string/join.hpp>

#include "../lts/LabelledTS.hpp"
#include "../lts/LTSAnalyses.hpp"
#include "../utils/LogManager.hpp"

#include "SubsetPairExplorer.hpp"
#include "TraceEquivalence.hpp"
#include "FailuresEquivalence.hpp"

namespace PAV {
    namespace Equiv {

        using namespace LTS;

        namespace Detail {

            static inline ActionSetFamilyT MaximalRefusals(const LabelledTS* TheLTS,
                                                           const StateSetT& States,
                                                           const set<Action>& Alphabet)
            {
                ActionSetFamilyT Refusals;
                for (auto const& Initials : StableInitials(TheLTS, States)) {
                    Refusals.insert(ComplementSet(Alphabet, Initials));
                }
                return MaximalSets(Refusals);
            }

            // A refusal of Refusals1 not contained in any of Refusals2
            static inline bool FindUncoveredRefusal(const ActionSetFamilyT& Refusals1,
                                                    const ActionSetFamilyT& Refusals2,
                                                    set<Action>& Uncovered)
            {
                for (auto const& Refusal : Refusals1) {
                    if (!IsCovered(Refusal, Refusals2)) {
                        Uncovered = Refusal;
                        return true;
                    }
                }
                return false;
            }

            static inline bool FindExtraAction(const set<Action>& Actions1,
                                               const set<Action>& Actions2,
                                               Action& Extra)
            {
                for (auto const& TheAction : Actions1) {
                    if (Actions2.find(TheAction) == Actions2.end()) {
                        Extra = TheAction;
                        return true;
                    }
                }
                return false;
            }

            static inline string FamilyToString(const ActionSetFamilyT& Family)
            {
                vector<string> Members;
                for (auto const& Member : Family) {
                    Members.push_back("{" + boost::algorithm::join(Member, ", ") + "}");
                }
                return "[" + boost::algorithm::join(Members, ", ") + "]";
            }

        } /* end namespace Detail */

        FailuresChecker::FailuresChecker(u32 MaxDepth)
            : MaxDepth(MaxDepth)
        {
            // Nothing here
        }

        FailuresChecker::~FailuresChecker()
        {
            // Nothing here
        }

        u32 FailuresChecker::GetMaxDepth() const
        {
            return MaxDepth;
        }

        FailuresMapT FailuresChecker::ComputeFailures(const LabelledTS* TheLTS, u32 Depth,
                                                      const set<Action>& Alphabet)
        {
            auto&& Traces = TraceChecker::ComputeTraces(TheLTS, Depth);
            Traces.insert(TraceT());

            FailuresMapT Retval;
            for (auto const& Trace : Traces) {
                auto Reached = TauClosure(TheLTS, TheLTS->GetInitialState());
                for (auto const& TheAction : Trace) {
                    Reached = WeakAfter(TheLTS, Reached, TheAction);
                }
                Retval[Trace] = Detail::MaximalRefusals(TheLTS, Reached, Alphabet);

                PAV_LOG_SHORT("Failures.Refusals",
                              Out_ << "[Refusals] <" << TraceToString(Trace) << "> : "
                                   << Detail::FamilyToString(Retval[Trace]) << endl;);
            }
            return Retval;
        }

        FailuresMapT FailuresChecker::ComputeFailures(const LabelledTS* TheLTS, u32 Depth)
        {
            return ComputeFailures(TheLTS, Depth, TheLTS->GetVisibleActions());
        }

        EquivalenceResult FailuresChecker::Check(const LabelledTS* LTS1,
                                                 const LabelledTS* LTS2) const
        {
            auto Alphabet = LTS1->GetVisibleActions();
            auto&& Actions2 = LTS2->GetVisibleActions();
            Alphabet.insert(Actions2.begin(), Actions2.end());
            string Message;

            auto PairCheck = [&] (const StateSetT& Set1, const StateSetT& Set2,
                                  const TraceT& Trace, Witness& TheWitness) -> bool
                {
                    auto&& Initials1 = VisibleInitials(LTS1, Set1);
                    auto&& Initials2 = VisibleInitials(LTS2, Set2);
                    Action Extra;
                    if (Detail::FindExtraAction(Initials1, Initials2, Extra) ||
                        Detail::FindExtraAction(Initials2, Initials1, Extra)) {
                        TheWitness.Trace.push_back(Extra);
                        Message = "the traces differ";
                        return false;
                    }

                    auto&& Refusals1 = Detail::MaximalRefusals(LTS1, Set1, Alphabet);
                    auto&& Refusals2 = Detail::MaximalRefusals(LTS2, Set2, Alphabet);

                    PAV_LOG_SHORT("Failures.Refusals",
                                  Out_ << "[Refusals] <" << TraceToString(Trace) << "> : "
                                       << Detail::FamilyToString(Refusals1) << " vs "
                                       << Detail::FamilyToString(Refusals2) << endl;);

                    set<Action> Uncovered;
                    if (Detail::FindUncoveredRefusal(Refusals1, Refusals2, Uncovered)) {
                        TheWitness.SetActionSet(ActionSetKindT::Refusal, Uncovered);
                        Message = "only the left process can refuse the set";
                        return false;
                    }
                    if (Detail::FindUncoveredRefusal(Refusals2, Refusals1, Uncovered)) {
                        TheWitness.SetActionSet(ActionSetKindT::Refusal, Uncovered);
                        Message = "only the right process can refuse the set";
                        return false;
                    }
                    return true;
                };

            SubsetPairExplorer Explorer(LTS1, LTS2, MaxDepth, "Failures.Refusals");
            auto&& Retval = Explorer.Explore(PairCheck);
            if (Retval.IsNotEquivalent()) {
                Retval.Message = Message;
            }
            return Retval;
        }

        EquivalenceResult FailuresChecker::CheckRefinement(const LabelledTS* Spec,
                                                           const LabelledTS* Impl) const
        {
            auto Alphabet = Spec->GetVisibleActions();
            auto&& ImplActions = Impl->GetVisibleActions();
            Alphabet.insert(ImplActions.begin(), ImplActions.end());
            string Message;

            auto PairCheck = [&] (const StateSetT& SpecSet, const StateSetT& ImplSet,
                                  const TraceT& Trace, Witness& TheWitness) -> bool
                {
                    Action Extra;
                    if (Detail::FindExtraAction(VisibleInitials(Impl, ImplSet),
                                                VisibleInitials(Spec, SpecSet), Extra)) {
                        TheWitness.Trace.push_back(Extra);
                        Message = "the implementation has a trace the refined process lacks";
                        return false;
                    }

                    auto&& SpecRefusals = Detail::MaximalRefusals(Spec, SpecSet, Alphabet);
                    auto&& ImplRefusals = Detail::MaximalRefusals(Impl, ImplSet, Alphabet);
                    set<Action> Uncovered;
                    if (Detail::FindUncoveredRefusal(ImplRefusals, SpecRefusals, Uncovered)) {
                        TheWitness.SetActionSet(ActionSetKindT::Refusal, Uncovered);
                        Message = "the implementation has a refusal the refined process lacks";
                        PAV_LOG_SHORT("Failures.Refusals",
                                      Out_ << "[Refinement] Unmatched refusal at <"
                                           << TraceToString(Trace) << ">" << endl;);
                        return false;
                    }
                    return true;
                };

            SubsetPairExplorer Explorer(Spec, Impl, MaxDepth, "Failures.Refusals");
            auto&& Retval = Explorer.Explore(PairCheck);
            if (Retval.IsNotEquivalent()) {
                Retval.Message = Message;
            }
            return Retval;
        }

    } /* end namespace Equiv */
} /* end namespace PAV */

//
// FailuresEquivalence.cpp ends here
