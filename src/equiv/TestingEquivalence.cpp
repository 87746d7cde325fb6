// TestingEquivalence.cpp ---
//
// Filename: TestingEquivalence.cpp
// Author: Abhishek Udupa
// Created: Wed Apr 12 19:28:44 2015 (-0400)
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

#include <algorithm>

#include <boost/algorithm/string/join.hpp>

#include "../lts/LabelledTS.hpp"
#include "../lts/LTSAnalyses.hpp"
#include "../utils/LogManager.hpp"

#include "SubsetPairExplorer.hpp"
#include "TraceEquivalence.hpp"
#include "TestingEquivalence.hpp"

namespace PAV {
    namespace Equiv {

        using namespace LTS;

        namespace Detail {

            // The set reached after Trace. Diverges is set if one of
            // the non empty sets met along the way can diverge.
            static inline StateSetT ReplayTrace(const LabelledTS* TheLTS, const TraceT& Trace,
                                                bool& Diverges)
            {
                Diverges = false;
                auto Retval = TauClosure(TheLTS, TheLTS->GetInitialState());
                for (u32 i = 0; i <= Trace.size(); ++i) {
                    if (Retval.size() == 0) {
                        return Retval;
                    }
                    if (CanDiverge(TheLTS, Retval)) {
                        Diverges = true;
                    }
                    if (i == Trace.size()) {
                        break;
                    }
                    Retval = WeakAfter(TheLTS, Retval, Trace[i]);
                }
                return Retval;
            }

            static inline set<Action> GetAlphabet(const LabelledTS* LTS1, const LabelledTS* LTS2)
            {
                auto Retval = LTS1->GetVisibleActions();
                auto&& Actions2 = LTS2->GetVisibleActions();
                Retval.insert(Actions2.begin(), Actions2.end());
                return Retval;
            }

            // A member of Family1 that contains no member of Family2
            static inline bool FindUnmatchedAcceptance(const ActionSetFamilyT& Family1,
                                                       const ActionSetFamilyT& Family2,
                                                       set<Action>& Unmatched)
            {
                for (auto const& Candidate : Family1) {
                    bool Matched = false;
                    for (auto const& Other : Family2) {
                        if (includes(Candidate.begin(), Candidate.end(),
                                     Other.begin(), Other.end())) {
                            Matched = true;
                            break;
                        }
                    }
                    if (!Matched) {
                        Unmatched = Candidate;
                        return true;
                    }
                }
                return false;
            }

            // Fills in a test that the non empty set Reached fails and
            // an empty set passes
            static inline void MakeFailingTest(const LabelledTS* TheLTS, const StateSetT& Reached,
                                               const set<Action>& Alphabet, Witness& TheWitness)
            {
                if (CanDiverge(TheLTS, Reached)) {
                    TheWitness.SetActionSet(ActionSetKindT::Acceptance, Alphabet);
                    return;
                }
                auto&& Initials = StableInitials(TheLTS, Reached);
                auto Smallest = *(MinimalSets(Initials).begin());
                TheWitness.SetActionSet(ActionSetKindT::Acceptance,
                                        ComplementSet(Alphabet, Smallest));
            }

        } /* end namespace Detail */

        TestingChecker::TestT::TestT()
        {
            // Nothing here
        }

        TestingChecker::TestT::TestT(const TraceT& Trace, const set<Action>& Acceptance)
            : Trace(Trace), Acceptance(Acceptance)
        {
            // Nothing here
        }

        TestingChecker::TestT::TestT(const TestT& Other)
            : Trace(Other.Trace), Acceptance(Other.Acceptance)
        {
            // Nothing here
        }

        TestingChecker::TestT::~TestT()
        {
            // Nothing here
        }

        TestingChecker::TestT& TestingChecker::TestT::operator = (const TestT& Other)
        {
            if (&Other == this) {
                return *this;
            }
            Trace = Other.Trace;
            Acceptance = Other.Acceptance;
            return *this;
        }

        bool TestingChecker::TestT::operator == (const TestT& Other) const
        {
            return (Trace == Other.Trace && Acceptance == Other.Acceptance);
        }

        bool TestingChecker::TestT::operator < (const TestT& Other) const
        {
            if (Trace != Other.Trace) {
                return Trace < Other.Trace;
            }
            return Acceptance < Other.Acceptance;
        }

        string TestingChecker::TestT::ToString() const
        {
            return ((string)"(<" + TraceToString(Trace) + ">, {" +
                    boost::algorithm::join(Acceptance, ", ") + "})");
        }

        TestingChecker::TestingChecker(u32 MaxDepth)
            : MaxDepth(MaxDepth)
        {
            // Nothing here
        }

        TestingChecker::~TestingChecker()
        {
            // Nothing here
        }

        u32 TestingChecker::GetMaxDepth() const
        {
            return MaxDepth;
        }

        set<TestingChecker::TestT>
        TestingChecker::GenerateTests(const LabelledTS* LTS1, const LabelledTS* LTS2) const
        {
            auto&& Alphabet = Detail::GetAlphabet(LTS1, LTS2);
            auto Traces = TraceChecker::ComputeTraces(LTS1, MaxDepth);
            auto&& Traces2 = TraceChecker::ComputeTraces(LTS2, MaxDepth);
            Traces.insert(Traces2.begin(), Traces2.end());
            Traces.insert(TraceT());

            set<TestT> Retval;
            for (auto const& Trace : Traces) {
                Retval.insert(TestT(Trace, Alphabet));
                Retval.insert(TestT(Trace, set<Action>()));
                for (auto TheLTS : { LTS1, LTS2 }) {
                    bool Diverges;
                    auto&& Reached = Detail::ReplayTrace(TheLTS, Trace, Diverges);
                    for (auto const& Initials : StableInitials(TheLTS, Reached)) {
                        Retval.insert(TestT(Trace, ComplementSet(Alphabet, Initials)));
                    }
                }
            }

            PAV_LOG_FULL("Testing.Tests",
                         Out_ << "[Tests] Generated " << Retval.size() << " tests over "
                              << Traces.size() << " traces:" << endl;
                         for (auto const& Test : Retval) {
                             Out_ << "    " << Test.ToString() << endl;
                         });

            return Retval;
        }

        bool TestingChecker::MayPasses(const LabelledTS* TheLTS, const TestT& Test)
        {
            bool Diverges;
            return (Detail::ReplayTrace(TheLTS, Test.Trace, Diverges).size() > 0);
        }

        bool TestingChecker::MustPasses(const LabelledTS* TheLTS, const TestT& Test)
        {
            bool Diverges;
            auto&& Reached = Detail::ReplayTrace(TheLTS, Test.Trace, Diverges);
            if (Diverges) {
                return false;
            }
            for (auto const& Initials : StableInitials(TheLTS, Reached)) {
                bool Accepted = false;
                for (auto const& TheAction : Initials) {
                    if (Test.Acceptance.find(TheAction) != Test.Acceptance.end()) {
                        Accepted = true;
                        break;
                    }
                }
                if (!Accepted) {
                    return false;
                }
            }
            return true;
        }

        EquivalenceResult TestingChecker::CheckMay(const LabelledTS* LTS1,
                                                   const LabelledTS* LTS2) const
        {
            SubsetPairExplorer Explorer(LTS1, LTS2, MaxDepth, "Testing.Tests");
            return Explorer.Explore([&] (const StateSetT& Set1, const StateSetT& Set2,
                                         const TraceT& Trace, Witness& TheWitness) -> bool
                                    {
                                        auto&& Initials1 = VisibleInitials(LTS1, Set1);
                                        auto&& Initials2 = VisibleInitials(LTS2, Set2);
                                        for (auto const& TheAction : Initials1) {
                                            if (Initials2.find(TheAction) == Initials2.end()) {
                                                TheWitness.Trace.push_back(TheAction);
                                                return false;
                                            }
                                        }
                                        for (auto const& TheAction : Initials2) {
                                            if (Initials1.find(TheAction) == Initials1.end()) {
                                                TheWitness.Trace.push_back(TheAction);
                                                return false;
                                            }
                                        }
                                        return true;
                                    });
        }

        // Every pair that gets expanded has a convergent history on
        // both sides: a pair where exactly one side diverges is a
        // difference, a pair where both diverge fails every test on
        // all its extensions and is not expanded. The must tests at a
        // pair then depend only on the minimal sets of initials of
        // the stable states.
        EquivalenceResult TestingChecker::CheckMust(const LabelledTS* LTS1,
                                                    const LabelledTS* LTS2) const
        {
            auto&& Alphabet = Detail::GetAlphabet(LTS1, LTS2);
            string Message;

            auto PairCheck = [&] (const StateSetT& Set1, const StateSetT& Set2,
                                  const TraceT& Trace, Witness& TheWitness) -> bool
                {
                    bool Diverges1 = CanDiverge(LTS1, Set1);
                    bool Diverges2 = CanDiverge(LTS2, Set2);
                    if (Diverges1 != Diverges2) {
                        Message = (string)"only the " + (Diverges1 ? "left" : "right") +
                            " process can diverge after the trace";
                        return false;
                    }
                    if (Diverges1) {
                        return true;
                    }

                    auto&& Family1 = MinimalSets(StableInitials(LTS1, Set1));
                    auto&& Family2 = MinimalSets(StableInitials(LTS2, Set2));
                    set<Action> Unmatched;
                    if (Detail::FindUnmatchedAcceptance(Family1, Family2, Unmatched) ||
                        Detail::FindUnmatchedAcceptance(Family2, Family1, Unmatched)) {
                        TheWitness.SetActionSet(ActionSetKindT::Acceptance,
                                                ComplementSet(Alphabet, Unmatched));
                        Message = "exactly one process must pass the test";
                        PAV_LOG_SHORT("Testing.Tests",
                                      Out_ << "[Must] Failing test at <"
                                           << TraceToString(Trace) << ">: "
                                           << TheWitness.ToString() << endl;);
                        return false;
                    }

                    // An action offered by one side only: the other side
                    // passes every test along it vacuously
                    auto&& Initials1 = VisibleInitials(LTS1, Set1);
                    auto&& Initials2 = VisibleInitials(LTS2, Set2);
                    for (auto const& TheAction : Initials1) {
                        if (Initials2.find(TheAction) == Initials2.end()) {
                            TheWitness.Trace.push_back(TheAction);
                            Detail::MakeFailingTest(LTS1, WeakAfter(LTS1, Set1, TheAction),
                                                    Alphabet, TheWitness);
                            Message = "only the right process must pass the test";
                            return false;
                        }
                    }
                    for (auto const& TheAction : Initials2) {
                        if (Initials1.find(TheAction) == Initials1.end()) {
                            TheWitness.Trace.push_back(TheAction);
                            Detail::MakeFailingTest(LTS2, WeakAfter(LTS2, Set2, TheAction),
                                                    Alphabet, TheWitness);
                            Message = "only the left process must pass the test";
                            return false;
                        }
                    }
                    return true;
                };

            auto Expand = [&] (const StateSetT& Set1, const StateSetT& Set2) -> bool
                {
                    return !(CanDiverge(LTS1, Set1) && CanDiverge(LTS2, Set2));
                };

            SubsetPairExplorer Explorer(LTS1, LTS2, MaxDepth, "Testing.Tests");
            auto&& Retval = Explorer.Explore(PairCheck, Expand);
            if (Retval.IsNotEquivalent()) {
                Retval.Message = Message;
            }
            return Retval;
        }

        EquivalenceResult TestingChecker::Check(const LabelledTS* LTS1,
                                                const LabelledTS* LTS2) const
        {
            auto&& MayResult = CheckMay(LTS1, LTS2);
            if (MayResult.IsNotEquivalent()) {
                return MayResult;
            }
            auto&& MustResult = CheckMust(LTS1, LTS2);
            if (MustResult.IsNotEquivalent()) {
                return MustResult;
            }
            if (MayResult.IsInconclusive()) {
                return MayResult;
            }
            return MustResult;
        }

        ostream& operator << (ostream& Out, const TestingChecker::TestT& Test)
        {
            Out << Test.ToString();
            return Out;
        }

    } /* end namespace Equiv */
} /* end namespace PAV */

//
// TestingEquivalence.cpp ends here
