// PropertyTests.cpp ---
//
// Filename: PropertyTests.cpp
// Author: Abhishek Udupa
// Created: Tue May 22 14:09:27 2015 (-0400)
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

#include <stdlib.h>
#include <map>

#include "../../src/terms/Actions.hpp"
#include "../../src/terms/TermMgr.hpp"
#include "../../src/semantics/SOSEngine.hpp"
#include "../../src/lts/LabelledTS.hpp"
#include "../../src/lts/LTSAnalyses.hpp"
#include "../../src/lts/LTSBuilder.hpp"
#include "../../src/equiv/EquivTypes.hpp"
#include "../../src/equiv/TraceEquivalence.hpp"
#include "../../src/equiv/Bisimulation.hpp"
#include "../../src/equiv/TestingEquivalence.hpp"
#include "../../src/equiv/FailuresEquivalence.hpp"
#include "../../src/equiv/EquivalenceChecker.hpp"

using namespace PAV;
using namespace Terms;
using namespace Sem;
using namespace LTS;
using namespace Equiv;

static const vector<EquivalenceKindT> AllKinds = {
    EquivalenceKindT::Trace, EquivalenceKindT::StrongBisimulation,
    EquivalenceKindT::WeakBisimulation, EquivalenceKindT::Testing,
    EquivalenceKindT::MayTesting, EquivalenceKindT::MustTesting,
    EquivalenceKindT::Failures
};

static inline void Check(bool Condition, const string& Message)
{
    if (!Condition) {
        cout << "Error: " << Message << endl;
        exit(1);
    }
}

// Runs a checker directly on two built LTSs, bypassing the
// shortcut for identical terms
static inline VerdictT RunKind(const LabelledTS* LTS1, const LabelledTS* LTS2,
                               EquivalenceKindT Kind)
{
    switch (Kind) {
    case EquivalenceKindT::Trace:
        return TraceChecker().Check(LTS1, LTS2).Verdict;
    case EquivalenceKindT::StrongBisimulation:
        return BisimulationChecker().CheckStrong(LTS1, LTS2).Verdict;
    case EquivalenceKindT::WeakBisimulation:
        return BisimulationChecker().CheckWeak(LTS1, LTS2).Verdict;
    case EquivalenceKindT::Testing:
        return TestingChecker().Check(LTS1, LTS2).Verdict;
    case EquivalenceKindT::MayTesting:
        return TestingChecker().CheckMay(LTS1, LTS2).Verdict;
    case EquivalenceKindT::MustTesting:
        return TestingChecker().CheckMust(LTS1, LTS2).Verdict;
    case EquivalenceKindT::Failures:
        return FailuresChecker().Check(LTS1, LTS2).Verdict;
    }
    throw InternalError((string)"Unhandled equivalence kind.\nIn call to " + __FUNCTION__ +
                        " at " + __FILE__ + ":" + to_string(__LINE__));
}

// Small terms over a, b, 'a and tau: every one of them has a
// finite LTS and every check on them saturates within the bounds
static inline vector<TermRef> GenerateTerms(TermMgr* Mgr)
{
    auto Stop = Mgr->MakeStop();
    vector<TermRef> Atoms = { Stop, Mgr->MakePrefix("a", Stop), Mgr->MakePrefix("b", Stop),
                              Mgr->MakePrefix(TauAction, Stop) };
    vector<TermRef> Retval = Atoms;

    for (auto const& TheAction : { Action("a"), TauAction }) {
        for (u32 i = 1; i < Atoms.size(); ++i) {
            Retval.push_back(Mgr->MakePrefix(TheAction, Atoms[i]));
        }
    }
    for (u32 i = 0; i < Atoms.size(); ++i) {
        for (u32 j = i + 1; j < Atoms.size(); ++j) {
            Retval.push_back(Mgr->MakeChoice(Atoms[i], Atoms[j]));
        }
    }

    auto AStop = Atoms[1];
    auto BStop = Atoms[2];
    Retval.push_back(Mgr->MakePrefix("a", Mgr->MakeChoice(BStop, Stop)));
    Retval.push_back(Mgr->MakeChoice(Mgr->MakePrefix("a", BStop), Mgr->MakePrefix("a", Stop)));
    Retval.push_back(Mgr->MakeChoice(Mgr->MakePrefix(TauAction, AStop),
                                     Mgr->MakePrefix(TauAction, BStop)));
    Retval.push_back(Mgr->MakeParallel(AStop, BStop));
    Retval.push_back(Mgr->MakeParallel(AStop, Mgr->MakePrefix("'a", Stop)));
    Retval.push_back(Mgr->MakeChoice(Mgr->MakeSequence({ "a", "b" }, Stop),
                                     Mgr->MakeSequence({ "b", "a" }, Stop)));

    auto X = Mgr->MakeVar("X");
    Retval.push_back(Mgr->MakeRec("X", Mgr->MakePrefix("a", X)));
    Retval.push_back(Mgr->MakeRec("X", Mgr->MakeSequence({ "a", "a" }, X)));
    Retval.push_back(Mgr->MakeRec("X", Mgr->MakeChoice(Mgr->MakePrefix(TauAction, X),
                                                       AStop)));
    Retval.push_back(Mgr->MakeRec("X", Mgr->MakePrefix(TauAction, X)));
    return Retval;
}

int main()
{
    auto Mgr = new TermMgr();
    auto&& Pool = GenerateTerms(Mgr);
    cout << "Generated " << Pool.size() << " terms" << endl;

    vector<LabelledTS*> LTSs;
    vector<LabelledTS*> Copies;
    for (auto const& Term : Pool) {
        LTSs.push_back(BuildLTS(Term, SemanticModelT::CCS));
        // An independently built copy, so that reflexivity is checked
        // on two distinct LTS instances
        Copies.push_back(BuildLTS(Term, SemanticModelT::CCS));
    }

    cout << "Testing reflexivity... " << endl;
    for (u32 i = 0; i < Pool.size(); ++i) {
        for (auto Kind : AllKinds) {
            Check(RunKind(LTSs[i], Copies[i], Kind) == VerdictT::Equivalent,
                  Pool[i]->ToString() + " is not " + EquivalenceKindToString(Kind) +
                  " equivalent to itself");
            Check(CheckEquivalence(Pool[i], Pool[i], Kind).IsEquivalent(),
                  "checking interface on " + Pool[i]->ToString());
        }
    }

    cout << "Testing symmetry and the ordering of the equivalences... " << endl;
    u32 NumStrong = 0;
    u32 NumTraceOnly = 0;
    u32 NumCoincidences = 0;
    for (u32 i = 0; i < Pool.size(); ++i) {
        for (u32 j = i + 1; j < Pool.size(); ++j) {
            auto const& Pair = Pool[i]->ToString() + " vs " + Pool[j]->ToString();
            map<EquivalenceKindT, VerdictT> Verdicts;
            for (auto Kind : AllKinds) {
                auto Verdict = RunKind(LTSs[i], LTSs[j], Kind);
                Check(Verdict != VerdictT::Inconclusive,
                      "inconclusive " + EquivalenceKindToString(Kind) + " verdict for " +
                      Pair);
                Check(Verdict == RunKind(LTSs[j], LTSs[i], Kind),
                      EquivalenceKindToString(Kind) + " is not symmetric on " + Pair);
                Verdicts[Kind] = Verdict;
            }

            if (Verdicts[EquivalenceKindT::StrongBisimulation] == VerdictT::Equivalent) {
                ++NumStrong;
                for (auto Kind : AllKinds) {
                    Check(Verdicts[Kind] == VerdictT::Equivalent,
                          "strongly bisimilar but not " + EquivalenceKindToString(Kind) +
                          " equivalent: " + Pair);
                }
            }
            if (Verdicts[EquivalenceKindT::WeakBisimulation] == VerdictT::Equivalent) {
                Check(Verdicts[EquivalenceKindT::Trace] == VerdictT::Equivalent,
                      "weakly bisimilar but not trace equivalent: " + Pair);
            }
            if (Verdicts[EquivalenceKindT::Testing] == VerdictT::Equivalent) {
                Check(Verdicts[EquivalenceKindT::MayTesting] == VerdictT::Equivalent &&
                      Verdicts[EquivalenceKindT::MustTesting] == VerdictT::Equivalent,
                      "testing equivalence is not may and must: " + Pair);
            }
            if (Verdicts[EquivalenceKindT::MayTesting] == VerdictT::Equivalent) {
                Check(Verdicts[EquivalenceKindT::Trace] == VerdictT::Equivalent,
                      "may testing equivalent but not trace equivalent: " + Pair);
            }
            if (Verdicts[EquivalenceKindT::Trace] == VerdictT::Equivalent &&
                Verdicts[EquivalenceKindT::StrongBisimulation] == VerdictT::NotEquivalent) {
                ++NumTraceOnly;
            }

            // Without silent steps weak and strong bisimilarity coincide
            if (!HasSilentTransitions(LTSs[i]) && !HasSilentTransitions(LTSs[j])) {
                ++NumCoincidences;
                Check(Verdicts[EquivalenceKindT::StrongBisimulation] ==
                      Verdicts[EquivalenceKindT::WeakBisimulation],
                      "weak and strong bisimilarity disagree without silent steps: " + Pair);
            }
        }
    }
    cout << NumStrong << " strongly bisimilar pairs, " << NumTraceOnly
         << " trace equivalent but not bisimilar pairs, " << NumCoincidences
         << " pairs without silent steps" << endl;
    // The implications are not equivalences
    Check(NumStrong > 0 && NumTraceOnly > 0 && NumCoincidences > 0,
          "the generated pool does not cover the interesting cases");

    cout << "Testing choice idempotence and Stop absorption... " << endl;
    auto Stop = Mgr->MakeStop();
    for (u32 i = 0; i < Pool.size(); ++i) {
        auto Twice = BuildLTS(Mgr->MakeChoice(Pool[i], Pool[i]), SemanticModelT::CCS);
        auto WithStop = BuildLTS(Mgr->MakeChoice(Pool[i], Stop), SemanticModelT::CCS);
        auto&& Traces = TraceChecker::ComputeTraces(LTSs[i], 6);
        Check(TraceChecker::ComputeTraces(Twice, 6) == Traces,
              "choice is not idempotent on " + Pool[i]->ToString());
        Check(TraceChecker().Check(WithStop, LTSs[i]).IsEquivalent(),
              "Stop is not absorbed by " + Pool[i]->ToString());
        delete Twice;
        delete WithStop;
    }

    for (auto TheLTS : LTSs) {
        delete TheLTS;
    }
    for (auto TheLTS : Copies) {
        delete TheLTS;
    }
    Pool.clear();
    delete Mgr;

    cout << "All property tests passed!" << endl;
    return 0;
}

//
// PropertyTests.cpp ends here
