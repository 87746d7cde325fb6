// EquivTests.cpp ---
//
// Filename: EquivTests.cpp
// Author: Abhishek Udupa
// Created: Mon May 15 09:52:56 2015 (-0400)
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

#include "../../src/terms/Actions.hpp"
#include "../../src/terms/TermMgr.hpp"
#include "../../src/semantics/SOSEngine.hpp"
#include "../../src/lts/LabelledTS.hpp"
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

static inline void Check(bool Condition, const string& Message)
{
    if (!Condition) {
        cout << "Error: " << Message << endl;
        exit(1);
    }
}

template <typename ExceptionT, typename FuncT>
static inline void CheckThrows(const FuncT& Func, const string& Message)
{
    try {
        Func();
    } catch (const ExceptionT& Ex) {
        cout << "Got expected exception: " << Ex.what() << endl;
        return;
    }
    cout << "Error: no exception raised: " << Message << endl;
    exit(1);
}

static inline void CheckVerdict(const EquivalenceResult& Result, VerdictT Expected,
                                const string& Message)
{
    cout << Message << ": " << Result.ToString() << endl;
    if (Result.Verdict != Expected) {
        cout << "Error: expected verdict " << VerdictToString(Expected) << endl;
        exit(1);
    }
}

class Fixture
{
public:
    TermMgr* Mgr;
    TermRef Stop;
    TermRef AStop;
    TermRef BStop;
    TermRef CStop;

    Fixture()
        : Mgr(new TermMgr())
    {
        Stop = Mgr->MakeStop();
        AStop = Mgr->MakePrefix("a", Stop);
        BStop = Mgr->MakePrefix("b", Stop);
        CStop = Mgr->MakePrefix("c", Stop);
    }

    ~Fixture()
    {
        Stop = TermRef::NullPtr;
        AStop = TermRef::NullPtr;
        BStop = TermRef::NullPtr;
        CStop = TermRef::NullPtr;
        delete Mgr;
    }

    TermRef Tau(const TermRef& Cont) const
    {
        return Mgr->MakePrefix(TauAction, Cont);
    }

    TermRef Pre(const Action& TheAction, const TermRef& Cont) const
    {
        return Mgr->MakePrefix(TheAction, Cont);
    }

    TermRef Plus(const TermRef& Left, const TermRef& Right) const
    {
        return Mgr->MakeChoice(Left, Right);
    }
};

static inline void TestTraces(const Fixture& F)
{
    cout << "Testing trace equivalence... " << endl;
    auto Rec = F.Mgr->MakeRec("X", F.Pre("a", F.Mgr->MakeVar("X")));
    auto RecLTS = BuildLTS(Rec, SemanticModelT::CCS);
    auto&& Traces = TraceChecker::ComputeTraces(RecLTS, 10);
    Check(Traces.size() == 10, "rec X.a.X must have ten traces up to length ten");
    for (u32 i = 1; i <= 10; ++i) {
        Check(Traces.find(TraceT(i, "a")) != Traces.end(),
              "trace a^" + to_string(i) + " of rec X.a.X");
    }

    // a.(b + c) vs a.b + a.c: same traces
    auto Late = F.Pre("a", F.Plus(F.BStop, F.CStop));
    auto Early = F.Plus(F.Pre("a", F.BStop), F.Pre("a", F.CStop));
    auto LateLTS = BuildLTS(Late, SemanticModelT::CCS);
    auto EarlyLTS = BuildLTS(Early, SemanticModelT::CCS);
    TraceChecker Checker;
    Check(Checker.GetMaxDepth() == EquivalenceOptionsT::DefaultMaxDepth, "default depth");
    CheckVerdict(Checker.Check(LateLTS, EarlyLTS), VerdictT::Equivalent,
                 "a.(b + c) vs a.b + a.c");
    Check(TraceChecker::ComputeTraces(LateLTS, 5) == TraceChecker::ComputeTraces(EarlyLTS, 5),
          "trace sets of a.(b + c) and a.b + a.c");

    // a + b vs a
    auto ABLTS = BuildLTS(F.Plus(F.AStop, F.BStop), SemanticModelT::CCS);
    auto ALTS = BuildLTS(F.AStop, SemanticModelT::CCS);
    auto&& Result = Checker.Check(ABLTS, ALTS);
    CheckVerdict(Result, VerdictT::NotEquivalent, "a + b vs a");
    Check(Result.HasWitness && Result.TheWitness.Trace == TraceT({ "b" }),
          "witness for a + b vs a");

    CheckVerdict(Checker.CheckInclusion(ABLTS, ALTS), VerdictT::Equivalent,
                 "traces of a included in a + b");
    CheckVerdict(Checker.CheckInclusion(ALTS, ABLTS), VerdictT::NotEquivalent,
                 "traces of a + b included in a");

    // A difference beyond the depth bound is not found
    vector<Action> Long(15, "a");
    auto LongA = F.Mgr->MakeSequence(Long, F.Stop);
    auto LongAB = F.Mgr->MakeSequence(Long, F.BStop);
    auto LongALTS = BuildLTS(LongA, SemanticModelT::CCS);
    auto LongABLTS = BuildLTS(LongAB, SemanticModelT::CCS);
    CheckVerdict(Checker.Check(LongALTS, LongABLTS), VerdictT::Inconclusive,
                 "difference beyond the bound");
    CheckVerdict(TraceChecker(20).Check(LongALTS, LongABLTS), VerdictT::NotEquivalent,
                 "difference within a larger bound");

    // Recursive terms compare exactly: the pair space saturates
    auto Rec2 = F.Mgr->MakeRec("Y", F.Pre("a", F.Pre("a", F.Mgr->MakeVar("Y"))));
    auto Rec2LTS = BuildLTS(Rec2, SemanticModelT::CCS);
    CheckVerdict(Checker.Check(RecLTS, Rec2LTS), VerdictT::Equivalent,
                 "rec X.a.X vs rec Y.a.a.Y");

    for (auto TheLTS : { RecLTS, LateLTS, EarlyLTS, ABLTS, ALTS, LongALTS,
                LongABLTS, Rec2LTS }) {
        delete TheLTS;
    }
}

static inline void TestBisimulation(const Fixture& F)
{
    cout << "Testing bisimulation... " << endl;
    BisimulationChecker Checker;

    auto Late = BuildLTS(F.Pre("a", F.Plus(F.BStop, F.CStop)), SemanticModelT::CCS);
    auto Early = BuildLTS(F.Plus(F.Pre("a", F.BStop), F.Pre("a", F.CStop)),
                          SemanticModelT::CCS);
    auto&& Result = Checker.CheckStrong(Late, Early);
    CheckVerdict(Result, VerdictT::NotEquivalent, "a.(b + c) vs a.b + a.c, strong");
    Check(Result.TheWitness.HasStatePair &&
          Result.TheWitness.LeftState == "a.(b.STOP + c.STOP)", "state pair witness");
    CheckVerdict(Checker.CheckWeak(Late, Early), VerdictT::NotEquivalent,
                 "a.(b + c) vs a.b + a.c, weak");

    // rec Y.a.a.Y collapses into a single block
    auto Rec = BuildLTS(F.Mgr->MakeRec("X", F.Pre("a", F.Mgr->MakeVar("X"))),
                        SemanticModelT::CCS);
    auto Rec2 = BuildLTS(F.Mgr->MakeRec("Y", F.Pre("a", F.Pre("a", F.Mgr->MakeVar("Y")))),
                         SemanticModelT::CCS);
    Check(Rec2->GetNumStates() == 2, "states of rec Y.a.a.Y");
    Check(BisimulationChecker::CountBlocks(BisimulationChecker::ComputeStrongPartition(Rec2))
          == 1, "blocks of rec Y.a.a.Y");
    Check(BisimulationChecker::CountBlocks(BisimulationChecker::ComputeStrongPartition(Late))
          == 3, "blocks of a.(b + c)");
    CheckVerdict(Checker.CheckStrong(Rec, Rec2), VerdictT::Equivalent,
                 "rec X.a.X vs rec Y.a.a.Y");

    // Silent steps
    auto TauA = BuildLTS(F.Tau(F.AStop), SemanticModelT::CCS);
    auto A = BuildLTS(F.AStop, SemanticModelT::CCS);
    CheckVerdict(Checker.CheckStrong(TauA, A), VerdictT::NotEquivalent, "tau.a vs a, strong");
    CheckVerdict(Checker.CheckWeak(TauA, A), VerdictT::Equivalent, "tau.a vs a, weak");

    auto ATauB = BuildLTS(F.Pre("a", F.Tau(F.BStop)), SemanticModelT::CCS);
    auto AB = BuildLTS(F.Pre("a", F.BStop), SemanticModelT::CCS);
    CheckVerdict(Checker.CheckWeak(ATauB, AB), VerdictT::Equivalent, "a.tau.b vs a.b, weak");

    // A silent step that discards an alternative is observable
    auto Preempt = BuildLTS(F.Plus(F.AStop, F.Tau(F.BStop)), SemanticModelT::CCS);
    auto Plain = BuildLTS(F.Plus(F.AStop, F.BStop), SemanticModelT::CCS);
    CheckVerdict(Checker.CheckWeak(Preempt, Plain), VerdictT::NotEquivalent,
                 "a + tau.b vs a + b, weak");

    // Silent self loops are transparent
    auto TauLoop = BuildLTS(F.Mgr->MakeRec("X", F.Plus(F.Tau(F.Mgr->MakeVar("X")), F.AStop)),
                            SemanticModelT::CCS);
    CheckVerdict(Checker.CheckWeak(TauLoop, A), VerdictT::Equivalent,
                 "rec X.(tau.X + a) vs a, weak");
    Check(BisimulationChecker::CountBlocks(BisimulationChecker::ComputeWeakPartition(TauA))
          == 2, "weak blocks of tau.a");

    for (auto TheLTS : { Late, Early, Rec, Rec2, TauA, A, ATauB, AB, Preempt, Plain,
                TauLoop }) {
        delete TheLTS;
    }
}

static inline void TestTesting(const Fixture& F)
{
    cout << "Testing may and must testing... " << endl;
    TestingChecker Checker;

    auto External = BuildLTS(F.Plus(F.AStop, F.BStop), SemanticModelT::CCS);
    auto Internal = BuildLTS(F.Plus(F.Tau(F.AStop), F.Tau(F.BStop)), SemanticModelT::CCS);
    CheckVerdict(Checker.CheckMay(External, Internal), VerdictT::Equivalent,
                 "external vs internal choice, may");
    auto&& MustResult = Checker.CheckMust(External, Internal);
    CheckVerdict(MustResult, VerdictT::NotEquivalent, "external vs internal choice, must");
    Check(MustResult.TheWitness.SetKind == ActionSetKindT::Acceptance,
          "must witness carries an acceptance set");
    TestingChecker::TestT Witness(MustResult.TheWitness.Trace,
                                  MustResult.TheWitness.ActionSet);
    Check(TestingChecker::MustPasses(External, Witness) !=
          TestingChecker::MustPasses(Internal, Witness),
          "the witness test does not separate the processes: " + Witness.ToString());
    CheckVerdict(Checker.Check(External, Internal), VerdictT::NotEquivalent,
                 "external vs internal choice, testing");

    // Generated tests separate them too
    bool Separated = false;
    for (auto const& Test : Checker.GenerateTests(External, Internal)) {
        Check(TestingChecker::MayPasses(External, Test) ==
              TestingChecker::MayPasses(Internal, Test), "may test " + Test.ToString());
        if (TestingChecker::MustPasses(External, Test) !=
            TestingChecker::MustPasses(Internal, Test)) {
            cout << "Separating test: " << Test << endl;
            Separated = true;
        }
    }
    Check(Separated, "no generated test separates external and internal choice");

    // tau.a vs a
    auto TauA = BuildLTS(F.Tau(F.AStop), SemanticModelT::CCS);
    auto A = BuildLTS(F.AStop, SemanticModelT::CCS);
    CheckVerdict(Checker.Check(TauA, A), VerdictT::Equivalent, "tau.a vs a, testing");
    for (auto const& Test : Checker.GenerateTests(TauA, A)) {
        Check(TestingChecker::MustPasses(TauA, Test) == TestingChecker::MustPasses(A, Test),
              "must test " + Test.ToString());
    }

    // Divergence fails every must test
    auto Diverge = BuildLTS(F.Mgr->MakeRec("X", F.Tau(F.Mgr->MakeVar("X"))),
                            SemanticModelT::CCS);
    auto Dead = BuildLTS(F.Stop, SemanticModelT::CCS);
    CheckVerdict(Checker.CheckMay(Diverge, Dead), VerdictT::Equivalent,
                 "divergence vs deadlock, may");
    CheckVerdict(Checker.CheckMust(Diverge, Dead), VerdictT::NotEquivalent,
                 "divergence vs deadlock, must");
    Check(!TestingChecker::MustPasses(Diverge, TestingChecker::TestT(TraceT(), { "a" })) &&
          !TestingChecker::MustPasses(Dead, TestingChecker::TestT(TraceT(), { "a" })),
          "must tests of divergence and deadlock");
    Check(!TestingChecker::MustPasses(Diverge, TestingChecker::TestT(TraceT({ "a" }),
                                                                      set<Action>())) &&
          TestingChecker::MustPasses(Dead, TestingChecker::TestT(TraceT({ "a" }),
                                                                 set<Action>())),
          "must tests after an impossible trace");

    // Must testing looks past a shared prefix
    auto Early = BuildLTS(F.Plus(F.Pre("a", F.BStop), F.Pre("a", F.CStop)),
                          SemanticModelT::CCS);
    auto Late = BuildLTS(F.Pre("a", F.Plus(F.BStop, F.CStop)), SemanticModelT::CCS);
    auto&& EarlyResult = Checker.CheckMust(Early, Late);
    CheckVerdict(EarlyResult, VerdictT::NotEquivalent, "a.b + a.c vs a.(b + c), must");
    Check(EarlyResult.TheWitness.Trace == TraceT({ "a" }), "must witness trace");

    for (auto TheLTS : { External, Internal, TauA, A, Diverge, Dead, Early, Late }) {
        delete TheLTS;
    }
}

static inline void TestFailures(const Fixture& F)
{
    cout << "Testing failures... " << endl;
    FailuresChecker Checker;

    auto External = BuildLTS(F.Plus(F.AStop, F.BStop), SemanticModelT::CCS);
    auto Internal = BuildLTS(F.Plus(F.Tau(F.AStop), F.Tau(F.BStop)), SemanticModelT::CCS);

    auto&& ExternalFailures = FailuresChecker::ComputeFailures(External, 5);
    Check(ExternalFailures.size() == 3, "traces of the failures of a + b");
    Check(ExternalFailures[TraceT()] == ActionSetFamilyT({ set<Action>() }),
          "a + b refuses nothing initially");
    Check(ExternalFailures[TraceT({ "a" })] == ActionSetFamilyT({ { "a", "b" } }),
          "a + b refuses everything after a");

    auto&& InternalFailures = FailuresChecker::ComputeFailures(Internal, 5);
    Check(InternalFailures[TraceT()] == ActionSetFamilyT({ { "a" }, { "b" } }),
          "initial refusals of tau.a + tau.b");

    auto&& Result = Checker.Check(External, Internal);
    CheckVerdict(Result, VerdictT::NotEquivalent, "a + b vs tau.a + tau.b, failures");
    Check(Result.TheWitness.SetKind == ActionSetKindT::Refusal &&
          Result.TheWitness.Trace.size() == 0, "failures witness");

    // Refinement
    auto A = BuildLTS(F.AStop, SemanticModelT::CCS);
    CheckVerdict(Checker.CheckRefinement(Internal, A), VerdictT::Equivalent,
                 "tau.a + tau.b refined by a");
    CheckVerdict(Checker.CheckRefinement(Internal, External), VerdictT::Equivalent,
                 "tau.a + tau.b refined by a + b");
    auto&& NotRefined = Checker.CheckRefinement(External, Internal);
    CheckVerdict(NotRefined, VerdictT::NotEquivalent, "a + b refined by tau.a + tau.b");
    Check(NotRefined.TheWitness.SetKind == ActionSetKindT::Refusal, "refinement witness");
    auto&& ExtraTrace = Checker.CheckRefinement(A, External);
    CheckVerdict(ExtraTrace, VerdictT::NotEquivalent, "a refined by a + b");
    Check(ExtraTrace.TheWitness.Trace == TraceT({ "b" }), "extra trace witness");

    // Silent steps are invisible to failures
    auto TauA = BuildLTS(F.Tau(F.AStop), SemanticModelT::CCS);
    CheckVerdict(Checker.Check(TauA, A), VerdictT::Equivalent, "tau.a vs a, failures");

    for (auto TheLTS : { External, Internal, A, TauA }) {
        delete TheLTS;
    }
}

static inline void TestFacade(const Fixture& F)
{
    cout << "Testing the checking interface... " << endl;
    Check(EquivalenceKindFromString("trace") == EquivalenceKindT::Trace, "parsing trace");
    Check(EquivalenceKindFromString("Weak") == EquivalenceKindT::WeakBisimulation,
          "parsing weak");
    Check(EquivalenceKindFromString("MUSTTESTING") == EquivalenceKindT::MustTesting,
          "parsing musttesting");
    CheckThrows<PAVError>([] () { EquivalenceKindFromString("isomorphism"); },
                          "unknown equivalence kind");

    EquivalenceOptionsT Options;
    Check(Options.Model == SemanticModelT::CCS && Options.MaxDepth == 10 &&
          Options.MaxStates == 100000, "default options");

    // Inconsistent options are rejected before any exploration
    EquivalenceOptionsT BadDepth;
    BadDepth.MaxDepth = 0;
    CheckThrows<ConfigurationError>([&] () { EquivalenceChecker Checker(BadDepth); },
                                    "zero depth");
    EquivalenceOptionsT BadStates;
    BadStates.MaxStates = 0;
    CheckThrows<ConfigurationError>([&] () {
            CheckEquivalence(F.AStop, F.BStop, EquivalenceKindT::Trace, BadStates);
        }, "zero states");
    EquivalenceOptionsT BadCSP;
    BadCSP.Model = SemanticModelT::CSP;
    BadCSP.SyncAlphabet.insert(TauAction);
    CheckThrows<ConfigurationError>([&] () { EquivalenceChecker Checker(BadCSP); },
                                    "tau in the alphabet");
    EquivalenceOptionsT BadACP;
    BadACP.Model = SemanticModelT::ACP;
    BadACP.CommFunction.Define("s", "r", "c");
    CheckThrows<ConfigurationError>([&] () { EquivalenceChecker Checker(BadACP); },
                                    "non commutative communication");

    CheckThrows<PAVError>([&] () {
            CheckEquivalence(F.Pre("a", F.Mgr->MakeVar("X")), F.AStop,
                             EquivalenceKindT::Trace);
        }, "free variable");

    // Identical terms are equivalent even when they cannot be explored
    auto Growing = F.Mgr->MakeRec("X", F.Mgr->MakeParallel(F.Pre("a", F.Mgr->MakeVar("X")),
                                                           F.BStop));
    auto Growing2 = F.Mgr->MakeRec("X", F.Mgr->MakeParallel(F.Pre("a", F.Mgr->MakeVar("X")),
                                                            F.CStop));
    EquivalenceOptionsT Small;
    Small.MaxStates = 100;
    CheckVerdict(CheckEquivalence(Growing, Growing, EquivalenceKindT::StrongBisimulation,
                                  Small),
                 VerdictT::Equivalent, "infinite state term vs itself");
    auto&& GaveUp = CheckEquivalence(Growing, Growing2, EquivalenceKindT::StrongBisimulation,
                                     Small);
    CheckVerdict(GaveUp, VerdictT::Inconclusive, "state ceiling exceeded");
    Check(!GaveUp.IsNotEquivalent(), "giving up reported as a difference");

    EquivalenceChecker Checker(Options);
    Check(Checker.GetEngine()->GetModel() == SemanticModelT::CCS, "engine of the checker");
    auto TheLTS = Checker.BuildLTS(F.Plus(F.AStop, F.BStop));
    Check(TheLTS->GetNumStates() == 2, "LTS built by the checker");
    delete TheLTS;

    CheckVerdict(Checker.Check(F.Plus(F.AStop, F.BStop), F.AStop,
                               EquivalenceKindT::StrongBisimulation),
                 VerdictT::NotEquivalent, "a + b vs a, strong");
    CheckVerdict(Checker.CheckRefinement(F.Plus(F.Tau(F.AStop), F.Tau(F.BStop)), F.BStop),
                 VerdictT::Equivalent, "internal choice refined by b");
    CheckVerdict(CheckRefinement(F.AStop, F.BStop), VerdictT::NotEquivalent,
                 "a refined by b");

    // The same pair under different models
    auto Sync = F.Mgr->MakeParallel(F.AStop, F.Pre("'a", F.Stop));
    auto Interleaved = F.Plus(F.Pre("a", F.Pre("'a", F.Stop)), F.Pre("'a", F.AStop));
    CheckVerdict(CheckEquivalence(Sync, Interleaved, EquivalenceKindT::StrongBisimulation),
                 VerdictT::NotEquivalent, "a | 'a vs interleaving, CCS strong");
    EquivalenceOptionsT ACPOptions;
    ACPOptions.Model = SemanticModelT::ACP;
    CheckVerdict(CheckEquivalence(Sync, Interleaved, EquivalenceKindT::StrongBisimulation,
                                  ACPOptions),
                 VerdictT::Equivalent, "a | 'a vs interleaving, ACP without communication");

    // A silent step resolves a CCS choice but leaves a CSP choice open
    auto Hidden = F.Plus(F.AStop, F.Tau(F.BStop));
    auto Open = F.Plus(F.AStop, F.BStop);
    CheckVerdict(CheckEquivalence(Hidden, Open, EquivalenceKindT::WeakBisimulation),
                 VerdictT::NotEquivalent, "a + tau.b vs a + b, CCS weak");
    EquivalenceOptionsT CSPOptions;
    CSPOptions.Model = SemanticModelT::CSP;
    CheckVerdict(CheckEquivalence(Hidden, Open, EquivalenceKindT::WeakBisimulation,
                                  CSPOptions),
                 VerdictT::Equivalent, "a + tau.b vs a + b, CSP weak");
}

int main()
{
    auto F = new Fixture();

    TestTraces(*F);
    TestBisimulation(*F);
    TestTesting(*F);
    TestFailures(*F);
    TestFacade(*F);

    delete F;
    cout << "All equivalence tests passed!" << endl;
    return 0;
}

//
// EquivTests.cpp ends here
