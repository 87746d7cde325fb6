// ScenarioTests.cpp ---
//
// Filename: ScenarioTests.cpp
// Author: Abhishek Udupa
// Created: Wed May 20 16:26:58 2015 (-0400)
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
#include "../../src/terms/Transition.hpp"
#include "../../src/semantics/SOSEngine.hpp"
#include "../../src/lts/LabelledTS.hpp"
#include "../../src/lts/LTSBuilder.hpp"
#include "../../src/equiv/EquivTypes.hpp"
#include "../../src/equiv/TraceEquivalence.hpp"
#include "../../src/equiv/Bisimulation.hpp"
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

static inline void Expect(const EquivalenceResult& Result, VerdictT Expected,
                          const string& Message)
{
    cout << "    " << Message << ": " << Result << endl;
    Check(Result.Verdict == Expected, Message + " expected to be " +
          VerdictToString(Expected));
}

// a.STOP vs a.STOP, and a + b vs a
static inline void TestBasicScenarios(TermMgr* Mgr)
{
    cout << "Testing basic scenarios... " << endl;
    auto Stop = Mgr->MakeStop();
    auto AStop = Mgr->MakePrefix("a", Stop);
    auto BStop = Mgr->MakePrefix("b", Stop);

    Expect(CheckEquivalence(AStop, AStop, EquivalenceKindT::StrongBisimulation),
           VerdictT::Equivalent, "a.STOP vs a.STOP");
    auto LTS1 = BuildLTS(AStop, SemanticModelT::CCS);
    auto LTS2 = BuildLTS(AStop, SemanticModelT::CCS);
    Expect(BisimulationChecker().CheckStrong(LTS1, LTS2), VerdictT::Equivalent,
           "a.STOP vs a.STOP on separately built systems");
    delete LTS1;
    delete LTS2;

    auto AB = Mgr->MakeChoice(AStop, BStop);
    Expect(CheckEquivalence(AB, AStop, EquivalenceKindT::StrongBisimulation),
           VerdictT::NotEquivalent, "a + b vs a, strong");
    Expect(CheckEquivalence(AB, AStop, EquivalenceKindT::WeakBisimulation),
           VerdictT::NotEquivalent, "a + b vs a, weak");
    auto&& TraceResult = CheckEquivalence(AB, AStop, EquivalenceKindT::Trace);
    Expect(TraceResult, VerdictT::NotEquivalent, "a + b vs a, trace");
    Check(TraceResult.TheWitness.Trace == TraceT({ "b" }), "the missing trace is b");

    // a | 'a under CCS offers a handshake besides both visible moves
    auto Engine = MakeCCSEngine();
    auto&& Moves = Engine->ComputeTransitions(Mgr->MakeParallel(AStop,
                                                                Mgr->MakePrefix("'a", Stop)));
    set<Action> Labels;
    for (auto const& Trans : Moves) {
        Labels.insert(Trans.GetAction());
    }
    Check(Moves.size() == 3 && Labels == set<Action>({ "a", "'a", TauAction }),
          "transitions of a | 'a");
    delete Engine;

    // rec X.a.X explored up to a bound
    auto Rec = Mgr->MakeRec("X", Mgr->MakePrefix("a", Mgr->MakeVar("X")));
    auto RecLTS = BuildLTS(Rec, SemanticModelT::CCS);
    for (u32 Depth : { 1, 4, 10 }) {
        auto&& Traces = TraceChecker::ComputeTraces(RecLTS, Depth);
        Check(Traces.size() == Depth && Traces.rbegin()->size() == Depth,
              "traces of rec X.a.X up to " + to_string(Depth));
    }
    delete RecLTS;
}

// A machine that lets the customer choose after paying vs one that
// decides on its own when the coin is inserted
static inline void TestVendingMachines(TermMgr* Mgr)
{
    cout << "Testing vending machines... " << endl;
    auto Stop = Mgr->MakeStop();
    auto Coffee = Mgr->MakePrefix("coffee", Stop);
    auto Tea = Mgr->MakePrefix("tea", Stop);

    auto Fair = Mgr->MakePrefix("coin", Mgr->MakeChoice(Coffee, Tea));
    auto Unfair = Mgr->MakeChoice(Mgr->MakeSequence({ "coin", TauAction }, Coffee),
                                  Mgr->MakeSequence({ "coin", TauAction }, Tea));

    Expect(CheckEquivalence(Fair, Unfair, EquivalenceKindT::Trace), VerdictT::Equivalent,
           "vending machines, trace");
    Expect(CheckEquivalence(Fair, Unfair, EquivalenceKindT::MayTesting), VerdictT::Equivalent,
           "vending machines, may testing");
    Expect(CheckEquivalence(Fair, Unfair, EquivalenceKindT::StrongBisimulation),
           VerdictT::NotEquivalent, "vending machines, strong");
    auto&& WeakResult = CheckEquivalence(Fair, Unfair, EquivalenceKindT::WeakBisimulation);
    Expect(WeakResult, VerdictT::NotEquivalent, "vending machines, weak");
    Check(WeakResult.TheWitness.HasStatePair, "weak bisimulation witness");

    auto&& FailuresResult = CheckEquivalence(Fair, Unfair, EquivalenceKindT::Failures);
    Expect(FailuresResult, VerdictT::NotEquivalent, "vending machines, failures");
    Check(FailuresResult.TheWitness.Trace == TraceT({ "coin" }),
          "the unfair machine refuses after the coin");
    Expect(CheckEquivalence(Fair, Unfair, EquivalenceKindT::MustTesting),
           VerdictT::NotEquivalent, "vending machines, must testing");

    // The unfair machine is a valid implementation of the fair one only
    // in the other direction
    Expect(CheckRefinement(Unfair, Fair), VerdictT::Equivalent,
           "fair machine refines the unfair one");
    Expect(CheckRefinement(Fair, Unfair), VerdictT::NotEquivalent,
           "unfair machine refines the fair one");

    // A silent commitment is weakly the same as committing on the coin
    auto Committed = Mgr->MakeChoice(Mgr->MakePrefix("coin", Coffee),
                                     Mgr->MakePrefix("coin", Tea));
    Expect(CheckEquivalence(Committed, Unfair, EquivalenceKindT::WeakBisimulation),
           VerdictT::Equivalent, "visible vs silent commitment, weak");
    Expect(CheckEquivalence(Committed, Unfair, EquivalenceKindT::StrongBisimulation),
           VerdictT::NotEquivalent, "visible vs silent commitment, strong");
    Expect(CheckEquivalence(Committed, Fair, EquivalenceKindT::WeakBisimulation),
           VerdictT::NotEquivalent, "visible commitment vs the fair machine, weak");
}

// A sender and a receiver synchronizing on send and ack under CSP.
// The composition must behave as a one place buffer that handshakes
// on every message.
static inline void TestProtocol(TermMgr* Mgr)
{
    cout << "Testing the sender/receiver protocol... " << endl;
    auto Stop = Mgr->MakeStop();
    auto S = Mgr->MakeVar("S");
    auto R = Mgr->MakeVar("R");
    auto P = Mgr->MakeVar("P");

    auto Sender = Mgr->MakeRec("S", Mgr->MakeSequence({ "in", "send", "ack" }, S));
    auto Receiver = Mgr->MakeRec("R", Mgr->MakeSequence({ "send", "out", "ack" }, R));
    auto Buffer = Mgr->MakeRec("P", Mgr->MakeSequence({ "in", "send", "out", "ack" }, P));

    // Drops the message: acknowledges without delivering
    auto Deliver = Mgr->MakeSequence({ "out", "ack" }, R);
    auto Lossy = Mgr->MakeRec("R", Mgr->MakePrefix("send",
                                                   Mgr->MakeChoice(Deliver,
                                                                   Mgr->MakePrefix("ack", R))));
    // May crash silently after receiving. The choice is made by the
    // send itself, since a silent step leaves a CSP choice in place.
    auto Crashing = Mgr->MakeRec("R", Mgr->MakeChoice(Mgr->MakeSequence({ "send", TauAction },
                                                                        Deliver),
                                                      Mgr->MakeSequence({ "send", TauAction },
                                                                        Stop)));

    EquivalenceOptionsT Options;
    Options.Model = SemanticModelT::CSP;
    Options.SyncAlphabet = { "send", "ack" };

    auto System = Mgr->MakeParallel(Sender, Receiver);
    auto SystemLTS = BuildLTS(System, Options);
    cout << SystemLTS->ToString() << endl;
    Check(SystemLTS->GetNumStates() == 4, "states of the protocol");
    delete SystemLTS;

    for (auto Kind : { EquivalenceKindT::StrongBisimulation, EquivalenceKindT::Trace,
                EquivalenceKindT::Testing, EquivalenceKindT::Failures }) {
        Expect(CheckEquivalence(System, Buffer, Kind, Options), VerdictT::Equivalent,
               "protocol vs buffer, " + EquivalenceKindToString(Kind));
    }
    Expect(CheckRefinement(Buffer, System, Options), VerdictT::Equivalent,
           "protocol refines the buffer");

    auto LossySystem = Mgr->MakeParallel(Sender, Lossy);
    auto&& LossyTraces = CheckEquivalence(LossySystem, Buffer, EquivalenceKindT::Trace,
                                          Options);
    Expect(LossyTraces, VerdictT::NotEquivalent, "lossy protocol vs buffer, trace");
    Check(LossyTraces.TheWitness.Trace == TraceT({ "in", "send", "ack" }),
          "the lossy protocol acknowledges an undelivered message");
    auto&& LossyRefinement = CheckRefinement(Buffer, LossySystem, Options);
    Expect(LossyRefinement, VerdictT::NotEquivalent, "lossy protocol refines the buffer");
    Check(LossyRefinement.TheWitness.Trace == TraceT({ "in", "send", "ack" }),
          "refinement witness of the lossy protocol");

    auto CrashingSystem = Mgr->MakeParallel(Sender, Crashing);
    Expect(CheckEquivalence(CrashingSystem, Buffer, EquivalenceKindT::Trace, Options),
           VerdictT::Equivalent, "crashing protocol vs buffer, trace");
    Expect(CheckEquivalence(CrashingSystem, Buffer, EquivalenceKindT::WeakBisimulation,
                            Options),
           VerdictT::NotEquivalent, "crashing protocol vs buffer, weak");
    auto&& CrashingFailures = CheckEquivalence(CrashingSystem, Buffer,
                                               EquivalenceKindT::Failures, Options);
    Expect(CrashingFailures, VerdictT::NotEquivalent, "crashing protocol vs buffer, failures");
    Check(CrashingFailures.TheWitness.Trace == TraceT({ "in", "send" }) &&
          CrashingFailures.TheWitness.SetKind == ActionSetKindT::Refusal,
          "the crashing protocol deadlocks after a send");
    Expect(CheckEquivalence(CrashingSystem, Buffer, EquivalenceKindT::MustTesting, Options),
           VerdictT::NotEquivalent, "crashing protocol vs buffer, must testing");
    Expect(CheckRefinement(Buffer, CrashingSystem, Options), VerdictT::NotEquivalent,
           "crashing protocol refines the buffer");
    // Every behaviour of the buffer is a behaviour of the crashing protocol
    Expect(CheckRefinement(CrashingSystem, Buffer, Options), VerdictT::Equivalent,
           "buffer refines the crashing protocol");
}

// s | r with gamma(s, r) = c expands to s.r + r.s + c
static inline void TestExpansion(TermMgr* Mgr)
{
    cout << "Testing the ACP expansion law... " << endl;
    auto Stop = Mgr->MakeStop();
    auto SStop = Mgr->MakePrefix("s", Stop);
    auto RStop = Mgr->MakePrefix("r", Stop);

    EquivalenceOptionsT Options;
    Options.Model = SemanticModelT::ACP;
    Options.CommFunction.DefineSymmetric("s", "r", "c");

    auto Merge = Mgr->MakeParallel(SStop, RStop);
    auto Expansion = Mgr->MakeChoice({ Mgr->MakePrefix("s", RStop), Mgr->MakePrefix("r", SStop),
                                       Mgr->MakePrefix("c", Stop) });
    Expect(CheckEquivalence(Merge, Expansion, EquivalenceKindT::StrongBisimulation, Options),
           VerdictT::Equivalent, "s | r vs its expansion under ACP");

    // Without the communication the expansion has an extra summand
    EquivalenceOptionsT Silent;
    Silent.Model = SemanticModelT::ACP;
    Expect(CheckEquivalence(Merge, Expansion, EquivalenceKindT::Trace, Silent),
           VerdictT::NotEquivalent, "s | r vs its expansion without communication");

    // Under CCS the handshake needs complementary names
    auto CCSMerge = Mgr->MakeParallel(SStop, Mgr->MakePrefix("'s", Stop));
    auto CCSExpansion = Mgr->MakeChoice({ Mgr->MakeSequence({ "s", "'s" }, Stop),
                                          Mgr->MakeSequence({ "'s", "s" }, Stop),
                                          Mgr->MakePrefix(TauAction, Stop) });
    Expect(CheckEquivalence(CCSMerge, CCSExpansion, EquivalenceKindT::StrongBisimulation),
           VerdictT::Equivalent, "s | 's vs its expansion under CCS");
}

int main()
{
    auto Mgr = new TermMgr();

    TestBasicScenarios(Mgr);
    TestVendingMachines(Mgr);
    TestProtocol(Mgr);
    TestExpansion(Mgr);

    delete Mgr;
    cout << "All scenario tests passed!" << endl;
    return 0;
}

//
// ScenarioTests.cpp ends here
