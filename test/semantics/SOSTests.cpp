// SOSTests.cpp ---
//
// Filename: SOSTests.cpp
// Author: Abhishek Udupa
// Created: Sat May  1 13:18:54 2015 (-0400)
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
#include "../../src/semantics/CommunicationFunction.hpp"
#include "../../src/semantics/DerivationCache.hpp"
#include "../../src/semantics/SOSRules.hpp"
#include "../../src/semantics/CCSRules.hpp"
#include "../../src/semantics/SOSEngine.hpp"

using namespace PAV;
using namespace Terms;
using namespace Sem;

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

static inline bool HasTransition(const TransitionSetT& Transitions, const Action& TheAction,
                                 const string& TargetName)
{
    for (auto const& Trans : Transitions) {
        if (Trans.GetAction() == TheAction && Trans.GetTarget()->ToString() == TargetName) {
            return true;
        }
    }
    return false;
}

static inline void PrintTransitions(const TransitionSetT& Transitions)
{
    for (auto const& Trans : SortTransitions(Transitions)) {
        cout << "    " << Trans << endl;
    }
}

static inline void TestCCS(TermMgr* Mgr)
{
    cout << "Testing CCS semantics... " << endl;
    auto Engine = MakeCCSEngine();
    auto Stop = Mgr->MakeStop();
    auto AStop = Mgr->MakePrefix("a", Stop);
    auto CoAStop = Mgr->MakePrefix("'a", Stop);
    auto BStop = Mgr->MakePrefix("b", Stop);

    Check(Engine->GetModel() == SemanticModelT::CCS, "model of the CCS engine");
    Check(Engine->ComputeTransitions(Stop).size() == 0, "Stop is not stuck");

    // a | 'a interleaves and handshakes
    auto&& Handshake = Engine->ComputeTransitions(Mgr->MakeParallel(AStop, CoAStop));
    PrintTransitions(Handshake);
    Check(Handshake.size() == 3, "a | 'a must have three transitions");
    Check(HasTransition(Handshake, "a", "(STOP | 'a.STOP)"), "left move of a | 'a");
    Check(HasTransition(Handshake, "'a", "(a.STOP | STOP)"), "right move of a | 'a");
    Check(HasTransition(Handshake, TauAction, "(STOP | STOP)"), "handshake of a | 'a");

    // No handshake between unrelated actions
    auto&& NoSync = Engine->ComputeTransitions(Mgr->MakeParallel(AStop, BStop));
    Check(NoSync.size() == 2, "a | b must have two transitions");

    // Silent actions do not synchronize
    auto TauStop = Mgr->MakePrefix(TauAction, Stop);
    auto&& TauPar = Engine->ComputeTransitions(Mgr->MakeParallel(TauStop, TauStop));
    Check(TauPar.size() == 2 && !HasTransition(TauPar, TauAction, "(STOP | STOP)"),
          "tau | tau must only interleave");

    // Recursion inside parallel composition
    auto Rec = Mgr->MakeRec("X", Mgr->MakePrefix("a", Mgr->MakeVar("X")));
    auto&& RecPar = Engine->ComputeTransitions(Mgr->MakeParallel(Rec, CoAStop));
    Check(HasTransition(RecPar, TauAction, "(rec X.a.X | STOP)"),
          "handshake with a recursive operand");

    // The result does not depend on the order of the rules
    auto Reversed = new SOSEngine(SemanticModelT::CCS);
    auto const& Rules = Engine->GetRules();
    for (auto it = Rules.rbegin(); it != Rules.rend(); ++it) {
        if ((*it)->GetName() == "Prefix") {
            Reversed->AddRule(new PrefixRule());
        } else if ((*it)->GetName() == "Choice") {
            Reversed->AddRule(new ChoiceRule());
        } else if ((*it)->GetName() == "Recursion") {
            Reversed->AddRule(new RecursionRule());
        } else if ((*it)->GetName() == "CCS.Interleaving") {
            Reversed->AddRule(new CCSInterleavingRule());
        } else if ((*it)->GetName() == "CCS.Communication") {
            Reversed->AddRule(new CCSCommunicationRule());
        }
    }
    Check(Reversed->GetRules().size() == Rules.size(), "rule names of the CCS engine");
    auto Term = Mgr->MakeParallel(Mgr->MakeChoice(AStop, BStop), CoAStop);
    Check(Reversed->ComputeTransitions(Term) == Engine->ComputeTransitions(Term),
          "rule order changed the transitions");

    CheckThrows<PAVError>([&] () { Engine->DeriveLeftMerge(AStop, BStop); },
                          "left merge on a CCS engine");

    delete Reversed;
    delete Engine;
}

static inline void TestCSP(TermMgr* Mgr)
{
    cout << "Testing CSP semantics... " << endl;
    auto Stop = Mgr->MakeStop();
    auto AStop = Mgr->MakePrefix("a", Stop);
    auto BStop = Mgr->MakePrefix("b", Stop);
    auto Engine = MakeCSPEngine({ "a" });

    // Alphabet actions rendezvous and stay visible
    auto&& Sync = Engine->ComputeTransitions(Mgr->MakeParallel(AStop, AStop));
    PrintTransitions(Sync);
    Check(Sync.size() == 1, "a || a must synchronize only");
    Check(HasTransition(Sync, "a", "(STOP | STOP)"), "rendezvous on a");

    // An alphabet action offered by one side only blocks
    auto&& Blocked = Engine->ComputeTransitions(Mgr->MakeParallel(AStop, BStop));
    Check(Blocked.size() == 1 && HasTransition(Blocked, "b", "(a.STOP | STOP)"),
          "a || b must only interleave b");

    // Three way rendezvous through nested composition
    auto Three = Mgr->MakeParallel(Mgr->MakeParallel(AStop, AStop), AStop);
    auto&& ThreeWay = Engine->ComputeTransitions(Three);
    Check(ThreeWay.size() == 1 && HasTransition(ThreeWay, "a", "((STOP | STOP) | STOP)"),
          "multi way rendezvous");

    // Silent actions always interleave
    auto TauStop = Mgr->MakePrefix(TauAction, Stop);
    auto&& TauPar = Engine->ComputeTransitions(Mgr->MakeParallel(TauStop, TauStop));
    Check(TauPar.size() == 2 && !HasTransition(TauPar, TauAction, "(STOP | STOP)"),
          "tau under CSP");

    // A silent step of a branch leaves the choice open
    auto Hidden = Mgr->MakeChoice(AStop, Mgr->MakePrefix(TauAction, BStop));
    auto&& External = Engine->ComputeTransitions(Hidden);
    PrintTransitions(External);
    Check(External.size() == 2, "a + tau.b must have two transitions");
    Check(HasTransition(External, TauAction, "(a.STOP + b.STOP)"),
          "silent step of an external choice");
    Check(HasTransition(External, "a", "STOP"), "visible step of an external choice");
    auto CCSEngine = MakeCCSEngine();
    Check(HasTransition(CCSEngine->ComputeTransitions(Hidden), TauAction, "b.STOP"),
          "silent step of a CCS choice");
    delete CCSEngine;

    CheckThrows<ConfigurationError>([] () { MakeCSPEngine({ TauAction }); },
                                    "tau in the synchronization alphabet");
    delete Engine;
}

static inline void TestACP(TermMgr* Mgr)
{
    cout << "Testing ACP semantics... " << endl;
    auto Stop = Mgr->MakeStop();
    auto SStop = Mgr->MakePrefix("s", Stop);
    auto RStop = Mgr->MakePrefix("r", Stop);

    CommunicationFunction Gamma;
    Gamma.DefineSymmetric("s", "r", "c");
    Gamma.Validate();
    Action Result;
    Check(Gamma.Communicate("r", "s", Result) && Result == "c", "gamma(r, s)");
    Check(!Gamma.Communicate("s", "s", Result), "gamma(s, s) defined");
    cout << "Communication function: " << Gamma.ToString() << endl;

    auto Engine = MakeACPEngine(Gamma);
    auto&& Merged = Engine->ComputeTransitions(Mgr->MakeParallel(SStop, RStop));
    PrintTransitions(Merged);
    Check(Merged.size() == 3, "s || r must have three transitions");
    Check(HasTransition(Merged, "c", "(STOP | STOP)"), "communication of s and r");

    auto&& LeftMerge = Engine->DeriveLeftMerge(SStop, RStop);
    Check(LeftMerge.size() == 1 && HasTransition(LeftMerge, "s", "(STOP | r.STOP)"),
          "left merge of s and r");
    auto&& CommMerge = Engine->DeriveCommunicationMerge(SStop, RStop);
    Check(CommMerge.size() == 1 && HasTransition(CommMerge, "c", "(STOP | STOP)"),
          "communication merge of s and r");

    // The left merge and its mirror together give free interleaving
    auto&& RightMerge = Engine->DeriveLeftMerge(RStop, SStop);
    Check(RightMerge.size() == 1, "left merge of r and s");

    // Structural inconsistencies are rejected before any exploration
    CheckThrows<ConfigurationError>([] () {
            CommunicationFunction Bad;
            Bad.Define("s", "r", "c");
            MakeACPEngine(Bad);
        }, "non commutative communication function");
    CheckThrows<ConfigurationError>([] () {
            CommunicationFunction Bad;
            Bad.DefineSymmetric("s", TauAction, "c");
            Bad.Validate();
        }, "communication function with tau");
    CheckThrows<ConfigurationError>([] () {
            CommunicationFunction Bad;
            Bad.Define("s", "r", "c");
            Bad.Define("s", "r", "d");
        }, "conflicting redefinition");
    CheckThrows<ConfigurationError>([] () {
            // gamma(gamma(a, a), b) = gamma(b, b) = c, but gamma(a, gamma(a, b))
            // is undefined
            CommunicationFunction Bad;
            Bad.Define("a", "a", "b");
            Bad.Define("b", "b", "c");
            Bad.Validate();
        }, "non associative communication function");

    delete Engine;
}

static inline void TestDerivationCache(TermMgr* Mgr)
{
    cout << "Testing shared derivations... " << endl;
    auto Engine = MakeCCSEngine();
    auto Stop = Mgr->MakeStop();

    // ((a0 | a1) | a2) | ... with no two names complementary. Both
    // parallel rules consult both operands, which would take time
    // exponential in the nesting if operands were derived afresh.
    const u64 NumOperands = 24;
    auto Nested = Mgr->MakePrefix("a0", Stop);
    for (u64 i = 1; i < NumOperands; ++i) {
        Nested = Mgr->MakeParallel(Nested, Mgr->MakePrefix("a" + to_string(i), Stop));
    }

    DerivationCache Cache;
    auto const& Transitions = Engine->ComputeTransitions(Cache, Nested);
    Check(Transitions.size() == NumOperands, "transitions of the nested composition");
    Check(Cache.GetNumDerived() == 2 * NumOperands - 1, "terms derived for the composition");
    Check(Cache.GetNumReused() == 2 * (NumOperands - 1), "derivations reused");

    // Asking again is answered from the cache
    Check(&(Engine->ComputeTransitions(Cache, Nested)) == &Transitions, "cached result");
    Check(Cache.GetNumDerived() == 2 * NumOperands - 1, "terms derived after a lookup");
    CheckThrows<InternalError>([&] () { Cache.Insert(Nested, TransitionSetT()); },
                               "term derived twice");

    Cache.Clear();
    Check(Cache.GetNumDerived() == 0 && Cache.GetNumReused() == 0, "cleared cache");
    delete Engine;
}

static inline void TestFactory(TermMgr* Mgr)
{
    cout << "Testing the engine factory... " << endl;
    Check(SemanticModelFromString("ccs") == SemanticModelT::CCS, "parsing ccs");
    Check(SemanticModelFromString("CSP") == SemanticModelT::CSP, "parsing CSP");
    Check(SemanticModelFromString("Acp") == SemanticModelT::ACP, "parsing Acp");
    Check(SemanticModelToString(SemanticModelT::ACP) == "ACP", "printing ACP");
    CheckThrows<PAVError>([] () { SemanticModelFromString("pi"); }, "unknown model");

    for (auto Model : { SemanticModelT::CCS, SemanticModelT::CSP, SemanticModelT::ACP }) {
        auto Engine = MakeEngine(Model);
        Check(Engine->GetModel() == Model, "model of a factory made engine");
        // Visible steps of sequential terms are the same everywhere
        auto Term = Mgr->MakeChoice(Mgr->MakePrefix("a", Mgr->MakeStop()),
                                    Mgr->MakeRec("X", Mgr->MakePrefix("b",
                                                                      Mgr->MakeVar("X"))));
        Check(Engine->ComputeTransitions(Term).size() == 2,
              "sequential transitions under " + SemanticModelToString(Model));
        delete Engine;
    }
}

int main()
{
    auto Mgr = new TermMgr();

    TestCCS(Mgr);
    TestCSP(Mgr);
    TestACP(Mgr);
    TestDerivationCache(Mgr);
    TestFactory(Mgr);

    delete Mgr;
    cout << "All SOS tests passed!" << endl;
    return 0;
}

//
// SOSTests.cpp ends here
