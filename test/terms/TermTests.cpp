// TermTests.cpp ---
//
// Filename: TermTests.cpp
// Author: Abhishek Udupa
// Created: Fri May 21 22:01:23 2015 (-0400)
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
#include "../../src/terms/Terms.hpp"
#include "../../src/terms/TermMgr.hpp"
#include "../../src/terms/TermUtils.hpp"
#include "../../src/terms/Transition.hpp"

using namespace PAV;
using namespace Terms;

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

// Counts the nodes of each kind in a term
class KindCounter : public TermVisitorBase
{
public:
    u32 NumStop;
    u32 NumVar;
    u32 NumPrefix;
    u32 NumChoice;
    u32 NumParallel;
    u32 NumRec;

    KindCounter()
        : NumStop(0), NumVar(0), NumPrefix(0), NumChoice(0),
          NumParallel(0), NumRec(0)
    {
        // Nothing here
    }

    virtual ~KindCounter()
    {
        // Nothing here
    }

    virtual void VisitStopTerm(const StopTerm* Term) override
    {
        ++NumStop;
    }

    virtual void VisitVarTerm(const VarTerm* Term) override
    {
        ++NumVar;
    }

    virtual void VisitPrefixTerm(const PrefixTerm* Term) override
    {
        ++NumPrefix;
        Term->GetContinuation()->Accept(this);
    }

    virtual void VisitChoiceTerm(const ChoiceTerm* Term) override
    {
        ++NumChoice;
        Term->GetLeft()->Accept(this);
        Term->GetRight()->Accept(this);
    }

    virtual void VisitParallelTerm(const ParallelTerm* Term) override
    {
        ++NumParallel;
        Term->GetLeft()->Accept(this);
        Term->GetRight()->Accept(this);
    }

    virtual void VisitRecTerm(const RecTerm* Term) override
    {
        ++NumRec;
        Term->GetDefinition()->Accept(this);
    }
};

static inline void TestActions()
{
    cout << "Testing actions... " << endl;
    Check(IsSilent(TauAction), "tau is not silent");
    Check(IsVisible("a"), "a is not visible");
    Check(Complement("a") == "'a", "complement of a");
    Check(Complement("'a") == "a", "complement of 'a");
    Check(AreComplementary("a", "'a"), "a and 'a not complementary");
    Check(AreComplementary("'a", "a"), "'a and a not complementary");
    Check(!AreComplementary("a", "a"), "a and a complementary");
    Check(!AreComplementary("a", "'b"), "a and 'b complementary");
    Check(!AreComplementary(TauAction, TauAction), "tau complementary to itself");

    CheckThrows<PAVError>([] () { Complement(TauAction); }, "complement of tau");
    CheckThrows<PAVError>([] () { CheckActionName(""); }, "empty action");
    CheckThrows<PAVError>([] () { CheckActionName("''a"); }, "double marker");
    CheckThrows<PAVError>([] () { CheckActionName("a b"); }, "space in action");
    CheckThrows<PAVError>([] () { CheckActionName("'tau"); }, "complemented tau");
    CheckActionName("send_1");
    CheckActionName("'recv");
}

static inline void TestCanonicalForms(TermMgr* Mgr)
{
    cout << "Testing canonical forms and interning... " << endl;
    auto Stop = Mgr->MakeStop();
    auto AStop = Mgr->MakePrefix("a", Stop);
    auto BStop = Mgr->MakePrefix("b", Stop);
    auto X = Mgr->MakeVar("X");

    Check(Stop->ToString() == "STOP", "canonical form of Stop");
    Check(AStop->ToString() == "a.STOP", "canonical form of a prefix");
    Check(Mgr->MakeChoice(AStop, BStop)->ToString() == "(a.STOP + b.STOP)",
          "canonical form of a choice");
    Check(Mgr->MakeParallel(AStop, Mgr->MakePrefix("'a", Stop))->ToString() ==
          "(a.STOP | 'a.STOP)", "canonical form of a parallel composition");
    Check(Mgr->MakeRec("X", Mgr->MakePrefix("a", X))->ToString() == "rec X.a.X",
          "canonical form of a recursive term");
    Check(Mgr->MakeSequence({ "a", "b", "c" }, Stop)->ToString() == "a.b.c.STOP",
          "canonical form of a sequence");

    auto NumTerms = Mgr->GetNumTerms();
    auto AStopAgain = Mgr->MakePrefix("a", Mgr->MakeStop());
    Check(AStop == AStopAgain, "equal terms were not interned to one instance");
    Check(Mgr->GetNumTerms() == NumTerms, "interning a known term created a new one");
    Check(Mgr->GetTermByID(AStop->GetID()) == AStop, "lookup by id failed");
    Check(AStop->Equals(AStopAgain), "structural equality");
    Check(!AStop->Equals(BStop), "different terms compare equal");
    Check(AStop->Compare(BStop.GetPtr_()) != 0, "different terms have compare 0");
    Check(AStop->Compare(AStopAgain.GetPtr_()) == 0, "equal terms have non zero compare");

    Check(Mgr->MakeChoice(vector<TermRef>())->Is<StopTerm>(),
          "empty choice is not Stop");
    Check(Mgr->MakeChoice(vector<TermRef>({ AStop, BStop, AStop }))->ToString() ==
          "((a.STOP + b.STOP) + a.STOP)", "left associated choice");

    // Normalized choice flattens and drops duplicate summands
    auto AB = Mgr->MakeChoice(AStop, BStop);
    auto BA = Mgr->MakeChoice(BStop, AStop);
    Check(Mgr->MakeNormalizedChoice(AB, BA) == AB, "normalized choice of (a + b) and (b + a)");
    Check(Mgr->MakeNormalizedChoice(AStop, AStop) == AStop, "normalized choice is idempotent");

    vector<TermRef> Summands;
    GatherSummands(Mgr->MakeChoice(AB, Mgr->MakePrefix("c", Stop)), Summands);
    Check(Summands.size() == 3, "summand gathering");

    CheckThrows<PAVError>([&] () { Mgr->MakeVar("1X"); }, "variable starting with a digit");
    CheckThrows<PAVError>([&] () { Mgr->MakeVar("STOP"); }, "reserved variable name");
    CheckThrows<PAVError>([&] () { Mgr->MakePrefix("a b", Stop); }, "bad action name");
    CheckThrows<PAVError>([&] () { Mgr->MakeChoice(AStop, TermRef::NullPtr); },
                          "null operand");

    TermMgr OtherMgr;
    CheckThrows<PAVError>([&] () { Mgr->MakeChoice(AStop, OtherMgr.MakeStop()); },
                          "operand from another manager");
}

static inline void TestSubstitution(TermMgr* Mgr)
{
    cout << "Testing substitution and unfolding... " << endl;
    auto Stop = Mgr->MakeStop();
    auto X = Mgr->MakeVar("X");
    auto Y = Mgr->MakeVar("Y");
    auto AX = Mgr->MakePrefix("a", X);

    Check(AX->Substitute("X", Stop)->ToString() == "a.STOP", "substitution into a prefix");
    Check(AX->Substitute("Y", Stop) == AX, "substitution of an absent variable");

    // Targeting the bound variable replaces the whole recursion
    auto RecX = Mgr->MakeRec("X", Mgr->MakeChoice(AX, Mgr->MakePrefix("b", Y)));
    auto Substituted = RecX->Substitute("X", Stop);
    Check(Substituted == Stop, "substitution of the bound variable replaces the term");
    Substituted = RecX->Substitute("Y", Stop);
    Check(Substituted->ToString() == "rec X.(a.X + b.STOP)",
          "substitution of a free variable under a binder");

    auto RecA = Mgr->MakeRec("X", AX);
    auto Unfolded = RecA->SAs<RecTerm>()->Unfold();
    Check(Unfolded->ToString() == "a.rec X.a.X", "unfolding of rec X.a.X");
}

static inline void TestDerive(TermMgr* Mgr)
{
    cout << "Testing the model agnostic derivation... " << endl;
    auto Stop = Mgr->MakeStop();
    auto AStop = Mgr->MakePrefix("a", Stop);
    auto BStop = Mgr->MakePrefix("b", Stop);

    Check(Stop->Derive().size() == 0, "Stop has transitions");
    Check(Mgr->MakeVar("X")->Derive().size() == 0, "a variable has transitions");
    Check(Mgr->MakeParallel(AStop, BStop)->Derive().size() == 0,
          "the inert parallel derivation produced transitions");

    auto PrefixTrans = AStop->Derive();
    Check(PrefixTrans.size() == 1, "prefix has one transition");
    Check(PrefixTrans.begin()->GetAction() == "a" &&
          PrefixTrans.begin()->GetTarget() == Stop, "prefix transition");

    // A visible step of a branch discards the alternative
    auto Choice = Mgr->MakeChoice(AStop, BStop);
    auto&& ChoiceTrans = SortTransitions(Choice->Derive());
    Check(ChoiceTrans.size() == 2, "choice has two transitions");
    for (auto const& Trans : ChoiceTrans) {
        Check(Trans.GetSource() == Choice, "choice transition source");
        Check(Trans.GetTarget() == Stop, "visible choice step keeps the alternative");
    }

    // So does a silent one
    auto TauChoice = Mgr->MakeChoice(Mgr->MakePrefix(TauAction, AStop), BStop);
    bool FoundTau = false;
    for (auto const& Trans : TauChoice->Derive()) {
        if (IsSilent(Trans.GetAction())) {
            FoundTau = true;
            Check(Trans.GetTarget() == AStop,
                  "silent choice step target: " + Trans.GetTarget()->ToString());
        }
    }
    Check(FoundTau, "silent step of a choice branch missing");

    // Keeping the alternative on silent steps is opt in
    TransitionSetT Lifted;
    TauChoice->SAs<ChoiceTerm>()->LiftExternalBranchTransitions(
        Mgr->MakePrefix(TauAction, AStop)->Derive(), BStop->Derive(), Lifted);
    Check(Lifted.size() == 2, "external lifting of tau.a.STOP + b.STOP");
    for (auto const& Trans : Lifted) {
        if (IsSilent(Trans.GetAction())) {
            Check(Trans.GetTarget()->ToString() == "(a.STOP + b.STOP)",
                  "external silent step target: " + Trans.GetTarget()->ToString());
        } else {
            Check(Trans.GetTarget() == Stop, "external visible step target");
        }
    }

    // Repeated silent steps stay finite
    auto Loop = Mgr->MakeRec("X", Mgr->MakeChoice(Mgr->MakePrefix(TauAction,
                                                                  Mgr->MakeVar("X")),
                                                   AStop));
    auto&& LoopTrans = Loop->Derive();
    Check(LoopTrans.size() == 2, "rec X.(tau.X + a.STOP) transitions");
    for (auto const& Trans : LoopTrans) {
        Check(Trans.GetSource() == Loop, "recursive transition not re-sourced");
    }
}

static inline void TestUtilities(TermMgr* Mgr)
{
    cout << "Testing free variables and guardedness... " << endl;
    auto X = Mgr->MakeVar("X");
    auto Y = Mgr->MakeVar("Y");
    auto AX = Mgr->MakePrefix("a", X);

    auto FreeVars = GetFreeVariables(Mgr->MakeChoice(AX, Y));
    Check(FreeVars.size() == 2, "free variables of (a.X + Y)");
    Check(GetFreeVariables(Mgr->MakeRec("X", AX)).size() == 0,
          "free variables of rec X.a.X");
    Check(IsClosed(Mgr->MakeRec("X", AX)), "rec X.a.X is not closed");
    Check(!IsClosed(AX), "a.X is closed");

    Check(IsGuarded(Mgr->MakeRec("X", AX)), "rec X.a.X is unguarded");
    Check(!IsGuarded(Mgr->MakeRec("X", X)), "rec X.X is guarded");
    Check(!IsGuarded(Mgr->MakeRec("X", Mgr->MakeChoice(AX, X))),
          "rec X.(a.X + X) is guarded");
    Check(!IsGuarded(Mgr->MakeRec("X", Mgr->MakeParallel(Mgr->MakePrefix("b", Mgr->MakeStop()),
                                                         X))),
          "rec X.(b.STOP | X) is guarded");

    CheckThrows<PAVError>([&] () { CheckExplorable(AX); }, "free variable");
    CheckThrows<PAVError>([&] () { CheckExplorable(Mgr->MakeRec("X", X)); },
                          "unguarded recursion");
    CheckExplorable(Mgr->MakeRec("X", AX));

    KindCounter Counter;
    Mgr->MakeParallel(Mgr->MakeRec("X", Mgr->MakeChoice(AX, Mgr->MakeStop())),
                      Mgr->MakeStop())->Accept(&Counter);
    Check(Counter.NumParallel == 1 && Counter.NumRec == 1 && Counter.NumChoice == 1 &&
          Counter.NumPrefix == 1 && Counter.NumVar == 1 && Counter.NumStop == 2,
          "visitor counts");
}

int main()
{
    auto Mgr = new TermMgr();

    TestActions();
    TestCanonicalForms(Mgr);
    TestSubstitution(Mgr);
    TestDerive(Mgr);
    TestUtilities(Mgr);

    delete Mgr;
    cout << "All term tests passed!" << endl;
    return 0;
}

//
// TermTests.cpp ends here
