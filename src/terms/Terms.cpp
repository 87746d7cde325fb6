// Terms.cpp ---
//
// Filename: Terms.cpp
// Author: Abhishek Udupa
// Created: Tue Feb  3 21:16:08 2015 (-0500)
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

#include "Actions.hpp"
#include "Terms.hpp"
#include "TermMgr.hpp"
#include "Transition.hpp"

namespace PAV {
    namespace Terms {

        TermBase::TermBase(TermMgr* Mgr, TermKind Kind)
            : Mgr(Mgr), Kind(Kind), InternID(UINT64_MAX), HashCode(0)
        {
            // Nothing here
        }

        TermBase::~TermBase()
        {
            // Nothing here
        }

        bool TermBase::Equals(const TermBase* Other) const
        {
            if (Other == this) {
                return true;
            }
            // Interned terms from the same manager are equal
            // iff they are the same object
            if (Other->Mgr == Mgr && InternID != UINT64_MAX &&
                Other->InternID != UINT64_MAX) {
                return false;
            }
            return (Compare(Other) == 0);
        }

        void TermBase::SetInternID_(u64 ID) const
        {
            InternID = ID;
        }

        TransitionSetT TermBase::Derive() const
        {
            TransitionSetT Retval;
            TermRef ThisTerm = this;

            switch (Kind) {
            case TermKind::Stop:
            case TermKind::Var:
            case TermKind::Parallel:
                break;

            case TermKind::Prefix: {
                auto ThisAsPrefix = SAs<PrefixTerm>();
                Retval.insert(Transition(ThisTerm, ThisAsPrefix->GetAction(),
                                         ThisAsPrefix->GetContinuation()));
                break;
            }

            case TermKind::Choice: {
                auto ThisAsChoice = SAs<ChoiceTerm>();
                ThisAsChoice->LiftBranchTransitions(ThisAsChoice->GetLeft()->Derive(),
                                                    ThisAsChoice->GetRight()->Derive(),
                                                    Retval);
                break;
            }

            case TermKind::Recursive: {
                auto Unfolded = SAs<RecTerm>()->Unfold();
                for (auto const& Trans : Unfolded->Derive()) {
                    Retval.insert(Transition(ThisTerm, Trans.GetAction(),
                                             Trans.GetTarget()));
                }
                break;
            }
            }
            return Retval;
        }

        StopTerm::StopTerm(TermMgr* Mgr)
            : TermBase(Mgr, TermKind::Stop)
        {
            Finalize("STOP");
        }

        StopTerm::~StopTerm()
        {
            // Nothing here
        }

        i32 StopTerm::Compare(const TermBase* Other) const
        {
            if (Other->GetKind() == TermKind::Stop) {
                return 0;
            }
            return -1;
        }

        void StopTerm::Accept(TermVisitorBase* Visitor) const
        {
            Visitor->VisitStopTerm(this);
        }

        TermRef StopTerm::Substitute(const string& VarName,
                                     const TermRef& Replacement) const
        {
            return this;
        }

        VarTerm::VarTerm(TermMgr* Mgr, const string& VarName)
            : TermBase(Mgr, TermKind::Var), VarName(VarName)
        {
            Finalize(VarName);
        }

        VarTerm::~VarTerm()
        {
            // Nothing here
        }

        i32 VarTerm::Compare(const TermBase* Other) const
        {
            if (Other->GetKind() != TermKind::Var) {
                return ((i32)TermKind::Var - (i32)Other->GetKind());
            }
            return VarName.compare(Other->SAs<VarTerm>()->VarName);
        }

        void VarTerm::Accept(TermVisitorBase* Visitor) const
        {
            Visitor->VisitVarTerm(this);
        }

        TermRef VarTerm::Substitute(const string& VarName,
                                    const TermRef& Replacement) const
        {
            if (VarName == this->VarName) {
                return Replacement;
            }
            return this;
        }

        PrefixTerm::PrefixTerm(TermMgr* Mgr, const Action& PrefixAction,
                               const TermRef& Continuation)
            : TermBase(Mgr, TermKind::Prefix), PrefixAction(PrefixAction),
              Continuation(Continuation)
        {
            Finalize(PrefixAction + "." + Continuation->ToString());
        }

        PrefixTerm::~PrefixTerm()
        {
            // Nothing here
        }

        i32 PrefixTerm::Compare(const TermBase* Other) const
        {
            if (Other->GetKind() != TermKind::Prefix) {
                return ((i32)TermKind::Prefix - (i32)Other->GetKind());
            }
            auto OtherAsPrefix = Other->SAs<PrefixTerm>();
            auto Res = PrefixAction.compare(OtherAsPrefix->PrefixAction);
            if (Res != 0) {
                return Res;
            }
            return Continuation->Compare(OtherAsPrefix->Continuation.GetPtr_());
        }

        void PrefixTerm::Accept(TermVisitorBase* Visitor) const
        {
            Visitor->VisitPrefixTerm(this);
        }

        TermRef PrefixTerm::Substitute(const string& VarName,
                                       const TermRef& Replacement) const
        {
            auto NewContinuation = Continuation->Substitute(VarName, Replacement);
            if (NewContinuation == Continuation) {
                return this;
            }
            return GetMgr()->MakePrefix(PrefixAction, NewContinuation);
        }

        BinaryTerm::BinaryTerm(TermMgr* Mgr, TermKind Kind,
                               const TermRef& Left, const TermRef& Right)
            : TermBase(Mgr, Kind), Left(Left), Right(Right)
        {
            string OpString = (Kind == TermKind::Choice ? " + " : " | ");
            Finalize("(" + Left->ToString() + OpString + Right->ToString() + ")");
        }

        BinaryTerm::~BinaryTerm()
        {
            // Nothing here
        }

        i32 BinaryTerm::CompareInternal(const BinaryTerm* Other) const
        {
            auto Res = Left->Compare(Other->Left.GetPtr_());
            if (Res != 0) {
                return Res;
            }
            return Right->Compare(Other->Right.GetPtr_());
        }

        ChoiceTerm::ChoiceTerm(TermMgr* Mgr, const TermRef& Left, const TermRef& Right)
            : BinaryTerm(Mgr, TermKind::Choice, Left, Right)
        {
            // Nothing here
        }

        ChoiceTerm::~ChoiceTerm()
        {
            // Nothing here
        }

        i32 ChoiceTerm::Compare(const TermBase* Other) const
        {
            if (Other->GetKind() != TermKind::Choice) {
                return ((i32)TermKind::Choice - (i32)Other->GetKind());
            }
            return CompareInternal(Other->SAs<ChoiceTerm>());
        }

        void ChoiceTerm::Accept(TermVisitorBase* Visitor) const
        {
            Visitor->VisitChoiceTerm(this);
        }

        TermRef ChoiceTerm::Substitute(const string& VarName,
                                       const TermRef& Replacement) const
        {
            auto NewLeft = GetLeft()->Substitute(VarName, Replacement);
            auto NewRight = GetRight()->Substitute(VarName, Replacement);
            if (NewLeft == GetLeft() && NewRight == GetRight()) {
                return this;
            }
            return GetMgr()->MakeChoice(NewLeft, NewRight);
        }

        void ChoiceTerm::LiftBranchTransitions(const TransitionSetT& LeftTransitions,
                                               const TransitionSetT& RightTransitions,
                                               TransitionSetT& Result) const
        {
            TermRef ThisTerm = this;
            for (auto const& Trans : LeftTransitions) {
                Result.insert(Transition(ThisTerm, Trans.GetAction(), Trans.GetTarget()));
            }
            for (auto const& Trans : RightTransitions) {
                Result.insert(Transition(ThisTerm, Trans.GetAction(), Trans.GetTarget()));
            }
        }

        void ChoiceTerm::LiftExternalBranchTransitions(const TransitionSetT& LeftTransitions,
                                                       const TransitionSetT& RightTransitions,
                                                       TransitionSetT& Result) const
        {
            TermRef ThisTerm = this;
            auto Mgr = GetMgr();

            for (auto const& Trans : LeftTransitions) {
                if (IsSilent(Trans.GetAction())) {
                    Result.insert(Transition(ThisTerm, Trans.GetAction(),
                                             Mgr->MakeNormalizedChoice(Trans.GetTarget(),
                                                                       GetRight())));
                } else {
                    Result.insert(Transition(ThisTerm, Trans.GetAction(),
                                             Trans.GetTarget()));
                }
            }

            for (auto const& Trans : RightTransitions) {
                if (IsSilent(Trans.GetAction())) {
                    Result.insert(Transition(ThisTerm, Trans.GetAction(),
                                             Mgr->MakeNormalizedChoice(GetLeft(),
                                                                       Trans.GetTarget())));
                } else {
                    Result.insert(Transition(ThisTerm, Trans.GetAction(),
                                             Trans.GetTarget()));
                }
            }
        }

        ParallelTerm::ParallelTerm(TermMgr* Mgr, const TermRef& Left, const TermRef& Right)
            : BinaryTerm(Mgr, TermKind::Parallel, Left, Right)
        {
            // Nothing here
        }

        ParallelTerm::~ParallelTerm()
        {
            // Nothing here
        }

        i32 ParallelTerm::Compare(const TermBase* Other) const
        {
            if (Other->GetKind() != TermKind::Parallel) {
                return ((i32)TermKind::Parallel - (i32)Other->GetKind());
            }
            return CompareInternal(Other->SAs<ParallelTerm>());
        }

        void ParallelTerm::Accept(TermVisitorBase* Visitor) const
        {
            Visitor->VisitParallelTerm(this);
        }

        TermRef ParallelTerm::Substitute(const string& VarName,
                                         const TermRef& Replacement) const
        {
            auto NewLeft = GetLeft()->Substitute(VarName, Replacement);
            auto NewRight = GetRight()->Substitute(VarName, Replacement);
            if (NewLeft == GetLeft() && NewRight == GetRight()) {
                return this;
            }
            return GetMgr()->MakeParallel(NewLeft, NewRight);
        }

        RecTerm::RecTerm(TermMgr* Mgr, const string& VarName, const TermRef& Definition)
            : TermBase(Mgr, TermKind::Recursive), VarName(VarName), Definition(Definition)
        {
            Finalize("rec " + VarName + "." + Definition->ToString());
        }

        RecTerm::~RecTerm()
        {
            // Nothing here
        }

        TermRef RecTerm::Unfold() const
        {
            return Definition->Substitute(VarName, this);
        }

        i32 RecTerm::Compare(const TermBase* Other) const
        {
            if (Other->GetKind() != TermKind::Recursive) {
                return ((i32)TermKind::Recursive - (i32)Other->GetKind());
            }
            auto OtherAsRec = Other->SAs<RecTerm>();
            auto Res = VarName.compare(OtherAsRec->VarName);
            if (Res != 0) {
                return Res;
            }
            return Definition->Compare(OtherAsRec->Definition.GetPtr_());
        }

        void RecTerm::Accept(TermVisitorBase* Visitor) const
        {
            Visitor->VisitRecTerm(this);
        }

        TermRef RecTerm::Substitute(const string& VarName,
                                    const TermRef& Replacement) const
        {
            // The whole term is replaced when its own variable is targeted
            if (VarName == this->VarName) {
                return Replacement;
            }
            auto NewDefinition = Definition->Substitute(VarName, Replacement);
            if (NewDefinition == Definition) {
                return this;
            }
            return GetMgr()->MakeRec(this->VarName, NewDefinition);
        }

        TermVisitorBase::TermVisitorBase()
        {
            // Nothing here
        }

        TermVisitorBase::~TermVisitorBase()
        {
            // Nothing here
        }

        ostream& operator << (ostream& Out, const TermRef& Term)
        {
            Out << Term->ToString();
            return Out;
        }

        string TermKindToString(TermKind Kind)
        {
            switch (Kind) {
            case TermKind::Stop:
                return "Stop";
            case TermKind::Var:
                return "Var";
            case TermKind::Prefix:
                return "Prefix";
            case TermKind::Choice:
                return "Choice";
            case TermKind::Parallel:
                return "Parallel";
            case TermKind::Recursive:
                return "Recursive";
            }
            return "Unknown";
        }

    } /* end namespace Terms */
} /* end namespace PAV */

//
// Terms.cpp ends here
