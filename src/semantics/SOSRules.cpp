// SOSRules.cpp ---
//
// Filename: SOSRules.cpp
// Author: Abhishek Udupa
// Created: Fri Mar 19 15:06:18 2015 (-0500)
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

#include "../terms/TermMgr.hpp"

#include "SOSEngine.hpp"
#include "SOSRules.hpp"

namespace PAV {
    namespace Sem {

        using namespace Terms;

        SOSRuleBase::SOSRuleBase(const string& Name)
            : Name(Name)
        {
            // Nothing here
        }

        SOSRuleBase::~SOSRuleBase()
        {
            // Nothing here
        }

        const string& SOSRuleBase::GetName() const
        {
            return Name;
        }

        PrefixRule::PrefixRule()
            : SOSRuleBase("Prefix")
        {
            // Nothing here
        }

        PrefixRule::~PrefixRule()
        {
            // Nothing here
        }

        bool PrefixRule::CanApply(const TermRef& Term) const
        {
            switch (Term->GetKind()) {
            case TermKind::Prefix:
                return true;
            case TermKind::Stop:
            case TermKind::Var:
            case TermKind::Choice:
            case TermKind::Parallel:
            case TermKind::Recursive:
                return false;
            }
            return false;
        }

        void PrefixRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const
        {
            auto TermAsPrefix = Term->SAs<PrefixTerm>();
            Result.insert(Transition(Term, TermAsPrefix->GetAction(),
                                     TermAsPrefix->GetContinuation()));
        }

        ChoiceRule::ChoiceRule()
            : SOSRuleBase("Choice")
        {
            // Nothing here
        }

        ChoiceRule::ChoiceRule(const string& Name)
            : SOSRuleBase(Name)
        {
            // Nothing here
        }

        ChoiceRule::~ChoiceRule()
        {
            // Nothing here
        }

        bool ChoiceRule::CanApply(const TermRef& Term) const
        {
            switch (Term->GetKind()) {
            case TermKind::Choice:
                return true;
            case TermKind::Stop:
            case TermKind::Var:
            case TermKind::Prefix:
            case TermKind::Parallel:
            case TermKind::Recursive:
                return false;
            }
            return false;
        }

        void ChoiceRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const
        {
            auto TermAsChoice = Term->SAs<ChoiceTerm>();
            auto&& LeftTransitions = Engine->ComputeTransitions(Cache, TermAsChoice->GetLeft());
            auto&& RightTransitions = Engine->ComputeTransitions(Cache, TermAsChoice->GetRight());
            TermAsChoice->LiftBranchTransitions(LeftTransitions, RightTransitions, Result);
        }

        RecursionRule::RecursionRule()
            : SOSRuleBase("Recursion")
        {
            // Nothing here
        }

        RecursionRule::~RecursionRule()
        {
            // Nothing here
        }

        bool RecursionRule::CanApply(const TermRef& Term) const
        {
            switch (Term->GetKind()) {
            case TermKind::Recursive:
                return true;
            case TermKind::Stop:
            case TermKind::Var:
            case TermKind::Prefix:
            case TermKind::Choice:
            case TermKind::Parallel:
                return false;
            }
            return false;
        }

        void RecursionRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                   DerivationCache& Cache, TransitionSetT& Result) const
        {
            auto Unfolded = Term->SAs<RecTerm>()->Unfold();
            for (auto const& Trans : Engine->ComputeTransitions(Cache, Unfolded)) {
                Result.insert(Transition(Term, Trans.GetAction(), Trans.GetTarget()));
            }
        }

        ParallelRuleBase::ParallelRuleBase(const string& Name)
            : SOSRuleBase(Name)
        {
            // Nothing here
        }

        ParallelRuleBase::~ParallelRuleBase()
        {
            // Nothing here
        }

        bool ParallelRuleBase::CanApply(const TermRef& Term) const
        {
            switch (Term->GetKind()) {
            case TermKind::Parallel:
                return true;
            case TermKind::Stop:
            case TermKind::Var:
            case TermKind::Prefix:
            case TermKind::Choice:
            case TermKind::Recursive:
                return false;
            }
            return false;
        }

    } /* end namespace Sem */
} /* end namespace PAV */

//
// SOSRules.cpp ends here
