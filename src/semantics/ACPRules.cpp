// ACPRules.cpp ---
//
// Filename: ACPRules.cpp
// Author: Abhishek Udupa
// Created: Thu Mar  7 17:48:24 2015 (-0500)
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

#include "../terms/Actions.hpp"
#include "../terms/TermMgr.hpp"

#include "SOSEngine.hpp"
#include "ACPRules.hpp"

namespace PAV {
    namespace Sem {

        using namespace Terms;

        ACPLeftMergeRule::ACPLeftMergeRule(MergeOperandT Operand)
            : ParallelRuleBase(Operand == MergeOperandT::Left ?
                               "ACP.LeftMerge" : "ACP.RightMerge"),
              Operand(Operand)
        {
            // Nothing here
        }

        ACPLeftMergeRule::~ACPLeftMergeRule()
        {
            // Nothing here
        }

        MergeOperandT ACPLeftMergeRule::GetOperand() const
        {
            return Operand;
        }

        void ACPLeftMergeRule::LiftMoves(const TermRef& Composition, const TermRef& Mover,
                                         const TermRef& Waiter, bool MoverIsLeft,
                                         const SOSEngine* Engine, DerivationCache& Cache,
                                         TransitionSetT& Result)
        {
            auto Mgr = Mover->GetMgr();
            for (auto const& Trans : Engine->ComputeTransitions(Cache, Mover)) {
                auto Target = (MoverIsLeft ?
                               Mgr->MakeParallel(Trans.GetTarget(), Waiter) :
                               Mgr->MakeParallel(Waiter, Trans.GetTarget()));
                Result.insert(Transition(Composition, Trans.GetAction(), Target));
            }
        }

        void ACPLeftMergeRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                      DerivationCache& Cache, TransitionSetT& Result) const
        {
            auto TermAsPar = Term->SAs<ParallelTerm>();
            switch (Operand) {
            case MergeOperandT::Left:
                LiftMoves(Term, TermAsPar->GetLeft(), TermAsPar->GetRight(),
                          true, Engine, Cache, Result);
                break;
            case MergeOperandT::Right:
                LiftMoves(Term, TermAsPar->GetRight(), TermAsPar->GetLeft(),
                          false, Engine, Cache, Result);
                break;
            }
        }

        ACPCommunicationMergeRule::ACPCommunicationMergeRule(const CommunicationFunction& Gamma)
            : ParallelRuleBase("ACP.CommunicationMerge"), Gamma(Gamma)
        {
            // Nothing here
        }

        ACPCommunicationMergeRule::~ACPCommunicationMergeRule()
        {
            // Nothing here
        }

        const CommunicationFunction& ACPCommunicationMergeRule::GetCommunicationFunction() const
        {
            return Gamma;
        }

        void ACPCommunicationMergeRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                               DerivationCache& Cache, TransitionSetT& Result) const
        {
            if (Gamma.IsEmpty()) {
                return;
            }

            auto TermAsPar = Term->SAs<ParallelTerm>();
            auto Mgr = Term->GetMgr();

            auto&& LeftTransitions = Engine->ComputeTransitions(Cache, TermAsPar->GetLeft());
            auto&& RightTransitions = Engine->ComputeTransitions(Cache, TermAsPar->GetRight());

            for (auto const& LeftTrans : LeftTransitions) {
                if (IsSilent(LeftTrans.GetAction())) {
                    continue;
                }
                for (auto const& RightTrans : RightTransitions) {
                    Action Communicated;
                    if (!Gamma.Communicate(LeftTrans.GetAction(), RightTrans.GetAction(),
                                           Communicated)) {
                        continue;
                    }
                    Result.insert(Transition(Term, Communicated,
                                             Mgr->MakeParallel(LeftTrans.GetTarget(),
                                                               RightTrans.GetTarget())));
                }
            }
        }

    } /* end namespace Sem */
} /* end namespace PAV */

//
// ACPRules.cpp ends here
