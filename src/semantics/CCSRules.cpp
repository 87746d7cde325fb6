// CCSRules.cpp ---
//
// Filename: CCSRules.cpp
// Author: Abhishek Udupa
// Created: Sun Mar  6 11:40:20 2015 (-0500)
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
#include "CCSRules.hpp"

namespace PAV {
    namespace Sem {

        using namespace Terms;

        CCSInterleavingRule::CCSInterleavingRule()
            : ParallelRuleBase("CCS.Interleaving")
        {
            // Nothing here
        }

        CCSInterleavingRule::~CCSInterleavingRule()
        {
            // Nothing here
        }

        void CCSInterleavingRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                         DerivationCache& Cache, TransitionSetT& Result) const
        {
            auto TermAsPar = Term->SAs<ParallelTerm>();
            auto Mgr = Term->GetMgr();
            auto const& Left = TermAsPar->GetLeft();
            auto const& Right = TermAsPar->GetRight();

            for (auto const& Trans : Engine->ComputeTransitions(Cache, Left)) {
                Result.insert(Transition(Term, Trans.GetAction(),
                                         Mgr->MakeParallel(Trans.GetTarget(), Right)));
            }
            for (auto const& Trans : Engine->ComputeTransitions(Cache, Right)) {
                Result.insert(Transition(Term, Trans.GetAction(),
                                         Mgr->MakeParallel(Left, Trans.GetTarget())));
            }
        }

        CCSCommunicationRule::CCSCommunicationRule()
            : ParallelRuleBase("CCS.Communication")
        {
            // Nothing here
        }

        CCSCommunicationRule::~CCSCommunicationRule()
        {
            // Nothing here
        }

        void CCSCommunicationRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                          DerivationCache& Cache, TransitionSetT& Result) const
        {
            auto TermAsPar = Term->SAs<ParallelTerm>();
            auto Mgr = Term->GetMgr();

            auto&& LeftTransitions = Engine->ComputeTransitions(Cache, TermAsPar->GetLeft());
            auto&& RightTransitions = Engine->ComputeTransitions(Cache, TermAsPar->GetRight());

            for (auto const& LeftTrans : LeftTransitions) {
                if (IsSilent(LeftTrans.GetAction())) {
                    continue;
                }
                for (auto const& RightTrans : RightTransitions) {
                    if (!AreComplementary(LeftTrans.GetAction(), RightTrans.GetAction())) {
                        continue;
                    }
                    Result.insert(Transition(Term, TauAction,
                                             Mgr->MakeParallel(LeftTrans.GetTarget(),
                                                               RightTrans.GetTarget())));
                }
            }
        }

    } /* end namespace Sem */
} /* end namespace PAV */

//
// CCSRules.cpp ends here
