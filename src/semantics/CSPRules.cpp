// CSPRules.cpp ---
//
// Filename: CSPRules.cpp
// Author: Abhishek Udupa
// Created: Tue Mar 20 21:14:22 2015 (-0500)
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
#include "CSPRules.hpp"

namespace PAV {
    namespace Sem {

        using namespace Terms;

        void ValidateSyncAlphabet(const set<Action>& SyncAlphabet)
        {
            for (auto const& SyncAction : SyncAlphabet) {
                if (IsSilent(SyncAction)) {
                    throw ConfigurationError((string)"The silent action cannot be part " +
                                             "of a synchronization alphabet.\nIn call to " +
                                             __FUNCTION__ + " at " + __FILE__ + ":" +
                                             to_string(__LINE__));
                }
                try {
                    CheckActionName(SyncAction);
                } catch (const PAVError& Ex) {
                    throw ConfigurationError((string)"Invalid action in synchronization " +
                                             "alphabet: " + Ex.what());
                }
            }
        }

        CSPExternalChoiceRule::CSPExternalChoiceRule()
            : ChoiceRule("CSP.ExternalChoice")
        {
            // Nothing here
        }

        CSPExternalChoiceRule::~CSPExternalChoiceRule()
        {
            // Nothing here
        }

        void CSPExternalChoiceRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                           DerivationCache& Cache,
                                           TransitionSetT& Result) const
        {
            auto TermAsChoice = Term->SAs<ChoiceTerm>();
            auto&& LeftTransitions = Engine->ComputeTransitions(Cache, TermAsChoice->GetLeft());
            auto&& RightTransitions = Engine->ComputeTransitions(Cache, TermAsChoice->GetRight());
            TermAsChoice->LiftExternalBranchTransitions(LeftTransitions, RightTransitions, Result);
        }

        CSPInterleavingRule::CSPInterleavingRule(const set<Action>& SyncAlphabet)
            : ParallelRuleBase("CSP.Interleaving"), SyncAlphabet(SyncAlphabet)
        {
            // Nothing here
        }

        CSPInterleavingRule::~CSPInterleavingRule()
        {
            // Nothing here
        }

        void CSPInterleavingRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                         DerivationCache& Cache, TransitionSetT& Result) const
        {
            auto TermAsPar = Term->SAs<ParallelTerm>();
            auto Mgr = Term->GetMgr();
            auto const& Left = TermAsPar->GetLeft();
            auto const& Right = TermAsPar->GetRight();

            for (auto const& Trans : Engine->ComputeTransitions(Cache, Left)) {
                if (SyncAlphabet.find(Trans.GetAction()) != SyncAlphabet.end()) {
                    continue;
                }
                Result.insert(Transition(Term, Trans.GetAction(),
                                         Mgr->MakeParallel(Trans.GetTarget(), Right)));
            }
            for (auto const& Trans : Engine->ComputeTransitions(Cache, Right)) {
                if (SyncAlphabet.find(Trans.GetAction()) != SyncAlphabet.end()) {
                    continue;
                }
                Result.insert(Transition(Term, Trans.GetAction(),
                                         Mgr->MakeParallel(Left, Trans.GetTarget())));
            }
        }

        CSPSynchronizationRule::CSPSynchronizationRule(const set<Action>& SyncAlphabet)
            : ParallelRuleBase("CSP.Synchronization"), SyncAlphabet(SyncAlphabet)
        {
            // Nothing here
        }

        CSPSynchronizationRule::~CSPSynchronizationRule()
        {
            // Nothing here
        }

        const set<Action>& CSPSynchronizationRule::GetSyncAlphabet() const
        {
            return SyncAlphabet;
        }

        void CSPSynchronizationRule::Derive(const TermRef& Term, const SOSEngine* Engine,
                                            DerivationCache& Cache, TransitionSetT& Result) const
        {
            if (SyncAlphabet.empty()) {
                return;
            }

            auto TermAsPar = Term->SAs<ParallelTerm>();
            auto Mgr = Term->GetMgr();

            auto&& LeftTransitions = Engine->ComputeTransitions(Cache, TermAsPar->GetLeft());
            auto&& RightTransitions = Engine->ComputeTransitions(Cache, TermAsPar->GetRight());

            for (auto const& LeftTrans : LeftTransitions) {
                auto const& SyncAction = LeftTrans.GetAction();
                if (SyncAlphabet.find(SyncAction) == SyncAlphabet.end()) {
                    continue;
                }
                for (auto const& RightTrans : RightTransitions) {
                    if (RightTrans.GetAction() != SyncAction) {
                        continue;
                    }
                    Result.insert(Transition(Term, SyncAction,
                                             Mgr->MakeParallel(LeftTrans.GetTarget(),
                                                               RightTrans.GetTarget())));
                }
            }
        }

    } /* end namespace Sem */
} /* end namespace PAV */

//
// CSPRules.cpp ends here
