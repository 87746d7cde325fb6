// LTSBuilder.cpp ---
//
// Filename: LTSBuilder.cpp
// Author: Abhishek Udupa
// Created: Sun Apr 23 11:38:34 2015 (-0400)
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

#include <stack>

#include "../terms/TermUtils.hpp"
#include "../terms/Transition.hpp"
#include "../semantics/SOSEngine.hpp"
#include "../utils/LogManager.hpp"

#include "LabelledTS.hpp"
#include "LTSBuilder.hpp"

namespace PAV {
    namespace LTS {

        const u64 LTSBuilder::DefaultMaxStates = 100000;

        LTSBuilder::LTSBuilder(const Sem::SOSEngine* Engine, u64 MaxStates)
            : Engine(Engine), MaxStates(MaxStates),
              NumStatesExplored(0), NumTransitionsRecorded(0), NumTermsDerived(0)
        {
            if (Engine == nullptr) {
                throw PAVError((string)"LTSBuilder needs an SOS engine.\nIn call to " +
                               __FUNCTION__ + " at " + __FILE__ + ":" +
                               to_string(__LINE__));
            }
            if (MaxStates == 0) {
                throw ConfigurationError((string)"The state ceiling of an LTSBuilder " +
                                         "must be positive.\nIn call to " + __FUNCTION__ +
                                         " at " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        LTSBuilder::~LTSBuilder()
        {
            // Nothing here
        }

        u64 LTSBuilder::GetMaxStates() const
        {
            return MaxStates;
        }

        const Sem::SOSEngine* LTSBuilder::GetEngine() const
        {
            return Engine;
        }

        LabelledTS* LTSBuilder::Build(const TermRef& Term)
        {
            Terms::CheckExplorable(Term);

            NumStatesExplored = 0;
            NumTransitionsRecorded = 0;
            NumTermsDerived = 0;

            // Operands of composite states recur across states,
            // so derivations are shared for the whole build
            Sem::DerivationCache Cache;
            auto TheLTS = new LabelledTS();
            try {
                stack<StateID> DFSStack;
                bool IsNew = false;
                auto Root = TheLTS->AddState(Term, IsNew);
                TheLTS->SetInitialState(Root);
                DFSStack.push(Root);

                while (DFSStack.size() > 0) {
                    auto CurState = DFSStack.top();
                    DFSStack.pop();
                    ++NumStatesExplored;

                    auto CurTerm = TheLTS->GetTerm(CurState);

                    PAV_LOG_SHORT("Builder.States",
                                  Out_ << "[DFS] Exploring state " << CurState << ": "
                                       << CurTerm->ToString() << endl;);

                    auto const& Transitions = Engine->ComputeTransitions(Cache, CurTerm);
                    for (auto const& Trans : Terms::SortTransitions(Transitions)) {
                        auto Target = TheLTS->AddState(Trans.GetTarget(), IsNew);
                        if (IsNew) {
                            if (TheLTS->GetNumStates() > MaxStates) {
                                throw ExplorationLimitException((string)"LTS exploration of " +
                                                                Term->ToString() +
                                                                " exceeded the ceiling of " +
                                                                to_string(MaxStates) +
                                                                " states",
                                                                MaxStates,
                                                                TheLTS->GetNumStates());
                            }
                            DFSStack.push(Target);
                        }
                        TheLTS->AddTransition(CurState, Trans.GetAction(), Target);
                        ++NumTransitionsRecorded;

                        PAV_LOG_SHORT("Builder.Transitions",
                                      Out_ << "[DFS] " << CurState << " --"
                                           << Trans.GetAction() << "--> " << Target
                                           << (IsNew ? " (new)" : "") << endl;);
                    }
                }
            } catch (...) {
                NumTermsDerived = Cache.GetNumDerived();
                delete TheLTS;
                throw;
            }
            NumTermsDerived = Cache.GetNumDerived();

            PAV_LOG_MIN_SHORT(Out_ << "LTS built, contains " << TheLTS->GetNumStates()
                                   << " states and " << TheLTS->GetNumTransitions()
                                   << " transitions." << endl;);
            PAV_LOG_SHORT("Builder.Transitions",
                          Out_ << NumTermsDerived << " terms derived, "
                               << Cache.GetNumReused() << " derivations reused." << endl;);

            return TheLTS;
        }

        u64 LTSBuilder::GetNumStatesExplored() const
        {
            return NumStatesExplored;
        }

        u64 LTSBuilder::GetNumTransitionsRecorded() const
        {
            return NumTransitionsRecorded;
        }

        u64 LTSBuilder::GetNumTermsDerived() const
        {
            return NumTermsDerived;
        }

        LabelledTS* BuildLTS(const TermRef& Term, Sem::SemanticModelT Model)
        {
            auto Engine = Sem::MakeEngine(Model);
            LTSBuilder Builder(Engine);
            LabelledTS* Retval = nullptr;
            try {
                Retval = Builder.Build(Term);
            } catch (...) {
                delete Engine;
                throw;
            }
            delete Engine;
            return Retval;
        }

    } /* end namespace LTS */
} /* end namespace PAV */

//
// LTSBuilder.cpp ends here
