// LabelledTS.cpp ---
//
// Filename: LabelledTS.cpp
// Author: Abhishek Udupa
// Created: Wed Mar 22 19:30:30 2015 (-0500)
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

#include <deque>
#include <unordered_map>

#include "../terms/Actions.hpp"

#include "LabelledTS.hpp"

namespace PAV {
    namespace LTS {

        LabelledTS::LabelledTS()
            : InitialState(0), HasInitialState(false)
        {
            // Nothing here
        }

        LabelledTS::~LabelledTS()
        {
            // Nothing here
        }

        StateID LabelledTS::AddState(const TermRef& Term, bool& IsNew)
        {
            auto it = NameIndex.find(Term->ToString());
            if (it != NameIndex.end()) {
                IsNew = false;
                return it->second;
            }
            IsNew = true;
            StateID NewID = StateTerms.size();
            StateTerms.push_back(Term);
            NameIndex[Term->ToString()] = NewID;
            return NewID;
        }

        void LabelledTS::AddTransition(StateID Source, const Action& TheAction, StateID Target)
        {
            if (Source >= StateTerms.size() || Target >= StateTerms.size()) {
                throw InternalError((string)"Attempted to add a transition with one " +
                                    "or more states not known to the LTS.\n" +
                                    "At: " + __FILE__ + ":" + to_string(__LINE__));
            }
            Actions.insert(TheAction);
            Relation.Add(Source, TheAction, Target);
        }

        void LabelledTS::SetInitialState(StateID State)
        {
            if (State >= StateTerms.size()) {
                throw InternalError((string)"Initial state " + to_string(State) +
                                    " is not known to the LTS.\nAt: " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }
            InitialState = State;
            HasInitialState = true;
        }

        u32 LabelledTS::GetNumStates() const
        {
            return StateTerms.size();
        }

        u64 LabelledTS::GetNumTransitions() const
        {
            return Relation.GetNumTransitions();
        }

        StateSetT LabelledTS::GetStates() const
        {
            StateSetT Retval;
            for (StateID i = 0; i < StateTerms.size(); ++i) {
                Retval.insert(Retval.end(), i);
            }
            return Retval;
        }

        const set<Action>& LabelledTS::GetActions() const
        {
            return Actions;
        }

        set<Action> LabelledTS::GetVisibleActions() const
        {
            set<Action> Retval;
            for (auto const& TheAction : Actions) {
                if (Terms::IsVisible(TheAction)) {
                    Retval.insert(TheAction);
                }
            }
            return Retval;
        }

        StateID LabelledTS::GetInitialState() const
        {
            if (!HasInitialState) {
                throw InternalError((string)"LTS has no initial state.\nAt: " +
                                    __FILE__ + ":" + to_string(__LINE__));
            }
            return InitialState;
        }

        bool LabelledTS::FindState(const string& Name, StateID& State) const
        {
            auto it = NameIndex.find(Name);
            if (it == NameIndex.end()) {
                return false;
            }
            State = it->second;
            return true;
        }

        const TermRef& LabelledTS::GetTerm(StateID State) const
        {
            if (State >= StateTerms.size()) {
                throw PAVError((string)"State " + to_string(State) + " is not known " +
                               "to the LTS.\nIn call to " + __FUNCTION__ + " at " +
                               __FILE__ + ":" + to_string(__LINE__));
            }
            return StateTerms[State];
        }

        const string& LabelledTS::GetName(StateID State) const
        {
            return GetTerm(State)->ToString();
        }

        const TransitionRelation& LabelledTS::GetRelation() const
        {
            return Relation;
        }

        const LTSEdgeSetT& LabelledTS::GetTransitions(StateID State) const
        {
            return Relation.GetTransitions(State);
        }

        StateSetT LabelledTS::GetTargets(StateID State, const Action& TheAction) const
        {
            return Relation.GetTargets(State, TheAction);
        }

        bool LabelledTS::FindPath(StateID Target, vector<Action>& Path) const
        {
            Path.clear();
            auto Origin = GetInitialState();
            if (Target == Origin) {
                return true;
            }

            // do a bfs
            deque<StateID> BFSQueue;
            unordered_map<StateID, const LTSEdge*> PathPreds;
            unordered_map<StateID, StateID> PredStates;
            BFSQueue.push_back(Origin);
            PredStates[Origin] = Origin;

            bool Found = false;
            while (BFSQueue.size() > 0 && !Found) {
                auto CurState = BFSQueue.front();
                BFSQueue.pop_front();

                for (auto Edge : SortEdges(Relation.GetTransitions(CurState))) {
                    auto CurTarget = Edge->GetTarget();
                    if (PredStates.find(CurTarget) != PredStates.end()) {
                        continue;
                    }
                    PredStates[CurTarget] = CurState;
                    PathPreds[CurTarget] = Edge;
                    if (CurTarget == Target) {
                        Found = true;
                        break;
                    }
                    BFSQueue.push_back(CurTarget);
                }
            }

            if (!Found) {
                return false;
            }

            deque<Action> ThePath;
            auto CurTarget = Target;
            while (CurTarget != Origin) {
                ThePath.push_front(PathPreds[CurTarget]->GetAction());
                CurTarget = PredStates[CurTarget];
            }
            Path.assign(ThePath.begin(), ThePath.end());
            return true;
        }

        string LabelledTS::ToString() const
        {
            ostringstream sstr;
            sstr << "LTS with " << GetNumStates() << " states and "
                 << GetNumTransitions() << " transitions" << endl;
            for (StateID i = 0; i < StateTerms.size(); ++i) {
                sstr << "State " << i << (HasInitialState && i == InitialState ? " (initial)" : "")
                     << ": " << StateTerms[i]->ToString() << endl;
                for (auto Edge : SortEdges(Relation.GetTransitions(i))) {
                    sstr << "    --" << Edge->GetAction() << "--> "
                         << Edge->GetTarget() << endl;
                }
            }
            return sstr.str();
        }

        ostream& operator << (ostream& Out, const LabelledTS& TheLTS)
        {
            Out << TheLTS.ToString();
            return Out;
        }

    } /* end namespace LTS */
} /* end namespace PAV */

//
// LabelledTS.cpp ends here
