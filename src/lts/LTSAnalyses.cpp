// LTSAnalyses.cpp ---
//
// Filename: LTSAnalyses.cpp
// Author: Abhishek Udupa
// Created: Fri Mar  9 15:04:32 2015 (-0500)
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
#include <stack>
#include <unordered_map>

#include "../terms/Actions.hpp"

#include "LabelledTS.hpp"
#include "LTSAnalyses.hpp"

namespace PAV {
    namespace LTS {

        StateSetT TauClosure(const LabelledTS* TheLTS, StateID State)
        {
            return TauClosure(TheLTS, StateSetT({ State }));
        }

        StateSetT TauClosure(const LabelledTS* TheLTS, const StateSetT& States)
        {
            StateSetT Retval(States);
            deque<StateID> BFSQueue(States.begin(), States.end());

            while (BFSQueue.size() > 0) {
                auto CurState = BFSQueue.front();
                BFSQueue.pop_front();
                for (auto Edge : TheLTS->GetTransitions(CurState)) {
                    if (!Terms::IsSilent(Edge->GetAction())) {
                        continue;
                    }
                    if (Retval.insert(Edge->GetTarget()).second) {
                        BFSQueue.push_back(Edge->GetTarget());
                    }
                }
            }
            return Retval;
        }

        StateSetT WeakAfter(const LabelledTS* TheLTS, const StateSetT& States,
                            const Action& TheAction)
        {
            StateSetT Middle;
            for (auto State : TauClosure(TheLTS, States)) {
                for (auto Edge : TheLTS->GetTransitions(State)) {
                    if (Edge->GetAction() == TheAction) {
                        Middle.insert(Edge->GetTarget());
                    }
                }
            }
            return TauClosure(TheLTS, Middle);
        }

        set<Action> VisibleInitials(const LabelledTS* TheLTS, const StateSetT& States)
        {
            set<Action> Retval;
            for (auto State : States) {
                for (auto Edge : TheLTS->GetTransitions(State)) {
                    if (Terms::IsVisible(Edge->GetAction())) {
                        Retval.insert(Edge->GetAction());
                    }
                }
            }
            return Retval;
        }

        set<Action> VisibleInitials(const LabelledTS* TheLTS, StateID State)
        {
            return VisibleInitials(TheLTS, StateSetT({ State }));
        }

        bool IsStable(const LabelledTS* TheLTS, StateID State)
        {
            for (auto Edge : TheLTS->GetTransitions(State)) {
                if (Terms::IsSilent(Edge->GetAction())) {
                    return false;
                }
            }
            return true;
        }

        StateSetT StableStates(const LabelledTS* TheLTS, const StateSetT& States)
        {
            StateSetT Retval;
            for (auto State : States) {
                if (IsStable(TheLTS, State)) {
                    Retval.insert(State);
                }
            }
            return Retval;
        }

        set<set<Action>> StableInitials(const LabelledTS* TheLTS, const StateSetT& States)
        {
            set<set<Action>> Retval;
            for (auto State : StableStates(TheLTS, States)) {
                Retval.insert(VisibleInitials(TheLTS, State));
            }
            return Retval;
        }

        bool CanDiverge(const LabelledTS* TheLTS, const StateSetT& States)
        {
            // Look for a cycle in the silent subgraph reachable from
            // States, with an iterative three colour dfs
            enum class ColourT { Grey, Black };
            unordered_map<StateID, ColourT> Colours;

            for (auto Root : States) {
                if (Colours.find(Root) != Colours.end()) {
                    continue;
                }

                stack<pair<StateID, vector<StateID>>> DFSStack;
                auto SilentSuccessors = [&] (StateID State) -> vector<StateID>
                    {
                        vector<StateID> Retval;
                        for (auto Edge : TheLTS->GetTransitions(State)) {
                            if (Terms::IsSilent(Edge->GetAction())) {
                                Retval.push_back(Edge->GetTarget());
                            }
                        }
                        return Retval;
                    };

                Colours[Root] = ColourT::Grey;
                DFSStack.push(make_pair(Root, SilentSuccessors(Root)));

                while (DFSStack.size() > 0) {
                    auto& CurEntry = DFSStack.top();
                    if (CurEntry.second.size() == 0) {
                        Colours[CurEntry.first] = ColourT::Black;
                        DFSStack.pop();
                        continue;
                    }

                    auto Next = CurEntry.second.back();
                    CurEntry.second.pop_back();

                    auto it = Colours.find(Next);
                    if (it == Colours.end()) {
                        Colours[Next] = ColourT::Grey;
                        DFSStack.push(make_pair(Next, SilentSuccessors(Next)));
                    } else if (it->second == ColourT::Grey) {
                        return true;
                    }
                }
            }
            return false;
        }

        bool HasSilentTransitions(const LabelledTS* TheLTS)
        {
            for (auto const& TheAction : TheLTS->GetActions()) {
                if (Terms::IsSilent(TheAction)) {
                    return true;
                }
            }
            return false;
        }

    } /* end namespace LTS */
} /* end namespace PAV */

//
// LTSAnalyses.cpp ends here
