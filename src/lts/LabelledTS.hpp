// LabelledTS.hpp ---
//
// Filename: LabelledTS.hpp
// Author: Abhishek Udupa
// Created: Tue Mar 15 14:13:59 2015 (-0500)
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

// A labelled transition system over process terms. States are
// numbered densely from zero in discovery order and are indexed by
// the canonical form of their term. Built once by an LTSBuilder,
// read only afterwards.

#if !defined PAV_LTS_LABELLEDTS_HPP_
#define PAV_LTS_LABELLEDTS_HPP_

#include <set>
#include <vector>
#include <sparse_hash_map>

#include "../common/PAVFwdDecls.hpp"
#include "../terms/Terms.hpp"

#include "TransitionRelation.hpp"

namespace PAV {
    namespace LTS {

        using Terms::TermRef;

        class LabelledTS
        {
        private:
            vector<TermRef> StateTerms;
            sparse_hash_map<string, StateID> NameIndex;
            set<Action> Actions;
            TransitionRelation Relation;
            StateID InitialState;
            bool HasInitialState;

        public:
            LabelledTS();
            ~LabelledTS();

            LabelledTS(const LabelledTS& Other) = delete;
            LabelledTS& operator = (const LabelledTS& Other) = delete;

            // Returns the ID of the state for Term, creating it if
            // needed. IsNew is set iff the state was created.
            StateID AddState(const TermRef& Term, bool& IsNew);
            // Both states must already be known
            void AddTransition(StateID Source, const Action& TheAction, StateID Target);
            void SetInitialState(StateID State);

            u32 GetNumStates() const;
            u64 GetNumTransitions() const;
            StateSetT GetStates() const;
            const set<Action>& GetActions() const;
            set<Action> GetVisibleActions() const;
            StateID GetInitialState() const;

            bool FindState(const string& Name, StateID& State) const;
            const TermRef& GetTerm(StateID State) const;
            const string& GetName(StateID State) const;

            const TransitionRelation& GetRelation() const;
            const LTSEdgeSetT& GetTransitions(StateID State) const;
            StateSetT GetTargets(StateID State, const Action& TheAction) const;

            // Shortest sequence of actions leading from the initial
            // state to Target. Returns false if Target is unreachable.
            bool FindPath(StateID Target, vector<Action>& Path) const;

            string ToString() const;
        };

        extern ostream& operator << (ostream& Out, const LabelledTS& TheLTS);

    } /* end namespace LTS */
} /* end namespace PAV */

#endif /* PAV_LTS_LABELLEDTS_HPP_ */

//
// LabelledTS.hpp ends here
