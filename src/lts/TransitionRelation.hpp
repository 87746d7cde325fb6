// TransitionRelation.hpp ---
//
// Filename: TransitionRelation.hpp
// Author: Abhishek Udupa
// Created: Sun Mar  1 18:39:57 2015 (-0500)
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

// An indexed transition relation over numbered states.
// Edges (action, target) are pooled and shared between all the
// sources that have them, and every source keeps the set of
// its outgoing edges.

#if !defined PAV_LTS_TRANSITIONRELATION_HPP_
#define PAV_LTS_TRANSITIONRELATION_HPP_

#include <new>
#include <sparse_hash_set>
#include <sparse_hash_map>

#include <boost/pool/pool.hpp>
#include <boost/functional/hash.hpp>

#include "../common/PAVFwdDecls.hpp"

namespace PAV {
    namespace LTS {

        using google::sparse_hash_set;
        using google::sparse_hash_map;
        using Terms::Action;

        class LTSEdge
        {
        private:
            Action TheAction;
            StateID Target;

        public:
            inline LTSEdge(const Action& TheAction, StateID Target)
                : TheAction(TheAction), Target(Target)
            {
                // Nothing here
            }

            inline LTSEdge(const LTSEdge& Other)
                : TheAction(Other.TheAction), Target(Other.Target)
            {
                // Nothing here
            }

            inline ~LTSEdge()
            {
                // Nothing here
            }

            inline LTSEdge& operator = (const LTSEdge& Other)
            {
                if (&Other == this) {
                    return *this;
                }
                TheAction = Other.TheAction;
                Target = Other.Target;
                return *this;
            }

            inline bool operator == (const LTSEdge& Other) const
            {
                return (Target == Other.Target && TheAction == Other.TheAction);
            }

            inline const Action& GetAction() const
            {
                return TheAction;
            }

            inline StateID GetTarget() const
            {
                return Target;
            }

            inline u64 Hash() const
            {
                u64 Retval = 0;
                boost::hash_combine(Retval, TheAction);
                boost::hash_combine(Retval, Target);
                return Retval;
            }
        };

        namespace Detail {

            class LTSEdgePtrHasher
            {
            public:
                inline u64 operator () (const LTSEdge* Edge) const
                {
                    return Edge->Hash();
                }
            };

            class LTSEdgePtrEquals
            {
            public:
                inline bool operator () (const LTSEdge* Edge1, const LTSEdge* Edge2) const
                {
                    return (*Edge1 == *Edge2);
                }
            };

        } /* end namespace Detail */

        typedef sparse_hash_set<const LTSEdge*,
                                Detail::LTSEdgePtrHasher,
                                Detail::LTSEdgePtrEquals> LTSEdgeHashSetT;

        // Edges are unique, so identity suffices here
        typedef sparse_hash_set<const LTSEdge*> LTSEdgeSetT;

        typedef sparse_hash_map<StateID, LTSEdgeSetT> LTSEdgeMapT;

        class TransitionRelation
        {
        private:
            LTSEdgeMapT OutEdges;
            LTSEdgeHashSetT EdgeHashSet;
            LTSEdgeSetT EmptyEdgeSet;
            boost::pool<>* EdgePool;
            u64 NumTransitions;

        public:
            TransitionRelation();
            ~TransitionRelation();

            TransitionRelation(const TransitionRelation& Other) = delete;
            TransitionRelation& operator = (const TransitionRelation& Other) = delete;

            // Returns false if the transition was already present
            bool Add(StateID Source, const Action& TheAction, StateID Target);

            // Empty for states without outgoing transitions,
            // including states never seen before
            const LTSEdgeSetT& GetTransitions(StateID Source) const;
            StateSetT GetTargets(StateID Source, const Action& TheAction) const;
            bool HasTransition(StateID Source, const Action& TheAction,
                               StateID Target) const;

            u64 GetNumTransitions() const;
            // Number of distinct (action, target) edges in the pool
            u64 GetNumEdges() const;
        };

        // Edges of a state sorted on (action, target)
        extern vector<const LTSEdge*> SortEdges(const LTSEdgeSetT& Edges);

    } /* end namespace LTS */
} /* end namespace PAV */

#endif /* PAV_LTS_TRANSITIONRELATION_HPP_ */

//
// TransitionRelation.hpp ends here
