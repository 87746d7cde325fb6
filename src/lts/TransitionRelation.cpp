// TransitionRelation.cpp ---
//
// Filename: TransitionRelation.cpp
// Author: Abhishek Udupa
// Created: Mon Mar  8 09:56:28 2015 (-0500)
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

#include <algorithm>

#include "TransitionRelation.hpp"

namespace PAV {
    namespace LTS {

        TransitionRelation::TransitionRelation()
            : EdgePool(new boost::pool<>(sizeof(LTSEdge))),
              NumTransitions(0)
        {
            // Nothing here
        }

        TransitionRelation::~TransitionRelation()
        {
            for (auto Edge : EdgeHashSet) {
                Edge->~LTSEdge();
            }
            OutEdges.clear();
            EdgeHashSet.clear();
            delete EdgePool;
        }

        bool TransitionRelation::Add(StateID Source, const Action& TheAction, StateID Target)
        {
            auto NewEdge = new (EdgePool->malloc()) LTSEdge(TheAction, Target);
            const LTSEdge* TheEdge = NewEdge;
            auto EdgeIt = EdgeHashSet.find(NewEdge);
            if (EdgeIt != EdgeHashSet.end()) {
                NewEdge->~LTSEdge();
                EdgePool->free(NewEdge);
                TheEdge = *EdgeIt;
            } else {
                EdgeHashSet.insert(NewEdge);
            }

            auto& SourceEdges = OutEdges[Source];
            if (SourceEdges.find(TheEdge) != SourceEdges.end()) {
                return false;
            }
            SourceEdges.insert(TheEdge);
            ++NumTransitions;
            return true;
        }

        const LTSEdgeSetT& TransitionRelation::GetTransitions(StateID Source) const
        {
            auto it = OutEdges.find(Source);
            if (it == OutEdges.end()) {
                return EmptyEdgeSet;
            } else {
                return it->second;
            }
        }

        StateSetT TransitionRelation::GetTargets(StateID Source, const Action& TheAction) const
        {
            StateSetT Retval;
            for (auto Edge : GetTransitions(Source)) {
                if (Edge->GetAction() == TheAction) {
                    Retval.insert(Edge->GetTarget());
                }
            }
            return Retval;
        }

        bool TransitionRelation::HasTransition(StateID Source, const Action& TheAction,
                                               StateID Target) const
        {
            LTSEdge Lookup(TheAction, Target);
            auto EdgeIt = EdgeHashSet.find(&Lookup);
            if (EdgeIt == EdgeHashSet.end()) {
                return false;
            }
            auto const& SourceEdges = GetTransitions(Source);
            return (SourceEdges.find(*EdgeIt) != SourceEdges.end());
        }

        u64 TransitionRelation::GetNumTransitions() const
        {
            return NumTransitions;
        }

        u64 TransitionRelation::GetNumEdges() const
        {
            return EdgeHashSet.size();
        }

        vector<const LTSEdge*> SortEdges(const LTSEdgeSetT& Edges)
        {
            vector<const LTSEdge*> Retval(Edges.begin(), Edges.end());
            sort(Retval.begin(), Retval.end(),
                 [] (const LTSEdge* Edge1, const LTSEdge* Edge2) -> bool
                 {
                     if (Edge1->GetAction() != Edge2->GetAction()) {
                         return (Edge1->GetAction() < Edge2->GetAction());
                     }
                     return (Edge1->GetTarget() < Edge2->GetTarget());
                 });
            return Retval;
        }

    } /* end namespace LTS */
} /* end namespace PAV */

//
// TransitionRelation.cpp ends here
