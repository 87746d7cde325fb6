// LTSAnalyses.hpp ---
//
// Filename: LTSAnalyses.hpp
// Author: Abhishek Udupa
// Created: Thu Mar  2 10:47:01 2015 (-0500)
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

// Analyses over the silent transitions of an LTS, used by the
// weak equivalences.

#if !defined PAV_LTS_LTSANALYSES_HPP_
#define PAV_LTS_LTSANALYSES_HPP_

#include <set>

#include "../common/PAVFwdDecls.hpp"

namespace PAV {
    namespace LTS {

        using Terms::Action;

        // States reachable through zero or more silent steps
        extern StateSetT TauClosure(const LabelledTS* TheLTS, StateID State);
        extern StateSetT TauClosure(const LabelledTS* TheLTS, const StateSetT& States);

        // States reachable from States through tau* a tau*
        extern StateSetT WeakAfter(const LabelledTS* TheLTS, const StateSetT& States,
                                   const Action& TheAction);

        // Visible actions enabled in any of the states
        extern set<Action> VisibleInitials(const LabelledTS* TheLTS, const StateSetT& States);
        extern set<Action> VisibleInitials(const LabelledTS* TheLTS, StateID State);

        // A state is stable if it has no silent transition
        extern bool IsStable(const LabelledTS* TheLTS, StateID State);
        extern StateSetT StableStates(const LabelledTS* TheLTS, const StateSetT& States);
        // The distinct sets of visible initials of the stable states
        extern set<set<Action>> StableInitials(const LabelledTS* TheLTS,
                                               const StateSetT& States);

        // True if an infinite sequence of silent steps can start
        // from one of the states
        extern bool CanDiverge(const LabelledTS* TheLTS, const StateSetT& States);

        // True if some transition reachable from the initial
        // state is silent
        extern bool HasSilentTransitions(const LabelledTS* TheLTS);

    } /* end namespace LTS */
} /* end namespace PAV */

#endif /* PAV_LTS_LTSANALYSES_HPP_ */

//
// LTSAnalyses.hpp ends here
