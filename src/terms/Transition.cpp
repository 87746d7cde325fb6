// Transition.cpp ---
//
// Filename: Transition.cpp
// Author: Abhishek Udupa
// Created: Mon Feb 18 09:58:14 2015 (-0500)
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

#include "Transition.hpp"

namespace PAV {
    namespace Terms {

        string Transition::ToString() const
        {
            return (Source->ToString() + " --" + TheAction + "--> " + Target->ToString());
        }

        ostream& operator << (ostream& Out, const Transition& Trans)
        {
            Out << Trans.ToString();
            return Out;
        }

        vector<Transition> SortTransitions(const TransitionSetT& Transitions)
        {
            vector<Transition> Retval(Transitions.begin(), Transitions.end());
            sort(Retval.begin(), Retval.end(),
                 [] (const Transition& T1, const Transition& T2) -> bool
                 {
                     if (T1.GetAction() != T2.GetAction()) {
                         return (T1.GetAction() < T2.GetAction());
                     }
                     if (T1.GetSource()->ToString() != T2.GetSource()->ToString()) {
                         return (T1.GetSource()->ToString() < T2.GetSource()->ToString());
                     }
                     return (T1.GetTarget()->ToString() < T2.GetTarget()->ToString());
                 });
            return Retval;
        }

    } /* end namespace Terms */
} /* end namespace PAV */

//
// Transition.cpp ends here
