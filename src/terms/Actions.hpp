// Actions.hpp ---
//
// Filename: Actions.hpp
// Author: Abhishek Udupa
// Created: Sat Feb  9 20:25:35 2015 (-0500)
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

// Actions labelling transitions: the distinguished silent action
// and the complement convention used by CCS style synchronization.
// The co-action of "a" is written "'a", and vice versa.

#if !defined PAV_TERMS_ACTIONS_HPP_
#define PAV_TERMS_ACTIONS_HPP_

#include "../common/PAVFwdDecls.hpp"

namespace PAV {
    namespace Terms {

        extern const Action TauAction;
        extern const char ComplementMarker;

        extern bool IsSilent(const Action& TheAction);
        extern bool IsVisible(const Action& TheAction);

        // Throws PAVError for the silent action and the empty action
        extern Action Complement(const Action& TheAction);
        extern bool AreComplementary(const Action& Action1, const Action& Action2);

        // Checks that an action name is usable as a prefix label
        extern void CheckActionName(const Action& TheAction);

    } /* end namespace Terms */
} /* end namespace PAV */

#endif /* PAV_TERMS_ACTIONS_HPP_ */

//
// Actions.hpp ends here
