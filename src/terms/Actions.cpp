// Actions.cpp ---
//
// Filename: Actions.cpp
// Author: Abhishek Udupa
// Created: Sun Feb 16 11:42:06 2015 (-0500)
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

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "Actions.hpp"

namespace PAV {
    namespace Terms {

        const Action TauAction = "tau";
        const char ComplementMarker = '\'';

        bool IsSilent(const Action& TheAction)
        {
            return (TheAction == TauAction);
        }

        bool IsVisible(const Action& TheAction)
        {
            return (!IsSilent(TheAction));
        }

        void CheckActionName(const Action& TheAction)
        {
            if (TheAction.empty()) {
                throw PAVError((string)"Empty action names are not allowed.\n" +
                               "In call to " + __FUNCTION__ + " at " + __FILE__ +
                               ":" + to_string(__LINE__));
            }
            if (boost::algorithm::all(TheAction,
                                      boost::algorithm::is_from_range(ComplementMarker,
                                                                      ComplementMarker))) {
                throw PAVError((string)"Action \"" + TheAction + "\" consists only " +
                               "of complement markers.\nIn call to " + __FUNCTION__ +
                               " at " + __FILE__ + ":" + to_string(__LINE__));
            }
            if (boost::algorithm::starts_with(TheAction, "''")) {
                throw PAVError((string)"Action \"" + TheAction + "\" carries more " +
                               "than one complement marker.\nIn call to " + __FUNCTION__ +
                               " at " + __FILE__ + ":" + to_string(__LINE__));
            }
            auto Offset = (TheAction[0] == ComplementMarker ? 1 : 0);
            if (!boost::algorithm::all(TheAction.substr(Offset),
                                       boost::algorithm::is_alnum() ||
                                       boost::algorithm::is_any_of("_"))) {
                throw PAVError((string)"Action \"" + TheAction + "\" may only contain " +
                               "letters, digits and underscores after an optional " +
                               "complement marker.\nIn call to " + __FUNCTION__ +
                               " at " + __FILE__ + ":" + to_string(__LINE__));
            }
            if (Offset == 1 && IsSilent(TheAction.substr(1))) {
                throw PAVError((string)"The silent action has no complement.\n" +
                               "In call to " + __FUNCTION__ + " at " + __FILE__ +
                               ":" + to_string(__LINE__));
            }
        }

        Action Complement(const Action& TheAction)
        {
            CheckActionName(TheAction);
            if (IsSilent(TheAction)) {
                throw PAVError((string)"The silent action has no complement.\n" +
                               "In call to " + __FUNCTION__ + " at " + __FILE__ +
                               ":" + to_string(__LINE__));
            }
            if (TheAction[0] == ComplementMarker) {
                return TheAction.substr(1);
            }
            return ComplementMarker + TheAction;
        }

        bool AreComplementary(const Action& Action1, const Action& Action2)
        {
            if (IsSilent(Action1) || IsSilent(Action2)) {
                return false;
            }
            if (Action1.size() == Action2.size() + 1) {
                return (Action1[0] == ComplementMarker &&
                        Action1.compare(1, string::npos, Action2) == 0);
            }
            if (Action2.size() == Action1.size() + 1) {
                return (Action2[0] == ComplementMarker &&
                        Action2.compare(1, string::npos, Action1) == 0);
            }
            return false;
        }

    } /* end namespace Terms */
} /* end namespace PAV */

//
// Actions.cpp ends here
