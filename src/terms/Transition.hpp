// Transition.hpp ---
//
// Filename: Transition.hpp
// Author: Abhishek Udupa
// Created: Sun Feb 11 18:41:43 2015 (-0500)
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

// One step transitions between terms, as derived by the default
// derivation or by the rules of an SOS engine.

#if !defined PAV_TERMS_TRANSITION_HPP_
#define PAV_TERMS_TRANSITION_HPP_

#include <boost/functional/hash.hpp>

#include "Terms.hpp"

namespace PAV {
    namespace Terms {

        class Transition
        {
        private:
            TermRef Source;
            Action TheAction;
            TermRef Target;

        public:
            inline Transition(const TermRef& Source, const Action& TheAction,
                              const TermRef& Target)
                : Source(Source), TheAction(TheAction), Target(Target)
            {
                // Nothing here
            }

            inline Transition(const Transition& Other)
                : Source(Other.Source), TheAction(Other.TheAction),
                  Target(Other.Target)
            {
                // Nothing here
            }

            inline ~Transition()
            {
                // Nothing here
            }

            inline Transition& operator = (const Transition& Other)
            {
                if (&Other == this) {
                    return *this;
                }
                Source = Other.Source;
                TheAction = Other.TheAction;
                Target = Other.Target;
                return *this;
            }

            inline bool operator == (const Transition& Other) const
            {
                return (TheAction == Other.TheAction &&
                        Source->Equals(Other.Source) &&
                        Target->Equals(Other.Target));
            }

            inline bool operator != (const Transition& Other) const
            {
                return !(*this == Other);
            }

            inline const TermRef& GetSource() const
            {
                return Source;
            }

            inline const Action& GetAction() const
            {
                return TheAction;
            }

            inline const TermRef& GetTarget() const
            {
                return Target;
            }

            inline u64 Hash() const
            {
                u64 Retval = 0;
                boost::hash_combine(Retval, Source->Hash());
                boost::hash_combine(Retval, TheAction);
                boost::hash_combine(Retval, Target->Hash());
                return Retval;
            }

            string ToString() const;
        };

        class TransitionHasher
        {
        public:
            inline u64 operator () (const Transition& Trans) const
            {
                return Trans.Hash();
            }
        };

        extern ostream& operator << (ostream& Out, const Transition& Trans);

        // Transitions sorted on (action, target form), for printing
        // and anything else that wants a deterministic order
        extern vector<Transition> SortTransitions(const TransitionSetT& Transitions);

    } /* end namespace Terms */
} /* end namespace PAV */

#endif /* PAV_TERMS_TRANSITION_HPP_ */

//
// Transition.hpp ends here
