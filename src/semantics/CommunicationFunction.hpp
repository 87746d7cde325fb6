// CommunicationFunction.hpp ---
//
// Filename: CommunicationFunction.hpp
// Author: Abhishek Udupa
// Created: Tue Mar 25 14:15:45 2015 (-0500)
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

// The ACP communication function gamma: a partial map from pairs
// of actions to the action produced when both happen together.

#if !defined PAV_SEMANTICS_COMMUNICATIONFUNCTION_HPP_
#define PAV_SEMANTICS_COMMUNICATIONFUNCTION_HPP_

#include <map>
#include <set>

#include "../common/PAVFwdDecls.hpp"

namespace PAV {
    namespace Sem {

        using Terms::Action;

        class CommunicationFunction
        {
        private:
            map<pair<Action, Action>, Action> Table;

        public:
            CommunicationFunction();
            CommunicationFunction(const CommunicationFunction& Other);
            ~CommunicationFunction();

            CommunicationFunction& operator = (const CommunicationFunction& Other);

            // Throws ConfigurationError if (Action1, Action2) is
            // already mapped to a different action
            void Define(const Action& Action1, const Action& Action2,
                        const Action& Result);
            // Defines both (Action1, Action2) and (Action2, Action1)
            void DefineSymmetric(const Action& Action1, const Action& Action2,
                                 const Action& Result);

            bool Communicate(const Action& Action1, const Action& Action2,
                             Action& Result) const;

            bool IsEmpty() const;
            u32 GetSize() const;
            // Every action mentioned by the table, as argument or result
            set<Action> GetDomain() const;

            // Checks commutativity, associativity and the absence of the
            // silent action. Throws ConfigurationError on a violation.
            void Validate() const;

            string ToString() const;
        };

    } /* end namespace Sem */
} /* end namespace PAV */

#endif /* PAV_SEMANTICS_COMMUNICATIONFUNCTION_HPP_ */

//
// CommunicationFunction.hpp ends here
