// CommunicationFunction.cpp ---
//
// Filename: CommunicationFunction.cpp
// Author: Abhishek Udupa
// Created: Wed Mar  5 19:32:16 2015 (-0500)
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

#include "../terms/Actions.hpp"

#include "CommunicationFunction.hpp"

namespace PAV {
    namespace Sem {

        CommunicationFunction::CommunicationFunction()
        {
            // Nothing here
        }

        CommunicationFunction::CommunicationFunction(const CommunicationFunction& Other)
            : Table(Other.Table)
        {
            // Nothing here
        }

        CommunicationFunction::~CommunicationFunction()
        {
            // Nothing here
        }

        CommunicationFunction&
        CommunicationFunction::operator = (const CommunicationFunction& Other)
        {
            if (&Other == this) {
                return *this;
            }
            Table = Other.Table;
            return *this;
        }

        void CommunicationFunction::Define(const Action& Action1, const Action& Action2,
                                           const Action& Result)
        {
            Terms::CheckActionName(Action1);
            Terms::CheckActionName(Action2);
            Terms::CheckActionName(Result);

            auto Key = make_pair(Action1, Action2);
            auto it = Table.find(Key);
            if (it != Table.end() && it->second != Result) {
                throw ConfigurationError((string)"Communication of (" + Action1 + ", " +
                                         Action2 + ") is already defined as \"" +
                                         it->second + "\", cannot redefine it as \"" +
                                         Result + "\".\nIn call to " + __FUNCTION__ +
                                         " at " + __FILE__ + ":" + to_string(__LINE__));
            }
            Table[Key] = Result;
        }

        void CommunicationFunction::DefineSymmetric(const Action& Action1,
                                                    const Action& Action2,
                                                    const Action& Result)
        {
            Define(Action1, Action2, Result);
            Define(Action2, Action1, Result);
        }

        bool CommunicationFunction::Communicate(const Action& Action1, const Action& Action2,
                                                Action& Result) const
        {
            auto it = Table.find(make_pair(Action1, Action2));
            if (it == Table.end()) {
                return false;
            }
            Result = it->second;
            return true;
        }

        bool CommunicationFunction::IsEmpty() const
        {
            return Table.empty();
        }

        u32 CommunicationFunction::GetSize() const
        {
            return Table.size();
        }

        set<Action> CommunicationFunction::GetDomain() const
        {
            set<Action> Retval;
            for (auto const& Entry : Table) {
                Retval.insert(Entry.first.first);
                Retval.insert(Entry.first.second);
                Retval.insert(Entry.second);
            }
            return Retval;
        }

        void CommunicationFunction::Validate() const
        {
            for (auto const& Entry : Table) {
                auto const& A = Entry.first.first;
                auto const& B = Entry.first.second;

                if (Terms::IsSilent(A) || Terms::IsSilent(B) ||
                    Terms::IsSilent(Entry.second)) {
                    throw ConfigurationError((string)"The silent action cannot take part " +
                                             "in communication: (" + A + ", " + B +
                                             ") -> " + Entry.second + "\nIn call to " +
                                             __FUNCTION__ + " at " + __FILE__ + ":" +
                                             to_string(__LINE__));
                }

                Action Reverse;
                if (!Communicate(B, A, Reverse) || Reverse != Entry.second) {
                    throw ConfigurationError((string)"Communication function is not " +
                                             "commutative: (" + A + ", " + B + ") -> " +
                                             Entry.second + " has no matching entry for (" +
                                             B + ", " + A + ")\nIn call to " +
                                             __FUNCTION__ + " at " + __FILE__ + ":" +
                                             to_string(__LINE__));
                }
            }

            // gamma(gamma(a, b), c) is defined iff gamma(a, gamma(b, c))
            // is, and then the two agree
            auto Domain = GetDomain();
            for (auto const& A : Domain) {
                for (auto const& B : Domain) {
                    for (auto const& C : Domain) {
                        Action AB, BC, Left, Right;
                        bool LeftDefined = (Communicate(A, B, AB) &&
                                            Communicate(AB, C, Left));
                        bool RightDefined = (Communicate(B, C, BC) &&
                                             Communicate(A, BC, Right));
                        if (LeftDefined != RightDefined ||
                            (LeftDefined && Left != Right)) {
                            throw ConfigurationError((string)"Communication function " +
                                                     "is not associative on (" + A + ", " +
                                                     B + ", " + C + ")\nIn call to " +
                                                     __FUNCTION__ + " at " + __FILE__ +
                                                     ":" + to_string(__LINE__));
                        }
                    }
                }
            }
        }

        string CommunicationFunction::ToString() const
        {
            ostringstream sstr;
            sstr << "{";
            bool First = true;
            for (auto const& Entry : Table) {
                if (!First) {
                    sstr << ", ";
                }
                First = false;
                sstr << "(" << Entry.first.first << ", " << Entry.first.second
                     << ") -> " << Entry.second;
            }
            sstr << "}";
            return sstr.str();
        }

    } /* end namespace Sem */
} /* end namespace PAV */

//
// CommunicationFunction.cpp ends here
