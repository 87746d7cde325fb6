// TermUtils.cpp ---
//
// Filename: TermUtils.cpp
// Author: Abhishek Udupa
// Created: Sat Feb  4 13:24:12 2015 (-0500)
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
#include <boost/algorithm/string/join.hpp>

#include "TermUtils.hpp"

namespace PAV {
    namespace Terms {
        namespace Detail {

            FreeVarGatherer::FreeVarGatherer()
                : TermVisitorBase()
            {
                // Nothing here
            }

            FreeVarGatherer::~FreeVarGatherer()
            {
                // Nothing here
            }

            void FreeVarGatherer::VisitStopTerm(const StopTerm* Term)
            {
                // Nothing here
            }

            void FreeVarGatherer::VisitVarTerm(const VarTerm* Term)
            {
                auto const& VarName = Term->GetVarName();
                if (find(BoundVars.begin(), BoundVars.end(), VarName) == BoundVars.end()) {
                    FreeVars.insert(VarName);
                }
            }

            void FreeVarGatherer::VisitPrefixTerm(const PrefixTerm* Term)
            {
                Term->GetContinuation()->Accept(this);
            }

            void FreeVarGatherer::VisitChoiceTerm(const ChoiceTerm* Term)
            {
                Term->GetLeft()->Accept(this);
                Term->GetRight()->Accept(this);
            }

            void FreeVarGatherer::VisitParallelTerm(const ParallelTerm* Term)
            {
                Term->GetLeft()->Accept(this);
                Term->GetRight()->Accept(this);
            }

            void FreeVarGatherer::VisitRecTerm(const RecTerm* Term)
            {
                BoundVars.push_back(Term->GetVarName());
                Term->GetDefinition()->Accept(this);
                BoundVars.pop_back();
            }

            set<string> FreeVarGatherer::Do(const TermRef& Term)
            {
                FreeVarGatherer TheGatherer;
                Term->Accept(&TheGatherer);
                return TheGatherer.FreeVars;
            }

            GuardChecker::GuardChecker()
                : TermVisitorBase(), Guarded(true)
            {
                // Nothing here
            }

            GuardChecker::~GuardChecker()
            {
                // Nothing here
            }

            void GuardChecker::VisitStopTerm(const StopTerm* Term)
            {
                // Nothing here
            }

            void GuardChecker::VisitVarTerm(const VarTerm* Term)
            {
                if (Guarded && UnguardedVars.find(Term->GetVarName()) != UnguardedVars.end()) {
                    Guarded = false;
                    Offender = Term->GetVarName();
                }
            }

            void GuardChecker::VisitPrefixTerm(const PrefixTerm* Term)
            {
                set<string> SavedVars;
                swap(SavedVars, UnguardedVars);
                Term->GetContinuation()->Accept(this);
                swap(SavedVars, UnguardedVars);
            }

            void GuardChecker::VisitChoiceTerm(const ChoiceTerm* Term)
            {
                Term->GetLeft()->Accept(this);
                Term->GetRight()->Accept(this);
            }

            void GuardChecker::VisitParallelTerm(const ParallelTerm* Term)
            {
                Term->GetLeft()->Accept(this);
                Term->GetRight()->Accept(this);
            }

            void GuardChecker::VisitRecTerm(const RecTerm* Term)
            {
                auto const& VarName = Term->GetVarName();
                bool WasUnguarded = (UnguardedVars.find(VarName) != UnguardedVars.end());
                UnguardedVars.insert(VarName);
                Term->GetDefinition()->Accept(this);
                if (!WasUnguarded) {
                    UnguardedVars.erase(VarName);
                }
            }

            bool GuardChecker::Do(const TermRef& Term, string& OffendingVar)
            {
                GuardChecker TheChecker;
                Term->Accept(&TheChecker);
                OffendingVar = TheChecker.Offender;
                return TheChecker.Guarded;
            }

        } /* end namespace Detail */

        set<string> GetFreeVariables(const TermRef& Term)
        {
            return Detail::FreeVarGatherer::Do(Term);
        }

        bool IsGuarded(const TermRef& Term)
        {
            string Unused;
            return Detail::GuardChecker::Do(Term, Unused);
        }

        bool IsClosed(const TermRef& Term)
        {
            return (GetFreeVariables(Term).size() == 0);
        }

        void CheckExplorable(const TermRef& Term)
        {
            auto FreeVars = GetFreeVariables(Term);
            if (FreeVars.size() > 0) {
                throw PAVError((string)"Term \"" + Term->ToString() + "\" has free " +
                               "process variables: " +
                               boost::algorithm::join(FreeVars, ", ") +
                               "\nIn call to " + __FUNCTION__ + " at " + __FILE__ +
                               ":" + to_string(__LINE__));
            }

            string Offender;
            if (!Detail::GuardChecker::Do(Term, Offender)) {
                throw PAVError((string)"Term \"" + Term->ToString() + "\" contains an " +
                               "unguarded occurrence of the recursion variable \"" +
                               Offender + "\"\nIn call to " + __FUNCTION__ + " at " +
                               __FILE__ + ":" + to_string(__LINE__));
            }
        }

    } /* end namespace Terms */
} /* end namespace PAV */

//
// TermUtils.cpp ends here
