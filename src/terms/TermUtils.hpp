// TermUtils.hpp ---
//
// Filename: TermUtils.hpp
// Author: Abhishek Udupa
// Created: Fri Feb 24 22:07:41 2015 (-0500)
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

#if !defined PAV_TERMS_TERMUTILS_HPP_
#define PAV_TERMS_TERMUTILS_HPP_

#include <set>
#include <vector>

#include "Terms.hpp"

namespace PAV {
    namespace Terms {

        namespace Detail {

            // Collects the variables with an occurrence not
            // bound by an enclosing rec
            class FreeVarGatherer : public TermVisitorBase
            {
            private:
                vector<string> BoundVars;
                set<string> FreeVars;

            public:
                FreeVarGatherer();
                virtual ~FreeVarGatherer();

                virtual void VisitStopTerm(const StopTerm* Term) override;
                virtual void VisitVarTerm(const VarTerm* Term) override;
                virtual void VisitPrefixTerm(const PrefixTerm* Term) override;
                virtual void VisitChoiceTerm(const ChoiceTerm* Term) override;
                virtual void VisitParallelTerm(const ParallelTerm* Term) override;
                virtual void VisitRecTerm(const RecTerm* Term) override;

                static set<string> Do(const TermRef& Term);
            };

            // Checks that every occurrence of a rec bound variable
            // appears underneath at least one prefix within its binder
            class GuardChecker : public TermVisitorBase
            {
            private:
                set<string> UnguardedVars;
                bool Guarded;
                string Offender;

            public:
                GuardChecker();
                virtual ~GuardChecker();

                virtual void VisitStopTerm(const StopTerm* Term) override;
                virtual void VisitVarTerm(const VarTerm* Term) override;
                virtual void VisitPrefixTerm(const PrefixTerm* Term) override;
                virtual void VisitChoiceTerm(const ChoiceTerm* Term) override;
                virtual void VisitParallelTerm(const ParallelTerm* Term) override;
                virtual void VisitRecTerm(const RecTerm* Term) override;

                // Returns true if guarded, else sets OffendingVar
                static bool Do(const TermRef& Term, string& OffendingVar);
            };

        } /* end namespace Detail */

        extern set<string> GetFreeVariables(const TermRef& Term);
        extern bool IsGuarded(const TermRef& Term);
        extern bool IsClosed(const TermRef& Term);

        // Throws PAVError unless the term is closed and guarded
        extern void CheckExplorable(const TermRef& Term);

    } /* end namespace Terms */
} /* end namespace PAV */

#endif /* PAV_TERMS_TERMUTILS_HPP_ */

//
// TermUtils.hpp ends here
