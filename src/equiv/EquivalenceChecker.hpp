// EquivalenceChecker.hpp ---
//
// Filename: EquivalenceChecker.hpp
// Author: Abhishek Udupa
// Created: Sat Apr  6 20:19:17 2015 (-0400)
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

// The checking interface of the library: builds the LTSs of two
// terms under a semantic model and dispatches to the checker for
// the requested equivalence.

#if !defined PAV_EQUIV_EQUIVALENCECHECKER_HPP_
#define PAV_EQUIV_EQUIVALENCECHECKER_HPP_

#include "../common/PAVFwdDecls.hpp"
#include "../terms/Terms.hpp"

#include "EquivTypes.hpp"

namespace PAV {
    namespace Equiv {

        using LTS::LabelledTS;
        using Terms::TermRef;

        class EquivalenceChecker
        {
        private:
            EquivalenceOptionsT Options;
            Sem::SOSEngine* Engine;

            EquivalenceResult Dispatch(const LabelledTS* LTS1, const LabelledTS* LTS2,
                                       EquivalenceKindT Kind) const;

        public:
            // Throws ConfigurationError if the options are inconsistent
            EquivalenceChecker(const EquivalenceOptionsT& Options = EquivalenceOptionsT());
            ~EquivalenceChecker();

            const EquivalenceOptionsT& GetOptions() const;
            const Sem::SOSEngine* GetEngine() const;

            // The caller owns the returned LTS
            LabelledTS* BuildLTS(const TermRef& Term) const;

            EquivalenceResult Check(const TermRef& Term1, const TermRef& Term2,
                                    EquivalenceKindT Kind) const;
            // Failures refinement of Spec by Impl
            EquivalenceResult CheckRefinement(const TermRef& Spec, const TermRef& Impl) const;
        };

        extern EquivalenceResult CheckEquivalence(const TermRef& Term1, const TermRef& Term2,
                                                  EquivalenceKindT Kind,
                                                  const EquivalenceOptionsT& Options);
        extern EquivalenceResult CheckRefinement(const TermRef& Spec, const TermRef& Impl,
                                                 const EquivalenceOptionsT& Options);
        extern LabelledTS* BuildLTS(const TermRef& Term, const EquivalenceOptionsT& Options);

        // As above, with the check options the library was
        // initialized with (see PAVLibOptionsT)
        extern EquivalenceResult CheckEquivalence(const TermRef& Term1, const TermRef& Term2,
                                                  EquivalenceKindT Kind);
        extern EquivalenceResult CheckRefinement(const TermRef& Spec, const TermRef& Impl);

    } /* end namespace Equiv */
} /* end namespace PAV */

#endif /* PAV_EQUIV_EQUIVALENCECHECKER_HPP_ */

//
// EquivalenceChecker.hpp ends here
