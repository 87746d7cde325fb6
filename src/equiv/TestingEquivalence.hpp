// TestingEquivalence.hpp ---
//
// Filename: TestingEquivalence.hpp
// Author: Abhishek Udupa
// Created: Tue Apr  5 14:11:13 2015 (-0400)
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

// May and must testing equivalence. A test is a visible trace
// together with an acceptance set. A process may pass a test if it
// can perform the trace. It must pass the test if it cannot diverge
// along the trace and every stable state it reaches after the trace
// offers some action of the acceptance set.

#if !defined PAV_EQUIV_TESTINGEQUIVALENCE_HPP_
#define PAV_EQUIV_TESTINGEQUIVALENCE_HPP_

#include <set>

#include "../common/PAVFwdDecls.hpp"

#include "EquivTypes.hpp"

namespace PAV {
    namespace Equiv {

        using LTS::LabelledTS;

        class TestingChecker
        {
        public:
            class TestT
            {
            public:
                TraceT Trace;
                set<Action> Acceptance;

                TestT();
                TestT(const TraceT& Trace, const set<Action>& Acceptance);
                TestT(const TestT& Other);
                ~TestT();

                TestT& operator = (const TestT& Other);
                bool operator == (const TestT& Other) const;
                bool operator < (const TestT& Other) const;

                string ToString() const;
            };

        private:
            u32 MaxDepth;

        public:
            TestingChecker(u32 MaxDepth = EquivalenceOptionsT::DefaultMaxDepth);
            ~TestingChecker();

            u32 GetMaxDepth() const;

            // Tests over the traces of either LTS up to the depth bound,
            // with the acceptance sets that separate their stable states
            set<TestT> GenerateTests(const LabelledTS* LTS1, const LabelledTS* LTS2) const;

            static bool MayPasses(const LabelledTS* TheLTS, const TestT& Test);
            static bool MustPasses(const LabelledTS* TheLTS, const TestT& Test);

            EquivalenceResult CheckMay(const LabelledTS* LTS1, const LabelledTS* LTS2) const;
            EquivalenceResult CheckMust(const LabelledTS* LTS1, const LabelledTS* LTS2) const;
            // May and must together
            EquivalenceResult Check(const LabelledTS* LTS1, const LabelledTS* LTS2) const;
        };

        extern ostream& operator << (ostream& Out, const TestingChecker::TestT& Test);

    } /* end namespace Equiv */
} /* end namespace PAV */

#endif /* PAV_EQUIV_TESTINGEQUIVALENCE_HPP_ */

//
// TestingEquivalence.hpp ends here
