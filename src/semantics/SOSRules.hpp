// SOSRules.hpp ---
//
// Filename: SOSRules.hpp
// Author: Abhishek Udupa
// Created: Thu Mar 12 10:49:47 2015 (-0500)
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

// Rules of a structural operational semantics, and the rules
// shared by every semantic model (prefix, choice, recursion).

#if !defined PAV_SEMANTICS_SOSRULES_HPP_
#define PAV_SEMANTICS_SOSRULES_HPP_

#include "../common/PAVFwdDecls.hpp"
#include "../terms/Terms.hpp"
#include "../terms/Transition.hpp"

#include "DerivationCache.hpp"

namespace PAV {
    namespace Sem {

        using Terms::TermRef;
        using Terms::TermKind;
        using Terms::TransitionSetT;

        class SOSRuleBase
        {
        private:
            string Name;

        public:
            SOSRuleBase(const string& Name);
            virtual ~SOSRuleBase();

            const string& GetName() const;

            virtual bool CanApply(const TermRef& Term) const = 0;
            // Adds the transitions this rule contributes for Term to
            // Result. Operand transitions are obtained from Engine,
            // through Cache, so that each operand is derived once.
            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const = 0;
        };

        class PrefixRule : public SOSRuleBase
        {
        public:
            PrefixRule();
            virtual ~PrefixRule();

            virtual bool CanApply(const TermRef& Term) const override;
            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;
        };

        // Either branch may move, and its move discards the other
        class ChoiceRule : public SOSRuleBase
        {
        protected:
            ChoiceRule(const string& Name);

        public:
            ChoiceRule();
            virtual ~ChoiceRule();

            virtual bool CanApply(const TermRef& Term) const override;
            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;
        };

        class RecursionRule : public SOSRuleBase
        {
        public:
            RecursionRule();
            virtual ~RecursionRule();

            virtual bool CanApply(const TermRef& Term) const override;
            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;
        };

        // Parallel composition rules share this applicability test
        class ParallelRuleBase : public SOSRuleBase
        {
        public:
            ParallelRuleBase(const string& Name);
            virtual ~ParallelRuleBase();

            virtual bool CanApply(const TermRef& Term) const override;
        };

    } /* end namespace Sem */
} /* end namespace PAV */

#endif /* PAV_SEMANTICS_SOSRULES_HPP_ */

//
// SOSRules.hpp ends here
