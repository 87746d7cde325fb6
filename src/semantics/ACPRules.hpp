// ACPRules.hpp ---
//
// Filename: ACPRules.hpp
// Author: Abhishek Udupa
// Created: Wed Mar 27 12:31:53 2015 (-0500)
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

// Parallel composition in ACP, split into its derived relations:
// the left merge (a designated operand moves first, the other
// waits) and the communication merge (both operands move at once,
// producing the action given by the communication function).
// The merge of P and Q is the union of the left merge of P and Q,
// the left merge of Q and P, and the communication merge.

#if !defined PAV_SEMANTICS_ACPRULES_HPP_
#define PAV_SEMANTICS_ACPRULES_HPP_

#include "SOSRules.hpp"
#include "CommunicationFunction.hpp"

namespace PAV {
    namespace Sem {

        enum class MergeOperandT {
            Left, Right
        };

        class ACPLeftMergeRule : public ParallelRuleBase
        {
        private:
            MergeOperandT Operand;

        public:
            ACPLeftMergeRule(MergeOperandT Operand);
            virtual ~ACPLeftMergeRule();

            MergeOperandT GetOperand() const;

            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;

            // Moves of Mover lifted into the composition, where
            // MoverIsLeft says which side of the composition it is on
            static void LiftMoves(const TermRef& Composition, const TermRef& Mover,
                                  const TermRef& Waiter, bool MoverIsLeft,
                                  const SOSEngine* Engine, DerivationCache& Cache,
                                  TransitionSetT& Result);
        };

        class ACPCommunicationMergeRule : public ParallelRuleBase
        {
        private:
            CommunicationFunction Gamma;

        public:
            ACPCommunicationMergeRule(const CommunicationFunction& Gamma);
            virtual ~ACPCommunicationMergeRule();

            const CommunicationFunction& GetCommunicationFunction() const;

            virtual void Derive(const TermRef& Term, const SOSEngine* Engine,
                                DerivationCache& Cache, TransitionSetT& Result) const override;
        };

    } /* end namespace Sem */
} /* end namespace PAV */

#endif /* PAV_SEMANTICS_ACPRULES_HPP_ */

//
// ACPRules.hpp ends here
