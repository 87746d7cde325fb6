// EquivTypes.hpp ---
//
// Filename: EquivTypes.hpp
// Author: Abhishek Udupa
// Created: Mon Apr  3 16:55:05 2015 (-0400)
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

// Verdicts, witnesses and options shared by the equivalence checkers.

#if !defined PAV_EQUIV_EQUIVTYPES_HPP_
#define PAV_EQUIV_EQUIVTYPES_HPP_

#include <set>
#include <vector>

#include "../common/PAVFwdDecls.hpp"
#include "../semantics/SOSEngine.hpp"

namespace PAV {
    namespace Equiv {

        using Terms::Action;
        using Sem::SemanticModelT;

        // What a witness set of actions means
        enum class ActionSetKindT {
            None, Refusal, Acceptance
        };

        // Evidence for a difference: the visible trace leading to it,
        // and optionally the pair of states and a set of actions
        class Witness
        {
        public:
            TraceT Trace;
            bool HasStatePair;
            string LeftState;
            string RightState;
            ActionSetKindT SetKind;
            set<Action> ActionSet;

            Witness();
            Witness(const TraceT& Trace);
            Witness(const Witness& Other);
            ~Witness();

            Witness& operator = (const Witness& Other);

            void SetStatePair(const string& Left, const string& Right);
            void SetActionSet(ActionSetKindT Kind, const set<Action>& Actions);

            string ToString() const;
        };

        class EquivalenceResult
        {
        public:
            VerdictT Verdict;
            bool HasWitness;
            Witness TheWitness;
            string Message;

            EquivalenceResult();
            EquivalenceResult(VerdictT Verdict, const string& Message = "");
            EquivalenceResult(VerdictT Verdict, const Witness& TheWitness,
                              const string& Message = "");
            EquivalenceResult(const EquivalenceResult& Other);
            ~EquivalenceResult();

            EquivalenceResult& operator = (const EquivalenceResult& Other);

            bool IsEquivalent() const;
            bool IsNotEquivalent() const;
            bool IsInconclusive() const;

            string ToString() const;
        };

        class EquivalenceOptionsT
        {
        public:
            SemanticModelT Model;
            // Bound on trace length for trace, testing and failures
            u32 MaxDepth;
            // Ceiling on the number of states of each LTS
            u64 MaxStates;
            // CSP only
            set<Action> SyncAlphabet;
            // ACP only
            Sem::CommunicationFunction CommFunction;

            static const u32 DefaultMaxDepth;
            static const u64 DefaultMaxStates;

            EquivalenceOptionsT();
            EquivalenceOptionsT(const EquivalenceOptionsT& Other);
            ~EquivalenceOptionsT();

            EquivalenceOptionsT& operator = (const EquivalenceOptionsT& Other);

            Sem::SemanticOptionsT GetSemanticOptions() const;
            // Throws ConfigurationError on inconsistent options
            void Validate() const;
        };

        typedef set<set<Action>> ActionSetFamilyT;

        // The members of Family with no proper subset (superset) in Family
        extern ActionSetFamilyT MinimalSets(const ActionSetFamilyT& Family);
        extern ActionSetFamilyT MaximalSets(const ActionSetFamilyT& Family);
        // Alphabet minus Actions
        extern set<Action> ComplementSet(const set<Action>& Alphabet,
                                         const set<Action>& Actions);
        // True if Actions is a subset of some member of Family
        extern bool IsCovered(const set<Action>& Actions, const ActionSetFamilyT& Family);

        extern string VerdictToString(VerdictT Verdict);
        extern string EquivalenceKindToString(EquivalenceKindT Kind);
        // Case insensitive, throws PAVError for unknown names
        extern EquivalenceKindT EquivalenceKindFromString(const string& KindName);
        extern string TraceToString(const TraceT& Trace);

        extern ostream& operator << (ostream& Out, VerdictT Verdict);
        extern ostream& operator << (ostream& Out, EquivalenceKindT Kind);
        extern ostream& operator << (ostream& Out, const Witness& TheWitness);
        extern ostream& operator << (ostream& Out, const EquivalenceResult& Result);

    } /* end namespace Equiv */
} /* end namespace PAV */

#endif /* PAV_EQUIV_EQUIVTYPES_HPP_ */

//
// EquivTypes.hpp ends here
