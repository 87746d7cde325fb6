// SOSEngine.hpp ---
//
// Filename: SOSEngine.hpp
// Author: Abhishek Udupa
// Created: Fri Mar 14 22:05:55 2015 (-0500)
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

// A rule driven transition engine for one semantic model.
// The transitions of a term are the union of the contributions
// of every rule that applies to it; rules are required to be
// independent of one another, so the order in which they are
// consulted does not matter.

#if !defined PAV_SEMANTICS_SOSENGINE_HPP_
#define PAV_SEMANTICS_SOSENGINE_HPP_

#include <set>
#include <vector>

#include "../common/PAVFwdDecls.hpp"
#include "../terms/Terms.hpp"
#include "../terms/Transition.hpp"

#include "CommunicationFunction.hpp"
#include "DerivationCache.hpp"

namespace PAV {
    namespace Sem {

        using Terms::Action;
        using Terms::TermRef;
        using Terms::TransitionSetT;

        // Model specific parameters, only the ones relevant
        // to the model in force are consulted
        class SemanticOptionsT
        {
        public:
            // CSP: actions on which parallel operands rendezvous
            set<Action> SyncAlphabet;
            // ACP: the communication function
            CommunicationFunction CommFunction;

            SemanticOptionsT();
            SemanticOptionsT(const SemanticOptionsT& Other);
            ~SemanticOptionsT();

            SemanticOptionsT& operator = (const SemanticOptionsT& Other);

            // Throws ConfigurationError on structural inconsistencies
            void Validate(SemanticModelT Model) const;
        };

        class SOSEngine
        {
        private:
            SemanticModelT Model;
            SemanticOptionsT Options;
            vector<SOSRuleBase*> Rules;

        public:
            SOSEngine(SemanticModelT Model,
                      const SemanticOptionsT& Options = SemanticOptionsT());
            ~SOSEngine();

            SOSEngine(const SOSEngine& Other) = delete;
            SOSEngine& operator = (const SOSEngine& Other) = delete;

            // The engine takes ownership of the rule
            void AddRule(SOSRuleBase* Rule);
            const vector<SOSRuleBase*>& GetRules() const;

            SemanticModelT GetModel() const;
            const SemanticOptionsT& GetOptions() const;

            // A term that no rule applies to is stuck and
            // has no transitions
            TransitionSetT ComputeTransitions(const TermRef& Term) const;
            // As above, but consults Cache before deriving, and records
            // every term derived, operands included, in Cache. The
            // returned reference lives as long as Cache does.
            const TransitionSetT& ComputeTransitions(DerivationCache& Cache,
                                                     const TermRef& Term) const;

            // The derived ACP relations of Parallel(P, Q), taken in
            // isolation. Only available on ACP engines.
            TransitionSetT DeriveLeftMerge(const TermRef& P, const TermRef& Q) const;
            TransitionSetT DeriveCommunicationMerge(const TermRef& P, const TermRef& Q) const;
        };

        // Factories: the configuration is validated before
        // an engine is handed out. The caller owns the engine.
        extern SOSEngine* MakeEngine(SemanticModelT Model,
                                     const SemanticOptionsT& Options = SemanticOptionsT());
        extern SOSEngine* MakeCCSEngine();
        extern SOSEngine* MakeCSPEngine(const set<Action>& SyncAlphabet);
        extern SOSEngine* MakeACPEngine(const CommunicationFunction& Gamma);

        extern string SemanticModelToString(SemanticModelT Model);
        // Case insensitive, throws PAVError for unknown names
        extern SemanticModelT SemanticModelFromString(const string& ModelName);

        extern ostream& operator << (ostream& Out, SemanticModelT Model);

    } /* end namespace Sem */
} /* end namespace PAV */

#endif /* PAV_SEMANTICS_SOSENGINE_HPP_ */

//
// SOSEngine.hpp ends here
