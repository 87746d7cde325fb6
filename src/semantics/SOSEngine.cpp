// SOSEngine.cpp ---
//
// Filename: SOSEngine.cpp
// Author: Abhishek Udupa
// Created: Sat Mar 21 13:22:26 2015 (-0500)
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

#include <boost/algorithm/string/predicate.hpp>

#include "../terms/TermMgr.hpp"
#include "../utils/LogManager.hpp"

#include "SOSEngine.hpp"
#include "SOSRules.hpp"
#include "CCSRules.hpp"
#include "CSPRules.hpp"
#include "ACPRules.hpp"

namespace PAV {
    namespace Sem {

        using namespace Terms;

        SemanticOptionsT::SemanticOptionsT()
        {
            // Nothing here
        }

        SemanticOptionsT::SemanticOptionsT(const SemanticOptionsT& Other)
            : SyncAlphabet(Other.SyncAlphabet), CommFunction(Other.CommFunction)
        {
            // Nothing here
        }

        SemanticOptionsT::~SemanticOptionsT()
        {
            // Nothing here
        }

        SemanticOptionsT& SemanticOptionsT::operator = (const SemanticOptionsT& Other)
        {
            if (&Other == this) {
                return *this;
            }
            SyncAlphabet = Other.SyncAlphabet;
            CommFunction = Other.CommFunction;
            return *this;
        }

        void SemanticOptionsT::Validate(SemanticModelT Model) const
        {
            switch (Model) {
            case SemanticModelT::CCS:
                break;
            case SemanticModelT::CSP:
                ValidateSyncAlphabet(SyncAlphabet);
                break;
            case SemanticModelT::ACP:
                CommFunction.Validate();
                break;
            }
        }

        SOSEngine::SOSEngine(SemanticModelT Model, const SemanticOptionsT& Options)
            : Model(Model), Options(Options)
        {
            // Nothing here
        }

        SOSEngine::~SOSEngine()
        {
            for (auto Rule : Rules) {
                delete Rule;
            }
            Rules.clear();
        }

        void SOSEngine::AddRule(SOSRuleBase* Rule)
        {
            Rules.push_back(Rule);
        }

        const vector<SOSRuleBase*>& SOSEngine::GetRules() const
        {
            return Rules;
        }

        SemanticModelT SOSEngine::GetModel() const
        {
            return Model;
        }

        const SemanticOptionsT& SOSEngine::GetOptions() const
        {
            return Options;
        }

        TransitionSetT SOSEngine::ComputeTransitions(const TermRef& Term) const
        {
            DerivationCache Cache;
            return ComputeTransitions(Cache, Term);
        }

        const TransitionSetT& SOSEngine::ComputeTransitions(DerivationCache& Cache,
                                                            const TermRef& Term) const
        {
            auto Cached = Cache.Find(Term);
            if (Cached != nullptr) {
                return *Cached;
            }

            TransitionSetT Retval;
            for (auto Rule : Rules) {
                if (Rule->CanApply(Term)) {
                    Rule->Derive(Term, this, Cache, Retval);
                }
            }

            PAV_LOG_FULL("Engine.Derivations",
                         Out_ << "Transitions of " << Term->ToString() << " under "
                              << Model << ":" << endl;
                         for (auto const& Trans : SortTransitions(Retval)) {
                             Out_ << "    " << Trans << endl;
                         });

            return Cache.Insert(Term, move(Retval));
        }

        TransitionSetT SOSEngine::DeriveLeftMerge(const TermRef& P, const TermRef& Q) const
        {
            if (Model != SemanticModelT::ACP) {
                throw PAVError((string)"The left merge is only defined for ACP engines.\n" +
                               "In call to " + __FUNCTION__ + " at " + __FILE__ + ":" +
                               to_string(__LINE__));
            }
            TransitionSetT Retval;
            DerivationCache Cache;
            auto Composition = P->GetMgr()->MakeParallel(P, Q);
            ACPLeftMergeRule::LiftMoves(Composition, P, Q, true, this, Cache, Retval);
            return Retval;
        }

        TransitionSetT SOSEngine::DeriveCommunicationMerge(const TermRef& P,
                                                           const TermRef& Q) const
        {
            if (Model != SemanticModelT::ACP) {
                throw PAVError((string)"The communication merge is only defined for " +
                               "ACP engines.\nIn call to " + __FUNCTION__ + " at " +
                               __FILE__ + ":" + to_string(__LINE__));
            }
            TransitionSetT Retval;
            DerivationCache Cache;
            auto Composition = P->GetMgr()->MakeParallel(P, Q);
            ACPCommunicationMergeRule CommRule(Options.CommFunction);
            CommRule.Derive(Composition, this, Cache, Retval);
            return Retval;
        }

        SOSEngine* MakeEngine(SemanticModelT Model, const SemanticOptionsT& Options)
        {
            Options.Validate(Model);

            auto Retval = new SOSEngine(Model, Options);
            Retval->AddRule(new PrefixRule());
            Retval->AddRule(new RecursionRule());

            switch (Model) {
            case SemanticModelT::CCS:
                Retval->AddRule(new ChoiceRule());
                Retval->AddRule(new CCSInterleavingRule());
                Retval->AddRule(new CCSCommunicationRule());
                break;
            case SemanticModelT::CSP:
                Retval->AddRule(new CSPExternalChoiceRule());
                Retval->AddRule(new CSPInterleavingRule(Options.SyncAlphabet));
                Retval->AddRule(new CSPSynchronizationRule(Options.SyncAlphabet));
                break;
            case SemanticModelT::ACP:
                Retval->AddRule(new ChoiceRule());
                Retval->AddRule(new ACPLeftMergeRule(MergeOperandT::Left));
                Retval->AddRule(new ACPLeftMergeRule(MergeOperandT::Right));
                Retval->AddRule(new ACPCommunicationMergeRule(Options.CommFunction));
                break;
            }
            return Retval;
        }

        SOSEngine* MakeCCSEngine()
        {
            return MakeEngine(SemanticModelT::CCS);
        }

        SOSEngine* MakeCSPEngine(const set<Action>& SyncAlphabet)
        {
            SemanticOptionsT Options;
            Options.SyncAlphabet = SyncAlphabet;
            return MakeEngine(SemanticModelT::CSP, Options);
        }

        SOSEngine* MakeACPEngine(const CommunicationFunction& Gamma)
        {
            SemanticOptionsT Options;
            Options.CommFunction = Gamma;
            return MakeEngine(SemanticModelT::ACP, Options);
        }

        string SemanticModelToString(SemanticModelT Model)
        {
            switch (Model) {
            case SemanticModelT::CCS:
                return "CCS";
            case SemanticModelT::CSP:
                return "CSP";
            case SemanticModelT::ACP:
                return "ACP";
            }
            return "Unknown";
        }

        SemanticModelT SemanticModelFromString(const string& ModelName)
        {
            if (boost::algorithm::iequals(ModelName, "CCS")) {
                return SemanticModelT::CCS;
            } else if (boost::algorithm::iequals(ModelName, "CSP")) {
                return SemanticModelT::CSP;
            } else if (boost::algorithm::iequals(ModelName, "ACP")) {
                return SemanticModelT::ACP;
            }
            throw PAVError((string)"Unknown semantic model \"" + ModelName + "\". " +
                           "Expected one of CCS, CSP or ACP.\nIn call to " +
                           __FUNCTION__ + " at " + __FILE__ + ":" + to_string(__LINE__));
        }

        ostream& operator << (ostream& Out, SemanticModelT Model)
        {
            Out << SemanticModelToString(Model);
            return Out;
        }

    } /* end namespace Sem */
} /* end namespace PAV */

//
// SOSEngine.cpp ends here
