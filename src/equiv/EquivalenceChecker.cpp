// EquivalenceChecker.cpp ---
//
// Filename: EquivalenceChecker.cpp
// Author: Abhishek Udupa
// Created: Sun Apr 13 11:36:48 2015 (-0400)
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

#include "../semantics/SOSEngine.hpp"
#include "../terms/TermUtils.hpp"
#include "../lts/LabelledTS.hpp"
#include "../lts/LTSBuilder.hpp"
#include "../utils/LogManager.hpp"
#include "../lib/PAVLib.hpp"

#include "TraceEquivalence.hpp"
#include "Bisimulation.hpp"
#include "TestingEquivalence.hpp"
#include "FailuresEquivalence.hpp"
#include "EquivalenceChecker.hpp"

namespace PAV {
    namespace Equiv {

        using LTS::LTSBuilder;

        EquivalenceChecker::EquivalenceChecker(const EquivalenceOptionsT& Options)
            : Options(Options), Engine(nullptr)
        {
            Options.Validate();
            Engine = Sem::MakeEngine(Options.Model, Options.GetSemanticOptions());
        }

        EquivalenceChecker::~EquivalenceChecker()
        {
            delete Engine;
        }

        const EquivalenceOptionsT& EquivalenceChecker::GetOptions() const
        {
            return Options;
        }

        const Sem::SOSEngine* EquivalenceChecker::GetEngine() const
        {
            return Engine;
        }

        LabelledTS* EquivalenceChecker::BuildLTS(const TermRef& Term) const
        {
            LTSBuilder Builder(Engine, Options.MaxStates);
            return Builder.Build(Term);
        }

        EquivalenceResult EquivalenceChecker::Dispatch(const LabelledTS* LTS1,
                                                       const LabelledTS* LTS2,
                                                       EquivalenceKindT Kind) const
        {
            switch (Kind) {
            case EquivalenceKindT::Trace:
                return TraceChecker(Options.MaxDepth).Check(LTS1, LTS2);
            case EquivalenceKindT::StrongBisimulation:
                return BisimulationChecker().CheckStrong(LTS1, LTS2);
            case EquivalenceKindT::WeakBisimulation:
                return BisimulationChecker().CheckWeak(LTS1, LTS2);
            case EquivalenceKindT::Testing:
                return TestingChecker(Options.MaxDepth).Check(LTS1, LTS2);
            case EquivalenceKindT::MayTesting:
                return TestingChecker(Options.MaxDepth).CheckMay(LTS1, LTS2);
            case EquivalenceKindT::MustTesting:
                return TestingChecker(Options.MaxDepth).CheckMust(LTS1, LTS2);
            case EquivalenceKindT::Failures:
                return FailuresChecker(Options.MaxDepth).Check(LTS1, LTS2);
            }

            throw PAVError((string)"Unsupported equivalence kind with value " +
                           to_string((u32)Kind) + "\nIn call to " + __FUNCTION__ +
                           " at " + __FILE__ + ":" + to_string(__LINE__));
        }

        EquivalenceResult EquivalenceChecker::Check(const TermRef& Term1, const TermRef& Term2,
                                                    EquivalenceKindT Kind) const
        {
            Terms::CheckExplorable(Term1);
            Terms::CheckExplorable(Term2);

            // Every equivalence is reflexive, whatever the bounds
            if (Term1->Equals(Term2)) {
                EquivalenceResult Retval(VerdictT::Equivalent, "the terms are identical");
                PAV_LOG_SHORT("Checker.Verdicts",
                              Out_ << "[" << EquivalenceKindToString(Kind) << "] "
                                   << Term1->ToString() << " vs " << Term2->ToString()
                                   << " : " << Retval.ToString() << endl;);
                return Retval;
            }

            LabelledTS* LTS1 = nullptr;
            LabelledTS* LTS2 = nullptr;
            EquivalenceResult Retval;

            try {
                LTS1 = BuildLTS(Term1);
                LTS2 = BuildLTS(Term2);
                Retval = Dispatch(LTS1, LTS2, Kind);
            } catch (const ExplorationLimitException& Ex) {
                Retval = EquivalenceResult(VerdictT::Inconclusive, Ex.what());
            } catch (...) {
                delete LTS1;
                delete LTS2;
                throw;
            }

            delete LTS1;
            delete LTS2;

            PAV_LOG_SHORT("Checker.Verdicts",
                          Out_ << "[" << EquivalenceKindToString(Kind) << "] "
                               << Term1->ToString() << " vs " << Term2->ToString()
                               << " under " << Sem::SemanticModelToString(Options.Model)
                               << " : " << Retval.ToString() << endl;);
            return Retval;
        }

        EquivalenceResult EquivalenceChecker::CheckRefinement(const TermRef& Spec,
                                                              const TermRef& Impl) const
        {
            Terms::CheckExplorable(Spec);
            Terms::CheckExplorable(Impl);

            if (Spec->Equals(Impl)) {
                return EquivalenceResult(VerdictT::Equivalent, "the terms are identical");
            }

            LabelledTS* SpecLTS = nullptr;
            LabelledTS* ImplLTS = nullptr;
            EquivalenceResult Retval;

            try {
                SpecLTS = BuildLTS(Spec);
                ImplLTS = BuildLTS(Impl);
                Retval = FailuresChecker(Options.MaxDepth).CheckRefinement(SpecLTS, ImplLTS);
            } catch (const ExplorationLimitException& Ex) {
                Retval = EquivalenceResult(VerdictT::Inconclusive, Ex.what());
            } catch (...) {
                delete SpecLTS;
                delete ImplLTS;
                throw;
            }

            delete SpecLTS;
            delete ImplLTS;

            PAV_LOG_SHORT("Checker.Verdicts",
                          Out_ << "[Refinement] " << Spec->ToString() << " refined by "
                               << Impl->ToString() << " : " << Retval.ToString() << endl;);
            return Retval;
        }

        EquivalenceResult CheckEquivalence(const TermRef& Term1, const TermRef& Term2,
                                           EquivalenceKindT Kind,
                                           const EquivalenceOptionsT& Options)
        {
            EquivalenceChecker Checker(Options);
            return Checker.Check(Term1, Term2, Kind);
        }

        EquivalenceResult CheckRefinement(const TermRef& Spec, const TermRef& Impl,
                                          const EquivalenceOptionsT& Options)
        {
            EquivalenceChecker Checker(Options);
            return Checker.CheckRefinement(Spec, Impl);
        }

        LabelledTS* BuildLTS(const TermRef& Term, const EquivalenceOptionsT& Options)
        {
            EquivalenceChecker Checker(Options);
            return Checker.BuildLTS(Term);
        }

        EquivalenceResult CheckEquivalence(const TermRef& Term1, const TermRef& Term2,
                                           EquivalenceKindT Kind)
        {
            return CheckEquivalence(Term1, Term2, Kind, PAVLib::GetOptions().CheckOptions);
        }

        EquivalenceResult CheckRefinement(const TermRef& Spec, const TermRef& Impl)
        {
            return CheckRefinement(Spec, Impl, PAVLib::GetOptions().CheckOptions);
        }

    } /* end namespace Equiv */
} /* end namespace PAV */

//
// EquivalenceChecker.cpp ends here
