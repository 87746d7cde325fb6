// PAVFwdDecls.hpp ---
//
// Filename: PAVFwdDecls.hpp
// Author: Abhishek Udupa
// Created: Tue Feb  8 14:17:31 2015 (-0500)
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

// Forward declarations of classes and types

#if !defined PAV_COMMON_PAVFWDDECLS_HPP_
#define PAV_COMMON_PAVFWDDECLS_HPP_

#include <vector>
#include <set>

#include "PAVTypes.hpp"

namespace PAV {

    // SmartPtrs and such
    class RefCountable;
    template <typename T> class CSmartPtr;

    enum class LogFileCompressionTechniqueT {
        COMPRESS_NONE, COMPRESS_GZIP, COMPRESS_BZIP2
    };

    class PAVLibOptionsT;
    class PAVLib;

    namespace Logging {
        class LogManager;
    } /* end namespace Logging */

    namespace Terms {

        typedef string Action;

        enum class TermKind {
            Stop, Var, Prefix, Choice, Parallel, Recursive
        };

        class TermBase;
        class StopTerm;
        class VarTerm;
        class PrefixTerm;
        class ChoiceTerm;
        class ParallelTerm;
        class RecTerm;

        class TermVisitorBase;
        class TermMgr;
        class Transition;
        class TransitionHasher;

        typedef CSmartPtr<TermBase> TermRef;

    } /* end namespace Terms */

    namespace Sem {

        enum class SemanticModelT {
            CCS, CSP, ACP
        };

        class SOSRuleBase;
        class SOSEngine;
        class CommunicationFunction;
        class SemanticOptionsT;
        class DerivationCache;

        // Rules shared by all models
        class PrefixRule;
        class ChoiceRule;
        class RecursionRule;

        // Model specific parallel composition rules
        class CCSInterleavingRule;
        class CCSCommunicationRule;
        class CSPInterleavingRule;
        class CSPSynchronizationRule;
        class CSPExternalChoiceRule;
        class ACPLeftMergeRule;
        class ACPCommunicationMergeRule;

    } /* end namespace Sem */

    namespace LTS {

        typedef u32 StateID;

        class LTSEdge;
        class TransitionRelation;
        class LabelledTS;
        class LTSBuilder;

        typedef set<StateID> StateSetT;

    } /* end namespace LTS */

    namespace Equiv {

        enum class EquivalenceKindT {
            Trace, StrongBisimulation, WeakBisimulation,
            Testing, MayTesting, MustTesting, Failures
        };

        enum class VerdictT {
            Equivalent, NotEquivalent, Inconclusive
        };

        typedef vector<Terms::Action> TraceT;

        class Witness;
        class EquivalenceResult;
        class EquivalenceOptionsT;
        class SubsetPairExplorer;

        class TraceChecker;
        class BisimulationChecker;
        class TestingChecker;
        class FailuresChecker;
        class EquivalenceChecker;

    } /* end namespace Equiv */

} /* end namespace PAV */

#endif /* PAV_COMMON_PAVFWDDECLS_HPP_ */

//
// PAVFwdDecls.hpp ends here
