// LTSBuilder.hpp ---
//
// Filename: LTSBuilder.hpp
// Author: Abhishek Udupa
// Created: Sat Mar 16 20:21:03 2015 (-0500)
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

// Builds the LTS of a process term by exhaustive exploration
// of its reachable configurations, as derived by an SOS engine.

#if !defined PAV_LTS_LTSBUILDER_HPP_
#define PAV_LTS_LTSBUILDER_HPP_

#include "../common/PAVFwdDecls.hpp"
#include "../terms/Terms.hpp"

namespace PAV {
    namespace LTS {

        using Terms::TermRef;

        class LTSBuilder
        {
        private:
            const Sem::SOSEngine* Engine;
            u64 MaxStates;

            // Statistics from the last build
            u64 NumStatesExplored;
            u64 NumTransitionsRecorded;
            // Distinct terms, operands included, the engine derived
            u64 NumTermsDerived;

        public:
            static const u64 DefaultMaxStates;

            LTSBuilder(const Sem::SOSEngine* Engine, u64 MaxStates = DefaultMaxStates);
            ~LTSBuilder();

            u64 GetMaxStates() const;
            const Sem::SOSEngine* GetEngine() const;

            // The caller owns the returned LTS. Throws PAVError for
            // terms with free variables or unguarded recursion, and
            // ExplorationLimitException when more than MaxStates
            // states are discovered.
            LabelledTS* Build(const TermRef& Term);

            u64 GetNumStatesExplored() const;
            u64 GetNumTransitionsRecorded() const;
            u64 GetNumTermsDerived() const;
        };

        // Builds with a fresh engine for the given model
        extern LabelledTS* BuildLTS(const TermRef& Term, Sem::SemanticModelT Model);

    } /* end namespace LTS */
} /* end namespace PAV */

#endif /* PAV_LTS_LTSBUILDER_HPP_ */

//
// LTSBuilder.hpp ends here
