// DerivationCache.hpp ---
//
// Filename: DerivationCache.hpp
// Author: Abhishek Udupa
// Created: Tue Jun  2 09:41:07 2015 (-0400)
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

// A memo of the transitions derived for each term during one
// exploration. Operands of nested compositions are consulted by
// several rules and by several states, each is derived once.
// Caches are not shared between threads: every exploration owns
// its own, while the engine itself stays read only. Ids are only
// unique within one TermMgr, so a cache must not mix managers.

#if !defined PAV_SEMANTICS_DERIVATIONCACHE_HPP_
#define PAV_SEMANTICS_DERIVATIONCACHE_HPP_

#include <unordered_map>

#include "../common/PAVFwdDecls.hpp"
#include "../terms/Terms.hpp"
#include "../terms/Transition.hpp"

namespace PAV {
    namespace Sem {

        using Terms::TermRef;
        using Terms::TransitionSetT;

        class DerivationCache
        {
        private:
            // Keyed by the interned id of the term. Entries are only
            // erased by Clear(), so references to them stay valid
            // until then.
            unordered_map<u64, TransitionSetT> Derived;
            u64 NumReused;

        public:
            DerivationCache();
            ~DerivationCache();

            DerivationCache(const DerivationCache& Other) = delete;
            DerivationCache& operator = (const DerivationCache& Other) = delete;

            // nullptr if Term has not been derived yet
            const TransitionSetT* Find(const TermRef& Term);
            const TransitionSetT& Insert(const TermRef& Term, TransitionSetT&& Transitions);

            // Number of terms derived, and number of lookups that
            // were answered without deriving again
            u64 GetNumDerived() const;
            u64 GetNumReused() const;

            void Clear();
        };

    } /* end namespace Sem */
} /* end namespace PAV */

#endif /* PAV_SEMANTICS_DERIVATIONCACHE_HPP_ */

//
// DerivationCache.hpp ends here
