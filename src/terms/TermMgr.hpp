// TermMgr.hpp ---
//
// Filename: TermMgr.hpp
// Author: Abhishek Udupa
// Created: Wed Feb 10 12:33:39 2015 (-0500)
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

// The term manager: an explicit interning table (arena + index)
// for process terms. Every term is created through a manager,
// which hands out a unique shared instance per canonical form.
// A manager can be shared across verification tasks running
// on different threads.
//
// Interned terms are never evicted: every term built while
// exploring (unfoldings and intermediate configurations included)
// stays in the arena until the manager is destroyed, and ids are
// never reused. Long running clients should scope a manager to a
// batch of checks and drop it afterwards.

#if !defined PAV_TERMS_TERMMGR_HPP_
#define PAV_TERMS_TERMMGR_HPP_

#include "../common/PAVFwdDecls.hpp"
#include "../containers/RefCache.hpp"

#include "Terms.hpp"

namespace PAV {
    namespace Terms {

        class TermMgr
        {
        private:
            typedef RefCache<TermBase, TermCanonicalHasher, TermCanonicalEquals> TermCacheT;

            TermCacheT TermCache;
            TermRef TheStopTerm;

            inline void CheckMgr(const TermRef& Term) const;
            inline TermRef GetCachedOrInsert(const TermRef& Term);

        public:
            TermMgr();
            ~TermMgr();

            TermMgr(const TermMgr& Other) = delete;
            TermMgr& operator = (const TermMgr& Other) = delete;

            const TermRef& MakeStop() const;
            TermRef MakeVar(const string& VarName);
            TermRef MakePrefix(const Action& PrefixAction, const TermRef& Continuation);
            TermRef MakeChoice(const TermRef& Left, const TermRef& Right);
            // Left associated choice over all the summands, Stop if empty
            TermRef MakeChoice(const vector<TermRef>& Summands);
            TermRef MakeParallel(const TermRef& Left, const TermRef& Right);
            TermRef MakeRec(const string& VarName, const TermRef& Definition);

            // Choice modulo associativity and idempotence: the summands
            // of both operands are flattened and duplicates dropped,
            // keeping the order of first occurrence
            TermRef MakeNormalizedChoice(const TermRef& Left, const TermRef& Right);

            // Convenience: Action1.Action2...ActionN.Continuation
            TermRef MakeSequence(const vector<Action>& Actions, const TermRef& Continuation);

            TermRef GetTermByID(u64 ID) const;
            u64 GetNumTerms() const;

            static void CheckVarName(const string& VarName);
        };

        // Gathers the summands of nested choices, left to right
        extern void GatherSummands(const TermRef& Term, vector<TermRef>& Summands);

    } /* end namespace Terms */
} /* end namespace PAV */

#endif /* PAV_TERMS_TERMMGR_HPP_ */

//
// TermMgr.hpp ends here
