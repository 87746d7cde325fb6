// TermMgr.cpp ---
//
// Filename: TermMgr.cpp
// Author: Abhishek Udupa
// Created: Thu Feb 17 17:50:10 2015 (-0500)
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

#include <unordered_set>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "Actions.hpp"
#include "TermMgr.hpp"

namespace PAV {
    namespace Terms {

        TermMgr::TermMgr()
            : TermCache(), TheStopTerm(TermRef::NullPtr)
        {
            TheStopTerm = TermCache.Get<StopTerm>(this);
        }

        TermMgr::~TermMgr()
        {
            // Nothing here
        }

        inline void TermMgr::CheckMgr(const TermRef& Term) const
        {
            if (Term.IsNull_()) {
                throw PAVError((string)"Null term passed as an operand.\nIn call to " +
                               __FUNCTION__ + " at " + __FILE__ + ":" +
                               to_string(__LINE__));
            }
            if (Term->GetMgr() != this) {
                throw PAVError((string)"Term \"" + Term->ToString() + "\" was created " +
                               "by a different term manager.\nIn call to " +
                               __FUNCTION__ + " at " + __FILE__ + ":" +
                               to_string(__LINE__));
            }
        }

        inline TermRef TermMgr::GetCachedOrInsert(const TermRef& Term)
        {
            return TermCache.Get(Term);
        }

        void TermMgr::CheckVarName(const string& VarName)
        {
            if (VarName.empty() ||
                !boost::algorithm::all(VarName, boost::algorithm::is_alnum() ||
                                       boost::algorithm::is_any_of("_")) ||
                boost::algorithm::is_digit()(VarName[0])) {
                throw PAVError((string)"Invalid process variable name \"" + VarName +
                               "\". Variables are identifiers made of letters, " +
                               "digits and underscores.\nIn call to " + __FUNCTION__ +
                               " at " + __FILE__ + ":" + to_string(__LINE__));
            }
            if (VarName == "STOP" || VarName == "rec") {
                throw PAVError((string)"\"" + VarName + "\" is reserved and cannot " +
                               "be used as a process variable.\nIn call to " +
                               __FUNCTION__ + " at " + __FILE__ + ":" +
                               to_string(__LINE__));
            }
        }

        const TermRef& TermMgr::MakeStop() const
        {
            return TheStopTerm;
        }

        TermRef TermMgr::MakeVar(const string& VarName)
        {
            CheckVarName(VarName);
            return GetCachedOrInsert(new VarTerm(this, VarName));
        }

        TermRef TermMgr::MakePrefix(const Action& PrefixAction, const TermRef& Continuation)
        {
            CheckActionName(PrefixAction);
            CheckMgr(Continuation);
            return GetCachedOrInsert(new PrefixTerm(this, PrefixAction, Continuation));
        }

        TermRef TermMgr::MakeChoice(const TermRef& Left, const TermRef& Right)
        {
            CheckMgr(Left);
            CheckMgr(Right);
            return GetCachedOrInsert(new ChoiceTerm(this, Left, Right));
        }

        TermRef TermMgr::MakeChoice(const vector<TermRef>& Summands)
        {
            if (Summands.size() == 0) {
                return TheStopTerm;
            }
            auto Retval = Summands[0];
            CheckMgr(Retval);
            for (u32 i = 1; i < Summands.size(); ++i) {
                Retval = MakeChoice(Retval, Summands[i]);
            }
            return Retval;
        }

        TermRef TermMgr::MakeParallel(const TermRef& Left, const TermRef& Right)
        {
            CheckMgr(Left);
            CheckMgr(Right);
            return GetCachedOrInsert(new ParallelTerm(this, Left, Right));
        }

        TermRef TermMgr::MakeRec(const string& VarName, const TermRef& Definition)
        {
            CheckVarName(VarName);
            CheckMgr(Definition);
            return GetCachedOrInsert(new RecTerm(this, VarName, Definition));
        }

        TermRef TermMgr::MakeNormalizedChoice(const TermRef& Left, const TermRef& Right)
        {
            CheckMgr(Left);
            CheckMgr(Right);

            vector<TermRef> AllSummands;
            GatherSummands(Left, AllSummands);
            GatherSummands(Right, AllSummands);

            // Terms are interned, so pointer identity is structural identity
            vector<TermRef> Summands;
            unordered_set<const TermBase*> SeenSummands;
            for (auto const& Summand : AllSummands) {
                if (SeenSummands.insert(Summand.GetPtr_()).second) {
                    Summands.push_back(Summand);
                }
            }
            return MakeChoice(Summands);
        }

        TermRef TermMgr::MakeSequence(const vector<Action>& Actions,
                                      const TermRef& Continuation)
        {
            auto Retval = Continuation;
            CheckMgr(Retval);
            for (auto it = Actions.rbegin(); it != Actions.rend(); ++it) {
                Retval = MakePrefix(*it, Retval);
            }
            return Retval;
        }

        TermRef TermMgr::GetTermByID(u64 ID) const
        {
            return TermCache.GetByID(ID);
        }

        u64 TermMgr::GetNumTerms() const
        {
            return TermCache.Size();
        }

        void GatherSummands(const TermRef& Term, vector<TermRef>& Summands)
        {
            if (Term->GetKind() == TermKind::Choice) {
                auto TermAsChoice = Term->SAs<ChoiceTerm>();
                GatherSummands(TermAsChoice->GetLeft(), Summands);
                GatherSummands(TermAsChoice->GetRight(), Summands);
            } else {
                Summands.push_back(Term);
            }
        }

    } /* end namespace Terms */
} /* end namespace PAV */

//
// TermMgr.cpp ends here
