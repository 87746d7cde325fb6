// DerivationCache.cpp ---
//
// Filename: DerivationCache.cpp
// Author: Abhishek Udupa
// Created: Tue Jun  2 09:58:33 2015 (-0400)
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

#include "DerivationCache.hpp"

namespace PAV {
    namespace Sem {

        DerivationCache::DerivationCache()
            : NumReused(0)
        {
            // Nothing here
        }

        DerivationCache::~DerivationCache()
        {
            // Nothing here
        }

        const TransitionSetT* DerivationCache::Find(const TermRef& Term)
        {
            auto it = Derived.find(Term->GetID());
            if (it == Derived.end()) {
                return nullptr;
            }
            ++NumReused;
            return &(it->second);
        }

        const TransitionSetT& DerivationCache::Insert(const TermRef& Term,
                                                      TransitionSetT&& Transitions)
        {
            auto Res = Derived.insert(make_pair(Term->GetID(), move(Transitions)));
            if (!Res.second) {
                throw InternalError((string)"Term \"" + Term->ToString() + "\" was " +
                                    "derived twice in one exploration.\nIn call to " +
                                    __FUNCTION__ + " at " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }
            return Res.first->second;
        }

        u64 DerivationCache::GetNumDerived() const
        {
            return Derived.size();
        }

        u64 DerivationCache::GetNumReused() const
        {
            return NumReused;
        }

        void DerivationCache::Clear()
        {
            Derived.clear();
            NumReused = 0;
        }

    } /* end namespace Sem */
} /* end namespace PAV */

//
// DerivationCache.cpp ends here
