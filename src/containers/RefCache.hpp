// RefCache.hpp ---
//
// Filename: RefCache.hpp
// Author: Abhishek Udupa
// Created: Fri Feb  2 15:08:04 2015 (-0500)
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

#if !defined PAV_CONTAINERS_REFCACHE_HPP_
#define PAV_CONTAINERS_REFCACHE_HPP_

#include <unordered_set>
#include <vector>
#include <mutex>

#include "../common/PAVFwdDecls.hpp"
#include "SmartPtr.hpp"

namespace PAV {

    // A permanent interning store: an arena of objects indexed by
    // HASHERTYPE/EQTYPE. Objects are never evicted, so an object
    // handed out by the cache stays valid (and is never mutated)
    // for the lifetime of the cache. OBJTYPE must provide
    // SetInternID_(u64) const, which is invoked exactly once,
    // before the object becomes visible to other threads.
    template <typename OBJTYPE, typename HASHERTYPE, typename EQTYPE>
    class RefCache
    {
    public:
        typedef CSmartPtr<OBJTYPE> PtrType;

    private:
        typedef unordered_set<PtrType, HASHERTYPE, EQTYPE> SetType;

        SetType Cache;
        vector<PtrType> Arena;
        mutable mutex CacheMutex;

    public:
        inline RefCache(u32 InitialCapacity = 1024)
        {
            Cache.reserve(InitialCapacity);
            Arena.reserve(InitialCapacity);
        }

        inline ~RefCache()
        {
            Cache.clear();
            Arena.clear();
        }

        RefCache(const RefCache& Other) = delete;
        RefCache& operator = (const RefCache& Other) = delete;

        template <typename T, typename... ArgTypes>
        inline PtrType Get(ArgTypes&&... Args)
        {
            PtrType NewObj = new T(forward<ArgTypes>(Args)...);
            return Get(NewObj);
        }

        inline PtrType Get(const PtrType& Obj)
        {
            lock_guard<mutex> Guard(CacheMutex);
            auto it = Cache.find(Obj);
            if (it != Cache.end()) {
                return (*it);
            }
            Obj->SetInternID_(Arena.size());
            Arena.push_back(Obj);
            Cache.insert(Obj);
            return Obj;
        }

        inline PtrType Find(const PtrType& Obj) const
        {
            lock_guard<mutex> Guard(CacheMutex);
            auto it = Cache.find(Obj);
            if (it == Cache.end()) {
                return PtrType::NullPtr;
            } else {
                return (*it);
            }
        }

        inline PtrType GetByID(u64 ID) const
        {
            lock_guard<mutex> Guard(CacheMutex);
            if (ID >= Arena.size()) {
                return PtrType::NullPtr;
            }
            return Arena[ID];
        }

        inline u64 Size() const
        {
            lock_guard<mutex> Guard(CacheMutex);
            return Arena.size();
        }
    };

} /* end namespace PAV */

#endif /* PAV_CONTAINERS_REFCACHE_HPP_ */

//
// RefCache.hpp ends here
