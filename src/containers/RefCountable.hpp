// RefCountable.hpp ---
//
// Filename: RefCountable.hpp
// Author: Abhishek Udupa
// Created: Wed Feb 15 19:34:02 2015 (-0500)
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

// Basic ref countable type. The count is atomic so that interned
// terms can be handed out to independent verification tasks
// running on different threads.

#if !defined PAV_CONTAINERS_REFCOUNTABLE_HPP_
#define PAV_CONTAINERS_REFCOUNTABLE_HPP_

#include <atomic>

#include "../common/PAVFwdDecls.hpp"

namespace PAV {

    class RefCountable
    {
    private:
        mutable atomic<i64> RefCount_;

    public:
        inline RefCountable()
            : RefCount_((i64)0)
        {
            // Nothing here
        }

        inline RefCountable(const RefCountable& Other)
            : RefCount_((i64)0)
        {
            // Nothing here
        }

        virtual ~RefCountable()
        {
            // Nothing here
        }

        inline void IncRef_() const
        {
            RefCount_.fetch_add((i64)1, memory_order_relaxed);
        }

        inline void DecRef_() const
        {
            if (RefCount_.fetch_sub((i64)1, memory_order_acq_rel) <= (i64)1) {
                delete this;
            }
        }

        inline i64 GetRefCnt_() const
        {
            return RefCount_.load(memory_order_acquire);
        }
    };

} /* end namespace */

#endif /* PAV_CONTAINERS_REFCOUNTABLE_HPP_ */

//
// RefCountable.hpp ends here
