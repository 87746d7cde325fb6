// SmartPtr.hpp ---
//
// Filename: SmartPtr.hpp
// Author: Abhishek Udupa
// Created: Thu Feb 22 10:51:33 2015 (-0500)
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

#if !defined PAV_CONTAINERS_SMARTPTR_HPP_
#define PAV_CONTAINERS_SMARTPTR_HPP_

#include <algorithm>

#include "../common/PAVFwdDecls.hpp"

namespace PAV {

    // An intrusive reference counted pointer to an
    // immutable object. T must derive from RefCountable.
    template <typename T>
    class CSmartPtr
    {
    private:
        const T* Ptr_;

        inline i64 Compare_(const T* OtherPtr) const;

    public:
        static const CSmartPtr NullPtr;

        inline CSmartPtr();
        inline CSmartPtr(const CSmartPtr& Other);
        inline CSmartPtr(CSmartPtr&& Other);
        inline CSmartPtr(const T* OtherPtr);
        inline ~CSmartPtr();

        inline CSmartPtr& operator = (CSmartPtr Other);

        inline const T* GetPtr_() const;

        inline const T* operator -> () const;
        inline const T& operator * () const;

        inline bool operator == (const CSmartPtr& Other) const;
        inline bool operator != (const CSmartPtr& Other) const;
        inline bool operator < (const CSmartPtr& Other) const;

        inline bool operator == (const T* OtherPtr) const;
        inline bool operator != (const T* OtherPtr) const;

        inline bool operator ! () const;
        inline bool IsNull_() const;
    };

    template <typename T>
    const CSmartPtr<T> CSmartPtr<T>::NullPtr;

    template <typename T>
    inline i64 CSmartPtr<T>::Compare_(const T* OtherPtr) const
    {
        return (i64)((const char*)Ptr_ - (const char*)OtherPtr);
    }

    template <typename T>
    inline CSmartPtr<T>::CSmartPtr()
        : Ptr_(nullptr)
    {
        // Nothing here
    }

    template <typename T>
    inline CSmartPtr<T>::CSmartPtr(const CSmartPtr<T>& Other)
        : Ptr_(Other.Ptr_)
    {
        if (Ptr_ != nullptr) {
            Ptr_->IncRef_();
        }
    }

    template <typename T>
    inline CSmartPtr<T>::CSmartPtr(CSmartPtr<T>&& Other)
        : CSmartPtr<T>()
    {
        swap(Ptr_, Other.Ptr_);
    }

    template <typename T>
    inline CSmartPtr<T>::CSmartPtr(const T* OtherPtr)
        : Ptr_(OtherPtr)
    {
        if (Ptr_ != nullptr) {
            Ptr_->IncRef_();
        }
    }

    template <typename T>
    inline CSmartPtr<T>::~CSmartPtr()
    {
        if (Ptr_ != nullptr) {
            Ptr_->DecRef_();
        }
        Ptr_ = nullptr;
    }

    template <typename T>
    inline CSmartPtr<T>& CSmartPtr<T>::operator = (CSmartPtr<T> Other)
    {
        swap(Ptr_, Other.Ptr_);
        return (*this);
    }

    template <typename T>
    inline const T* CSmartPtr<T>::GetPtr_() const
    {
        return Ptr_;
    }

    template <typename T>
    inline const T* CSmartPtr<T>::operator -> () const
    {
        return Ptr_;
    }

    template <typename T>
    inline const T& CSmartPtr<T>::operator * () const
    {
        return (*Ptr_);
    }

    template <typename T>
    inline bool CSmartPtr<T>::operator == (const CSmartPtr<T>& Other) const
    {
        return (Compare_(Other.Ptr_) == 0);
    }

    template <typename T>
    inline bool CSmartPtr<T>::operator != (const CSmartPtr<T>& Other) const
    {
        return (Compare_(Other.Ptr_) != 0);
    }

    template <typename T>
    inline bool CSmartPtr<T>::operator < (const CSmartPtr<T>& Other) const
    {
        return (Compare_(Other.Ptr_) < 0);
    }

    template <typename T>
    inline bool CSmartPtr<T>::operator == (const T* OtherPtr) const
    {
        return (Compare_(OtherPtr) == 0);
    }

    template <typename T>
    inline bool CSmartPtr<T>::operator != (const T* OtherPtr) const
    {
        return (Compare_(OtherPtr) != 0);
    }

    template <typename T>
    inline bool CSmartPtr<T>::IsNull_() const
    {
        return (Ptr_ == nullptr);
    }

    template <typename T>
    inline bool CSmartPtr<T>::operator ! () const
    {
        return (IsNull_());
    }

} /* end namespace PAV */

#endif /* PAV_CONTAINERS_SMARTPTR_HPP_ */

//
// SmartPtr.hpp ends here
