// Terms.hpp ---
//
// Filename: Terms.hpp
// Author: Abhishek Udupa
// Created: Mon Feb 23 16:59:37 2015 (-0500)
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

// Classes for process terms.
// Terms form a closed family tagged by TermKind. They are
// immutable and are only ever created through a TermMgr, which
// interns them by canonical form.

#if !defined PAV_TERMS_TERMS_HPP_
#define PAV_TERMS_TERMS_HPP_

#include <unordered_set>
#include <boost/functional/hash.hpp>

#include "../common/PAVFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"

namespace PAV {
    namespace Terms {

        typedef unordered_set<Transition, TransitionHasher> TransitionSetT;

        // Comparators for use with containers
        class TermPtrHasher
        {
        public:
            inline u64 operator () (const TermBase* Term) const;
        };

        class TermPtrEquals
        {
        public:
            inline bool operator () (const TermBase* Term1, const TermBase* Term2) const;
        };

        class TermSPtrHasher
        {
        public:
            inline u64 operator () (const TermRef& Term) const;
        };

        class TermSPtrEquals
        {
        public:
            inline bool operator () (const TermRef& Term1, const TermRef& Term2) const;
        };

        // Interning is keyed on the canonical textual form
        class TermCanonicalHasher
        {
        public:
            inline u64 operator () (const TermRef& Term) const;
        };

        class TermCanonicalEquals
        {
        public:
            inline bool operator () (const TermRef& Term1, const TermRef& Term2) const;
        };

        class TermBase : public RefCountable
        {
            friend class TermMgr;

        private:
            TermMgr* Mgr;
            TermKind Kind;
            mutable u64 InternID;

        protected:
            string Canonical;
            u64 HashCode;

            // Called by the subclass constructors once the
            // canonical form is known
            inline void Finalize(const string& CanonicalForm);

        public:
            TermBase(TermMgr* Mgr, TermKind Kind);
            virtual ~TermBase();

            inline TermMgr* GetMgr() const;
            inline TermKind GetKind() const;
            inline u64 GetID() const;
            inline u64 Hash() const;
            inline const string& ToString() const;

            // Structural (syntactic) equality
            bool Equals(const TermBase* Other) const;
            inline bool Equals(const TermRef& Other) const;

            // Structural total order, consistent with Equals
            virtual i32 Compare(const TermBase* Other) const = 0;
            virtual void Accept(TermVisitorBase* Visitor) const = 0;
            // Replaces every free occurrence of VarName by Replacement
            virtual TermRef Substitute(const string& VarName,
                                       const TermRef& Replacement) const = 0;

            // The model agnostic one step transitions. Parallel
            // composition is deliberately inert here: its semantics
            // is only available through an SOS engine
            TransitionSetT Derive() const;

            void SetInternID_(u64 ID) const;

            // Downcasts
            template <typename T>
            inline const T* As() const;

            template <typename T>
            inline const T* SAs() const;

            template <typename T>
            inline bool Is() const;
        };

        class StopTerm : public TermBase
        {
        public:
            StopTerm(TermMgr* Mgr);
            virtual ~StopTerm();

            virtual i32 Compare(const TermBase* Other) const override;
            virtual void Accept(TermVisitorBase* Visitor) const override;
            virtual TermRef Substitute(const string& VarName,
                                       const TermRef& Replacement) const override;
        };

        class VarTerm : public TermBase
        {
        private:
            string VarName;

        public:
            VarTerm(TermMgr* Mgr, const string& VarName);
            virtual ~VarTerm();

            inline const string& GetVarName() const;

            virtual i32 Compare(const TermBase* Other) const override;
            virtual void Accept(TermVisitorBase* Visitor) const override;
            virtual TermRef Substitute(const string& VarName,
                                       const TermRef& Replacement) const override;
        };

        class PrefixTerm : public TermBase
        {
        private:
            Action PrefixAction;
            TermRef Continuation;

        public:
            PrefixTerm(TermMgr* Mgr, const Action& PrefixAction,
                       const TermRef& Continuation);
            virtual ~PrefixTerm();

            inline const Action& GetAction() const;
            inline const TermRef& GetContinuation() const;

            virtual i32 Compare(const TermBase* Other) const override;
            virtual void Accept(TermVisitorBase* Visitor) const override;
            virtual TermRef Substitute(const string& VarName,
                                       const TermRef& Replacement) const override;
        };

        // Common base for the two binary operators
        class BinaryTerm : public TermBase
        {
        private:
            TermRef Left;
            TermRef Right;

        protected:
            i32 CompareInternal(const BinaryTerm* Other) const;

        public:
            BinaryTerm(TermMgr* Mgr, TermKind Kind,
                       const TermRef& Left, const TermRef& Right);
            virtual ~BinaryTerm();

            inline const TermRef& GetLeft() const;
            inline const TermRef& GetRight() const;
        };

        class ChoiceTerm : public BinaryTerm
        {
        public:
            ChoiceTerm(TermMgr* Mgr, const TermRef& Left, const TermRef& Right);
            virtual ~ChoiceTerm();

            virtual i32 Compare(const TermBase* Other) const override;
            virtual void Accept(TermVisitorBase* Visitor) const override;
            virtual TermRef Substitute(const string& VarName,
                                       const TermRef& Replacement) const override;

            // Lifts the transitions of the two branches to transitions
            // of this choice. Any step of a branch, silent or not,
            // discards the alternative.
            void LiftBranchTransitions(const TransitionSetT& LeftTransitions,
                                       const TransitionSetT& RightTransitions,
                                       TransitionSetT& Result) const;
            // As above, but a silent step keeps the alternative, as
            // in an external choice. Targets of silent steps are built
            // with TermMgr::MakeNormalizedChoice.
            void LiftExternalBranchTransitions(const TransitionSetT& LeftTransitions,
                                               const TransitionSetT& RightTransitions,
                                               TransitionSetT& Result) const;
        };

        class ParallelTerm : public BinaryTerm
        {
        public:
            ParallelTerm(TermMgr* Mgr, const TermRef& Left, const TermRef& Right);
            virtual ~ParallelTerm();

            virtual i32 Compare(const TermBase* Other) const override;
            virtual void Accept(TermVisitorBase* Visitor) const override;
            virtual TermRef Substitute(const string& VarName,
                                       const TermRef& Replacement) const override;
        };

        // rec X.P: stored unexpanded, unfolded on demand
        class RecTerm : public TermBase
        {
        private:
            string VarName;
            TermRef Definition;

        public:
            RecTerm(TermMgr* Mgr, const string& VarName, const TermRef& Definition);
            virtual ~RecTerm();

            inline const string& GetVarName() const;
            inline const TermRef& GetDefinition() const;

            // Definition[VarName := this]
            TermRef Unfold() const;

            virtual i32 Compare(const TermBase* Other) const override;
            virtual void Accept(TermVisitorBase* Visitor) const override;
            virtual TermRef Substitute(const string& VarName,
                                       const TermRef& Replacement) const override;
        };

        // Visitors must handle every kind of term
        class TermVisitorBase
        {
        public:
            TermVisitorBase();
            virtual ~TermVisitorBase();

            virtual void VisitStopTerm(const StopTerm* Term) = 0;
            virtual void VisitVarTerm(const VarTerm* Term) = 0;
            virtual void VisitPrefixTerm(const PrefixTerm* Term) = 0;
            virtual void VisitChoiceTerm(const ChoiceTerm* Term) = 0;
            virtual void VisitParallelTerm(const ParallelTerm* Term) = 0;
            virtual void VisitRecTerm(const RecTerm* Term) = 0;
        };

        extern ostream& operator << (ostream& Out, const TermRef& Term);
        extern string TermKindToString(TermKind Kind);

        // Implementation of inline methods

        inline u64 TermPtrHasher::operator () (const TermBase* Term) const
        {
            return Term->Hash();
        }

        inline bool TermPtrEquals::operator () (const TermBase* Term1,
                                                const TermBase* Term2) const
        {
            return Term1->Equals(Term2);
        }

        inline u64 TermSPtrHasher::operator () (const TermRef& Term) const
        {
            return Term->Hash();
        }

        inline bool TermSPtrEquals::operator () (const TermRef& Term1,
                                                 const TermRef& Term2) const
        {
            return Term1->Equals(Term2);
        }

        inline u64 TermCanonicalHasher::operator () (const TermRef& Term) const
        {
            return Term->Hash();
        }

        inline bool TermCanonicalEquals::operator () (const TermRef& Term1,
                                                      const TermRef& Term2) const
        {
            return (Term1->Hash() == Term2->Hash() &&
                    Term1->ToString() == Term2->ToString());
        }

        inline void TermBase::Finalize(const string& CanonicalForm)
        {
            Canonical = CanonicalForm;
            HashCode = boost::hash_value(Canonical);
        }

        inline TermMgr* TermBase::GetMgr() const
        {
            return Mgr;
        }

        inline TermKind TermBase::GetKind() const
        {
            return Kind;
        }

        inline u64 TermBase::GetID() const
        {
            return InternID;
        }

        inline u64 TermBase::Hash() const
        {
            return HashCode;
        }

        inline const string& TermBase::ToString() const
        {
            return Canonical;
        }

        inline bool TermBase::Equals(const TermRef& Other) const
        {
            return Equals(Other.GetPtr_());
        }

        template <typename T>
        inline const T* TermBase::As() const
        {
            return dynamic_cast<const T*>(this);
        }

        template <typename T>
        inline const T* TermBase::SAs() const
        {
            return static_cast<const T*>(this);
        }

        template <typename T>
        inline bool TermBase::Is() const
        {
            return (dynamic_cast<const T*>(this) != nullptr);
        }

        inline const string& VarTerm::GetVarName() const
        {
            return VarName;
        }

        inline const Action& PrefixTerm::GetAction() const
        {
            return PrefixAction;
        }

        inline const TermRef& PrefixTerm::GetContinuation() const
        {
            return Continuation;
        }

        inline const TermRef& BinaryTerm::GetLeft() const
        {
            return Left;
        }

        inline const TermRef& BinaryTerm::GetRight() const
        {
            return Right;
        }

        inline const string& RecTerm::GetVarName() const
        {
            return VarName;
        }

        inline const TermRef& RecTerm::GetDefinition() const
        {
            return Definition;
        }

    } /* end namespace Terms */
} /* end namespace PAV */

#endif /* PAV_TERMS_TERMS_HPP_ */

//
// Terms.hpp ends here
