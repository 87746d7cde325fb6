// EquivTypes.cpp ---
//
// Filename: EquivTypes.cpp
// Author: Abhishek Udupa
// Created: Tue Apr 10 21:12:36 2015 (-0400)
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

#include <algorithm>
#include <iterator>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "EquivTypes.hpp"

namespace PAV {
    namespace Equiv {

        Witness::Witness()
            : HasStatePair(false), SetKind(ActionSetKindT::None)
        {
            // Nothing here
        }

        Witness::Witness(const TraceT& Trace)
            : Trace(Trace), HasStatePair(false), SetKind(ActionSetKindT::None)
        {
            // Nothing here
        }

        Witness::Witness(const Witness& Other)
            : Trace(Other.Trace), HasStatePair(Other.HasStatePair),
              LeftState(Other.LeftState), RightState(Other.RightState),
              SetKind(Other.SetKind), ActionSet(Other.ActionSet)
        {
            // Nothing here
        }

        Witness::~Witness()
        {
            // Nothing here
        }

        Witness& Witness::operator = (const Witness& Other)
        {
            if (&Other == this) {
                return *this;
            }
            Trace = Other.Trace;
            HasStatePair = Other.HasStatePair;
            LeftState = Other.LeftState;
            RightState = Other.RightState;
            SetKind = Other.SetKind;
            ActionSet = Other.ActionSet;
            return *this;
        }

        void Witness::SetStatePair(const string& Left, const string& Right)
        {
            HasStatePair = true;
            LeftState = Left;
            RightState = Right;
        }

        void Witness::SetActionSet(ActionSetKindT Kind, const set<Action>& Actions)
        {
            SetKind = Kind;
            ActionSet = Actions;
        }

        string Witness::ToString() const
        {
            ostringstream sstr;
            sstr << "trace <" << TraceToString(Trace) << ">";
            if (HasStatePair) {
                sstr << ", states (" << LeftState << ", " << RightState << ")";
            }
            switch (SetKind) {
            case ActionSetKindT::None:
                break;
            case ActionSetKindT::Refusal:
                sstr << ", refusal {" << boost::algorithm::join(ActionSet, ", ") << "}";
                break;
            case ActionSetKindT::Acceptance:
                sstr << ", acceptance {" << boost::algorithm::join(ActionSet, ", ") << "}";
                break;
            }
            return sstr.str();
        }

        EquivalenceResult::EquivalenceResult()
            : Verdict(VerdictT::Inconclusive), HasWitness(false)
        {
            // Nothing here
        }

        EquivalenceResult::EquivalenceResult(VerdictT Verdict, const string& Message)
            : Verdict(Verdict), HasWitness(false), Message(Message)
        {
            // Nothing here
        }

        EquivalenceResult::EquivalenceResult(VerdictT Verdict, const Witness& TheWitness,
                                             const string& Message)
            : Verdict(Verdict), HasWitness(true), TheWitness(TheWitness),
              Message(Message)
        {
            // Nothing here
        }

        EquivalenceResult::EquivalenceResult(const EquivalenceResult& Other)
            : Verdict(Other.Verdict), HasWitness(Other.HasWitness),
              TheWitness(Other.TheWitness), Message(Other.Message)
        {
            // Nothing here
        }

        EquivalenceResult::~EquivalenceResult()
        {
            // Nothing here
        }

        EquivalenceResult& EquivalenceResult::operator = (const EquivalenceResult& Other)
        {
            if (&Other == this) {
                return *this;
            }
            Verdict = Other.Verdict;
            HasWitness = Other.HasWitness;
            TheWitness = Other.TheWitness;
            Message = Other.Message;
            return *this;
        }

        bool EquivalenceResult::IsEquivalent() const
        {
            return (Verdict == VerdictT::Equivalent);
        }

        bool EquivalenceResult::IsNotEquivalent() const
        {
            return (Verdict == VerdictT::NotEquivalent);
        }

        bool EquivalenceResult::IsInconclusive() const
        {
            return (Verdict == VerdictT::Inconclusive);
        }

        string EquivalenceResult::ToString() const
        {
            ostringstream sstr;
            sstr << VerdictToString(Verdict);
            if (Message != "") {
                sstr << ": " << Message;
            }
            if (HasWitness) {
                sstr << " [witness: " << TheWitness.ToString() << "]";
            }
            return sstr.str();
        }

        const u32 EquivalenceOptionsT::DefaultMaxDepth = 10;
        const u64 EquivalenceOptionsT::DefaultMaxStates = 100000;

        EquivalenceOptionsT::EquivalenceOptionsT()
            : Model(SemanticModelT::CCS), MaxDepth(DefaultMaxDepth),
              MaxStates(DefaultMaxStates)
        {
            // Nothing here
        }

        EquivalenceOptionsT::EquivalenceOptionsT(const EquivalenceOptionsT& Other)
            : Model(Other.Model), MaxDepth(Other.MaxDepth), MaxStates(Other.MaxStates),
              SyncAlphabet(Other.SyncAlphabet), CommFunction(Other.CommFunction)
        {
            // Nothing here
        }

        EquivalenceOptionsT::~EquivalenceOptionsT()
        {
            // Nothing here
        }

        EquivalenceOptionsT& EquivalenceOptionsT::operator = (const EquivalenceOptionsT& Other)
        {
            if (&Other == this) {
                return *this;
            }
            Model = Other.Model;
            MaxDepth = Other.MaxDepth;
            MaxStates = Other.MaxStates;
            SyncAlphabet = Other.SyncAlphabet;
            CommFunction = Other.CommFunction;
            return *this;
        }

        Sem::SemanticOptionsT EquivalenceOptionsT::GetSemanticOptions() const
        {
            Sem::SemanticOptionsT Retval;
            Retval.SyncAlphabet = SyncAlphabet;
            Retval.CommFunction = CommFunction;
            return Retval;
        }

        void EquivalenceOptionsT::Validate() const
        {
            if (MaxDepth == 0) {
                throw ConfigurationError((string)"The exploration depth bound must be " +
                                         "positive.\nIn call to " + __FUNCTION__ + " at " +
                                         __FILE__ + ":" + to_string(__LINE__));
            }
            if (MaxStates == 0) {
                throw ConfigurationError((string)"The state ceiling must be positive.\n" +
                                         "In call to " + __FUNCTION__ + " at " + __FILE__ +
                                         ":" + to_string(__LINE__));
            }
            GetSemanticOptions().Validate(Model);
        }

        ActionSetFamilyT MinimalSets(const ActionSetFamilyT& Family)
        {
            ActionSetFamilyT Retval;
            for (auto const& Candidate : Family) {
                bool Minimal = true;
                for (auto const& Other : Family) {
                    if (Other.size() < Candidate.size() &&
                        includes(Candidate.begin(), Candidate.end(),
                                 Other.begin(), Other.end())) {
                        Minimal = false;
                        break;
                    }
                }
                if (Minimal) {
                    Retval.insert(Candidate);
                }
            }
            return Retval;
        }

        ActionSetFamilyT MaximalSets(const ActionSetFamilyT& Family)
        {
            ActionSetFamilyT Retval;
            for (auto const& Candidate : Family) {
                bool Maximal = true;
                for (auto const& Other : Family) {
                    if (Other.size() > Candidate.size() &&
                        includes(Other.begin(), Other.end(),
                                 Candidate.begin(), Candidate.end())) {
                        Maximal = false;
                        break;
                    }
                }
                if (Maximal) {
                    Retval.insert(Candidate);
                }
            }
            return Retval;
        }

        set<Action> ComplementSet(const set<Action>& Alphabet, const set<Action>& Actions)
        {
            set<Action> Retval;
            set_difference(Alphabet.begin(), Alphabet.end(), Actions.begin(), Actions.end(),
                           inserter(Retval, Retval.begin()));
            return Retval;
        }

        bool IsCovered(const set<Action>& Actions, const ActionSetFamilyT& Family)
        {
            for (auto const& Member : Family) {
                if (includes(Member.begin(), Member.end(), Actions.begin(), Actions.end())) {
                    return true;
                }
            }
            return false;
        }

        string VerdictToString(VerdictT Verdict)
        {
            switch (Verdict) {
            case VerdictT::Equivalent:
                return "Equivalent";
            case VerdictT::NotEquivalent:
                return "NotEquivalent";
            case VerdictT::Inconclusive:
                return "Inconclusive";
            }
            return "Unknown";
        }

        string EquivalenceKindToString(EquivalenceKindT Kind)
        {
            switch (Kind) {
            case EquivalenceKindT::Trace:
                return "Trace";
            case EquivalenceKindT::StrongBisimulation:
                return "StrongBisimulation";
            case EquivalenceKindT::WeakBisimulation:
                return "WeakBisimulation";
            case EquivalenceKindT::Testing:
                return "Testing";
            case EquivalenceKindT::MayTesting:
                return "MayTesting";
            case EquivalenceKindT::MustTesting:
                return "MustTesting";
            case EquivalenceKindT::Failures:
                return "Failures";
            }
            return "Unknown";
        }

        EquivalenceKindT EquivalenceKindFromString(const string& KindName)
        {
            static const vector<pair<string, EquivalenceKindT>> KindNames =
                {
                    { "Trace", EquivalenceKindT::Trace },
                    { "StrongBisimulation", EquivalenceKindT::StrongBisimulation },
                    { "Strong", EquivalenceKindT::StrongBisimulation },
                    { "WeakBisimulation", EquivalenceKindT::WeakBisimulation },
                    { "Weak", EquivalenceKindT::WeakBisimulation },
                    { "Testing", EquivalenceKindT::Testing },
                    { "MayTesting", EquivalenceKindT::MayTesting },
                    { "May", EquivalenceKindT::MayTesting },
                    { "MustTesting", EquivalenceKindT::MustTesting },
                    { "Must", EquivalenceKindT::MustTesting },
                    { "Failures", EquivalenceKindT::Failures }
                };

            for (auto const& KindEntry : KindNames) {
                if (boost::algorithm::iequals(KindName, KindEntry.first)) {
                    return KindEntry.second;
                }
            }
            throw PAVError((string)"Unknown equivalence kind \"" + KindName + "\".\n" +
                           "In call to " + __FUNCTION__ + " at " + __FILE__ + ":" +
                           to_string(__LINE__));
        }

        string TraceToString(const TraceT& Trace)
        {
            return boost::algorithm::join(Trace, ".");
        }

        ostream& operator << (ostream& Out, VerdictT Verdict)
        {
            Out << VerdictToString(Verdict);
            return Out;
        }

        ostream& operator << (ostream& Out, EquivalenceKindT Kind)
        {
            Out << EquivalenceKindToString(Kind);
            return Out;
        }

        ostream& operator << (ostream& Out, const Witness& TheWitness)
        {
            Out << TheWitness.ToString();
            return Out;
        }

        ostream& operator << (ostream& Out, const EquivalenceResult& Result)
        {
            Out << Result.ToString();
            return Out;
        }

    } /* end namespace Equiv */
} /* end namespace PAV */

//
// EquivTypes.cpp ends here
