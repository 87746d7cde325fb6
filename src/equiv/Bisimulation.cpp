// Bisimulation.cpp ---
//
// Filename: Bisimulation.cpp
// Author: Abhishek Udupa
// Created: Mon Apr 25 09:54:42 2015 (-0400)
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

#include <map>

#include "../terms/Actions.hpp"
#include "../lts/LabelledTS.hpp"
#include "../lts/LTSAnalyses.hpp"
#include "../utils/LogManager.hpp"

#include "Bisimulation.hpp"

namespace PAV {
    namespace Equiv {

        using namespace LTS;

        namespace Detail {

            typedef set<pair<Action, u32>> SignatureT;

            static inline SignatureT ComputeSignature(const GraphT& Graph, u32 State,
                                                      const vector<u32>& Blocks)
            {
                SignatureT Retval;
                for (auto const& Edge : Graph[State]) {
                    Retval.insert(make_pair(Edge.first, Blocks[Edge.second]));
                }
                return Retval;
            }

            vector<u32> RefinePartition(const GraphT& Graph, const string& LogTag)
            {
                const u32 NumStates = Graph.size();
                vector<u32> Blocks(NumStates, 0);
                u32 NumBlocks = (NumStates > 0 ? 1 : 0);
                u32 Round = 0;

                while (true) {
                    ++Round;
                    // The old block is part of the key, so blocks only split
                    map<pair<u32, SignatureT>, u32> SigToBlock;
                    vector<u32> NewBlocks(NumStates);

                    for (u32 State = 0; State < NumStates; ++State) {
                        auto Key = make_pair(Blocks[State],
                                             ComputeSignature(Graph, State, Blocks));
                        auto it = SigToBlock.find(Key);
                        if (it == SigToBlock.end()) {
                            u32 NewBlock = SigToBlock.size();
                            SigToBlock[Key] = NewBlock;
                            NewBlocks[State] = NewBlock;
                        } else {
                            NewBlocks[State] = it->second;
                        }
                    }

                    u32 NewNumBlocks = SigToBlock.size();
                    Blocks.swap(NewBlocks);

                    // The last round only confirms the partition
                    PAV_LOG_COND_SHORT(LogTag,
                                       Out_ << "[Refinement] Round " << Round << ": "
                                            << NumBlocks << " blocks split into "
                                            << NewNumBlocks << endl;,
                                       NewNumBlocks != NumBlocks);

                    if (NewNumBlocks == NumBlocks) {
                        break;
                    }
                    NumBlocks = NewNumBlocks;
                }

                PAV_LOG_FULL(LogTag,
                             Out_ << "Stable partition after " << Round << " rounds:" << endl;
                             for (u32 State = 0; State < NumStates; ++State) {
                                 Out_ << "    state " << State << " -> block "
                                      << Blocks[State] << endl;
                             });

                return Blocks;
            }

        } /* end namespace Detail */

        BisimulationChecker::BisimulationChecker()
        {
            // Nothing here
        }

        BisimulationChecker::~BisimulationChecker()
        {
            // Nothing here
        }

        void BisimulationChecker::AppendGraph(const LabelledTS* TheLTS, u32 Offset,
                                              bool Saturate, Detail::GraphT& Graph)
        {
            const u32 NumStates = TheLTS->GetNumStates();
            Graph.resize(Offset + NumStates);

            for (StateID State = 0; State < NumStates; ++State) {
                auto& Edges = Graph[Offset + State];
                if (!Saturate) {
                    for (auto Edge : TheLTS->GetTransitions(State)) {
                        Edges.push_back(make_pair(Edge->GetAction(),
                                                  Offset + Edge->GetTarget()));
                    }
                    continue;
                }

                auto Closure = TauClosure(TheLTS, State);
                for (auto Target : Closure) {
                    Edges.push_back(make_pair(Terms::TauAction, Offset + Target));
                }
                for (auto const& TheAction : VisibleInitials(TheLTS, Closure)) {
                    for (auto Target : WeakAfter(TheLTS, Closure, TheAction)) {
                        Edges.push_back(make_pair(TheAction, Offset + Target));
                    }
                }

                PAV_LOG_SHORT("Bisim.Weak",
                              Out_ << "[Saturation] state " << State << " ("
                                   << TheLTS->GetName(State) << "): " << Edges.size()
                                   << " weak transitions" << endl;);
            }
        }

        vector<u32> BisimulationChecker::ComputeStrongPartition(const LabelledTS* TheLTS)
        {
            Detail::GraphT Graph;
            AppendGraph(TheLTS, 0, false, Graph);
            return Detail::RefinePartition(Graph, "Bisim.Refinement");
        }

        vector<u32> BisimulationChecker::ComputeWeakPartition(const LabelledTS* TheLTS)
        {
            Detail::GraphT Graph;
            AppendGraph(TheLTS, 0, true, Graph);
            return Detail::RefinePartition(Graph, "Bisim.Weak");
        }

        u32 BisimulationChecker::CountBlocks(const vector<u32>& Partition)
        {
            set<u32> Blocks(Partition.begin(), Partition.end());
            return Blocks.size();
        }

        EquivalenceResult BisimulationChecker::Check(const LabelledTS* LTS1,
                                                     const LabelledTS* LTS2, bool Weak)
        {
            Detail::GraphT Graph;
            const u32 Offset = LTS1->GetNumStates();
            AppendGraph(LTS1, 0, Weak, Graph);
            AppendGraph(LTS2, Offset, Weak, Graph);

            auto&& Blocks = Detail::RefinePartition(Graph, (Weak ? "Bisim.Weak" :
                                                            "Bisim.Refinement"));

            auto Init1 = LTS1->GetInitialState();
            auto Init2 = Offset + LTS2->GetInitialState();
            if (Blocks[Init1] == Blocks[Init2]) {
                return EquivalenceResult(VerdictT::Equivalent);
            }

            // The initial states end up with different signatures
            // in the stable partition, report one distinguishing step
            Witness TheWitness;
            TheWitness.SetStatePair(LTS1->GetName(LTS1->GetInitialState()),
                                    LTS2->GetName(LTS2->GetInitialState()));
            auto Sig1 = Detail::ComputeSignature(Graph, Init1, Blocks);
            auto Sig2 = Detail::ComputeSignature(Graph, Init2, Blocks);
            string Message = "the initial states are in different blocks";
            for (auto const& Entry : Sig1) {
                if (Sig2.find(Entry) == Sig2.end()) {
                    Message = "the left initial state has a move on \"" + Entry.first +
                        "\" that the right one cannot match";
                    if (Terms::IsVisible(Entry.first)) {
                        TheWitness.Trace.push_back(Entry.first);
                    }
                    return EquivalenceResult(VerdictT::NotEquivalent, TheWitness, Message);
                }
            }
            for (auto const& Entry : Sig2) {
                if (Sig1.find(Entry) == Sig1.end()) {
                    Message = "the right initial state has a move on \"" + Entry.first +
                        "\" that the left one cannot match";
                    if (Terms::IsVisible(Entry.first)) {
                        TheWitness.Trace.push_back(Entry.first);
                    }
                    break;
                }
            }
            return EquivalenceResult(VerdictT::NotEquivalent, TheWitness, Message);
        }

        EquivalenceResult BisimulationChecker::CheckStrong(const LabelledTS* LTS1,
                                                           const LabelledTS* LTS2) const
        {
            return Check(LTS1, LTS2, false);
        }

        EquivalenceResult BisimulationChecker::CheckWeak(const LabelledTS* LTS1,
                                                         const LabelledTS* LTS2) const
        {
            return Check(LTS1, LTS2, true);
        }

    } /* end namespace Equiv */
} /* end namespace PAV */

//
// Bisimulation.cpp ends here
