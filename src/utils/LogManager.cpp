// LogManager.cpp ---
//
// Filename: LogManager.cpp
// Author: Abhishek Udupa
// Created: Tue May 27 21:10:50 2015 (-0400)
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

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "LogManager.hpp"

namespace PAV {
    namespace Logging {

        const map<string, string>& LogManager::LogOptionDescriptions()
        {
            static const map<string, string> LogOptionDescriptions_ =
                {
                    {
                        "Builder.States",
                        "Print each state as it is discovered by the LTS builder."
                    },
                    {
                        "Builder.Transitions",
                        (string)"Print each transition recorded by the LTS builder, " +
                        "along with exploration statistics."
                    },
                    {
                        "Engine.Derivations",
                        (string)"Print the one step transitions derived by the SOS " +
                        "engine for every term it is asked about."
                    },
                    {
                        "Bisim.Refinement",
                        (string)"Print the partition after each round of signature " +
                        "refinement."
                    },
                    {
                        "Bisim.Weak",
                        "Print the saturated (weak) transitions used for weak bisimulation."
                    },
                    {
                        "Trace.Exploration",
                        (string)"Print pairs of state sets visited during bounded trace " +
                        "exploration."
                    },
                    {
                        "Testing.Tests",
                        "Print the tests generated for may/must testing and their outcomes."
                    },
                    {
                        "Failures.Refusals",
                        "Print the refusal families computed per trace."
                    },
                    {
                        "Checker.Verdicts",
                        "Print a summary line for every equivalence or refinement check."
                    },
                    {
                        "PAV.Minimal",
                        (string)"Bare minimal output from the builder, serving only " +
                        "to indicate progress. Available even if the libraries have been " +
                        "built without -DPAV_ENABLE_TRACING_ set."
                    },
                    {
                        "PAV.None",
                        (string)"Turns off ALL tracing options (including PAV.Minimal)."
                    },
                    {
                        "PAV.All",
                        (string)"Turns ON ALL tracing options."
                    }
                };
            return LogOptionDescriptions_;
        }

        unordered_set<string>& LogManager::EnabledLogOptions()
        {
            static unordered_set<string> EnabledLogOptions_;
            return EnabledLogOptions_;
        }

        ostream*& LogManager::LogStream()
        {
            static ostream* LogStream_ = nullptr;
            return LogStream_;
        }

        bool& LogManager::NoLoggingEnabled()
        {
            static bool NoLoggingEnabled_ = false;
            return NoLoggingEnabled_;
        }

        LogManager::LogManager()
        {
            // Nothing here
        }

        void LogManager::CheckOptionName(const string& OptionName)
        {
            if (LogOptionDescriptions().find(OptionName) ==
                LogOptionDescriptions().end()) {
                throw PAVError((string)"Log option \"" + OptionName + "\" is not " +
                               "a recognized log option.\nIn call to " + __FUNCTION__ +
                               " at " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        void LogManager::Initialize(const string& LogStreamName,
                                    LogFileCompressionTechniqueT LogCompressionTechnique)
        {
            Finalize();

            if (LogStreamName == "") {
                LogStream() = &std::cout;
            } else {
                auto LogStreamFileName = LogStreamName;
                auto LocalLogStream = new boost::iostreams::filtering_ostream();
                if (LogCompressionTechnique == LogFileCompressionTechniqueT::COMPRESS_BZIP2) {
                    LocalLogStream->push(boost::iostreams::bzip2_compressor(9));
                    if (!boost::algorithm::ends_with(LogStreamFileName, ".bz2")) {
                        LogStreamFileName = LogStreamFileName + ".bz2";
                    }
                } else if (LogCompressionTechnique == LogFileCompressionTechniqueT::COMPRESS_GZIP) {
                    LocalLogStream->push(boost::iostreams::gzip_compressor(9));
                    if (!boost::algorithm::ends_with(LogStreamFileName, ".gz")) {
                        LogStreamFileName += ".gz";
                    }
                }

                auto OpenFlags = ios_base::out;
                if (LogCompressionTechnique != LogFileCompressionTechniqueT::COMPRESS_NONE) {
                    OpenFlags = OpenFlags | ios_base::binary;
                }

                LocalLogStream->push(boost::iostreams::file_sink(LogStreamFileName, OpenFlags));
                LogStream() = LocalLogStream;
            }
        }

        void LogManager::Finalize()
        {
            if (LogStream() != nullptr && LogStream() != &cout) {
                // Popping the chain flushes the compressor and closes the sink
                auto FilteringStream =
                    static_cast<boost::iostreams::filtering_ostream*>(LogStream());
                FilteringStream->reset();
                delete FilteringStream;
            } else if (LogStream() != nullptr) {
                LogStream()->flush();
            }
            LogStream() = nullptr;
            EnabledLogOptions().clear();
            NoLoggingEnabled() = false;
        }

        ostream& LogManager::GetLogStream()
        {
            if (LogStream() == nullptr) {
                return cout;
            }
            return *(LogStream());
        }

        void LogManager::EnableLogOption(const string& OptionName)
        {
            CheckOptionName(OptionName);

            if (OptionName == "PAV.All") {
                NoLoggingEnabled() = false;
                for (auto const& OptionDesc : LogOptionDescriptions()) {
                    if (OptionDesc.first != "PAV.None") {
                        EnabledLogOptions().insert(OptionDesc.first);
                    }
                }
            } else if (OptionName == "PAV.None") {
                NoLoggingEnabled() = true;
                EnabledLogOptions().clear();
            } else {
                NoLoggingEnabled() = false;
                EnabledLogOptions().insert(OptionName);
            }
        }

        void LogManager::EnableLogOptions(const vector<string>& OptionNames)
        {
            EnableLogOptions(OptionNames.begin(), OptionNames.end());
        }

        void LogManager::DisableLogOption(const string& OptionName)
        {
            CheckOptionName(OptionName);
            EnabledLogOptions().erase(OptionName);
        }

        const unordered_set<string>& LogManager::GetEnabledLogOptions()
        {
            return EnabledLogOptions();
        }

        bool LogManager::IsOptionEnabled(const string& OptionName)
        {
            return (!NoLoggingEnabled() && (EnabledLogOptions().find(OptionName) !=
                                            EnabledLogOptions().end()));
        }

        bool LogManager::IsLoggingDisabled()
        {
            return NoLoggingEnabled();
        }

        string LogManager::GetLogOptions()
        {
            ostringstream sstr;
            sstr << "Available logging options:" << endl;
            for (auto const& Option : LogOptionDescriptions()) {
                sstr << left << setw(24) << setfill(' ') << Option.first
                     << ": " << Option.second << endl;
            }
            return sstr.str();
        }

    } /* end namespace Logging */
} /* end namespace PAV */

//
// LogManager.cpp ends here
