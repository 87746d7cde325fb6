// PAVLib.cpp ---
//
// Filename: PAVLib.cpp
// Author: Abhishek Udupa
// Created: Thu May 14 17:44:52 2015 (-0400)
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

#include "../utils/LogManager.hpp"

#include "PAVLib.hpp"

namespace PAV {

PAVLibOptionsT::PAVLibOptionsT()
    : LogFileName(""),
      LogCompressionTechnique(LogFileCompressionTechniqueT::COMPRESS_NONE),
      LoggingOptions(), CheckOptions()
{
    // Nothing here
}

PAVLibOptionsT::~PAVLibOptionsT()
{
    // Nothing here
}

PAVLibOptionsT::PAVLibOptionsT(const PAVLibOptionsT& Other)
    : LogFileName(Other.LogFileName),
      LogCompressionTechnique(Other.LogCompressionTechnique),
      LoggingOptions(Other.LoggingOptions),
      CheckOptions(Other.CheckOptions)
{
    // Nothing here
}

PAVLibOptionsT& PAVLibOptionsT::operator = (const PAVLibOptionsT& Other)
{
    if (&Other == this) {
        return *this;
    }
    LogFileName = Other.LogFileName;
    LogCompressionTechnique = Other.LogCompressionTechnique;
    LoggingOptions = Other.LoggingOptions;
    CheckOptions = Other.CheckOptions;
    return *this;
}

PAVLibOptionsT& PAVLib::PAVLibOptions()
{
    static PAVLibOptionsT PAVLibOptions_;
    return PAVLibOptions_;
}

PAVLib::PAVLib()
{
    // Nothing here
}

void PAVLib::Initialize()
{
    PAVLibOptions() = PAVLibOptionsT();
    Logging::LogManager::Initialize();
}

void PAVLib::Initialize(const PAVLibOptionsT& LibOptions)
{
    for (auto const& OptionName : LibOptions.LoggingOptions) {
        Logging::LogManager::CheckOptionName(OptionName);
    }
    LibOptions.CheckOptions.Validate();

    PAVLibOptions() = LibOptions;
    Logging::LogManager::Initialize(PAVLibOptions().LogFileName,
                                    PAVLibOptions().LogCompressionTechnique);
    Logging::LogManager::EnableLogOptions(PAVLibOptions().LoggingOptions.begin(),
                                          PAVLibOptions().LoggingOptions.end());
}

void PAVLib::Finalize()
{
    Logging::LogManager::Finalize();
}

const PAVLibOptionsT& PAVLib::GetOptions()
{
    return PAVLibOptions();
}

// The library initializer
__attribute__((constructor)) void PAVLibInitialize_()
{
    PAVLib::Initialize();
}

__attribute__((destructor)) void PAVLibFinalize_()
{
    PAVLib::Finalize();
}

} /* end namespace PAV */

//
// PAVLib.cpp ends here
