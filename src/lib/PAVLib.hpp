// PAVLib.hpp ---
//
// Filename: PAVLib.hpp
// Author: Abhishek Udupa
// Created: Wed May  7 12:27:21 2015 (-0400)
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

#if !defined PAV_LIB_PAVLIB_HPP_
#define PAV_LIB_PAVLIB_HPP_

#include <set>

#include "../common/PAVFwdDecls.hpp"
#include "../equiv/EquivTypes.hpp"

namespace PAV {

class PAVLibOptionsT
{
public:
    string LogFileName;
    LogFileCompressionTechniqueT LogCompressionTechnique;
    set<string> LoggingOptions;
    // Used by the checking functions that are not handed options
    Equiv::EquivalenceOptionsT CheckOptions;

    PAVLibOptionsT();
    virtual ~PAVLibOptionsT();

    PAVLibOptionsT(const PAVLibOptionsT& Other);
    PAVLibOptionsT& operator = (const PAVLibOptionsT& Other);
};

class PAVLib
{
private:
    static PAVLibOptionsT& PAVLibOptions();

    PAVLib();
    PAVLib(const PAVLib& Other) = delete;
    PAVLib(PAVLib&& Other) = delete;

public:
    static void Initialize();
    // Reinitializes logging. All options are validated before any
    // of them takes effect: unknown logging options raise PAVError
    // and inconsistent check options raise ConfigurationError,
    // leaving the library as it was.
    static void Initialize(const PAVLibOptionsT& LibOptions);
    static void Finalize();
    static const PAVLibOptionsT& GetOptions();
};

__attribute__((constructor)) extern void PAVLibInitialize_();
__attribute__((destructor)) extern void PAVLibFinalize_();

} /* end namespace PAV */

#endif /* PAV_LIB_PAVLIB_HPP_ */

//
// PAVLib.hpp ends here
