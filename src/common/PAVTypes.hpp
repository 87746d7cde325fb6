// PAVTypes.hpp ---
//
// Filename: PAVTypes.hpp
// Author: Abhishek Udupa
// Created: Mon Feb  1 09:00:00 2015 (-0500)
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

// Common types used throughout the verifier

#if !defined PAV_COMMON_PAVTYPES_HPP_
#define PAV_COMMON_PAVTYPES_HPP_

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <string>
#include <inttypes.h>
#include <exception>
#include <functional>

#ifndef BOOST_SYSTEM_NO_DEPRECATED
#define BOOST_SYSTEM_NO_DEPRECATED 1
#endif

using namespace std;

namespace PAV {
typedef int8_t i08;

typedef uint8_t u08;
typedef int16_t i16;
typedef uint16_t u16;
typedef int32_t i32;
typedef uint32_t u32;
typedef int64_t i64;
#ifdef __APPLE__
typedef size_t u64;
#else
typedef uint64_t u64;
#endif

class InternalError : public exception
{
private:
    string ErrorMsg;

public:

    inline InternalError(const string& ErrorMsg)
        : ErrorMsg((string)"InternalError: " + ErrorMsg) {}
    inline virtual ~InternalError() throw() {}
    inline virtual const char* what() const throw() override { return ErrorMsg.c_str(); }
};

// Malformed input: unknown model or equivalence names, unguarded
// recursion, free variables handed to the checker and so on
class PAVError : public exception
{
private:
    string ErrorMsg;

public:
    inline PAVError(const string& ErrorMsg)
        : ErrorMsg(ErrorMsg)
    {
        // Nothing here
    }

    inline virtual ~PAVError() throw ()
    {
        // Nothing here
    }

    inline virtual const char* what() const throw() override { return ErrorMsg.c_str(); }
};

// Structural inconsistencies in a semantic configuration,
// always raised before any exploration begins
class ConfigurationError : public PAVError
{
public:
    inline ConfigurationError(const string& ErrorMsg)
        : PAVError((string)"ConfigurationError: " + ErrorMsg)
    {
        // Nothing here
    }

    inline virtual ~ConfigurationError() throw ()
    {
        // Nothing here
    }
};

// The state space grew beyond the configured ceiling.
// This is "gave up", never "not equivalent"
class ExplorationLimitException : public PAVError
{
private:
    u64 Limit;
    u64 NumStatesSeen;

public:
    inline ExplorationLimitException(const string& ErrorMsg, u64 Limit,
                                     u64 NumStatesSeen)
        : PAVError(ErrorMsg), Limit(Limit), NumStatesSeen(NumStatesSeen)
    {
        // Nothing here
    }

    inline virtual ~ExplorationLimitException() throw ()
    {
        // Nothing here
    }

    inline u64 GetLimit() const { return Limit; }
    inline u64 GetNumStatesSeen() const { return NumStatesSeen; }
};

} /* end namespace PAV */

#endif /* PAV_COMMON_PAVTYPES_HPP_ */

//
// PAVTypes.hpp ends here
