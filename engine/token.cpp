// Copyright 2014 Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "engine/token.hpp"

#include <fstream>

#include "engine/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;


namespace {


/// Characters that can appear in a token.
static const char token_alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789";


/// Number of valid characters in token_alphabet.
static const unsigned int alphabet_size = sizeof(token_alphabet) - 1;


/// Largest multiple of alphabet_size that fits in a byte.
///
/// Random bytes at or above this limit are discarded so that all the
/// characters of the alphabet are equally likely.
static const unsigned int byte_limit = 256 - (256 % alphabet_size);


}  // anonymous namespace


/// Generates a random token out of the system's random number generator.
///
/// \param length The number of characters of the token.
///
/// \return A string of ASCII letters and digits.
///
/// \throw engine::error If the random source cannot be read.
std::string
engine::create_token(const std::size_t length)
{
    return create_token(length, fs::path("/dev/urandom"));
}


/// Generates a random token out of a source of random bytes.
///
/// \param length The number of characters of the token.
/// \param source Path to the file providing random bytes.
///
/// \return A string of ASCII letters and digits.
///
/// \throw engine::error If the random source cannot be read.
std::string
engine::create_token(const std::size_t length, const fs::path& source)
{
    PRE(length > 0);

    std::ifstream input(source.c_str(), std::ios::in | std::ios::binary);
    if (!input)
        throw engine::error(F("Cannot open random source %s") % source);

    std::string token;
    token.reserve(length);
    while (token.length() < length) {
        char byte;
        if (!input.get(byte))
            throw engine::error(F("Random source %s exhausted") % source);

        const unsigned int value = static_cast< unsigned char >(byte);
        if (value < byte_limit)
            token += token_alphabet[value % alphabet_size];
    }
    INV(token.length() == length);
    return token;
}
