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

/// \file utils/text/encoding.hpp
/// Detection and decoding of the character encodings of raw files.
///
/// Files are read as raw bytes and decoded into UTF-8 strings.  Only two
/// encodings are recognized: UTF-8, which is always attempted first, and
/// Windows-1252, which is used as a fallback for legacy files.

#if !defined(UTILS_TEXT_ENCODING_HPP)
#define UTILS_TEXT_ENCODING_HPP

#include <string>

#include "utils/optional.hpp"

namespace utils {
namespace text {


/// Character encodings recognized by the decoders.
enum encoding {
    encoding_utf8,
    encoding_cp1252,
};


std::string encoding_name(const encoding);

optional< std::string > decode_utf8(const std::string&);
optional< std::string > decode_cp1252(const std::string&);


}  // namespace text
}  // namespace utils

#endif  // !defined(UTILS_TEXT_ENCODING_HPP)
