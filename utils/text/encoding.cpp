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

#include "utils/text/encoding.hpp"

extern "C" {
#include <stdint.h>
}

#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace text = utils::text;

using utils::none;
using utils::optional;


namespace {


/// Code points for the 0x80-0x9F range of Windows-1252.
///
/// A zero entry denotes a byte that is not defined in the code page.
static const uint32_t cp1252_high_table[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};


/// Appends the UTF-8 encoding of a code point to a string.
///
/// \param code_point The code point to encode; must be in the BMP.
/// \param [in,out] output The string to append the encoded bytes to.
static void
append_utf8(const uint32_t code_point, std::string& output)
{
    PRE(code_point <= 0xFFFF);
    if (code_point < 0x80) {
        output += static_cast< char >(code_point);
    } else if (code_point < 0x800) {
        output += static_cast< char >(0xC0 | (code_point >> 6));
        output += static_cast< char >(0x80 | (code_point & 0x3F));
    } else {
        output += static_cast< char >(0xE0 | (code_point >> 12));
        output += static_cast< char >(0x80 | ((code_point >> 6) & 0x3F));
        output += static_cast< char >(0x80 | (code_point & 0x3F));
    }
}


/// Checks if a byte is a UTF-8 continuation byte.
///
/// \param byte The byte to check.
///
/// \return True if the byte has the 10xxxxxx form.
static bool
is_continuation(const unsigned char byte)
{
    return (byte & 0xC0) == 0x80;
}


}  // anonymous namespace


/// Returns the canonical name of an encoding.
///
/// \param type The encoding to name.
///
/// \return A name such as "utf-8" or "windows-1252".
std::string
text::encoding_name(const encoding type)
{
    switch (type) {
    case encoding_utf8: return "utf-8";
    case encoding_cp1252: return "windows-1252";
    }
    UNREACHABLE;
}


/// Validates that a sequence of bytes is well-formed UTF-8.
///
/// Overlong forms, encoded surrogates and code points beyond U+10FFFF are
/// rejected.
///
/// \param raw The bytes to validate.
///
/// \return The input if it is valid UTF-8; none otherwise.
optional< std::string >
text::decode_utf8(const std::string& raw)
{
    std::string::size_type pos = 0;
    while (pos < raw.length()) {
        const unsigned char lead = static_cast< unsigned char >(raw[pos]);

        std::string::size_type length;
        uint32_t code_point;
        uint32_t minimum;
        if (lead < 0x80) {
            ++pos;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
            minimum = 0x10000;
        } else {
            return none;
        }

        if (pos + length > raw.length())
            return none;
        for (std::string::size_type i = 1; i < length; ++i) {
            const unsigned char byte = static_cast< unsigned char >(
                raw[pos + i]);
            if (!is_continuation(byte))
                return none;
            code_point = (code_point << 6) | (byte & 0x3F);
        }

        if (code_point < minimum || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF))
            return none;
        pos += length;
    }

    return utils::make_optional(raw);
}


/// Decodes a sequence of Windows-1252 bytes into UTF-8.
///
/// \param raw The bytes to decode.
///
/// \return The UTF-8 representation of the input, or none if the input
/// contains bytes that are undefined in the code page (0x81, 0x8D, 0x8F, 0x90
/// and 0x9D).
optional< std::string >
text::decode_cp1252(const std::string& raw)
{
    std::string output;
    output.reserve(raw.length());
    for (std::string::const_iterator iter = raw.begin(); iter != raw.end();
         ++iter) {
        const unsigned char byte = static_cast< unsigned char >(*iter);
        if (byte < 0x80) {
            output += *iter;
        } else if (byte < 0xA0) {
            const uint32_t code_point = cp1252_high_table[byte - 0x80];
            if (code_point == 0)
                return none;
            append_utf8(code_point, output);
        } else {
            append_utf8(byte, output);
        }
    }
    return utils::make_optional(output);
}
