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

#include "utils/text/operations.ipp"

#include "utils/format/macros.hpp"

namespace text = utils::text;


/// Replaces XML special characters from an input string.
///
/// The list of XML special characters is specified here:
///     http://www.w3.org/TR/xml11/#charsets
///
/// \param in The input to quote.
///
/// \return A quoted string without any XML special characters.
std::string
text::escape_xml(const std::string& in)
{
    std::ostringstream quoted;

    for (std::string::const_iterator it = in.begin();
         it != in.end(); ++it) {
        unsigned char c = (unsigned char)*it;
        if (c == '"') {
            quoted << "&quot;";
        } else if (c == '&') {
            quoted << "&amp;";
        } else if (c == '<') {
            quoted << "&lt;";
        } else if (c == '>') {
            quoted << "&gt;";
        } else if (c == '\'') {
            quoted << "&apos;";
        } else if ((c >= 0x01 && c <= 0x08) ||
                   (c >= 0x0B && c <= 0x0C) ||
                   (c >= 0x0E && c <= 0x1F) ||
                   (c == 0x7F)) {
            // Control characters other than tab and line breaks are not valid
            // in HTML text; render them as numeric references.
            quoted << "&#" << static_cast< int >(c) << ";";
        } else {
            quoted << *it;
        }
    }
    return quoted.str();
}


/// Surrounds a string with quotes, escaping the quote itself if needed.
///
/// \param text The string to quote.
/// \param quote The quote character to use.
///
/// \return The quoted string.
std::string
text::quote(const std::string& text, const char quote)
{
    std::ostringstream quoted;
    quoted << quote;

    std::string::size_type start_pos = 0;
    std::string::size_type last_pos = text.find(quote);
    while (last_pos != std::string::npos) {
        quoted << text.substr(start_pos, last_pos - start_pos) << '\\';
        start_pos = last_pos;
        last_pos = text.find(quote, start_pos + 1);
    }
    quoted << text.substr(start_pos);

    quoted << quote;
    return quoted.str();
}


/// Splits a string into different components.
///
/// \param str The string to split.
/// \param delimiter The separator to use to split the words.
///
/// \return The different words in the input string as split by the provided
/// delimiter.
std::vector< std::string >
text::split(const std::string& str, const char delimiter)
{
    std::vector< std::string > words;
    if (!str.empty()) {
        std::string::size_type pos = str.find(delimiter);
        words.push_back(str.substr(0, pos));
        while (pos != std::string::npos) {
            ++pos;
            const std::string::size_type next = str.find(delimiter, pos);
            words.push_back(str.substr(pos, next - pos));
            pos = next;
        }
    }
    return words;
}


/// Splits a text into lines using universal newlines.
///
/// Any of "\n", "\r\n" or a lone "\r" terminates a line.  The terminators are
/// not part of the returned lines, and a terminator at the very end of the
/// text does not produce an extra empty line.
///
/// \param str The text to split.
///
/// \return The lines in the text.  Empty if the text is empty.
std::vector< std::string >
text::split_lines(const std::string& str)
{
    std::vector< std::string > lines;

    std::string::size_type start = 0;
    std::string::size_type pos = 0;
    while (pos < str.length()) {
        if (str[pos] == '\n' || str[pos] == '\r') {
            lines.push_back(str.substr(start, pos - start));
            if (str[pos] == '\r' && pos + 1 < str.length() &&
                str[pos + 1] == '\n')
                ++pos;
            start = pos + 1;
        }
        ++pos;
    }
    if (start < str.length())
        lines.push_back(str.substr(start));

    return lines;
}


/// Converts a string to a boolean.
///
/// \param str The string to convert.
///
/// \return The converted string, if the input string was valid.
///
/// \throw std::value_error If the input string does not represent a valid
///     boolean value.
template<>
bool
text::to_type(const std::string& str)
{
    if (str == "true")
        return true;
    else if (str == "false")
        return false;
    else
        throw value_error(F("Invalid boolean value '%s'") % str);
}


/// Identity function for to_type, for genericity purposes.
///
/// \param str The string to convert.
///
/// \return The input string.
template<>
std::string
text::to_type(const std::string& str)
{
    return str;
}
