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

#include "utils/format/formatter.hpp"

#include <cctype>
#include <iomanip>

#include "utils/format/exceptions.hpp"
#include "utils/sanity.hpp"

namespace format = utils::format;

using utils::format::formatter;


namespace {


/// Conversion characters accepted at the end of a placeholder.
static const std::string valid_conversions = "cdsu";


/// Parses the placeholder that starts at a given position.
///
/// \param format The format string.
/// \param pos Position of the '%' character; must not be followed by another
///     '%' character.
/// \param [out] placeholder The parsed placeholder.
///
/// \return True if the placeholder is well-formed; false otherwise.
static bool
parse_placeholder(const std::string& format, const std::string::size_type pos,
                  format::detail::placeholder& placeholder)
{
    PRE(format[pos] == '%');

    std::string::size_type cur = pos + 1;
    placeholder.begin = pos;
    placeholder.zero_pad = false;
    placeholder.width = 0;
    placeholder.precision = -1;

    if (cur < format.length() && format[cur] == '0') {
        placeholder.zero_pad = true;
        ++cur;
    }
    while (cur < format.length() &&
           std::isdigit(static_cast< unsigned char >(format[cur]))) {
        placeholder.width = placeholder.width * 10 + (format[cur] - '0');
        ++cur;
    }
    if (cur < format.length() && format[cur] == '.') {
        ++cur;
        placeholder.precision = 0;
        while (cur < format.length() &&
               std::isdigit(static_cast< unsigned char >(format[cur]))) {
            placeholder.precision = placeholder.precision * 10 +
                (format[cur] - '0');
            ++cur;
        }
    }
    if (cur >= format.length() ||
        valid_conversions.find(format[cur]) == std::string::npos)
        return false;

    placeholder.length = cur - pos + 1;
    return true;
}


/// Collapses all the "%%" sequences of a literal chunk into "%".
///
/// \param chunk Literal text of a format string, without placeholders.
///
/// \return The text as it has to appear in the expansion.
static std::string
unescape(const std::string& chunk)
{
    std::string out;
    out.reserve(chunk.length());
    for (std::string::size_type i = 0; i < chunk.length(); ++i) {
        out += chunk[i];
        if (chunk[i] == '%' && i + 1 < chunk.length() && chunk[i + 1] == '%')
            ++i;
    }
    return out;
}


}  // anonymous namespace


/// Constructs a new formatter object (internal).
///
/// \param format The format string.
/// \param expansion The expansion of the format string up to last_pos.
/// \param last_pos The position in format from which to start looking for
///     formatting placeholders.
formatter::formatter(const std::string& format, const std::string& expansion,
                     const std::string::size_type last_pos) :
    _format(format),
    _expansion(expansion),
    _last_pos(last_pos)
{
}


/// Constructs a new formatter object.
///
/// \param format The format string.
///
/// \throw utils::format::bad_format_error If the format string is invalid.
formatter::formatter(const std::string& format) :
    _format(format),
    _last_pos(0)
{
    std::string::size_type pos = _format.find('%');
    while (pos != std::string::npos) {
        if (pos == _format.length() - 1)
            throw bad_format_error(_format, "Trailing %");

        if (_format[pos + 1] == '%') {
            pos = _format.find('%', pos + 2);
        } else {
            detail::placeholder placeholder;
            if (!parse_placeholder(_format, pos, placeholder))
                throw bad_format_error(_format, "Unknown sequence '" +
                                       _format.substr(pos, 2) + "'");
            pos = _format.find('%', pos + placeholder.length);
        }
    }
}


/// Locates the next placeholder pending replacement.
///
/// \param [out] placeholder The located placeholder, if any.
///
/// \return True if a placeholder was found; false otherwise.
bool
formatter::find_placeholder(detail::placeholder& placeholder) const
{
    std::string::size_type pos = _format.find('%', _last_pos);
    while (pos != std::string::npos && _format[pos + 1] == '%')
        pos = _format.find('%', pos + 2);
    if (pos == std::string::npos)
        return false;

    const bool valid = parse_placeholder(_format, pos, placeholder);
    INV_MSG(valid, "Format string was validated during construction");
    return valid;
}


/// Replaces a placeholder with its already-formatted value.
///
/// \param placeholder The placeholder to be replaced.
/// \param arg The formatted replacement.
///
/// \return A new formatter with the replacement performed.
formatter
formatter::replace(const detail::placeholder& placeholder,
                   const std::string& arg) const
{
    PRE(placeholder.begin >= _last_pos);
    const std::string expansion = _expansion + unescape(
        _format.substr(_last_pos, placeholder.begin - _last_pos)) + arg;
    return formatter(_format, expansion,
                     placeholder.begin + placeholder.length);
}


/// Configures a stream to honor the flags of a placeholder.
///
/// \param placeholder The placeholder being replaced.
/// \param output The stream to configure.
void
formatter::prepare_stream(const detail::placeholder& placeholder,
                          std::ostream& output)
{
    output << std::boolalpha;
    if (placeholder.precision != -1)
        output << std::fixed << std::setprecision(placeholder.precision);
    if (placeholder.width > 0) {
        output << std::setw(placeholder.width);
        if (placeholder.zero_pad)
            output << std::setfill('0');
    }
}


/// Returns the formatted string.
///
/// Placeholders that have not been replaced are kept verbatim.
///
/// \return The expansion of the format string.
std::string
formatter::str(void) const
{
    return _expansion + unescape(_format.substr(_last_pos));
}


/// Automatic conversion of formatter objects to strings.
///
/// This is provided to allow painless injection of formatter objects into
/// streams, without having to manually call the str() method.
formatter::operator std::string(void) const
{
    return str();
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
format::operator<<(std::ostream& output, const formatter& object)
{
    return (output << object.str());
}
