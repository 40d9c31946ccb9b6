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

/// \file utils/format/formatter.hpp
/// Provides the definition of the utils::format::formatter class.
///
/// The utils::format::formatter class is a poor man's replacement for the
/// Boost.Format library, as it is much simpler and has less dependencies.

#if !defined(UTILS_FORMAT_FORMATTER_HPP)
#define UTILS_FORMAT_FORMATTER_HPP

#include <ostream>
#include <string>

namespace utils {
namespace format {


namespace detail {


/// Location and flags of a formatting placeholder within a format string.
struct placeholder {
    /// Position of the '%' character that starts the placeholder.
    std::string::size_type begin;

    /// Length of the placeholder, including the '%' and the conversion.
    std::string::size_type length;

    /// Whether the replacement has to be padded with zeros.
    bool zero_pad;

    /// Minimum width of the replacement; 0 if none.
    int width;

    /// Precision for floating point values; -1 if none.
    int precision;
};


}  // namespace detail


/// Mechanism to format strings similar to printf.
///
/// A formatter always maintains the original format string and the part of
/// the expansion computed so far.  Calls to operator% return new formatter
/// objects with one less formatting placeholder.  Supported placeholders are
/// %c, %d, %s and %u, optionally with a zero-padded width and a precision
/// (e.g. "%06s" or "%.3s"); "%%" is a literal percent sign.
///
/// In general, one can format a string in the following manner:
///
/// \code
/// const std::string s = (formatter("%s %d") % "foo" % 5).str();
/// \endcode
class formatter {
    /// The original format string.
    std::string _format;

    /// The expansion of _format up to _last_pos.
    std::string _expansion;

    /// Position in _format where the unprocessed text starts.
    std::string::size_type _last_pos;

    formatter(const std::string&, const std::string&,
              const std::string::size_type);

    bool find_placeholder(detail::placeholder&) const;
    formatter replace(const detail::placeholder&, const std::string&) const;
    static void prepare_stream(const detail::placeholder&, std::ostream&);

public:
    formatter(const std::string&);

    std::string str(void) const;
    operator std::string(void) const;

    template< typename Type > formatter operator%(const Type&) const;
};


std::ostream& operator<<(std::ostream&, const formatter&);


}  // namespace format
}  // namespace utils


#endif  // !defined(UTILS_FORMAT_FORMATTER_HPP)
