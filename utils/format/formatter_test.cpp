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

#include <ostream>
#include <sstream>

#include <atf-c++.hpp>

#include "utils/format/exceptions.hpp"
#include "utils/format/macros.hpp"

namespace format = utils::format;


namespace {


/// Wraps an integer in a C++ class.
///
/// This custom type exists to ensure that we can feed arbitrary objects that
/// support operator<< to the formatter.
class int_wrapper {
    /// The wrapped integer.
    int _value;

public:
    /// Constructs a new wrapper.
    ///
    /// \param value_ The value to wrap.
    int_wrapper(const int value_) : _value(value_)
    {
    }

    /// Returns the wrapped value.
    ///
    /// \return An integer.
    int
    value(void) const
    {
        return _value;
    }
};


/// Writes a wrapped integer into an output stream.
///
/// \param output The output stream into which to place the integer.
/// \param wrapper The wrapped integer.
///
/// \return The output stream.
std::ostream&
operator<<(std::ostream& output, const int_wrapper& wrapper)
{
    return (output << "[" << wrapper.value() << "]");
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(no_fields);
ATF_TEST_CASE_BODY(no_fields)
{
    ATF_REQUIRE_EQ("Plain string", F("Plain string").str());
}


ATF_TEST_CASE_WITHOUT_HEAD(one_field);
ATF_TEST_CASE_BODY(one_field)
{
    ATF_REQUIRE_EQ("foo", (F("%sfoo") % "").str());
    ATF_REQUIRE_EQ(" foo", (F("%sfoo") % " ").str());
    ATF_REQUIRE_EQ("foo ", (F("foo %s") % "").str());
    ATF_REQUIRE_EQ("foo bar", (F("foo %s") % "bar").str());
    ATF_REQUIRE_EQ("foo bar baz", (F("foo %s baz") % "bar").str());
    ATF_REQUIRE_EQ("foo %s %s", (F("foo %s %s") % "%s" % "%s").str());
}


ATF_TEST_CASE_WITHOUT_HEAD(many_fields);
ATF_TEST_CASE_BODY(many_fields)
{
    ATF_REQUIRE_EQ("", (F("%s%s") % "" % "").str());
    ATF_REQUIRE_EQ("foo", (F("%s%s%s") % "" % "foo" % "").str());
    ATF_REQUIRE_EQ("some 5 text", (F("%s %s %s") % "some" % 5 % "text").str());
    ATF_REQUIRE_EQ("f%s 5 text", (F("%s %s %s") % "f%s" % 5 % "text").str());
}


ATF_TEST_CASE_WITHOUT_HEAD(escape);
ATF_TEST_CASE_BODY(escape)
{
    ATF_REQUIRE_EQ("%", F("%%").str());
    ATF_REQUIRE_EQ("% %", F("%% %%").str());
    ATF_REQUIRE_EQ("%% %%", (F("%s %s") % "%%" % "%%").str());
    ATF_REQUIRE_EQ("100% done", (F("%s%% done") % 100).str());
}


ATF_TEST_CASE_WITHOUT_HEAD(conversions);
ATF_TEST_CASE_BODY(conversions)
{
    ATF_REQUIRE_EQ("c", (F("%c") % 'c').str());
    ATF_REQUIRE_EQ("-3", (F("%d") % -3).str());
    ATF_REQUIRE_EQ("7", (F("%u") % 7u).str());
    ATF_REQUIRE_EQ("true false", (F("%s %s") % true % false).str());
    ATF_REQUIRE_EQ("[5]", (F("%s") % int_wrapper(5)).str());
}


ATF_TEST_CASE_WITHOUT_HEAD(width_and_precision);
ATF_TEST_CASE_BODY(width_and_precision)
{
    ATF_REQUIRE_EQ("000123", (F("%06s") % 123).str());
    ATF_REQUIRE_EQ("   ab", (F("%5s") % "ab").str());
    ATF_REQUIRE_EQ("1.500", (F("%.3s") % 1.5).str());
    ATF_REQUIRE_EQ("x 0042 y", (F("x %04d y") % 42).str());
}


ATF_TEST_CASE_WITHOUT_HEAD(missing_arguments);
ATF_TEST_CASE_BODY(missing_arguments)
{
    ATF_REQUIRE_EQ("foo %s bar", (F("%s %s %s") % "foo" % "bar").str());
}


ATF_TEST_CASE_WITHOUT_HEAD(stream_injection);
ATF_TEST_CASE_BODY(stream_injection)
{
    std::ostringstream output;
    output << F("a %s c") % "b";
    ATF_REQUIRE_EQ("a b c", output.str());
}


ATF_TEST_CASE_WITHOUT_HEAD(bad_format);
ATF_TEST_CASE_BODY(bad_format)
{
    ATF_REQUIRE_THROW_RE(format::bad_format_error, "Trailing %", F("%"));
    ATF_REQUIRE_THROW_RE(format::bad_format_error, "Trailing %", F("f%"));
    ATF_REQUIRE_THROW_RE(format::bad_format_error, "Unknown sequence '%Z'",
                         F("%Z"));
    ATF_REQUIRE_THROW_RE(format::bad_format_error, "Unknown sequence '%.'",
                         F("%.f"));
}


ATF_TEST_CASE_WITHOUT_HEAD(non_ascii);
ATF_TEST_CASE_BODY(non_ascii)
{
    ATF_REQUIRE_EQ("caf\xc3\xa9 \xe9t\xe9",
                   (F("caf\xc3\xa9 %s") % "\xe9t\xe9").str());
    ATF_REQUIRE_EQ("  ab\xff", (F("%4s\xff") % "ab").str());
    ATF_REQUIRE_THROW_RE(format::bad_format_error, "Unknown sequence '%5'",
                         F("%5\xe9"));
    ATF_REQUIRE_THROW_RE(format::bad_format_error, "Unknown sequence '%.'",
                         F("%.\xb2s"));
}


ATF_TEST_CASE_WITHOUT_HEAD(extra_args);
ATF_TEST_CASE_BODY(extra_args)
{
    ATF_REQUIRE_THROW_RE(format::extra_args_error, "argument 'foo'",
                         F("") % "foo");
    ATF_REQUIRE_THROW_RE(format::extra_args_error, "argument '3'",
                         F("%s") % 1 % 3);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, no_fields);
    ATF_ADD_TEST_CASE(tcs, one_field);
    ATF_ADD_TEST_CASE(tcs, many_fields);
    ATF_ADD_TEST_CASE(tcs, escape);
    ATF_ADD_TEST_CASE(tcs, conversions);
    ATF_ADD_TEST_CASE(tcs, width_and_precision);
    ATF_ADD_TEST_CASE(tcs, missing_arguments);
    ATF_ADD_TEST_CASE(tcs, stream_injection);
    ATF_ADD_TEST_CASE(tcs, bad_format);
    ATF_ADD_TEST_CASE(tcs, non_ascii);
    ATF_ADD_TEST_CASE(tcs, extra_args);
}
