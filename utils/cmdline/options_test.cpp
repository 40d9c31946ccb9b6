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

#include "utils/cmdline/options.hpp"

#include <atf-c++.hpp>

#include "utils/cmdline/exceptions.hpp"
#include "utils/fs/path.hpp"

namespace cmdline = utils::cmdline;
namespace fs = utils::fs;


ATF_TEST_CASE_WITHOUT_HEAD(base_option__short_name__no_arg);
ATF_TEST_CASE_BODY(base_option__short_name__no_arg)
{
    const cmdline::bool_option o('d', "download", "Render for download");
    ATF_REQUIRE(o.has_short_name());
    ATF_REQUIRE_EQ('d', o.short_name());
    ATF_REQUIRE_EQ("download", o.long_name());
    ATF_REQUIRE_EQ("Render for download", o.description());
    ATF_REQUIRE(!o.needs_arg());
    ATF_REQUIRE_EQ("-d", o.format_short_name());
    ATF_REQUIRE_EQ("--download", o.format_long_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(base_option__short_name__with_arg);
ATF_TEST_CASE_BODY(base_option__short_name__with_arg)
{
    const cmdline::string_option o('o', "output", "Output file", "file");
    ATF_REQUIRE(o.has_short_name());
    ATF_REQUIRE_EQ('o', o.short_name());
    ATF_REQUIRE(o.needs_arg());
    ATF_REQUIRE_EQ("file", o.arg_name());
    ATF_REQUIRE(!o.has_default_value());
    ATF_REQUIRE_EQ("-o file", o.format_short_name());
    ATF_REQUIRE_EQ("--output=file", o.format_long_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(base_option__long_name__with_default);
ATF_TEST_CASE_BODY(base_option__long_name__with_default)
{
    const cmdline::string_option o("loglevel", "Logging level", "level",
                                   "info");
    ATF_REQUIRE(!o.has_short_name());
    ATF_REQUIRE_EQ("loglevel", o.long_name());
    ATF_REQUIRE(o.needs_arg());
    ATF_REQUIRE_EQ("level", o.arg_name());
    ATF_REQUIRE(o.has_default_value());
    ATF_REQUIRE_EQ("info", o.default_value());
    ATF_REQUIRE_EQ("--loglevel=level", o.format_long_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(bool_option);
ATF_TEST_CASE_BODY(bool_option)
{
    const cmdline::bool_option o("download", "Render for download");
    ATF_REQUIRE(!o.has_short_name());
    ATF_REQUIRE_EQ("download", o.long_name());
    ATF_REQUIRE(!o.needs_arg());
}


ATF_TEST_CASE_WITHOUT_HEAD(int_option__validate_and_convert);
ATF_TEST_CASE_BODY(int_option__validate_and_convert)
{
    const cmdline::int_option o("pr", "Pull request number", "number", "0");
    ATF_REQUIRE_EQ("0", o.default_value());

    o.validate("123");
    o.validate("-5");
    ATF_REQUIRE_EQ(123, cmdline::int_option::convert("123"));
    ATF_REQUIRE_EQ(-5, cmdline::int_option::convert("-5"));
}


ATF_TEST_CASE_WITHOUT_HEAD(int_option__invalid);
ATF_TEST_CASE_BODY(int_option__invalid)
{
    const cmdline::int_option o('p', "pr", "Pull request number", "number");

    try {
        o.validate("12a");
        fail("option_argument_value_error not raised");
    } catch (const cmdline::option_argument_value_error& e) {
        ATF_REQUIRE_EQ("--pr", e.option());
        ATF_REQUIRE_EQ("12a", e.argument());
    }
    ATF_REQUIRE_THROW(cmdline::option_argument_value_error, o.validate(""));
}


ATF_TEST_CASE_WITHOUT_HEAD(path_option__validate_and_convert);
ATF_TEST_CASE_BODY(path_option__validate_and_convert)
{
    const cmdline::path_option o('c', "config", "Configuration file", "file",
                                 "none");
    ATF_REQUIRE_EQ("none", o.default_value());

    o.validate("/etc/trackrun.conf");
    o.validate("relative//path/");
    ATF_REQUIRE_EQ(fs::path("relative/path"),
                   cmdline::path_option::convert("relative//path/"));
}


ATF_TEST_CASE_WITHOUT_HEAD(path_option__invalid);
ATF_TEST_CASE_BODY(path_option__invalid)
{
    const cmdline::path_option o("logfile", "Log file", "file");

    ATF_REQUIRE_THROW_RE(cmdline::option_argument_value_error,
                         "Invalid argument '' for option --logfile",
                         o.validate(""));
}


ATF_TEST_CASE_WITHOUT_HEAD(string_option);
ATF_TEST_CASE_BODY(string_option)
{
    const cmdline::string_option o("branch", "Branch name", "name");
    o.validate("");
    o.validate("feature/new stuff");
    ATF_REQUIRE_EQ("feature/new stuff",
                   cmdline::string_option::convert("feature/new stuff"));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, base_option__short_name__no_arg);
    ATF_ADD_TEST_CASE(tcs, base_option__short_name__with_arg);
    ATF_ADD_TEST_CASE(tcs, base_option__long_name__with_default);
    ATF_ADD_TEST_CASE(tcs, bool_option);
    ATF_ADD_TEST_CASE(tcs, int_option__validate_and_convert);
    ATF_ADD_TEST_CASE(tcs, int_option__invalid);
    ATF_ADD_TEST_CASE(tcs, path_option__validate_and_convert);
    ATF_ADD_TEST_CASE(tcs, path_option__invalid);
    ATF_ADD_TEST_CASE(tcs, string_option);
}
