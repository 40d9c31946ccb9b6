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

#include "utils/logging/operations.hpp"

extern "C" {
#include <unistd.h>
}

#include <fstream>
#include <stdexcept>
#include <string>

#include <atf-c++.hpp>

#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace logging = utils::logging;


namespace {


/// Reads the next line of a log file, failing the test if there is none.
///
/// \param input The open log file.
///
/// \return The line, without the pid field to simplify comparisons.
static std::string
next_entry(std::ifstream& input)
{
    std::string line;
    ATF_REQUIRE(std::getline(input, line).good());
    const std::string pid = F(" %s ") % ::getpid();
    const std::string::size_type pos = line.find(pid);
    ATF_REQUIRE(pos != std::string::npos);
    return line.substr(0, pos) + " " + line.substr(pos + pid.length());
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(generate_log_name__before_log);
ATF_TEST_CASE_BODY(generate_log_name__before_log)
{
    datetime::set_mock_now(2011, 2, 21, 18, 10, 0, 0);
    ATF_REQUIRE_EQ(fs::path("/some/dir/foobar.20110221-181000.log"),
                   logging::generate_log_name(fs::path("/some/dir"), "foobar"));

    datetime::set_mock_now(2011, 2, 21, 18, 10, 1, 987654);
    logging::log(logging::level_info, "file", 123, "A message");

    datetime::set_mock_now(2011, 2, 21, 18, 10, 2, 123);
    ATF_REQUIRE_EQ(fs::path("/some/dir/foobar.20110221-181000.log"),
                   logging::generate_log_name(fs::path("/some/dir"), "foobar"));
}


ATF_TEST_CASE_WITHOUT_HEAD(generate_log_name__after_log);
ATF_TEST_CASE_BODY(generate_log_name__after_log)
{
    datetime::set_mock_now(2011, 2, 21, 18, 15, 0, 0);
    logging::log(logging::level_info, "file", 123, "A message");
    datetime::set_mock_now(2011, 2, 21, 18, 15, 1, 987654);
    logging::log(logging::level_info, "file", 123, "A message");

    datetime::set_mock_now(2011, 2, 21, 18, 15, 2, 123);
    ATF_REQUIRE_EQ(fs::path("/some/dir/foobar.20110221-181500.log"),
                   logging::generate_log_name(fs::path("/some/dir"), "foobar"));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_persistency__backlog);
ATF_TEST_CASE_BODY(set_persistency__backlog)
{
    datetime::set_mock_now(2011, 2, 21, 18, 10, 0, 0);
    logging::log(logging::level_debug, "f1", 1, "Debug message");

    datetime::set_mock_now(2011, 2, 21, 18, 10, 1, 0);
    logging::log(logging::level_error, "f2", 2, "Error message");

    logging::set_persistency("debug", fs::path("test.log"));

    datetime::set_mock_now(2011, 2, 21, 18, 10, 2, 0);
    logging::log(logging::level_info, "f3", 3, "Info message");

    datetime::set_mock_now(2011, 2, 21, 18, 10, 3, 0);
    logging::log(logging::level_warning, "f4", 4, "Warning message");

    std::ifstream input("test.log");
    ATF_REQUIRE(input);
    ATF_REQUIRE_EQ("20110221-181000 D f1:1: Debug message", next_entry(input));
    ATF_REQUIRE_EQ("20110221-181001 E f2:2: Error message", next_entry(input));
    ATF_REQUIRE_EQ("20110221-181002 I f3:3: Info message", next_entry(input));
    ATF_REQUIRE_EQ("20110221-181003 W f4:4: Warning message",
                   next_entry(input));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_persistency__filter_level);
ATF_TEST_CASE_BODY(set_persistency__filter_level)
{
    datetime::set_mock_now(2011, 2, 21, 18, 20, 0, 0);
    logging::log(logging::level_debug, "f1", 1, "Debug message");
    logging::log(logging::level_warning, "f2", 2, "Warning message");

    logging::set_persistency("warning", fs::path("test.log"));

    logging::log(logging::level_info, "f3", 3, "Info message");
    logging::log(logging::level_error, "f4", 4, "Error message");

    std::ifstream input("test.log");
    ATF_REQUIRE(input);
    ATF_REQUIRE_EQ("20110221-182000 W f2:2: Warning message",
                   next_entry(input));
    ATF_REQUIRE_EQ("20110221-182000 E f4:4: Error message", next_entry(input));
    std::string line;
    ATF_REQUIRE(!std::getline(input, line));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_persistency__bad_level);
ATF_TEST_CASE_BODY(set_persistency__bad_level)
{
    ATF_REQUIRE_THROW_RE(std::range_error, "Unrecognized log level 'foo'",
                         logging::set_persistency("foo", fs::path("test.log")));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_persistency__fail);
ATF_TEST_CASE_BODY(set_persistency__fail)
{
    ATF_REQUIRE_THROW_RE(std::runtime_error, "nonexistent/test.log",
                         logging::set_persistency(
                             "info", fs::path("nonexistent/test.log")));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, generate_log_name__before_log);
    ATF_ADD_TEST_CASE(tcs, generate_log_name__after_log);

    ATF_ADD_TEST_CASE(tcs, set_persistency__backlog);
    ATF_ADD_TEST_CASE(tcs, set_persistency__filter_level);
    ATF_ADD_TEST_CASE(tcs, set_persistency__bad_level);
    ATF_ADD_TEST_CASE(tcs, set_persistency__fail);
}
