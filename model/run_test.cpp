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

#include "model/run.hpp"

#include <sstream>

#include <atf-c++.hpp>

#include "model/exceptions.hpp"


ATF_TEST_CASE_WITHOUT_HEAD(parse_platform);
ATF_TEST_CASE_BODY(parse_platform)
{
    ATF_REQUIRE_EQ(model::platform_linux, model::parse_platform("linux"));
    ATF_REQUIRE_EQ(model::platform_windows, model::parse_platform("windows"));
    ATF_REQUIRE_EQ(std::string("windows"),
                   model::platform_name(model::platform_windows));
    ATF_REQUIRE_THROW_RE(model::format_error, "Unknown platform 'macos'",
                         model::parse_platform("macos"));
}


ATF_TEST_CASE_WITHOUT_HEAD(parse_run_type);
ATF_TEST_CASE_BODY(parse_run_type)
{
    ATF_REQUIRE_EQ(model::run_type_commit, model::parse_run_type("commit"));
    ATF_REQUIRE_EQ(model::run_type_pull_request, model::parse_run_type("pr"));
    ATF_REQUIRE_EQ(std::string("pr"),
                   model::run_type_name(model::run_type_pull_request));
    ATF_REQUIRE_THROW_RE(model::format_error, "Unknown run type 'pull'",
                         model::parse_run_type("pull"));
}


ATF_TEST_CASE_WITHOUT_HEAD(ctor_and_getters);
ATF_TEST_CASE_BODY(ctor_and_getters)
{
    const model::run run(model::platform_windows, model::run_type_pull_request,
                         "abc123", "https://example.org/user/project.git",
                         "fix-crash", "0123abcd", 17);
    ATF_REQUIRE_EQ(model::platform_windows, run.get_platform());
    ATF_REQUIRE_EQ(model::run_type_pull_request, run.type());
    ATF_REQUIRE_EQ("abc123", run.token());
    ATF_REQUIRE_EQ("https://example.org/user/project.git", run.fork_url());
    ATF_REQUIRE_EQ("fix-crash", run.branch());
    ATF_REQUIRE_EQ("0123abcd", run.commit());
    ATF_REQUIRE_EQ(17, run.pr_nr());
}


ATF_TEST_CASE_WITHOUT_HEAD(ctor__invalid_pr_nr);
ATF_TEST_CASE_BODY(ctor__invalid_pr_nr)
{
    ATF_REQUIRE_THROW_RE(
        model::error, "Commit runs cannot have a pull request number",
        model::run(model::platform_linux, model::run_type_commit, "t",
                   "https://example.org/a/b", "master", "abc", 3));
    ATF_REQUIRE_THROW_RE(
        model::error, "Invalid pull request number 0",
        model::run(model::platform_linux, model::run_type_pull_request, "t",
                   "https://example.org/a/b", "master", "abc", 0));
}


ATF_TEST_CASE_WITHOUT_HEAD(repository_link__commit);
ATF_TEST_CASE_BODY(repository_link__commit)
{
    const model::run run(model::platform_linux, model::run_type_commit, "t",
                         "https://example.org/user/project.git", "master",
                         "deadbeef", 0);
    ATF_REQUIRE_EQ("https://example.org/user/project", run.repository_url());
    ATF_REQUIRE_EQ("https://example.org/user/project/commit/deadbeef",
                   run.repository_link());
}


ATF_TEST_CASE_WITHOUT_HEAD(repository_link__pull_request);
ATF_TEST_CASE_BODY(repository_link__pull_request)
{
    const model::run run(model::platform_linux, model::run_type_pull_request,
                         "t", "https://example.org/user/project", "master",
                         "deadbeef", 1234);
    ATF_REQUIRE_EQ("https://example.org/user/project", run.repository_url());
    ATF_REQUIRE_EQ("https://example.org/user/project/pull/1234",
                   run.repository_link());
}


ATF_TEST_CASE_WITHOUT_HEAD(operators_eq_and_ne);
ATF_TEST_CASE_BODY(operators_eq_and_ne)
{
    const model::run run1(model::platform_linux, model::run_type_commit, "t",
                          "url", "b", "c", 0);
    const model::run run2(model::platform_linux, model::run_type_commit, "t",
                          "url", "b", "c", 0);
    const model::run run3(model::platform_linux, model::run_type_commit, "u",
                          "url", "b", "c", 0);
    ATF_REQUIRE(  run1 == run2);
    ATF_REQUIRE(!(run1 != run2));
    ATF_REQUIRE(!(run1 == run3));
    ATF_REQUIRE(  run1 != run3);
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    const model::run run(model::platform_windows, model::run_type_commit,
                         "secret", "url", "main", "abc", 0);
    std::ostringstream str;
    str << run;
    ATF_REQUIRE_EQ("model::run{platform='windows', type='commit', "
                   "fork_url='url', branch='main', commit='abc', pr_nr=0}",
                   str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, parse_platform);
    ATF_ADD_TEST_CASE(tcs, parse_run_type);
    ATF_ADD_TEST_CASE(tcs, ctor_and_getters);
    ATF_ADD_TEST_CASE(tcs, ctor__invalid_pr_nr);
    ATF_ADD_TEST_CASE(tcs, repository_link__commit);
    ATF_ADD_TEST_CASE(tcs, repository_link__pull_request);
    ATF_ADD_TEST_CASE(tcs, operators_eq_and_ne);
    ATF_ADD_TEST_CASE(tcs, output);
}
