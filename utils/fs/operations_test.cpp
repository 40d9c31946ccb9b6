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

#include "utils/fs/operations.hpp"

extern "C" {
#include <unistd.h>
}

#include <cerrno>

#include <atf-c++.hpp>

#include "utils/fs/exceptions.hpp"
#include "utils/fs/path.hpp"

namespace fs = utils::fs;


ATF_TEST_CASE_WITHOUT_HEAD(current_path);
ATF_TEST_CASE_BODY(current_path)
{
    const fs::path previous = fs::current_path();
    ATF_REQUIRE(previous.is_absolute());
    fs::mkdir(fs::path("subdir"), 0755);
    ATF_REQUIRE(::chdir("subdir") != -1);
    ATF_REQUIRE_EQ(previous / "subdir", fs::current_path());
}


ATF_TEST_CASE_WITHOUT_HEAD(exists);
ATF_TEST_CASE_BODY(exists)
{
    ATF_REQUIRE(!fs::exists(fs::path("artifact.txt")));
    atf::utils::create_file("artifact.txt", "contents\n");
    ATF_REQUIRE(fs::exists(fs::path("artifact.txt")));
}


ATF_TEST_CASE_WITHOUT_HEAD(is_directory);
ATF_TEST_CASE_BODY(is_directory)
{
    ATF_REQUIRE(!fs::is_directory(fs::path("missing")));
    atf::utils::create_file("file", "");
    ATF_REQUIRE(!fs::is_directory(fs::path("file")));
    fs::mkdir(fs::path("dir"), 0755);
    ATF_REQUIRE(fs::is_directory(fs::path("dir")));
}


ATF_TEST_CASE_WITHOUT_HEAD(mkdir__enoent);
ATF_TEST_CASE_BODY(mkdir__enoent)
{
    try {
        fs::mkdir(fs::path("outputs/run-1"), 0755);
        fail("system_error not raised");
    } catch (const fs::system_error& e) {
        ATF_REQUIRE_EQ(ENOENT, e.original_errno());
    }
    ATF_REQUIRE(!fs::exists(fs::path("outputs")));
}


ATF_TEST_CASE_WITHOUT_HEAD(mkdir_p__many_components);
ATF_TEST_CASE_BODY(mkdir_p__many_components)
{
    fs::mkdir_p(fs::path("a/b/c"), 0755);
    ATF_REQUIRE(fs::is_directory(fs::path("a")));
    ATF_REQUIRE(fs::is_directory(fs::path("a/b")));
    ATF_REQUIRE(fs::is_directory(fs::path("a/b/c")));
}


ATF_TEST_CASE_WITHOUT_HEAD(mkdir_p__already_exists);
ATF_TEST_CASE_BODY(mkdir_p__already_exists)
{
    fs::mkdir(fs::path("a"), 0755);
    fs::mkdir(fs::path("a/b"), 0755);
    fs::mkdir_p(fs::path("a/b"), 0755);
    ATF_REQUIRE(fs::is_directory(fs::path("a/b")));
}


ATF_TEST_CASE_WITHOUT_HEAD(mkdir_p__file_in_the_way);
ATF_TEST_CASE_BODY(mkdir_p__file_in_the_way)
{
    atf::utils::create_file("a", "");
    try {
        fs::mkdir_p(fs::path("a/b"), 0755);
        fail("system_error not raised");
    } catch (const fs::system_error& e) {
        ATF_REQUIRE_EQ(ENOTDIR, e.original_errno());
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(mkdir_p__target_is_file);
ATF_TEST_CASE_BODY(mkdir_p__target_is_file)
{
    atf::utils::create_file("logs", "");
    ATF_REQUIRE_THROW_RE(fs::system_error, "Failed to create directory logs",
                         fs::mkdir_p(fs::path("logs"), 0755));
}


ATF_TEST_CASE_WITHOUT_HEAD(mkdir_p__absolute);
ATF_TEST_CASE_BODY(mkdir_p__absolute)
{
    const fs::path dir = fs::current_path() / "home/.trackrun/logs";
    fs::mkdir_p(dir, 0755);
    ATF_REQUIRE(fs::is_directory(fs::path("home/.trackrun/logs")));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, current_path);
    ATF_ADD_TEST_CASE(tcs, exists);
    ATF_ADD_TEST_CASE(tcs, is_directory);
    ATF_ADD_TEST_CASE(tcs, mkdir__enoent);
    ATF_ADD_TEST_CASE(tcs, mkdir_p__many_components);
    ATF_ADD_TEST_CASE(tcs, mkdir_p__already_exists);
    ATF_ADD_TEST_CASE(tcs, mkdir_p__file_in_the_way);
    ATF_ADD_TEST_CASE(tcs, mkdir_p__target_is_file);
    ATF_ADD_TEST_CASE(tcs, mkdir_p__absolute);
}
