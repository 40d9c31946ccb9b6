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

#include "utils/stream.hpp"

#include <sstream>
#include <string>

#include <atf-c++.hpp>


ATF_TEST_CASE_WITHOUT_HEAD(stream_length);
ATF_TEST_CASE_BODY(stream_length)
{
    std::istringstream input("0123456789");
    char buffer[4];
    input.read(buffer, 3);
    ATF_REQUIRE_EQ(10, static_cast< std::streamoff >(
        utils::stream_length(input)));
    input.read(buffer, 1);
    ATF_REQUIRE_EQ('3', buffer[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(read_stream__empty);
ATF_TEST_CASE_BODY(read_stream__empty)
{
    std::istringstream input("");
    ATF_REQUIRE_EQ("", utils::read_stream(input));
}


ATF_TEST_CASE_WITHOUT_HEAD(read_stream__large);
ATF_TEST_CASE_BODY(read_stream__large)
{
    std::string contents;
    for (int i = 0; i < 5000; ++i)
        contents += static_cast< char >('a' + i % 26);
    std::istringstream input(contents);
    ATF_REQUIRE_EQ(contents, utils::read_stream(input));
}


ATF_TEST_CASE_WITHOUT_HEAD(read_stream__binary);
ATF_TEST_CASE_BODY(read_stream__binary)
{
    const std::string contents("a\0b\r\n\xff", 6);
    std::istringstream input(contents);
    const std::string read = utils::read_stream(input);
    ATF_REQUIRE_EQ(6, read.length());
    ATF_REQUIRE(contents == read);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, stream_length);
    ATF_ADD_TEST_CASE(tcs, read_stream__empty);
    ATF_ADD_TEST_CASE(tcs, read_stream__large);
    ATF_ADD_TEST_CASE(tcs, read_stream__binary);
}
