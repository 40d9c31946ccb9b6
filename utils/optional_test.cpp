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

#include "utils/optional.ipp"

#include <sstream>
#include <string>

#include <atf-c++.hpp>

using utils::none;
using utils::optional;


namespace {


/// Object that keeps track of how many of its instances are alive.
class counted {
public:
    /// Value carried by the object.
    int value;

    /// Number of live instances of this class.
    static int instances;

    counted(const int value_) : value(value_) { ++instances; }
    counted(const counted& other) : value(other.value) { ++instances; }
    ~counted(void) { --instances; }
};


int counted::instances = 0;


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(ctors);
ATF_TEST_CASE_BODY(ctors)
{
    const optional< std::string > empty;
    ATF_REQUIRE(!empty);

    const optional< std::string > from_none(none);
    ATF_REQUIRE(!from_none);

    const optional< std::string > from_value(std::string("abc"));
    ATF_REQUIRE(from_value);
    ATF_REQUIRE_EQ("abc", from_value.get());

    const optional< std::string > copy(from_value);
    ATF_REQUIRE(copy);
    ATF_REQUIRE_EQ("abc", copy.get());
}


ATF_TEST_CASE_WITHOUT_HEAD(assign);
ATF_TEST_CASE_BODY(assign)
{
    optional< int > value(3);
    value = none;
    ATF_REQUIRE(!value);

    value = 8;
    ATF_REQUIRE_EQ(8, value.get());

    const optional< int > other;
    value = other;
    ATF_REQUIRE(!value);
}


ATF_TEST_CASE_WITHOUT_HEAD(compare);
ATF_TEST_CASE_BODY(compare)
{
    ATF_REQUIRE(optional< int >() == optional< int >(none));
    ATF_REQUIRE(optional< int >(1) == optional< int >(1));
    ATF_REQUIRE(optional< int >(1) != optional< int >(2));
    ATF_REQUIRE(optional< int >(1) != optional< int >());
}


ATF_TEST_CASE_WITHOUT_HEAD(get_default);
ATF_TEST_CASE_BODY(get_default)
{
    ATF_REQUIRE_EQ(5, optional< int >().get_default(5));
    ATF_REQUIRE_EQ(7, optional< int >(7).get_default(5));
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    std::ostringstream str;
    str << optional< int >() << " " << optional< int >(12);
    ATF_REQUIRE_EQ("none 12", str.str());
}


ATF_TEST_CASE_WITHOUT_HEAD(memory);
ATF_TEST_CASE_BODY(memory)
{
    ATF_REQUIRE_EQ(0, counted::instances);
    {
        optional< counted > first(counted(3));
        ATF_REQUIRE_EQ(1, counted::instances);
        {
            optional< counted > second(first);
            ATF_REQUIRE_EQ(2, counted::instances);
            second = none;
            ATF_REQUIRE_EQ(1, counted::instances);
        }
        ATF_REQUIRE_EQ(3, first.get().value);
    }
    ATF_REQUIRE_EQ(0, counted::instances);
}


ATF_TEST_CASE_WITHOUT_HEAD(make_optional);
ATF_TEST_CASE_BODY(make_optional)
{
    const optional< int > value = utils::make_optional(576);
    ATF_REQUIRE(value);
    ATF_REQUIRE_EQ(576, value.get());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, ctors);
    ATF_ADD_TEST_CASE(tcs, assign);
    ATF_ADD_TEST_CASE(tcs, compare);
    ATF_ADD_TEST_CASE(tcs, get_default);
    ATF_ADD_TEST_CASE(tcs, output);
    ATF_ADD_TEST_CASE(tcs, memory);
    ATF_ADD_TEST_CASE(tcs, make_optional);
}
