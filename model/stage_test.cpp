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

#include "model/stage.hpp"

#include <sstream>

#include <atf-c++.hpp>

#include "model/exceptions.hpp"


ATF_TEST_CASE_WITHOUT_HEAD(ordered_stages);
ATF_TEST_CASE_BODY(ordered_stages)
{
    const model::stages_vector& stages = model::ordered_stages();
    ATF_REQUIRE_EQ(4, stages.size());
    ATF_REQUIRE_EQ(model::stage_preparation, stages[0]);
    ATF_REQUIRE_EQ(model::stage_building, stages[1]);
    ATF_REQUIRE_EQ(model::stage_testing, stages[2]);
    ATF_REQUIRE_EQ(model::stage_completed, stages[3]);
    ATF_REQUIRE(&stages == &model::ordered_stages());
}


ATF_TEST_CASE_WITHOUT_HEAD(stage_index__monotonic);
ATF_TEST_CASE_BODY(stage_index__monotonic)
{
    ATF_REQUIRE_EQ(0, model::stage_index(model::stage_preparation));
    ATF_REQUIRE(model::stage_index(model::stage_preparation) <
                model::stage_index(model::stage_building));
    ATF_REQUIRE(model::stage_index(model::stage_building) <
                model::stage_index(model::stage_testing));
    ATF_REQUIRE(model::stage_index(model::stage_testing) <
                model::stage_index(model::stage_completed));
    ATF_REQUIRE_EQ(3, model::stage_index(model::stage_completed));
}


ATF_TEST_CASE_WITHOUT_HEAD(stage_index__not_ordered);
ATF_TEST_CASE_BODY(stage_index__not_ordered)
{
    ATF_REQUIRE_EQ(-1, model::stage_index(model::stage_canceled));
    ATF_REQUIRE_EQ(-1, model::stage_index(static_cast< model::stage >(42)));
}


ATF_TEST_CASE_WITHOUT_HEAD(is_terminal);
ATF_TEST_CASE_BODY(is_terminal)
{
    ATF_REQUIRE(!model::is_terminal(model::stage_preparation));
    ATF_REQUIRE(!model::is_terminal(model::stage_building));
    ATF_REQUIRE(!model::is_terminal(model::stage_testing));
    ATF_REQUIRE( model::is_terminal(model::stage_completed));
    ATF_REQUIRE( model::is_terminal(model::stage_canceled));
}


ATF_TEST_CASE_WITHOUT_HEAD(names_and_descriptions);
ATF_TEST_CASE_BODY(names_and_descriptions)
{
    ATF_REQUIRE_EQ(std::string("building"),
                   model::stage_name(model::stage_building));
    ATF_REQUIRE_EQ(std::string("Building"),
                   model::stage_description(model::stage_building));
    ATF_REQUIRE_EQ(std::string("canceled"),
                   model::stage_name(model::stage_canceled));
    ATF_REQUIRE_EQ(std::string("Canceled/Error"),
                   model::stage_description(model::stage_canceled));
}


ATF_TEST_CASE_WITHOUT_HEAD(parse_stage__ok);
ATF_TEST_CASE_BODY(parse_stage__ok)
{
    const model::stage all[] = {
        model::stage_preparation, model::stage_building, model::stage_testing,
        model::stage_completed, model::stage_canceled };
    for (std::size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i)
        ATF_REQUIRE_EQ(all[i], model::parse_stage(model::stage_name(all[i])));
}


ATF_TEST_CASE_WITHOUT_HEAD(parse_stage__unknown);
ATF_TEST_CASE_BODY(parse_stage__unknown)
{
    ATF_REQUIRE_THROW_RE(model::format_error, "Unknown stage 'done'",
                         model::parse_stage("done"));
    ATF_REQUIRE_THROW_RE(model::format_error, "Unknown stage 'Testing'",
                         model::parse_stage("Testing"));
    ATF_REQUIRE_THROW(model::format_error, model::parse_stage(""));
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    std::ostringstream str;
    str << model::stage_testing << ' ' << model::stage_canceled;
    ATF_REQUIRE_EQ("testing canceled", str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, ordered_stages);
    ATF_ADD_TEST_CASE(tcs, stage_index__monotonic);
    ATF_ADD_TEST_CASE(tcs, stage_index__not_ordered);
    ATF_ADD_TEST_CASE(tcs, is_terminal);
    ATF_ADD_TEST_CASE(tcs, names_and_descriptions);
    ATF_ADD_TEST_CASE(tcs, parse_stage__ok);
    ATF_ADD_TEST_CASE(tcs, parse_stage__unknown);
    ATF_ADD_TEST_CASE(tcs, output);
}
