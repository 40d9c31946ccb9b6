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

#include "model/run_event.hpp"

#include <sstream>

#include <atf-c++.hpp>

namespace datetime = utils::datetime;


ATF_TEST_CASE_WITHOUT_HEAD(ctor_and_getters);
ATF_TEST_CASE_BODY(ctor_and_getters)
{
    const datetime::timestamp ts = datetime::timestamp::from_values(
        2026, 5, 12, 8, 30, 0, 123);
    const model::run_event event(42, model::stage_building, ts,
                                 "Building sources");
    ATF_REQUIRE_EQ(42, event.run_id());
    ATF_REQUIRE_EQ(model::stage_building, event.stage());
    ATF_REQUIRE_EQ(ts, event.timestamp());
    ATF_REQUIRE_EQ("Building sources", event.message());
}


ATF_TEST_CASE_WITHOUT_HEAD(operators_eq_and_ne);
ATF_TEST_CASE_BODY(operators_eq_and_ne)
{
    const datetime::timestamp ts1 = datetime::timestamp::from_microseconds(10);
    const datetime::timestamp ts2 = datetime::timestamp::from_microseconds(20);

    const model::run_event event(1, model::stage_testing, ts1, "msg");
    ATF_REQUIRE(  event == model::run_event(1, model::stage_testing, ts1,
                                            "msg"));
    ATF_REQUIRE(  event != model::run_event(2, model::stage_testing, ts1,
                                            "msg"));
    ATF_REQUIRE(  event != model::run_event(1, model::stage_canceled, ts1,
                                            "msg"));
    ATF_REQUIRE(  event != model::run_event(1, model::stage_testing, ts2,
                                            "msg"));
    ATF_REQUIRE(  event != model::run_event(1, model::stage_testing, ts1,
                                            "other"));
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    const model::run_event event(
        3, model::stage_preparation,
        datetime::timestamp::from_values(2026, 1, 2, 3, 4, 5, 6), "Queued");
    std::ostringstream str;
    str << event;
    ATF_REQUIRE_EQ("model::run_event{run_id=3, stage='preparation', "
                   "timestamp=2026-01-02T03:04:05.000006Z, message='Queued'}",
                   str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, ctor_and_getters);
    ATF_ADD_TEST_CASE(tcs, operators_eq_and_ne);
    ATF_ADD_TEST_CASE(tcs, output);
}
