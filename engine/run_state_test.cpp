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

#include "engine/run_state.hpp"

#include <atf-c++.hpp>

#include "model/run_event.hpp"
#include "model/stage.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;


namespace {


/// Builds a timestamp a given number of seconds after a fixed instant.
///
/// \param seconds Offset from the base instant.
///
/// \return A timestamp.
static datetime::timestamp
at(const int seconds)
{
    return datetime::timestamp::from_values(2026, 3, 1, 10, 0, seconds, 0);
}


/// Builds an event log out of a list of stages.
///
/// The event for the stage at position i is timestamped at at(i).
///
/// \param stages The stages to record, in order.
///
/// \return The event log.
static model::run_events_vector
make_events(const model::stages_vector& stages)
{
    model::run_events_vector events;
    for (model::stages_vector::size_type i = 0; i < stages.size(); ++i)
        events.push_back(model::run_event(1, stages[i],
                                          at(static_cast< int >(i)), ""));
    return events;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(is_finished);
ATF_TEST_CASE_BODY(is_finished)
{
    model::stages_vector stages;
    ATF_REQUIRE(!engine::is_finished(make_events(stages)));

    stages.push_back(model::stage_preparation);
    ATF_REQUIRE(!engine::is_finished(make_events(stages)));
    stages.push_back(model::stage_building);
    ATF_REQUIRE(!engine::is_finished(make_events(stages)));
    stages.push_back(model::stage_testing);
    ATF_REQUIRE(!engine::is_finished(make_events(stages)));

    model::stages_vector completed = stages;
    completed.push_back(model::stage_completed);
    ATF_REQUIRE(engine::is_finished(make_events(completed)));

    model::stages_vector canceled = stages;
    canceled.push_back(model::stage_canceled);
    ATF_REQUIRE(engine::is_finished(make_events(canceled)));
}


ATF_TEST_CASE_WITHOUT_HEAD(has_failed);
ATF_TEST_CASE_BODY(has_failed)
{
    model::stages_vector stages;
    ATF_REQUIRE(!engine::has_failed(make_events(stages)));

    stages.push_back(model::stage_preparation);
    ATF_REQUIRE(!engine::has_failed(make_events(stages)));

    model::stages_vector completed = stages;
    completed.push_back(model::stage_completed);
    ATF_REQUIRE(!engine::has_failed(make_events(completed)));

    model::stages_vector canceled = stages;
    canceled.push_back(model::stage_canceled);
    ATF_REQUIRE(engine::has_failed(make_events(canceled)));
}


ATF_TEST_CASE_WITHOUT_HEAD(is_malformed);
ATF_TEST_CASE_BODY(is_malformed)
{
    model::stages_vector stages;
    ATF_REQUIRE(!engine::is_malformed(make_events(stages)));

    stages.push_back(model::stage_preparation);
    stages.push_back(model::stage_testing);
    ATF_REQUIRE(!engine::is_malformed(make_events(stages)));

    stages.clear();
    stages.push_back(model::stage_building);
    ATF_REQUIRE(engine::is_malformed(make_events(stages)));
}


ATF_TEST_CASE_WITHOUT_HEAD(derive_progress__empty);
ATF_TEST_CASE_BODY(derive_progress__empty)
{
    const model::progress_report report = engine::derive_progress(
        model::run_events_vector());
    ATF_REQUIRE_EQ(model::progress_report::state_error, report.state());
    ATF_REQUIRE_EQ(-1, report.step_index());
    ATF_REQUIRE(!report.start());
    ATF_REQUIRE(!report.end());
    ATF_REQUIRE(!report.is_malformed());
}


ATF_TEST_CASE_WITHOUT_HEAD(derive_progress__single_event);
ATF_TEST_CASE_BODY(derive_progress__single_event)
{
    model::stages_vector stages;
    stages.push_back(model::stage_preparation);
    const model::progress_report report = engine::derive_progress(
        make_events(stages));
    ATF_REQUIRE_EQ(model::progress_report::state_ok, report.state());
    ATF_REQUIRE_EQ(0, report.step_index());
    ATF_REQUIRE_EQ(at(0), report.start().get());
    ATF_REQUIRE(!report.end());
}


ATF_TEST_CASE_WITHOUT_HEAD(derive_progress__in_progress);
ATF_TEST_CASE_BODY(derive_progress__in_progress)
{
    model::stages_vector stages;
    stages.push_back(model::stage_preparation);
    stages.push_back(model::stage_building);
    stages.push_back(model::stage_testing);
    const model::progress_report report = engine::derive_progress(
        make_events(stages));
    ATF_REQUIRE_EQ(model::progress_report::state_ok, report.state());
    ATF_REQUIRE_EQ(2, report.step_index());
    ATF_REQUIRE_EQ(at(0), report.start().get());
    ATF_REQUIRE(!report.end());
}


ATF_TEST_CASE_WITHOUT_HEAD(derive_progress__completed);
ATF_TEST_CASE_BODY(derive_progress__completed)
{
    model::stages_vector stages;
    stages.push_back(model::stage_preparation);
    stages.push_back(model::stage_building);
    stages.push_back(model::stage_testing);
    stages.push_back(model::stage_completed);
    const model::progress_report report = engine::derive_progress(
        make_events(stages));
    ATF_REQUIRE_EQ(model::progress_report::state_ok, report.state());
    ATF_REQUIRE_EQ(model::stage_index(model::stage_completed),
                   report.step_index());
    ATF_REQUIRE_EQ(at(0), report.start().get());
    ATF_REQUIRE_EQ(at(3), report.end().get());
}


ATF_TEST_CASE_WITHOUT_HEAD(derive_progress__canceled_after_stages);
ATF_TEST_CASE_BODY(derive_progress__canceled_after_stages)
{
    model::stages_vector stages;
    stages.push_back(model::stage_preparation);
    stages.push_back(model::stage_building);
    stages.push_back(model::stage_testing);
    stages.push_back(model::stage_canceled);
    const model::progress_report report = engine::derive_progress(
        make_events(stages));
    ATF_REQUIRE_EQ(model::progress_report::state_error, report.state());
    ATF_REQUIRE_EQ(2, report.step_index());
    ATF_REQUIRE_EQ(at(0), report.start().get());
    ATF_REQUIRE_EQ(at(3), report.end().get());
}


ATF_TEST_CASE_WITHOUT_HEAD(derive_progress__canceled_only);
ATF_TEST_CASE_BODY(derive_progress__canceled_only)
{
    model::stages_vector stages;
    stages.push_back(model::stage_canceled);
    const model::progress_report report = engine::derive_progress(
        make_events(stages));
    ATF_REQUIRE_EQ(model::progress_report::state_error, report.state());
    ATF_REQUIRE_EQ(-1, report.step_index());
    ATF_REQUIRE_EQ(at(0), report.start().get());
    ATF_REQUIRE_EQ(at(0), report.end().get());
    ATF_REQUIRE(report.is_malformed());
}


ATF_TEST_CASE_WITHOUT_HEAD(derive_progress__malformed_is_tolerated);
ATF_TEST_CASE_BODY(derive_progress__malformed_is_tolerated)
{
    model::stages_vector stages;
    stages.push_back(model::stage_testing);
    stages.push_back(model::stage_building);
    const model::progress_report report = engine::derive_progress(
        make_events(stages));
    ATF_REQUIRE_EQ(model::progress_report::state_ok, report.state());
    ATF_REQUIRE_EQ(1, report.step_index());
    ATF_REQUIRE_EQ(at(0), report.start().get());
    ATF_REQUIRE(!report.end());
    ATF_REQUIRE(report.is_malformed());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, is_finished);
    ATF_ADD_TEST_CASE(tcs, has_failed);
    ATF_ADD_TEST_CASE(tcs, is_malformed);

    ATF_ADD_TEST_CASE(tcs, derive_progress__empty);
    ATF_ADD_TEST_CASE(tcs, derive_progress__single_event);
    ATF_ADD_TEST_CASE(tcs, derive_progress__in_progress);
    ATF_ADD_TEST_CASE(tcs, derive_progress__completed);
    ATF_ADD_TEST_CASE(tcs, derive_progress__canceled_after_stages);
    ATF_ADD_TEST_CASE(tcs, derive_progress__canceled_only);
    ATF_ADD_TEST_CASE(tcs, derive_progress__malformed_is_tolerated);
}
