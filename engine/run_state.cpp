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

#include "model/run_event.hpp"
#include "model/stage.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;

using utils::none;
using utils::optional;


/// Checks whether a run has reached a terminal stage.
///
/// \param events The events of the run, in insertion order.
///
/// \return True if the last event corresponds to the completed stage or to
/// the canceled outcome; false otherwise, including for an empty log.
bool
engine::is_finished(const model::run_events_vector& events)
{
    if (events.empty())
        return false;
    return model::is_terminal(events.back().stage());
}


/// Checks whether a run has been canceled.
///
/// \param events The events of the run, in insertion order.
///
/// \return True if the last event corresponds to the canceled outcome.
bool
engine::has_failed(const model::run_events_vector& events)
{
    if (events.empty())
        return false;
    return events.back().stage() == model::stage_canceled;
}


/// Checks whether the event log of a run does not start as expected.
///
/// This is purely diagnostic: derive_progress() is not affected by it.
///
/// \param events The events of the run, in insertion order.
///
/// \return True if the log is not empty and its first event does not
/// correspond to the preparation stage.
bool
engine::is_malformed(const model::run_events_vector& events)
{
    if (events.empty())
        return false;
    return events.front().stage() != model::stage_preparation;
}


/// Computes the progress report of a run.
///
/// \param events The events of the run, in insertion order.
///
/// \return The progress report.  An empty log yields an error report with an
/// unknown step and no timestamps.
model::progress_report
engine::derive_progress(const model::run_events_vector& events)
{
    if (events.empty())
        return model::progress_report(model::progress_report::state_error, -1,
                                      none, none, false);

    const model::run_event& last = events.back();
    const optional< datetime::timestamp > start(events.front().timestamp());
    optional< datetime::timestamp > end;
    if (model::is_terminal(last.stage()))
        end = last.timestamp();

    if (last.stage() == model::stage_canceled) {
        int step_index = -1;
        if (events.size() >= 2) {
            const model::run_event& previous = events[events.size() - 2];
            step_index = model::stage_index(previous.stage());
        }
        return model::progress_report(model::progress_report::state_error,
                                      step_index, start, end,
                                      is_malformed(events));
    } else {
        return model::progress_report(model::progress_report::state_ok,
                                      model::stage_index(last.stage()),
                                      start, end, is_malformed(events));
    }
}
