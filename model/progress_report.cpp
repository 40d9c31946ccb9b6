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

#include "model/progress_report.hpp"

#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;

using utils::optional;


/// Constructs a new progress report.
///
/// \param state_ Overall state of the run.
/// \param step_index_ Index of the current stage in ordered_stages(), or -1.
/// \param start_ Timestamp of the first event, if any.
/// \param end_ Timestamp of the terminal event, if any.
/// \param malformed_ Whether the events look malformed.
model::progress_report::progress_report(
    const state_type state_, const int step_index_,
    const optional< datetime::timestamp >& start_,
    const optional< datetime::timestamp >& end_,
    const bool malformed_) :
    _state(state_),
    _step_index(step_index_),
    _start(start_),
    _end(end_),
    _malformed(malformed_)
{
    PRE(_step_index >= -1 &&
        _step_index < static_cast< int >(ordered_stages().size()));
}


/// Returns the overall state of the run.
///
/// \return The state.
model::progress_report::state_type
model::progress_report::state(void) const
{
    return _state;
}


/// Returns the textual representation of the overall state of the run.
///
/// \return "ok" or "error".
const char*
model::progress_report::state_name(void) const
{
    switch (_state) {
    case state_ok: return "ok";
    case state_error: return "error";
    }
    UNREACHABLE;
}


/// Returns the index of the current stage of the run.
///
/// \return An index into stages(), or -1 if unknown or not yet started.
int
model::progress_report::step_index(void) const
{
    return _step_index;
}


/// Returns the ordered list of stages the step index refers to.
///
/// \return The ordered stages.
const model::stages_vector&
model::progress_report::stages(void) const
{
    return ordered_stages();
}


/// Returns the timestamp of the first event of the run.
///
/// \return A timestamp, or none if the run has no events.
const optional< datetime::timestamp >&
model::progress_report::start(void) const
{
    return _start;
}


/// Returns the timestamp of the terminal event of the run.
///
/// \return A timestamp, or none if the run has not finished.
const optional< datetime::timestamp >&
model::progress_report::end(void) const
{
    return _end;
}


/// Checks whether the events of the run looked malformed.
///
/// This is purely diagnostic: a malformed sequence still yields a report.
///
/// \return True if the first event was not the preparation stage.
bool
model::progress_report::is_malformed(void) const
{
    return _malformed;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::progress_report::operator==(const progress_report& other) const
{
    return _state == other._state && _step_index == other._step_index &&
        _start == other._start && _end == other._end &&
        _malformed == other._malformed;
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::progress_report::operator!=(const progress_report& other) const
{
    return !(*this == other);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const progress_report& object)
{
    output << F("model::progress_report{state=%s, step_index=%s, start=%s, "
                "end=%s, malformed=%s}")
        % object.state_name() % object.step_index() % object.start()
        % object.end() % object.is_malformed();
    return output;
}
