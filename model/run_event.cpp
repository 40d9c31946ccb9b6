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

#include "utils/format/macros.hpp"
#include "utils/text/operations.hpp"

namespace datetime = utils::datetime;
namespace text = utils::text;


/// Constructs a new event.
///
/// \param run_id_ Identifier of the run this event belongs to.
/// \param stage_ The stage entered by the run.
/// \param timestamp_ The moment at which the stage was entered.
/// \param message_ Free-form message attached to the event; may be empty.
model::run_event::run_event(const int64_t run_id_, const model::stage stage_,
                            const datetime::timestamp& timestamp_,
                            const std::string& message_) :
    _run_id(run_id_),
    _stage(stage_),
    _timestamp(timestamp_),
    _message(message_)
{
}


/// Returns the identifier of the run this event belongs to.
///
/// \return A run identifier.
int64_t
model::run_event::run_id(void) const
{
    return _run_id;
}


/// Returns the stage entered by the run.
///
/// \return A stage or terminal outcome.
model::stage
model::run_event::stage(void) const
{
    return _stage;
}


/// Returns the moment at which the stage was entered.
///
/// \return A timestamp.
const datetime::timestamp&
model::run_event::timestamp(void) const
{
    return _timestamp;
}


/// Returns the message attached to the event.
///
/// \return A message, possibly empty.
const std::string&
model::run_event::message(void) const
{
    return _message;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::run_event::operator==(const run_event& other) const
{
    return _run_id == other._run_id && _stage == other._stage &&
        _timestamp == other._timestamp && _message == other._message;
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::run_event::operator!=(const run_event& other) const
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
model::operator<<(std::ostream& output, const run_event& object)
{
    output << F("model::run_event{run_id=%s, stage=%s, timestamp=%s, "
                "message=%s}")
        % object.run_id()
        % text::quote(stage_name(object.stage()), '\'')
        % object.timestamp()
        % text::quote(object.message(), '\'');
    return output;
}
