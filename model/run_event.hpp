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

/// \file model/run_event.hpp
/// Definition of the "run event" concept.

#if !defined(MODEL_RUN_EVENT_HPP)
#define MODEL_RUN_EVENT_HPP

#include "model/run_event_fwd.hpp"

extern "C" {
#include <stdint.h>
}

#include <ostream>
#include <string>

#include "model/stage.hpp"
#include "utils/datetime.hpp"

namespace model {


/// Immutable record of a run entering a stage or a terminal outcome.
class run_event {
    /// Identifier of the run this event belongs to.
    int64_t _run_id;

    /// The stage entered by the run.
    model::stage _stage;

    /// The moment at which the stage was entered.
    utils::datetime::timestamp _timestamp;

    /// Free-form message attached to the event.
    std::string _message;

public:
    run_event(const int64_t, const model::stage,
              const utils::datetime::timestamp&, const std::string&);

    int64_t run_id(void) const;
    model::stage stage(void) const;
    const utils::datetime::timestamp& timestamp(void) const;
    const std::string& message(void) const;

    bool operator==(const run_event&) const;
    bool operator!=(const run_event&) const;
};


std::ostream& operator<<(std::ostream&, const run_event&);


}  // namespace model

#endif  // !defined(MODEL_RUN_EVENT_HPP)
