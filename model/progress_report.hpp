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

/// \file model/progress_report.hpp
/// Definition of the progress report of a run.

#if !defined(MODEL_PROGRESS_REPORT_HPP)
#define MODEL_PROGRESS_REPORT_HPP

#include <ostream>

#include "model/stage.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.hpp"

namespace model {


/// Summary of the position of a run in the sequence of stages.
///
/// Reports are always derived from the events of a run and are never stored.
class progress_report {
public:
    /// Overall state of the run.
    enum state_type {
        state_ok,
        state_error
    };

private:
    /// Overall state of the run.
    state_type _state;

    /// Index of the current stage in ordered_stages(); -1 if unknown.
    int _step_index;

    /// Timestamp of the first event of the run, if any.
    utils::optional< utils::datetime::timestamp > _start;

    /// Timestamp of the terminal event of the run, if the run has finished.
    utils::optional< utils::datetime::timestamp > _end;

    /// Whether the events did not start with the preparation stage.
    bool _malformed;

public:
    progress_report(const state_type, const int,
                    const utils::optional< utils::datetime::timestamp >&,
                    const utils::optional< utils::datetime::timestamp >&,
                    const bool);

    state_type state(void) const;
    const char* state_name(void) const;
    int step_index(void) const;
    const stages_vector& stages(void) const;
    const utils::optional< utils::datetime::timestamp >& start(void) const;
    const utils::optional< utils::datetime::timestamp >& end(void) const;
    bool is_malformed(void) const;

    bool operator==(const progress_report&) const;
    bool operator!=(const progress_report&) const;
};


std::ostream& operator<<(std::ostream&, const progress_report&);


}  // namespace model

#endif  // !defined(MODEL_PROGRESS_REPORT_HPP)
