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

/// \file model/case_result.hpp
/// Definition of the result of a single test case within a run.

#if !defined(MODEL_CASE_RESULT_HPP)
#define MODEL_CASE_RESULT_HPP

extern "C" {
#include <stdint.h>
}

#include <ostream>
#include <vector>

namespace model {


/// Outcome of running one test case as part of a run.
///
/// The exit code is only one of the failure signals of a case: the outputs
/// of the case are compared separately (see output_comparison).
class case_result {
    /// Identifier of the run.
    int64_t _run_id;

    /// Identifier of the test case.
    int64_t _case_id;

    /// Time it took to execute the case, in milliseconds.
    int64_t _runtime_ms;

    /// Exit code returned by the case.
    int _exit_code;

    /// Exit code the case was expected to return.
    int _expected_exit_code;

public:
    case_result(const int64_t, const int64_t, const int64_t, const int,
                const int);

    int64_t run_id(void) const;
    int64_t case_id(void) const;
    int64_t runtime_ms(void) const;
    int exit_code(void) const;
    int expected_exit_code(void) const;

    bool exit_code_matches(void) const;

    bool operator==(const case_result&) const;
    bool operator!=(const case_result&) const;
};


/// Collection of case results.
typedef std::vector< case_result > case_results_vector;


std::ostream& operator<<(std::ostream&, const case_result&);


}  // namespace model

#endif  // !defined(MODEL_CASE_RESULT_HPP)
