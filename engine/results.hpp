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

/// \file engine/results.hpp
/// Aggregation of the per-case results of a run into its outcome.
///
/// A test case passes only if its exit code matches the expected one and all
/// of its outputs match their expected versions.  Outputs that match are
/// recorded without an actual file, so a mismatch is detected by the mere
/// presence of the actual file reference.

#if !defined(ENGINE_RESULTS_HPP)
#define ENGINE_RESULTS_HPP

#include <stdint.h>

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "engine/diff.hpp"
#include "model/case_result.hpp"
#include "model/output_comparison.hpp"
#include "utils/fs/path.hpp"

namespace engine {


/// Collection of output identifiers.
typedef std::vector< int64_t > output_ids_vector;


/// Outcome of a single test case within a run.
class case_outcome {
    /// Identifier of the test case.
    int64_t _case_id;

    /// Whether the exit code of the test case matched the expected one.
    bool _exit_code_matched;

    /// Time the test case took to run, in milliseconds.
    int64_t _runtime_ms;

    /// Identifiers of the outputs that did not match their expected version.
    output_ids_vector _mismatching_outputs;

public:
    case_outcome(const int64_t, const bool, const int64_t,
                 const output_ids_vector&);

    int64_t case_id(void) const;
    bool passed(void) const;
    bool exit_code_matched(void) const;
    int64_t runtime_ms(void) const;
    const output_ids_vector& mismatching_outputs(void) const;

    bool operator==(const case_outcome&) const;
    bool operator!=(const case_outcome&) const;
};


/// Collection of case outcomes.
typedef std::vector< case_outcome > case_outcomes_vector;


/// Externally-reported outcome of a run.
class run_outcome {
    /// Outcomes of the test cases, in the order in which they were given.
    case_outcomes_vector _cases;

public:
    explicit run_outcome(const case_outcomes_vector&);

    const case_outcomes_vector& cases(void) const;
    std::size_t passed_count(void) const;
    std::size_t failed_count(void) const;
    int64_t total_runtime_ms(void) const;
    bool all_passed(void) const;
};


std::ostream& operator<<(std::ostream&, const case_outcome&);


run_outcome aggregate_results(const model::case_results_vector&,
                              const model::output_comparisons_vector&);
std::string generate_diff(const utils::fs::path&,
                          const model::output_comparison&,
                          const render_mode);


}  // namespace engine


#endif  // !defined(ENGINE_RESULTS_HPP)
