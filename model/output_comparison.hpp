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

/// \file model/output_comparison.hpp
/// Definition of the comparison of one output of a test case.

#if !defined(MODEL_OUTPUT_COMPARISON_HPP)
#define MODEL_OUTPUT_COMPARISON_HPP

extern "C" {
#include <stdint.h>
}

#include <ostream>
#include <string>
#include <vector>

#include "utils/optional.hpp"

namespace model {


/// Comparison between the expected and the actual contents of an output.
///
/// Outputs are stored as artifacts named after a reference plus the extension
/// of the output definition.  If the actual output is byte-identical to the
/// expected output, no actual reference is recorded.
class output_comparison {
    /// Identifier of the run.
    int64_t _run_id;

    /// Identifier of the test case.
    int64_t _case_id;

    /// Identifier of the output definition of the test case.
    int64_t _output_id;

    /// File extension of the output definition, including the dot.
    std::string _extension;

    /// Reference to the artifact with the expected output.
    std::string _expected_ref;

    /// Reference to the artifact with the actual output, if it differs.
    utils::optional< std::string > _actual_ref;

public:
    output_comparison(const int64_t, const int64_t, const int64_t,
                      const std::string&, const std::string&,
                      const utils::optional< std::string >&);

    int64_t run_id(void) const;
    int64_t case_id(void) const;
    int64_t output_id(void) const;
    const std::string& extension(void) const;
    const std::string& expected_ref(void) const;
    const utils::optional< std::string >& actual_ref(void) const;

    bool matches(void) const;
    std::string expected_file(void) const;
    std::string actual_file(void) const;

    bool operator==(const output_comparison&) const;
    bool operator!=(const output_comparison&) const;
};


/// Collection of output comparisons.
typedef std::vector< output_comparison > output_comparisons_vector;


std::ostream& operator<<(std::ostream&, const output_comparison&);


}  // namespace model

#endif  // !defined(MODEL_OUTPUT_COMPARISON_HPP)
