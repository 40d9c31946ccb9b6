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

#include "engine/results.hpp"

#include <sstream>

#include "engine/artifacts.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"

namespace fs = utils::fs;


namespace {


/// Formats a collection of output identifiers as a comma-separated list.
///
/// \param ids The identifiers to format.
///
/// \return The textual representation of the identifiers.
static std::string
format_ids(const engine::output_ids_vector& ids)
{
    std::ostringstream output;
    for (engine::output_ids_vector::const_iterator iter = ids.begin();
         iter != ids.end(); ++iter) {
        if (iter != ids.begin())
            output << ", ";
        output << *iter;
    }
    return output.str();
}


}  // anonymous namespace


/// Constructs a new case outcome.
///
/// \param case_id_ Identifier of the test case.
/// \param exit_code_matched_ Whether the exit code matched the expected one.
/// \param runtime_ms_ Time the test case took to run, in milliseconds.
/// \param mismatching_outputs_ Identifiers of the outputs that differ from
///     their expected version.
engine::case_outcome::case_outcome(
    const int64_t case_id_, const bool exit_code_matched_,
    const int64_t runtime_ms_,
    const output_ids_vector& mismatching_outputs_) :
    _case_id(case_id_),
    _exit_code_matched(exit_code_matched_),
    _runtime_ms(runtime_ms_),
    _mismatching_outputs(mismatching_outputs_)
{
}


/// Returns the identifier of the test case.
///
/// \return A test case identifier.
int64_t
engine::case_outcome::case_id(void) const
{
    return _case_id;
}


/// Checks whether the test case passed.
///
/// \return True if the exit code matched and no output differs.
bool
engine::case_outcome::passed(void) const
{
    return _exit_code_matched && _mismatching_outputs.empty();
}


/// Returns whether the exit code matched the expected one.
///
/// \return A boolean.
bool
engine::case_outcome::exit_code_matched(void) const
{
    return _exit_code_matched;
}


/// Returns the time the test case took to run.
///
/// \return A duration in milliseconds.
int64_t
engine::case_outcome::runtime_ms(void) const
{
    return _runtime_ms;
}


/// Returns the identifiers of the outputs that differ.
///
/// \return A collection of output identifiers; empty if all outputs match.
const engine::output_ids_vector&
engine::case_outcome::mismatching_outputs(void) const
{
    return _mismatching_outputs;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
engine::case_outcome::operator==(const case_outcome& other) const
{
    return _case_id == other._case_id &&
        _exit_code_matched == other._exit_code_matched &&
        _runtime_ms == other._runtime_ms &&
        _mismatching_outputs == other._mismatching_outputs;
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
engine::case_outcome::operator!=(const case_outcome& other) const
{
    return !(*this == other);
}


/// Constructs a new run outcome.
///
/// \param cases_ Outcomes of the test cases of the run.
engine::run_outcome::run_outcome(const case_outcomes_vector& cases_) :
    _cases(cases_)
{
}


/// Returns the outcomes of the test cases of the run.
///
/// \return A collection of case outcomes.
const engine::case_outcomes_vector&
engine::run_outcome::cases(void) const
{
    return _cases;
}


/// Counts the test cases that passed.
///
/// \return A number of test cases.
std::size_t
engine::run_outcome::passed_count(void) const
{
    std::size_t count = 0;
    for (case_outcomes_vector::const_iterator iter = _cases.begin();
         iter != _cases.end(); ++iter) {
        if ((*iter).passed())
            ++count;
    }
    return count;
}


/// Counts the test cases that failed.
///
/// \return A number of test cases.
std::size_t
engine::run_outcome::failed_count(void) const
{
    return _cases.size() - passed_count();
}


/// Adds up the runtime of all test cases.
///
/// \return A duration in milliseconds.
int64_t
engine::run_outcome::total_runtime_ms(void) const
{
    int64_t total = 0;
    for (case_outcomes_vector::const_iterator iter = _cases.begin();
         iter != _cases.end(); ++iter)
        total += (*iter).runtime_ms();
    return total;
}


/// Checks whether all the test cases of the run passed.
///
/// \return True if no test case failed, including when there are none.
bool
engine::run_outcome::all_passed(void) const
{
    return failed_count() == 0;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
engine::operator<<(std::ostream& output, const case_outcome& object)
{
    output << F("engine::case_outcome{case_id=%s, passed=%s, "
                "exit_code_matched=%s, runtime_ms=%s, "
                "mismatching_outputs=[%s]}")
        % object.case_id() % object.passed() % object.exit_code_matched()
        % object.runtime_ms() % format_ids(object.mismatching_outputs());
    return output;
}


/// Assembles the outcome of a run.
///
/// \param results The results of the test cases of the run.
/// \param comparisons The output comparisons of the run.  Comparisons that
///     do not belong to any of the given results are ignored.
///
/// \return The outcome of the run, with one entry per result in the same
/// order.
engine::run_outcome
engine::aggregate_results(const model::case_results_vector& results,
                          const model::output_comparisons_vector& comparisons)
{
    case_outcomes_vector cases;
    for (model::case_results_vector::const_iterator iter = results.begin();
         iter != results.end(); ++iter) {
        const model::case_result& result = *iter;

        output_ids_vector mismatching;
        for (model::output_comparisons_vector::const_iterator iter2 =
                 comparisons.begin(); iter2 != comparisons.end(); ++iter2) {
            const model::output_comparison& comparison = *iter2;
            if (comparison.run_id() == result.run_id() &&
                comparison.case_id() == result.case_id() &&
                !comparison.matches())
                mismatching.push_back(comparison.output_id());
        }

        const case_outcome outcome(result.case_id(),
                                   result.exit_code_matches(),
                                   result.runtime_ms(), mismatching);
        LD(F("Aggregated %s") % outcome);
        cases.push_back(outcome);
    }
    return run_outcome(cases);
}


/// Renders the diff of an output comparison.
///
/// Diffs are not cached: the artifacts are read and compared on every call.
///
/// \param base The directory holding the artifacts.
/// \param comparison The output comparison to render.  If it has no actual
///     file, the expected file is compared against itself.
/// \param mode The output format.
///
/// \return The HTML text of the diff.
///
/// \throw artifact_not_found If any of the files is missing.
/// \throw decoding_error If any of the files cannot be decoded.
std::string
engine::generate_diff(const fs::path& base,
                      const model::output_comparison& comparison,
                      const render_mode mode)
{
    LD(F("Generating diff for %s vs %s") % comparison.expected_file() %
       comparison.actual_file());

    const decoded_file expected = read_artifact(base,
                                                comparison.expected_file());
    if (comparison.matches())
        return compute_diff(expected.lines(), expected.lines(), mode);

    const decoded_file actual = read_artifact(base, comparison.actual_file());
    return compute_diff(expected.lines(), actual.lines(), mode);
}
