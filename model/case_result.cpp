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

#include "model/case_result.hpp"

#include "utils/format/macros.hpp"


/// Constructs a new case result.
///
/// \param run_id_ Identifier of the run.
/// \param case_id_ Identifier of the test case.
/// \param runtime_ms_ Time it took to execute the case, in milliseconds.
/// \param exit_code_ Exit code returned by the case.
/// \param expected_exit_code_ Exit code the case was expected to return.
model::case_result::case_result(const int64_t run_id_, const int64_t case_id_,
                                const int64_t runtime_ms_,
                                const int exit_code_,
                                const int expected_exit_code_) :
    _run_id(run_id_),
    _case_id(case_id_),
    _runtime_ms(runtime_ms_),
    _exit_code(exit_code_),
    _expected_exit_code(expected_exit_code_)
{
}


/// \return The identifier of the run.
int64_t
model::case_result::run_id(void) const
{
    return _run_id;
}


/// \return The identifier of the test case.
int64_t
model::case_result::case_id(void) const
{
    return _case_id;
}


/// \return The execution time of the case in milliseconds.
int64_t
model::case_result::runtime_ms(void) const
{
    return _runtime_ms;
}


/// \return The exit code returned by the case.
int
model::case_result::exit_code(void) const
{
    return _exit_code;
}


/// \return The exit code the case was expected to return.
int
model::case_result::expected_exit_code(void) const
{
    return _expected_exit_code;
}


/// Checks whether the case returned the expected exit code.
///
/// \return True if the actual and expected exit codes are equal.
bool
model::case_result::exit_code_matches(void) const
{
    return _exit_code == _expected_exit_code;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::case_result::operator==(const case_result& other) const
{
    return _run_id == other._run_id && _case_id == other._case_id &&
        _runtime_ms == other._runtime_ms && _exit_code == other._exit_code &&
        _expected_exit_code == other._expected_exit_code;
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::case_result::operator!=(const case_result& other) const
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
model::operator<<(std::ostream& output, const case_result& object)
{
    output << F("model::case_result{run_id=%s, case_id=%s, runtime_ms=%s, "
                "exit_code=%s, expected_exit_code=%s}")
        % object.run_id() % object.case_id() % object.runtime_ms()
        % object.exit_code() % object.expected_exit_code();
    return output;
}
