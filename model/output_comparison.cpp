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

#include "model/output_comparison.hpp"

#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/text/operations.hpp"

namespace text = utils::text;

using utils::optional;


/// Constructs a new output comparison.
///
/// \param run_id_ Identifier of the run.
/// \param case_id_ Identifier of the test case.
/// \param output_id_ Identifier of the output definition.
/// \param extension_ File extension of the output definition.  May be empty.
/// \param expected_ref_ Reference to the artifact with the expected output.
/// \param actual_ref_ Reference to the artifact with the actual output, or none
///     if the actual output matched the expected one.
model::output_comparison::output_comparison(
    const int64_t run_id_, const int64_t case_id_, const int64_t output_id_,
    const std::string& extension_, const std::string& expected_ref_,
    const optional< std::string >& actual_ref_) :
    _run_id(run_id_),
    _case_id(case_id_),
    _output_id(output_id_),
    _extension(extension_),
    _expected_ref(expected_ref_),
    _actual_ref(actual_ref_)
{
}


/// \return The identifier of the run.
int64_t
model::output_comparison::run_id(void) const
{
    return _run_id;
}


/// \return The identifier of the test case.
int64_t
model::output_comparison::case_id(void) const
{
    return _case_id;
}


/// \return The identifier of the output definition.
int64_t
model::output_comparison::output_id(void) const
{
    return _output_id;
}


/// \return The file extension of the output definition.
const std::string&
model::output_comparison::extension(void) const
{
    return _extension;
}


/// \return The reference to the artifact with the expected output.
const std::string&
model::output_comparison::expected_ref(void) const
{
    return _expected_ref;
}


/// \return The reference to the artifact with the actual output, if any.
const optional< std::string >&
model::output_comparison::actual_ref(void) const
{
    return _actual_ref;
}


/// Checks whether the actual output matched the expected output.
///
/// \return True if no actual output was recorded.
bool
model::output_comparison::matches(void) const
{
    return !_actual_ref;
}


/// Gets the name of the artifact holding the expected output.
///
/// \return The expected reference followed by the extension.
std::string
model::output_comparison::expected_file(void) const
{
    return _expected_ref + _extension;
}


/// Gets the name of the artifact holding the actual output.
///
/// If the output matched, the actual output is the expected output.
///
/// \return The actual reference followed by the extension.
std::string
model::output_comparison::actual_file(void) const
{
    if (_actual_ref)
        return _actual_ref.get() + _extension;
    else
        return expected_file();
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::output_comparison::operator==(const output_comparison& other) const
{
    return _run_id == other._run_id && _case_id == other._case_id &&
        _output_id == other._output_id && _extension == other._extension &&
        _expected_ref == other._expected_ref &&
        _actual_ref == other._actual_ref;
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::output_comparison::operator!=(const output_comparison& other) const
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
model::operator<<(std::ostream& output, const output_comparison& object)
{
    output << F("model::output_comparison{run_id=%s, case_id=%s, "
                "output_id=%s, extension=%s, expected_ref=%s, actual_ref=%s}")
        % object.run_id() % object.case_id() % object.output_id()
        % text::quote(object.extension(), '\'')
        % text::quote(object.expected_ref(), '\'')
        % object.actual_ref();
    return output;
}
