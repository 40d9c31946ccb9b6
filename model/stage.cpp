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

#include "model/stage.hpp"

#include "model/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"


namespace {


/// Position-ordered table of the stages of a run.
static const model::stage ordered_stages_table[] = {
    model::stage_preparation,
    model::stage_building,
    model::stage_testing,
    model::stage_completed,
};


/// Number of entries in ordered_stages_table.
static const std::size_t num_ordered_stages =
    sizeof(ordered_stages_table) / sizeof(ordered_stages_table[0]);


/// Process-wide, immutable list of ordered stages.
static const model::stages_vector all_ordered_stages(
    ordered_stages_table, ordered_stages_table + num_ordered_stages);


}  // anonymous namespace


/// Gets the stages of a run in the order in which they are visited.
///
/// \return The preparation, building, testing and completed stages.  The
/// canceled outcome is never part of this list.
const model::stages_vector&
model::ordered_stages(void)
{
    return all_ordered_stages;
}


/// Gets the position of a stage within ordered_stages().
///
/// \param stage_ The stage to look up.
///
/// \return The index of the stage, or -1 if the stage is not one of the
/// ordered stages (e.g. it is the canceled outcome).
int
model::stage_index(const stage stage_)
{
    for (std::size_t i = 0; i < num_ordered_stages; ++i) {
        if (ordered_stages_table[i] == stage_)
            return static_cast< int >(i);
    }
    return -1;
}


/// Checks whether a stage ends a run.
///
/// \param stage_ The stage to check.
///
/// \return True for the completed stage and the canceled outcome.
bool
model::is_terminal(const stage stage_)
{
    return stage_ == stage_completed || stage_ == stage_canceled;
}


/// Gets the stable identifier of a stage.
///
/// This identifier is used in the database and on the command line.
///
/// \param stage_ The stage to convert.
///
/// \return A lowercase identifier.
const char*
model::stage_name(const stage stage_)
{
    switch (stage_) {
    case stage_preparation: return "preparation";
    case stage_building: return "building";
    case stage_testing: return "testing";
    case stage_completed: return "completed";
    case stage_canceled: return "canceled";
    }
    UNREACHABLE;
}


/// Gets the user-friendly description of a stage.
///
/// \param stage_ The stage to describe.
///
/// \return A short description.
const char*
model::stage_description(const stage stage_)
{
    switch (stage_) {
    case stage_preparation: return "Preparation";
    case stage_building: return "Building";
    case stage_testing: return "Testing";
    case stage_completed: return "Completed";
    case stage_canceled: return "Canceled/Error";
    }
    UNREACHABLE;
}


/// Parses the identifier of a stage.
///
/// \param name The identifier, as returned by stage_name().
///
/// \return The stage.
///
/// \throw format_error If the identifier is not known.
model::stage
model::parse_stage(const std::string& name)
{
    if (name == "preparation")
        return stage_preparation;
    else if (name == "building")
        return stage_building;
    else if (name == "testing")
        return stage_testing;
    else if (name == "completed")
        return stage_completed;
    else if (name == "canceled")
        return stage_canceled;
    else
        throw format_error(F("Unknown stage '%s'") % name);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const stage object)
{
    output << stage_name(object);
    return output;
}
