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

#include "store/dbtypes.hpp"

#include "model/exceptions.hpp"
#include "model/run.hpp"
#include "store/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sqlite/statement.ipp"

namespace datetime = utils::datetime;
namespace sqlite = utils::sqlite;

using utils::none;
using utils::optional;


namespace {


/// Queries a text column from a statement, checking its type.
///
/// \param stmt The statement from which to get the column.
/// \param column The name of the column holding the value.
/// \param what Description of the value, for error reporting purposes.
///
/// \return The text in the column.
///
/// \throw integrity_error If the column does not hold a string.
static std::string
text_column(sqlite::statement& stmt, const char* column, const char* what)
{
    const int id = stmt.column_id(column);
    if (stmt.column_type(id) != sqlite::type_text)
        throw store::integrity_error(F("%s in column %s is not a string") %
                                     what % column);
    return stmt.column_text(id);
}


}  // anonymous namespace


/// Binds an optional string to a statement parameter.
///
/// \param stmt The statement to which to bind the parameter.
/// \param field The name of the parameter; must exist.
/// \param str The string to bind; none binds NULL.
void
store::bind_optional_string(sqlite::statement& stmt, const char* field,
                            const optional< std::string >& str)
{
    if (str)
        stmt.bind(field, str.get());
    else
        stmt.bind(field, sqlite::null());
}


/// Binds a platform to a statement parameter.
///
/// \param stmt The statement to which to bind the parameter.
/// \param field The name of the parameter; must exist.
/// \param platform The value to bind.
void
store::bind_platform(sqlite::statement& stmt, const char* field,
                     const model::platform platform)
{
    stmt.bind(field, std::string(model::platform_name(platform)));
}


/// Binds a run type to a statement parameter.
///
/// \param stmt The statement to which to bind the parameter.
/// \param field The name of the parameter; must exist.
/// \param type The value to bind.
void
store::bind_run_type(sqlite::statement& stmt, const char* field,
                     const model::run_type type)
{
    stmt.bind(field, std::string(model::run_type_name(type)));
}


/// Binds a stage to a statement parameter.
///
/// \param stmt The statement to which to bind the parameter.
/// \param field The name of the parameter; must exist.
/// \param stage The value to bind.
void
store::bind_stage(sqlite::statement& stmt, const char* field,
                  const model::stage stage)
{
    stmt.bind(field, std::string(model::stage_name(stage)));
}


/// Binds a timestamp to a statement parameter.
///
/// Timestamps are stored as microseconds since the Unix epoch in UTC.
///
/// \param stmt The statement to which to bind the parameter.
/// \param field The name of the parameter; must exist.
/// \param timestamp The value to bind.
void
store::bind_timestamp(sqlite::statement& stmt, const char* field,
                      const datetime::timestamp& timestamp)
{
    stmt.bind(field, timestamp.to_microseconds());
}


/// Queries an optional string from a statement.
///
/// \param stmt The statement from which to get the column.
/// \param column The name of the column holding the value.
///
/// \return The string, or none if the column is NULL.
///
/// \throw integrity_error If the value in the specified column is invalid.
optional< std::string >
store::column_optional_string(sqlite::statement& stmt, const char* column)
{
    const int id = stmt.column_id(column);
    switch (stmt.column_type(id)) {
    case sqlite::type_text:
        return utils::make_optional(std::string(stmt.column_text(id)));
    case sqlite::type_null:
        return none;
    default:
        throw integrity_error(F("Invalid string type in column %s") % column);
    }
}


/// Queries a platform from a statement.
///
/// \param stmt The statement from which to get the column.
/// \param column The name of the column holding the value.
///
/// \return The parsed value if all goes well.
///
/// \throw integrity_error If the value in the specified column is invalid.
model::platform
store::column_platform(sqlite::statement& stmt, const char* column)
{
    const std::string value = text_column(stmt, column, "Platform");
    try {
        return model::parse_platform(value);
    } catch (const model::format_error& e) {
        throw integrity_error(e.what());
    }
}


/// Queries a run type from a statement.
///
/// \param stmt The statement from which to get the column.
/// \param column The name of the column holding the value.
///
/// \return The parsed value if all goes well.
///
/// \throw integrity_error If the value in the specified column is invalid.
model::run_type
store::column_run_type(sqlite::statement& stmt, const char* column)
{
    const std::string value = text_column(stmt, column, "Run type");
    try {
        return model::parse_run_type(value);
    } catch (const model::format_error& e) {
        throw integrity_error(e.what());
    }
}


/// Queries a stage from a statement.
///
/// \param stmt The statement from which to get the column.
/// \param column The name of the column holding the value.
///
/// \return The parsed value if all goes well.
///
/// \throw integrity_error If the value in the specified column is invalid.
model::stage
store::column_stage(sqlite::statement& stmt, const char* column)
{
    const std::string value = text_column(stmt, column, "Stage");
    try {
        return model::parse_stage(value);
    } catch (const model::format_error& e) {
        throw integrity_error(e.what());
    }
}


/// Queries a timestamp from a statement.
///
/// The stored value is always interpreted as microseconds since the Unix
/// epoch in UTC, so the returned timestamp is always normalized to UTC.
///
/// \param stmt The statement from which to get the column.
/// \param column The name of the column holding the value.
///
/// \return The parsed value if all goes well.
///
/// \throw integrity_error If the value in the specified column is invalid.
datetime::timestamp
store::column_timestamp(sqlite::statement& stmt, const char* column)
{
    const int id = stmt.column_id(column);
    if (stmt.column_type(id) != sqlite::type_integer)
        throw store::integrity_error(F("Timestamp in column %s is not an "
                                       "integer") % column);
    const int64_t value = stmt.column_int64(id);
    if (value < 0)
        throw store::integrity_error(F("Timestamp in column %s must be "
                                       "positive") % column);
    return datetime::timestamp::from_microseconds(value);
}
