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

#include "store/read_transaction.hpp"

#include "model/exceptions.hpp"
#include "model/run.hpp"
#include "model/run_event.hpp"
#include "store/backend.hpp"
#include "store/dbtypes.hpp"
#include "store/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"
#include "utils/sqlite/database.hpp"
#include "utils/sqlite/exceptions.hpp"
#include "utils/sqlite/statement.ipp"
#include "utils/sqlite/transaction.hpp"

namespace sqlite = utils::sqlite;


namespace {


/// Ensures that a run exists in the database.
///
/// \param db The database to query.
/// \param run_id The identifier of the run to look for.
///
/// \throw store::error If the run does not exist.
static void
check_run_exists(sqlite::database& db, const int64_t run_id)
{
    sqlite::statement stmt = db.create_statement(
        "SELECT run_id FROM runs WHERE run_id == :run_id");
    stmt.bind(":run_id", run_id);
    if (!stmt.step())
        throw store::error(F("Run %s does not exist") % run_id);
}


/// Builds an output comparison from the current row of a statement.
///
/// \param stmt The statement positioned on a row of the case_outputs table.
///
/// \return The loaded comparison.
///
/// \throw store::integrity_error If the row contains invalid data.
static model::output_comparison
parse_output(sqlite::statement& stmt)
{
    try {
        return model::output_comparison(
            stmt.safe_column_int64("run_id"),
            stmt.safe_column_int64("case_id"),
            stmt.safe_column_int64("output_id"),
            stmt.safe_column_text("extension"),
            stmt.safe_column_text("expected_ref"),
            store::column_optional_string(stmt, "actual_ref"));
    } catch (const sqlite::error& e) {
        throw store::integrity_error(e.what());
    }
}


}  // anonymous namespace


/// Internal implementation for a read-only transaction.
struct store::read_transaction::impl {
    /// The backend instance.
    store::backend _backend;

    /// The SQLite database this transaction deals with.
    sqlite::database _db;

    /// The backing SQLite transaction.
    sqlite::transaction _tx;

    /// Opens a transaction.
    ///
    /// \param backend_ The backend this transaction is connected to.
    impl(backend& backend_) :
        _backend(backend_),
        _db(backend_.database()),
        _tx(backend_.database().begin_transaction())
    {
    }
};


/// Creates a new read-only transaction.
///
/// \param backend_ The backend this transaction belongs to.
store::read_transaction::read_transaction(backend& backend_) :
    _pimpl(new impl(backend_))
{
}


/// Destructor.
store::read_transaction::~read_transaction(void)
{
}


/// Terminates the transaction.
///
/// \throw error If there is any problem when talking to the database.
void
store::read_transaction::finish(void)
{
    try {
        _pimpl->_tx.commit();
    } catch (const sqlite::error& e) {
        throw error(e.what());
    }
}


/// Retrieves a run from the database.
///
/// \param run_id The identifier of the run to retrieve.
///
/// \return The retrieved run.
///
/// \throw error If the run does not exist or if there is a problem loading it.
model::run
store::read_transaction::get_run(const int64_t run_id)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "SELECT platform, run_type, token, fork_url, branch, commit_hash, "
            "pr_nr FROM runs WHERE run_id == :run_id");
        stmt.bind(":run_id", run_id);
        if (!stmt.step())
            throw error(F("Run %s does not exist") % run_id);

        return model::run(column_platform(stmt, "platform"),
                          column_run_type(stmt, "run_type"),
                          stmt.safe_column_text("token"),
                          stmt.safe_column_text("fork_url"),
                          stmt.safe_column_text("branch"),
                          stmt.safe_column_text("commit_hash"),
                          stmt.safe_column_int("pr_nr"));
    } catch (const model::error& e) {
        throw integrity_error(F("Invalid run %s: %s") % run_id % e.what());
    } catch (const sqlite::error& e) {
        throw error(F("Error loading run %s: %s") % run_id % e.what());
    }
}


/// Retrieves the event log of a run.
///
/// \param run_id The identifier of the run.
///
/// \return The events of the run in the order in which they were recorded.
///
/// \throw error If the run does not exist or if there is a problem loading its
///     events.
model::run_events_vector
store::read_transaction::get_run_events(const int64_t run_id)
{
    try {
        check_run_exists(_pimpl->_db, run_id);

        sqlite::statement stmt = _pimpl->_db.create_statement(
            "SELECT stage, timestamp, message FROM run_events "
            "WHERE run_id == :run_id ORDER BY event_id");
        stmt.bind(":run_id", run_id);

        model::run_events_vector events;
        while (stmt.step()) {
            events.push_back(model::run_event(
                run_id, column_stage(stmt, "stage"),
                column_timestamp(stmt, "timestamp"),
                stmt.safe_column_text("message")));
        }
        LD(F("Loaded %s events for run %s") % events.size() % run_id);
        return events;
    } catch (const sqlite::error& e) {
        throw error(F("Error loading events of run %s: %s") % run_id %
                    e.what());
    }
}


/// Retrieves the results of all the test cases of a run.
///
/// \param run_id The identifier of the run.
///
/// \return The case results, sorted by case identifier.
///
/// \throw error If the run does not exist or if there is a problem loading its
///     results.
model::case_results_vector
store::read_transaction::get_case_results(const int64_t run_id)
{
    try {
        check_run_exists(_pimpl->_db, run_id);

        sqlite::statement stmt = _pimpl->_db.create_statement(
            "SELECT case_id, runtime_ms, exit_code, expected_exit_code "
            "FROM case_results WHERE run_id == :run_id ORDER BY case_id");
        stmt.bind(":run_id", run_id);

        model::case_results_vector results;
        while (stmt.step()) {
            results.push_back(model::case_result(
                run_id, stmt.safe_column_int64("case_id"),
                stmt.safe_column_int64("runtime_ms"),
                stmt.safe_column_int("exit_code"),
                stmt.safe_column_int("expected_exit_code")));
        }
        return results;
    } catch (const sqlite::error& e) {
        throw error(F("Error loading results of run %s: %s") % run_id %
                    e.what());
    }
}


/// Retrieves the output comparisons of a single test case.
///
/// \param run_id The identifier of the run.
/// \param case_id The identifier of the test case within the run.
///
/// \return The comparisons, sorted by output identifier.
///
/// \throw error If there is a problem loading the comparisons.
model::output_comparisons_vector
store::read_transaction::get_case_outputs(const int64_t run_id,
                                          const int64_t case_id)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "SELECT run_id, case_id, output_id, extension, expected_ref, "
            "actual_ref FROM case_outputs "
            "WHERE run_id == :run_id AND case_id == :case_id "
            "ORDER BY output_id");
        stmt.bind(":run_id", run_id);
        stmt.bind(":case_id", case_id);

        model::output_comparisons_vector outputs;
        while (stmt.step())
            outputs.push_back(parse_output(stmt));
        return outputs;
    } catch (const sqlite::error& e) {
        throw error(F("Error loading outputs of case %s in run %s: %s") %
                    case_id % run_id % e.what());
    }
}


/// Retrieves the output comparisons of all the test cases of a run.
///
/// \param run_id The identifier of the run.
///
/// \return The comparisons, sorted by case and output identifiers.
///
/// \throw error If the run does not exist or if there is a problem loading the
///     comparisons.
model::output_comparisons_vector
store::read_transaction::get_run_outputs(const int64_t run_id)
{
    try {
        check_run_exists(_pimpl->_db, run_id);

        sqlite::statement stmt = _pimpl->_db.create_statement(
            "SELECT run_id, case_id, output_id, extension, expected_ref, "
            "actual_ref FROM case_outputs WHERE run_id == :run_id "
            "ORDER BY case_id, output_id");
        stmt.bind(":run_id", run_id);

        model::output_comparisons_vector outputs;
        while (stmt.step())
            outputs.push_back(parse_output(stmt));
        return outputs;
    } catch (const sqlite::error& e) {
        throw error(F("Error loading outputs of run %s: %s") % run_id %
                    e.what());
    }
}


/// Retrieves a single output comparison.
///
/// \param run_id The identifier of the run.
/// \param case_id The identifier of the test case within the run.
/// \param output_id The identifier of the output within the test case.
///
/// \return The comparison.
///
/// \throw error If the comparison does not exist or if there is a problem
///     loading it.
model::output_comparison
store::read_transaction::get_output(const int64_t run_id,
                                    const int64_t case_id,
                                    const int64_t output_id)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "SELECT run_id, case_id, output_id, extension, expected_ref, "
            "actual_ref FROM case_outputs "
            "WHERE run_id == :run_id AND case_id == :case_id "
            "AND output_id == :output_id");
        stmt.bind(":run_id", run_id);
        stmt.bind(":case_id", case_id);
        stmt.bind(":output_id", output_id);
        if (!stmt.step())
            throw error(F("Output %s of case %s in run %s does not exist") %
                        output_id % case_id % run_id);
        return parse_output(stmt);
    } catch (const sqlite::error& e) {
        throw error(F("Error loading output %s of case %s in run %s: %s") %
                    output_id % case_id % run_id % e.what());
    }
}
