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

#include "store/write_transaction.hpp"

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


/// Internal implementation for a write-only transaction.
struct store::write_transaction::impl {
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


/// Creates a new write-only transaction.
///
/// \param backend_ The backend this transaction belongs to.
store::write_transaction::write_transaction(backend& backend_) :
    _pimpl(new impl(backend_))
{
}


/// Destructor.
store::write_transaction::~write_transaction(void)
{
}


/// Commits the transaction.
///
/// \throw error If there is any problem when talking to the database.
void
store::write_transaction::commit(void)
{
    try {
        _pimpl->_tx.commit();
    } catch (const sqlite::error& e) {
        throw error(e.what());
    }
}


/// Rolls the transaction back.
///
/// \throw error If there is any problem when talking to the database.
void
store::write_transaction::rollback(void)
{
    try {
        _pimpl->_tx.rollback();
    } catch (const sqlite::error& e) {
        throw error(e.what());
    }
}


/// Puts a new run into the database.
///
/// \post The run is stored into the database with a new identifier.
///
/// \param run The run to put.
///
/// \return The identifier of the inserted run.
///
/// \throw error If there is any problem when talking to the database.
int64_t
store::write_transaction::put_run(const model::run& run)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "INSERT INTO runs (platform, run_type, token, fork_url, branch, "
            "                  commit_hash, pr_nr) "
            "VALUES (:platform, :run_type, :token, :fork_url, :branch, "
            "        :commit_hash, :pr_nr)");
        bind_platform(stmt, ":platform", run.get_platform());
        bind_run_type(stmt, ":run_type", run.type());
        stmt.bind(":token", run.token());
        stmt.bind(":fork_url", run.fork_url());
        stmt.bind(":branch", run.branch());
        stmt.bind(":commit_hash", run.commit());
        stmt.bind(":pr_nr", run.pr_nr());
        stmt.step_without_results();
        const int64_t run_id = _pimpl->_db.last_insert_rowid();

        LI(F("Created run %s") % run_id);
        return run_id;
    } catch (const sqlite::error& e) {
        throw error(F("Cannot store run: %s") % e.what());
    }
}


/// Appends an event to the log of a run.
///
/// \pre The run referenced by the event has already been put.
///
/// \param event The event to append.
///
/// \return The identifier of the inserted event, which grows with every
/// insertion.
///
/// \throw error If there is any problem when talking to the database.
int64_t
store::write_transaction::put_run_event(const model::run_event& event)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "INSERT INTO run_events (run_id, stage, timestamp, message) "
            "VALUES (:run_id, :stage, :timestamp, :message)");
        stmt.bind(":run_id", event.run_id());
        bind_stage(stmt, ":stage", event.stage());
        bind_timestamp(stmt, ":timestamp", event.timestamp());
        stmt.bind(":message", event.message());
        stmt.step_without_results();
        return _pimpl->_db.last_insert_rowid();
    } catch (const sqlite::error& e) {
        throw error(F("Cannot store event for run %s: %s") % event.run_id() %
                    e.what());
    }
}


/// Puts the result of a test case into the database.
///
/// \pre The run referenced by the result has already been put.
///
/// \param result The result to put.
///
/// \throw error If there is any problem when talking to the database,
///     including an attempt to store the same case twice.
void
store::write_transaction::put_case_result(const model::case_result& result)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "INSERT INTO case_results (run_id, case_id, runtime_ms, "
            "                          exit_code, expected_exit_code) "
            "VALUES (:run_id, :case_id, :runtime_ms, :exit_code, "
            "        :expected_exit_code)");
        stmt.bind(":run_id", result.run_id());
        stmt.bind(":case_id", result.case_id());
        stmt.bind(":runtime_ms", result.runtime_ms());
        stmt.bind(":exit_code", result.exit_code());
        stmt.bind(":expected_exit_code", result.expected_exit_code());
        stmt.step_without_results();
    } catch (const sqlite::error& e) {
        throw error(F("Cannot store result of case %s in run %s: %s") %
                    result.case_id() % result.run_id() % e.what());
    }
}


/// Puts the comparison of one output of a test case into the database.
///
/// \pre The run referenced by the comparison has already been put.
///
/// \param comparison The comparison to put.
///
/// \throw error If there is any problem when talking to the database.
void
store::write_transaction::put_output_comparison(
    const model::output_comparison& comparison)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "INSERT INTO case_outputs (run_id, case_id, output_id, extension, "
            "                          expected_ref, actual_ref) "
            "VALUES (:run_id, :case_id, :output_id, :extension, "
            "        :expected_ref, :actual_ref)");
        stmt.bind(":run_id", comparison.run_id());
        stmt.bind(":case_id", comparison.case_id());
        stmt.bind(":output_id", comparison.output_id());
        stmt.bind(":extension", comparison.extension());
        stmt.bind(":expected_ref", comparison.expected_ref());
        bind_optional_string(stmt, ":actual_ref", comparison.actual_ref());
        stmt.step_without_results();
    } catch (const sqlite::error& e) {
        throw error(F("Cannot store output %s of case %s in run %s: %s") %
                    comparison.output_id() % comparison.case_id() %
                    comparison.run_id() % e.what());
    }
}


/// Deletes a run and all the data that belongs to it.
///
/// \param run_id The identifier of the run to delete.
///
/// \throw error If the run does not exist or if there is any problem when
///     talking to the database.
void
store::write_transaction::delete_run(const int64_t run_id)
{
    try {
        sqlite::statement query = _pimpl->_db.create_statement(
            "SELECT run_id FROM runs WHERE run_id == :run_id");
        query.bind(":run_id", run_id);
        if (!query.step())
            throw error(F("Run %s does not exist") % run_id);

        sqlite::statement stmt = _pimpl->_db.create_statement(
            "DELETE FROM runs WHERE run_id == :run_id");
        stmt.bind(":run_id", run_id);
        stmt.step_without_results();
        LI(F("Deleted run %s") % run_id);
    } catch (const sqlite::error& e) {
        throw error(F("Cannot delete run %s: %s") % run_id % e.what());
    }
}
