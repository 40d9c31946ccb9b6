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

#include <atf-c++.hpp>

#include "model/run.hpp"
#include "model/run_event.hpp"
#include "store/backend.hpp"
#include "store/exceptions.hpp"
#include "store/read_transaction.hpp"
#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"
#include "utils/sqlite/database.hpp"
#include "utils/sqlite/statement.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace sqlite = utils::sqlite;

using utils::none;


namespace {


/// Constructs a commit run for testing purposes.
///
/// \return A new run.
static model::run
fake_run(void)
{
    return model::run(model::platform_linux, model::run_type_commit,
                      "s3cr3t", "https://github.com/user/fork", "master",
                      "0123456789abcdef", 0);
}


/// Counts the rows of a table.
///
/// \param backend The backend to query.
/// \param table The name of the table.
///
/// \return The number of rows in the table.
static int
count_rows(store::backend& backend, const char* table)
{
    sqlite::statement stmt = backend.database().create_statement(
        F("SELECT COUNT(*) FROM %s") % table);
    ATF_REQUIRE(stmt.step());
    return stmt.column_int(0);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(commit__ok);
ATF_TEST_CASE_BODY(commit__ok)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    store::write_transaction tx = backend.start_write();
    tx.put_run(fake_run());
    tx.commit();

    ATF_REQUIRE_EQ(1, count_rows(backend, "runs"));
}


ATF_TEST_CASE_WITHOUT_HEAD(commit__fail);
ATF_TEST_CASE_BODY(commit__fail)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    {
        store::write_transaction tx = backend.start_write();
        const int64_t run_id = tx.put_run(fake_run());
        tx.put_case_result(model::case_result(run_id, 1, 10, 0, 0));
        tx.commit();
    }

    store::write_transaction tx = backend.start_write();
    backend.database().exec("CREATE TABLE foo (a REFERENCES runs "
                            "DEFERRABLE INITIALLY DEFERRED)");
    backend.database().exec("INSERT INTO foo VALUES (912)");
    ATF_REQUIRE_THROW(store::error, tx.commit());
}


ATF_TEST_CASE_WITHOUT_HEAD(rollback__ok);
ATF_TEST_CASE_BODY(rollback__ok)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    store::write_transaction tx = backend.start_write();
    tx.put_run(fake_run());
    tx.rollback();

    ATF_REQUIRE_EQ(0, count_rows(backend, "runs"));
}


ATF_TEST_CASE_WITHOUT_HEAD(rollback__implicit);
ATF_TEST_CASE_BODY(rollback__implicit)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    {
        store::write_transaction tx = backend.start_write();
        tx.put_run(fake_run());
    }

    ATF_REQUIRE_EQ(0, count_rows(backend, "runs"));
}


ATF_TEST_CASE_WITHOUT_HEAD(put_run__ok);
ATF_TEST_CASE_BODY(put_run__ok)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    store::write_transaction tx = backend.start_write();
    const int64_t id1 = tx.put_run(fake_run());
    const int64_t id2 = tx.put_run(model::run(
        model::platform_windows, model::run_type_pull_request, "tok",
        "https://github.com/other/fork", "feature", "fedcba", 42));
    tx.commit();
    ATF_REQUIRE(id1 < id2);

    sqlite::statement stmt = backend.database().create_statement(
        "SELECT platform, run_type, pr_nr FROM runs WHERE run_id == :id");
    stmt.bind(":id", id2);
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ(std::string("windows"), stmt.safe_column_text("platform"));
    ATF_REQUIRE_EQ(std::string("pr"), stmt.safe_column_text("run_type"));
    ATF_REQUIRE_EQ(42, stmt.safe_column_int("pr_nr"));
}


ATF_TEST_CASE_WITHOUT_HEAD(put_run_event__unknown_run);
ATF_TEST_CASE_BODY(put_run_event__unknown_run)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    store::write_transaction tx = backend.start_write();
    ATF_REQUIRE_THROW_RE(store::error, "Cannot store event for run 7",
                         tx.put_run_event(model::run_event(
                             7, model::stage_building,
                             datetime::timestamp::from_microseconds(100),
                             "Building")));
}


ATF_TEST_CASE_WITHOUT_HEAD(put_run_event__microseconds);
ATF_TEST_CASE_BODY(put_run_event__microseconds)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    store::write_transaction tx = backend.start_write();
    const int64_t run_id = tx.put_run(fake_run());
    tx.put_run_event(model::run_event(
        run_id, model::stage_preparation,
        datetime::timestamp::from_values(2019, 5, 1, 10, 0, 0, 123456),
        "Preparing"));
    tx.commit();

    sqlite::statement stmt = backend.database().create_statement(
        "SELECT timestamp FROM run_events");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ(datetime::timestamp::from_values(
                       2019, 5, 1, 10, 0, 0, 123456).to_microseconds(),
                   stmt.safe_column_int64("timestamp"));
}


ATF_TEST_CASE_WITHOUT_HEAD(put_case_result__duplicate);
ATF_TEST_CASE_BODY(put_case_result__duplicate)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    store::write_transaction tx = backend.start_write();
    const int64_t run_id = tx.put_run(fake_run());
    tx.put_case_result(model::case_result(run_id, 3, 10, 0, 0));
    ATF_REQUIRE_THROW_RE(store::error, "Cannot store result of case 3",
                         tx.put_case_result(model::case_result(
                             run_id, 3, 20, 1, 0)));
}


ATF_TEST_CASE_WITHOUT_HEAD(put_output_comparison__null_actual);
ATF_TEST_CASE_BODY(put_output_comparison__null_actual)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    store::write_transaction tx = backend.start_write();
    const int64_t run_id = tx.put_run(fake_run());
    tx.put_output_comparison(model::output_comparison(
        run_id, 1, 1, ".txt", "exp1", none));
    tx.commit();

    sqlite::statement stmt = backend.database().create_statement(
        "SELECT actual_ref FROM case_outputs");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE(stmt.column_type(0) == sqlite::type_null);
}


ATF_TEST_CASE_WITHOUT_HEAD(delete_run__cascade);
ATF_TEST_CASE_BODY(delete_run__cascade)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    int64_t run1, run2;
    {
        store::write_transaction tx = backend.start_write();
        run1 = tx.put_run(fake_run());
        run2 = tx.put_run(fake_run());
        for (int64_t run_id = run1; run_id <= run2; ++run_id) {
            tx.put_run_event(model::run_event(
                run_id, model::stage_preparation,
                datetime::timestamp::from_microseconds(1000), "Preparing"));
            tx.put_case_result(model::case_result(run_id, 1, 10, 0, 0));
            tx.put_output_comparison(model::output_comparison(
                run_id, 1, 1, ".txt", "exp", none));
        }
        tx.commit();
    }

    {
        store::write_transaction tx = backend.start_write();
        tx.delete_run(run1);
        tx.commit();
    }

    ATF_REQUIRE_EQ(1, count_rows(backend, "runs"));
    ATF_REQUIRE_EQ(1, count_rows(backend, "run_events"));
    ATF_REQUIRE_EQ(1, count_rows(backend, "case_results"));
    ATF_REQUIRE_EQ(1, count_rows(backend, "case_outputs"));

    store::read_transaction tx = backend.start_read();
    ATF_REQUIRE_EQ(1, tx.get_run_events(run2).size());
    ATF_REQUIRE_THROW_RE(store::error, "Run .* does not exist",
                         tx.get_run_events(run1));
}


ATF_TEST_CASE_WITHOUT_HEAD(delete_run__unknown);
ATF_TEST_CASE_BODY(delete_run__unknown)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    store::write_transaction tx = backend.start_write();
    ATF_REQUIRE_THROW_RE(store::error, "Run 12 does not exist",
                         tx.delete_run(12));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, commit__ok);
    ATF_ADD_TEST_CASE(tcs, commit__fail);
    ATF_ADD_TEST_CASE(tcs, rollback__ok);
    ATF_ADD_TEST_CASE(tcs, rollback__implicit);

    ATF_ADD_TEST_CASE(tcs, put_run__ok);
    ATF_ADD_TEST_CASE(tcs, put_run_event__unknown_run);
    ATF_ADD_TEST_CASE(tcs, put_run_event__microseconds);
    ATF_ADD_TEST_CASE(tcs, put_case_result__duplicate);
    ATF_ADD_TEST_CASE(tcs, put_output_comparison__null_actual);

    ATF_ADD_TEST_CASE(tcs, delete_run__cascade);
    ATF_ADD_TEST_CASE(tcs, delete_run__unknown);
}
