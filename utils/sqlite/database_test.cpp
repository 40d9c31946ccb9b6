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

#include "utils/sqlite/database.hpp"

#include <atf-c++.hpp>

#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/sqlite/statement.ipp"
#include "utils/sqlite/test_utils.hpp"
#include "utils/sqlite/transaction.hpp"

namespace fs = utils::fs;
namespace sqlite = utils::sqlite;


ATF_TEST_CASE_WITHOUT_HEAD(in_memory);
ATF_TEST_CASE_BODY(in_memory)
{
    sqlite::database db = sqlite::database::in_memory();
    create_test_table(raw(db));
    verify_test_table(raw(db));
    ATF_REQUIRE_EQ(":memory:", db.db_filename());
    ATF_REQUIRE(!fs::exists(fs::path(":memory:")));
}


ATF_TEST_CASE_WITHOUT_HEAD(open__readonly__ok);
ATF_TEST_CASE_BODY(open__readonly__ok)
{
    {
        ::sqlite3* db;
        ATF_REQUIRE_EQ(SQLITE_OK, ::sqlite3_open_v2("test.db", &db,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, NULL));
        create_test_table(db);
        ::sqlite3_close(db);
    }
    {
        sqlite::database db = sqlite::database::open(fs::path("test.db"),
            sqlite::open_readonly);
        verify_test_table(raw(db));
        REQUIRE_API_ERROR("sqlite3_exec", db.exec("DELETE FROM test"));
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(open__readonly__fail);
ATF_TEST_CASE_BODY(open__readonly__fail)
{
    REQUIRE_API_ERROR("sqlite3_open_v2",
        sqlite::database::open(fs::path("missing.db"), sqlite::open_readonly));
    ATF_REQUIRE(!fs::exists(fs::path("missing.db")));
}


ATF_TEST_CASE_WITHOUT_HEAD(open__create__ok);
ATF_TEST_CASE_BODY(open__create__ok)
{
    {
        sqlite::database db = sqlite::database::open(fs::path("test.db"),
            sqlite::open_readwrite | sqlite::open_create);
        ATF_REQUIRE(fs::exists(fs::path("test.db")));
        create_test_table(raw(db));
    }
    {
        ::sqlite3* db;
        ATF_REQUIRE_EQ(SQLITE_OK, ::sqlite3_open_v2("test.db", &db,
            SQLITE_OPEN_READONLY, NULL));
        verify_test_table(db);
        ::sqlite3_close(db);
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(open__create__missing_directory);
ATF_TEST_CASE_BODY(open__create__missing_directory)
{
    REQUIRE_API_ERROR("sqlite3_open_v2",
        sqlite::database::open(fs::path("missing/test.db"),
                               sqlite::open_readwrite | sqlite::open_create));
}


ATF_TEST_CASE_WITHOUT_HEAD(copies_share_connection);
ATF_TEST_CASE_BODY(copies_share_connection)
{
    sqlite::database db = sqlite::database::in_memory();
    {
        sqlite::database copy = db;
        copy.exec("CREATE TABLE foo (a INTEGER)");
    }
    db.exec("INSERT INTO foo VALUES (3)");
}


ATF_TEST_CASE_WITHOUT_HEAD(exec__fail);
ATF_TEST_CASE_BODY(exec__fail)
{
    sqlite::database db = sqlite::database::in_memory();
    REQUIRE_API_ERROR("sqlite3_exec", db.exec("SELECT * FROM missing"));
    try {
        db.exec("SELECT * FROM missing");
        fail("api_error not raised");
    } catch (const sqlite::api_error& e) {
        ATF_REQUIRE(atf::utils::grep_string("no such table: missing",
                                            e.what()));
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(create_statement__fail);
ATF_TEST_CASE_BODY(create_statement__fail)
{
    sqlite::database db = sqlite::database::in_memory();
    REQUIRE_API_ERROR("sqlite3_prepare_v2",
                      db.create_statement("SELECT * FROM missing"));
}


ATF_TEST_CASE_WITHOUT_HEAD(last_insert_rowid);
ATF_TEST_CASE_BODY(last_insert_rowid)
{
    sqlite::database db = sqlite::database::in_memory();
    db.exec("CREATE TABLE runs (run_id INTEGER PRIMARY KEY, name TEXT)");
    db.exec("INSERT INTO runs VALUES (723, 'first')");
    ATF_REQUIRE_EQ(723, db.last_insert_rowid());

    sqlite::statement stmt = db.create_statement(
        "INSERT INTO runs (name) VALUES (:name)");
    stmt.bind(":name", std::string("second"));
    stmt.step_without_results();
    ATF_REQUIRE_EQ(724, db.last_insert_rowid());
}


ATF_TEST_CASE_WITHOUT_HEAD(transaction__commit);
ATF_TEST_CASE_BODY(transaction__commit)
{
    sqlite::database db = sqlite::database::in_memory();
    db.exec("CREATE TABLE foo (a INTEGER)");
    {
        sqlite::transaction tx = db.begin_transaction();
        db.exec("INSERT INTO foo VALUES (1)");
        tx.commit();
    }
    sqlite::statement stmt = db.create_statement("SELECT COUNT(*) FROM foo");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ(1, stmt.column_int(0));
}


ATF_TEST_CASE_WITHOUT_HEAD(transaction__rollback);
ATF_TEST_CASE_BODY(transaction__rollback)
{
    sqlite::database db = sqlite::database::in_memory();
    db.exec("CREATE TABLE foo (a INTEGER)");
    {
        sqlite::transaction tx = db.begin_transaction();
        db.exec("INSERT INTO foo VALUES (1)");
        tx.rollback();
    }
    {
        sqlite::transaction tx = db.begin_transaction();
        db.exec("INSERT INTO foo VALUES (2)");
        // Leaving the scope without committing discards the insert.
    }
    sqlite::statement stmt = db.create_statement("SELECT COUNT(*) FROM foo");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ(0, stmt.column_int(0));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, in_memory);
    ATF_ADD_TEST_CASE(tcs, open__readonly__ok);
    ATF_ADD_TEST_CASE(tcs, open__readonly__fail);
    ATF_ADD_TEST_CASE(tcs, open__create__ok);
    ATF_ADD_TEST_CASE(tcs, open__create__missing_directory);
    ATF_ADD_TEST_CASE(tcs, copies_share_connection);
    ATF_ADD_TEST_CASE(tcs, exec__fail);
    ATF_ADD_TEST_CASE(tcs, create_statement__fail);
    ATF_ADD_TEST_CASE(tcs, last_insert_rowid);
    ATF_ADD_TEST_CASE(tcs, transaction__commit);
    ATF_ADD_TEST_CASE(tcs, transaction__rollback);
}
