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

#include "store/backend.hpp"

#include <fstream>

#include <atf-c++.hpp>

#include "store/exceptions.hpp"
#include "store/metadata.hpp"
#include "utils/datetime.hpp"
#include "utils/env.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/sqlite/database.hpp"
#include "utils/sqlite/exceptions.hpp"
#include "utils/sqlite/statement.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace sqlite = utils::sqlite;


namespace {


/// Creates a new database file with the default schema.
///
/// \param file The name of the database to create.
static void
create_store(const char* file)
{
    sqlite::database db = sqlite::database::open(
        fs::path(file), sqlite::open_readwrite | sqlite::open_create);
    store::detail::initialize(db);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(detail_schema_file__builtin);
ATF_TEST_CASE_BODY(detail_schema_file__builtin)
{
    utils::unsetenv("TRACKRUN_STOREDIR");
    ATF_REQUIRE_EQ(fs::path(TRACKRUN_STOREDIR) / "schema.sql",
                   store::detail::schema_file());
}


ATF_TEST_CASE_WITHOUT_HEAD(detail_schema_file__overriden);
ATF_TEST_CASE_BODY(detail_schema_file__overriden)
{
    utils::setenv("TRACKRUN_STOREDIR", "/tmp/foo");
    ATF_REQUIRE_EQ(fs::path("/tmp/foo/schema.sql"),
                   store::detail::schema_file());
}


ATF_TEST_CASE_WITHOUT_HEAD(detail_initialize__ok);
ATF_TEST_CASE_BODY(detail_initialize__ok)
{
    sqlite::database db = sqlite::database::in_memory();
    const datetime::timestamp before = datetime::timestamp::now();
    const store::metadata md = store::detail::initialize(db);
    const datetime::timestamp after = datetime::timestamp::now();

    ATF_REQUIRE(md.timestamp() >= before.to_seconds());
    ATF_REQUIRE(md.timestamp() <= after.to_seconds());
    ATF_REQUIRE_EQ(store::detail::current_schema_version, md.schema_version());

    db.exec("SELECT * FROM runs");
    db.exec("SELECT * FROM run_events");
    db.exec("SELECT * FROM case_results");
    db.exec("SELECT * FROM case_outputs");

    sqlite::statement stmt = db.create_statement(
        "SELECT COUNT(*) FROM metadata");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ(1, stmt.column_int(0));
    ATF_REQUIRE(!stmt.step());
}


ATF_TEST_CASE_WITHOUT_HEAD(detail_initialize__missing_schema);
ATF_TEST_CASE_BODY(detail_initialize__missing_schema)
{
    sqlite::database db = sqlite::database::in_memory();
    ATF_REQUIRE_THROW_RE(store::error, "Cannot open.*'abc.sql'",
                         store::detail::initialize(db, fs::path("abc.sql")));
}


ATF_TEST_CASE_WITHOUT_HEAD(detail_initialize__sqlite_error);
ATF_TEST_CASE_BODY(detail_initialize__sqlite_error)
{
    std::ofstream output("schema.sql");
    output << "CREATE TABLE runs (run_id INTEGER);\n";
    output << "this is not sql;\n";
    output.close();

    sqlite::database db = sqlite::database::in_memory();
    ATF_REQUIRE_THROW_RE(store::error, "Failed to initialize.*:.*this",
                         store::detail::initialize(db, fs::path("schema.sql")));
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__open_ro__ok);
ATF_TEST_CASE_BODY(backend__open_ro__ok)
{
    create_store("test.db");
    store::backend backend = store::backend::open_ro(fs::path("test.db"));
    backend.database().exec("SELECT * FROM runs");
    ATF_REQUIRE_THROW(sqlite::error, backend.database().exec(
        "INSERT INTO metadata (schema_version, timestamp) VALUES (2, 0)"));
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__open_ro__missing_file);
ATF_TEST_CASE_BODY(backend__open_ro__missing_file)
{
    ATF_REQUIRE_THROW_RE(store::error, "Cannot open 'missing.db': ",
                         store::backend::open_ro(fs::path("missing.db")));
    ATF_REQUIRE(!fs::exists(fs::path("missing.db")));
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__open_ro__integrity_error);
ATF_TEST_CASE_BODY(backend__open_ro__integrity_error)
{
    {
        sqlite::database db = sqlite::database::open(
            fs::path("test.db"), sqlite::open_readwrite | sqlite::open_create);
        store::detail::initialize(db);
        db.exec("DELETE FROM metadata");
    }
    ATF_REQUIRE_THROW_RE(store::integrity_error, "metadata.*empty",
                         store::backend::open_ro(fs::path("test.db")));
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__open_ro__not_a_store);
ATF_TEST_CASE_BODY(backend__open_ro__not_a_store)
{
    {
        sqlite::database db = sqlite::database::open(
            fs::path("other.db"), sqlite::open_readwrite | sqlite::open_create);
        db.exec("CREATE TABLE foo (a INTEGER)");
    }
    ATF_REQUIRE_THROW_RE(store::integrity_error, "Invalid metadata schema",
                         store::backend::open_ro(fs::path("other.db")));
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__open_ro__unknown_version);
ATF_TEST_CASE_BODY(backend__open_ro__unknown_version)
{
    {
        sqlite::database db = sqlite::database::open(
            fs::path("test.db"), sqlite::open_readwrite | sqlite::open_create);
        store::detail::initialize(db);
        db.exec("INSERT INTO metadata (schema_version, timestamp) "
                "VALUES (8, 0)");
    }
    ATF_REQUIRE_THROW_RE(store::integrity_error, "schema version 8",
                         store::backend::open_ro(fs::path("test.db")));
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__open_rw__ok);
ATF_TEST_CASE_BODY(backend__open_rw__ok)
{
    create_store("test.db");
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    backend.database().exec("SELECT * FROM runs");
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__open_rw__create_missing);
ATF_TEST_CASE_BODY(backend__open_rw__create_missing)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    backend.database().exec("SELECT * FROM metadata");
    ATF_REQUIRE(fs::exists(fs::path("test.db")));
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__open_rw__integrity_error);
ATF_TEST_CASE_BODY(backend__open_rw__integrity_error)
{
    {
        sqlite::database db = sqlite::database::open(
            fs::path("test.db"), sqlite::open_readwrite | sqlite::open_create);
        store::detail::initialize(db);
        db.exec("DELETE FROM metadata");
    }
    ATF_REQUIRE_THROW_RE(store::integrity_error, "metadata.*empty",
                         store::backend::open_rw(fs::path("test.db")));
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__foreign_keys);
ATF_TEST_CASE_BODY(backend__foreign_keys)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    ATF_REQUIRE_THROW_RE(sqlite::error, "FOREIGN KEY", backend.database().exec(
        "INSERT INTO run_events (run_id, stage, timestamp, message) "
        "VALUES (15, 'building', 0, 'orphan')"));
}


ATF_TEST_CASE_WITHOUT_HEAD(backend__busy_timeout);
ATF_TEST_CASE_BODY(backend__busy_timeout)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    sqlite::statement stmt = backend.database().create_statement(
        "PRAGMA busy_timeout");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ(5000, stmt.column_int(0));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, detail_schema_file__builtin);
    ATF_ADD_TEST_CASE(tcs, detail_schema_file__overriden);

    ATF_ADD_TEST_CASE(tcs, detail_initialize__ok);
    ATF_ADD_TEST_CASE(tcs, detail_initialize__missing_schema);
    ATF_ADD_TEST_CASE(tcs, detail_initialize__sqlite_error);

    ATF_ADD_TEST_CASE(tcs, backend__open_ro__ok);
    ATF_ADD_TEST_CASE(tcs, backend__open_ro__missing_file);
    ATF_ADD_TEST_CASE(tcs, backend__open_ro__integrity_error);
    ATF_ADD_TEST_CASE(tcs, backend__open_ro__not_a_store);
    ATF_ADD_TEST_CASE(tcs, backend__open_ro__unknown_version);
    ATF_ADD_TEST_CASE(tcs, backend__open_rw__ok);
    ATF_ADD_TEST_CASE(tcs, backend__open_rw__create_missing);
    ATF_ADD_TEST_CASE(tcs, backend__open_rw__integrity_error);

    ATF_ADD_TEST_CASE(tcs, backend__foreign_keys);
    ATF_ADD_TEST_CASE(tcs, backend__busy_timeout);
}
