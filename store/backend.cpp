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

#include "store/exceptions.hpp"
#include "store/metadata.hpp"
#include "store/read_transaction.hpp"
#include "store/write_transaction.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"
#include "utils/sqlite/database.hpp"
#include "utils/sqlite/exceptions.hpp"
#include "utils/sqlite/statement.hpp"
#include "utils/stream.hpp"

namespace fs = utils::fs;
namespace sqlite = utils::sqlite;

using utils::optional;


/// The current schema version.
///
/// Any new database gets this schema version.  Existing databases with a
/// different schema version cannot be used.
///
/// This must be kept in sync with the value in schema.sql.
const int store::detail::current_schema_version = 1;


namespace {


/// Milliseconds to wait for a lock held by another process before failing.
///
/// Reporters and readers of the same store run as independent processes, so
/// a writer may briefly hold the database lock while a report is requested.
static const int busy_timeout_ms = 5000;


/// Opens a store database and configures the connection.
///
/// Every connection enforces foreign keys and waits on locks held by other
/// processes instead of failing right away.
///
/// \param file The database file to be opened.
/// \param flags The flags for the open; see sqlite::database::open.
///
/// \return The opened database.
///
/// \throw store::error If the database cannot be opened or configured.
static sqlite::database
open_connection(const fs::path& file, const int flags)
{
    try {
        sqlite::database db = sqlite::database::open(file, flags);
        db.exec(F("PRAGMA busy_timeout = %s") % busy_timeout_ms);
        db.exec("PRAGMA foreign_keys = ON");
        LD(F("Opened store %s") % file);
        return db;
    } catch (const sqlite::error& e) {
        throw store::error(F("Cannot open '%s': %s") % file % e.what());
    }
}


/// Checks if a database is empty (i.e. if it is new).
///
/// \param db The database to check.
///
/// \return True if the database is empty.
static bool
empty_database(sqlite::database& db)
{
    sqlite::statement stmt = db.create_statement("SELECT * FROM sqlite_master");
    return !stmt.step();
}


}  // anonymous namespace


/// Gets the path to the schema file to be used by initialize().
///
/// \return The schema.sql file in the directory named by the TRACKRUN_STOREDIR
/// environment variable, or in the built-in location if it is not defined.
fs::path
store::detail::schema_file(void)
{
    const optional< std::string > dir = utils::getenv("TRACKRUN_STOREDIR");
    if (dir)
        return fs::path(dir.get()) / "schema.sql";
    else
        return fs::path(TRACKRUN_STOREDIR) / "schema.sql";
}


/// Initializes an empty database.
///
/// \param db The database to initialize.
/// \param file The schema file to use.
///
/// \return The metadata record written into the new database.
///
/// \throw store::error If there is a problem initializing the database.
store::metadata
store::detail::initialize(sqlite::database& db, const fs::path& file)
{
    PRE(empty_database(db));

    std::ifstream input(file.c_str());
    if (!input)
        throw error(F("Cannot open database schema '%s'") % file);

    LI(F("Populating new database with schema from %s") % file);
    const std::string schema_string = utils::read_stream(input);
    try {
        db.exec(schema_string);

        const metadata metadata = metadata::fetch_latest(db);
        LI(F("New metadata entry %s") % metadata.timestamp());
        if (metadata.schema_version() != detail::current_schema_version) {
            UNREACHABLE_MSG(F("current_schema_version is out of sync with "
                              "%s") % file);
        }
        return metadata;
    } catch (const store::integrity_error& e) {
        // Could be raised by metadata::fetch_latest.
        UNREACHABLE_MSG("Inconsistent code while creating a database");
    } catch (const sqlite::error& e) {
        throw error(F("Failed to initialize database: %s") % e.what());
    }
}


/// Initializes an empty database with the default schema file.
///
/// \param db The database to initialize.
///
/// \return The metadata record written into the new database.
///
/// \throw store::error If there is a problem initializing the database.
store::metadata
store::detail::initialize(sqlite::database& db)
{
    return initialize(db, schema_file());
}


/// Internal implementation for the backend.
struct store::backend::impl {
    /// The SQLite database this backend talks to.
    sqlite::database database;

    /// Constructor.
    ///
    /// \param database_ The SQLite database instance.
    /// \param metadata_ The metadata for the loaded database.  This must match
    ///     the schema version we implement in this module.
    impl(sqlite::database& database_, const metadata& metadata_) :
        database(database_)
    {
        if (metadata_.schema_version() != detail::current_schema_version)
            throw integrity_error(F("Found schema version %s in database but "
                                    "this version does not exist") %
                                  metadata_.schema_version());
    }
};


/// Constructs a new backend.
///
/// \param pimpl_ The internal data.
store::backend::backend(impl* pimpl_) :
    _pimpl(pimpl_)
{
}


/// Destructor.
store::backend::~backend(void)
{
}


/// Opens a database in read-only mode.
///
/// \param file The database file to be opened.
///
/// \return The backend representation.
///
/// \throw store::error If there is any problem opening the database.
store::backend
store::backend::open_ro(const fs::path& file)
{
    sqlite::database db = open_connection(file, sqlite::open_readonly);
    return backend(new impl(db, metadata::fetch_latest(db)));
}


/// Opens a database in read-write mode and creates it if necessary.
///
/// \param file The database file to be opened.
///
/// \return The backend representation.
///
/// \throw store::error If there is any problem opening or creating
///     the database.
store::backend
store::backend::open_rw(const fs::path& file)
{
    sqlite::database db = open_connection(file, sqlite::open_readwrite |
                                  sqlite::open_create);
    if (empty_database(db))
        return backend(new impl(db, detail::initialize(db)));
    else
        return backend(new impl(db, metadata::fetch_latest(db)));
}


/// Gets the connection to the SQLite database.
///
/// \return A database connection.
sqlite::database&
store::backend::database(void)
{
    return _pimpl->database;
}


/// Opens a read-only transaction.
///
/// \return A new transaction.
store::read_transaction
store::backend::start_read(void)
{
    return read_transaction(*this);
}


/// Opens a write-only transaction.
///
/// \return A new transaction.
store::write_transaction
store::backend::start_write(void)
{
    return write_transaction(*this);
}
