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

extern "C" {
#include <sqlite3.h>
}

#include <new>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/sqlite/exceptions.hpp"
#include "utils/sqlite/statement.hpp"
#include "utils/sqlite/transaction.hpp"

namespace sqlite = utils::sqlite;


/// Internal implementation for sqlite::database.
struct utils::sqlite::database::impl {
    /// The SQLite 3 internal database.
    ::sqlite3* db;

    /// Name of the file backing the database, or ":memory:".
    std::string filename;

    /// Constructor.
    ///
    /// \param db_ The SQLite internal database, owned by this object.
    /// \param filename_ The name of the file backing the database.
    impl(::sqlite3* db_, const std::string& filename_) :
        db(db_),
        filename(filename_)
    {
    }

    /// Destructor.
    ///
    /// The impl is shared by all copies of a database object, so the
    /// connection is closed exactly once here.
    ~impl(void)
    {
        const int error = ::sqlite3_close(db);
        if (error != SQLITE_OK)
            LW(F("Failed to close database %s: %s") % filename %
               ::sqlite3_errstr(error));
    }
};


/// Initializes the SQLite database.
///
/// You must share the same database object alongside the lifetime of your
/// SQLite session.  As soon as the object is destroyed, the session is
/// terminated.
///
/// \param db_ Raw pointer to the C SQLite 3 object.
/// \param filename_ The name of the file backing the database.
sqlite::database::database(void* db_, const std::string& filename_) :
    _pimpl(new impl(static_cast< ::sqlite3* >(db_), filename_))
{
}


/// Destructor for the SQLite 3 database.
sqlite::database::~database(void)
{
}


/// Opens a memory-based temporary SQLite database.
///
/// \return An in-memory database instance.
///
/// \throw api_error If there is a problem opening the database.
sqlite::database
sqlite::database::in_memory(void)
{
    return open(fs::path(":memory:"), open_readwrite | open_create);
}


/// Opens a named on-disk SQLite database.
///
/// \param file The path to the database file to be opened.
/// \param open_flags The flags to be passed to the open routine.
///
/// \return A file-backed database instance.
///
/// \throw std::bad_alloc If there is not enough memory to open the database.
/// \throw api_error If there is any problem opening the database.
sqlite::database
sqlite::database::open(const fs::path& file, int open_flags)
{
    int flags = 0;
    if (open_flags & open_readonly) {
        flags |= SQLITE_OPEN_READONLY;
        open_flags &= ~open_readonly;
    }
    if (open_flags & open_readwrite) {
        flags |= SQLITE_OPEN_READWRITE;
        open_flags &= ~open_readwrite;
    }
    if (open_flags & open_create) {
        flags |= SQLITE_OPEN_CREATE;
        open_flags &= ~open_create;
    }
    PRE(open_flags == 0);

    ::sqlite3* db;
    const int error = ::sqlite3_open_v2(file.c_str(), &db, flags, NULL);
    if (error != SQLITE_OK) {
        if (db == NULL)
            throw std::bad_alloc();
        else {
            database error_db(db, file.str());
            throw sqlite::api_error::from_database(error_db, "sqlite3_open_v2");
        }
    }
    INV(db != NULL);
    return database(db, file.str());
}


/// Gets the internal sqlite3 object.
///
/// \return The raw SQLite 3 database.  This is returned as a void pointer to
/// prevent including the sqlite3.h header file from our public interface.
void*
sqlite::database::raw_database(void)
{
    return _pimpl->db;
}


/// Returns the name of the file backing the database.
///
/// \return A path, or ":memory:" for in-memory databases.
const std::string&
sqlite::database::db_filename(void) const
{
    return _pimpl->filename;
}


/// Executes an arbitrary SQL string.
///
/// As the documentation explains, this is unsafe.  The code should really be
/// preparing statements and executing them step by step.  However, it is
/// perfectly fine to use this function for, e.g. the initial creation of
/// tables in a database and in tests.
///
/// \param sql The SQL commands to be executed.
///
/// \throw api_error If there is any problem while processing the SQL.
void
sqlite::database::exec(const std::string& sql)
{
    const int error = ::sqlite3_exec(_pimpl->db, sql.c_str(), NULL, NULL, NULL);
    if (error != SQLITE_OK)
        throw api_error::from_database(*this, "sqlite3_exec");
}


/// Opens a new transaction.
///
/// \return An object representing the state of the transaction.
///
/// \throw api_error If there is any problem while opening the transaction.
sqlite::transaction
sqlite::database::begin_transaction(void)
{
    exec("BEGIN TRANSACTION");
    return transaction(*this);
}


/// Prepares a new statement.
///
/// \param sql The SQL statement to prepare.
///
/// \return The prepared statement.
///
/// \throw api_error If there is any problem while preparing the statement.
sqlite::statement
sqlite::database::create_statement(const std::string& sql)
{
    LD(F("Creating statement: %s") % sql);
    sqlite3_stmt* stmt;
    const int error = ::sqlite3_prepare_v2(_pimpl->db, sql.c_str(),
                                           static_cast< int >(sql.length() + 1),
                                           &stmt, NULL);
    if (error != SQLITE_OK)
        throw api_error::from_database(*this, "sqlite3_prepare_v2");
    return statement(*this, static_cast< void* >(stmt));
}


/// Returns the row identifier of the last insert.
///
/// \return A row identifier.
int64_t
sqlite::database::last_insert_rowid(void)
{
    return ::sqlite3_last_insert_rowid(_pimpl->db);
}
