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

#include "utils/logging/operations.hpp"

extern "C" {
#include <unistd.h>
}

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace logging = utils::logging;

using utils::none;
using utils::optional;


namespace {


/// Single log entry, kept in memory until the log becomes persistent.
typedef std::pair< logging::level, std::string > log_entry;


/// First time recorded by the logging module.
static optional< datetime::timestamp > first_timestamp = none;


/// In-memory record of log entries before persistency is enabled.
static std::vector< log_entry > backlog;


/// Whether log entries go to the backlog at all.
///
/// Entries are discarded once set_inmemory() has been called explicitly.
static bool keep_backlog = true;


/// Maximum level of the entries that get written to the log file.
static logging::level log_level = logging::level_debug;


/// Stream to the currently open log file.
static std::unique_ptr< std::ofstream > logfile;


/// Constant string to strftime to format timestamps.
static const char* timestamp_format = "%Y%m%d-%H%M%S";


/// Converts a level to the single-character code used in the log file.
///
/// \param level The level to convert.
///
/// \return The code of the level.
static char
level_code(const logging::level level)
{
    switch (level) {
    case logging::level_debug: return 'D';
    case logging::level_error: return 'E';
    case logging::level_info: return 'I';
    case logging::level_warning: return 'W';
    }
    UNREACHABLE;
}


/// Parses a textual level name.
///
/// \param name The name of the level.
///
/// \return The parsed level.
///
/// \throw std::range_error If the name is not valid.
static logging::level
parse_level(const std::string& name)
{
    if (name == "debug")
        return logging::level_debug;
    else if (name == "error")
        return logging::level_error;
    else if (name == "info")
        return logging::level_info;
    else if (name == "warning")
        return logging::level_warning;
    else
        throw std::range_error(F("Unrecognized log level '%s'") % name);
}


}  // anonymous namespace


/// Generates a standard log name.
///
/// This always adds the same timestamp to the log name for a particular run.
/// The timestamp corresponds to the first one recorded by the module, which
/// does not necessarily match the current value of "now".
///
/// \param logdir The path to the directory in which to place the log.
/// \param progname The name of the program that is generating the log.
///
/// \return The path to the log file.
fs::path
logging::generate_log_name(const fs::path& logdir, const std::string& progname)
{
    if (!first_timestamp)
        first_timestamp = datetime::timestamp::now();
    return logdir / (F("%s.%s.log") % progname %
                     first_timestamp.get().strftime(timestamp_format));
}


/// Logs an entry to the log file.
///
/// If the log is not yet set to persistent mode, the entry is recorded in the
/// in-memory backlog.  Otherwise, it is written to disk if its level is
/// important enough.
///
/// \param type The severity of the entry.
/// \param file The file from which the log message is generated.
/// \param line The line from which the log message is generated.
/// \param user_message The raw message to store.
void
logging::log(const level type, const char* file, const int line,
             const std::string& user_message)
{
    const datetime::timestamp now = datetime::timestamp::now();
    if (!first_timestamp)
        first_timestamp = now;

    const std::string message = F("%s %s %s %s:%s: %s") %
        now.strftime(timestamp_format) % level_code(type) % ::getpid() %
        file % line % user_message;
    if (logfile.get() == NULL) {
        if (keep_backlog)
            backlog.push_back(log_entry(type, message));
    } else if (type <= log_level) {
        INV(backlog.empty());
        (*logfile) << message << '\n';
        (*logfile).flush();
    }
}


/// Discards the backlog and keeps dropping log entries from now on.
///
/// This is meant for programs that never make the log persistent, so that the
/// backlog does not grow unbounded.
void
logging::set_inmemory(void)
{
    keep_backlog = false;
    backlog.clear();
}


/// Makes the log persistent.
///
/// Calling this function flushes the in-memory log, if any, to disk and sets
/// the logging module to send log entries to disk from this point onwards.
/// There is no way back, and the caller program should execute this function as
/// early as possible to ensure that a crash at startup does not discard too
/// many useful log entries.
///
/// \param new_level The name of the most detailed level to record.
/// \param path The file to write the logs to.
///
/// \throw std::range_error If the given level is invalid.
/// \throw std::runtime_error If the given file cannot be created.
void
logging::set_persistency(const std::string& new_level, const fs::path& path)
{
    PRE(logfile.get() == NULL);

    log_level = parse_level(new_level);

    logfile.reset(new std::ofstream(path.c_str()));
    if (!(*logfile)) {
        logfile.reset();
        throw std::runtime_error(F("Failed to create log file %s") % path);
    }

    for (std::vector< log_entry >::const_iterator iter = backlog.begin();
         iter != backlog.end(); ++iter) {
        if ((*iter).first <= log_level)
            (*logfile) << (*iter).second << '\n';
    }
    (*logfile).flush();
    backlog.clear();
}
