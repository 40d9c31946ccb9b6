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

#include "cli/common.hpp"

#include <stdexcept>

#include "engine/config.hpp"
#include "store/backend.hpp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/config/tree.ipp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/text/exceptions.hpp"
#include "utils/text/operations.ipp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;
namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace text = utils::text;

using utils::optional;


/// Standard definition of the option to specify a configuration file.
///
/// The special value 'default' loads the user's configuration file if it
/// exists, and the special value 'none' skips loading any file.
const cmdline::string_option cli::config_option(
    'c', "config",
    "Path to the configuration file; 'none' to use the built-in defaults",
    "file", "default");


namespace {


/// Locates the configuration file to load by default.
///
/// \return The path to the user's configuration file if it exists; none
/// otherwise.
static optional< fs::path >
default_config_file(void)
{
    const optional< fs::path > home = utils::get_home();
    if (home) {
        const fs::path file = home.get() / ".trackrun/trackrun.conf";
        if (fs::exists(file))
            return utils::make_optional(file);
        LD(F("Configuration file %s does not exist") % file);
    }
    return utils::none;
}


/// Loads the configuration requested by the user, raising on failure.
///
/// \param cmdline The parsed command line.
///
/// \return The loaded configuration.
///
/// \throw engine::error If the configuration file cannot be loaded.
static config::tree
load_required_config(const cmdline::parsed_cmdline& cmdline)
{
    const std::string file = cmdline.get_option< cmdline::string_option >(
        cli::config_option.long_name());
    if (file == "none") {
        return engine::default_config();
    } else if (file == "default") {
        const optional< fs::path > path = default_config_file();
        if (path)
            return engine::load_config(path.get());
        else
            return engine::default_config();
    } else {
        return engine::load_config(fs::path(file));
    }
}


}  // anonymous namespace


/// Loads the configuration file for this session, if any.
///
/// \param cmdline The parsed command line.
/// \param required Whether the loading of the configuration file must succeed.
///     Some commands should run regardless, and therefore we need to set this
///     to false for those commands.
///
/// \return The loaded configuration file data.  If required was set to false,
/// this might be the default configuration data if the requested file could
/// not be properly loaded.
///
/// \throw engine::error If the configuration file cannot be loaded and
///     required is true.
config::tree
cli::load_config(const cmdline::parsed_cmdline& cmdline, const bool required)
{
    try {
        return load_required_config(cmdline);
    } catch (const std::runtime_error& e) {
        if (required) {
            throw;
        } else {
            LW(F("Ignoring failure to load configuration because the "
                 "requested command should not fail: %s") % e.what());
            return engine::default_config();
        }
    }
}


/// Gets the path to the store database.
///
/// \param user_config The user configuration.
///
/// \return The path to the database, as defined by the store_file property.
fs::path
cli::store_path(const config::tree& user_config)
{
    return fs::path(user_config.lookup< config::string_node >("store_file"));
}


/// Opens the store database for reading.
///
/// \param user_config The user configuration.
///
/// \return The opened backend.
///
/// \throw store::error If the database cannot be opened.
store::backend
cli::open_store_ro(const config::tree& user_config)
{
    const fs::path store = store_path(user_config);
    LI(F("Opening store %s for reading") % store);
    return store::backend::open_ro(store);
}


/// Opens the store database for writing, creating it if necessary.
///
/// This has the side-effect of creating the directory in which to store the
/// database.
///
/// \param user_config The user configuration.
///
/// \return The opened backend.
///
/// \throw fs::error If the creation of the directory fails.
/// \throw store::error If the database cannot be opened.
store::backend
cli::open_store_rw(const config::tree& user_config)
{
    const fs::path store = store_path(user_config);
    if (!fs::exists(store.branch_path()))
        fs::mkdir_p(store.branch_path(), 0755);
    LI(F("Opening store %s for writing") % store);
    return store::backend::open_rw(store);
}


/// Gets the directory holding the result artifacts.
///
/// \param user_config The user configuration.
///
/// \return The path defined by the artifacts_dir property.
fs::path
cli::artifacts_dir(const config::tree& user_config)
{
    return fs::path(user_config.lookup< config::string_node >(
        "artifacts_dir"));
}


/// Parses a numerical identifier given as a command-line argument.
///
/// \param arg The argument to parse.
/// \param name The name of the argument, for error reporting purposes.
///
/// \return The parsed identifier.
///
/// \throw cmdline::usage_error If the argument is not a valid identifier.
int64_t
cli::parse_id(const std::string& arg, const char* name)
{
    try {
        const int64_t id = text::to_type< int64_t >(arg);
        if (id < 0)
            throw cmdline::usage_error(F("Invalid %s '%s'; cannot be "
                                         "negative") % name % arg);
        return id;
    } catch (const text::value_error&) {
        throw cmdline::usage_error(F("Invalid %s '%s'") % name % arg);
    }
}


/// Formats an optional timestamp for user presentation.
///
/// \param timestamp The timestamp to format.
///
/// \return The timestamp in ISO 8601 format in UTC, or '-' if not set.
std::string
cli::format_timestamp(const optional< datetime::timestamp >& timestamp)
{
    if (timestamp)
        return timestamp.get().to_iso8601_in_utc();
    else
        return "-";
}
