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

#include "cli/cmd_new_run.hpp"

#include <cstdlib>

#include "engine/token.hpp"
#include "model/exceptions.hpp"
#include "model/run.hpp"
#include "store/backend.hpp"
#include "store/write_transaction.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui.hpp"
#include "utils/config/tree.ipp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;

using cli::cmd_new_run;


namespace {


/// Gets the value of an option that the user must always provide.
///
/// \param cmdline The parsed command line.
/// \param name The long name of the option.
///
/// \return The value of the option.
///
/// \throw cmdline::usage_error If the option was not provided.
static std::string
required_option(const cmdline::parsed_cmdline& cmdline, const char* name)
{
    if (!cmdline.has_option(name))
        throw cmdline::usage_error(F("Missing required option --%s") % name);
    return cmdline.get_option< cmdline::string_option >(name);
}


/// Constructs the run requested by the user.
///
/// \param cmdline The parsed command line.
/// \param token The access token to assign to the run.
///
/// \return The new run.
///
/// \throw cmdline::usage_error If any of the options is invalid.
static model::run
build_run(const cmdline::parsed_cmdline& cmdline, const std::string& token)
{
    try {
        return model::run(
            model::parse_platform(required_option(cmdline, "platform")),
            model::parse_run_type(required_option(cmdline, "type")),
            token,
            required_option(cmdline, "fork"),
            required_option(cmdline, "branch"),
            required_option(cmdline, "commit"),
            cmdline.get_option< cmdline::int_option >("pr"));
    } catch (const model::error& e) {
        throw cmdline::usage_error(e.what());
    }
}


}  // anonymous namespace


/// Default constructor for cmd_new_run.
cmd_new_run::cmd_new_run(void) : cli_command(
    "new-run", "", 0, 0,
    "Registers a new test run and prints its identifier and token")
{
    add_option(cmdline::string_option("platform", "Platform on which the run "
                                      "executes: linux or windows",
                                      "platform"));
    add_option(cmdline::string_option("type", "Type of the run: commit or pr",
                                      "type"));
    add_option(cmdline::string_option("fork", "URL of the repository holding "
                                      "the change", "url"));
    add_option(cmdline::string_option("branch", "Branch holding the change",
                                      "name"));
    add_option(cmdline::string_option("commit", "Hash of the tested commit",
                                      "sha"));
    add_option(cmdline::int_option("pr", "Number of the pull request; only "
                                   "for pr runs", "number", "0"));
    add_option(cmdline::string_option("token", "Access token for the run; "
                                      "generated if not given", "token"));
}


/// Entry point for the "new-run" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param user_config The runtime configuration of the program.
///
/// \return 0 to indicate success.
int
cmd_new_run::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
                 const config::tree& user_config)
{
    std::string token;
    if (cmdline.has_option("token")) {
        token = cmdline.get_option< cmdline::string_option >("token");
    } else {
        token = engine::create_token(static_cast< std::size_t >(
            user_config.lookup< config::int_node >("token_length")));
    }
    const model::run run = build_run(cmdline, token);

    store::backend backend = open_store_rw(user_config);
    store::write_transaction tx = backend.start_write();
    const int64_t run_id = tx.put_run(run);
    tx.commit();

    LI(F("Registered %s as run %s") % run % run_id);
    ui->out(F("run_id: %s") % run_id);
    ui->out(F("token: %s") % run.token());
    return EXIT_SUCCESS;
}
