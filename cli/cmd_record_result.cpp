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

#include "cli/cmd_record_result.hpp"

#include <cstdlib>

#include "model/case_result.hpp"
#include "store/backend.hpp"
#include "store/write_transaction.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/text/exceptions.hpp"
#include "utils/text/operations.ipp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;
namespace text = utils::text;

using cli::cmd_record_result;


namespace {


/// Parses an exit code given as a command-line argument.
///
/// \param arg The argument to parse.
/// \param name The name of the argument, for error reporting purposes.
///
/// \return The parsed exit code.
///
/// \throw cmdline::usage_error If the argument is not an integer.
static int
parse_exit_code(const std::string& arg, const char* name)
{
    try {
        return text::to_type< int >(arg);
    } catch (const text::value_error&) {
        throw cmdline::usage_error(F("Invalid %s '%s'") % name % arg);
    }
}


}  // anonymous namespace


/// Default constructor for cmd_record_result.
cmd_record_result::cmd_record_result(void) : cli_command(
    "record-result", "run-id case-id runtime-ms exit-code expected-exit-code",
    5, 5, "Records the result of a test case")
{
}


/// Entry point for the "record-result" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param user_config The runtime configuration of the program.
///
/// \return 0 to indicate success.
int
cmd_record_result::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
                       const config::tree& user_config)
{
    const cmdline::args_vector& args = cmdline.arguments();
    const model::case_result result(
        parse_id(args[0], "run-id"), parse_id(args[1], "case-id"),
        parse_id(args[2], "runtime-ms"), parse_exit_code(args[3], "exit-code"),
        parse_exit_code(args[4], "expected-exit-code"));

    store::backend backend = open_store_rw(user_config);
    store::write_transaction tx = backend.start_write();
    tx.put_case_result(result);
    tx.commit();

    LI(F("Recorded %s") % result);
    ui->out(F("Case %s of run %s: %s") % result.case_id() % result.run_id() %
            (result.exit_code_matches() ? "exit code matched" :
             "exit code mismatch"));
    return EXIT_SUCCESS;
}
