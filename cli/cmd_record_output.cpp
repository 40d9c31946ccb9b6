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

#include "cli/cmd_record_output.hpp"

#include <cstdlib>

#include "model/output_comparison.hpp"
#include "store/backend.hpp"
#include "store/write_transaction.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;

using cli::cmd_record_output;
using utils::optional;


namespace {


/// Ensures that a reference names a file within the artifacts directory.
///
/// \param ref The reference to validate.
///
/// \return The reference itself.
///
/// \throw cmdline::usage_error If the reference is empty or contains a
///     directory separator.
static const std::string&
check_ref(const std::string& ref)
{
    if (ref.empty() || ref.find('/') != std::string::npos)
        throw cmdline::usage_error(F("Invalid artifact reference '%s'") % ref);
    return ref;
}


}  // anonymous namespace


/// Default constructor for cmd_record_output.
cmd_record_output::cmd_record_output(void) : cli_command(
    "record-output",
    "run-id case-id output-id extension expected-ref [actual-ref]", 5, 6,
    "Records the comparison of an output of a test case; omit actual-ref "
    "if the output matched")
{
}


/// Entry point for the "record-output" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param user_config The runtime configuration of the program.
///
/// \return 0 to indicate success.
int
cmd_record_output::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
                       const config::tree& user_config)
{
    const cmdline::args_vector& args = cmdline.arguments();
    optional< std::string > actual_ref;
    if (args.size() == 6)
        actual_ref = check_ref(args[5]);
    const model::output_comparison comparison(
        parse_id(args[0], "run-id"), parse_id(args[1], "case-id"),
        parse_id(args[2], "output-id"), args[3], check_ref(args[4]),
        actual_ref);

    store::backend backend = open_store_rw(user_config);
    store::write_transaction tx = backend.start_write();
    tx.put_output_comparison(comparison);
    tx.commit();

    LI(F("Recorded %s") % comparison);
    ui->out(F("Output %s of case %s in run %s: %s") % comparison.output_id() %
            comparison.case_id() % comparison.run_id() %
            (comparison.matches() ? "matched" : "differs"));
    return EXIT_SUCCESS;
}
