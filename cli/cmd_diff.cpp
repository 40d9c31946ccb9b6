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

#include "cli/cmd_diff.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "engine/results.hpp"
#include "model/output_comparison.hpp"
#include "store/backend.hpp"
#include "store/read_transaction.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;
namespace fs = utils::fs;

using cli::cmd_diff;


namespace {


/// Writes a rendered diff to a file.
///
/// \param path The file to create.
/// \param html The contents to write.
///
/// \throw std::runtime_error If the file cannot be written.
static void
write_file(const fs::path& path, const std::string& html)
{
    std::ofstream output(path.c_str());
    if (!output)
        throw std::runtime_error(F("Cannot open output file %s") % path);
    output << html;
    output.close();
    if (!output)
        throw std::runtime_error(F("Failed to write output file %s") % path);
}


}  // anonymous namespace


/// Default constructor for cmd_diff.
cmd_diff::cmd_diff(void) : cli_command(
    "diff", "run-id case-id output-id", 3, 3,
    "Renders the differences between the expected and actual versions of "
    "an output as HTML")
{
    add_option(cmdline::bool_option("download", "Generate a standalone HTML "
                                    "document instead of a fragment"));
    add_option(cmdline::path_option("output", "File to write the HTML to; "
                                    "defaults to stdout", "file"));
}


/// Entry point for the "diff" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param user_config The runtime configuration of the program.
///
/// \return 0 to indicate success.
int
cmd_diff::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
              const config::tree& user_config)
{
    const cmdline::args_vector& args = cmdline.arguments();
    const int64_t run_id = parse_id(args[0], "run-id");
    const int64_t case_id = parse_id(args[1], "case-id");
    const int64_t output_id = parse_id(args[2], "output-id");

    store::backend backend = open_store_ro(user_config);
    store::read_transaction tx = backend.start_read();
    const model::output_comparison comparison = tx.get_output(
        run_id, case_id, output_id);
    tx.finish();

    const engine::render_mode mode = cmdline.has_option("download") ?
        engine::render_download : engine::render_inline;
    const std::string html = engine::generate_diff(artifacts_dir(user_config),
                                                   comparison, mode);

    if (cmdline.has_option("output")) {
        const fs::path output = cmdline.get_option< cmdline::path_option >(
            "output");
        write_file(output, html);
        LI(F("Diff of %s written to %s") % comparison % output);
    } else {
        ui->out_text(html);
    }
    return EXIT_SUCCESS;
}
