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

#include "cli/cmd_progress.hpp"

#include <cstdlib>

#include "engine/run_state.hpp"
#include "model/progress_report.hpp"
#include "model/run_event.hpp"
#include "model/stage.hpp"
#include "store/backend.hpp"
#include "store/read_transaction.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;

using cli::cmd_progress;


namespace {


/// Formats the names of a collection of stages.
///
/// \param stages The stages to format.
///
/// \return The comma-separated names of the stages.
static std::string
format_stages(const model::stages_vector& stages)
{
    std::string text;
    for (model::stages_vector::const_iterator iter = stages.begin();
         iter != stages.end(); ++iter) {
        if (iter != stages.begin())
            text += ",";
        text += model::stage_name(*iter);
    }
    return text;
}


}  // anonymous namespace


/// Default constructor for cmd_progress.
cmd_progress::cmd_progress(void) : cli_command(
    "progress", "run-id", 1, 1,
    "Shows the progress of a run through its stages")
{
}


/// Entry point for the "progress" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param user_config The runtime configuration of the program.
///
/// \return 0 to indicate success.
int
cmd_progress::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
                  const config::tree& user_config)
{
    const int64_t run_id = parse_id(cmdline.arguments()[0], "run-id");

    store::backend backend = open_store_ro(user_config);
    store::read_transaction tx = backend.start_read();
    const model::run_events_vector events = tx.get_run_events(run_id);
    tx.finish();

    if (engine::is_malformed(events))
        LW(F("Run %s does not start with the preparation stage") % run_id);

    const model::progress_report report = engine::derive_progress(events);
    ui->out(F("state: %s") % report.state_name());
    ui->out(F("step: %s") % report.step_index());
    ui->out(F("stages: %s") % format_stages(report.stages()));
    ui->out(F("start: %s") % format_timestamp(report.start()));
    ui->out(F("end: %s") % format_timestamp(report.end()));
    ui->out(F("finished: %s") % engine::is_finished(events));
    ui->out(F("failed: %s") % engine::has_failed(events));
    return EXIT_SUCCESS;
}
