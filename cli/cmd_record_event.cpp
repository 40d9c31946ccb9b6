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

#include "cli/cmd_record_event.hpp"

#include <cstdlib>
#include <stdexcept>

#include "model/exceptions.hpp"
#include "model/run_event.hpp"
#include "model/stage.hpp"
#include "store/backend.hpp"
#include "store/write_transaction.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui.hpp"
#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;
namespace datetime = utils::datetime;

using cli::cmd_record_event;


namespace {


/// Gets the time at which the event happened.
///
/// \param cmdline The parsed command line.
///
/// \return The timestamp given by the user in --timestamp, or the current
/// time if none was given.
///
/// \throw cmdline::usage_error If the user-provided timestamp is invalid.
static datetime::timestamp
event_timestamp(const cmdline::parsed_cmdline& cmdline)
{
    if (!cmdline.has_option("timestamp"))
        return datetime::timestamp::now();

    const std::string raw = cmdline.get_option< cmdline::string_option >(
        "timestamp");
    try {
        return datetime::timestamp::from_iso8601(raw);
    } catch (const std::invalid_argument& e) {
        throw cmdline::usage_error(F("Invalid timestamp '%s': %s") % raw %
                                   e.what());
    }
}


}  // anonymous namespace


/// Default constructor for cmd_record_event.
cmd_record_event::cmd_record_event(void) : cli_command(
    "record-event", "run-id stage message", 3, 3,
    "Appends an event to the log of a run")
{
    add_option(cmdline::string_option("timestamp", "Time of the event in "
                                      "ISO 8601 format; defaults to now",
                                      "iso8601"));
}


/// Entry point for the "record-event" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param user_config The runtime configuration of the program.
///
/// \return 0 to indicate success.
int
cmd_record_event::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
                      const config::tree& user_config)
{
    const cmdline::args_vector& args = cmdline.arguments();
    const int64_t run_id = parse_id(args[0], "run-id");
    model::stage stage;
    try {
        stage = model::parse_stage(args[1]);
    } catch (const model::format_error& e) {
        throw cmdline::usage_error(e.what());
    }
    const model::run_event event(run_id, stage, event_timestamp(cmdline),
                                 args[2]);

    store::backend backend = open_store_rw(user_config);
    store::write_transaction tx = backend.start_write();
    const int64_t event_id = tx.put_run_event(event);
    tx.commit();

    LI(F("Recorded event %s: %s") % event_id % event);
    ui->out(F("Run %s entered stage %s at %s") % run_id %
            model::stage_name(stage) %
            event.timestamp().to_iso8601_in_utc());
    return EXIT_SUCCESS;
}
