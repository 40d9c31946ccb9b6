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

#include "cli/cmd_report.hpp"

#include <cstdlib>

#include "engine/results.hpp"
#include "model/run.hpp"
#include "store/backend.hpp"
#include "store/read_transaction.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui.hpp"
#include "utils/format/macros.hpp"
#include "utils/text/table.hpp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;
namespace text = utils::text;

using cli::cmd_report;


namespace {


/// Formats the identifiers of the outputs that did not match.
///
/// \param ids The output identifiers.
///
/// \return A comma-separated list of identifiers, or '-' if there are none.
static std::string
format_outputs(const engine::output_ids_vector& ids)
{
    if (ids.empty())
        return "-";

    std::string text;
    for (engine::output_ids_vector::const_iterator iter = ids.begin();
         iter != ids.end(); ++iter) {
        if (iter != ids.begin())
            text += ",";
        text += F("%s") % *iter;
    }
    return text;
}


/// Prints the per-case table of a run outcome.
///
/// \param ui Object to interact with the I/O of the program.
/// \param outcome The outcome to print.
static void
print_cases(cmdline::ui* ui, const engine::run_outcome& outcome)
{
    text::table table(5);
    table.set_alignment(2, text::align_right);
    {
        text::table_row header;
        header.push_back("CASE");
        header.push_back("RESULT");
        header.push_back("RUNTIME");
        header.push_back("EXIT CODE");
        header.push_back("MISMATCHING OUTPUTS");
        table.add_row(header);
    }

    for (engine::case_outcomes_vector::const_iterator iter =
             outcome.cases().begin(); iter != outcome.cases().end(); ++iter) {
        const engine::case_outcome& result = *iter;

        text::table_row row;
        row.push_back(F("%s") % result.case_id());
        row.push_back(result.passed() ? "passed" : "failed");
        row.push_back(F("%sms") % result.runtime_ms());
        row.push_back(result.exit_code_matched() ? "ok" : "mismatch");
        row.push_back(format_outputs(result.mismatching_outputs()));
        table.add_row(row);
    }

    ui->out_table(table);
}


}  // anonymous namespace


/// Default constructor for cmd_report.
cmd_report::cmd_report(void) : cli_command(
    "report", "run-id", 1, 1,
    "Shows the results of the test cases of a run")
{
}


/// Entry point for the "report" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param user_config The runtime configuration of the program.
///
/// \return 0 if all the test cases passed; 1 otherwise.
int
cmd_report::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
                const config::tree& user_config)
{
    const int64_t run_id = parse_id(cmdline.arguments()[0], "run-id");

    store::backend backend = open_store_ro(user_config);
    store::read_transaction tx = backend.start_read();
    const model::run run = tx.get_run(run_id);
    const engine::run_outcome outcome = engine::aggregate_results(
        tx.get_case_results(run_id), tx.get_run_outputs(run_id));
    tx.finish();

    ui->out(F("Run %s: %s on %s") % run_id % run.repository_link() %
            model::platform_name(run.get_platform()));
    if (!outcome.cases().empty()) {
        ui->out("");
        print_cases(ui, outcome);
    }
    ui->out("");
    ui->out(F("%s passed, %s failed, %s cases in %sms") %
            outcome.passed_count() % outcome.failed_count() %
            outcome.cases().size() % outcome.total_runtime_ms());

    return outcome.all_passed() ? EXIT_SUCCESS : EXIT_FAILURE;
}
