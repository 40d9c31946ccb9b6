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

#include "cli/cmd_help.hpp"

#include <cstdlib>

#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/commands_map.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/globals.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui.hpp"
#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/text/table.hpp"

namespace cmdline = utils::cmdline;
namespace text = utils::text;

using cli::cmd_help;


namespace {


/// Collection of commands known to the help command.
typedef cmdline::commands_map< cli::cli_command > cli_commands_map;


/// Builds a two-column table row.
///
/// \param name The contents of the first column.
/// \param description The contents of the second column.
///
/// \return The new row.
static text::table_row
make_row(const std::string& name, const std::string& description)
{
    text::table_row row;
    row.push_back(name);
    row.push_back(description);
    return row;
}


/// Prints a titled table of options.
///
/// \param ui Object to interact with the I/O of the program.
/// \param title The heading of the section.
/// \param options The set of options to describe.  If empty, nothing is
///     printed.
static void
options_help(cmdline::ui* ui, const char* title,
             const cmdline::options_vector& options)
{
    if (options.empty())
        return;

    text::table table(2);
    for (cmdline::options_vector::const_iterator iter = options.begin();
         iter != options.end(); iter++) {
        const cmdline::base_option* option = *iter;

        std::string names = option->format_long_name();
        if (option->has_short_name())
            names = option->format_short_name() + ", " + names;

        std::string description = option->description();
        if (option->needs_arg() && option->has_default_value())
            description += F(" (default: %s)") % option->default_value();

        table.add_row(make_row(names, description));
    }

    ui->out("");
    ui->out(title);
    ui->out_table(table, "  ");
}


/// Computes the heading under which to list a category of commands.
///
/// \param category The name of the category; may be empty.
///
/// \return The heading text.
static std::string
category_title(const std::string& category)
{
    if (category.empty())
        return "Available commands:";
    else
        return F("%s commands:") % category;
}


/// Prints the summary of commands and generic options.
///
/// \param ui Object to interact with the I/O of the program.
/// \param options The program-wide options.
/// \param commands The set of commands for which to print help.
static void
general_help(cmdline::ui* ui, const cmdline::options_vector* options,
             const cli_commands_map* commands)
{
    PRE(!commands->empty());

    ui->out(F("Usage: %s [general_options] command [command_options] [args]") %
              cmdline::progname());

    options_help(ui, "Available general options:", *options);

    for (cli_commands_map::categories_iterator iter =
             commands->categories_begin(); iter != commands->categories_end();
         ++iter) {
        text::table table(2);
        for (cli_commands_map::names_set::const_iterator name =
                 (*iter).second.begin(); name != (*iter).second.end();
             ++name) {
            const cli::cli_command* command = commands->find(*name);
            INV(command != NULL);
            table.add_row(make_row(command->name(),
                                   command->short_description()));
        }

        ui->out("");
        ui->out(category_title((*iter).first));
        ui->out_table(table, "  ");
    }
}


/// Prints help for a particular subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param general_options The options that apply to all commands.
/// \param command Pointer to the command to describe.
static void
subcommand_help(cmdline::ui* ui,
                const cmdline::options_vector* general_options,
                const cli::cli_command* command)
{
    ui->out(F("Usage: %s [general_options] %s%s%s") %
            cmdline::progname() % command->name() %
            (command->options().empty() ? "" : " [command_options]") %
            (command->arg_list().empty() ? "" : (" " + command->arg_list())));
    ui->out("");
    ui->out(F("%s.") % command->short_description());

    options_help(ui, "Available general options:", *general_options);
    options_help(ui, "Available command options:", command->options());
}


}  // anonymous namespace


/// Default constructor for cmd_help.
///
/// \param options_ The set of program-wide options for which to provide help.
/// \param commands_ The set of commands for which to provide help.
cmd_help::cmd_help(const cmdline::options_vector* options_,
                   const cmdline::commands_map< cli_command >* commands_) :
    cli_command("help", "[subcommand]", 0, 1, "Shows usage information"),
    _options(options_),
    _commands(commands_)
{
}


/// Entry point for the "help" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param unused_user_config The runtime configuration of the program.
///
/// \return 0 to indicate success.
///
/// \throw cmdline::usage_error If the requested command does not exist.
int
cmd_help::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
              const utils::config::tree& UTILS_UNUSED_PARAM(user_config))
{
    if (cmdline.arguments().empty()) {
        general_help(ui, _options, _commands);
    } else {
        INV(cmdline.arguments().size() == 1);
        const std::string& cmdname = cmdline.arguments()[0];
        const cli_command* command = _commands->find(cmdname);
        if (command == NULL)
            throw cmdline::usage_error(F("The command %s does not exist") %
                                       cmdname);
        else
            subcommand_help(ui, _options, command);
    }

    return EXIT_SUCCESS;
}
