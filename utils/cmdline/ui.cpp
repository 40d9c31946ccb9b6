// Copyright 2011 Google Inc.
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

#include "utils/cmdline/ui.hpp"

#include <iostream>
#include <vector>

#include "utils/cmdline/globals.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/text/operations.hpp"
#include "utils/text/table.hpp"

namespace cmdline = utils::cmdline;
namespace text = utils::text;


namespace {


/// Removes the trailing period of a message, if any.
///
/// Messages coming from external libraries (SQLite, Lua) are sometimes full
/// sentences; the period is re-added by the caller.
///
/// \param message The message to process.
///
/// \return The message without its final period.
static std::string
strip_period(const std::string& message)
{
    if (!message.empty() && message[message.length() - 1] == '.')
        return message.substr(0, message.length() - 1);
    else
        return message;
}


/// Prints a tagged diagnostic message to stderr.
///
/// \param ui_ The user interface object used to print the message.
/// \param tag Single-letter tag identifying the type of message.
/// \param message The message to print.
static void
print_tagged(cmdline::ui* ui_, const char tag, const std::string& message)
{
    const std::string sentence = strip_period(message);
    PRE_MSG(!sentence.empty(), "Diagnostic messages cannot be empty");
    ui_->err(F("%s: %s: %s.") % cmdline::progname() % tag % sentence);
}


}  // anonymous namespace


/// Destructor for the class.
cmdline::ui::~ui(void)
{
}


/// Writes a line to stderr.
///
/// \param message The line to print, without the trailing newline character.
void
cmdline::ui::err(const std::string& message)
{
    PRE(message.empty() || message[message.length() - 1] != '\n');
    LI(F("stderr: %s") % message);
    std::cerr << message << "\n";
}


/// Writes a line to stdout.
///
/// \param message The line to print, without the trailing newline character.
void
cmdline::ui::out(const std::string& message)
{
    PRE(message.empty() || message[message.length() - 1] != '\n');
    LI(F("stdout: %s") % message);
    std::cout << message << "\n";
}


/// Writes a multi-line document to stdout.
///
/// The document is split with universal newlines and each line is sent
/// through out(), so the log and the mock interfaces see individual lines.
///
/// \param document The text to print.
void
cmdline::ui::out_text(const std::string& document)
{
    const std::vector< std::string > lines = text::split_lines(document);
    for (std::vector< std::string >::const_iterator iter = lines.begin();
         iter != lines.end(); ++iter)
        out(*iter);
}


/// Writes a table to stdout, one line per row.
///
/// \param table The table to print.
/// \param prefix Text to prepend to every line of the table.
void
cmdline::ui::out_table(const text::table& table, const std::string& prefix)
{
    const std::vector< std::string > lines = text::format_table(table);
    for (std::vector< std::string >::const_iterator iter = lines.begin();
         iter != lines.end(); ++iter)
        out(prefix + *iter);
}


/// Formats and prints an error message.
///
/// \param ui_ The user interface object used to print the message.
/// \param message The message to print.  A final period, if any, is not
///     duplicated.
void
cmdline::print_error(ui* ui_, const std::string& message)
{
    LE(message);
    print_tagged(ui_, 'E', message);
}


/// Formats and prints a warning message.
///
/// \param ui_ The user interface object used to print the message.
/// \param message The message to print.
void
cmdline::print_warning(ui* ui_, const std::string& message)
{
    LW(message);
    print_tagged(ui_, 'W', message);
}
