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

#include "utils/cmdline/parser.hpp"

extern "C" {
#include <getopt.h>
}

#include <cstdlib>
#include <cstring>
#include <limits>

#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/format/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/sanity.hpp"

namespace cmdline = utils::cmdline;

namespace {


/// Auxiliary data to call getopt_long(3).
struct getopt_data : utils::noncopyable {
    /// Plain-text representation of the short options.
    ///
    /// This string follows the syntax expected by getopt_long(3) in the
    /// argument to describe the short options.
    std::string short_options;

    /// Representation of the long options as expected by getopt_long(3).
    struct ::option* long_options;

    /// Auto-generated identifiers to be able to parse long options.
    std::map< int, const cmdline::base_option* > ids;

    /// Constructs a new getopt_data.
    ///
    /// \param options The user-provided options to be converted.
    getopt_data(const cmdline::options_vector& options) :
        long_options(NULL)
    {
        // Make getopt_long(3) stop at the first non-option argument so that
        // subcommands can be parsed later on, and make it report missing
        // arguments with ':' instead of '?'.
        short_options = "+:";
        long_options = new struct ::option[options.size() + 1];

        int cur_id = std::numeric_limits< char >::max() + 1;
        for (cmdline::options_vector::size_type i = 0; i < options.size();
             i++) {
            const cmdline::base_option* option = options[i];
            struct ::option& long_option = long_options[i];

            long_option.name = option->long_name().c_str();
            if (option->needs_arg())
                long_option.has_arg = required_argument;
            else
                long_option.has_arg = no_argument;

            int id = -1;
            if (option->has_short_name()) {
                short_options += option->short_name();
                if (option->needs_arg())
                    short_options += ':';
                id = option->short_name();
            } else {
                id = cur_id++;
            }
            long_option.flag = NULL;
            long_option.val = id;
            ids[id] = option;
        }

        struct ::option& last_long_option = long_options[options.size()];
        last_long_option.name = NULL;
        last_long_option.has_arg = 0;
        last_long_option.flag = NULL;
        last_long_option.val = 0;
    }

    /// Releases the data allocated by the constructor.
    ~getopt_data(void)
    {
        delete [] long_options;
    }
};


/// Modifiable copy of the command line in the format expected by getopt(3).
class argv_copy : utils::noncopyable {
    /// The copied strings, terminated by a NULL pointer.
    std::vector< char* > _argv;

public:
    /// Copies a command line.
    ///
    /// \param argc The number of arguments in argv.
    /// \param argv The arguments to copy.
    argv_copy(const int argc, const char* const* argv)
    {
        _argv.reserve(argc + 1);
        for (int i = 0; i < argc; i++)
            _argv.push_back(::strdup(argv[i]));
        _argv.push_back(NULL);
    }

    /// Releases the copied strings.
    ~argv_copy(void)
    {
        for (std::vector< char* >::iterator iter = _argv.begin();
             iter != _argv.end(); ++iter)
            std::free(*iter);
    }

    /// Gets the copied command line.
    ///
    /// \return A NULL-terminated array of strings.
    char** get(void)
    {
        return &_argv[0];
    }
};


/// Resets getopt(3) so that it can process a new command line.
static void
reset_getopt(void)
{
    opterr = 0;
#if defined(__GLIBC__)
    // Zero forces glibc to reinitialize all of its internal state.
    optind = 0;
#else
    optind = 1;
    optreset = 1;
#endif
}


/// Gets the name of the option that caused a getopt(3) error.
///
/// \param argv The command line being processed.
///
/// \return The name of the offending option, including its dashes.
static std::string
offending_option(char* const* argv)
{
    const std::string arg = argv[optind - 1];
    if (arg.length() > 2 && arg.substr(0, 2) == "--")
        return arg.substr(0, arg.find('='));
    else if (optopt > 0 && optopt <= std::numeric_limits< char >::max())
        return F("-%s") % static_cast< char >(optopt);
    else
        return arg.substr(0, arg.find('='));
}


}  // anonymous namespace


/// Constructs a new parsed_cmdline.
///
/// Use the cmdline::parse() free functions to construct.
///
/// \param option_values_ A mapping of long option names to values.  This
///     contains a representation of the options provided by the user.  Note
///     that each value is actually a collection values: a user may specify a
///     flag multiple times, and depending on the case we want to honor one or
///     the other.  For those options that support no argument, the argument
///     value is the empty string.
/// \param arguments_ The list of non-option arguments in the command line.
cmdline::parsed_cmdline::parsed_cmdline(const options_map& option_values_,
                                        const cmdline::args_vector& arguments_) :
    _option_values(option_values_),
    _arguments(arguments_)
{
}


/// Checks if the given option has been given in the command line.
///
/// \param name The long option name to check for presence.
///
/// \return True if the option has been given; false otherwise.
bool
cmdline::parsed_cmdline::has_option(const std::string& name) const
{
    return _option_values.find(name) != _option_values.end();
}


/// Gets the raw values of an option.
///
/// \param name The long option name to query.
///
/// \return All the values given to the option, in order of appearance.
///
/// \pre has_option(name) must be true.
const std::vector< std::string >&
cmdline::parsed_cmdline::get_option_raw(const std::string& name) const
{
    const options_map::const_iterator iter = _option_values.find(name);
    PRE_MSG(iter != _option_values.end(), F("Option %s not defined") % name);
    INV(!(*iter).second.empty());
    return (*iter).second;
}


/// Returns the non-option arguments found in the command line.
///
/// \return The arguments, if any.
const cmdline::args_vector&
cmdline::parsed_cmdline::arguments(void) const
{
    return _arguments;
}


/// Parses a command line.
///
/// \param args The command line to parse, broken down by words.
/// \param options The description of the supported options.
///
/// \return The parsed command line.
///
/// \pre args[0] must be the program or command name.
///
/// \throw cmdline::error See the description of parse(argc, argv, options) for
///     more details on the raised errors.
cmdline::parsed_cmdline
cmdline::parse(const cmdline::args_vector& args,
               const cmdline::options_vector& options)
{
    PRE_MSG(args.size() >= 1, "No progname or command name found");

    std::vector< const char* > argv;
    for (args_vector::const_iterator iter = args.begin(); iter != args.end();
         ++iter)
        argv.push_back((*iter).c_str());
    argv.push_back(NULL);

    return parse(static_cast< int >(args.size()), &argv[0], options);
}


/// Parses a command line.
///
/// \param argc The number of arguments in argv, without counting the
///     terminating NULL.
/// \param argv The arguments to parse.  The array is NULL-terminated.
/// \param options The description of the supported options.
///
/// \return The parsed command line.
///
/// \pre args[0] must be the program or command name.
///
/// \throw cmdline::missing_option_argument_error If the user specified an
///     option that requires an argument, but no argument was provided.
/// \throw cmdline::unknown_option_error If the user specified an unknown
///     option (i.e. an option not defined in options).
/// \throw cmdline::option_argument_value_error If the user passed an invalid
///     argument to a supported option.
cmdline::parsed_cmdline
cmdline::parse(const int argc, const char* const* argv,
               const cmdline::options_vector& options)
{
    PRE_MSG(argc >= 1, "No progname or command name found");

    options_map option_values;
    for (options_vector::const_iterator iter = options.begin();
         iter != options.end(); ++iter) {
        const base_option* option = *iter;
        if (option->needs_arg() && option->has_default_value())
            option_values[option->long_name()].push_back(
                option->default_value());
    }

    argv_copy mutable_argv(argc, argv);
    const getopt_data data(options);

    reset_getopt();
    int ch;
    while ((ch = ::getopt_long(argc, mutable_argv.get(),
                               data.short_options.c_str(),
                               data.long_options, NULL)) != -1) {
        if (ch == ':') {
            throw missing_option_argument_error(offending_option(
                mutable_argv.get()));
        } else if (ch == '?') {
            throw unknown_option_error(offending_option(
                mutable_argv.get()));
        }

        const std::map< int, const base_option* >::const_iterator id =
            data.ids.find(ch);
        INV(id != data.ids.end());
        const base_option* option = (*id).second;

        if (option->needs_arg()) {
            option->validate(optarg);
            option_values[option->long_name()].push_back(optarg);
        } else {
            option_values[option->long_name()].push_back("");
        }
    }

    args_vector arguments;
    for (int i = optind; i < argc; i++)
        arguments.push_back(argv[i]);

    reset_getopt();

    return parsed_cmdline(option_values, arguments);
}
