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

#include "utils/cmdline/commands_map.hpp"

#if !defined(UTILS_CMDLINE_COMMANDS_MAP_IPP)
#define UTILS_CMDLINE_COMMANDS_MAP_IPP

#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"

namespace utils {


/// Constructs an empty set of commands.
template< typename BaseCommand >
cmdline::commands_map< BaseCommand >::commands_map(void)
{
}


/// Inserts a new command into the map.
///
/// \param command The command to insert.  This must have been dynamically
///     allocated by the caller.  The collection takes ownership of the object.
/// \param category The category the command belongs to, used to group the
///     commands in the help output.
template< typename BaseCommand >
void
cmdline::commands_map< BaseCommand >::insert(command_ptr command,
                                             const std::string& category)
{
    const std::string name = command->name();
    PRE_MSG(_commands.find(name) == _commands.end(),
            F("Command '%s' already registered") % name);
    _commands[name] = command;
    _categories[category].insert(name);
}


/// Checks whether the list of commands is empty.
///
/// \return True if there are no commands in this map.
template< typename BaseCommand >
bool
cmdline::commands_map< BaseCommand >::empty(void) const
{
    return _commands.empty();
}


/// Returns a constant iterator to the beginning of the commands.
///
/// \return A map (string, BaseCommand*) iterator.
template< typename BaseCommand >
typename cmdline::commands_map< BaseCommand >::const_iterator
cmdline::commands_map< BaseCommand >::begin(void) const
{
    return _commands.begin();
}


/// Returns a constant iterator to the end of the commands.
///
/// \return A map (string, BaseCommand*) iterator.
template< typename BaseCommand >
typename cmdline::commands_map< BaseCommand >::const_iterator
cmdline::commands_map< BaseCommand >::end(void) const
{
    return _commands.end();
}


/// Returns a constant iterator to the beginning of the categories.
///
/// Commands inserted without a category are grouped under the empty name,
/// which sorts before any other category.
///
/// \return A map (string, names_set) iterator.
template< typename BaseCommand >
typename cmdline::commands_map< BaseCommand >::categories_iterator
cmdline::commands_map< BaseCommand >::categories_begin(void) const
{
    return _categories.begin();
}


/// Returns a constant iterator to the end of the categories.
///
/// \return A map (string, names_set) iterator.
template< typename BaseCommand >
typename cmdline::commands_map< BaseCommand >::categories_iterator
cmdline::commands_map< BaseCommand >::categories_end(void) const
{
    return _categories.end();
}


/// Finds a command by name.
///
/// \param name The name of the command to locate.
///
/// \return The command itself or NULL if it does not exist.
template< typename BaseCommand >
BaseCommand*
cmdline::commands_map< BaseCommand >::find(const std::string& name) const
{
    typename impl_map::const_iterator iter = _commands.find(name);
    if (iter == _commands.end())
        return NULL;
    else
        return (*iter).second.get();
}


}  // namespace utils


#endif  // !defined(UTILS_CMDLINE_COMMANDS_MAP_IPP)
