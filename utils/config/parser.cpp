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

#include "utils/config/parser.hpp"

#include <lutok/exceptions.hpp>
#include <lutok/operations.hpp>
#include <lutok/stack_cleaner.hpp>
#include <lutok/state.ipp>

#include "utils/config/exceptions.hpp"
#include "utils/config/tree.ipp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/noncopyable.hpp"

namespace config = utils::config;


/// Internal implementation of the parser.
struct utils::config::parser::impl : utils::noncopyable {
    /// Pointer to the parent parser.  Needed for callbacks.
    parser* _parent;

    /// The Lua state used by this parser to process the configuration file.
    lutok::state _state;

    /// The tree to be filed in by the configuration parameters, as provided by
    /// the caller.
    config::tree& _tree;

    /// Whether syntax() has been called or not.
    bool _syntax_called;

    /// Constructs a new implementation.
    ///
    /// \param parent_ Pointer to the class being constructed.
    /// \param config_tree_ The configuration tree provided by the user.
    impl(parser* const parent_, tree& config_tree_) :
        _parent(parent_), _tree(config_tree_), _syntax_called(false)
    {
    }

    void syntax_callback(const int);
};


namespace {


/// Gets the parser implementation registered in a Lua state.
///
/// \param state The Lua state to query.
///
/// \return The parser implementation stored in the _config_parser global.
static config::parser::impl*
get_impl(lutok::state& state)
{
    lutok::stack_cleaner cleaner(state);
    state.get_global("_config_parser");
    return *state.to_userdata< config::parser::impl* >(-1);
}


/// Gets the key being accessed by a metamethod.
///
/// \param state The Lua state.
/// \param key_index Stack position of the key.
///
/// \return The key as a string.
///
/// \throw config::value_error If the key is not a string.
static std::string
get_key(lutok::state& state, const int key_index)
{
    if (!state.is_string(key_index))
        throw config::value_error("Configuration keys must be strings");
    return state.to_string(key_index);
}


/// Lua __index metamethod for the globals table.
///
/// Reads of undefined global variables are redirected to the configuration
/// tree so that the configuration file can query the value of a property.
///
/// \pre state(-2) The globals table.
/// \pre state(-1) The key of the variable being queried.
///
/// \param state The Lua state to operate in.
///
/// \return The number of results pushed onto the stack; always 1.
static int
redirect_index(lutok::state& state)
{
    const std::string key = get_key(state, -1);
    const config::tree& tree = get_impl(state)->_tree;
    if (tree.is_set(key))
        tree.push_lua(key, state);
    else
        state.push_nil();
    return 1;
}


/// Lua __newindex metamethod for the globals table.
///
/// Assignments to global variables are redirected to the configuration tree.
/// Only the keys defined by the parser's setup hook are valid.
///
/// \pre state(-3) The globals table.
/// \pre state(-2) The key of the variable being set.
/// \pre state(-1) The value to set.
///
/// \param state The Lua state to operate in.
///
/// \return The number of results pushed onto the stack; always 0.
///
/// \throw config::unknown_key_error If the key is not defined in the tree.
/// \throw config::value_error If the value does not match the key's type.
static int
redirect_newindex(lutok::state& state)
{
    const std::string key = get_key(state, -2);
    config::tree& tree = get_impl(state)->_tree;
    tree.set_lua(key, state, -1);
    LD(F("Configuration property '%s' set to '%s'") % key %
       tree.lookup_string(key));
    return 0;
}


/// Implementation of the Lua syntax() function.
///
/// The syntax() function has to be called by configuration files as the very
/// first thing they do.  Once called, this function populates the configuration
/// tree based on the syntax version and then continues to process the rest of
/// the file.
///
/// \pre state(-1) The syntax format version.
///
/// \param state The Lua state to operate in.
///
/// \return The number of results pushed onto the stack; always 0.
static int
lua_syntax(lutok::state& state)
{
    if (!state.is_number(-1))
        throw config::value_error("Argument to syntax must be a number");
    const int syntax_version = state.to_integer(-1);

    config::parser::impl* impl = get_impl(state);
    if (impl->_syntax_called)
        throw config::value_error("syntax() can only be invoked once");
    impl->_syntax_called = true;

    impl->syntax_callback(syntax_version);

    return 0;
}


}  // anonymous namespace


/// Callback executed by the Lua syntax() function.
///
/// \param syntax_version The syntax format version as provided by the
///     configuration file in the call to syntax().
void
config::parser::impl::syntax_callback(const int syntax_version)
{
    // Allow the parser caller to populate the tree with its own schema
    // depending on the version.
    _parent->setup(_tree, syntax_version);

    // Redirect all global variable accesses to the configuration tree.
    lutok::stack_cleaner cleaner(_state);
    _state.push_globals_table();
    _state.new_table();
    _state.push_string("__index");
    _state.push_cxx_function(redirect_index);
    _state.set_table(-3);
    _state.push_string("__newindex");
    _state.push_cxx_function(redirect_newindex);
    _state.set_table(-3);
    _state.set_metatable(-2);
}


/// Constructs a new parser.
///
/// \param [in,out] config_tree The configuration tree into which the values set
///     in the configuration file will be stored.
config::parser::parser(tree& config_tree) :
    _pimpl(new impl(this, config_tree))
{
    lutok::stack_cleaner cleaner(_pimpl->_state);

    _pimpl->_state.open_base();
    _pimpl->_state.open_string();
    _pimpl->_state.open_table();

    _pimpl->_state.push_cxx_function(lua_syntax);
    _pimpl->_state.set_global("syntax");
    *_pimpl->_state.new_userdata< config::parser::impl* >() = _pimpl.get();
    _pimpl->_state.set_global("_config_parser");
}


/// Destructor.
config::parser::~parser(void)
{
}


/// Parses a configuration file.
///
/// \post The tree registered during the construction of this class is updated
/// to contain the values read from the configuration file.  If the processing
/// fails, the state of the output tree is undefined.
///
/// \param file The path to the file to process.
///
/// \throw syntax_error If there is any problem processing the file.
void
config::parser::parse(const fs::path& file)
{
    try {
        lutok::do_file(_pimpl->_state, file.str(), 0, 0, 0);
    } catch (const lutok::error& e) {
        throw syntax_error(e.what());
    }

    if (!_pimpl->_syntax_called)
        throw syntax_error("No syntax defined (no call to syntax() found)");
}
