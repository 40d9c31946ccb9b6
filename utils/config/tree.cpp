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

#include "utils/config/tree.ipp"

#include <lutok/state.ipp>

#include "utils/config/exceptions.hpp"
#include "utils/format/macros.hpp"

namespace config = utils::config;


/// Destructor.
config::leaf_node::~leaf_node(void)
{
}


/// Copies the node.
///
/// \return A dynamically-allocated node.
config::leaf_node*
config::bool_node::deep_copy(void) const
{
    bool_node* new_node = new bool_node();
    new_node->_value = _value;
    return new_node;
}


/// Pushes the node's value onto the Lua stack.
///
/// \param state The Lua state onto which to push the value.
void
config::bool_node::push_lua(lutok::state& state) const
{
    state.push_boolean(value());
}


/// Sets the value of the node from an entry in the Lua stack.
///
/// \param state The Lua state from which to get the value.
/// \param value_index The stack index in which the value resides.
///
/// \throw value_error If the value in state(value_index) cannot be
///     processed by this node.
void
config::bool_node::set_lua(lutok::state& state, const int value_index)
{
    if (state.is_boolean(value_index))
        set(state.to_boolean(value_index));
    else
        throw value_error("Not a boolean");
}


/// Copies the node.
///
/// \return A dynamically-allocated node.
config::leaf_node*
config::int_node::deep_copy(void) const
{
    int_node* new_node = new int_node();
    new_node->_value = _value;
    return new_node;
}


/// Pushes the node's value onto the Lua stack.
///
/// \param state The Lua state onto which to push the value.
void
config::int_node::push_lua(lutok::state& state) const
{
    state.push_integer(value());
}


/// Sets the value of the node from an entry in the Lua stack.
///
/// Strings holding numbers are accepted too, as Lua does in arithmetic.
///
/// \param state The Lua state from which to get the value.
/// \param value_index The stack index in which the value resides.
///
/// \throw value_error If the value in state(value_index) cannot be
///     processed by this node.
void
config::int_node::set_lua(lutok::state& state, const int value_index)
{
    if (state.is_number(value_index))
        set_string(state.to_string(value_index));
    else
        throw value_error("Not a number");
}


/// Copies the node.
///
/// \return A dynamically-allocated node.
config::leaf_node*
config::string_node::deep_copy(void) const
{
    string_node* new_node = new string_node();
    new_node->_value = _value;
    return new_node;
}


/// Pushes the node's value onto the Lua stack.
///
/// \param state The Lua state onto which to push the value.
void
config::string_node::push_lua(lutok::state& state) const
{
    state.push_string(value());
}


/// Sets the value of the node from an entry in the Lua stack.
///
/// \param state The Lua state from which to get the value.
/// \param value_index The stack index in which the value resides.
///
/// \throw value_error If the value in state(value_index) cannot be
///     processed by this node.
void
config::string_node::set_lua(lutok::state& state, const int value_index)
{
    if (state.is_string(value_index))
        set(state.to_string(value_index));
    else
        throw value_error("Not a string");
}


/// Constructor.
config::tree::tree(void)
{
}


/// Destructor.
config::tree::~tree(void)
{
}


/// Locates a node by its key.
///
/// \param key The key of the node to look for.
///
/// \return The node; never NULL.
///
/// \throw unknown_key_error If the key has not been defined.
config::leaf_node*
config::tree::find_node(const std::string& key) const
{
    const nodes_map::const_iterator iter = _nodes.find(key);
    if (iter == _nodes.end())
        throw unknown_key_error(key);
    return (*iter).second.get();
}


/// Generates a deep copy of the input tree.
///
/// \return A new tree that is an exact copy of this tree.
config::tree
config::tree::deep_copy(void) const
{
    tree new_tree;
    for (nodes_map::const_iterator iter = _nodes.begin(); iter != _nodes.end();
         ++iter) {
        new_tree._nodes[(*iter).first] = std::shared_ptr< leaf_node >(
            (*iter).second->deep_copy());
    }
    return new_tree;
}


/// Checks if a given key has been defined.
///
/// \param key The key to check.
///
/// \return True if the key has been registered with define().
bool
config::tree::is_defined(const std::string& key) const
{
    return _nodes.find(key) != _nodes.end();
}


/// Checks if a given node is set.
///
/// \param key The key to be checked.
///
/// \return True if the key is defined and set to a value; false otherwise.
bool
config::tree::is_set(const std::string& key) const
{
    const nodes_map::const_iterator iter = _nodes.find(key);
    return iter != _nodes.end() && (*iter).second->is_set();
}


/// Pushes a leaf node's value onto the Lua stack.
///
/// \param key The key to be queried.
/// \param state The Lua state into which to push the key's value.
///
/// \throw unknown_key_error If the provided key is unknown or not set.
void
config::tree::push_lua(const std::string& key, lutok::state& state) const
{
    const leaf_node* node = find_node(key);
    if (!node->is_set())
        throw unknown_key_error(key, "Configuration property '%s' is not set");
    node->push_lua(state);
}


/// Sets a leaf node's value from a value in the Lua stack.
///
/// \param key The key to be set.
/// \param state The Lua state from which to retrieve the value.
/// \param value_index The position in the Lua stack holding the value.
///
/// \throw unknown_key_error If the provided key is unknown.
/// \throw value_error If the value mismatches the node type.
void
config::tree::set_lua(const std::string& key, lutok::state& state,
                      const int value_index)
{
    leaf_node* node = find_node(key);
    try {
        node->set_lua(state, value_index);
    } catch (const value_error& e) {
        throw value_error(F("Invalid value for property '%s': %s") % key %
                          e.what());
    }
}


/// Gets the value of a node as a plain string.
///
/// \param key The key to be looked up.
///
/// \return The value in the located node as a string.
///
/// \throw unknown_key_error If the provided key is unknown or not set.
std::string
config::tree::lookup_string(const std::string& key) const
{
    const leaf_node* node = find_node(key);
    if (!node->is_set())
        throw unknown_key_error(key, "Configuration property '%s' is not set");
    return node->to_string();
}


/// Sets the value of a leaf addressed by its key from a string value.
///
/// This respects the native types of all the nodes that have been predefined.
///
/// \param key The key to be set.
/// \param raw_value The string representation of the value to set the node to.
///
/// \throw unknown_key_error If the provided key is unknown.
/// \throw value_error If the value mismatches the node type.
void
config::tree::set_string(const std::string& key, const std::string& raw_value)
{
    leaf_node* node = find_node(key);
    try {
        node->set_string(raw_value);
    } catch (const value_error& e) {
        throw value_error(F("Invalid value for property '%s': %s") % key %
                          e.what());
    }
}


/// Converts the tree to a collection of key/value string pairs.
///
/// Keys that have been defined but not set are skipped.
///
/// \return A map of keys to values in their textual representation.
config::properties_map
config::tree::all_properties(void) const
{
    properties_map properties;
    for (nodes_map::const_iterator iter = _nodes.begin(); iter != _nodes.end();
         ++iter) {
        if ((*iter).second->is_set())
            properties[(*iter).first] = (*iter).second->to_string();
    }
    return properties;
}
