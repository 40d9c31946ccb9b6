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

#include "utils/config/tree.hpp"

#if !defined(UTILS_CONFIG_TREE_IPP)
#define UTILS_CONFIG_TREE_IPP

#include <typeinfo>

#include "utils/config/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"
#include "utils/text/exceptions.hpp"
#include "utils/text/operations.ipp"

namespace utils {


/// Constructs a new leaf node without a value.
template< typename ValueType >
config::typed_leaf_node< ValueType >::typed_leaf_node(void) :
    _value(none)
{
}


/// Checks whether the node has been set by the user.
///
/// \return True if a value has been set in the node.
template< typename ValueType >
bool
config::typed_leaf_node< ValueType >::is_set(void) const
{
    return static_cast< bool >(_value);
}


/// Gets the value stored in the node.
///
/// \pre The node must have a value.
///
/// \return The value in the node.
template< typename ValueType >
const typename config::typed_leaf_node< ValueType >::value_type&
config::typed_leaf_node< ValueType >::value(void) const
{
    PRE(is_set());
    return _value.get();
}


/// Sets the value of the node.
///
/// \param value_ The new value to set the node to.
template< typename ValueType >
void
config::typed_leaf_node< ValueType >::set(const value_type& value_)
{
    _value = optional< value_type >(value_);
}


/// Sets the value of the node from a raw string representation.
///
/// \param raw_value The value to set the node to.
///
/// \throw value_error If the value is invalid.
template< typename ValueType >
void
config::native_leaf_node< ValueType >::set_string(const std::string& raw_value)
{
    try {
        typed_leaf_node< ValueType >::set(text::to_type< ValueType >(
            raw_value));
    } catch (const text::value_error& e) {
        throw value_error(F("Failed to convert string value '%s' to the node's "
                            "type") % raw_value);
    }
}


/// Converts the contents of the node to a string.
///
/// \pre The node must have a value.
///
/// \return A string representation of the value held by the node.
template< typename ValueType >
std::string
config::native_leaf_node< ValueType >::to_string(void) const
{
    PRE(typed_leaf_node< ValueType >::is_set());
    return F("%s") % typed_leaf_node< ValueType >::value();
}


/// Registers a key as valid and having a specific type.
///
/// This method does not raise errors on invalid/unknown keys or other
/// tree-related issues.  The reasons is that define() is a method that does not
/// depend on user input: it is intended to pre-populate the tree with a
/// specific structure, and that happens once at coding time.
///
/// \tparam LeafType The node type of the leaf we are defining.
/// \param key The key to be registered; must not be defined yet.
template< class LeafType >
void
config::tree::define(const std::string& key)
{
    PRE_MSG(!key.empty(), "Configuration keys cannot be empty");
    PRE_MSG(_nodes.find(key) == _nodes.end(),
            F("Configuration key '%s' defined twice") % key);
    _nodes[key] = std::shared_ptr< leaf_node >(new LeafType());
}


/// Gets the value of a node.
///
/// \tparam LeafType The node type of the leaf we are querying.
/// \param key The key to be queried.
///
/// \return A reference to the value in the located leaf, if successful.
///
/// \throw unknown_key_error If the provided key is unknown or not set.
/// \throw value_error If the type of the request does not match the type of
///     the node.
template< class LeafType >
const typename LeafType::value_type&
config::tree::lookup(const std::string& key) const
{
    const leaf_node* raw_node = find_node(key);
    if (!raw_node->is_set())
        throw unknown_key_error(key, "Configuration property '%s' is not set");
    try {
        const LeafType& child = dynamic_cast< const LeafType& >(*raw_node);
        return child.value();
    } catch (const std::bad_cast& unused_error) {
        throw value_error(F("Invalid value type for key '%s'") % key);
    }
}


/// Sets the value of a leaf.
///
/// \tparam LeafType The node type of the leaf we are setting.
/// \param key The key to be set.
/// \param value The value to set into the node.
///
/// \throw unknown_key_error If the provided key is unknown.
/// \throw value_error If the type of the request does not match the type of
///     the node.
template< class LeafType >
void
config::tree::set(const std::string& key,
                  const typename LeafType::value_type& value)
{
    leaf_node* raw_node = find_node(key);
    try {
        LeafType& child = dynamic_cast< LeafType& >(*raw_node);
        child.set(value);
    } catch (const std::bad_cast& unused_error) {
        throw value_error(F("Invalid value type for key '%s'") % key);
    }
}


}  // namespace utils


#endif  // !defined(UTILS_CONFIG_TREE_IPP)
