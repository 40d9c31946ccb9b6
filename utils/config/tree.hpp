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

/// \file utils/config/tree.hpp
/// Data type to represent the configuration of a program.
///
/// The configuration of a program is a flat set of strictly-typed keys.  The
/// program defines the valid keys and their types upfront and only those keys
/// can later be set, either programmatically or through a configuration file.

#if !defined(UTILS_CONFIG_TREE_HPP)
#define UTILS_CONFIG_TREE_HPP

#include <map>
#include <memory>
#include <string>

#include "utils/noncopyable.hpp"
#include "utils/optional.hpp"

namespace lutok {
class state;
}  // namespace lutok

namespace utils {
namespace config {


/// Flat representation of all properties as strings.
typedef std::map< std::string, std::string > properties_map;


/// Abstract leaf node without any specified type.
///
/// This base abstract type is necessary to have a common pointer type to which
/// to cast any leaf.  We later provide templated derivates of this class, and
/// those cannot act in this manner.
class leaf_node : noncopyable {
public:
    virtual ~leaf_node(void);

    /// Creates a copy of the node, including its value.
    ///
    /// \return A newly-allocated node owned by the caller.
    virtual leaf_node* deep_copy(void) const = 0;

    /// Checks whether the node has been set.
    ///
    /// Nodes of the tree are predefined by the caller to specify the valid
    /// types of the leaves.  Such predefinition results in the creation of
    /// nodes within the tree, but these nodes have not yet been set.
    ///
    /// \return True if a value has been set in the node.
    virtual bool is_set(void) const = 0;

    /// Pushes the node's value onto the Lua stack.
    ///
    /// \param state The Lua state onto which to push the value.
    virtual void push_lua(lutok::state& state) const = 0;

    /// Sets the value of this node from the value on the Lua stack.
    ///
    /// \param state The Lua state from which to get the value.
    /// \param value_index The stack index in which the value resides.
    ///
    /// \throw value_error If the value in state(value_index) cannot be
    ///     processed by this node.
    virtual void set_lua(lutok::state& state, const int value_index) = 0;

    /// Sets the value of the node from a raw string representation.
    ///
    /// \param raw_value The value to set the node to.
    ///
    /// \throw value_error If the value is invalid.
    virtual void set_string(const std::string& raw_value) = 0;

    /// Converts the contents of the node to a string.
    ///
    /// \pre The node must have a value.
    ///
    /// \return A string representation of the value held by the node.
    virtual std::string to_string(void) const = 0;
};


/// Templated leaf node holding a single primitive value.
template< typename ValueType >
class typed_leaf_node : public leaf_node {
public:
    /// The type of the value held by this node.
    typedef ValueType value_type;

    typed_leaf_node(void);

    bool is_set(void) const;

    const value_type& value(void) const;
    void set(const value_type&);

protected:
    /// The value held by this node.
    optional< value_type > _value;
};


/// Leaf node holding a native type.
///
/// This templated leaf node holds native types.  The conversion to/from strings
/// for these types is generically performed via the text::to_type() function
/// and the F() formatter.
template< typename ValueType >
class native_leaf_node : public typed_leaf_node< ValueType > {
public:
    void set_string(const std::string&);
    std::string to_string(void) const;
};


/// Shorthand for a bool value.
class bool_node : public native_leaf_node< bool > {
public:
    virtual leaf_node* deep_copy(void) const;

    void push_lua(lutok::state&) const;
    void set_lua(lutok::state&, const int);
};


/// Shorthand for an int value.
class int_node : public native_leaf_node< int > {
public:
    virtual leaf_node* deep_copy(void) const;

    void push_lua(lutok::state&) const;
    void set_lua(lutok::state&, const int);
};


/// Shorthand for a string value.
class string_node : public native_leaf_node< std::string > {
public:
    virtual leaf_node* deep_copy(void) const;

    void push_lua(lutok::state&) const;
    void set_lua(lutok::state&, const int);
};


/// Representation of a configuration tree.
///
/// Copies of a tree are shallow: they share the same nodes, so setting a value
/// through one copy is visible through the other.  Use deep_copy() to obtain
/// an independent tree.
class tree {
    /// Type of the collection of nodes, indexed by their key.
    typedef std::map< std::string, std::shared_ptr< leaf_node > > nodes_map;

    /// The nodes of the tree.
    nodes_map _nodes;

    leaf_node* find_node(const std::string&) const;

public:
    tree(void);
    ~tree(void);

    tree deep_copy(void) const;

    template< class LeafType >
    void define(const std::string&);

    bool is_defined(const std::string&) const;
    bool is_set(const std::string&) const;

    template< class LeafType >
    const typename LeafType::value_type& lookup(const std::string&) const;

    template< class LeafType >
    void set(const std::string&, const typename LeafType::value_type&);

    void push_lua(const std::string&, lutok::state&) const;
    void set_lua(const std::string&, lutok::state&, const int);

    std::string lookup_string(const std::string&) const;
    void set_string(const std::string&, const std::string&);

    properties_map all_properties(void) const;
};


}  // namespace config
}  // namespace utils

#endif  // !defined(UTILS_CONFIG_TREE_HPP)
