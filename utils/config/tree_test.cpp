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

#include <atf-c++.hpp>

#include "utils/config/exceptions.hpp"

namespace config = utils::config;


namespace {


/// Creates a tree with the keys used by most tests.
///
/// \return A tree with a few defined but unset keys.
static config::tree
make_tree(void)
{
    config::tree tree;
    tree.define< config::string_node >("store_file");
    tree.define< config::int_node >("token_length");
    tree.define< config::bool_node >("verbose");
    return tree;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(define_set_lookup);
ATF_TEST_CASE_BODY(define_set_lookup)
{
    config::tree tree = make_tree();

    tree.set< config::string_node >("store_file", "/tmp/store.db");
    tree.set< config::int_node >("token_length", 32);
    tree.set< config::bool_node >("verbose", false);

    ATF_REQUIRE_EQ("/tmp/store.db",
                   tree.lookup< config::string_node >("store_file"));
    ATF_REQUIRE_EQ(32, tree.lookup< config::int_node >("token_length"));
    ATF_REQUIRE(!tree.lookup< config::bool_node >("verbose"));
}


ATF_TEST_CASE_WITHOUT_HEAD(is_defined_and_is_set);
ATF_TEST_CASE_BODY(is_defined_and_is_set)
{
    config::tree tree = make_tree();

    ATF_REQUIRE(tree.is_defined("token_length"));
    ATF_REQUIRE(!tree.is_set("token_length"));
    ATF_REQUIRE(!tree.is_defined("unknown"));
    ATF_REQUIRE(!tree.is_set("unknown"));

    tree.set< config::int_node >("token_length", 8);
    ATF_REQUIRE(tree.is_set("token_length"));
}


ATF_TEST_CASE_WITHOUT_HEAD(lookup__unknown_key);
ATF_TEST_CASE_BODY(lookup__unknown_key)
{
    const config::tree tree = make_tree();

    try {
        tree.lookup< config::int_node >("foo");
        fail("unknown_key_error not raised");
    } catch (const config::unknown_key_error& e) {
        ATF_REQUIRE_EQ("foo", e.key());
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(lookup__not_set);
ATF_TEST_CASE_BODY(lookup__not_set)
{
    const config::tree tree = make_tree();

    ATF_REQUIRE_THROW_RE(config::unknown_key_error,
                         "'token_length' is not set",
                         tree.lookup< config::int_node >("token_length"));
    ATF_REQUIRE_THROW_RE(config::unknown_key_error,
                         "'verbose' is not set",
                         tree.lookup_string("verbose"));
}


ATF_TEST_CASE_WITHOUT_HEAD(lookup__type_mismatch);
ATF_TEST_CASE_BODY(lookup__type_mismatch)
{
    config::tree tree = make_tree();
    tree.set< config::int_node >("token_length", 5);

    ATF_REQUIRE_THROW_RE(config::value_error,
                         "Invalid value type for key 'token_length'",
                         tree.lookup< config::string_node >("token_length"));
}


ATF_TEST_CASE_WITHOUT_HEAD(set__unknown_key);
ATF_TEST_CASE_BODY(set__unknown_key)
{
    config::tree tree = make_tree();

    ATF_REQUIRE_THROW_RE(config::unknown_key_error,
                         "Unknown configuration property 'artifacts'",
                         tree.set< config::string_node >("artifacts", "x"));
}


ATF_TEST_CASE_WITHOUT_HEAD(set__type_mismatch);
ATF_TEST_CASE_BODY(set__type_mismatch)
{
    config::tree tree = make_tree();

    ATF_REQUIRE_THROW_RE(config::value_error,
                         "Invalid value type for key 'verbose'",
                         tree.set< config::int_node >("verbose", 1));
    ATF_REQUIRE(!tree.is_set("verbose"));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_string__ok);
ATF_TEST_CASE_BODY(set_string__ok)
{
    config::tree tree = make_tree();

    tree.set_string("store_file", "/var/db/store.db");
    tree.set_string("token_length", "128");
    tree.set_string("verbose", "true");

    ATF_REQUIRE_EQ("/var/db/store.db", tree.lookup_string("store_file"));
    ATF_REQUIRE_EQ(128, tree.lookup< config::int_node >("token_length"));
    ATF_REQUIRE_EQ("128", tree.lookup_string("token_length"));
    ATF_REQUIRE_EQ("true", tree.lookup_string("verbose"));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_string__invalid_value);
ATF_TEST_CASE_BODY(set_string__invalid_value)
{
    config::tree tree = make_tree();

    ATF_REQUIRE_THROW_RE(config::value_error,
                         "Invalid value for property 'token_length'",
                         tree.set_string("token_length", "many"));
    ATF_REQUIRE_THROW_RE(config::value_error,
                         "Invalid value for property 'verbose'",
                         tree.set_string("verbose", "maybe"));
    ATF_REQUIRE_THROW(config::unknown_key_error,
                      tree.set_string("other", "1"));
}


ATF_TEST_CASE_WITHOUT_HEAD(all_properties__skips_unset);
ATF_TEST_CASE_BODY(all_properties__skips_unset)
{
    config::tree tree = make_tree();
    ATF_REQUIRE(tree.all_properties().empty());

    tree.set< config::int_node >("token_length", 64);
    tree.set< config::bool_node >("verbose", true);

    config::properties_map exp_properties;
    exp_properties["token_length"] = "64";
    exp_properties["verbose"] = "true";
    ATF_REQUIRE(exp_properties == tree.all_properties());
}


ATF_TEST_CASE_WITHOUT_HEAD(copy__shallow);
ATF_TEST_CASE_BODY(copy__shallow)
{
    config::tree tree1 = make_tree();
    config::tree tree2 = tree1;

    tree2.set< config::int_node >("token_length", 10);
    ATF_REQUIRE_EQ(10, tree1.lookup< config::int_node >("token_length"));
}


ATF_TEST_CASE_WITHOUT_HEAD(deep_copy__independent);
ATF_TEST_CASE_BODY(deep_copy__independent)
{
    config::tree tree1 = make_tree();
    tree1.set< config::string_node >("store_file", "a.db");

    config::tree tree2 = tree1.deep_copy();
    ATF_REQUIRE_EQ("a.db", tree2.lookup< config::string_node >("store_file"));

    tree2.set< config::string_node >("store_file", "b.db");
    tree2.set< config::int_node >("token_length", 3);
    ATF_REQUIRE_EQ("a.db", tree1.lookup< config::string_node >("store_file"));
    ATF_REQUIRE(!tree1.is_set("token_length"));
    ATF_REQUIRE(tree2.is_defined("verbose"));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, define_set_lookup);
    ATF_ADD_TEST_CASE(tcs, is_defined_and_is_set);
    ATF_ADD_TEST_CASE(tcs, lookup__unknown_key);
    ATF_ADD_TEST_CASE(tcs, lookup__not_set);
    ATF_ADD_TEST_CASE(tcs, lookup__type_mismatch);
    ATF_ADD_TEST_CASE(tcs, set__unknown_key);
    ATF_ADD_TEST_CASE(tcs, set__type_mismatch);
    ATF_ADD_TEST_CASE(tcs, set_string__ok);
    ATF_ADD_TEST_CASE(tcs, set_string__invalid_value);
    ATF_ADD_TEST_CASE(tcs, all_properties__skips_unset);
    ATF_ADD_TEST_CASE(tcs, copy__shallow);
    ATF_ADD_TEST_CASE(tcs, deep_copy__independent);
}
