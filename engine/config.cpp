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

#include "engine/config.hpp"

#include "engine/exceptions.hpp"
#include "utils/config/exceptions.hpp"
#include "utils/config/parser.hpp"
#include "utils/config/tree.ipp"
#include "utils/env.hpp"
#include "utils/fs/operations.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"

namespace config = utils::config;
namespace fs = utils::fs;

using utils::optional;


namespace {


/// Defines the schema of a configuration tree.
///
/// \param [in,out] tree The tree to populate.  The tree should be empty on
///     entry to prevent collisions with the keys defined in here.
static void
init_tree(config::tree& tree)
{
    tree.define< config::string_node >("store_file");
    tree.define< config::string_node >("artifacts_dir");
    tree.define< config::int_node >("token_length");
}


/// Fills in a configuration tree with default values.
///
/// \param [in,out] tree The tree to populate.  init_tree() must have been
///     called on it beforehand.
static void
set_defaults(config::tree& tree)
{
    const optional< fs::path > home = utils::get_home();
    if (home) {
        tree.set< config::string_node >(
            "store_file", (home.get() / ".trackrun/store.db").str());
    } else {
        LW("HOME not defined; the default store database lives in the "
           "current directory");
        tree.set< config::string_node >(
            "store_file", (fs::current_path() / "trackrun-store.db").str());
    }
    tree.set< config::string_node >("artifacts_dir",
                                    "/var/lib/trackrun/results");
    tree.set< config::int_node >("token_length", 64);
}


/// Configuration parser specialization for trackrun configuration files.
class config_parser : public config::parser {
    /// Initializes the configuration tree.
    ///
    /// This is a callback executed when the configuration script invokes the
    /// syntax() method.
    ///
    /// \param [out] tree The tree in which to define the key structure.
    /// \param syntax_version The version of the file format as specified in the
    ///     configuration file.
    ///
    /// \throw config::error If the syntax_version is not supported.
    void
    setup(config::tree& tree, const int syntax_version)
    {
        if (syntax_version != 1)
            throw config::error(F("Unsupported config version %s") %
                                syntax_version);

        init_tree(tree);
        set_defaults(tree);
    }

public:
    /// Initializes the configuration parser.
    ///
    /// \param [out] tree The tree in which to store the parsed configuration.
    config_parser(config::tree& tree) :
        config::parser(tree)
    {
    }
};


}  // anonymous namespace


/// Constructs a configuration tree without any values set.
///
/// \return A new configuration tree with only the schema defined.
config::tree
engine::empty_config(void)
{
    config::tree tree;
    init_tree(tree);
    return tree;
}


/// Constructs a configuration tree with the default values.
///
/// \return A new configuration tree.
config::tree
engine::default_config(void)
{
    config::tree tree;
    init_tree(tree);
    set_defaults(tree);
    return tree;
}


/// Parses a configuration file.
///
/// \param file The path to the configuration file to load.
///
/// \return The parsed configuration, with the defaults of any key not set by
/// the file.
///
/// \throw load_error If there is any problem loading the file or if any of
///     the values is out of range.
config::tree
engine::load_config(const fs::path& file)
{
    config::tree tree;
    try {
        config_parser(tree).parse(file);

        const int token_length = tree.lookup< config::int_node >(
            "token_length");
        if (token_length <= 0)
            throw load_error(file, F("Invalid token_length %s: must be "
                                     "positive") % token_length);
    } catch (const config::error& e) {
        throw load_error(file, e.what());
    }

    LI(F("Loaded configuration from %s") % file);
    return tree;
}
