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

/// \file cli/common.hpp
/// Utility functions to implement CLI subcommands.

#if !defined(CLI_COMMON_HPP)
#define CLI_COMMON_HPP

extern "C" {
#include <stdint.h>
}

#include <memory>
#include <string>

#include "utils/cmdline/base_command.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/config/tree.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.hpp"

namespace utils {
namespace cmdline {
class parsed_cmdline;
}  // namespace cmdline
namespace fs {
class path;
}  // namespace fs
}  // namespace utils

namespace store {
class backend;
}  // namespace store

namespace cli {


/// Base type for commands defined in the cli module.
///
/// All commands in trackrun receive the user configuration as their data.
typedef utils::cmdline::base_command< utils::config::tree > cli_command;


/// Shared pointer to a cli_command.
typedef std::shared_ptr< cli_command > cli_command_ptr;


extern const utils::cmdline::string_option config_option;


utils::config::tree load_config(const utils::cmdline::parsed_cmdline&,
                                const bool);

utils::fs::path store_path(const utils::config::tree&);
store::backend open_store_ro(const utils::config::tree&);
store::backend open_store_rw(const utils::config::tree&);
utils::fs::path artifacts_dir(const utils::config::tree&);

int64_t parse_id(const std::string&, const char*);
std::string format_timestamp(
    const utils::optional< utils::datetime::timestamp >&);


}  // namespace cli

#endif  // !defined(CLI_COMMON_HPP)
