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

/// \file model/run.hpp
/// Definition of the "run" concept.

#if !defined(MODEL_RUN_HPP)
#define MODEL_RUN_HPP

#include "model/run_fwd.hpp"

#include <ostream>
#include <string>

namespace model {


const char* platform_name(const platform);
platform parse_platform(const std::string&);

const char* run_type_name(const run_type);
run_type parse_run_type(const std::string&);


/// Representation of a run: one execution of the test suite against a change.
class run {
    /// Platform on which the run executes.
    platform _platform;

    /// Whether the run tests a commit or a pull request.
    run_type _type;

    /// Access token of the run.
    std::string _token;

    /// URL of the repository holding the change.
    std::string _fork_url;

    /// Name of the branch holding the change.
    std::string _branch;

    /// Hash of the tested commit.
    std::string _commit;

    /// Number of the pull request; 0 for commit runs.
    int _pr_nr;

public:
    run(const platform, const run_type, const std::string&, const std::string&,
        const std::string&, const std::string&, const int);

    platform get_platform(void) const;
    run_type type(void) const;
    const std::string& token(void) const;
    const std::string& fork_url(void) const;
    const std::string& branch(void) const;
    const std::string& commit(void) const;
    int pr_nr(void) const;

    std::string repository_url(void) const;
    std::string repository_link(void) const;

    bool operator==(const run&) const;
    bool operator!=(const run&) const;
};


std::ostream& operator<<(std::ostream&, const platform);
std::ostream& operator<<(std::ostream&, const run_type);
std::ostream& operator<<(std::ostream&, const run&);


}  // namespace model

#endif  // !defined(MODEL_RUN_HPP)
