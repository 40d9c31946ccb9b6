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

#include "model/run.hpp"

#include "model/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/text/operations.hpp"

namespace text = utils::text;


/// Gets the stable identifier of a platform.
///
/// \param platform_ The platform to convert.
///
/// \return A lowercase identifier.
const char*
model::platform_name(const platform platform_)
{
    switch (platform_) {
    case platform_linux: return "linux";
    case platform_windows: return "windows";
    }
    UNREACHABLE;
}


/// Parses the identifier of a platform.
///
/// \param name The identifier, as returned by platform_name().
///
/// \return The platform.
///
/// \throw format_error If the identifier is not known.
model::platform
model::parse_platform(const std::string& name)
{
    if (name == "linux")
        return platform_linux;
    else if (name == "windows")
        return platform_windows;
    else
        throw format_error(F("Unknown platform '%s'") % name);
}


/// Gets the stable identifier of a run type.
///
/// \param type The run type to convert.
///
/// \return A lowercase identifier.
const char*
model::run_type_name(const run_type type)
{
    switch (type) {
    case run_type_commit: return "commit";
    case run_type_pull_request: return "pr";
    }
    UNREACHABLE;
}


/// Parses the identifier of a run type.
///
/// \param name The identifier, as returned by run_type_name().
///
/// \return The run type.
///
/// \throw format_error If the identifier is not known.
model::run_type
model::parse_run_type(const std::string& name)
{
    if (name == "commit")
        return run_type_commit;
    else if (name == "pr")
        return run_type_pull_request;
    else
        throw format_error(F("Unknown run type '%s'") % name);
}


/// Constructs a new run.
///
/// \param platform_ Platform on which the run executes.
/// \param type_ Whether the run tests a commit or a pull request.
/// \param token_ Access token of the run.
/// \param fork_url_ URL of the repository holding the change.
/// \param branch_ Name of the branch holding the change.
/// \param commit_ Hash of the tested commit.
/// \param pr_nr_ Number of the pull request; must be 0 for commit runs.
///
/// \throw model::error If the pull request number does not match the type of
///     the run.
model::run::run(const platform platform_, const run_type type_,
                const std::string& token_, const std::string& fork_url_,
                const std::string& branch_, const std::string& commit_,
                const int pr_nr_) :
    _platform(platform_),
    _type(type_),
    _token(token_),
    _fork_url(fork_url_),
    _branch(branch_),
    _commit(commit_),
    _pr_nr(pr_nr_)
{
    if (_type == run_type_commit && _pr_nr != 0)
        throw error(F("Commit runs cannot have a pull request number; got %s")
                    % _pr_nr);
    if (_type == run_type_pull_request && _pr_nr <= 0)
        throw error(F("Invalid pull request number %s") % _pr_nr);
}


/// Returns the platform on which the run executes.
///
/// \return The platform.
model::platform
model::run::get_platform(void) const
{
    return _platform;
}


/// Returns the type of the run.
///
/// \return The run type.
model::run_type
model::run::type(void) const
{
    return _type;
}


/// Returns the access token of the run.
///
/// \return The token.
const std::string&
model::run::token(void) const
{
    return _token;
}


/// Returns the URL of the repository holding the change.
///
/// \return The URL as given to the constructor.
const std::string&
model::run::fork_url(void) const
{
    return _fork_url;
}


/// Returns the name of the branch holding the change.
///
/// \return The branch name.
const std::string&
model::run::branch(void) const
{
    return _branch;
}


/// Returns the hash of the tested commit.
///
/// \return The commit hash.
const std::string&
model::run::commit(void) const
{
    return _commit;
}


/// Returns the number of the pull request.
///
/// \return The pull request number; 0 for commit runs.
int
model::run::pr_nr(void) const
{
    return _pr_nr;
}


/// Returns the web URL of the repository.
///
/// \return The fork URL with any trailing ".git" suffix removed.
std::string
model::run::repository_url(void) const
{
    const std::string suffix = ".git";
    if (_fork_url.length() >= suffix.length() &&
        _fork_url.compare(_fork_url.length() - suffix.length(),
                          suffix.length(), suffix) == 0)
        return _fork_url.substr(0, _fork_url.length() - suffix.length());
    else
        return _fork_url;
}


/// Returns the link to the change tested by the run.
///
/// \return A link to the commit for commit runs, or to the pull request for
/// pull request runs.
std::string
model::run::repository_link(void) const
{
    switch (_type) {
    case run_type_commit:
        return F("%s/commit/%s") % repository_url() % _commit;
    case run_type_pull_request:
        return F("%s/pull/%s") % repository_url() % _pr_nr;
    }
    UNREACHABLE;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::run::operator==(const run& other) const
{
    return _platform == other._platform && _type == other._type &&
        _token == other._token && _fork_url == other._fork_url &&
        _branch == other._branch && _commit == other._commit &&
        _pr_nr == other._pr_nr;
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::run::operator!=(const run& other) const
{
    return !(*this == other);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const platform object)
{
    output << platform_name(object);
    return output;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const run_type object)
{
    output << run_type_name(object);
    return output;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const run& object)
{
    output << F("model::run{platform=%s, type=%s, fork_url=%s, branch=%s, "
                "commit=%s, pr_nr=%s}")
        % text::quote(platform_name(object.get_platform()), '\'')
        % text::quote(run_type_name(object.type()), '\'')
        % text::quote(object.fork_url(), '\'')
        % text::quote(object.branch(), '\'')
        % text::quote(object.commit(), '\'')
        % object.pr_nr();
    return output;
}
