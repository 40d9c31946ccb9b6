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

#include "utils/fs/operations.hpp"

extern "C" {
#include <sys/stat.h>

#include <unistd.h>
}

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <vector>

#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"

namespace fs = utils::fs;


/// Queries the path to the current directory.
///
/// \return The path to the current directory.
///
/// \throw fs::error If there is a problem querying the current directory.
fs::path
fs::current_path(void)
{
    char buffer[PATH_MAX];
    if (::getcwd(buffer, sizeof(buffer)) == NULL) {
        const int original_errno = errno;
        throw fs::system_error("Failed to get current working directory",
                               original_errno);
    }
    return fs::path(buffer);
}


/// Checks if a file exists.
///
/// Be aware that this is racy in the same way as access(2) is.
///
/// \param path The file to check the existance of.
///
/// \return True if the file exists; false otherwise.
bool
fs::exists(const fs::path& path)
{
    return ::access(path.c_str(), F_OK) == 0;
}


/// Checks if a path exists and refers to a directory.
///
/// \param path The file to check.
///
/// \return True if the path names a directory; false otherwise.
bool
fs::is_directory(const fs::path& path)
{
    struct ::stat sb;
    if (::stat(path.c_str(), &sb) == -1)
        return false;
    return S_ISDIR(sb.st_mode);
}


/// Creates a directory.
///
/// \param dir The path to the directory to create.
/// \param mode The permissions for the new directory.
///
/// \throw system_error If the call to mkdir(2) fails.
void
fs::mkdir(const fs::path& dir, const int mode)
{
    if (::mkdir(dir.c_str(), static_cast< mode_t >(mode)) == -1) {
        const int original_errno = errno;
        throw fs::system_error(F("Failed to create directory %s") % dir,
                               original_errno);
    }
    LD(F("Created directory %s") % dir);
}


/// Creates a directory and any missing parents.
///
/// The ancestors of the directory are visited from the innermost to the
/// outermost until an existing one is found, and the missing ones are then
/// created in the reverse order.  An already-existing directory is not an
/// error.
///
/// \param dir The path to the directory to create.
/// \param mode The permissions for the new directories.
///
/// \throw system_error If any call to mkdir(2) fails, including the case in
///     which an ancestor exists but is not a directory.
void
fs::mkdir_p(const fs::path& dir, const int mode)
{
    std::vector< fs::path > missing;
    fs::path current = dir;
    while (!fs::exists(current)) {
        missing.push_back(current);
        if (current == current.branch_path())
            break;
        current = current.branch_path();
    }

    for (std::vector< fs::path >::const_reverse_iterator iter =
             missing.rbegin(); iter != missing.rend(); ++iter) {
        try {
            fs::mkdir(*iter, mode);
        } catch (const fs::system_error& e) {
            if (e.original_errno() != EEXIST)
                throw;
        }
    }

    if (!fs::is_directory(dir))
        throw fs::system_error(F("Failed to create directory %s") % dir,
                               ENOTDIR);
}
