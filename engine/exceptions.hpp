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

/// \file engine/exceptions.hpp
/// Exception types raised by the engine module.

#if !defined(ENGINE_EXCEPTIONS_HPP)
#define ENGINE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "utils/fs/path.hpp"

namespace engine {


/// Base exception for engine errors.
class error : public std::runtime_error {
public:
    explicit error(const std::string&);
    virtual ~error(void) throw();
};


/// Error while loading the configuration file.
class load_error : public error {
    /// Path to the file that could not be loaded.
    utils::fs::path _file;

public:
    load_error(const utils::fs::path&, const std::string&);
    virtual ~load_error(void) throw();

    const utils::fs::path& file(void) const;
};


/// Error denoting that a result artifact is missing or cannot be read.
class artifact_not_found : public error {
    /// Path to the artifact that could not be read.
    utils::fs::path _path;

public:
    artifact_not_found(const utils::fs::path&, const std::string&);
    virtual ~artifact_not_found(void) throw();

    const utils::fs::path& path(void) const;
};


/// Error denoting that an artifact is not valid in any known encoding.
class decoding_error : public error {
public:
    explicit decoding_error(const std::string&);
    virtual ~decoding_error(void) throw();
};


}  // namespace engine


#endif  // !defined(ENGINE_EXCEPTIONS_HPP)
