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

/// \file engine/artifacts.hpp
/// Access to the result files stored by the test workers.
///
/// Result files are plain text files produced by the programs under test.
/// Their encoding is not recorded anywhere: they are decoded as UTF-8 when
/// possible and as Windows-1252 otherwise.

#if !defined(ENGINE_ARTIFACTS_HPP)
#define ENGINE_ARTIFACTS_HPP

#include <string>

#include "engine/diff.hpp"
#include "utils/fs/path.hpp"
#include "utils/text/encoding.hpp"

namespace engine {


extern const char* const no_final_newline;


/// Contents of an artifact once decoded.
class decoded_file {
    /// The lines of the file, without their terminators.
    ///
    /// If the file does not end with a line terminator, the last entry is the
    /// no_final_newline marker.
    lines_vector _lines;

    /// The encoding with which the file was successfully decoded.
    utils::text::encoding _encoding;

public:
    decoded_file(const lines_vector&, const utils::text::encoding);

    const lines_vector& lines(void) const;
    utils::text::encoding encoding(void) const;
};


decoded_file decode_artifact(const std::string&);
decoded_file read_artifact(const utils::fs::path&, const std::string&);


}  // namespace engine


#endif  // !defined(ENGINE_ARTIFACTS_HPP)
