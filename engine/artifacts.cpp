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

#include "engine/artifacts.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include "engine/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/stream.hpp"
#include "utils/text/operations.hpp"

namespace fs = utils::fs;
namespace text = utils::text;

using utils::optional;


/// Line appended to the contents of an artifact that lacks a final newline.
const char* const engine::no_final_newline = "\\ No newline at end of file";


/// Constructs a new decoded file.
///
/// \param lines_ The lines of the file, without their terminators.
/// \param encoding_ The encoding with which the file was decoded.
engine::decoded_file::decoded_file(const lines_vector& lines_,
                                   const text::encoding encoding_) :
    _lines(lines_),
    _encoding(encoding_)
{
}


/// Returns the lines of the file.
///
/// \return A sequence of UTF-8 lines, without their terminators.
const engine::lines_vector&
engine::decoded_file::lines(void) const
{
    return _lines;
}


/// Returns the encoding with which the file was decoded.
///
/// \return An encoding.
text::encoding
engine::decoded_file::encoding(void) const
{
    return _encoding;
}


/// Decodes the raw contents of an artifact.
///
/// \param raw The bytes of the artifact.
///
/// \return The decoded lines and the encoding that succeeded.  The lines end
/// with the no_final_newline marker if the contents do not end with a line
/// terminator.
///
/// \throw decoding_error If the contents are neither valid UTF-8 nor valid
///     Windows-1252.
engine::decoded_file
engine::decode_artifact(const std::string& raw)
{
    optional< std::string > decoded = text::decode_utf8(raw);
    text::encoding encoding = text::encoding_utf8;
    if (!decoded) {
        decoded = text::decode_cp1252(raw);
        encoding = text::encoding_cp1252;
    }
    if (!decoded)
        throw decoding_error(F("Contents are not valid %s nor %s")
                             % text::encoding_name(text::encoding_utf8)
                             % text::encoding_name(text::encoding_cp1252));
    const std::string& contents = decoded.get();
    lines_vector lines = text::split_lines(contents);
    if (!contents.empty()) {
        const char last = contents[contents.length() - 1];
        if (last != '\n' && last != '\r')
            lines.push_back(no_final_newline);
    }
    return decoded_file(lines, encoding);
}


/// Reads and decodes an artifact.
///
/// \param base The directory holding the artifacts.
/// \param name The name of the artifact file, relative to base.
///
/// \return The decoded lines and the encoding that succeeded.
///
/// \throw artifact_not_found If the file does not exist or cannot be read.
/// \throw decoding_error If the file cannot be decoded.
engine::decoded_file
engine::read_artifact(const fs::path& base, const std::string& name)
{
    const fs::path path = base / name;

    if (fs::is_directory(path))
        throw artifact_not_found(path, "Is a directory");

    std::ifstream input(path.c_str(), std::ios::in | std::ios::binary);
    if (!input) {
        const int original_errno = errno;
        throw artifact_not_found(path, std::strerror(original_errno));
    }
    const std::string raw = utils::read_stream(input);
    if (input.bad())
        throw artifact_not_found(path, "Read failed");

    try {
        const decoded_file file = decode_artifact(raw);
        if (file.encoding() == text::encoding_utf8)
            LD(F("Read artifact %s (%s lines, %s)") % path %
               file.lines().size() % text::encoding_name(file.encoding()));
        else
            LI(F("Artifact %s is not valid UTF-8; decoded as %s") % path %
               text::encoding_name(file.encoding()));
        return file;
    } catch (const decoding_error& e) {
        LW(F("Cannot decode artifact %s: %s") % path % e.what());
        throw decoding_error(F("Cannot decode artifact %s: %s") % path %
                             e.what());
    }
}
