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

/// \file engine/diff.hpp
/// Line-based comparison of the expected and actual outputs of a test case.
///
/// The comparison is split in two phases: diff_lines() aligns the two
/// sequences of lines and computes a structured diff, and render_html()
/// converts that structured diff into an HTML table.  compute_diff() chains
/// both for the common case.
///
/// All functions in this module are pure: identical inputs always produce
/// byte-identical outputs and no state is shared across calls.

#if !defined(ENGINE_DIFF_HPP)
#define ENGINE_DIFF_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace engine {


/// Sequence of decoded lines of an output, without line terminators.
typedef std::vector< std::string > lines_vector;


/// Classification of a group of lines in a diff.
enum diff_kind {
    diff_equal,
    diff_added,
    diff_removed,
    diff_changed
};


/// Output formats supported by render_html().
enum render_mode {
    /// HTML fragment to be embedded in an existing page.
    render_inline,

    /// Standalone HTML document to be saved to disk.
    render_download
};


/// Contiguous group of lines sharing the same classification.
///
/// Line ranges are zero-based and half-open.  An added group has an empty
/// range on the expected side and a removed group has an empty range on the
/// actual side.
class diff_group {
    /// Classification of the lines in the group.
    diff_kind _kind;

    /// First line of the group in the expected sequence.
    std::size_t _expected_begin;

    /// One past the last line of the group in the expected sequence.
    std::size_t _expected_end;

    /// First line of the group in the actual sequence.
    std::size_t _actual_begin;

    /// One past the last line of the group in the actual sequence.
    std::size_t _actual_end;

public:
    diff_group(const diff_kind, const std::size_t, const std::size_t,
               const std::size_t, const std::size_t);

    diff_kind kind(void) const;
    std::size_t expected_begin(void) const;
    std::size_t expected_end(void) const;
    std::size_t actual_begin(void) const;
    std::size_t actual_end(void) const;

    bool operator==(const diff_group&) const;
    bool operator!=(const diff_group&) const;
};


/// Collection of diff groups, in the order in which they appear.
typedef std::vector< diff_group > diff_groups_vector;


/// Structured diff between two sequences of lines.
class line_diff {
    /// The groups that compose the diff.
    diff_groups_vector _groups;

public:
    explicit line_diff(const diff_groups_vector&);

    const diff_groups_vector& groups(void) const;
    std::size_t count(const diff_kind) const;
    bool has_differences(void) const;
};


const char* diff_kind_name(const diff_kind);

line_diff diff_lines(const lines_vector&, const lines_vector&);
std::string render_html(const lines_vector&, const lines_vector&,
                        const line_diff&, const render_mode);
std::string compute_diff(const lines_vector&, const lines_vector&,
                         const render_mode);


std::ostream& operator<<(std::ostream&, const diff_kind);
std::ostream& operator<<(std::ostream&, const diff_group&);


}  // namespace engine


#endif  // !defined(ENGINE_DIFF_HPP)
