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

#include "engine/diff.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <utility>

#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/text/operations.hpp"

namespace text = utils::text;


namespace {


/// Alignment decision for a single line.
enum edit_op {
    op_equal,
    op_removed,
    op_added
};


/// Sequence of alignment decisions.
typedef std::vector< edit_op > edit_ops_vector;


/// Style sheet shared by the two render modes.
static const char* style_sheet =
    "table.diff { border-collapse: collapse; font-family: monospace; }\n"
    "table.diff caption { text-align: left; padding: 4px; }\n"
    "table.diff th { background: #e0e0e0; padding: 2px 6px; }\n"
    "table.diff td { padding: 0 6px; white-space: pre-wrap; "
    "vertical-align: top; }\n"
    "table.diff td.lineno { color: #808080; text-align: right; }\n"
    "table.diff tr.diff-added td.actual { background: #e6ffe6; }\n"
    "table.diff tr.diff-removed td.expected { background: #ffe6e6; }\n"
    "table.diff tr.diff-changed td.expected { background: #ffe6e6; }\n"
    "table.diff tr.diff-changed td.actual { background: #e6ffe6; }\n"
    "table.diff td.diff-none { font-style: italic; }\n"
    "span.diff-highlight { background: #ffd780; }\n";


/// Checks if a byte is a UTF-8 continuation byte.
///
/// \param c The byte to check.
///
/// \return True if the byte is not the start of a character.
static bool
is_continuation(const char c)
{
    return (static_cast< unsigned char >(c) & 0xc0) == 0x80;
}


/// Sequence of line identifiers; equal lines share the same identifier.
typedef std::vector< std::size_t > ids_vector;


/// Pair of matching positions, one in each of the sequences being aligned.
typedef std::pair< std::size_t, std::size_t > match_pair;


/// Sequence of matching positions in increasing order on both sides.
typedef std::vector< match_pair > matches_vector;


/// Computes the LCS lengths of a range of a against the prefixes of b.
///
/// \param a The first sequence.
/// \param alo First position of the range in a.
/// \param ahi One past the last position of the range in a.
/// \param b The second sequence.
/// \param blo First position of the range in b.
/// \param bhi One past the last position of the range in b.
///
/// \return A vector of bhi - blo + 1 entries in which entry k holds the length
/// of the longest common subsequence of a[alo, ahi) and b[blo, blo + k).
static std::vector< std::size_t >
forward_lengths(const ids_vector& a, const std::size_t alo,
                const std::size_t ahi, const ids_vector& b,
                const std::size_t blo, const std::size_t bhi)
{
    const std::size_t width = bhi - blo;
    std::vector< std::size_t > previous(width + 1, 0);
    std::vector< std::size_t > current(width + 1, 0);
    for (std::size_t i = alo; i < ahi; ++i) {
        current[0] = 0;
        for (std::size_t k = 1; k <= width; ++k) {
            if (a[i] == b[blo + k - 1])
                current[k] = previous[k - 1] + 1;
            else
                current[k] = std::max(previous[k], current[k - 1]);
        }
        previous.swap(current);
    }
    return previous;
}


/// Computes the LCS lengths of a range of a against the suffixes of b.
///
/// \param a The first sequence.
/// \param alo First position of the range in a.
/// \param ahi One past the last position of the range in a.
/// \param b The second sequence.
/// \param blo First position of the range in b.
/// \param bhi One past the last position of the range in b.
///
/// \return A vector of bhi - blo + 1 entries in which entry k holds the length
/// of the longest common subsequence of a[alo, ahi) and b[blo + k, bhi).
static std::vector< std::size_t >
backward_lengths(const ids_vector& a, const std::size_t alo,
                 const std::size_t ahi, const ids_vector& b,
                 const std::size_t blo, const std::size_t bhi)
{
    const std::size_t width = bhi - blo;
    std::vector< std::size_t > previous(width + 1, 0);
    std::vector< std::size_t > current(width + 1, 0);
    for (std::size_t i = ahi; i > alo; --i) {
        current[width] = 0;
        for (std::size_t k = width; k > 0; --k) {
            if (a[i - 1] == b[blo + k - 1])
                current[k - 1] = previous[k] + 1;
            else
                current[k - 1] = std::max(previous[k - 1], current[k]);
        }
        previous.swap(current);
    }
    return previous;
}


/// Finds a longest common subsequence of two ranges in linear space.
///
/// This is Hirschberg's algorithm: the first range is split in half and the
/// second one is split at the point that maximizes the combined LCS length of
/// both halves, recursing on each side.
///
/// \param a The first sequence.
/// \param alo First position of the range in a.
/// \param ahi One past the last position of the range in a.
/// \param b The second sequence.
/// \param blo First position of the range in b.
/// \param bhi One past the last position of the range in b.
/// \param [in,out] matches The vector to which to append the matching
///     positions, in increasing order.
static void
find_matches(const ids_vector& a, const std::size_t alo, const std::size_t ahi,
             const ids_vector& b, const std::size_t blo, const std::size_t bhi,
             matches_vector& matches)
{
    if (alo == ahi || blo == bhi)
        return;

    if (ahi - alo == 1) {
        for (std::size_t j = blo; j < bhi; ++j) {
            if (a[alo] == b[j]) {
                matches.push_back(match_pair(alo, j));
                break;
            }
        }
        return;
    }

    const std::size_t amid = alo + (ahi - alo) / 2;
    const std::vector< std::size_t > head = forward_lengths(a, alo, amid,
                                                            b, blo, bhi);
    const std::vector< std::size_t > tail = backward_lengths(a, amid, ahi,
                                                             b, blo, bhi);
    std::size_t split = 0;
    for (std::size_t k = 1; k < head.size(); ++k) {
        if (head[k] + tail[k] > head[split] + tail[split])
            split = k;
    }

    find_matches(a, alo, amid, b, blo, blo + split, matches);
    find_matches(a, amid, ahi, b, blo + split, bhi, matches);
}


/// Computes the alignment of two sequences of lines.
///
/// Lines common to the beginning and to the end of both sequences are
/// aligned directly.  Lines of the remaining middle sections that do not
/// appear at all on the other side cannot be part of a common subsequence,
/// so they are discarded before running the linear-space LCS computation on
/// what is left.
///
/// \param expected The expected lines.
/// \param actual The actual lines.
///
/// \return The alignment decisions.  Consuming the expected lines on equal
/// and removed decisions, and the actual lines on equal and added decisions,
/// traverses both sequences completely.
static edit_ops_vector
align(const engine::lines_vector& expected, const engine::lines_vector& actual)
{
    std::size_t prefix = 0;
    while (prefix < expected.size() && prefix < actual.size() &&
           expected[prefix] == actual[prefix])
        ++prefix;

    std::size_t suffix = 0;
    while (suffix < expected.size() - prefix &&
           suffix < actual.size() - prefix &&
           expected[expected.size() - suffix - 1] ==
           actual[actual.size() - suffix - 1])
        ++suffix;

    const std::size_t expected_end = expected.size() - suffix;
    const std::size_t actual_end = actual.size() - suffix;

    // Identifiers are shared by equal lines; bit 0 of each entry in 'sides'
    // records an occurrence in expected and bit 1 one in actual.
    std::map< std::string, std::size_t > ids;
    std::vector< int > sides;
    ids_vector expected_ids, actual_ids;
    for (std::size_t i = prefix; i < expected_end; ++i) {
        const std::size_t id = ids.insert(std::make_pair(
            expected[i], ids.size())).first->second;
        if (id == sides.size())
            sides.push_back(0);
        sides[id] |= 1;
        expected_ids.push_back(id);
    }
    for (std::size_t j = prefix; j < actual_end; ++j) {
        const std::size_t id = ids.insert(std::make_pair(
            actual[j], ids.size())).first->second;
        if (id == sides.size())
            sides.push_back(0);
        sides[id] |= 2;
        actual_ids.push_back(id);
    }

    std::vector< std::size_t > expected_kept, actual_kept;
    ids_vector a, b;
    for (std::size_t i = 0; i < expected_ids.size(); ++i) {
        if (sides[expected_ids[i]] == 3) {
            expected_kept.push_back(prefix + i);
            a.push_back(expected_ids[i]);
        }
    }
    for (std::size_t j = 0; j < actual_ids.size(); ++j) {
        if (sides[actual_ids[j]] == 3) {
            actual_kept.push_back(prefix + j);
            b.push_back(actual_ids[j]);
        }
    }

    matches_vector matches;
    find_matches(a, 0, a.size(), b, 0, b.size(), matches);

    edit_ops_vector ops(prefix, op_equal);
    std::size_t i = prefix, j = prefix;
    for (matches_vector::const_iterator iter = matches.begin();
         iter != matches.end(); ++iter) {
        const std::size_t next_i = expected_kept[(*iter).first];
        const std::size_t next_j = actual_kept[(*iter).second];
        INV(next_i >= i && next_j >= j);
        ops.insert(ops.end(), next_i - i, op_removed);
        ops.insert(ops.end(), next_j - j, op_added);
        ops.push_back(op_equal);
        i = next_i + 1;
        j = next_j + 1;
    }
    ops.insert(ops.end(), expected_end - i, op_removed);
    ops.insert(ops.end(), actual_end - j, op_added);
    ops.insert(ops.end(), suffix, op_equal);
    return ops;
}


/// Escapes a line for its inclusion in the HTML table.
///
/// \param line The line to escape.
///
/// \return The escaped line; a non-breaking space if the line is empty so
/// that the table row keeps its height.
static std::string
escape_line(const std::string& line)
{
    if (line.empty())
        return "&nbsp;";
    return text::escape_xml(line);
}


/// Renders a pair of changed lines highlighting their differing section.
///
/// \param expected The expected line.
/// \param actual The actual line.
/// \param [out] expected_html The rendered expected line.
/// \param [out] actual_html The rendered actual line.
static void
highlight_pair(const std::string& expected, const std::string& actual,
               std::string& expected_html, std::string& actual_html)
{
    std::size_t prefix = 0;
    while (prefix < expected.length() && prefix < actual.length() &&
           expected[prefix] == actual[prefix])
        ++prefix;
    while (prefix > 0 &&
           ((prefix < expected.length() && is_continuation(expected[prefix])) ||
            (prefix < actual.length() && is_continuation(actual[prefix]))))
        --prefix;

    std::size_t suffix = 0;
    while (suffix < expected.length() - prefix &&
           suffix < actual.length() - prefix &&
           expected[expected.length() - suffix - 1] ==
           actual[actual.length() - suffix - 1])
        ++suffix;
    while (suffix > 0 &&
           is_continuation(expected[expected.length() - suffix]))
        --suffix;

    const std::string head = expected.substr(0, prefix);
    const std::string tail = expected.substr(expected.length() - suffix);

    expected_html = text::escape_xml(head) +
        "<span class=\"diff-highlight\">" +
        text::escape_xml(expected.substr(prefix,
                                         expected.length() - prefix - suffix)) +
        "</span>" + text::escape_xml(tail);
    actual_html = text::escape_xml(head) +
        "<span class=\"diff-highlight\">" +
        text::escape_xml(actual.substr(prefix,
                                       actual.length() - prefix - suffix)) +
        "</span>" + text::escape_xml(tail);
}


/// Emits a single row of the diff table.
///
/// \param output The stream into which to write the row.
/// \param kind The classification of the row.
/// \param expected_lineno The one-based line number on the expected side, or
///     0 if the row has no expected line.
/// \param expected_html The rendered expected line.
/// \param actual_lineno The one-based line number on the actual side, or 0 if
///     the row has no actual line.
/// \param actual_html The rendered actual line.
static void
emit_row(std::ostream& output, const engine::diff_kind kind,
         const std::size_t expected_lineno, const std::string& expected_html,
         const std::size_t actual_lineno, const std::string& actual_html)
{
    output << F("<tr class=\"diff-%s\">") % engine::diff_kind_name(kind);
    if (expected_lineno == 0)
        output << "<td class=\"lineno\"></td><td class=\"expected\"></td>";
    else
        output << F("<td class=\"lineno\">%s</td><td class=\"expected\">%s"
                    "</td>") % expected_lineno % expected_html;
    if (actual_lineno == 0)
        output << "<td class=\"lineno\"></td><td class=\"actual\"></td>";
    else
        output << F("<td class=\"lineno\">%s</td><td class=\"actual\">%s"
                    "</td>") % actual_lineno % actual_html;
    output << "</tr>\n";
}


/// Renders the diff table.
///
/// \param expected The expected lines.
/// \param actual The actual lines.
/// \param diff The structured diff between the two.
///
/// \return The HTML table.
static std::string
render_table(const engine::lines_vector& expected,
             const engine::lines_vector& actual,
             const engine::line_diff& diff)
{
    std::ostringstream output;
    output << "<table class=\"diff\">\n";
    output << F("<caption>%s changed, %s added, %s removed</caption>\n")
        % diff.count(engine::diff_changed) % diff.count(engine::diff_added)
        % diff.count(engine::diff_removed);
    output << "<tr><th></th><th>Expected</th><th></th><th>Actual</th></tr>\n";
    if (!diff.has_differences())
        output << "<tr><td class=\"diff-none\" colspan=\"4\">"
            "No differences found</td></tr>\n";

    for (engine::diff_groups_vector::const_iterator iter =
             diff.groups().begin(); iter != diff.groups().end(); ++iter) {
        const engine::diff_group& group = *iter;
        PRE(group.expected_end() <= expected.size());
        PRE(group.actual_end() <= actual.size());

        const std::size_t expected_lines =
            group.expected_end() - group.expected_begin();
        const std::size_t actual_lines =
            group.actual_end() - group.actual_begin();
        const std::size_t rows = std::max(expected_lines, actual_lines);
        for (std::size_t row = 0; row < rows; ++row) {
            const std::size_t e = group.expected_begin() + row;
            const std::size_t a = group.actual_begin() + row;
            const bool has_expected = row < expected_lines;
            const bool has_actual = row < actual_lines;

            std::string expected_html, actual_html;
            if (group.kind() == engine::diff_changed && has_expected &&
                has_actual) {
                highlight_pair(expected[e], actual[a], expected_html,
                               actual_html);
            } else {
                if (has_expected)
                    expected_html = escape_line(expected[e]);
                if (has_actual)
                    actual_html = escape_line(actual[a]);
            }
            emit_row(output, group.kind(),
                     has_expected ? e + 1 : 0, expected_html,
                     has_actual ? a + 1 : 0, actual_html);
        }
    }
    output << "</table>\n";
    return output.str();
}


}  // anonymous namespace


/// Constructs a new diff group.
///
/// \param kind_ Classification of the lines in the group.
/// \param expected_begin_ First line of the group in the expected sequence.
/// \param expected_end_ One past the last line in the expected sequence.
/// \param actual_begin_ First line of the group in the actual sequence.
/// \param actual_end_ One past the last line in the actual sequence.
engine::diff_group::diff_group(const diff_kind kind_,
                               const std::size_t expected_begin_,
                               const std::size_t expected_end_,
                               const std::size_t actual_begin_,
                               const std::size_t actual_end_) :
    _kind(kind_),
    _expected_begin(expected_begin_),
    _expected_end(expected_end_),
    _actual_begin(actual_begin_),
    _actual_end(actual_end_)
{
    PRE(_expected_begin <= _expected_end);
    PRE(_actual_begin <= _actual_end);
}


/// Returns the classification of the lines in the group.
///
/// \return A diff kind.
engine::diff_kind
engine::diff_group::kind(void) const
{
    return _kind;
}


/// Returns the first line of the group in the expected sequence.
///
/// \return A zero-based line index.
std::size_t
engine::diff_group::expected_begin(void) const
{
    return _expected_begin;
}


/// Returns one past the last line of the group in the expected sequence.
///
/// \return A zero-based line index.
std::size_t
engine::diff_group::expected_end(void) const
{
    return _expected_end;
}


/// Returns the first line of the group in the actual sequence.
///
/// \return A zero-based line index.
std::size_t
engine::diff_group::actual_begin(void) const
{
    return _actual_begin;
}


/// Returns one past the last line of the group in the actual sequence.
///
/// \return A zero-based line index.
std::size_t
engine::diff_group::actual_end(void) const
{
    return _actual_end;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
engine::diff_group::operator==(const diff_group& other) const
{
    return _kind == other._kind &&
        _expected_begin == other._expected_begin &&
        _expected_end == other._expected_end &&
        _actual_begin == other._actual_begin &&
        _actual_end == other._actual_end;
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
engine::diff_group::operator!=(const diff_group& other) const
{
    return !(*this == other);
}


/// Constructs a new structured diff.
///
/// \param groups_ The groups that compose the diff, in order.
engine::line_diff::line_diff(const diff_groups_vector& groups_) :
    _groups(groups_)
{
}


/// Returns the groups that compose the diff.
///
/// \return A collection of groups, in the order in which they appear.
const engine::diff_groups_vector&
engine::line_diff::groups(void) const
{
    return _groups;
}


/// Counts the groups of a particular kind.
///
/// \param kind The kind of the groups to count.
///
/// \return The number of groups.
std::size_t
engine::line_diff::count(const diff_kind kind) const
{
    std::size_t total = 0;
    for (diff_groups_vector::const_iterator iter = _groups.begin();
         iter != _groups.end(); ++iter) {
        if ((*iter).kind() == kind)
            ++total;
    }
    return total;
}


/// Checks if the compared sequences differ at all.
///
/// \return True if there is any group other than an equal one.
bool
engine::line_diff::has_differences(void) const
{
    return count(diff_added) + count(diff_removed) + count(diff_changed) > 0;
}


/// Gets the textual name of a diff kind.
///
/// \param kind The diff kind to convert.
///
/// \return One of "equal", "added", "removed" or "changed".
const char*
engine::diff_kind_name(const diff_kind kind)
{
    switch (kind) {
    case diff_equal: return "equal";
    case diff_added: return "added";
    case diff_removed: return "removed";
    case diff_changed: return "changed";
    }
    UNREACHABLE;
}


/// Computes the structured diff between two sequences of lines.
///
/// A run of removed lines adjacent to a run of added lines, with no equal
/// lines between them, is reported as a single changed group.
///
/// \param expected The expected lines.
/// \param actual The actual lines.
///
/// \return The structured diff.  Empty inputs are valid.
engine::line_diff
engine::diff_lines(const lines_vector& expected, const lines_vector& actual)
{
    const edit_ops_vector ops = align(expected, actual);

    diff_groups_vector groups;
    std::size_t i = 0, j = 0;
    edit_ops_vector::const_iterator iter = ops.begin();
    while (iter != ops.end()) {
        const std::size_t expected_begin = i, actual_begin = j;
        if (*iter == op_equal) {
            while (iter != ops.end() && *iter == op_equal) {
                ++i;
                ++j;
                ++iter;
            }
            groups.push_back(diff_group(diff_equal, expected_begin, i,
                                        actual_begin, j));
        } else {
            while (iter != ops.end() && *iter != op_equal) {
                if (*iter == op_removed)
                    ++i;
                else
                    ++j;
                ++iter;
            }

            diff_kind kind;
            if (i == expected_begin)
                kind = diff_added;
            else if (j == actual_begin)
                kind = diff_removed;
            else
                kind = diff_changed;
            groups.push_back(diff_group(kind, expected_begin, i,
                                        actual_begin, j));
        }
    }
    INV(i == expected.size());
    INV(j == actual.size());

    return line_diff(groups);
}


/// Renders a structured diff as HTML.
///
/// The diff table is identical in both modes.  The inline mode prepends the
/// style sheet to the table so that the fragment can be embedded in a page;
/// the download mode wraps both in a complete standalone document.
///
/// \param expected The expected lines.
/// \param actual The actual lines.
/// \param diff The structured diff between expected and actual, as returned
///     by diff_lines().
/// \param mode The output format.
///
/// \return The HTML text.
std::string
engine::render_html(const lines_vector& expected, const lines_vector& actual,
                    const line_diff& diff, const render_mode mode)
{
    const std::string table = render_table(expected, actual, diff);

    switch (mode) {
    case render_inline:
        return F("<div class=\"trackrun-diff\">\n<style>\n%s</style>\n%s"
                 "</div>\n") % style_sheet % table;

    case render_download:
        return F("<!DOCTYPE html>\n"
                 "<html>\n"
                 "<head>\n"
                 "<meta charset=\"utf-8\">\n"
                 "<title>Output differences</title>\n"
                 "<style>\n%s</style>\n"
                 "</head>\n"
                 "<body>\n%s</body>\n"
                 "</html>\n") % style_sheet % table;
    }
    UNREACHABLE;
}


/// Computes and renders the diff between two sequences of lines.
///
/// \param expected The expected lines.
/// \param actual The actual lines.
/// \param mode The output format.
///
/// \return The HTML text.
std::string
engine::compute_diff(const lines_vector& expected, const lines_vector& actual,
                     const render_mode mode)
{
    return render_html(expected, actual, diff_lines(expected, actual), mode);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
engine::operator<<(std::ostream& output, const diff_kind object)
{
    output << diff_kind_name(object);
    return output;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
engine::operator<<(std::ostream& output, const diff_group& object)
{
    output << F("engine::diff_group{kind=%s, expected=[%s, %s), "
                "actual=[%s, %s)}")
        % object.kind()
        % object.expected_begin() % object.expected_end()
        % object.actual_begin() % object.actual_end();
    return output;
}
