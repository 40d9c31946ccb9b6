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

#include <cstddef>
#include <sstream>

#include <atf-c++.hpp>

#include "utils/format/macros.hpp"
#include "utils/text/operations.hpp"

namespace text = utils::text;


namespace {


/// Builds a sequence of lines from a comma-separated list.
///
/// \param joined The lines, separated by commas.  Empty for no lines.
///
/// \return The sequence of lines.
static engine::lines_vector
lines(const std::string& joined)
{
    return text::split(joined, ',');
}


/// Extracts the diff table out of a rendered document.
///
/// \param html The rendered diff.
///
/// \return The text between the opening and closing tags of the table,
/// including both.
static std::string
extract_table(const std::string& html)
{
    const std::string::size_type begin = html.find("<table");
    ATF_REQUIRE(begin != std::string::npos);
    const std::string::size_type end = html.find("</table>\n", begin);
    ATF_REQUIRE(end != std::string::npos);
    return html.substr(begin, end + 9 - begin);
}


/// Checks if a string contains another one.
///
/// \param haystack The string in which to look.
/// \param needle The string to look for.
///
/// \return True if needle is in haystack.
static bool
contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}


/// Checks that the groups of a diff cover both sequences in order.
///
/// \param diff The diff to validate.
/// \param expected_size Number of lines in the expected sequence.
/// \param actual_size Number of lines in the actual sequence.
static void
check_contiguous(const engine::line_diff& diff, const std::size_t expected_size,
                 const std::size_t actual_size)
{
    std::size_t expected_pos = 0, actual_pos = 0;
    for (engine::diff_groups_vector::const_iterator iter =
             diff.groups().begin(); iter != diff.groups().end(); ++iter) {
        ATF_REQUIRE_EQ(expected_pos, (*iter).expected_begin());
        ATF_REQUIRE_EQ(actual_pos, (*iter).actual_begin());
        expected_pos = (*iter).expected_end();
        actual_pos = (*iter).actual_end();
    }
    ATF_REQUIRE_EQ(expected_size, expected_pos);
    ATF_REQUIRE_EQ(actual_size, actual_pos);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(diff_group__getters);
ATF_TEST_CASE_BODY(diff_group__getters)
{
    const engine::diff_group group(engine::diff_changed, 1, 3, 2, 5);
    ATF_REQUIRE_EQ(engine::diff_changed, group.kind());
    ATF_REQUIRE_EQ(1, group.expected_begin());
    ATF_REQUIRE_EQ(3, group.expected_end());
    ATF_REQUIRE_EQ(2, group.actual_begin());
    ATF_REQUIRE_EQ(5, group.actual_end());
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_group__output);
ATF_TEST_CASE_BODY(diff_group__output)
{
    std::ostringstream str;
    str << engine::diff_group(engine::diff_added, 4, 4, 3, 6);
    ATF_REQUIRE_EQ("engine::diff_group{kind=added, expected=[4, 4), "
                   "actual=[3, 6)}", str.str());
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__both_empty);
ATF_TEST_CASE_BODY(diff_lines__both_empty)
{
    const engine::line_diff diff = engine::diff_lines(lines(""), lines(""));
    ATF_REQUIRE(diff.groups().empty());
    ATF_REQUIRE(!diff.has_differences());
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__identical);
ATF_TEST_CASE_BODY(diff_lines__identical)
{
    const engine::line_diff diff = engine::diff_lines(lines("a,b,c"),
                                                      lines("a,b,c"));
    ATF_REQUIRE_EQ(1, diff.groups().size());
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_equal, 0, 3, 0, 3),
                   diff.groups()[0]);
    ATF_REQUIRE_EQ(0, diff.count(engine::diff_added));
    ATF_REQUIRE_EQ(0, diff.count(engine::diff_removed));
    ATF_REQUIRE_EQ(0, diff.count(engine::diff_changed));
    ATF_REQUIRE(!diff.has_differences());
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__all_added);
ATF_TEST_CASE_BODY(diff_lines__all_added)
{
    const engine::line_diff diff = engine::diff_lines(lines(""),
                                                      lines("x,y"));
    ATF_REQUIRE_EQ(1, diff.groups().size());
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_added, 0, 0, 0, 2),
                   diff.groups()[0]);
    ATF_REQUIRE(diff.has_differences());
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__all_removed);
ATF_TEST_CASE_BODY(diff_lines__all_removed)
{
    const engine::line_diff diff = engine::diff_lines(lines("x,y"),
                                                      lines(""));
    ATF_REQUIRE_EQ(1, diff.groups().size());
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_removed, 0, 2, 0, 0),
                   diff.groups()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__one_changed_line);
ATF_TEST_CASE_BODY(diff_lines__one_changed_line)
{
    const engine::line_diff diff = engine::diff_lines(lines("a,b,c"),
                                                      lines("a,x,c"));
    ATF_REQUIRE_EQ(1, diff.count(engine::diff_changed));
    ATF_REQUIRE_EQ(0, diff.count(engine::diff_added));
    ATF_REQUIRE_EQ(0, diff.count(engine::diff_removed));

    ATF_REQUIRE_EQ(3, diff.groups().size());
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_equal, 0, 1, 0, 1),
                   diff.groups()[0]);
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_changed, 1, 2, 1, 2),
                   diff.groups()[1]);
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_equal, 2, 3, 2, 3),
                   diff.groups()[2]);
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__changed_uneven);
ATF_TEST_CASE_BODY(diff_lines__changed_uneven)
{
    const engine::line_diff diff = engine::diff_lines(lines("a,b,c"),
                                                      lines("a,x,y,z,c"));
    ATF_REQUIRE_EQ(3, diff.groups().size());
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_changed, 1, 2, 1, 4),
                   diff.groups()[1]);
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_equal, 2, 3, 4, 5),
                   diff.groups()[2]);
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__separate_add_and_remove);
ATF_TEST_CASE_BODY(diff_lines__separate_add_and_remove)
{
    const engine::line_diff diff = engine::diff_lines(lines("a,b,c,d"),
                                                      lines("a,c,d,e"));
    ATF_REQUIRE_EQ(4, diff.groups().size());
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_equal, 0, 1, 0, 1),
                   diff.groups()[0]);
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_removed, 1, 2, 1, 1),
                   diff.groups()[1]);
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_equal, 2, 4, 1, 3),
                   diff.groups()[2]);
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_added, 4, 4, 3, 4),
                   diff.groups()[3]);
    ATF_REQUIRE_EQ(0, diff.count(engine::diff_changed));
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__repeated_lines);
ATF_TEST_CASE_BODY(diff_lines__repeated_lines)
{
    const engine::line_diff diff = engine::diff_lines(lines("x,a,x,b,x,c"),
                                                      lines("x,b,x,c,x,a"));
    check_contiguous(diff, 6, 6);

    std::size_t equal_lines = 0;
    for (engine::diff_groups_vector::const_iterator iter =
             diff.groups().begin(); iter != diff.groups().end(); ++iter) {
        if ((*iter).kind() == engine::diff_equal)
            equal_lines += (*iter).expected_end() - (*iter).expected_begin();
    }
    ATF_REQUIRE_EQ(4, equal_lines);
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__large_unrelated);
ATF_TEST_CASE_BODY(diff_lines__large_unrelated)
{
    engine::lines_vector expected, actual;
    for (int i = 0; i < 30000; ++i) {
        expected.push_back(F("expected line %s") % i);
        actual.push_back(F("actual line %s") % i);
    }

    const engine::line_diff diff = engine::diff_lines(expected, actual);
    ATF_REQUIRE_EQ(1, diff.groups().size());
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_changed, 0, 30000,
                                      0, 30000),
                   diff.groups()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(diff_lines__large_sparse_changes);
ATF_TEST_CASE_BODY(diff_lines__large_sparse_changes)
{
    engine::lines_vector expected, actual;
    for (int i = 0; i < 5000; ++i) {
        expected.push_back(F("line %s") % i);
        if (i % 1000 == 500)
            actual.push_back(F("LINE %s") % i);
        else
            actual.push_back(F("line %s") % i);
    }
    actual.insert(actual.begin() + 2000, "inserted");

    const engine::line_diff diff = engine::diff_lines(expected, actual);
    check_contiguous(diff, 5000, 5001);
    ATF_REQUIRE_EQ(5, diff.count(engine::diff_changed));
    ATF_REQUIRE_EQ(1, diff.count(engine::diff_added));
    ATF_REQUIRE_EQ(0, diff.count(engine::diff_removed));
    ATF_REQUIRE_EQ(engine::diff_group(engine::diff_added, 2000, 2000,
                                      2000, 2001),
                   diff.groups()[5]);
}


ATF_TEST_CASE_WITHOUT_HEAD(render_html__same_table_in_both_modes);
ATF_TEST_CASE_BODY(render_html__same_table_in_both_modes)
{
    const engine::lines_vector expected = lines("first,second,third");
    const engine::lines_vector actual = lines("first,2nd,third,fourth");
    const engine::line_diff diff = engine::diff_lines(expected, actual);

    const std::string inline_html = engine::render_html(
        expected, actual, diff, engine::render_inline);
    const std::string download_html = engine::render_html(
        expected, actual, diff, engine::render_download);
    ATF_REQUIRE_EQ(extract_table(inline_html), extract_table(download_html));
}


ATF_TEST_CASE_WITHOUT_HEAD(render_html__download_is_standalone);
ATF_TEST_CASE_BODY(render_html__download_is_standalone)
{
    const std::string html = engine::compute_diff(
        lines("a"), lines("b"), engine::render_download);
    ATF_REQUIRE_EQ(0, html.find("<!DOCTYPE html>\n"));
    ATF_REQUIRE(contains(html, "<meta charset=\"utf-8\">"));
    ATF_REQUIRE(contains(html, "<title>"));
    ATF_REQUIRE(contains(html, "<style>"));
    ATF_REQUIRE(contains(html, "<body>"));
    ATF_REQUIRE(contains(html, "</html>\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(render_html__inline_is_fragment);
ATF_TEST_CASE_BODY(render_html__inline_is_fragment)
{
    const std::string html = engine::compute_diff(
        lines("a"), lines("b"), engine::render_inline);
    ATF_REQUIRE(!contains(html, "<!DOCTYPE"));
    ATF_REQUIRE(!contains(html, "<html>"));
    ATF_REQUIRE(contains(html, "<style>"));
    ATF_REQUIRE(contains(html, "<table class=\"diff\">"));
}


ATF_TEST_CASE_WITHOUT_HEAD(render_html__escapes_text);
ATF_TEST_CASE_BODY(render_html__escapes_text)
{
    const std::string html = engine::compute_diff(
        lines("<b>&amp"), lines("<b>&amp"), engine::render_inline);
    ATF_REQUIRE(contains(html, "&lt;b&gt;&amp;amp"));
    ATF_REQUIRE(!contains(html, "<b>"));
}


ATF_TEST_CASE_WITHOUT_HEAD(render_html__highlights_changed_segment);
ATF_TEST_CASE_BODY(render_html__highlights_changed_segment)
{
    const std::string html = engine::compute_diff(
        lines("value = 10;"), lines("value = 20;"), engine::render_inline);
    ATF_REQUIRE(contains(
        html, "value = <span class=\"diff-highlight\">1</span>0;"));
    ATF_REQUIRE(contains(
        html, "value = <span class=\"diff-highlight\">2</span>0;"));
}


ATF_TEST_CASE_WITHOUT_HEAD(render_html__highlight_keeps_characters_whole);
ATF_TEST_CASE_BODY(render_html__highlight_keeps_characters_whole)
{
    const std::string html = engine::compute_diff(
        lines("caf\xc3\xa9"), lines("caf\xc3\xa8"), engine::render_inline);
    ATF_REQUIRE(contains(
        html, "caf<span class=\"diff-highlight\">\xc3\xa9</span>"));
    ATF_REQUIRE(contains(
        html, "caf<span class=\"diff-highlight\">\xc3\xa8</span>"));
}


ATF_TEST_CASE_WITHOUT_HEAD(render_html__no_differences);
ATF_TEST_CASE_BODY(render_html__no_differences)
{
    ATF_REQUIRE(contains(engine::compute_diff(lines("a,b"), lines("a,b"),
                                              engine::render_inline),
                         "No differences found"));
    ATF_REQUIRE(contains(engine::compute_diff(lines(""), lines(""),
                                              engine::render_download),
                         "No differences found"));
    ATF_REQUIRE(!contains(engine::compute_diff(lines("a"), lines("b"),
                                               engine::render_inline),
                          "No differences found"));
}


ATF_TEST_CASE_WITHOUT_HEAD(render_html__line_numbers);
ATF_TEST_CASE_BODY(render_html__line_numbers)
{
    const std::string html = engine::compute_diff(
        lines("a"), lines("a,b"), engine::render_inline);
    ATF_REQUIRE(contains(
        html, "<tr class=\"diff-equal\"><td class=\"lineno\">1</td>"
        "<td class=\"expected\">a</td><td class=\"lineno\">1</td>"
        "<td class=\"actual\">a</td></tr>\n"));
    ATF_REQUIRE(contains(
        html, "<tr class=\"diff-added\"><td class=\"lineno\"></td>"
        "<td class=\"expected\"></td><td class=\"lineno\">2</td>"
        "<td class=\"actual\">b</td></tr>\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(compute_diff__deterministic);
ATF_TEST_CASE_BODY(compute_diff__deterministic)
{
    const engine::lines_vector expected = lines("a,b,c,d,e,f");
    const engine::lines_vector actual = lines("a,c,x,d,f,g");
    for (int i = 0; i < 2; ++i) {
        const engine::render_mode mode = i == 0 ? engine::render_inline :
            engine::render_download;
        ATF_REQUIRE_EQ(engine::compute_diff(expected, actual, mode),
                       engine::compute_diff(expected, actual, mode));
    }
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, diff_group__getters);
    ATF_ADD_TEST_CASE(tcs, diff_group__output);

    ATF_ADD_TEST_CASE(tcs, diff_lines__both_empty);
    ATF_ADD_TEST_CASE(tcs, diff_lines__identical);
    ATF_ADD_TEST_CASE(tcs, diff_lines__all_added);
    ATF_ADD_TEST_CASE(tcs, diff_lines__all_removed);
    ATF_ADD_TEST_CASE(tcs, diff_lines__one_changed_line);
    ATF_ADD_TEST_CASE(tcs, diff_lines__changed_uneven);
    ATF_ADD_TEST_CASE(tcs, diff_lines__separate_add_and_remove);
    ATF_ADD_TEST_CASE(tcs, diff_lines__repeated_lines);
    ATF_ADD_TEST_CASE(tcs, diff_lines__large_unrelated);
    ATF_ADD_TEST_CASE(tcs, diff_lines__large_sparse_changes);

    ATF_ADD_TEST_CASE(tcs, render_html__same_table_in_both_modes);
    ATF_ADD_TEST_CASE(tcs, render_html__download_is_standalone);
    ATF_ADD_TEST_CASE(tcs, render_html__inline_is_fragment);
    ATF_ADD_TEST_CASE(tcs, render_html__escapes_text);
    ATF_ADD_TEST_CASE(tcs, render_html__highlights_changed_segment);
    ATF_ADD_TEST_CASE(tcs, render_html__highlight_keeps_characters_whole);
    ATF_ADD_TEST_CASE(tcs, render_html__no_differences);
    ATF_ADD_TEST_CASE(tcs, render_html__line_numbers);

    ATF_ADD_TEST_CASE(tcs, compute_diff__deterministic);
}
