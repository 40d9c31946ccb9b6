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

#include "utils/text/table.hpp"

#include "utils/sanity.hpp"
#include "utils/text/operations.hpp"

namespace text = utils::text;


namespace {


/// Collection of widths of the columns of a table.
typedef std::vector< std::string::size_type > widths_vector;


/// Calculates the maximum widths of the columns of a table.
///
/// \param table The table from which to calculate the column widths.
///
/// \return A vector with the widths of the columns of the input table.
static widths_vector
column_widths(const text::table& table)
{
    widths_vector widths(table.ncolumns(), 0);

    for (text::table::const_iterator iter = table.begin(); iter != table.end();
         ++iter) {
        const text::table_row& row = *iter;
        INV(row.size() == table.ncolumns());
        for (text::table_row::size_type i = 0; i < row.size(); ++i)
            if (widths[i] < row[i].length())
                widths[i] = row[i].length();
    }

    return widths;
}


/// Pads an input text to a specific width with spaces.
///
/// \param input The text to pad.
/// \param length The desired length of the output.
/// \param align Where to place the text within the cell.
/// \param is_last Whether the text is the last column; left-aligned text in
///     it is not padded so that lines do not carry trailing whitespace.
///
/// \return The padded cell.
static std::string
pad_cell(const std::string& input, const std::string::size_type length,
         const text::alignment align, const bool is_last)
{
    if (input.length() >= length)
        return input;

    const std::string padding(length - input.length(), ' ');
    switch (align) {
    case text::align_left:
        return is_last ? input : input + padding;
    case text::align_right:
        return padding + input;
    }
    UNREACHABLE;
}


}  // anonymous namespace


/// Constructs a new table.
///
/// \param ncolumns_ The number of columns that the table will have.
text::table::table(const table_row::size_type ncolumns_) :
    _ncolumns(ncolumns_),
    _alignments(ncolumns_, align_left)
{
}


/// Gets the number of columns in the table.
///
/// \return The number of columns in the table.  This value remains constant
/// during the existence of the table.
text::table_row::size_type
text::table::ncolumns(void) const
{
    return _ncolumns;
}


/// Sets the alignment of a column.
///
/// \param column The index of the column to modify.
/// \param align The new alignment of the column.
void
text::table::set_alignment(const table_row::size_type column,
                           const alignment align)
{
    PRE(column < _ncolumns);
    _alignments[column] = align;
}


/// Gets the alignment of a column.
///
/// \param column The index of the column to query.
///
/// \return The alignment of the column.
text::alignment
text::table::column_alignment(const table_row::size_type column) const
{
    PRE(column < _ncolumns);
    return _alignments[column];
}


/// Checks whether the table is empty or not.
///
/// \return True if the table is empty; false otherwise.
bool
text::table::empty(void) const
{
    return _rows.empty();
}


/// Adds a row to the table.
///
/// \param row The row to be added.  This row must have the same amount of
///     columns as defined during the construction of the table.
void
text::table::add_row(const table_row& row)
{
    PRE(row.size() == _ncolumns);
    _rows.push_back(row);
}


/// Gets an iterator pointing to the beginning of the rows of the table.
///
/// \return An iterator on the rows.
text::table::const_iterator
text::table::begin(void) const
{
    return _rows.begin();
}


/// Gets an iterator pointing to the end of the rows of the table.
///
/// \return An iterator on the rows.
text::table::const_iterator
text::table::end(void) const
{
    return _rows.end();
}


/// Formats a table into lines of text with aligned columns.
///
/// \param table The table to format.
/// \param separator The text to print between columns.
///
/// \return The formatted lines, one per table row.
std::vector< std::string >
text::format_table(const text::table& table, const std::string& separator)
{
    const widths_vector widths = column_widths(table);

    std::vector< std::string > lines;
    for (text::table::const_iterator iter = table.begin(); iter != table.end();
         ++iter) {
        const text::table_row& row = *iter;

        text::table_row cells;
        for (text::table_row::size_type i = 0; i < row.size(); ++i)
            cells.push_back(pad_cell(row[i], widths[i],
                                     table.column_alignment(i),
                                     i == row.size() - 1));
        lines.push_back(text::join(cells, separator));
    }
    return lines;
}
