/********************************************************************
 * cb-csv-layout.hpp - recognizing the columns of a statement      *
 *                                                                  *
 * This program is free software; you can redistribute it and/or    *
 * modify it under the terms of the GNU General Public License as   *
 * published by the Free Software Foundation; either version 2 of   *
 * the License, or (at your option) any later version.              *
 *                                                                  *
 * This program is distributed in the hope that it will be useful,  *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of   *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the    *
 * GNU General Public License for more details.                     *
 *                                                                  *
 * You should have received a copy of the GNU General Public License*
 * along with this program; if not, contact:                        *
 *                                                                  *
 * Free Software Foundation           Voice:  +1-617-542-5942       *
 * 51 Franklin Street, Fifth Floor    Fax:    +1-617-542-2652       *
 * Boston, MA  02110-1301,  USA       gnu@gnu.org                   *
 *                                                                  *
 *******************************************************************/

/** @file cb-csv-layout.hpp
 *  Heuristics that find the header row of a delimited statement and decide
 *  which of its columns hold the date, description and amount. They work on
 *  tokenized rows only so that each can be tested without any file.
 *
 *  Column recognition first tries a table of layouts exported by specific
 *  banks, recognized by a distinctive pair of header names, and then falls
 *  back to searching the headers for likely names in order of preference.
 */

#ifndef CB_CSV_LAYOUT_HPP
#define CB_CSV_LAYOUT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

using StrVec = std::vector<std::string>;

/** Which cells of a data row make up a statement row. */
struct CbColumnMapping
{
    int date = -1;
    int description = -1;
    /** A second column appended to the description. */
    std::optional<int> description_extra;
    int amount = -1;
    std::optional<int> memo;
    /** The amounts are of the opposite sign, e.g. a charges column. */
    bool negate = false;
    /** Row of the headers; detected when not set. */
    std::optional<std::size_t> header_row;
    /** Name of the layout that produced the mapping. */
    std::string layout;
};

/** Rows past this one are never taken for the header row. */
constexpr std::size_t CB_HEADER_SCAN_ROWS = 20;
/** A row scoring this much is taken without looking further. */
constexpr int CB_HEADER_GOOD_SCORE = 3;

/** Count the cells of @a row that look like a column title (date, amount,
 * debit, credit, payee, description, memo, balance, reference, posting). */
int cb_score_header_row (const StrVec& row);

/** Pick the header row among the first rows of @a rows: the highest
 * scoring one with at least two cells, the earliest on a tie, stopping at
 * the first that scores CB_HEADER_GOOD_SCORE. 0 if no row qualifies. */
std::size_t cb_detect_header_row (const std::vector<StrVec>& rows);

/** The mapping of a known bank layout, if @a headers is one. */
std::optional<CbColumnMapping> cb_match_known_layout (const StrVec& headers);

/** A mapping built from the header names alone, nullopt unless a date, a
 * description and an amount column are all found. */
std::optional<CbColumnMapping> cb_guess_column_mapping (const StrVec& headers);

#endif
