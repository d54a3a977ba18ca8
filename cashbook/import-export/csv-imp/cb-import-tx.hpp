/********************************************************************
 * cb-import-tx.hpp - statement rows from delimited text           *
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

/** @file cb-import-tx.hpp
 *  Turns tokenized delimited text into statement rows: find the header row,
 *  recognize the columns, then collect one CbPreTrans per data row. Rows
 *  that lack a usable date or amount are dropped without error; exports
 *  commonly carry titles, totals and disclaimers around the data.
 */

#ifndef CB_IMPORT_TX_HPP
#define CB_IMPORT_TX_HPP

#include <optional>
#include <string>
#include <vector>

#include "cb-csv-layout.hpp"
#include "cb-imp-props-tx.hpp"

/** What parsing a statement produced. */
struct CbImportResult
{
    /** "qfx", "ofx", "csv" or "xlsx". */
    std::string format;
    /** For OFX, "BANKID ACCTID ACCTTYPE" of the statement's account. */
    std::string suggested_account_hint;
    /** The columns couldn't be recognized; call again with a mapping. */
    bool needs_mapping = false;
    StrVec headers;
    std::optional<std::size_t> header_row;
    /** The layout or heuristic that mapped the columns. */
    std::string layout;
    std::vector<CbImportRow> rows;
};

/** Rows of @a lines from below the header row, read through @a mapping.
 * The header row is @a mapping.header_row or else detected. */
std::vector<CbImportRow> cb_csv_rows_with_mapping (const std::vector<StrVec>& lines,
                                                   const CbColumnMapping& mapping);

/** Parse tokenized delimited text.
 * @param header_row Overrides header row detection. */
CbImportResult cb_csv_import (const std::vector<StrVec>& lines,
                              std::optional<std::size_t> header_row = std::nullopt);

/** Tokenize @a contents (UTF-8, an optional byte order mark) and parse it.
 * @exception std::range_error if it can't be tokenized. */
CbImportResult cb_parse_csv (const std::string& contents,
                             std::optional<std::size_t> header_row = std::nullopt);

#endif
