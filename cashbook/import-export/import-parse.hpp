/********************************************************************
 * import-parse.hpp - statement import entry points                *
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

/** @file import-parse.hpp
 *  The format of a statement is chosen by its file name extension:
 *  @li .qfx, .ofx: OFX tag/value statements;
 *  @li .csv, .txt: comma separated text;
 *  @li .xlsx, .xls: the first worksheet of a workbook.
 *
 *  Anything else is refused with CbImportFormatError.
 */

#ifndef IMPORT_PARSE_HPP
#define IMPORT_PARSE_HPP

#include <optional>
#include <string>
#include <vector>

#include "cb-import-tx.hpp"

/** The lower cased extension of @a filename, empty if it has none. */
std::string cb_import_file_extension (const std::string& filename);

/** Parse the statement @a contents read from @a filename.
 *
 * A result with needs_mapping set carries the headers found, but no rows;
 * the caller picks the columns and calls
 * cb_parse_import_file_with_mapping().
 *
 * @param header_row Overrides header row detection for delimited text.
 * @exception CbImportFormatError for an unknown extension, a workbook that
 * can't be read or text that can't be tokenized.
 */
CbImportResult cb_parse_import_file (const std::string& contents,
                                     const std::string& filename,
                                     std::optional<std::size_t> header_row = std::nullopt);

/** Parse delimited text or a workbook with explicit columns.
 * @exception CbImportFormatError as cb_parse_import_file(), and for OFX.
 */
std::vector<CbImportRow>
cb_parse_import_file_with_mapping (const std::string& contents,
                                   const CbColumnMapping& mapping,
                                   const std::string& filename = "statement.csv");

#endif
