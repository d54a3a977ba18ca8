/********************************************************************
 * cb-xlsx-import.hpp - spreadsheet statements                     *
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

/** @file cb-xlsx-import.hpp
 *  Office Open XML workbooks are zip archives of XML parts. The first
 *  worksheet is located through xl/workbook.xml and its relationships,
 *  its cells resolved against xl/sharedStrings.xml, and the result is
 *  written out as comma separated text for the delimited text importer.
 *
 *  Date cells come out as the spreadsheet's serial day numbers, which the
 *  date parser understands. The older binary .xls format is not read.
 */

#ifndef CB_XLSX_IMPORT_HPP
#define CB_XLSX_IMPORT_HPP

#include <string>

/** Convert the first worksheet of the workbook in @a contents to comma
 * separated text, one line per non-blank row, quoting cells as needed.
 * @exception CbImportFormatError if @a contents is not a readable workbook.
 */
std::string cb_xlsx_first_sheet_to_csv (const std::string& contents,
                                        const std::string& filename = "workbook.xlsx");

#endif
