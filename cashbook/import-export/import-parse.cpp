/********************************************************************
 * import-parse.cpp - statement import entry points                *
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


#include <boost/algorithm/string.hpp>
#include <stdexcept>

#include "import-parse.hpp"
#include "cb-tokenizer-csv.hpp"
#include "cb-ofx-import.hpp"
#include "cb-xlsx-import.hpp"
#include "cb-errors.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_IMPORT;

std::string
cb_import_file_extension (const std::string& filename)
{
    auto dot = filename.rfind ('.');
    auto slash = filename.find_last_of ("/\\");
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash))
        return {};
    return boost::to_lower_copy (filename.substr (dot + 1));
}

static bool
is_ofx (const std::string& ext)
{
    return ext == "qfx" || ext == "ofx";
}

static bool
is_workbook (const std::string& ext)
{
    return ext == "xlsx" || ext == "xls";
}

static bool
is_delimited (const std::string& ext)
{
    return ext == "csv" || ext == "txt";
}

/* The statement as tokenized delimited text. */
static std::vector<StrVec>
delimited_lines (const std::string& contents, const std::string& filename,
                 const std::string& ext)
{
    auto text = is_workbook (ext) ?
        cb_xlsx_first_sheet_to_csv (contents, filename) : contents;
    try
    {
        return cb_csv_tokenize (text);
    }
    catch (const std::range_error& e)
    {
        PERR ("%s: %s", filename.c_str(), e.what());
        throw CbImportFormatError (filename, e.what());
    }
}

CbImportResult
cb_parse_import_file (const std::string& contents, const std::string& filename,
                      std::optional<std::size_t> header_row)
{
    auto ext = cb_import_file_extension (filename);
    ENTER ("%s (%s), %zu bytes", filename.c_str(), ext.c_str(), contents.size());

    if (is_ofx (ext))
    {
        auto result = cb_ofx_parse (contents);
        result.format = ext;
        LEAVE ("%zu rows", result.rows.size());
        return result;
    }
    if (!is_workbook (ext) && !is_delimited (ext))
    {
        PERR ("unsupported statement type '%s'", ext.c_str());
        throw CbImportFormatError (filename, "Unsupported statement file type '" +
                                   ext + "'");
    }

    auto result = cb_csv_import (delimited_lines (contents, filename, ext),
                                 header_row);
    result.format = is_workbook (ext) ? "xlsx" : "csv";
    LEAVE ("%s, %zu rows%s", result.layout.c_str(), result.rows.size(),
           result.needs_mapping ? ", needs mapping" : "");
    return result;
}

std::vector<CbImportRow>
cb_parse_import_file_with_mapping (const std::string& contents,
                                   const CbColumnMapping& mapping,
                                   const std::string& filename)
{
    auto ext = cb_import_file_extension (filename);
    if (!is_workbook (ext) && !is_delimited (ext))
        throw CbImportFormatError (filename, "Column mappings only apply to "
                                   "delimited text and workbooks");
    auto lines = delimited_lines (contents, filename, ext);
    if (lines.size() < 2)
        return {};
    return cb_csv_rows_with_mapping (lines, mapping);
}
