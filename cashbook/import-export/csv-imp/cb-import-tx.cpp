/********************************************************************
 * cb-import-tx.cpp - statement rows from delimited text           *
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
#include <algorithm>

#include "cb-import-tx.hpp"
#include "cb-tokenizer-csv.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_CSV;

static const std::string empty_cell;

static const std::string&
cell (const StrVec& line, std::optional<int> col)
{
    if (!col || *col < 0 || static_cast<std::size_t>(*col) >= line.size())
        return empty_cell;
    return line[*col];
}

static bool
blank_line (const StrVec& line)
{
    return std::all_of (line.begin(), line.end(), [](const std::string& c)
                        { return boost::trim_copy (c).empty(); });
}

std::vector<CbImportRow>
cb_csv_rows_with_mapping (const std::vector<StrVec>& lines,
                          const CbColumnMapping& mapping)
{
    std::vector<CbImportRow> rows;
    auto header_row = mapping.header_row ? *mapping.header_row
        : cb_detect_header_row (lines);
    auto amount_type = mapping.negate ? CbTransPropType::AMOUNT_NEG
        : CbTransPropType::AMOUNT;

    ENTER ("header row %zu, date %d, description %d, amount %d%s", header_row,
           mapping.date, mapping.description, mapping.amount,
           mapping.negate ? " negated" : "");
    for (auto i = header_row + 1; i < lines.size(); ++i)
    {
        const auto& line = lines[i];
        if (blank_line (line))
            continue;

        CbPreTrans pre_trans;
        pre_trans.set (CbTransPropType::DATE, cell (line, mapping.date));
        pre_trans.set (CbTransPropType::DESCRIPTION,
                       cell (line, mapping.description));
        if (mapping.description_extra)
            pre_trans.add (CbTransPropType::DESCRIPTION,
                           cell (line, mapping.description_extra));
        pre_trans.set (amount_type, cell (line, mapping.amount));
        if (mapping.memo)
            pre_trans.set (CbTransPropType::MEMO, cell (line, mapping.memo));

        if (auto row = pre_trans.create_row())
            rows.push_back (std::move (*row));
        else
            DEBUG ("line %zu dropped", i + 1);
    }
    LEAVE ("%zu of %zu lines kept", rows.size(),
           lines.size() > header_row ? lines.size() - header_row - 1 : 0);
    return rows;
}

CbImportResult
cb_csv_import (const std::vector<StrVec>& lines,
               std::optional<std::size_t> header_row)
{
    CbImportResult result;
    result.format = "csv";

    if (lines.size() < 2)
    {
        PINFO ("%zu lines, nothing to map", lines.size());
        result.needs_mapping = true;
        return result;
    }
    if (header_row && *header_row >= lines.size())
    {
        PWARN ("header row %zu is past the last line", *header_row);
        result.needs_mapping = true;
        return result;
    }

    auto row = header_row ? *header_row : cb_detect_header_row (lines);
    result.header_row = row;
    for (const auto& h : lines[row])
        result.headers.push_back (boost::trim_copy_if (h, boost::is_any_of ("\" ")));

    auto mapping = cb_match_known_layout (result.headers);
    if (!mapping)
        mapping = cb_guess_column_mapping (result.headers);
    if (!mapping)
    {
        PINFO ("columns not recognized, a mapping is needed");
        result.needs_mapping = true;
        return result;
    }

    mapping->header_row = row;
    result.layout = mapping->layout;
    result.rows = cb_csv_rows_with_mapping (lines, *mapping);
    return result;
}

CbImportResult
cb_parse_csv (const std::string& contents, std::optional<std::size_t> header_row)
{
    return cb_csv_import (cb_csv_tokenize (contents), header_row);
}
