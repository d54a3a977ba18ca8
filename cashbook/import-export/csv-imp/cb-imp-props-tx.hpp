/********************************************************************
 * cb-imp-props-tx.hpp - statement row properties and their parsers*
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

/** @file cb-imp-props-tx.hpp
 *  A statement row is collected one property at a time from the cells of
 *  an import file. Each property is parsed as it is set; a cell that can't
 *  be parsed records an error for that property instead of throwing, so the
 *  row can be dropped quietly once all its cells have been seen.
 */

#ifndef CB_IMP_PROPS_TX_HPP
#define CB_IMP_PROPS_TX_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cb-datetime.hpp"
#include "cb-numeric.hpp"

/** Enumeration for column types. These are the different types of
 * columns a statement can have. There should be no two columns with the
 * same type except for the CbTransPropType::NONE type and DESCRIPTION,
 * which can be assembled from several columns. */
enum class CbTransPropType {
    NONE,
    UNIQUE_ID,
    DATE,
    DESCRIPTION,
    AMOUNT,
    AMOUNT_NEG,
    MEMO,
};

using StrVec = std::vector<std::string>;
using ErrMap = std::map<CbTransPropType, std::string>;

/** Maps all column types to a string representation. */
extern std::map<CbTransPropType, const char*> cb_csv_col_type_strs;

/** Parse an amount as found in bank exports: "1,234.56", "$ 42.50",
 * "-12", "(42.50)" and "42.50-" are all understood.
 * @exception std::invalid_argument if @a str holds no number. */
CbNumeric parse_monetary (const std::string &str);

/** Parse a statement date. Accepted are YYYYMMDD with anything after it
 * (OFX's YYYYMMDDHHMMSS.XXX[-5:EST] included), M/D/YYYY, YYYY-MM-DD and
 * spreadsheet serial day numbers above 40000.
 * @exception std::invalid_argument for anything else. */
CbDate cb_parse_import_date (const std::string &str);

/** One row of a parsed statement. */
struct CbImportRow
{
    /** The bank's id for the transaction (OFX FITID), empty if none. */
    std::string online_id;
    CbDate date;
    std::string description;
    CbNumeric amount;
    std::string memo;
    /** Set by the duplicate reconciler. */
    bool is_duplicate = false;
};

class CbPreTrans
{
public:
    CbPreTrans() = default;

    void set (CbTransPropType prop_type, const std::string& value);
    /** Like set but DESCRIPTION values are appended, space separated. */
    void add (CbTransPropType prop_type, const std::string& value);
    void reset (CbTransPropType prop_type);
    /** @return the reasons the row can't be imported, empty if it can. */
    StrVec verify_essentials (void);
    /** The row, or nullopt if verify_essentials finds a problem. */
    std::optional<CbImportRow> create_row (void);

    ErrMap errors();

private:
    std::optional<std::string> m_online_id;
    std::optional<CbDate> m_date;
    std::optional<std::string> m_desc;
    std::optional<CbNumeric> m_amount;
    std::optional<std::string> m_memo;

    ErrMap m_errors;
};

#endif
