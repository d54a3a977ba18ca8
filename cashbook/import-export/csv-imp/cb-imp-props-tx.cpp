/********************************************************************
 * cb-imp-props-tx.cpp - statement row properties and their parsers*
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


#include <boost/regex.hpp>
#include <boost/algorithm/string.hpp>
#include <exception>
#include <string>

#include "cb-imp-props-tx.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_IMPORT;

std::map<CbTransPropType, const char*> cb_csv_col_type_strs = {
        { CbTransPropType::NONE, "None" },
        { CbTransPropType::UNIQUE_ID, "Transaction ID" },
        { CbTransPropType::DATE, "Date" },
        { CbTransPropType::DESCRIPTION, "Description" },
        { CbTransPropType::AMOUNT, "Amount" },
        { CbTransPropType::AMOUNT_NEG, "Amount (Negated)" },
        { CbTransPropType::MEMO, "Memo" },
};

/* Currency signs found in the exports we know of, in UTF-8. */
static const char* currency_signs[] = { "$", "\xE2\x82\xAC", "\xC2\xA3",
                                        "\xC2\xA5", nullptr };

CbNumeric parse_monetary (const std::string &str)
{
    /* Strings containing no digits will be considered invalid */
    if(!boost::regex_search(str, boost::regex("[0-9]")))
        throw std::invalid_argument ("Value doesn't appear to contain a valid number.");

    auto val = str;
    for (auto sign = currency_signs; *sign; ++sign)
        boost::erase_all (val, *sign);
    val = boost::regex_replace (val, boost::regex("[[:blank:],]|--"), "");

    auto negative = false;
    if (val.size() > 2 && val.front() == '(' && val.back() == ')')
    {
        negative = true;
        val = val.substr (1, val.size() - 2);
    }
    else if (val.size() > 1 && val.back() == '-')
    {
        negative = true;
        val.pop_back();
    }

    static const boost::regex number("[-+]?([0-9]+\\.?[0-9]*|\\.[0-9]+)");
    if (!boost::regex_match (val, number))
        throw std::invalid_argument ("Value can't be parsed into a number.");
    if (val.back() == '.')
        val.pop_back();

    CbNumeric amount{val};
    return negative ? -amount : amount;
}

CbDate cb_parse_import_date (const std::string &str)
{
    auto s = boost::trim_copy (str);
    boost::smatch m;

    static const boost::regex compact("^([0-9]{4})([0-9]{2})([0-9]{2})");
    static const boost::regex mdy("^([0-9]{1,2})/([0-9]{1,2})/([0-9]{4})");
    static const boost::regex iso("^([0-9]{4})-([0-9]{2})-([0-9]{2})");
    static const boost::regex serial("^[0-9]+(\\.[0-9]*)?$");

    if (boost::regex_search (s, m, compact) ||
        boost::regex_search (s, m, iso))
        return CbDate (std::stoi (m[1].str()), std::stoi (m[2].str()),
                       std::stoi (m[3].str()));
    if (boost::regex_search (s, m, mdy))
        return CbDate (std::stoi (m[3].str()), std::stoi (m[1].str()),
                       std::stoi (m[2].str()));
    if (boost::regex_match (s, serial))
    {
        /* Spreadsheet day numbers count from 1899-12-30; 25569 is
         * 1970-01-01. */
        auto days = std::stoll (s.substr (0, s.find ('.')));
        if (days > 40000)
            return CbDate::from_days_since_epoch (days - 25569);
    }
    throw std::invalid_argument ("Value can't be parsed into a date.");
}

void CbPreTrans::set (CbTransPropType prop_type, const std::string& value)
{
    try
    {
        // Drop any existing error for the prop_type we're about to set
        m_errors.erase(prop_type);

        switch (prop_type)
        {
            case CbTransPropType::UNIQUE_ID:
                m_online_id.reset();
                if (!value.empty())
                    m_online_id = value;
                break;

            case CbTransPropType::DATE:
                m_date.reset();
                m_date = cb_parse_import_date (value); // Throws if parsing fails
                break;

            case CbTransPropType::DESCRIPTION:
                m_desc.reset();
                if (!value.empty())
                    m_desc = value;
                break;

            case CbTransPropType::AMOUNT:
                m_amount.reset();
                m_amount = parse_monetary (value); // Will throw if parsing fails
                break;

            case CbTransPropType::AMOUNT_NEG:
                m_amount.reset();
                m_amount = -parse_monetary (value); // Will throw if parsing fails
                break;

            case CbTransPropType::MEMO:
                m_memo.reset();
                if (!value.empty())
                    m_memo = value;
                break;

            default:
                /* Issue a warning for all other prop_types. */
                PWARN ("%d is an invalid property for a transaction", static_cast<int>(prop_type));
                break;
        }
    }
    catch (const std::exception& e)
    {
        auto err_str = std::string{cb_csv_col_type_strs[prop_type]} + ": " + e.what();
        m_errors.emplace(prop_type, err_str);
    }
}

void CbPreTrans::add (CbTransPropType prop_type, const std::string& value)
{
    if (prop_type != CbTransPropType::DESCRIPTION || !m_desc)
    {
        set (prop_type, value);
        return;
    }
    if (!value.empty())
        m_desc = *m_desc + " " + value;
}

void CbPreTrans::reset (CbTransPropType prop_type)
{
    set (prop_type, std::string());
    // Set with an empty string will effectively clear the property
    // but can also set an error for the property. Clear that error here.
    m_errors.erase(prop_type);
}

StrVec CbPreTrans::verify_essentials (void)
{
    auto errors = StrVec();

    if (!m_date)
        errors.emplace_back("No valid date.");

    if (!m_amount)
        errors.emplace_back("No valid amount.");

    return errors;
}

std::optional<CbImportRow> CbPreTrans::create_row (void)
{
    auto check = verify_essentials();
    if (!check.empty())
    {
        DEBUG ("dropping row: %s", boost::join (check, " ").c_str());
        return std::nullopt;
    }

    CbImportRow row;
    row.online_id = m_online_id.value_or ("");
    row.date = *m_date;
    row.description = m_desc.value_or ("");
    row.amount = *m_amount;
    row.memo = m_memo.value_or ("");
    return row;
}

ErrMap CbPreTrans::errors ()
{
    return m_errors;
}
