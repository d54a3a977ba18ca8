/********************************************************************
 * cb-ofx-import.cpp - OFX and QFX bank statements                 *
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


#include <glib.h>
#include <boost/regex.hpp>
#include <boost/algorithm/string.hpp>
#include <string>
#include <vector>

#include "cb-ofx-import.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_OFX;

/* Banks have been known to send Latin-1 in files declaring UTF-8. */
static std::string
sanitize_string (std::string str)
{
    const gchar *inval;
    while (!g_utf8_validate (str.c_str(), str.size(), &inval))
        str[inval - str.c_str()] = '@';
    return str;
}

static std::string
decode_entities (std::string value)
{
    boost::replace_all (value, "&lt;", "<");
    boost::replace_all (value, "&gt;", ">");
    boost::replace_all (value, "&quot;", "\"");
    boost::replace_all (value, "&apos;", "'");
    boost::replace_all (value, "&nbsp;", " ");
    boost::replace_all (value, "&amp;", "&");
    return value;
}

std::optional<std::string>
cb_ofx_tag_value (const std::string& text, const std::string& tag)
{
    boost::regex re ("<" + tag + ">([^<\\r\\n]+)", boost::regex::icase);
    boost::smatch m;
    if (!boost::regex_search (text, m, re))
        return std::nullopt;
    auto value = boost::trim_copy (m[1].str());
    if (value.empty())
        return std::nullopt;
    return decode_entities (value);
}

static std::string
account_hint (const std::string& text)
{
    StrVec parts;
    for (auto tag : {"BANKID", "ACCTID", "ACCTTYPE"})
        if (auto value = cb_ofx_tag_value (text, tag))
            parts.push_back (*value);
    return boost::join (parts, " ");
}

CbImportResult
cb_ofx_parse (const std::string& input)
{
    static const boost::regex stmttrn ("<STMTTRN>.*?</STMTTRN>",
                                       boost::regex::icase);

    auto text = sanitize_string (input);
    CbImportResult result;
    result.format = "ofx";
    result.suggested_account_hint = account_hint (text);

    ENTER ("account %s", result.suggested_account_hint.c_str());
    auto blocks = 0;
    for (boost::sregex_iterator it (text.begin(), text.end(), stmttrn), end;
         it != end; ++it)
    {
        auto block = it->str();
        ++blocks;

        CbPreTrans pre_trans;
        auto date = cb_ofx_tag_value (block, "DTPOSTED");
        if (!date)
            date = cb_ofx_tag_value (block, "DTAVAIL");
        pre_trans.set (CbTransPropType::DATE, date.value_or (""));
        pre_trans.set (CbTransPropType::AMOUNT,
                       cb_ofx_tag_value (block, "TRNAMT").value_or (""));
        pre_trans.set (CbTransPropType::UNIQUE_ID,
                       cb_ofx_tag_value (block, "FITID").value_or (""));

        /* Put transaction name in Description, or memo if name unavailable */
        auto name = cb_ofx_tag_value (block, "NAME");
        auto memo = cb_ofx_tag_value (block, "MEMO");
        pre_trans.set (CbTransPropType::DESCRIPTION,
                       name ? *name : memo.value_or (""));
        pre_trans.set (CbTransPropType::MEMO, memo.value_or (""));

        if (auto row = pre_trans.create_row())
            result.rows.push_back (std::move (*row));
        else
            DEBUG ("STMTTRN %d dropped", blocks);
    }
    LEAVE ("%zu of %d transactions kept", result.rows.size(), blocks);
    return result;
}
