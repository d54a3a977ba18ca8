/********************************************************************
 * gtest-cb-ofx-import.cpp - OFX and QFX statements                *
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


#include <gtest/gtest.h>

#include "../cb-ofx-import.hpp"

static const char* sgml_statement =
    "OFXHEADER:100\r\n"
    "DATA:OFXSGML\r\n"
    "VERSION:102\r\n"
    "\r\n"
    "<OFX>\r\n"
    "<BANKMSGSRSV1><STMTTRNRS><STMTRS><CURDEF>USD\r\n"
    "<BANKACCTFROM><BANKID>121000248<ACCTID>5555<ACCTTYPE>CHECKING</BANKACCTFROM>\r\n"
    "<BANKTRANLIST><DTSTART>20240301<DTEND>20240331\r\n"
    "<STMTTRN>\r\n"
    "<TRNTYPE>DEBIT\r\n"
    "<DTPOSTED>20240310120000.000[-5:EST]\r\n"
    "<TRNAMT>-42.50\r\n"
    "<FITID>1234.000000\r\n"
    "<NAME>A&amp;P #123\r\n"
    "<MEMO>groceries\r\n"
    "</STMTTRN>\r\n"
    "<STMTTRN>\r\n"
    "<TRNTYPE>ATM\r\n"
    "<DTAVAIL>20240311\r\n"
    "<TRNAMT>-60.00\r\n"
    "<FITID>2\r\n"
    "<NAME>   \r\n"
    "<MEMO>ATM WITHDRAWAL\r\n"
    "</STMTTRN>\r\n"
    "<STMTTRN>\r\n"
    "<TRNTYPE>CREDIT\r\n"
    "<DTPOSTED>20240312\r\n"
    "<FITID>3\r\n"
    "<NAME>NO AMOUNT\r\n"
    "</STMTTRN>\r\n"
    "</BANKTRANLIST></STMTRS></STMTTRNRS></BANKMSGSRSV1>\r\n"
    "</OFX>\r\n";

TEST(CbOfxImport, TagValue)
{
    std::string text{"<STMTTRN><trnamt>-1.00</TRNAMT>\n<NAME>\n<MEMO>  x &lt;y&gt;  \n"};
    EXPECT_EQ ("-1.00", cb_ofx_tag_value (text, "TRNAMT").value_or (""));
    EXPECT_EQ ("x <y>", cb_ofx_tag_value (text, "memo").value_or (""));
    EXPECT_FALSE (cb_ofx_tag_value (text, "NAME"));
    EXPECT_FALSE (cb_ofx_tag_value (text, "FITID"));
}

TEST(CbOfxImport, ParseStatement)
{
    auto result = cb_ofx_parse (sgml_statement);
    EXPECT_EQ ("ofx", result.format);
    EXPECT_EQ ("121000248 5555 CHECKING", result.suggested_account_hint);
    EXPECT_FALSE (result.needs_mapping);

    ASSERT_EQ (2u, result.rows.size());
    const auto& first = result.rows[0];
    EXPECT_EQ ("1234.000000", first.online_id);
    EXPECT_EQ ("2024-03-10", first.date.iso());
    EXPECT_EQ ("A&P #123", first.description);
    EXPECT_EQ ((CbNumeric {-4250, 100}), first.amount);
    EXPECT_EQ ("groceries", first.memo);

    const auto& second = result.rows[1];
    EXPECT_EQ ("2", second.online_id);
    EXPECT_EQ ("2024-03-11", second.date.iso());
    EXPECT_EQ ("ATM WITHDRAWAL", second.description);
    EXPECT_EQ ("ATM WITHDRAWAL", second.memo);
    EXPECT_EQ ((CbNumeric {-60, 1}), second.amount);
}

TEST(CbOfxImport, ParseXmlStatement)
{
    auto result = cb_ofx_parse (
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<?OFX OFXHEADER=\"200\" VERSION=\"211\"?>\n"
        "<OFX><CREDITCARDMSGSRSV1><CCSTMTTRNRS><CCSTMTRS>\n"
        "<CCACCTFROM><ACCTID>4111</ACCTID></CCACCTFROM>\n"
        "<BANKTRANLIST>\n"
        "<STMTTRN><DTPOSTED>20240310</DTPOSTED><TRNAMT>12.00</TRNAMT>"
        "<FITID>X9</FITID><NAME>CAF\xE9</NAME></STMTTRN>\n"
        "</BANKTRANLIST></CCSTMTRS></CCSTMTTRNRS></CREDITCARDMSGSRSV1></OFX>\n");
    EXPECT_EQ ("4111", result.suggested_account_hint);
    ASSERT_EQ (1u, result.rows.size());
    EXPECT_EQ ("X9", result.rows[0].online_id);
    EXPECT_EQ ("CAF@", result.rows[0].description);
    EXPECT_TRUE (result.rows[0].memo.empty());
}

TEST(CbOfxImport, ParseEmpty)
{
    auto result = cb_ofx_parse ("");
    EXPECT_TRUE (result.rows.empty());
    EXPECT_TRUE (result.suggested_account_hint.empty());
}
