/********************************************************************
 * gtest-cb-imp-props-tx.cpp - statement row properties            *
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

#include <cb-datetime.hpp>

#include "../cb-imp-props-tx.hpp"

class CbImpPropsTxTest : public testing::Test
{
protected:
    CbPreTrans m_pre_trans;
};

TEST_F(CbImpPropsTxTest, ParseMonetary)
{
    /* No digits in string */
    EXPECT_THROW (parse_monetary (""), std::invalid_argument);
    EXPECT_THROW (parse_monetary ("abc"), std::invalid_argument);

    auto value = parse_monetary ("1,000.00");
    EXPECT_EQ (value, (CbNumeric {100000, 100}));
    value = parse_monetary ("-1,001.00");
    EXPECT_EQ (value, (CbNumeric {-100100, 100}));
    value = parse_monetary ("$ 42.50");
    EXPECT_EQ (value, (CbNumeric {4250, 100}));
    value = parse_monetary ("-12");
    EXPECT_EQ (value, (CbNumeric {-12, 1}));
    value = parse_monetary ("1 000 003.00");
    EXPECT_EQ (value, (CbNumeric {100000300, 100}));
    // Two minus signs are taken for a positive number
    value = parse_monetary ("--1,005.00");
    EXPECT_EQ (value, (CbNumeric {100500, 100}));
    value = parse_monetary ("(42.50)");
    EXPECT_EQ (value, (CbNumeric {-4250, 100}));
    value = parse_monetary ("42.50-");
    EXPECT_EQ (value, (CbNumeric {-4250, 100}));
    value = parse_monetary ("\xE2\x82\xAC" "7.");
    EXPECT_EQ (value, (CbNumeric {7, 1}));
    value = parse_monetary (".5");
    EXPECT_EQ (value, (CbNumeric {1, 2}));

    /* Things that will throw */
    EXPECT_THROW (parse_monetary ("3000.00.01"), std::invalid_argument);
    EXPECT_THROW (parse_monetary ("12 apples"), std::invalid_argument);
}

TEST_F(CbImpPropsTxTest, ParseImportDate)
{
    EXPECT_EQ ("2024-03-10", cb_parse_import_date ("20240310").iso());
    EXPECT_EQ ("2024-03-10",
               cb_parse_import_date ("20240310120000.000[-5:EST]").iso());
    EXPECT_EQ ("2024-03-10", cb_parse_import_date ("3/10/2024").iso());
    EXPECT_EQ ("2024-03-10", cb_parse_import_date (" 03/10/2024 ").iso());
    EXPECT_EQ ("2024-03-10", cb_parse_import_date ("2024-03-10").iso());
    EXPECT_EQ ("2024-03-10", cb_parse_import_date ("45361").iso());
    EXPECT_EQ ("2024-03-10", cb_parse_import_date ("45361.75").iso());

    EXPECT_THROW (cb_parse_import_date (""), std::invalid_argument);
    EXPECT_THROW (cb_parse_import_date ("N/A"), std::invalid_argument);
    EXPECT_THROW (cb_parse_import_date ("12345"), std::invalid_argument);
    EXPECT_THROW (cb_parse_import_date ("2024-02-30"), std::invalid_argument);
    EXPECT_THROW (cb_parse_import_date ("13/01/2024"), std::invalid_argument);
}

TEST_F(CbImpPropsTxTest, CreateRow)
{
    m_pre_trans.set (CbTransPropType::DATE, "03/10/2024");
    m_pre_trans.set (CbTransPropType::DESCRIPTION, "Fidelity");
    m_pre_trans.add (CbTransPropType::DESCRIPTION, "");
    m_pre_trans.add (CbTransPropType::DESCRIPTION, "CONTRIBUTION");
    m_pre_trans.set (CbTransPropType::AMOUNT_NEG, "-100.00");
    m_pre_trans.set (CbTransPropType::UNIQUE_ID, "T1");
    m_pre_trans.set (CbTransPropType::MEMO, "FXAIX");

    EXPECT_TRUE (m_pre_trans.verify_essentials().empty());
    EXPECT_TRUE (m_pre_trans.errors().empty());
    auto row = m_pre_trans.create_row();
    ASSERT_TRUE (row);
    EXPECT_EQ ("2024-03-10", row->date.iso());
    EXPECT_EQ ("Fidelity CONTRIBUTION", row->description);
    EXPECT_EQ ((CbNumeric {10000, 100}), row->amount);
    EXPECT_EQ ("T1", row->online_id);
    EXPECT_EQ ("FXAIX", row->memo);
    EXPECT_FALSE (row->is_duplicate);
}

TEST_F(CbImpPropsTxTest, RowWithoutEssentials)
{
    m_pre_trans.set (CbTransPropType::DATE, "N/A");
    m_pre_trans.set (CbTransPropType::AMOUNT, "");
    m_pre_trans.set (CbTransPropType::DESCRIPTION, "PENDING");

    auto errors = m_pre_trans.errors();
    EXPECT_EQ (2u, errors.size());
    EXPECT_EQ (0u, errors.at (CbTransPropType::DATE).find ("Date: "));
    EXPECT_EQ (2u, m_pre_trans.verify_essentials().size());
    EXPECT_FALSE (m_pre_trans.create_row());

    m_pre_trans.set (CbTransPropType::DATE, "2024-03-11");
    m_pre_trans.set (CbTransPropType::AMOUNT, "5");
    EXPECT_TRUE (m_pre_trans.errors().empty());
    auto row = m_pre_trans.create_row();
    ASSERT_TRUE (row);
    EXPECT_TRUE (row->online_id.empty());
    EXPECT_TRUE (row->memo.empty());

    m_pre_trans.reset (CbTransPropType::AMOUNT);
    EXPECT_TRUE (m_pre_trans.errors().empty());
    EXPECT_FALSE (m_pre_trans.create_row());
}
