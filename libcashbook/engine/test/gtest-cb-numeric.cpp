/********************************************************************
 * gtest-cb-numeric.cpp -- tests of CbNumeric and the cent codec   *
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
#include "../cb-numeric.hpp"

TEST(cbnumeric_constructors, test_default_constructor)
{
    CbNumeric value;
    EXPECT_EQ(value.num(), 0);
    EXPECT_EQ(value.denom(), 1);
}

TEST(cbnumeric_constructors, test_int64_constructor)
{
    CbNumeric value(INT64_C(123), INT64_C(456));
    EXPECT_EQ(123, value.num());
    EXPECT_EQ(456, value.denom());
    CbNumeric negden(INT64_C(123), INT64_C(-456));
    EXPECT_EQ(-123, negden.num());
    EXPECT_EQ(456, negden.denom());
    EXPECT_THROW(CbNumeric throw_val(123, 0), std::invalid_argument);
}

TEST(cbnumeric_constructors, test_string_constructor)
{
    CbNumeric simple_num("123/456");
    EXPECT_EQ(123, simple_num.num());
    EXPECT_EQ(456, simple_num.denom());
    CbNumeric neg_simple_num("-4250/100");
    EXPECT_EQ(-4250, neg_simple_num.num());
    EXPECT_EQ(100, neg_simple_num.denom());
    CbNumeric with_spaces("123 / 456");
    EXPECT_EQ(123, with_spaces.num());
    EXPECT_EQ(456, with_spaces.denom());
    CbNumeric decimal("42.50");
    EXPECT_EQ(4250, decimal.num());
    EXPECT_EQ(100, decimal.denom());
    CbNumeric neg_fraction("-0.50");
    EXPECT_EQ(-50, neg_fraction.num());
    EXPECT_EQ(100, neg_fraction.denom());
    CbNumeric no_integer("-.5");
    EXPECT_EQ(-5, no_integer.num());
    EXPECT_EQ(10, no_integer.denom());
    CbNumeric integer("+3");
    EXPECT_EQ(3, integer.num());
    EXPECT_EQ(1, integer.denom());
    CbNumeric embedded("Amount: 12.34 USD");
    EXPECT_EQ(1234, embedded.num());
    EXPECT_EQ(100, embedded.denom());
    EXPECT_THROW(CbNumeric empty(""), std::invalid_argument);
    EXPECT_THROW(CbNumeric bad("N/A"), std::invalid_argument);
    EXPECT_THROW(CbNumeric huge("99999999999999999999"), std::invalid_argument);
    EXPECT_THROW(CbNumeric huge_num("99999999999999999999/100"),
                 std::invalid_argument);
    EXPECT_THROW(CbNumeric huge_den("1/100000000000000000000"),
                 std::invalid_argument);
    EXPECT_THROW(CbNumeric too_precise("1.0000000000000000001"),
                 std::invalid_argument);
    EXPECT_THROW(CbNumeric overflow("9223372036854775807.5"),
                 std::invalid_argument);
}

TEST(cbnumeric_operators, test_arithmetic)
{
    CbNumeric a(4250, 100), b(-1, 4);
    auto sum = a + b;
    EXPECT_EQ(CbNumeric(4225, 100), sum);
    EXPECT_EQ(CbNumeric(4275, 100), a - b);
    EXPECT_EQ(CbNumeric(-4250, 100), -a);
    EXPECT_EQ(CbNumeric(1, 4), b.abs());
    EXPECT_TRUE(b < a);
    EXPECT_TRUE(CbNumeric(1, 2) == CbNumeric(50, 100));
    a += b;
    EXPECT_EQ(sum, a);
}

TEST(cbnumeric_functions, test_convert)
{
    CbNumeric a(123456, 1000);
    auto b = a.convert<RoundType::half_up>(100);
    EXPECT_EQ(12346, b.num());
    EXPECT_EQ(100, b.denom());
    CbNumeric c(-123455, 1000);
    auto d = c.convert<RoundType::half_up>(100);
    EXPECT_EQ(-12346, d.num());
    EXPECT_THROW(c.convert<RoundType::never>(100), std::domain_error);
}

TEST(cbnumeric_functions, test_to_decimal_string)
{
    EXPECT_EQ("-42.50", CbNumeric(-4250, 100).to_decimal_string(2));
    EXPECT_EQ("-0.05", CbNumeric(-5, 100).to_decimal_string(2));
    EXPECT_EQ("0.00", CbNumeric().to_decimal_string(2));
    EXPECT_EQ("1234.00", CbNumeric("1234").to_decimal_string(2));
    EXPECT_EQ("0.33", CbNumeric(1, 3).to_decimal_string(2));
    EXPECT_EQ("7", CbNumeric(7, 1).to_decimal_string(0));
}

TEST(cbnumeric_codec, test_to_fraction)
{
    EXPECT_EQ("4250/100", cb_numeric_to_fraction(CbNumeric("42.50")));
    EXPECT_EQ("-4250/100", cb_numeric_to_fraction(CbNumeric("-42.5")));
    EXPECT_EQ("0/100", cb_numeric_to_fraction(CbNumeric()));
    EXPECT_EQ("100/100", cb_numeric_to_fraction(CbNumeric("1")));
    /* Half away from zero */
    EXPECT_EQ("1/100", cb_numeric_to_fraction(CbNumeric("0.005")));
    EXPECT_EQ("-1/100", cb_numeric_to_fraction(CbNumeric("-0.005")));
    EXPECT_EQ("0/100", cb_numeric_to_fraction(CbNumeric("0.004")));
    EXPECT_EQ("-4251/100", cb_numeric_to_fraction(CbNumeric("-42.505")));
}

TEST(cbnumeric_codec, test_from_fraction)
{
    auto value = cb_numeric_from_fraction("-1234/100");
    EXPECT_EQ(-1234, value.num());
    EXPECT_EQ(100, value.denom());
    auto whole = cb_numeric_from_fraction("5");
    EXPECT_EQ(5, whole.num());
    EXPECT_EQ(1, whole.denom());
    EXPECT_THROW(cb_numeric_from_fraction(""), std::invalid_argument);
}

TEST(cbnumeric_codec, test_round_trip_is_idempotent)
{
    const char* amounts[] = {"42.50", "-42.50", "0", "-0", "0.001", "-0.004",
                             "0.005", "-0.005", "1234.5678", "-99999.995",
                             "1/3", "-2/3", "17"};
    for (auto str : amounts)
    {
        CbNumeric amount(str);
        auto once = cb_numeric_from_fraction(cb_numeric_to_fraction(amount));
        EXPECT_EQ(cb_numeric_round_cents(amount), once) << str;
        EXPECT_EQ(CB_AMOUNT_DENOM, once.denom()) << str;
        auto twice = cb_numeric_from_fraction(cb_numeric_to_fraction(once));
        EXPECT_EQ(once.num(), twice.num()) << str;
        EXPECT_EQ(once.denom(), twice.denom()) << str;
    }
}
