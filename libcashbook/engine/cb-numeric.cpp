/********************************************************************
 * cb-numeric.cpp - A rational number class for ledger amounts     *
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
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <numeric>
#include <sstream>

#include "cb-numeric.hpp"

static const uint8_t max_leg_digits{17};
static const int64_t pten[] = { 1, 10, 100, 1000, 10000, 100000, 1000000,
                               10000000, 100000000, 1000000000,
                               INT64_C(10000000000), INT64_C(100000000000),
                               INT64_C(1000000000000), INT64_C(10000000000000),
                               INT64_C(100000000000000),
                               INT64_C(1000000000000000),
                               INT64_C(10000000000000000),
                               INT64_C(100000000000000000)};

static int64_t
powten (unsigned int exp)
{
    if (exp > max_leg_digits)
        throw std::out_of_range("Too many decimal places for a CbNumeric.");
    return pten[exp];
}

static int64_t
checked_mul (int64_t a, int64_t b)
{
    if (a != 0 && b != 0 &&
        std::abs(a) > std::numeric_limits<int64_t>::max() / std::abs(b))
        throw std::overflow_error("CbNumeric multiplication overflow.");
    return a * b;
}

static int64_t
checked_add (int64_t a, int64_t b)
{
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b))
        throw std::overflow_error("CbNumeric addition overflow.");
    return a + b;
}

using boost::regex;
using boost::smatch;
using boost::regex_search;

static CbNumeric
numeric_from_string(const std::string& str)
{
    static const std::string numer_frag("([-+]?[0-9]+)");
    static const std::string denom_frag("([0-9]+)");
    static const std::string slash("[ \\t]*/[ \\t]*");
    static const regex numeral(numer_frag);
    static const regex numeral_rational(numer_frag + slash + denom_frag);
    static const regex decimal("([-+]?)([0-9]*)[.,]([0-9]+)");
    smatch m;
/* The order of testing the regexes is from the more restrictive to the less
 * restrictive, as less-restrictive ones will match patterns that would also
 * match the more-restrictive and so invoke the wrong construction.
 */
    if (str.empty())
        throw std::invalid_argument("Can't construct a CbNumeric from an empty string.");
    if (regex_search(str, m, numeral_rational))
    {
        return CbNumeric(std::stoll(m[1].str()), std::stoll(m[2].str()));
    }
    if (regex_search(str, m, decimal))
    {
        /* The sign is captured separately: "-0.50" has an integer part of
         * zero, which carries no sign of its own. */
        auto negative = m[1].str() == "-";
        auto high = m[2].length() ? std::stoll(m[2].str()) : INT64_C(0);
        auto low = std::stoll(m[3].str());
        auto d = powten(m[3].str().length());
        auto n = checked_add(checked_mul(high, d), low);
        return CbNumeric(negative ? -n : n, d);
    }
    if (regex_search(str, m, numeral))
    {
        return CbNumeric(std::stoll(m[1].str()), INT64_C(1));
    }
    std::ostringstream errmsg;
    errmsg << "String " << str << " contains no recognizable numeric value.";
    throw std::invalid_argument(errmsg.str());
}

/* Values too large for 64 bits are malformed input as far as callers are
 * concerned, so they get the same exception as any other bad string. */
CbNumeric::CbNumeric(const std::string& str) : m_num(0), m_den(1)
{
    try
    {
        auto n = numeric_from_string(str);
        m_num = n.num();
        m_den = n.denom();
    }
    catch (const std::out_of_range& err)
    {
        throw std::invalid_argument(std::string("String ") + str +
                                    " is out of range: " + err.what());
    }
    catch (const std::overflow_error& err)
    {
        throw std::invalid_argument(std::string("String ") + str +
                                    " is out of range: " + err.what());
    }
}

CbNumeric
CbNumeric::operator-() const noexcept
{
    CbNumeric b(*this);
    b.m_num = - b.m_num;
    return b;
}

CbNumeric
CbNumeric::abs() const noexcept
{
    if (m_num < 0)
        return -*this;
    return *this;
}

CbNumeric
CbNumeric::reduce() const noexcept
{
    auto g = std::gcd(m_num, m_den);
    if (g <= 1)
        return *this;
    return CbNumeric(m_num / g, m_den / g);
}

CbNumeric::round_param
CbNumeric::prepare_conversion(int64_t new_denom) const
{
    if (new_denom <= 0)
        throw std::invalid_argument("Conversion to a non-positive denominator.");
    if (new_denom == m_den)
        return {m_num, m_den, 0};
    auto g = std::gcd(new_denom, m_den);
    auto mult = new_denom / g;
    auto div = m_den / g;
    auto new_num = checked_mul(m_num, mult);
    return {new_num / div, div, new_num % div};
}

std::string
CbNumeric::to_string() const noexcept
{
    std::ostringstream out;
    out << *this;
    return out.str();
}

std::string
CbNumeric::to_decimal_string(unsigned int places) const
{
    auto scale = powten(places);
    auto val = convert<RoundType::half_up>(scale);
    auto whole = val.num() / scale;
    auto frac = std::abs(val.num() % scale);
    std::ostringstream out;
    if (val.num() < 0)
        out << "-";
    out << std::abs(whole);
    if (places)
    {
        auto digits = std::to_string(frac);
        out << "." << std::string(places - digits.size(), '0') << digits;
    }
    return out.str();
}

double
CbNumeric::to_double() const noexcept
{
    return static_cast<double>(m_num) / static_cast<double>(m_den);
}

int
CbNumeric::cmp(CbNumeric b) const
{
    if (m_den == b.m_den)
        return m_num < b.m_num ? -1 : (m_num > b.m_num ? 1 : 0);
    try
    {
        auto a_num = checked_mul(m_num, b.m_den);
        auto b_num = checked_mul(b.m_num, m_den);
        return a_num < b_num ? -1 : (a_num > b_num ? 1 : 0);
    }
    catch (const std::overflow_error&)
    {
        auto a = static_cast<long double>(m_num) / m_den;
        auto bd = static_cast<long double>(b.m_num) / b.m_den;
        return a < bd ? -1 : (a > bd ? 1 : 0);
    }
}

void
CbNumeric::operator+=(CbNumeric b)
{
    *this = *this + b;
}

void
CbNumeric::operator-=(CbNumeric b)
{
    *this = *this - b;
}

CbNumeric
operator+(CbNumeric a, CbNumeric b)
{
    if (a.denom() == b.denom())
        return CbNumeric(checked_add(a.num(), b.num()), a.denom());
    auto lcd = std::lcm(a.denom(), b.denom());
    auto a_num = checked_mul(a.num(), lcd / a.denom());
    auto b_num = checked_mul(b.num(), lcd / b.denom());
    return CbNumeric(checked_add(a_num, b_num), lcd);
}

CbNumeric
operator-(CbNumeric a, CbNumeric b)
{
    return a + -b;
}

std::ostream&
operator<<(std::ostream& s, CbNumeric n)
{
    if (n.denom() == 1)
        s << n.num();
    else
        s << n.num() << "/" << n.denom();
    return s;
}

CbNumeric
cb_numeric_round_cents (CbNumeric amount)
{
    return amount.convert<RoundType::half_up>(CB_AMOUNT_DENOM);
}

std::string
cb_numeric_to_fraction (CbNumeric amount)
{
    auto cents = cb_numeric_round_cents (amount);
    return std::to_string (cents.num()) + "/" + std::to_string (cents.denom());
}

CbNumeric
cb_numeric_from_fraction (const std::string& str)
{
    return CbNumeric (str);
}
