/********************************************************************
 * cb-numeric.hpp - A rational number class for ledger amounts     *
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


#ifndef CB_NUMERIC_HPP
#define CB_NUMERIC_HPP

#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "cb-rational-rounding.hpp"

/** @brief The numeric class for representing amounts and values.
 *
 * A CbNumeric is an int64_t numerator over a positive int64_t denominator,
 * exactly the "N/D" form the ledger file stores for split values and
 * quantities.
 *
 * Errors:
 * * A zero denominator will raise a std::invalid_argument.
 * * Arithmetic whose result doesn't fit will raise a std::overflow_error.
 * * Failure to convert a number as specified by the arguments to convert() will
 *   raise a std::domain_error.
 *
 * Rounding Policy: convert() takes a RoundType template argument naming the
 * rounding method, see cb-rational-rounding.hpp.
 */
class CbNumeric
{
public:
    /**
     * Default constructor provides the zero value.
     */
    CbNumeric() : m_num (0), m_den(1) {}
    /**
     * Integer constructor. A negative denominator moves its sign to the
     * numerator.
     *
     * \param num The Numerator
     * \param denom The Denominator
     */
    CbNumeric(int64_t num, int64_t denom) :
        m_num(num), m_den(denom) {
        if (denom == 0)
            throw std::invalid_argument("Attempt to construct a CbNumeric with a 0 denominator.");
        if (denom < 0)
        {
            m_num = -m_num;
            m_den = -m_den;
        }
    }
    /**
     * String constructor.
     *
     * If the string contains a '/' it is taken to separate the numerator and
     * the denominator; if it contains either a '.' or a ',' it is taken as a
     * decimal point and the integers on either side will be combined and a
     * denominator will be the appropriate power of 10. If neither is present
     * the number will be treated as an integer and m_den will be set to 1.
     * A sign may precede the number: "-.5", "-0.50" and "+3" are accepted.
     *
     * Whitespace around a '/' is ignored. A correctly-formatted number will be
     * extracted from a larger string.
     *
     * An empty string, one which contains no recognizable number, or one whose
     * numerator, denominator or decimal places don't fit an int64_t will
     * result in std::invalid_argument.
     */
    explicit CbNumeric(const std::string& str);
    CbNumeric(const CbNumeric& rhs) = default;
    CbNumeric(CbNumeric&& rhs) = default;
    CbNumeric& operator=(const CbNumeric& rhs) = default;
    CbNumeric& operator=(CbNumeric&& rhs) = default;
    ~CbNumeric() = default;

    /**
     * Accessor for numerator value.
     */
    int64_t num() const noexcept { return m_num; }
    /**
     * Accessor for denominator value.
     */
    int64_t denom() const noexcept { return m_den; }
    /**
     * @return A CbNumeric with the opposite sign.
     */
    CbNumeric operator-() const noexcept;
    /**
     * @return -this if this < 0 else this.
     */
    CbNumeric abs() const noexcept;
    /**
     * Return an equivalent fraction with all common factors between the
     * numerator and the denominator removed.
     */
    CbNumeric reduce() const noexcept;
    /**
     * Convert a CbNumeric to use a new denominator. If rounding is necessary
     * use the indicated template argument. For example, to use half-up
     * rounding you'd call bar = foo.convert<RoundType::half_up>(100). If you
     * specify RoundType::never this will throw std::domain_error if rounding is
     * required.
     *
     * \param new_denom The new denominator to convert the fraction to.
     * \return A new CbNumeric having the requested denominator.
     */
    template <RoundType RT>
    CbNumeric convert(int64_t new_denom) const
    {
        auto params = prepare_conversion(new_denom);
        if (params.rem == 0)
            return CbNumeric(params.num, new_denom);
        return CbNumeric(round(params.num, params.den,
                               params.rem, RT2T<RT>()), new_denom);
    }
    /**
     * Return the "N/D" representation, or just "N" if the denominator is 1.
     */
    std::string to_string() const noexcept;
    /**
     * Return the decimal representation, e.g. "-42.50" for -4250/100. The
     * denominator must be a power of ten; if it isn't, the value is first
     * converted to @a places decimals with half_up rounding.
     */
    std::string to_decimal_string(unsigned int places = 2) const;
    double to_double() const noexcept;
    bool is_zero() const noexcept { return m_num == 0; }
    bool is_negative() const noexcept { return m_num < 0; }

    int cmp(CbNumeric b) const;

    void operator+=(CbNumeric b);
    void operator-=(CbNumeric b);

private:
    struct round_param
    {
        int64_t num;
        int64_t den;
        int64_t rem;
    };
    round_param prepare_conversion(int64_t new_denom) const;

    int64_t m_num;
    int64_t m_den;
};

CbNumeric operator+(CbNumeric a, CbNumeric b);
CbNumeric operator-(CbNumeric a, CbNumeric b);

std::ostream& operator<<(std::ostream&, CbNumeric);

inline bool operator<(CbNumeric a, CbNumeric b) { return a.cmp(b) < 0; }
inline bool operator>(CbNumeric a, CbNumeric b) { return a.cmp(b) > 0; }
inline bool operator==(CbNumeric a, CbNumeric b) { return a.cmp(b) == 0; }
inline bool operator!=(CbNumeric a, CbNumeric b) { return a.cmp(b) != 0; }
inline bool operator<=(CbNumeric a, CbNumeric b) { return a.cmp(b) <= 0; }
inline bool operator>=(CbNumeric a, CbNumeric b) { return a.cmp(b) >= 0; }

/** @name Fraction codec
 * The ledger stores amounts as whole cents over a denominator of 100.
 * @{ */
/** The fixed denominator of stored values. */
constexpr int64_t CB_AMOUNT_DENOM = 100;

/** Round @a amount to whole cents, half away from zero. */
CbNumeric cb_numeric_round_cents (CbNumeric amount);

/** Encode @a amount as "N/100", rounding half away from zero, so
 * cb_numeric_from_fraction(cb_numeric_to_fraction(x)) ==
 * cb_numeric_round_cents(x) for every x.
 */
std::string cb_numeric_to_fraction (CbNumeric amount);

/** Decode an "N/D" fraction (or a plain decimal) as found in the ledger.
 * @exception std::invalid_argument if @a str holds no number.
 */
CbNumeric cb_numeric_from_fraction (const std::string& str);
/** @} */

#endif // CB_NUMERIC_HPP
