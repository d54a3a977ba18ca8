/********************************************************************
 * cb-rational-rounding.hpp - Template functions for rounding      *
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

/** @file cb-rational-rounding.hpp
 *  Rounding policies for CbNumeric::convert(). Each policy takes the truncated
 *  quotient @a num of a conversion together with its remainder @a rem over
 *  @a den and returns the rounded quotient.
 */

#ifndef CB_RATIONAL_ROUNDING_HPP
#define CB_RATIONAL_ROUNDING_HPP

#include <cstdlib>
#include <stdexcept>

enum class RoundType
{
    floor,
    ceiling,
    truncate,
    promote,
    half_down,
    half_up,
    bankers,
    never,
};

template <RoundType rt>
struct RT2T
{
    RoundType value = rt;
};

/* The sign of the exact quotient, which the truncated quotient loses when it
 * is zero. */
template <typename T> inline bool
quotient_is_negative (T num, T den, T rem)
{
    if (num != 0)
        return num < 0;
    return (rem < 0) != (den < 0);
}

/* One unit further from zero than the truncated quotient. */
template <typename T> inline T
step_away_from_zero (T num, T den, T rem)
{
    return quotient_is_negative (num, den, rem) ? num - 1 : num + 1;
}

/* Compares twice the remainder with the divisor: <0 below half, 0 exactly
 * half, >0 above half. */
template <typename T> inline int
compare_to_half (T den, T rem)
{
    auto twice = std::abs (rem) * 2;
    auto whole = std::abs (den);
    return twice < whole ? -1 : (twice == whole ? 0 : 1);
}

template <typename T> inline T
round (T num, T den, T rem, RT2T<RoundType::never>)
{
    if (rem == 0)
        return num;
    throw std::domain_error ("Rounding required when 'never round' specified.");
}

template <typename T> inline T
round (T num, T den, T rem, RT2T<RoundType::floor>)
{
    if (rem != 0 && quotient_is_negative (num, den, rem))
        return num - 1;
    return num;
}

template <typename T> inline T
round (T num, T den, T rem, RT2T<RoundType::ceiling>)
{
    if (rem != 0 && !quotient_is_negative (num, den, rem))
        return num + 1;
    return num;
}

template <typename T> inline T
round (T num, T, T, RT2T<RoundType::truncate>)
{
    return num;
}

template <typename T> inline T
round (T num, T den, T rem, RT2T<RoundType::promote>)
{
    return rem == 0 ? num : step_away_from_zero (num, den, rem);
}

template <typename T> inline T
round (T num, T den, T rem, RT2T<RoundType::half_down>)
{
    if (rem != 0 && compare_to_half (den, rem) > 0)
        return step_away_from_zero (num, den, rem);
    return num;
}

/* Half away from zero: this is the policy of the ledger's cent codec. */
template <typename T> inline T
round (T num, T den, T rem, RT2T<RoundType::half_up>)
{
    if (rem != 0 && compare_to_half (den, rem) >= 0)
        return step_away_from_zero (num, den, rem);
    return num;
}

template <typename T> inline T
round (T num, T den, T rem, RT2T<RoundType::bankers>)
{
    if (rem == 0)
        return num;
    auto half = compare_to_half (den, rem);
    if (half > 0 || (half == 0 && num % 2))
        return step_away_from_zero (num, den, rem);
    return num;
}

#endif //CB_RATIONAL_ROUNDING_HPP
