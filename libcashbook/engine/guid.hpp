/********************************************************************
 * guid.hpp - globally unique identifiers for ledger entities      *
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


#ifndef CB_GUID_HPP
#define CB_GUID_HPP

#include <boost/uuid/uuid.hpp>
#include <stdexcept>
#include <string>

namespace cashbook {
struct guid_syntax_exception : public std::invalid_argument
{
    guid_syntax_exception () noexcept;
};

/** A 128 bit identifier, written in the ledger as 32 lowercase hex digits
 * without separators. Identifiers read from files are kept as plain strings;
 * this class only creates and validates them. */
struct GUID
{
    private:
    boost::uuids::uuid implementation;

    public:
    GUID (boost::uuids::uuid const &) noexcept;
    GUID (GUID const &) noexcept = default;
    GUID () noexcept = default;
    GUID & operator = (GUID const &) noexcept = default;

    static GUID create_random () noexcept;
    static GUID const & null_guid () noexcept;
    /** @exception guid_syntax_exception if @a str isn't a guid. */
    static GUID from_string (std::string const & str);
    static bool is_valid_guid (std::string const & str);
    std::string to_string () const noexcept;
    friend bool operator == (GUID const &, GUID const &) noexcept;
};

bool operator == (GUID const &, GUID const &) noexcept;
bool operator != (GUID const &, GUID const &) noexcept;

}

/** A fresh random guid in ledger form. */
std::string cb_guid_new_string ();

#endif
