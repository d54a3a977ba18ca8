/********************************************************************
 * io-cbxml-v2.hpp -- reading and writing whole version 2 ledgers  *
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

/**
 * @file io-cbxml-v2.hpp
 * @brief api for the GnuCash version 2 XML file format
 */

#ifndef IO_CBXML_V2_HPP
#define IO_CBXML_V2_HPP

#include <string>

#include "cb-book.hpp"

/** Parse a decompressed ledger document.
 *
 * Only the direct children of <gnc:book> are read: the book id, the
 * count-data counters, accounts and transactions. Commodities, prices,
 * scheduled transactions and their templates are left to the file.
 *
 * @exception CbParseError if the text isn't well-formed XML, has no book, an
 * account or transaction can't be read, or the account tree is invalid.
 */
LedgerBook cb_xml_read_book (const std::string& text);

/** Serialize a complete document for @a book: the XML declaration, the
 * gnc-v2 root with its namespace declarations, the book with its counters,
 * the default currency, the accounts and the transactions. */
std::string cb_xml_book_to_string (const LedgerBook& book);

/** Write the namespace declaration for @a ns within the GnuCash namespace at
 * http://www.gnucash.org/XML. */
std::string cb_xml2_namespace_decl (const char* ns);

#endif /* IO_CBXML_V2_HPP */
