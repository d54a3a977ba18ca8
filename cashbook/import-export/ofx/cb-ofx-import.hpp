/********************************************************************
 * cb-ofx-import.hpp - OFX and QFX bank statements                 *
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

/** @file cb-ofx-import.hpp
 *  Statements in OFX (and Quicken's QFX flavour of it) are read without a
 *  full SGML or XML parser: the values used are all leaf elements, written
 *  as <TAG>value on a line of their own, and the transactions are
 *  the <STMTTRN> aggregates, which are always closed.
 */

#ifndef CB_OFX_IMPORT_HPP
#define CB_OFX_IMPORT_HPP

#include <optional>
#include <string>

#include "cb-import-tx.hpp"

/** The first value of leaf element @a tag in @a text, trimmed; nullopt if
 * there's none or it's empty. Tag names are matched case insensitively. */
std::optional<std::string> cb_ofx_tag_value (const std::string& text,
                                             const std::string& tag);

/** Parse an OFX/QFX statement.
 *
 * Every STMTTRN with a date (DTPOSTED, else DTAVAIL) and an amount
 * (TRNAMT) yields a row; its description is NAME, else MEMO, and its
 * online id FITID. The account hint is "BANKID ACCTID ACCTTYPE", leaving
 * out the missing ones. The result's format is "ofx".
 */
CbImportResult cb_ofx_parse (const std::string& text);

#endif
