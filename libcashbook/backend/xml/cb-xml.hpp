/********************************************************************
 * cb-xml.hpp -- xml conversions of the ledger entities            *
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


#ifndef CB_XML_HPP
#define CB_XML_HPP

#include <libxml/tree.h>
#include <optional>
#include <string>

#include "Account.hpp"
#include "Transaction.hpp"

extern const char* account_version_string;
extern const char* transaction_version_string;

/** Build a <gnc:account version="2.0.0"> element. The caller owns the node. */
xmlNodePtr cb_account_dom_tree_create (const Account& act);
/** Read a <gnc:account> element.
 * @return nullopt, after logging why, if a required child is missing or
 * unreadable. */
std::optional<Account> dom_tree_to_account (xmlNodePtr node);
/** The text of cb_account_dom_tree_create()'s element, without a trailing
 * newline.
 * @exception CbWriteError if libxml2 can't serialize it. */
std::string cb_account_to_xml_string (const Account& act);

/** Build a <gnc:transaction version="2.0.0"> element. A transaction without
 * a date entered is stamped with the current date. The caller owns the
 * node. */
xmlNodePtr cb_transaction_dom_tree_create (const Transaction& trn);
/** Read a <gnc:transaction> element.
 * @return nullopt, after logging why, if a required child is missing or
 * unreadable. */
std::optional<Transaction> dom_tree_to_transaction (xmlNodePtr node);
/** The text of cb_transaction_dom_tree_create()'s element, without a
 * trailing newline.
 * @exception CbWriteError if libxml2 can't serialize it. */
std::string cb_transaction_to_xml_string (const Transaction& trn);

#endif /* CB_XML_HPP */
