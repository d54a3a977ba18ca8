/********************************************************************
 * cb-book.hpp - the in-memory ledger                              *
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


#ifndef CB_BOOK_HPP
#define CB_BOOK_HPP

#include <map>
#include <string>
#include <vector>

#include "Account.hpp"
#include "Transaction.hpp"

/** A parsed ledger: its accounts (a tree through Account::parent) and its
 * transactions, in document order.
 *
 * Books handed out by the backend are immutable snapshots; a write to the
 * ledger produces a new book on the next load rather than changing an
 * existing one.
 */
struct LedgerBook
{
    std::string book_id;
    std::vector<Account> accounts;
    std::vector<Transaction> transactions;
    /** The gnc:count-data counters as read, keyed by cd:type. */
    std::map<std::string, int64_t> counts;

    const Account* find_account(const std::string& id) const;
    /** The first account named @a name, optionally restricted to the children
     * of @a parent. */
    const Account* find_account_by_name(const std::string& name,
                                        const std::string& parent = {}) const;
    const Transaction* find_transaction(const std::string& id) const;
    /** True if any split references account @a id. */
    bool account_in_use(const std::string& id) const;
    /** The ROOT account, nullptr if the book has no accounts. */
    const Account* root() const;
    /** The colon separated path from the top level down to @a id, leaving out
     * the root, e.g. "Expenses:Groceries". */
    std::string full_name(const std::string& id) const;
    /** The ids of the direct children of @a id. */
    std::vector<std::string> children(const std::string& id) const;
    /** The sum of the values of the splits on account @a id. */
    CbNumeric balance(const std::string& id) const;

    /** Check the account tree: parents exist, no cycles, and exactly one ROOT
     * when there are accounts.
     * @exception CbParseError describing the first violation.
     */
    void validate_tree() const;
};

#endif // CB_BOOK_HPP
