/********************************************************************
 * Transaction.hpp - transactions and their splits                 *
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


#ifndef CB_TRANSACTION_HPP
#define CB_TRANSACTION_HPP

#include <optional>
#include <string>
#include <vector>

#include "Account.hpp"
#include "cb-datetime.hpp"
#include "cb-numeric.hpp"
#include "kvp-slot.hpp"

/** @name Split reconciled states
 * @{ */
#define CREC 'c'              /**< The Split has been cleared    */
#define YREC 'y'              /**< The Split has been reconciled */
#define FREC 'f'              /**< frozen into accounting period */
#define NREC 'n'              /**< not reconciled or cleared     */
#define VREC 'v'              /**< split is void                 */
/** @} */

/** True if @a state is one of the reconciled-state letters above. */
bool cb_split_reconcile_state_is_valid (char state);

/** One leg of a transaction.
 *
 * The value is in the transaction's currency. Its sign follows the ledger
 * convention: a positive value debits the account, so it raises the balance
 * of debit-normal accounts and lowers the balance of credit-normal ones.
 */
struct Split
{
    std::string id;
    std::string account;
    CbNumeric value;
    /** Equal to value unless the account's commodity differs from the
     * transaction currency. */
    CbNumeric quantity;
    char reconciled = NREC;
    std::optional<CbDate> reconcile_date;
    std::string memo;
    std::string action;
    /** The bank's id for the transaction this split was imported from. */
    std::optional<std::string> online_id;
    /** The guid of the lot holding this split, empty if none. */
    std::string lot;
    KvpSlots other_slots;
};

bool operator==(const Split& a, const Split& b);
inline bool operator!=(const Split& a, const Split& b) { return !(a == b); }

struct Transaction
{
    std::string id;
    CbCommodityRef currency = cb_default_currency;
    std::string num;
    CbDate date_posted;
    /** Absent if the file doesn't record it; the writer then stamps the
     * current time. */
    std::optional<CbDate> date_entered;
    std::string description;
    std::string notes;
    std::vector<Split> splits;
    KvpSlots other_slots;

    /** The sum of the split values. Zero for a balanced transaction, but
     * nothing requires it to be. */
    CbNumeric imbalance() const;
    const Split* find_split(const std::string& split_id) const;
};

bool operator==(const Transaction& a, const Transaction& b);
inline bool operator!=(const Transaction& a, const Transaction& b) { return !(a == b); }

/** A split with a fresh id whose quantity equals @a value. */
Split cb_split_create (const std::string& account, CbNumeric value);

#endif // CB_TRANSACTION_HPP
