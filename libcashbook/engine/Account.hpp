/********************************************************************
 * Account.hpp - the ledger's account records                      *
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


#ifndef CB_ACCOUNT_HPP
#define CB_ACCOUNT_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "kvp-slot.hpp"

/** The account types. The names returned by cb_account_type_to_string() are
 * the ones stored in act:type. */
typedef enum
{
    ACCT_TYPE_INVALID = -1,
    ACCT_TYPE_NONE = -1,
    ACCT_TYPE_BANK = 0,     /**< checking or savings */
    ACCT_TYPE_CASH = 1,
    ACCT_TYPE_ASSET = 2,
    ACCT_TYPE_CREDIT = 3,   /**< credit card */
    ACCT_TYPE_LIABILITY = 4,
    ACCT_TYPE_STOCK = 5,
    ACCT_TYPE_MUTUAL = 6,
    ACCT_TYPE_CURRENCY = 7,
    ACCT_TYPE_INCOME = 8,
    ACCT_TYPE_EXPENSE = 9,
    ACCT_TYPE_EQUITY = 10,
    ACCT_TYPE_RECEIVABLE = 11,
    ACCT_TYPE_PAYABLE = 12,
    ACCT_TYPE_ROOT = 13,    /**< the sentinel at the top of the tree */
    ACCT_TYPE_TRADING = 14,
    NUM_ACCOUNT_TYPES = 15,
} CbAccountType;

const char* cb_account_type_to_string (CbAccountType type);
/** @return false if @a str names no account type; @a type is then left
 * alone. */
bool cb_account_string_to_type (const std::string& str, CbAccountType* type);

/** True for the types whose balance rises with positive split values:
 * assets and expenses. Liabilities, income and equity rise with negative
 * values. */
bool cb_account_type_is_debit_normal (CbAccountType type);

/** A commodity reference such as {"CURRENCY", "USD"}. */
struct CbCommodityRef
{
    std::string space;
    std::string id;
};

inline bool operator==(const CbCommodityRef& a, const CbCommodityRef& b)
{
    return a.space == b.space && a.id == b.id;
}

inline bool operator!=(const CbCommodityRef& a, const CbCommodityRef& b)
{
    return !(a == b);
}

/** The commodity of new accounts and transactions. */
extern const CbCommodityRef cb_default_currency;

struct Account
{
    std::string id;
    std::string name;
    CbAccountType type = ACCT_TYPE_BANK;
    /** Absent for the root account. */
    std::optional<std::string> parent;
    std::string code;
    std::string description;
    /** Absent for the root account. */
    std::optional<CbCommodityRef> commodity;
    std::optional<int64_t> commodity_scu;
    /** Groups children; must not be referenced by splits. */
    bool placeholder = false;
    bool hidden = false;
    KvpSlots other_slots;
};

bool operator==(const Account& a, const Account& b);
inline bool operator!=(const Account& a, const Account& b) { return !(a == b); }

/** A new account with a fresh id, denominated in the default currency with a
 * smallest commodity unit of 1/100. */
Account cb_account_create (const std::string& name, CbAccountType type,
                           std::optional<std::string> parent);

#endif // CB_ACCOUNT_HPP
