/********************************************************************
 * Account.cpp - the ledger's account records                      *
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


#include <tuple>

#include "Account.hpp"
#include "guid.hpp"

const CbCommodityRef cb_default_currency {"CURRENCY", "USD"};

static const char* account_type_names[NUM_ACCOUNT_TYPES] =
{
    "BANK",
    "CASH",
    "ASSET",
    "CREDIT",
    "LIABILITY",
    "STOCK",
    "MUTUAL",
    "CURRENCY",
    "INCOME",
    "EXPENSE",
    "EQUITY",
    "RECEIVABLE",
    "PAYABLE",
    "ROOT",
    "TRADING",
};

const char*
cb_account_type_to_string (CbAccountType type)
{
    if (type < 0 || type >= NUM_ACCOUNT_TYPES)
        return "NONE";
    return account_type_names[type];
}

bool
cb_account_string_to_type (const std::string& str, CbAccountType* type)
{
    for (int i = 0; i < NUM_ACCOUNT_TYPES; ++i)
    {
        if (str == account_type_names[i])
        {
            *type = static_cast<CbAccountType>(i);
            return true;
        }
    }
    if (str == "NONE")
    {
        *type = ACCT_TYPE_NONE;
        return true;
    }
    return false;
}

bool
cb_account_type_is_debit_normal (CbAccountType type)
{
    switch (type)
    {
    case ACCT_TYPE_BANK:
    case ACCT_TYPE_CASH:
    case ACCT_TYPE_ASSET:
    case ACCT_TYPE_STOCK:
    case ACCT_TYPE_MUTUAL:
    case ACCT_TYPE_CURRENCY:
    case ACCT_TYPE_EXPENSE:
    case ACCT_TYPE_RECEIVABLE:
    case ACCT_TYPE_TRADING:
        return true;
    default:
        return false;
    }
}

bool
operator==(const Account& a, const Account& b)
{
    return std::tie(a.id, a.name, a.type, a.parent, a.code, a.description,
                    a.commodity, a.commodity_scu, a.placeholder, a.hidden,
                    a.other_slots) ==
        std::tie(b.id, b.name, b.type, b.parent, b.code, b.description,
                 b.commodity, b.commodity_scu, b.placeholder, b.hidden,
                 b.other_slots);
}

Account
cb_account_create (const std::string& name, CbAccountType type,
                   std::optional<std::string> parent)
{
    Account acc;
    acc.id = cb_guid_new_string ();
    acc.name = name;
    acc.type = type;
    acc.parent = std::move (parent);
    if (type != ACCT_TYPE_ROOT)
    {
        acc.commodity = cb_default_currency;
        acc.commodity_scu = 100;
    }
    return acc;
}
