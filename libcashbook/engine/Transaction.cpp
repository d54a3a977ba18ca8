/********************************************************************
 * Transaction.cpp - transactions and their splits                 *
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


#include <algorithm>
#include <tuple>

#include "Transaction.hpp"
#include "guid.hpp"

bool
cb_split_reconcile_state_is_valid (char state)
{
    switch (state)
    {
    case NREC:
    case CREC:
    case YREC:
    case FREC:
    case VREC:
        return true;
    default:
        return false;
    }
}

bool
operator==(const Split& a, const Split& b)
{
    return std::tie(a.id, a.account, a.value, a.quantity, a.reconciled,
                    a.reconcile_date, a.memo, a.action, a.online_id, a.lot,
                    a.other_slots) ==
        std::tie(b.id, b.account, b.value, b.quantity, b.reconciled,
                 b.reconcile_date, b.memo, b.action, b.online_id, b.lot,
                 b.other_slots);
}

CbNumeric
Transaction::imbalance() const
{
    CbNumeric sum;
    for (const auto& split : splits)
        sum += split.value;
    return sum;
}

const Split*
Transaction::find_split(const std::string& split_id) const
{
    auto iter = std::find_if(splits.begin(), splits.end(),
                             [&split_id](const Split& s)
                             { return s.id == split_id; });
    return iter == splits.end() ? nullptr : &*iter;
}

bool
operator==(const Transaction& a, const Transaction& b)
{
    return std::tie(a.id, a.currency, a.num, a.date_posted, a.date_entered,
                    a.description, a.notes, a.splits, a.other_slots) ==
        std::tie(b.id, b.currency, b.num, b.date_posted, b.date_entered,
                 b.description, b.notes, b.splits, b.other_slots);
}

Split
cb_split_create (const std::string& account, CbNumeric value)
{
    Split split;
    split.id = cb_guid_new_string ();
    split.account = account;
    split.value = value;
    split.quantity = value;
    return split;
}
