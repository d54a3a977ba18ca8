/********************************************************************
 * cb-book.cpp - the in-memory ledger                              *
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
#include <set>

#include "cb-book.hpp"
#include "cb-errors.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_ENGINE;

const Account*
LedgerBook::find_account(const std::string& id) const
{
    auto iter = std::find_if(accounts.begin(), accounts.end(),
                             [&id](const Account& a) { return a.id == id; });
    return iter == accounts.end() ? nullptr : &*iter;
}

const Account*
LedgerBook::find_account_by_name(const std::string& name,
                                 const std::string& parent) const
{
    auto iter = std::find_if(accounts.begin(), accounts.end(),
                             [&name, &parent](const Account& a)
                             {
                                 return a.name == name &&
                                     (parent.empty() || a.parent == parent);
                             });
    return iter == accounts.end() ? nullptr : &*iter;
}

const Transaction*
LedgerBook::find_transaction(const std::string& id) const
{
    auto iter = std::find_if(transactions.begin(), transactions.end(),
                             [&id](const Transaction& t) { return t.id == id; });
    return iter == transactions.end() ? nullptr : &*iter;
}

bool
LedgerBook::account_in_use(const std::string& id) const
{
    return std::any_of(transactions.begin(), transactions.end(),
                       [&id](const Transaction& t)
                       {
                           return std::any_of(t.splits.begin(), t.splits.end(),
                                              [&id](const Split& s)
                                              { return s.account == id; });
                       });
}

const Account*
LedgerBook::root() const
{
    auto iter = std::find_if(accounts.begin(), accounts.end(),
                             [](const Account& a)
                             { return a.type == ACCT_TYPE_ROOT; });
    return iter == accounts.end() ? nullptr : &*iter;
}

std::string
LedgerBook::full_name(const std::string& id) const
{
    std::string name;
    std::set<std::string> seen;
    auto acc = find_account(id);
    while (acc && acc->type != ACCT_TYPE_ROOT && seen.insert(acc->id).second)
    {
        name = name.empty() ? acc->name : acc->name + ":" + name;
        acc = acc->parent ? find_account(*acc->parent) : nullptr;
    }
    return name;
}

std::vector<std::string>
LedgerBook::children(const std::string& id) const
{
    std::vector<std::string> kids;
    for (const auto& acc : accounts)
        if (acc.parent == id)
            kids.push_back(acc.id);
    return kids;
}

CbNumeric
LedgerBook::balance(const std::string& id) const
{
    CbNumeric sum;
    for (const auto& trans : transactions)
        for (const auto& split : trans.splits)
            if (split.account == id)
                sum += split.value;
    return sum;
}

void
LedgerBook::validate_tree() const
{
    int roots = 0;
    for (const auto& acc : accounts)
    {
        if (acc.type == ACCT_TYPE_ROOT)
            ++roots;
        if (acc.parent && !find_account(*acc.parent))
            throw CbParseError("Account " + acc.id + " (" + acc.name +
                               ") has a nonexistent parent " + *acc.parent);

        std::set<std::string> chain{acc.id};
        auto parent = acc.parent ? find_account(*acc.parent) : nullptr;
        while (parent)
        {
            if (!chain.insert(parent->id).second)
                throw CbParseError("Account " + acc.id +
                                   " is part of a parent cycle");
            parent = parent->parent ? find_account(*parent->parent) : nullptr;
        }
    }
    if (!accounts.empty() && roots != 1)
        throw CbParseError("The book has " + std::to_string(roots) +
                           " root accounts");
    DEBUG("account tree of %zu accounts is valid", accounts.size());
}
