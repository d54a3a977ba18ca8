/********************************************************************
 * import-backend.cpp - finding imported rows already in the ledger*
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


#include <glib.h>
#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>

#include "import-backend.hpp"
#include "guid.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_IMPORT;

std::string
cb_normalize_online_id (const std::string& online_id)
{
    static const boost::regex zero_fraction ("\\.0+$");
    return boost::regex_replace (boost::trim_copy (online_id), zero_fraction, "");
}

std::string
cb_fuzzy_description (const std::string& description, std::size_t prefix)
{
    std::string fuzzy;
    for (auto c : description)
    {
        if (fuzzy.size() >= prefix)
            break;
        /* Bytes of multibyte characters are kept as they are. */
        if (static_cast<unsigned char>(c) >= 0x80)
            fuzzy += c;
        else if (g_ascii_isalnum (c))
            fuzzy += g_ascii_tolower (c);
    }
    return fuzzy;
}

std::string
cb_fuzzy_key (const CbDate& date, const CbNumeric& amount,
              const std::string& description, std::size_t prefix)
{
    return date.iso() + "|" + amount.abs().to_decimal_string (2) + "|" +
        cb_fuzzy_description (description, prefix);
}

/* One normalized description starts the other. Empty ones only match each
 * other. */
static bool
descriptions_match (const std::string& a, const std::string& b)
{
    if (a.empty() || b.empty())
        return a.empty() && b.empty();
    return boost::starts_with (a, b) || boost::starts_with (b, a);
}

std::string
CbDuplicateIndex::date_amount_key (const CbDate& date, const CbNumeric& amount)
{
    return date.iso() + "|" + amount.abs().to_decimal_string (2);
}

CbDuplicateIndex::CbDuplicateIndex (const LedgerBook& book,
                                    const std::string& target_account,
                                    int date_window, std::size_t prefix) :
    m_date_window{date_window < 0 ? 0 : date_window}, m_prefix{prefix}
{
    for (const auto& trans : book.transactions)
        for (const auto& split : trans.splits)
        {
            if (split.online_id)
            {
                auto id = cb_normalize_online_id (*split.online_id);
                if (!id.empty())
                    m_online_ids.insert (id);
            }
            if (target_account.empty() || split.account == target_account)
                add_split (trans, split);
        }
    DEBUG ("%zu online ids, %zu fuzzy keys", m_online_ids.size(), m_fuzzy.size());
}

void
CbDuplicateIndex::add_split (const Transaction& trans, const Split& split)
{
    auto desc = cb_fuzzy_description (trans.description, m_prefix);
    for (auto offset = -m_date_window; offset <= m_date_window; ++offset)
        m_fuzzy.emplace (date_amount_key (trans.date_posted.offset_days (offset),
                                          split.value),
                         desc);
}

bool
CbDuplicateIndex::online_id_exists (const std::string& online_id) const
{
    auto id = cb_normalize_online_id (online_id);
    return !id.empty() && m_online_ids.count (id) > 0;
}

bool
CbDuplicateIndex::fuzzy_match (const CbImportRow& row) const
{
    auto desc = cb_fuzzy_description (row.description, m_prefix);
    auto range = m_fuzzy.equal_range (date_amount_key (row.date, row.amount));
    for (auto it = range.first; it != range.second; ++it)
        if (descriptions_match (it->second, desc))
            return true;
    return false;
}

bool
CbDuplicateIndex::is_duplicate (const CbImportRow& row) const
{
    if (online_id_exists (row.online_id))
    {
        DEBUG ("online id %s exists", row.online_id.c_str());
        return true;
    }
    if (fuzzy_match (row))
    {
        DEBUG ("%s matches an existing split",
               cb_fuzzy_key (row.date, row.amount, row.description,
                             m_prefix).c_str());
        return true;
    }
    return false;
}

std::vector<CbImportRow>
cb_reconcile_duplicates (std::vector<CbImportRow> rows, const LedgerBook& book,
                         const std::string& target_account, int date_window,
                         std::size_t prefix)
{
    ENTER ("%zu rows, target '%s'", rows.size(), target_account.c_str());
    CbDuplicateIndex index{book, target_account, date_window, prefix};
    auto duplicates = 0;
    for (auto& row : rows)
    {
        row.is_duplicate = index.is_duplicate (row);
        if (row.is_duplicate)
            ++duplicates;
    }
    LEAVE ("%d duplicates", duplicates);
    return rows;
}

const Account*
cb_import_offset_account (const LedgerBook& book)
{
    static const boost::regex imbalance ("imbalance", boost::regex::icase);

    auto default_name = "Imbalance-" + cb_default_currency.id;

    /* Placeholders hold no splits, so they are never an offset. */
    for (const auto& acc : book.accounts)
        if (acc.name == default_name && !acc.placeholder)
            return &acc;
    for (const auto& acc : book.accounts)
        if (boost::regex_search (acc.name, imbalance) && !acc.placeholder)
            return &acc;
    for (const auto& acc : book.accounts)
        if (acc.type == ACCT_TYPE_EQUITY && !acc.placeholder)
            return &acc;
    return nullptr;
}

Transaction
cb_import_row_to_transaction (const CbImportRow& row,
                              const std::string& target_account,
                              const std::string& offset_account)
{
    Transaction trans;
    trans.id = cb_guid_new_string ();
    trans.currency = cb_default_currency;
    trans.date_posted = row.date;
    trans.date_entered = CbDate{};
    trans.description = row.description;
    trans.notes = row.memo;

    auto amount = cb_numeric_round_cents (row.amount);
    auto target = cb_split_create (target_account, amount);
    target.memo = row.memo;
    if (!row.online_id.empty())
        target.online_id = row.online_id;
    trans.splits.push_back (std::move (target));
    trans.splits.push_back (cb_split_create (offset_account, -amount));
    return trans;
}
