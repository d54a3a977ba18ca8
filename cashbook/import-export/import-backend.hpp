/********************************************************************
 * import-backend.hpp - finding imported rows already in the ledger*
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

/** @file import-backend.hpp
 *  An imported row is taken for one already in the ledger when
 *  @li its online id (the bank's FITID) equals that of a split in the
 *      ledger, once both are normalized, or
 *  @li a split, of the target account when one is given, has the same
 *      absolute amount to the cent, a transaction date within the date
 *      window of the row's, and a description whose normalized prefix
 *      starts the row's or is started by it.
 *
 *  Banks change the id format or append reference text to descriptions, and
 *  credit card exports date rows by transaction date while the ledger has
 *  the posting date; hence the looser second rule. Either rule can be wrong
 *  both ways, so the result is a suggestion to be confirmed per row.
 */

#ifndef IMPORT_BACKEND_HPP
#define IMPORT_BACKEND_HPP

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "cb-book.hpp"
#include "cb-imp-props-tx.hpp"

#define CB_IMPORT_DATE_WINDOW 1
#define CB_IMPORT_DESCRIPTION_PREFIX 20

/** Trim @a online_id and drop a ".000..." suffix, which some exporters add
 * to numeric ids: "1234.000000" becomes "1234". */
std::string cb_normalize_online_id (const std::string& online_id);

/** Lower case, letters and digits only, at most @a prefix characters. */
std::string cb_fuzzy_description (const std::string& description,
                                  std::size_t prefix = CB_IMPORT_DESCRIPTION_PREFIX);

/** "YYYY-MM-DD|absolute amount to 2 places|fuzzy description". */
std::string cb_fuzzy_key (const CbDate& date, const CbNumeric& amount,
                          const std::string& description,
                          std::size_t prefix = CB_IMPORT_DESCRIPTION_PREFIX);

class CbDuplicateIndex
{
public:
    /** Index the splits of @a book. Fuzzy matching is restricted to the
     * splits of @a target_account unless it's empty. */
    explicit CbDuplicateIndex (const LedgerBook& book,
                               const std::string& target_account = {},
                               int date_window = CB_IMPORT_DATE_WINDOW,
                               std::size_t prefix = CB_IMPORT_DESCRIPTION_PREFIX);

    bool is_duplicate (const CbImportRow& row) const;
    bool online_id_exists (const std::string& online_id) const;
    bool fuzzy_match (const CbImportRow& row) const;

private:
    void add_split (const Transaction& trans, const Split& split);
    static std::string date_amount_key (const CbDate& date,
                                        const CbNumeric& amount);

    int m_date_window;
    std::size_t m_prefix;
    std::unordered_set<std::string> m_online_ids;
    /* date|amount, for every day of the window, to fuzzy descriptions */
    std::unordered_multimap<std::string, std::string> m_fuzzy;
};

/** The account an imported row is balanced against when the caller names
 * none: Imbalance-USD, else the first account whose name contains
 * "imbalance" in any case, else the first EQUITY account that is not a
 * placeholder. nullptr if there is none of these. */
const Account* cb_import_offset_account (const LedgerBook& book);

/** A new transaction for @a row: a split of the row's amount on
 * @a target_account carrying its online id and memo, balanced by a split on
 * @a offset_account. The memo also goes to the notes. */
Transaction cb_import_row_to_transaction (const CbImportRow& row,
                                          const std::string& target_account,
                                          const std::string& offset_account);

/** Set is_duplicate on each of @a rows against @a book. */
std::vector<CbImportRow> cb_reconcile_duplicates (std::vector<CbImportRow> rows,
                                                  const LedgerBook& book,
                                                  const std::string& target_account = {},
                                                  int date_window = CB_IMPORT_DATE_WINDOW,
                                                  std::size_t prefix = CB_IMPORT_DESCRIPTION_PREFIX);

#endif
