/********************************************************************
 * gtest-import-backend.cpp - finding imported rows already in the ledger*
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


#include <gtest/gtest.h>

#include "../import-backend.hpp"

static CbImportRow
make_row (const std::string& online_id, CbDate date, const std::string& description,
          CbNumeric amount)
{
    CbImportRow row;
    row.online_id = online_id;
    row.date = date;
    row.description = description;
    row.amount = amount;
    return row;
}

class ImportBackendTest : public ::testing::Test
{
protected:
    ImportBackendTest ()
    {
        auto root = cb_account_create ("Root Account", ACCT_TYPE_ROOT, std::nullopt);
        auto assets = cb_account_create ("Assets", ACCT_TYPE_ASSET, root.id);
        assets.placeholder = true;
        m_checking = cb_account_create ("Checking Account", ACCT_TYPE_BANK, assets.id);
        m_savings = cb_account_create ("Savings Account", ACCT_TYPE_BANK, assets.id);
        m_groceries = cb_account_create ("Groceries", ACCT_TYPE_EXPENSE, root.id);
        auto equity = cb_account_create ("Equity", ACCT_TYPE_EQUITY, root.id);
        equity.placeholder = true;
        m_imbalance = cb_account_create ("Imbalance-USD", ACCT_TYPE_EQUITY, equity.id);
        m_book.accounts = {root, assets, m_checking, m_savings, m_groceries, equity,
                           m_imbalance};

        Transaction trans;
        trans.id = "0123456789abcdef0123456789abcdef";
        trans.date_posted = CbDate (2024, 3, 10);
        trans.description = "TRADER JOES #123 PORTLAND OR";
        auto bank = cb_split_create (m_checking.id, CbNumeric (-4250, 100));
        bank.online_id = "1234.000000";
        trans.splits = {bank, cb_split_create (m_groceries.id, CbNumeric (4250, 100))};
        m_book.transactions.push_back (trans);
    }

    LedgerBook m_book;
    Account m_checking;
    Account m_savings;
    Account m_groceries;
    Account m_imbalance;
};

TEST(ImportBackend, NormalizeOnlineId)
{
    EXPECT_EQ ("1234", cb_normalize_online_id (" 1234.000000 "));
    EXPECT_EQ ("1234", cb_normalize_online_id ("1234.0"));
    EXPECT_EQ ("1234.50", cb_normalize_online_id ("1234.50"));
    EXPECT_EQ ("ABC", cb_normalize_online_id ("ABC.00"));
    EXPECT_EQ ("", cb_normalize_online_id ("  "));
}

TEST(ImportBackend, FuzzyDescription)
{
    EXPECT_EQ ("traderjoes123", cb_fuzzy_description ("Trader Joe's #123"));
    EXPECT_EQ ("trader", cb_fuzzy_description ("Trader Joe's #123", 6));
    EXPECT_EQ ("traderjoes123portlan",
               cb_fuzzy_description ("TRADER JOES #123 PORTLAND OR"));
    EXPECT_EQ ("caf\xC3\xA9", cb_fuzzy_description ("Caf\xC3\xA9!"));
    EXPECT_EQ ("", cb_fuzzy_description ("--- ***"));
}

TEST(ImportBackend, FuzzyKey)
{
    EXPECT_EQ ("2024-03-10|42.50|traderjoes",
               cb_fuzzy_key (CbDate (2024, 3, 10), CbNumeric (-4250, 100),
                             "Trader Joe's"));
    EXPECT_EQ ("2024-03-10|7.00|", cb_fuzzy_key (CbDate (2024, 3, 10),
                                                 CbNumeric (7, 1), ""));
}

TEST_F(ImportBackendTest, OnlineIdMatch)
{
    CbDuplicateIndex index{m_book};
    EXPECT_TRUE (index.online_id_exists ("1234"));
    EXPECT_TRUE (index.online_id_exists ("1234.000000"));
    EXPECT_FALSE (index.online_id_exists ("12345"));
    EXPECT_FALSE (index.online_id_exists (""));

    /* Nothing else matches, the id alone makes it a duplicate. */
    EXPECT_TRUE (index.is_duplicate (make_row ("1234", CbDate (2023, 1, 1), "Other",
                                               CbNumeric (1, 1))));
}

TEST_F(ImportBackendTest, FuzzyMatch)
{
    CbDuplicateIndex index{m_book};
    /* Card exports date by transaction, the ledger has the posting date. */
    EXPECT_TRUE (index.fuzzy_match (make_row ("", CbDate (2024, 3, 9),
                                              "Trader Joe's #123",
                                              CbNumeric (-4250, 100))));
    EXPECT_TRUE (index.fuzzy_match (make_row ("", CbDate (2024, 3, 11),
                                              "TRADER JOES #123 PORTLAND OR 97201",
                                              CbNumeric (-4250, 100))));
    /* The amount is compared without its sign. */
    EXPECT_TRUE (index.fuzzy_match (make_row ("", CbDate (2024, 3, 10),
                                              "Trader Joes", CbNumeric (4250, 100))));

    EXPECT_FALSE (index.fuzzy_match (make_row ("", CbDate (2024, 3, 12),
                                               "Trader Joe's #123",
                                               CbNumeric (-4250, 100))));
    EXPECT_FALSE (index.fuzzy_match (make_row ("", CbDate (2024, 3, 10),
                                               "Trader Joe's #123",
                                               CbNumeric (-4251, 100))));
    EXPECT_FALSE (index.fuzzy_match (make_row ("", CbDate (2024, 3, 10),
                                               "Safeway", CbNumeric (-4250, 100))));
    EXPECT_FALSE (index.fuzzy_match (make_row ("", CbDate (2024, 3, 10), "",
                                               CbNumeric (-4250, 100))));
}

TEST_F(ImportBackendTest, DateWindow)
{
    auto row = make_row ("", CbDate (2024, 3, 13), "Trader Joe's",
                         CbNumeric (-4250, 100));
    EXPECT_FALSE (CbDuplicateIndex (m_book).is_duplicate (row));
    EXPECT_TRUE (CbDuplicateIndex (m_book, "", 3).is_duplicate (row));
    row.date = CbDate (2024, 3, 11);
    EXPECT_FALSE (CbDuplicateIndex (m_book, "", 0).is_duplicate (row));
    EXPECT_FALSE (CbDuplicateIndex (m_book, "", -2).is_duplicate (row));
}

TEST_F(ImportBackendTest, TargetAccount)
{
    auto row = make_row ("", CbDate (2024, 3, 10), "Trader Joe's",
                         CbNumeric (-4250, 100));
    EXPECT_TRUE (CbDuplicateIndex (m_book, m_checking.id).is_duplicate (row));
    EXPECT_FALSE (CbDuplicateIndex (m_book, m_savings.id).is_duplicate (row));
    /* Online ids are matched across all accounts. */
    row.online_id = "1234";
    EXPECT_TRUE (CbDuplicateIndex (m_book, m_savings.id).is_duplicate (row));
}

TEST_F(ImportBackendTest, ReconcileDuplicates)
{
    std::vector<CbImportRow> rows {
        make_row ("1234.000000", CbDate (2024, 3, 10), "TRADER JOES #123",
                  CbNumeric (-4250, 100)),
        make_row ("", CbDate (2024, 3, 11), "Trader Joes #123",
                  CbNumeric (-4250, 100)),
        make_row ("9999", CbDate (2024, 3, 10), "Trader Joes #123",
                  CbNumeric (-4251, 100)),
        make_row ("", CbDate (2024, 3, 14), "Powell's Books",
                  CbNumeric (-1999, 100)),
    };
    rows[2].is_duplicate = true;

    auto result = cb_reconcile_duplicates (rows, m_book, m_checking.id);
    ASSERT_EQ (rows.size (), result.size ());
    EXPECT_TRUE (result[0].is_duplicate);
    EXPECT_TRUE (result[1].is_duplicate);
    EXPECT_FALSE (result[2].is_duplicate);
    EXPECT_FALSE (result[3].is_duplicate);
    EXPECT_EQ (rows[3].description, result[3].description);

    /* A short prefix makes unrelated descriptions alike. */
    result = cb_reconcile_duplicates (rows, m_book, {}, 1, 1);
    EXPECT_FALSE (result[3].is_duplicate);
    rows[3] = make_row ("", CbDate (2024, 3, 10), "Tacos", CbNumeric (-4250, 100));
    result = cb_reconcile_duplicates (rows, m_book, {}, 1, 1);
    EXPECT_TRUE (result[3].is_duplicate);

    EXPECT_TRUE (cb_reconcile_duplicates ({}, m_book).empty ());
}

TEST_F(ImportBackendTest, OffsetAccount)
{
    ASSERT_NE (nullptr, cb_import_offset_account (m_book));
    EXPECT_EQ (m_imbalance.id, cb_import_offset_account (m_book)->id);

    auto book = m_book;
    book.accounts.back ().name = "Orphan-IMBALANCE";
    EXPECT_EQ (m_imbalance.id, cb_import_offset_account (book)->id);

    book.accounts.back ().name = "Opening Balances";
    EXPECT_EQ (m_imbalance.id, cb_import_offset_account (book)->id);

    book.accounts.back ().placeholder = true;
    EXPECT_EQ (nullptr, cb_import_offset_account (book));
}

TEST_F(ImportBackendTest, OffsetAccountSkipsPlaceholders)
{
    auto book = m_book;
    book.accounts.back ().placeholder = true;
    auto opening = cb_account_create ("Opening Balances", ACCT_TYPE_EQUITY,
                                      book.accounts.back ().parent);
    book.accounts.push_back (opening);
    ASSERT_NE (nullptr, cb_import_offset_account (book));
    EXPECT_EQ (opening.id, cb_import_offset_account (book)->id);

    auto group = cb_account_create ("Imbalance", ACCT_TYPE_EQUITY,
                                    book.accounts.front ().id);
    group.placeholder = true;
    book.accounts.insert (book.accounts.begin () + 1, group);
    EXPECT_EQ (opening.id, cb_import_offset_account (book)->id);

    auto orphan = cb_account_create ("Orphan-Imbalance", ACCT_TYPE_EQUITY,
                                     group.id);
    book.accounts.push_back (orphan);
    EXPECT_EQ (orphan.id, cb_import_offset_account (book)->id);
}

TEST_F(ImportBackendTest, RowToTransaction)
{
    auto row = make_row ("1234", CbDate (2024, 3, 10), "Trader Joe's",
                         CbNumeric (-12, 7));
    row.memo = "weekly";
    auto trans = cb_import_row_to_transaction (row, m_checking.id, m_imbalance.id);

    EXPECT_EQ (32u, trans.id.size ());
    EXPECT_EQ (cb_default_currency, trans.currency);
    EXPECT_EQ ("2024-03-10", trans.date_posted.iso ());
    EXPECT_TRUE (trans.date_entered);
    EXPECT_EQ ("Trader Joe's", trans.description);
    EXPECT_EQ ("weekly", trans.notes);
    ASSERT_EQ (2u, trans.splits.size ());

    const auto& target = trans.splits[0];
    EXPECT_EQ (m_checking.id, target.account);
    EXPECT_EQ ((CbNumeric {-171, 100}), target.value);
    EXPECT_EQ (target.value, target.quantity);
    EXPECT_EQ ("1234", target.online_id.value_or (""));
    EXPECT_EQ ("weekly", target.memo);
    EXPECT_EQ (NREC, target.reconciled);

    const auto& offset = trans.splits[1];
    EXPECT_EQ (m_imbalance.id, offset.account);
    EXPECT_EQ ((CbNumeric {171, 100}), offset.value);
    EXPECT_FALSE (offset.online_id);
    EXPECT_TRUE (trans.imbalance ().is_zero ());
    EXPECT_NE (target.id, offset.id);

    row.online_id.clear ();
    EXPECT_FALSE (cb_import_row_to_transaction (row, m_checking.id,
                                                m_imbalance.id).splits[0].online_id);
}
