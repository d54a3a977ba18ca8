/********************************************************************
 * gtest-cashbook-commands.cpp - the actions of cashbook-cli on a ledger*
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
#include <glib/gstdio.h>
#include <gtest/gtest.h>

#include <boost/algorithm/string.hpp>
#include <memory>
#include <string>

#include "../cashbook-commands.hpp"
#include "cb-config.hpp"
#include "cb-xml-backend.hpp"

using namespace Cashbook;

class CashbookCommandsTest : public ::testing::Test
{
protected:
    void SetUp () override
    {
        g_unsetenv ("CASHBOOK_FILE");
        g_unsetenv ("GNUCASH_FILE");
        m_dir = g_dir_make_tmp ("cashbook-cli-XXXXXX", nullptr);
        ASSERT_NE (nullptr, m_dir);
        m_ledger = path ("household.gnucash");
        m_config = std::make_unique<CbConfig> (path ("cashbook.conf"));
        ASSERT_EQ (0, new_book (m_ledger, *m_config));
    }

    void TearDown () override
    {
        auto dir = g_dir_open (m_dir, 0, nullptr);
        if (dir)
        {
            while (auto name = g_dir_read_name (dir))
                g_unlink (path (name).c_str ());
            g_dir_close (dir);
        }
        g_rmdir (m_dir);
        g_free (m_dir);
    }

    std::string path (const std::string& name) const
    {
        return std::string{m_dir} + "/" + name;
    }

    std::string write_statement (const std::string& name, const std::string& text)
    {
        auto file = path (name);
        EXPECT_TRUE (g_file_set_contents (file.c_str (), text.c_str (), -1, nullptr));
        return file;
    }

    std::shared_ptr<const LedgerBook> load ()
    {
        CbXmlBackend backend{m_ledger};
        return backend.load ();
    }

    gchar* m_dir = nullptr;
    std::string m_ledger;
    std::unique_ptr<CbConfig> m_config;
};

static const char* statement_csv =
    "Date,Description,Amount\n"
    "03/10/2024,TRADER JOES #123,-42.50\n"
    "03/11/2024,PAYROLL,1500.00\n";

TEST_F(CashbookCommandsTest, new_book)
{
    EXPECT_EQ (m_ledger, m_config->ledger_file ());
    CbConfig reread{path ("cashbook.conf")};
    EXPECT_TRUE (reread.load ());
    EXPECT_EQ (m_ledger, reread.ledger_file ());
    EXPECT_EQ (18u, load ()->accounts.size ());
    EXPECT_EQ (1, new_book (m_ledger, *m_config));
    EXPECT_EQ (1, new_book ("", *m_config));
}

TEST_F(CashbookCommandsTest, accounts)
{
    testing::internal::CaptureStdout ();
    EXPECT_EQ (0, add_account (m_ledger, *m_config, "Dining", "expense",
                               bo_str{"Expenses"}, false));
    auto id = testing::internal::GetCapturedStdout ();
    boost::algorithm::trim (id);
    auto book = load ();
    auto dining = book->find_account (id);
    ASSERT_NE (nullptr, dining);
    EXPECT_EQ (ACCT_TYPE_EXPENSE, dining->type);
    EXPECT_EQ ("Expenses:Dining", book->full_name (id));

    EXPECT_EQ (0, add_account (m_ledger, *m_config, "Travel", "EXPENSE",
                               bo_str{}, true));
    EXPECT_TRUE (load ()->find_account_by_name ("Travel")->placeholder);
    EXPECT_EQ (1, add_account (m_ledger, *m_config, "Gold", "bullion",
                               bo_str{}, false));
    EXPECT_EQ (1, add_account (m_ledger, *m_config, "Gold", "ASSET",
                               bo_str{"Nowhere"}, false));

    EXPECT_EQ (0, rename_account (m_ledger, *m_config, id, "Restaurants"));
    EXPECT_EQ ("Restaurants", load ()->find_account (id)->name);

    EXPECT_EQ (0, delete_account (m_ledger, *m_config, id));
    EXPECT_EQ (nullptr, load ()->find_account (id));
    EXPECT_EQ (1, delete_account (m_ledger, *m_config, id));
    EXPECT_EQ (1, delete_account (m_ledger, *m_config,
                                  load ()->find_account_by_name ("Assets")->id));

    testing::internal::CaptureStdout ();
    EXPECT_EQ (0, list_accounts (m_ledger));
    auto listing = testing::internal::GetCapturedStdout ();
    EXPECT_NE (std::string::npos, listing.find ("Checking Account"));
    EXPECT_EQ (std::string::npos, listing.find ("Restaurants"));
    EXPECT_EQ (1, list_accounts (""));
}

TEST_F(CashbookCommandsTest, import_and_recategorize)
{
    ImportOptions options;
    options.statement = write_statement ("activity.csv", statement_csv);
    options.target_account = std::string{"Assets:Checking Account"};

    testing::internal::CaptureStdout ();
    EXPECT_EQ (0, import_statement (m_ledger, *m_config, options));
    auto preview = testing::internal::GetCapturedStdout ();
    EXPECT_NE (std::string::npos, preview.find ("2 rows, 0 duplicates"));
    EXPECT_TRUE (load ()->transactions.empty ());

    options.commit = true;
    EXPECT_EQ (0, import_statement (m_ledger, *m_config, options));
    auto book = load ();
    ASSERT_EQ (2u, book->transactions.size ());
    auto checking = book->find_account_by_name ("Checking Account");
    EXPECT_EQ ("1457.50", book->balance (checking->id).to_decimal_string (2));
    EXPECT_EQ (2, book->counts.at ("transaction"));

    /* The same statement again adds nothing. */
    testing::internal::CaptureStdout ();
    EXPECT_EQ (0, import_statement (m_ledger, *m_config, options));
    auto again = testing::internal::GetCapturedStdout ();
    EXPECT_NE (std::string::npos, again.find ("[duplicate]"));
    EXPECT_EQ (2u, load ()->transactions.size ());

    /* Recategorize the grocery run. */
    const Transaction* groceries_run = nullptr;
    for (const auto& trn : book->transactions)
        if (trn.description == "TRADER JOES #123")
            groceries_run = &trn;
    ASSERT_NE (nullptr, groceries_run);
    auto imbalance = book->find_account_by_name ("Imbalance-USD");
    std::string split_id;
    for (const auto& split : groceries_run->splits)
        if (split.account == imbalance->id)
            split_id = split.id;
    ASSERT_FALSE (split_id.empty ());

    EXPECT_EQ (1, move_split (m_ledger, *m_config, split_id, "Expenses"));
    EXPECT_EQ (0, move_split (m_ledger, *m_config, split_id, "Expenses:Groceries"));
    auto groceries = load ()->find_account_by_name ("Groceries");
    EXPECT_EQ ("42.50", load ()->balance (groceries->id).to_decimal_string (2));
    EXPECT_EQ (1, move_split (m_ledger, *m_config, "no-such-split", "Groceries"));

    testing::internal::CaptureStdout ();
    EXPECT_EQ (0, change_log (m_ledger));
    auto history = testing::internal::GetCapturedStdout ();
    EXPECT_NE (std::string::npos, history.find ("Imbalance-USD -> Groceries"));
    EXPECT_NE (std::string::npos, history.find ("TRADER JOES #123"));

    EXPECT_EQ (1, delete_account (m_ledger, *m_config, groceries->id));
    EXPECT_EQ (0, delete_transaction (m_ledger, *m_config, groceries_run->id));
    EXPECT_EQ (1u, load ()->transactions.size ());
    EXPECT_EQ (1, delete_transaction (m_ledger, *m_config, groceries_run->id));
}

TEST_F(CashbookCommandsTest, import_needs_mapping)
{
    ImportOptions options;
    options.statement = write_statement ("odd.csv",
                                         "When,What,How much\n"
                                         "03/10/2024,Coffee,3.50\n");
    options.target_account = std::string{"Checking Account"};
    options.commit = true;

    testing::internal::CaptureStdout ();
    EXPECT_EQ (1, import_statement (m_ledger, *m_config, options));
    auto headers = testing::internal::GetCapturedStdout ();
    EXPECT_NE (std::string::npos, headers.find ("2: How much"));

    options.column_map = std::string{"0,1,x"};
    EXPECT_EQ (1, import_statement (m_ledger, *m_config, options));
    options.column_map = std::string{"0,1"};
    EXPECT_EQ (1, import_statement (m_ledger, *m_config, options));

    options.column_map = std::string{"0, 1, 2"};
    options.negate = true;
    options.offset_account = std::string{"Other Expenses"};
    EXPECT_EQ (0, import_statement (m_ledger, *m_config, options));
    auto book = load ();
    ASSERT_EQ (1u, book->transactions.size ());
    auto other = book->find_account_by_name ("Other Expenses");
    EXPECT_EQ ("3.50", book->balance (other->id).to_decimal_string (2));
}

TEST_F(CashbookCommandsTest, import_refusals)
{
    ImportOptions options;
    options.statement = write_statement ("activity.csv", statement_csv);
    options.commit = true;
    EXPECT_EQ (1, import_statement (m_ledger, *m_config, options));

    options.target_account = std::string{"Assets"};
    EXPECT_EQ (1, import_statement (m_ledger, *m_config, options));

    options.target_account = std::string{"Checking Account"};
    options.offset_account = std::string{"Expenses"};
    EXPECT_EQ (1, import_statement (m_ledger, *m_config, options));
    options.offset_account = boost::none;

    options.statement = path ("missing.csv");
    EXPECT_EQ (1, import_statement (m_ledger, *m_config, options));

    options.statement = write_statement ("statement.pdf", "%PDF-1.4");
    EXPECT_EQ (1, import_statement (m_ledger, *m_config, options));
    EXPECT_TRUE (load ()->transactions.empty ());
}
