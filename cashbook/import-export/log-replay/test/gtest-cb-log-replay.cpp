/********************************************************************
 * gtest-cb-log-replay.cpp - reading account changes back from the logs*
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

#include "../cb-log-replay.hpp"
#include "TransLog.hpp"
#include "cb-book.hpp"
#include "cb-datetime.hpp"

class CbLogReplayTest : public ::testing::Test
{
protected:
    CbLogReplayTest () : m_now{1710068340}
    {
        auto root = cb_account_create ("Root Account", ACCT_TYPE_ROOT, std::nullopt);
        m_checking = cb_account_create ("Checking", ACCT_TYPE_BANK, root.id);
        m_groceries = cb_account_create ("Groceries", ACCT_TYPE_EXPENSE, root.id);
        m_dining = cb_account_create ("Dining", ACCT_TYPE_EXPENSE, root.id);
        m_book.accounts = {root, m_checking, m_groceries, m_dining};

        m_trans.id = "0123456789abcdef0123456789abcdef";
        m_trans.date_posted = CbDate (2024, 3, 9);
        m_trans.date_entered = CbDate (2024, 3, 9);
        m_trans.description = "Burgerville";
        m_trans.splits = {cb_split_create (m_groceries.id, CbNumeric (1825, 100)),
                          cb_split_create (m_checking.id, CbNumeric (-1825, 100))};
        m_moved = m_trans;
        m_moved.splits[0].account = m_dining.id;
    }

    CbDateTime m_now;
    LedgerBook m_book;
    Account m_checking;
    Account m_groceries;
    Account m_dining;
    Transaction m_trans;
    Transaction m_moved;
};

TEST_F(CbLogReplayTest, split_moved)
{
    auto log = cb_trans_log_format (&m_trans, &m_moved, m_book, m_now);
    auto changes = cb_log_account_changes (log, "20240310105900");
    ASSERT_EQ (1u, changes.size ());
    const auto& change = changes[0];
    EXPECT_EQ ("2024-03-10T10:59:00Z", change.changed_at);
    EXPECT_EQ (m_trans.id, change.trans_guid);
    EXPECT_EQ (m_trans.splits[0].id, change.split_guid);
    EXPECT_EQ ("2024-03-09", change.date_posted);
    EXPECT_EQ ("Burgerville", change.description);
    EXPECT_EQ ((CbNumeric {1825, 100}), change.amount);
    EXPECT_EQ (m_groceries.id, change.from_account.id);
    EXPECT_EQ ("Groceries", change.from_account.name);
    EXPECT_EQ (m_dining.id, change.to_account.id);
    EXPECT_EQ ("Dining", change.to_account.name);
}

TEST_F(CbLogReplayTest, oversized_amount)
{
    auto log = cb_trans_log_format (&m_trans, &m_moved, m_book, m_now);
    boost::replace_all (log, "1825/100", "99999999999999999999/100");
    auto changes = cb_log_account_changes (log, "20240310105900");
    ASSERT_EQ (1u, changes.size ());
    EXPECT_EQ (CbNumeric {}, changes[0].amount);
    EXPECT_EQ ("Dining", changes[0].to_account.name);
}

TEST_F(CbLogReplayTest, no_account_change)
{
    auto edited = m_trans;
    edited.description = "Burgerville #12";
    EXPECT_TRUE (cb_log_account_changes (cb_trans_log_format (&m_trans, &edited,
                                                              m_book, m_now),
                                         "20240310105900").empty ());
    EXPECT_TRUE (cb_log_account_changes (cb_trans_log_format (nullptr, &m_trans,
                                                              m_book, m_now),
                                         "20240310105900").empty ());
    EXPECT_TRUE (cb_log_account_changes (cb_trans_log_format (&m_trans, nullptr,
                                                              m_book, m_now),
                                         "20240310105900").empty ());
    EXPECT_TRUE (cb_log_account_changes ("", "20240310105900").empty ());
}

TEST_F(CbLogReplayTest, unterminated_block)
{
    auto log = cb_trans_log_format (&m_trans, &m_moved, m_book, m_now);
    log = log.substr (0, log.find (cb_trans_log_end));
    EXPECT_TRUE (cb_log_account_changes (log, "20240310105900").empty ());
}

TEST_F(CbLogReplayTest, bad_stamp)
{
    auto log = cb_trans_log_format (&m_trans, &m_moved, m_book, m_now);
    auto changes = cb_log_account_changes (log, "yesterday");
    ASSERT_EQ (1u, changes.size ());
    EXPECT_TRUE (changes[0].changed_at.empty ());
}

TEST_F(CbLogReplayTest, scan_logs_newest_first)
{
    auto dir = g_dir_make_tmp ("cashbook-replay-XXXXXX", nullptr);
    ASSERT_NE (nullptr, dir);
    std::string ledger{std::string{dir} + "/household.gnucash"};

    auto first = cb_trans_log_write (ledger, &m_trans, &m_moved, m_book, m_now);
    auto back = m_moved;
    back.splits[0].account = m_groceries.id;
    auto second = cb_trans_log_write (ledger, &m_moved, &back, m_book,
                                      CbDateTime{1710068340 + 86400});
    auto account_only = cb_trans_log_write (ledger, nullptr, nullptr, m_book,
                                            CbDateTime{1710068340 + 3600});
    std::string unrelated{std::string{dir} + "/other.gnucash.20240312105900.log"};
    ASSERT_TRUE (g_file_set_contents (unrelated.c_str (),
                                      cb_trans_log_format (&m_trans, &m_moved,
                                                           m_book, m_now).c_str (),
                                      -1, nullptr));

    auto changes = cb_scan_account_changes (ledger);
    ASSERT_EQ (2u, changes.size ());
    EXPECT_EQ ("2024-03-11T10:59:00Z", changes[0].changed_at);
    EXPECT_EQ ("Groceries", changes[0].to_account.name);
    EXPECT_EQ ("2024-03-10T10:59:00Z", changes[1].changed_at);
    EXPECT_EQ ("Dining", changes[1].to_account.name);

    for (const auto& path : {first, second, account_only, unrelated})
        g_unlink (path.c_str ());
    g_rmdir (dir);
    g_free (dir);

    EXPECT_TRUE (cb_scan_account_changes (ledger).empty ());
}
