/********************************************************************
 * test-dom-converters.cpp -- account and transaction xml round trips*
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
#include <gtest/gtest.h>
#include <libxml/tree.h>

#include "../cb-xml.hpp"
#include "../io-cbxml-v2.hpp"
#include "cb-book.hpp"
#include "cb-errors.hpp"

static KvpSlot
string_slot (const char* key, const char* text)
{
    KvpNode value;
    value.name = "slot:value";
    value.attributes.emplace_back ("type", "string");
    value.text = text;
    return KvpSlot{key, value};
}

static Account
make_account ()
{
    auto acc = cb_account_create ("Groceries & Household", ACCT_TYPE_EXPENSE,
                                  std::string{"0123456789abcdef0123456789abcdef"});
    acc.code = "5100";
    acc.description = "Food <and> supplies";
    acc.hidden = true;
    acc.other_slots.push_back (string_slot ("color", "#ff0000"));
    return acc;
}

static Transaction
make_transaction ()
{
    Transaction trn;
    trn.id = "11111111111111111111111111111111";
    trn.num = "1042";
    trn.date_posted = CbDate (2024, 3, 10);
    trn.date_entered = CbDate (2024, 3, 11);
    trn.description = "Trader Joes 123";
    trn.notes = "weekly shop\nsecond line";

    auto debit = cb_split_create ("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa",
                                  CbNumeric (4250, 100));
    debit.memo = "food";
    debit.action = "Buy";
    debit.online_id = "FITID-1234";
    debit.other_slots.push_back (string_slot ("import-tag", "csv"));
    auto credit = cb_split_create ("bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb",
                                   CbNumeric (-4250, 100));
    credit.reconciled = YREC;
    credit.reconcile_date = CbDate (2024, 3, 31);
    trn.splits = {debit, credit};
    return trn;
}

TEST(DomConverters, test_account_round_trip)
{
    auto acc = make_account ();
    auto node = cb_account_dom_tree_create (acc);
    ASSERT_NE (nullptr, node);
    auto parsed = dom_tree_to_account (node);
    xmlFreeNode (node);
    ASSERT_TRUE (parsed);
    EXPECT_EQ (acc, *parsed);
}

TEST(DomConverters, test_placeholder_and_root)
{
    auto acc = cb_account_create ("Assets", ACCT_TYPE_ASSET,
                                  std::string{"0123456789abcdef0123456789abcdef"});
    acc.placeholder = true;
    auto root = cb_account_create ("Root Account", ACCT_TYPE_ROOT, std::nullopt);
    for (const auto& orig : {acc, root})
    {
        auto node = cb_account_dom_tree_create (orig);
        auto parsed = dom_tree_to_account (node);
        xmlFreeNode (node);
        ASSERT_TRUE (parsed);
        EXPECT_EQ (orig, *parsed);
    }
}

TEST(DomConverters, test_transaction_round_trip)
{
    auto trn = make_transaction ();
    auto node = cb_transaction_dom_tree_create (trn);
    ASSERT_NE (nullptr, node);
    auto parsed = dom_tree_to_transaction (node);
    xmlFreeNode (node);
    ASSERT_TRUE (parsed);
    EXPECT_EQ (trn, *parsed);
    ASSERT_EQ (2u, parsed->splits.size ());
    EXPECT_EQ ("FITID-1234", parsed->splits[0].online_id.value_or (""));
    EXPECT_EQ (CbNumeric (-4250, 100), parsed->splits[1].value);
}

TEST(DomConverters, test_amounts_are_stored_in_cents)
{
    auto trn = make_transaction ();
    trn.splits[0].value = CbNumeric (1, 3);
    trn.splits[0].quantity = CbNumeric (1, 3);
    auto text = cb_transaction_to_xml_string (trn);
    EXPECT_NE (std::string::npos, text.find ("<split:value>33/100</split:value>"));

    auto node = cb_transaction_dom_tree_create (trn);
    auto parsed = dom_tree_to_transaction (node);
    xmlFreeNode (node);
    ASSERT_TRUE (parsed);
    EXPECT_EQ (CbNumeric (33, 100), parsed->splits[0].value);
}

TEST(DomConverters, test_transaction_without_splits)
{
    auto trn = make_transaction ();
    trn.splits.clear ();
    auto node = cb_transaction_dom_tree_create (trn);
    EXPECT_FALSE (dom_tree_to_transaction (node));
    xmlFreeNode (node);
}

TEST(DomConverters, test_escaped_text)
{
    auto acc = make_account ();
    auto text = cb_account_to_xml_string (acc);
    EXPECT_NE (std::string::npos,
               text.find ("<act:name>Groceries &amp; Household</act:name>"));
    EXPECT_NE (std::string::npos, text.find ("Food &lt;and&gt; supplies"));
}

class BookTextTest : public ::testing::Test
{
protected:
    BookTextTest ()
    {
        auto root = cb_account_create ("Root Account", ACCT_TYPE_ROOT,
                                       std::nullopt);
        auto food = cb_account_create ("Groceries", ACCT_TYPE_EXPENSE, root.id);
        food.id = "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
        auto bank = cb_account_create ("Checking", ACCT_TYPE_BANK, root.id);
        bank.id = "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";
        m_book.book_id = "cccccccccccccccccccccccccccccccc";
        m_book.accounts = {root, food, bank};
        m_book.transactions = {make_transaction ()};
    }

    LedgerBook m_book;
};

TEST_F(BookTextTest, test_book_round_trip)
{
    auto text = cb_xml_book_to_string (m_book);
    auto book = cb_xml_read_book (text);
    EXPECT_EQ (m_book.book_id, book.book_id);
    ASSERT_EQ (m_book.accounts.size (), book.accounts.size ());
    for (std::size_t i = 0; i < book.accounts.size (); ++i)
        EXPECT_EQ (m_book.accounts[i], book.accounts[i]);
    ASSERT_EQ (1u, book.transactions.size ());
    EXPECT_EQ (m_book.transactions[0], book.transactions[0]);
    EXPECT_EQ (3, book.counts["account"]);
    EXPECT_EQ (1, book.counts["transaction"]);
}

TEST_F(BookTextTest, test_unknown_elements_are_skipped)
{
    auto text = cb_xml_book_to_string (m_book);
    auto pos = text.find ("<gnc:account");
    text.insert (pos, "<gnc:schedxaction version=\"2.0.0\"><sx:id type=\"guid\">"
                 "dddddddddddddddddddddddddddddddd</sx:id></gnc:schedxaction>\n");
    auto book = cb_xml_read_book (text);
    EXPECT_EQ (3u, book.accounts.size ());
}

TEST_F(BookTextTest, test_no_book)
{
    EXPECT_THROW (cb_xml_read_book ("<?xml version=\"1.0\"?>\n<gnc-v2>\n</gnc-v2>\n"),
                  CbParseError);
}

TEST_F(BookTextTest, test_malformed_xml)
{
    auto text = cb_xml_book_to_string (m_book);
    text.resize (text.size () / 2);
    EXPECT_THROW (cb_xml_read_book (text), CbParseError);
    EXPECT_THROW (cb_xml_read_book ("not xml at all"), CbParseError);
}

TEST_F(BookTextTest, test_nonexistent_parent)
{
    m_book.accounts[1].parent = "eeeeeeeeeeeeeeeeeeeeeeeeeeeeeeee";
    auto text = cb_xml_book_to_string (m_book);
    try
    {
        cb_xml_read_book (text);
        FAIL () << "an orphaned account was accepted";
    }
    catch (const CbParseError& err)
    {
        EXPECT_EQ (ERR_FILEIO_PARSE_ERROR, err.code ());
        EXPECT_NE (std::string::npos,
                   std::string{err.what ()}.find ("eeeeeeeeeeeeeeeeeeeeeeeeeeeeeeee"));
    }
}

TEST_F(BookTextTest, test_oversized_split_value)
{
    auto text = cb_xml_book_to_string (m_book);
    auto open = text.find ("<split:value>");
    ASSERT_NE (std::string::npos, open);
    open += strlen ("<split:value>");
    auto close = text.find ("</split:value>", open);
    text.replace (open, close - open, "99999999999999999999/100");
    EXPECT_THROW (cb_xml_read_book (text), CbParseError);

    text.replace (open, text.find ("</split:value>", open) - open,
                  "1/100000000000000000000");
    EXPECT_THROW (cb_xml_read_book (text), CbParseError);
}
