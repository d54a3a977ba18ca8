/********************************************************************
 * gtest-cb-xml-document.cpp -- tests of in-place ledger text editing*
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

#include "../cb-xml-document.hpp"
#include "../cb-xml.hpp"
#include "../io-cbxml-v2.hpp"
#include "cb-errors.hpp"

static const char* food_id = "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
static const char* bank_id = "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";
static const char* spare_id = "dddddddddddddddddddddddddddddddd";
static const char* trans_id = "11111111111111111111111111111111";

class CbXmlDocumentTest : public ::testing::Test
{
protected:
    CbXmlDocumentTest ()
    {
        auto root = cb_account_create ("Root Account", ACCT_TYPE_ROOT,
                                       std::nullopt);
        auto food = cb_account_create ("Groceries", ACCT_TYPE_EXPENSE, root.id);
        food.id = food_id;
        auto bank = cb_account_create ("Checking", ACCT_TYPE_BANK, root.id);
        bank.id = bank_id;
        auto spare = cb_account_create ("Spare", ACCT_TYPE_EXPENSE, bank.id);
        spare.id = spare_id;
        m_book.book_id = "cccccccccccccccccccccccccccccccc";
        m_book.accounts = {root, food, bank, spare};

        Transaction trn;
        trn.id = trans_id;
        trn.date_posted = CbDate (2024, 3, 10);
        trn.date_entered = CbDate (2024, 3, 10);
        trn.description = "Trader Joes 123";
        trn.splits = {cb_split_create (food_id, CbNumeric (4250, 100)),
                      cb_split_create (bank_id, CbNumeric (-4250, 100))};
        m_book.transactions = {trn};
        m_text = cb_xml_book_to_string (m_book);
    }

    std::string block (const CbXmlDocument& doc, const CbXmlSpan& span)
    {
        return doc.text ().substr (span.begin, span.end - span.begin);
    }

    LedgerBook m_book;
    std::string m_text;
};

TEST_F(CbXmlDocumentTest, test_find_blocks)
{
    CbXmlDocument doc{m_text};
    auto acc = doc.find_account (food_id);
    ASSERT_TRUE (acc);
    auto text = block (doc, *acc);
    EXPECT_EQ (0u, text.find ("<gnc:account"));
    EXPECT_NE (std::string::npos, text.find ("<act:name>Groceries</act:name>"));
    EXPECT_EQ (text.size () - 14, text.rfind ("</gnc:account>"));

    auto trn = doc.find_transaction (trans_id);
    ASSERT_TRUE (trn);
    EXPECT_NE (std::string::npos, block (doc, *trn).find ("Trader Joes 123"));

    EXPECT_FALSE (doc.find_account (trans_id));
    EXPECT_FALSE (doc.find_transaction (food_id));
    EXPECT_FALSE (doc.find_account ("aaaaaaaaaaaaaaaa"));
}

TEST_F(CbXmlDocumentTest, test_references)
{
    CbXmlDocument doc{m_text};
    EXPECT_TRUE (doc.account_in_use (food_id));
    EXPECT_TRUE (doc.account_in_use (bank_id));
    EXPECT_FALSE (doc.account_in_use (spare_id));
    EXPECT_TRUE (doc.account_has_children (bank_id));
    EXPECT_FALSE (doc.account_has_children (spare_id));
}

TEST_F(CbXmlDocumentTest, test_counts)
{
    CbXmlDocument doc{m_text};
    EXPECT_EQ (4, doc.count ("account").value_or (-1));
    EXPECT_EQ (1, doc.count ("transaction").value_or (-1));
    EXPECT_FALSE (doc.count ("budget"));

    doc.adjust_count ("account", -1);
    EXPECT_EQ (3, doc.count ("account").value_or (-1));
    doc.adjust_count ("transaction", -5);
    EXPECT_EQ (0, doc.count ("transaction").value_or (-1));
    doc.adjust_count ("budget", -1);
    EXPECT_FALSE (doc.count ("budget"));
    doc.adjust_count ("budget", 2);
    EXPECT_EQ (2, doc.count ("budget").value_or (-1));
    EXPECT_NO_THROW (cb_xml_read_book (doc.text ()));
}

TEST_F(CbXmlDocumentTest, test_insert_account_before_transactions)
{
    CbXmlDocument doc{m_text};
    auto acc = cb_account_create ("Dining", ACCT_TYPE_EXPENSE,
                                  m_book.accounts[0].id);
    doc.insert_account (cb_account_to_xml_string (acc));
    auto span = doc.find_account (acc.id);
    ASSERT_TRUE (span);
    auto first_trans = doc.text ().find ("<gnc:transaction");
    EXPECT_LT (span->end, first_trans);
    EXPECT_EQ ('\n', doc.text ()[span->end]);
    EXPECT_EQ (5u, cb_xml_read_book (doc.text ()).accounts.size ());
}

TEST_F(CbXmlDocumentTest, test_insert_account_without_transactions)
{
    m_book.transactions.clear ();
    CbXmlDocument doc{cb_xml_book_to_string (m_book)};
    auto acc = cb_account_create ("Dining", ACCT_TYPE_EXPENSE,
                                  m_book.accounts[0].id);
    doc.insert_account (cb_account_to_xml_string (acc));
    auto span = doc.find_account (acc.id);
    ASSERT_TRUE (span);
    EXPECT_EQ (doc.text ().find ("</gnc:book>"), span->end + 1);
}

TEST_F(CbXmlDocumentTest, test_insert_transaction_at_end)
{
    CbXmlDocument doc{m_text};
    auto trn = m_book.transactions[0];
    trn.id = "22222222222222222222222222222222";
    doc.insert_transaction (cb_transaction_to_xml_string (trn));
    auto span = doc.find_transaction (trn.id);
    ASSERT_TRUE (span);
    EXPECT_LT (doc.find_transaction (trans_id)->end, span->begin);
    EXPECT_EQ (doc.text ().find ("</gnc:book>"), span->end + 1);
    EXPECT_EQ (2u, cb_xml_read_book (doc.text ()).transactions.size ());
}

TEST_F(CbXmlDocumentTest, test_erase_and_replace)
{
    CbXmlDocument doc{m_text};
    auto span = doc.find_account (spare_id);
    ASSERT_TRUE (span);
    auto before = doc.text ().substr (0, span->begin);
    auto after = doc.text ().substr (span->end + 1);
    doc.erase (*span);
    EXPECT_EQ (before + after, doc.text ());
    EXPECT_FALSE (doc.find_account (spare_id));

    auto trn = m_book.transactions[0];
    trn.description = "Trader Joe's";
    auto trn_span = doc.find_transaction (trans_id);
    ASSERT_TRUE (trn_span);
    doc.replace (*trn_span, cb_transaction_to_xml_string (trn));
    auto book = cb_xml_read_book (doc.text ());
    ASSERT_EQ (1u, book.transactions.size ());
    EXPECT_EQ ("Trader Joe's", book.transactions[0].description);
}

TEST_F(CbXmlDocumentTest, test_replace_child_text)
{
    CbXmlDocument doc{m_text};
    auto span = doc.find_account (food_id);
    ASSERT_TRUE (span);
    auto old_end = span->end;
    EXPECT_TRUE (doc.replace_child_text (*span, "act:name", "Food & Drink"));
    EXPECT_EQ (old_end + 7, span->end);
    EXPECT_NE (std::string::npos,
               block (doc, *span).find ("<act:name>Food &amp; Drink</act:name>"));
    EXPECT_FALSE (doc.replace_child_text (*span, "act:nickname", "x"));

    auto book = cb_xml_read_book (doc.text ());
    EXPECT_EQ ("Food & Drink", book.find_account (food_id)->name);
    EXPECT_EQ ("Checking", book.find_account (bank_id)->name);
}

TEST_F(CbXmlDocumentTest, test_no_book)
{
    CbXmlDocument doc{"<?xml version=\"1.0\"?>\n<gnc-v2>\n</gnc-v2>\n"};
    EXPECT_THROW (doc.insert_transaction ("<gnc:transaction/>"), CbParseError);
    EXPECT_THROW (doc.find_account (food_id), CbParseError);
}
