/********************************************************************
 * test-tokenizer.cpp - test suite for the csv tokenizer class     *
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


#include "../cb-tokenizer.hpp"
#include "../cb-tokenizer-csv.hpp"
#include <gtest/gtest.h>
#include <fstream>      // fstream

#include <memory>
#include <string>

typedef struct
{
    const char *csv_line;
    unsigned    num_fields;
    const char *fields [8];
} tokenize_csv_test_data;

class CbTokenizerTest : public ::testing::Test
{
public:
    CbTokenizerTest() : csv_tok{std::make_unique<CbCsvTokenizer>()} {}

protected:
    std::string& get_utf8_contents(std::unique_ptr<CbTokenizer> &tokenizer)
    { return tokenizer->m_utf8_contents; }
    void set_utf8_contents(std::unique_ptr<CbTokenizer> &tokenizer, const std::string& newcontents)
    { tokenizer->m_utf8_contents = newcontents; }
    void test_cb_tokenize_helper (const std::string& separators, tokenize_csv_test_data* test_data);

    std::unique_ptr<CbTokenizer> csv_tok;
};

TEST_F (CbTokenizerTest, load_file_nonexisting)
{
    EXPECT_THROW (csv_tok->load_file ("notexist.csv"), std::ios_base::failure);
}

TEST_F (CbTokenizerTest, load_buffer_normalizes)
{
    csv_tok->load_buffer ("\xEF\xBB\xBF" "Date,Amount\r\n03/10/2024,-42.50\r03/11/2024,7\n");
    EXPECT_EQ (std::string ("Date,Amount\n03/10/2024,-42.50\n03/11/2024,7\n"),
               get_utf8_contents (csv_tok));
    EXPECT_TRUE (csv_tok->current_file().empty());
    EXPECT_EQ ("UTF-8", csv_tok->encoding());
}

TEST_F (CbTokenizerTest, load_buffer_from_latin1)
{
    csv_tok->load_buffer ("Caf\xE9,1.00\n");
    csv_tok->encoding ("ISO-8859-1");
    EXPECT_EQ (std::string ("Caf\xC3\xA9,1.00\n"), get_utf8_contents (csv_tok));
}

void
CbTokenizerTest::test_cb_tokenize_helper (const std::string& separators, tokenize_csv_test_data* test_data)
{
    CbCsvTokenizer *csvtok = dynamic_cast<CbCsvTokenizer*>(csv_tok.get());
    csvtok->set_separators (separators);

    int i = 0;
    while (test_data[i].csv_line)
    {
        tokenize_csv_test_data cur_line = test_data[i];
        set_utf8_contents (csv_tok, std::string(cur_line.csv_line));
        csv_tok->tokenize();

        // The tests only come with one line, so get the first row only
        auto line_tok = csv_tok->get_tokens().front();
        EXPECT_EQ (cur_line.num_fields, line_tok.size());
        for (auto j = 0u; j < cur_line.num_fields && j < line_tok.size(); j++)
            EXPECT_EQ (std::string (cur_line.fields[j]), line_tok[j]);

        i++;
    }
}

static tokenize_csv_test_data comma_separated [] = {
        { "Date,Num,Description,Notes,Account,Deposit,Withdrawal,Balance", 8, { "Date","Num","Description","Notes","Account","Deposit","Withdrawal","Balance" } },
        { "05/01/15,45,Acme Inc.,,Miscellaneous,,\"1,100.00\",", 8, { "05/01/15","45","Acme Inc.","","Miscellaneous","","1,100.00","" } },
        { "05/01/15,45,Acme Inc.,,Miscellaneous,", 6, { "05/01/15","45","Acme Inc.","","Miscellaneous","",NULL,NULL } },
        { " 03/10/2024 , TRADER JOES ,  -42.50 ", 3, { "03/10/2024","TRADER JOES","-42.50",NULL,NULL,NULL,NULL,NULL } },
        { "a,\"He said \"\"hi\"\"\",c", 3, { "a","He said \"hi\"","c",NULL,NULL,NULL,NULL,NULL } },
        { "a,\"\",c", 3, { "a","","c",NULL,NULL,NULL,NULL,NULL } },
        { "C:\\Users,x", 2, { "C:\\Users","x",NULL,NULL,NULL,NULL,NULL,NULL } },
        { NULL, 0, { NULL, NULL, NULL, NULL, NULL, NULL, NULL, NULL } },
};

TEST_F (CbTokenizerTest, tokenize_comma_sep)
{
    test_cb_tokenize_helper (",", comma_separated);
}

static tokenize_csv_test_data semicolon_separated [] = {
        { "Date;Num;Description;Notes;Account;Deposit;Withdrawal;Balance", 8, { "Date","Num","Description","Notes","Account","Deposit","Withdrawal","Balance" } },
        { "05/01/15;45;Acme Inc.;;Miscellaneous;;\"1,100.00\";", 8, { "05/01/15","45","Acme Inc.","","Miscellaneous","","1,100.00","" } },
        { NULL, 0, { NULL, NULL, NULL, NULL, NULL, NULL, NULL, NULL } },
};

TEST_F (CbTokenizerTest, tokenize_semicolon_sep)
{
    test_cb_tokenize_helper (";", semicolon_separated);
}

TEST_F (CbTokenizerTest, tokenize_multiline_and_blank)
{
    set_utf8_contents (csv_tok, "Date,Description,Amount\n\n   \n"
                       "03/10/2024,\"Line one\nline two\",5\n"
                       "03/11/2024,Last,6\n");
    csv_tok->tokenize();
    auto tokens = csv_tok->get_tokens();
    ASSERT_EQ (3u, tokens.size());
    EXPECT_EQ ("Line one\nline two", tokens[1][1]);
    EXPECT_EQ ("5", tokens[1][2]);
    EXPECT_EQ ("Last", tokens[2][1]);
}

TEST (CbCsvTokenize, tokenize_buffer)
{
    auto tokens = cb_csv_tokenize ("\xEF\xBB\xBF" "Date,Amount\r\n03/10/2024,-42.50\r\n");
    ASSERT_EQ (2u, tokens.size());
    EXPECT_EQ ("Date", tokens[0][0]);
    EXPECT_EQ ("-42.50", tokens[1][1]);
    EXPECT_TRUE (cb_csv_tokenize ("").empty());
}
