/********************************************************************
 * cb-tokenizer-csv.cpp - delimited text tokenizer                 *
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

#include "cb-tokenizer-csv.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/tokenizer.hpp>
#include <boost/algorithm/string.hpp>

#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_CSV;

void
CbCsvTokenizer::set_separators(const std::string& separators)
{
    m_sep_str = separators;
}

static void
quote_state (const std::string& buffer, bool& inside_quotes)
{
    auto last_quote = buffer.find_first_of('"');
    while (last_quote != std::string::npos)
    {
        if (last_quote == 0) // Test separately because last_quote - 1 would be out of range
            inside_quotes = !inside_quotes;
        else if (buffer[ last_quote - 1 ] != '\\')
            inside_quotes = !inside_quotes;

        last_quote = buffer.find_first_of('"',last_quote+1);
    }
}

int CbCsvTokenizer::tokenize()
{
    using Tokenizer = boost::tokenizer< boost::escaped_list_separator<char>>;

    boost::escaped_list_separator<char> sep("\\", m_sep_str, "\"");

    StrVec vec;
    std::string line;
    std::string buffer;

    bool inside_quotes(false);

    m_tokenized_contents.clear();
    std::istringstream in_stream(m_utf8_contents);

    auto split_line = [&]()
    {
        // Deal with backslashes that are not meant to be escapes
        // The boost::tokenizer with escaped_list_separator as we use
        // it would choke on this.
        auto bs_pos = line.find ('\\');
        while (bs_pos != std::string::npos)
        {
            if ((bs_pos + 1 == line.size()) ||                             // got trailing single backslash
                (line.find_first_of ("\"\\n", bs_pos + 1) != bs_pos + 1))  // backslash is not part of known escapes \\, \" or \n
                line = line.substr(0, bs_pos) + "\\\\" + line.substr(bs_pos + 1);
            bs_pos += 2;
            bs_pos = line.find ('\\', bs_pos);
        }

        // Deal with repeated " ("") in strings.
        // This is the usual escape for a double quote in csv files,
        // but boost just eats them.
        bs_pos = line.find ("\"\"");
        while (bs_pos != std::string::npos)
        {
            // Two quotes with nothing else between separators are an
            // empty field and are left alone.
            if (!(((bs_pos == 0) ||
                   (m_sep_str.find (line[bs_pos-1]) != std::string::npos))
                  &&
                  ((bs_pos + 2 >= line.length()) ||
                   (m_sep_str.find (line[bs_pos+2]) != std::string::npos))))
                line.replace (bs_pos, 2, "\\\"");
            bs_pos = line.find ("\"\"", bs_pos + 2);
        }

        Tokenizer tok(line, sep);
        vec.assign(tok.begin(),tok.end());
        for (auto& cell : vec)
            boost::trim (cell);
        m_tokenized_contents.push_back(vec);
        line.clear();
    };

    try
    {
        while (std::getline (in_stream, buffer))
        {
            if (!inside_quotes && boost::trim_copy (buffer).empty())
                continue;

            // --- deal with line breaks in quoted strings
            quote_state (buffer, inside_quotes);
            line.append(buffer);
            if (inside_quotes)
            {
                line.append("\n");
                continue;
            }
            // ---
            split_line();
        }
        if (!line.empty())
        {
            PWARN ("unterminated quoted field at the end of the data");
            boost::trim_right (line);
            split_line();
        }
    }
    catch (boost::escaped_list_error &e)
    {
        PERR ("%s", e.what());
        throw (std::range_error ("There was an error parsing the file."));
    }

    DEBUG ("%zu rows", m_tokenized_contents.size());
    return 0;
}

std::vector<StrVec>
cb_csv_tokenize (const std::string& contents)
{
    CbCsvTokenizer tok;
    tok.load_buffer (contents);
    tok.tokenize ();
    return tok.get_tokens ();
}
