/********************************************************************
 * cb-tokenizer.cpp - turn statement text into rows of cells       *
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

#include "cb-tokenizer.hpp"

#include <fstream>      // fstream
#include <string>

#include <boost/locale.hpp>
#include <boost/algorithm/string.hpp>

#include <glib.h>

#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_CSV;

static const char utf8_bom[] = "\xEF\xBB\xBF";

void
CbTokenizer::load_file(const std::string& path)
{
    if (path.empty())
        return;

    m_imp_file_str = path;
    char *raw_contents;
    size_t raw_length;
    GError *error = nullptr;

    if (!g_file_get_contents(path.c_str(), &raw_contents, &raw_length, &error))
    {
        std::string msg {error->message};
        g_error_free (error);
        throw std::ifstream::failure {msg};
    }

    m_raw_contents.assign(raw_contents, raw_length);
    g_free(raw_contents);
    this->encoding(m_enc_str);
}

void
CbTokenizer::load_buffer(const std::string& contents)
{
    m_imp_file_str.clear();
    m_raw_contents = contents;
    this->encoding(m_enc_str);
}

const std::string&
CbTokenizer::current_file()
{
    return m_imp_file_str;
}

void
CbTokenizer::encoding(const std::string& encoding)
{
    m_enc_str = encoding;
    m_utf8_contents = boost::locale::conv::to_utf<char>(m_raw_contents, m_enc_str);

    if (boost::starts_with (m_utf8_contents, utf8_bom))
    {
        DEBUG ("removing byte order mark");
        m_utf8_contents.erase (0, sizeof (utf8_bom) - 1);
    }

    // While we are converting here, let's also normalize line-endings to "\n"
    // That's what STL expects by default
    boost::replace_all (m_utf8_contents, "\r\n", "\n");
    boost::replace_all (m_utf8_contents, "\r", "\n");
}

const std::string&
CbTokenizer::encoding()
{
    return m_enc_str;
}


const std::vector<StrVec>&
CbTokenizer::get_tokens()
{
    return m_tokenized_contents;
}
