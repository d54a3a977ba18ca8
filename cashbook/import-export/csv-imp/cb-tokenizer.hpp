/********************************************************************
 * cb-tokenizer.hpp - turn statement text into rows of cells       *
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

/** @file
     @brief Class to convert a file into vector of string vectors.
     This is a generic base class that holds the functionality common
     to the different specializations. Loading reads the raw bytes,
     converts them to UTF-8 from the selected encoding, removes a byte
     order mark and normalizes line endings to "\n".
     The child classes have to override the tokenize function to
     create a full tokenizer class.
*/

#ifndef CB_TOKENIZER_HPP
#define CB_TOKENIZER_HPP

#include <string>
#include <vector>

using StrVec = std::vector<std::string>;

class CbTokenizerTest;

class CbTokenizer
{
friend CbTokenizerTest;
public:
    CbTokenizer() = default;                              // default constructor
    CbTokenizer(const CbTokenizer&) = default;            // copy constructor
    CbTokenizer& operator=(const CbTokenizer&) = default; // copy assignment
    CbTokenizer(CbTokenizer&&) = default;                 // move constructor
    CbTokenizer& operator=(CbTokenizer&&) = default;      // move assignment
    virtual ~CbTokenizer() = default;                     // destructor

    /** @exception std::ifstream::failure if @a path can't be read. */
    virtual void load_file(const std::string& path);
    /** Use @a contents as if read from a file. */
    void load_buffer(const std::string& contents);
    const std::string& current_file();
    /** Reconvert the raw contents from @a encoding.
     * @exception boost::locale::conv::conversion_error if the encoding is
     * not supported. */
    void encoding(const std::string& encoding);
    const std::string& encoding();
    virtual int  tokenize() = 0;
    const std::vector<StrVec>& get_tokens();

protected:
    std::string m_utf8_contents;
    std::vector<StrVec> m_tokenized_contents;

private:
    std::string m_imp_file_str;
    std::string m_raw_contents;
    std::string m_enc_str = "UTF-8";
};

#endif
