/********************************************************************
 * cb-tokenizer-csv.hpp - delimited text tokenizer                 *
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
     @brief Class to convert a csv file into vector of string vectors.
     One can define the separator characters to use to split each line
     into multiple fields. Quote characters will be removed, a doubled
     quote inside a quoted field becomes a single one and a quoted field
     may run over several lines. Cells are trimmed and blank lines are
     skipped. No interpretation of the cells is done yet, that's up to
     the code using this class.
*/

#ifndef CB_CSV_TOKENIZER_HPP
#define CB_CSV_TOKENIZER_HPP

#include <string>
#include <vector>
#include "cb-tokenizer.hpp"

class CbCsvTokenizer : public CbTokenizer
{
public:
    CbCsvTokenizer() = default;                                 // default constructor
    CbCsvTokenizer(const CbCsvTokenizer&) = default;            // copy constructor
    CbCsvTokenizer& operator=(const CbCsvTokenizer&) = default; // copy assignment
    CbCsvTokenizer(CbCsvTokenizer&&) = default;                 // move constructor
    CbCsvTokenizer& operator=(CbCsvTokenizer&&) = default;      // move assignment
    ~CbCsvTokenizer() = default;                                // destructor

    void set_separators(const std::string& separators);
    /** @exception std::range_error on an invalid escape sequence. */
    int  tokenize() override;

private:
    std::string m_sep_str = ",";
};

/** Tokenize @a contents as UTF-8 comma separated text. */
std::vector<StrVec> cb_csv_tokenize (const std::string& contents);

#endif
