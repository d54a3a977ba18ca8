/********************************************************************
 * cb-xml-document.hpp -- in-place editing of the ledger text      *
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

/** @file cb-xml-document.hpp
 *  The writer never re-serializes the whole book. It edits the decompressed
 *  document text instead, one entity block at a time, so that everything it
 *  doesn't model (commodities, prices, scheduled transactions, formatting)
 *  is left exactly as it was.
 *
 *  Blocks are found by their start and end markers and the text of their id
 *  element, never by pattern matching over the whole document. A span covers
 *  the block from the start of its line, when only indentation precedes it,
 *  to the end of its closing tag.
 */

#ifndef CB_XML_DOCUMENT_HPP
#define CB_XML_DOCUMENT_HPP

#include <cstdint>
#include <optional>
#include <string>

struct CbXmlSpan
{
    std::size_t begin;
    std::size_t end;
};

class CbXmlDocument
{
public:
    explicit CbXmlDocument (std::string text) : m_text{std::move (text)} {}

    const std::string& text () const noexcept { return m_text; }

    /** The <gnc:account> block whose act:id is exactly @a id. */
    std::optional<CbXmlSpan> find_account (const std::string& id) const;
    /** The <gnc:transaction> block whose trn:id is exactly @a id. */
    std::optional<CbXmlSpan> find_transaction (const std::string& id) const;

    void replace (const CbXmlSpan& span, const std::string& block);
    /** Remove @a span and the line break following it. */
    void erase (const CbXmlSpan& span);
    /** Insert @a block on its own line before the first transaction, or
     * before the end of the book if there are none.
     * @exception CbParseError if the document has no book. */
    void insert_account (const std::string& block);
    /** Insert @a block on its own line before the end of the book.
     * @exception CbParseError if the document has no book. */
    void insert_transaction (const std::string& block);

    /** True if a split:account element names @a id. */
    bool account_in_use (const std::string& id) const;
    /** True if an act:parent element names @a id. */
    bool account_has_children (const std::string& id) const;

    /** The book's gnc:count-data of @a type ("account", "transaction"). */
    std::optional<int64_t> count (const std::string& type) const;
    /** Add @a delta to the book's counter of @a type, never going below
     * zero. A missing counter is created after the book id when @a delta is
     * positive.
     * @exception CbParseError if the document has no book. */
    void adjust_count (const std::string& type, int64_t delta);

    /** Replace the text of the first @a tag element inside @a span, escaping
     * it. The span's end is moved to match.
     * @return false if @a span has no such element. */
    bool replace_child_text (CbXmlSpan& span, const std::string& tag,
                             const std::string& text);

private:
    std::optional<CbXmlSpan> find_block (const std::string& tag,
                                         const std::string& id_tag,
                                         const std::string& id) const;
    bool any_element_is (const std::string& tag, const std::string& text) const;
    std::size_t find_open_tag (const std::string& tag, std::size_t from,
                               std::size_t to) const;
    std::size_t line_start (std::size_t pos) const;
    std::size_t book_start () const;
    std::size_t book_end () const;
    void insert_line (std::size_t pos, const std::string& block);

    std::string m_text;
};

#endif /* CB_XML_DOCUMENT_HPP */
