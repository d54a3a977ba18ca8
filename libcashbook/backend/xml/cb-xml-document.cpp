/********************************************************************
 * cb-xml-document.cpp -- in-place editing of the ledger text      *
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
#include <libxml/entities.h>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>

#include "cb-xml-document.hpp"
#include "cb-errors.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_BACKEND;

#define gnc_book_string "gnc:book"
#define gnc_account_string "gnc:account"
#define gnc_transaction_string "gnc:transaction"

static inline std::string
close_tag (const std::string& tag)
{
    return "</" + tag + ">";
}

std::size_t
CbXmlDocument::find_open_tag (const std::string& tag, std::size_t from,
                              std::size_t to) const
{
    auto needle = "<" + tag;
    for (auto pos = m_text.find (needle, from);
         pos != std::string::npos && pos < to;
         pos = m_text.find (needle, pos + 1))
    {
        auto next = pos + needle.size ();
        if (next >= m_text.size ())
            break;
        /* "<gnc:account" mustn't match "<gnc:accounts" */
        switch (m_text[next])
        {
        case ' ': case '\t': case '\r': case '\n': case '>': case '/':
            return pos;
        default:
            break;
        }
    }
    return std::string::npos;
}

std::size_t
CbXmlDocument::line_start (std::size_t pos) const
{
    auto p = pos;
    while (p > 0 && (m_text[p - 1] == ' ' || m_text[p - 1] == '\t'))
        --p;
    if (p == 0 || m_text[p - 1] == '\n')
        return p;
    return pos;
}

std::size_t
CbXmlDocument::book_start () const
{
    auto pos = find_open_tag (gnc_book_string, 0, std::string::npos);
    if (pos == std::string::npos)
        throw CbParseError ("The document has no book");
    return pos;
}

std::size_t
CbXmlDocument::book_end () const
{
    auto pos = m_text.rfind (close_tag (gnc_book_string));
    if (pos == std::string::npos)
        throw CbParseError ("The document's book is not terminated");
    return pos;
}

std::optional<CbXmlSpan>
CbXmlDocument::find_block (const std::string& tag, const std::string& id_tag,
                           const std::string& id) const
{
    auto end = book_end ();
    auto closer = close_tag (tag);
    auto id_closer = close_tag (id_tag);
    auto from = book_start ();
    while (true)
    {
        auto pos = find_open_tag (tag, from, end);
        if (pos == std::string::npos)
            return std::nullopt;
        auto close = m_text.find (closer, pos);
        if (close == std::string::npos || close > end)
        {
            PWARN ("unterminated <%s> at offset %zu", tag.c_str (), pos);
            return std::nullopt;
        }
        auto block_end = close + closer.size ();

        auto id_pos = find_open_tag (id_tag, pos, block_end);
        if (id_pos != std::string::npos)
        {
            auto gt = m_text.find ('>', id_pos);
            auto id_close = m_text.find (id_closer, gt);
            if (gt != std::string::npos && id_close != std::string::npos &&
                id_close < block_end)
            {
                auto text = m_text.substr (gt + 1, id_close - gt - 1);
                if (boost::algorithm::trim_copy (text) == id)
                    return CbXmlSpan{line_start (pos), block_end};
            }
        }
        from = block_end;
    }
}

std::optional<CbXmlSpan>
CbXmlDocument::find_account (const std::string& id) const
{
    return find_block (gnc_account_string, "act:id", id);
}

std::optional<CbXmlSpan>
CbXmlDocument::find_transaction (const std::string& id) const
{
    return find_block (gnc_transaction_string, "trn:id", id);
}

bool
CbXmlDocument::any_element_is (const std::string& tag,
                               const std::string& text) const
{
    auto end = book_end ();
    auto closer = close_tag (tag);
    for (auto pos = find_open_tag (tag, book_start (), end);
         pos != std::string::npos;
         pos = find_open_tag (tag, pos + 1, end))
    {
        auto gt = m_text.find ('>', pos);
        auto close = m_text.find (closer, gt);
        if (gt == std::string::npos || close == std::string::npos)
            break;
        if (boost::algorithm::trim_copy (m_text.substr (gt + 1, close - gt - 1))
            == text)
            return true;
    }
    return false;
}

bool
CbXmlDocument::account_in_use (const std::string& id) const
{
    return any_element_is ("split:account", id);
}

bool
CbXmlDocument::account_has_children (const std::string& id) const
{
    return any_element_is ("act:parent", id);
}

void
CbXmlDocument::replace (const CbXmlSpan& span, const std::string& block)
{
    m_text.replace (span.begin, span.end - span.begin, block);
}

void
CbXmlDocument::erase (const CbXmlSpan& span)
{
    auto end = span.end;
    if (end < m_text.size () && m_text[end] == '\r')
        ++end;
    if (end < m_text.size () && m_text[end] == '\n')
        ++end;
    m_text.erase (span.begin, end - span.begin);
}

void
CbXmlDocument::insert_line (std::size_t pos, const std::string& block)
{
    std::string line;
    if (pos > 0 && m_text[pos - 1] != '\n')
        line += '\n';
    line += block;
    line += '\n';
    m_text.insert (pos, line);
}

void
CbXmlDocument::insert_account (const std::string& block)
{
    auto end = book_end ();
    auto start = book_start ();
    /* Scheduled transaction templates have transactions of their own. */
    auto limit = std::min (end, find_open_tag ("gnc:template-transactions",
                                               start, end));
    auto first = find_open_tag (gnc_transaction_string, start, limit);
    insert_line (line_start (first != std::string::npos ? first : end), block);
}

void
CbXmlDocument::insert_transaction (const std::string& block)
{
    insert_line (line_start (book_end ()), block);
}

static std::string
count_data_tag (const std::string& type)
{
    return "<gnc:count-data cd:type=\"" + type + "\">";
}

std::optional<int64_t>
CbXmlDocument::count (const std::string& type) const
{
    auto needle = count_data_tag (type);
    auto pos = m_text.find (needle, book_start ());
    if (pos == std::string::npos || pos > book_end ())
        return std::nullopt;
    auto start = pos + needle.size ();
    auto close = m_text.find ("</gnc:count-data>", start);
    if (close == std::string::npos)
        return std::nullopt;
    auto digits = boost::algorithm::trim_copy (m_text.substr (start,
                                                              close - start));
    gchar* endp = nullptr;
    auto val = g_ascii_strtoll (digits.c_str (), &endp, 10);
    if (digits.empty () || (endp && *endp))
    {
        PWARN ("bad %s count '%s'", type.c_str (), digits.c_str ());
        return std::nullopt;
    }
    return val;
}

void
CbXmlDocument::adjust_count (const std::string& type, int64_t delta)
{
    auto needle = count_data_tag (type);
    auto start = book_start ();
    auto pos = m_text.find (needle, start);
    if (pos != std::string::npos && pos < book_end ())
    {
        auto num_start = pos + needle.size ();
        auto close = m_text.find ("</gnc:count-data>", num_start);
        auto old = count (type).value_or (0);
        auto updated = std::max<int64_t> (0, old + delta);
        DEBUG ("%s count %" G_GINT64_FORMAT " -> %" G_GINT64_FORMAT,
               type.c_str (), old, updated);
        m_text.replace (num_start, close - num_start, std::to_string (updated));
        return;
    }
    if (delta <= 0)
    {
        PWARN ("no %s counter to decrement", type.c_str ());
        return;
    }

    /* Put a new counter after the book id, or right after the book tag. */
    auto anchor = m_text.find ("</book:id>", start);
    if (anchor == std::string::npos || anchor > book_end ())
        anchor = m_text.find ('>', start);
    auto nl = m_text.find ('\n', anchor);
    auto at = nl == std::string::npos ? m_text.size () : nl + 1;
    insert_line (at, needle + std::to_string (delta) + "</gnc:count-data>");
}

bool
CbXmlDocument::replace_child_text (CbXmlSpan& span, const std::string& tag,
                                   const std::string& text)
{
    auto open = find_open_tag (tag, span.begin, span.end);
    if (open == std::string::npos)
        return false;
    auto gt = m_text.find ('>', open);
    if (gt == std::string::npos || gt >= span.end)
        return false;

    auto encoded = xmlEncodeSpecialChars (nullptr, BAD_CAST text.c_str ());
    std::string escaped{reinterpret_cast<const char*> (encoded)};
    xmlFree (encoded);

    auto old_size = m_text.size ();
    if (m_text[gt - 1] == '/')
    {
        m_text.replace (open, gt + 1 - open,
                        "<" + tag + ">" + escaped + close_tag (tag));
    }
    else
    {
        auto close = m_text.find (close_tag (tag), gt);
        if (close == std::string::npos || close > span.end)
            return false;
        m_text.replace (gt + 1, close - gt - 1, escaped);
    }
    span.end = span.end + m_text.size () - old_size;
    return true;
}
