/********************************************************************
 * io-cbxml-v2.cpp -- reading and writing whole version 2 ledgers  *
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
#include <libxml/parser.h>
#include <memory>
#include <set>
#include <sstream>

#include "io-cbxml-v2.hpp"
#include "cb-xml.hpp"
#include "sixtp-dom-parsers.hpp"
#include "cb-errors.hpp"
#include "guid.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_BACKEND;

/* non-static because the book writer and the backend share it */
const char* cb_v2_book_version_string = "2.0.0";

/* ids */
#define gnc_book_string "gnc:book"
#define book_id_string "book:id"
#define gnc_count_data_string "gnc:count-data"
#define gnc_account_string "gnc:account"
#define gnc_transaction_string "gnc:transaction"

static const char* cb_xml2_namespaces[] =
{
    "gnc", "act", "book", "cd", "cmdty", "price", "slot", "split", "sx",
    "trn", "ts", "fs", "bgt", "recurrence", "lot", nullptr
};

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype (&xmlFreeDoc)>;

static std::string
count_type (xmlNodePtr node)
{
    /* xmlGetProp ignores the attribute's namespace; files written without
     * the cd declaration carry it in the name. */
    auto prop = xmlGetProp (node, BAD_CAST "type");
    if (!prop)
        prop = xmlGetProp (node, BAD_CAST "cd:type");
    if (!prop)
        return {};
    std::string type{reinterpret_cast<const char*> (prop)};
    xmlFree (prop);
    return type;
}

static xmlNodePtr
find_book (xmlNodePtr root)
{
    if (dom_tree_qname (root) == gnc_book_string)
        return root;
    for (auto child = root->children; child; child = child->next)
        if (child->type == XML_ELEMENT_NODE &&
            dom_tree_qname (child) == gnc_book_string)
            return child;
    return nullptr;
}

static void
check_split_accounts (const LedgerBook& book)
{
    std::set<std::string> ids;
    for (const auto& acc : book.accounts)
        ids.insert (acc.id);
    for (const auto& trn : book.transactions)
        for (const auto& split : trn.splits)
            if (ids.find (split.account) == ids.end ())
                PWARN ("split %s of transaction %s references unknown account %s",
                       split.id.c_str (), trn.id.c_str (),
                       split.account.c_str ());
}

LedgerBook
cb_xml_read_book (const std::string& text)
{
    ENTER ("%zu bytes", text.size ());
    XmlDocPtr doc{xmlReadMemory (text.data (), text.size (), "ledger.xml",
                                 nullptr,
                                 XML_PARSE_NONET | XML_PARSE_HUGE |
                                 XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                  &xmlFreeDoc};
    if (!doc)
    {
        std::string msg{"The ledger is not well-formed XML"};
        auto err = xmlGetLastError ();
        if (err && err->message)
            msg += std::string{": "} + err->message;
        PERR ("%s", msg.c_str ());
        throw CbParseError (msg);
    }

    auto root = xmlDocGetRootElement (doc.get ());
    auto book_node = root ? find_book (root) : nullptr;
    if (!book_node)
    {
        PERR ("no book in the ledger");
        throw CbParseError ("The ledger has no gnc:book element");
    }

    LedgerBook book;
    for (auto node = book_node->children; node; node = node->next)
    {
        if (node->type != XML_ELEMENT_NODE)
            continue;
        auto tag = dom_tree_qname (node);
        if (tag == book_id_string)
        {
            book.book_id = dom_tree_to_trimmed_text (node);
        }
        else if (tag == gnc_count_data_string)
        {
            auto type = count_type (node);
            auto digits = dom_tree_to_trimmed_text (node);
            gchar* end = nullptr;
            auto val = g_ascii_strtoll (digits.c_str (), &end, 10);
            if (type.empty () || digits.empty () || (end && *end))
                PWARN ("ignoring malformed count-data '%s'", digits.c_str ());
            else
                book.counts[type] = val;
        }
        else if (tag == gnc_account_string)
        {
            auto acc = dom_tree_to_account (node);
            if (!acc)
                throw CbParseError ("Unable to read account " +
                                    std::to_string (book.accounts.size () + 1) +
                                    " of the ledger");
            book.accounts.push_back (std::move (*acc));
        }
        else if (tag == gnc_transaction_string)
        {
            auto trn = dom_tree_to_transaction (node);
            if (!trn)
                throw CbParseError ("Unable to read transaction " +
                                    std::to_string (book.transactions.size () + 1) +
                                    " of the ledger");
            book.transactions.push_back (std::move (*trn));
        }
        else
        {
            DEBUG ("skipping <%s>", tag.c_str ());
        }
    }

    book.validate_tree ();
    check_split_accounts (book);
    LEAVE ("%zu accounts, %zu transactions", book.accounts.size (),
           book.transactions.size ());
    return book;
}

std::string
cb_xml2_namespace_decl (const char* ns)
{
    return std::string{"\n     xmlns:"} + ns + "=\"http://www.gnucash.org/XML/" +
        ns + "\"";
}

static void
write_counts (std::ostringstream& out, const char* type, std::size_t count)
{
    if (count == 0)
        return;
    out << "<gnc:count-data cd:type=\"" << type << "\">" << count
        << "</gnc:count-data>\n";
}

static void
write_default_currency (std::ostringstream& out)
{
    out << "<gnc:commodity version=\"2.0.0\">\n"
        << "  <cmdty:space>" << cb_default_currency.space << "</cmdty:space>\n"
        << "  <cmdty:id>" << cb_default_currency.id << "</cmdty:id>\n"
        << "  <cmdty:get_quotes/>\n"
        << "  <cmdty:quote_source>currency</cmdty:quote_source>\n"
        << "  <cmdty:quote_tz/>\n"
        << "</gnc:commodity>\n";
}

std::string
cb_xml_book_to_string (const LedgerBook& book)
{
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"utf-8\" ?>\n<gnc-v2";
    for (auto ns = cb_xml2_namespaces; *ns; ++ns)
        out << cb_xml2_namespace_decl (*ns);
    out << ">\n";

    write_counts (out, "book", 1);
    out << "<" << gnc_book_string << " version=\"" << cb_v2_book_version_string
        << "\">\n";
    auto id = book.book_id.empty () ? cb_guid_new_string () : book.book_id;
    out << "<" << book_id_string << " type=\"guid\">" << id << "</"
        << book_id_string << ">\n";
    write_counts (out, "commodity", 1);
    write_counts (out, "account", book.accounts.size ());
    write_counts (out, "transaction", book.transactions.size ());
    write_default_currency (out);

    for (const auto& acc : book.accounts)
        out << cb_account_to_xml_string (acc) << "\n";
    for (const auto& trn : book.transactions)
        out << cb_transaction_to_xml_string (trn) << "\n";

    out << "</" << gnc_book_string << ">\n</gnc-v2>\n\n";
    return out.str ();
}
