/********************************************************************
 * cb-xml-backend.cpp -- the compressed XML ledger file            *
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
#include <zlib.h>
#include <stdexcept>
#include <set>

#include "cb-xml-backend.hpp"
#include "cb-xml-compress.hpp"
#include "cb-xml-document.hpp"
#include "cb-xml.hpp"
#include "io-cbxml-v2.hpp"
#include "sixtp-dom-parsers.hpp"
#include "TransLog.hpp"
#include "cb-errors.hpp"
#include "cb-filepath-utils.hpp"
#include "guid.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_BACKEND;

const char*
cb_write_mode_to_string (CbWriteMode mode)
{
    switch (mode)
    {
    case CB_WRITE_CREATE:
        return "create";
    case CB_WRITE_UPDATE:
        return "update";
    case CB_WRITE_DELETE:
        return "delete";
    }
    return "unknown";
}

static unsigned long
bytes_crc (const std::string& bytes)
{
    auto crc = crc32 (0L, Z_NULL, 0);
    return crc32 (crc, reinterpret_cast<const Bytef*> (bytes.data ()),
                  bytes.size ());
}

/* Parse one entity block cut out of the document. Its namespace prefixes
 * aren't declared there, which libxml2 reports and tolerates. */
template <typename T> static std::optional<T>
parse_block (const CbXmlDocument& doc, const std::optional<CbXmlSpan>& span,
             std::optional<T> (*convert) (xmlNodePtr))
{
    if (!span)
        return std::nullopt;
    auto block = doc.text ().substr (span->begin, span->end - span->begin);
    auto xml = xmlReadMemory (block.data (), block.size (), "block.xml", "utf-8",
                              XML_PARSE_NONET | XML_PARSE_NOERROR |
                              XML_PARSE_NOWARNING);
    if (!xml)
        return std::nullopt;
    std::optional<T> result;
    if (auto root = xmlDocGetRootElement (xml))
        result = convert (root);
    xmlFreeDoc (xml);
    return result;
}

CbXmlBackend::CbXmlBackend (std::string fullpath, int compression_level) :
    m_fullpath{std::move (fullpath)}, m_compression_level{compression_level}
{
    if (m_compression_level < 1 || m_compression_level > 9)
    {
        PWARN ("compression level %d out of range, using 9", compression_level);
        m_compression_level = 9;
    }
}

CbXmlBackend::~CbXmlBackend () = default;

std::string
CbXmlBackend::read_file () const
{
    gchar* contents = nullptr;
    gsize length = 0;
    GError* error = nullptr;
    if (!g_file_get_contents (m_fullpath.c_str (), &contents, &length, &error))
    {
        auto code = error->code == G_FILE_ERROR_NOENT ?
            ERR_FILEIO_FILE_NOT_FOUND : ERR_FILEIO_FILE_BAD_READ;
        std::string msg{error->message};
        g_error_free (error);
        PERR ("%s", msg.c_str ());
        throw CbParseError (msg, code);
    }
    std::string bytes{contents, length};
    g_free (contents);
    return bytes;
}

std::shared_ptr<const LedgerBook>
CbXmlBackend::load ()
{
    std::lock_guard<std::mutex> lock{m_mutex};
    if (m_book)
        return m_book;

    ENTER ("%s", m_fullpath.c_str ());
    auto bytes = read_file ();
    auto crc = bytes_crc (bytes);
    if (!m_have_raw || crc != m_raw_crc)
    {
        m_raw = cb_gzip_inflate (bytes);
        m_raw_crc = crc;
        m_have_raw = true;
    }
    m_book = std::make_shared<const LedgerBook> (cb_xml_read_book (m_raw));
    LEAVE ("");
    return m_book;
}

void
CbXmlBackend::invalidate ()
{
    std::lock_guard<std::mutex> lock{m_mutex};
    m_raw.clear ();
    m_have_raw = false;
    m_book.reset ();
}

void
CbXmlBackend::backup_file (const std::string& bytes, const CbDateTime& now,
                           const std::string& id, const char* operation)
{
    auto backup = cb_backup_path (m_fullpath, cb_file_stamp (now));
    GError* error = nullptr;
    if (!g_file_set_contents (backup.c_str (), bytes.data (), bytes.size (),
                              &error))
    {
        std::string msg{"Failed to make backup file " + backup + ": " +
                error->message};
        g_error_free (error);
        PERR ("%s", msg.c_str ());
        throw CbWriteError (ERR_FILEIO_BACKUP_ERROR, msg, id, operation);
    }
    m_last_backup = backup;
    DEBUG ("backup %s", backup.c_str ());
}

CbXmlDocument
CbXmlBackend::begin_write (const CbDateTime& now, const std::string& id,
                           const char* operation)
{
    m_last_backup.clear ();
    m_last_log.clear ();

    auto bytes = read_file ();
    backup_file (bytes, now, id, operation);

    auto crc = bytes_crc (bytes);
    if (!m_have_raw || crc != m_raw_crc)
    {
        if (m_have_raw)
            PINFO ("%s changed on disk, rereading", m_fullpath.c_str ());
        m_raw = cb_gzip_inflate (bytes);
        m_raw_crc = crc;
        m_have_raw = true;
        m_book.reset ();
    }
    return CbXmlDocument{m_raw};
}

void
CbXmlBackend::write_to_file (const CbXmlDocument& doc, const std::string& id,
                             const char* operation)
{
    auto compressed = cb_gzip_deflate (doc.text (), m_compression_level);

    /* g_file_set_contents writes a temporary file and renames it over the
     * live one. */
    GError* error = nullptr;
    if (!g_file_set_contents (m_fullpath.c_str (), compressed.data (),
                              compressed.size (), &error))
    {
        std::string msg{"Failed to write " + m_fullpath + ": " +
                error->message};
        g_error_free (error);
        PERR ("%s", msg.c_str ());
        throw CbWriteError (ERR_FILEIO_WRITE_ERROR, msg, id, operation);
    }

    m_raw = doc.text ();
    m_raw_crc = bytes_crc (compressed);
    m_have_raw = true;
    m_book.reset ();
}

void
CbXmlBackend::write_log (const Transaction* before, const Transaction* after,
                         const LedgerBook& names, const CbDateTime& now)
{
    m_last_log = cb_trans_log_write (m_fullpath, before, after, names, now);
}

/* The accounts the splits of @a trans refer to, for the log's acc_name
 * column. */
static void
collect_account_names (const CbXmlDocument& doc, const Transaction* trans,
                       LedgerBook& names)
{
    if (!trans)
        return;
    for (const auto& split : trans->splits)
    {
        if (names.find_account (split.account))
            continue;
        auto acc = parse_block<Account> (doc, doc.find_account (split.account),
                                         dom_tree_to_account);
        if (acc)
            names.accounts.push_back (std::move (*acc));
        else
            PWARN ("split %s: no account %s", split.id.c_str (),
                   split.account.c_str ());
    }
}

/* Whether @a ancestor is @a id or one of its parents, walking the parent
 * links of the document. */
static bool
is_ancestor (const CbXmlDocument& doc, const std::string& ancestor,
             std::string id)
{
    std::set<std::string> seen;
    while (seen.insert (id).second)
    {
        if (id == ancestor)
            return true;
        auto acc = parse_block<Account> (doc, doc.find_account (id),
                                         dom_tree_to_account);
        if (!acc || !acc->parent)
            return false;
        id = *acc->parent;
    }
    return false;
}

void
CbXmlBackend::write_account (const Account& acc, CbWriteMode mode)
{
    static const char* operation = "write_account";
    std::lock_guard<std::mutex> lock{m_mutex};
    ENTER ("%s %s", cb_write_mode_to_string (mode), acc.id.c_str ());

    CbDateTime now;
    auto doc = begin_write (now, acc.id, operation);

    switch (mode)
    {
    case CB_WRITE_CREATE:
        if (doc.find_account (acc.id))
            throw CbConstraintError (acc.id, operation, "already exists");
        if (acc.type == ACCT_TYPE_ROOT)
            throw CbConstraintError (acc.id, operation,
                                     "is a second root account");
        if (!acc.parent || !doc.find_account (*acc.parent))
            throw CbConstraintError (acc.id, operation,
                                     "has no parent in the ledger");
        doc.insert_account (cb_account_to_xml_string (acc));
        doc.adjust_count ("account", 1);
        break;

    case CB_WRITE_UPDATE:
    {
        auto span = doc.find_account (acc.id);
        if (!span)
            throw CbNotFoundError (acc.id, operation);
        auto current = parse_block<Account> (doc, span, dom_tree_to_account);
        if (!current)
            throw CbParseError ("Unable to read account " + acc.id);
        if (acc.type == ACCT_TYPE_ROOT && current->type != ACCT_TYPE_ROOT)
            throw CbConstraintError (acc.id, operation,
                                     "is a second root account");
        if (acc.type != ACCT_TYPE_ROOT && current->type == ACCT_TYPE_ROOT)
            throw CbConstraintError (acc.id, operation,
                                     "is the root account");
        if (acc.parent && !doc.find_account (*acc.parent))
            throw CbConstraintError (acc.id, operation,
                                     "has no parent in the ledger");
        if (acc.parent && is_ancestor (doc, acc.id, *acc.parent))
            throw CbConstraintError (acc.id, operation,
                                     "would become its own ancestor");
        doc.replace (*span, cb_account_to_xml_string (acc));
        break;
    }

    case CB_WRITE_DELETE:
    {
        auto span = doc.find_account (acc.id);
        if (!span)
            throw CbNotFoundError (acc.id, operation);
        if (doc.account_in_use (acc.id))
            throw CbConstraintError (acc.id, operation, "account in use");
        if (doc.account_has_children (acc.id))
            throw CbConstraintError (acc.id, operation, "has child accounts");
        doc.erase (*span);
        doc.adjust_count ("account", -1);
        break;
    }
    }

    write_to_file (doc, acc.id, operation);
    write_log (nullptr, nullptr, LedgerBook{}, now);
    LEAVE ("");
}

void
CbXmlBackend::rename_account (const std::string& id, const std::string& name)
{
    static const char* operation = "rename_account";
    std::lock_guard<std::mutex> lock{m_mutex};
    ENTER ("%s -> %s", id.c_str (), name.c_str ());

    CbDateTime now;
    auto doc = begin_write (now, id, operation);
    auto span = doc.find_account (id);
    if (!span)
        throw CbNotFoundError (id, operation);
    if (!doc.replace_child_text (*span, "act:name", name))
        throw CbParseError ("Account " + id + " has no name element");

    write_to_file (doc, id, operation);
    write_log (nullptr, nullptr, LedgerBook{}, now);
    LEAVE ("");
}

void
CbXmlBackend::write_transaction (const Transaction* before,
                                 const Transaction* after, CbWriteMode mode)
{
    static const char* operation = "write_transaction";
    auto target = mode == CB_WRITE_DELETE && before ? before : after;
    auto target_id = target ? target->id : std::string{};

    std::lock_guard<std::mutex> lock{m_mutex};
    ENTER ("%s %s", cb_write_mode_to_string (mode), target_id.c_str ());

    /* Every attempt leaves a backup, including the ones refused below. */
    CbDateTime now;
    auto doc = begin_write (now, target_id, operation);
    if (!target)
        throw std::invalid_argument{std::string{operation} + ": " +
                cb_write_mode_to_string (mode) + " without a transaction"};
    if (mode != CB_WRITE_DELETE && after->splits.empty ())
        throw CbConstraintError (after->id, operation, "has no splits");
    std::optional<Transaction> old;
    const Transaction* logged_after = after;

    switch (mode)
    {
    case CB_WRITE_CREATE:
        if (doc.find_transaction (after->id))
            throw CbConstraintError (after->id, operation, "already exists");
        doc.insert_transaction (cb_transaction_to_xml_string (*after));
        doc.adjust_count ("transaction", 1);
        break;

    case CB_WRITE_UPDATE:
    case CB_WRITE_DELETE:
    {
        auto span = doc.find_transaction (target->id);
        if (!span)
            throw CbNotFoundError (target->id, operation);
        if (before)
            old = *before;
        else
            old = parse_block<Transaction> (doc, span, dom_tree_to_transaction);
        if (!old)
        {
            PWARN ("unable to read %s as it was; logging the new state only",
                   target->id.c_str ());
        }
        if (mode == CB_WRITE_UPDATE)
        {
            doc.replace (*span, cb_transaction_to_xml_string (*after));
        }
        else
        {
            doc.erase (*span);
            doc.adjust_count ("transaction", -1);
            logged_after = nullptr;
            if (!old)
                old = *target;
        }
        break;
    }
    }

    write_to_file (doc, target->id, operation);

    LedgerBook names;
    collect_account_names (doc, old ? &*old : nullptr, names);
    collect_account_names (doc, logged_after, names);
    write_log (old ? &*old : nullptr, logged_after, names, now);
    LEAVE ("");
}

/***********************************************************************/

LedgerBook
cb_xml_create_new_book (const std::string& path, int compression_level)
{
    ENTER ("%s", path.c_str ());
    if (g_file_test (path.c_str (), G_FILE_TEST_EXISTS))
        throw CbWriteError (ERR_FILEIO_FILE_EXISTS,
                            "Refusing to replace the existing file " + path,
                            {}, "create");

    LedgerBook book;
    book.book_id = cb_guid_new_string ();
    auto add = [&book] (const char* name, CbAccountType type,
                        const std::string& parent, bool placeholder)
    {
        auto acc = cb_account_create (name, type, parent);
        acc.placeholder = placeholder;
        book.accounts.push_back (acc);
        return acc.id;
    };

    auto root = cb_account_create ("Root Account", ACCT_TYPE_ROOT, std::nullopt);
    book.accounts.push_back (root);

    auto assets = add ("Assets", ACCT_TYPE_ASSET, root.id, true);
    add ("Checking Account", ACCT_TYPE_BANK, assets, false);
    add ("Savings Account", ACCT_TYPE_BANK, assets, false);

    auto liabilities = add ("Liabilities", ACCT_TYPE_LIABILITY, root.id, true);
    add ("Credit Card", ACCT_TYPE_CREDIT, liabilities, false);

    auto income = add ("Income", ACCT_TYPE_INCOME, root.id, true);
    add ("Salary", ACCT_TYPE_INCOME, income, false);
    add ("Other Income", ACCT_TYPE_INCOME, income, false);

    auto expenses = add ("Expenses", ACCT_TYPE_EXPENSE, root.id, true);
    add ("Groceries", ACCT_TYPE_EXPENSE, expenses, false);
    add ("Utilities", ACCT_TYPE_EXPENSE, expenses, false);
    add ("Housing", ACCT_TYPE_EXPENSE, expenses, false);
    add ("Transportation", ACCT_TYPE_EXPENSE, expenses, false);
    add ("Other Expenses", ACCT_TYPE_EXPENSE, expenses, false);

    auto equity = add ("Equity", ACCT_TYPE_EQUITY, root.id, true);
    add ("Opening Balances", ACCT_TYPE_EQUITY, equity, false);
    add ("Imbalance-USD", ACCT_TYPE_EQUITY, equity, false);

    book.counts["account"] = book.accounts.size ();

    auto compressed = cb_gzip_deflate (cb_xml_book_to_string (book),
                                       compression_level);
    GError* error = nullptr;
    if (!g_file_set_contents (path.c_str (), compressed.data (),
                              compressed.size (), &error))
    {
        std::string msg{"Failed to write " + path + ": " + error->message};
        g_error_free (error);
        PERR ("%s", msg.c_str ());
        throw CbWriteError (ERR_FILEIO_WRITE_ERROR, msg, {}, "create");
    }
    LEAVE ("%zu accounts", book.accounts.size ());
    return book;
}
