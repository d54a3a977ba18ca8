/********************************************************************
 * cashbook-commands.cpp -- the actions of cashbook-cli            *
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


#include "cashbook-commands.hpp"

#include <glib.h>
#include <cb-book.hpp>
#include <cb-config.hpp>
#include <cb-errors.hpp>
#include <cb-log.hpp>
#include <cb-xml-backend.hpp>
#include <import-backend.hpp>
#include <import-parse.hpp>
#include <cb-log-replay.hpp>

#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <vector>

/* This static indicates the debugging module that this .o belongs to.  */
static CbLogModule log_module = CB_MOD_CLI;

template <typename Command> static int
run_command (const char* name, Command&& command)
{
    try
    {
        return command ();
    }
    catch (const CbError& err)
    {
        PERR ("%s failed: %s", name, err.what ());
        std::cerr << name << ": " << err.what () << " ("
                  << cb_backend_error_to_string (err.code ()) << ")\n";
    }
    catch (const std::exception& err)
    {
        PERR ("%s failed: %s", name, err.what ());
        std::cerr << name << ": " << err.what () << "\n";
    }
    return 1;
}

static void
require_ledger (const std::string& file_to_load)
{
    if (file_to_load.empty ())
        throw std::invalid_argument ("Missing data file parameter and no "
                                     "ledger is configured");
}

/* An account given by id, else by full name ("Expenses:Groceries"), else by
 * a unique plain name. */
static const Account*
resolve_account (const LedgerBook& book, const std::string& ref,
                 const char* operation)
{
    if (auto acc = book.find_account (ref))
        return acc;
    const Account* found = nullptr;
    for (const auto& acc : book.accounts)
    {
        if (book.full_name (acc.id) == ref)
            return &acc;
        if (acc.name == ref)
        {
            if (found)
                throw CbConstraintError (ref, operation,
                                         "names more than one account");
            found = &acc;
        }
    }
    if (!found)
        throw CbNotFoundError (ref, operation);
    return found;
}

static void
print_account (const LedgerBook& book, const Account& acc, int depth)
{
    std::cout << acc.id << "  " << std::left << std::setw (10)
              << cb_account_type_to_string (acc.type) << "  "
              << std::string (depth * 2, ' ') << acc.name;
    if (acc.placeholder)
        std::cout << " [placeholder]";
    std::cout << "  " << book.balance (acc.id).to_decimal_string (2) << "\n";
}

static void
print_account_tree (const LedgerBook& book, const std::string& parent,
                    int depth)
{
    for (const auto& id : book.children (parent))
    {
        auto acc = book.find_account (id);
        if (!acc)
            continue;
        print_account (book, *acc, depth);
        print_account_tree (book, id, depth + 1);
    }
}

int
Cashbook::list_accounts (const std::string& file_to_load)
{
    return run_command ("accounts", [&] {
        require_ledger (file_to_load);
        CbXmlBackend backend{file_to_load};
        auto book = backend.load ();
        if (auto root = book->root ())
            print_account_tree (*book, root->id, 0);
        else
            for (const auto& acc : book->accounts)
                print_account (*book, acc, 0);
        return 0;
    });
}

static void
print_transaction (const LedgerBook& book, const Transaction& trn)
{
    std::cout << trn.date_posted.iso () << "  " << trn.id << "  "
              << trn.description << "\n";
    for (const auto& split : trn.splits)
    {
        std::cout << "    " << std::left << std::setw (36)
                  << book.full_name (split.account) << std::right
                  << std::setw (14) << split.value.to_decimal_string (2);
        if (!split.memo.empty ())
            std::cout << "  " << split.memo;
        std::cout << "\n";
    }
}

int
Cashbook::list_transactions (const std::string& file_to_load,
                             const bo_str& account)
{
    return run_command ("transactions", [&] {
        require_ledger (file_to_load);
        CbXmlBackend backend{file_to_load};
        auto book = backend.load ();
        std::string account_id;
        if (account)
            account_id = resolve_account (*book, *account, "transactions")->id;

        std::vector<const Transaction*> listed;
        for (const auto& trn : book->transactions)
        {
            if (!account_id.empty () &&
                std::none_of (trn.splits.begin (), trn.splits.end (),
                              [&account_id](const Split& split)
                              { return split.account == account_id; }))
                continue;
            listed.push_back (&trn);
        }
        std::stable_sort (listed.begin (), listed.end (),
                          [](const Transaction* a, const Transaction* b)
                          { return a->date_posted < b->date_posted; });
        for (auto trn : listed)
            print_transaction (*book, *trn);
        return 0;
    });
}

int
Cashbook::new_book (const std::string& file_to_load, CbConfig& config)
{
    return run_command ("new", [&] {
        require_ledger (file_to_load);
        auto book = cb_xml_create_new_book (file_to_load,
                                            config.compression_level ());
        config.set_ledger_file (file_to_load);
        std::cout << "Created " << file_to_load << " with "
                  << book.accounts.size () << " accounts\n";
        return 0;
    });
}

int
Cashbook::add_account (const std::string& file_to_load, const CbConfig& config,
                       const std::string& name, const std::string& type,
                       const bo_str& parent, bool placeholder)
{
    return run_command ("add-account", [&] {
        require_ledger (file_to_load);
        CbAccountType acct_type;
        if (!cb_account_string_to_type (boost::algorithm::to_upper_copy (type),
                                        &acct_type))
            throw std::invalid_argument ("Unknown account type '" + type + "'");

        CbXmlBackend backend{file_to_load, config.compression_level ()};
        auto book = backend.load ();
        std::string parent_id;
        if (parent)
            parent_id = resolve_account (*book, *parent, "add-account")->id;
        else if (auto root = book->root ())
            parent_id = root->id;
        else
            throw CbConstraintError (name, "add-account",
                                     "has no parent and the ledger no root");

        auto acc = cb_account_create (name, acct_type, parent_id);
        acc.placeholder = placeholder;
        backend.write_account (acc, CB_WRITE_CREATE);
        std::cout << acc.id << "\n";
        return 0;
    });
}

int
Cashbook::rename_account (const std::string& file_to_load,
                          const CbConfig& config, const std::string& id,
                          const std::string& name)
{
    return run_command ("rename-account", [&] {
        require_ledger (file_to_load);
        CbXmlBackend backend{file_to_load, config.compression_level ()};
        backend.rename_account (id, name);
        return 0;
    });
}

int
Cashbook::delete_account (const std::string& file_to_load,
                          const CbConfig& config, const std::string& id)
{
    return run_command ("delete-account", [&] {
        require_ledger (file_to_load);
        CbXmlBackend backend{file_to_load, config.compression_level ()};
        Account acc;
        acc.id = id;
        backend.write_account (acc, CB_WRITE_DELETE);
        std::cout << "Deleted account " << id << "; backup in "
                  << backend.last_backup () << "\n";
        return 0;
    });
}

int
Cashbook::move_split (const std::string& file_to_load, const CbConfig& config,
                      const std::string& split_id, const std::string& account)
{
    static const char* operation = "move-split";
    return run_command (operation, [&] {
        require_ledger (file_to_load);
        CbXmlBackend backend{file_to_load, config.compression_level ()};
        auto book = backend.load ();
        auto acc = resolve_account (*book, account, operation);
        if (acc->placeholder)
            throw CbConstraintError (acc->id, operation, "is a placeholder");

        for (const auto& trn : book->transactions)
        {
            if (!trn.find_split (split_id))
                continue;
            auto after = trn;
            for (auto& split : after.splits)
                if (split.id == split_id)
                    split.account = acc->id;
            backend.write_transaction (&trn, &after, CB_WRITE_UPDATE);
            std::cout << "Moved split " << split_id << " of " << trn.id
                      << " to " << book->full_name (acc->id) << "\n";
            return 0;
        }
        throw CbNotFoundError (split_id, operation);
    });
}

int
Cashbook::delete_transaction (const std::string& file_to_load,
                              const CbConfig& config, const std::string& id)
{
    return run_command ("delete-transaction", [&] {
        require_ledger (file_to_load);
        CbXmlBackend backend{file_to_load, config.compression_level ()};
        /* The backend logs the transaction as the file has it. */
        Transaction trn;
        trn.id = id;
        backend.write_transaction (nullptr, &trn, CB_WRITE_DELETE);
        std::cout << "Deleted transaction " << id << "; backup in "
                  << backend.last_backup () << "\n";
        return 0;
    });
}

static CbColumnMapping
parse_column_map (const std::string& map)
{
    std::vector<std::string> cols;
    boost::split (cols, map, [](char c){ return c == ','; });
    if (cols.size () < 3 || cols.size () > 4)
        throw std::invalid_argument ("--map needs date,description,amount[,memo]");

    std::vector<int> index;
    for (auto col : cols)
    {
        boost::algorithm::trim (col);
        std::size_t used = 0;
        auto val = std::stoi (col, &used);
        if (used != col.size () || val < 0)
            throw std::invalid_argument ("Bad column number '" + col + "' in --map");
        index.push_back (val);
    }

    CbColumnMapping mapping;
    mapping.date = index[0];
    mapping.description = index[1];
    mapping.amount = index[2];
    if (index.size () == 4)
        mapping.memo = index[3];
    mapping.layout = "user";
    return mapping;
}

static std::string
read_statement (const std::string& filename)
{
    gchar* contents = nullptr;
    gsize length = 0;
    GError* error = nullptr;
    if (!g_file_get_contents (filename.c_str (), &contents, &length, &error))
    {
        std::string msg{error->message};
        g_error_free (error);
        throw CbImportFormatError (filename, msg);
    }
    std::string data{contents, length};
    g_free (contents);
    return data;
}

static void
print_import_row (const CbImportRow& row)
{
    std::cout << row.date.iso () << "  " << std::right << std::setw (12)
              << row.amount.to_decimal_string (2) << "  " << std::left
              << std::setw (40) << row.description;
    if (!row.online_id.empty ())
        std::cout << "  id " << row.online_id;
    if (row.is_duplicate)
        std::cout << "  [duplicate]";
    std::cout << "\n";
}

int
Cashbook::import_statement (const std::string& file_to_load,
                            const CbConfig& config, const ImportOptions& options)
{
    static const char* operation = "import";
    return run_command (operation, [&] {
        require_ledger (file_to_load);
        auto data = read_statement (options.statement);
        CbXmlBackend backend{file_to_load, config.compression_level ()};
        auto book = backend.load ();

        const Account* target = nullptr;
        if (options.target_account)
            target = resolve_account (*book, *options.target_account, operation);

        std::vector<CbImportRow> rows;
        if (options.column_map)
        {
            auto mapping = parse_column_map (*options.column_map);
            mapping.negate = options.negate;
            mapping.header_row = options.header_row;
            rows = cb_parse_import_file_with_mapping (data, mapping,
                                                      options.statement);
        }
        else
        {
            auto result = cb_parse_import_file (data, options.statement,
                                                options.header_row);
            if (result.needs_mapping)
            {
                std::cout << "The columns of " << options.statement
                          << " weren't recognized. Its headers are:\n";
                for (std::size_t i = 0; i < result.headers.size (); ++i)
                    std::cout << "  " << i << ": " << result.headers[i] << "\n";
                std::cout << "Give them with --map date,description,amount[,memo]\n";
                return 1;
            }
            PINFO ("%s parsed as %s, layout '%s'", options.statement.c_str (),
                   result.format.c_str (), result.layout.c_str ());
            if (!result.suggested_account_hint.empty ())
                std::cout << "Statement account: "
                          << result.suggested_account_hint << "\n";
            rows = std::move (result.rows);
            if (options.negate)
                for (auto& row : rows)
                    row.amount = -row.amount;
        }

        rows = cb_reconcile_duplicates (std::move (rows), *book,
                                        target ? target->id : std::string{},
                                        config.date_window (),
                                        config.description_prefix ());
        for (const auto& row : rows)
            print_import_row (row);
        auto duplicates = std::count_if (rows.begin (), rows.end (),
                                         [](const CbImportRow& row)
                                         { return row.is_duplicate; });

        if (!options.commit)
        {
            std::cout << rows.size () << " rows, " << duplicates
                      << " duplicates\n";
            return 0;
        }

        if (!target)
            throw std::invalid_argument ("--commit needs --target-account");
        if (target->placeholder)
            throw CbConstraintError (target->id, operation, "is a placeholder");
        const Account* offset = nullptr;
        if (options.offset_account)
            offset = resolve_account (*book, *options.offset_account, operation);
        else
            offset = cb_import_offset_account (*book);
        if (!offset)
            throw CbNotFoundError (std::string{"Imbalance-"} +
                                   cb_default_currency.id, operation);
        if (offset->placeholder)
            throw CbConstraintError (offset->id, operation, "is a placeholder");

        std::size_t imported = 0;
        for (const auto& row : rows)
        {
            if (row.is_duplicate)
                continue;
            auto trn = cb_import_row_to_transaction (row, target->id, offset->id);
            backend.write_transaction (nullptr, &trn, CB_WRITE_CREATE);
            ++imported;
        }
        std::cout << "Imported " << imported << " transactions into "
                  << book->full_name (target->id) << ", skipped " << duplicates
                  << " duplicates\n";
        return 0;
    });
}

int
Cashbook::change_log (const std::string& file_to_load)
{
    return run_command ("change-log", [&] {
        require_ledger (file_to_load);
        for (const auto& change : cb_scan_account_changes (file_to_load))
        {
            std::cout << change.changed_at << "  " << change.date_posted << "  "
                      << std::right << std::setw (12)
                      << change.amount.to_decimal_string (2) << "  "
                      << change.description << "\n    "
                      << change.from_account.name << " -> "
                      << change.to_account.name << "  (split "
                      << change.split_guid << ")\n";
        }
        return 0;
    });
}
