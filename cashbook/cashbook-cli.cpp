/********************************************************************
 * cashbook-cli.cpp -- command line maintenance of a GnuCash ledger*
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
#include "cashbook-core-app.hpp"

#include <cb-log.hpp>

#include <boost/optional.hpp>
#include <iostream>

/* This static indicates the debugging module that this .o belongs to.  */
static CbLogModule log_module = CB_MOD_CLI;

namespace Cashbook {

    class CashbookCli : public CoreApp
    {
    public:
        CashbookCli (const char* app_name);
        void parse_command_line (int argc, char **argv);
        int start (int argc, char **argv);
    private:
        void configure_program_options (void);
        int missing (const char* what);

        bool m_list_accounts = false;
        bool m_list_transactions = false;
        bool m_new_book = false;
        bool m_change_log = false;
        bo_str m_account;

        bo_str m_add_account;
        bo_str m_account_type;
        bo_str m_parent;
        bool m_placeholder = false;
        bo_str m_rename_account;
        bo_str m_new_name;
        bo_str m_delete_account;
        bo_str m_move_split;
        bo_str m_to_account;
        bo_str m_delete_transaction;

        bo_str m_import;
        bo_str m_target_account;
        bo_str m_offset_account;
        boost::optional <std::size_t> m_header_row;
        bo_str m_column_map;
        bool m_negate = false;
        bool m_commit = false;
    };

}

Cashbook::CashbookCli::CashbookCli (const char *app_name) : Cashbook::CoreApp (app_name)
{
    configure_program_options();
}

void
Cashbook::CashbookCli::parse_command_line (int argc, char **argv)
{
    Cashbook::CoreApp::parse_command_line (argc, argv);

    if (!m_log_to_filename || m_log_to_filename->empty())
        m_log_to_filename = "stderr";
}

// Define command line options specific to cashbook-cli.
void
Cashbook::CashbookCli::configure_program_options (void)
{
    bpo::options_description ledger_options("Ledger Options");
    ledger_options.add_options()
    ("accounts", bpo::bool_switch (&m_list_accounts),
     "List the account tree with balances.")
    ("transactions", bpo::bool_switch (&m_list_transactions),
     "List the transactions by posted date; --account limits them to one account.")
    ("account", bpo::value (&m_account),
     "Account id, full name or unique name for --transactions.")
    ("new", bpo::bool_switch (&m_new_book),
     "Write a new ledger with the standard account tree and make it the configured ledger.")
    ("add-account", bpo::value (&m_add_account),
     "Add an account of the given name; needs --type.")
    ("type", bpo::value (&m_account_type),
     "Account type for --add-account: BANK, CASH, CREDIT, ASSET, LIABILITY, STOCK, MUTUAL, INCOME, EXPENSE, EQUITY, RECEIVABLE, PAYABLE or TRADING.")
    ("parent", bpo::value (&m_parent),
     "Parent account for --add-account; defaults to the top level.")
    ("placeholder", bpo::bool_switch (&m_placeholder),
     "Make the account added a placeholder.")
    ("rename-account", bpo::value (&m_rename_account),
     "Rename the account of this id; needs --name.")
    ("name", bpo::value (&m_new_name),
     "New name for --rename-account.")
    ("delete-account", bpo::value (&m_delete_account),
     "Delete the account of this id. Accounts with splits or children are kept.")
    ("move-split", bpo::value (&m_move_split),
     "Move the split of this id to another account; needs --to-account.")
    ("to-account", bpo::value (&m_to_account),
     "Destination account for --move-split.")
    ("delete-transaction", bpo::value (&m_delete_transaction),
     "Delete the transaction of this id.")
    ("change-log", bpo::bool_switch (&m_change_log),
     "List the splits moved between accounts, newest first.");

    m_opt_desc_display->add (ledger_options);
    m_opt_desc_all.add (ledger_options);

    bpo::options_description import_options("Statement Import Options");
    import_options.add_options()
    ("import", bpo::value (&m_import),
     "Preview a QFX, OFX, CSV or XLSX statement, flagging rows already in the ledger. "
     "Binary .xls workbooks are refused, export them as .xlsx or .csv.")
    ("target-account", bpo::value (&m_target_account),
     "Account the statement belongs to.")
    ("offset-account", bpo::value (&m_offset_account),
     "Account balancing imported transactions; defaults to Imbalance-USD.")
    ("header-row", bpo::value (&m_header_row),
     "Row of the column headers, counted from 0; detected when not given.")
    ("map", bpo::value (&m_column_map),
     "Column numbers of date,description,amount[,memo], counted from 0.")
    ("negate", bpo::bool_switch (&m_negate),
     "Reverse the sign of the amounts.")
    ("commit", bpo::bool_switch (&m_commit),
     "Add the rows that aren't duplicates to the ledger.");

    m_opt_desc_display->add (import_options);
    m_opt_desc_all.add (import_options);
}

int
Cashbook::CashbookCli::missing (const char* what)
{
    std::cerr << "Missing " << what << " parameter" << "\n\n"
              << *m_opt_desc_display.get();
    return 1;
}

int
Cashbook::CashbookCli::start ([[maybe_unused]] int argc, [[maybe_unused]] char **argv)
{
    Cashbook::CoreApp::start();

    auto file = ledger_file ();
    PINFO ("ledger %s", file.c_str ());

    if (m_new_book)
    {
        if (!m_file_to_load || m_file_to_load->empty())
            return missing ("--file");
        return Cashbook::new_book (*m_file_to_load, m_config);
    }

    if (m_list_accounts)
        return Cashbook::list_accounts (file);

    if (m_list_transactions)
        return Cashbook::list_transactions (file, m_account);

    if (m_add_account)
    {
        if (!m_account_type)
            return missing ("--type");
        return Cashbook::add_account (file, m_config, *m_add_account,
                                      *m_account_type, m_parent, m_placeholder);
    }

    if (m_rename_account)
    {
        if (!m_new_name || m_new_name->empty())
            return missing ("--name");
        return Cashbook::rename_account (file, m_config, *m_rename_account,
                                         *m_new_name);
    }

    if (m_delete_account)
        return Cashbook::delete_account (file, m_config, *m_delete_account);

    if (m_move_split)
    {
        if (!m_to_account)
            return missing ("--to-account");
        return Cashbook::move_split (file, m_config, *m_move_split,
                                     *m_to_account);
    }

    if (m_delete_transaction)
        return Cashbook::delete_transaction (file, m_config,
                                             *m_delete_transaction);

    if (m_import)
    {
        Cashbook::ImportOptions options;
        options.statement = *m_import;
        options.target_account = m_target_account;
        options.offset_account = m_offset_account;
        options.header_row = m_header_row;
        options.column_map = m_column_map;
        options.negate = m_negate;
        options.commit = m_commit;
        return Cashbook::import_statement (file, m_config, options);
    }

    if (m_change_log)
        return Cashbook::change_log (file);

    std::cerr << "Missing command or option" << "\n\n"
              << *m_opt_desc_display.get();
    return 1;
}

int
main(int argc, char **argv)
{
    Cashbook::CashbookCli application (argv[0]);

    application.parse_command_line (argc, argv);
    auto status = application.start (argc, argv);
    cb_log_shutdown ();
    return status;
}
