/********************************************************************
 * TransLog.cpp - the transaction logger                           *
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
#include <sstream>

#include "TransLog.hpp"
#include "cb-errors.hpp"
#include "cb-filepath-utils.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_TRANSLOG;

const char* cb_trans_log_header =
    "mod\ttrans_guid\tsplit_guid\ttime_now\t"
    "date_entered\tdate_posted\tacc_guid\tacc_name\t"
    "num\tdescription\tnotes\tmemo\taction\t"
    "reconciled\tamount\tvalue\tdate_reconciled\n"
    "-----------------";
const char* cb_trans_log_start = "===== START";
const char* cb_trans_log_end = "===== END";

std::string
cb_trans_log_split_row (char mode, const Transaction& trans, const Split& split,
                        const std::string& acc_name, const CbDateTime& now)
{
    auto posted = trans.date_posted.iso();
    auto entered = trans.date_entered ? trans.date_entered->iso() : posted;
    auto reconciled = split.reconcile_date ? split.reconcile_date->iso() :
        std::string{"1970-01-01"};
    auto amount = cb_numeric_to_fraction (split.value);

    std::ostringstream row;
    row << mode << '\t'
        << trans.id << '\t'
        << split.id << '\t'
        << now.format_zulu ("%Y-%m-%d %H:%M:%S") << '\t'
        << entered << '\t'
        << posted << '\t'
        << split.account << '\t'
        << acc_name << '\t'
        << '\t'                              // num
        << trans.description << '\t'
        << trans.notes << '\t'
        << split.memo << '\t'
        << split.action << '\t'
        << split.reconciled << '\t'
        << amount << '\t'
        << amount << '\t'
        << reconciled;
    return row.str();
}

static void
log_splits (std::ostringstream& out, char mode, const Transaction& trans,
            const LedgerBook& book, const CbDateTime& now)
{
    for (const auto& split : trans.splits)
    {
        auto acc = book.find_account (split.account);
        out << cb_trans_log_split_row (mode, trans, split,
                                       acc ? acc->name : std::string{}, now)
            << '\n';
    }
}

std::string
cb_trans_log_format (const Transaction* before, const Transaction* after,
                     const LedgerBook& book, const CbDateTime& now)
{
    std::ostringstream out;
    out << cb_trans_log_header << '\n' << cb_trans_log_start << '\n';
    if (before && after)
    {
        log_splits (out, CB_LOG_BEFORE, *before, book, now);
        log_splits (out, CB_LOG_CHANGED, *after, book, now);
    }
    else if (after)
    {
        log_splits (out, CB_LOG_NEW, *after, book, now);
    }
    else if (before)
    {
        log_splits (out, CB_LOG_DELETED, *before, book, now);
    }
    out << cb_trans_log_end << '\n';
    return out.str();
}

std::string
cb_trans_log_write (const std::string& ledger_path, const Transaction* before,
                    const Transaction* after, const LedgerBook& book,
                    const CbDateTime& now)
{
    auto path = cb_translog_path (ledger_path, cb_file_stamp (now));
    auto text = cb_trans_log_format (before, after, book, now);
    ENTER ("%s", path.c_str());

    GError* error = nullptr;
    if (!g_file_set_contents (path.c_str(), text.c_str(), text.size(), &error))
    {
        std::string msg{"Unable to write the transaction log " + path + ": " +
                error->message};
        g_error_free (error);
        PERR ("%s", msg.c_str());
        auto id = after ? after->id : before ? before->id : std::string{};
        throw CbWriteError (ERR_FILEIO_WRITE_ERROR, msg, id, "log");
    }
    LEAVE ("%zu bytes", text.size());
    return path;
}
