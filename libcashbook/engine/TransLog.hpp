/********************************************************************
 * TransLog.hpp - the transaction logger                           *
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

/** @file TransLog.hpp
 *  Every mutation of the ledger is journaled to a tab-delimited file next to
 *  it, <tt>\<ledger\>.YYYYMMDDHHMMSS.log</tt>, in the same layout GnuCash
 *  writes its own .log files so that tools reading those keep working:
 *
 *  @verbatim
 mod	trans_guid	split_guid	time_now	date_entered	date_posted	acc_guid	acc_name	num	description	notes	memo	action	reconciled	amount	value	date_reconciled
 -----------------
 ===== START
 B	...
 C	...
 ===== END
 @endverbatim
 *
 *  The mod column is B (before the change) and C (changed to) for an update,
 *  N for a new transaction and D for a deleted one. Each line ends in a
 *  newline, the last one included.
 */

#ifndef CB_TRANS_LOG_HPP
#define CB_TRANS_LOG_HPP

#include <string>

#include "Transaction.hpp"
#include "cb-book.hpp"
#include "cb-datetime.hpp"

/** @name Log row modes
 * @{ */
#define CB_LOG_BEFORE  'B'
#define CB_LOG_CHANGED 'C'
#define CB_LOG_NEW     'N'
#define CB_LOG_DELETED 'D'
/** @} */

extern const char* cb_trans_log_header;
extern const char* cb_trans_log_start;
extern const char* cb_trans_log_end;

/** Format one split row, without the line terminator.
 *
 * Text fields are written verbatim: a tab or newline inside a description,
 * notes or memo shifts the following columns.
 *
 * @param mode One of the row modes above.
 * @param acc_name The name of the split's account.
 * @param now The wall-clock time of the mutation.
 */
std::string cb_trans_log_split_row (char mode, const Transaction& trans,
                                    const Split& split,
                                    const std::string& acc_name,
                                    const CbDateTime& now);

/** Format the log of one mutation.
 *
 * Both @a before and @a after present logs an update, only @a after a
 * creation and only @a before a deletion. With neither, as for account
 * mutations, the START/END block is empty. Account names are looked up in
 * @a book.
 */
std::string cb_trans_log_format (const Transaction* before,
                                 const Transaction* after,
                                 const LedgerBook& book, const CbDateTime& now);

/** Write cb_trans_log_format()'s output to the log file for @a ledger_path
 * stamped @a now, replacing a log of the same second.
 *
 * @return The log file's path.
 * @exception CbWriteError if the file can't be written.
 */
std::string cb_trans_log_write (const std::string& ledger_path,
                                const Transaction* before,
                                const Transaction* after,
                                const LedgerBook& book, const CbDateTime& now);

#endif /* CB_TRANS_LOG_HPP */
