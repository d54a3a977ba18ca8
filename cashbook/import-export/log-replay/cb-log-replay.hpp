/********************************************************************
 * cb-log-replay.hpp - account changes recorded in the transaction logs*
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
    @brief Reading back the .log files written beside the ledger.
    *
    Each mutation's START/END block holds a B row and a C row for every
    split of an updated transaction. A split whose account guid differs
    between the two was moved to another account; these moves are the
    ledger's recategorization history.
*/

#ifndef CB_LOG_REPLAY_HPP
#define CB_LOG_REPLAY_HPP

#include <string>
#include <vector>

#include "cb-numeric.hpp"

struct CbAccountRef
{
    std::string id;
    std::string name;
};

struct CbAccountChange
{
    /** When the log was written, "YYYY-MM-DDTHH:MM:SSZ". */
    std::string changed_at;
    std::string trans_guid;
    std::string split_guid;
    /** "YYYY-MM-DD" */
    std::string date_posted;
    std::string description;
    CbNumeric amount;
    CbAccountRef from_account;
    CbAccountRef to_account;
};

/** The account changes in the text of one log stamped @a stamp
 * (YYYYMMDDHHMMSS), in the order they appear. */
std::vector<CbAccountChange> cb_log_account_changes (const std::string& log_text,
                                                     const std::string& stamp);

/** The account changes in all the logs beside @a ledger_path, newest first.
 * Logs that can't be read are skipped with a warning. */
std::vector<CbAccountChange> cb_scan_account_changes (const std::string& ledger_path);

#endif
