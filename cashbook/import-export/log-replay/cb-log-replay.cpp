/********************************************************************
 * cb-log-replay.cpp - account changes recorded in the transaction logs*
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
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <map>
#include <sstream>

#include "cb-log-replay.hpp"
#include "cb-filepath-utils.hpp"
#include "TransLog.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_REPLAY;

/* Columns of a log row */
enum
{
    COL_MOD,
    COL_TRANS_GUID,
    COL_SPLIT_GUID,
    COL_TIME_NOW,
    COL_DATE_ENTERED,
    COL_DATE_POSTED,
    COL_ACC_GUID,
    COL_ACC_NAME,
    COL_NUM,
    COL_DESCRIPTION,
    COL_NOTES,
    COL_MEMO,
    COL_ACTION,
    COL_RECONCILED,
    COL_AMOUNT,
    COL_VALUE,
    COL_DATE_RECONCILED,
    COL_MIN_FIELDS = COL_NOTES
};

using StrVec = std::vector<std::string>;

struct split_rows
{
    StrVec before;
    StrVec changed;
};

static std::string
stamp_to_iso (const std::string& stamp)
{
    if (!cb_is_file_stamp (stamp))
        return {};
    return stamp.substr (0, 4) + "-" + stamp.substr (4, 2) + "-" +
        stamp.substr (6, 2) + "T" + stamp.substr (8, 2) + ":" +
        stamp.substr (10, 2) + ":" + stamp.substr (12, 2) + "Z";
}

static CbNumeric
row_amount (const std::string& field)
{
    if (field.empty())
        return {};
    try
    {
        return cb_numeric_from_fraction (field);
    }
    catch (const std::invalid_argument& e)
    {
        PWARN ("bad amount '%s': %s", field.c_str(), e.what());
        return {};
    }
}

static void
close_block (const std::vector<std::string>& order,
             const std::map<std::string, split_rows>& block,
             const std::string& changed_at,
             std::vector<CbAccountChange>& changes)
{
    for (const auto& guid : order)
    {
        const auto& rows = block.at (guid);
        const auto& b = rows.before;
        const auto& c = rows.changed;
        if (b.empty() || c.empty() || b[COL_ACC_GUID] == c[COL_ACC_GUID])
            continue;

        CbAccountChange change;
        change.changed_at = changed_at;
        change.trans_guid = b[COL_TRANS_GUID];
        change.split_guid = guid;
        change.date_posted = b[COL_DATE_POSTED].substr (0, 10);
        change.description = b[COL_DESCRIPTION];
        change.amount = b.size() > COL_AMOUNT ? row_amount (b[COL_AMOUNT])
            : CbNumeric{};
        change.from_account = {b[COL_ACC_GUID], b[COL_ACC_NAME]};
        change.to_account = {c[COL_ACC_GUID], c[COL_ACC_NAME]};
        DEBUG ("split %s: %s -> %s", guid.c_str(),
               change.from_account.name.c_str(), change.to_account.name.c_str());
        changes.push_back (std::move (change));
    }
}

std::vector<CbAccountChange>
cb_log_account_changes (const std::string& log_text, const std::string& stamp)
{
    std::vector<CbAccountChange> changes;
    auto changed_at = stamp_to_iso (stamp);
    std::istringstream in{log_text};
    std::string line;
    auto in_block = false;
    std::map<std::string, split_rows> block;
    std::vector<std::string> order;

    while (std::getline (in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (boost::starts_with (line, cb_trans_log_start))
        {
            in_block = true;
            block.clear();
            order.clear();
            continue;
        }
        if (boost::starts_with (line, cb_trans_log_end))
        {
            close_block (order, block, changed_at, changes);
            in_block = false;
            block.clear();
            order.clear();
            continue;
        }
        if (!in_block)
            continue;

        StrVec cols;
        boost::split (cols, line, boost::is_any_of ("\t"));
        if (cols.size() < COL_MIN_FIELDS || cols[COL_SPLIT_GUID].empty())
            continue;
        if (cols[COL_MOD].size() != 1)
            continue;

        auto mode = cols[COL_MOD][0];
        if (mode != CB_LOG_BEFORE && mode != CB_LOG_CHANGED)
            continue;
        auto guid = cols[COL_SPLIT_GUID];
        if (block.find (guid) == block.end())
            order.push_back (guid);
        auto& rows = block[guid];
        if (mode == CB_LOG_BEFORE)
            rows.before = std::move (cols);
        else
            rows.changed = std::move (cols);
    }
    if (in_block)
        PWARN ("log %s ends inside a START/END block", stamp.c_str());
    return changes;
}

std::vector<CbAccountChange>
cb_scan_account_changes (const std::string& ledger_path)
{
    ENTER ("%s", ledger_path.c_str());
    std::vector<CbAccountChange> changes;
    for (const auto& [stamp, path] : cb_find_stamped_siblings (ledger_path, "log"))
    {
        gchar* contents = nullptr;
        gsize length = 0;
        GError* error = nullptr;
        if (!g_file_get_contents (path.c_str(), &contents, &length, &error))
        {
            PWARN ("skipping %s: %s", path.c_str(), error->message);
            g_error_free (error);
            continue;
        }
        std::string text{contents, length};
        g_free (contents);

        auto found = cb_log_account_changes (text, stamp);
        changes.insert (changes.end(), found.begin(), found.end());
    }

    std::stable_sort (changes.begin(), changes.end(),
                      [](const CbAccountChange& a, const CbAccountChange& b)
                      { return a.changed_at > b.changed_at; });
    LEAVE ("%zu changes", changes.size());
    return changes;
}
