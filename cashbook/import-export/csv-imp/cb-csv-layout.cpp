/********************************************************************
 * cb-csv-layout.cpp - recognizing the columns of a statement      *
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


#include <boost/regex.hpp>
#include <algorithm>
#include <initializer_list>

#include "cb-csv-layout.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_CSV;

static const boost::regex header_keywords
    ("date|amount|debit|credit|payee|desc|memo|balance|reference|posting",
     boost::regex::icase);

int
cb_score_header_row (const StrVec& row)
{
    return std::count_if (row.begin(), row.end(), [](const std::string& cell)
                          { return boost::regex_search (cell, header_keywords); });
}

std::size_t
cb_detect_header_row (const std::vector<StrVec>& rows)
{
    std::size_t best = 0;
    auto best_score = -1;
    auto limit = std::min (rows.size(), CB_HEADER_SCAN_ROWS);
    for (std::size_t i = 0; i < limit; ++i)
    {
        if (rows[i].size() < 2)
            continue;
        auto score = cb_score_header_row (rows[i]);
        if (score > best_score)
        {
            best_score = score;
            best = i;
        }
        if (score >= CB_HEADER_GOOD_SCORE)
            break;
    }
    DEBUG ("header row %zu, score %d", best, best_score);
    return best;
}

/* Index of the first header matching @a pattern, -1 if none. */
static int
find_column (const StrVec& headers, const char* pattern)
{
    boost::regex re (pattern, boost::regex::icase);
    auto it = std::find_if (headers.begin(), headers.end(),
                            [&re](const std::string& h)
                            { return boost::regex_search (h, re); });
    return it == headers.end() ? -1 : static_cast<int>(it - headers.begin());
}

/* Index of the first header matching any of @a patterns, trying them in
 * order. */
static int
find_column (const StrVec& headers, std::initializer_list<const char*> patterns)
{
    for (auto pattern : patterns)
    {
        auto col = find_column (headers, pattern);
        if (col >= 0)
            return col;
    }
    return -1;
}

static std::optional<int>
optional_column (int col)
{
    if (col < 0)
        return std::nullopt;
    return col;
}

/* "Transaction Date","Post Date","Description","Category","Type","Amount","Memo" */
static bool
chase_detect (const StrVec& h)
{
    return find_column (h, "transaction.?date") >= 0 &&
        find_column (h, "description") >= 0;
}

static CbColumnMapping
chase_map (const StrVec& h)
{
    CbColumnMapping m;
    /* The posting date is what the bank's OFX download carries. */
    m.date = find_column (h, {"post.?date", "transaction.?date"});
    m.description = find_column (h, "description");
    m.amount = find_column (h, "^amount$");
    m.memo = optional_column (find_column (h, "memo"));
    return m;
}

/* "Posted Date","Reference Number","Payee","Address","Amount" */
static bool
bofa_detect (const StrVec& h)
{
    return find_column (h, "posted.?date") >= 0 && find_column (h, "payee") >= 0;
}

static CbColumnMapping
bofa_map (const StrVec& h)
{
    CbColumnMapping m;
    m.date = find_column (h, "posted.?date");
    m.description = find_column (h, {"payee", "description"});
    m.amount = find_column (h, "amount");
    return m;
}

/* "Run Date","Action","Symbol","Security Description","Security Type",
 * "Quantity","Price","Commission","Fees","Accrued Interest","Amount",
 * "Settlement Date" */
static bool
fidelity_detect (const StrVec& h)
{
    return find_column (h, "run.?date") >= 0 && find_column (h, "action") >= 0;
}

static CbColumnMapping
fidelity_map (const StrVec& h)
{
    CbColumnMapping m;
    m.date = find_column (h, "run.?date");
    m.description = find_column (h, "action");
    m.description_extra = optional_column (find_column (h, "security.?desc"));
    m.amount = find_column (h, "^amount$");
    m.memo = optional_column (find_column (h, "symbol"));
    return m;
}

struct csv_layout
{
    const char* name;
    bool (*detect)(const StrVec&);
    CbColumnMapping (*map)(const StrVec&);
};

static const csv_layout known_layouts[] =
{
    { "Chase", chase_detect, chase_map },
    { "BofA", bofa_detect, bofa_map },
    { "Fidelity", fidelity_detect, fidelity_map },
    { nullptr, nullptr, nullptr },
};

std::optional<CbColumnMapping>
cb_match_known_layout (const StrVec& headers)
{
    for (auto layout = known_layouts; layout->name; ++layout)
    {
        if (!layout->detect (headers))
            continue;
        auto mapping = layout->map (headers);
        if (mapping.date < 0 || mapping.description < 0 || mapping.amount < 0)
        {
            PINFO ("headers look like %s but a required column is missing",
                   layout->name);
            continue;
        }
        mapping.layout = layout->name;
        PINFO ("known layout %s", layout->name);
        return mapping;
    }
    return std::nullopt;
}

std::optional<CbColumnMapping>
cb_guess_column_mapping (const StrVec& headers)
{
    CbColumnMapping m;
    m.date = find_column (headers, {"^date$", "transaction.?date", "posted",
                                    "run.?date", "date"});
    m.description = find_column (headers, {"description", "payee", "name",
                                           "memo", "narrative"});
    m.amount = find_column (headers, {"^amount$", "debit.?credit", "credit",
                                      "debit", "amount"});
    m.memo = optional_column (find_column (headers, {"memo", "note"}));

    if (m.date < 0 || m.description < 0 || m.amount < 0)
    {
        DEBUG ("no mapping: date %d, description %d, amount %d", m.date,
               m.description, m.amount);
        return std::nullopt;
    }
    m.layout = "generic";
    return m;
}
