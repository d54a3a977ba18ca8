/********************************************************************
 * cb-filepath-utils.cpp - file path resolution utility functions  *
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
#include <boost/filesystem.hpp>
#include <algorithm>
#include <cctype>

#include "cb-filepath-utils.hpp"
#include "cb-log.hpp"

namespace bfs = boost::filesystem;

static CbLogModule log_module = CB_MOD_CONFIG;

static const std::string default_extension{"gnucash"};

std::string
cb_userconfig_dir (void)
{
    bfs::path dir;
    auto env = g_getenv ("CASHBOOK_CONFIG_HOME");
    if (env && *env)
        dir = bfs::path (env);
    else
        dir = bfs::path (g_get_user_config_dir ()) / "cashbook";

    if (!bfs::exists (dir))
    {
        DEBUG ("creating configuration directory %s", dir.string().c_str());
        bfs::create_directories (dir);
    }
    return dir.string();
}

std::string
cb_build_userconfig_path (const std::string& filename)
{
    return (bfs::path (cb_userconfig_dir ()) / filename).string();
}

std::string
cb_file_extension (const std::string& path)
{
    auto ext = bfs::path (path).extension().string();
    if (ext.size() < 2)
        return default_extension;
    return ext.substr (1);
}

std::string
cb_backup_path (const std::string& path, const std::string& stamp)
{
    return path + "." + stamp + "." + cb_file_extension (path);
}

std::string
cb_translog_path (const std::string& path, const std::string& stamp)
{
    return path + "." + stamp + ".log";
}

bool
cb_is_file_stamp (const std::string& stamp)
{
    return stamp.size() == 14 &&
        std::all_of (stamp.begin(), stamp.end(),
                     [](unsigned char c) { return std::isdigit (c); });
}

std::vector<CbStampedFile>
cb_find_stamped_siblings (const std::string& path, const std::string& ext)
{
    std::vector<CbStampedFile> found;
    auto ledger = bfs::path (path);
    auto dir = ledger.parent_path();
    if (dir.empty())
        dir = bfs::current_path();
    if (!bfs::is_directory (dir))
        return found;

    auto prefix = ledger.filename().string() + ".";
    auto suffix = "." + ext;
    for (auto& entry : bfs::directory_iterator (dir))
    {
        auto name = entry.path().filename().string();
        if (name.size() != prefix.size() + 14 + suffix.size())
            continue;
        if (name.compare (0, prefix.size(), prefix) != 0 ||
            name.compare (name.size() - suffix.size(), suffix.size(), suffix) != 0)
            continue;
        auto stamp = name.substr (prefix.size(), 14);
        if (!cb_is_file_stamp (stamp))
            continue;
        found.emplace_back (stamp, entry.path().string());
    }
    std::sort (found.begin(), found.end());
    return found;
}
