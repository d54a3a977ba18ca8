/********************************************************************
 * gtest-cb-filepath-utils.cpp -- tests of the file path utilities *
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
#include <glib/gstdio.h>
#include <gtest/gtest.h>

#include "../cb-filepath-utils.hpp"

TEST(CbFilepathUtils, test_extension)
{
    EXPECT_EQ ("gnucash", cb_file_extension ("/home/me/household.gnucash"));
    EXPECT_EQ ("gz", cb_file_extension ("books/household.xml.gz"));
    EXPECT_EQ ("gnucash", cb_file_extension ("household"));
}

TEST(CbFilepathUtils, test_stamped_paths)
{
    EXPECT_EQ ("/b/h.gnucash.20240310105900.gnucash",
               cb_backup_path ("/b/h.gnucash", "20240310105900"));
    EXPECT_EQ ("/b/h.gnucash.20240310105900.log",
               cb_translog_path ("/b/h.gnucash", "20240310105900"));
    EXPECT_TRUE (cb_is_file_stamp ("20240310105900"));
    EXPECT_FALSE (cb_is_file_stamp ("2024031010590"));
    EXPECT_FALSE (cb_is_file_stamp ("2024031010590x"));
}

TEST(CbFilepathUtils, test_userconfig_dir)
{
    auto dir = g_dir_make_tmp ("cashbook-home-XXXXXX", nullptr);
    ASSERT_NE (nullptr, dir);
    auto config_home = std::string{dir} + "/config";
    g_setenv ("CASHBOOK_CONFIG_HOME", config_home.c_str (), TRUE);
    EXPECT_EQ (config_home, cb_userconfig_dir ());
    EXPECT_TRUE (g_file_test (config_home.c_str (), G_FILE_TEST_IS_DIR));
    EXPECT_EQ (config_home + "/log.conf", cb_build_userconfig_path ("log.conf"));
    g_unsetenv ("CASHBOOK_CONFIG_HOME");
    g_rmdir (config_home.c_str ());
    g_rmdir (dir);
    g_free (dir);
}

TEST(CbFilepathUtils, test_find_stamped_siblings)
{
    auto dir = g_dir_make_tmp ("cashbook-siblings-XXXXXX", nullptr);
    ASSERT_NE (nullptr, dir);
    std::string base{dir};
    auto ledger = base + "/h.gnucash";
    const char* names[] = {"/h.gnucash.20240311000000.log",
                           "/h.gnucash.20240310105900.log",
                           "/h.gnucash.20240310105900.gnucash",
                           "/h.gnucash.2024031010590.log",
                           "/other.gnucash.20240310105900.log"};
    for (auto name : names)
        ASSERT_TRUE (g_file_set_contents ((base + name).c_str (), "", 0, nullptr));

    auto logs = cb_find_stamped_siblings (ledger, "log");
    ASSERT_EQ (2u, logs.size ());
    EXPECT_EQ ("20240310105900", logs[0].first);
    EXPECT_EQ (base + "/h.gnucash.20240310105900.log", logs[0].second);
    EXPECT_EQ ("20240311000000", logs[1].first);

    auto backups = cb_find_stamped_siblings (ledger, "gnucash");
    ASSERT_EQ (1u, backups.size ());

    EXPECT_TRUE (cb_find_stamped_siblings (base + "/none/h.gnucash", "log").empty ());

    for (auto name : names)
        g_unlink ((base + name).c_str ());
    g_rmdir (dir);
    g_free (dir);
}
