/********************************************************************
 * cb-filepath-utils.hpp - file path resolution utility functions  *
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

/** @addtogroup Utils
 * @{ */
/** @file cb-filepath-utils.hpp
 *  @brief Naming of ledger side files and the user configuration directory.
 *
 *  Writes to a ledger leave two kinds of sibling files next to it: verbatim
 *  backups named <tt>\<ledger\>.YYYYMMDDHHMMSS.\<ext\></tt> and audit logs named
 *  <tt>\<ledger\>.YYYYMMDDHHMMSS.log</tt>. The stamps are UTC.
 */

#ifndef CB_FILEPATH_UTILS_HPP
#define CB_FILEPATH_UTILS_HPP

#include <string>
#include <utility>
#include <vector>

/** A stamped sibling file: the 14 digit stamp and the full path. */
using CbStampedFile = std::pair<std::string, std::string>;

/** Return the directory holding cashbook's configuration files, creating it
 * if it does not exist. $CASHBOOK_CONFIG_HOME overrides the XDG default.
 *
 * @exception boost::filesystem::filesystem_error if the directory can't be
 * created.
 */
std::string cb_userconfig_dir (void);

/** Return @a filename inside cb_userconfig_dir(). */
std::string cb_build_userconfig_path (const std::string& filename);

/** The extension of @a path without the leading dot, "gnucash" if it has
 * none. */
std::string cb_file_extension (const std::string& path);

/** <tt>\<path\>.\<stamp\>.\<extension of path\></tt> */
std::string cb_backup_path (const std::string& path, const std::string& stamp);

/** <tt>\<path\>.\<stamp\>.log</tt> */
std::string cb_translog_path (const std::string& path, const std::string& stamp);

/** True if @a stamp is exactly 14 ASCII digits. */
bool cb_is_file_stamp (const std::string& stamp);

/** Find the files beside @a path named <tt>\<filename of path\>.\<stamp\>.\<ext\></tt>.
 *
 * @return The matches sorted by ascending stamp; empty if the directory
 * doesn't exist.
 */
std::vector<CbStampedFile> cb_find_stamped_siblings (const std::string& path,
                                                     const std::string& ext);

#endif /* CB_FILEPATH_UTILS_HPP */
/** @} */
