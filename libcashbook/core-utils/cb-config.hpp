/********************************************************************
 * cb-config.hpp - user settings for cashbook                      *
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

/** @file cb-config.hpp
 *  @brief Key file backed settings.
 *
 *  Settings live in a GKeyFile (default
 *  <tt>$XDG_CONFIG_HOME/cashbook/cashbook.conf</tt>):
 *  @verbatim
    [ledger]
    file=/home/me/books/household.gnucash
    compression-level=9
    [import]
    date-window=1
    description-prefix=20
    [log]
    to=stderr
 @endverbatim
 *  Missing keys yield the defaults. The ledger path may be overridden by the
 *  CASHBOOK_FILE or GNUCASH_FILE environment variables.
 */

#ifndef CB_CONFIG_HPP
#define CB_CONFIG_HPP

#include <glib.h>
#include <string>

class CbConfig
{
public:
    /** Use the configuration file in the user configuration directory. */
    CbConfig();
    explicit CbConfig(std::string filename);
    CbConfig(const CbConfig&) = delete;
    CbConfig& operator=(const CbConfig&) = delete;
    ~CbConfig();

    /** Read the key file.
     * @return false if it doesn't exist or can't be parsed; the defaults
     * remain in effect. */
    bool load();
    /** Write the key file.
     * @exception std::runtime_error if it can't be written. */
    void save() const;

    const std::string& filename() const { return m_filename; }
    /** Read and write @a filename from now on. Call load() again. */
    void set_filename(std::string filename) { m_filename = std::move(filename); }

    /** The ledger path: $CASHBOOK_FILE, else $GNUCASH_FILE, else the key
     * file's [ledger] file. Empty if none is set. */
    std::string ledger_file() const;
    /** Store @a path in [ledger] file and save. */
    void set_ledger_file(const std::string& path);

    int compression_level() const;
    int date_window() const;
    int description_prefix() const;
    std::string log_to() const;

    static constexpr int default_compression_level = 9;
    static constexpr int default_date_window = 1;
    static constexpr int default_description_prefix = 20;

private:
    int get_int(const char* group, const char* key, int def, int min, int max) const;

    std::string m_filename;
    GKeyFile* m_keyfile;
};

#endif // CB_CONFIG_HPP
