/********************************************************************
 * cashbook-core-app.hpp -- basic application object for cashbook binaries*
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


#ifndef CASHBOOK_CORE_APP_HPP
#define CASHBOOK_CORE_APP_HPP

#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <memory>
#include <string>
#include <vector>

#include "cb-config.hpp"

namespace Cashbook {

namespace bpo = boost::program_options;

class CoreApp
{
public:
    CoreApp (const char* app_name);

    /** Parse the options and read the settings file. */
    void parse_command_line (int argc, char **argv);
    void start (void);

protected:
    /** The ledger named on the command line, else the configured one.
     * Empty if neither is set. */
    std::string ledger_file (void) const;

    std::string m_app_name;
    std::string m_tagline;
    boost::optional <std::string> m_log_to_filename;
    boost::optional <std::string> m_file_to_load;
    CbConfig m_config;

    bpo::options_description m_opt_desc_all;
    std::unique_ptr<bpo::options_description> m_opt_desc_display;
    bpo::variables_map m_opt_map;
    bpo::positional_options_description m_pos_opt_desc;

private:
    void add_common_program_options (void);

    /* Command-line option variables */
    bool m_show_help = false;
    bool m_show_version = false;
    bool m_debug = false;
    bool m_have_config = false;
    boost::optional <std::string> m_config_file;
    std::vector <std::string> m_log_flags;
};

}
#endif
