/********************************************************************
 * cashbook-commands.hpp -- the actions of cashbook-cli            *
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


#ifndef CASHBOOK_COMMANDS_HPP
#define CASHBOOK_COMMANDS_HPP

#include <string>
#include <boost/optional.hpp>

class CbConfig;

using bo_str = boost::optional <std::string>;

namespace Cashbook {

    struct ImportOptions
    {
        std::string statement;
        bo_str target_account;
        bo_str offset_account;
        boost::optional <std::size_t> header_row;
        /** "date,description,amount[,memo]" column numbers, counted from 0 */
        bo_str column_map;
        bool negate = false;
        bool commit = false;
    };

    int list_accounts (const std::string& file_to_load);
    int list_transactions (const std::string& file_to_load,
                           const bo_str& account);
    int new_book (const std::string& file_to_load, CbConfig& config);
    int add_account (const std::string& file_to_load, const CbConfig& config,
                     const std::string& name, const std::string& type,
                     const bo_str& parent, bool placeholder);
    int rename_account (const std::string& file_to_load, const CbConfig& config,
                        const std::string& id, const std::string& name);
    int delete_account (const std::string& file_to_load, const CbConfig& config,
                        const std::string& id);
    int move_split (const std::string& file_to_load, const CbConfig& config,
                    const std::string& split_id, const std::string& account);
    int delete_transaction (const std::string& file_to_load,
                            const CbConfig& config, const std::string& id);
    int import_statement (const std::string& file_to_load,
                          const CbConfig& config, const ImportOptions& options);
    int change_log (const std::string& file_to_load);
}
#endif
