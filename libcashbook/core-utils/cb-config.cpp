/********************************************************************
 * cb-config.cpp - user settings for cashbook                      *
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
#include <stdexcept>

#include "cb-config.hpp"
#include "cb-filepath-utils.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_CONFIG;

#define CONFIG_FILE_NAME "cashbook.conf"

#define GROUP_LEDGER "ledger"
#define GROUP_IMPORT "import"
#define GROUP_LOG    "log"

#define KEY_FILE              "file"
#define KEY_COMPRESSION_LEVEL "compression-level"
#define KEY_DATE_WINDOW       "date-window"
#define KEY_DESC_PREFIX       "description-prefix"
#define KEY_LOG_TO            "to"

CbConfig::CbConfig() : CbConfig(cb_build_userconfig_path(CONFIG_FILE_NAME)) {}

CbConfig::CbConfig(std::string filename) :
    m_filename{std::move(filename)}, m_keyfile{g_key_file_new()} {}

CbConfig::~CbConfig()
{
    g_key_file_free(m_keyfile);
}

bool
CbConfig::load()
{
    GError* error = nullptr;
    if (!g_key_file_load_from_file(m_keyfile, m_filename.c_str(),
                                   G_KEY_FILE_KEEP_COMMENTS, &error))
    {
        if (!g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT))
            PWARN("Unable to read %s: %s", m_filename.c_str(), error->message);
        g_error_free(error);
        return false;
    }
    DEBUG("loaded settings from %s", m_filename.c_str());
    return true;
}

void
CbConfig::save() const
{
    GError* error = nullptr;
    if (!g_key_file_save_to_file(m_keyfile, m_filename.c_str(), &error))
    {
        std::string msg{"Unable to save settings to " + m_filename + ": " +
                error->message};
        g_error_free(error);
        PERR("%s", msg.c_str());
        throw std::runtime_error(msg);
    }
}

std::string
CbConfig::ledger_file() const
{
    for (auto var : {"CASHBOOK_FILE", "GNUCASH_FILE"})
    {
        auto env = g_getenv(var);
        if (env && *env)
            return env;
    }

    auto path = g_key_file_get_string(m_keyfile, GROUP_LEDGER, KEY_FILE, nullptr);
    if (!path)
        return {};
    std::string retval{path};
    g_free(path);
    return retval;
}

void
CbConfig::set_ledger_file(const std::string& path)
{
    g_key_file_set_string(m_keyfile, GROUP_LEDGER, KEY_FILE, path.c_str());
    save();
}

int
CbConfig::get_int(const char* group, const char* key, int def, int min, int max) const
{
    GError* error = nullptr;
    auto value = g_key_file_get_integer(m_keyfile, group, key, &error);
    if (error)
    {
        if (error->code != G_KEY_FILE_ERROR_KEY_NOT_FOUND &&
            error->code != G_KEY_FILE_ERROR_GROUP_NOT_FOUND)
            PWARN("Error reading [%s] %s: %s", group, key, error->message);
        g_error_free(error);
        return def;
    }
    if (value < min || value > max)
    {
        PWARN("[%s] %s=%d is outside %d..%d, using %d", group, key, value,
              min, max, def);
        return def;
    }
    return value;
}

int
CbConfig::compression_level() const
{
    return get_int(GROUP_LEDGER, KEY_COMPRESSION_LEVEL,
                   default_compression_level, 1, 9);
}

int
CbConfig::date_window() const
{
    return get_int(GROUP_IMPORT, KEY_DATE_WINDOW, default_date_window, 0, 31);
}

int
CbConfig::description_prefix() const
{
    return get_int(GROUP_IMPORT, KEY_DESC_PREFIX, default_description_prefix,
                   1, 255);
}

std::string
CbConfig::log_to() const
{
    auto value = g_key_file_get_string(m_keyfile, GROUP_LOG, KEY_LOG_TO, nullptr);
    if (!value)
        return {};
    std::string retval{value};
    g_free(value);
    return retval;
}
