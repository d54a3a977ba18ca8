/********************************************************************
 * cb-log.cpp - hierarchical, domain-based logging                 *
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
#include <unistd.h>
#include <cstring>

#undef G_LOG_DOMAIN
#define G_LOG_DOMAIN "cb.log"

#include "cb-log.hpp"
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#define CB_LOG_MAX_CHARS_WITH_ALLOWANCE 100
#define CB_LOG_INDENT_WIDTH 4

static FILE* fout = nullptr;
static gchar* function_buffer = nullptr;
static gint cb_log_num_spaces = 0;
static GLogFunc previous_handler = nullptr;
static gchar* cb_logger_format = nullptr;

using StrVec = std::vector<std::string>;

struct ModuleEntry;
using ModuleEntryPtr = std::unique_ptr<ModuleEntry>;
using MEVec = std::vector<ModuleEntryPtr>;

static constexpr int parts = 4; //Log domain parts vector preallocation size
static constexpr CbLogLevel default_level = CB_LOG_WARNING;

struct ModuleEntry
{
    ModuleEntry(std::string name, CbLogLevel level) :
        m_name{name}, m_level{level} {
            m_children.reserve(parts);
        }
    ~ModuleEntry() = default;
    std::string m_name;
    CbLogLevel m_level;
    MEVec m_children;
};

static ModuleEntryPtr _modules = nullptr;

static ModuleEntry*
get_modules()
{
    if (!_modules)
        _modules = std::make_unique<ModuleEntry>("", default_level);
    return _modules.get();
}

static StrVec
split_domain (const std::string& domain)
{
    StrVec domain_parts;
    domain_parts.reserve(parts);
    std::string::size_type start = 0;
    auto pos = domain.find('.');
    while (pos != std::string::npos)
    {
        domain_parts.emplace_back(domain.substr(start, pos - start));
        start = pos + 1;
        pos = domain.find('.', start);
    }
    domain_parts.emplace_back(domain.substr(start));
    return domain_parts;
}

void
cb_log_indent(void)
{
    cb_log_num_spaces += CB_LOG_INDENT_WIDTH;
}

void
cb_log_dedent(void)
{
    cb_log_num_spaces
    = (cb_log_num_spaces < CB_LOG_INDENT_WIDTH)
      ? 0
      : cb_log_num_spaces - CB_LOG_INDENT_WIDTH;
}

void
cb_log_set_file(FILE* outfile)
{
    fout = outfile ? outfile : stderr;
}

void
cb_log_init(void)
{
    cb_log_init_filename(nullptr);
}

static void
log4glib_handler(const gchar*    log_domain,
                 GLogLevelFlags  log_level,
                 const gchar*    message,
                 gpointer        user_data)
{
    auto level = static_cast<CbLogLevel>(log_level & G_LOG_LEVEL_MASK);
    if (G_LIKELY(!cb_log_check(log_domain, level)))
        return;

    auto now = g_date_time_new_now_local();
    auto timestamp = g_date_time_format(now, "%H:%M:%S");
    fprintf(fout, cb_logger_format,
            timestamp,
            5, cb_log_level_to_string(level),
            (log_domain == nullptr ? "" : log_domain),
            cb_log_num_spaces, "",
            message,
            (g_str_has_suffix(message, "\n") ? "" : "\n"));
    fflush(fout);
    g_free(timestamp);
    g_date_time_unref(now);
}

void
cb_log_init_filename(const gchar* log_filename)
{
    gboolean warn_about_missing_permission = FALSE;
    auto modules = get_modules();

    if (!cb_logger_format)
        cb_logger_format = g_strdup ("* %s %*s <%s> %*s%s%s"); //default format

    if (log_filename)
    {
        if (fout != nullptr && fout != stderr && fout != stdout)
            fclose(fout);

        auto fname = g_strconcat(log_filename, ".XXXXXX.log", nullptr);
        int fd = g_mkstemp(fname);
        if (fd != -1)
        {
            /* Write to a temporary name and move it into place so that an
             * existing log is never truncated before we can write to it. */
            if (g_rename(fname, log_filename) != 0)
                warn_about_missing_permission = TRUE;
            fout = fdopen(fd, "w");
            if (!fout)
                warn_about_missing_permission = TRUE;
        }
        else
        {
            warn_about_missing_permission = TRUE;
            fout = stderr;
        }
        g_free(fname);
    }

    if (!fout)
        fout = stderr;

    if (previous_handler == nullptr)
        previous_handler = g_log_set_default_handler(log4glib_handler, modules);

    if (warn_about_missing_permission)
        g_critical("Cannot open log output file \"%s\", using stderr.", log_filename);
}

void
cb_log_shutdown (void)
{
    if (fout && fout != stderr && fout != stdout)
    {
        fclose(fout);
        fout = nullptr;
    }

    if (function_buffer)
    {
        g_free(function_buffer);
        function_buffer = nullptr;
    }

    _modules = nullptr;

    if (previous_handler != nullptr)
    {
        g_log_set_default_handler(previous_handler, nullptr);
        previous_handler = nullptr;
    }
}

void
cb_log_set_level(CbLogModule log_module, CbLogLevel level)
{
    if (!log_module || level == 0)
        return;

    auto module = get_modules();
    if (!*log_module)
    {
        module->m_level = level;
        return;
    }

    for (auto part : split_domain(log_module))
    {
        auto iter = std::find_if(module->m_children.begin(),
                                 module->m_children.end(),
                                 [part](auto& child){
                                     return child && part == child->m_name;
                                 });
        if (iter == module->m_children.end())
        {
            auto child = std::make_unique<ModuleEntry>(part, module->m_level);
            module->m_children.emplace_back(std::move(child));
            module = module->m_children.back().get();
        }
        else
        {
            module = iter->get();
        }
    }
    module->m_level = level;
}

gboolean
cb_log_check(CbLogModule domain, CbLogLevel level)
{
    auto module = get_modules();
    // If the level is at or above the default then no need to look further.
    if (level <= module->m_level)
        return TRUE;

    if (!domain)
        return FALSE;

    for (auto part : split_domain(domain))
    {
        auto iter = std::find_if(module->m_children.begin(),
                                 module->m_children.end(),
                                 [part](auto& child) {
                                     return child && part == child->m_name; });

        if (iter == module->m_children.end())
            return FALSE;

        if (level <= (*iter)->m_level)
            return TRUE;

        module = iter->get();
    }
    return FALSE;
}

const char*
cb_log_prettify (const char* name)
{
    if (!name)
        return "";

/* Clang's __func__ displays the whole signature. Strip the extras so that
 * log messages are the same regardless of compiler.
 */
    auto buffer = g_strndup(name, CB_LOG_MAX_CHARS_WITH_ALLOWANCE - 1);
    auto p = strchr (buffer, '(');
    if (p) *p = '\0';
    auto begin = strrchr (buffer, '*');
    if (begin == nullptr)
        begin = strrchr (buffer, ' ');
    else if (*(begin + 1) == ' ')
        ++begin;
    p = begin ? begin + 1 : buffer;

    g_free(function_buffer);
    function_buffer = g_strdup(p);
    g_free(buffer);
    return function_buffer;
}

void
cb_log_init_filename_special(const char* log_to_filename)
{
    if (g_ascii_strcasecmp("stderr", log_to_filename) == 0)
    {
        cb_log_init();
        cb_log_set_file(stderr);
    }
    else if (g_ascii_strcasecmp("stdout", log_to_filename) == 0)
    {
        cb_log_init();
        cb_log_set_file(stdout);
    }
    else
    {
        cb_log_init_filename(log_to_filename);
    }
}

void
cb_log_parse_log_config(const char* filename)
{
    const gchar* levels_group = "levels";
    const gchar* output_group = "output";
    GError* err = nullptr;
    GKeyFile* conf = g_key_file_new();

    if (!g_key_file_load_from_file(conf, filename, G_KEY_FILE_NONE, &err))
    {
        g_warning("unable to parse [%s]: %s", filename, err->message);
        g_error_free(err);
        g_key_file_free(conf);
        return;
    }

    g_debug("parsing log config from [%s]", filename);
    if (g_key_file_has_group(conf, levels_group))
    {
        gsize num_levels;
        gint logger_max_name_length = 12;
        auto levels = g_key_file_get_keys(conf, levels_group, &num_levels, nullptr);

        for (gsize key_idx = 0; key_idx < num_levels && levels[key_idx] != nullptr; key_idx++)
        {
            auto logger_name = levels[key_idx];
            logger_max_name_length = MAX (logger_max_name_length, (gint) strlen (logger_name));
            auto level_str = g_key_file_get_string(conf, levels_group, logger_name, nullptr);
            auto level = cb_log_level_from_string(level_str);

            g_debug("setting log [%s] to level [%s=%d]", logger_name, level_str, level);
            cb_log_set_level(logger_name, level);
            g_free(level_str);
        }

        auto str = g_strdup_printf ("%d", logger_max_name_length);
        g_free (cb_logger_format);
        cb_logger_format = g_strconcat ("* %s %*s <%-", str, ".", str, "s> %*s%s%s", nullptr);
        g_free (str);
        g_strfreev(levels);
    }

    if (g_key_file_has_group(conf, output_group))
    {
        gsize num_outputs;
        auto outputs = g_key_file_get_keys(conf, output_group, &num_outputs, nullptr);
        for (gsize output_idx = 0; output_idx < num_outputs && outputs[output_idx] != nullptr; output_idx++)
        {
            auto key = outputs[output_idx];
            if (g_ascii_strcasecmp("to", key) != 0)
            {
                g_warning("unknown key [%s] in [output], skipping", key);
                continue;
            }

            auto value = g_key_file_get_string(conf, output_group, key, nullptr);
            g_debug("setting [output].to=[%s]", value);
            cb_log_init_filename_special(value);
            g_free(value);
        }
        g_strfreev(outputs);
    }

    g_key_file_free(conf);
}

void
cb_log_set_default(CbLogLevel log_level)
{
    cb_log_set_level("", log_level);
    cb_log_set_level(CB_MOD_ROOT, log_level);
}

const char*
cb_log_level_to_string(CbLogLevel log_level)
{
    switch (log_level)
    {
    case CB_LOG_FATAL:
        return "FATAL";
    case CB_LOG_ERROR:
        return "ERROR";
    case CB_LOG_WARNING:
        return "WARN";
    case CB_LOG_MESSAGE:
        return "MESSG";
    case CB_LOG_INFO:
        return "INFO";
    case CB_LOG_DEBUG:
        return "DEBUG";
    default:
        return "OTHER";
    }
}

CbLogLevel
cb_log_level_from_string(const char* str)
{
    if (!str) return CB_LOG_DEBUG;
    if (g_ascii_strncasecmp("error", str, 5) == 0) return CB_LOG_FATAL;
    if (g_ascii_strncasecmp("crit", str, 4) == 0) return CB_LOG_ERROR;
    if (g_ascii_strncasecmp("warn", str, 4) == 0) return CB_LOG_WARNING;
    if (g_ascii_strncasecmp("mess", str, 4) == 0) return CB_LOG_MESSAGE;
    if (g_ascii_strncasecmp("info", str, 4) == 0) return CB_LOG_INFO;
    if (g_ascii_strncasecmp("debug", str, 5) == 0) return CB_LOG_DEBUG;
    return CB_LOG_DEBUG;
}
