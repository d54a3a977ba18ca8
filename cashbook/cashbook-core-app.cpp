/********************************************************************
 * cashbook-core-app.cpp -- basic application object for cashbook binaries*
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


#include "cashbook-core-app.hpp"

#include <glib.h>
#include <cb-filepath-utils.hpp>
#include <cb-log.hpp>

#include <boost/algorithm/string.hpp>
#include <clocale>
#include <iostream>
#include <string>
#include <vector>

/* This static indicates the debugging module that this .o belongs to.  */
static CbLogModule log_module = CB_MOD_CLI;

#ifndef CASHBOOK_VERSION
#define CASHBOOK_VERSION "unknown"
#endif

static void
cb_app_log_init (const std::vector <std::string>& log_flags,
                 const boost::optional <std::string> &log_to_filename,
                 bool debugging)
{
    if (log_to_filename && !log_to_filename->empty())
    {
        cb_log_init_filename_special (log_to_filename->c_str());
    }
    else
    {
        /* initialize logging to our file. */
        auto tracefilename = g_build_filename (g_get_tmp_dir(), "cashbook.trace",
                                               (gchar *)NULL);
        cb_log_init_filename (tracefilename);
        g_free (tracefilename);
    }

    if (debugging)
    {
        cb_log_set_level ("", CB_LOG_INFO);
        cb_log_set_level (CB_MOD_ROOT, CB_LOG_INFO);
    }

    auto log_config_filename = cb_build_userconfig_path ("log.conf");
    if (g_file_test (log_config_filename.c_str(), G_FILE_TEST_EXISTS))
        cb_log_parse_log_config (log_config_filename.c_str());

    for (auto log_flag : log_flags)
    {
        if (log_flag.empty () ||
            log_flag[0] == '=' ||
            log_flag[log_flag.length () - 1] == '=' ||
            log_flag.find ('=') == std::string::npos)
        {
            g_warning ("string [%s] not parseable", log_flag.c_str());
            continue;
        }

        std::vector<std::string> split_flag;
        boost::split (split_flag, log_flag, [](char c){return c == '=';});

        auto level = cb_log_level_from_string (split_flag[1].c_str());
        cb_log_set_level (split_flag[0].c_str(), level);
    }
}

Cashbook::CoreApp::CoreApp (const char* app_name) : m_app_name {app_name}
{
    if (!setlocale (LC_ALL, ""))
    {
        std::cerr << "The locale defined in the environment isn't supported. "
                  << "Falling back to the 'C' (US English) locale\n";
        g_setenv ("LC_ALL", "C", TRUE);
        setlocale (LC_ALL, "C");
    }

    m_tagline = "- cashbook, maintenance of GnuCash ledgers";
    m_opt_desc_display = std::make_unique<bpo::options_description>
        (m_app_name + " [options] [datafile] " + m_tagline);
    add_common_program_options();
}

void
Cashbook::CoreApp::parse_command_line (int argc, char **argv)
{
    try
    {
    bpo::store (bpo::command_line_parser (argc, argv).
        options (m_opt_desc_all).positional(m_pos_opt_desc).run(), m_opt_map);
    bpo::notify (m_opt_map);
    }
    catch (std::exception &e)
    {
        std::cerr << e.what() << "\n\n";
        std::cerr << *m_opt_desc_display.get() << std::endl;

        exit(1);
    }

    if (m_show_version)
    {
        std::cout << "cashbook " << CASHBOOK_VERSION << "\n";
        exit(0);
    }

    if (m_show_help)
    {
        std::cout << *m_opt_desc_display.get() << std::endl;
        exit(0);
    }

    if (m_config_file)
        m_config.set_filename (*m_config_file);
    m_have_config = m_config.load ();

    if ((!m_log_to_filename || m_log_to_filename->empty()) &&
        !m_config.log_to ().empty ())
        m_log_to_filename = m_config.log_to ();
}

/* Define command line options common to all cashbook binaries. */
void
Cashbook::CoreApp::add_common_program_options (void)
{
    bpo::options_description common_options("Common Options");
    common_options.add_options()
        ("help,h", bpo::bool_switch (&m_show_help),
         "Show this help message")
        ("version,v", bpo::bool_switch (&m_show_version),
         "Show cashbook version")
        ("debug", bpo::bool_switch (&m_debug),
         "Enable debugging mode: provide deep detail in the logs.\nThis is equivalent to: --log \"=info\" --log \"cb=info\"")
        ("log", bpo::value (&m_log_flags),
         "Log level overrides, of the form \"modulename={debug,info,warn,crit,error}\"\nExamples: \"--log cb.import=debug\" or \"--log cb.backend.xml=info\"\nThis can be invoked multiple times.")
        ("logto", bpo::value (&m_log_to_filename),
         "File to log into; defaults to \"/tmp/cashbook.trace\"; can be \"stderr\" or \"stdout\".")
        ("config", bpo::value (&m_config_file),
         "Settings file; defaults to cashbook.conf in the user configuration directory.")
        ("file,f", bpo::value (&m_file_to_load),
         "Ledger to work on; defaults to the configured ledger.");

    bpo::options_description hidden_options("Hidden Options");
    hidden_options.add_options()
        ("input-file", bpo::value (&m_file_to_load),
         "[datafile]");

        m_pos_opt_desc.add("input-file", -1);

        m_opt_desc_all.add (common_options);
        m_opt_desc_all.add (hidden_options);

        m_opt_desc_display->add (common_options);
}

void
Cashbook::CoreApp::start (void)
{
    cb_app_log_init (m_log_flags, m_log_to_filename, m_debug);

    if (!m_have_config)
        PINFO ("No settings read from %s, using the defaults",
               m_config.filename ().c_str ());

    /* Write some locale details to the log to simplify debugging */
    PINFO ("Effective locale set to %s.", setlocale (LC_ALL, NULL));
}

std::string
Cashbook::CoreApp::ledger_file (void) const
{
    if (m_file_to_load && !m_file_to_load->empty ())
        return *m_file_to_load;
    return m_config.ledger_file ();
}
