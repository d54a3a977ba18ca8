/********************************************************************
 * cb-log.hpp - hierarchical, domain-based logging                 *
 * Logging is routed through g_log(); every translation unit       *
 * declares a static log_module naming its dotted log domain.      *
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

/** @addtogroup Logging
 *
 * Log domains form a hierarchy ("cb.import.csv" is below "cb.import" which is
 * below "cb"). A domain logs at a given level if it, or its closest configured
 * ancestor, is set to that level or higher. The default threshold is WARNING.
 *
 * Use:
 * @li declare <tt>static CbLogModule log_module = CB_MOD_FOO;</tt>
 * @li log with PERR, PWARN, PINFO, DEBUG, ENTER and LEAVE.
 * @{ */

#ifndef CB_LOG_HPP
#define CB_LOG_HPP

#include <cstdio>
#include <glib.h>

typedef const char* CbLogModule;

#define CB_MOD_ROOT     "cb"
#define CB_MOD_ENGINE   "cb.engine"
#define CB_MOD_CONFIG   "cb.config"
#define CB_MOD_BACKEND  "cb.backend.xml"
#define CB_MOD_TRANSLOG "cb.translog"
#define CB_MOD_IMPORT   "cb.import"
#define CB_MOD_CSV      "cb.import.csv"
#define CB_MOD_OFX      "cb.import.ofx"
#define CB_MOD_XLSX     "cb.import.xlsx"
#define CB_MOD_REPLAY   "cb.import.log-replay"
#define CB_MOD_CLI      "cb.cli"

typedef enum
{
    CB_LOG_FATAL   = G_LOG_LEVEL_ERROR,
    CB_LOG_ERROR   = G_LOG_LEVEL_CRITICAL,
    CB_LOG_WARNING = G_LOG_LEVEL_WARNING,
    CB_LOG_MESSAGE = G_LOG_LEVEL_MESSAGE,
    CB_LOG_INFO    = G_LOG_LEVEL_INFO,
    CB_LOG_DEBUG   = G_LOG_LEVEL_DEBUG
} CbLogLevel;

const char* cb_log_level_to_string (CbLogLevel level);
CbLogLevel cb_log_level_from_string (const char* str);

/** Indents one level; see ENTER macro. **/
void cb_log_indent (void);

/** De-dent one level, capped at 0; see LEAVE macro. **/
void cb_log_dedent (void);

/** Initialize the logging subsystem. Defaults to a level-threshold of
 * "warning", and logging to stderr. **/
void cb_log_init (void);

/** Log to @a log_filename, falling back to stderr if it can't be opened. **/
void cb_log_init_filename (const char* log_filename);

/** If @a log_to_filename is "stderr" or "stdout" (case-insensitive) then those
 * streams are used; otherwise it is taken as a file name. **/
void cb_log_init_filename_special (const char* log_to_filename);

/** Specify an alternate log output, to pipe or file. **/
void cb_log_set_file (FILE* outfile);

/** Set the logging level of the given log_module. **/
void cb_log_set_level (CbLogModule module, CbLogLevel level);

/** Set the threshold of the root and "cb" domains. **/
void cb_log_set_default (CbLogLevel level);

/** Check whether @a log_module logs at @a level, walking the domain
 * hierarchy. **/
gboolean cb_log_check (CbLogModule log_module, CbLogLevel level);

/**
 * Parse a log-configuration key file of the form
 * @verbatim
    [levels]
    cb.backend.xml=debug
    cb.import=info
    [output]
    # to=["stderr"|"stdout"|filename]
    to=stderr
 @endverbatim
 **/
void cb_log_parse_log_config (const char* filename);

/** Close the log file if one is open and restore the previous handler. */
void cb_log_shutdown (void);

/** Strip a compiler-generated function signature down to the bare name. **/
const char* cb_log_prettify (const char* name);

#define PRETTY_FUNC_NAME cb_log_prettify(G_STRFUNC)

/** Log an error */
#define PERR(format, args...) do { \
    g_log (log_module, G_LOG_LEVEL_CRITICAL, \
      "[%s()] " format, PRETTY_FUNC_NAME , ## args); \
} while (0)

/** Log a warning */
#define PWARN(format, args...) do { \
    g_log (log_module, G_LOG_LEVEL_WARNING, \
      "[%s()] " format, PRETTY_FUNC_NAME , ## args); \
} while (0)

/** Print an informational note */
#define PINFO(format, args...) do { \
    g_log (log_module, G_LOG_LEVEL_INFO, \
      "[%s] " format, PRETTY_FUNC_NAME , ## args); \
} while (0)

/** Print a debugging message */
#define DEBUG(format, args...) do { \
    g_log (log_module, G_LOG_LEVEL_DEBUG, \
      "[%s] " format, PRETTY_FUNC_NAME , ## args); \
} while (0)

/** Print a function entry debugging message */
#define ENTER(format, args...) do { \
    if (cb_log_check(log_module, CB_LOG_DEBUG)) { \
      g_log (log_module, G_LOG_LEVEL_DEBUG, \
        "[enter %s:%s()] " format, __FILE__, \
        PRETTY_FUNC_NAME , ## args); \
      cb_log_indent(); \
    } \
} while (0)

/** Print a function exit debugging message. **/
#define LEAVE(format, args...) do { \
    if (cb_log_check(log_module, CB_LOG_DEBUG)) { \
      cb_log_dedent(); \
      g_log (log_module, G_LOG_LEVEL_DEBUG, \
        "[leave %s()] " format, \
        PRETTY_FUNC_NAME , ## args); \
    } \
} while (0)

#endif /* CB_LOG_HPP */
/** @} */
