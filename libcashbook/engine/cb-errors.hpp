/********************************************************************
 * cb-errors.hpp - the exceptions raised by ledger operations      *
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

/** @file cb-errors.hpp
 *  Every failure of a ledger read, write or import is a CbError carrying a
 *  CbBackendError code, the id of the entity it concerns (empty for file
 *  level failures) and the name of the operation that raised it.
 *
 *  Value parsers (CbNumeric, CbDate, parse_monetary) throw
 *  std::invalid_argument instead; those are row-level failures that the
 *  importers recover from by dropping the row.
 */

#ifndef CB_ERRORS_HPP
#define CB_ERRORS_HPP

#include <stdexcept>
#include <string>

typedef enum
{
    ERR_BACKEND_NO_ERR = 0,
    ERR_BACKEND_NO_SUCH_ENTITY,  /**< mutation target is not in the ledger */
    ERR_BACKEND_CONSTRAINT,      /**< referential integrity violation */
    ERR_FILEIO_FILE_NOT_FOUND,   /**< ledger file does not exist */
    ERR_FILEIO_FILE_BAD_READ,    /**< ledger could not be read or inflated */
    ERR_FILEIO_PARSE_ERROR,      /**< ledger document is malformed */
    ERR_FILEIO_FILE_EXISTS,      /**< refusing to replace an existing file */
    ERR_FILEIO_BACKUP_ERROR,     /**< the pre-write backup failed */
    ERR_FILEIO_WRITE_ERROR,      /**< the ledger or audit log write failed */
    ERR_IMPORT_FORMAT,           /**< unrecognized or unreadable statement */
} CbBackendError;

const char* cb_backend_error_to_string (CbBackendError code);

class CbError : public std::runtime_error
{
public:
    CbError (CbBackendError code, const std::string& msg,
             std::string target = {}, std::string operation = {}) :
        std::runtime_error{msg}, m_code{code}, m_target{std::move(target)},
        m_operation{std::move(operation)} {}

    CbBackendError code () const noexcept { return m_code; }
    const std::string& target () const noexcept { return m_target; }
    const std::string& operation () const noexcept { return m_operation; }

private:
    CbBackendError m_code;
    std::string m_target;
    std::string m_operation;
};

/** Malformed, unreadable or undecompressable ledger. No partial result is
 * ever returned alongside one. */
class CbParseError : public CbError
{
public:
    CbParseError (const std::string& msg,
                  CbBackendError code = ERR_FILEIO_PARSE_ERROR) :
        CbError{code, msg, {}, "read"} {}
};

/** The id targeted by an update or delete isn't in the ledger. */
class CbNotFoundError : public CbError
{
public:
    CbNotFoundError (const std::string& id, const std::string& operation) :
        CbError{ERR_BACKEND_NO_SUCH_ENTITY, operation + ": " + id + " not found",
                id, operation} {}
};

/** The mutation would break referential integrity. */
class CbConstraintError : public CbError
{
public:
    CbConstraintError (const std::string& id, const std::string& operation,
                       const std::string& reason) :
        CbError{ERR_BACKEND_CONSTRAINT, operation + ": " + id + " " + reason,
                id, operation} {}
};

/** Writing the backup, the ledger or the audit log failed. */
class CbWriteError : public CbError
{
public:
    CbWriteError (CbBackendError code, const std::string& msg,
                  const std::string& id, const std::string& operation) :
        CbError{code, msg, id, operation} {}
};

/** The statement file's type isn't recognized or it can't be read. */
class CbImportFormatError : public CbError
{
public:
    CbImportFormatError (const std::string& filename, const std::string& msg) :
        CbError{ERR_IMPORT_FORMAT, msg, filename, "import"} {}
};

#endif // CB_ERRORS_HPP
