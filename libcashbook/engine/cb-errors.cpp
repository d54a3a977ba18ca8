/********************************************************************
 * cb-errors.cpp - the exceptions raised by ledger operations      *
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


#include "cb-errors.hpp"

const char*
cb_backend_error_to_string (CbBackendError code)
{
    switch (code)
    {
    case ERR_BACKEND_NO_ERR:
        return "no error";
    case ERR_BACKEND_NO_SUCH_ENTITY:
        return "no such entity";
    case ERR_BACKEND_CONSTRAINT:
        return "constraint violation";
    case ERR_FILEIO_FILE_NOT_FOUND:
        return "file not found";
    case ERR_FILEIO_FILE_BAD_READ:
        return "bad read";
    case ERR_FILEIO_PARSE_ERROR:
        return "parse error";
    case ERR_FILEIO_FILE_EXISTS:
        return "file exists";
    case ERR_FILEIO_BACKUP_ERROR:
        return "backup failed";
    case ERR_FILEIO_WRITE_ERROR:
        return "write failed";
    case ERR_IMPORT_FORMAT:
        return "unrecognized import format";
    }
    return "unknown error";
}
