/********************************************************************
 * cb-xml-compress.hpp -- gzip framing of the ledger file          *
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

/** @file cb-xml-compress.hpp
 *  The ledger is stored as a single gzip member. Both directions work on
 *  whole in-memory buffers.
 */

#ifndef CB_XML_COMPRESS_HPP
#define CB_XML_COMPRESS_HPP

#include <string>

/** True if @a bytes starts with the gzip magic number. */
bool cb_is_gzip (const std::string& bytes);

/** Decompress a gzip file image.
 * @exception CbParseError (ERR_FILEIO_FILE_BAD_READ) if @a bytes isn't
 * gzip or the stream is corrupt or truncated.
 */
std::string cb_gzip_inflate (const std::string& bytes);

/** Compress @a text into a gzip file image at @a level (1..9).
 * @exception CbWriteError (ERR_FILEIO_WRITE_ERROR) if zlib fails.
 */
std::string cb_gzip_deflate (const std::string& text, int level);

#endif /* CB_XML_COMPRESS_HPP */
