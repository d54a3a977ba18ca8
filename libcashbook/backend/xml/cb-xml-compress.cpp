/********************************************************************
 * cb-xml-compress.cpp -- gzip framing of the ledger file          *
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


#include <zlib.h>

#include "cb-xml-compress.hpp"
#include "cb-errors.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_BACKEND;

/* "add 16 to decode only the gzip format" */
#define GZIP_WINDOW_BITS (16 + MAX_WBITS)
#define CHUNK_SIZE 65536

bool
cb_is_gzip (const std::string& bytes)
{
    /* 037 0213 are the header id bytes for a gzipped file. */
    return bytes.size () >= 2 &&
        static_cast<unsigned char> (bytes[0]) == 037 &&
        static_cast<unsigned char> (bytes[1]) == 0213;
}

std::string
cb_gzip_inflate (const std::string& bytes)
{
    if (!cb_is_gzip (bytes))
        throw CbParseError ("The file is not gzip compressed",
                            ERR_FILEIO_FILE_BAD_READ);

    z_stream stream{};
    stream.next_in = reinterpret_cast<Bytef*> (const_cast<char*> (bytes.data ()));
    stream.avail_in = bytes.size ();
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    int ret = inflateInit2 (&stream, GZIP_WINDOW_BITS);
    if (ret != Z_OK)
        throw CbParseError (std::string{"inflateInit failed: "} +
                            std::to_string (ret), ERR_FILEIO_FILE_BAD_READ);

    std::string out;
    char buf[CHUNK_SIZE];
    do
    {
        stream.next_out = reinterpret_cast<Bytef*> (buf);
        stream.avail_out = sizeof (buf);
        ret = inflate (&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END)
        {
            std::string msg{"The file could not be uncompressed: "};
            msg += stream.msg ? stream.msg : std::to_string (ret);
            inflateEnd (&stream);
            PERR ("%s", msg.c_str ());
            throw CbParseError (msg, ERR_FILEIO_FILE_BAD_READ);
        }
        out.append (buf, sizeof (buf) - stream.avail_out);
        if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0)
        {
            inflateEnd (&stream);
            PERR ("truncated gzip stream");
            throw CbParseError ("The compressed file is truncated",
                                ERR_FILEIO_FILE_BAD_READ);
        }
    }
    while (ret != Z_STREAM_END);

    inflateEnd (&stream);
    if (stream.avail_in)
        PWARN ("%u bytes of trailing data after the gzip stream",
               stream.avail_in);
    return out;
}

std::string
cb_gzip_deflate (const std::string& text, int level)
{
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    int ret = deflateInit2 (&stream, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8,
                            Z_DEFAULT_STRATEGY);
    if (ret != Z_OK)
        throw CbWriteError (ERR_FILEIO_WRITE_ERROR,
                            "deflateInit failed: " + std::to_string (ret),
                            {}, "write");

    stream.next_in = reinterpret_cast<Bytef*> (const_cast<char*> (text.data ()));
    stream.avail_in = text.size ();

    std::string out;
    char buf[CHUNK_SIZE];
    do
    {
        stream.next_out = reinterpret_cast<Bytef*> (buf);
        stream.avail_out = sizeof (buf);
        ret = deflate (&stream, Z_FINISH);
        if (ret == Z_STREAM_ERROR)
        {
            deflateEnd (&stream);
            throw CbWriteError (ERR_FILEIO_WRITE_ERROR,
                                "The ledger could not be compressed", {},
                                "write");
        }
        out.append (buf, sizeof (buf) - stream.avail_out);
    }
    while (ret != Z_STREAM_END);

    deflateEnd (&stream);
    return out;
}
