/********************************************************************
 * cb-xml-backend.hpp -- the compressed XML ledger file            *
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

/** @file cb-xml-backend.hpp
 *  CbXmlBackend owns one ledger file. It serves parsed snapshots of it and
 *  applies single-entity mutations by patching the decompressed text.
 *
 *  Every mutation follows the same protocol:
 *  -# read the compressed file and copy it verbatim to
 *     <tt>\<file\>.YYYYMMDDHHMMSS.\<ext\></tt>;
 *  -# bring the raw text cache up to date with the bytes just read;
 *  -# locate the target block, checking the one integrity rule;
 *  -# patch the block and the book's counters;
 *  -# compress and replace the live file;
 *  -# keep the new text, drop the parsed snapshot;
 *  -# write the audit log.
 *
 *  A failure after step 1 leaves the backup for recovery; a failure before
 *  step 5 leaves the live file untouched.
 */

#ifndef CB_XML_BACKEND_HPP
#define CB_XML_BACKEND_HPP

#include <memory>
#include <mutex>
#include <string>

#include "cb-book.hpp"
#include "cb-datetime.hpp"

class CbXmlDocument;

typedef enum
{
    CB_WRITE_CREATE,
    CB_WRITE_UPDATE,
    CB_WRITE_DELETE,
} CbWriteMode;

const char* cb_write_mode_to_string (CbWriteMode mode);

class CbXmlBackend
{
public:
    /** @param compression_level gzip level of the rewritten file, 1..9. */
    explicit CbXmlBackend (std::string fullpath, int compression_level = 9);
    CbXmlBackend (const CbXmlBackend&) = delete;
    CbXmlBackend& operator= (const CbXmlBackend&) = delete;
    ~CbXmlBackend ();

    const std::string& get_filename () const { return m_fullpath; }

    /** The parsed ledger, read on first use and after each write.
     * @exception CbParseError if the file is missing, not gzip or not a
     * valid ledger. */
    std::shared_ptr<const LedgerBook> load ();
    /** Forget both the raw text and the parsed ledger. */
    void invalidate ();

    /** Create, update or delete @a acc.
     *
     * A new account needs a parent that is in the file; a ROOT can't be
     * added. Deleting an account that a split references, or that has
     * children, is refused.
     *
     * @exception CbNotFoundError, CbConstraintError, CbWriteError,
     * CbParseError
     */
    void write_account (const Account& acc, CbWriteMode mode);
    /** Replace only the act:name of account @a id. */
    void rename_account (const std::string& id, const std::string& name);
    /** Create, update or delete a transaction.
     *
     * Creation needs @a after, deletion @a before or @a after (only the id
     * is used to find the block); an update needs @a after and logs @a before
     * when given, the transaction as it was in the file otherwise.
     *
     * @exception CbNotFoundError, CbConstraintError, CbWriteError,
     * CbParseError
     */
    void write_transaction (const Transaction* before, const Transaction* after,
                            CbWriteMode mode);

    /** The backup made by the last mutation attempt, empty if none. */
    const std::string& last_backup () const { return m_last_backup; }
    /** The audit log written by the last mutation, empty if none. */
    const std::string& last_log () const { return m_last_log; }

private:
    std::string read_file () const;
    void backup_file (const std::string& bytes, const CbDateTime& now,
                      const std::string& id, const char* operation);
    CbXmlDocument begin_write (const CbDateTime& now, const std::string& id,
                               const char* operation);
    void write_to_file (const CbXmlDocument& doc, const std::string& id,
                        const char* operation);
    void write_log (const Transaction* before, const Transaction* after,
                    const LedgerBook& names, const CbDateTime& now);

    std::string m_fullpath;
    int m_compression_level;
    std::mutex m_mutex;

    /* Decompressed text of the file and the crc32 of the bytes it came
     * from. */
    std::string m_raw;
    unsigned long m_raw_crc = 0;
    bool m_have_raw = false;
    std::shared_ptr<const LedgerBook> m_book;

    std::string m_last_backup;
    std::string m_last_log;
};

/** Write a new compressed ledger at @a path holding the standard account
 * tree: Assets (Checking Account, Savings Account), Liabilities (Credit
 * Card), Income (Salary, Other Income), Expenses (Groceries, Utilities,
 * Housing, Transportation, Other Expenses) and Equity (Opening Balances,
 * Imbalance-USD), the top level accounts being placeholders.
 *
 * @return The book written.
 * @exception CbWriteError with ERR_FILEIO_FILE_EXISTS if @a path exists, or
 * ERR_FILEIO_WRITE_ERROR if it can't be written.
 */
LedgerBook cb_xml_create_new_book (const std::string& path,
                                   int compression_level = 9);

#endif /* CB_XML_BACKEND_HPP */
