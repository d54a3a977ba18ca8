/********************************************************************
 * cb-datetime.hpp - calendar dates and UTC instants               *
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


#ifndef CB_DATETIME_HPP
#define CB_DATETIME_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

typedef struct
{
    int year;  //1400-9999
    int month; //1-12
    int day; //1-31
} ymd;

class CbDateImpl;
class CbDateTimeImpl;
using time64 = int64_t;

/** The date formats understood by CbDate's string constructor. */
class CbDateFormat
{
public:
    CbDateFormat (const char* fmt, const char* re) :
    m_fmt(fmt), m_re(re) {}
    /** A string representing the format. */
    const std::string m_fmt;
private:
    /** Regular expression associated with the format string. */
    const std::string m_re;

    friend class CbDateImpl;
};

/** Cashbook Date class
 *
 * A calendar date without a time of day. The ledger's posted, entered and
 * reconcile stamps are all reduced to one of these.
 */
class CbDate
{
public:
    /** A vector with all the date formats supported by the string constructor.
     * The currently supported formats are:
     * "y-m-d" (including yyyymmdd)
     * "d-m-y" (including ddmmyyyy)
     * "m-d-y" (including mmddyyyy)
     *
     * While the format names are using a "-" as separator, the regexes will
     * accept any of "-/.' " and will also work for dates without separators.
     */
    static const std::vector<CbDateFormat> c_formats;
    /** Construct a CbDate representing the current day. */
    CbDate();
    /** Construct a CbDate representing the given year, month, and day in
     * the proleptic Gregorian calendar.
     *
     * @exception std::invalid_argument if the date doesn't exist or the year
     * is outside 1400 - 9999.
     */
    CbDate(int year, int month, int day);
    /** Construct a CbDate by parsing a string assumed to be in the format
     * passed in. Two-digit years are taken to lie in 1969 - 2068.
     *
     * @exception std::invalid_argument if the string couldn't be parsed or
     * any of the date components is outside of its limit.
     */
    CbDate(const std::string& str, const std::string& fmt);
    CbDate(std::unique_ptr<CbDateImpl> impl);
    CbDate(const CbDate&);
    CbDate(CbDate&&);
    ~CbDate();
    CbDate& operator=(const CbDate&);
    CbDate& operator=(CbDate&&);

    /** Parse the leading "YYYY-MM-DD" of a ledger timestamp such as
     * "2024-03-10 10:59:00 +0000".
     * @exception std::invalid_argument if it isn't one.
     */
    static CbDate from_iso(const std::string& str);

    /** Get the year, month, and day from the date as a ymd. */
    ymd year_month_day() const;
    /** Format the CbDate with a strftime-like boost::date_time format. */
    std::string format(const char* format) const;
    /** "YYYY-MM-DD" */
    std::string iso() const;
    /** The date @a days later (earlier if negative). */
    CbDate offset_days(int days) const;
    /** The number of days from 1970-01-01. Spreadsheet serial days are
     * converted through this. */
    static CbDate from_days_since_epoch(int64_t days);

private:
    std::unique_ptr<CbDateImpl> m_impl;

    friend bool operator<(const CbDate&, const CbDate&);
    friend bool operator>(const CbDate&, const CbDate&);
    friend bool operator==(const CbDate&, const CbDate&);
    friend bool operator<=(const CbDate&, const CbDate&);
    friend bool operator>=(const CbDate&, const CbDate&);
    friend bool operator!=(const CbDate&, const CbDate&);
};

bool operator<(const CbDate& a, const CbDate& b);
bool operator>(const CbDate& a, const CbDate& b);
bool operator==(const CbDate& a, const CbDate& b);
bool operator<=(const CbDate& a, const CbDate& b);
bool operator>=(const CbDate& a, const CbDate& b);
bool operator!=(const CbDate& a, const CbDate& b);

/** Cashbook DateTime class
 *
 * An instant, always presented in UTC. Used for wall-clock stamps: the
 * audit log's time_now column and the names of backup and log files.
 */
class CbDateTime
{
public:
    /** The current time. */
    CbDateTime();
    /** Seconds from the POSIX epoch. */
    explicit CbDateTime(time64 time);
    CbDateTime(const CbDateTime&);
    CbDateTime& operator=(const CbDateTime&);
    ~CbDateTime();

    /** Seconds from the POSIX epoch. */
    time64 seconds() const;
    /** The UTC calendar date. */
    CbDate date() const;
    /** Format in UTC with a boost::date_time format, e.g.
     * "%Y%m%d%H%M%S". */
    std::string format_zulu(const char* format) const;

private:
    std::unique_ptr<CbDateTimeImpl> m_impl;
};

/** The 14 digit UTC stamp naming backup and audit-log files. */
std::string cb_file_stamp(const CbDateTime& when);

/** A ledger timestamp for @a date: "YYYY-MM-DD 10:59:00 +0000". 10:59 UTC
 * falls on the same calendar day in every timezone from -10 to +13. */
std::string cb_ledger_timestamp(const CbDate& date);

#endif // CB_DATETIME_HPP
