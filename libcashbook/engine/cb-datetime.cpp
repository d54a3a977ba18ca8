/********************************************************************
 * cb-datetime.cpp - calendar dates and UTC instants               *
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


#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/regex.hpp>
#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "cb-datetime.hpp"

using Date = boost::gregorian::date;
using Month = boost::gregorian::greg_month;
using PTime = boost::posix_time::ptime;

static const PTime unix_epoch (Date(1970, boost::gregorian::Jan, 1),
        boost::posix_time::seconds(0));

/* Note: while the format names are using a "-" as separator, the regexes will
 * accept any of "-/.' " and will also work for dates without separators.
 */
const std::vector<CbDateFormat> CbDate::c_formats ({
    CbDateFormat {
        "y-m-d",
        "(?:"                                   // either y-m-d
        "(?<YEAR>[0-9]+)[-/.' ]+"
        "(?<MONTH>[0-9]+)[-/.' ]+"
        "(?<DAY>[0-9]+)"
        "|"                                     // or CCYYMMDD
        "(?<YEAR>[0-9]{4})"
        "(?<MONTH>[0-9]{2})"
        "(?<DAY>[0-9]{2})"
        ")"
    },
    CbDateFormat {
        "d-m-y",
        "(?:"                                   // either d-m-y
        "(?<DAY>[0-9]+)[-/.' ]+"
        "(?<MONTH>[0-9]+)[-/.' ]+"
        "(?<YEAR>[0-9]+)"
        "|"                                     // or DDMMCCYY
        "(?<DAY>[0-9]{2})"
        "(?<MONTH>[0-9]{2})"
        "(?<YEAR>[0-9]{4})"
        ")"
    },
    CbDateFormat {
        "m-d-y",
        "(?:"                                   // either m-d-y
        "(?<MONTH>[0-9]+)[-/.' ]+"
        "(?<DAY>[0-9]+)[-/.' ]+"
        "(?<YEAR>[0-9]+)"
        "|"                                     // or MMDDCCYY
        "(?<MONTH>[0-9]{2})"
        "(?<DAY>[0-9]{2})"
        "(?<YEAR>[0-9]{4})"
        ")"
    }
});

static std::string
normalize_format (const std::string& format)
{
    bool is_pct = false;
    std::string normalized;
    std::remove_copy_if(
        format.begin(), format.end(), back_inserter(normalized),
        [&is_pct](char e){
            bool r = (is_pct && (e == 'E' || e == 'O' || e == '-'));
            is_pct = e == '%';
            return r;
        });
    return normalized;
}

static Date
make_date (int year, int month, int day)
{
    try
    {
        auto date = Date(year, static_cast<Month>(month), day);
        return date;
    }
    catch (const std::out_of_range& err)
    {
        throw std::invalid_argument (err.what());
    }
}

/** Private implementation of CbDate. See the documentation for that class.
 */
class CbDateImpl
{
public:
    CbDateImpl(): m_greg(boost::gregorian::day_clock::local_day()) {}
    CbDateImpl(const int year, const int month, const int day) :
        m_greg(make_date(year, month, day)) {}
    CbDateImpl(Date d) : m_greg(d) {}
    CbDateImpl(const std::string& str, const std::string& fmt);

    ymd year_month_day() const;
    std::string format(const char* format) const;
    Date m_greg;
};

CbDateImpl::CbDateImpl(const std::string& str, const std::string& fmt) :
    m_greg(boost::gregorian::day_clock::local_day())
{
    auto iter = std::find_if(CbDate::c_formats.cbegin(), CbDate::c_formats.cend(),
                             [&fmt](const CbDateFormat& v){ return (v.m_fmt == fmt); } );
    if (iter == CbDate::c_formats.cend())
        throw std::invalid_argument("Unknown date format specifier passed as argument.");

    boost::regex r(iter->m_re);
    boost::smatch what;
    if(!boost::regex_search(str, what, r))  // regex didn't find a match
        throw std::invalid_argument ("Value can't be parsed into a date using the selected date format.");

    auto year = std::stoi (what.str("YEAR"));
    /* We assume two-digit years to be in the range 1969 - 2068. */
    if (year < 69)
        year += 2000;
    else if (year < 100)
        year += 1900;

    m_greg = make_date(year, std::stoi (what.str("MONTH")),
                       std::stoi (what.str("DAY")));
}

ymd
CbDateImpl::year_month_day() const
{
    auto boost_ymd = m_greg.year_month_day();
    return {boost_ymd.year, boost_ymd.month.as_number(), boost_ymd.day};
}

std::string
CbDateImpl::format(const char* format) const
{
    using Facet = boost::gregorian::date_facet;
    std::stringstream ss;
    //The stream destructor frees the facet, so it must be heap-allocated.
    auto output_facet(new Facet(normalize_format(format).c_str()));
    ss.imbue(std::locale(std::locale(), output_facet));
    ss << m_greg;
    return ss.str();
}

/** Private implementation of CbDateTime. */
class CbDateTimeImpl
{
public:
    CbDateTimeImpl() :
        m_time(boost::posix_time::second_clock::universal_time()) {}
    CbDateTimeImpl(time64 time) :
        m_time(unix_epoch + boost::posix_time::seconds(time)) {}

    std::string format_zulu(const char* format) const;
    PTime m_time;
};

std::string
CbDateTimeImpl::format_zulu(const char* format) const
{
    using Facet = boost::posix_time::time_facet;
    std::stringstream ss;
    //The stream destructor frees the facet, so it must be heap-allocated.
    auto output_facet(new Facet(normalize_format(format).c_str()));
    ss.imbue(std::locale(std::locale(), output_facet));
    ss << m_time;
    return ss.str();
}

/* CbDate */
CbDate::CbDate() : m_impl{new CbDateImpl} {}
CbDate::CbDate(int year, int month, int day) :
    m_impl(new CbDateImpl(year, month, day)) {}
CbDate::CbDate(const std::string& str, const std::string& fmt) :
    m_impl(new CbDateImpl(str, fmt)) {}
CbDate::CbDate(std::unique_ptr<CbDateImpl> impl) :
    m_impl(std::move(impl)) {}
CbDate::CbDate(const CbDate& a) :
    m_impl(new CbDateImpl(*a.m_impl)) {}
CbDate::CbDate(CbDate&& a) : m_impl(new CbDateImpl(*a.m_impl)) {}
CbDate::~CbDate() = default;

CbDate&
CbDate::operator=(const CbDate& a)
{
    m_impl.reset(new CbDateImpl(*a.m_impl));
    return *this;
}

CbDate&
CbDate::operator=(CbDate&& a)
{
    std::swap(m_impl, a.m_impl);
    return *this;
}

CbDate
CbDate::from_iso(const std::string& str)
{
    static const boost::regex iso("^[ \\t\\r\\n]*([0-9]{4})-([0-9]{2})-([0-9]{2})");
    boost::smatch what;
    if (!boost::regex_search(str, what, iso))
        throw std::invalid_argument ("Not an ISO date: " + str);
    return CbDate(std::stoi(what.str(1)), std::stoi(what.str(2)),
                  std::stoi(what.str(3)));
}

ymd
CbDate::year_month_day() const
{
    return m_impl->year_month_day();
}

std::string
CbDate::format(const char* format) const
{
    return m_impl->format(format);
}

std::string
CbDate::iso() const
{
    return m_impl->format("%Y-%m-%d");
}

CbDate
CbDate::offset_days(int days) const
{
    auto greg = m_impl->m_greg + boost::gregorian::date_duration(days);
    return CbDate(std::make_unique<CbDateImpl>(greg));
}

CbDate
CbDate::from_days_since_epoch(int64_t days)
{
    try
    {
        auto greg = unix_epoch.date() + boost::gregorian::date_duration(days);
        if (!greg.is_special())
            return CbDate(std::make_unique<CbDateImpl>(greg));
    }
    catch (const std::out_of_range&)
    {
    }
    throw std::invalid_argument ("Day count is outside the supported range.");
}

bool operator<(const CbDate& a, const CbDate& b) { return a.m_impl->m_greg < b.m_impl->m_greg; }
bool operator>(const CbDate& a, const CbDate& b) { return a.m_impl->m_greg > b.m_impl->m_greg; }
bool operator==(const CbDate& a, const CbDate& b) { return a.m_impl->m_greg == b.m_impl->m_greg; }
bool operator<=(const CbDate& a, const CbDate& b) { return a.m_impl->m_greg <= b.m_impl->m_greg; }
bool operator>=(const CbDate& a, const CbDate& b) { return a.m_impl->m_greg >= b.m_impl->m_greg; }
bool operator!=(const CbDate& a, const CbDate& b) { return a.m_impl->m_greg != b.m_impl->m_greg; }

/* CbDateTime */
CbDateTime::CbDateTime() : m_impl(new CbDateTimeImpl) {}
CbDateTime::CbDateTime(time64 time) : m_impl(new CbDateTimeImpl(time)) {}
CbDateTime::CbDateTime(const CbDateTime& a) :
    m_impl(new CbDateTimeImpl(*a.m_impl)) {}
CbDateTime::~CbDateTime() = default;

CbDateTime&
CbDateTime::operator=(const CbDateTime& a)
{
    m_impl.reset(new CbDateTimeImpl(*a.m_impl));
    return *this;
}

time64
CbDateTime::seconds() const
{
    return (m_impl->m_time - unix_epoch).total_seconds();
}

CbDate
CbDateTime::date() const
{
    return CbDate(std::make_unique<CbDateImpl>(m_impl->m_time.date()));
}

std::string
CbDateTime::format_zulu(const char* format) const
{
    return m_impl->format_zulu(format);
}

std::string
cb_file_stamp(const CbDateTime& when)
{
    return when.format_zulu("%Y%m%d%H%M%S");
}

std::string
cb_ledger_timestamp(const CbDate& date)
{
    return date.iso() + " 10:59:00 +0000";
}
