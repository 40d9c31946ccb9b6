// Copyright 2014 Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "utils/datetime.hpp"

extern "C" {
#include <sys/time.h>

#include <time.h>
}

#include <cctype>
#include <stdexcept>

#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;

using utils::optional;


namespace {


/// Fake value for the current time.
static optional< datetime::timestamp > mock_now;


/// Splits a count of microseconds into seconds and the remaining microseconds.
///
/// \param useconds The microseconds since the epoch.  May be negative.
/// \param [out] seconds The seconds since the epoch, rounded down.
/// \param [out] remainder The microseconds within that second, in [0, 1e6).
static void
split_microseconds(const int64_t useconds, int64_t& seconds,
                   int64_t& remainder)
{
    seconds = useconds / 1000000;
    remainder = useconds % 1000000;
    if (remainder < 0) {
        seconds -= 1;
        remainder += 1000000;
    }
}


/// Consumes a fixed number of decimal digits from a string.
///
/// \param str The string being parsed.
/// \param [in,out] pos Position of the first digit; advanced past the digits.
/// \param count The number of digits to consume.
/// \param [out] value The parsed number.
///
/// \return True if there were enough digits; false otherwise.
static bool
parse_digits(const std::string& str, std::string::size_type& pos,
             const int count, int& value)
{
    value = 0;
    for (int i = 0; i < count; ++i, ++pos) {
        if (pos >= str.length() ||
            !std::isdigit(static_cast< unsigned char >(str[pos])))
            return false;
        value = value * 10 + (str[pos] - '0');
    }
    return true;
}


/// Returns the number of days in a month.
///
/// \param year The year, needed to account for leap years.
/// \param month The month, in the [1, 12] range.
///
/// \return The number of days in the month.
static int
days_in_month(const int year, const int month)
{
    static const int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30,
                                31 };
    PRE(month >= 1 && month <= 12);
    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0))
        return 29;
    return days[month - 1];
}


/// Consumes a specific character from a string.
///
/// \param str The string being parsed.
/// \param [in,out] pos Position of the character; advanced past it.
/// \param expected The character that has to be present.
///
/// \return True if the character was found; false otherwise.
static bool
parse_char(const std::string& str, std::string::size_type& pos,
           const char expected)
{
    if (pos >= str.length() || str[pos] != expected)
        return false;
    ++pos;
    return true;
}


/// Parses the zone designator of an ISO 8601 timestamp.
///
/// \param str The string being parsed.
/// \param [in,out] pos Position of the designator, if any.
/// \param [out] offset The offset of the zone from UTC, in seconds.
///
/// \return True if the designator is valid or missing; false otherwise.
static bool
parse_zone(const std::string& str, std::string::size_type& pos, int& offset)
{
    offset = 0;
    if (pos == str.length())
        return true;  // No designator; the timestamp is already in UTC.
    if (str[pos] == 'Z') {
        ++pos;
        return true;
    }
    if (str[pos] != '+' && str[pos] != '-')
        return false;
    const int sign = str[pos] == '+' ? 1 : -1;
    ++pos;

    int hours, minutes = 0;
    if (!parse_digits(str, pos, 2, hours) || hours > 23)
        return false;
    if (pos < str.length()) {
        (void)parse_char(str, pos, ':');
        if (!parse_digits(str, pos, 2, minutes) || minutes > 59)
            return false;
    }
    offset = sign * (hours * 3600 + minutes * 60);
    return true;
}


}  // anonymous namespace


namespace utils {
namespace datetime {


/// Internal representation for datetime::timestamp.
struct timestamp::impl {
    /// The timestamp as microseconds since the epoch in UTC.
    int64_t useconds;

    /// The broken-down representation of the seconds in useconds.
    ::tm data;

    /// Constructs an impl object from the microseconds since the epoch.
    ///
    /// \param useconds_ The microseconds since the epoch in UTC.
    impl(const int64_t useconds_) : useconds(useconds_)
    {
        int64_t seconds, remainder;
        split_microseconds(useconds, seconds, remainder);
        const time_t raw_seconds = static_cast< time_t >(seconds);
        if (::gmtime_r(&raw_seconds, &data) == NULL)
            UNREACHABLE_MSG("gmtime_r(3) did not accept the value returned by "
                            "time(3); this cannot happen");
    }
};


}  // namespace datetime
}  // namespace utils


/// Constructs a new timestamp.
///
/// \param pimpl_ An existing impl representation.
datetime::timestamp::timestamp(std::shared_ptr< impl > pimpl_) :
    _pimpl(pimpl_)
{
}


/// Constructs a timestamp from the amount of microseconds since the epoch.
///
/// \param value Microseconds since the epoch in UTC.
///
/// \return A new timestamp.
datetime::timestamp
datetime::timestamp::from_microseconds(const int64_t value)
{
    return timestamp(std::shared_ptr< impl >(new impl(value)));
}


/// Constructs a timestamp based on user-friendly values.
///
/// \param year The year in the [1900,inf) range.
/// \param month The month in the [1,12] range.
/// \param day The day in the [1,31] range.
/// \param hour The hour in the [0,23] range.
/// \param minute The minute in the [0,59] range.
/// \param second The second in the [0,60] range.  Yes, that is 60, which can
///     happen on leap seconds.
/// \param microsecond The microsecond in the [0,999999] range.
///
/// \return A new timestamp, interpreting all values as UTC.
datetime::timestamp
datetime::timestamp::from_values(const int year, const int month,
                                 const int day, const int hour,
                                 const int minute, const int second,
                                 const int microsecond)
{
    PRE(year >= 1900);
    PRE(month >= 1 && month <= 12);
    PRE(day >= 1 && day <= 31);
    PRE(hour >= 0 && hour <= 23);
    PRE(minute >= 0 && minute <= 59);
    PRE(second >= 0 && second <= 60);
    PRE(microsecond >= 0 && microsecond <= 999999);

    ::tm data;
    data.tm_sec = second;
    data.tm_min = minute;
    data.tm_hour = hour;
    data.tm_mday = day;
    data.tm_mon = month - 1;
    data.tm_year = year - 1900;
    data.tm_wday = 0;
    data.tm_yday = 0;
    data.tm_isdst = 0;

    const time_t seconds = ::timegm(&data);
    return from_microseconds(static_cast< int64_t >(seconds) * 1000000 +
                             microsecond);
}


/// Parses an ISO 8601 timestamp.
///
/// The accepted format is YYYY-MM-DDTHH:MM:SS, where the 'T' may also be a
/// space, optionally followed by a fraction of a second and a zone designator
/// ('Z', +HH, +HHMM or +HH:MM, or the negative versions of these).  A
/// timestamp without zone designator is interpreted as UTC.
///
/// \param str The string to parse.
///
/// \return A new timestamp, converted to UTC.
///
/// \throw std::invalid_argument If the string is not a valid timestamp.
datetime::timestamp
datetime::timestamp::from_iso8601(const std::string& str)
{
    std::string::size_type pos = 0;
    int year, month, day, hour, minute, second;
    bool valid =
        parse_digits(str, pos, 4, year) && parse_char(str, pos, '-') &&
        parse_digits(str, pos, 2, month) && parse_char(str, pos, '-') &&
        parse_digits(str, pos, 2, day) &&
        (parse_char(str, pos, 'T') || parse_char(str, pos, ' ')) &&
        parse_digits(str, pos, 2, hour) && parse_char(str, pos, ':') &&
        parse_digits(str, pos, 2, minute) && parse_char(str, pos, ':') &&
        parse_digits(str, pos, 2, second);

    int microsecond = 0;
    if (valid && pos < str.length() && str[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < str.length() &&
               std::isdigit(static_cast< unsigned char >(str[pos]))) {
            if (digits < 6)
                microsecond = microsecond * 10 + (str[pos] - '0');
            ++digits;
            ++pos;
        }
        for (int i = digits; i < 6; ++i)
            microsecond *= 10;
        valid = digits > 0;
    }

    int offset = 0;
    valid = valid && parse_zone(str, pos, offset) && pos == str.length() &&
        year >= 1900 && month >= 1 && month <= 12 && day >= 1 &&
        day <= days_in_month(year, month) &&
        hour <= 23 && minute <= 59 && second <= 60;
    if (!valid)
        throw std::invalid_argument(F("Invalid ISO 8601 timestamp '%s'") %
                                    str);

    const timestamp local = from_values(year, month, day, hour, minute, second,
                                        microsecond);
    return from_microseconds(local.to_microseconds() -
                             static_cast< int64_t >(offset) * 1000000);
}


/// Constructs a new timestamp representing the current time in UTC.
///
/// \return A new timestamp.
datetime::timestamp
datetime::timestamp::now(void)
{
    if (mock_now)
        return mock_now.get();

    ::timeval data;
    {
        const int ret = ::gettimeofday(&data, NULL);
        INV(ret != -1);
    }

    return from_microseconds(static_cast< int64_t >(data.tv_sec) * 1000000 +
                             data.tv_usec);
}


/// Formats a timestamp.
///
/// \param format The format string to use as consumed by strftime(3).
///
/// \return The formatted time.
std::string
datetime::timestamp::strftime(const std::string& format) const
{
    char buf[128];
    if (::strftime(buf, sizeof(buf), format.c_str(), &_pimpl->data) == 0)
        UNREACHABLE_MSG("Arbitrary-long format strings are unimplemented");
    return buf;
}


/// Formats a timestamp in the ISO 8601 format with microsecond precision.
///
/// \return A string like 2026-01-31T12:34:56.000123Z.
std::string
datetime::timestamp::to_iso8601_in_utc(void) const
{
    int64_t seconds, remainder;
    split_microseconds(_pimpl->useconds, seconds, remainder);
    return F("%s.%06sZ") % strftime("%Y-%m-%dT%H:%M:%S") % remainder;
}


/// Returns the number of microseconds since the epoch in UTC.
///
/// \return A number of microseconds.
int64_t
datetime::timestamp::to_microseconds(void) const
{
    return _pimpl->useconds;
}


/// Returns the number of seconds since the epoch in UTC.
///
/// \return A number of seconds, rounded down.
int64_t
datetime::timestamp::to_seconds(void) const
{
    int64_t seconds, remainder;
    split_microseconds(_pimpl->useconds, seconds, remainder);
    return seconds;
}


/// Checks if two timestamps are equal.
///
/// \param other The object to compare to.
///
/// \return True if the two timestamps are equals; false otherwise.
bool
datetime::timestamp::operator==(const datetime::timestamp& other) const
{
    return _pimpl->useconds == other._pimpl->useconds;
}


/// Checks if two timestamps are different.
///
/// \param other The object to compare to.
///
/// \return True if the two timestamps are different; false otherwise.
bool
datetime::timestamp::operator!=(const datetime::timestamp& other) const
{
    return !(*this == other);
}


/// Checks if a timestamp is before another.
///
/// \param other The object to compare to.
///
/// \return True if this timestamp comes before other; false otherwise.
bool
datetime::timestamp::operator<(const datetime::timestamp& other) const
{
    return _pimpl->useconds < other._pimpl->useconds;
}


/// Checks if a timestamp is before or equal to another.
///
/// \param other The object to compare to.
///
/// \return True if this timestamp comes before other or is equal to it;
/// false otherwise.
bool
datetime::timestamp::operator<=(const datetime::timestamp& other) const
{
    return _pimpl->useconds <= other._pimpl->useconds;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
datetime::operator<<(std::ostream& output, const timestamp& object)
{
    return (output << object.to_iso8601_in_utc());
}


/// Sets the current time for testing purposes.
///
/// \param year The year in the [1900,inf) range.
/// \param month The month in the [1,12] range.
/// \param day The day in the [1,31] range.
/// \param hour The hour in the [0,23] range.
/// \param minute The minute in the [0,59] range.
/// \param second The second in the [0,60] range.
/// \param microsecond The microsecond in the [0,999999] range.
void
datetime::set_mock_now(const int year, const int month,
                       const int day, const int hour,
                       const int minute, const int second,
                       const int microsecond)
{
    mock_now = timestamp::from_values(year, month, day, hour, minute, second,
                                      microsecond);
}


/// Sets the current time for testing purposes.
///
/// \param mock_now_ The mock timestamp to set the time to.
void
datetime::set_mock_now(const timestamp& mock_now_)
{
    mock_now = mock_now_;
}
