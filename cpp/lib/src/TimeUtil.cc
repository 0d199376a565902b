/** \file    TimeUtil.cc
 *  \brief   Declarations of time-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Wagner Truppel
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2003-2009 The Regents of The University of California.
 *  Copyright 2018-2021 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "TimeUtil.h"
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include "Locale.h"
#include "util.h"


namespace TimeUtil {


// GetCurrentTime -- Get the current date and time as a string
//
std::string GetCurrentDateAndTime(const std::string &format, const TimeZone time_zone) {
    time_t now;
    std::time(&now);
    return TimeTToString(now, format, time_zone);
}


std::string TimeTToString(const time_t &the_time, const std::string &format, const TimeZone time_zone) {
    Locale locale("C", LC_TIME_MASK);

    struct tm tm;
    if (unlikely((time_zone == LOCAL ? ::localtime_r(&the_time, &tm) : ::gmtime_r(&the_time, &tm)) == nullptr))
        LOG_ERROR("time conversion error! (" + std::to_string(the_time) + ")");
    char time_buf[100 + 1];
    if (unlikely(std::strftime(time_buf, sizeof(time_buf), format.c_str(), &tm) == 0))
        LOG_ERROR("strftime(3) failed! (format: " + format + ")");
    return time_buf;
}


time_t TimeGm(const struct tm &tm) {
    struct tm temp_tm(tm);
    errno = 0;
    const time_t ret_val(::timegm(&temp_tm));
    if (unlikely(ret_val == static_cast<time_t>(-1) and errno != 0)) {
        errno = 0;
        return BAD_TIME_T;
    }

    return ret_val;
}


bool StringToStructTm(struct tm * const tm, const std::string &date_str, const std::string &strptime_format) {
    Locale locale("C", LC_TIME_MASK);

    std::memset(tm, 0, sizeof(*tm));
    const char * const last_char(::strptime(date_str.c_str(), strptime_format.c_str(), tm));
    if (last_char == nullptr or *last_char != '\0')
        return false;

    // Formats w/o a day-of-month leave tm_mday at 0 which would otherwise be normalised into the previous month.
    if (tm->tm_mday == 0)
        tm->tm_mday = 1;

    // strptime(3) happily accepts e.g. Feb 31st.  Let timegm(3) normalise a copy and see whether anything moved.
    struct tm normalised_tm(*tm);
    if (unlikely(::timegm(&normalised_tm) == static_cast<time_t>(-1) and errno != 0)) {
        errno = 0;
        return false;
    }

    return normalised_tm.tm_year == tm->tm_year and normalised_tm.tm_mon == tm->tm_mon and normalised_tm.tm_mday == tm->tm_mday
           and normalised_tm.tm_hour == tm->tm_hour and normalised_tm.tm_min == tm->tm_min;
}


struct tm StringToStructTm(const std::string &date_str, const std::string &strptime_format) {
    struct tm tm;
    if (likely(StringToStructTm(&tm, date_str, strptime_format)))
        return tm;

    throw std::runtime_error("in TimeUtil::StringToStructTm: \"" + date_str + "\" does not match \"" + strptime_format + "\"!");
}


bool StringToTimeT(const std::string &date_str, const std::string &strptime_format, time_t * const unix_time) {
    struct tm tm;
    if (not StringToStructTm(&tm, date_str, strptime_format)) {
        *unix_time = BAD_TIME_T;
        return false;
    }

    *unix_time = TimeGm(tm);
    return *unix_time != BAD_TIME_T;
}


} // namespace TimeUtil
