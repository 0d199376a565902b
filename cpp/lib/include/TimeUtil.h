/** \file    TimeUtil.h
 *  \brief   Declarations of time-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Wagner Truppel
 */

/*
 *  Copyright 2003-2008 Project iVia.
 *  Copyright 2003-2008 The Regents of The University of California.
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
#pragma once


#include <limits>
#include <string>
#include <ctime>


/** \namespace  TimeUtil
 *  \brief      Utility funstions for manipulating dates and times.
 */
namespace TimeUtil {


constexpr time_t BAD_TIME_T = std::numeric_limits<time_t>::min();


const std::string ISO_8601_FORMAT("%Y-%m-%dT%T"); // This is only one of several possible ISO 8601 date/time formats!


/** The default strftime(3) format string for representing dates and times. */
const std::string DEFAULT_FORMAT("%Y-%m-%d %T");


/** The strftime(3) format string for RFC 822 timestamps in UTC, as used by RSS 2.0's <pubDate>. */
const std::string RFC822_UTC_FORMAT("%a, %d %b %Y %H:%M:%S +0000");


/** \enum   TimeZone
 *  \brief  Differentiate between UTC and the local timezone.
 */
enum TimeZone { UTC, LOCAL };


/** \brief   Get the current date time as a string
 *  \return  A string representing the current date and time.
 */
std::string GetCurrentDateAndTime(const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


/** \brief  Convert a time from a time_t to a string.
 *  \param  the_time   The time to convert.
 *  \param  format     The format of the result, in strftime(3) format.
 *  \param  time_zone  Whether to use local time (the default) or UTC.
 *  \return The converted time.
 *  \note   Day and month names are always English, independent of the environment's locale.
 */
std::string TimeTToString(const time_t &the_time, const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


/** \brief  Converts a struct tm interpreted as UTC to a time_t.
 *  \return The calendar time or TimeUtil::BAD_TIME_T on error.
 */
time_t TimeGm(const struct tm &tm);


/** \brief  Parses "date_str" according to the strptime(3) format "strptime_format".
 *  \return True if all of "date_str" was consumed by "strptime_format" and the result is a real calendar date, o/w false.
 *  \note   Dates that strptime(3) accepts but which don't exist, e.g. 2024-02-31, are rejected.
 */
bool StringToStructTm(struct tm * const tm, const std::string &date_str, const std::string &strptime_format = DEFAULT_FORMAT);


/** \brief  Like the above but throws a std::runtime_error if "date_str" can't be parsed. */
struct tm StringToStructTm(const std::string &date_str, const std::string &strptime_format = DEFAULT_FORMAT);


/** \brief  Parses "date_str" according to "strptime_format" and interprets the result as UTC.
 *  \return True on success, o/w false in which case "*unix_time" will be set to BAD_TIME_T.
 */
bool StringToTimeT(const std::string &date_str, const std::string &strptime_format, time_t * const unix_time);


} // namespace TimeUtil
