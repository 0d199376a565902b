/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2002-2004 Dr. Johannes Ruscheinski.
 *  Copyright 2015 Universitätsbibliothek Tübingen
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

#include "StringUtil.h"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>


namespace StringUtil {


std::string ToLower(std::string * const s) {
    for (std::string::iterator ch(s->begin()); ch != s->end(); ++ch)
        *ch = static_cast<char>(std::tolower(static_cast<unsigned char>(*ch)));

    return *s;
}


std::string ToLower(const std::string &s) {
    std::string result(s);
    return ToLower(&result);
}


std::string RightTrim(const std::string &trim_set, std::string * const s) {
    size_t trimmed_length(s->length());
    const char * const set(trim_set.c_str());
    while (trimmed_length > 0 and std::strchr(set, (*s)[trimmed_length - 1]) != nullptr)
        --trimmed_length;

    s->resize(trimmed_length);
    return *s;
}


std::string LeftTrim(const std::string &trim_set, std::string * const s) {
    size_t no_of_leading_trim_chars(0);
    const char * const set(trim_set.c_str());
    while (no_of_leading_trim_chars < s->length() and std::strchr(set, (*s)[no_of_leading_trim_chars]) != nullptr)
        ++no_of_leading_trim_chars;

    if (no_of_leading_trim_chars > 0)
        s->erase(0, no_of_leading_trim_chars);

    return *s;
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    RightTrim(trim_set, s);
    return LeftTrim(trim_set, s);
}


bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and std::isspace(static_cast<unsigned char>(*ch)))
        ++ch;
    if (unlikely(ch == s.end() or *ch == '-'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, base));
    *n = static_cast<unsigned>(ul);

    const bool success((*end_ptr == '\0') and (errno == 0) and (ul <= UINT_MAX));
    errno = 0;
    return success;
}


unsigned ToUnsigned(const std::string &s, const unsigned base) {
    unsigned n;
    if (unlikely(not ToUnsigned(s, &n, base)))
        throw std::runtime_error("in StringUtil::ToUnsigned: can't convert \"" + s + "\" to an unsigned!");

    return n;
}


} // namespace StringUtil
