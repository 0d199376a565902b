/** \file    Locale.h
 *  \brief   Declaration of class Locale, a scoped per-thread locale switch.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2008 Project iVia.
 *  Copyright 2008 The Regents of The University of California.
 *  Copyright 2018-2020 Universitätsbibliothek Tübingen
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


#include <string>
#include <locale.h>


/** \class  Locale
 *  \brief  Switches the calling thread to "new_locale" for the lifetime of the object.
 *  \note   Used to get English day and month names out of strftime(3) and into strptime(3) regardless of the
 *          environment's LC_TIME setting.
 */
class Locale {
    locale_t old_locale_;
    locale_t new_locale_;
    const std::string new_locale_string_;

public:
    /** \brief  Constructs a new locale setting object.
     *  \param  new_locale     The new locale to switch to, e.g. "C".
     *  \param  category_mask  The categories to change, e.g. LC_TIME_MASK (see newlocale(3) for documentation).
     */
    explicit Locale(const std::string &new_locale, const int category_mask = LC_ALL_MASK);

    /** Restores the thread's previous locale. */
    ~Locale();

    Locale(const Locale &rhs) = delete;
    Locale &operator=(const Locale &rhs) = delete;
};
