/** \file    Locale.cc
 *  \brief   Implementation of class Locale.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2008 Project iVia.
 *  Copyright 2008 The Regents of The University of California.
 *  Copyright 2020 Universitätsbibliothek Tübingen
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

#include "Locale.h"
#include "util.h"


Locale::Locale(const std::string &new_locale, const int category_mask)
    : old_locale_(::uselocale(static_cast<locale_t>(0))), new_locale_(static_cast<locale_t>(0)), new_locale_string_(new_locale)
{
    new_locale_ = ::newlocale(category_mask, new_locale_string_.c_str(), static_cast<locale_t>(0));
    if (new_locale_ == static_cast<locale_t>(0))
        LOG_ERROR("failed to allocate new locale for '" + new_locale_string_ + "' (" + std::to_string(category_mask) + ")");
    if (::uselocale(new_locale_) == static_cast<locale_t>(0))
        LOG_ERROR("failed to set thread locale to '" + new_locale_string_ + "'");
}


Locale::~Locale() {
    if (::uselocale(old_locale_) == static_cast<locale_t>(0))
        LOG_ERROR("failed to restore thread locale");

    ::freelocale(new_locale_);
}
