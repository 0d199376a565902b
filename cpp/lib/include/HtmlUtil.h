/** \file    HtmlUtil.h
 *  \brief   Declarations of HTML-related utility functions.
 *  \author  Dr. Gordon W. Paynter
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2016-2017 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#ifndef HTML_UTIL_H
#define HTML_UTIL_H


#include <string>


namespace HtmlUtil {


/** \brief  Checks whether a character reference like "&amp;", "&#38;" or "&#x26;" starts at "ampersand_pos".
 *  \param  reference_length  If not NULL and a reference was found, its length including the '&' and ';' will be stored here.
 */
bool IsCharacterReference(const std::string &text, const size_t ampersand_pos, size_t * const reference_length = nullptr);


/** \brief Replaces ampersands, angle brackets and both types of quotes with HTML entities.
 *  \note  Everything is escaped, including ampersands that already start a character reference.
 */
std::string HtmlEscape(const std::string &unescaped_text);


/** \brief Replaces ampersands, angle brackets and both types of quotes with HTML entities. */
inline std::string HtmlEscape(std::string * const unescaped_text) {
    return *unescaped_text = HtmlEscape(*unescaped_text);
}


/** \brief  Escapes '<', '>' and ampersands that do not start a character reference.
 *  \param  escape_double_quotes  If true, '"' will be escaped as well which is what we need for attribute values.
 *  \note   Unlike HtmlEscape(), this can be applied to text that may already contain correctly escaped parts.
 */
std::string EscapePreservingCharacterReferences(const std::string &text, const bool escape_double_quotes = false);


/** \brief  Replaces numeric character references and the more common named ones with the UTF-8 encoded characters they
 *          stand for.  References to unknown names or invalid code points are left alone.
 *  \note   It is probably a good idea to call ExtractText() or remove the tags in some other way before calling this.
 */
std::string DecodeCharacterReferences(const std::string &text);


/** \brief  Returns the concatenated text contents of an HTML fragment with all character references decoded.
 *  \note   The contents of "script" and "style" elements as well as comments are not part of the text.
 */
std::string ExtractText(const std::string &html);


} // namespace HtmlUtil


#endif // define HTML_UTIL_H
