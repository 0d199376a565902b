/** \file   HtmlSanitizer.h
 *  \brief  Reduces HTML fragments to a small set of harmless tags and attributes.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <string>


namespace HtmlSanitizer {


/** \brief  Returns true if "tag_name" (lowercase) may appear in sanitised output. */
bool IsAllowedTag(const std::string &tag_name);


/** \brief  Returns true if "attribute_name" (lowercase) may appear on "tag_name" (lowercase) in sanitised output. */
bool IsAllowedAttribute(const std::string &tag_name, const std::string &attribute_name);


/** \brief  Returns true if "url" is relative or uses one of the http, https or mailto schemes.
 *  \note   Character references and embedded whitespace or control characters are taken into account before the
 *          scheme is determined, so "jav&#x61;script:" and "java\tscript:" are both rejected.
 */
bool IsSafeUrl(const std::string &url);


/** \brief  Removes everything from an HTML fragment that is not on our allow-list.
 *
 *  Tags that are not allowed are removed while their contents are kept.  The contents of "script", "style", "iframe",
 *  "object", "noscript" and "template" elements as well as comments and declarations are dropped entirely.  Only the
 *  "href" and "title" attributes on "a" elements and the "title" attribute on "abbr" and "acronym" elements survive,
 *  and "href" only if IsSafeUrl() approves of it.  Stray closing tags are dropped and tags that are still open at the
 *  end of the input are closed.  Character references in text and attribute values are retained, any other
 *  ampersands and angle brackets are escaped.
 */
std::string Sanitize(const std::string &html);


} // namespace HtmlSanitizer
