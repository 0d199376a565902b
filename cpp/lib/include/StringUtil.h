/** \file    StringUtil.h
 *  \brief   Declarations for string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Artur Kedzierski
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

#ifndef STRING_UTIL_H
#define STRING_UTIL_H


#include <string>
#include <stdexcept>
#include <cstring>
#include <strings.h>
#include "util.h"


/** \namespace  StringUtil
 *  \brief      Various string processing functions.
 */
namespace StringUtil {


// Only ASCII whitespace.  A lone 0xA0 byte would be the tail of a multibyte UTF-8 sequence.
const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief  Convert a string to lowercase (modifies its argument). */
std::string ToLower(std::string * const s);


/** \brief  Convert a string to lowercase (does not modify its agrument). */
std::string ToLower(const std::string &s);


/** \brief   Remove all occurences of a set of characters from the end of a string.
 *  \param   s          The string to trim.
 *  \param   trim_set   The set of characters to remove.
 *  \return  The trimmed string.
 */
std::string RightTrim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from the beginning of a string.
 *  \param   s          The string to trim.
 *  \param   trim_set   The set of characters to remove.
 *  \return  The trimmed string.
 */
std::string LeftTrim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   s         The string to trim.
 *  \param   trim_set  The set of characters to remove.
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of whitespace characters from either end of a string.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
inline std::string TrimWhite(std::string * const s)
{
        return Trim(WHITE_SPACE, s);
}


/** \brief   Remove all occurences of whitespace characters from either end of a string.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
inline std::string TrimWhite(const std::string &s)
{
        std::string temp_s(s);
        return TrimWhite(&temp_s);
}


/** \brief   Convert a string into an unsigned number.
 *  \param   s     The string to convert.
 *  \param   n     Number that will hold the result.
 *  \param   base  The base of the string representation.
 *  \return  true if the conversion was successful, false otherwise.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);


/** \brief   Convert a string into an unsigned number.
 *  \throws  std::runtime_error if "s" is not comprised solely of digits.
 */
unsigned ToUnsigned(const std::string &s, const unsigned base = 10);


/** \brief  Split a string around a delimiter character.
 *  \param  source                     The string to split.
 *  \param  delimiter                  The character to split around.
 *  \param  container                  A list to return the resulting fields in.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of extracted "fields".
 */
template<typename InsertableContainer> unsigned Split(const std::string &source, const char delimiter,
                                                      InsertableContainer * const container,
                                                      const bool suppress_empty_components = true)
{
        container->clear();
        if (source.empty())
              return 0;

        unsigned count(0);
        std::string::size_type start(0);
        for (;;) {
                const std::string::size_type next_delimiter(source.find(delimiter, start));
                const std::string field(next_delimiter == std::string::npos ? source.substr(start)
                                                                            : source.substr(start, next_delimiter - start));
                if (not field.empty() or not suppress_empty_components) {
                        container->insert(container->end(), field);
                        ++count;
                }

                if (next_delimiter == std::string::npos)
                        return count;
                start = next_delimiter + 1;
        }
}


/** \brief  Split a string, then trim the component substrings.
 *  \param  s                     The string to split.
 *  \param  field_separator       A delimiter character to split around.
 *  \param  trim_chars            A set of characters to trim from each resulting substring.
 *  \param  container             A string container to hold the parts (e.g. std::list<std::string>).
 *  \param  suppress_empty_words  If true, we skip words that are empty after trimming, otherwise we keep them.
 *  \return The number of extracted "words".
 *
 *  \par
 *  The "words" must be a container that contains strings.  It can have any container type that matches the STL "Back
 *  Insertion Sequence".  In other words, it can be std::list<std::string>, std::vector<std::string> or
 *  std::deque<std::string>.
 */
template<typename InsertableContainer> inline unsigned SplitThenTrim(const std::string &s, const char field_separator, const std::string &trim_chars,
                                                                     InsertableContainer * const container, const bool suppress_empty_words = true)
{
        Split(s, field_separator, container, /* suppress_empty_components = */false);

        InsertableContainer trimmed_words;
        for (auto word : *container) {
                Trim(trim_chars, &word);
                if (word.empty() and suppress_empty_words)
                        continue;
                trimmed_words.insert(trimmed_words.end(), word);
        }
        container->swap(trimmed_words);

        return static_cast<unsigned>(container->size());
}


/** \brief  Split a string, then trim the component substrings' whitespace.
 *  \param  s                     The string to split.
 *  \param  field_separator       The delimiter character to split around.
 *  \param  container             A string container to hold the parts (e.g. std::list<std::string>).
 *  \param  suppress_empty_words  If true, we skip empty "words", otherwise we keep them.
 *  \return The number of extracted "words".
 */
template<typename InsertableContainer> inline unsigned SplitThenTrimWhite(const std::string &s, const char field_separator,
                                                                          InsertableContainer * const container, const bool suppress_empty_words = true)
{
        return SplitThenTrim(s, field_separator, WHITE_SPACE, container, suppress_empty_words);
}


/** \brief  Join a list of words to form a single string and return that string
 *  \param  source         A container of strings.
 *  \param  separator      The text to insert between the list elements.
 */
template<typename StringContainer> std::string Join(const StringContainer &source, const std::string &separator)
{
        std::string dest;
        for (auto word(source.begin()); word != source.end(); ++word) {
                if (word != source.begin())
                        dest += separator;
                dest += *word;
        }

        return dest;
}


/** \brief  Returns what isalpha would return in the "C" locale. */
inline bool IsAsciiLetter(const char ch)
{
        // Caution: the following code assumes a character set where a-z, A-Z are consecutive, e.g. ANSI or ASCII
        //          but not EBCDIC etc.
        return (ch >= 'a' and ch <= 'z') or (ch >= 'A' and ch <= 'Z');
}


/** \brief  Returns what isdigit would return in the "C" locale. */
inline bool IsDigit(const char ch)
{
        return ch >= '0' and ch <= '9';
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false)
{
        return prefix.empty()
                or (s.length() >= prefix.length()
                    and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                         : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** \brief   Does the given string end with the suggested suffix?
 *  \param   s            The string to test.
 *  \param   suffix       The suffix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or ends with the suffix "suffix."
 */
inline bool EndsWith(const std::string &s, const std::string &suffix, const bool ignore_case = false)
{
        return suffix.empty() or (s.length() >= suffix.length()
               and (ignore_case
                    ? (::strncasecmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)
                    : (std::strncmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)));
}


} // namespace StringUtil


#endif // ifndef STRING_UTIL_H
