/** \file    HtmlUtil.cc
 *  \brief   Implementation of HTML-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
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

#include "HtmlUtil.h"
#include <unordered_map>
#include <cstdlib>
#include "HtmlParser.h"
#include "StringUtil.h"


namespace HtmlUtil {


static inline bool IsHexDigit(const char ch) {
    return StringUtil::IsDigit(ch) or (ch >= 'a' and ch <= 'f') or (ch >= 'A' and ch <= 'F');
}


bool IsCharacterReference(const std::string &text, const size_t ampersand_pos, size_t * const reference_length) {
    if (unlikely(ampersand_pos >= text.length() or text[ampersand_pos] != '&'))
        return false;

    size_t pos(ampersand_pos + 1);
    if (pos < text.length() and text[pos] == '#') {
        ++pos;
        const bool hex(pos < text.length() and (text[pos] == 'x' or text[pos] == 'X'));
        if (hex)
            ++pos;
        const size_t digits_start(pos);
        while (pos < text.length() and (hex ? IsHexDigit(text[pos]) : StringUtil::IsDigit(text[pos])))
            ++pos;
        if (pos == digits_start or pos - digits_start > (hex ? 6u : 7u))
            return false;
    } else {
        if (pos >= text.length() or not StringUtil::IsAsciiLetter(text[pos]))
            return false;
        while (pos < text.length() and (StringUtil::IsAsciiLetter(text[pos]) or StringUtil::IsDigit(text[pos])))
            ++pos;
    }

    if (pos >= text.length() or text[pos] != ';')
        return false;

    if (reference_length != nullptr)
        *reference_length = pos + 1 - ampersand_pos;
    return true;
}


std::string HtmlEscape(const std::string &unescaped_text) {
    std::string escaped_text;
    escaped_text.reserve(unescaped_text.length());

    for (const char ch : unescaped_text) {
        if (ch == '&')
            escaped_text += "&amp;";
        else if (ch == '<')
            escaped_text += "&lt;";
        else if (ch == '>')
            escaped_text += "&gt;";
        else if (ch == '"')
            escaped_text += "&quot;";
        else if (ch == '\'')
            escaped_text += "&#x27;";
        else
            escaped_text += ch;
    }

    return escaped_text;
}


std::string EscapePreservingCharacterReferences(const std::string &text, const bool escape_double_quotes) {
    std::string escaped_text;
    escaped_text.reserve(text.length());

    for (size_t pos(0); pos < text.length(); ++pos) {
        const char ch(text[pos]);
        if (ch == '&')
            escaped_text += IsCharacterReference(text, pos) ? "&" : "&amp;";
        else if (ch == '<')
            escaped_text += "&lt;";
        else if (ch == '>')
            escaped_text += "&gt;";
        else if (ch == '"' and escape_double_quotes)
            escaped_text += "&quot;";
        else
            escaped_text += ch;
    }

    return escaped_text;
}


static const std::unordered_map<std::string, unsigned> NAMED_REFERENCES{
    { "amp", '&' }, { "lt", '<' }, { "gt", '>' }, { "quot", '"' }, { "apos", '\'' }, { "colon", ':' }, { "tab", '\t' },
    { "newline", '\n' }, { "nbsp", 0xA0 }, { "copy", 0xA9 }, { "reg", 0xAE }, { "deg", 0xB0 }, { "laquo", 0xAB },
    { "raquo", 0xBB }, { "auml", 0xE4 }, { "ouml", 0xF6 }, { "uuml", 0xFC }, { "Auml", 0xC4 }, { "Ouml", 0xD6 },
    { "Uuml", 0xDC }, { "szlig", 0xDF }, { "eacute", 0xE9 }, { "egrave", 0xE8 }, { "ndash", 0x2013 }, { "mdash", 0x2014 },
    { "lsquo", 0x2018 }, { "rsquo", 0x2019 }, { "sbquo", 0x201A }, { "ldquo", 0x201C }, { "rdquo", 0x201D },
    { "bdquo", 0x201E }, { "hellip", 0x2026 }, { "euro", 0x20AC }, { "trade", 0x2122 }
};


// \return False if "code_point" can't be represented in UTF-8.
static bool AppendUTF8(const unsigned long code_point, std::string * const s) {
    if (code_point == 0 or code_point > 0x10FFFF or (code_point >= 0xD800 and code_point <= 0xDFFF))
        return false;

    if (code_point < 0x80)
        *s += static_cast<char>(code_point);
    else if (code_point < 0x800) {
        *s += static_cast<char>(0xC0 | (code_point >> 6u));
        *s += static_cast<char>(0x80 | (code_point & 0x3Fu));
    } else if (code_point < 0x10000) {
        *s += static_cast<char>(0xE0 | (code_point >> 12u));
        *s += static_cast<char>(0x80 | ((code_point >> 6u) & 0x3Fu));
        *s += static_cast<char>(0x80 | (code_point & 0x3Fu));
    } else {
        *s += static_cast<char>(0xF0 | (code_point >> 18u));
        *s += static_cast<char>(0x80 | ((code_point >> 12u) & 0x3Fu));
        *s += static_cast<char>(0x80 | ((code_point >> 6u) & 0x3Fu));
        *s += static_cast<char>(0x80 | (code_point & 0x3Fu));
    }

    return true;
}


std::string DecodeCharacterReferences(const std::string &text) {
    std::string decoded_text;
    decoded_text.reserve(text.length());

    size_t pos(0);
    while (pos < text.length()) {
        size_t reference_length;
        if (text[pos] != '&' or not IsCharacterReference(text, pos, &reference_length)) {
            decoded_text += text[pos++];
            continue;
        }

        const std::string reference(text.substr(pos + 1, reference_length - 2));
        bool decoded;
        if (reference[0] == '#') {
            const bool hex(reference[1] == 'x' or reference[1] == 'X');
            decoded = AppendUTF8(std::strtoul(reference.c_str() + (hex ? 2 : 1), nullptr, hex ? 16 : 10), &decoded_text);
        } else {
            const auto named_reference(NAMED_REFERENCES.find(reference));
            decoded = named_reference != NAMED_REFERENCES.cend() and AppendUTF8(named_reference->second, &decoded_text);
        }
        if (not decoded)
            decoded_text += text.substr(pos, reference_length);
        pos += reference_length;
    }

    return decoded_text;
}


namespace {


class TextExtractor : public HtmlParser {
    std::string * const extracted_text_;
public:
    TextExtractor(const std::string &html, std::string * const extracted_text)
        : HtmlParser(html, HtmlParser::TEXT), extracted_text_(extracted_text) { }
    virtual void notify(const HtmlParser::Chunk &chunk) { *extracted_text_ += chunk.text_; }
};


} // unnamed namespace


std::string ExtractText(const std::string &html) {
    std::string extracted_text;
    TextExtractor extractor(html, &extracted_text);
    extractor.parse();

    return DecodeCharacterReferences(extracted_text);
}


} // namespace HtmlUtil
