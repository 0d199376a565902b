/** \file    HtmlParser.cc
 *  \brief   Implementation of an HTML parser class.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2007 Dr. Johannes Ruscheinski.
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

#include "HtmlParser.h"
#include <stdexcept>
#include <cctype>
#include <cstdio>
#include <strings.h>
#include "StringUtil.h"
#include "util.h"


namespace {


inline bool IsAsciiLetter(const int ch) {
    return ('A' <= ch and ch <= 'Z') or ('a' <= ch and ch <= 'z');
}


inline bool IsAsciiLetterOrDigit(const int ch) {
    return ('A' <= ch and ch <= 'Z') or ('a' <= ch and ch <= 'z') or ('0' <= ch and ch <= '9');
}


inline bool IsAttributeNameChar(const int ch) {
    return IsAsciiLetterOrDigit(ch) or ch == '-' or ch == '_' or ch == ':' or ch == '.';
}


inline bool IsSpace(const int ch) {
    return ch == ' ' or ch == '\t' or ch == '\n' or ch == '\r' or ch == '\f' or ch == '\v';
}


} // unnamed namespace


// HtmlParser::AttributeMap::toString -- Construct a string representation of an attribute map.
//
std::string HtmlParser::AttributeMap::toString() const
{
    std::string result;
    for (const auto &name_and_value : attributes_)
        result += " " + name_and_value.first + "=\"" + name_and_value.second + "\"";

    return result;
}


bool HtmlParser::AttributeMap::insert(const std::string &name, const std::string &value)
{
    if (find(name) != end())
        return false;

    attributes_.emplace_back(name, value);
    return true;
}


HtmlParser::AttributeMap::const_iterator HtmlParser::AttributeMap::find(const std::string &key) const
{
    for (auto name_and_value(attributes_.cbegin()); name_and_value != attributes_.cend(); ++name_and_value) {
        if (name_and_value->first == key)
            return name_and_value;
    }

    return attributes_.cend();
}


// HtmlParser::Chunk::toString -- Construct a string representation of a chunk.
//
std::string HtmlParser::Chunk::toString() const
{
    switch (type_) {
    case OPENING_TAG:
        return "<" + text_ + (attribute_map_ == nullptr ? "" : attribute_map_->toString()) + ">";
    case MALFORMED_TAG:
    case TEXT:
        return text_;
    case CLOSING_TAG:
    case UNEXPECTED_CLOSING_TAG:
        return "</" + text_ + ">";
    case COMMENT:
        return "<!--" + text_ + "-->";
    case END_OF_STREAM:
    case UNEXPECTED_END_OF_STREAM:
        if (error_message_.empty())
            return "";
        else
            return "(" + error_message_ + ")";
    }

    throw std::runtime_error("in HtmlParser::Chunk::toString: cannot convert an unknown chunk type to a string!");
}


int HtmlParser::getChar()
{
    if (unlikely(endOfStream()))
        return EOF;

    const int ch(static_cast<unsigned char>(input_[pos_++]));
    if (unlikely(ch == '\n'))
        ++lineno_;

    return ch;
}


void HtmlParser::ungetChar()
{
    if (unlikely(pos_ == 0))
        LOG_ERROR("trying to push back at beginning of input!");

    --pos_;
    if (unlikely(input_[pos_] == '\n'))
        --lineno_;
}


// HtmlParser::isStartOfMarkup -- a '<' only starts a tag, comment or declaration if it is followed by a letter, a
//                                slash or an exclamation mark.  Anything else is a literal less-than sign.
//
bool HtmlParser::isStartOfMarkup(const size_t pos) const
{
    if (input_[pos] != '<' or pos + 1 >= input_.length())
        return false;

    const int next_ch(static_cast<unsigned char>(input_[pos + 1]));
    return IsAsciiLetter(next_ch) or next_ch == '/' or next_ch == '!';
}


void HtmlParser::skipWhiteSpace()
{
    while (not endOfStream() and IsSpace(peekChar()))
        getChar();
}


void HtmlParser::reportUnexpectedEndOfStream(const std::string &error_message)
{
    if (chunk_mask_ & UNEXPECTED_END_OF_STREAM) {
        Chunk unexpected_eof_chunk(UNEXPECTED_END_OF_STREAM, lineno_, error_message);
        preNotify(&unexpected_eof_chunk);
    }
}


// HtmlParser::skipDeclaration -- assumes that at this point we have read "<!" and skips over all input up to and
//                                including ">".  Returns false if we hit the end of our input.
//
bool HtmlParser::skipDeclaration()
{
    const unsigned start_lineno(lineno_);
    int ch;
    do
        ch = getChar();
    while (ch != '>' and ch != EOF);

    if (unlikely(ch == EOF)) {
        reportUnexpectedEndOfStream("unexpected end-of-stream while skipping over a declaration started on line "
                                    + std::to_string(start_lineno));
        return false;
    }

    return true;
}


// HtmlParser::skipComment -- assumes that at this point we have read "<!--" and
//                            skips over all input up to and including "-->".
//
bool HtmlParser::skipComment()
{
    const unsigned start_lineno(lineno_);
    const size_t end_of_comment(input_.find("-->", pos_));
    if (unlikely(end_of_comment == std::string::npos)) {
        while (getChar() != EOF)
            /* Intentionally empty! */;
        reportUnexpectedEndOfStream("unexpected EOF within HTML comment (started on line "
                                    + std::to_string(start_lineno) + ")");
        return false;
    }

    const std::string comment_text(input_.substr(pos_, end_of_comment - pos_));
    while (pos_ < end_of_comment + 3)
        getChar();

    if (chunk_mask_ & COMMENT) {
        Chunk comment_chunk(COMMENT, comment_text, start_lineno);
        preNotify(&comment_chunk);
    }

    return true;
}


// HtmlParser::skipToEndOfTag -- attempts to skip until the closing '>' of a tag or a '<'.  Returns false if we hit
//                               the end of our input instead.
//
bool HtmlParser::skipToEndOfTag()
{
    int ch;
    do
        ch = getChar();
    while (ch != EOF and ch != '>' and ch != '<');

    if (ch == '<')
        ungetChar();

    return ch != EOF;
}


// HtmlParser::reportMalformedTag -- skips the rest of a broken tag and reports the raw input from "tag_start" on.
//                                   Returns false if the tag was never closed.
//
bool HtmlParser::reportMalformedTag(const size_t tag_start, const unsigned tag_start_lineno, const std::string &tag_name)
{
    const bool tag_ended(skipToEndOfTag());
    if (chunk_mask_ & MALFORMED_TAG) {
        Chunk malformed_tag(MALFORMED_TAG, input_.substr(tag_start, pos_ - tag_start), tag_start_lineno);
        preNotify(&malformed_tag);
    }

    if (unlikely(not tag_ended)) {
        reportUnexpectedEndOfStream("tag \"" + tag_name + "\" opened on line " + std::to_string(tag_start_lineno)
                                    + " was never closed");
        return false;
    }

    return true;
}


// HtmlParser::skipToEndOfScriptOrStyle -- skips to the position just past the closing tag named "tag_name".
//                                         Returns false if we hit the end of our input.
//
bool HtmlParser::skipToEndOfScriptOrStyle(const std::string &tag_name, const unsigned tag_start_lineno)
{
    size_t closing_tag_start(pos_);
    for (;;) {
        closing_tag_start = input_.find("</", closing_tag_start);
        if (closing_tag_start == std::string::npos)
            break;

        const size_t after_tag_name(closing_tag_start + 2 + tag_name.length());
        if (::strncasecmp(input_.c_str() + closing_tag_start + 2, tag_name.c_str(), tag_name.length()) == 0
            and (after_tag_name >= input_.length() or IsSpace(static_cast<unsigned char>(input_[after_tag_name]))
                 or input_[after_tag_name] == '>' or input_[after_tag_name] == '/'))
            break;
        closing_tag_start += 2;
    }

    if (unlikely(closing_tag_start == std::string::npos)) {
        while (getChar() != EOF)
            /* Intentionally empty! */;
        reportUnexpectedEndOfStream("unexpected end-of-stream while skipping over the contents of a \"" + tag_name
                                    + "\" tag opened on line " + std::to_string(tag_start_lineno));
        return false;
    }

    while (pos_ < closing_tag_start)
        getChar();
    int ch;
    do
        ch = getChar();
    while (ch != '>' and ch != EOF);

    return true;
}


// HtmlParser::extractTagName -- returns the lowercased tag name starting at the current position.
//
std::string HtmlParser::extractTagName()
{
    std::string tag_name;
    while (not endOfStream() and IsAsciiLetterOrDigit(peekChar()))
        tag_name += static_cast<char>(getChar());

    return StringUtil::ToLower(&tag_name);
}


// HtmlParser::extractAttribute -- returns true if an attribute was found, else false.
//
bool HtmlParser::extractAttribute(std::string * const attribute_name, std::string * const attribute_value)
{
    attribute_name->clear();
    attribute_value->clear();

    if (not IsAsciiLetter(peekChar()))
        return false;

    while (not endOfStream() and IsAttributeNameChar(peekChar()))
        *attribute_name += static_cast<char>(getChar());
    StringUtil::ToLower(attribute_name);

    skipWhiteSpace();
    if (peekChar() != '=') // An attribute w/o a value.
        return not endOfStream();
    getChar();

    skipWhiteSpace();
    int ch(getChar());
    if (ch == '\'' or ch == '"') {
        const int DELIMITER(ch);
        while ((ch = getChar()) != EOF and ch != DELIMITER)
            *attribute_value += static_cast<char>(ch);
        return ch != EOF;
    }

    // unquoted attribute value
    while (ch != EOF and not IsSpace(ch) and ch != '>' and ch != '<') {
        *attribute_value += static_cast<char>(ch);
        ch = getChar();
    }
    if (ch == EOF)
        return false;
    ungetChar();

    return true;
}


// HtmlParser::parseTag -- parse HTML tags, assumes that we have already read the opening '<'.  Returns false if we
//                         want to abort parsing, else true.
//
bool HtmlParser::parseTag()
{
    const size_t tag_start(pos_ - 1);
    const unsigned start_lineno(lineno_);

    const bool is_end_tag(peekChar() == '/');
    if (is_end_tag)
        getChar();

    const std::string tag_name(extractTagName());
    if (unlikely(tag_name.empty()))
        return reportMalformedTag(tag_start, start_lineno, tag_name);

    AttributeMap attribute_map;
    if (not is_end_tag) {
        std::string attribute_name, attribute_value;
        for (;;) {
            skipWhiteSpace();
            if (not extractAttribute(&attribute_name, &attribute_value))
                break;
            attribute_map.insert(attribute_name, attribute_value);
        }
    }

    skipWhiteSpace();
    bool is_opening_and_closing_tag(false);
    if (peekChar() == '/' and not is_end_tag) {
        getChar();
        is_opening_and_closing_tag = true;
    }

    if (peekChar() != '>')
        return reportMalformedTag(tag_start, start_lineno, tag_name);
    getChar();

    if (tag_name == "script" or tag_name == "style") {
        if (unlikely(is_end_tag)) {
            if (chunk_mask_ & UNEXPECTED_CLOSING_TAG) {
                Chunk chunk(UNEXPECTED_CLOSING_TAG, tag_name, start_lineno);
                preNotify(&chunk);
            }
            return true;
        }

        if (chunk_mask_ & OPENING_TAG) {
            Chunk chunk(OPENING_TAG, tag_name, start_lineno, &attribute_map);
            preNotify(&chunk);
        }
        if (not is_opening_and_closing_tag and not skipToEndOfScriptOrStyle(tag_name, start_lineno))
            return false;
        if (chunk_mask_ & CLOSING_TAG) {
            Chunk chunk(CLOSING_TAG, tag_name, lineno_);
            preNotify(&chunk);
        }
        return true;
    }

    if (is_end_tag) {
        if (chunk_mask_ & CLOSING_TAG) {
            Chunk chunk(CLOSING_TAG, tag_name, start_lineno);
            preNotify(&chunk);
        }
    } else { // We have an opening tag.
        if (chunk_mask_ & OPENING_TAG) {
            Chunk chunk(OPENING_TAG, tag_name, start_lineno, &attribute_map);
            preNotify(&chunk);
        }
        if (is_opening_and_closing_tag and (chunk_mask_ & CLOSING_TAG)) {
            Chunk closing_tag_chunk(CLOSING_TAG, tag_name, start_lineno);
            preNotify(&closing_tag_chunk);
        }
    }

    return true;
}


void HtmlParser::parseText()
{
    const unsigned start_lineno(lineno_);
    std::string text;
    while (not endOfStream() and not isStartOfMarkup(pos_))
        text += static_cast<char>(getChar());

    if ((chunk_mask_ & TEXT) and not text.empty()) {
        Chunk chunk(TEXT, text, start_lineno);
        preNotify(&chunk);
    }
}


void HtmlParser::parse()
{
    for (;;) {
        if (unlikely(endOfStream())) {
            if (chunk_mask_ & END_OF_STREAM) {
                Chunk end_of_stream_chunk(END_OF_STREAM, "", lineno_);
                preNotify(&end_of_stream_chunk);
            }
            return;
        }

        if (not isStartOfMarkup(pos_)) {
            parseText();
            continue;
        }

        getChar(); // Skip over the '<'.
        if (peekChar() != '!') {
            if (unlikely(not parseTag()))
                return;
        } else if (input_.compare(pos_, 3, "!--") == 0) {
            for (unsigned i(0); i < __builtin_strlen("!--"); ++i)
                getChar();
            if (unlikely(not skipComment()))
                return;
        } else if (unlikely(not skipDeclaration())) // We assume we have a DOCTYPE or CDATA section.
            return;
    }
}


std::string HtmlParser::ChunkTypeToString(const unsigned chunk_type) {
    switch (chunk_type) {
    case OPENING_TAG:
        return "OPENING_TAG";
    case CLOSING_TAG:
        return "CLOSING_TAG";
    case MALFORMED_TAG:
        return "MALFORMED_TAG";
    case UNEXPECTED_CLOSING_TAG:
        return "UNEXPECTED_CLOSING_TAG";
    case TEXT:
        return "TEXT";
    case COMMENT:
        return "COMMENT";
    case END_OF_STREAM:
        return "END_OF_STREAM";
    case UNEXPECTED_END_OF_STREAM:
        return "UNEXPECTED_END_OF_STREAM";
    case EVERYTHING:
        return "EVERYTHING";
    default:
        throw std::runtime_error("in HtmlParser::ChunkTypeToString: unknown chunk type: " + std::to_string(chunk_type) + "!");
    }
}
