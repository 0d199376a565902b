/** \file    HtmlParser.h
 *  \brief   Declaration of an HTML parser class.
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

#ifndef HTML_PARSER_H
#define HTML_PARSER_H


#include <stdexcept>
#include <string>
#include <cstdio>
#include <utility>
#include <vector>


/** \class  HtmlParser
 *  \brief  A parser for HTML fragments.
 *
 *  This class provides a simple HTML parser.  To use it, you should
 *  create a subclass that specifies which tokens should generate
 *  events (by setting the notification_mask) and then overriding the
 *  notify member function to take an appropriate action whenever an
 *  event occurs.
 *
 *  Character references are not decoded, i.e. TEXT chunks and attribute values
 *  contain exactly what was found in the input.  The contents of "script" and
 *  "style" elements are never reported.
 */
class HtmlParser {
    const std::string input_;
    size_t pos_;
    unsigned lineno_;
    const unsigned chunk_mask_;
public:
    // The different Chunk types:
    static const unsigned OPENING_TAG              = 1u << 0u;
    static const unsigned CLOSING_TAG              = 1u << 1u;
    static const unsigned MALFORMED_TAG            = 1u << 2u;
    static const unsigned UNEXPECTED_CLOSING_TAG   = 1u << 3u;
    static const unsigned TEXT                     = 1u << 4u;
    static const unsigned COMMENT                  = 1u << 5u;
    static const unsigned END_OF_STREAM            = 1u << 6u;
    static const unsigned UNEXPECTED_END_OF_STREAM = 1u << 7u;
    static const unsigned EVERYTHING               = 0xFFFFu;

    /** \class  AttributeMap
     *  \brief  A representation of the HTML attributes in a single HTML Element in the order in which they were found.
     */
    class AttributeMap {
        std::vector<std::pair<std::string, std::string>> attributes_;
    public:
        typedef std::vector<std::pair<std::string, std::string>>::const_iterator const_iterator;
    public:
        bool empty() const { return attributes_.empty(); }
        size_t size() const { return attributes_.size(); }

        /** \brief  Insert a value into an AttributeMap.
         *  \param  name   The name of the key.
         *  \param  value  The value to be associated with "name".
         *  \return True if the attribute wasn't in the map yet, else false.
         *
         *  If there is an existing value associated with name, the new value is not inserted.
         */
        bool insert(const std::string &name, const std::string &value);

        /** \brief  Reconstruct the string representation of this HTML fragment.
         *  \note   The reconstructed text may differ from the original HTML.
         */
        std::string toString() const;

        const_iterator find(const std::string &key) const;
        const_iterator begin() const { return attributes_.begin(); }
        const_iterator end() const { return attributes_.end(); }
    };

    /** \class  Chunk
     *  \brief  A representation of a small "chunk" of an HTML document.
     */
    struct Chunk {
        unsigned type_;
        std::string text_; // The tag name for tags, the raw source text for MALFORMED_TAG.
        unsigned lineno_;
        std::string error_message_;
        const AttributeMap *attribute_map_; // only non-nullptr if type_ == OPENING_TAG
    public:
        /** Construct a chunk. */
        Chunk(const unsigned type, const std::string &text, const unsigned lineno,
              const AttributeMap * const attribute_map = nullptr)
            : type_(type), text_(text), lineno_(lineno), attribute_map_(attribute_map) { }

        /** Construct a chunk. */
        Chunk(const unsigned type, const unsigned lineno, const std::string &error_message)
            : type_(type), lineno_(lineno), error_message_(error_message), attribute_map_(nullptr) { }

        /** \brief  Reconstruct the string representation of this HTML fragment.
         *  \note   The reconstructed text may differ from the original HTML.
         */
        std::string toString() const;
    };
public:
    explicit HtmlParser(const std::string &input_string, const unsigned chunk_mask = EVERYTHING)
        : input_(input_string), pos_(0), lineno_(1), chunk_mask_(chunk_mask) { }
    virtual ~HtmlParser() = default;
    virtual void parse();
    virtual void notify(const Chunk &chunk) = 0;

    static std::string ChunkTypeToString(const unsigned chunk_type);
protected:

    /** A filter for notify().  Allows descendents to modify or suppress some chunks as they are reported to
        notify(). */
    virtual void preNotify(Chunk * const chunk) { notify(*chunk); }
private:
    int getChar();
    int peekChar() const { return pos_ < input_.length() ? static_cast<unsigned char>(input_[pos_]) : EOF; }
    bool endOfStream() const { return pos_ >= input_.length(); }
    void ungetChar();
    bool isStartOfMarkup(const size_t pos) const;
    bool parseTag();
    void parseText();
    void skipWhiteSpace();
    bool skipDeclaration();
    bool skipComment();
    bool skipToEndOfTag();
    bool reportMalformedTag(const size_t tag_start, const unsigned tag_start_lineno, const std::string &tag_name);
    bool skipToEndOfScriptOrStyle(const std::string &tag_name, const unsigned tag_start_lineno);
    std::string extractTagName();
    bool extractAttribute(std::string * const attribute_name, std::string * const attribute_value);
    void reportUnexpectedEndOfStream(const std::string &error_message);
private:
    HtmlParser() = delete;
    HtmlParser(const HtmlParser &rhs) = delete;
    HtmlParser &operator=(const HtmlParser &rhs) = delete;
};


#endif // ifndef HTML_PARSER_H
