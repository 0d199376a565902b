/** \file    XmlWriter.h
 *  \brief   Declaration of the XmlWriter class.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2005-2007 Project iVia.
 *  Copyright 2005-2007 The Regents of The University of California.
 *  Copyright 2015-2016 Universitätsbibliothek Tübingen
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

#ifndef XML_WRITER_H
#define XML_WRITER_H


#include <list>
#include <stack>
#include <string>


/** \class  XmlWriter
 *  \brief  An XML generator class.
 *
 *  See the accompanying tests/XmlWriterTests.cc program for a usage example.
 */
class XmlWriter {
    std::string * const output_string_;
    std::stack<std::string> active_tags_;
    const unsigned indent_amount_;
    unsigned nesting_level_;
public:
    enum XmlDeclarationWriteBehaviour { WriteTheXmlDeclaration, DoNotWriteTheXmlDeclaration };
    typedef std::list< std::pair<std::string, std::string> > Attributes;
private:
    Attributes next_attributes_;
public:
    /** \brief  Instantiate an XmlWriter object.
     *  \param  output_string                    Where to write the generated XML to.  Will be overwritten.
     *  \param  xml_declaration_write_behaviour  Whether to write an XML declaration or not.
     *  \param  indent_amount                    How many leading spaces to add per indentation level.
     */
    explicit XmlWriter(std::string * const output_string,
                       const XmlDeclarationWriteBehaviour xml_declaration_write_behaviour = WriteTheXmlDeclaration,
                       const unsigned indent_amount = 0);

    /** Destroyes an XmlWriter object, closing any still open tags. */
    virtual ~XmlWriter() { closeAllTags(); }

    /** \brief    Adds another attribute to be used the next time the one-argument version of openTag() gets called.
     *  \warning  If the two-argument version of openTag() gets called all prior calls to this function will be
     *            ignored!
     */
    void addAttribute(const std::string &name, const std::string &value = "")
        { next_attributes_.push_back(std::make_pair(name, value) ); }

    /** Writes an open tag at the current indentation level. Uses the attributes queued up by calls to addAttribute(),
        if any. */
    void openTag(const std::string &tag_name, const bool suppress_newline = false);

    /**  Writes an open tag at the current indentation level. Does not use the attributes queued up by calls to
         addAttribute(). */
    void openTag(const std::string &tag_name, const Attributes &attribs, const bool suppress_newline = false);

    /** Write character data. */
    void write(const std::string &characters) { (*this) << characters; }

    /** Write character data that is already valid XML w/o escaping it. */
    void writeEscaped(const std::string &characters) { *output_string_ += characters; }

    /** Write character data between an opening and closing tag pair on a single line. */
    void writeTagsWithData(const std::string &tag_name, const std::string &characters) {
        writeTagsWithData(tag_name, Attributes(), characters);
    }

    /** Write character data between an opening and closing tag pair on a single line. */
    void writeTagsWithData(const std::string &tag_name, const Attributes &attribs, const std::string &characters) {
        openTag(tag_name, attribs, /* suppress_newline = */true);
        write(characters);
        closeTag(tag_name, /* suppress_indent = */true);
    }

    /** \brief  Write already escaped character data between an opening and closing tag pair on a single line.
     *  \note   The caller is responsible for "characters" being well-formed XML character data.
     */
    void writeTagsWithEscapedData(const std::string &tag_name, const std::string &characters) {
        openTag(tag_name, Attributes(), /* suppress_newline = */true);
        writeEscaped(characters);
        closeTag(tag_name, /* suppress_indent = */true);
    }

    /** \brief  Writes a closing tag at the approriate indentation level.
     *  \param  tag_name         If empty, we close the last open tag otherwise we close tags until we find a tag that
     *                           matches tag_name which we also close.
     *  \param  suppress_indent  If true we don't emit any leading spaces o/w we indent to the previous indentation level.
     */
    void closeTag(const std::string &tag_name = "", const bool suppress_indent = false);

    /** Calls closeTag() until all open tags are closed. */
    void closeAllTags();

    /** Emits the number of spaces corresponding to the current nesting level to the output string. */
    void indent();

    XmlWriter &operator<<(const std::string &s);
    XmlWriter &operator<<(const char * const s) { return operator<<(std::string(s)); }

    /** \brief  Escapes text for XML generation.
     *  \param  unescaped_text  The text that may optionally contain ampersands, single and double quotes or angle brackets.
     *  \return The string with the XML metacharacters escaped.
     */
    static std::string XmlEscape(const std::string &unescaped_text);
private:
    XmlWriter() = delete;
    XmlWriter(const XmlWriter &rhs) = delete;
    XmlWriter &operator=(const XmlWriter &rhs) = delete;
};


#endif // ifndef XML_WRITER_H
