/** \file    XmlWriter.cc
 *  \brief   Implementation of class XmlWriter.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2005-2007 Project iVia.
 *  Copyright 2005-2007 The Regents of The University of California.
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

#include "XmlWriter.h"
#include <stdexcept>
#include "util.h"


XmlWriter::XmlWriter(std::string * const output_string,
                     const XmlDeclarationWriteBehaviour xml_declaration_write_behaviour, const unsigned indent_amount)
    : output_string_(output_string), indent_amount_(indent_amount), nesting_level_(0)
{
    if (xml_declaration_write_behaviour == WriteTheXmlDeclaration)
        *output_string_ = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    else
        output_string_->clear();
}


namespace {


std::string EscapeAttribValue(const std::string &value) {
    std::string quote_escaped_string;
    for (const auto ch : value) {
        if (ch == '"')
            quote_escaped_string += "&quot;";
        else if (ch == '&')
            quote_escaped_string += "&amp;";
        else if (ch == '<')
            quote_escaped_string += "&lt;";
        else
            quote_escaped_string += ch;
    }

    return quote_escaped_string;
}


} // unnamed namespace


void XmlWriter::openTag(const std::string &tag_name, const bool suppress_newline) {
    active_tags_.push(tag_name);
    indent();
    ++nesting_level_;

    *output_string_ += "<" + tag_name;
    for (const auto &attrib : next_attributes_) {
        *output_string_ += " " + attrib.first + "=\"";
        *output_string_ += attrib.second.empty() ? attrib.first : EscapeAttribValue(attrib.second);
        *output_string_ += '"';
    }
    *output_string_ += (suppress_newline ? ">" : ">\n");

    next_attributes_.clear();
}


void XmlWriter::openTag(const std::string &tag_name, const Attributes &attribs, const bool suppress_newline) {
    next_attributes_ = attribs;
    openTag(tag_name, suppress_newline);
}


void XmlWriter::closeTag(const std::string &tag_name, const bool suppress_indent) {
    std::string last_closed_tag;
    do {
        if (unlikely(active_tags_.empty())) {
            if (tag_name.empty())
                throw std::runtime_error("in XmlWriter::closeTag: trying to close a tag when none are open!");
            else
                throw std::runtime_error("in XmlWriter::closeTag: trying to close a tag (" + tag_name + ") when none are open!");
        }

        --nesting_level_;
        if (not suppress_indent)
            indent();
        last_closed_tag = active_tags_.top();
        *output_string_ += "</" + last_closed_tag + ">\n";
        active_tags_.pop();
    } while (not tag_name.empty() and tag_name != last_closed_tag);
}


void XmlWriter::closeAllTags() {
    while (not active_tags_.empty()) {
        --nesting_level_;
        indent();
        *output_string_ += "</" + active_tags_.top() + ">\n";
        active_tags_.pop();
    }
}


void XmlWriter::indent() {
    *output_string_ += std::string(indent_amount_ * nesting_level_, ' ');
}


XmlWriter &XmlWriter::operator<<(const std::string &s) {
    *output_string_ += XmlWriter::XmlEscape(s);
    return *this;
}


std::string XmlWriter::XmlEscape(const std::string &s) {
    std::string escaped_string;
    escaped_string.reserve(s.length());

    for (const auto ch : s) {
        if (ch == '<')
            escaped_string += "&lt;";
        else if (ch == '>')
            escaped_string += "&gt;";
        else if (ch == '&')
            escaped_string += "&amp;";
        else if (ch == '"')
            escaped_string += "&quot;";
        else if (ch == '\'')
            escaped_string += "&apos;";
        else
            escaped_string += ch;
    }

    return escaped_string;
}
