/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen
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

#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value, const std::string &comment) {
    // Handle comment-only lines first:
    if (variable_name.empty() and value.empty()) {
        entries_.emplace_back("", "", comment);
        return;
    }

    if (unlikely(hasEntry(variable_name)))
        throw std::runtime_error("in IniFile::Section::insert: attempting to insert a duplicate variable name: \"" + variable_name
                                 + "\" in section \"" + section_name_ + "\"!");

    entries_.emplace_back(variable_name, value, comment);
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    return existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("in IniFile::Section::getUnsigned: can't find \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    unsigned number;
    if (not StringUtil::ToUnsigned(existing_entry->value_, &number))
        throw std::runtime_error("in IniFile::Section::getUnsigned: invalid unsigned entry \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned &default_value) const {
    return hasEntry(variable_name) ? getUnsigned(variable_name) : default_value;
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_lineno_(0) {
    processFile();
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header on line "
                                 + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

    std::string section_name(line.substr(1, line.length() - 2));
    StringUtil::Trim(" \t", &section_name);
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on line "
                                 + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

    if (sectionIsDefined(section_name))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\" on line "
                                 + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");
    sections_.emplace_back(section_name);
}


namespace {


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens and underscores.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    std::string::const_iterator ch(possible_variable_name.begin());

    // Variable names must start with a letter...
    if (not StringUtil::IsAsciiLetter(*ch))
        return false;

    // ...followed by letters, digits, hyphens, underscores, periods, slashes or colons:
    for (++ch; ch != possible_variable_name.end(); ++ch) {
        if (not StringUtil::IsAsciiLetter(*ch) and not StringUtil::IsDigit(*ch) and *ch != '-' and *ch != '_' and *ch != '.'
            and *ch != '/' and *ch != ':')
            return false;
    }

    return true;
}


// Resolves \n, \t, \", \\ and \# in the contents of a double-quoted value.
void CStyleUnescape(std::string * const value) {
    std::string unescaped_value;
    for (auto ch(value->cbegin()); ch != value->cend(); ++ch) {
        if (*ch != '\\') {
            unescaped_value += *ch;
            continue;
        }

        ++ch;
        if (unlikely(ch == value->cend()))
            throw std::runtime_error("trailing backslash");
        switch (*ch) {
        case 'n':
            unescaped_value += '\n';
            break;
        case 't':
            unescaped_value += '\t';
            break;
        case '"':
        case '\\':
        case '#':
            unescaped_value += *ch;
            break;
        default:
            throw std::runtime_error("unknown escape sequence \\" + std::string(1, *ch));
        }
    }

    value->swap(unescaped_value);
}


std::string StripComment(std::string * const line, std::string * const comment) {
    comment->clear();

    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '\"')
            inside_string_literal = not inside_string_literal;
        else if (*character == '#') {
            if (character != line->begin() and *(character - 1) == '\\')
                continue; // skip escaped hash characters
            else if (inside_string_literal)
                continue;
            else {
                size_t comment_start_pos(std::distance(line->begin(), character));
                while (comment_start_pos > 0 and (*line)[comment_start_pos - 1] == ' ')
                    --comment_start_pos;
                *comment = line->substr(comment_start_pos);
                line->resize(comment_start_pos);
                return *line;
            }
        }
    }

    return *line;
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line, const std::string &comment) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // Not a normal "variable = value" type line.
        const std::string trimmed_line(StringUtil::TrimWhite(line));
        if (unlikely(not IsValidVariableName(trimmed_line)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + trimmed_line + "\" on line "
                                     + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

        sections_.back().insert(trimmed_line, "true");
        return;
    }

    std::string variable_name(line.substr(0, equal_sign));
    StringUtil::Trim(" \t", &variable_name);
    if (variable_name.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable name on line " + std::to_string(current_lineno_)
                                 + " in file \"" + ini_file_name_ + "\"!");

    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on line "
                                 + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

    std::string value(line.substr(equal_sign + 1));
    StringUtil::Trim(" \t", &value);
    if (value.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable value on line " + std::to_string(current_lineno_)
                                 + " in file \"" + ini_file_name_ + "\"!");

    if (value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on line "
                                     + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

        value = value.substr(1, value.length() - 2);
        try {
            CStyleUnescape(&value);
        } catch (const std::runtime_error &x) {
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape on line " + std::to_string(current_lineno_)
                                     + " in file \"" + ini_file_name_ + "\"! (" + std::string(x.what()) + ")");
        }
    }

    sections_.back().insert(variable_name, value, comment);
}


void IniFile::processFile() {
    std::string error_message;
    if (unlikely(not FileUtil::Exists(ini_file_name_, &error_message)))
        throw std::runtime_error("in IniFile::processFile: file \"" + ini_file_name_ + "\" does not exist! (" + error_message + ")");

    std::ifstream ini_file(ini_file_name_.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + ini_file_name_ + "\"! ("
                                 + std::string(std::strerror(errno)) + ")");

    // Read the file:
    while (not ini_file.eof()) {
        std::string line;

        // read lines until newline character is not preceeded by a '\'
        bool continued_line(false);
        do {
            std::string buf;
            std::getline(ini_file, buf);
            ++current_lineno_;
            line += StringUtil::TrimWhite(buf);
            if (line.empty())
                break;

            continued_line = line[line.length() - 1] == '\\' and not ini_file.eof();
            if (continued_line)
                line = StringUtil::TrimWhite(line.substr(0, line.length() - 1));
        } while (continued_line);

        std::string comment;
        StripComment(&line, &comment);
        StringUtil::Trim(" \t", &line);
        if (line.empty()) { // Blank or comment-only line.
            if (sections_.empty())
                sections_.emplace_back("");
            sections_.back().insert("", "", comment);
            continue;
        }

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line, comment);
        }
    }
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    if (section == sections_.cend())
        return default_value;

    return section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned &default_value) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    if (section == sections_.cend())
        return default_value;

    return section->getUnsigned(variable_name, default_value);
}


bool IniFile::sectionIsDefined(const std::string &section_name) const {
    return std::find(sections_.cbegin(), sections_.cend(), section_name) != sections_.cend();
}
