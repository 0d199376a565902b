/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
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
#pragma once


#include <algorithm>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  This class allows access to the contents of an ini file.  It is initialised with the name of the file, and the
 *  settings stored in the file can then be accessed through the get* methods.  String constants can use
 *  C-style character backslash escapes like \\n.  If you want to embed a hash mark in a string you must preceede it with
 *  a single backslash.  In order to extend a string constant over multiple lines, put backslashes just before the line
 *  ends on all but the last line.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_, comment_;

    public:
        Entry(const std::string &name, const std::string &value, const std::string &comment)
            : name_(name), value_(value), comment_(comment) { }
    };

public:
    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        typedef std::vector<Entry>::const_iterator const_iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }

        /** \throws std::runtime_error if "variable_name" already exists in this section. */
        void insert(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        /** \brief   Retrieves a string value from a configuration file.
         *  \param   variable_name  The name of the section entry to read.
         *  \param   default_value  A default to return if the variable is not defined.
         *  \return  The value of the specified variable in the specified section, or "default_value" if it is not
         *           defined.
         */
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \brief   Retrieves an unsigned integer value from a configuration file.
         *  \throws  A std::runtime_error if the variable is not found or the value cannot be converted to an unsigned.
         */
        unsigned getUnsigned(const std::string &variable_name) const;

        /** \brief   Retrieves an unsigned integer value from a configuration file.
         *  \param   default_value  A default to return if the variable is not defined.
         *  \throws  A std::runtime_error if the value was found but cannot be converted to an unsigned.
         */
        unsigned getUnsigned(const std::string &variable_name, const unsigned &default_value) const;

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }

        const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }
    };

private:
    std::string ini_file_name_;
    std::vector<Section> sections_;
    unsigned current_lineno_;

public:
    /** \brief   Parses "ini_file_name".
     *  \throws  std::runtime_error if the file does not exist, can't be read or contains syntax errors.
     */
    explicit IniFile(const std::string &ini_file_name);

    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;

    /** \throws std::runtime_error if the variable is defined but its value is not a valid unsigned. */
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned &default_value) const;

    bool sectionIsDefined(const std::string &section_name) const;

private:
    void processFile();
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line, const std::string &comment);
};
