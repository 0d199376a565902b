/** \file    FileUtil.h
 *  \brief   Declaration of file-related utility functions.
 *  \author  Dr. Gordon W. Paynter
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Steven Lolong
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen.  All rights reserved.
 *  Copyright 2022 Universitätsbibliothek Tübingen.
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


#include <string>
#include <sys/types.h>
#include <unistd.h>


/** \namespace  FileUtil
 *  \brief      File-related utility functions.
 */
namespace FileUtil {


/** \class AutoTempFile
 *  \brief Creates a temp file and removes it when going out of scope.
 */
class AutoTempFile {
    std::string path_;
    bool automatically_remove_;

public:
    explicit AutoTempFile(const std::string &path_prefix = "/tmp/ATF", const std::string &path_suffix = "",
                          bool automatically_remove = true);
    AutoTempFile(const AutoTempFile &rhs) = delete;
    ~AutoTempFile() {
        if (not path_.empty() and automatically_remove_)
            ::unlink(path_.c_str());
    }

    const std::string &getFilePath() const { return path_; }
};


/** \brief Replaces the contents of "path" with "data", creating the file if necessary. */
bool WriteString(const std::string &path, const std::string &data);

/** \throws std::runtime_error including the reason if "data" couldn't be written. */
void WriteStringOrThrow(const std::string &path, const std::string &data);


/** \brief Reads all of "path" into "*data".  Works on pipes and other pseudo files as well. */
bool ReadString(const std::string &path, std::string * const data);

/** \throws std::runtime_error including the reason if "path" couldn't be read. */
std::string ReadStringOrThrow(const std::string &path);


/** \return True if "path" exists, o/w false.  If "error_message" is not NULL, it will be set to the reason for a failure. */
bool Exists(const std::string &path, std::string * const error_message = nullptr);


} // namespace FileUtil
