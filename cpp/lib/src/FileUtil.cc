/** \file   FileUtil.cc
 *  \brief  Implementation of file related utility classes and functions.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *  \author Steven Lolong (steven.lolong@uni-tuebingen.de)
 *
 *  \copyright 2015-2023 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "FileUtil.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include "util.h"


namespace FileUtil {


AutoTempFile::AutoTempFile(const std::string &path_prefix, const std::string &path_suffix, bool automatically_remove)
    : automatically_remove_(automatically_remove) {
    std::string path_template(path_prefix + "XXXXXX" + path_suffix);
    const int fd(::mkstemps(const_cast<char *>(path_template.c_str()), path_suffix.length()));
    if (fd == -1)
        LOG_ERROR("mkstemps(3) for path prefix \"" + path_prefix + "\" failed!");

    ::close(fd);
    path_ = path_template;
}


static bool Stat(struct stat * const stat_buf, const std::string &path, std::string * const error_message) {
    errno = 0;

    if (::stat(path.c_str(), stat_buf) != 0) {
        if (error_message != nullptr)
            *error_message = "can't stat(2) \"" + path + "\": " + std::string(::strerror(errno));
        errno = 0;
        return false;
    }

    return true;
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), data.size());
    output.close();
    return not output.fail();
}


void WriteStringOrThrow(const std::string &path, const std::string &data) {
    errno = 0;
    if (not WriteString(path, data)) {
        const std::string reason(errno != 0 ? std::string(std::strerror(errno)) : "unknown error");
        errno = 0;
        throw std::runtime_error("failed to write to \"" + path + "\": " + reason);
    }
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios_base::in | std::ios_base::binary);
    if (input.fail())
        return false;

    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad())
        return false;

    *data = buffer.str();
    return true;
}


std::string ReadStringOrThrow(const std::string &path) {
    errno = 0;
    std::string data;
    if (not ReadString(path, &data)) {
        const std::string reason(errno != 0 ? std::string(std::strerror(errno)) : "unknown error");
        errno = 0;
        throw std::runtime_error("failed to read \"" + path + "\": " + reason);
    }

    return data;
}


bool Exists(const std::string &path, std::string * const error_message) {
    struct stat stat_buf;
    return Stat(&stat_buf, path, error_message);
}


} // namespace FileUtil
