/** \file   MarkdownUtil.cc
 *  \brief  Implementation of Markdown-related utility functions.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "MarkdownUtil.h"
#include <stdexcept>
#include <vector>
#include <cerrno>
#include "ExecUtil.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace MarkdownUtil {


std::string RenderHtml(const std::string &markdown, const std::string &renderer_command, const unsigned timeout_in_seconds) {
    std::vector<std::string> args;
    StringUtil::SplitThenTrimWhite(renderer_command, ' ', &args);
    if (unlikely(args.empty()))
        throw std::runtime_error("in MarkdownUtil::RenderHtml: empty renderer command!");

    const std::string renderer_name(args.front());
    args.erase(args.begin());
    const std::string renderer_path(ExecUtil::Which(renderer_name));
    if (renderer_path.empty())
        throw std::runtime_error("in MarkdownUtil::RenderHtml: can't find an executable Markdown renderer \"" + renderer_name + "\"!");

    const FileUtil::AutoTempFile markdown_temp_file("/tmp/MD", ".md");
    FileUtil::WriteStringOrThrow(markdown_temp_file.getFilePath(), markdown);
    const FileUtil::AutoTempFile html_temp_file("/tmp/MD", ".html");
    const FileUtil::AutoTempFile stderr_temp_file("/tmp/MD", ".err");

    LOG_DEBUG("running \"" + renderer_path + "\" on " + std::to_string(markdown.length()) + " bytes of Markdown");
    const int exit_code(ExecUtil::Exec(renderer_path, args, markdown_temp_file.getFilePath(), html_temp_file.getFilePath(),
                                       stderr_temp_file.getFilePath(), timeout_in_seconds));
    if (exit_code == -1 and errno == ETIME) {
        errno = 0;
        throw std::runtime_error("in MarkdownUtil::RenderHtml: \"" + renderer_name + "\" timed out after "
                                 + std::to_string(timeout_in_seconds) + " seconds!");
    }
    if (exit_code != 0) {
        std::string error_output;
        if (not FileUtil::ReadString(stderr_temp_file.getFilePath(), &error_output))
            error_output = "no error output available";
        throw std::runtime_error("in MarkdownUtil::RenderHtml: \"" + renderer_name + "\" failed with exit code "
                                 + std::to_string(exit_code) + "! (" + StringUtil::TrimWhite(error_output) + ")");
    }

    return FileUtil::ReadStringOrThrow(html_temp_file.getFilePath());
}


} // namespace MarkdownUtil
