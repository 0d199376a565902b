/** \file   MarkdownUtil.h
 *  \brief  Conversion of Markdown to HTML with the help of an external renderer.
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
#pragma once


#include <string>


namespace MarkdownUtil {


const std::string DEFAULT_RENDERER("markdown");
const unsigned DEFAULT_RENDERER_TIMEOUT(20); // seconds


/** \brief  Converts "markdown" to HTML.
 *  \param  renderer_command    A command line that reads Markdown on stdin and writes HTML to stdout, e.g. "markdown"
 *                              or "pandoc --from=gfm --to=html".  Arguments are separated by whitespace.  If the
 *                              program name contains no slash it will be looked up using PATH.
 *  \param  timeout_in_seconds  If not zero, the renderer will be killed if it takes longer than this.
 *  \throws std::runtime_error if the renderer can't be found, times out or exits with a non-zero exit code.
 */
std::string RenderHtml(const std::string &markdown, const std::string &renderer_command = DEFAULT_RENDERER,
                       const unsigned timeout_in_seconds = DEFAULT_RENDERER_TIMEOUT);


} // namespace MarkdownUtil
