/** \brief Test cases for MarkdownUtil and ExecUtil
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
#include <stdexcept>
#include "ExecUtil.h"
#include "MarkdownUtil.h"
#include "UnitTest.h"


// "cat" is a perfectly good renderer if the input already is HTML.
TEST(PassThroughRenderer) {
    CHECK_EQ(MarkdownUtil::RenderHtml("<h1>Title</h1>\n<p>Body</p>\n", "cat"), "<h1>Title</h1>\n<p>Body</p>\n");
    CHECK_EQ(MarkdownUtil::RenderHtml("", "cat"), "");
}


TEST(RendererArguments) {
    CHECK_EQ(MarkdownUtil::RenderHtml("a\nb\nc\n", "head  -n 2"), "a\nb\n");
}


TEST(MissingRenderer) {
    CHECK_THROWS(MarkdownUtil::RenderHtml("# x", "no-such-markdown-renderer"), std::runtime_error);
    CHECK_THROWS(MarkdownUtil::RenderHtml("# x", "/nonexistent/markdown"), std::runtime_error);
    CHECK_THROWS(MarkdownUtil::RenderHtml("# x", "  "), std::runtime_error);
}


TEST(FailingRenderer) {
    CHECK_THROWS(MarkdownUtil::RenderHtml("# x", "false"), std::runtime_error);
    try {
        MarkdownUtil::RenderHtml("# x", "ls /nonexistent/directory");
        CHECK_TRUE(false);
    } catch (const std::runtime_error &x) {
        CHECK_CONTAINS(x.what(), "failed with exit code");
    }
}


TEST(RendererTimeout) {
    try {
        MarkdownUtil::RenderHtml("# x", "sleep 10", /* timeout_in_seconds = */1);
        CHECK_TRUE(false);
    } catch (const std::runtime_error &x) {
        CHECK_CONTAINS(x.what(), "timed out after 1 seconds");
    }
}


TEST(Which) {
    CHECK_NE(ExecUtil::Which("cat"), "");
    CHECK_EQ(ExecUtil::Which("no-such-markdown-renderer"), "");
    CHECK_EQ(ExecUtil::Which("/nonexistent/markdown"), "");
}


TEST_MAIN(MarkdownUtil)
