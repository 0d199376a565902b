/** \brief Test cases for HtmlParser
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
#include <vector>
#include "HtmlParser.h"
#include "UnitTest.h"


namespace {


// Records a textual representation of every chunk it gets notified about.
class ChunkRecorder : public HtmlParser {
    std::vector<std::string> * const chunks_;
public:
    ChunkRecorder(const std::string &html, std::vector<std::string> * const chunks,
                  const unsigned chunk_mask = HtmlParser::EVERYTHING)
        : HtmlParser(html, chunk_mask), chunks_(chunks) { }
    virtual void notify(const HtmlParser::Chunk &chunk) {
        chunks_->emplace_back(HtmlParser::ChunkTypeToString(chunk.type_) + ":" + chunk.toString());
    }
};


std::vector<std::string> Parse(const std::string &html, const unsigned chunk_mask = HtmlParser::EVERYTHING) {
    std::vector<std::string> chunks;
    ChunkRecorder recorder(html, &chunks, chunk_mask);
    recorder.parse();
    return chunks;
}


} // unnamed namespace


TEST(TagsAndText) {
    const auto chunks(Parse("<P Class=\"x\">Hi <b>there</b></p>"));
    CHECK_EQ(chunks.size(), 7u);
    CHECK_EQ(chunks[0], "OPENING_TAG:<p class=\"x\">");
    CHECK_EQ(chunks[1], "TEXT:Hi ");
    CHECK_EQ(chunks[2], "OPENING_TAG:<b>");
    CHECK_EQ(chunks[3], "TEXT:there");
    CHECK_EQ(chunks[4], "CLOSING_TAG:</b>");
    CHECK_EQ(chunks[5], "CLOSING_TAG:</p>");
    CHECK_EQ(chunks[6], "END_OF_STREAM:");
}


TEST(Attributes) {
    const auto chunks(Parse("<a href='single' title=\"double\" data-x=bare checked>", HtmlParser::OPENING_TAG));
    CHECK_EQ(chunks.size(), 1u);
    CHECK_EQ(chunks[0], "OPENING_TAG:<a href=\"single\" title=\"double\" data-x=\"bare\" checked=\"\">");
}


TEST(CharacterReferencesAreNotDecoded) {
    const auto chunks(Parse("a &amp; b", HtmlParser::TEXT));
    CHECK_EQ(chunks.size(), 1u);
    CHECK_EQ(chunks[0], "TEXT:a &amp; b");
}


TEST(SelfClosingTags) {
    const auto chunks(Parse("<br/>", HtmlParser::OPENING_TAG | HtmlParser::CLOSING_TAG));
    CHECK_EQ(chunks.size(), 2u);
    CHECK_EQ(chunks[0], "OPENING_TAG:<br>");
    CHECK_EQ(chunks[1], "CLOSING_TAG:</br>");
}


TEST(CommentsAndDeclarations) {
    const auto chunks(Parse("<!DOCTYPE html><!-- note -->x", HtmlParser::COMMENT | HtmlParser::TEXT));
    CHECK_EQ(chunks.size(), 2u);
    CHECK_EQ(chunks[0], "COMMENT:<!-- note -->");
    CHECK_EQ(chunks[1], "TEXT:x");
}


TEST(ScriptContentsAreSkipped) {
    const auto chunks(Parse("<script>if (a < b) document.write('</p>');</SCRIPT>after"));
    CHECK_EQ(chunks.size(), 4u);
    CHECK_EQ(chunks[0], "OPENING_TAG:<script>");
    CHECK_EQ(chunks[1], "CLOSING_TAG:</script>");
    CHECK_EQ(chunks[2], "TEXT:after");
    CHECK_EQ(chunks[3], "END_OF_STREAM:");
}


TEST(LiteralLessThanSigns) {
    const auto chunks(Parse("1 < 2 <3", HtmlParser::TEXT));
    CHECK_EQ(chunks.size(), 1u);
    CHECK_EQ(chunks[0], "TEXT:1 < 2 <3");
}


TEST(MalformedTag) {
    const auto chunks(Parse("<p =oops>text", HtmlParser::MALFORMED_TAG | HtmlParser::TEXT));
    CHECK_EQ(chunks.size(), 2u);
    CHECK_EQ(chunks[0], "MALFORMED_TAG:<p =oops>");
    CHECK_EQ(chunks[1], "TEXT:text");
}


TEST(UnexpectedEndOfStream) {
    const auto chunks(Parse("x<!-- never closed", HtmlParser::UNEXPECTED_END_OF_STREAM | HtmlParser::END_OF_STREAM));
    CHECK_EQ(chunks.size(), 1u);
    CHECK_CONTAINS(chunks[0], "UNEXPECTED_END_OF_STREAM:(unexpected EOF within HTML comment");
}


TEST(ChunkTypeToString) {
    CHECK_EQ(HtmlParser::ChunkTypeToString(HtmlParser::MALFORMED_TAG), "MALFORMED_TAG");
    CHECK_THROWS(HtmlParser::ChunkTypeToString(3), std::runtime_error);
}


TEST_MAIN(HtmlParser)
