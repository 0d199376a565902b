/** \brief Test cases for XmlWriter
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
#include "XmlWriter.h"
#include "UnitTest.h"


TEST(XmlDeclaration) {
    std::string xml;
    {
        XmlWriter xml_writer(&xml);
        xml_writer.openTag("empty", /* suppress_newline = */true);
    }
    CHECK_EQ(xml, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<empty></empty>\n");
}


TEST(IndentationAndEscaping) {
    std::string xml;
    {
        XmlWriter xml_writer(&xml, XmlWriter::DoNotWriteTheXmlDeclaration, /* indent_amount = */2);
        xml_writer.openTag("outer", { { "attr", "1\"2 & <3>" } });
        xml_writer.writeTagsWithData("data", "1 < 2 & 'x' > \"y\"");
        xml_writer.writeTagsWithEscapedData("raw", "Tom &amp; Jerry");
        xml_writer.closeTag("outer");
    }
    CHECK_EQ(xml, "<outer attr=\"1&quot;2 &amp; &lt;3>\">\n"
                  "  <data>1 &lt; 2 &amp; &apos;x&apos; &gt; &quot;y&quot;</data>\n"
                  "  <raw>Tom &amp; Jerry</raw>\n"
                  "</outer>\n");
}


TEST(QueuedAttributes) {
    std::string xml;
    XmlWriter xml_writer(&xml, XmlWriter::DoNotWriteTheXmlDeclaration);
    xml_writer.addAttribute("checked");
    xml_writer.addAttribute("name", "n");
    xml_writer.openTag("input", /* suppress_newline = */true);
    xml_writer.closeTag("input", /* suppress_indent = */true);
    CHECK_EQ(xml, "<input checked=\"checked\" name=\"n\"></input>\n");
}


TEST(ClosingOuterTagClosesInnerTags) {
    std::string xml;
    XmlWriter xml_writer(&xml, XmlWriter::DoNotWriteTheXmlDeclaration, /* indent_amount = */1);
    xml_writer.openTag("a");
    xml_writer.openTag("b");
    xml_writer.openTag("c");
    xml_writer.closeTag("a");
    CHECK_EQ(xml, "<a>\n <b>\n  <c>\n  </c>\n </b>\n</a>\n");
}


TEST(DestructorClosesAllTags) {
    std::string xml;
    {
        XmlWriter xml_writer(&xml, XmlWriter::DoNotWriteTheXmlDeclaration);
        xml_writer.openTag("x");
        xml_writer.openTag("y");
    }
    CHECK_EQ(xml, "<x>\n<y>\n</y>\n</x>\n");
}


TEST(ClosingWithoutOpenTags) {
    std::string xml;
    XmlWriter xml_writer(&xml, XmlWriter::DoNotWriteTheXmlDeclaration);
    CHECK_THROWS(xml_writer.closeTag(), std::runtime_error);
    CHECK_THROWS(xml_writer.closeTag("item"), std::runtime_error);
}


TEST(XmlEscape) {
    CHECK_EQ(XmlWriter::XmlEscape("plain text"), "plain text");
    CHECK_EQ(XmlWriter::XmlEscape("<&>\"'"), "&lt;&amp;&gt;&quot;&apos;");
}


TEST_MAIN(XmlWriter)
