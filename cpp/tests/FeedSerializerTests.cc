/** \brief Test cases for FeedSerializer
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
#include "CapturingLogger.h"
#include "FeedSerializer.h"
#include "UnitTest.h"


const FeedMetadata FEED_METADATA("My Blog", "Posts & notes", "https://example.com/?feed=rss&lang=en");
const time_t JAN_15_2024(1705276800);


TEST(CompleteDocument) {
    CapturingLogger logger;
    const std::vector<Article> articles{
        Article("Post One", "<p>Hello world.</p>", JAN_15_2024, { "tech", "news" }, std::nullopt)
    };

    CHECK_EQ(FeedSerializer::Serialize(FEED_METADATA, articles, &logger, /* now = */0),
             "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
             "<rss version=\"2.0\">\n"
             "  <channel>\n"
             "    <title>My Blog</title>\n"
             "    <description>Posts &amp; notes</description>\n"
             "    <link>https://example.com/?feed=rss&amp;lang=en</link>\n"
             "    <item>\n"
             "      <title>Post One</title>\n"
             "      <description>&lt;p&gt;Hello world.&lt;/p&gt;</description>\n"
             "      <pubDate>Mon, 15 Jan 2024 00:00:00 +0000</pubDate>\n"
             "      <category>tech</category>\n"
             "      <category>news</category>\n"
             "    </item>\n"
             "  </channel>\n"
             "</rss>\n");
    CHECK_TRUE(logger.warnings_.empty());
}


TEST(NoArticles) {
    CapturingLogger logger;
    const std::string rss(FeedSerializer::Serialize(FEED_METADATA, {}, &logger));

    CHECK_CONTAINS(rss, "<channel>");
    CHECK_NOT_CONTAINS(rss, "<item>");
}


TEST(TitlesAreNotEscapedTwice) {
    CapturingLogger logger;
    const std::vector<Article> articles{ Article("Tom &amp; Jerry", "", JAN_15_2024, {}, std::nullopt) };
    const std::string rss(FeedSerializer::Serialize(FEED_METADATA, articles, &logger));

    CHECK_CONTAINS(rss, "<title>Tom &amp; Jerry</title>");
    CHECK_CONTAINS(rss, "<description></description>");
}


TEST(MissingPublishDate) {
    CapturingLogger logger;
    const std::vector<Article> articles{ Article("Undated", "<p>x</p>", std::nullopt, {}, std::nullopt) };
    const std::string rss(FeedSerializer::Serialize(FEED_METADATA, articles, &logger, /* now = */0));

    CHECK_CONTAINS(rss, "<pubDate>Thu, 01 Jan 1970 00:00:00 +0000</pubDate>");
    CHECK_EQ(logger.warnings_.size(), 1u);
    CHECK_TRUE(logger.hasWarning("Using current date for article 'Undated'."));
}


TEST(MissingPublishDateWarningUsesPlainTitle) {
    CapturingLogger logger;
    const std::vector<Article> articles{ Article("Fish &amp; Chips", "", std::nullopt, {}, std::nullopt) };
    FeedSerializer::Serialize(FEED_METADATA, articles, &logger, /* now = */0);

    CHECK_TRUE(logger.hasWarning("Using current date for article 'Fish & Chips'."));
}


TEST(AuthorAndCategoriesAreEscaped) {
    CapturingLogger logger;
    const std::vector<Article> articles{
        Article("With author", "", JAN_15_2024, { "C & C++", "<tags>" }, std::string("jane@example.com (Jane \"JD\" Doe)"))
    };
    const std::string rss(FeedSerializer::Serialize(FEED_METADATA, articles, &logger));

    CHECK_CONTAINS(rss, "      <category>C &amp; C++</category>\n      <category>&lt;tags&gt;</category>\n"
                        "      <author>jane@example.com (Jane &quot;JD&quot; Doe)</author>\n    </item>\n");
}


TEST(ItemsKeepTheirOrder) {
    CapturingLogger logger;
    const std::vector<Article> articles{
        Article("First", "", JAN_15_2024, {}, std::nullopt),
        Article("Second", "", JAN_15_2024 + 86400, {}, std::nullopt),
        Article("Third", "", JAN_15_2024 + 2 * 86400, {}, std::nullopt)
    };
    const std::string rss(FeedSerializer::Serialize(FEED_METADATA, articles, &logger));

    const size_t first_pos(rss.find("<title>First</title>"));
    const size_t second_pos(rss.find("<title>Second</title>"));
    const size_t third_pos(rss.find("<title>Third</title>"));
    CHECK_NE(first_pos, std::string::npos);
    CHECK_LT(first_pos, second_pos);
    CHECK_LT(second_pos, third_pos);
    CHECK_NE(third_pos, std::string::npos);
    CHECK_CONTAINS(rss, "<pubDate>Wed, 17 Jan 2024 00:00:00 +0000</pubDate>");
}


TEST_MAIN(FeedSerializer)
