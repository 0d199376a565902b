/** \brief Test cases for ArticleExtractor
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
#include "ArticleExtractor.h"
#include "CapturingLogger.h"
#include "UnitTest.h"


// The HTML the "markdown" program produces for a typical two-article document.
const std::string TWO_ARTICLES(
    "<h1>Post One</h1>\n"
    "\n"
    "<p>2024-01-15\n"
    "Categories: tech, news</p>\n"
    "\n"
    "<p>Hello world.</p>\n"
    "\n"
    "<h1>Post Two</h1>\n"
    "\n"
    "<p>2024-02-29\n"
    "Author: Jane Doe</p>\n"
    "\n"
    "<p>Second <em>post</em>.</p>\n");


TEST(SegmentsOnTopLevelHeadings) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract(TWO_ARTICLES));

    CHECK_EQ(articles.size(), 2u);
    CHECK_EQ(articles[0].getTitle(), "Post One");
    CHECK_EQ(articles[1].getTitle(), "Post Two");
    CHECK_TRUE(logger.warnings_.empty());
}


TEST(ExtractsDateAndCategories) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract(TWO_ARTICLES));

    const Article &first(articles[0]);
    CHECK_TRUE(first.hasPublishDate());
    CHECK_EQ(first.getPublishDate(), 1705276800); // 2024-01-15T00:00:00Z
    CHECK_EQ(first.getCategories().size(), 2u);
    CHECK_EQ(first.getCategories()[0], "tech");
    CHECK_EQ(first.getCategories()[1], "news");
    CHECK_FALSE(first.hasAuthor());

    CHECK_EQ(first.getBody(), "<p>\n</p>\n\n<p>Hello world.</p>");
    CHECK_NOT_CONTAINS(first.getBody(), "2024-01-15");
    CHECK_NOT_CONTAINS(first.getBody(), "Categories:");
}


TEST(ExtractsAuthor) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract(TWO_ARTICLES));

    const Article &second(articles[1]);
    CHECK_TRUE(second.hasAuthor());
    CHECK_EQ(second.getAuthor(), "Jane Doe");
    CHECK_TRUE(second.getCategories().empty());
    CHECK_EQ(second.getPublishDate(), 1709164800); // 2024-02-29T00:00:00Z
    CHECK_NOT_CONTAINS(second.getBody(), "Author:");
    CHECK_CONTAINS(second.getBody(), "<p>Second <em>post</em>.</p>");
}


TEST(IgnoresContentBeforeTheFirstHeading) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<p>Preamble</p>\n<h1>Only</h1>\n<p>2023-12-24</p>\n<p>Body</p>\n"));

    CHECK_EQ(articles.size(), 1u);
    CHECK_EQ(articles[0].getTitle(), "Only");
    CHECK_NOT_CONTAINS(articles[0].getBody(), "Preamble");
    CHECK_CONTAINS(articles[0].getBody(), "<p>Body</p>");
}


TEST(HeadingsWithAttributes) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<H1 id=\"first\">First</H1><p>2024-01-01</p><h1 class='x'>Second</h1 ><p>2024-01-02</p>"));

    CHECK_EQ(articles.size(), 2u);
    CHECK_EQ(articles[0].getTitle(), "First");
    CHECK_EQ(articles[1].getTitle(), "Second");
    CHECK_EQ(articles[1].getPublishDate(), 1704153600); // 2024-01-02T00:00:00Z
}


TEST(SecondLevelHeadingsDoNotSplit) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<h1>Main</h1><p>2024-01-01</p><h2>Sub</h2><p>More</p>"));

    CHECK_EQ(articles.size(), 1u);
    CHECK_EQ(articles[0].getBody(), "<p></p><h2>Sub</h2><p>More</p>");
}


TEST(TitlesAreEscapedPlainText) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<h1>  Tom &amp; <em>Jerry</em> &lt;3  </h1><p>2024-01-01</p>"));

    CHECK_EQ(articles[0].getTitle(), "Tom &amp; Jerry &lt;3");
}


TEST(MissingDate) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<h1>Undated</h1><p>Just text.</p>"));

    CHECK_FALSE(articles[0].hasPublishDate());
    CHECK_TRUE(logger.hasWarning("No date found for article 'Undated'."));
    CHECK_EQ(articles[0].getBody(), "<p>Just text.</p>");
}


TEST(UnparseableDateIsKeptByDefault) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<h1>Slashed</h1><p>Published 2024/01/15</p>"));

    CHECK_FALSE(articles[0].hasPublishDate());
    CHECK_TRUE(logger.hasWarning("Invalid date format for article 'Slashed'. Expected format: %Y-%m-%d"));
    CHECK_EQ(articles[0].getBody(), "<p>Published 2024/01/15</p>");
}


TEST(UnparseableDateCanBeStripped) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(ArticleExtractor::DEFAULT_DATE_FORMAT,
                                                               /* strip_unparseable_dates = */true),
                                     &logger);
    const auto articles(extractor.extract("<h1>Slashed</h1><p>Published 2024/01/15</p>"));

    CHECK_FALSE(articles[0].hasPublishDate());
    CHECK_EQ(articles[0].getBody(), "<p>Published</p>");
}


TEST(CharacterReferencesInLabelsAndAuthorAreDecoded) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<h1>Q&amp;A</h1>\n<p>2024-01-15\nCategories: R&amp;D, Q&#38;A\nAuthor: Tom &amp; Jerry</p>"));

    CHECK_EQ(articles[0].getCategories().size(), 2u);
    CHECK_EQ(articles[0].getCategories()[0], "R&D");
    CHECK_EQ(articles[0].getCategories()[1], "Q&A");
    CHECK_TRUE(articles[0].hasAuthor());
    CHECK_EQ(articles[0].getAuthor(), "Tom & Jerry");
}


TEST(ImpossibleCalendarDate) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<h1>Bogus</h1><p>2023-02-29</p>"));

    CHECK_FALSE(articles[0].hasPublishDate());
    CHECK_TRUE(logger.hasWarning("Invalid date format for article 'Bogus'. Expected format: %Y-%m-%d"));
}


TEST(CustomDateFormat) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params("%Y/%m/%d"), &logger);
    const auto articles(extractor.extract("<h1>Slashed</h1><p>2024/01/15</p>"));

    CHECK_TRUE(articles[0].hasPublishDate());
    CHECK_EQ(articles[0].getPublishDate(), 1705276800);
    CHECK_TRUE(logger.warnings_.empty());
}


TEST(EmptyCategoryLabelsAndAuthor) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<h1>Sparse</h1><p>2024-01-01\nCategories: a,, b ,\nAuthor:   </p>"));

    CHECK_EQ(articles[0].getCategories().size(), 2u);
    CHECK_EQ(articles[0].getCategories()[0], "a");
    CHECK_EQ(articles[0].getCategories()[1], "b");
    CHECK_FALSE(articles[0].hasAuthor());
    CHECK_EQ(articles[0].getBody(), "<p>\n</p>");
}


TEST(BodyIsSanitised) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<h1>Risky</h1><p>2024-01-01</p><script>alert(1)</script>"
                                          "<p onclick=\"x()\">Safe <a href=\"javascript:x()\">link</a></p>"));

    CHECK_EQ(articles[0].getBody(), "<p></p><p>Safe <a>link</a></p>");
}


TEST(TrailingHeadingWithoutBody) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    const auto articles(extractor.extract("<h1>One</h1><p>2024-01-01</p><h1>Two</h1>"));

    CHECK_EQ(articles.size(), 2u);
    CHECK_EQ(articles[1].getTitle(), "Two");
    CHECK_TRUE(articles[1].getBody().empty());
    CHECK_TRUE(logger.hasWarning("No date found for article 'Two'."));
}


TEST(NoArticles) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);

    CHECK_THROWS(extractor.extract(""), ArticleExtractor::ParsingError);
    CHECK_THROWS(extractor.extract("<h2>Not a top-level heading</h2><p>text</p>"), ArticleExtractor::ParsingError);
    try {
        extractor.extract("<p>nothing</p>");
        CHECK_TRUE(false);
    } catch (const ArticleExtractor::ParsingError &x) {
        CHECK_EQ(std::string(x.what()), "No articles found in the Markdown content.");
    }
}


TEST(EmptyTitle) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);

    CHECK_THROWS(extractor.extract("<h1>Fine</h1><p>x</p><h1> <em> </em> </h1><p>y</p>"), ArticleExtractor::ParsingError);
}


TEST(ReportsArticleCount) {
    CapturingLogger logger;
    const ArticleExtractor extractor(ArticleExtractor::Params(), &logger);
    extractor.extract(TWO_ARTICLES);

    CHECK_EQ(logger.debug_messages_.size(), 1u);
    CHECK_EQ(logger.debug_messages_[0], "extracted 2 article(s)");
}


TEST_MAIN(ArticleExtractor)
