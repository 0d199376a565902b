/** \file   ArticleExtractor.h
 *  \brief  Splits rendered Markdown into articles and extracts their metadata.
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


#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "Article.h"
#include "RegexMatcher.h"
#include "util.h"


/** \class  ArticleExtractor
 *  \brief  Turns the HTML rendering of a Markdown document into a list of articles.
 *
 *  Every <h1> element starts a new article and its text contents become the title of the article.  Everything up to the next
 *  <h1> element or the end of the document is the article's body.  Anything preceding the first <h1> element is ignored.
 *  In the body we look for the first date (dddd-dd-dd or dddd/dd/dd), a "Categories:" line with comma-separated labels
 *  and an "Author:" line, in that order.  Each of these is removed from the body when found, a date that can't be parsed
 *  only if Params::strip_unparseable_dates_ is set.  Character references in labels and author names are decoded since
 *  these are plain text.  What remains of the body is then passed through HtmlSanitizer::Sanitize().
 */
class ArticleExtractor {
public:
    class ParsingError : public std::runtime_error {
    public:
        explicit ParsingError(const std::string &message): std::runtime_error(message) { }
    };

    static const std::string DEFAULT_DATE_FORMAT;

    struct Params {
        std::string date_format_; // strptime(3) format for the article dates
        bool strip_unparseable_dates_; // If true, dates that don't match "date_format_" are removed from the body as well.
    public:
        explicit Params(const std::string &date_format = DEFAULT_DATE_FORMAT, const bool strip_unparseable_dates = false)
            : date_format_(date_format), strip_unparseable_dates_(strip_unparseable_dates) { }
    };
private:
    const Params params_;
    Logger * const logger_;
    const ThreadSafeRegexMatcher heading_matcher_;
    const ThreadSafeRegexMatcher date_matcher_;
    const ThreadSafeRegexMatcher categories_matcher_;
    const ThreadSafeRegexMatcher author_matcher_;
public:
    /** \param logger  Where to report anomalies in individual articles. */
    explicit ArticleExtractor(const Params &params = Params(), Logger * const logger = ::logger);

    inline const Params &getParams() const { return params_; }

    /** \return The articles in document order.  Never empty.
     *  \throws ParsingError if "rendered_html" contains no <h1> elements or one of them has an empty title.
     */
    std::vector<Article> extract(const std::string &rendered_html) const;
private:
    Article extractArticle(const std::string &raw_title, const std::string &raw_body, const unsigned article_no) const;
    std::optional<time_t> extractPublishDate(const std::string &title, std::string * const body) const;
    std::vector<std::string> extractCategories(const std::string &title, std::string * const body) const;
    std::optional<std::string> extractAuthor(const std::string &title, std::string * const body) const;
};
