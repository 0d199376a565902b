/** \file   ArticleExtractor.cc
 *  \brief  Implementation of class ArticleExtractor.
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
#include "HtmlSanitizer.h"
#include "HtmlUtil.h"
#include "StringUtil.h"
#include "TimeUtil.h"


const std::string ArticleExtractor::DEFAULT_DATE_FORMAT("%Y-%m-%d");


ArticleExtractor::ArticleExtractor(const Params &params, Logger * const logger)
    : params_(params), logger_(logger),
      heading_matcher_("<h1(?:\\s[^>]*)?>(.*?)</h1\\s*>",
                       ThreadSafeRegexMatcher::ENABLE_UTF8 | ThreadSafeRegexMatcher::CASE_INSENSITIVE | ThreadSafeRegexMatcher::DOTALL),
      date_matcher_("\\s*([0-9]{4}[-/][0-9]{2}[-/][0-9]{2})"),
      categories_matcher_("Categories:[ \t]*([^\n<]*)\n?"),
      author_matcher_("Author:[ \t]*([^\n<]*)\n?")
{
}


std::vector<Article> ArticleExtractor::extract(const std::string &rendered_html) const {
    struct Heading {
        size_t start_, end_;
        std::string title_;
    };

    std::vector<Heading> headings;
    size_t offset(0), start_pos, end_pos;
    for (;;) {
        const auto match_result(heading_matcher_.match(rendered_html, offset, &start_pos, &end_pos));
        if (not match_result) {
            if (unlikely(not match_result.getErrorMessage().empty()))
                throw ParsingError("Error parsing Markdown content: " + match_result.getErrorMessage());
            break;
        }

        headings.emplace_back(Heading{ start_pos, end_pos, match_result[1] });
        offset = end_pos;
    }

    if (headings.empty())
        throw ParsingError("No articles found in the Markdown content.");

    std::vector<Article> articles;
    articles.reserve(headings.size());
    try {
        for (auto heading(headings.cbegin()); heading != headings.cend(); ++heading) {
            const size_t body_end(heading + 1 == headings.cend() ? rendered_html.length() : (heading + 1)->start_);
            articles.emplace_back(extractArticle(heading->title_, rendered_html.substr(heading->end_, body_end - heading->end_),
                                                 static_cast<unsigned>(articles.size() + 1)));
        }
    } catch (const ParsingError &) {
        throw;
    } catch (const std::exception &x) {
        throw ParsingError("Error parsing Markdown content: " + std::string(x.what()));
    }

    logger_->debug("extracted " + std::to_string(articles.size()) + " article(s)");
    return articles;
}


Article ArticleExtractor::extractArticle(const std::string &raw_title, const std::string &raw_body, const unsigned article_no) const {
    const std::string title(StringUtil::TrimWhite(HtmlUtil::ExtractText(raw_title)));
    if (unlikely(title.empty()))
        throw ParsingError("article #" + std::to_string(article_no) + " has an empty title!");

    std::string body(raw_body);
    const auto publish_date(extractPublishDate(title, &body));
    const auto categories(extractCategories(title, &body));
    const auto author(extractAuthor(title, &body));

    return Article(HtmlUtil::HtmlEscape(title), StringUtil::TrimWhite(HtmlSanitizer::Sanitize(body)), publish_date, categories,
                   author);
}


std::optional<time_t> ArticleExtractor::extractPublishDate(const std::string &title, std::string * const body) const {
    size_t start_pos, end_pos;
    const auto match_result(date_matcher_.match(*body, 0, &start_pos, &end_pos));
    if (not match_result) {
        if (unlikely(not match_result.getErrorMessage().empty()))
            logger_->warning("Failed to look for a date in article '" + title + "': " + match_result.getErrorMessage());
        else
            logger_->warning("No date found for article '" + title + "'.");
        return std::nullopt;
    }

    time_t publish_date;
    const bool parsed(TimeUtil::StringToTimeT(match_result[1], params_.date_format_, &publish_date));
    if (parsed or params_.strip_unparseable_dates_)
        body->erase(start_pos, end_pos - start_pos);
    if (not parsed) {
        logger_->warning("Invalid date format for article '" + title + "'. Expected format: " + params_.date_format_);
        return std::nullopt;
    }

    return publish_date;
}


std::vector<std::string> ArticleExtractor::extractCategories(const std::string &title, std::string * const body) const {
    std::vector<std::string> categories;

    size_t start_pos, end_pos;
    const auto match_result(categories_matcher_.match(*body, 0, &start_pos, &end_pos));
    if (not match_result) {
        if (unlikely(not match_result.getErrorMessage().empty()))
            logger_->warning("Failed to look for categories in article '" + title + "': " + match_result.getErrorMessage());
        return categories;
    }

    StringUtil::SplitThenTrimWhite(HtmlUtil::DecodeCharacterReferences(match_result[1]), ',', &categories);
    body->erase(start_pos, end_pos - start_pos);

    return categories;
}


std::optional<std::string> ArticleExtractor::extractAuthor(const std::string &title, std::string * const body) const {
    size_t start_pos, end_pos;
    const auto match_result(author_matcher_.match(*body, 0, &start_pos, &end_pos));
    if (not match_result) {
        if (unlikely(not match_result.getErrorMessage().empty()))
            logger_->warning("Failed to look for an author in article '" + title + "': " + match_result.getErrorMessage());
        return std::nullopt;
    }

    body->erase(start_pos, end_pos - start_pos);
    const std::string author(StringUtil::TrimWhite(HtmlUtil::DecodeCharacterReferences(match_result[1])));
    if (author.empty())
        return std::nullopt;

    return author;
}
