/** \file   Article.h
 *  \brief  The records that make up an RSS feed.
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
#include <string>
#include <vector>
#include <ctime>


/** \brief  One entry of a feed.
 *  \note   The title is already HTML-escaped and the body has already been sanitised, see ArticleExtractor.
 */
class Article {
    std::string title_;
    std::string body_;
    std::optional<time_t> publish_date_;
    std::vector<std::string> categories_;
    std::optional<std::string> author_;
public:
    Article(const std::string &title, const std::string &body, const std::optional<time_t> &publish_date,
            const std::vector<std::string> &categories, const std::optional<std::string> &author)
        : title_(title), body_(body), publish_date_(publish_date), categories_(categories), author_(author) { }

    inline const std::string &getTitle() const { return title_; }
    inline const std::string &getBody() const { return body_; }
    inline bool hasPublishDate() const { return publish_date_.has_value(); }

    /** \note Only call this if hasPublishDate() returns true! */
    inline time_t getPublishDate() const { return *publish_date_; }
    inline const std::optional<time_t> &getOptionalPublishDate() const { return publish_date_; }
    inline const std::vector<std::string> &getCategories() const { return categories_; }
    inline bool hasAuthor() const { return author_.has_value(); }

    /** \note Only call this if hasAuthor() returns true! */
    inline const std::string &getAuthor() const { return *author_; }
};


/** \brief  Channel-level information.  All members are plain text and will be escaped upon serialisation. */
struct FeedMetadata {
    std::string title_;
    std::string description_;
    std::string link_;
public:
    FeedMetadata(const std::string &title, const std::string &description, const std::string &link)
        : title_(title), description_(description), link_(link) { }
};
