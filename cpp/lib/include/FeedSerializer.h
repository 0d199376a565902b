/** \file   FeedSerializer.h
 *  \brief  Generation of RSS 2.0 documents.
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


#include <stdexcept>
#include <string>
#include <vector>
#include <ctime>
#include "Article.h"
#include "util.h"


namespace FeedSerializer {


class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string &message): std::runtime_error(message) { }
};


/** \brief  Generates an RSS 2.0 document with one channel.
 *  \param  logger  Where to report articles w/o a publication date.
 *  \param  now     The publication date used for articles that don't have one.
 *  \return The UTF-8 encoded XML document, including an XML declaration.
 *  \note   Article titles are expected to be HTML-escaped already and are therefore written w/o further escaping.
 *  \throws SerializationError if the document could not be generated.
 */
std::string Serialize(const FeedMetadata &feed_metadata, const std::vector<Article> &articles, Logger * const logger = ::logger,
                      const time_t now = std::time(nullptr));


} // namespace FeedSerializer
