/** \file   FeedSerializer.cc
 *  \brief  Implementation of the RSS 2.0 generator.
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
#include "FeedSerializer.h"
#include "HtmlUtil.h"
#include "TimeUtil.h"
#include "XmlWriter.h"


namespace FeedSerializer {


namespace {


void WriteItem(const Article &article, Logger * const logger, const time_t now, XmlWriter * const xml_writer) {
    xml_writer->openTag("item");
    xml_writer->writeTagsWithEscapedData("title", article.getTitle());
    xml_writer->writeTagsWithData("description", article.getBody());

    time_t publish_date(now);
    if (article.hasPublishDate())
        publish_date = article.getPublishDate();
    else
        logger->warning("Using current date for article '" + HtmlUtil::DecodeCharacterReferences(article.getTitle()) + "'.");
    xml_writer->writeTagsWithData("pubDate", TimeUtil::TimeTToString(publish_date, TimeUtil::RFC822_UTC_FORMAT, TimeUtil::UTC));

    for (const auto &category : article.getCategories())
        xml_writer->writeTagsWithData("category", category);
    if (article.hasAuthor())
        xml_writer->writeTagsWithData("author", article.getAuthor());
    xml_writer->closeTag("item");
}


} // unnamed namespace


std::string Serialize(const FeedMetadata &feed_metadata, const std::vector<Article> &articles, Logger * const logger,
                      const time_t now)
{
    std::string rss_document;
    try {
        XmlWriter xml_writer(&rss_document, XmlWriter::WriteTheXmlDeclaration, /* indent_amount = */2);
        xml_writer.openTag("rss", { { "version", "2.0" } });
        xml_writer.openTag("channel");
        xml_writer.writeTagsWithData("title", feed_metadata.title_);
        xml_writer.writeTagsWithData("description", feed_metadata.description_);
        xml_writer.writeTagsWithData("link", feed_metadata.link_);

        for (const auto &article : articles)
            WriteItem(article, logger, now, &xml_writer);

        xml_writer.closeTag("channel");
        xml_writer.closeTag("rss");
    } catch (const std::exception &x) {
        throw SerializationError("Error generating RSS feed: " + std::string(x.what()));
    }

    return rss_document;
}


} // namespace FeedSerializer
