/** \file   HtmlSanitizer.cc
 *  \brief  Implementation of the HtmlSanitizer functions.
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
#include "HtmlSanitizer.h"
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "HtmlParser.h"
#include "HtmlUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace HtmlSanitizer {


namespace {


const std::unordered_set<std::string> ALLOWED_TAGS{
    "a", "abbr", "acronym", "b", "blockquote", "code", "em", "i", "li", "ol", "strong", "ul", "p", "br", "span", "div",
    "h1", "h2", "h3", "h4", "h5", "h6", "pre"
};


const std::unordered_map<std::string, std::unordered_set<std::string>> ALLOWED_ATTRIBUTES{
    { "a",       { "href", "title" } },
    { "abbr",    { "title" }         },
    { "acronym", { "title" }         },
};


// Elements whose entire content gets dropped.  "script" and "style" are absent because HtmlParser never reports their
// contents in the first place.  Void elements like "embed" have no content and must not be listed here.
const std::unordered_set<std::string> DROPPED_CONTENT_TAGS{ "iframe", "object", "noscript", "template" };


const std::unordered_set<std::string> SAFE_URL_SCHEMES{ "http", "https", "mailto" };


inline bool IsVoidTag(const std::string &tag_name) {
    return tag_name == "br";
}


class SanitizingParser : public HtmlParser {
    std::string * const sanitized_html_;
    std::vector<std::string> open_tags_;
    unsigned suppression_depth_;
public:
    SanitizingParser(const std::string &html, std::string * const sanitized_html)
        : HtmlParser(html, HtmlParser::OPENING_TAG | HtmlParser::CLOSING_TAG | HtmlParser::MALFORMED_TAG | HtmlParser::TEXT
                           | HtmlParser::END_OF_STREAM | HtmlParser::UNEXPECTED_END_OF_STREAM),
          sanitized_html_(sanitized_html), suppression_depth_(0) { }
    virtual void notify(const HtmlParser::Chunk &chunk);
private:
    void processOpeningTag(const HtmlParser::Chunk &chunk);
    void processClosingTag(const std::string &tag_name);
    void closeAllOpenTags();
};


void SanitizingParser::notify(const HtmlParser::Chunk &chunk) {
    switch (chunk.type_) {
    case HtmlParser::OPENING_TAG:
        processOpeningTag(chunk);
        break;
    case HtmlParser::CLOSING_TAG:
        processClosingTag(chunk.text_);
        break;
    case HtmlParser::TEXT:
        if (suppression_depth_ == 0)
            *sanitized_html_ += HtmlUtil::EscapePreservingCharacterReferences(chunk.text_);
        break;
    case HtmlParser::MALFORMED_TAG:
        // Whatever this was, it will be displayed as literal text.
        if (suppression_depth_ == 0)
            *sanitized_html_ += HtmlUtil::HtmlEscape(chunk.text_);
        break;
    case HtmlParser::END_OF_STREAM:
        closeAllOpenTags();
        break;
    case HtmlParser::UNEXPECTED_END_OF_STREAM:
        LOG_DEBUG("truncated HTML: " + chunk.error_message_);
        closeAllOpenTags();
        break;
    default:
        break;
    }
}


void SanitizingParser::processOpeningTag(const HtmlParser::Chunk &chunk) {
    if (DROPPED_CONTENT_TAGS.find(chunk.text_) != DROPPED_CONTENT_TAGS.cend()) {
        ++suppression_depth_;
        return;
    }
    if (suppression_depth_ > 0 or not IsAllowedTag(chunk.text_))
        return;

    *sanitized_html_ += "<" + chunk.text_;
    for (const auto &name_and_value : *chunk.attribute_map_) {
        if (not IsAllowedAttribute(chunk.text_, name_and_value.first))
            continue;
        if (name_and_value.first == "href" and not IsSafeUrl(name_and_value.second))
            continue;
        *sanitized_html_ += " " + name_and_value.first + "=\""
                            + HtmlUtil::EscapePreservingCharacterReferences(name_and_value.second, /* escape_double_quotes = */true)
                            + "\"";
    }
    *sanitized_html_ += ">";

    if (not IsVoidTag(chunk.text_))
        open_tags_.emplace_back(chunk.text_);
}


void SanitizingParser::processClosingTag(const std::string &tag_name) {
    if (DROPPED_CONTENT_TAGS.find(tag_name) != DROPPED_CONTENT_TAGS.cend()) {
        if (suppression_depth_ > 0)
            --suppression_depth_;
        return;
    }
    if (suppression_depth_ > 0 or IsVoidTag(tag_name) or not IsAllowedTag(tag_name))
        return;

    auto open_tag(open_tags_.rbegin());
    while (open_tag != open_tags_.rend() and *open_tag != tag_name)
        ++open_tag;
    if (open_tag == open_tags_.rend()) // Stray closing tag.
        return;

    // Close all tags that were opened after the one we're closing:
    const size_t new_size(open_tags_.size() - (open_tag - open_tags_.rbegin()) - 1);
    while (open_tags_.size() > new_size) {
        *sanitized_html_ += "</" + open_tags_.back() + ">";
        open_tags_.pop_back();
    }
}


void SanitizingParser::closeAllOpenTags() {
    while (not open_tags_.empty()) {
        *sanitized_html_ += "</" + open_tags_.back() + ">";
        open_tags_.pop_back();
    }
}


} // unnamed namespace


bool IsAllowedTag(const std::string &tag_name) {
    return ALLOWED_TAGS.find(tag_name) != ALLOWED_TAGS.cend();
}


bool IsAllowedAttribute(const std::string &tag_name, const std::string &attribute_name) {
    const auto tag_and_attributes(ALLOWED_ATTRIBUTES.find(tag_name));
    if (tag_and_attributes == ALLOWED_ATTRIBUTES.cend())
        return false;

    return tag_and_attributes->second.find(attribute_name) != tag_and_attributes->second.cend();
}


bool IsSafeUrl(const std::string &url) {
    std::string normalised_url;
    for (const char ch : HtmlUtil::DecodeCharacterReferences(url)) {
        if (static_cast<unsigned char>(ch) > ' ' and ch != '\x7F')
            normalised_url += ch;
    }
    StringUtil::ToLower(&normalised_url);

    const size_t colon_pos(normalised_url.find(':'));
    if (colon_pos == std::string::npos)
        return true;

    // A slash, question mark or hash before the first colon means that the colon is not part of a scheme.
    if (normalised_url.find_first_of("/?#") < colon_pos)
        return true;

    return SAFE_URL_SCHEMES.find(normalised_url.substr(0, colon_pos)) != SAFE_URL_SCHEMES.cend();
}


std::string Sanitize(const std::string &html) {
    std::string sanitized_html;
    SanitizingParser parser(html, &sanitized_html);
    parser.parse();

    return sanitized_html;
}


} // namespace HtmlSanitizer
