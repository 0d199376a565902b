/** \file   markdown_to_rss.cc
 *  \brief  Converts a Markdown document with one article per top-level heading into an RSS 2.0 feed.
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
#include <iostream>
#include <cstdlib>
#include "ArticleExtractor.h"
#include "FeedSerializer.h"
#include "FileUtil.h"
#include "IniFile.h"
#include "MarkdownUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config-file=path] [--title=feed_title] [--description=feed_description] [--link=feed_link]\n"
            "[--date-format=strptime_format] [--markdown-renderer=command_line]\n"
            "[--log-level=(CRITICAL|ERROR|WARNING|INFO|DEBUG)] input_markdown_file output_rss_file\n"
            "The feed title, description and link have to be provided either on the command-line or in the [Feed] section\n"
            "of the config file.  Command-line options take precedence over config file entries.  Supported config file\n"
            "entries are title, description, link and date_format in the [Feed] section and renderer and timeout (in\n"
            "seconds) in the [Markdown] section.  The default date format is \"" + ArticleExtractor::DEFAULT_DATE_FORMAT + "\"\n"
            "and the default Markdown renderer is \"" + MarkdownUtil::DEFAULT_RENDERER + "\".");
}


bool ExtractOption(const std::string &arg, const std::string &option_name, std::string * const value) {
    const std::string prefix("--" + option_name + "=");
    if (not StringUtil::StartsWith(arg, prefix))
        return false;

    *value = arg.substr(prefix.length());
    return true;
}


struct FeedSettings {
    std::string title_, description_, link_, date_format_, renderer_;
    unsigned renderer_timeout_;
public:
    FeedSettings(): renderer_timeout_(MarkdownUtil::DEFAULT_RENDERER_TIMEOUT) { }
};


// Fills in whatever has not been specified on the command-line.
void LoadConfigFile(const std::string &config_file_path, FeedSettings * const settings) {
    const IniFile ini_file(config_file_path);

    if (settings->title_.empty())
        settings->title_ = ini_file.getString("Feed", "title", "");
    if (settings->description_.empty())
        settings->description_ = ini_file.getString("Feed", "description", "");
    if (settings->link_.empty())
        settings->link_ = ini_file.getString("Feed", "link", "");
    if (settings->date_format_.empty())
        settings->date_format_ = ini_file.getString("Feed", "date_format", "");
    if (settings->renderer_.empty())
        settings->renderer_ = ini_file.getString("Markdown", "renderer", "");
    settings->renderer_timeout_ = ini_file.getUnsigned("Markdown", "timeout", MarkdownUtil::DEFAULT_RENDERER_TIMEOUT);
}


void ProcessMarkdownFile(const std::string &input_path, const std::string &output_path, const FeedSettings &settings) {
    const std::string markdown(FileUtil::ReadStringOrThrow(input_path));
    const std::string rendered_html(MarkdownUtil::RenderHtml(markdown, settings.renderer_, settings.renderer_timeout_));

    const ArticleExtractor article_extractor{ ArticleExtractor::Params(settings.date_format_) };
    const std::vector<Article> articles(article_extractor.extract(rendered_html));

    const FeedMetadata feed_metadata(settings.title_, settings.description_, settings.link_);
    FileUtil::WriteStringOrThrow(output_path, FeedSerializer::Serialize(feed_metadata, articles));
    LOG_INFO("RSS feed successfully written to " + output_path);
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    FeedSettings settings;
    std::string config_file_path, log_level;
    while (argc > 1 and StringUtil::StartsWith(argv[1], "--")) {
        if (not ExtractOption(argv[1], "config-file", &config_file_path)
            and not ExtractOption(argv[1], "title", &settings.title_)
            and not ExtractOption(argv[1], "description", &settings.description_)
            and not ExtractOption(argv[1], "link", &settings.link_)
            and not ExtractOption(argv[1], "date-format", &settings.date_format_)
            and not ExtractOption(argv[1], "markdown-renderer", &settings.renderer_)
            and not ExtractOption(argv[1], "log-level", &log_level))
            Usage();
        --argc, ++argv;
    }

    if (argc != 3)
        Usage();
    const std::string input_path(argv[1]);
    const std::string output_path(argv[2]);

    if (not log_level.empty()) {
        try {
            logger->setMinimumLogLevel(Logger::StringToLogLevel(log_level));
        } catch (const std::invalid_argument &x) {
            std::cerr << x.what() << '\n';
            Usage();
        }
    }

    try {
        if (not config_file_path.empty())
            LoadConfigFile(config_file_path, &settings);
        if (settings.title_.empty() or settings.description_.empty() or settings.link_.empty())
            Usage();
        if (settings.date_format_.empty())
            settings.date_format_ = ArticleExtractor::DEFAULT_DATE_FORMAT;
        if (settings.renderer_.empty())
            settings.renderer_ = MarkdownUtil::DEFAULT_RENDERER;

        ProcessMarkdownFile(input_path, output_path, settings);
        LOG_INFO("Successfully processed " + input_path + " and generated " + output_path);
    } catch (const std::exception &x) {
        std::cout << "An error occurred: " << x.what() << '\n';
        LOG_ERROR("Error processing file " + input_path + ": " + std::string(x.what()));
    }

    std::cout << "RSS feed generated successfully. Check " << output_path << '\n';
    return EXIT_SUCCESS;
}
