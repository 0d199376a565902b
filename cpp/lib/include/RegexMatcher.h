/** \file   RegexMatcher.h
 *  \brief  Interface for the RegexMatcher class.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2014-2021 Universitätsbibliothek Tübingen.  All rights reserved.
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


#include <memory>
#include <string>
#include <vector>
#include <pcre.h>


/** \class ThreadSafeRegexMatcher
 *  \brief Wrapper class for simple use cases of the PCRE library and UTF-8 strings.
 *  \note  Instances may be shared between threads as match() keeps all of its state in the returned MatchResult.
 */
class ThreadSafeRegexMatcher {
public:
    class MatchResult {
        friend class ThreadSafeRegexMatcher;

        std::string subject_;
        bool matched_;
        unsigned match_count_;
        std::vector<int> substr_indices_;
        std::string error_message_;
    public:
        explicit MatchResult(const std::string &subject);
        MatchResult(const MatchResult &) = default;
        MatchResult(MatchResult &&) = default;
        MatchResult &operator=(const MatchResult &) = default;

        inline operator bool() const { return matched_; }

        /** \return The number of substring matches + 1 for the full match. */
        inline unsigned size() const { return match_count_; }

        /** \brief Returns either the full match or matched substrings.
         *  \param group  When "group" is 0, the full match will be returned, o/w the n-th substring match.
         *  \throws std::out_of_range when "group" is not less than size().
         */
        std::string operator[](const unsigned group) const;

        /** \return A non-empty string if pcre_exec(3) failed for some other reason than a simple mismatch. */
        inline const std::string &getErrorMessage() const { return error_message_; }
    };

    friend class MatchResult;

    // We need this wrapper class to use the incomplete
    // PCRE types with the STL smart pointers
    struct PcreData {
        ::pcre *pcre_;
        ::pcre_extra *pcre_extra_;
    public:
        PcreData() : pcre_(nullptr), pcre_extra_(nullptr) {}
        ~PcreData() {
            if (pcre_extra_ != nullptr)
                ::pcre_free_study(pcre_extra_);

            if (pcre_)
                ::pcre_free(pcre_);
        }
    };

    enum Option { ENABLE_UTF8 = 1, CASE_INSENSITIVE = 2, MULTILINE = 4, ENABLE_UCP = 8, DOTALL = 16 };
private:
    static constexpr size_t MAX_SUBSTRING_MATCHES = 20;

    const std::string pattern_;
    const unsigned options_;
    std::shared_ptr<PcreData> pcre_data_;
public:
    /** \note Aborts via LOG_ERROR if "pattern" can't be compiled. */
    explicit ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options = ENABLE_UTF8);
    ThreadSafeRegexMatcher(const ThreadSafeRegexMatcher &rhs)
        : pattern_(rhs.pattern_), options_(rhs.options_), pcre_data_(rhs.pcre_data_) {}

    inline const std::string &getPattern() const { return pattern_; }

    /** \brief Looks for the first match of our pattern in "subject" starting at "subject_start_offset".
     *  \param start_pos  If not NULL and the match succeeded, the offset of the first character of the match.
     *  \param end_pos    If not NULL and the match succeeded, the offset of the last character of the match + 1.
     */
    MatchResult match(const std::string &subject, const size_t subject_start_offset = 0,
                      size_t * const start_pos = nullptr, size_t * const end_pos = nullptr) const;
};
