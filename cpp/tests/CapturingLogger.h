/** \file   CapturingLogger.h
 *  \brief  A Logger that records messages instead of emitting them.
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


#include <string>
#include <vector>
#include "util.h"


class CapturingLogger : public Logger {
public:
    std::vector<std::string> warnings_, infos_, debug_messages_;
public:
    virtual void warning(const std::string &msg) override { warnings_.emplace_back(msg); }
    virtual void info(const std::string &msg) override { infos_.emplace_back(msg); }
    virtual void debug(const std::string &msg) override { debug_messages_.emplace_back(msg); }

    bool hasWarning(const std::string &msg) const {
        for (const auto &warning : warnings_) {
            if (warning == msg)
                return true;
        }
        return false;
    }
};
