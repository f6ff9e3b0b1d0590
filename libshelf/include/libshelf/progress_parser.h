//
// Created by cv2 on 10/13/25.
//

#pragma once

#include "libshelf/config.h"
#include "libshelf/operation.h"

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace shelf {

    struct ParsedLine {
        std::string phase;
        std::optional<int> percent;
        std::string message;
        ProgressConfidence confidence = ProgressConfidence::Low;
    };

    // Turns one line of tool output into a phase and an optional percentage.
    class ProgressParser {
    public:
        explicit ProgressParser(const std::vector<ProgressPattern>& patterns = default_progress_patterns());

        ParsedLine parse(const std::string& line) const;

        static std::string strip_ansi(const std::string& line);
        // "45%" or a "(n/m)" counter.
        static std::optional<int> extract_percent(const std::string& line);

    private:
        std::vector<std::pair<std::string, std::regex>> m_rules;
    };

} // namespace shelf
