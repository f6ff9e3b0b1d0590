//
// Created by cv2 on 10/13/25.
//

#include "libshelf/progress_parser.h"
#include "libshelf/logging.h"

#include <algorithm>
#include <charconv>
#include <cstdint>

namespace shelf {

    ProgressParser::ProgressParser(const std::vector<ProgressPattern>& patterns) {
        for (const auto& pattern : patterns) {
            try {
                m_rules.emplace_back(pattern.phase, std::regex(pattern.regex, std::regex::icase | std::regex::ECMAScript));
            } catch (const std::regex_error& e) {
                log::warn("Skipping progress pattern for '" + pattern.phase + "': " + e.what());
            }
        }
    }

    std::string ProgressParser::strip_ansi(const std::string& line) {
        // CSI sequences (colours, cursor movement) and OSC sequences (window titles).
        static const std::regex ansi_re(R"(\x1B\[[0-9;?]*[ -/]*[@-~]|\x1B\][^\x07]*\x07|\x1B[@-Z\\-_])");
        return std::regex_replace(line, ansi_re, "");
    }

    // Counters too large for 64 bits are not progress, they are noise.
    static std::optional<std::uint64_t> parse_count(const std::string& digits) {
        std::uint64_t value = 0;
        const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc() || end != digits.data() + digits.size() || value > UINT64_MAX / 100) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<int> ProgressParser::extract_percent(const std::string& line) {
        static const std::regex percent_re(R"((\d{1,3})(?:\.\d+)?\s*%)");
        static const std::regex counter_re(R"(\(\s*(\d+)\s*/\s*(\d+)\s*\))");

        std::smatch match;
        if (std::regex_search(line, match, percent_re)) {
            return std::min(std::stoi(match[1].str()), 100);
        }
        if (std::regex_search(line, match, counter_re)) {
            const auto current = parse_count(match[1].str());
            const auto total = parse_count(match[2].str());
            if (current && total && *total > 0 && *current <= *total) {
                return static_cast<int>(*current * 100 / *total);
            }
        }
        return std::nullopt;
    }

    static std::string trim(const std::string& text) {
        const auto first = text.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return {};
        }
        const auto last = text.find_last_not_of(" \t");
        return text.substr(first, last - first + 1);
    }

    ParsedLine ProgressParser::parse(const std::string& line) const {
        ParsedLine parsed;
        parsed.message = trim(strip_ansi(line));
        parsed.percent = extract_percent(parsed.message);

        for (const auto& [phase, rule] : m_rules) {
            if (std::regex_search(parsed.message, rule)) {
                parsed.phase = phase;
                parsed.confidence = ProgressConfidence::High;
                return parsed;
            }
        }

        parsed.phase = "output";
        parsed.confidence = ProgressConfidence::Low;
        return parsed;
    }

} // namespace shelf
