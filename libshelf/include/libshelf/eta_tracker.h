//
// Created by cv2 on 10/13/25.
//

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shelf {

    // Learns how many output lines and how much time a kind of command takes,
    // so a percentage can be estimated when the tool prints none.
    class EtaTracker {
    public:
        static constexpr std::size_t max_samples = 20;
        static constexpr std::size_t default_lines = 50;
        static constexpr std::size_t min_lines = 5;

        // {"pacman", "-S", "--noconfirm", "firefox"} -> "pacman_-S"
        static std::string make_key(const std::vector<std::string>& argv);

        std::size_t estimate_total_lines(const std::string& key) const;
        std::optional<std::chrono::seconds> estimate_duration(const std::string& key) const;
        void record_completion(const std::string& key, std::size_t total_lines, std::chrono::duration<double> duration);

        // Optional persistence; a missing file loads as empty history.
        bool load(const std::filesystem::path& path);
        bool save(const std::filesystem::path& path) const;

    private:
        struct History {
            std::vector<std::size_t> lines;
            std::vector<double> durations;
        };

        mutable std::mutex m_mutex;
        std::map<std::string, History> m_history;
    };

} // namespace shelf
