//
// Created by cv2 on 10/13/25.
//

#include "libshelf/eta_tracker.h"
#include "libshelf/logging.h"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

namespace shelf {

    template<typename T>
    static double median(std::vector<T> values) {
        std::sort(values.begin(), values.end());
        const std::size_t mid = values.size() / 2;
        if (values.size() % 2 == 0) {
            return (static_cast<double>(values[mid - 1]) + static_cast<double>(values[mid])) / 2.0;
        }
        return static_cast<double>(values[mid]);
    }

    template<typename T>
    static void keep_last(std::vector<T>& values, std::size_t count) {
        if (values.size() > count) {
            values.erase(values.begin(), values.end() - static_cast<std::ptrdiff_t>(count));
        }
    }

    std::string EtaTracker::make_key(const std::vector<std::string>& argv) {
        if (argv.empty()) {
            return "unknown";
        }
        const std::string base = std::filesystem::path(argv[0]).filename().string();
        for (std::size_t i = 1; i < argv.size(); ++i) {
            const auto& arg = argv[i];
            if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
                return base + "_" + arg;
            }
        }
        return base;
    }

    std::size_t EtaTracker::estimate_total_lines(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_history.find(key);
        if (it == m_history.end() || it->second.lines.empty()) {
            return default_lines;
        }
        return std::max(static_cast<std::size_t>(median(it->second.lines)), min_lines);
    }

    std::optional<std::chrono::seconds> EtaTracker::estimate_duration(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_history.find(key);
        if (it == m_history.end() || it->second.durations.empty()) {
            return std::nullopt;
        }
        return std::chrono::seconds(static_cast<long long>(median(it->second.durations) + 0.5));
    }

    void EtaTracker::record_completion(const std::string& key, std::size_t total_lines, std::chrono::duration<double> duration) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& entry = m_history[key];
        entry.lines.push_back(total_lines);
        entry.durations.push_back(duration.count());
        keep_last(entry.lines, max_samples);
        keep_last(entry.durations, max_samples);
    }

    bool EtaTracker::load(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            return true;
        }

        std::map<std::string, History> loaded;
        try {
            YAML::Node root = YAML::LoadFile(path.string());
            if (!root.IsMap()) {
                log::warn("ETA history at " + path.string() + " is not a mapping, ignoring it.");
                return false;
            }
            for (const auto& entry : root) {
                History history;
                if (entry.second["lines"]) {
                    history.lines = entry.second["lines"].as<std::vector<std::size_t>>();
                }
                if (entry.second["durations"]) {
                    history.durations = entry.second["durations"].as<std::vector<double>>();
                }
                keep_last(history.lines, max_samples);
                keep_last(history.durations, max_samples);
                loaded[entry.first.as<std::string>()] = std::move(history);
            }
        } catch (const YAML::Exception& e) {
            log::warn("Could not load ETA history from " + path.string() + ": " + e.what());
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_history = std::move(loaded);
        return true;
    }

    bool EtaTracker::save(const std::filesystem::path& path) const {
        YAML::Emitter out;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            out << YAML::BeginMap;
            for (const auto& [key, history] : m_history) {
                out << YAML::Key << key << YAML::Value << YAML::BeginMap;
                out << YAML::Key << "lines" << YAML::Value << YAML::Flow << history.lines;
                out << YAML::Key << "durations" << YAML::Value << YAML::Flow << history.durations;
                out << YAML::EndMap;
            }
            out << YAML::EndMap;
        }

        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        std::ofstream file(path);
        if (!file.is_open()) {
            log::warn("Could not write ETA history to " + path.string());
            return false;
        }
        file << out.c_str() << "\n";
        return static_cast<bool>(file);
    }

} // namespace shelf
