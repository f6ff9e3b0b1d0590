//
// Created by cv2 on 10/12/25.
//

#include "libshelf/config.h"
#include "libshelf/logging.h"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace shelf {

    std::vector<TerminalCandidate> default_terminals() {
        // Every entry must block until the shell inside it exits.
        return {
            {"gnome-terminal", {"--wait", "--", "bash", "-c"}},
            {"konsole", {"--nofork", "-e", "bash", "-c"}},
            {"xfce4-terminal", {"--disable-server", "-x", "bash", "-c"}},
            {"alacritty", {"-e", "bash", "-c"}},
            {"kitty", {"bash", "-c"}},
            {"xterm", {"-e", "bash", "-c"}},
        };
    }

    std::vector<ProgressPattern> default_progress_patterns() {
        // First match wins, so "uninstalling" must be tested before "installing".
        return {
            {"resolving dependencies", "resolving dependencies|looking for conflicting packages|looking for inter-conflicts|checking dependencies|calculating"},
            {"verifying", "checking keyring|checking keys|checking package integrity|loading package files|checking for file conflicts|checking available disk space|verifying"},
            {"downloading", "downloading|retrieving|synchronizing package databases|fetching|receiving objects"},
            {"building", "==> making package|==> starting build|==> entering fakeroot|compiling|building"},
            {"converting", "converting|unpacking|generating \\.pkginfo|creating final package|extracting"},
            {"removing", "uninstalling|removing|deleting"},
            {"installing", "installing|upgrading|:: processing package changes|running post-transaction hooks|committing"},
        };
    }

    std::vector<std::filesystem::path> split_search_path(const std::string& value) {
        std::vector<std::filesystem::path> dirs;
        std::stringstream ss(value);
        std::string segment;
        while (std::getline(ss, segment, ':')) {
            if (!segment.empty()) {
                dirs.emplace_back(segment);
            }
        }
        return dirs;
    }

    Config Config::defaults() {
        Config config;
        const char* path_env = std::getenv("PATH");
        config.tools.search_path = split_search_path(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
        config.privilege.terminals = default_terminals();
        config.progress_patterns = default_progress_patterns();
        config.work_dir = std::filesystem::temp_directory_path();
        return config;
    }

    std::string Config::search_path_string() const {
        std::string joined;
        for (const auto& dir : tools.search_path) {
            if (!joined.empty()) {
                joined += ":";
            }
            joined += dir.string();
        }
        return joined;
    }

    // --- YAML helpers ---

    template<typename T>
    static void read_scalar(const YAML::Node& node, const std::string& key, T& out) {
        if (node[key] && node[key].IsScalar()) {
            out = node[key].as<T>();
        }
    }

    static void read_path(const YAML::Node& node, const std::string& key, std::filesystem::path& out) {
        if (node[key] && node[key].IsScalar()) {
            out = node[key].as<std::string>();
        }
    }

    static std::vector<std::string> get_sequence(const YAML::Node& node, const std::string& key) {
        std::vector<std::string> result;
        if (node[key] && node[key].IsSequence()) {
            for (const auto& item : node[key]) {
                result.push_back(item.as<std::string>());
            }
        }
        return result;
    }

    template<typename Duration>
    static void read_duration(const YAML::Node& node, const std::string& key, Duration& out) {
        if (node[key] && node[key].IsScalar()) {
            const auto count = node[key].as<long long>();
            if (count < 0) {
                throw YAML::BadConversion(node[key].Mark());
            }
            out = Duration(count);
        }
    }

    static void apply_timeouts(const YAML::Node& node, TimeoutConfig& timeouts) {
        if (!node) return;
        read_duration(node, "probe_ms", timeouts.probe);
        read_duration(node, "authorization_s", timeouts.authorization);
        read_duration(node, "grace_period_ms", timeouts.grace_period);
        read_duration(node, "stall_s", timeouts.stall);
        read_duration(node, "query_s", timeouts.query);
    }

    static void apply_privilege(const YAML::Node& node, PrivilegeConfig& privilege) {
        if (!node) return;
        read_scalar(node, "use_agent", privilege.use_agent);
        read_scalar(node, "skip_when_root", privilege.skip_when_root);
        read_scalar(node, "agent_action", privilege.agent_action);

        if (node["terminals"] && node["terminals"].IsSequence()) {
            privilege.terminals.clear();
            for (const auto& item : node["terminals"]) {
                if (!item["name"]) {
                    log::error("Terminal entry without a 'name' in configuration.");
                    throw YAML::BadConversion(item.Mark());
                }
                privilege.terminals.push_back({item["name"].as<std::string>(), get_sequence(item, "args")});
            }
        }
    }

    static void apply_tools(const YAML::Node& node, ToolConfig& tools) {
        if (!node) return;
        if (node["search_path"]) {
            tools.search_path.clear();
            for (const auto& dir : get_sequence(node, "search_path")) {
                tools.search_path.emplace_back(dir);
            }
        }
        if (node["aur_helpers"]) {
            tools.aur_helpers = get_sequence(node, "aur_helpers");
        }
        if (node["hints"] && node["hints"].IsMap()) {
            for (const auto& entry : node["hints"]) {
                tools.hints[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }
        read_path(node, "debtap_cache", tools.debtap_cache);
        read_duration(node, "debtap_max_age_h", tools.debtap_max_age);
    }

    static void apply_diagnostics(const YAML::Node& node, DiagnosticsConfig& diag) {
        if (!node) return;
        read_path(node, "root", diag.root);
        read_path(node, "cache_dir", diag.cache_dir);
        read_path(node, "keyring_dir", diag.keyring_dir);
        read_path(node, "lock_file", diag.lock_file);
        read_path(node, "proc_dir", diag.proc_dir);
        if (node["symlink_dirs"]) {
            diag.symlink_dirs.clear();
            for (const auto& dir : get_sequence(node, "symlink_dirs")) {
                diag.symlink_dirs.emplace_back(dir);
            }
        }
        read_scalar(node, "disk_warning_gb", diag.disk_warning_gb);
        read_scalar(node, "disk_critical_gb", diag.disk_critical_gb);
        read_scalar(node, "cache_warning_gb", diag.cache_warning_gb);
        read_scalar(node, "symlink_scan_limit", diag.symlink_scan_limit);
    }

    static void apply_aur(const YAML::Node& node, AurConfig& aur) {
        if (!node) return;
        read_scalar(node, "rpc_url", aur.rpc_url);
        read_scalar(node, "package_url", aur.package_url);
        read_duration(node, "timeout_s", aur.timeout);
        read_scalar(node, "user_agent", aur.user_agent);
    }

    static std::expected<void, ConfigError> apply_progress(const YAML::Node& node, std::vector<ProgressPattern>& patterns) {
        if (!node || !node["patterns"]) return {};
        if (!node["patterns"].IsSequence()) {
            log::error("progress.patterns must be a sequence.");
            return std::unexpected(ConfigError::InvalidValue);
        }

        std::vector<ProgressPattern> parsed;
        for (const auto& item : node["patterns"]) {
            if (!item["phase"] || !item["regex"]) {
                log::error("Progress pattern needs both 'phase' and 'regex'.");
                return std::unexpected(ConfigError::InvalidValue);
            }
            ProgressPattern pattern{item["phase"].as<std::string>(), item["regex"].as<std::string>()};
            try {
                std::regex compiled(pattern.regex, std::regex::icase);
            } catch (const std::regex_error& e) {
                log::error("Invalid progress regex '" + pattern.regex + "': " + e.what());
                return std::unexpected(ConfigError::InvalidValue);
            }
            parsed.push_back(std::move(pattern));
        }
        patterns = std::move(parsed);
        return {};
    }

    static std::expected<Config, ConfigError> apply_document(const YAML::Node& root) {
        Config config = Config::defaults();
        if (root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            log::error("Configuration root must be a mapping.");
            return std::unexpected(ConfigError::InvalidFormat);
        }

        try {
            apply_timeouts(root["timeouts"], config.timeouts);
            apply_privilege(root["privilege"], config.privilege);
            apply_tools(root["tools"], config.tools);
            apply_diagnostics(root["diagnostics"], config.diagnostics);
            apply_aur(root["aur"], config.aur);
            if (root["flatpak"]) {
                read_scalar(root["flatpak"], "remote", config.flatpak_remote);
            }
            read_path(root, "work_dir", config.work_dir);
        } catch (const YAML::Exception& e) {
            log::error(std::string("Invalid value in configuration: ") + e.what());
            return std::unexpected(ConfigError::InvalidValue);
        }

        auto progress_result = apply_progress(root["progress"], config.progress_patterns);
        if (!progress_result) {
            return std::unexpected(progress_result.error());
        }
        return config;
    }

    std::expected<Config, ConfigError> Config::load(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            log::info("No configuration at " + path.string() + ", using defaults.");
            return Config::defaults();
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(path.string());
        } catch (const YAML::BadFile& e) {
            log::error("Could not read configuration file " + path.string() + ": " + e.what());
            return std::unexpected(ConfigError::FileNotReadable);
        } catch (const YAML::Exception& e) {
            log::error("Failed to parse configuration file " + path.string() + ": " + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
        return apply_document(root);
    }

    std::expected<Config, ConfigError> Config::load_from_string(const std::string& content) {
        YAML::Node root;
        try {
            root = YAML::Load(content);
        } catch (const YAML::Exception& e) {
            log::error(std::string("Failed to parse configuration: ") + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
        return apply_document(root);
    }

    std::string to_string(ConfigError error) {
        switch (error) {
            case ConfigError::FileNotReadable: return "The configuration file could not be read.";
            case ConfigError::InvalidFormat: return "The configuration file is not valid YAML.";
            case ConfigError::InvalidValue: return "The configuration contains an invalid value.";
        }
        return "Unknown configuration error.";
    }

} // namespace shelf
