//
// Created by cv2 on 10/12/25.
//

#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace shelf {

    enum class ConfigError {
        FileNotReadable,
        InvalidFormat,
        InvalidValue
    };

    // A terminal emulator the PrivilegeBroker may fall back to. `args` are inserted
    // between the program and the shell command line, e.g. {"-e", "bash", "-c"}.
    struct TerminalCandidate {
        std::string name;
        std::vector<std::string> args;
    };

    // Maps tool output onto a progress phase. The regex is matched case-insensitively.
    struct ProgressPattern {
        std::string phase;
        std::string regex;
    };

    struct TimeoutConfig {
        std::chrono::milliseconds probe{2000};
        std::chrono::seconds authorization{120};
        std::chrono::milliseconds grace_period{5000};
        std::chrono::seconds stall{600};   // network-bound installs can be quiet for a while
        std::chrono::seconds query{30};    // read-only helper commands used by diagnostics
    };

    struct PrivilegeConfig {
        bool use_agent = true;
        bool skip_when_root = true;
        std::string agent_action = "org.freedesktop.policykit.exec";
        std::vector<TerminalCandidate> terminals;
    };

    struct ToolConfig {
        std::vector<std::filesystem::path> search_path;
        std::vector<std::string> aur_helpers{"paru", "yay"};
        std::map<std::string, std::string> hints; // overrides the built-in resolution hints
        std::filesystem::path debtap_cache = "/var/cache/debtap";
        std::chrono::hours debtap_max_age{24};     // older databases are refreshed before a conversion
    };

    struct DiagnosticsConfig {
        std::filesystem::path root = "/";
        std::filesystem::path cache_dir = "/var/cache/pacman/pkg";
        std::filesystem::path keyring_dir = "/etc/pacman.d/gnupg";
        std::filesystem::path lock_file = "/var/lib/pacman/db.lck";
        std::filesystem::path proc_dir = "/proc";
        std::vector<std::filesystem::path> symlink_dirs{"/usr/bin", "/usr/lib"};
        double disk_warning_gb = 5.0;
        double disk_critical_gb = 1.0;
        double cache_warning_gb = 5.0;
        std::size_t symlink_scan_limit = 10;
    };

    struct AurConfig {
        std::string rpc_url = "https://aur.archlinux.org/rpc/";
        std::string package_url = "https://aur.archlinux.org/packages/";
        std::chrono::seconds timeout{15};
        std::string user_agent = "shelf/1.0";
    };

    struct Config {
        TimeoutConfig timeouts;
        PrivilegeConfig privilege;
        ToolConfig tools;
        std::vector<ProgressPattern> progress_patterns;
        DiagnosticsConfig diagnostics;
        AurConfig aur;
        std::string flatpak_remote = "flathub";
        std::filesystem::path work_dir;

        // Built-in defaults, search path taken from $PATH.
        static Config defaults();

        // Reads a YAML file on top of the defaults. A missing file is not an error.
        static std::expected<Config, ConfigError> load(const std::filesystem::path& path);
        static std::expected<Config, ConfigError> load_from_string(const std::string& content);

        // The search path joined with ':' for child process environments.
        std::string search_path_string() const;
    };

    std::vector<TerminalCandidate> default_terminals();
    std::vector<ProgressPattern> default_progress_patterns();
    std::vector<std::filesystem::path> split_search_path(const std::string& value);

    std::string to_string(ConfigError error);

} // namespace shelf
