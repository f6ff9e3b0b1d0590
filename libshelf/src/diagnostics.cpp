//
// Created by cv2 on 10/14/25.
//

#include "libshelf/diagnostics.h"
#include "libshelf/keyring.h"
#include "libshelf/logging.h"
#include "libshelf/subprocess.h"
#include "libshelf/tool_probe.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace shelf {

    static constexpr double bytes_per_gb = 1024.0 * 1024.0 * 1024.0;

    std::string to_string(CheckStatus status) {
        switch (status) {
            case CheckStatus::Ok: return "ok";
            case CheckStatus::Warning: return "warning";
            case CheckStatus::Critical: return "critical";
        }
        return "unknown";
    }

    static std::string format_gb(double gb) {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(1) << gb << " GB";
        return ss.str();
    }

    static DiagnosticCheck make_check(std::string name, CheckStatus status, std::string detail) {
        DiagnosticCheck check;
        check.name = std::move(name);
        check.status = status;
        check.detail = std::move(detail);
        return check;
    }

    static void with_fix(DiagnosticCheck& check, const std::string& label, OperationDescriptor fix) {
        check.remediation_label = label;
        check.remediation = std::move(fix);
    }

    DiagnosticsEngine::DiagnosticsEngine(const Config& config, ToolProbe& probe) : m_config(config), m_probe(probe) {}

    OperationDescriptor DiagnosticsEngine::fix_descriptor(const std::string& fix_id, std::vector<std::string> arguments) {
        return OperationDescriptor(OperationKind::DiagnosticFix, fix_id, SourceBackend::Repo, true, std::move(arguments));
    }

    std::optional<std::pair<int, std::vector<std::string>>> DiagnosticsEngine::query(
            const std::string& tool, const std::vector<std::string>& args) const {
        const auto path = m_probe.locate(tool);
        if (!path) {
            log::debug(tool + " is not installed, skipping its query.");
            return std::nullopt;
        }

        SpawnOptions options;
        options.argv.push_back(path->string());
        options.argv.insert(options.argv.end(), args.begin(), args.end());
        options.search_path = m_config.search_path_string();

        auto output = run_command(options, m_config.timeouts.query);
        if (!output) {
            log::warn("Could not run " + tool + ": " + to_string(output.error()));
            return std::nullopt;
        }
        if (output->timed_out) {
            log::warn(tool + " did not answer in time.");
            return std::nullopt;
        }

        std::vector<std::string> lines;
        std::istringstream stream(output->output);
        std::string line;
        while (std::getline(stream, line)) {
            if (line.find_first_not_of(" \t\r") != std::string::npos) {
                lines.push_back(line);
            }
        }
        return std::make_pair(output->exit_code, std::move(lines));
    }

    DiagnosticCheck DiagnosticsEngine::check_disk_space() const {
        std::error_code ec;
        const auto space = std::filesystem::space(m_config.diagnostics.root, ec);
        if (ec) {
            return make_check("Disk Space", CheckStatus::Warning,
                              "Could not read free space of " + m_config.diagnostics.root.string() + ": " + ec.message());
        }

        const double free_gb = static_cast<double>(space.available) / bytes_per_gb;
        const double used_pct = space.capacity > 0
                ? 100.0 * static_cast<double>(space.capacity - space.free) / static_cast<double>(space.capacity)
                : 0.0;
        const std::string summary = format_gb(free_gb) + " free (" + std::to_string(static_cast<int>(used_pct)) + "% used)";

        if (free_gb < m_config.diagnostics.disk_critical_gb) {
            auto check = make_check("Disk Space", CheckStatus::Critical, "Critical: only " + summary);
            with_fix(check, "Clear package cache", fix_descriptor("clear-cache"));
            return check;
        }
        if (free_gb < m_config.diagnostics.disk_warning_gb) {
            auto check = make_check("Disk Space", CheckStatus::Warning, "Low disk space: " + summary);
            with_fix(check, "Clean package cache", fix_descriptor("clean-cache"));
            return check;
        }
        return make_check("Disk Space", CheckStatus::Ok, summary);
    }

    DiagnosticCheck DiagnosticsEngine::check_keyring() const {
        auto keyring = inspect_keyring(m_config.diagnostics.keyring_dir);
        if (!keyring) {
            auto check = make_check("Pacman Keyring", CheckStatus::Warning, to_string(keyring.error()));
            with_fix(check, "Refresh keyring", fix_descriptor("refresh-keyring"));
            return check;
        }
        if (keyring->key_count == 0) {
            auto check = make_check("Pacman Keyring", CheckStatus::Warning, "The keyring holds no keys");
            with_fix(check, "Refresh keyring", fix_descriptor("refresh-keyring"));
            return check;
        }
        if (keyring->expired > 0 || keyring->revoked > 0) {
            auto check = make_check("Pacman Keyring", CheckStatus::Warning,
                                    std::to_string(keyring->expired) + " expired and " +
                                    std::to_string(keyring->revoked) + " revoked keys");
            with_fix(check, "Refresh keyring", fix_descriptor("refresh-keyring"));
            return check;
        }
        return make_check("Pacman Keyring", CheckStatus::Ok,
                          "Keyring is healthy (" + std::to_string(keyring->key_count) + " keys)");
    }

    DiagnosticCheck DiagnosticsEngine::check_orphans() const {
        auto result = query("pacman", {"-Qdtq"});
        if (!result) {
            return make_check("Orphaned Packages", CheckStatus::Warning, "Could not query pacman");
        }
        const auto& [code, orphans] = *result;
        // pacman -Qdtq exits 1 when there is nothing to list
        if (orphans.empty()) {
            if (code != 0 && code != 1) {
                return make_check("Orphaned Packages", CheckStatus::Warning,
                                  "pacman exited with code " + std::to_string(code));
            }
            return make_check("Orphaned Packages", CheckStatus::Ok, "No orphaned packages");
        }

        std::string listed;
        for (std::size_t i = 0; i < orphans.size() && i < 5; ++i) {
            listed += (i == 0 ? "" : ", ") + orphans[i];
        }
        if (orphans.size() > 5) listed += "...";

        auto check = make_check("Orphaned Packages", CheckStatus::Warning,
                                std::to_string(orphans.size()) + " orphaned packages found: " + listed);
        with_fix(check, "Remove orphans", fix_descriptor("remove-orphans", orphans));
        return check;
    }

    DiagnosticCheck DiagnosticsEngine::check_package_cache() const {
        const auto& cache_dir = m_config.diagnostics.cache_dir;
        std::error_code ec;
        if (!std::filesystem::is_directory(cache_dir, ec)) {
            return make_check("Package Cache", CheckStatus::Ok, "No package cache at " + cache_dir.string());
        }

        std::uintmax_t total = 0;
        for (auto it = std::filesystem::directory_iterator(cache_dir, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec)) {
                const auto size = it->file_size(entry_ec);
                if (!entry_ec) total += size;
            }
        }
        if (ec) {
            return make_check("Package Cache", CheckStatus::Warning, "Could not read " + cache_dir.string() + ": " + ec.message());
        }

        const double gb = static_cast<double>(total) / bytes_per_gb;
        if (gb > m_config.diagnostics.cache_warning_gb) {
            auto check = make_check("Package Cache", CheckStatus::Warning, "Cache is " + format_gb(gb));
            with_fix(check, "Clean old versions", fix_descriptor("prune-cache"));
            return check;
        }
        return make_check("Package Cache", CheckStatus::Ok, "Cache is " + format_gb(gb));
    }

    DiagnosticCheck DiagnosticsEngine::check_failed_services() const {
        auto result = query("systemctl", {"--failed", "--no-pager", "--no-legend"});
        if (!result) {
            return make_check("System Services", CheckStatus::Ok, "Could not check services");
        }
        const auto& failed = result->second;
        if (!failed.empty()) {
            auto check = make_check("System Services", CheckStatus::Warning,
                                    std::to_string(failed.size()) + " failed service(s)");
            with_fix(check, "Reset failed units", fix_descriptor("reset-failed-services"));
            return check;
        }
        return make_check("System Services", CheckStatus::Ok, "All services running");
    }

    DiagnosticCheck DiagnosticsEngine::check_broken_symlinks() const {
        const std::size_t limit = m_config.diagnostics.symlink_scan_limit;
        std::vector<std::string> broken;
        for (const auto& dir : m_config.diagnostics.symlink_dirs) {
            std::error_code ec;
            for (auto it = std::filesystem::directory_iterator(dir, ec);
                 !ec && it != std::filesystem::directory_iterator() && broken.size() < limit; it.increment(ec)) {
                std::error_code entry_ec;
                if (it->is_symlink(entry_ec) && !std::filesystem::exists(it->path(), entry_ec)) {
                    broken.push_back(it->path().string());
                }
            }
            if (broken.size() >= limit) break;
        }

        if (!broken.empty()) {
            log::debug("First broken symlink: " + broken.front());
            return make_check("Broken Symlinks", CheckStatus::Warning,
                              std::to_string(broken.size()) + " broken symlink(s) found in system dirs");
        }
        return make_check("Broken Symlinks", CheckStatus::Ok, "No broken symlinks detected");
    }

    bool DiagnosticsEngine::package_manager_running() const {
        std::error_code ec;
        for (auto it = std::filesystem::directory_iterator(m_config.diagnostics.proc_dir, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            std::ifstream comm(it->path() / "comm");
            std::string name;
            if (comm && std::getline(comm, name) && name == "pacman") {
                return true;
            }
        }
        return false;
    }

    DiagnosticCheck DiagnosticsEngine::check_lock_file() const {
        const auto& lock = m_config.diagnostics.lock_file;
        std::error_code ec;
        if (!std::filesystem::exists(lock, ec)) {
            return make_check("Pacman Lock", CheckStatus::Ok, "No lock file, pacman is ready");
        }
        if (package_manager_running()) {
            return make_check("Pacman Lock", CheckStatus::Warning, "A pacman process holds the lock");
        }
        auto check = make_check("Pacman Lock", CheckStatus::Critical,
                                "Stale lock file " + lock.string() + " and no pacman process running");
        with_fix(check, "Remove lock file", fix_descriptor("remove-lock"));
        return check;
    }

    std::vector<DiagnosticCheck> DiagnosticsEngine::run_checks() const {
        log::info("Running system diagnostics...");
        std::vector<DiagnosticCheck> checks;
        checks.push_back(check_disk_space());
        checks.push_back(check_keyring());
        checks.push_back(check_orphans());
        checks.push_back(check_package_cache());
        checks.push_back(check_failed_services());
        checks.push_back(check_broken_symlinks());
        checks.push_back(check_lock_file());

        for (const auto& check : checks) {
            if (check.status != CheckStatus::Ok) {
                log::warn(check.name + ": " + check.detail);
            }
        }
        return checks;
    }

    std::vector<DiagnosticCheck> DiagnosticsEngine::pre_install_checks(const std::vector<std::string>& packages) const {
        std::vector<DiagnosticCheck> checks;
        checks.push_back(check_disk_space());
        checks.push_back(check_lock_file());

        for (const auto& name : packages) {
            auto result = query("pacman", {"-Si", name});
            if (!result || result->first != 0) {
                checks.push_back(make_check("Package '" + name + "'", CheckStatus::Warning,
                                            "Package info not found, it may not exist in the repositories"));
            }
        }
        return checks;
    }

    std::vector<DiagnosticCheck> DiagnosticsEngine::post_install_checks(const std::vector<std::string>& packages) const {
        std::vector<DiagnosticCheck> checks;
        for (const auto& name : packages) {
            auto result = query("pacman", {"-Q", name});
            if (result && result->first == 0) {
                checks.push_back(make_check(name, CheckStatus::Ok, "Successfully installed"));
            } else {
                checks.push_back(make_check(name, CheckStatus::Critical,
                                            "Package not found after installation, it may have failed"));
            }
        }
        return checks;
    }

} // namespace shelf
