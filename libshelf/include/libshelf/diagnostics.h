//
// Created by cv2 on 10/14/25.
//

#pragma once

#include "libshelf/config.h"
#include "libshelf/operation.h"

#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace shelf {

    class ToolProbe;

    enum class CheckStatus {
        Ok,
        Warning,
        Critical
    };

    struct DiagnosticCheck {
        std::string name;
        CheckStatus status = CheckStatus::Ok;
        std::string detail;
        // A DiagnosticFix operation to submit to the queue; never run from here.
        std::optional<OperationDescriptor> remediation;
        std::string remediation_label;
    };

    // Read-only health checks of the package system. Checks report, they never throw
    // and never change anything.
    class DiagnosticsEngine {
    public:
        DiagnosticsEngine(const Config& config, ToolProbe& probe);

        // Disk space, keyring, orphans, cache size, failed services, broken symlinks, lock file.
        std::vector<DiagnosticCheck> run_checks() const;

        std::vector<DiagnosticCheck> pre_install_checks(const std::vector<std::string>& packages) const;
        std::vector<DiagnosticCheck> post_install_checks(const std::vector<std::string>& packages) const;

        DiagnosticCheck check_disk_space() const;
        DiagnosticCheck check_keyring() const;
        DiagnosticCheck check_orphans() const;
        DiagnosticCheck check_package_cache() const;
        DiagnosticCheck check_failed_services() const;
        DiagnosticCheck check_broken_symlinks() const;
        DiagnosticCheck check_lock_file() const;

        static OperationDescriptor fix_descriptor(const std::string& fix_id, std::vector<std::string> arguments = {});

    private:
        // Runs a query tool and returns its output lines, nullopt if it could not run.
        std::optional<std::pair<int, std::vector<std::string>>> query(const std::string& tool,
                                                                      const std::vector<std::string>& args) const;
        bool package_manager_running() const;

        Config m_config;
        ToolProbe& m_probe;
    };

    std::string to_string(CheckStatus status);

} // namespace shelf
