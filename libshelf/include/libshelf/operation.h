//
// Created by cv2 on 10/12/25.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shelf {

    using OperationId = std::uint64_t;

    enum class OperationKind {
        Install,
        Remove,
        Convert,
        Move,
        DiagnosticFix,
        Update,
        // Read-only queries, never exclusive
        Search,
        ListInstalled
    };

    enum class SourceBackend {
        Repo,
        AUR,
        Flatpak,
        Snap,
        File
    };

    enum class OperationStatus {
        Success,
        Failed,
        Cancelled
    };

    enum class OperationError {
        // Pre-check failure, nothing was started
        ToolMissing,
        UnsupportedTarget,
        // Privilege acquisition
        AuthorizationDenied,
        AuthorizationTimeout,
        NoPrivilegeMechanism,
        // Execution
        ExecutionFailed,
        Cancelled,
        Timeout
    };

    class ShelfException : public std::runtime_error {
    public:
        ShelfException(OperationError error, const std::string& what_arg)
            : std::runtime_error(what_arg), m_error(error) {}

        OperationError get_error() const {
            return m_error;
        }

    private:
        OperationError m_error;
    };

    // True for every kind that changes what is installed on the system.
    bool mutates_package_state(OperationKind kind);

    // Immutable description of one requested action. Built by the front-end,
    // consumed exactly once by the OperationQueue.
    class OperationDescriptor {
    public:
        OperationDescriptor(OperationKind kind, std::string target, SourceBackend backend,
                            bool requires_privilege, std::vector<std::string> arguments = {});

        OperationKind kind() const { return m_kind; }
        const std::string& target() const { return m_target; }
        SourceBackend backend() const { return m_backend; }
        bool requires_privilege() const { return m_requires_privilege; }
        const std::vector<std::string>& arguments() const { return m_arguments; }

        // Holds the single exclusive slot while it runs.
        bool is_exclusive() const { return m_requires_privilege && mutates_package_state(m_kind); }

        std::string describe() const;

    private:
        OperationKind m_kind;
        std::string m_target;
        SourceBackend m_backend;
        bool m_requires_privilege;
        std::vector<std::string> m_arguments;
    };

    enum class ProgressConfidence {
        High, // matched a known output pattern
        Low   // raw tool output, forwarded so nothing is lost
    };

    struct OperationProgress {
        OperationId operation_id = 0;
        std::string phase;
        std::optional<int> percent; // 0-100
        std::string message;
        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
        ProgressConfidence confidence = ProgressConfidence::High;
        std::optional<std::chrono::seconds> eta;
    };

    struct OperationResult {
        OperationId operation_id = 0;
        OperationStatus status = OperationStatus::Failed;
        int exit_code = -1;
        std::optional<OperationError> error;
        std::optional<std::string> error_detail;

        bool succeeded() const { return status == OperationStatus::Success; }

        static OperationResult success(OperationId id, int exit_code = 0);
        static OperationResult failure(OperationId id, OperationError error, std::string detail, int exit_code = -1);
        static OperationResult cancelled(OperationId id, std::string detail = "Cancelled by user");
    };

    std::string to_string(OperationKind kind);
    std::string to_string(SourceBackend backend);
    std::string to_string(OperationStatus status);
    std::string to_string(OperationError error);

    std::optional<OperationKind> kind_from_string(const std::string& name);
    std::optional<SourceBackend> backend_from_string(const std::string& name);

} // namespace shelf
