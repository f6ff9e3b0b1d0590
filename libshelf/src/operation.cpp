//
// Created by cv2 on 10/12/25.
//

#include "libshelf/operation.h"

#include <algorithm>
#include <cctype>

namespace shelf {

    bool mutates_package_state(OperationKind kind) {
        switch (kind) {
            case OperationKind::Search:
            case OperationKind::ListInstalled:
                return false;
            default:
                return true;
        }
    }

    OperationDescriptor::OperationDescriptor(OperationKind kind, std::string target, SourceBackend backend,
                                             bool requires_privilege, std::vector<std::string> arguments)
            : m_kind(kind),
              m_target(std::move(target)),
              m_backend(backend),
              m_requires_privilege(requires_privilege),
              m_arguments(std::move(arguments))
    {}

    std::string OperationDescriptor::describe() const {
        std::string text = to_string(m_kind) + " '" + m_target + "' (" + to_string(m_backend) + ")";
        if (m_requires_privilege) {
            text += " [privileged]";
        }
        return text;
    }

    OperationResult OperationResult::success(OperationId id, int exit_code) {
        OperationResult result;
        result.operation_id = id;
        result.status = OperationStatus::Success;
        result.exit_code = exit_code;
        return result;
    }

    OperationResult OperationResult::failure(OperationId id, OperationError error, std::string detail, int exit_code) {
        OperationResult result;
        result.operation_id = id;
        result.status = OperationStatus::Failed;
        result.exit_code = exit_code;
        result.error = error;
        result.error_detail = std::move(detail);
        return result;
    }

    OperationResult OperationResult::cancelled(OperationId id, std::string detail) {
        OperationResult result;
        result.operation_id = id;
        result.status = OperationStatus::Cancelled;
        result.error = OperationError::Cancelled;
        result.error_detail = std::move(detail);
        return result;
    }

    std::string to_string(OperationKind kind) {
        switch (kind) {
            case OperationKind::Install: return "install";
            case OperationKind::Remove: return "remove";
            case OperationKind::Convert: return "convert";
            case OperationKind::Move: return "move";
            case OperationKind::DiagnosticFix: return "fix";
            case OperationKind::Update: return "update";
            case OperationKind::Search: return "search";
            case OperationKind::ListInstalled: return "list";
        }
        return "unknown";
    }

    std::string to_string(SourceBackend backend) {
        switch (backend) {
            case SourceBackend::Repo: return "repo";
            case SourceBackend::AUR: return "aur";
            case SourceBackend::Flatpak: return "flatpak";
            case SourceBackend::Snap: return "snap";
            case SourceBackend::File: return "file";
        }
        return "unknown";
    }

    std::string to_string(OperationStatus status) {
        switch (status) {
            case OperationStatus::Success: return "success";
            case OperationStatus::Failed: return "failed";
            case OperationStatus::Cancelled: return "cancelled";
        }
        return "unknown";
    }

    std::string to_string(OperationError error) {
        switch (error) {
            case OperationError::ToolMissing: return "A required tool is not installed.";
            case OperationError::UnsupportedTarget: return "The operation is not supported for this target.";
            case OperationError::AuthorizationDenied: return "Authorization was denied.";
            case OperationError::AuthorizationTimeout: return "Authorization timed out.";
            case OperationError::NoPrivilegeMechanism: return "No way to obtain administrator privileges was found.";
            case OperationError::ExecutionFailed: return "The external tool reported a failure.";
            case OperationError::Cancelled: return "The operation was cancelled.";
            case OperationError::Timeout: return "The operation made no progress and timed out.";
        }
        return "An unknown error occurred.";
    }

    static std::string lowercase(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::optional<OperationKind> kind_from_string(const std::string& name) {
        const auto key = lowercase(name);
        for (auto kind : {OperationKind::Install, OperationKind::Remove, OperationKind::Convert,
                          OperationKind::Move, OperationKind::DiagnosticFix, OperationKind::Update,
                          OperationKind::Search, OperationKind::ListInstalled}) {
            if (to_string(kind) == key) {
                return kind;
            }
        }
        return std::nullopt;
    }

    std::optional<SourceBackend> backend_from_string(const std::string& name) {
        const auto key = lowercase(name);
        for (auto backend : {SourceBackend::Repo, SourceBackend::AUR, SourceBackend::Flatpak,
                             SourceBackend::Snap, SourceBackend::File}) {
            if (to_string(backend) == key) {
                return backend;
            }
        }
        return std::nullopt;
    }

} // namespace shelf
