//
// Created by cv2 on 10/13/25.
//

#pragma once

#include "libshelf/command_plan.h"
#include "libshelf/config.h"
#include "libshelf/operation.h"
#include "libshelf/subprocess.h"

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace shelf {

    class ToolProbe;

    enum class PrivilegeMechanism {
        None,     // no elevation needed, or already root
        Agent,    // polkit agent, root steps run through pkexec
        Terminal  // root steps run through sudo inside a terminal emulator
    };

    struct WrappedCommand {
        SpawnOptions options;
        // Terminal sessions write the command's exit status here; the terminal's own
        // exit code says nothing about the command.
        std::optional<std::filesystem::path> status_file;
    };

    // Proof that privileges may be used for one operation. Owns the terminal
    // session's status files and removes them when destroyed.
    class AuthorizationHandle {
    public:
        static AuthorizationHandle none(std::string search_path);
        static AuthorizationHandle agent(std::filesystem::path pkexec, std::string search_path);
        static AuthorizationHandle terminal(std::filesystem::path terminal, std::vector<std::string> terminal_args,
                                            std::filesystem::path sudo, std::string search_path);

        AuthorizationHandle(AuthorizationHandle&&) noexcept;
        AuthorizationHandle& operator=(AuthorizationHandle&&) noexcept;
        ~AuthorizationHandle();

        PrivilegeMechanism mechanism() const;

        // Builds the spawn options for one resolved step.
        WrappedCommand wrap(const ResolvedCommand& command) const;

        // Exit status written by a terminal session, nullopt until the session has written
        // a complete line.
        static std::optional<int> read_exit_status(const std::filesystem::path& status_file);

    private:
        struct Impl;
        explicit AuthorizationHandle(std::unique_ptr<Impl> impl);
        std::unique_ptr<Impl> pimpl;
    };

    class PrivilegeBroker {
    public:
        PrivilegeBroker(const Config& config, ToolProbe& probe);
        virtual ~PrivilegeBroker();

        // Blocks until the user answered, the authorization timed out or `stop` was requested.
        virtual std::expected<AuthorizationHandle, OperationError> authorize(const OperationDescriptor& descriptor,
                                                                             std::stop_token stop = {}) const;

    private:
        std::expected<std::optional<AuthorizationHandle>, OperationError> try_agent(std::stop_token stop) const;
        std::optional<AuthorizationHandle> try_terminal() const;

        Config m_config;
        ToolProbe& m_probe;
    };

    std::string to_string(PrivilegeMechanism mechanism);

    // Single-quotes a word for bash.
    std::string shell_quote(const std::string& word);

} // namespace shelf
