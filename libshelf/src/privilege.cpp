//
// Created by cv2 on 10/13/25.
//

#include "libshelf/privilege.h"
#include "libshelf/logging.h"
#include "libshelf/tool_probe.h"

#include <atomic>
#include <charconv>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

#include <unistd.h>

namespace shelf {

    std::string shell_quote(const std::string& word) {
        std::string quoted = "'";
        for (char c : word) {
            if (c == '\'') {
                quoted += "'\\''";
            } else {
                quoted += c;
            }
        }
        quoted += "'";
        return quoted;
    }

    std::string to_string(PrivilegeMechanism mechanism) {
        switch (mechanism) {
            case PrivilegeMechanism::None: return "none";
            case PrivilegeMechanism::Agent: return "polkit agent";
            case PrivilegeMechanism::Terminal: return "terminal";
        }
        return "unknown";
    }

    // --- AuthorizationHandle ---

    struct AuthorizationHandle::Impl {
        PrivilegeMechanism mechanism = PrivilegeMechanism::None;
        std::string search_path;
        std::filesystem::path pkexec;
        std::filesystem::path terminal;
        std::vector<std::string> terminal_args;
        std::filesystem::path sudo;
        std::filesystem::path status_dir;
        mutable std::atomic<unsigned> next_status{0};

        ~Impl() {
            if (status_dir.empty()) return;
            std::error_code ec;
            std::filesystem::remove_all(status_dir, ec);
            if (ec) {
                log::warn("Could not remove " + status_dir.string() + ": " + ec.message());
            }
        }
    };

    AuthorizationHandle::AuthorizationHandle(std::unique_ptr<Impl> impl) : pimpl(std::move(impl)) {}
    AuthorizationHandle::AuthorizationHandle(AuthorizationHandle&&) noexcept = default;
    AuthorizationHandle& AuthorizationHandle::operator=(AuthorizationHandle&&) noexcept = default;
    AuthorizationHandle::~AuthorizationHandle() = default;

    AuthorizationHandle AuthorizationHandle::none(std::string search_path) {
        auto impl = std::make_unique<Impl>();
        impl->search_path = std::move(search_path);
        return AuthorizationHandle(std::move(impl));
    }

    AuthorizationHandle AuthorizationHandle::agent(std::filesystem::path pkexec, std::string search_path) {
        auto impl = std::make_unique<Impl>();
        impl->mechanism = PrivilegeMechanism::Agent;
        impl->pkexec = std::move(pkexec);
        impl->search_path = std::move(search_path);
        return AuthorizationHandle(std::move(impl));
    }

    AuthorizationHandle AuthorizationHandle::terminal(std::filesystem::path terminal, std::vector<std::string> terminal_args,
                                                      std::filesystem::path sudo, std::string search_path) {
        auto impl = std::make_unique<Impl>();
        impl->mechanism = PrivilegeMechanism::Terminal;
        impl->terminal = std::move(terminal);
        impl->terminal_args = std::move(terminal_args);
        impl->sudo = std::move(sudo);
        impl->search_path = std::move(search_path);

        std::string pattern = (std::filesystem::temp_directory_path() / "shelf-auth-XXXXXX").string();
        if (mkdtemp(pattern.data()) == nullptr) {
            throw ShelfException(OperationError::NoPrivilegeMechanism,
                                 "Could not create a status directory for the terminal session: " + std::string(std::strerror(errno)));
        }
        impl->status_dir = pattern;
        return AuthorizationHandle(std::move(impl));
    }

    PrivilegeMechanism AuthorizationHandle::mechanism() const {
        return pimpl->mechanism;
    }

    WrappedCommand AuthorizationHandle::wrap(const ResolvedCommand& command) const {
        WrappedCommand wrapped;
        SpawnOptions& options = wrapped.options;
        options.search_path = pimpl->search_path;
        options.working_dir = command.working_dir;

        switch (pimpl->mechanism) {
            case PrivilegeMechanism::None:
                options.argv = command.argv;
                break;

            case PrivilegeMechanism::Agent:
                if (command.elevation == Elevation::Root) {
                    options.argv.push_back(pimpl->pkexec.string());
                    options.argv.insert(options.argv.end(), command.argv.begin(), command.argv.end());
                } else if (command.elevation == Elevation::SelfElevating && !command.argv.empty()) {
                    options.argv.push_back(command.argv.front());
                    options.argv.insert(options.argv.end(), command.agent_args.begin(), command.agent_args.end());
                    options.argv.insert(options.argv.end(), command.argv.begin() + 1, command.argv.end());
                    options.env = command.agent_env;
                } else {
                    options.argv = command.argv;
                }
                break;

            case PrivilegeMechanism::Terminal: {
                if (command.elevation == Elevation::None) {
                    options.argv = command.argv;
                    break;
                }
                const auto status_file = pimpl->status_dir /
                        ("step-" + std::to_string(pimpl->next_status.fetch_add(1)) + ".status");

                std::string script;
                if (!command.working_dir.empty()) {
                    script += "cd " + shell_quote(command.working_dir.string()) + " && ";
                }
                if (command.elevation == Elevation::Root) {
                    script += shell_quote(pimpl->sudo.string()) + " -- ";
                }
                for (std::size_t i = 0; i < command.argv.size(); ++i) {
                    script += (i == 0 ? "" : " ") + shell_quote(command.argv[i]);
                }
                script += "; echo $? > " + shell_quote(status_file.string());
                script += "; echo; read -p 'Press Enter to close'";

                options.argv.push_back(pimpl->terminal.string());
                options.argv.insert(options.argv.end(), pimpl->terminal_args.begin(), pimpl->terminal_args.end());
                options.argv.push_back(script);
                // The shell inside the terminal changes directory itself.
                options.working_dir.clear();
                wrapped.status_file = status_file;
                break;
            }
        }
        return wrapped;
    }

    std::optional<int> AuthorizationHandle::read_exit_status(const std::filesystem::path& status_file) {
        std::ifstream file(status_file);
        std::string line;
        // Only a finished line counts, the shell may still be writing it.
        if (!std::getline(file, line) || file.eof()) {
            return std::nullopt;
        }
        int status = 0;
        const auto [end, ec] = std::from_chars(line.data(), line.data() + line.size(), status);
        if (ec != std::errc() || end != line.data() + line.size()) {
            return std::nullopt;
        }
        return status;
    }

    // --- PrivilegeBroker ---

    PrivilegeBroker::PrivilegeBroker(const Config& config, ToolProbe& probe) : m_config(config), m_probe(probe) {}

    PrivilegeBroker::~PrivilegeBroker() = default;

    std::expected<AuthorizationHandle, OperationError> PrivilegeBroker::authorize(const OperationDescriptor& descriptor,
                                                                                 std::stop_token stop) const {
        const std::string search_path = m_config.search_path_string();

        if (!descriptor.requires_privilege()) {
            return AuthorizationHandle::none(search_path);
        }
        if (m_config.privilege.skip_when_root && geteuid() == 0) {
            log::debug("Already running as root, no authorization needed.");
            return AuthorizationHandle::none(search_path);
        }
        if (stop.stop_requested()) {
            return std::unexpected(OperationError::Cancelled);
        }

        auto agent = try_agent(stop);
        if (!agent) {
            return std::unexpected(agent.error());
        }
        if (*agent) {
            return std::move(**agent);
        }

        if (auto terminal = try_terminal()) {
            return std::move(*terminal);
        }

        log::error("Found neither a polkit agent nor a terminal emulator with sudo.");
        return std::unexpected(OperationError::NoPrivilegeMechanism);
    }

    std::expected<std::optional<AuthorizationHandle>, OperationError> PrivilegeBroker::try_agent(std::stop_token stop) const {
        if (!m_config.privilege.use_agent) {
            return std::optional<AuthorizationHandle>();
        }

        const auto pkexec = m_probe.probe("pkexec");
        const auto pkcheck = m_probe.probe("pkcheck");
        if (!pkexec.installed || !pkcheck.installed || !pkexec.path || !pkcheck.path) {
            log::debug("polkit is not available, skipping the agent.");
            return std::optional<AuthorizationHandle>();
        }

        SpawnOptions options;
        options.argv = {pkcheck.path->string(), "--action-id", m_config.privilege.agent_action,
                        "--process", std::to_string(getpid()), "--allow-user-interaction"};
        options.search_path = m_config.search_path_string();

        auto proc = Subprocess::spawn(options);
        if (!proc) {
            log::warn("Could not start pkcheck: " + to_string(proc.error()));
            return std::optional<AuthorizationHandle>();
        }

        log::info("Waiting for authorization through the polkit agent...");
        const auto deadline = std::chrono::steady_clock::now() + m_config.timeouts.authorization;
        while (true) {
            if (stop.stop_requested()) {
                (*proc)->terminate(m_config.timeouts.grace_period);
                log::warn("Authorization cancelled.");
                return std::unexpected(OperationError::Cancelled);
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                (*proc)->terminate(m_config.timeouts.grace_period);
                log::error("Authorization timed out.");
                return std::unexpected(OperationError::AuthorizationTimeout);
            }
            auto read = (*proc)->read_line(std::chrono::milliseconds(100));
            if (read.status == ReadStatus::Line) {
                log::debug("pkcheck: " + read.line);
            } else if (read.status == ReadStatus::Eof) {
                break;
            }
        }

        const int code = (*proc)->wait();
        switch (code) {
            case 0:
                log::ok("Authorized through the polkit agent.");
                return std::optional<AuthorizationHandle>(AuthorizationHandle::agent(*pkexec.path, m_config.search_path_string()));
            case 1:
            case 3:
                log::error("Authorization was denied.");
                return std::unexpected(OperationError::AuthorizationDenied);
            case 2:
                log::warn("No polkit agent answered, falling back to a terminal.");
                return std::optional<AuthorizationHandle>();
            default:
                log::warn("pkcheck exited with " + std::to_string(code) + ", falling back to a terminal.");
                return std::optional<AuthorizationHandle>();
        }
    }

    std::optional<AuthorizationHandle> PrivilegeBroker::try_terminal() const {
        const auto sudo = m_probe.locate("sudo");
        if (!sudo) {
            log::debug("sudo not found, no terminal fallback.");
            return std::nullopt;
        }

        for (const auto& candidate : m_config.privilege.terminals) {
            const auto path = m_probe.locate(candidate.name);
            if (!path) continue;

            try {
                log::info("Using " + candidate.name + " with sudo for privileged steps.");
                return AuthorizationHandle::terminal(*path, candidate.args, *sudo, m_config.search_path_string());
            } catch (const ShelfException& e) {
                log::error(e.what());
                return std::nullopt;
            }
        }
        log::debug("No configured terminal emulator found.");
        return std::nullopt;
    }

} // namespace shelf
