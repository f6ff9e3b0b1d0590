//
// Created by cv2 on 10/12/25.
//

#include "libshelf/subprocess.h"
#include "libshelf/config.h"
#include "libshelf/logging.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace shelf {

    int decode_wait_status(int status) {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }

    static bool is_executable_file(const std::filesystem::path& path) {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    }

    std::optional<std::filesystem::path> find_executable(const std::string& name, const std::string& search_path) {
        if (name.empty()) {
            return std::nullopt;
        }
        if (name.find('/') != std::string::npos) {
            if (is_executable_file(name)) {
                return std::filesystem::path(name);
            }
            return std::nullopt;
        }
        for (const auto& dir : split_search_path(search_path)) {
            auto candidate = dir / name;
            if (is_executable_file(candidate)) {
                return candidate;
            }
        }
        return std::nullopt;
    }

    std::string to_string(SpawnError error) {
        switch (error) {
            case SpawnError::EmptyCommand: return "empty command line";
            case SpawnError::NotFound: return "executable not found on the search path";
            case SpawnError::PipeFailed: return "could not create a pipe";
            case SpawnError::ForkFailed: return "fork failed";
            case SpawnError::ExecFailed: return "exec failed";
        }
        return "unknown spawn error";
    }

    static std::vector<std::string> build_environment(const SpawnOptions& options, const std::string& path) {
        std::map<std::string, std::string> env;
        for (char** entry = environ; entry && *entry; ++entry) {
            std::string text(*entry);
            const auto eq = text.find('=');
            if (eq == std::string::npos) continue;
            env[text.substr(0, eq)] = text.substr(eq + 1);
        }
        env["PATH"] = path;
        // Progress patterns match the untranslated tool output.
        env["LC_ALL"] = "C";
        for (const auto& [key, value] : options.env) {
            env[key] = value;
        }

        std::vector<std::string> result;
        result.reserve(env.size());
        for (const auto& [key, value] : env) {
            result.push_back(key + "=" + value);
        }
        return result;
    }

    // Only async-signal-safe calls between fork() and execve().
    [[noreturn]] static void report_child_failure(int fd) {
        int err = errno;
        ssize_t written = write(fd, &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    std::expected<std::unique_ptr<Subprocess>, SpawnError> Subprocess::spawn(const SpawnOptions& options) {
        if (options.argv.empty()) {
            return std::unexpected(SpawnError::EmptyCommand);
        }

        const char* inherited_path = std::getenv("PATH");
        const std::string path = options.search_path.empty() ? (inherited_path ? inherited_path : "") : options.search_path;

        auto executable = find_executable(options.argv[0], path);
        if (!executable) {
            log::debug("Executable '" + options.argv[0] + "' not found in " + path);
            return std::unexpected(SpawnError::NotFound);
        }
        const std::string exe = executable->string();
        const std::string workdir = options.working_dir.string();

        // Everything the child touches is prepared before fork().
        std::vector<std::string> env_strings = build_environment(options, path);
        std::vector<char*> envp;
        for (auto& entry : env_strings) envp.push_back(entry.data());
        envp.push_back(nullptr);

        std::vector<std::string> args = options.argv;
        std::vector<char*> argvp;
        for (auto& arg : args) argvp.push_back(arg.data());
        argvp.push_back(nullptr);

        int out_pipe[2];
        if (pipe2(out_pipe, O_CLOEXEC) != 0) {
            log::error("pipe2 failed: " + std::string(std::strerror(errno)));
            return std::unexpected(SpawnError::PipeFailed);
        }
        int err_pipe[2];
        if (pipe2(err_pipe, O_CLOEXEC) != 0) {
            log::error("pipe2 failed: " + std::string(std::strerror(errno)));
            close(out_pipe[0]);
            close(out_pipe[1]);
            return std::unexpected(SpawnError::PipeFailed);
        }

        const pid_t parent = getpid();
        const pid_t pid = fork();
        if (pid < 0) {
            log::error("fork failed: " + std::string(std::strerror(errno)));
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(err_pipe[0]);
            close(err_pipe[1]);
            return std::unexpected(SpawnError::ForkFailed);
        }

        if (pid == 0) {
            setpgid(0, 0);
            prctl(PR_SET_PDEATHSIG, SIGTERM);
            if (getppid() != parent) {
                _exit(127);
            }

            sigset_t empty;
            sigemptyset(&empty);
            sigprocmask(SIG_SETMASK, &empty, nullptr);
            struct sigaction dfl {};
            dfl.sa_handler = SIG_DFL;
            sigaction(SIGPIPE, &dfl, nullptr);

            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
            }
            if (dup2(out_pipe[1], STDOUT_FILENO) < 0 || dup2(out_pipe[1], STDERR_FILENO) < 0) {
                report_child_failure(err_pipe[1]);
            }
            if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
                report_child_failure(err_pipe[1]);
            }
            execve(exe.c_str(), argvp.data(), envp.data());
            report_child_failure(err_pipe[1]);
        }

        // Also done in the child; whichever runs first wins.
        if (setpgid(pid, pid) != 0 && errno != EACCES) {
            log::debug("setpgid failed for " + std::to_string(pid) + ": " + std::strerror(errno));
        }
        close(out_pipe[1]);
        close(err_pipe[1]);

        int child_errno = 0;
        ssize_t n;
        do {
            n = read(err_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close(err_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            close(out_pipe[0]);
            int status = 0;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            log::error("Could not execute " + exe + ": " + std::strerror(child_errno));
            return std::unexpected(SpawnError::ExecFailed);
        }

        int flags = fcntl(out_pipe[0], F_GETFL);
        fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);

        log::debug("Started " + exe + " (pid " + std::to_string(pid) + ")");
        return std::make_unique<Subprocess>(Token{}, pid, out_pipe[0]);
    }

    Subprocess::Subprocess(Token, pid_t pid, int output_fd) : m_pid(pid), m_fd(output_fd) {}

    Subprocess::~Subprocess() {
        if (!try_wait()) {
            terminate(std::chrono::milliseconds(1000));
        }
        close_output();
    }

    void Subprocess::close_output() {
        if (m_fd >= 0) {
            close(m_fd);
            m_fd = -1;
        }
    }

    bool Subprocess::fill_buffer() {
        bool got_data = false;
        char chunk[4096];
        while (m_fd >= 0) {
            const ssize_t n = read(m_fd, chunk, sizeof(chunk));
            if (n > 0) {
                m_buffer.append(chunk, static_cast<std::size_t>(n));
                got_data = true;
                continue;
            }
            if (n == 0) {
                m_eof = true;
                close_output();
                break;
            }
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;

            log::debug("Read from pid " + std::to_string(m_pid) + " failed: " + std::strerror(errno));
            m_eof = true;
            close_output();
            break;
        }
        return got_data;
    }

    std::optional<std::string> Subprocess::pop_line() {
        auto pos = m_buffer.find_first_of("\r\n");
        while (pos != std::string::npos) {
            std::string line = m_buffer.substr(0, pos);
            m_buffer.erase(0, pos + 1);
            if (!line.empty()) {
                return line;
            }
            pos = m_buffer.find_first_of("\r\n");
        }
        if (m_eof && !m_buffer.empty()) {
            std::string rest;
            rest.swap(m_buffer);
            return rest;
        }
        return std::nullopt;
    }

    ReadResult Subprocess::read_line(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (auto line = pop_line()) {
                return {ReadStatus::Line, std::move(*line)};
            }

            if (m_eof) {
                if (try_wait()) {
                    return {ReadStatus::Eof, {}};
                }
            } else if (try_wait()) {
                // Descendants may keep the pipe open; take what is there and stop.
                fill_buffer();
                m_eof = true;
                close_output();
                continue;
            } else {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now());
                const auto slice = std::clamp(remaining, std::chrono::milliseconds(0), std::chrono::milliseconds(100));
                pollfd pfd{m_fd, POLLIN, 0};
                const int rc = poll(&pfd, 1, static_cast<int>(slice.count()));
                if (rc < 0 && errno != EINTR) {
                    log::debug("poll failed: " + std::string(std::strerror(errno)));
                    m_eof = true;
                    close_output();
                    continue;
                }
                if (rc > 0) {
                    fill_buffer();
                    continue;
                }
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                return {ReadStatus::Timeout, {}};
            }
            if (m_eof) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    }

    std::optional<int> Subprocess::try_wait() {
        if (m_exit_code) {
            return m_exit_code;
        }
        int status = 0;
        const pid_t r = waitpid(m_pid, &status, WNOHANG);
        if (r == m_pid) {
            m_exit_code = decode_wait_status(status);
        } else if (r < 0 && errno == ECHILD) {
            m_exit_code = -1;
        }
        return m_exit_code;
    }

    int Subprocess::wait() {
        if (m_exit_code) {
            return *m_exit_code;
        }
        int status = 0;
        pid_t r;
        do {
            r = waitpid(m_pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        m_exit_code = (r == m_pid) ? decode_wait_status(status) : -1;
        return *m_exit_code;
    }

    int Subprocess::terminate(std::chrono::milliseconds grace) {
        if (auto code = try_wait()) {
            close_output();
            return *code;
        }

        log::debug("Sending SIGTERM to process group " + std::to_string(m_pid));
        kill(-m_pid, SIGTERM);

        const auto deadline = std::chrono::steady_clock::now() + grace;
        while (std::chrono::steady_clock::now() < deadline) {
            if (try_wait()) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        if (!m_exit_code) {
            log::warn("Process " + std::to_string(m_pid) + " ignored SIGTERM, sending SIGKILL.");
            kill(-m_pid, SIGKILL);
            wait();
        } else {
            // The leader is gone; take down whatever it left in the group.
            kill(-m_pid, SIGKILL);
        }
        close_output();
        return *m_exit_code;
    }

    std::expected<CommandOutput, SpawnError> run_command(const SpawnOptions& options, std::chrono::milliseconds timeout) {
        auto spawned = Subprocess::spawn(options);
        if (!spawned) {
            return std::unexpected(spawned.error());
        }
        auto& proc = *spawned;

        CommandOutput result;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
            auto read = proc->read_line(std::max(remaining, std::chrono::milliseconds(0)));
            if (read.status == ReadStatus::Line) {
                if (!result.output.empty()) result.output += '\n';
                result.output += read.line;
            } else if (read.status == ReadStatus::Eof) {
                break;
            } else {
                log::debug("'" + options.argv[0] + "' timed out after " + std::to_string(timeout.count()) + " ms");
                result.timed_out = true;
                result.exit_code = proc->terminate(std::chrono::milliseconds(500));
                return result;
            }
        }
        result.exit_code = proc->wait();
        return result;
    }

} // namespace shelf
