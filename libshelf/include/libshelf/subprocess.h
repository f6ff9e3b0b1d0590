//
// Created by cv2 on 10/12/25.
//

#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace shelf {

    enum class SpawnError {
        EmptyCommand,
        NotFound,     // argv[0] is not on the search path
        PipeFailed,
        ForkFailed,
        ExecFailed
    };

    struct SpawnOptions {
        std::vector<std::string> argv;
        std::filesystem::path working_dir;         // empty: inherit
        std::map<std::string, std::string> env;    // added on top of the inherited environment
        std::string search_path;                   // PATH for lookup and for the child, empty: inherit
    };

    enum class ReadStatus {
        Line,
        Timeout,
        Eof
    };

    struct ReadResult {
        ReadStatus status;
        std::string line;
    };

    // A child process in its own process group, stdout and stderr merged into one pipe.
    class Subprocess {
        // Only spawn() can name this, so only spawn() can construct.
        struct Token {
            explicit Token() = default;
        };

    public:
        static std::expected<std::unique_ptr<Subprocess>, SpawnError> spawn(const SpawnOptions& options);

        Subprocess(Token, pid_t pid, int output_fd);
        ~Subprocess();
        Subprocess(const Subprocess&) = delete;
        Subprocess& operator=(const Subprocess&) = delete;

        pid_t pid() const { return m_pid; }

        // Next line of output; '\n' and '\r' both terminate a line, empty lines are skipped.
        // Eof once the output is drained and the child has exited.
        ReadResult read_line(std::chrono::milliseconds timeout);

        std::optional<int> try_wait();
        int wait();

        // SIGTERM to the process group, SIGKILL after `grace`. Returns the exit code.
        int terminate(std::chrono::milliseconds grace);

    private:
        bool fill_buffer();
        void close_output();
        std::optional<std::string> pop_line();

        pid_t m_pid;
        int m_fd;
        std::string m_buffer;
        bool m_eof = false;
        std::optional<int> m_exit_code;
    };

    struct CommandOutput {
        int exit_code = -1;
        std::string output;
        bool timed_out = false;
    };

    // Runs a short-lived command to completion and collects its output.
    std::expected<CommandOutput, SpawnError> run_command(const SpawnOptions& options, std::chrono::milliseconds timeout);

    // Looks `name` up in a ':'-separated search path. Names containing '/' are checked as-is.
    std::optional<std::filesystem::path> find_executable(const std::string& name, const std::string& search_path);

    std::string to_string(SpawnError error);

    // Converts a waitpid() status: exit status, or 128 + signal number.
    int decode_wait_status(int status);

} // namespace shelf
