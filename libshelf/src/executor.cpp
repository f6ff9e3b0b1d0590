//
// Created by cv2 on 10/13/25.
//

#include "libshelf/executor.h"
#include "libshelf/archive.h"
#include "libshelf/command_plan.h"
#include "libshelf/eta_tracker.h"
#include "libshelf/logging.h"
#include "libshelf/progress_parser.h"
#include "libshelf/subprocess.h"
#include "libshelf/tool_probe.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <deque>

namespace shelf {

    // Scratch directory for one operation, removed on scope exit.
    class WorkDirectory {
    public:
        WorkDirectory(const std::filesystem::path& parent, OperationId id) {
            std::filesystem::create_directories(parent);
            std::string pattern = (parent / ("shelf-op-" + std::to_string(id) + "-XXXXXX")).string();
            if (mkdtemp(pattern.data()) == nullptr) {
                throw ShelfException(OperationError::ExecutionFailed,
                                     "Could not create a work directory in " + parent.string() + ": " + std::strerror(errno));
            }
            m_path = std::filesystem::path(pattern);
            log::debug("Work directory: " + m_path.string());
        }

        ~WorkDirectory() {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
            if (ec) {
                log::warn("Could not remove work directory " + m_path.string() + ": " + ec.message());
            }
        }

        WorkDirectory(const WorkDirectory&) = delete;
        WorkDirectory& operator=(const WorkDirectory&) = delete;

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    static std::string join(const std::vector<std::string>& parts, const std::string& separator) {
        std::string joined;
        for (const auto& part : parts) {
            if (!joined.empty()) joined += separator;
            joined += part;
        }
        return joined;
    }

    static void replace_all(std::string& text, const std::string& from, const std::string& to) {
        std::size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos) {
            text.replace(pos, from.size(), to);
            pos += to.size();
        }
    }

    struct RunState {
        OperationId id = 0;
        const ProgressSink* sink = nullptr;
        std::stop_token stop;
        const AuthorizationHandle* authorization = nullptr;
        std::optional<WorkDirectory> workdir;
        std::optional<std::filesystem::path> artifact;
        std::size_t step_index = 0;
        std::size_t step_count = 1;
        int last_exit_code = -1;

        void emit(OperationProgress progress) const {
            if (sink && *sink) {
                progress.operation_id = id;
                (*sink)(std::move(progress));
            }
        }

        int overall_percent(double step_fraction) const {
            const double overall = (static_cast<double>(step_index) + std::clamp(step_fraction, 0.0, 1.0)) /
                                   static_cast<double>(step_count);
            return std::min(static_cast<int>(overall * 100.0), 99);
        }
    };

    struct OperationExecutor::Impl {
        Config config;
        ToolProbe& probe;
        EtaTracker* eta;
        ProgressParser parser;

        Impl(const Config& cfg, ToolProbe& p, EtaTracker* e)
            : config(cfg), probe(p), eta(e), parser(cfg.progress_patterns) {}

        void check_requirements(const CommandPlan& plan) const {
            std::vector<std::string> missing;
            for (const auto& group : plan.requirements) {
                const bool satisfied = std::any_of(group.begin(), group.end(),
                                                   [this](const std::string& tool) { return probe.probe(tool).installed; });
                if (!satisfied) {
                    missing.push_back(join(group, " or ") + " (install with: " + probe.hint_for(group.front()) + ")");
                }
            }
            if (!missing.empty()) {
                const std::string detail = "Missing required tools: " + join(missing, "; ");
                log::error(detail);
                throw ShelfException(OperationError::ToolMissing, detail);
            }
        }

        const std::filesystem::path& workdir_of(const RunState& state) const {
            if (!state.workdir) {
                throw ShelfException(OperationError::ExecutionFailed, "This step needs a work directory but none was created.");
            }
            return state.workdir->path();
        }

        const std::filesystem::path& artifact_of(RunState& state, const std::string& phase) const {
            if (state.artifact) {
                return *state.artifact;
            }
            std::vector<std::filesystem::path> candidates;
            std::error_code ec;
            for (auto it = std::filesystem::recursive_directory_iterator(workdir_of(state), ec);
                 !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
                if (it->is_regular_file() && it->path().filename().string().find(".pkg.tar") != std::string::npos) {
                    candidates.push_back(it->path());
                }
            }
            if (candidates.empty()) {
                throw ShelfException(OperationError::ExecutionFailed,
                                     "No package was produced in " + workdir_of(state).string());
            }
            std::sort(candidates.begin(), candidates.end());
            state.artifact = candidates.front();

            auto info = read_package_info(*state.artifact);
            OperationProgress progress;
            progress.phase = phase;
            progress.percent = state.overall_percent(0.0);
            if (info) {
                progress.message = "Package " + info->name + " " + info->version + " ready";
            } else {
                log::debug("Could not read .PKGINFO from " + state.artifact->string() + ": " + to_string(info.error()));
                progress.message = "Package " + state.artifact->filename().string() + " ready";
            }
            state.emit(std::move(progress));
            return *state.artifact;
        }

        std::vector<std::string> workdir_entries(const RunState& state) const {
            std::vector<std::string> entries;
            for (const auto& entry : std::filesystem::directory_iterator(workdir_of(state))) {
                entries.push_back(entry.path().string());
            }
            if (entries.empty()) {
                throw ShelfException(OperationError::ExecutionFailed, "Nothing was extracted into " + workdir_of(state).string());
            }
            std::sort(entries.begin(), entries.end());
            return entries;
        }

        std::string expand(const std::string& text, RunState& state, const std::string& phase) const {
            std::string result = text;
            if (result.find("{workdir}") != std::string::npos) {
                replace_all(result, "{workdir}", workdir_of(state).string());
            }
            if (result.find("{artifact}") != std::string::npos) {
                replace_all(result, "{artifact}", artifact_of(state, phase).string());
            }
            return result;
        }

        ResolvedCommand resolve(const Invocation& invocation, const CommandStep& step, RunState& state) const {
            auto path = probe.probe(invocation.tool).path;
            if (!path) {
                path = probe.locate(invocation.tool);
            }
            if (!path) {
                throw ShelfException(OperationError::ToolMissing, "Could not locate " + invocation.tool);
            }

            ResolvedCommand command;
            command.argv.push_back(path->string());
            for (const auto& arg : invocation.args) {
                if (arg == "{workdir_entries}") {
                    auto entries = workdir_entries(state);
                    command.argv.insert(command.argv.end(), entries.begin(), entries.end());
                } else {
                    command.argv.push_back(expand(arg, state, step.phase));
                }
            }
            if (!step.working_dir.empty()) {
                command.working_dir = expand(step.working_dir, state, step.phase);
            }
            command.elevation = step.elevation;
            command.agent_args = invocation.agent_args;
            command.agent_env = invocation.agent_env;
            return command;
        }

        std::optional<std::chrono::seconds> estimate_eta(std::optional<std::chrono::seconds> expected,
                                                         std::chrono::duration<double> elapsed, double fraction) const {
            if (expected) {
                const auto remaining = std::chrono::duration<double>(*expected) - elapsed;
                return std::chrono::seconds(static_cast<long long>(std::max(remaining.count(), 0.0)));
            }
            if (fraction > 0.0) {
                return std::chrono::seconds(static_cast<long long>(elapsed.count() * (1.0 - fraction) / fraction));
            }
            return std::nullopt;
        }

        // Runs one process to completion and returns its exit code.
        int run_process(const ResolvedCommand& command, const std::string& tool, RunState& state,
                        std::deque<std::string>& tail) const {
            WrappedCommand wrapped = state.authorization->wrap(command);
            log::debug("Running: " + join(wrapped.options.argv, " "));

            auto spawned = Subprocess::spawn(wrapped.options);
            if (!spawned) {
                throw ShelfException(OperationError::ExecutionFailed,
                                     "Could not start " + tool + ": " + to_string(spawned.error()));
            }
            auto& proc = *spawned;

            const std::string key = EtaTracker::make_key(command.argv);
            const std::size_t expected_lines = eta ? eta->estimate_total_lines(key) : EtaTracker::default_lines;
            const auto expected_duration = eta ? eta->estimate_duration(key) : std::nullopt;

            const auto started = std::chrono::steady_clock::now();
            auto last_output = started;
            std::size_t lines = 0;
            std::optional<int> terminal_status;

            while (true) {
                if (state.stop.stop_requested()) {
                    log::warn("Cancelling operation #" + std::to_string(state.id) + ", stopping " + tool + ".");
                    state.last_exit_code = proc->terminate(config.timeouts.grace_period);
                    throw ShelfException(OperationError::Cancelled, "Cancelled by user");
                }

                auto read = proc->read_line(std::chrono::milliseconds(100));
                const auto now = std::chrono::steady_clock::now();
                if (read.status == ReadStatus::Eof) {
                    break;
                }
                if (read.status == ReadStatus::Timeout) {
                    if (wrapped.status_file) {
                        // The terminal shows the output in its own window and waits for Enter
                        // afterwards, so silence says nothing. The status file decides.
                        terminal_status = AuthorizationHandle::read_exit_status(*wrapped.status_file);
                        if (terminal_status) {
                            break;
                        }
                        continue;
                    }
                    if (now - last_output >= config.timeouts.stall) {
                        log::error(tool + " produced no output for " + std::to_string(config.timeouts.stall.count()) +
                                   " seconds, terminating it.");
                        state.last_exit_code = proc->terminate(config.timeouts.grace_period);
                        throw ShelfException(OperationError::Timeout,
                                             tool + " made no progress for " + std::to_string(config.timeouts.stall.count()) + " seconds");
                    }
                    continue;
                }

                last_output = now;
                ++lines;
                ParsedLine parsed = parser.parse(read.line);
                if (parsed.message.empty()) {
                    continue;
                }
                tail.push_back(parsed.message);
                if (tail.size() > 20) {
                    tail.pop_front();
                }

                OperationProgress progress;
                progress.phase = parsed.phase;
                progress.message = parsed.message;
                progress.confidence = parsed.confidence;
                double fraction;
                if (parsed.percent) {
                    fraction = *parsed.percent / 100.0;
                } else {
                    fraction = std::min(static_cast<double>(lines) / static_cast<double>(expected_lines), 0.99);
                    progress.eta = estimate_eta(expected_duration, now - started, fraction);
                }
                progress.percent = state.overall_percent(fraction);
                state.emit(std::move(progress));
            }

            int code;
            if (terminal_status) {
                // Only the "Press Enter" prompt is left.
                const int session_code = proc->terminate(config.timeouts.grace_period);
                log::debug(tool + " finished in the terminal, session closed with " + std::to_string(session_code) + ".");
                code = *terminal_status;
            } else {
                code = proc->wait();
                if (wrapped.status_file) {
                    auto status = AuthorizationHandle::read_exit_status(*wrapped.status_file);
                    if (!status) {
                        state.last_exit_code = code;
                        throw ShelfException(OperationError::ExecutionFailed,
                                             "The terminal session closed before " + tool + " reported an exit status.");
                    }
                    code = *status;
                }
            }
            state.last_exit_code = code;

            // A stop that arrived while the tool was exiting still wins.
            if (state.stop.stop_requested()) {
                log::warn("Operation #" + std::to_string(state.id) + " was cancelled as " + tool + " exited.");
                throw ShelfException(OperationError::Cancelled, "Cancelled by user");
            }

            if (code == 0 && eta) {
                eta->record_completion(key, lines, std::chrono::steady_clock::now() - started);
            }
            return code;
        }

        void run_step(const CommandStep& step, RunState& state) const {
            std::vector<const Invocation*> present;
            for (const auto& alternative : step.alternatives) {
                if (probe.probe(alternative.tool).installed) {
                    present.push_back(&alternative);
                }
            }
            if (present.empty()) {
                throw ShelfException(OperationError::ToolMissing, "No tool available for the " + step.phase + " step");
            }
            if (!step.fallback_on_failure) {
                present.resize(1);
            }

            for (std::size_t k = 0; k < present.size(); ++k) {
                const Invocation& invocation = *present[k];

                OperationProgress start;
                start.phase = step.phase;
                start.percent = state.overall_percent(0.0);
                start.message = "Running " + invocation.tool;
                state.emit(std::move(start));

                std::deque<std::string> tail;
                const ResolvedCommand command = resolve(invocation, step, state);
                const int code = run_process(command, invocation.tool, state, tail);
                if (code == 0) {
                    return;
                }

                if (k + 1 < present.size()) {
                    log::warn(invocation.tool + " failed with exit code " + std::to_string(code) +
                              ", trying " + present[k + 1]->tool + ".");
                    continue;
                }

                std::vector<std::string> last_lines(tail.size() > 10 ? tail.end() - 10 : tail.begin(), tail.end());
                std::string detail = invocation.tool + " exited with code " + std::to_string(code);
                if (!last_lines.empty()) {
                    detail += ":\n" + join(last_lines, "\n");
                }
                throw ShelfException(OperationError::ExecutionFailed, detail);
            }
        }

        void run_plan(const OperationDescriptor& descriptor, RunState& state) const {
            auto plan = resolve_plan(descriptor, config);
            if (!plan) {
                throw ShelfException(OperationError::UnsupportedTarget,
                                     "Cannot " + to_string(descriptor.kind()) + " '" + descriptor.target() + "' (" +
                                     to_string(descriptor.backend()) + "): " + to_string(plan.error()));
            }

            check_requirements(*plan);

            if (state.stop.stop_requested()) {
                throw ShelfException(OperationError::Cancelled, "Cancelled by user");
            }
            if (plan->needs_workdir) {
                state.workdir.emplace(config.work_dir, state.id);
            }

            state.step_count = plan->steps.size();
            for (std::size_t i = 0; i < plan->steps.size(); ++i) {
                state.step_index = i;
                run_step(plan->steps[i], state);
            }
        }

        OperationResult run(OperationId id,
                            const OperationDescriptor& descriptor,
                            const AuthorizationHandle& authorization,
                            const ProgressSink& sink,
                            std::stop_token stop) const {
            log::info("Operation #" + std::to_string(id) + ": " + descriptor.describe());

            RunState state;
            state.id = id;
            state.sink = &sink;
            state.stop = std::move(stop);
            state.authorization = &authorization;

            try {
                run_plan(descriptor, state);
            } catch (const ShelfException& e) {
                if (e.get_error() == OperationError::Cancelled) {
                    log::warn("Operation #" + std::to_string(id) + " cancelled.");
                    return OperationResult::cancelled(id, e.what());
                }
                log::error("Operation #" + std::to_string(id) + " failed: " + e.what());
                return OperationResult::failure(id, e.get_error(), e.what(), state.last_exit_code);
            } catch (const std::exception& e) {
                // Filesystem errors and anything else a step throws end the operation, not the thread.
                log::error("Operation #" + std::to_string(id) + " failed: " + e.what());
                return OperationResult::failure(id, OperationError::ExecutionFailed, e.what(), state.last_exit_code);
            }

            OperationProgress done;
            done.phase = "done";
            done.percent = 100;
            done.message = "Finished " + descriptor.describe();
            state.emit(std::move(done));

            log::ok("Operation #" + std::to_string(id) + " finished.");
            return OperationResult::success(id, std::max(state.last_exit_code, 0));
        }
    };

    OperationExecutor::OperationExecutor(const Config& config, ToolProbe& probe, EtaTracker* eta)
        : pimpl(std::make_shared<Impl>(config, probe, eta)) {}

    OperationExecutor::~OperationExecutor() = default;

    OperationResult OperationExecutor::run(OperationId id,
                                           const OperationDescriptor& descriptor,
                                           const AuthorizationHandle& authorization,
                                           const ProgressSink& sink,
                                           std::stop_token stop) const {
        return pimpl->run(id, descriptor, authorization, sink, std::move(stop));
    }

    std::shared_ptr<OperationStream> OperationExecutor::execute(OperationId id,
                                                                OperationDescriptor descriptor,
                                                                AuthorizationHandle authorization) const {
        auto stream = std::make_shared<OperationStream>(id);
        OperationStream* events = stream.get();

        // The stream joins this thread before it is destroyed, so the raw pointer stays valid.
        // The worker shares the executor's state and may outlive the executor itself.
        std::jthread worker([impl = pimpl, events, id, descriptor = std::move(descriptor), authorization = std::move(authorization)]
                            (std::stop_token stop) {
            const ProgressSink sink = [events](OperationProgress progress) { events->push(std::move(progress)); };
            events->finish(impl->run(id, descriptor, authorization, sink, std::move(stop)));
        });
        stream->set_cancel_handler([source = worker.get_stop_source()]() mutable { source.request_stop(); });
        stream->adopt_worker(std::move(worker));
        return stream;
    }

} // namespace shelf
