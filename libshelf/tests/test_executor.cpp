//
// Created by cv2 on 10/15/25.
//

#include "../include/libshelf/eta_tracker.h"
#include "../include/libshelf/executor.h"
#include "../include/libshelf/logging.h"
#include "../include/libshelf/tool_probe.h"
#include "test_helpers.h"
#include <algorithm>
#include <cassert>
#include <set>

// Reports every tool outside `present` as missing and counts the questions.
class FakeToolProbe : public shelf::ToolProbe {
public:
    FakeToolProbe(const shelf::Config& config, std::set<std::string> present)
        : shelf::ToolProbe(config), m_present(std::move(present)) {}

    shelf::ToolAvailability probe(const std::string& name) override {
        ++probes;
        shelf::ToolAvailability availability;
        availability.name = name;
        availability.installed = m_present.contains(name);
        availability.resolution_hint = hint_for(name);
        if (availability.installed) {
            availability.path = locate(name);
        }
        return availability;
    }

    int probes = 0;

private:
    std::set<std::string> m_present;
};

struct Recorder {
    std::vector<shelf::OperationProgress> events;
    shelf::ProgressSink sink() {
        return [this](shelf::OperationProgress progress) { events.push_back(std::move(progress)); };
    }
    bool saw_message(const std::string& text) const {
        return std::any_of(events.begin(), events.end(),
                           [&text](const auto& p) { return p.message.find(text) != std::string::npos; });
    }
};

bool work_dir_is_empty(const FakeToolbox& box) {
    return std::filesystem::is_empty(box.m_root / "work");
}

void test_repo_install_reports_progress() {
    shelf::log::info("Running test: Repo Install Progress...");
    FakeToolbox box("exec_install");
    box.add_tool("pacman",
                 "echo \"$@\" >> " + box.log_path("pacman").string() + "\n"
                 "echo 'resolving dependencies...'\n"
                 "echo ':: Retrieving packages...'\n"
                 "echo ' firefox-121.0 downloading 50%'\n"
                 "echo '(1/1) checking package integrity'\n"
                 "echo '(1/1) installing firefox'\n"
                 "echo 'some hook output'\n"
                 "exit 0");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::EtaTracker eta;
    shelf::OperationExecutor executor(config, probe, &eta);

    Recorder recorder;
    const auto sink = recorder.sink();
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor install(shelf::OperationKind::Install, "firefox", shelf::SourceBackend::Repo, true);
    auto result = executor.run(7, install, auth, sink, {});

    assert(result.succeeded());
    assert(result.operation_id == 7);
    assert(result.exit_code == 0);
    assert((box.read_log("pacman") == std::vector<std::string>{"-S --noconfirm --needed firefox"}));

    assert(recorder.events.size() >= 7);
    assert(recorder.events.front().message == "Running pacman");
    assert(recorder.events.back().phase == "done");
    assert(recorder.events.back().percent == 100);
    for (const auto& event : recorder.events) {
        assert(event.operation_id == 7);
        assert(event.percent && *event.percent >= 0 && *event.percent <= 100);
    }
    auto phase_of = [&recorder](const std::string& text) {
        for (const auto& event : recorder.events) {
            if (event.message.find(text) != std::string::npos) return event.phase;
        }
        return std::string();
    };
    assert(phase_of("resolving") == "resolving dependencies");
    assert(phase_of("Retrieving") == "downloading");
    assert(phase_of("integrity") == "verifying");
    assert(phase_of("(1/1) installing") == "installing");
    assert(phase_of("hook output") == "output");

    // the completed run feeds the estimate for the next one
    assert(eta.estimate_total_lines("pacman_-S") == 6);
    shelf::log::ok("Test Passed: Repo Install Progress");
}

void test_failure_keeps_output_tail() {
    shelf::log::info("Running test: Failure Detail...");
    FakeToolbox box("exec_failure");
    box.add_tool("pacman", "echo 'resolving dependencies...'\necho 'error: target not found: nosuchpkg'\nexit 3");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor install(shelf::OperationKind::Install, "nosuchpkg", shelf::SourceBackend::Repo, true);
    auto result = executor.run(1, install, auth, recorder.sink(), {});

    assert(result.status == shelf::OperationStatus::Failed);
    assert(result.error == shelf::OperationError::ExecutionFailed);
    assert(result.exit_code == 3);
    assert(result.error_detail->find("target not found: nosuchpkg") != std::string::npos);
    assert(recorder.events.back().phase != "done");
    shelf::log::ok("Test Passed: Failure Detail");
}

void test_precheck_short_circuits() {
    shelf::log::info("Running test: Pre-check Short Circuit...");
    FakeToolbox box("exec_precheck");
    box.add_logging_tool("pacman");
    box.add_logging_tool("debtap");
    const auto deb = box.write_file("chrome.deb", "!<arch>\n");
    const auto config = box.config();

    FakeToolProbe probe(config, {"pacman"});
    shelf::OperationExecutor executor(config, probe);

    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor convert(shelf::OperationKind::Convert, deb.string(), shelf::SourceBackend::File, true);
    auto result = executor.run(2, convert, auth, recorder.sink(), {});

    assert(result.status == shelf::OperationStatus::Failed);
    assert(result.error == shelf::OperationError::ToolMissing);
    assert(result.exit_code == -1);
    assert(result.error_detail->find("debtap") != std::string::npos);
    assert(result.error_detail->find("paru -S debtap") != std::string::npos);
    assert(probe.probes > 0);
    // nothing ran and nothing was reported
    assert(recorder.events.empty());
    assert(box.read_log("debtap").empty());
    assert(box.read_log("pacman").empty());
    assert(work_dir_is_empty(box));
    shelf::log::ok("Test Passed: Pre-check Short Circuit");
}

void test_rpm_without_extractors_fails() {
    shelf::log::info("Running test: RPM Without Extractors...");
    FakeToolbox box("exec_rpm_missing");
    box.add_logging_tool("rpmextract.sh");
    box.add_logging_tool("bsdtar");
    const auto rpm = box.write_file("app.rpm", "rpm payload");
    const auto config = box.config();

    FakeToolProbe probe(config, {"cp"});
    shelf::OperationExecutor executor(config, probe);

    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor convert(shelf::OperationKind::Convert, rpm.string(), shelf::SourceBackend::File, false);
    auto result = executor.run(3, convert, auth, recorder.sink(), {});

    assert(result.status == shelf::OperationStatus::Failed);
    assert(result.error == shelf::OperationError::ToolMissing);
    assert(result.error_detail->find("rpmextract") != std::string::npos);
    assert(result.error_detail->find("bsdtar") != std::string::npos);
    assert(recorder.events.empty());
    assert(box.read_log("rpmextract.sh").empty());
    assert(box.read_log("bsdtar").empty());
    shelf::log::ok("Test Passed: RPM Without Extractors");
}

void test_unsupported_target() {
    shelf::log::info("Running test: Unsupported Target...");
    FakeToolbox box("exec_unsupported");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor convert(shelf::OperationKind::Convert, "firefox", shelf::SourceBackend::Repo, true);
    auto result = executor.run(3, convert, auth, recorder.sink(), {});
    assert(result.error == shelf::OperationError::UnsupportedTarget);

    shelf::OperationDescriptor missing_file(shelf::OperationKind::Install, "/tmp/shelf_no_such_file.deb", shelf::SourceBackend::File, true);
    result = executor.run(4, missing_file, auth, recorder.sink(), {});
    assert(result.error == shelf::OperationError::UnsupportedTarget);

    shelf::OperationDescriptor unknown_fix(shelf::OperationKind::DiagnosticFix, "reinstall-everything", shelf::SourceBackend::Repo, true);
    result = executor.run(5, unknown_fix, auth, recorder.sink(), {});
    assert(result.error == shelf::OperationError::UnsupportedTarget);
    assert(recorder.events.empty());
    shelf::log::ok("Test Passed: Unsupported Target");
}

void test_rpm_extraction_falls_back() {
    shelf::log::info("Running test: RPM Fallback Chain...");
    FakeToolbox box("exec_rpm");
    box.add_tool("rpmextract.sh",
                 "echo \"$@\" >> " + box.log_path("rpmextract").string() + "\n"
                 "echo 'cpio: premature end of archive'\n"
                 "exit 1");
    // bsdtar -xf <file> -C <dir>
    box.add_tool("bsdtar",
                 "echo \"$@\" >> " + box.log_path("bsdtar").string() + "\n"
                 "mkdir -p \"$4/usr/bin\" && echo zoom > \"$4/usr/bin/zoom\"\n"
                 "echo 'extracting usr/bin/zoom'\n"
                 "exit 0");
    box.add_logging_tool("cp");
    const auto rpm = box.write_file("zoom.rpm", "rpm payload");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor convert(shelf::OperationKind::Convert, rpm.string(), shelf::SourceBackend::File, true);
    auto result = executor.run(6, convert, auth, recorder.sink(), {});

    assert(result.succeeded());
    assert((box.read_log("rpmextract") == std::vector<std::string>{rpm.string()}));
    const auto bsdtar_calls = box.read_log("bsdtar");
    assert(bsdtar_calls.size() == 1);
    assert(bsdtar_calls[0].starts_with("-xf " + rpm.string() + " -C " + (box.m_root / "work").string()));

    const auto cp_calls = box.read_log("cp");
    assert(cp_calls.size() == 1);
    assert(cp_calls[0].starts_with("-r " + (box.m_root / "work").string()));
    assert(cp_calls[0].find("/usr /") != std::string::npos);

    assert(recorder.saw_message("Running rpmextract"));
    assert(recorder.saw_message("Running bsdtar"));
    assert(recorder.saw_message("Running cp"));
    assert(work_dir_is_empty(box));
    shelf::log::ok("Test Passed: RPM Fallback Chain");
}

void test_deb_conversion_installs_artifact() {
    shelf::log::info("Running test: DEB Conversion...");
    FakeToolbox box("exec_deb");
    // debtap -Q -o <dir> <file>
    box.add_tool("debtap",
                 "echo 'converting package'\n"
                 "touch \"$3/chrome-120.0-1-x86_64.pkg.tar.zst\"\n"
                 "exit 0");
    box.add_logging_tool("pacman", 0, "(1/1) installing chrome");
    const auto deb = box.write_file("chrome.deb", "!<arch>\n");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor convert(shelf::OperationKind::Install, deb.string(), shelf::SourceBackend::File, true);
    auto result = executor.run(8, convert, auth, recorder.sink(), {});

    assert(result.succeeded());
    const auto pacman_calls = box.read_log("pacman");
    assert(pacman_calls.size() == 1);
    assert(pacman_calls[0].starts_with("-U --noconfirm " + (box.m_root / "work").string()));
    assert(pacman_calls[0].ends_with("chrome-120.0-1-x86_64.pkg.tar.zst"));
    assert(recorder.saw_message("ready"));
    assert(work_dir_is_empty(box));
    shelf::log::ok("Test Passed: DEB Conversion");
}

void test_cancel_within_grace_period() {
    shelf::log::info("Running test: Cancellation...");
    FakeToolbox box("exec_cancel");
    // ignores SIGTERM so only the kill after the grace period stops it
    box.add_tool("pacman", "trap '' TERM\necho 'resolving dependencies...'\nwhile true; do sleep 0.1; done");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    shelf::OperationDescriptor install(shelf::OperationKind::Install, "firefox", shelf::SourceBackend::Repo, true);
    auto stream = executor.execute(9, install, shelf::AuthorizationHandle::none(config.search_path_string()));

    // wait until the tool is actually talking
    bool running = false;
    while (!running) {
        auto event = stream->next_for(std::chrono::milliseconds(5000));
        assert(event.has_value());
        assert(std::holds_alternative<shelf::OperationProgress>(*event));
        running = std::get<shelf::OperationProgress>(*event).message.find("resolving") != std::string::npos;
    }

    const auto started = std::chrono::steady_clock::now();
    stream->cancel();
    auto result = stream->wait();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert(result.status == shelf::OperationStatus::Cancelled);
    assert(result.operation_id == 9);
    assert(elapsed < config.timeouts.grace_period + std::chrono::milliseconds(1500));
    // a second cancel after the result is a no-op
    stream->cancel();
    assert(stream->result()->status == shelf::OperationStatus::Cancelled);
    shelf::log::ok("Test Passed: Cancellation");
}

void test_stalled_tool_times_out() {
    shelf::log::info("Running test: Stall Timeout...");
    FakeToolbox box("exec_stall");
    box.add_tool("pacman", "sleep 30");
    auto config = box.config();
    config.timeouts.stall = std::chrono::seconds(1);
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor install(shelf::OperationKind::Install, "firefox", shelf::SourceBackend::Repo, true);
    const auto started = std::chrono::steady_clock::now();
    auto result = executor.run(10, install, auth, recorder.sink(), {});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert(result.status == shelf::OperationStatus::Failed);
    assert(result.error == shelf::OperationError::Timeout);
    assert(elapsed < std::chrono::seconds(5));
    shelf::log::ok("Test Passed: Stall Timeout");
}

void test_stop_before_start_runs_nothing() {
    shelf::log::info("Running test: Stop Before Start...");
    FakeToolbox box("exec_prestop");
    box.add_logging_tool("pacman");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    std::stop_source source;
    source.request_stop();
    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor install(shelf::OperationKind::Install, "firefox", shelf::SourceBackend::Repo, true);
    auto result = executor.run(11, install, auth, recorder.sink(), source.get_token());

    assert(result.status == shelf::OperationStatus::Cancelled);
    assert(box.read_log("pacman").empty());
    shelf::log::ok("Test Passed: Stop Before Start");
}

void test_stale_debtap_database_is_refreshed() {
    shelf::log::info("Running test: DEB Database Refresh...");
    FakeToolbox box("exec_debtap_update");
    box.add_tool("debtap",
                 "echo \"$@\" >> " + box.log_path("debtap").string() + "\n"
                 "if [ \"$1\" = \"-u\" ]; then echo 'updating database'; exit 0; fi\n"
                 "touch \"$3/chrome-120.0-1-x86_64.pkg.tar.zst\"\n"
                 "exit 0");
    box.add_logging_tool("pacman", 0, "(1/1) installing chrome");
    const auto deb = box.write_file("chrome.deb", "!<arch>\n");
    auto config = box.config();
    config.tools.debtap_cache = box.m_root / "never-updated";
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor install(shelf::OperationKind::Install, deb.string(), shelf::SourceBackend::File, true);
    auto result = executor.run(12, install, auth, recorder.sink(), {});

    assert(result.succeeded());
    const auto debtap_calls = box.read_log("debtap");
    assert(debtap_calls.size() == 2);
    assert(debtap_calls[0] == "-u");
    assert(debtap_calls[1].starts_with("-Q -o "));
    assert(box.read_log("pacman").size() == 1);
    assert(std::any_of(recorder.events.begin(), recorder.events.end(),
                       [](const auto& p) { return p.phase == "updating"; }));
    shelf::log::ok("Test Passed: DEB Database Refresh");
}

void test_oversized_counter_does_not_end_the_run() {
    shelf::log::info("Running test: Oversized Counter Output...");
    FakeToolbox box("exec_counter");
    box.add_tool("pacman", "echo '(99999999999999999999/3) installing foo'\necho '(1/1) installing foo'\nexit 0");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    Recorder recorder;
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor install(shelf::OperationKind::Install, "foo", shelf::SourceBackend::Repo, true);
    auto result = executor.run(13, install, auth, recorder.sink(), {});

    assert(result.succeeded());
    assert(recorder.saw_message("99999999999999999999/3"));
    assert(recorder.events.back().phase == "done");
    shelf::log::ok("Test Passed: Oversized Counter Output");
}

void test_stop_while_tool_exits_is_cancelled() {
    shelf::log::info("Running test: Stop At Exit...");
    FakeToolbox box("exec_stop_at_exit");
    box.add_tool("pacman", "echo 'resolving dependencies...'\necho 'last line'\nexit 0");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::OperationExecutor executor(config, probe);

    // the stop arrives with the tool's final line, right before it exits successfully
    std::stop_source source;
    Recorder recorder;
    const shelf::ProgressSink sink = [&](shelf::OperationProgress progress) {
        if (progress.message == "last line") source.request_stop();
        recorder.events.push_back(std::move(progress));
    };
    auto auth = shelf::AuthorizationHandle::none(config.search_path_string());
    shelf::OperationDescriptor install(shelf::OperationKind::Install, "firefox", shelf::SourceBackend::Repo, true);
    auto result = executor.run(14, install, auth, sink, source.get_token());

    assert(result.status == shelf::OperationStatus::Cancelled);
    assert(recorder.events.back().phase != "done");
    shelf::log::ok("Test Passed: Stop At Exit");
}

void test_stream_outlives_executor() {
    shelf::log::info("Running test: Stream Outlives Executor...");
    FakeToolbox box("exec_outlive");
    box.add_tool("pacman", "echo 'resolving dependencies...'\nsleep 1\necho '(1/1) installing firefox'\nexit 0");
    const auto config = box.config();
    shelf::ToolProbe probe(config);

    std::shared_ptr<shelf::OperationStream> stream;
    {
        shelf::OperationExecutor executor(config, probe);
        shelf::OperationDescriptor install(shelf::OperationKind::Install, "firefox", shelf::SourceBackend::Repo, true);
        stream = executor.execute(15, install, shelf::AuthorizationHandle::none(config.search_path_string()));
    }

    auto result = stream->wait();
    assert(result.succeeded());
    assert(result.operation_id == 15);
    shelf::log::ok("Test Passed: Stream Outlives Executor");
}

int main() {
    try {
        test_repo_install_reports_progress();
        test_failure_keeps_output_tail();
        test_precheck_short_circuits();
        test_unsupported_target();
        test_rpm_extraction_falls_back();
        test_rpm_without_extractors_fails();
        test_deb_conversion_installs_artifact();
        test_cancel_within_grace_period();
        test_stalled_tool_times_out();
        test_stop_before_start_runs_nothing();
        test_stale_debtap_database_is_refreshed();
        test_oversized_counter_does_not_end_the_run();
        test_stop_while_tool_exits_is_cancelled();
        test_stream_outlives_executor();
    } catch (const std::exception& e) {
        shelf::log::error(std::string("An executor test failed: ") + e.what());
        return 1;
    }

    shelf::log::ok("All executor tests completed successfully!");
    return 0;
}
