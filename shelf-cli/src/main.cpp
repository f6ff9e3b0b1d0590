//
// Created by cv2 on 10/15/25.
//

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "ui_helpers.h"
#include <libshelf/archive.h>
#include <libshelf/aur_client.h>
#include <libshelf/command_plan.h>
#include <libshelf/config.h>
#include <libshelf/diagnostics.h>
#include <libshelf/eta_tracker.h>
#include <libshelf/executor.h>
#include <libshelf/logging.h>
#include <libshelf/operation_queue.h>
#include <libshelf/privilege.h>
#include <libshelf/tool_probe.h>

namespace {

    std::atomic<bool> interrupted{false};

    void handle_interrupt(int) {
        interrupted.store(true);
    }

    // Everything an operation needs, built once per invocation.
    struct Session {
        explicit Session(const shelf::Config& cfg)
            : config(cfg), probe(config), broker(config, probe), executor(config, probe, &eta), queue(broker, executor) {}

        shelf::Config config;
        shelf::ToolProbe probe;
        shelf::EtaTracker eta;
        shelf::PrivilegeBroker broker;
        shelf::OperationExecutor executor;
        shelf::OperationQueue queue; // last: joins its workers before the rest goes away
    };

}

void print_usage() {
    std::cerr << "Usage: shelf [options] <command> [args...]\n\n"
              << "Commands:\n"
              << "  probe [tool...]          Show which package tools are installed\n"
              << "  install <target>...      Install packages, or local files with --backend file\n"
              << "  remove <target>...       Remove packages\n"
              << "  convert <file>           Convert and install a .deb or .rpm\n"
              << "  move <app>               Move a flatpak app (--arg <to> --arg <from>)\n"
              << "  update                   Update everything the backend manages\n"
              << "  search <query>           Search the backend (AUR RPC with --aur)\n"
              << "  list                     List installed packages\n"
              << "  diagnose                 Run system health checks (--fix to apply fixes)\n"
              << "  fix <id> [arg...]        Apply one diagnostic fix\n"
              << "  inspect <file>           Show what a local file is and what it needs\n";
}

// Whether an operation goes through the PrivilegeBroker.
bool needs_privilege(shelf::OperationKind kind, shelf::SourceBackend backend, const std::string& target) {
    if (!shelf::mutates_package_state(kind)) return false;
    if (kind == shelf::OperationKind::DiagnosticFix) return true;
    if (backend == shelf::SourceBackend::Flatpak) return false;
    if (backend == shelf::SourceBackend::File) {
        const auto type = shelf::detect_file_type(target);
        return type != shelf::FileType::AppImage && type != shelf::FileType::Flatpak;
    }
    return true;
}

// Follows one operation's stream to its result. Ctrl-C cancels it.
int follow(shelf::OperationQueue& queue, const shelf::Submission& submission) {
    bool cancel_sent = false;
    while (true) {
        if (interrupted.load() && !cancel_sent) {
            ui::warning("Interrupted, cancelling...");
            auto cancelled = queue.cancel(submission.id);
            if (!cancelled) {
                shelf::log::debug("Cancel of operation " + std::to_string(submission.id) + ": " + shelf::to_string(cancelled.error()));
            }
            cancel_sent = true;
        }

        auto event = submission.stream->next_for(std::chrono::milliseconds(200));
        if (!event) continue;
        if (const auto* progress = std::get_if<shelf::OperationProgress>(&*event)) {
            ui::print_progress(*progress);
            continue;
        }

        const auto& result = std::get<shelf::OperationResult>(*event);
        switch (result.status) {
            case shelf::OperationStatus::Success:
                ui::header("Done.");
                return 0;
            case shelf::OperationStatus::Cancelled:
                ui::warning(result.error_detail.value_or("Cancelled"));
                return 130;
            case shelf::OperationStatus::Failed:
                ui::error(shelf::to_string(result.error.value_or(shelf::OperationError::ExecutionFailed)) +
                          (result.error_detail ? ": " + *result.error_detail : ""));
                return result.exit_code > 0 ? result.exit_code : 1;
        }
    }
}

int run_operation(Session& session, shelf::OperationKind kind, shelf::SourceBackend backend,
                  const std::string& target, const std::vector<std::string>& arguments) {
    shelf::OperationDescriptor descriptor(kind, target, backend, needs_privilege(kind, backend, target), arguments);
    ui::action(descriptor.describe());
    auto submission = session.queue.enqueue(std::move(descriptor));
    return follow(session.queue, submission);
}

int do_probe(Session& session, std::vector<std::string> tools) {
    if (tools.empty()) tools = shelf::ToolProbe::known_tools();
    ui::action("Probing package tools...");
    for (const auto& [name, availability] : session.probe.probe_all(tools)) {
        if (availability.installed) {
            ui::item(name + " " + availability.version.value_or("(present)") +
                     (availability.path ? "  " + availability.path->string() : ""));
        } else {
            ui::warning(name + " is missing, install with: " + availability.resolution_hint);
        }
    }
    return 0;
}

int do_inspect(Session& session, const std::string& file) {
    const auto analysis = shelf::analyze_file(file, session.probe);
    ui::header(analysis.path.string());
    ui::item("type: " + shelf::to_string(analysis.type));
    ui::item("size: " + std::to_string(analysis.size) + " bytes");
    if (!analysis.build_system.empty()) ui::item("build system: " + analysis.build_system);
    if (analysis.build_root) ui::item("build root: " + *analysis.build_root);
    for (const auto& missing : analysis.missing_tools) {
        ui::warning("missing tool: " + missing);
    }
    ui::item("suggested: " + analysis.suggested_action);

    if (analysis.type == shelf::FileType::PacmanPackage) {
        if (auto info = shelf::read_package_info(file)) {
            ui::item("package: " + info->name + " " + info->version + " (" + info->arch + ")");
            if (!info->description.empty()) ui::item(info->description);
        }
    }
    return analysis.type == shelf::FileType::Unknown ? 1 : 0;
}

int do_aur_search(Session& session, const std::string& query) {
    shelf::AurClient client(session.config.aur);
    auto packages = client.search(query);
    if (!packages) {
        ui::error(shelf::to_string(packages.error()));
        return 1;
    }
    if (packages->empty()) {
        ui::header("No AUR packages match '" + query + "'.");
        return 0;
    }
    for (const auto& pkg : *packages) {
        std::string line = pkg.name + " " + pkg.version + " [" + std::to_string(pkg.votes) + " votes]";
        if (pkg.out_of_date) line += " (out of date)";
        if (pkg.maintainer.empty()) line += " (orphaned)";
        ui::item(line);
        if (!pkg.description.empty()) std::cout << "     " << pkg.description << std::endl;
    }
    return 0;
}

int do_diagnose(Session& session, bool apply_fixes) {
    shelf::DiagnosticsEngine engine(session.config, session.probe);
    const auto checks = engine.run_checks();

    ui::header("System health:");
    int worst = 0;
    for (const auto& check : checks) {
        ui::print_check(check);
        if (check.status == shelf::CheckStatus::Warning) worst = std::max(worst, 1);
        if (check.status == shelf::CheckStatus::Critical) worst = 2;
    }
    if (!apply_fixes) {
        return worst == 2 ? 1 : 0;
    }

    int status = 0;
    for (const auto& check : checks) {
        if (!check.remediation) continue;
        if (!ui::confirm(check.remediation_label + "?")) continue;
        ui::action(check.remediation_label);
        auto submission = session.queue.enqueue(*check.remediation);
        if (follow(session.queue, submission) != 0) status = 1;
    }
    return status;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("shelf", "Runs package operations through the system's package tools");
    options.add_options()
            ("c,config", "Configuration file", cxxopts::value<std::string>()->default_value("/etc/shelf/shelf.yaml"))
            ("b,backend", "repo, aur, flatpak, snap or file", cxxopts::value<std::string>()->default_value("repo"))
            ("a,arg", "Extra argument for the operation", cxxopts::value<std::vector<std::string>>())
            ("aur", "Search the AUR web interface", cxxopts::value<bool>()->default_value("false"))
            ("fix", "Offer the fixes diagnose finds", cxxopts::value<bool>()->default_value("false"))
            ("eta-file", "Where progress estimates are kept", cxxopts::value<std::string>()->default_value(""))
            ("v,verbose", "Print debug output", cxxopts::value<bool>()->default_value("false"))
            ("h,help", "Show this help")
            ("command", "Command", cxxopts::value<std::string>())
            ("args", "Command arguments", cxxopts::value<std::vector<std::string>>());
    options.parse_positional({"command", "args"});

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        ui::error(e.what());
        print_usage();
        return 1;
    }
    const cxxopts::ParseResult& result = *parsed;

    if (result.count("help") || !result.count("command")) {
        std::cout << options.help() << std::endl;
        print_usage();
        return result.count("help") ? 0 : 1;
    }

    shelf::log::set_verbose(result["verbose"].as<bool>());

    auto config = shelf::Config::load(result["config"].as<std::string>());
    if (!config) {
        ui::error("Could not load " + result["config"].as<std::string>() + ": " + shelf::to_string(config.error()));
        return 1;
    }

    const auto backend = shelf::backend_from_string(result["backend"].as<std::string>());
    if (!backend) {
        ui::error("Unknown backend '" + result["backend"].as<std::string>() + "'.");
        return 1;
    }

    const std::string command = result["command"].as<std::string>();
    std::vector<std::string> args;
    if (result.count("args")) args = result["args"].as<std::vector<std::string>>();
    std::vector<std::string> extra;
    if (result.count("arg")) extra = result["arg"].as<std::vector<std::string>>();

    std::signal(SIGINT, handle_interrupt);

    Session session(*config);
    const std::string eta_file = result["eta-file"].as<std::string>();
    if (!eta_file.empty() && !session.eta.load(eta_file)) {
        shelf::log::debug("No progress estimates loaded from " + eta_file);
    }

    int status = 0;
    if (command == "probe") {
        status = do_probe(session, args);
    } else if (command == "install" || command == "remove") {
        if (args.empty()) { print_usage(); return 1; }
        const auto kind = command == "install" ? shelf::OperationKind::Install : shelf::OperationKind::Remove;
        for (const auto& target : args) {
            status = run_operation(session, kind, *backend, target, extra);
            if (status != 0 || interrupted.load()) break;
        }
    } else if (command == "convert") {
        if (args.size() != 1) { print_usage(); return 1; }
        status = run_operation(session, shelf::OperationKind::Convert, shelf::SourceBackend::File, args[0], extra);
    } else if (command == "move") {
        if (args.size() != 1 || extra.empty()) { print_usage(); return 1; }
        status = run_operation(session, shelf::OperationKind::Move, shelf::SourceBackend::Flatpak, args[0], extra);
    } else if (command == "update") {
        status = run_operation(session, shelf::OperationKind::Update, *backend, "", extra);
    } else if (command == "search") {
        if (args.empty()) { print_usage(); return 1; }
        if (result["aur"].as<bool>()) {
            status = do_aur_search(session, args[0]);
        } else {
            status = run_operation(session, shelf::OperationKind::Search, *backend, args[0], extra);
        }
    } else if (command == "list") {
        status = run_operation(session, shelf::OperationKind::ListInstalled, *backend, "", extra);
    } else if (command == "diagnose") {
        status = do_diagnose(session, result["fix"].as<bool>());
    } else if (command == "fix") {
        if (args.empty()) { print_usage(); return 1; }
        auto submission = session.queue.enqueue(shelf::DiagnosticsEngine::fix_descriptor(
                args[0], std::vector<std::string>(args.begin() + 1, args.end())));
        ui::action("Applying fix " + args[0]);
        status = follow(session.queue, submission);
    } else if (command == "inspect") {
        if (args.size() != 1) { print_usage(); return 1; }
        status = do_inspect(session, args[0]);
    } else {
        ui::error("Unknown command: " + command);
        print_usage();
        return 1;
    }

    if (!eta_file.empty() && !session.eta.save(eta_file)) {
        ui::warning("Could not save progress estimates to " + eta_file);
    }
    return status;
}
