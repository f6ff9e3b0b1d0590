//
// Created by cv2 on 10/13/25.
//

#include "libshelf/command_plan.h"
#include "libshelf/archive.h"
#include "libshelf/logging.h"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <optional>

namespace shelf {

    static const std::vector<std::string> fix_ids = {
        "clear-cache",
        "clean-cache",
        "prune-cache",
        "remove-orphans",
        "refresh-keyring",
        "remove-lock",
        "reset-failed-services",
        "refresh-mirrors",
    };

    const std::vector<std::string>& known_fix_ids() {
        return fix_ids;
    }

    // --- Step builders ---

    static Invocation invoke(std::string tool, std::vector<std::string> args) {
        Invocation invocation;
        invocation.tool = std::move(tool);
        invocation.args = std::move(args);
        return invocation;
    }

    static CommandStep step(std::string phase, Invocation invocation, Elevation elevation, std::string working_dir = {}) {
        CommandStep result;
        result.phase = std::move(phase);
        result.alternatives.push_back(std::move(invocation));
        result.elevation = elevation;
        result.working_dir = std::move(working_dir);
        return result;
    }

    static std::vector<std::string> concat(std::vector<std::string> head, const std::vector<std::string>& tail) {
        head.insert(head.end(), tail.begin(), tail.end());
        return head;
    }

    // One requirement group per step, made of the step's alternatives.
    static void derive_requirements(CommandPlan& plan) {
        for (const auto& s : plan.steps) {
            std::vector<std::string> group;
            for (const auto& alt : s.alternatives) {
                if (std::find(group.begin(), group.end(), alt.tool) == group.end()) {
                    group.push_back(alt.tool);
                }
            }
            if (!group.empty() && std::find(plan.requirements.begin(), plan.requirements.end(), group) == plan.requirements.end()) {
                plan.requirements.push_back(std::move(group));
            }
        }
    }

    // --- AUR helpers ---

    static Invocation aur_helper(const std::string& helper, std::vector<std::string> args) {
        Invocation invocation = invoke(helper, std::move(args));
        if (helper == "paru" || helper == "yay") {
            invocation.agent_args = {"--sudo", "pkexec"};
        }
        return invocation;
    }

    static std::vector<std::string> aur_install_args(const std::string& helper, const std::vector<std::string>& packages) {
        if (helper == "paru") {
            return concat({"-S", "--noconfirm", "--skipreview"}, packages);
        }
        if (helper == "yay") {
            return concat({"-S", "--noconfirm", "--answerdiff", "None", "--answerclean", "None"}, packages);
        }
        return concat({"-S", "--noconfirm"}, packages);
    }

    static CommandStep aur_step(const Config& config, const std::string& phase, Elevation elevation,
                                const std::function<std::vector<std::string>(const std::string&)>& args_for) {
        CommandStep result;
        result.phase = phase;
        result.elevation = elevation;
        for (const auto& helper : config.tools.aur_helpers) {
            result.alternatives.push_back(aur_helper(helper, args_for(helper)));
        }
        return result;
    }

    // --- Flatpak ---

    static std::vector<std::string> installation_flags(const std::string& installation) {
        if (installation.empty() || installation == "system") {
            return {};
        }
        if (installation == "user") {
            return {"--user"};
        }
        return {"--installation=" + installation};
    }

    static std::string argument_or(const OperationDescriptor& descriptor, std::size_t index, const std::string& fallback) {
        if (descriptor.arguments().size() > index && !descriptor.arguments()[index].empty()) {
            return descriptor.arguments()[index];
        }
        return fallback;
    }

    // --- Per-backend tables ---

    static std::expected<CommandPlan, PlanError> plan_repo(const OperationDescriptor& d) {
        CommandPlan plan;
        const auto packages = concat({d.target()}, d.arguments());
        switch (d.kind()) {
            case OperationKind::Install:
                plan.steps.push_back(step("installing", invoke("pacman", concat({"-S", "--noconfirm", "--needed"}, packages)), Elevation::Root));
                break;
            case OperationKind::Remove:
                plan.steps.push_back(step("removing", invoke("pacman", concat({"-Rns", "--noconfirm"}, packages)), Elevation::Root));
                break;
            case OperationKind::Update:
                plan.steps.push_back(step("upgrading", invoke("pacman", {"-Syu", "--noconfirm"}), Elevation::Root));
                break;
            case OperationKind::Search:
                plan.steps.push_back(step("searching", invoke("pacman", {"-Ss", d.target()}), Elevation::None));
                break;
            case OperationKind::ListInstalled:
                plan.steps.push_back(step("listing", invoke("pacman", {"-Q"}), Elevation::None));
                break;
            default:
                return std::unexpected(PlanError::UnsupportedKind);
        }
        return plan;
    }

    static std::expected<CommandPlan, PlanError> plan_aur(const OperationDescriptor& d, const Config& config) {
        CommandPlan plan;
        const auto packages = concat({d.target()}, d.arguments());
        switch (d.kind()) {
            case OperationKind::Install:
                plan.steps.push_back(aur_step(config, "building", Elevation::SelfElevating,
                                              [&packages](const std::string& helper) { return aur_install_args(helper, packages); }));
                break;
            case OperationKind::Remove:
                plan.steps.push_back(step("removing", invoke("pacman", concat({"-Rns", "--noconfirm"}, packages)), Elevation::Root));
                break;
            case OperationKind::Update:
                plan.steps.push_back(aur_step(config, "upgrading", Elevation::SelfElevating,
                                              [](const std::string&) { return std::vector<std::string>{"-Sua", "--noconfirm"}; }));
                break;
            case OperationKind::Search:
                plan.steps.push_back(aur_step(config, "searching", Elevation::None,
                                              [&d](const std::string&) { return std::vector<std::string>{"-Ss", "--aur", d.target()}; }));
                break;
            case OperationKind::ListInstalled:
                plan.steps.push_back(step("listing", invoke("pacman", {"-Qm"}), Elevation::None));
                break;
            default:
                return std::unexpected(PlanError::UnsupportedKind);
        }
        if (!plan.steps.empty() && plan.steps.front().alternatives.empty()) {
            log::error("No AUR helpers are configured.");
            return std::unexpected(PlanError::UnsupportedKind);
        }
        return plan;
    }

    static std::expected<CommandPlan, PlanError> plan_flatpak(const OperationDescriptor& d, const Config& config) {
        CommandPlan plan;
        const std::string installation = argument_or(d, 0, "");
        switch (d.kind()) {
            case OperationKind::Install:
                plan.steps.push_back(step("installing", invoke("flatpak",
                        concat(installation_flags(installation), {"install", "-y", config.flatpak_remote, d.target()})), Elevation::None));
                break;
            case OperationKind::Remove:
                plan.steps.push_back(step("removing", invoke("flatpak",
                        concat(installation_flags(installation), {"uninstall", "-y", d.target()})), Elevation::None));
                break;
            case OperationKind::Move: {
                if (d.arguments().empty()) {
                    return std::unexpected(PlanError::MissingArguments);
                }
                const std::string destination = d.arguments()[0];
                const std::string source = argument_or(d, 1, "system");
                if (destination == source) {
                    log::error("Source and destination installation are both '" + source + "'.");
                    return std::unexpected(PlanError::MissingArguments);
                }
                plan.steps.push_back(step("installing", invoke("flatpak",
                        concat(installation_flags(destination), {"install", "-y", config.flatpak_remote, d.target()})), Elevation::None));
                plan.steps.push_back(step("removing", invoke("flatpak",
                        concat(installation_flags(source), {"uninstall", "-y", d.target()})), Elevation::None));
                break;
            }
            case OperationKind::Update:
                plan.steps.push_back(step("upgrading", invoke("flatpak", {"update", "-y"}), Elevation::None));
                break;
            case OperationKind::Search:
                plan.steps.push_back(step("searching", invoke("flatpak", {"search", d.target()}), Elevation::None));
                break;
            case OperationKind::ListInstalled:
                plan.steps.push_back(step("listing", invoke("flatpak", {"list", "--app"}), Elevation::None));
                break;
            default:
                return std::unexpected(PlanError::UnsupportedKind);
        }
        return plan;
    }

    static std::expected<CommandPlan, PlanError> plan_snap(const OperationDescriptor& d) {
        CommandPlan plan;
        switch (d.kind()) {
            case OperationKind::Install:
                plan.steps.push_back(step("installing", invoke("snapd", {"install", d.target()}), Elevation::Root));
                break;
            case OperationKind::Remove:
                plan.steps.push_back(step("removing", invoke("snapd", {"remove", d.target()}), Elevation::Root));
                break;
            case OperationKind::Update:
                plan.steps.push_back(step("upgrading", invoke("snapd", {"refresh"}), Elevation::Root));
                break;
            case OperationKind::Search:
                plan.steps.push_back(step("searching", invoke("snapd", {"find", d.target()}), Elevation::None));
                break;
            case OperationKind::ListInstalled:
                plan.steps.push_back(step("listing", invoke("snapd", {"list"}), Elevation::None));
                break;
            default:
                return std::unexpected(PlanError::UnsupportedKind);
        }
        return plan;
    }

    // debtap converts against its own package database. Missing, empty or older than
    // the configured age means it has to be refreshed first.
    static bool debtap_database_stale(const ToolConfig& tools) {
        std::error_code ec;
        std::optional<std::filesystem::file_time_type> newest;
        for (auto it = std::filesystem::recursive_directory_iterator(tools.debtap_cache, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (!it->is_regular_file(entry_ec)) continue;
            const auto written = it->last_write_time(entry_ec);
            if (!entry_ec && (!newest || written > *newest)) {
                newest = written;
            }
        }
        if (!newest) {
            return true;
        }
        return std::filesystem::file_time_type::clock::now() - *newest > tools.debtap_max_age;
    }

    static CommandPlan plan_deb(const std::string& file, const Config& config) {
        CommandPlan plan;
        plan.needs_workdir = true;
        if (debtap_database_stale(config.tools)) {
            log::info("The debtap database in " + config.tools.debtap_cache.string() + " is missing or out of date, updating it first.");
            plan.steps.push_back(step("updating", invoke("debtap", {"-u"}), Elevation::Root));
        }
        plan.steps.push_back(step("converting", invoke("debtap", {"-Q", "-o", "{workdir}", file}), Elevation::None, "{workdir}"));
        plan.steps.push_back(step("installing", invoke("pacman", {"-U", "--noconfirm", "{artifact}"}), Elevation::Root));
        return plan;
    }

    static CommandPlan plan_rpm(const std::string& file) {
        CommandPlan plan;
        plan.needs_workdir = true;

        CommandStep extract;
        extract.phase = "extracting";
        extract.alternatives.push_back(invoke("rpmextract", {file}));
        extract.alternatives.push_back(invoke("bsdtar", {"-xf", file, "-C", "{workdir}"}));
        extract.fallback_on_failure = true;
        extract.working_dir = "{workdir}";
        plan.steps.push_back(std::move(extract));

        plan.steps.push_back(step("installing", invoke("cp", {"-r", "{workdir_entries}", "/"}), Elevation::Root, "{workdir}"));
        return plan;
    }

    static std::expected<CommandPlan, PlanError> plan_source_tarball(const std::string& file) {
        auto entries = list_entries(file);
        if (!entries) {
            log::warn("Cannot read source archive " + file + ": " + to_string(entries.error()));
            return std::unexpected(PlanError::UnsupportedFileType);
        }
        const std::string build_system = detect_build_system(*entries);
        if (build_system != "pkgbuild") {
            log::info("No PKGBUILD in " + file + (build_system.empty() ? "" : " (found " + build_system + ")") +
                      "; it has to be built by hand.");
            return std::unexpected(PlanError::UnsupportedFileType);
        }
        const std::string root = find_build_root(*entries, build_system).value_or("");

        CommandPlan plan;
        plan.needs_workdir = true;
        plan.steps.push_back(step("extracting", invoke("bsdtar", {"-xf", file, "-C", "{workdir}"}), Elevation::None));

        Invocation makepkg = invoke("makepkg", {"-si", "--noconfirm"});
        makepkg.agent_env["PACMAN_AUTH"] = "pkexec";
        plan.steps.push_back(step("building", std::move(makepkg), Elevation::SelfElevating,
                                  root.empty() ? "{workdir}" : "{workdir}/" + root));
        return plan;
    }

    static std::expected<CommandPlan, PlanError> plan_file(const OperationDescriptor& d, const Config& config) {
        std::error_code ec;
        const auto path = std::filesystem::absolute(d.target(), ec);
        if (ec || !std::filesystem::is_regular_file(path, ec)) {
            log::error("File not found: " + d.target());
            return std::unexpected(PlanError::FileNotFound);
        }
        const std::string file = path.string();
        const FileType type = detect_file_type(path);

        if (d.kind() == OperationKind::Convert) {
            if (type == FileType::Deb) return plan_deb(file, config);
            if (type == FileType::Rpm) return plan_rpm(file);
            return std::unexpected(PlanError::UnsupportedFileType);
        }
        if (d.kind() != OperationKind::Install) {
            return std::unexpected(PlanError::UnsupportedKind);
        }

        switch (type) {
            case FileType::Deb:
                return plan_deb(file, config);
            case FileType::Rpm:
                return plan_rpm(file);
            case FileType::PacmanPackage: {
                CommandPlan plan;
                plan.steps.push_back(step("installing", invoke("pacman", {"-U", "--noconfirm", file}), Elevation::Root));
                return plan;
            }
            case FileType::SourceTarball:
                return plan_source_tarball(file);
            case FileType::Flatpak: {
                CommandPlan plan;
                const bool is_ref = path.extension() == ".flatpakref";
                plan.steps.push_back(step("installing", invoke("flatpak",
                        {"install", "--user", "-y", is_ref ? "--from" : "--bundle", file}), Elevation::None));
                return plan;
            }
            case FileType::AppImage: {
                const char* home = std::getenv("HOME");
                if (!home) {
                    log::error("HOME is not set; cannot place the AppImage.");
                    return std::unexpected(PlanError::MissingArguments);
                }
                const auto destination = std::filesystem::path(home) / "Applications" / path.filename();
                CommandPlan plan;
                plan.steps.push_back(step("installing", invoke("install", {"-Dm755", file, destination.string()}), Elevation::None));
                return plan;
            }
            case FileType::Unknown:
                break;
        }
        return std::unexpected(PlanError::UnsupportedFileType);
    }

    static std::expected<CommandPlan, PlanError> plan_fix(const OperationDescriptor& d, const Config& config) {
        const std::string& id = d.target();
        CommandPlan plan;
        if (id == "clear-cache") {
            plan.steps.push_back(step("cleaning", invoke("pacman", {"-Scc", "--noconfirm"}), Elevation::Root));
        } else if (id == "clean-cache") {
            plan.steps.push_back(step("cleaning", invoke("pacman", {"-Sc", "--noconfirm"}), Elevation::Root));
        } else if (id == "prune-cache") {
            plan.steps.push_back(step("cleaning", invoke("paccache", {"-r"}), Elevation::Root));
        } else if (id == "remove-orphans") {
            if (d.arguments().empty()) {
                return std::unexpected(PlanError::MissingArguments);
            }
            plan.steps.push_back(step("removing", invoke("pacman", concat({"-Rns", "--noconfirm"}, d.arguments())), Elevation::Root));
        } else if (id == "refresh-keyring") {
            plan.steps.push_back(step("verifying", invoke("pacman-key", {"--init"}), Elevation::Root));
            plan.steps.push_back(step("verifying", invoke("pacman-key", {"--populate", "archlinux"}), Elevation::Root));
        } else if (id == "remove-lock") {
            plan.steps.push_back(step("removing", invoke("rm", {"-f", config.diagnostics.lock_file.string()}), Elevation::Root));
        } else if (id == "reset-failed-services") {
            plan.steps.push_back(step("resetting", invoke("systemctl", {"reset-failed"}), Elevation::Root));
        } else if (id == "refresh-mirrors") {
            plan.steps.push_back(step("downloading", invoke("reflector",
                    {"--latest", "20", "--protocol", "https", "--sort", "rate", "--save", "/etc/pacman.d/mirrorlist"}), Elevation::Root));
        } else {
            log::error("Unknown diagnostic fix '" + id + "'.");
            return std::unexpected(PlanError::UnknownFix);
        }
        return plan;
    }

    std::expected<CommandPlan, PlanError> resolve_plan(const OperationDescriptor& descriptor, const Config& config) {
        const bool needs_target = descriptor.kind() != OperationKind::Update && descriptor.kind() != OperationKind::ListInstalled;
        if (needs_target && descriptor.target().empty()) {
            return std::unexpected(PlanError::MissingTarget);
        }

        std::expected<CommandPlan, PlanError> plan = std::unexpected(PlanError::UnsupportedKind);
        if (descriptor.kind() == OperationKind::DiagnosticFix) {
            plan = plan_fix(descriptor, config);
        } else {
            switch (descriptor.backend()) {
                case SourceBackend::Repo: plan = plan_repo(descriptor); break;
                case SourceBackend::AUR: plan = plan_aur(descriptor, config); break;
                case SourceBackend::Flatpak: plan = plan_flatpak(descriptor, config); break;
                case SourceBackend::Snap: plan = plan_snap(descriptor); break;
                case SourceBackend::File: plan = plan_file(descriptor, config); break;
            }
        }

        if (plan) {
            derive_requirements(*plan);
        }
        return plan;
    }

    std::string to_string(PlanError error) {
        switch (error) {
            case PlanError::UnsupportedKind: return "this backend does not support the operation";
            case PlanError::UnsupportedFileType: return "this kind of file cannot be installed automatically";
            case PlanError::UnknownFix: return "unknown diagnostic fix";
            case PlanError::MissingTarget: return "no target was given";
            case PlanError::MissingArguments: return "the operation is missing required arguments";
            case PlanError::FileNotFound: return "the file does not exist";
        }
        return "unknown plan error";
    }

    std::string to_string(Elevation elevation) {
        switch (elevation) {
            case Elevation::None: return "none";
            case Elevation::Root: return "root";
            case Elevation::SelfElevating: return "self-elevating";
        }
        return "unknown";
    }

} // namespace shelf
