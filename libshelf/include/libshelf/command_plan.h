//
// Created by cv2 on 10/13/25.
//

#pragma once

#include "libshelf/config.h"
#include "libshelf/operation.h"

#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace shelf {

    // How a step gets its privileges.
    enum class Elevation {
        None,           // runs as the calling user
        Root,           // the whole command runs as root
        SelfElevating   // runs as the user and asks for root itself (AUR helpers, makepkg)
    };

    // One way of running a step. `tool` is the ToolProbe name, not a path.
    // Arguments may contain the placeholders {workdir}, {artifact} and {workdir_entries}.
    struct Invocation {
        std::string tool;
        std::vector<std::string> args;
        std::vector<std::string> agent_args;            // inserted after the program when a polkit agent is in use
        std::map<std::string, std::string> agent_env;   // added to the environment when a polkit agent is in use
    };

    struct CommandStep {
        std::string phase;
        std::vector<Invocation> alternatives;   // priority order
        bool fallback_on_failure = false;       // try the next present alternative if one fails
        Elevation elevation = Elevation::None;
        std::string working_dir;                // may contain {workdir}; empty inherits
    };

    struct CommandPlan {
        std::vector<CommandStep> steps;
        // Each group is satisfied by any one of its tools.
        std::vector<std::vector<std::string>> requirements;
        bool needs_workdir = false;
    };

    // A step invocation with placeholders resolved and argv[0] an absolute path.
    struct ResolvedCommand {
        std::vector<std::string> argv;
        Elevation elevation = Elevation::None;
        std::vector<std::string> agent_args;
        std::map<std::string, std::string> agent_env;
        std::filesystem::path working_dir;
    };

    enum class PlanError {
        UnsupportedKind,        // the backend has no such operation
        UnsupportedFileType,
        UnknownFix,
        MissingTarget,
        MissingArguments,
        FileNotFound
    };

    std::expected<CommandPlan, PlanError> resolve_plan(const OperationDescriptor& descriptor, const Config& config);

    // Diagnostic fix ids understood by resolve_plan.
    const std::vector<std::string>& known_fix_ids();

    std::string to_string(PlanError error);
    std::string to_string(Elevation elevation);

} // namespace shelf
