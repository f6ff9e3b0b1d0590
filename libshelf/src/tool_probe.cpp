//
// Created by cv2 on 10/12/25.
//

#include "libshelf/tool_probe.h"
#include "libshelf/logging.h"
#include "libshelf/subprocess.h"

#include <mutex>
#include <regex>

namespace shelf {

    static const std::vector<ToolSpec>& tool_table() {
        static const std::vector<ToolSpec> table = {
            {"pacman", {"pacman"}, {"--version"}, false, "pacman is part of the base system; reinstall it from the Arch installation medium"},
            {"paru", {"paru"}, {"--version"}, false, "git clone https://aur.archlinux.org/paru.git && cd paru && makepkg -si"},
            {"yay", {"yay"}, {"--version"}, false, "git clone https://aur.archlinux.org/yay.git && cd yay && makepkg -si"},
            {"flatpak", {"flatpak"}, {"--version"}, false, "sudo pacman -S flatpak"},
            {"snapd", {"snap"}, {"version"}, false, "paru -S snapd && sudo systemctl enable --now snapd.socket"},
            {"debtap", {"debtap"}, {}, true, "paru -S debtap && sudo debtap -u"},
            {"rpmextract", {"rpmextract.sh", "rpmextract"}, {}, true, "sudo pacman -S rpmextract"},
            {"bsdtar", {"bsdtar"}, {"--version"}, false, "sudo pacman -S libarchive"},
            {"reflector", {"reflector"}, {"--version"}, false, "sudo pacman -S reflector"},
            {"paccache", {"paccache"}, {}, true, "sudo pacman -S pacman-contrib"},
            {"pkexec", {"pkexec"}, {"--version"}, false, "sudo pacman -S polkit"},
            {"pkcheck", {"pkcheck"}, {"--version"}, false, "sudo pacman -S polkit"},
            {"sudo", {"sudo"}, {"--version"}, false, "su -c 'pacman -S sudo'"},
            {"makepkg", {"makepkg"}, {"--version"}, false, "sudo pacman -S base-devel"},
            {"pacman-key", {"pacman-key"}, {"--version"}, false, "sudo pacman -S pacman"},
            {"systemctl", {"systemctl"}, {"--version"}, false, "systemd is part of the base system"},
        };
        return table;
    }

    ToolSpec ToolProbe::spec_for(const std::string& name) {
        for (const auto& spec : tool_table()) {
            if (spec.name == name) {
                return spec;
            }
        }
        return {name, {name}, {"--version"}, false, "Install '" + name + "' with your package manager"};
    }

    std::vector<std::string> ToolProbe::known_tools() {
        std::vector<std::string> names;
        for (const auto& spec : tool_table()) {
            names.push_back(spec.name);
        }
        return names;
    }

    static std::optional<std::string> extract_version(const std::string& output) {
        static const std::regex version_re(R"((\d+(?:\.\d+)+[^\s,)]*))");
        std::smatch match;
        if (std::regex_search(output, match, version_re)) {
            return match[1].str();
        }
        auto first_line = output.substr(0, output.find('\n'));
        if (!first_line.empty()) {
            return first_line;
        }
        return std::nullopt;
    }

    struct ToolProbe::Impl {
        Config config;
        std::string search_path;
        mutable std::mutex cache_mutex;
        std::map<std::string, ToolAvailability> cache;

        explicit Impl(const Config& cfg) : config(cfg), search_path(cfg.search_path_string()) {}

        std::string hint_for(const std::string& name) const {
            auto it = config.tools.hints.find(name);
            if (it != config.tools.hints.end()) {
                return it->second;
            }
            return ToolProbe::spec_for(name).hint;
        }

        std::optional<std::filesystem::path> locate(const std::string& name) const {
            for (const auto& exe : ToolProbe::spec_for(name).executables) {
                if (auto found = find_executable(exe, search_path)) {
                    return found;
                }
            }
            return std::nullopt;
        }

        ToolAvailability inspect(const std::string& name) const {
            const ToolSpec spec = ToolProbe::spec_for(name);
            ToolAvailability availability;
            availability.name = name;
            availability.resolution_hint = hint_for(name);
            availability.path = locate(name);

            if (!availability.path) {
                log::debug("Tool '" + name + "' not found on the search path.");
                return availability;
            }
            if (spec.presence_only) {
                availability.installed = true;
                return availability;
            }

            SpawnOptions options;
            options.argv.push_back(availability.path->string());
            options.argv.insert(options.argv.end(), spec.version_args.begin(), spec.version_args.end());
            options.search_path = search_path;

            auto output = run_command(options, config.timeouts.probe);
            if (!output) {
                log::warn("Could not run '" + name + "' to query its version: " + to_string(output.error()));
                return availability;
            }
            if (output->timed_out) {
                log::warn("Version query for '" + name + "' timed out.");
                return availability;
            }
            if (output->exit_code != 0) {
                log::warn("'" + name + "' exited with " + std::to_string(output->exit_code) + " on version query.");
                return availability;
            }

            availability.installed = true;
            availability.version = extract_version(output->output);
            return availability;
        }
    };

    ToolProbe::ToolProbe(const Config& config) : pimpl(std::make_unique<Impl>(config)) {}

    ToolProbe::~ToolProbe() = default;

    ToolAvailability ToolProbe::probe(const std::string& name) {
        {
            std::lock_guard<std::mutex> lock(pimpl->cache_mutex);
            auto it = pimpl->cache.find(name);
            if (it != pimpl->cache.end()) {
                return it->second;
            }
        }

        // The version command runs unlocked; two racing probes of one tool store equal results.
        ToolAvailability availability = pimpl->inspect(name);

        std::lock_guard<std::mutex> lock(pimpl->cache_mutex);
        pimpl->cache.emplace(name, availability);
        return availability;
    }

    std::map<std::string, ToolAvailability> ToolProbe::probe_all(const std::vector<std::string>& names) {
        std::map<std::string, ToolAvailability> result;
        for (const auto& name : names) {
            log::progress("Probing " + name + "...");
            result.emplace(name, probe(name));
        }
        if (!names.empty()) {
            log::progress_ok();
        }
        return result;
    }

    void ToolProbe::refresh() {
        std::lock_guard<std::mutex> lock(pimpl->cache_mutex);
        pimpl->cache.clear();
        log::debug("Tool availability cache cleared.");
    }

    std::optional<std::filesystem::path> ToolProbe::locate(const std::string& name) const {
        return pimpl->locate(name);
    }

    std::string ToolProbe::hint_for(const std::string& name) const {
        return pimpl->hint_for(name);
    }

    const Config& ToolProbe::config() const {
        return pimpl->config;
    }

} // namespace shelf
