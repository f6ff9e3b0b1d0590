//
// Created by cv2 on 10/12/25.
//

#pragma once

#include "libshelf/config.h"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shelf {

    struct ToolAvailability {
        std::string name;
        bool installed = false;
        std::optional<std::string> version;
        std::string resolution_hint;
        std::optional<std::filesystem::path> path;
    };

    // How a tool is found and asked for its version.
    struct ToolSpec {
        std::string name;
        std::vector<std::string> executables;   // tried in order, the first hit wins
        std::vector<std::string> version_args;
        bool presence_only = false;             // no reliable version flag, being on the path is enough
        std::string hint;
    };

    class ToolProbe {
    public:
        explicit ToolProbe(const Config& config);
        virtual ~ToolProbe();

        ToolProbe(const ToolProbe&) = delete;
        ToolProbe& operator=(const ToolProbe&) = delete;

        // Cached until refresh(). Never throws, never changes the system.
        virtual ToolAvailability probe(const std::string& name);
        std::map<std::string, ToolAvailability> probe_all(const std::vector<std::string>& names);
        void refresh();

        std::optional<std::filesystem::path> locate(const std::string& name) const;
        std::string hint_for(const std::string& name) const;

        const Config& config() const;

        static ToolSpec spec_for(const std::string& name);
        static std::vector<std::string> known_tools();

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

} // namespace shelf
