//
// Created by cv2 on 10/13/25.
//

#include "libshelf/archive.h"
#include "libshelf/logging.h"
#include "libshelf/tool_probe.h"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace shelf {

    // Helper to ensure archive structs are always freed
    struct ArchiveReadGuard {
        archive* a;
        explicit ArchiveReadGuard(archive* arch) : a(arch) {}
        ~ArchiveReadGuard() {
            if (a) {
                archive_read_free(a);
            }
        }
    };

    static std::string lowercase(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    static bool ends_with(const std::string& text, const std::string& suffix) {
        return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    static std::string normalize_entry(std::string entry) {
        while (entry.starts_with("./")) {
            entry.erase(0, 2);
        }
        while (!entry.empty() && entry.back() == '/') {
            entry.pop_back();
        }
        return entry;
    }

    FileType detect_file_type(const std::filesystem::path& path) {
        const std::string name = lowercase(path.filename().string());
        if (ends_with(name, ".deb")) return FileType::Deb;
        if (ends_with(name, ".rpm")) return FileType::Rpm;
        // Must be checked before the generic tarball suffixes.
        if (name.find(".pkg.tar") != std::string::npos) return FileType::PacmanPackage;
        for (const char* suffix : {".tar.gz", ".tgz", ".tar.zst", ".tar.xz", ".tar.bz2"}) {
            if (ends_with(name, suffix)) return FileType::SourceTarball;
        }
        if (ends_with(name, ".appimage")) return FileType::AppImage;
        if (ends_with(name, ".flatpak") || ends_with(name, ".flatpakref")) return FileType::Flatpak;
        return FileType::Unknown;
    }

    static archive* open_archive() {
        archive* a = archive_read_new();
        archive_read_support_filter_all(a);
        archive_read_support_format_all(a);
        return a;
    }

    std::expected<std::vector<std::string>, ArchiveError> list_entries(const std::filesystem::path& archive_path) {
        archive* a = open_archive();
        ArchiveReadGuard guard(a);

        if (archive_read_open_filename(a, archive_path.c_str(), 10240) != ARCHIVE_OK) {
            log::error("libarchive could not open file: " + std::string(archive_error_string(a)));
            return std::unexpected(ArchiveError::OpenFile);
        }

        std::vector<std::string> entries;
        archive_entry* entry;
        int rc;
        while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK || rc == ARCHIVE_WARN) {
            const char* name = archive_entry_pathname(entry);
            if (name) {
                auto normalized = normalize_entry(name);
                if (!normalized.empty()) {
                    entries.push_back(std::move(normalized));
                }
            }
            archive_read_data_skip(a);
        }

        if (rc != ARCHIVE_EOF) {
            log::error("libarchive read error: " + std::string(archive_error_string(a)));
            return std::unexpected(ArchiveError::ReadHeader);
        }
        return entries;
    }

    std::expected<std::string, ArchiveError> extract_single_file_to_memory(
            const std::filesystem::path& archive_path,
            const std::string& file_inside_archive)
    {
        archive* a = open_archive();
        ArchiveReadGuard guard(a);

        if (archive_read_open_filename(a, archive_path.c_str(), 10240) != ARCHIVE_OK) {
            log::error("libarchive could not open file: " + std::string(archive_error_string(a)));
            return std::unexpected(ArchiveError::OpenFile);
        }

        const std::string wanted = normalize_entry(file_inside_archive);
        archive_entry* entry;
        while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
            const char* name = archive_entry_pathname(entry);
            if (!name || normalize_entry(name) != wanted) {
                continue;
            }

            std::string content;
            char buffer[8192];
            la_ssize_t read_bytes;
            while ((read_bytes = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
                content.append(buffer, static_cast<std::size_t>(read_bytes));
            }
            if (read_bytes < 0) {
                log::error("libarchive failed to read data: " + std::string(archive_error_string(a)));
                return std::unexpected(ArchiveError::ReadData);
            }
            return content;
        }

        log::debug("File not found in archive: " + file_inside_archive);
        return std::unexpected(ArchiveError::EntryNotFound);
    }

    std::string detect_build_system(const std::vector<std::string>& entries) {
        std::vector<std::string> basenames;
        for (const auto& entry : entries) {
            basenames.push_back(lowercase(std::filesystem::path(entry).filename().string()));
        }
        for (const char* candidate : {"pkgbuild", "makefile", "configure", "install.sh"}) {
            if (std::find(basenames.begin(), basenames.end(), candidate) != basenames.end()) {
                return candidate;
            }
        }
        return {};
    }

    std::optional<std::string> find_build_root(const std::vector<std::string>& entries, const std::string& build_system) {
        if (build_system.empty()) {
            return std::nullopt;
        }
        std::optional<std::filesystem::path> best;
        std::size_t best_depth = 0;
        for (const auto& entry : entries) {
            const std::filesystem::path path(entry);
            if (lowercase(path.filename().string()) != build_system) continue;

            const std::size_t depth = static_cast<std::size_t>(std::distance(path.begin(), path.end()));
            if (!best || depth < best_depth) {
                best = path;
                best_depth = depth;
            }
        }
        if (!best) {
            return std::nullopt;
        }
        return best->parent_path().string();
    }

    PackageInfo parse_package_info(const std::string& content) {
        PackageInfo info;
        std::stringstream ss(content);
        std::string line;
        while (std::getline(ss, line)) {
            if (line.empty() || line[0] == '#') continue;
            const auto eq = line.find(" = ");
            if (eq == std::string::npos) continue;

            const std::string key = line.substr(0, eq);
            const std::string value = line.substr(eq + 3);
            if (key == "pkgname") info.name = value;
            else if (key == "pkgver") info.version = value;
            else if (key == "pkgdesc") info.description = value;
            else if (key == "arch") info.arch = value;
            else if (key == "depend") info.depends.push_back(value);
            else if (key == "provides") info.provides.push_back(value);
            else if (key == "conflict") info.conflicts.push_back(value);
        }
        return info;
    }

    std::expected<PackageInfo, ArchiveError> read_package_info(const std::filesystem::path& package_path) {
        auto content = extract_single_file_to_memory(package_path, ".PKGINFO");
        if (!content) {
            return std::unexpected(content.error());
        }
        return parse_package_info(*content);
    }

    std::vector<std::vector<std::string>> required_tools(FileType type, const std::string& build_system) {
        switch (type) {
            case FileType::Deb:
                return {{"debtap"}, {"pacman"}};
            case FileType::Rpm:
                return {{"rpmextract", "bsdtar"}};
            case FileType::PacmanPackage:
                return {{"pacman"}};
            case FileType::SourceTarball: {
                std::vector<std::vector<std::string>> tools{{"bsdtar"}};
                if (build_system == "pkgbuild") tools.push_back({"makepkg"});
                else if (build_system == "makefile" || build_system == "configure") tools.push_back({"make"});
                return tools;
            }
            case FileType::Flatpak:
                return {{"flatpak"}};
            case FileType::AppImage:
            case FileType::Unknown:
                return {};
        }
        return {};
    }

    static std::string suggested_action(FileType type, const std::string& build_system) {
        switch (type) {
            case FileType::Deb: return "Convert with debtap, then install with pacman -U";
            case FileType::Rpm: return "Extract with rpmextract or bsdtar and copy the files into place";
            case FileType::PacmanPackage: return "Install with pacman -U";
            case FileType::AppImage: return "Copy into ~/Applications and make it executable";
            case FileType::Flatpak: return "Install with flatpak install";
            case FileType::Unknown: return "Unknown file type";
            case FileType::SourceTarball:
                if (build_system == "pkgbuild") return "Build with makepkg -si";
                if (build_system == "makefile") return "Build with make && make install";
                if (build_system == "configure") return "Run ./configure && make && make install";
                if (build_system == "install.sh") return "Run install.sh script";
                return "Extract and inspect manually";
        }
        return {};
    }

    FileAnalysis analyze_file(const std::filesystem::path& path, ToolProbe& probe) {
        FileAnalysis analysis;
        analysis.path = path;
        analysis.type = detect_file_type(path);

        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            analysis.size = std::filesystem::file_size(path, ec);
            if (ec) analysis.size = 0;
        }

        if (analysis.type == FileType::SourceTarball) {
            auto entries = list_entries(path);
            if (entries) {
                analysis.build_system = detect_build_system(*entries);
                analysis.build_root = find_build_root(*entries, analysis.build_system);
            } else {
                log::warn("Could not list " + path.string() + ": " + to_string(entries.error()));
            }
        }

        for (const auto& group : required_tools(analysis.type, analysis.build_system)) {
            const bool satisfied = std::any_of(group.begin(), group.end(),
                                               [&probe](const std::string& tool) { return probe.probe(tool).installed; });
            if (!satisfied) {
                analysis.missing_tools.push_back(group.front());
            }
        }
        if (!analysis.missing_tools.empty()) {
            std::string names;
            for (const auto& tool : analysis.missing_tools) {
                names += (names.empty() ? "" : ", ") + tool;
            }
            log::info("Missing tools for " + to_string(analysis.type) + ": " + names);
        }

        analysis.suggested_action = suggested_action(analysis.type, analysis.build_system);
        return analysis;
    }

    std::string to_string(FileType type) {
        switch (type) {
            case FileType::Deb: return "deb";
            case FileType::Rpm: return "rpm";
            case FileType::PacmanPackage: return "pacman package";
            case FileType::SourceTarball: return "source tarball";
            case FileType::AppImage: return "AppImage";
            case FileType::Flatpak: return "flatpak";
            case FileType::Unknown: return "unknown";
        }
        return "unknown";
    }

    std::string to_string(ArchiveError error) {
        switch (error) {
            case ArchiveError::OpenFile: return "could not open archive";
            case ArchiveError::ReadHeader: return "could not read archive header";
            case ArchiveError::ReadData: return "could not read archive data";
            case ArchiveError::EntryNotFound: return "entry not found in archive";
        }
        return "unknown archive error";
    }

} // namespace shelf
