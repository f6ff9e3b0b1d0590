//
// Created by cv2 on 10/13/25.
//

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shelf {

    class ToolProbe;

    enum class FileType {
        Deb,
        Rpm,
        PacmanPackage,  // *.pkg.tar.*
        SourceTarball,  // *.tar.gz, *.tgz, *.tar.zst, *.tar.xz, *.tar.bz2
        AppImage,
        Flatpak,        // *.flatpak bundle or *.flatpakref
        Unknown
    };

    enum class ArchiveError {
        OpenFile,
        ReadHeader,
        ReadData,
        EntryNotFound
    };

    struct PackageInfo {
        std::string name;
        std::string version;
        std::string description;
        std::string arch;
        std::vector<std::string> depends;
        std::vector<std::string> provides;
        std::vector<std::string> conflicts;
    };

    struct FileAnalysis {
        std::filesystem::path path;
        FileType type = FileType::Unknown;
        std::uintmax_t size = 0;
        std::string build_system;               // "pkgbuild", "makefile", "configure", "install.sh" or empty
        std::optional<std::string> build_root;  // directory inside the archive holding the build file
        std::vector<std::string> missing_tools;
        std::string suggested_action;
    };

    FileType detect_file_type(const std::filesystem::path& path);

    std::expected<std::vector<std::string>, ArchiveError> list_entries(const std::filesystem::path& archive_path);

    std::expected<std::string, ArchiveError> extract_single_file_to_memory(
            const std::filesystem::path& archive_path,
            const std::string& file_inside_archive
    );

    // Looks at base names only, in priority order PKGBUILD, Makefile, configure, install.sh.
    std::string detect_build_system(const std::vector<std::string>& entries);
    // Shallowest directory containing the build file, "" for the archive root.
    std::optional<std::string> find_build_root(const std::vector<std::string>& entries, const std::string& build_system);

    PackageInfo parse_package_info(const std::string& content);
    std::expected<PackageInfo, ArchiveError> read_package_info(const std::filesystem::path& package_path);

    // Tool groups ("any of") needed to install a file of this type.
    std::vector<std::vector<std::string>> required_tools(FileType type, const std::string& build_system);

    FileAnalysis analyze_file(const std::filesystem::path& path, ToolProbe& probe);

    std::string to_string(FileType type);
    std::string to_string(ArchiveError error);

} // namespace shelf
