//
// Created by cv2 on 10/15/25.
//

#include "../include/libshelf/archive.h"
#include "../include/libshelf/logging.h"
#include "../include/libshelf/tool_probe.h"
#include "test_helpers.h"
#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <sys/wait.h>

// Packs everything below `staging` into `output` with the system tar.
void make_tarball(const std::filesystem::path& staging, const std::filesystem::path& output, const std::string& members = ".") {
    const std::string command = "tar -C " + staging.string() + " -czf " + output.string() + " " + members;
    int status = std::system(command.c_str());
    assert(WEXITSTATUS(status) == 0);
}

void test_detect_file_type() {
    shelf::log::info("Running test: Detect File Type...");
    assert(shelf::detect_file_type("google-chrome_120.0_amd64.deb") == shelf::FileType::Deb);
    assert(shelf::detect_file_type("zoom.x86_64.RPM") == shelf::FileType::Rpm);
    assert(shelf::detect_file_type("firefox-121.0-1-x86_64.pkg.tar.zst") == shelf::FileType::PacmanPackage);
    assert(shelf::detect_file_type("yay-12.0.tar.gz") == shelf::FileType::SourceTarball);
    assert(shelf::detect_file_type("tool.tgz") == shelf::FileType::SourceTarball);
    assert(shelf::detect_file_type("Obsidian-1.5.3.AppImage") == shelf::FileType::AppImage);
    assert(shelf::detect_file_type("org.gnome.Maps.flatpakref") == shelf::FileType::Flatpak);
    assert(shelf::detect_file_type("app.flatpak") == shelf::FileType::Flatpak);
    assert(shelf::detect_file_type("notes.txt") == shelf::FileType::Unknown);
    shelf::log::ok("Test Passed: Detect File Type");
}

void test_build_system_detection() {
    shelf::log::info("Running test: Build System Detection...");
    const std::vector<std::string> pkgbuild_tree{"yay-12.0", "yay-12.0/src/main.go", "yay-12.0/PKGBUILD", "yay-12.0/contrib/PKGBUILD"};
    assert(shelf::detect_build_system(pkgbuild_tree) == "pkgbuild");
    assert(shelf::find_build_root(pkgbuild_tree, "pkgbuild") == "yay-12.0");

    const std::vector<std::string> make_tree{"tool/Makefile", "tool/configure", "tool/src/a.c"};
    assert(shelf::detect_build_system(make_tree) == "makefile");
    assert(shelf::find_build_root(make_tree, "makefile") == "tool");

    const std::vector<std::string> flat{"PKGBUILD", "foo.install"};
    assert(shelf::find_build_root(flat, "pkgbuild") == "");

    assert(shelf::detect_build_system({"README", "data/x.png"}).empty());
    assert(!shelf::find_build_root({"README"}, ""));
    shelf::log::ok("Test Passed: Build System Detection");
}

void test_list_entries_of_source_tarball() {
    shelf::log::info("Running test: List Entries...");
    FakeToolbox box("archive_list");
    box.write_file("staging/hello-1.0/PKGBUILD", "pkgname=hello\npkgver=1.0\n");
    box.write_file("staging/hello-1.0/hello.c", "int main() { return 0; }\n");
    const auto tarball = box.m_root / "hello-1.0.tar.gz";
    make_tarball(box.m_root / "staging", tarball);

    auto entries = shelf::list_entries(tarball);
    assert(entries.has_value());
    assert(std::find(entries->begin(), entries->end(), "hello-1.0/PKGBUILD") != entries->end());
    assert(std::find(entries->begin(), entries->end(), "hello-1.0/hello.c") != entries->end());
    // "./" is normalized away
    assert(std::none_of(entries->begin(), entries->end(), [](const std::string& e) { return e.rfind("./", 0) == 0; }));

    auto missing = shelf::list_entries(box.m_root / "nope.tar.gz");
    assert(!missing && missing.error() == shelf::ArchiveError::OpenFile);
    shelf::log::ok("Test Passed: List Entries");
}

void test_package_info() {
    shelf::log::info("Running test: Package Info...");
    FakeToolbox box("archive_pkginfo");
    box.write_file("staging/.PKGINFO",
                   "# Generated by makepkg\n"
                   "pkgname = hello\n"
                   "pkgver = 1.0-1\n"
                   "pkgdesc = Says hello\n"
                   "arch = x86_64\n"
                   "depend = glibc\n"
                   "depend = bash\n"
                   "provides = greeter\n"
                   "conflict = hello-git\n");
    box.write_file("staging/usr/bin/hello", "#!/bin/sh\necho hello\n");
    const auto package = box.m_root / "hello-1.0-1-x86_64.pkg.tar.gz";
    make_tarball(box.m_root / "staging", package, ".PKGINFO usr");

    auto info = shelf::read_package_info(package);
    assert(info.has_value());
    assert(info->name == "hello");
    assert(info->version == "1.0-1");
    assert(info->description == "Says hello");
    assert(info->arch == "x86_64");
    assert((info->depends == std::vector<std::string>{"glibc", "bash"}));
    assert((info->provides == std::vector<std::string>{"greeter"}));
    assert((info->conflicts == std::vector<std::string>{"hello-git"}));

    auto not_there = shelf::extract_single_file_to_memory(package, ".MTREE");
    assert(!not_there && not_there.error() == shelf::ArchiveError::EntryNotFound);
    shelf::log::ok("Test Passed: Package Info");
}

void test_analyze_file_reports_missing_tools() {
    shelf::log::info("Running test: Analyze File...");
    FakeToolbox box("archive_analyze");
    box.write_file("staging/hello-1.0/PKGBUILD", "pkgname=hello\n");
    const auto tarball = box.m_root / "hello-1.0.tar.gz";
    make_tarball(box.m_root / "staging", tarball);
    const auto deb = box.write_file("chrome.deb", "!<arch>\n");
    box.add_tool("bsdtar", "exit 0");

    shelf::ToolProbe probe(box.config());

    auto source = shelf::analyze_file(tarball, probe);
    assert(source.type == shelf::FileType::SourceTarball);
    assert(source.size > 0);
    assert(source.build_system == "pkgbuild");
    assert(source.build_root == "hello-1.0");
    assert((source.missing_tools == std::vector<std::string>{"makepkg"}));
    assert(source.suggested_action == "Build with makepkg -si");

    auto debian = shelf::analyze_file(deb, probe);
    assert(debian.type == shelf::FileType::Deb);
    assert((debian.missing_tools == std::vector<std::string>{"debtap", "pacman"}));

    box.add_tool("rpmextract.sh", "exit 0");
    probe.refresh();
    const auto rpm = box.write_file("zoom.rpm", "rpm");
    // either extractor satisfies the requirement
    assert(shelf::analyze_file(rpm, probe).missing_tools.empty());
    shelf::log::ok("Test Passed: Analyze File");
}

int main() {
    try {
        test_detect_file_type();
        test_build_system_detection();
        test_list_entries_of_source_tarball();
        test_package_info();
        test_analyze_file_reports_missing_tools();
    } catch (const std::exception& e) {
        shelf::log::error(std::string("An archive test failed: ") + e.what());
        return 1;
    }

    shelf::log::ok("All archive tests completed successfully!");
    return 0;
}
