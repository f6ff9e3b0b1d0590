//
// Created by cv2 on 10/16/25.
//

#include "../include/libshelf/diagnostics.h"
#include "../include/libshelf/logging.h"
#include "../include/libshelf/tool_probe.h"
#include "test_helpers.h"
#include <cassert>

bool has_fix(const shelf::DiagnosticCheck& check, const std::string& fix_id) {
    return check.remediation && check.remediation->kind() == shelf::OperationKind::DiagnosticFix &&
           check.remediation->target() == fix_id && check.remediation->requires_privilege();
}

void test_disk_space_thresholds() {
    shelf::log::info("Running test: Disk Space Thresholds...");
    FakeToolbox box("diag_disk");
    auto config = box.config();
    shelf::ToolProbe probe(config);

    auto ok = shelf::DiagnosticsEngine(config, probe).check_disk_space();
    assert(ok.name == "Disk Space");
    assert(ok.status == shelf::CheckStatus::Ok);
    assert(!ok.remediation);
    assert(ok.detail.find("GB free") != std::string::npos);

    config.diagnostics.disk_warning_gb = 1e9;
    auto low = shelf::DiagnosticsEngine(config, probe).check_disk_space();
    assert(low.status == shelf::CheckStatus::Warning);
    assert(has_fix(low, "clean-cache"));

    config.diagnostics.disk_critical_gb = 1e9;
    auto critical = shelf::DiagnosticsEngine(config, probe).check_disk_space();
    assert(critical.status == shelf::CheckStatus::Critical);
    assert(has_fix(critical, "clear-cache"));
    shelf::log::ok("Test Passed: Disk Space Thresholds");
}

void test_lock_file() {
    shelf::log::info("Running test: Lock File...");
    FakeToolbox box("diag_lock");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::DiagnosticsEngine engine(config, probe);

    auto free = engine.check_lock_file();
    assert(free.status == shelf::CheckStatus::Ok);
    assert(!free.remediation);

    // a lock nobody holds
    box.write_file("db.lck", "");
    auto stale = engine.check_lock_file();
    assert(stale.name == "Pacman Lock");
    assert(stale.status == shelf::CheckStatus::Critical);
    assert(has_fix(stale, "remove-lock"));
    assert(stale.remediation_label == "Remove lock file");

    // a lock held by a running pacman is not ours to remove
    box.write_file("proc/1/comm", "systemd\n");
    box.write_file("proc/4242/comm", "pacman\n");
    auto held = engine.check_lock_file();
    assert(held.status == shelf::CheckStatus::Warning);
    assert(!held.remediation);
    assert(std::filesystem::exists(config.diagnostics.lock_file));
    shelf::log::ok("Test Passed: Lock File");
}

void test_orphans() {
    shelf::log::info("Running test: Orphaned Packages...");
    FakeToolbox box("diag_orphans");
    const auto config = box.config();

    {
        shelf::ToolProbe probe(config);
        auto missing = shelf::DiagnosticsEngine(config, probe).check_orphans();
        assert(missing.status == shelf::CheckStatus::Warning);
        assert(!missing.remediation);
    }

    // pacman -Qdtq exits 1 with no output on a clean system
    box.add_tool("pacman", "exit 1");
    {
        shelf::ToolProbe probe(config);
        auto clean = shelf::DiagnosticsEngine(config, probe).check_orphans();
        assert(clean.status == shelf::CheckStatus::Ok);
    }

    box.add_tool("pacman", "if [ \"$1\" = \"-Qdtq\" ]; then echo 'lib32-foo'; echo 'python-bar'; exit 0; fi\nexit 1");
    {
        shelf::ToolProbe probe(config);
        auto found = shelf::DiagnosticsEngine(config, probe).check_orphans();
        assert(found.status == shelf::CheckStatus::Warning);
        assert(has_fix(found, "remove-orphans"));
        assert((found.remediation->arguments() == std::vector<std::string>{"lib32-foo", "python-bar"}));
        assert(found.detail == "2 orphaned packages found: lib32-foo, python-bar");
    }
    shelf::log::ok("Test Passed: Orphaned Packages");
}

void test_package_cache() {
    shelf::log::info("Running test: Package Cache...");
    FakeToolbox box("diag_cache");
    auto config = box.config();
    shelf::ToolProbe probe(config);

    auto absent = shelf::DiagnosticsEngine(config, probe).check_package_cache();
    assert(absent.status == shelf::CheckStatus::Ok);

    box.write_file("cache/firefox-121.0-1-x86_64.pkg.tar.zst", std::string(4096, 'x'));
    auto small = shelf::DiagnosticsEngine(config, probe).check_package_cache();
    assert(small.status == shelf::CheckStatus::Ok);
    assert(small.detail == "Cache is 0.0 GB");

    config.diagnostics.cache_warning_gb = 0.0;
    auto large = shelf::DiagnosticsEngine(config, probe).check_package_cache();
    assert(large.status == shelf::CheckStatus::Warning);
    assert(has_fix(large, "prune-cache"));
    shelf::log::ok("Test Passed: Package Cache");
}

void test_failed_services() {
    shelf::log::info("Running test: Failed Services...");
    FakeToolbox box("diag_services");
    const auto config = box.config();

    {
        shelf::ToolProbe probe(config);
        auto unknown = shelf::DiagnosticsEngine(config, probe).check_failed_services();
        assert(unknown.status == shelf::CheckStatus::Ok);
        assert(unknown.detail == "Could not check services");
    }

    box.add_tool("systemctl", "echo '  bluetooth.service loaded failed failed Bluetooth service'");
    {
        shelf::ToolProbe probe(config);
        auto failed = shelf::DiagnosticsEngine(config, probe).check_failed_services();
        assert(failed.status == shelf::CheckStatus::Warning);
        assert(failed.detail == "1 failed service(s)");
        assert(has_fix(failed, "reset-failed-services"));
    }
    shelf::log::ok("Test Passed: Failed Services");
}

void test_broken_symlinks() {
    shelf::log::info("Running test: Broken Symlinks...");
    FakeToolbox box("diag_links");
    auto config = box.config();
    shelf::ToolProbe probe(config);

    auto none = shelf::DiagnosticsEngine(config, probe).check_broken_symlinks();
    assert(none.status == shelf::CheckStatus::Ok);

    const auto target = box.write_file("links/real", "x");
    std::filesystem::create_symlink(target, box.m_root / "links" / "good");
    std::filesystem::create_symlink(box.m_root / "nowhere-a", box.m_root / "links" / "bad-a");
    std::filesystem::create_symlink(box.m_root / "nowhere-b", box.m_root / "links" / "bad-b");

    auto broken = shelf::DiagnosticsEngine(config, probe).check_broken_symlinks();
    assert(broken.status == shelf::CheckStatus::Warning);
    assert(broken.detail == "2 broken symlink(s) found in system dirs");
    assert(!broken.remediation);

    config.diagnostics.symlink_scan_limit = 1;
    auto capped = shelf::DiagnosticsEngine(config, probe).check_broken_symlinks();
    assert(capped.detail == "1 broken symlink(s) found in system dirs");
    shelf::log::ok("Test Passed: Broken Symlinks");
}

void test_checks_are_read_only_and_repeatable() {
    shelf::log::info("Running test: Repeatable Checks...");
    FakeToolbox box("diag_repeat");
    box.add_tool("pacman", "if [ \"$1\" = \"-Qdtq\" ]; then echo 'orphan'; exit 0; fi\nexit 1");
    box.write_file("db.lck", "");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::DiagnosticsEngine engine(config, probe);

    const auto first = engine.run_checks();
    const auto second = engine.run_checks();
    assert(first.size() == 7);
    assert(first.size() == second.size());

    const std::vector<std::string> names{"Disk Space", "Pacman Keyring", "Orphaned Packages", "Package Cache",
                                         "System Services", "Broken Symlinks", "Pacman Lock"};
    for (std::size_t i = 0; i < first.size(); ++i) {
        assert(first[i].name == names[i]);
        assert(first[i].name == second[i].name);
        assert(first[i].status == second[i].status);
        assert(first[i].remediation.has_value() == second[i].remediation.has_value());
    }
    // the keyring home does not exist here
    assert(first[1].status == shelf::CheckStatus::Warning);
    assert(has_fix(first[1], "refresh-keyring"));
    // nothing was changed by looking
    assert(std::filesystem::exists(config.diagnostics.lock_file));
    assert(!std::filesystem::exists(config.diagnostics.keyring_dir));
    shelf::log::ok("Test Passed: Repeatable Checks");
}

void test_install_checks() {
    shelf::log::info("Running test: Pre and Post Install Checks...");
    FakeToolbox box("diag_install");
    box.add_tool("pacman",
                 "if [ \"$1\" = \"-Si\" ] && [ \"$2\" = \"firefox\" ]; then echo 'Name : firefox'; exit 0; fi\n"
                 "if [ \"$1\" = \"-Q\" ] && [ \"$2\" = \"firefox\" ]; then echo 'firefox 121.0-1'; exit 0; fi\n"
                 "echo \"error: package '$2' was not found\"\nexit 1");
    const auto config = box.config();
    shelf::ToolProbe probe(config);
    shelf::DiagnosticsEngine engine(config, probe);

    auto pre = engine.pre_install_checks({"firefox", "no-such-package"});
    assert(pre.size() == 3);
    assert(pre[0].name == "Disk Space");
    assert(pre[1].name == "Pacman Lock");
    assert(pre[2].name == "Package 'no-such-package'");
    assert(pre[2].status == shelf::CheckStatus::Warning);

    auto post = engine.post_install_checks({"firefox", "no-such-package"});
    assert(post.size() == 2);
    assert(post[0].name == "firefox" && post[0].status == shelf::CheckStatus::Ok);
    assert(post[1].name == "no-such-package" && post[1].status == shelf::CheckStatus::Critical);
    shelf::log::ok("Test Passed: Pre and Post Install Checks");
}

int main() {
    try {
        test_disk_space_thresholds();
        test_lock_file();
        test_orphans();
        test_package_cache();
        test_failed_services();
        test_broken_symlinks();
        test_checks_are_read_only_and_repeatable();
        test_install_checks();
    } catch (const std::exception& e) {
        shelf::log::error(std::string("A diagnostics test failed: ") + e.what());
        return 1;
    }

    shelf::log::ok("All diagnostics tests completed successfully!");
    return 0;
}
