//
// Created by cv2 on 10/15/25.
//

#include "../include/libshelf/config.h"
#include "../include/libshelf/logging.h"
#include <cassert>
#include <filesystem>
#include <fstream>

const std::filesystem::path TEST_CONFIG_DIR = "/tmp/shelf_test_config";

void test_defaults() {
    shelf::log::info("Running test: Defaults...");
    auto config = shelf::Config::defaults();

    assert(config.timeouts.probe == std::chrono::milliseconds(2000));
    assert(config.timeouts.authorization == std::chrono::seconds(120));
    assert(config.timeouts.grace_period == std::chrono::milliseconds(5000));
    assert(config.timeouts.stall == std::chrono::seconds(600));
    assert(config.privilege.use_agent);
    assert(!config.privilege.terminals.empty());
    assert(config.privilege.terminals.front().name == "gnome-terminal");
    assert((config.tools.aur_helpers == std::vector<std::string>{"paru", "yay"}));
    assert(!config.progress_patterns.empty());
    assert(config.flatpak_remote == "flathub");
    assert(!config.tools.search_path.empty());

    shelf::log::ok("Test Passed: Defaults");
}

void test_missing_file_gives_defaults() {
    shelf::log::info("Running test: Missing File...");
    auto config = shelf::Config::load(TEST_CONFIG_DIR / "does-not-exist.yaml");
    assert(config.has_value());
    assert(config->timeouts.authorization == std::chrono::seconds(120));
    shelf::log::ok("Test Passed: Missing File");
}

void test_load_overrides() {
    shelf::log::info("Running test: Load Overrides...");
    std::filesystem::create_directories(TEST_CONFIG_DIR);
    const auto path = TEST_CONFIG_DIR / "shelf.yaml";
    {
        std::ofstream out(path);
        out << "timeouts:\n"
            << "  probe_ms: 500\n"
            << "  authorization_s: 30\n"
            << "  grace_period_ms: 1500\n"
            << "  stall_s: 60\n"
            << "privilege:\n"
            << "  use_agent: false\n"
            << "  terminals:\n"
            << "    - name: kitty\n"
            << "      args: [bash, -c]\n"
            << "tools:\n"
            << "  search_path: [/opt/tools/bin, /usr/bin]\n"
            << "  aur_helpers: [yay]\n"
            << "  hints:\n"
            << "    debtap: \"install debtap from the AUR\"\n"
            << "  debtap_cache: /srv/debtap\n"
            << "  debtap_max_age_h: 48\n"
            << "diagnostics:\n"
            << "  lock_file: /tmp/db.lck\n"
            << "  disk_warning_gb: 10\n"
            << "aur:\n"
            << "  timeout_s: 5\n"
            << "flatpak:\n"
            << "  remote: kdeapps\n"
            << "work_dir: /var/tmp/shelf\n"
            << "progress:\n"
            << "  patterns:\n"
            << "    - phase: fetching\n"
            << "      regex: \"^fetch\"\n";
    }

    auto config = shelf::Config::load(path);
    assert(config.has_value());
    assert(config->timeouts.probe == std::chrono::milliseconds(500));
    assert(config->timeouts.authorization == std::chrono::seconds(30));
    assert(config->timeouts.grace_period == std::chrono::milliseconds(1500));
    assert(config->timeouts.stall == std::chrono::seconds(60));
    assert(!config->privilege.use_agent);
    assert(config->privilege.terminals.size() == 1);
    assert(config->privilege.terminals[0].name == "kitty");
    assert((config->privilege.terminals[0].args == std::vector<std::string>{"bash", "-c"}));
    assert(config->search_path_string() == "/opt/tools/bin:/usr/bin");
    assert((config->tools.aur_helpers == std::vector<std::string>{"yay"}));
    assert(config->tools.hints.at("debtap") == "install debtap from the AUR");
    assert(config->tools.debtap_cache == "/srv/debtap");
    assert(config->tools.debtap_max_age == std::chrono::hours(48));
    assert(config->diagnostics.lock_file == "/tmp/db.lck");
    assert(config->diagnostics.disk_warning_gb == 10.0);
    assert(config->aur.timeout == std::chrono::seconds(5));
    assert(config->flatpak_remote == "kdeapps");
    assert(config->work_dir == "/var/tmp/shelf");
    assert(config->progress_patterns.size() == 1);
    assert(config->progress_patterns[0].phase == "fetching");
    // untouched sections keep their defaults
    assert(config->timeouts.query == std::chrono::seconds(30));

    shelf::log::ok("Test Passed: Load Overrides");
}

void test_invalid_documents() {
    shelf::log::info("Running test: Invalid Documents...");

    auto broken = shelf::Config::load_from_string("timeouts: [unclosed");
    assert(!broken && broken.error() == shelf::ConfigError::InvalidFormat);

    auto not_a_map = shelf::Config::load_from_string("- just\n- a list\n");
    assert(!not_a_map && not_a_map.error() == shelf::ConfigError::InvalidFormat);

    auto wrong_type = shelf::Config::load_from_string("timeouts:\n  probe_ms: soon\n");
    assert(!wrong_type && wrong_type.error() == shelf::ConfigError::InvalidValue);

    auto negative = shelf::Config::load_from_string("timeouts:\n  stall_s: -4\n");
    assert(!negative && negative.error() == shelf::ConfigError::InvalidValue);

    auto bad_regex = shelf::Config::load_from_string("progress:\n  patterns:\n    - phase: x\n      regex: \"([\"\n");
    assert(!bad_regex && bad_regex.error() == shelf::ConfigError::InvalidValue);

    auto empty = shelf::Config::load_from_string("");
    assert(empty.has_value());

    shelf::log::ok("Test Passed: Invalid Documents");
}

int main() {
    std::filesystem::remove_all(TEST_CONFIG_DIR);

    try {
        test_defaults();
        test_missing_file_gives_defaults();
        test_load_overrides();
        test_invalid_documents();
    } catch (const std::exception& e) {
        shelf::log::error(std::string("A config test failed: ") + e.what());
        std::filesystem::remove_all(TEST_CONFIG_DIR);
        return 1;
    }

    std::filesystem::remove_all(TEST_CONFIG_DIR);
    shelf::log::ok("All config tests completed successfully!");
    return 0;
}
