//
// Created by cv2 on 10/16/25.
//

#include "../include/libshelf/aur_client.h"
#include "../include/libshelf/logging.h"
#include <cassert>

const std::string package_url = "https://aur.archlinux.org/packages/";

void test_parse_search_reply() {
    shelf::log::info("Running test: Parse Search Reply...");
    const std::string body = R"({
        "resultcount": 2,
        "type": "search",
        "version": 5,
        "results": [
            {
                "Name": "google-chrome",
                "PackageBase": "google-chrome",
                "Description": "The popular web browser by Google",
                "Version": "120.0.6099.109-1",
                "NumVotes": 2000,
                "Popularity": 25.5,
                "Maintainer": "luzifer",
                "URL": "https://www.google.com/chrome",
                "OutOfDate": null,
                "FirstSubmitted": 1277759148,
                "LastModified": 1702500000
            },
            {
                "Name": "old-tool",
                "PackageBase": "old-tool",
                "Description": null,
                "Version": "0.1-1",
                "NumVotes": 0,
                "Popularity": 0,
                "Maintainer": null,
                "URL": null,
                "OutOfDate": 1600000000,
                "FirstSubmitted": 1500000000,
                "LastModified": 1500000001
            }
        ]
    })";

    auto packages = shelf::AurClient::parse_response(body, package_url);
    assert(packages.has_value());
    assert(packages->size() == 2);

    const auto& chrome = (*packages)[0];
    assert(chrome.name == "google-chrome");
    assert(chrome.version == "120.0.6099.109-1");
    assert(chrome.votes == 2000);
    assert(chrome.popularity > 25.4 && chrome.popularity < 25.6);
    assert(chrome.maintainer == "luzifer");
    assert(chrome.aur_url == "https://aur.archlinux.org/packages/google-chrome");
    assert(!chrome.out_of_date);
    assert(chrome.first_submitted == 1277759148);

    const auto& orphan = (*packages)[1];
    assert(orphan.description.empty());
    assert(orphan.maintainer.empty());
    assert(orphan.url.empty());
    assert(orphan.out_of_date);
    assert(orphan.package_base == "old-tool");
    shelf::log::ok("Test Passed: Parse Search Reply");
}

void test_parse_empty_and_error_replies() {
    shelf::log::info("Running test: Parse Empty and Error Replies...");
    auto empty = shelf::AurClient::parse_response(R"({"resultcount": 0, "type": "search", "results": []})", package_url);
    assert(empty && empty->empty());

    auto no_results = shelf::AurClient::parse_response(R"({"type": "search", "results": null})", package_url);
    assert(no_results && no_results->empty());

    auto api_error = shelf::AurClient::parse_response(
            R"({"type": "error", "resultcount": 0, "results": [], "error": "Too many package results."})", package_url);
    assert(!api_error && api_error.error() == shelf::AurError::ApiError);

    auto truncated = shelf::AurClient::parse_response(R"({"type": "search", "results": [)", package_url);
    assert(!truncated && truncated.error() == shelf::AurError::InvalidResponse);

    auto not_object = shelf::AurClient::parse_response("<html>502 Bad Gateway</html>", package_url);
    assert(!not_object && not_object.error() == shelf::AurError::InvalidResponse);

    auto bad_list = shelf::AurClient::parse_response(R"({"type": "search", "results": "nope"})", package_url);
    assert(!bad_list && bad_list.error() == shelf::AurError::InvalidResponse);

    auto bad_votes = shelf::AurClient::parse_response(R"({"type": "search", "results": [{"Name": "x", "NumVotes": "many"}]})", package_url);
    assert(!bad_votes && bad_votes.error() == shelf::AurError::InvalidResponse);
    shelf::log::ok("Test Passed: Parse Empty and Error Replies");
}

void test_request_urls() {
    shelf::log::info("Running test: Request URLs...");
    shelf::AurConfig config;
    config.rpc_url = "https://aur.example.org/rpc/";
    shelf::AurClient client(config);

    assert(client.build_search_url("web browser", "name-desc") ==
           "https://aur.example.org/rpc/?v=5&type=search&by=name-desc&arg=web%20browser");
    assert(client.build_search_url("c++", "name") ==
           "https://aur.example.org/rpc/?v=5&type=search&by=name&arg=c%2B%2B");
    assert(client.build_info_url({"yay", "paru-bin"}) ==
           "https://aur.example.org/rpc/?v=5&type=info&arg%5B%5D=yay&arg%5B%5D=paru-bin");

    // nothing to ask for, nothing fetched
    auto none = client.info({});
    assert(none && none->empty());
    shelf::log::ok("Test Passed: Request URLs");
}

int main() {
    try {
        test_parse_search_reply();
        test_parse_empty_and_error_replies();
        test_request_urls();
    } catch (const std::exception& e) {
        shelf::log::error(std::string("An AUR client test failed: ") + e.what());
        return 1;
    }

    shelf::log::ok("All AUR client tests completed successfully!");
    return 0;
}
