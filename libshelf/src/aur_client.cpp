//
// Created by cv2 on 10/14/25.
//

#include "libshelf/aur_client.h"
#include "libshelf/logging.h"

#include <curl/curl.h>
#include <yaml-cpp/yaml.h>

namespace shelf {

    std::string to_string(AurError error) {
        switch (error) {
            case AurError::NetworkError: return "Could not reach the AUR";
            case AurError::InvalidResponse: return "The AUR sent a reply that could not be read";
            case AurError::ApiError: return "The AUR rejected the request";
        }
        return "Unknown AUR error";
    }

    static size_t write_callback(void* ptr, size_t size, size_t nmemb, std::string* body) {
        body->append(static_cast<const char*>(ptr), size * nmemb);
        return size * nmemb;
    }

    // Scalar or default; the RPC sends null for unset fields.
    template <typename T>
    static T field_or(const YAML::Node& node, const char* key, T fallback) {
        const YAML::Node value = node[key];
        if (!value || value.IsNull()) {
            return fallback;
        }
        return value.as<T>();
    }

    struct AurClient::Impl {
        AurConfig config;
        CURL* handle = nullptr;

        explicit Impl(AurConfig cfg) : config(std::move(cfg)) {
            curl_global_init(CURL_GLOBAL_ALL);
            handle = curl_easy_init();
        }

        ~Impl() {
            if (handle) curl_easy_cleanup(handle);
            curl_global_cleanup();
        }

        std::string escape(const std::string& text) const {
            char* escaped = curl_easy_escape(handle, text.c_str(), static_cast<int>(text.size()));
            if (!escaped) {
                return text;
            }
            std::string result(escaped);
            curl_free(escaped);
            return result;
        }

        std::expected<std::string, AurError> fetch(const std::string& url) {
            if (!handle) {
                log::error("libcurl could not create a handle.");
                return std::unexpected(AurError::NetworkError);
            }

            std::string body;
            char error_buffer[CURL_ERROR_SIZE] = {0};
            curl_easy_reset(handle);
            curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
            curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(handle, CURLOPT_WRITEDATA, &body);
            curl_easy_setopt(handle, CURLOPT_USERAGENT, config.user_agent.c_str());
            curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(config.timeout.count()));
            curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L); // Fail on HTTP >= 400
            curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);

            log::debug("GET " + url);
            const CURLcode code = curl_easy_perform(handle);
            if (code != CURLE_OK) {
                const std::string reason = error_buffer[0] ? error_buffer : curl_easy_strerror(code);
                log::warn("AUR request failed: " + reason);
                return std::unexpected(AurError::NetworkError);
            }
            return body;
        }
    };

    AurClient::AurClient(AurConfig config) : pimpl(std::make_unique<Impl>(std::move(config))) {}

    AurClient::~AurClient() = default;

    std::string AurClient::build_search_url(const std::string& query, const std::string& by) const {
        return pimpl->config.rpc_url + "?v=5&type=search&by=" + pimpl->escape(by) + "&arg=" + pimpl->escape(query);
    }

    std::string AurClient::build_info_url(const std::vector<std::string>& names) const {
        std::string url = pimpl->config.rpc_url + "?v=5&type=info";
        for (const auto& name : names) {
            url += "&arg%5B%5D=" + pimpl->escape(name);
        }
        return url;
    }

    std::expected<std::vector<AurPackage>, AurError> AurClient::search(const std::string& query, const std::string& by) {
        log::info("Searching the AUR for '" + query + "'...");
        auto body = pimpl->fetch(build_search_url(query, by));
        if (!body) {
            return std::unexpected(body.error());
        }
        return parse_response(*body, pimpl->config.package_url);
    }

    std::expected<std::vector<AurPackage>, AurError> AurClient::info(const std::vector<std::string>& names) {
        if (names.empty()) {
            return std::vector<AurPackage>{};
        }
        auto body = pimpl->fetch(build_info_url(names));
        if (!body) {
            return std::unexpected(body.error());
        }
        return parse_response(*body, pimpl->config.package_url);
    }

    std::expected<std::vector<AurPackage>, AurError> AurClient::parse_response(const std::string& body,
                                                                               const std::string& package_url) {
        YAML::Node root;
        try {
            root = YAML::Load(body);
        } catch (const YAML::Exception& e) {
            log::warn("Could not parse AUR reply: " + std::string(e.what()));
            return std::unexpected(AurError::InvalidResponse);
        }
        if (!root.IsMap()) {
            log::warn("AUR reply is not an object.");
            return std::unexpected(AurError::InvalidResponse);
        }

        std::vector<AurPackage> packages;
        try {
            if (field_or<std::string>(root, "type", "") == "error") {
                log::warn("AUR error: " + field_or<std::string>(root, "error", "no message"));
                return std::unexpected(AurError::ApiError);
            }

            const YAML::Node results = root["results"];
            if (!results || results.IsNull()) {
                return packages;
            }
            if (!results.IsSequence()) {
                log::warn("AUR reply has no result list.");
                return std::unexpected(AurError::InvalidResponse);
            }

            for (const auto& entry : results) {
                AurPackage package;
                package.name = field_or<std::string>(entry, "Name", "");
                package.description = field_or<std::string>(entry, "Description", "");
                package.version = field_or<std::string>(entry, "Version", "");
                package.votes = field_or<long>(entry, "NumVotes", 0);
                package.popularity = field_or<double>(entry, "Popularity", 0.0);
                package.maintainer = field_or<std::string>(entry, "Maintainer", "");
                package.url = field_or<std::string>(entry, "URL", "");
                package.aur_url = package_url + package.name;
                package.out_of_date = entry["OutOfDate"] && !entry["OutOfDate"].IsNull();
                package.first_submitted = field_or<std::int64_t>(entry, "FirstSubmitted", 0);
                package.last_modified = field_or<std::int64_t>(entry, "LastModified", 0);
                package.package_base = field_or<std::string>(entry, "PackageBase", "");
                packages.push_back(std::move(package));
            }
        } catch (const YAML::Exception& e) {
            log::warn("Unexpected field in AUR reply: " + std::string(e.what()));
            return std::unexpected(AurError::InvalidResponse);
        }

        log::debug("AUR returned " + std::to_string(packages.size()) + " packages.");
        return packages;
    }

} // namespace shelf
