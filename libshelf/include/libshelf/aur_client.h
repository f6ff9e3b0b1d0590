//
// Created by cv2 on 10/14/25.
//

#pragma once

#include "libshelf/config.h"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace shelf {

    enum class AurError {
        NetworkError,
        InvalidResponse,
        ApiError
    };

    struct AurPackage {
        std::string name;
        std::string description;
        std::string version;
        long votes = 0;
        double popularity = 0.0;
        std::string maintainer;     // empty for orphaned packages
        std::string url;
        std::string aur_url;
        bool out_of_date = false;
        std::int64_t first_submitted = 0;
        std::int64_t last_modified = 0;
        std::string package_base;
    };

    // Client for the AUR RPC v5 interface. Read-only, one request at a time.
    class AurClient {
    public:
        explicit AurClient(AurConfig config);
        ~AurClient();

        AurClient(const AurClient&) = delete;
        AurClient& operator=(const AurClient&) = delete;

        // `by` is one of name, name-desc, maintainer.
        std::expected<std::vector<AurPackage>, AurError> search(const std::string& query,
                                                                const std::string& by = "name-desc");
        std::expected<std::vector<AurPackage>, AurError> info(const std::vector<std::string>& names);

        std::string build_search_url(const std::string& query, const std::string& by) const;
        std::string build_info_url(const std::vector<std::string>& names) const;

        // Decodes an RPC reply body.
        static std::expected<std::vector<AurPackage>, AurError> parse_response(const std::string& body,
                                                                               const std::string& package_url);

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

    std::string to_string(AurError error);

} // namespace shelf
