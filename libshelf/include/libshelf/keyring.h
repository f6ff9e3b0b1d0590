//
// Created by cv2 on 10/14/25.
//

#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace shelf {

    enum class KeyringError {
        EngineUnavailable,
        ContextFailed,
        HomeMissing,
        ListFailed
    };

    struct KeyringStatus {
        std::size_t key_count = 0;
        std::size_t expired = 0;
        std::size_t revoked = 0;
    };

    // Lists the public keys in a GnuPG home such as /etc/pacman.d/gnupg. Read-only.
    std::expected<KeyringStatus, KeyringError> inspect_keyring(const std::filesystem::path& home);

    std::string to_string(KeyringError error);

} // namespace shelf
