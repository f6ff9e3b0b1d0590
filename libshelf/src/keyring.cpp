//
// Created by cv2 on 10/14/25.
//

#include "libshelf/keyring.h"
#include "libshelf/logging.h"

#include <gpgme.h>

namespace shelf {

    std::string to_string(KeyringError error) {
        switch (error) {
            case KeyringError::EngineUnavailable: return "The OpenPGP engine is not available";
            case KeyringError::ContextFailed: return "Could not create a GPGME context";
            case KeyringError::HomeMissing: return "The keyring directory does not exist";
            case KeyringError::ListFailed: return "Listing the keyring failed";
        }
        return "Unknown keyring error";
    }

    static bool initialize_gpgme() {
        gpgme_check_version(nullptr);
        gpgme_error_t err = gpgme_engine_check_version(GPGME_PROTOCOL_OPENPGP);
        if (err) {
            log::debug("GPGME engine check failed: " + std::string(gpgme_strerror(err)));
            return false;
        }
        return true;
    }

    // Releases the context on every exit path.
    class GpgContextGuard {
    public:
        explicit GpgContextGuard(gpgme_ctx_t ctx) : m_ctx(ctx) {}
        ~GpgContextGuard() {
            if (m_ctx) gpgme_release(m_ctx);
        }

        GpgContextGuard(const GpgContextGuard&) = delete;
        GpgContextGuard& operator=(const GpgContextGuard&) = delete;

        gpgme_ctx_t get() const { return m_ctx; }

    private:
        gpgme_ctx_t m_ctx;
    };

    std::expected<KeyringStatus, KeyringError> inspect_keyring(const std::filesystem::path& home) {
        std::error_code ec;
        if (!std::filesystem::is_directory(home, ec)) {
            log::debug("Keyring directory " + home.string() + " does not exist.");
            return std::unexpected(KeyringError::HomeMissing);
        }

        if (!initialize_gpgme()) {
            return std::unexpected(KeyringError::EngineUnavailable);
        }

        gpgme_ctx_t raw_ctx = nullptr;
        gpgme_error_t err = gpgme_new(&raw_ctx);
        if (err) {
            log::error("GPGME context creation failed: " + std::string(gpgme_strerror(err)));
            return std::unexpected(KeyringError::ContextFailed);
        }
        GpgContextGuard ctx(raw_ctx);

        err = gpgme_ctx_set_engine_info(ctx.get(), GPGME_PROTOCOL_OPENPGP, nullptr, home.c_str());
        if (err) {
            log::error("GPGME failed to use " + home.string() + ": " + std::string(gpgme_strerror(err)));
            return std::unexpected(KeyringError::ContextFailed);
        }

        err = gpgme_op_keylist_start(ctx.get(), nullptr, 0);
        if (err) {
            log::error("Could not list keys in " + home.string() + ": " + std::string(gpgme_strerror(err)));
            return std::unexpected(KeyringError::ListFailed);
        }

        KeyringStatus status;
        gpgme_key_t key = nullptr;
        while ((err = gpgme_op_keylist_next(ctx.get(), &key)) == 0) {
            ++status.key_count;
            if (key->expired) ++status.expired;
            if (key->revoked) ++status.revoked;
            gpgme_key_unref(key);
        }
        if (gpgme_err_code(err) != GPG_ERR_EOF) {
            log::error("Listing keys in " + home.string() + " stopped early: " + std::string(gpgme_strerror(err)));
            gpgme_op_keylist_end(ctx.get());
            return std::unexpected(KeyringError::ListFailed);
        }
        gpgme_op_keylist_end(ctx.get());

        log::debug("Keyring " + home.string() + ": " + std::to_string(status.key_count) + " keys.");
        return status;
    }

} // namespace shelf
