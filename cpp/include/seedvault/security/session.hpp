#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "seedvault/core/errors.hpp"
#include "seedvault/security/kdf.hpp"
#include "seedvault/security/secure_key.hpp"

namespace seedvault::security {

    // An unlocked vault held as its derived key, never as the password.
    // open() re-reads blobs sealed under the same salt (for example a copy
    // fetched again from the server). Saving is not offered here: every save
    // goes through seal_vault with the password so the salt is fresh.
    class VaultSession {
    public:
        VaultSession() = default;
        ~VaultSession() { lock(); }

        VaultSession(const VaultSession&) = delete;
        VaultSession& operator=(const VaultSession&) = delete;
        VaultSession(VaultSession&&) noexcept = default;
        VaultSession& operator=(VaultSession&&) noexcept = default;

        // Opens blob once. On success the session keeps the key and salt
        // and out receives the plaintext. Authentication on wrong password or
        // tampering; the session stays locked.
        seedvault::core::Status unlock(std::string_view password,
            std::string_view salt_b64,
            std::string_view blob,
            const KdfParams& params,
            std::string* out);

        // nullopt when locked, when blob carries a different salt, or on any
        // authentication failure.
        [[nodiscard]] std::optional<std::string> open(std::string_view blob) const;

        [[nodiscard]] bool is_unlocked() const noexcept { return key_.is_set(); }
        [[nodiscard]] const std::vector<u8>& salt() const noexcept { return salt_; }

        // Zeroizes the key and forgets the salt.
        void lock() noexcept;

    private:
        DerivedKey key_;
        std::vector<u8> salt_;
    };

} // namespace seedvault::security
