#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "seedvault/core/errors.hpp"
#include "seedvault/security/codec.hpp"
#include "seedvault/security/kdf.hpp"

namespace seedvault::security {

    inline constexpr u32 kClientSaltLen = kClientLayout.salt_len;

    struct SealedVault {
        std::string blob; // base64 client envelope
        std::string salt; // base64 of the 16-byte salt, stored as clientSalt
    };

    // Seals the vault document under the master password. Every call draws a
    // new salt and nonce, so two seals of the same document never match.
    //   Invalid         empty password, oversized document
    //   WeakParameters  params.iterations below the floor
    seedvault::core::Status seal_vault(std::string_view password,
        std::string_view plaintext_json,
        const KdfParams& params,
        SealedVault* out) noexcept;

    // Opens a blob produced by seal_vault. Wrong password, tampering, a salt
    // that does not match the blob and bad encoding all give std::nullopt.
    [[nodiscard]] std::optional<std::string> open_vault(std::string_view password,
        std::string_view salt_b64,
        std::string_view blob,
        const KdfParams& params) noexcept;

} // namespace seedvault::security
