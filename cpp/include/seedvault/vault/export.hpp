#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"
#include "seedvault/security/kdf.hpp"

namespace seedvault::vault {

    inline constexpr std::string_view kExportVersion = "1.0";

    // Offline backup, readable without the server:
    //   { "version": "1.0", "timestamp": "<ISO-8601>",
    //     "salt": "<base64 16 bytes>", "data": "<client envelope>" }
    // Sealed with a fresh salt under the master password.
    seedvault::core::Status export_vault_file(std::string_view password,
        std::string_view plaintext_json,
        seedvault::core::Timestamp now,
        const seedvault::security::KdfParams& params,
        std::string* out) noexcept;

    // nullopt for a wrong password, tampering, or a file that does not parse
    // or carries another version.
    [[nodiscard]] std::optional<std::string> import_vault_file(std::string_view password,
        std::string_view file_json,
        const seedvault::security::KdfParams& params) noexcept;

} // namespace seedvault::vault
