#pragma once

#include <string>
#include <string_view>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"
#include "seedvault/security/codec.hpp"
#include "seedvault/security/kdf.hpp"

namespace seedvault::security {

    inline constexpr u32 kServerSaltLen = kServerLayout.salt_len;

    struct WrappedVault {
        std::string blob; // base64 server envelope around the client blob
        std::string salt; // base64 of the 32-byte outer salt, stored as serverSalt
    };

    // Second, server-held layer. The key comes from the decimal account id
    // followed by the server secret, stretched with a fresh 32-byte salt that
    // is also bound as AAD. The client layer inside stays opaque: removing
    // this layer costs nothing in confidentiality against the server.
    //   Invalid         empty secret or inner blob, invalid account
    //   WeakParameters  params below the KDF floor
    seedvault::core::Status wrap_vault(std::string_view server_secret,
        seedvault::core::AccountId account,
        std::string_view inner_blob,
        const KdfParams& params,
        WrappedVault* out) noexcept;

    // Authentication on any corruption, wrong secret/account or a salt that
    // does not match the blob. Callers degrade to "no vault available".
    seedvault::core::Status unwrap_vault(std::string_view server_secret,
        seedvault::core::AccountId account,
        std::string_view outer_salt_b64,
        std::string_view outer_blob,
        const KdfParams& params,
        std::string* inner_out) noexcept;

} // namespace seedvault::security
