#pragma once
#include <cstdint>
#include <type_traits>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"
#include "seedvault/security/secure_key.hpp"

namespace seedvault::security {

    struct Tag16 {
        u8 b[16]{};
    };

    // AES-256-GCM accepts 12-byte IVs (client layer) and 16-byte IVs
    // (server layer); anything else is rejected here.
    [[nodiscard]] constexpr bool gcm_nonce_len_ok(u32 len) noexcept {
        return len == 12 || len == 16;
    }

    // Nonce rule: the caller draws a fresh random nonce for every seal under
    // the same key. Detached tag, ct_out.len >= pt.len.
    seedvault::core::Status gcm_seal(const DerivedKey& key,
        BufferView nonce,
        BufferView aad,
        BufferView pt,
        BufferMut ct_out,
        Tag16* tag_out) noexcept;

    // Any failure (tag mismatch included) is reported as Authentication.
    seedvault::core::Status gcm_open(const DerivedKey& key,
        BufferView nonce,
        BufferView aad,
        BufferView ct,
        const Tag16& tag,
        BufferMut pt_out) noexcept;

    static_assert(std::is_trivially_copyable_v<Tag16>);

} // namespace seedvault::security
