#pragma once

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"
#include "seedvault/security/secure_key.hpp"

namespace seedvault::security {

    enum class KdfHash : u8 {
        Sha256 = 1,
        Sha512 = 2,
    };

    // Anything below this is rejected outright, whatever the layer.
    inline constexpr u32 kKdfIterationFloor = 100000;

    // Client layer: PBKDF2-HMAC-SHA256, browser-compatible parameters.
    inline constexpr u32 kClientKdfIterations = 500000;
    // Server layer: PBKDF2-HMAC-SHA512, tuned independently of the client.
    inline constexpr u32 kServerKdfIterations = 600000;

    struct KdfParams {
        u32 iterations{kClientKdfIterations};
        KdfHash hash{KdfHash::Sha256};
    };

    inline constexpr KdfParams kClientKdf{kClientKdfIterations, KdfHash::Sha256};
    inline constexpr KdfParams kServerKdf{kServerKdfIterations, KdfHash::Sha512};

    // Deterministic for identical (password, salt, params). Blocks the calling
    // thread for the whole PBKDF2 run.
    //   Invalid         empty password or salt, null out
    //   WeakParameters  iterations below kKdfIterationFloor
    seedvault::core::Status derive_key(BufferView password,
        BufferView salt,
        const KdfParams& params,
        DerivedKey* out) noexcept;

    static_assert(std::is_trivially_copyable_v<KdfParams>);

} // namespace seedvault::security
