#include "seedvault/security/random.hpp"

#include <sodium.h>

namespace seedvault::security {
    seedvault::core::Status ensure_sodium() noexcept {
        if (sodium_init() < 0) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::External, seedvault::core::StatusCode::Unavailable);
        }
        return seedvault::core::ok_status();
    }

    seedvault::core::Status random_fill(seedvault::core::BufferMut out) noexcept {
        if (!seedvault::core::buffer_ok(out)) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        const seedvault::core::Status init = ensure_sodium();
        if (!seedvault::core::is_ok(init)) {
            return init;
        }
        if (out.len > 0) {
            randombytes_buf(out.data, out.len);
        }
        return seedvault::core::ok_status();
    }
} // namespace seedvault::security
