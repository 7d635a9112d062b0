#pragma once

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::security {

    // libsodium must be initialized once per process before any other sodium
    // call; safe to call repeatedly and from several threads.
    seedvault::core::Status ensure_sodium() noexcept;

    // Fills out from the OS CSPRNG. Used for every salt and nonce.
    seedvault::core::Status random_fill(seedvault::core::BufferMut out) noexcept;

} // namespace seedvault::security
