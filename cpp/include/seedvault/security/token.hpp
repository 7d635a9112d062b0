#pragma once

#include <string>
#include <string_view>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::security {

    // Bearer tokens: "v1.<account id>.<expiry ms>.<base64url HMAC-SHA256>".
    // The MAC covers everything before the last dot.
    inline constexpr std::string_view kTokenVersion = "v1";

    // Invalid for a non-positive ttl or when now + ttl_ms overflows.
    seedvault::core::Status issue_token(std::string_view secret,
        seedvault::core::AccountId account,
        seedvault::core::Timestamp now,
        seedvault::core::i64 ttl_ms,
        std::string* out) noexcept;

    // Authentication for malformed tokens, a MAC mismatch or expiry
    // (now >= expiry).
    seedvault::core::Status verify_token(std::string_view secret,
        std::string_view token,
        seedvault::core::Timestamp now,
        seedvault::core::AccountId* out) noexcept;

} // namespace seedvault::security
