#pragma once

#include <string>
#include <string_view>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::security {

    // Trimmed, lower-cased address. Anything outside the IPv4/IPv6 character
    // set (digits, hex letters, '.', ':') becomes "unknown".
    [[nodiscard]] std::string normalize_client_address(std::string_view remote_addr);

    // Origin key for the lockout ledger: "fp_" + 32 hex chars of a BLAKE3
    // hash over the normalized address. Request headers are client-chosen and
    // never part of the key. The raw address never leaves this function.
    [[nodiscard]] std::string origin_fingerprint(std::string_view remote_addr);

    seedvault::core::Status fingerprint_hash(std::string_view normalized_addr, seedvault::core::Hash256* out) noexcept;

} // namespace seedvault::security
