#pragma once

#include <functional>
#include <string>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/log.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::core {

    inline constexpr u32 kMinSecretLen = 32;
    inline constexpr u32 kMinServerKdfIterations = 600000;
    inline constexpr u32 kOriginMaxAttemptsLow = 5;
    inline constexpr u32 kOriginMaxAttemptsHigh = 10;
    inline constexpr i64 kMaxTokenTtlSeconds = 365 * 24 * 60 * 60;

    struct ServiceConfig {
        std::string db_path{":memory:"};
        std::string journal_mode{"WAL"};
        std::string server_key;   // secret
        std::string token_secret; // secret
        i64 token_ttl_seconds{7 * 24 * 60 * 60};
        u32 max_login_attempts{5};
        u32 lockout_minutes{15};
        u32 origin_max_attempts{5};
        u32 origin_lockout_minutes{15};
        u32 origin_max_lockout_minutes{24 * 60};
        u32 server_kdf_iterations{600000};
        LogLevel log_level{LogLevel::Info};
    };

    // Returns the value of a variable, or nullptr when unset.
    using EnvLookup = std::function<const char*(const char*)>;

    // Reads SEEDVAULT_* variables over the defaults above. Unset or empty
    // variables keep their default; an unparsable number or log level is
    // Invalid. Does not validate ranges, see config_validate.
    Status config_from_lookup(const EnvLookup& lookup, ServiceConfig* out);
    Status config_from_env(ServiceConfig* out);

    //   WeakParameters  server iterations below 600000, a secret shorter than
    //                   32 bytes, a zero lockout threshold or duration
    //   Invalid         origin threshold outside 5..10, ceiling below the
    //                   initial origin lock, unknown journal mode, empty path
    Status config_validate(const ServiceConfig& cfg) noexcept;

} // namespace seedvault::core
