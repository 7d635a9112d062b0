#pragma once

#include <functional>
#include <string_view>

#include "seedvault/core/errors.hpp"
#include "seedvault/security/ledger.hpp"

namespace seedvault::security {

    // Milliseconds to whole seconds, rounded up; what Locked carries in aux.
    [[nodiscard]] constexpr u32 remaining_seconds(i64 remaining_ms) noexcept {
        if (remaining_ms <= 0) {
            return 0;
        }
        return static_cast<u32>((remaining_ms + seedvault::core::kMillisPerSecond - 1) / seedvault::core::kMillisPerSecond);
    }

    // Runs one credential check against both lockout scopes. Neither ledger
    // is owned.
    class LoginGuard {
    public:
        LoginGuard(AttemptLedger& accounts, AttemptLedger& origins) noexcept
            : accounts_(accounts), origins_(origins) {}

        // Locked (aux = seconds left, max over both scopes) without calling
        // verify when either key is locked. Busy without calling verify when
        // in-flight checks already hold every remaining attempt for either
        // key. A failed verify is Authentication, or Locked when that failure
        // tripped a lock.
        seedvault::core::Status attempt(std::string_view account_key,
            std::string_view origin_key,
            const std::function<bool()>& verify);

        // Lock state merged over both scopes.
        [[nodiscard]] LockState check(std::string_view account_key, std::string_view origin_key) const;

    private:
        AttemptLedger& accounts_;
        AttemptLedger& origins_;
    };

} // namespace seedvault::security
