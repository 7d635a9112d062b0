#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::security {
    using u32 = seedvault::core::u32;

    inline constexpr std::size_t kMinPasswordLen = 8;
    inline constexpr std::size_t kMaxPasswordLen = 1024;

    enum class PasswordKind : u32 {
        Login = 0,  // account password: length only
        Master = 1, // vault password: length plus lower, upper, digit, symbol
    };

    struct PasswordStrength {
        u32 score{0}; // 0..5
        const char* label{"Very Weak"};
    };

    // Argon2id (crypto_pwhash_str, interactive limits). The output is the
    // self-describing encoded string stored as the account password hash.
    seedvault::core::Status hash_login_password(std::string_view password, std::string* out) noexcept;

    [[nodiscard]] bool verify_login_password(std::string_view password, std::string_view hash) noexcept;

    // A hash of a random password; verifying against it costs the same as a
    // real account, so unknown emails cannot be told apart by timing. Built
    // on first use and cached; a failed build is logged, returned, and
    // retried on the next call.
    seedvault::core::Status dummy_password_hash(std::string* out) noexcept;

    // Invalid when the password breaks the rules for its kind.
    seedvault::core::Status password_policy_check(std::string_view password, PasswordKind kind) noexcept;

    // One point each for length >= 8, length >= 12, a lower, an upper, a
    // digit, a symbol; minus one for any character repeated three times in a
    // row; clamped to 0..5.
    [[nodiscard]] PasswordStrength password_strength(std::string_view password) noexcept;

    [[nodiscard]] constexpr const char* strength_label(u32 score) noexcept {
        switch (score) {
            case 0:
            case 1: return "Very Weak";
            case 2: return "Weak";
            case 3: return "Fair";
            case 4: return "Good";
            case 5: return "Strong";
            default: return "Very Weak";
        }
    }

} // namespace seedvault::security
