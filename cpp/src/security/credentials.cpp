#include "seedvault/security/credentials.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <mutex>
#include <utility>

#include <sodium.h>

#include "seedvault/core/log.hpp"
#include "seedvault/security/random.hpp"
#include "seedvault/security/secure_key.hpp"

namespace seedvault::security {
    namespace {
        constexpr std::string_view kSymbols = "!@#$%^&*(),.?\":{}|<>";

        [[nodiscard]] bool is_lower(char c) noexcept { return c >= 'a' && c <= 'z'; }
        [[nodiscard]] bool is_upper(char c) noexcept { return c >= 'A' && c <= 'Z'; }
        [[nodiscard]] bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
        [[nodiscard]] bool is_symbol(char c) noexcept { return kSymbols.find(c) != std::string_view::npos; }

        [[nodiscard]] bool has_repeat_triple(std::string_view s) noexcept {
            for (std::size_t i = 2; i < s.size(); ++i) {
                if (s[i] == s[i - 1] && s[i] == s[i - 2]) {
                    return true;
                }
            }
            return false;
        }

        std::mutex g_dummy_mutex;
        std::string g_dummy_hash; // empty until built once

        seedvault::core::Status make_dummy_hash(std::string* out) noexcept {
            std::array<u8, 32> raw{};
            const seedvault::core::Status rs = random_fill(BufferMut{raw.data(), static_cast<u32>(raw.size())});
            if (!seedvault::core::is_ok(rs)) {
                return rs;
            }
            const std::string_view pw(reinterpret_cast<const char*>(raw.data()), raw.size());
            const seedvault::core::Status hs = hash_login_password(pw, out);
            wipe_bytes(raw.data(), raw.size());
            return hs;
        }
    } // namespace

    seedvault::core::Status hash_login_password(std::string_view password, std::string* out) noexcept {
        if (out == nullptr || password.empty() || password.size() > kMaxPasswordLen) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        const seedvault::core::Status init = ensure_sodium();
        if (!seedvault::core::is_ok(init)) {
            return init;
        }

        char encoded[crypto_pwhash_STRBYTES];
        if (crypto_pwhash_str(encoded, password.data(), password.size(),
                crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0) {
            // Out of memory is the only documented failure.
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Crypto);
        }
        out->assign(encoded);
        return seedvault::core::ok_status();
    }

    bool verify_login_password(std::string_view password, std::string_view hash) noexcept {
        if (hash.empty() || hash.size() >= crypto_pwhash_STRBYTES || password.size() > kMaxPasswordLen) {
            return false;
        }
        if (!seedvault::core::is_ok(ensure_sodium())) {
            return false;
        }
        // crypto_pwhash_str_verify wants a NUL-terminated string.
        char encoded[crypto_pwhash_STRBYTES]{};
        std::memcpy(encoded, hash.data(), hash.size());
        return crypto_pwhash_str_verify(encoded, password.data(), password.size()) == 0;
    }

    seedvault::core::Status dummy_password_hash(std::string* out) noexcept {
        if (out == nullptr) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        std::lock_guard<std::mutex> lock(g_dummy_mutex);
        if (g_dummy_hash.empty()) {
            std::string built;
            const seedvault::core::Status s = make_dummy_hash(&built);
            if (!seedvault::core::is_ok(s)) {
                seedvault::core::log_status(seedvault::core::LogLevel::Error, "dummy password hash", s);
                return s;
            }
            g_dummy_hash = std::move(built);
        }
        *out = g_dummy_hash;
        return seedvault::core::ok_status();
    }

    seedvault::core::Status password_policy_check(std::string_view password, PasswordKind kind) noexcept {
        const auto invalid = seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        if (password.size() < kMinPasswordLen || password.size() > kMaxPasswordLen) {
            return invalid;
        }
        if (kind == PasswordKind::Login) {
            return seedvault::core::ok_status();
        }

        bool lower = false;
        bool upper = false;
        bool digit = false;
        bool symbol = false;
        for (char c : password) {
            if (is_lower(c)) {
                lower = true;
            } else if (is_upper(c)) {
                upper = true;
            } else if (is_digit(c)) {
                digit = true;
            } else if (is_symbol(c)) {
                symbol = true;
            } else {
                return invalid;
            }
        }
        if (!(lower && upper && digit && symbol)) {
            return invalid;
        }
        return seedvault::core::ok_status();
    }

    PasswordStrength password_strength(std::string_view password) noexcept {
        int score = 0;
        if (password.size() >= 8) {
            score += 1;
        }
        if (password.size() >= 12) {
            score += 1;
        }
        if (std::any_of(password.begin(), password.end(), is_lower)) {
            score += 1;
        }
        if (std::any_of(password.begin(), password.end(), is_upper)) {
            score += 1;
        }
        if (std::any_of(password.begin(), password.end(), is_digit)) {
            score += 1;
        }
        if (std::any_of(password.begin(), password.end(), is_symbol)) {
            score += 1;
        }
        if (has_repeat_triple(password)) {
            score -= 1;
        }
        score = std::clamp(score, 0, 5);

        PasswordStrength out;
        out.score = static_cast<u32>(score);
        out.label = strength_label(out.score);
        return out;
    }
} // namespace seedvault::security
