#include "seedvault/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <system_error>
#include <utility>

namespace seedvault::core {
    namespace {
        constexpr const char* kJournalModes[] = {"WAL", "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "OFF"};

        [[nodiscard]] Status invalid() noexcept {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        [[nodiscard]] Status weak() noexcept {
            return make_status(StatusDomain::Core, StatusCode::WeakParameters);
        }

        [[nodiscard]] const char* get(const EnvLookup& lookup, const char* name) {
            const char* v = lookup(name);
            return (v == nullptr || v[0] == '\0') ? nullptr : v;
        }

        template <typename T>
        [[nodiscard]] bool read_number(const EnvLookup& lookup, const char* name, T* out) {
            const char* v = get(lookup, name);
            if (v == nullptr) {
                return true;
            }
            const std::string_view s(v);
            T parsed{};
            const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed);
            if (ec != std::errc() || ptr != s.data() + s.size()) {
                log_write(LogLevel::Error, "%s: not a number", name);
                return false;
            }
            *out = parsed;
            return true;
        }

        void read_string(const EnvLookup& lookup, const char* name, std::string* out) {
            const char* v = get(lookup, name);
            if (v != nullptr) {
                out->assign(v);
            }
        }
    } // namespace

    Status config_from_lookup(const EnvLookup& lookup, ServiceConfig* out) {
        if (out == nullptr || !lookup) {
            return invalid();
        }

        ServiceConfig cfg;
        read_string(lookup, "SEEDVAULT_DB_PATH", &cfg.db_path);
        read_string(lookup, "SEEDVAULT_DB_JOURNAL_MODE", &cfg.journal_mode);
        read_string(lookup, "SEEDVAULT_SERVER_KEY", &cfg.server_key);
        read_string(lookup, "SEEDVAULT_TOKEN_SECRET", &cfg.token_secret);

        const bool numbers_ok =
            read_number(lookup, "SEEDVAULT_TOKEN_TTL_SECONDS", &cfg.token_ttl_seconds) &&
            read_number(lookup, "SEEDVAULT_MAX_LOGIN_ATTEMPTS", &cfg.max_login_attempts) &&
            read_number(lookup, "SEEDVAULT_LOCKOUT_MINUTES", &cfg.lockout_minutes) &&
            read_number(lookup, "SEEDVAULT_ORIGIN_MAX_ATTEMPTS", &cfg.origin_max_attempts) &&
            read_number(lookup, "SEEDVAULT_ORIGIN_LOCKOUT_MINUTES", &cfg.origin_lockout_minutes) &&
            read_number(lookup, "SEEDVAULT_ORIGIN_MAX_LOCKOUT_MINUTES", &cfg.origin_max_lockout_minutes) &&
            read_number(lookup, "SEEDVAULT_SERVER_KDF_ITERATIONS", &cfg.server_kdf_iterations);
        if (!numbers_ok) {
            return invalid();
        }

        if (const char* level = get(lookup, "SEEDVAULT_LOG_LEVEL"); level != nullptr) {
            if (!log_level_parse(level, &cfg.log_level)) {
                log_write(LogLevel::Error, "SEEDVAULT_LOG_LEVEL: unknown level '%s'", level);
                return invalid();
            }
        }

        *out = std::move(cfg);
        return ok_status();
    }

    Status config_from_env(ServiceConfig* out) {
        return config_from_lookup([](const char* name) { return std::getenv(name); }, out);
    }

    Status config_validate(const ServiceConfig& cfg) noexcept {
        if (cfg.db_path.empty()) {
            return invalid();
        }
        bool journal_ok = false;
        for (const char* mode : kJournalModes) {
            if (cfg.journal_mode == mode) {
                journal_ok = true;
            }
        }
        if (!journal_ok) {
            return invalid();
        }

        if (cfg.server_key.size() < kMinSecretLen || cfg.token_secret.size() < kMinSecretLen) {
            return weak();
        }
        if (cfg.server_kdf_iterations < kMinServerKdfIterations) {
            return weak();
        }
        if (cfg.token_ttl_seconds <= 0 || cfg.token_ttl_seconds > kMaxTokenTtlSeconds) {
            return invalid();
        }
        if (cfg.max_login_attempts == 0 || cfg.lockout_minutes == 0 || cfg.origin_lockout_minutes == 0) {
            return weak();
        }
        if (cfg.origin_max_attempts < kOriginMaxAttemptsLow || cfg.origin_max_attempts > kOriginMaxAttemptsHigh) {
            return invalid();
        }
        if (cfg.origin_max_lockout_minutes < cfg.origin_lockout_minutes) {
            return invalid();
        }
        return ok_status();
    }
} // namespace seedvault::core
