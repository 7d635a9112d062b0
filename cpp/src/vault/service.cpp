#include "seedvault/vault/service.hpp"

#include <utility>

#include "seedvault/core/log.hpp"
#include "seedvault/encoding/base64.hpp"
#include "seedvault/security/credentials.hpp"
#include "seedvault/security/secure_key.hpp"
#include "seedvault/security/server_envelope.hpp"
#include "seedvault/security/token.hpp"

namespace seedvault::vault {
    using seedvault::core::LogLevel;
    using seedvault::core::StatusCode;
    using seedvault::core::StatusDomain;

    namespace {
        constexpr std::size_t kMaxEmailLen = 254;

        [[nodiscard]] Status vault_status(StatusCode code, seedvault::core::u32 aux = 0) noexcept {
            return seedvault::core::make_status(StatusDomain::Vault, code, aux);
        }

        [[nodiscard]] std::string account_key(std::string_view email) {
            std::string key = "acct:";
            key += email;
            return key;
        }

        [[nodiscard]] std::string_view origin_or_unknown(std::string_view origin) noexcept {
            return origin.empty() ? std::string_view("unknown") : origin;
        }

        [[nodiscard]] bool stored_field_ok(std::string_view s) noexcept {
            return !s.empty() && s.size() <= seedvault::core::kMaxPayloadBytes && seedvault::encoding::base64_is_valid(s);
        }
    } // namespace

    seedvault::security::LedgerPolicy account_policy(const seedvault::core::ServiceConfig& cfg) noexcept {
        const seedvault::core::i64 lock_ms = static_cast<seedvault::core::i64>(cfg.lockout_minutes) * seedvault::core::kMillisPerMinute;
        return seedvault::security::LedgerPolicy{cfg.max_login_attempts, lock_ms, lock_ms, false};
    }

    seedvault::security::LedgerPolicy origin_policy(const seedvault::core::ServiceConfig& cfg) noexcept {
        return seedvault::security::LedgerPolicy{cfg.origin_max_attempts,
            static_cast<seedvault::core::i64>(cfg.origin_lockout_minutes) * seedvault::core::kMillisPerMinute,
            static_cast<seedvault::core::i64>(cfg.origin_max_lockout_minutes) * seedvault::core::kMillisPerMinute,
            true};
    }

    seedvault::security::KdfParams server_kdf_params(const seedvault::core::ServiceConfig& cfg) noexcept {
        return seedvault::security::KdfParams{cfg.server_kdf_iterations, seedvault::security::KdfHash::Sha512};
    }

    bool normalize_email(std::string_view email, std::string* out) {
        while (!email.empty() && (email.front() == ' ' || email.front() == '\t')) {
            email.remove_prefix(1);
        }
        while (!email.empty() && (email.back() == ' ' || email.back() == '\t')) {
            email.remove_suffix(1);
        }
        if (out == nullptr || email.empty() || email.size() > kMaxEmailLen) {
            return false;
        }

        const std::size_t at = email.find('@');
        if (at == 0 || at == std::string_view::npos || email.find('@', at + 1) != std::string_view::npos) {
            return false;
        }
        const std::string_view domain = email.substr(at + 1);
        const std::size_t dot = domain.rfind('.');
        if (domain.empty() || dot == 0 || dot == std::string_view::npos || dot + 1 == domain.size()) {
            return false;
        }

        std::string norm;
        norm.reserve(email.size());
        for (char c : email) {
            const auto uc = static_cast<unsigned char>(c);
            if (uc <= 0x20 || uc == 0x7f) {
                return false;
            }
            norm.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
        }
        *out = std::move(norm);
        return true;
    }

    VaultService::VaultService(seedvault::core::ServiceConfig cfg, seedvault::db::DbHandle db, const seedvault::core::Clock& clock)
        : cfg_(std::move(cfg)),
          db_(db),
          clock_(clock),
          server_kdf_(server_kdf_params(cfg_)),
          accounts_(account_policy(cfg_), clock),
          origins_(origin_policy(cfg_), clock),
          guard_(accounts_, origins_) {}

    void VaultService::audit(AccountId account, std::string_view email, const char* action, std::string_view origin, std::string_view details) {
        seedvault::db::AuditEntry entry;
        entry.account = account;
        entry.email = std::string(email);
        entry.action = action;
        entry.origin = std::string(origin_or_unknown(origin));
        entry.details = std::string(details);
        entry.at = clock_.now_ms();

        const Status s = seedvault::db::db_audit_append(db_, entry);
        if (!seedvault::core::is_ok(s)) {
            seedvault::core::log_status(LogLevel::Warn, action, s);
        }
    }

    Status VaultService::register_account(std::string_view email, std::string_view password, std::string_view origin, AccountView* out) {
        if (out == nullptr) {
            return vault_status(StatusCode::Invalid);
        }
        std::string norm;
        if (!normalize_email(email, &norm)) {
            return vault_status(StatusCode::Invalid);
        }
        Status s = seedvault::security::password_policy_check(password, seedvault::security::PasswordKind::Login);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        std::string hash;
        s = seedvault::security::hash_login_password(password, &hash);
        if (!seedvault::core::is_ok(s)) {
            seedvault::core::log_status(LogLevel::Error, "password hash", s);
            return s;
        }

        const Timestamp now = clock_.now_ms();
        AccountId id{};
        s = seedvault::db::db_account_create(db_, norm, hash, now, &id);
        if (s.code == StatusCode::Conflict) {
            audit(AccountId::invalid(), norm, kAuditRegistrationFailed, origin, "exists");
            return vault_status(StatusCode::Conflict);
        }
        if (!seedvault::core::is_ok(s)) {
            seedvault::core::log_status(LogLevel::Error, "account create", s);
            return s;
        }

        audit(id, norm, kAuditRegistrationSuccess, origin);
        seedvault::core::log_write(LogLevel::Info, "account %llu registered", static_cast<unsigned long long>(id.v));

        out->id = id;
        out->email = std::move(norm);
        out->created_at = now;
        return seedvault::core::ok_status();
    }

    Status VaultService::login(std::string_view email, std::string_view password, std::string_view origin, LoginResult* out) {
        if (out == nullptr) {
            return vault_status(StatusCode::Invalid);
        }
        std::string norm;
        if (!normalize_email(email, &norm) || password.empty() || password.size() > seedvault::security::kMaxPasswordLen) {
            return vault_status(StatusCode::Invalid);
        }
        const std::string acct_key = account_key(norm);
        const std::string_view origin_key = origin_or_unknown(origin);

        const seedvault::security::LockState pre = guard_.check(acct_key, origin_key);
        if (pre.locked) {
            audit(AccountId::invalid(), norm, kAuditLoginFailedLocked, origin);
            return vault_status(StatusCode::Locked, seedvault::security::remaining_seconds(pre.remaining_ms));
        }

        seedvault::db::AccountRecord rec;
        const Status found = seedvault::db::db_account_find_by_email(db_, norm, &rec);
        if (!seedvault::core::is_ok(found) && found.code != StatusCode::NotFound) {
            seedvault::core::log_status(LogLevel::Error, "account lookup", found);
            return found;
        }
        const bool known = seedvault::core::is_ok(found);

        // Without a dummy hash an unknown email would answer faster than a
        // wrong password, so refuse the login instead.
        std::string dummy_hash;
        if (!known) {
            const Status ds = seedvault::security::dummy_password_hash(&dummy_hash);
            if (!seedvault::core::is_ok(ds)) {
                return vault_status(StatusCode::Unknown);
            }
        }

        const Status verdict = guard_.attempt(acct_key, origin_key, [&]() {
            if (!known) {
                // Same cost as a real check; always a failure.
                (void)seedvault::security::verify_login_password(password, dummy_hash);
                return false;
            }
            return seedvault::security::verify_login_password(password, rec.password_hash);
        });

        if (verdict.code == StatusCode::Locked) {
            audit(rec.id, norm, kAuditLoginFailed, origin);
            audit(rec.id, norm, kAuditAccountLocked, origin);
            seedvault::core::log_write(LogLevel::Warn, "login locked out for %u s", static_cast<unsigned>(verdict.aux));
            return vault_status(StatusCode::Locked, verdict.aux);
        }
        if (verdict.code == StatusCode::Busy) {
            audit(rec.id, norm, kAuditLoginFailed, origin);
            seedvault::core::log_write(LogLevel::Warn, "login refused: attempt limit held by checks in progress");
            return vault_status(StatusCode::Busy);
        }
        if (!seedvault::core::is_ok(verdict)) {
            audit(rec.id, norm, kAuditLoginFailed, origin);
            return vault_status(StatusCode::Authentication);
        }

        if (cfg_.token_ttl_seconds <= 0 || cfg_.token_ttl_seconds > seedvault::core::kMaxTokenTtlSeconds) {
            seedvault::core::log_write(LogLevel::Error, "token ttl out of range: %lld s",
                static_cast<long long>(cfg_.token_ttl_seconds));
            return vault_status(StatusCode::Unknown);
        }
        const Timestamp now = clock_.now_ms();
        std::string token;
        const Status ts = seedvault::security::issue_token(cfg_.token_secret, rec.id, now,
            cfg_.token_ttl_seconds * seedvault::core::kMillisPerSecond, &token);
        if (!seedvault::core::is_ok(ts)) {
            seedvault::core::log_status(LogLevel::Error, "token issue", ts);
            return vault_status(StatusCode::Unknown);
        }
        const Status touch = seedvault::db::db_account_touch_login(db_, rec.id, now);
        if (!seedvault::core::is_ok(touch)) {
            seedvault::core::log_status(LogLevel::Warn, "last login update", touch);
        }
        audit(rec.id, norm, kAuditLoginSuccess, origin);

        out->token = std::move(token);
        out->account.id = rec.id;
        out->account.email = std::move(rec.email);
        out->account.created_at = rec.created_at;
        return seedvault::core::ok_status();
    }

    Status VaultService::authenticate(std::string_view token, AccountId* out) {
        if (out == nullptr) {
            return vault_status(StatusCode::Invalid);
        }
        AccountId id{};
        const Status ts = seedvault::security::verify_token(cfg_.token_secret, token, clock_.now_ms(), &id);
        if (!seedvault::core::is_ok(ts)) {
            return vault_status(StatusCode::Authentication);
        }

        seedvault::db::AccountRecord rec;
        const Status s = seedvault::db::db_account_get(db_, id, &rec);
        if (s.code == StatusCode::NotFound) {
            return vault_status(StatusCode::Authentication);
        }
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        const seedvault::security::LockState lock = accounts_.is_locked(account_key(rec.email));
        if (lock.locked) {
            return vault_status(StatusCode::Locked, seedvault::security::remaining_seconds(lock.remaining_ms));
        }
        *out = id;
        return seedvault::core::ok_status();
    }

    Status VaultService::put_vault(AccountId account,
        std::string_view encrypted_data,
        std::string_view client_salt,
        std::string_view origin,
        Timestamp* updated_at) {
        if (!account.is_valid() || !stored_field_ok(encrypted_data) || !stored_field_ok(client_salt)) {
            return vault_status(StatusCode::Invalid);
        }

        seedvault::security::WrappedVault wrapped;
        Status s = seedvault::security::wrap_vault(cfg_.server_key, account, encrypted_data, server_kdf_, &wrapped);
        if (!seedvault::core::is_ok(s)) {
            seedvault::core::log_status(LogLevel::Error, "server wrap", s);
            return s;
        }

        seedvault::db::VaultRecord rec;
        rec.account = account;
        rec.encrypted_data = std::move(wrapped.blob);
        rec.server_salt = std::move(wrapped.salt);
        rec.client_salt = std::string(client_salt);

        const Timestamp now = clock_.now_ms();
        bool created = false;
        s = seedvault::db::db_vault_upsert(db_, rec, now, &created);
        if (!seedvault::core::is_ok(s)) {
            seedvault::core::log_status(LogLevel::Error, "vault upsert", s);
            return s;
        }

        audit(account, {}, created ? kAuditVaultCreated : kAuditVaultUpdated, origin);
        if (updated_at != nullptr) {
            *updated_at = now;
        }
        return seedvault::core::ok_status();
    }

    Status VaultService::open_stored(AccountId account, std::string_view origin, const char* action, VaultView* out) {
        if (out == nullptr || !account.is_valid()) {
            return vault_status(StatusCode::Invalid);
        }

        seedvault::db::VaultRecord rec;
        Status s = seedvault::db::db_vault_get(db_, account, &rec);
        if (s.code == StatusCode::NotFound) {
            return vault_status(StatusCode::NotFound);
        }
        if (!seedvault::core::is_ok(s)) {
            seedvault::core::log_status(LogLevel::Error, "vault read", s);
            return s;
        }

        std::string inner;
        s = seedvault::security::unwrap_vault(cfg_.server_key, account, rec.server_salt, rec.encrypted_data, server_kdf_, &inner);
        if (!seedvault::core::is_ok(s)) {
            seedvault::core::log_write(LogLevel::Warn, "vault for account %llu did not unwrap",
                static_cast<unsigned long long>(account.v));
            audit(account, {}, kAuditVaultUnavailable, origin);
            return vault_status(StatusCode::Unavailable);
        }

        const Timestamp now = clock_.now_ms();
        const Status touch = seedvault::db::db_vault_touch_access(db_, account, now);
        if (!seedvault::core::is_ok(touch)) {
            seedvault::core::log_status(LogLevel::Warn, "vault access update", touch);
        }
        audit(account, {}, action, origin);

        out->encrypted_data = std::move(inner);
        out->client_salt = std::move(rec.client_salt);
        out->version = std::move(rec.version);
        out->updated_at = rec.updated_at;
        out->last_accessed = now;
        return seedvault::core::ok_status();
    }

    Status VaultService::get_vault(AccountId account, std::string_view origin, VaultView* out) {
        return open_stored(account, origin, kAuditVaultAccessed, out);
    }

    Status VaultService::export_vault(AccountId account, std::string_view origin, VaultView* out) {
        return open_stored(account, origin, kAuditVaultExported, out);
    }

    Status VaultService::delete_vault(AccountId account, std::string_view origin) {
        if (!account.is_valid()) {
            return vault_status(StatusCode::Invalid);
        }
        const Status s = seedvault::db::db_vault_delete(db_, account);
        if (s.code == StatusCode::NotFound) {
            return vault_status(StatusCode::NotFound);
        }
        if (!seedvault::core::is_ok(s)) {
            seedvault::core::log_status(LogLevel::Error, "vault delete", s);
            return s;
        }
        audit(account, {}, kAuditVaultDeleted, origin);
        return seedvault::core::ok_status();
    }
} // namespace seedvault::vault
