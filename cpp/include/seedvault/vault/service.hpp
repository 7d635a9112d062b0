#pragma once

#include <string>
#include <string_view>

#include "seedvault/core/clock.hpp"
#include "seedvault/core/config.hpp"
#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"
#include "seedvault/db/db.hpp"
#include "seedvault/security/kdf.hpp"
#include "seedvault/security/ledger.hpp"
#include "seedvault/security/login_guard.hpp"

namespace seedvault::vault {
    using AccountId = seedvault::core::AccountId;
    using Status = seedvault::core::Status;
    using Timestamp = seedvault::core::Timestamp;

    // Audit actions.
    inline constexpr const char* kAuditRegistrationSuccess = "REGISTRATION_SUCCESS";
    inline constexpr const char* kAuditRegistrationFailed = "REGISTRATION_FAILED";
    inline constexpr const char* kAuditLoginSuccess = "LOGIN_SUCCESS";
    inline constexpr const char* kAuditLoginFailed = "LOGIN_FAILED";
    inline constexpr const char* kAuditLoginFailedLocked = "LOGIN_FAILED_LOCKED";
    inline constexpr const char* kAuditAccountLocked = "ACCOUNT_LOCKED";
    inline constexpr const char* kAuditVaultCreated = "VAULT_CREATED";
    inline constexpr const char* kAuditVaultUpdated = "VAULT_UPDATED";
    inline constexpr const char* kAuditVaultAccessed = "VAULT_ACCESSED";
    inline constexpr const char* kAuditVaultExported = "VAULT_EXPORTED";
    inline constexpr const char* kAuditVaultDeleted = "VAULT_DELETED";
    inline constexpr const char* kAuditVaultUnavailable = "VAULT_UNAVAILABLE";

    struct AccountView {
        AccountId id{AccountId::invalid()};
        std::string email;
        Timestamp created_at{0};
    };

    struct LoginResult {
        std::string token;
        AccountView account;
    };

    // The client envelope with the server layer removed.
    struct VaultView {
        std::string encrypted_data;
        std::string client_salt;
        std::string version;
        Timestamp updated_at{0};
        Timestamp last_accessed{0};
    };

    [[nodiscard]] seedvault::security::LedgerPolicy account_policy(const seedvault::core::ServiceConfig& cfg) noexcept;
    [[nodiscard]] seedvault::security::LedgerPolicy origin_policy(const seedvault::core::ServiceConfig& cfg) noexcept;
    [[nodiscard]] seedvault::security::KdfParams server_kdf_params(const seedvault::core::ServiceConfig& cfg) noexcept;

    // Trimmed and lower-cased; false if it does not look like an address.
    [[nodiscard]] bool normalize_email(std::string_view email, std::string* out);

    // Accounts, login and the stored vault. The service never sees the
    // master password or the vault plaintext: it stores the client envelope
    // wrapped in the server envelope.
    //
    // `origin` is always an origin fingerprint (see origin_fingerprint), used
    // as the origin-scope ledger key and in the audit trail.
    //
    // The config is taken as given; run config_validate first. Thread-safe:
    // the ledgers and the database handle serialize internally.
    class VaultService {
    public:
        VaultService(seedvault::core::ServiceConfig cfg, seedvault::db::DbHandle db, const seedvault::core::Clock& clock);

        VaultService(const VaultService&) = delete;
        VaultService& operator=(const VaultService&) = delete;

        //   Invalid   malformed email or a password outside 8..1024 chars
        //   Conflict  email already registered
        Status register_account(std::string_view email, std::string_view password, std::string_view origin, AccountView* out);

        // Unknown email and wrong password are both Authentication and both
        // count against the ledgers. Locked carries the seconds left in aux.
        // Busy when concurrent checks already hold the remaining attempts.
        Status login(std::string_view email, std::string_view password, std::string_view origin, LoginResult* out);

        // Authentication for a bad or expired token or a deleted account;
        // Locked while the account is locked out.
        Status authenticate(std::string_view token, AccountId* out);

        // Both fields must be non-empty base64 (Invalid otherwise).
        Status put_vault(AccountId account,
            std::string_view encrypted_data,
            std::string_view client_salt,
            std::string_view origin,
            Timestamp* updated_at);

        // NotFound when there is no vault; Unavailable when the server layer
        // does not open (wrong server key, corruption).
        Status get_vault(AccountId account, std::string_view origin, VaultView* out);
        Status export_vault(AccountId account, std::string_view origin, VaultView* out);

        Status delete_vault(AccountId account, std::string_view origin);

        [[nodiscard]] seedvault::security::AttemptLedger& account_ledger() noexcept { return accounts_; }
        [[nodiscard]] seedvault::security::AttemptLedger& origin_ledger() noexcept { return origins_; }
        [[nodiscard]] const seedvault::core::Clock& clock() const noexcept { return clock_; }

    private:
        Status open_stored(AccountId account, std::string_view origin, const char* action, VaultView* out);
        void audit(AccountId account, std::string_view email, const char* action, std::string_view origin, std::string_view details = {});

        seedvault::core::ServiceConfig cfg_;
        seedvault::db::DbHandle db_;
        const seedvault::core::Clock& clock_;
        seedvault::security::KdfParams server_kdf_;
        seedvault::security::AttemptLedger accounts_;
        seedvault::security::AttemptLedger origins_;
        seedvault::security::LoginGuard guard_;
    };

} // namespace seedvault::vault
