#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::db {
    using u32 = seedvault::core::u32;
    using u64 = seedvault::core::u64;
    using AccountId = seedvault::core::AccountId;
    using Timestamp = seedvault::core::Timestamp;

    struct DbConfig {
        const char* path{nullptr};         // nullptr: ":memory:"
        const char* journal_mode{nullptr}; // nullptr: "WAL"
    };

    struct DbHandle {
        u32 id{0};
    };

    [[nodiscard]] constexpr bool db_handle_valid(DbHandle h) noexcept {
        return h.id != 0;
    }

    struct AccountRecord {
        AccountId id{AccountId::invalid()};
        std::string email;
        std::string password_hash;
        Timestamp created_at{0};
        Timestamp last_login{0};
    };

    // One vault per account. encrypted_data is the server envelope; the
    // client envelope inside it is never visible at this layer.
    struct VaultRecord {
        AccountId account{AccountId::invalid()};
        std::string encrypted_data;
        std::string server_salt;
        std::string client_salt;
        std::string version{"1.0"};
        Timestamp created_at{0};
        Timestamp updated_at{0};
        Timestamp last_accessed{0};
    };

    // Never carries secrets or raw client addresses; origin is the
    // fingerprint.
    struct AuditEntry {
        AccountId account{AccountId::invalid()};
        std::string email;
        std::string action;
        std::string origin;
        std::string details;
        Timestamp at{0};
    };

    // Every handle owns its own connection and mutex. Failures to open or
    // run statements are Transport (aux = sqlite result code).
    seedvault::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    seedvault::core::Status db_close(DbHandle db) noexcept;

    // Conflict when the email is taken.
    seedvault::core::Status db_account_create(DbHandle db,
        std::string_view email,
        std::string_view password_hash,
        Timestamp now,
        AccountId* out) noexcept;
    seedvault::core::Status db_account_find_by_email(DbHandle db, std::string_view email, AccountRecord* out) noexcept;
    seedvault::core::Status db_account_get(DbHandle db, AccountId id, AccountRecord* out) noexcept;
    seedvault::core::Status db_account_touch_login(DbHandle db, AccountId id, Timestamp now) noexcept;

    // Inserts or replaces the account's vault. created_at survives updates;
    // updated_at and last_accessed are set to now. created is optional.
    seedvault::core::Status db_vault_upsert(DbHandle db, const VaultRecord& rec, Timestamp now, bool* created) noexcept;
    seedvault::core::Status db_vault_get(DbHandle db, AccountId account, VaultRecord* out) noexcept;
    seedvault::core::Status db_vault_touch_access(DbHandle db, AccountId account, Timestamp now) noexcept;
    seedvault::core::Status db_vault_delete(DbHandle db, AccountId account) noexcept;

    seedvault::core::Status db_audit_append(DbHandle db, const AuditEntry& entry) noexcept;
    // Empty action counts every action; an invalid account counts every
    // account.
    seedvault::core::Status db_audit_count(DbHandle db, AccountId account, std::string_view action, u64* out) noexcept;

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbHandle>);

} // namespace seedvault::db
