#include "seedvault/db/db.hpp"
#include <sqlite3.h>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace seedvault::db {

using namespace seedvault::core;

namespace {
    struct DbState {
        sqlite3* db = nullptr;
        std::mutex mutex;

        ~DbState() {
            if (db) {
                sqlite3_close(db);
            }
        }
    };

    // Open handles by id. Operations hold a shared_ptr so a concurrent
    // db_close cannot pull the connection out from under them.
    std::mutex g_registry_mutex;
    std::unordered_map<u32, std::shared_ptr<DbState>> g_handles;
    u32 g_next_id = 1;

    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS accounts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            email TEXT NOT NULL UNIQUE,
            password_hash TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            last_login INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS vaults (
            account_id INTEGER PRIMARY KEY REFERENCES accounts(id) ON DELETE CASCADE,
            encrypted_data TEXT NOT NULL,
            server_salt TEXT NOT NULL,
            client_salt TEXT NOT NULL,
            version TEXT NOT NULL DEFAULT '1.0',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            last_accessed INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_vaults_updated ON vaults(account_id, updated_at);

        CREATE TABLE IF NOT EXISTS audit_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            account_id INTEGER NOT NULL DEFAULT 0,
            email TEXT NOT NULL,
            action TEXT NOT NULL,
            origin TEXT NOT NULL,
            details TEXT NOT NULL DEFAULT '',
            at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_audit_account ON audit_log(account_id, at);
        CREATE INDEX IF NOT EXISTS idx_audit_email ON audit_log(email, at);
        CREATE INDEX IF NOT EXISTS idx_audit_action ON audit_log(action, at);
    )SQL";

    [[nodiscard]] Status transport(int rc) noexcept {
        return make_status(StatusDomain::Db, StatusCode::Transport, static_cast<u32>(rc));
    }

    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    [[nodiscard]] std::shared_ptr<DbState> find_state(DbHandle h) noexcept {
        if (!db_handle_valid(h)) {
            return nullptr;
        }
        std::lock_guard<std::mutex> lock(g_registry_mutex);
        const auto it = g_handles.find(h.id);
        return it == g_handles.end() ? nullptr : it->second;
    }

    // A null data pointer would bind NULL; empty strings stay ''.
    void bind_text(sqlite3_stmt* stmt, int idx, std::string_view s) noexcept {
        sqlite3_bind_text(stmt, idx, s.data() ? s.data() : "", static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }

    [[nodiscard]] std::string column_text(sqlite3_stmt* stmt, int col) {
        const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        if (!p) {
            return std::string();
        }
        return std::string(p, static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
    }

    [[nodiscard]] bool journal_mode_known(const char* mode) noexcept {
        static constexpr const char* kModes[] = {"WAL", "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "OFF"};
        for (const char* m : kModes) {
            if (std::strcmp(m, mode) == 0) {
                return true;
            }
        }
        return false;
    }

    // Runs a statement that returns no rows; NotFound when it touched none.
    [[nodiscard]] Status exec_changes(sqlite3* db, sqlite3_stmt* stmt) noexcept {
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return transport(rc);
        }
        if (sqlite3_changes(db) == 0) {
            return make_status(StatusDomain::Db, StatusCode::NotFound);
        }
        return ok_status();
    }

    constexpr const char* kAccountColumns = "SELECT id, email, password_hash, created_at, last_login FROM accounts ";

    [[nodiscard]] Status read_account(sqlite3_stmt* stmt, AccountRecord* out) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            out->id = AccountId{static_cast<u64>(sqlite3_column_int64(stmt, 0))};
            out->email = column_text(stmt, 1);
            out->password_hash = column_text(stmt, 2);
            out->created_at = sqlite3_column_int64(stmt, 3);
            out->last_login = sqlite3_column_int64(stmt, 4);
            sqlite3_finalize(stmt);
            return ok_status();
        }
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return make_status(StatusDomain::Db, StatusCode::NotFound);
        }
        return transport(rc);
    }
}

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return invalid();
    }
    const char* journal_mode = cfg.journal_mode ? cfg.journal_mode : "WAL";
    if (!journal_mode_known(journal_mode)) {
        return invalid();
    }

    auto state = std::make_shared<DbState>();
    const char* path = cfg.path ? cfg.path : ":memory:";
    int rc = sqlite3_open_v2(path, &state->db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }
    sqlite3_busy_timeout(state->db, 5000);

    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    // In-memory databases refuse WAL and stay on MEMORY; not an error.
    sqlite3_exec(state->db, journal_sql.c_str(), nullptr, nullptr, nullptr);
    sqlite3_exec(state->db, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);

    char* err_msg = nullptr;
    rc = sqlite3_exec(state->db, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        if (err_msg) {
            sqlite3_free(err_msg);
        }
        return transport(rc);
    }

    std::lock_guard<std::mutex> lock(g_registry_mutex);
    const u32 id = g_next_id++;
    g_handles.emplace(id, std::move(state));
    out->id = id;
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    if (!db_handle_valid(db)) {
        return invalid();
    }

    std::shared_ptr<DbState> state;
    {
        std::lock_guard<std::mutex> lock(g_registry_mutex);
        const auto it = g_handles.find(db.id);
        if (it == g_handles.end()) {
            return invalid();
        }
        state = std::move(it->second);
        g_handles.erase(it);
    }
    // Waits for an in-flight statement before the connection goes away.
    std::lock_guard<std::mutex> lock(state->mutex);
    return ok_status();
}

// ============================================================================
// Accounts
// ============================================================================

Status db_account_create(DbHandle db, std::string_view email, std::string_view password_hash, Timestamp now, AccountId* out) noexcept {
    if (!out || email.empty() || password_hash.empty()) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    const char* sql = "INSERT INTO accounts (email, password_hash, created_at, last_login) VALUES (?, ?, ?, 0)";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }

    bind_text(stmt, 1, email);
    bind_text(stmt, 2, password_hash);
    sqlite3_bind_int64(stmt, 3, now);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return make_status(StatusDomain::Db, StatusCode::Conflict);
    }
    if (rc != SQLITE_DONE) {
        return transport(rc);
    }

    *out = AccountId{static_cast<u64>(sqlite3_last_insert_rowid(state->db))};
    return ok_status();
}

Status db_account_find_by_email(DbHandle db, std::string_view email, AccountRecord* out) noexcept {
    if (!out || email.empty()) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    const std::string sql = std::string(kAccountColumns) + "WHERE email = ?";
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(state->db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }
    bind_text(stmt, 1, email);
    return read_account(stmt, out);
}

Status db_account_get(DbHandle db, AccountId id, AccountRecord* out) noexcept {
    if (!out || !id.is_valid()) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    const std::string sql = std::string(kAccountColumns) + "WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(state->db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));
    return read_account(stmt, out);
}

Status db_account_touch_login(DbHandle db, AccountId id, Timestamp now) noexcept {
    if (!id.is_valid()) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(state->db, "UPDATE accounts SET last_login = ? WHERE id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }
    sqlite3_bind_int64(stmt, 1, now);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(id.v));
    return exec_changes(state->db, stmt);
}

// ============================================================================
// Vaults
// ============================================================================

Status db_vault_upsert(DbHandle db, const VaultRecord& rec, Timestamp now, bool* created) noexcept {
    if (!rec.account.is_valid() || rec.encrypted_data.empty() || rec.server_salt.empty() || rec.client_salt.empty()) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state->db, "SELECT 1 FROM vaults WHERE account_id = ? LIMIT 1", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(rec.account.v));
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return transport(rc);
    }
    const bool exists = (rc == SQLITE_ROW);

    const char* sql =
        "INSERT INTO vaults (account_id, encrypted_data, server_salt, client_salt, version, created_at, updated_at, last_accessed) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(account_id) DO UPDATE SET encrypted_data = excluded.encrypted_data, "
        "server_salt = excluded.server_salt, client_salt = excluded.client_salt, version = excluded.version, "
        "updated_at = excluded.updated_at, last_accessed = excluded.last_accessed";
    rc = sqlite3_prepare_v2(state->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(rec.account.v));
    bind_text(stmt, 2, rec.encrypted_data);
    bind_text(stmt, 3, rec.server_salt);
    bind_text(stmt, 4, rec.client_salt);
    bind_text(stmt, 5, rec.version.empty() ? std::string_view("1.0") : std::string_view(rec.version));
    sqlite3_bind_int64(stmt, 6, now);
    sqlite3_bind_int64(stmt, 7, now);
    sqlite3_bind_int64(stmt, 8, now);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        // No such account.
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    if (rc != SQLITE_DONE) {
        return transport(rc);
    }
    if (created) {
        *created = !exists;
    }
    return ok_status();
}

Status db_vault_get(DbHandle db, AccountId account, VaultRecord* out) noexcept {
    if (!out || !account.is_valid()) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    const char* sql = "SELECT account_id, encrypted_data, server_salt, client_salt, version, created_at, updated_at, last_accessed "
                      "FROM vaults WHERE account_id = ?";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(account.v));

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out->account = AccountId{static_cast<u64>(sqlite3_column_int64(stmt, 0))};
        out->encrypted_data = column_text(stmt, 1);
        out->server_salt = column_text(stmt, 2);
        out->client_salt = column_text(stmt, 3);
        out->version = column_text(stmt, 4);
        out->created_at = sqlite3_column_int64(stmt, 5);
        out->updated_at = sqlite3_column_int64(stmt, 6);
        out->last_accessed = sqlite3_column_int64(stmt, 7);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return transport(rc);
}

Status db_vault_touch_access(DbHandle db, AccountId account, Timestamp now) noexcept {
    if (!account.is_valid()) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(state->db, "UPDATE vaults SET last_accessed = ? WHERE account_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }
    sqlite3_bind_int64(stmt, 1, now);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(account.v));
    return exec_changes(state->db, stmt);
}

Status db_vault_delete(DbHandle db, AccountId account) noexcept {
    if (!account.is_valid()) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(state->db, "DELETE FROM vaults WHERE account_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(account.v));
    return exec_changes(state->db, stmt);
}

// ============================================================================
// Audit Log
// ============================================================================

Status db_audit_append(DbHandle db, const AuditEntry& entry) noexcept {
    if (entry.action.empty()) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    const char* sql = "INSERT INTO audit_log (account_id, email, action, origin, details, at) VALUES (?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(entry.account.v));
    bind_text(stmt, 2, entry.email);
    bind_text(stmt, 3, entry.action);
    bind_text(stmt, 4, entry.origin);
    bind_text(stmt, 5, entry.details);
    sqlite3_bind_int64(stmt, 6, entry.at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return transport(rc);
    }
    return ok_status();
}

Status db_audit_count(DbHandle db, AccountId account, std::string_view action, u64* out) noexcept {
    if (!out) {
        return invalid();
    }
    auto state = find_state(db);
    if (!state) {
        return invalid();
    }
    std::lock_guard<std::mutex> lock(state->mutex);

    const char* sql = "SELECT COUNT(*) FROM audit_log WHERE (?1 = 0 OR account_id = ?1) AND (?2 = '' OR action = ?2)";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return transport(rc);
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(account.v));
    bind_text(stmt, 2, action);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return transport(rc);
    }
    *out = static_cast<u64>(sqlite3_column_int64(stmt, 0));
    sqlite3_finalize(stmt);
    return ok_status();
}

} // namespace seedvault::db
