#include <gtest/gtest.h>
#include "seedvault/db/db.hpp"
#include <string>
#include <thread>
#include <vector>

using namespace seedvault::db;
using namespace seedvault::core;

namespace {

// Opens an in-memory database for one test.
struct DbFixture : ::testing::Test {
    DbHandle db{};

    void SetUp() override {
        ASSERT_TRUE(is_ok(db_open(DbConfig{}, &db)));
    }

    void TearDown() override {
        EXPECT_TRUE(is_ok(db_close(db)));
    }

    AccountId make_account(const char* email, Timestamp now = 1000) {
        AccountId id{};
        EXPECT_TRUE(is_ok(db_account_create(db, email, "$argon2id$hash", now, &id)));
        return id;
    }
};

VaultRecord make_vault(AccountId account, const char* data = "b3V0ZXI=") {
    VaultRecord rec;
    rec.account = account;
    rec.encrypted_data = data;
    rec.server_salt = "c2VydmVy";
    rec.client_salt = "Y2xpZW50";
    return rec;
}

} // namespace

//=============================================================================
// Database Lifecycle Tests
//=============================================================================

TEST(Database, OpenClose) {
    DbConfig cfg{};
    DbHandle handle;

    Status s = db_open(cfg, &handle);
    EXPECT_TRUE(is_ok(s));
    EXPECT_TRUE(db_handle_valid(handle));

    s = db_close(handle);
    EXPECT_TRUE(is_ok(s));
}

TEST(Database, CloseTwiceIsInvalid) {
    DbHandle handle;
    ASSERT_TRUE(is_ok(db_open(DbConfig{}, &handle)));
    ASSERT_TRUE(is_ok(db_close(handle)));
    EXPECT_EQ(db_close(handle).code, StatusCode::Invalid);
}

TEST(Database, RejectsUnknownJournalMode) {
    DbConfig cfg{};
    cfg.journal_mode = "FAST";
    DbHandle handle;
    EXPECT_EQ(db_open(cfg, &handle).code, StatusCode::Invalid);
}

TEST(Database, ClosedHandleIsInvalid) {
    DbHandle handle;
    ASSERT_TRUE(is_ok(db_open(DbConfig{}, &handle)));
    ASSERT_TRUE(is_ok(db_close(handle)));
    AccountRecord rec;
    EXPECT_EQ(db_account_find_by_email(handle, "a@example.com", &rec).code, StatusCode::Invalid);
}

//=============================================================================
// Account Tests
//=============================================================================

TEST_F(DbFixture, CreateAndFindAccount) {
    const AccountId id = make_account("a@example.com", 1234);
    EXPECT_TRUE(id.is_valid());

    AccountRecord rec;
    ASSERT_TRUE(is_ok(db_account_find_by_email(db, "a@example.com", &rec)));
    EXPECT_EQ(rec.id, id);
    EXPECT_EQ(rec.email, "a@example.com");
    EXPECT_EQ(rec.password_hash, "$argon2id$hash");
    EXPECT_EQ(rec.created_at, 1234);
    EXPECT_EQ(rec.last_login, 0);

    AccountRecord by_id;
    ASSERT_TRUE(is_ok(db_account_get(db, id, &by_id)));
    EXPECT_EQ(by_id.email, "a@example.com");
}

TEST_F(DbFixture, DuplicateEmailIsConflict) {
    make_account("a@example.com");
    AccountId id{};
    EXPECT_EQ(db_account_create(db, "a@example.com", "h", 1, &id).code, StatusCode::Conflict);
}

TEST_F(DbFixture, MissingAccountIsNotFound) {
    AccountRecord rec;
    EXPECT_EQ(db_account_find_by_email(db, "nobody@example.com", &rec).code, StatusCode::NotFound);
    EXPECT_EQ(db_account_get(db, AccountId{99}, &rec).code, StatusCode::NotFound);
}

TEST_F(DbFixture, TouchLogin) {
    const AccountId id = make_account("a@example.com");
    ASSERT_TRUE(is_ok(db_account_touch_login(db, id, 5000)));
    AccountRecord rec;
    ASSERT_TRUE(is_ok(db_account_get(db, id, &rec)));
    EXPECT_EQ(rec.last_login, 5000);
    EXPECT_EQ(db_account_touch_login(db, AccountId{99}, 5000).code, StatusCode::NotFound);
}

//=============================================================================
// Vault Tests
//=============================================================================

TEST_F(DbFixture, UpsertCreatesThenUpdates) {
    const AccountId id = make_account("a@example.com");

    bool created = false;
    ASSERT_TRUE(is_ok(db_vault_upsert(db, make_vault(id, "Zmlyc3Q="), 2000, &created)));
    EXPECT_TRUE(created);

    ASSERT_TRUE(is_ok(db_vault_upsert(db, make_vault(id, "c2Vjb25k"), 3000, &created)));
    EXPECT_FALSE(created);

    VaultRecord rec;
    ASSERT_TRUE(is_ok(db_vault_get(db, id, &rec)));
    EXPECT_EQ(rec.account, id);
    EXPECT_EQ(rec.encrypted_data, "c2Vjb25k");
    EXPECT_EQ(rec.server_salt, "c2VydmVy");
    EXPECT_EQ(rec.client_salt, "Y2xpZW50");
    EXPECT_EQ(rec.version, "1.0");
    EXPECT_EQ(rec.created_at, 2000);
    EXPECT_EQ(rec.updated_at, 3000);
    EXPECT_EQ(rec.last_accessed, 3000);
}

TEST_F(DbFixture, UpsertForMissingAccountIsNotFound) {
    EXPECT_EQ(db_vault_upsert(db, make_vault(AccountId{42}), 1, nullptr).code, StatusCode::NotFound);
}

TEST_F(DbFixture, UpsertRejectsEmptyFields) {
    const AccountId id = make_account("a@example.com");
    VaultRecord rec = make_vault(id);
    rec.client_salt.clear();
    EXPECT_EQ(db_vault_upsert(db, rec, 1, nullptr).code, StatusCode::Invalid);
}

TEST_F(DbFixture, TouchAccess) {
    const AccountId id = make_account("a@example.com");
    ASSERT_TRUE(is_ok(db_vault_upsert(db, make_vault(id), 2000, nullptr)));
    ASSERT_TRUE(is_ok(db_vault_touch_access(db, id, 9000)));
    VaultRecord rec;
    ASSERT_TRUE(is_ok(db_vault_get(db, id, &rec)));
    EXPECT_EQ(rec.updated_at, 2000);
    EXPECT_EQ(rec.last_accessed, 9000);
}

TEST_F(DbFixture, DeleteVault) {
    const AccountId id = make_account("a@example.com");
    ASSERT_TRUE(is_ok(db_vault_upsert(db, make_vault(id), 2000, nullptr)));
    ASSERT_TRUE(is_ok(db_vault_delete(db, id)));

    VaultRecord rec;
    EXPECT_EQ(db_vault_get(db, id, &rec).code, StatusCode::NotFound);
    EXPECT_EQ(db_vault_delete(db, id).code, StatusCode::NotFound);
}

TEST_F(DbFixture, VaultsAreScopedToAccount) {
    const AccountId a = make_account("a@example.com");
    const AccountId b = make_account("b@example.com");
    ASSERT_TRUE(is_ok(db_vault_upsert(db, make_vault(a, "YWFh"), 1, nullptr)));

    VaultRecord rec;
    EXPECT_EQ(db_vault_get(db, b, &rec).code, StatusCode::NotFound);
}

//=============================================================================
// Audit Log Tests
//=============================================================================

TEST_F(DbFixture, AuditAppendAndCount) {
    const AccountId id = make_account("a@example.com");
    AuditEntry e;
    e.account = id;
    e.email = "a@example.com";
    e.action = "LOGIN_SUCCESS";
    e.origin = "fp_0123";
    e.at = 10;
    ASSERT_TRUE(is_ok(db_audit_append(db, e)));
    e.action = "LOGIN_FAILED";
    ASSERT_TRUE(is_ok(db_audit_append(db, e)));

    AuditEntry anon;
    anon.email = "ghost@example.com";
    anon.action = "LOGIN_FAILED";
    anon.origin = "fp_0123";
    ASSERT_TRUE(is_ok(db_audit_append(db, anon)));

    u64 n = 0;
    ASSERT_TRUE(is_ok(db_audit_count(db, id, "", &n)));
    EXPECT_EQ(n, 2u);
    ASSERT_TRUE(is_ok(db_audit_count(db, AccountId::invalid(), "LOGIN_FAILED", &n)));
    EXPECT_EQ(n, 2u);
    ASSERT_TRUE(is_ok(db_audit_count(db, id, "LOGIN_SUCCESS", &n)));
    EXPECT_EQ(n, 1u);
    ASSERT_TRUE(is_ok(db_audit_count(db, AccountId::invalid(), "", &n)));
    EXPECT_EQ(n, 3u);
}

TEST_F(DbFixture, AuditRequiresAction) {
    AuditEntry e;
    e.email = "a@example.com";
    EXPECT_EQ(db_audit_append(db, e).code, StatusCode::Invalid);
}

//=============================================================================
// Concurrency Tests
//=============================================================================

TEST_F(DbFixture, ConcurrentUpsertsKeepOneRow) {
    const AccountId id = make_account("a@example.com");
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, id, t] {
            for (int i = 0; i < 20; ++i) {
                EXPECT_TRUE(is_ok(db_vault_upsert(db, make_vault(id), t * 100 + i + 1, nullptr)));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    VaultRecord rec;
    EXPECT_TRUE(is_ok(db_vault_get(db, id, &rec)));
}
