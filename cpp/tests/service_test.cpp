#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "seedvault/core/clock.hpp"
#include "seedvault/core/config.hpp"
#include "seedvault/db/db.hpp"
#include "seedvault/security/client_envelope.hpp"
#include "seedvault/security/fingerprint.hpp"
#include "seedvault/vault/service.hpp"

using namespace seedvault::core;
using namespace seedvault::vault;

namespace {
constexpr seedvault::security::KdfParams kClientKdf{seedvault::security::kKdfIterationFloor, seedvault::security::KdfHash::Sha256};
constexpr Timestamp kStart = 1714564800000;

ServiceConfig test_config() {
    ServiceConfig cfg;
    cfg.server_key = std::string(32, 'k');
    cfg.token_secret = std::string(32, 't');
    // Below the production minimum to keep the suite fast.
    cfg.server_kdf_iterations = seedvault::security::kKdfIterationFloor;
    return cfg;
}

struct ServiceFixture : ::testing::Test {
    ManualClock clock{kStart};
    seedvault::db::DbHandle db{};
    std::unique_ptr<VaultService> service;
    std::string origin = seedvault::security::origin_fingerprint("10.0.0.1");

    void SetUp() override {
        ASSERT_TRUE(is_ok(seedvault::db::db_open(seedvault::db::DbConfig{}, &db)));
        service = std::make_unique<VaultService>(test_config(), db, clock);
    }

    void TearDown() override {
        service.reset();
        EXPECT_TRUE(is_ok(seedvault::db::db_close(db)));
    }

    AccountView register_user(const char* email = "alice@example.com", const char* password = "password123") {
        AccountView view;
        EXPECT_TRUE(is_ok(service->register_account(email, password, origin, &view)));
        return view;
    }

    u64 audit_count(AccountId account, const char* action) {
        u64 n = 0;
        EXPECT_TRUE(is_ok(seedvault::db::db_audit_count(db, account, action, &n)));
        return n;
    }
};
} // namespace

TEST(VaultServiceHelpers, NormalizeEmail) {
    std::string out;
    EXPECT_TRUE(normalize_email("  Alice@Example.COM ", &out));
    EXPECT_EQ(out, "alice@example.com");
    EXPECT_FALSE(normalize_email("alice", &out));
    EXPECT_FALSE(normalize_email("@example.com", &out));
    EXPECT_FALSE(normalize_email("a@b@example.com", &out));
    EXPECT_FALSE(normalize_email("alice@example", &out));
    EXPECT_FALSE(normalize_email("alice@example.", &out));
    EXPECT_FALSE(normalize_email("al ice@example.com", &out));
    EXPECT_FALSE(normalize_email(std::string(250, 'a') + "@example.com", &out));
}

TEST(VaultServiceHelpers, PoliciesFromConfig) {
    ServiceConfig cfg = test_config();
    cfg.max_login_attempts = 3;
    cfg.lockout_minutes = 20;
    const auto acct = account_policy(cfg);
    EXPECT_EQ(acct.max_attempts, 3u);
    EXPECT_EQ(acct.initial_backoff_ms, 20 * kMillisPerMinute);
    EXPECT_FALSE(acct.escalate);

    const auto orig = origin_policy(cfg);
    EXPECT_EQ(orig.max_attempts, 5u);
    EXPECT_EQ(orig.max_backoff_ms, 24 * kMillisPerHour);
    EXPECT_TRUE(orig.escalate);

    EXPECT_EQ(server_kdf_params(ServiceConfig{}).iterations, 600000u);
    EXPECT_EQ(server_kdf_params(ServiceConfig{}).hash, seedvault::security::KdfHash::Sha512);
}

TEST_F(ServiceFixture, RegisterNormalizesEmail) {
    const AccountView view = register_user("  Alice@Example.com");
    EXPECT_TRUE(view.id.is_valid());
    EXPECT_EQ(view.email, "alice@example.com");
    EXPECT_EQ(view.created_at, kStart);
    EXPECT_EQ(audit_count(view.id, kAuditRegistrationSuccess), 1u);
}

TEST_F(ServiceFixture, RegisterDuplicateIsConflict) {
    register_user();
    AccountView view;
    EXPECT_EQ(service->register_account("ALICE@example.com", "password456", origin, &view).code, StatusCode::Conflict);
    EXPECT_EQ(audit_count(AccountId::invalid(), kAuditRegistrationFailed), 1u);
}

TEST_F(ServiceFixture, RegisterValidatesInput) {
    AccountView view;
    EXPECT_EQ(service->register_account("not-an-email", "password123", origin, &view).code, StatusCode::Invalid);
    EXPECT_EQ(service->register_account("bob@example.com", "short", origin, &view).code, StatusCode::Invalid);
}

TEST_F(ServiceFixture, LoginIssuesToken) {
    const AccountView alice = register_user();
    clock.advance(kMillisPerMinute);

    LoginResult result;
    ASSERT_TRUE(is_ok(service->login("alice@example.com", "password123", origin, &result)));
    EXPECT_EQ(result.account.id, alice.id);
    EXPECT_EQ(result.account.email, "alice@example.com");
    EXPECT_FALSE(result.token.empty());

    AccountId id{};
    ASSERT_TRUE(is_ok(service->authenticate(result.token, &id)));
    EXPECT_EQ(id, alice.id);

    seedvault::db::AccountRecord rec;
    ASSERT_TRUE(is_ok(seedvault::db::db_account_get(db, alice.id, &rec)));
    EXPECT_EQ(rec.last_login, kStart + kMillisPerMinute);
    EXPECT_EQ(audit_count(alice.id, kAuditLoginSuccess), 1u);
}

TEST(VaultServiceConfig, OversizedTokenTtlFailsLogin) {
    ManualClock clock{kStart};
    seedvault::db::DbHandle db{};
    ASSERT_TRUE(is_ok(seedvault::db::db_open(seedvault::db::DbConfig{}, &db)));
    {
        ServiceConfig cfg = test_config();
        cfg.token_ttl_seconds = 92233720368547750;
        VaultService service(cfg, db, clock);
        const std::string origin = seedvault::security::origin_fingerprint("10.0.0.1");
        AccountView view;
        ASSERT_TRUE(is_ok(service.register_account("alice@example.com", "password123", origin, &view)));
        LoginResult result;
        const Status s = service.login("alice@example.com", "password123", origin, &result);
        EXPECT_EQ(s.code, StatusCode::Unknown);
        EXPECT_TRUE(result.token.empty());
    }
    EXPECT_TRUE(is_ok(seedvault::db::db_close(db)));
}

TEST_F(ServiceFixture, TokenExpiresAfterTtl) {
    register_user();
    LoginResult result;
    ASSERT_TRUE(is_ok(service->login("alice@example.com", "password123", origin, &result)));

    clock.advance(7 * 24 * kMillisPerHour);
    AccountId id{};
    EXPECT_EQ(service->authenticate(result.token, &id).code, StatusCode::Authentication);
    EXPECT_EQ(service->authenticate("garbage", &id).code, StatusCode::Authentication);
}

TEST_F(ServiceFixture, WrongPasswordAndUnknownEmailLookAlike) {
    register_user();
    LoginResult result;
    const Status wrong = service->login("alice@example.com", "password124", origin, &result);
    const Status unknown = service->login("nobody@example.com", "password123", origin, &result);
    EXPECT_EQ(wrong.code, StatusCode::Authentication);
    EXPECT_EQ(unknown.code, StatusCode::Authentication);
    EXPECT_EQ(wrong.domain, unknown.domain);
}

TEST_F(ServiceFixture, FiveWrongPasswordsLockAccount) {
    const AccountView alice = register_user();
    LoginResult result;
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(service->login("alice@example.com", "wrong-password", origin, &result).code, StatusCode::Authentication);
    }
    const Status locked = service->login("alice@example.com", "wrong-password", origin, &result);
    EXPECT_EQ(locked.code, StatusCode::Locked);
    EXPECT_EQ(locked.aux, 900u);
    EXPECT_EQ(audit_count(alice.id, kAuditAccountLocked), 1u);

    // The right password is refused while locked.
    const std::string other_origin = seedvault::security::origin_fingerprint("10.0.0.2");
    const Status still = service->login("alice@example.com", "password123", other_origin, &result);
    EXPECT_EQ(still.code, StatusCode::Locked);
    EXPECT_EQ(audit_count(AccountId::invalid(), kAuditLoginFailedLocked), 1u);

    clock.advance(15 * kMillisPerMinute);
    EXPECT_TRUE(is_ok(service->login("alice@example.com", "password123", other_origin, &result)));
}

TEST_F(ServiceFixture, LockedAccountTokenIsRefused) {
    register_user();
    LoginResult first;
    ASSERT_TRUE(is_ok(service->login("alice@example.com", "password123", origin, &first)));

    LoginResult result;
    for (int i = 0; i < 5; ++i) {
        (void)service->login("alice@example.com", "wrong-password", origin, &result);
    }
    AccountId id{};
    const Status s = service->authenticate(first.token, &id);
    EXPECT_EQ(s.code, StatusCode::Locked);
    EXPECT_GT(s.aux, 0u);
}

TEST_F(ServiceFixture, OriginLockCoversOtherAccounts) {
    register_user("a@example.com");
    register_user("b@example.com");
    LoginResult result;
    const char* emails[] = {"x1@example.com", "x2@example.com", "x3@example.com", "x4@example.com", "x5@example.com"};
    for (const char* e : emails) {
        (void)service->login(e, "password123", origin, &result);
    }
    EXPECT_EQ(service->login("b@example.com", "password123", origin, &result).code, StatusCode::Locked);
    const std::string elsewhere = seedvault::security::origin_fingerprint("10.9.9.9");
    EXPECT_TRUE(is_ok(service->login("b@example.com", "password123", elsewhere, &result)));
}

TEST_F(ServiceFixture, VaultLifecycle) {
    const AccountView alice = register_user();

    seedvault::security::SealedVault sealed;
    ASSERT_TRUE(is_ok(seedvault::security::seal_vault("Tr0ub4dor&3", "{\"seeds\":[]}", kClientKdf, &sealed)));

    VaultView view;
    EXPECT_EQ(service->get_vault(alice.id, origin, &view).code, StatusCode::NotFound);

    Timestamp updated = 0;
    ASSERT_TRUE(is_ok(service->put_vault(alice.id, sealed.blob, sealed.salt, origin, &updated)));
    EXPECT_EQ(updated, kStart);
    EXPECT_EQ(audit_count(alice.id, kAuditVaultCreated), 1u);

    seedvault::db::VaultRecord stored;
    ASSERT_TRUE(is_ok(seedvault::db::db_vault_get(db, alice.id, &stored)));
    EXPECT_NE(stored.encrypted_data, sealed.blob);
    EXPECT_EQ(stored.client_salt, sealed.salt);

    clock.advance(kMillisPerSecond);
    ASSERT_TRUE(is_ok(service->get_vault(alice.id, origin, &view)));
    EXPECT_EQ(view.encrypted_data, sealed.blob);
    EXPECT_EQ(view.client_salt, sealed.salt);
    EXPECT_EQ(view.version, "1.0");
    EXPECT_EQ(view.updated_at, kStart);
    EXPECT_EQ(view.last_accessed, kStart + kMillisPerSecond);
    EXPECT_EQ(audit_count(alice.id, kAuditVaultAccessed), 1u);

    const auto doc = seedvault::security::open_vault("Tr0ub4dor&3", view.client_salt, view.encrypted_data, kClientKdf);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(*doc, "{\"seeds\":[]}");

    ASSERT_TRUE(is_ok(service->put_vault(alice.id, sealed.blob, sealed.salt, origin, &updated)));
    EXPECT_EQ(audit_count(alice.id, kAuditVaultUpdated), 1u);

    ASSERT_TRUE(is_ok(service->export_vault(alice.id, origin, &view)));
    EXPECT_EQ(audit_count(alice.id, kAuditVaultExported), 1u);

    ASSERT_TRUE(is_ok(service->delete_vault(alice.id, origin)));
    EXPECT_EQ(service->delete_vault(alice.id, origin).code, StatusCode::NotFound);
    EXPECT_EQ(service->get_vault(alice.id, origin, &view).code, StatusCode::NotFound);
}

TEST_F(ServiceFixture, PutRejectsNonBase64) {
    const AccountView alice = register_user();
    EXPECT_EQ(service->put_vault(alice.id, "not base64!", "AAAA", origin, nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(service->put_vault(alice.id, "AAAA", "", origin, nullptr).code, StatusCode::Invalid);
}

TEST_F(ServiceFixture, RotatedServerKeyDegradesToUnavailable) {
    const AccountView alice = register_user();
    seedvault::security::SealedVault sealed;
    ASSERT_TRUE(is_ok(seedvault::security::seal_vault("Tr0ub4dor&3", "{}", kClientKdf, &sealed)));
    ASSERT_TRUE(is_ok(service->put_vault(alice.id, sealed.blob, sealed.salt, origin, nullptr)));

    ServiceConfig rotated = test_config();
    rotated.server_key = std::string(32, 'r');
    VaultService other(rotated, db, clock);

    VaultView view;
    EXPECT_EQ(other.get_vault(alice.id, origin, &view).code, StatusCode::Unavailable);
    EXPECT_EQ(audit_count(alice.id, kAuditVaultUnavailable), 1u);
    EXPECT_TRUE(view.encrypted_data.empty());
}
