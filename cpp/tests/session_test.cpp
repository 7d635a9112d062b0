#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "seedvault/core/errors.hpp"
#include "seedvault/security/client_envelope.hpp"
#include "seedvault/security/session.hpp"

using namespace seedvault::core;
using namespace seedvault::security;

namespace {
constexpr KdfParams kFastKdf{kKdfIterationFloor, KdfHash::Sha256};
constexpr std::string_view kPassword = "Tr0ub4dor&3";
constexpr std::string_view kDoc = "{\"seeds\":[{\"label\":\"main\"}]}";

SealedVault seal() {
    SealedVault sealed;
    EXPECT_TRUE(is_ok(seal_vault(kPassword, kDoc, kFastKdf, &sealed)));
    return sealed;
}
} // namespace

TEST(SecuritySession, StartsLocked) {
    VaultSession session;
    EXPECT_FALSE(session.is_unlocked());
    EXPECT_TRUE(session.salt().empty());
    EXPECT_FALSE(session.open("anything").has_value());
}

TEST(SecuritySession, UnlockThenReopen) {
    const SealedVault sealed = seal();
    VaultSession session;
    std::string doc;
    ASSERT_TRUE(is_ok(session.unlock(kPassword, sealed.salt, sealed.blob, kFastKdf, &doc)));
    EXPECT_EQ(doc, kDoc);
    EXPECT_TRUE(session.is_unlocked());
    EXPECT_EQ(session.salt().size(), kClientSaltLen);

    const auto again = session.open(sealed.blob);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, kDoc);
}

TEST(SecuritySession, WrongPasswordStaysLocked) {
    const SealedVault sealed = seal();
    VaultSession session;
    std::string doc;
    EXPECT_EQ(session.unlock("wrong", sealed.salt, sealed.blob, kFastKdf, &doc).code, StatusCode::Authentication);
    EXPECT_FALSE(session.is_unlocked());
    EXPECT_TRUE(doc.empty());
}

TEST(SecuritySession, OtherSaltIsRefused) {
    const SealedVault first = seal();
    const SealedVault second = seal();
    VaultSession session;
    std::string doc;
    ASSERT_TRUE(is_ok(session.unlock(kPassword, first.salt, first.blob, kFastKdf, &doc)));
    EXPECT_FALSE(session.open(second.blob).has_value());
}

TEST(SecuritySession, LockForgetsKey) {
    const SealedVault sealed = seal();
    VaultSession session;
    std::string doc;
    ASSERT_TRUE(is_ok(session.unlock(kPassword, sealed.salt, sealed.blob, kFastKdf, &doc)));
    session.lock();
    EXPECT_FALSE(session.is_unlocked());
    EXPECT_FALSE(session.open(sealed.blob).has_value());
}

TEST(SecuritySession, MoveTransfersKey) {
    const SealedVault sealed = seal();
    VaultSession a;
    std::string doc;
    ASSERT_TRUE(is_ok(a.unlock(kPassword, sealed.salt, sealed.blob, kFastKdf, &doc)));
    VaultSession b(std::move(a));
    EXPECT_TRUE(b.is_unlocked());
    EXPECT_TRUE(b.open(sealed.blob).has_value());
}

TEST(SecuritySession, RejectsBadArguments) {
    VaultSession session;
    std::string doc;
    EXPECT_EQ(session.unlock("", "AAAA", "AAAA", kFastKdf, &doc).code, StatusCode::Invalid);
    EXPECT_EQ(session.unlock(kPassword, "AAAA", "AAAA", kFastKdf, nullptr).code, StatusCode::Invalid);

    const SealedVault sealed = seal();
    const KdfParams weak{10, KdfHash::Sha256};
    EXPECT_EQ(session.unlock(kPassword, sealed.salt, sealed.blob, weak, &doc).code, StatusCode::WeakParameters);
}
