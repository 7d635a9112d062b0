#include <cstring>
#include <string_view>

#include <gtest/gtest.h>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"
#include "seedvault/security/kdf.hpp"

namespace {
constexpr seedvault::security::KdfParams kFastSha256{seedvault::security::kKdfIterationFloor, seedvault::security::KdfHash::Sha256};
constexpr seedvault::security::KdfParams kFastSha512{seedvault::security::kKdfIterationFloor, seedvault::security::KdfHash::Sha512};

const seedvault::core::u8 kSaltA[16] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16};
const seedvault::core::u8 kSaltB[16] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 17};

seedvault::security::BufferView salt(const seedvault::core::u8 (&s)[16]) {
    return seedvault::security::BufferView{s, 16};
}

void expect_key_eq(const seedvault::security::DerivedKey& a, const seedvault::security::DerivedKey& b) {
    EXPECT_EQ(0, std::memcmp(a.data(), b.data(), seedvault::security::DerivedKey::kSize));
}

void expect_key_ne(const seedvault::security::DerivedKey& a, const seedvault::security::DerivedKey& b) {
    EXPECT_NE(0, std::memcmp(a.data(), b.data(), seedvault::security::DerivedKey::kSize));
}
} // namespace

TEST(SecurityKdf, DefaultsMatchLayers) {
    EXPECT_EQ(seedvault::security::kClientKdf.iterations, 500000u);
    EXPECT_EQ(seedvault::security::kClientKdf.hash, seedvault::security::KdfHash::Sha256);
    EXPECT_EQ(seedvault::security::kServerKdf.iterations, 600000u);
    EXPECT_EQ(seedvault::security::kServerKdf.hash, seedvault::security::KdfHash::Sha512);
}

TEST(SecurityKdf, RejectsNullOut) {
    const seedvault::core::Status s = seedvault::security::derive_key(
        seedvault::core::view_of("pw"), salt(kSaltA), kFastSha256, nullptr);
    EXPECT_EQ(s.domain, seedvault::core::StatusDomain::Security);
    EXPECT_EQ(s.code, seedvault::core::StatusCode::Invalid);
}

TEST(SecurityKdf, RejectsEmptyPasswordOrSalt) {
    seedvault::security::DerivedKey key;
    EXPECT_EQ(seedvault::security::derive_key(seedvault::core::view_of(""), salt(kSaltA), kFastSha256, &key).code,
        seedvault::core::StatusCode::Invalid);
    EXPECT_EQ(seedvault::security::derive_key(seedvault::core::view_of("pw"), seedvault::security::BufferView{}, kFastSha256, &key).code,
        seedvault::core::StatusCode::Invalid);
    EXPECT_FALSE(key.is_set());
}

TEST(SecurityKdf, RejectsIterationsBelowFloor) {
    seedvault::security::DerivedKey key;
    const seedvault::security::KdfParams weak{seedvault::security::kKdfIterationFloor - 1, seedvault::security::KdfHash::Sha256};
    const seedvault::core::Status s = seedvault::security::derive_key(seedvault::core::view_of("pw"), salt(kSaltA), weak, &key);
    EXPECT_EQ(s.code, seedvault::core::StatusCode::WeakParameters);
    EXPECT_FALSE(key.is_set());
}

TEST(SecurityKdf, DeterministicForSameInputs) {
    seedvault::security::DerivedKey a;
    seedvault::security::DerivedKey b;
    ASSERT_TRUE(seedvault::core::is_ok(seedvault::security::derive_key(seedvault::core::view_of("Tr0ub4dor&3"), salt(kSaltA), kFastSha256, &a)));
    ASSERT_TRUE(seedvault::core::is_ok(seedvault::security::derive_key(seedvault::core::view_of("Tr0ub4dor&3"), salt(kSaltA), kFastSha256, &b)));
    EXPECT_TRUE(a.is_set());
    expect_key_eq(a, b);
}

TEST(SecurityKdf, PasswordSaltAndHashAllMatter) {
    seedvault::security::DerivedKey base;
    seedvault::security::DerivedKey other_pw;
    seedvault::security::DerivedKey other_salt;
    seedvault::security::DerivedKey other_hash;
    ASSERT_TRUE(seedvault::core::is_ok(seedvault::security::derive_key(seedvault::core::view_of("password-1"), salt(kSaltA), kFastSha256, &base)));
    ASSERT_TRUE(seedvault::core::is_ok(seedvault::security::derive_key(seedvault::core::view_of("password-2"), salt(kSaltA), kFastSha256, &other_pw)));
    ASSERT_TRUE(seedvault::core::is_ok(seedvault::security::derive_key(seedvault::core::view_of("password-1"), salt(kSaltB), kFastSha256, &other_salt)));
    ASSERT_TRUE(seedvault::core::is_ok(seedvault::security::derive_key(seedvault::core::view_of("password-1"), salt(kSaltA), kFastSha512, &other_hash)));
    expect_key_ne(base, other_pw);
    expect_key_ne(base, other_salt);
    expect_key_ne(base, other_hash);
}

TEST(SecurityKdf, MovedFromKeyIsWiped) {
    seedvault::security::DerivedKey a;
    ASSERT_TRUE(seedvault::core::is_ok(seedvault::security::derive_key(seedvault::core::view_of("pw"), salt(kSaltA), kFastSha256, &a)));
    seedvault::security::DerivedKey b(std::move(a));
    EXPECT_TRUE(b.is_set());
    EXPECT_FALSE(a.is_set());

    const seedvault::core::u8 zeros[seedvault::security::DerivedKey::kSize] = {};
    EXPECT_EQ(0, std::memcmp(a.data(), zeros, sizeof(zeros)));
}
