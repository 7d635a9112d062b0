#include <string>

#include <gtest/gtest.h>

#include "seedvault/core/errors.hpp"
#include "seedvault/security/fingerprint.hpp"

using namespace seedvault::security;

TEST(SecurityFingerprint, NormalizeAddress) {
    EXPECT_EQ(normalize_client_address("  192.168.0.1 "), "192.168.0.1");
    EXPECT_EQ(normalize_client_address("FE80::1"), "fe80::1");
    EXPECT_EQ(normalize_client_address("::ffff:10.0.0.1"), "::ffff:10.0.0.1");
    EXPECT_EQ(normalize_client_address(""), "unknown");
    EXPECT_EQ(normalize_client_address("   "), "unknown");
    EXPECT_EQ(normalize_client_address("evil.example.com"), "unknown");
    EXPECT_EQ(normalize_client_address("10.0.0.1; DROP"), "unknown");
}

TEST(SecurityFingerprint, Shape) {
    const std::string fp = origin_fingerprint("10.0.0.1");
    ASSERT_EQ(fp.size(), 3u + 32u);
    EXPECT_EQ(fp.substr(0, 3), "fp_");
    for (char c : fp.substr(3)) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(SecurityFingerprint, StableAndNormalized) {
    EXPECT_EQ(origin_fingerprint("10.0.0.1"), origin_fingerprint(" 10.0.0.1\n"));
    EXPECT_EQ(origin_fingerprint("FE80::1"), origin_fingerprint("fe80::1"));
}

TEST(SecurityFingerprint, DistinguishesInputs) {
    EXPECT_NE(origin_fingerprint("10.0.0.1"), origin_fingerprint("10.0.0.2"));
    EXPECT_NE(origin_fingerprint("::1"), origin_fingerprint("::2"));
}

TEST(SecurityFingerprint, UnparsableAddressesShareOneKey) {
    EXPECT_EQ(origin_fingerprint("evil.example.com"), origin_fingerprint(""));
    EXPECT_EQ(origin_fingerprint("10.0.0.1; DROP"), origin_fingerprint("unknown"));
}

TEST(SecurityFingerprint, HashIsDeterministic) {
    seedvault::core::Hash256 a{};
    seedvault::core::Hash256 b{};
    ASSERT_TRUE(seedvault::core::is_ok(fingerprint_hash("1.2.3.4", &a)));
    ASSERT_TRUE(seedvault::core::is_ok(fingerprint_hash("1.2.3.4", &b)));
    EXPECT_EQ(a, b);
    ASSERT_TRUE(seedvault::core::is_ok(fingerprint_hash("1.2.3.5", &b)));
    EXPECT_NE(a, b);
}

TEST(SecurityFingerprint, RawAddressNotEmbedded) {
    const std::string fp = origin_fingerprint("10.0.0.1");
    EXPECT_EQ(fp.find("10.0.0.1"), std::string::npos);
}

TEST(SecurityFingerprint, NullOutIsInvalid) {
    EXPECT_EQ(fingerprint_hash("x", nullptr).code, seedvault::core::StatusCode::Invalid);
}
