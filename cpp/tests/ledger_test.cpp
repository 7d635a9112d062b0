#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "seedvault/core/clock.hpp"
#include "seedvault/security/ledger.hpp"

using namespace seedvault::core;
using namespace seedvault::security;

namespace {
constexpr i64 kMin = kMillisPerMinute;

void fail_n(AttemptLedger& ledger, std::string_view key, u32 n) {
    for (u32 i = 0; i < n; ++i) {
        ledger.record_failure(key);
    }
}
} // namespace

TEST(SecurityLedger, PolicyDefaults) {
    EXPECT_TRUE(ledger_policy_valid(kAccountPolicy));
    EXPECT_TRUE(ledger_policy_valid(kOriginPolicy));
    EXPECT_FALSE(kAccountPolicy.escalate);
    EXPECT_TRUE(kOriginPolicy.escalate);
    EXPECT_EQ(kOriginPolicy.max_backoff_ms, 24 * kMillisPerHour);
    EXPECT_FALSE(ledger_policy_valid(LedgerPolicy{0, kMin, kMin, false}));
    EXPECT_FALSE(ledger_policy_valid(LedgerPolicy{5, 10 * kMin, kMin, false}));
}

TEST(SecurityLedger, UnknownKeyIsClear) {
    ManualClock clock(1000);
    AttemptLedger ledger(kAccountPolicy, clock);
    EXPECT_FALSE(ledger.is_locked("acct:a@example.com").locked);
    AttemptRecord rec;
    EXPECT_FALSE(ledger.lookup("acct:a@example.com", &rec));
    EXPECT_EQ(ledger.size(), 0u);
}

TEST(SecurityLedger, FifthFailureLocks) {
    ManualClock clock(1000);
    AttemptLedger ledger(kAccountPolicy, clock);
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(ledger.record_failure("k").locked);
    }
    const LockState st = ledger.record_failure("k");
    EXPECT_TRUE(st.locked);
    EXPECT_EQ(st.remaining_ms, 15 * kMin);

    AttemptRecord rec;
    ASSERT_TRUE(ledger.lookup("k", &rec));
    EXPECT_EQ(rec.failure_count, 5u);
    EXPECT_EQ(rec.lock_until, 1000 + 15 * kMin);
}

TEST(SecurityLedger, LockExpiresExactlyAtDeadline) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    fail_n(ledger, "k", 5);

    clock.advance(15 * kMin - 1);
    const LockState st = ledger.is_locked("k");
    EXPECT_TRUE(st.locked);
    EXPECT_EQ(st.remaining_ms, 1);

    clock.advance(1);
    EXPECT_FALSE(ledger.is_locked("k").locked);
    AttemptRecord rec;
    ASSERT_TRUE(ledger.lookup("k", &rec));
    EXPECT_EQ(rec.failure_count, 0u);
    EXPECT_EQ(rec.lock_until, 0);
}

TEST(SecurityLedger, FailureWhileLockedChangesNothing) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    fail_n(ledger, "k", 5);
    clock.advance(kMin);

    const LockState st = ledger.record_failure("k");
    EXPECT_TRUE(st.locked);
    EXPECT_EQ(st.remaining_ms, 14 * kMin);

    AttemptRecord rec;
    ASSERT_TRUE(ledger.lookup("k", &rec));
    EXPECT_EQ(rec.failure_count, 5u);
    EXPECT_EQ(rec.lock_until, 15 * kMin);
}

TEST(SecurityLedger, AccountLockDoesNotEscalate) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    fail_n(ledger, "k", 5);
    clock.advance(15 * kMin);
    fail_n(ledger, "k", 4);
    const LockState st = ledger.record_failure("k");
    EXPECT_TRUE(st.locked);
    EXPECT_EQ(st.remaining_ms, 15 * kMin);
}

TEST(SecurityLedger, OriginLockDoublesUpToCeiling) {
    ManualClock clock(0);
    AttemptLedger ledger(kOriginPolicy, clock);

    const i64 expected[] = {15 * kMin, 30 * kMin, 60 * kMin, 120 * kMin, 240 * kMin, 480 * kMin,
        960 * kMin, 1440 * kMin, 1440 * kMin};
    for (const i64 want : expected) {
        fail_n(ledger, "fp_x", 4);
        const LockState st = ledger.record_failure("fp_x");
        ASSERT_TRUE(st.locked);
        EXPECT_EQ(st.remaining_ms, want);
        clock.advance(st.remaining_ms);
        EXPECT_FALSE(ledger.is_locked("fp_x").locked);
    }
}

TEST(SecurityLedger, SuccessResetsCountAndBackoff) {
    ManualClock clock(0);
    AttemptLedger ledger(kOriginPolicy, clock);
    fail_n(ledger, "fp_x", 5);
    clock.advance(15 * kMin);

    fail_n(ledger, "fp_x", 3);
    ledger.record_success("fp_x");
    AttemptRecord rec;
    EXPECT_FALSE(ledger.lookup("fp_x", &rec));

    fail_n(ledger, "fp_x", 4);
    const LockState st = ledger.record_failure("fp_x");
    EXPECT_TRUE(st.locked);
    EXPECT_EQ(st.remaining_ms, 15 * kMin);
}

TEST(SecurityLedger, ClearUnlocks) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    fail_n(ledger, "k", 5);
    ASSERT_TRUE(ledger.is_locked("k").locked);
    ledger.clear("k");
    EXPECT_FALSE(ledger.is_locked("k").locked);
}

TEST(SecurityLedger, KeysAreIndependent) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    fail_n(ledger, "a", 5);
    EXPECT_TRUE(ledger.is_locked("a").locked);
    EXPECT_FALSE(ledger.is_locked("b").locked);
    EXPECT_FALSE(ledger.record_failure("b").locked);
    EXPECT_EQ(ledger.size(), 2u);
}

TEST(SecurityLedger, InvalidPolicyIsSanitized) {
    ManualClock clock(0);
    AttemptLedger ledger(LedgerPolicy{0, -5, 0, false}, clock);
    EXPECT_TRUE(ledger_policy_valid(ledger.policy()));
    EXPECT_TRUE(ledger.record_failure("k").locked);
}

TEST(SecurityLedger, ConcurrentFailuresLoseNoCount) {
    ManualClock clock(0);
    AttemptLedger ledger(LedgerPolicy{1000, kMin, kMin, false}, clock);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&ledger] {
            for (int i = 0; i < 100; ++i) {
                ledger.record_failure("shared");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    AttemptRecord rec;
    ASSERT_TRUE(ledger.lookup("shared", &rec));
    EXPECT_EQ(rec.failure_count, 800u);
    EXPECT_FALSE(ledger.is_locked("shared").locked);
}

TEST(SecurityLedger, ConcurrentFailuresLockExactlyOnce) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);

    std::vector<std::thread> threads;
    for (int t = 0; t < 16; ++t) {
        threads.emplace_back([&ledger] { ledger.record_failure("k"); });
    }
    for (auto& th : threads) {
        th.join();
    }

    AttemptRecord rec;
    ASSERT_TRUE(ledger.lookup("k", &rec));
    EXPECT_EQ(rec.failure_count, 5u);
    EXPECT_EQ(rec.lock_until, 15 * kMin);
}

TEST(SecurityLedger, AdmissionCountsInFlightAttempts) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    fail_n(ledger, "k", 3);

    LockState st;
    EXPECT_EQ(ledger.begin_attempt("k", &st), Admission::Admitted);
    EXPECT_EQ(ledger.begin_attempt("k", &st), Admission::Admitted);
    EXPECT_EQ(ledger.begin_attempt("k", &st), Admission::Saturated);

    ledger.cancel_attempt("k");
    EXPECT_EQ(ledger.begin_attempt("k", &st), Admission::Admitted);

    EXPECT_FALSE(ledger.finish_attempt("k", false).locked);
    const LockState locked = ledger.finish_attempt("k", false);
    EXPECT_TRUE(locked.locked);

    EXPECT_EQ(ledger.begin_attempt("k", &st), Admission::Locked);
    EXPECT_TRUE(st.locked);
    EXPECT_EQ(st.remaining_ms, 15 * kMin);

    AttemptRecord rec;
    ASSERT_TRUE(ledger.lookup("k", &rec));
    EXPECT_EQ(rec.failure_count, 5u);
    EXPECT_EQ(rec.in_flight, 0u);
}

TEST(SecurityLedger, SuccessfulAttemptErasesRecord) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    fail_n(ledger, "k", 2);
    ASSERT_EQ(ledger.begin_attempt("k", nullptr), Admission::Admitted);
    EXPECT_FALSE(ledger.finish_attempt("k", true).locked);
    EXPECT_EQ(ledger.size(), 0u);
}

TEST(SecurityLedger, CancelledFirstAttemptLeavesNoRecord) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    ASSERT_EQ(ledger.begin_attempt("k", nullptr), Admission::Admitted);
    EXPECT_EQ(ledger.size(), 1u);
    ledger.cancel_attempt("k");
    EXPECT_EQ(ledger.size(), 0u);
}

TEST(SecurityLedger, PruneDropsExpiredAndIdleRecords) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    for (int i = 0; i < 1000; ++i) {
        ledger.record_failure("acct:" + std::to_string(i));
    }
    fail_n(ledger, "locked", 5);
    EXPECT_EQ(ledger.size(), 1001u);
    EXPECT_EQ(ledger.prune(), 0u);

    // Lock expired: count and lock clear, backoff initial, so nothing left.
    clock.advance(15 * kMin);
    EXPECT_EQ(ledger.prune(), 1u);
    EXPECT_FALSE(ledger.is_locked("locked").locked);

    clock.advance(24 * kMillisPerHour);
    EXPECT_EQ(ledger.prune(), 1000u);
    EXPECT_EQ(ledger.size(), 0u);
}

TEST(SecurityLedger, PruneKeepsEscalatedBackoffWithinRetention) {
    ManualClock clock(0);
    AttemptLedger ledger(kOriginPolicy, clock);
    fail_n(ledger, "fp_x", 5);
    clock.advance(15 * kMin);
    EXPECT_EQ(ledger.prune(), 0u);

    fail_n(ledger, "fp_x", 4);
    const LockState st = ledger.record_failure("fp_x");
    EXPECT_TRUE(st.locked);
    EXPECT_EQ(st.remaining_ms, 30 * kMin);
}

TEST(SecurityLedger, IdleKeysAreSweptAsNewKeysArrive) {
    ManualClock clock(0);
    AttemptLedger ledger(kAccountPolicy, clock);
    for (int i = 0; i < 5000; ++i) {
        ledger.record_failure("old:" + std::to_string(i));
    }
    clock.advance(365 * 24 * kMillisPerHour);
    for (int i = 0; i < 2000; ++i) {
        ledger.record_failure("new:" + std::to_string(i));
    }
    EXPECT_LE(ledger.size(), 2000u);
}

TEST(SecurityLedger, RecordCapEvictsOldestUnlocked) {
    ManualClock clock(0);
    LedgerPolicy policy = kAccountPolicy;
    policy.max_records = 8;
    AttemptLedger ledger(policy, clock);

    fail_n(ledger, "locked", 5);
    for (int i = 0; i < 20; ++i) {
        clock.advance(1);
        ledger.record_failure("k" + std::to_string(i));
    }
    EXPECT_LE(ledger.size(), 8u);
    EXPECT_TRUE(ledger.is_locked("locked").locked);
    AttemptRecord rec;
    EXPECT_TRUE(ledger.lookup("k19", &rec));
    EXPECT_FALSE(ledger.lookup("k0", &rec));
}
