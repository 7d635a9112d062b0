#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

#include "seedvault/core/clock.hpp"
#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::security {
    using u32 = seedvault::core::u32;
    using i64 = seedvault::core::i64;
    using Timestamp = seedvault::core::Timestamp;

    struct LedgerPolicy {
        u32 max_attempts{5};
        i64 initial_backoff_ms{15 * seedvault::core::kMillisPerMinute};
        i64 max_backoff_ms{24 * seedvault::core::kMillisPerHour};
        bool escalate{false}; // double the lock duration on every new lock
        i64 idle_retention_ms{24 * seedvault::core::kMillisPerHour}; // unlocked records older than this are dropped
        std::size_t max_records{100000};
    };

    // Account scope: 5 failures, fixed 15 minute lock.
    inline constexpr LedgerPolicy kAccountPolicy{5, 15 * seedvault::core::kMillisPerMinute,
        15 * seedvault::core::kMillisPerMinute, false};
    // Origin scope: 5 failures, 15 minutes doubling up to 24 hours.
    inline constexpr LedgerPolicy kOriginPolicy{5, 15 * seedvault::core::kMillisPerMinute,
        24 * seedvault::core::kMillisPerHour, true};

    [[nodiscard]] constexpr bool ledger_policy_valid(const LedgerPolicy& p) noexcept {
        return p.max_attempts > 0 && p.initial_backoff_ms > 0 && p.max_backoff_ms >= p.initial_backoff_ms &&
            p.idle_retention_ms > 0 && p.max_records > 0;
    }

    struct AttemptRecord {
        u32 failure_count{0};
        Timestamp lock_until{0}; // 0: not locked
        i64 backoff_ms{0};       // duration of the next lock
        u32 in_flight{0};        // admitted attempts not yet finished
        Timestamp last_seen{0};
    };

    struct LockState {
        bool locked{false};
        i64 remaining_ms{0};
    };

    enum class Admission : seedvault::core::u8 {
        Admitted,
        Locked,
        Saturated, // failures plus in-flight attempts already reach max_attempts
    };

    // Failed-attempt bookkeeping for one scope (accounts or origins).
    //
    //   CLEAR --fail--> WARNING (count < max) --fail--> LOCKED (now < lock_until)
    //   LOCKED --now >= lock_until--> CLEAR (backoff kept)
    //   any --success--> CLEAR (backoff reset)
    //
    // Records are created on the first failure or admission. Every
    // read-modify-write runs under one mutex, so concurrent failures for a key
    // never lose a count or a lock transition.
    //
    // begin_attempt/finish_attempt bracket a credential check: an admitted
    // attempt holds one of the max_attempts slots until it finishes, so no
    // more than max_attempts checks run per lock window whatever the
    // concurrency.
    //
    // Records back in CLEAR with the initial backoff carry no state and are
    // dropped. Unlocked records idle for idle_retention_ms are dropped too.
    // At max_records the oldest unlocked record is evicted before a new key
    // is admitted; locked records are never evicted.
    class AttemptLedger {
    public:
        AttemptLedger(const LedgerPolicy& policy, const seedvault::core::Clock& clock) noexcept;

        AttemptLedger(const AttemptLedger&) = delete;
        AttemptLedger& operator=(const AttemptLedger&) = delete;

        // Check this before any credential comparison.
        [[nodiscard]] LockState is_locked(std::string_view key) const;

        // Returns the state after the failure. A failure reported while the
        // key is already locked changes nothing.
        LockState record_failure(std::string_view key);

        void record_success(std::string_view key);

        // Reserves a slot for one credential check. On Locked, lock receives
        // the remaining time. Every Admitted call must be paired with exactly
        // one finish_attempt or cancel_attempt.
        Admission begin_attempt(std::string_view key, LockState* lock);

        // Releases the slot and records the outcome like record_success or
        // record_failure.
        LockState finish_attempt(std::string_view key, bool success);

        // Releases the slot without counting anything.
        void cancel_attempt(std::string_view key);

        // Drops records that carry no state or have been idle past the
        // retention window. Returns the number removed.
        std::size_t prune();

        // Administrative reset, same effect as a success.
        void clear(std::string_view key);

        // Snapshot of the record with expiry applied; false if none.
        [[nodiscard]] bool lookup(std::string_view key, AttemptRecord* out) const;

        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] const LedgerPolicy& policy() const noexcept { return policy_; }

    private:
        using Map = std::unordered_map<std::string, AttemptRecord>;

        // Clears count and lock once the window has elapsed.
        static void expire(AttemptRecord* rec, Timestamp now) noexcept;

        // All below require mutex_ held.
        [[nodiscard]] bool droppable(const AttemptRecord& rec, Timestamp now) const noexcept;
        AttemptRecord& find_or_insert(std::string_view key, Timestamp now);
        LockState fail(AttemptRecord& rec, Timestamp now) noexcept;
        std::size_t prune_locked(Timestamp now);
        void evict_oldest(Timestamp now);

        LedgerPolicy policy_;
        const seedvault::core::Clock& clock_;
        mutable std::mutex mutex_;
        Map records_;
        std::size_t inserts_since_prune_{0};
    };

    static_assert(std::is_trivially_copyable_v<LedgerPolicy>);
    static_assert(std::is_trivially_copyable_v<AttemptRecord>);
    static_assert(std::is_trivially_copyable_v<LockState>);

} // namespace seedvault::security
