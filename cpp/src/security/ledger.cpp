#include "seedvault/security/ledger.hpp"

#include <algorithm>

namespace seedvault::security {
    namespace {
        constexpr std::size_t kPruneInterval = 1024; // new keys between sweeps
    } // namespace

    AttemptLedger::AttemptLedger(const LedgerPolicy& policy, const seedvault::core::Clock& clock) noexcept
        : policy_(policy), clock_(clock) {
        if (policy_.max_attempts == 0) {
            policy_.max_attempts = 1;
        }
        if (policy_.initial_backoff_ms <= 0) {
            policy_.initial_backoff_ms = kAccountPolicy.initial_backoff_ms;
        }
        policy_.max_backoff_ms = std::max(policy_.max_backoff_ms, policy_.initial_backoff_ms);
        if (policy_.idle_retention_ms <= 0) {
            policy_.idle_retention_ms = LedgerPolicy{}.idle_retention_ms;
        }
        if (policy_.max_records == 0) {
            policy_.max_records = LedgerPolicy{}.max_records;
        }
    }

    void AttemptLedger::expire(AttemptRecord* rec, Timestamp now) noexcept {
        if (rec->lock_until != 0 && now >= rec->lock_until) {
            rec->lock_until = 0;
            rec->failure_count = 0;
        }
    }

    bool AttemptLedger::droppable(const AttemptRecord& rec, Timestamp now) const noexcept {
        if (rec.in_flight != 0) {
            return false;
        }
        if (rec.lock_until != 0 && now < rec.lock_until) {
            return false;
        }
        AttemptRecord cur = rec;
        expire(&cur, now);
        if (cur.failure_count == 0 && cur.backoff_ms == policy_.initial_backoff_ms) {
            return true;
        }
        return now - cur.last_seen >= policy_.idle_retention_ms;
    }

    std::size_t AttemptLedger::prune_locked(Timestamp now) {
        std::size_t removed = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            if (droppable(it->second, now)) {
                it = records_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void AttemptLedger::evict_oldest(Timestamp now) {
        auto victim = records_.end();
        for (auto it = records_.begin(); it != records_.end(); ++it) {
            const AttemptRecord& rec = it->second;
            if (rec.in_flight != 0 || (rec.lock_until != 0 && now < rec.lock_until)) {
                continue;
            }
            if (victim == records_.end() || rec.last_seen < victim->second.last_seen) {
                victim = it;
            }
        }
        if (victim != records_.end()) {
            records_.erase(victim);
        }
    }

    AttemptRecord& AttemptLedger::find_or_insert(std::string_view key, Timestamp now) {
        std::string k(key);
        const auto it = records_.find(k);
        if (it != records_.end()) {
            return it->second;
        }

        if (++inserts_since_prune_ >= kPruneInterval || records_.size() >= policy_.max_records) {
            inserts_since_prune_ = 0;
            (void)prune_locked(now);
        }
        if (records_.size() >= policy_.max_records) {
            evict_oldest(now);
        }

        AttemptRecord& rec = records_.emplace(std::move(k), AttemptRecord{}).first->second;
        rec.backoff_ms = policy_.initial_backoff_ms;
        rec.last_seen = now;
        return rec;
    }

    LockState AttemptLedger::fail(AttemptRecord& rec, Timestamp now) noexcept {
        if (rec.lock_until != 0 && now < rec.lock_until) {
            return LockState{true, rec.lock_until - now};
        }
        expire(&rec, now);
        rec.last_seen = now;

        rec.failure_count += 1;
        if (rec.failure_count < policy_.max_attempts) {
            return LockState{};
        }

        rec.lock_until = now + rec.backoff_ms;
        const LockState state{true, rec.backoff_ms};
        if (policy_.escalate) {
            // Halve the ceiling first so the doubling cannot overflow.
            rec.backoff_ms = rec.backoff_ms > policy_.max_backoff_ms / 2 ? policy_.max_backoff_ms : rec.backoff_ms * 2;
        }
        return state;
    }

    LockState AttemptLedger::is_locked(std::string_view key) const {
        const Timestamp now = clock_.now_ms();
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = records_.find(std::string(key));
        if (it == records_.end()) {
            return LockState{};
        }
        const AttemptRecord& rec = it->second;
        if (rec.lock_until != 0 && now < rec.lock_until) {
            return LockState{true, rec.lock_until - now};
        }
        return LockState{};
    }

    LockState AttemptLedger::record_failure(std::string_view key) {
        const Timestamp now = clock_.now_ms();
        std::lock_guard<std::mutex> lock(mutex_);
        return fail(find_or_insert(key, now), now);
    }

    void AttemptLedger::record_success(std::string_view key) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(std::string(key));
    }

    Admission AttemptLedger::begin_attempt(std::string_view key, LockState* lock) {
        const Timestamp now = clock_.now_ms();
        std::lock_guard<std::mutex> guard(mutex_);
        AttemptRecord& rec = find_or_insert(key, now);
        if (rec.lock_until != 0 && now < rec.lock_until) {
            if (lock != nullptr) {
                *lock = LockState{true, rec.lock_until - now};
            }
            return Admission::Locked;
        }
        expire(&rec, now);
        rec.last_seen = now;
        if (rec.failure_count + rec.in_flight >= policy_.max_attempts) {
            return Admission::Saturated;
        }
        rec.in_flight += 1;
        return Admission::Admitted;
    }

    LockState AttemptLedger::finish_attempt(std::string_view key, bool success) {
        const Timestamp now = clock_.now_ms();
        std::lock_guard<std::mutex> lock(mutex_);
        if (success) {
            records_.erase(std::string(key));
            return LockState{};
        }
        // The record may be gone if a concurrent success reset the key.
        AttemptRecord& rec = find_or_insert(key, now);
        if (rec.in_flight > 0) {
            rec.in_flight -= 1;
        }
        return fail(rec, now);
    }

    void AttemptLedger::cancel_attempt(std::string_view key) {
        const Timestamp now = clock_.now_ms();
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = records_.find(std::string(key));
        if (it == records_.end()) {
            return;
        }
        if (it->second.in_flight > 0) {
            it->second.in_flight -= 1;
        }
        if (droppable(it->second, now)) {
            records_.erase(it);
        }
    }

    void AttemptLedger::clear(std::string_view key) {
        record_success(key);
    }

    bool AttemptLedger::lookup(std::string_view key, AttemptRecord* out) const {
        if (out == nullptr) {
            return false;
        }
        const Timestamp now = clock_.now_ms();
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = records_.find(std::string(key));
        if (it == records_.end()) {
            return false;
        }
        AttemptRecord rec = it->second;
        expire(&rec, now);
        *out = rec;
        return true;
    }

    std::size_t AttemptLedger::prune() {
        const Timestamp now = clock_.now_ms();
        std::lock_guard<std::mutex> lock(mutex_);
        return prune_locked(now);
    }

    std::size_t AttemptLedger::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }
} // namespace seedvault::security
