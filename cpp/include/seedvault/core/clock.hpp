#pragma once

#include <atomic>
#include <string>

#include "seedvault/core/types.hpp"

namespace seedvault::core {

    class Clock {
    public:
        virtual ~Clock() = default;
        [[nodiscard]] virtual Timestamp now_ms() const noexcept = 0;
    };

    class SystemClock final : public Clock {
    public:
        [[nodiscard]] Timestamp now_ms() const noexcept override;
    };

    // Test clock; only moves when told to.
    class ManualClock final : public Clock {
    public:
        explicit ManualClock(Timestamp start = 0) noexcept : now_(start) {}

        [[nodiscard]] Timestamp now_ms() const noexcept override {
            return now_.load(std::memory_order_acquire);
        }

        void set(Timestamp t) noexcept { now_.store(t, std::memory_order_release); }
        void advance(i64 delta_ms) noexcept { now_.fetch_add(delta_ms, std::memory_order_acq_rel); }

    private:
        std::atomic<Timestamp> now_;
    };

    // Process-wide wall clock for callers without an injected one.
    [[nodiscard]] const Clock& system_clock() noexcept;

    // "2024-05-01T12:00:00.000Z"; UTC, millisecond precision.
    [[nodiscard]] std::string format_iso8601(Timestamp t);

} // namespace seedvault::core
