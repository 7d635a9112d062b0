#include "seedvault/core/clock.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace seedvault::core {
    Timestamp SystemClock::now_ms() const noexcept {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    }

    const Clock& system_clock() noexcept {
        static const SystemClock clock;
        return clock;
    }

    std::string format_iso8601(Timestamp t) {
        i64 secs = t / kMillisPerSecond;
        i64 millis = t % kMillisPerSecond;
        if (millis < 0) {
            millis += kMillisPerSecond;
            secs -= 1;
        }

        const std::time_t tt = static_cast<std::time_t>(secs);
        std::tm tm{};
        if (gmtime_r(&tt, &tm) == nullptr) {
            return std::string();
        }

        char buf[32];
        const int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
        if (n <= 0 || static_cast<std::size_t>(n) >= sizeof(buf)) {
            return std::string();
        }
        return std::string(buf, static_cast<std::size_t>(n));
    }
} // namespace seedvault::core
