#include "seedvault/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace seedvault::core {
    namespace {
        std::atomic<LogLevel> g_min_level{LogLevel::Info};
        std::mutex g_log_mutex;

        [[nodiscard]] const char* level_prefix(LogLevel level) noexcept {
            switch (level) {
                case LogLevel::Debug: return "debug";
                case LogLevel::Info: return "info";
                case LogLevel::Warn: return "warn";
                case LogLevel::Error: return "error";
                case LogLevel::Off: return "off";
            }
            return "log";
        }
    } // namespace

    void log_write(LogLevel level, const char* fmt, ...) noexcept {
        if (fmt == nullptr || level == LogLevel::Off) {
            return;
        }
        if (static_cast<u8>(level) < static_cast<u8>(g_min_level.load(std::memory_order_relaxed))) {
            return;
        }

        char line[1024];
        va_list args;
        va_start(args, fmt);
        const int n = std::vsnprintf(line, sizeof(line), fmt, args);
        va_end(args);
        if (n < 0) {
            return;
        }

        // One fprintf per line so concurrent requests do not interleave.
        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::fprintf(stderr, "%s: %s\n", level_prefix(level), line);
    }

    void log_set_level(LogLevel level) noexcept {
        g_min_level.store(level, std::memory_order_relaxed);
    }

    LogLevel log_level() noexcept {
        return g_min_level.load(std::memory_order_relaxed);
    }

    bool log_level_parse(const char* s, LogLevel* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        static constexpr struct {
            const char* name;
            LogLevel level;
        } kLevels[] = {
            {"debug", LogLevel::Debug},
            {"info", LogLevel::Info},
            {"warn", LogLevel::Warn},
            {"error", LogLevel::Error},
            {"off", LogLevel::Off},
        };
        for (const auto& l : kLevels) {
            if (std::strcmp(s, l.name) == 0) {
                *out = l.level;
                return true;
            }
        }
        return false;
    }

    void log_status(LogLevel level, const char* context, Status s) noexcept {
        log_write(level, "%s failed: %s (code=%u, domain=%s, aux=%u)",
            context != nullptr ? context : "operation",
            status_code_name(s.code),
            static_cast<unsigned>(s.code),
            status_domain_name(s.domain),
            static_cast<unsigned>(s.aux));
    }
} // namespace seedvault::core
