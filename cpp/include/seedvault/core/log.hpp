#pragma once

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::core {

    enum class LogLevel : u8 {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4,
    };

    // Lines go to stderr as "<level>: <message>". Never pass secrets here.
    void log_write(LogLevel level, const char* fmt, ...) noexcept
#if defined(__GNUC__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;

    // Parses "debug", "info", "warn", "error", "off".
    [[nodiscard]] bool log_level_parse(const char* s, LogLevel* out) noexcept;

    // Convenience for the common "error: <context> failed (code, domain)" line.
    void log_status(LogLevel level, const char* context, Status s) noexcept;

} // namespace seedvault::core
