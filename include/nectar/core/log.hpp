#pragma once

#include "nectar/core/types.hpp"

namespace nectar::core {

    enum class LogLevel : u8 {
        Trace = 0,
        Debug,
        Info,
        Warn,
        Error,
        Off,
    };

    // Receives one formatted line without trailing newline.
    using LogSink = void (*)(LogLevel level, const char* component, const char* message, void* user);

    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;
    [[nodiscard]] bool log_enabled(LogLevel level) noexcept;

    // nullptr restores the default stderr sink.
    void log_set_sink(LogSink sink, void* user);

    [[nodiscard]] const char* log_level_name(LogLevel level) noexcept;
    [[nodiscard]] bool log_level_parse(const char* s, LogLevel* out) noexcept;

    // Writes regardless of the level. Output is serialized by a mutex.
    void log_write(LogLevel level, const char* component, const char* fmt, ...)
        __attribute__((format(printf, 3, 4)));

    // Drops the line unless the level is enabled.
    void log_trace(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace nectar::core
