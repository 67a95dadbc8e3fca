#include "nectar/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace nectar::core {
    namespace {
        struct LogState {
            std::atomic<u8> level{static_cast<u8>(LogLevel::Warn)};
            std::mutex mutex; // guards sink/user and serializes output
            LogSink sink{nullptr};
            void* user{nullptr};
        };

        LogState g_log;

        void stderr_sink(LogLevel level, const char* component, const char* message, void*) {
            std::fprintf(stderr, "nectar %s [%s] %s\n", log_level_name(level), component, message);
        }
    } // namespace

    void log_set_level(LogLevel level) noexcept {
        g_log.level.store(static_cast<u8>(level), std::memory_order_relaxed);
    }

    LogLevel log_level() noexcept {
        return static_cast<LogLevel>(g_log.level.load(std::memory_order_relaxed));
    }

    bool log_enabled(LogLevel level) noexcept {
        return level != LogLevel::Off && static_cast<u8>(level) >= g_log.level.load(std::memory_order_relaxed);
    }

    void log_set_sink(LogSink sink, void* user) {
        std::lock_guard<std::mutex> lock(g_log.mutex);
        g_log.sink = sink;
        g_log.user = user;
    }

    const char* log_level_name(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
        }
        return "unknown";
    }

    bool log_level_parse(const char* s, LogLevel* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        static constexpr LogLevel kLevels[] = {
            LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
            LogLevel::Warn, LogLevel::Error, LogLevel::Off,
        };
        for (LogLevel l : kLevels) {
            if (std::strcmp(s, log_level_name(l)) == 0) {
                *out = l;
                return true;
            }
        }
        return false;
    }

    namespace {
        void log_vwrite(LogLevel level, const char* component, const char* fmt, va_list args) {
            char line[1024];
            std::vsnprintf(line, sizeof(line), fmt, args);

            std::lock_guard<std::mutex> lock(g_log.mutex);
            const char* comp = component ? component : "-";
            if (g_log.sink != nullptr) {
                g_log.sink(level, comp, line, g_log.user);
            } else {
                stderr_sink(level, comp, line, nullptr);
            }
        }
    } // namespace

    void log_write(LogLevel level, const char* component, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        log_vwrite(level, component, fmt, args);
        va_end(args);
    }

    void log_trace(const char* component, const char* fmt, ...) {
        if (!log_enabled(LogLevel::Trace)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Trace, component, fmt, args);
        va_end(args);
    }

    void log_debug(const char* component, const char* fmt, ...) {
        if (!log_enabled(LogLevel::Debug)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Debug, component, fmt, args);
        va_end(args);
    }

    void log_info(const char* component, const char* fmt, ...) {
        if (!log_enabled(LogLevel::Info)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Info, component, fmt, args);
        va_end(args);
    }

    void log_warn(const char* component, const char* fmt, ...) {
        if (!log_enabled(LogLevel::Warn)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Warn, component, fmt, args);
        va_end(args);
    }

    void log_error(const char* component, const char* fmt, ...) {
        if (!log_enabled(LogLevel::Error)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Error, component, fmt, args);
        va_end(args);
    }
} // namespace nectar::core
