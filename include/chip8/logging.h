/**
 * @file logging.h
 * @brief Callback-based logging for the interpreter core and frontend.
 *
 * - All output goes through a host-settable callback
 * - Without a callback, messages go to stderr as "[LEVEL] SUBSYS: message"
 * - Level filtering is lock-free so trace logging in the step loop is cheap
 *   when disabled
 *
 * Usage:
 *   chip8::set_log_callback(my_logger, userdata);
 *   CHIP8_LOG_WARN("CPU", "Unknown instruction 0x%04X at 0x%03X", op, pc);
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace chip8 {

/**
 * @brief Log severity levels, most to least severe.
 */
enum class LogLevel : int {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
    Trace = 4
};

/**
 * @brief Log callback type.
 *
 * @param level     Severity level of the message
 * @param subsystem Subsystem identifier ("CPU", "MEM", "TIMER", ...)
 * @param message   Null-terminated message
 * @param userdata  Pointer given at registration
 */
using LogCallback = void (*)(LogLevel level,
                             const char* subsystem,
                             const char* message,
                             void* userdata);

/**
 * @brief Install a log callback (nullptr restores the stderr handler).
 */
void set_log_callback(LogCallback callback, void* userdata) noexcept;

/**
 * @brief Set minimum level; messages less severe are dropped.
 */
void set_log_level(LogLevel level) noexcept;

[[nodiscard]] LogLevel get_log_level() noexcept;

[[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

[[nodiscard]] inline bool log_level_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

/**
 * @brief Log a pre-formatted message (fast path).
 */
void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept;

/**
 * @brief Log with printf-style formatting.
 */
void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

namespace detail {

/**
 * @brief Default handler writing to stderr.
 */
void default_log_handler(LogLevel level,
                         const char* subsystem,
                         const char* message,
                         void* userdata) noexcept;

} // namespace detail

} // namespace chip8

// ─────────────────────────────────────────────────────────────────────────────
// Logging Macros
// ─────────────────────────────────────────────────────────────────────────────

#define CHIP8_LOG_LEVEL_ENABLED(level) \
    ::chip8::log_level_enabled(::chip8::LogLevel::level)

#define CHIP8_LOG_ERROR(subsys, ...) \
    ::chip8::log_printf(::chip8::LogLevel::Error, subsys, __VA_ARGS__)

#define CHIP8_LOG_WARN(subsys, ...) \
    ::chip8::log_printf(::chip8::LogLevel::Warn, subsys, __VA_ARGS__)

#define CHIP8_LOG_INFO(subsys, ...) \
    ::chip8::log_printf(::chip8::LogLevel::Info, subsys, __VA_ARGS__)

#define CHIP8_LOG_DEBUG(subsys, ...) \
    ::chip8::log_printf(::chip8::LogLevel::Debug, subsys, __VA_ARGS__)

#define CHIP8_LOG_TRACE(subsys, ...) \
    do { \
        if (CHIP8_LOG_LEVEL_ENABLED(Trace)) { \
            ::chip8::log_printf(::chip8::LogLevel::Trace, subsys, __VA_ARGS__); \
        } \
    } while (0)
