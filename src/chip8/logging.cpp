/**
 * @file logging.cpp
 * @brief Implementation of callback-based logging.
 *
 * Thread-safety: the callback registration is protected by a mutex, but
 * level checks are lock-free so disabled trace logging in the step loop
 * costs one atomic load.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace chip8 {

// ═══════════════════════════════════════════════════════════════════════════════
// Global State
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

// Mutex for callback registration (not for logging itself)
std::mutex g_log_mutex;

LogCallback g_log_callback = nullptr;
void* g_log_userdata = nullptr;

// Minimum log level (atomic for lock-free reads in hot path)
std::atomic<LogLevel> g_min_log_level{LogLevel::Info};

// Buffer size for printf-style formatting
constexpr size_t LOG_BUFFER_SIZE = 1024;

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

void set_log_callback(LogCallback callback, void* userdata) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_callback = callback;
    g_log_userdata = userdata;
}

void set_log_level(LogLevel level) noexcept {
    g_min_log_level.store(level, std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
    return g_min_log_level.load(std::memory_order_relaxed);
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "UNKNOWN";
}

namespace detail {

void default_log_handler(
    LogLevel level,
    const char* subsystem,
    const char* message,
    void* /*userdata*/
) noexcept {
    std::fprintf(stderr, "[%s] %s: %s\n", log_level_name(level), subsystem, message);
}

} // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// Core Logging Functions
// ─────────────────────────────────────────────────────────────────────────────

void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept {
    if (!log_level_enabled(level)) {
        return;
    }

    // Copy out the callback under a brief lock
    LogCallback callback = nullptr;
    void* userdata = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        callback = g_log_callback;
        userdata = g_log_userdata;
    }

    // string_view is not guaranteed to be null-terminated
    char buffer[LOG_BUFFER_SIZE];
    size_t len = message.size() < LOG_BUFFER_SIZE ? message.size() : LOG_BUFFER_SIZE - 1;
    std::memcpy(buffer, message.data(), len);
    buffer[len] = '\0';

    if (callback) {
        callback(level, subsystem, buffer, userdata);
    } else {
        detail::default_log_handler(level, subsystem, buffer, nullptr);
    }
}

void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept {
    // Fast path: check level without formatting
    if (!log_level_enabled(level)) {
        return;
    }

    char buffer[LOG_BUFFER_SIZE];
    va_list args;
    va_start(args, fmt);
    int written = std::vsnprintf(buffer, LOG_BUFFER_SIZE, fmt, args);
    va_end(args);

    if (written < 0) {
        buffer[0] = '\0';
    } else if (static_cast<size_t>(written) >= LOG_BUFFER_SIZE) {
        // Truncated - add ellipsis
        buffer[LOG_BUFFER_SIZE - 4] = '.';
        buffer[LOG_BUFFER_SIZE - 3] = '.';
        buffer[LOG_BUFFER_SIZE - 2] = '.';
        buffer[LOG_BUFFER_SIZE - 1] = '\0';
    }

    log_raw(level, subsystem, buffer);
}

} // namespace chip8
