/**
 * @file error.h
 * @brief Error handling infrastructure using C++23 std::expected.
 *
 * Provides:
 * - ErrorCode categories, including the interpreter's domain failures
 *   (ROM too large, stack overflow/underflow, unknown opcode)
 * - Error class with code, message, and source location
 * - Result<T> type alias for std::expected<T, Error>
 * - Ok(), Err(), make_error() helpers and CHIP8_CHECK / CHIP8_TRY macros
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <expected>
#include <source_location>
#include <string>
#include <utility>

namespace chip8 {

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Categorized error codes for Result<T> failures.
 *
 * Values are stable; zero is success and never stored in an Error.
 */
enum class ErrorCode : int {
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 3,
    InvalidState = 4,

    // I/O errors (200-299)
    FileNotFound = 200,
    FileReadError = 202,

    // Configuration errors (300-399)
    ConfigValueInvalid = 301,

    // Emulation errors (400-499)
    MemoryError = 401,
    RomTooLarge = 410,
    StackOverflow = 420,
    StackUnderflow = 421,
    UnknownOpcode = 430,

    // Platform errors (500-599)
    PlatformError = 500,
};

/**
 * @brief Convert ErrorCode to string representation.
 */
[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::ConfigValueInvalid: return "ConfigValueInvalid";
        case ErrorCode::MemoryError: return "MemoryError";
        case ErrorCode::RomTooLarge: return "RomTooLarge";
        case ErrorCode::StackOverflow: return "StackOverflow";
        case ErrorCode::StackUnderflow: return "StackUnderflow";
        case ErrorCode::UnknownOpcode: return "UnknownOpcode";
        case ErrorCode::PlatformError: return "PlatformError";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Structured error with code, message, and source location.
 *
 * Used as the error type in Result<T>. Captures where the error was
 * raised so a host can report it without a debugger.
 *
 * Example:
 * @code
 *   Error err(ErrorCode::RomTooLarge, "ROM is 4000 bytes");
 *   std::fprintf(stderr, "%s\n", err.format().c_str());
 *   // RomTooLarge at machine.cpp:42 (load): ROM is 4000 bytes
 * @endcode
 */
class Error {
public:
    Error(ErrorCode code,
          std::string message,
          std::source_location location = std::source_location::current())
        : code_(code)
        , message_(std::move(message))
        , location_(location)
    {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }

    [[nodiscard]] const char* file() const noexcept { return location_.file_name(); }
    [[nodiscard]] uint_least32_t line() const noexcept { return location_.line(); }
    [[nodiscard]] const char* function() const noexcept { return location_.function_name(); }

    /**
     * @brief Format error for display/logging.
     * @return "CODE at file:line (func): message"
     */
    [[nodiscard]] std::string format() const;

    [[nodiscard]] bool is(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Result Type
// ─────────────────────────────────────────────────────────────────────────────

template<typename T>
using Result = std::expected<T, Error>;

template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

[[nodiscard]] inline constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline std::unexpected<Error> Err(Error error) {
    return std::unexpected(std::move(error));
}

[[nodiscard]] inline std::unexpected<Error> make_error(
    ErrorCode code,
    std::string msg,
    std::source_location loc = std::source_location::current()
) {
    return std::unexpected(Error{code, std::move(msg), loc});
}

/**
 * @brief printf-style message builder used for error and log text.
 */
[[nodiscard]] std::string format_message(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace chip8

// ─────────────────────────────────────────────────────────────────────────────
// Propagation Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Return an error from the enclosing function if cond is false.
 */
#define CHIP8_CHECK(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return ::chip8::make_error(::chip8::ErrorCode::code, msg); \
        } \
    } while (0)

/**
 * @brief Propagate the error of a Result<void> expression.
 */
#define CHIP8_TRY(expr) \
    do { \
        auto&& chip8_try_result_ = (expr); \
        if (!chip8_try_result_.has_value()) { \
            return ::chip8::Err(chip8_try_result_.error()); \
        } \
    } while (0)
