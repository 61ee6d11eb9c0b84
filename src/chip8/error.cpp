/**
 * @file error.cpp
 * @brief Error formatting helpers.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/error.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace chip8 {

std::string format_message(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);

    std::string out;
    if (needed > 0) {
        out.resize(static_cast<size_t>(needed) + 1);
        std::vsnprintf(out.data(), out.size(), fmt, args);
        out.resize(static_cast<size_t>(needed));
    }
    va_end(args);
    return out;
}

std::string Error::format() const {
    // Keep just the file name; __FILE__ can be an absolute build path
    const char* path = file();
    const char* base = std::strrchr(path, '/');
    base = base ? base + 1 : path;

    return format_message("%s at %s:%u (%s): %s",
        error_code_name(code_),
        base,
        static_cast<unsigned>(line()),
        function(),
        message_.c_str());
}

} // namespace chip8
