/**
 * @file check_cxx23.cpp
 * @brief C++23 feature validation test.
 *
 * Used by CMake's try_compile to verify that the compiler and standard
 * library support the C++23 features the interpreter relies on.
 *
 * Required features:
 * - std::expected<T, E> from <expected>
 * - std::span<T> from <span>
 * - std::source_location from <source_location>
 * - defaulted operator== and string_view::starts_with
 */

#include <cstdint>
#include <expected>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

struct Word {
    uint16_t raw = 0;
    constexpr bool operator==(const Word&) const noexcept = default;
};

std::expected<Word, std::string> fetch(std::span<const uint8_t> bytes) {
    if (bytes.size() < 2) {
        return std::unexpected("short read");
    }
    return Word{static_cast<uint16_t>((bytes[0] << 8) | bytes[1])};
}

unsigned where(std::source_location loc = std::source_location::current()) {
    return loc.line();
}

int main() {
    const uint8_t program[] = {0x00, 0xE0};
    auto word = fetch(program);
    if (!word || !(*word == Word{0x00E0})) {
        return 1;
    }
    if (!std::string_view("--debug").starts_with("--")) {
        return 1;
    }
    return where() > 0 ? 0 : 1;
}
