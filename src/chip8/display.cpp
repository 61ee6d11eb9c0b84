/**
 * @file display.cpp
 * @brief DisplayBuffer implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/display.h"
#include "chip8/gsl.hpp"

#include <algorithm>

namespace chip8 {

DisplayBuffer::DisplayBuffer(uint32_t width, uint32_t height)
    : width_(width)
    , height_(height)
{
    gsl_Expects(width > 0 && height > 0);
    pixels_.assign(static_cast<size_t>(width) * height, 0);
}

void DisplayBuffer::clear() noexcept {
    std::fill(pixels_.begin(), pixels_.end(), uint8_t{0});
    dirty_ = true;
}

bool DisplayBuffer::draw_sprite(uint32_t x, uint32_t y, std::span<const uint8_t> rows) noexcept {
    const uint32_t x0 = x % width_;
    const uint32_t y0 = y % height_;
    bool collision = false;

    for (size_t row = 0; row < rows.size(); ++row) {
        const uint8_t bits = rows[row];
        const uint32_t py = static_cast<uint32_t>((y0 + row) % height_);

        for (uint32_t col = 0; col < 8; ++col) {
            if ((bits & (0x80u >> col)) == 0) {
                continue;
            }
            const uint32_t px = (x0 + col) % width_;
            uint8_t& cell = pixels_[static_cast<size_t>(py) * width_ + px];
            if (cell) {
                collision = true;
            }
            cell ^= 1;
        }
    }

    dirty_ = true;
    return collision;
}

bool DisplayBuffer::pixel(uint32_t x, uint32_t y) const {
    gsl_Expects(x < width_ && y < height_);
    return pixels_[static_cast<size_t>(y) * width_ + x] != 0;
}

size_t DisplayBuffer::lit_count() const noexcept {
    return static_cast<size_t>(std::count(pixels_.begin(), pixels_.end(), uint8_t{1}));
}

} // namespace chip8
