/**
 * @file display.h
 * @brief Monochrome display buffer mutated by CLS and DRW.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace chip8 {

constexpr uint32_t DISPLAY_WIDTH = 64;
constexpr uint32_t DISPLAY_HEIGHT = 32;

/**
 * @brief Row-major grid of 1-bit pixels.
 *
 * Allocated once at machine construction; only clear() and draw_sprite()
 * change pixels. The renderer reads it through pixel()/pixels() and polls
 * take_dirty() to skip frames with no change.
 */
class DisplayBuffer {
public:
    /**
     * @pre width > 0 && height > 0
     */
    DisplayBuffer(uint32_t width = DISPLAY_WIDTH, uint32_t height = DISPLAY_HEIGHT);

    /**
     * @brief Turn every pixel off.
     */
    void clear() noexcept;

    /**
     * @brief XOR an 8-pixel-wide sprite onto the buffer.
     *
     * The origin is taken modulo the buffer size and every pixel wraps
     * around the edges.
     *
     * @param x Origin column (any value; reduced mod width)
     * @param y Origin row (any value; reduced mod height)
     * @param rows Sprite bytes, one per row, MSB leftmost
     * @return true if any lit pixel was turned off (collision)
     */
    bool draw_sprite(uint32_t x, uint32_t y, std::span<const uint8_t> rows) noexcept;

    /**
     * @brief Pixel at (x, y).
     * @pre x < width() && y < height()
     */
    [[nodiscard]] bool pixel(uint32_t x, uint32_t y) const;

    [[nodiscard]] uint32_t width() const noexcept { return width_; }
    [[nodiscard]] uint32_t height() const noexcept { return height_; }

    /// One byte per pixel (0 or 1), row-major.
    [[nodiscard]] std::span<const uint8_t> pixels() const noexcept { return pixels_; }

    /// Number of lit pixels.
    [[nodiscard]] size_t lit_count() const noexcept;

    /**
     * @brief Return whether the buffer changed since the last call, and reset.
     */
    [[nodiscard]] bool take_dirty() noexcept {
        bool was = dirty_;
        dirty_ = false;
        return was;
    }

    [[nodiscard]] bool dirty() const noexcept { return dirty_; }

private:
    uint32_t width_;
    uint32_t height_;
    std::vector<uint8_t> pixels_;
    bool dirty_ = true;
};

} // namespace chip8
