#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "core.h"

/// Region: rectangle of pixels, origin top-left.
struct Region {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    /// Number of pixels covered.
    long long area() const { return static_cast<long long>(width) * height; }
    /// True if (px,py) lies inside.
    bool contains(int px, int py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
};

class PixelWindow;

/**
 * @brief Shared 8-bit RGB image, row-major, top row first, channels interleaved R,G,B.
 * Allocated once before rendering; workers write through disjoint PixelWindows.
 */
class PixelBuffer {
public:
    static constexpr int kChannels = 3;

    PixelBuffer() = default;
    /// Allocate a zeroed width×height buffer; throws std::invalid_argument on non-positive size
    /// and std::length_error if it cannot be addressed.
    PixelBuffer(int width, int height);

    int width() const  { return width_; }
    int height() const { return height_; }
    /// Whole image as a region.
    Region bounds() const { return Region{0, 0, width_, height_}; }

    /// Raw bytes (size width*height*3).
    const std::vector<std::uint8_t>& data() const { return data_; }
    std::uint8_t* raw() { return data_.data(); }

    /// Byte offset of pixel (x,y).
    std::size_t offset(int x, int y) const {
        return (static_cast<std::size_t>(y) * width_ + x) * kChannels;
    }
    /// Channel value at (x,y,c).
    std::uint8_t at(int x, int y, int c) const { return data_[offset(x, y) + c]; }

    /// Write view restricted to @p region; throws std::out_of_range if it leaves the image.
    PixelWindow window(const Region& region);

private:
    int width_{0};
    int height_{0};
    std::vector<std::uint8_t> data_;
};

/**
 * @brief One worker's write access to its region of a PixelBuffer.
 * Coordinates are absolute image coordinates; writes outside the region throw.
 * Windows over disjoint regions never alias, so no locking is needed.
 */
class PixelWindow {
public:
    PixelWindow(std::uint8_t* base, int image_width, const Region& region)
    : base_(base), image_width_(image_width), region_(region) {}

    const Region& region() const { return region_; }

    /// Store a quantized pixel at absolute (x,y).
    void set(int x, int y, std::uint8_t r, std::uint8_t g, std::uint8_t b);

    /// Gamma-correct, clamp, quantize, and store a linear color at absolute (x,y).
    void write_color(int x, int y, const Color& linear);

private:
    std::uint8_t* base_;
    int image_width_;
    Region region_;
};

/// Linear [0,∞) channel to gamma-2 byte; NaN and negatives map to 0.
std::uint8_t to_byte(double linear);
