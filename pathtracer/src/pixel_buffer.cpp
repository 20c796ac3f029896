#include "pixel_buffer.h"
#include <cmath>
#include <stdexcept>
#include <string>
#include "interval.h"

PixelBuffer::PixelBuffer(int width, int height) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) throw std::invalid_argument("PixelBuffer size must be positive");
    if (static_cast<unsigned long long>(width) * static_cast<unsigned long long>(height) >
        data_.max_size() / kChannels) {
        throw std::length_error("PixelBuffer " + std::to_string(width) + "x" + std::to_string(height) +
                                " is too large");
    }
    data_.assign(static_cast<std::size_t>(width) * height * kChannels, 0);
}

PixelWindow PixelBuffer::window(const Region& region) {
    if (region.width <= 0 || region.height <= 0 || region.x < 0 || region.y < 0 ||
        region.x + region.width > width_ || region.y + region.height > height_) {
        throw std::out_of_range("Region " + std::to_string(region.x) + "," + std::to_string(region.y) +
                                " " + std::to_string(region.width) + "x" + std::to_string(region.height) +
                                " is outside the image");
    }
    return PixelWindow(data_.data(), width_, region);
}

void PixelWindow::set(int x, int y, std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    if (!region_.contains(x, y)) {
        throw std::out_of_range("Pixel " + std::to_string(x) + "," + std::to_string(y) +
                                " is outside the worker region");
    }
    std::uint8_t* p = base_ + (static_cast<std::size_t>(y) * image_width_ + x) * PixelBuffer::kChannels;
    p[0] = r;
    p[1] = g;
    p[2] = b;
}

void PixelWindow::write_color(int x, int y, const Color& linear) {
    set(x, y, to_byte(linear.r), to_byte(linear.g), to_byte(linear.b));
}

std::uint8_t to_byte(double linear) {
    if (!(linear > 0.0)) return 0;  // also catches NaN
    static const Interval intensity(0.000, 0.999);
    const double gamma = std::sqrt(linear);
    return static_cast<std::uint8_t>(256 * intensity.clamp(gamma));
}
