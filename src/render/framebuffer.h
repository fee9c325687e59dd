#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "render/shading.h"

namespace marcher {

// Row-major packed ARGB pixels, top row first.
class Framebuffer {
public:
    Framebuffer(int width, int height)
        : width_(width), height_(height), pixels_(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), kMissColor) {
        if (width <= 0 || height <= 0) {
            throw std::invalid_argument(
                "Framebuffer size must be positive, got " + std::to_string(width) + "x" + std::to_string(height));
        }
    }

    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }

    void setPixel(int x, int y, std::uint32_t value) {
        pixels_[index(x, y)] = value;
    }

    [[nodiscard]] std::uint32_t getPixel(int x, int y) const {
        return pixels_[index(x, y)];
    }

    void fill(std::uint32_t value) {
        std::fill(pixels_.begin(), pixels_.end(), value);
    }

    [[nodiscard]] const std::vector<std::uint32_t>& pixels() const { return pixels_; }
    [[nodiscard]] std::vector<std::uint32_t>& pixels() { return pixels_; }

    // Unpacks to R, G, B, A bytes per pixel in framebuffer order, for byte-wise texture upload.
    void copyToRgba8(std::vector<std::uint8_t>& out) const {
        out.resize(pixels_.size() * 4);
        std::size_t offset = 0;
        for (const std::uint32_t pixel : pixels_) {
            out[offset++] = redOf(pixel);
            out[offset++] = greenOf(pixel);
            out[offset++] = blueOf(pixel);
            out[offset++] = alphaOf(pixel);
        }
    }

    // Binary P6; alpha is dropped.
    void writePPM(const std::string& path) const {
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            throw std::runtime_error("Failed to open output file: " + path);
        }

        out << "P6\n" << width_ << ' ' << height_ << "\n255\n";

        for (const std::uint32_t pixel : pixels_) {
            out.put(static_cast<char>(redOf(pixel)));
            out.put(static_cast<char>(greenOf(pixel)));
            out.put(static_cast<char>(blueOf(pixel)));
        }

        if (!out) {
            throw std::runtime_error("Failed to write output file: " + path);
        }
    }

private:
    int width_;
    int height_;
    std::vector<std::uint32_t> pixels_;

    [[nodiscard]] std::size_t index(int x, int y) const {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
    }
};

}  // namespace marcher
