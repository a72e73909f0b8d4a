#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

// Top-down, 4 bytes per pixel. Byte order is B,G,R,A unless a function
// says otherwise.
struct PixelBuffer {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> data;

    PixelBuffer() = default;
    PixelBuffer(int w, int h): width(w), height(h), data((size_t)w * (size_t)h * 4, 0) {}

    size_t expected_size() const { return (size_t)width * (size_t)height * 4; }
    bool valid() const { return width > 0 && height > 0 && data.size() == expected_size(); }
    uint8_t* at(int x, int y) { return &data[((size_t)y * (size_t)width + (size_t)x) * 4]; }
    const uint8_t* at(int x, int y) const { return &data[((size_t)y * (size_t)width + (size_t)x) * 4]; }
};
