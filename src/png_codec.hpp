#pragma once
#include "pixel_buffer.hpp"
#include <string>
#include <vector>
#include <cstdint>

// BGRA -> RGBA with alpha forced to 255.
std::vector<uint8_t> bgra_to_rgba_opaque(const PixelBuffer& bgra);

// Minimal PNG: IHDR (8-bit RGBA), one IDAT of filter-0 scanlines deflated
// at level 6, IEND. Output is identical for identical input.
// Throws std::runtime_error on bad dimensions or compressor failure.
std::string encode_png_rgba(const uint8_t* rgba, int w, int h);

std::string encode_frame_png(const PixelBuffer& bgra);

std::string base64_encode(const std::string& in);
std::string base64_decode(const std::string& in);
std::string png_data_uri(const std::string& b64);
