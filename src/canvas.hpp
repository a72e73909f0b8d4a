#pragma once
#include "pixel_buffer.hpp"
#include <string>

// Loads the raw BGRA canvas file. A missing file, a read error or any
// length other than w*h*4 yields a zero-filled buffer of the right size,
// which is also written back so the file matches.
PixelBuffer load_canvas(const std::string& path, int w, int h);

// Atomic replace; the previous file survives a failed write.
bool save_canvas(const std::string& path, const PixelBuffer& buf);

// Creates a zero canvas file if none exists. Returns false on write failure.
bool ensure_canvas(const std::string& path, int w, int h);
