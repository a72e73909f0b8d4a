#pragma once
#include "pixel_buffer.hpp"

// Area-averaging resize: each destination pixel is the coverage-weighted
// mean of the source pixels under it. Works for up- and downscaling.
// Returns false, leaving `out` untouched, on invalid sizes or allocation
// failure.
bool resample_area(const PixelBuffer& src, int dw, int dh, PixelBuffer& out);
