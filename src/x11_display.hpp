#pragma once
#include "pixel_buffer.hpp"
#include <optional>
#include <utility>

struct ScreenSize { int w; int h; };

// Size of the default screen; 1920x1080 when no display can be opened.
ScreenSize query_screen_size();

// Pointer position in root window pixels, if a display is available.
std::optional<std::pair<int,int>> query_pointer();

// Grabs the whole root window as BGRA. Returns false (and logs) when the
// display cannot be opened or the image has an unsupported format.
bool capture_root_bgra(PixelBuffer& out);

// Id of a 32-bit TrueColor visual when a compositing manager runs on the
// default screen; without one, ARGB windows would show opaque.
std::optional<unsigned long> find_argb_visual();
