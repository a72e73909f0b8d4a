#pragma once
#include "pixel_buffer.hpp"
#include "marks.hpp"
#include <vector>
#include <cstdint>

struct Rgba { uint8_t r, g, b, a; };

struct MarkStyle {
    Rgba click, double_click, right_click, drag;
    int point_radius;
    int drag_thickness;
    Rgba prev_cursor;
    int prev_radius;
    Rgba cursor_outer;
    int cursor_outer_radius;
    Rgba cursor_inner;
    int cursor_inner_radius;
};

// Palette for the persistent synthetic canvas.
MarkStyle canvas_style();
// Palette for the overlay surface, drawn over a cleared transparent buffer.
MarkStyle overlay_style();

// [0,1000] -> [0,extent], clamped first.
int norm_coord(int v, int extent);

// Source-over compositing into a BGRA buffer; alpha 255 overwrites.
void blend_pixel(PixelBuffer& buf, int x, int y, Rgba c);
void fill_circle(PixelBuffer& buf, int cx, int cy, int radius, Rgba c);
// Bresenham walk stamping a filled circle of radius thickness/2 per step.
void draw_thick_line(PixelBuffer& buf, int x1, int y1, int x2, int y2, Rgba c, int thickness);

// Paints marks in order, then the previous and current cursor on top.
void render_marks(PixelBuffer& buf, const std::vector<Mark>& marks,
                  const CursorState& cursor, const MarkStyle& style);
