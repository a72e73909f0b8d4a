#include "mark_renderer.hpp"
#include <algorithm>
#include <cstdlib>

MarkStyle canvas_style(){
    MarkStyle s{};
    s.click        = {255, 255, 255, 255};
    s.double_click = {0, 220, 0, 255};
    s.right_click  = {80, 140, 255, 255};
    s.drag         = {255, 220, 0, 220};
    s.point_radius = 10;
    s.drag_thickness = 4;
    s.prev_cursor  = {255, 0, 0, 50};
    s.prev_radius  = 12;
    s.cursor_outer = {255, 255, 255, 180};
    s.cursor_outer_radius = 14;
    s.cursor_inner = {255, 0, 0, 200};
    s.cursor_inner_radius = 10;
    return s;
}

MarkStyle overlay_style(){
    MarkStyle s = canvas_style();
    s.click        = {255, 255, 255, 220};
    s.double_click = {0, 220, 0, 220};
    s.right_click  = {80, 140, 255, 220};
    s.drag         = {255, 220, 0, 200};
    s.prev_cursor  = {255, 0, 0, 70};
    s.cursor_outer = {255, 255, 255, 240};
    s.cursor_inner = {255, 0, 0, 220};
    return s;
}

int norm_coord(int v, int extent){
    v = std::max(0, std::min(1000, v));
    return (int)((v / 1000.0) * extent);
}

void blend_pixel(PixelBuffer& buf, int x, int y, Rgba c){
    if (x < 0 || y < 0 || x >= buf.width || y >= buf.height) return;
    uint8_t* p = buf.at(x, y);
    if (c.a == 255) {
        p[0] = c.b; p[1] = c.g; p[2] = c.r; p[3] = 255;
        return;
    }
    const unsigned a = c.a, inv = 255 - c.a;
    p[0] = (uint8_t)((c.b * a + p[0] * inv) / 255);
    p[1] = (uint8_t)((c.g * a + p[1] * inv) / 255);
    p[2] = (uint8_t)((c.r * a + p[2] * inv) / 255);
    p[3] = (uint8_t)std::min(255u, a + p[3] * inv / 255);
}

void fill_circle(PixelBuffer& buf, int cx, int cy, int radius, Rgba c){
    const int r2 = radius * radius;
    for (int oy = -radius; oy <= radius; ++oy) {
        int y = cy + oy;
        if (y < 0 || y >= buf.height) continue;
        for (int ox = -radius; ox <= radius; ++ox) {
            if (ox * ox + oy * oy > r2) continue;
            blend_pixel(buf, cx + ox, y, c);
        }
    }
}

void draw_thick_line(PixelBuffer& buf, int x1, int y1, int x2, int y2, Rgba c, int thickness){
    const int dx = std::abs(x2 - x1), dy = std::abs(y2 - y1);
    const int sx = x1 < x2 ? 1 : -1;
    const int sy = y1 < y2 ? 1 : -1;
    const int half = thickness >> 1;
    int err = dx - dy;
    int x = x1, y = y1;
    for (;;) {
        fill_circle(buf, x, y, half, c);
        if (x == x2 && y == y2) break;
        int e2 = err << 1;
        if (e2 > -dy) { err -= dy; x += sx; }
        if (e2 < dx) { err += dx; y += sy; }
    }
}

void render_marks(PixelBuffer& buf, const std::vector<Mark>& marks,
                  const CursorState& cursor, const MarkStyle& style){
    const int w = buf.width, h = buf.height;
    for (const auto& m : marks) {
        switch (m.kind) {
            case MarkKind::Click:
                fill_circle(buf, norm_coord(m.x1, w), norm_coord(m.y1, h), style.point_radius, style.click);
                break;
            case MarkKind::DoubleClick:
                fill_circle(buf, norm_coord(m.x1, w), norm_coord(m.y1, h), style.point_radius, style.double_click);
                break;
            case MarkKind::RightClick:
                fill_circle(buf, norm_coord(m.x1, w), norm_coord(m.y1, h), style.point_radius, style.right_click);
                break;
            case MarkKind::Drag:
                draw_thick_line(buf, norm_coord(m.x1, w), norm_coord(m.y1, h),
                                norm_coord(m.x2, w), norm_coord(m.y2, h), style.drag, style.drag_thickness);
                break;
        }
    }
    if (cursor.has_prev()) {
        fill_circle(buf, norm_coord(*cursor.prev_x, w), norm_coord(*cursor.prev_y, h),
                    style.prev_radius, style.prev_cursor);
    }
    if (cursor.has_last()) {
        int cx = norm_coord(*cursor.last_x, w), cy = norm_coord(*cursor.last_y, h);
        fill_circle(buf, cx, cy, style.cursor_outer_radius, style.cursor_outer);
        fill_circle(buf, cx, cy, style.cursor_inner_radius, style.cursor_inner);
    }
}
