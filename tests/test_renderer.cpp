#include <catch2/catch_test_macros.hpp>
#include "mark_renderer.hpp"
#include <utility>

namespace {

bool is_bgra(const PixelBuffer& b, int x, int y, uint8_t bl, uint8_t g, uint8_t r, uint8_t a) {
    const uint8_t* p = b.at(x, y);
    return p[0] == bl && p[1] == g && p[2] == r && p[3] == a;
}

}  // namespace

TEST_CASE("Normalized coordinates scale to the buffer extent", "[renderer]") {
    CHECK(norm_coord(0, 1920) == 0);
    CHECK(norm_coord(500, 1920) == 960);
    CHECK(norm_coord(1000, 1080) == 1080);
    CHECK(norm_coord(-20, 100) == 0);
    CHECK(norm_coord(4000, 100) == 100);
}

TEST_CASE("Click mark lands on the midpoint", "[renderer]") {
    PixelBuffer buf(200, 100);
    render_marks(buf, {Mark::point(MarkKind::Click, 500, 500)}, CursorState{}, canvas_style());
    CHECK(is_bgra(buf, 100, 50, 255, 255, 255, 255));
    CHECK(is_bgra(buf, 110, 50, 255, 255, 255, 255));
    CHECK(is_bgra(buf, 111, 50, 0, 0, 0, 0));
    CHECK(is_bgra(buf, 0, 0, 0, 0, 0, 0));
}

TEST_CASE("Drag mark spans opposite corners", "[renderer]") {
    PixelBuffer buf(64, 48);
    render_marks(buf, {Mark::drag(0, 0, 1000, 1000)}, CursorState{}, canvas_style());
    for (auto xy : {std::make_pair(0, 0), std::make_pair(63, 47), std::make_pair(32, 24)}) {
        const uint8_t* p = buf.at(xy.first, xy.second);
        INFO(xy.first << "," << xy.second);
        CHECK(p[0] == 0);
        CHECK(p[1] > 0);
        CHECK(p[2] > p[1]);
        CHECK(p[3] > 0);
    }
    CHECK(is_bgra(buf, 63, 0, 0, 0, 0, 0));
    CHECK(is_bgra(buf, 0, 47, 0, 0, 0, 0));
}

TEST_CASE("Opaque colors overwrite, translucent colors blend", "[renderer]") {
    PixelBuffer buf(4, 4);
    blend_pixel(buf, 1, 1, {10, 20, 30, 255});
    CHECK(is_bgra(buf, 1, 1, 30, 20, 10, 255));

    blend_pixel(buf, 1, 1, {255, 255, 255, 0});
    CHECK(is_bgra(buf, 1, 1, 30, 20, 10, 255));

    PixelBuffer half(1, 1);
    blend_pixel(half, 0, 0, {255, 0, 0, 128});
    CHECK(is_bgra(half, 0, 0, 0, 0, 128, 128));

    blend_pixel(half, 7, 7, {1, 1, 1, 255});  // clipped, no crash
}

TEST_CASE("Cursor indicators are drawn over the marks", "[renderer]") {
    PixelBuffer buf(100, 100);
    CursorState cur;
    cur.last_x = 500; cur.last_y = 500;
    render_marks(buf, {Mark::point(MarkKind::Click, 500, 500)}, cur, canvas_style());
    // Inner red (alpha 200) over outer white (alpha 180) over the white click.
    const uint8_t* p = buf.at(50, 50);
    CHECK(p[2] == 255);
    CHECK(p[0] < 100);
    CHECK(p[1] < 100);
}

TEST_CASE("Previous cursor is fainter than the current one", "[renderer]") {
    PixelBuffer buf(100, 100);
    CursorState cur;
    cur.prev_x = 200; cur.prev_y = 200;
    cur.last_x = 800; cur.last_y = 800;
    render_marks(buf, {}, cur, canvas_style());
    CHECK(buf.at(20, 20)[2] > 0);
    CHECK(buf.at(20, 20)[2] < buf.at(80, 80)[2]);
}

TEST_CASE("Rendering the same state twice onto a fresh buffer is identical", "[renderer]") {
    std::vector<Mark> marks = {Mark::point(MarkKind::DoubleClick, 250, 750), Mark::drag(100, 900, 900, 100),
                               Mark::point(MarkKind::RightClick, 600, 300)};
    CursorState cur;
    cur.prev_x = 250; cur.prev_y = 750; cur.last_x = 900; cur.last_y = 100;
    PixelBuffer a(160, 90), b(160, 90);
    render_marks(a, marks, cur, overlay_style());
    render_marks(b, marks, cur, overlay_style());
    CHECK(a.data == b.data);
}

TEST_CASE("Thick line covers both endpoints and stays in bounds", "[renderer]") {
    PixelBuffer buf(20, 20);
    draw_thick_line(buf, 2, 17, 17, 2, {0, 0, 255, 255}, 4);
    CHECK(is_bgra(buf, 2, 17, 255, 0, 0, 255));
    CHECK(is_bgra(buf, 17, 2, 255, 0, 0, 255));
    CHECK(is_bgra(buf, 10, 9, 255, 0, 0, 255));
    CHECK(is_bgra(buf, 2, 2, 0, 0, 0, 0));
}
