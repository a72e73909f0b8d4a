#include <catch2/catch_test_macros.hpp>
#include "resample.hpp"

namespace {

PixelBuffer solid(int w, int h, uint8_t b, uint8_t g, uint8_t r) {
    PixelBuffer buf(w, h);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x) {
            uint8_t* p = buf.at(x, y);
            p[0] = b; p[1] = g; p[2] = r; p[3] = 255;
        }
    return buf;
}

}  // namespace

TEST_CASE("Uniform image keeps its color when scaled", "[resample]") {
    PixelBuffer src = solid(40, 30, 10, 120, 240);
    for (auto wh : {std::make_pair(8, 6), std::make_pair(13, 7), std::make_pair(97, 51)}) {
        PixelBuffer out;
        REQUIRE(resample_area(src, wh.first, wh.second, out));
        REQUIRE(out.width == wh.first);
        REQUIRE(out.height == wh.second);
        REQUIRE(out.valid());
        for (int y = 0; y < out.height; ++y)
            for (int x = 0; x < out.width; ++x) {
                const uint8_t* p = out.at(x, y);
                CHECK((p[0] == 10 && p[1] == 120 && p[2] == 240 && p[3] == 255));
            }
    }
}

TEST_CASE("Downscaling averages the covered area", "[resample]") {
    PixelBuffer src(2, 2);
    src.at(0, 0)[0] = 255;
    src.at(1, 1)[0] = 255;
    PixelBuffer out;
    REQUIRE(resample_area(src, 1, 1, out));
    CHECK((out.at(0, 0)[0] == 127 || out.at(0, 0)[0] == 128));
    CHECK(out.at(0, 0)[1] == 0);
}

TEST_CASE("Halving a 4x4 checker of 2x2 blocks is exact", "[resample]") {
    PixelBuffer src(4, 4);
    for (int y = 0; y < 4; ++y)
        for (int x = 0; x < 4; ++x)
            src.at(x, y)[2] = ((x / 2 + y / 2) % 2) ? 200 : 40;
    PixelBuffer out;
    REQUIRE(resample_area(src, 2, 2, out));
    CHECK(out.at(0, 0)[2] == 40);
    CHECK(out.at(1, 0)[2] == 200);
    CHECK(out.at(0, 1)[2] == 200);
    CHECK(out.at(1, 1)[2] == 40);
}

TEST_CASE("Invalid sizes fail without touching the output", "[resample]") {
    PixelBuffer src = solid(4, 4, 1, 2, 3);
    PixelBuffer out(1, 1);
    out.data[0] = 99;
    CHECK_FALSE(resample_area(src, 0, 4, out));
    CHECK_FALSE(resample_area(PixelBuffer{}, 2, 2, out));
    CHECK(out.width == 1);
    CHECK(out.data[0] == 99);
}
