#include <catch2/catch_test_macros.hpp>
#include "png_codec.hpp"
#include <zlib.h>

namespace {

uint32_t be32(const std::string& s, size_t at) {
    return ((uint32_t)(uint8_t)s[at] << 24) | ((uint32_t)(uint8_t)s[at + 1] << 16) |
           ((uint32_t)(uint8_t)s[at + 2] << 8) | (uint32_t)(uint8_t)s[at + 3];
}

PixelBuffer gradient(int w, int h) {
    PixelBuffer b(w, h);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x) {
            uint8_t* p = b.at(x, y);
            p[0] = (uint8_t)(x * 7);
            p[1] = (uint8_t)(y * 13);
            p[2] = (uint8_t)(x + y);
            p[3] = 0;
        }
    return b;
}

}  // namespace

TEST_CASE("PNG starts with the signature and an RGBA IHDR", "[png]") {
    std::string png = encode_frame_png(gradient(5, 3));
    REQUIRE(png.size() > 8 + 25 + 12 + 12);
    CHECK(png.compare(0, 8, std::string("\x89PNG\r\n\x1a\n", 8)) == 0);
    CHECK(be32(png, 8) == 13);
    CHECK(png.compare(12, 4, "IHDR") == 0);
    CHECK(be32(png, 16) == 5);
    CHECK(be32(png, 20) == 3);
    CHECK((uint8_t)png[24] == 8);
    CHECK((uint8_t)png[25] == 6);
    CHECK(png.compare(png.size() - 12, 12, std::string("\0\0\0\0IEND\xae\x42\x60\x82", 12)) == 0);
}

TEST_CASE("Chunk CRCs cover tag and payload", "[png]") {
    std::string png = encode_frame_png(gradient(4, 4));
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(png.data() + 12), 4 + 13);
    CHECK(be32(png, 12 + 4 + 13) == (uint32_t)crc);
}

TEST_CASE("IDAT inflates to filter-0 scanlines of opaque RGBA", "[png]") {
    PixelBuffer src = gradient(6, 2);
    std::string png = encode_frame_png(src);
    size_t idat = 8 + 12 + 13;
    uint32_t len = be32(png, idat);
    REQUIRE(png.compare(idat + 4, 4, "IDAT") == 0);

    std::string raw((6 * 4 + 1) * 2, '\0');
    uLongf raw_len = (uLongf)raw.size();
    REQUIRE(uncompress(reinterpret_cast<Bytef*>(&raw[0]), &raw_len,
                       reinterpret_cast<const Bytef*>(png.data() + idat + 8), len) == Z_OK);
    REQUIRE(raw_len == raw.size());
    for (int y = 0; y < 2; ++y) {
        const char* row = raw.data() + y * (6 * 4 + 1);
        CHECK(row[0] == 0);
        for (int x = 0; x < 6; ++x) {
            const uint8_t* px = reinterpret_cast<const uint8_t*>(row + 1 + x * 4);
            const uint8_t* s = src.at(x, y);
            CHECK(px[0] == s[2]);
            CHECK(px[1] == s[1]);
            CHECK(px[2] == s[0]);
            CHECK(px[3] == 255);
        }
    }
}

TEST_CASE("Encoding is deterministic", "[png]") {
    CHECK(encode_frame_png(gradient(9, 7)) == encode_frame_png(gradient(9, 7)));
}

TEST_CASE("Invalid buffers are refused", "[png]") {
    PixelBuffer bad;
    CHECK_THROWS_AS(encode_frame_png(bad), std::runtime_error);
    PixelBuffer truncated(4, 4);
    truncated.data.resize(10);
    CHECK_THROWS_AS(encode_frame_png(truncated), std::runtime_error);
}

TEST_CASE("Base64 transport", "[png][base64]") {
    CHECK(base64_encode("hello") == "aGVsbG8=");
    CHECK(base64_decode("aGVsbG8=") == "hello");
    CHECK(base64_encode("").empty());
    CHECK(png_data_uri("QUJD") == "data:image/png;base64,QUJD");

    std::string png = encode_frame_png(gradient(3, 3));
    std::string b64 = base64_encode(png);
    CHECK(b64.find('\n') == std::string::npos);
    CHECK(base64_decode(b64) == png);
}
