#include "png_codec.hpp"
#include <stdexcept>
#include <zlib.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>

std::vector<uint8_t> bgra_to_rgba_opaque(const PixelBuffer& bgra){
    std::vector<uint8_t> out(bgra.data.size());
    for (size_t i = 0; i + 3 < bgra.data.size(); i += 4) {
        out[i]     = bgra.data[i + 2];
        out[i + 1] = bgra.data[i + 1];
        out[i + 2] = bgra.data[i];
        out[i + 3] = 255;
    }
    return out;
}

static void put_be32(std::string& s, uint32_t v){
    s += (char)((v >> 24) & 0xFF);
    s += (char)((v >> 16) & 0xFF);
    s += (char)((v >> 8) & 0xFF);
    s += (char)(v & 0xFF);
}

static void put_chunk(std::string& out, const char tag[4], const std::string& body){
    put_be32(out, (uint32_t)body.size());
    std::string tb(tag, 4);
    tb += body;
    out += tb;
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(tb.data()), (uInt)tb.size());
    put_be32(out, (uint32_t)crc);
}

std::string encode_png_rgba(const uint8_t* rgba, int w, int h){
    if (w <= 0 || h <= 0) throw std::runtime_error("png: invalid dimensions");
    const size_t stride = (size_t)w * 4;
    std::string raw;
    raw.reserve((stride + 1) * (size_t)h);
    for (int y = 0; y < h; ++y) {
        raw += '\0';
        raw.append(reinterpret_cast<const char*>(rgba + stride * (size_t)y), stride);
    }

    uLongf zlen = compressBound((uLong)raw.size());
    std::string z(zlen, '\0');
    int rc = compress2(reinterpret_cast<Bytef*>(&z[0]), &zlen,
                       reinterpret_cast<const Bytef*>(raw.data()), (uLong)raw.size(), 6);
    if (rc != Z_OK) throw std::runtime_error("png: compress2 failed (" + std::to_string(rc) + ")");
    z.resize(zlen);

    std::string ihdr;
    put_be32(ihdr, (uint32_t)w);
    put_be32(ihdr, (uint32_t)h);
    ihdr += (char)8;   // bit depth
    ihdr += (char)6;   // RGBA
    ihdr += (char)0;   // deflate
    ihdr += (char)0;   // adaptive filtering, only type 0 used
    ihdr += (char)0;   // no interlace

    std::string png("\x89PNG\r\n\x1a\n", 8);
    put_chunk(png, "IHDR", ihdr);
    put_chunk(png, "IDAT", z);
    put_chunk(png, "IEND", "");
    return png;
}

std::string encode_frame_png(const PixelBuffer& bgra){
    if (!bgra.valid()) throw std::runtime_error("png: buffer size does not match dimensions");
    auto rgba = bgra_to_rgba_opaque(bgra);
    return encode_png_rgba(rgba.data(), bgra.width, bgra.height);
}

std::string base64_encode(const std::string& in){
    if (in.empty()) return "";
    BIO *bio, *b64; BUF_MEM *bufferPtr;
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, bio);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, in.data(), (int)in.size());
    (void)BIO_flush(b64);
    BIO_get_mem_ptr(b64, &bufferPtr);
    std::string out(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);
    return out;
}

std::string base64_decode(const std::string& in){
    if (in.empty()) return "";
    BIO *bio, *b64;
    int len = (int)in.size();
    std::string out; out.resize(len);
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new_mem_buf(in.data(), len);
    b64 = BIO_push(b64, bio);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    int outlen = BIO_read(b64, &out[0], len);
    BIO_free_all(b64);
    if (outlen < 0) outlen = 0;
    out.resize(outlen);
    return out;
}

std::string png_data_uri(const std::string& b64){
    return "data:image/png;base64," + b64;
}
