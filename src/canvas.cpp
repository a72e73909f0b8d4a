#include "canvas.hpp"
#include "util.hpp"
#include "log.hpp"
#include <cstring>

PixelBuffer load_canvas(const std::string& path, int w, int h){
    PixelBuffer buf(w, h);
    std::string bytes;
    if (try_read_file(path, bytes)) {
        if (bytes.size() == buf.expected_size()) {
            std::memcpy(buf.data.data(), bytes.data(), bytes.size());
            return buf;
        }
        log_msg("capture", "Canvas size mismatch: got %zu, expected %zu", bytes.size(), buf.expected_size());
    }
    if (!save_canvas(path, buf)) log_msg("capture", "could not recreate canvas %s", path.c_str());
    return buf;
}

bool save_canvas(const std::string& path, const PixelBuffer& buf){
    if (write_file_atomic(path, buf.data.data(), buf.data.size())) return true;
    log_msg("capture", "failed to save canvas %s", path.c_str());
    return false;
}

bool ensure_canvas(const std::string& path, int w, int h){
    if (file_exists(path)) return true;
    PixelBuffer buf(w, h);
    if (!save_canvas(path, buf)) return false;
    log_msg("capture", "Created virtual canvas: %dx%d at %s", w, h, path.c_str());
    return true;
}
