#include "frame_source.hpp"
#include "canvas.hpp"
#include "mark_renderer.hpp"
#include "resample.hpp"
#include "png_codec.hpp"
#include "x11_display.hpp"
#include "log.hpp"
#include <chrono>
#include <new>
#include <thread>

static const int kOverlaySettleMs = 150;

VirtualCanvasSource::VirtualCanvasSource(RunFiles files, int w, int h)
    : files_(std::move(files)), w_(w), h_(h) {}

std::optional<PixelBuffer> VirtualCanvasSource::capture(const std::vector<std::string>& actions){
    PixelBuffer buf = load_canvas(files_.canvas, w_, h_);

    CursorState st = advance_cursor(load_cursor_state(files_.cursor), actions);
    if (!SyncPublisher(files_, nullptr).publish(nullptr, st))
        log_msg("capture", "could not write %s", files_.cursor.c_str());

    auto marks = marks_from_actions(actions);
    if (!marks.empty()) log_msg("capture", "Drawing %zu marks on virtual canvas", marks.size());
    render_marks(buf, marks, st, canvas_style());

    if (!save_canvas(files_.canvas, buf))
        log_msg("capture", "could not save canvas %s", files_.canvas.c_str());
    return buf;
}

ScreenCaptureSource::ScreenCaptureSource(RunFiles files, NotifyChannel* overlay_channel,
                                         bool overlay_participates, double capture_delay_s)
    : files_(std::move(files)), channel_(overlay_channel),
      overlay_(overlay_participates), delay_s_(capture_delay_s) {}

std::optional<PixelBuffer> ScreenCaptureSource::capture(const std::vector<std::string>& actions){
    CursorState st = advance_cursor(load_cursor_state(files_.cursor), actions);
    if (overlay_) {
        auto marks = load_marks(files_.marks);
        auto fresh = marks_from_actions(actions);
        marks.insert(marks.end(), fresh.begin(), fresh.end());
        if (!SyncPublisher(files_, channel_).publish(&marks, st))
            log_msg("capture", "could not publish marks to %s", files_.marks.c_str());
        std::this_thread::sleep_for(std::chrono::milliseconds(kOverlaySettleMs));
    } else if (!SyncPublisher(files_, channel_).publish(nullptr, st)) {
        log_msg("capture", "could not write %s", files_.cursor.c_str());
    }
    if (delay_s_ > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds((long)(delay_s_ * 1000)));

    PixelBuffer buf;
    try {
        if (!capture_root_bgra(buf)) return std::nullopt;
    } catch (const std::bad_alloc&) {
        log_msg("capture", "out of memory grabbing the screen");
        return std::nullopt;
    }
    return buf;
}

std::string produce_frame_b64(FrameSource& src, const std::vector<std::string>& actions,
                              int target_w, int target_h){
    auto frame = src.capture(actions);
    if (!frame) {
        log_msg("capture", "Screen capture returned nothing -- returning empty base64");
        return "";
    }
    PixelBuffer buf = std::move(*frame);
    int dw = target_w <= 0 ? buf.width : target_w;
    int dh = target_h <= 0 ? buf.height : target_h;
    if (dw != buf.width || dh != buf.height) {
        PixelBuffer resized;
        if (resample_area(buf, dw, dh, resized)) buf = std::move(resized);
        else log_msg("capture", "Resize failed -- using original resolution");
    }
    try {
        std::string png = encode_frame_png(buf);
        return base64_encode(png);
    } catch (const std::exception& ex) {
        log_msg("capture", "encode failed: %s", ex.what());
        return "";
    }
}
