#pragma once
#include "pixel_buffer.hpp"
#include "mark_store.hpp"
#include "sync_protocol.hpp"
#include <optional>
#include <string>
#include <vector>

// Produces "what is visible now" after this turn's actions.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    // BGRA frame at source resolution, nullopt on capture failure.
    virtual std::optional<PixelBuffer> capture(const std::vector<std::string>& actions) = 0;
};

// Persistent synthetic screen in the run directory. Never touches the display.
class VirtualCanvasSource : public FrameSource {
public:
    VirtualCanvasSource(RunFiles files, int w, int h);
    std::optional<PixelBuffer> capture(const std::vector<std::string>& actions) override;
private:
    RunFiles files_;
    int w_, h_;
};

// Live X11 capture. The cursor state is published to the overlay every turn;
// when the overlay participates (isolation mode) this turn's marks are
// appended to the shared mark list and the grab waits for it to settle.
class ScreenCaptureSource : public FrameSource {
public:
    ScreenCaptureSource(RunFiles files, NotifyChannel* overlay_channel,
                        bool overlay_participates, double capture_delay_s);
    std::optional<PixelBuffer> capture(const std::vector<std::string>& actions) override;
private:
    RunFiles files_;
    NotifyChannel* channel_;
    bool overlay_;
    double delay_s_;
};

// capture -> optional resize -> RGBA/opaque -> PNG -> base64.
// Returns "" when no frame could be produced.
std::string produce_frame_b64(FrameSource& src, const std::vector<std::string>& actions,
                              int target_w, int target_h);
