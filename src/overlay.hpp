#pragma once
#include "pixel_buffer.hpp"
#include "sync_protocol.hpp"
#include <string>

struct SDL_Window;
struct SDL_Renderer;
struct SDL_Texture;

enum class AlphaMode {
    Composited,  // 32-bit ARGB visual blended by a compositing manager
    ShapeOnly,   // binary window shape; every shown pixel is opaque
};

// Pixels below this alpha are left out of a binary shape.
const int kShapeAlphaCutoff = 128;

// The overlay frame as a surface can show it. Composited takes the
// renderer's premultiplied BGRA unchanged. ShapeOnly clears faint pixels
// and makes the rest opaque in their straight color.
PixelBuffer prepare_frame(const PixelBuffer& frame, AlphaMode mode);

struct OverlayInputMode {
    bool grab;           // pointer and keyboard held by the overlay
    bool click_through;  // empty input region; all input reaches the windows below
};

// Observation passes every event through; isolation grabs everything.
OverlayInputMode overlay_input_mode(bool blocks_input);

// A full-screen surface the overlay presents finished frames on.
class OverlaySurface {
public:
    virtual ~OverlaySurface() = default;
    virtual bool show() = 0;
    // Drains the platform event queue. False once the surface was asked to close.
    virtual bool pump() = 0;
    // BGRA from prepare_frame for alpha_mode(); alpha 0 is fully see-through.
    virtual bool present(const PixelBuffer& frame) = 0;
    virtual AlphaMode alpha_mode() const = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;
};

// Borderless, always-on-top SDL window covering the desktop. It uses an
// ARGB visual under a compositor and a shaped window otherwise. With
// blocks_input the window grabs pointer and keyboard so nothing reaches
// other clients; otherwise its input region is empty.
class SdlOverlaySurface : public OverlaySurface {
public:
    explicit SdlOverlaySurface(bool blocks_input);
    ~SdlOverlaySurface() override;
    SdlOverlaySurface(const SdlOverlaySurface&) = delete;
    SdlOverlaySurface& operator=(const SdlOverlaySurface&) = delete;

    bool show() override;
    bool pump() override;
    bool present(const PixelBuffer& frame) override;
    AlphaMode alpha_mode() const override { return alpha_; }
    int width() const override { return w_; }
    int height() const override { return h_; }

private:
    bool clear_input_shape();

    OverlayInputMode input_;
    AlphaMode alpha_ = AlphaMode::ShapeOnly;
    bool sdl_ready_ = false;
    int w_ = 0, h_ = 0;
    SDL_Window* win_ = nullptr;
    SDL_Renderer* ren_ = nullptr;
    SDL_Texture* tex_ = nullptr;
};

enum class OverlayState { Created, Shown, Idle, Redrawing, Destroyed };

const char* overlay_state_name(OverlayState s);

// Drives one surface from a SyncReader:
// Created -> Shown -> {Idle <-> Redrawing} -> Destroyed.
class OverlayController {
public:
    static const int kSliceMs = 50;

    OverlayController(OverlaySurface& surface, SyncReader& reader);

    // Shows the surface and presents the initial (empty) frame.
    bool start();
    // One loop iteration: pump events, wait one slice on the reader,
    // redraw on change. False when the surface asked to close.
    bool step();
    void stop();

    OverlayState state() const { return state_; }
    int redraw_count() const { return redraws_; }
    const PixelBuffer& frame() const { return frame_; }

private:
    void redraw(const std::vector<Mark>& marks, const CursorState& cursor);

    OverlaySurface& surface_;
    SyncReader& reader_;
    OverlayState state_ = OverlayState::Created;
    PixelBuffer frame_;
    int redraws_ = 0;
};

// Entry point of the overlay process. Returns the process exit code.
int run_overlay(const std::string& run_dir, bool blocks_input);
