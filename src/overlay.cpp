#include "overlay.hpp"
#include "mark_renderer.hpp"
#include "x11_display.hpp"
#include "log.hpp"
#include <SDL2/SDL.h>
#include <SDL2/SDL_shape.h>
#include <SDL2/SDL_syswm.h>
#include <X11/Xlib.h>
#include <X11/extensions/shape.h>
#include <algorithm>
#include <string>

const char* overlay_state_name(OverlayState s){
    switch (s) {
        case OverlayState::Created: return "created";
        case OverlayState::Shown: return "shown";
        case OverlayState::Idle: return "idle";
        case OverlayState::Redrawing: return "redrawing";
        case OverlayState::Destroyed: return "destroyed";
    }
    return "?";
}

PixelBuffer prepare_frame(const PixelBuffer& frame, AlphaMode mode){
    PixelBuffer out = frame;
    if (mode == AlphaMode::Composited) return out;
    for (size_t i = 0; i + 3 < out.data.size(); i += 4) {
        uint8_t* p = &out.data[i];
        const unsigned a = p[3];
        if (a < (unsigned)kShapeAlphaCutoff) {
            p[0] = p[1] = p[2] = p[3] = 0;
            continue;
        }
        for (int c = 0; c < 3; ++c) p[c] = (uint8_t)std::min(255u, (p[c] * 255u + a / 2) / a);
        p[3] = 255;
    }
    return out;
}

OverlayInputMode overlay_input_mode(bool blocks_input){
    OverlayInputMode m;
    m.grab = blocks_input;
    m.click_through = !blocks_input;
    return m;
}

SdlOverlaySurface::SdlOverlaySurface(bool blocks_input): input_(overlay_input_mode(blocks_input)) {}

SdlOverlaySurface::~SdlOverlaySurface(){
    if (tex_) SDL_DestroyTexture(tex_);
    if (ren_) SDL_DestroyRenderer(ren_);
    if (win_) SDL_DestroyWindow(win_);
    if (sdl_ready_) SDL_Quit();
}

bool SdlOverlaySurface::show(){
    if (input_.grab) SDL_SetHint(SDL_HINT_GRAB_KEYBOARD, "1");
    SDL_SetHint(SDL_HINT_VIDEO_X11_NET_WM_BYPASS_COMPOSITOR, "0");
    auto visual = find_argb_visual();
    if (visual) {
        std::string id = std::to_string(*visual);
        SDL_SetHint(SDL_HINT_VIDEO_X11_WINDOW_VISUALID, id.c_str());
    }
    if (SDL_Init(SDL_INIT_VIDEO|SDL_INIT_EVENTS)!=0){
        log_msg("overlay", "SDL_Init failed: %s", SDL_GetError());
        return false;
    }
    sdl_ready_ = true;

    SDL_DisplayMode dm;
    if (SDL_GetDesktopDisplayMode(0, &dm) != 0) {
        log_msg("overlay", "SDL_GetDesktopDisplayMode failed: %s", SDL_GetError());
        return false;
    }
    w_ = dm.w; h_ = dm.h;

    Uint32 flags = SDL_WINDOW_BORDERLESS | SDL_WINDOW_ALWAYS_ON_TOP | SDL_WINDOW_SKIP_TASKBAR;
    if (visual) {
        alpha_ = AlphaMode::Composited;
        win_ = SDL_CreateWindow("deskpilot overlay", 0, 0, w_, h_, flags | SDL_WINDOW_HIDDEN);
    } else {
        alpha_ = AlphaMode::ShapeOnly;
        win_ = SDL_CreateShapedWindow("deskpilot overlay", 0, 0, (unsigned)w_, (unsigned)h_, flags);
    }
    if (!win_) {
        log_msg("overlay", "window creation failed: %s", SDL_GetError());
        return false;
    }
    ren_ = SDL_CreateRenderer(win_, -1, SDL_RENDERER_SOFTWARE);
    if (!ren_) {
        log_msg("overlay", "SDL_CreateRenderer failed: %s", SDL_GetError());
        return false;
    }
    tex_ = SDL_CreateTexture(ren_, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_STREAMING, w_, h_);
    if (!tex_) {
        log_msg("overlay", "SDL_CreateTexture failed: %s", SDL_GetError());
        return false;
    }
    // Frames carry their own alpha; copy it to the window untouched.
    SDL_SetTextureBlendMode(tex_, SDL_BLENDMODE_NONE);
    SDL_ShowWindow(win_);
    if (input_.click_through && !clear_input_shape()) return false;
    if (input_.grab) SDL_SetWindowGrab(win_, SDL_TRUE);
    pump();
    log_msg("overlay", "Overlay window created and shown (%dx%d, blocking=%d, %s)", w_, h_,
            (int)input_.grab, alpha_ == AlphaMode::Composited ? "argb" : "shaped");
    return true;
}

// Empty X input region: the window is painted but never hit.
bool SdlOverlaySurface::clear_input_shape(){
    SDL_SysWMinfo info;
    SDL_VERSION(&info.version);
    if (!SDL_GetWindowWMInfo(win_, &info) || info.subsystem != SDL_SYSWM_X11) {
        log_msg("overlay", "no X11 window to make click-through: %s", SDL_GetError());
        return false;
    }
    Display* dpy = info.info.x11.display;
    int ev_base = 0, err_base = 0;
    if (!XShapeQueryExtension(dpy, &ev_base, &err_base)) {
        log_msg("overlay", "X server has no SHAPE extension");
        return false;
    }
    XShapeCombineRectangles(dpy, info.info.x11.window, ShapeInput, 0, 0, nullptr, 0, ShapeSet, Unsorted);
    XFlush(dpy);
    return true;
}

bool SdlOverlaySurface::pump(){
    SDL_Event e;
    bool keep = true;
    while (SDL_PollEvent(&e)) {
        if (e.type == SDL_QUIT) keep = false;
    }
    return keep;
}

bool SdlOverlaySurface::present(const PixelBuffer& frame){
    if (!win_ || !frame.valid() || frame.width != w_ || frame.height != h_) return false;

    if (alpha_ == AlphaMode::ShapeOnly) {
        // ARGB8888 is B,G,R,A in memory on little-endian hosts.
        SDL_Surface* shape = SDL_CreateRGBSurfaceWithFormatFrom(
            const_cast<uint8_t*>(frame.data.data()), w_, h_, 32, w_ * 4, SDL_PIXELFORMAT_ARGB8888);
        if (!shape) {
            log_msg("overlay", "shape surface failed: %s", SDL_GetError());
            return false;
        }
        SDL_WindowShapeMode mode;
        mode.mode = ShapeModeBinarizeAlpha;
        mode.parameters.binarizationCutoff = 1;
        int rc = SDL_SetWindowShape(win_, shape, &mode);
        SDL_FreeSurface(shape);
        if (rc != 0) log_msg("overlay", "SDL_SetWindowShape failed: %s", SDL_GetError());
        // A new bounding shape must not bring the input region back.
        if (input_.click_through && !clear_input_shape()) return false;
    }

    if (SDL_UpdateTexture(tex_, nullptr, frame.data.data(), w_ * 4) != 0) {
        log_msg("overlay", "SDL_UpdateTexture failed: %s", SDL_GetError());
        return false;
    }
    SDL_SetRenderDrawColor(ren_, 0, 0, 0, 0);
    SDL_RenderClear(ren_);
    SDL_RenderCopy(ren_, tex_, nullptr, nullptr);
    SDL_RenderPresent(ren_);
    return true;
}

OverlayController::OverlayController(OverlaySurface& surface, SyncReader& reader)
    : surface_(surface), reader_(reader) {}

bool OverlayController::start(){
    if (!surface_.show()) return false;
    state_ = OverlayState::Shown;
    redraw({}, CursorState{});
    return true;
}

void OverlayController::redraw(const std::vector<Mark>& marks, const CursorState& cursor){
    state_ = OverlayState::Redrawing;
    if (frame_.width != surface_.width() || frame_.height != surface_.height())
        frame_ = PixelBuffer(surface_.width(), surface_.height());
    else
        std::fill(frame_.data.begin(), frame_.data.end(), 0);
    render_marks(frame_, marks, cursor, overlay_style());
    if (!surface_.present(prepare_frame(frame_, surface_.alpha_mode())))
        log_msg("overlay", "present failed");
    ++redraws_;
    state_ = OverlayState::Idle;
}

bool OverlayController::step(){
    if (!surface_.pump()) return false;
    auto wake = reader_.poll(kSliceMs);
    if (wake != SyncReader::Wake::Idle) redraw(reader_.marks(), reader_.cursor());
    return surface_.pump();
}

void OverlayController::stop(){
    state_ = OverlayState::Destroyed;
}

int run_overlay(const std::string& run_dir, bool blocks_input){
    RunFiles files = RunFiles::in(run_dir);
    PosixSemaphoreChannel channel(kRefreshChannelName, PosixSemaphoreChannel::Reader);
    SyncReader reader(files, channel.ready() ? &channel : nullptr);
    SdlOverlaySurface surface(blocks_input);
    OverlayController ctl(surface, reader);

    log_msg("overlay", "run_dir=%s, debug=%d", run_dir.c_str(), (int)blocks_input);
    if (!ctl.start()) return 1;
    log_msg("overlay", "Entering main loop");
    while (ctl.step()) {}
    ctl.stop();
    log_msg("overlay", "Overlay process exiting");
    return 0;
}
