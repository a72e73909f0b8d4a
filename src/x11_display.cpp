#include "x11_display.hpp"
#include "log.hpp"
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <cstdio>
#include <cstring>

namespace {

// Owns an X connection for the duration of one call.
class DisplayHandle {
public:
    DisplayHandle(): d_(XOpenDisplay(nullptr)) {}
    ~DisplayHandle() { if (d_) XCloseDisplay(d_); }
    DisplayHandle(const DisplayHandle&) = delete;
    DisplayHandle& operator=(const DisplayHandle&) = delete;
    Display* get() const { return d_; }
private:
    Display* d_;
};

}  // namespace

ScreenSize query_screen_size(){
    DisplayHandle dh;
    if (!dh.get()) {
        log_msg("x11", "no display, defaulting 1920x1080");
        return {1920, 1080};
    }
    int scr = DefaultScreen(dh.get());
    int w = DisplayWidth(dh.get(), scr), h = DisplayHeight(dh.get(), scr);
    if (w <= 0 || h <= 0) return {1920, 1080};
    return {w, h};
}

std::optional<std::pair<int,int>> query_pointer(){
    DisplayHandle dh;
    if (!dh.get()) return std::nullopt;
    Window root = DefaultRootWindow(dh.get()), root_ret, child_ret;
    int rx=0, ry=0, wx=0, wy=0; unsigned int mask=0;
    if (!XQueryPointer(dh.get(), root, &root_ret, &child_ret, &rx, &ry, &wx, &wy, &mask))
        return std::nullopt;
    return std::make_pair(rx, ry);
}

bool capture_root_bgra(PixelBuffer& out){
    DisplayHandle dh;
    if (!dh.get()) {
        log_msg("capture", "XOpenDisplay failed");
        return false;
    }
    Display* d = dh.get();
    int scr = DefaultScreen(d);
    int w = DisplayWidth(d, scr), h = DisplayHeight(d, scr);
    XImage* img = XGetImage(d, DefaultRootWindow(d), 0, 0, (unsigned)w, (unsigned)h, AllPlanes, ZPixmap);
    if (!img) {
        log_msg("capture", "XGetImage failed");
        return false;
    }
    if (img->bits_per_pixel != 32 || img->byte_order != LSBFirst) {
        log_msg("capture", "unsupported image format: %d bpp", img->bits_per_pixel);
        XDestroyImage(img);
        return false;
    }
    out = PixelBuffer(w, h);
    for (int y=0; y<h; ++y)
        std::memcpy(out.at(0, y), img->data + (size_t)y * (size_t)img->bytes_per_line, (size_t)w * 4);
    XDestroyImage(img);
    return true;
}

std::optional<unsigned long> find_argb_visual(){
    DisplayHandle dh;
    if (!dh.get()) return std::nullopt;
    Display* d = dh.get();
    int scr = DefaultScreen(d);
    char sel[32];
    std::snprintf(sel, sizeof(sel), "_NET_WM_CM_S%d", scr);
    if (XGetSelectionOwner(d, XInternAtom(d, sel, False)) == None) {
        log_msg("x11", "no compositing manager, overlay falls back to a binary shape");
        return std::nullopt;
    }
    XVisualInfo vi{};
    if (!XMatchVisualInfo(d, scr, 32, TrueColor, &vi)) {
        log_msg("x11", "no 32-bit TrueColor visual");
        return std::nullopt;
    }
    return (unsigned long)vi.visualid;
}
