#include "uinput_injector.hpp"
#include "x11_display.hpp"
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <chrono>
#include <thread>

static const int kMoveSteps = 20;
static const int kStepDelayMs = 10;
static const int kClickDelayMs = 120;

static void sleep_ms(int ms){ std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

static void ioctl_or_throw(int fd, unsigned long req, long arg, const char* what){
    if (ioctl(fd, req, arg) < 0)
        throw std::runtime_error(std::string(what) + ": " + std::strerror(errno));
}

// US layout: key code for a printable ASCII character and whether shift is held.
static bool ascii_key(char c, int& code, bool& shift){
    static const int letters[26] = {
        KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I, KEY_J, KEY_K, KEY_L, KEY_M,
        KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R, KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z,
    };
    static const int digits[10] = {KEY_0, KEY_1, KEY_2, KEY_3, KEY_4, KEY_5, KEY_6, KEY_7, KEY_8, KEY_9};
    shift = false;
    if (c >= 'a' && c <= 'z') { code = letters[c - 'a']; return true; }
    if (c >= 'A' && c <= 'Z') { code = letters[c - 'A']; shift = true; return true; }
    if (c >= '0' && c <= '9') { code = digits[c - '0']; return true; }
    struct Sym { char c; int code; bool shift; };
    static const Sym syms[] = {
        {' ', KEY_SPACE, false}, {'\n', KEY_ENTER, false}, {'\t', KEY_TAB, false},
        {'-', KEY_MINUS, false}, {'_', KEY_MINUS, true}, {'=', KEY_EQUAL, false}, {'+', KEY_EQUAL, true},
        {'[', KEY_LEFTBRACE, false}, {'{', KEY_LEFTBRACE, true}, {']', KEY_RIGHTBRACE, false},
        {'}', KEY_RIGHTBRACE, true}, {';', KEY_SEMICOLON, false}, {':', KEY_SEMICOLON, true},
        {'\'', KEY_APOSTROPHE, false}, {'"', KEY_APOSTROPHE, true}, {'`', KEY_GRAVE, false},
        {'~', KEY_GRAVE, true}, {'\\', KEY_BACKSLASH, false}, {'|', KEY_BACKSLASH, true},
        {',', KEY_COMMA, false}, {'<', KEY_COMMA, true}, {'.', KEY_DOT, false}, {'>', KEY_DOT, true},
        {'/', KEY_SLASH, false}, {'?', KEY_SLASH, true}, {'!', KEY_1, true}, {'@', KEY_2, true},
        {'#', KEY_3, true}, {'$', KEY_4, true}, {'%', KEY_5, true}, {'^', KEY_6, true},
        {'&', KEY_7, true}, {'*', KEY_8, true}, {'(', KEY_9, true}, {')', KEY_0, true},
    };
    for (const auto& s : syms) {
        if (s.c == c) { code = s.code; shift = s.shift; return true; }
    }
    return false;
}

// Code point starting at text[i]; n receives the sequence length.
static unsigned decode_utf8(const std::string& text, size_t i, size_t& n){
    unsigned char c = (unsigned char)text[i];
    unsigned cp = c;
    n = 1;
    if (c >= 0xF0) { cp = c & 0x07; n = 4; }
    else if (c >= 0xE0) { cp = c & 0x0F; n = 3; }
    else if (c >= 0xC0) { cp = c & 0x1F; n = 2; }
    for (size_t k = 1; k < n; ++k) {
        if (i + k >= text.size() || ((unsigned char)text[i + k] & 0xC0) != 0x80) { n = k; break; }
        cp = (cp << 6) | ((unsigned char)text[i + k] & 0x3F);
    }
    return cp;
}

std::vector<KeyStroke> keystrokes_for(const std::string& text){
    std::vector<KeyStroke> out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') continue;
        KeyStroke ks{0, false};
        if (!ascii_key(c, ks.code, ks.shift)) {
            size_t n = 1;
            unsigned cp = decode_utf8(text, i, n);
            char buf[64];
            snprintf(buf, sizeof(buf), "no key for U+%04X at offset %zu", cp, i);
            throw std::runtime_error(buf);
        }
        out.push_back(ks);
    }
    return out;
}

UinputInjector::UinputInjector(int screen_w, int screen_h)
    : w_(screen_w), h_(screen_h), cur_x_(screen_w / 2), cur_y_(screen_h / 2) {
    fd_ = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
    if (fd_ < 0) throw std::runtime_error(std::string("open /dev/uinput: ") + std::strerror(errno));
    try {
        ioctl_or_throw(fd_, UI_SET_EVBIT, EV_KEY, "UI_SET_EVBIT");
        ioctl_or_throw(fd_, UI_SET_KEYBIT, BTN_LEFT, "UI_SET_KEYBIT");
        ioctl_or_throw(fd_, UI_SET_KEYBIT, BTN_RIGHT, "UI_SET_KEYBIT");
        for (int k = KEY_ESC; k <= KEY_SLASH; ++k) ioctl_or_throw(fd_, UI_SET_KEYBIT, k, "UI_SET_KEYBIT");
        ioctl_or_throw(fd_, UI_SET_KEYBIT, KEY_LEFTSHIFT, "UI_SET_KEYBIT");
        ioctl_or_throw(fd_, UI_SET_KEYBIT, KEY_SPACE, "UI_SET_KEYBIT");
        ioctl_or_throw(fd_, UI_SET_EVBIT, EV_ABS, "UI_SET_EVBIT");
        ioctl_or_throw(fd_, UI_SET_ABSBIT, ABS_X, "UI_SET_ABSBIT");
        ioctl_or_throw(fd_, UI_SET_ABSBIT, ABS_Y, "UI_SET_ABSBIT");

        struct uinput_abs_setup ax{};
        ax.code = ABS_X; ax.absinfo.minimum = 0; ax.absinfo.maximum = w_ - 1;
        if (ioctl(fd_, UI_ABS_SETUP, &ax) < 0) throw std::runtime_error("UI_ABS_SETUP x failed");
        struct uinput_abs_setup ay{};
        ay.code = ABS_Y; ay.absinfo.minimum = 0; ay.absinfo.maximum = h_ - 1;
        if (ioctl(fd_, UI_ABS_SETUP, &ay) < 0) throw std::runtime_error("UI_ABS_SETUP y failed");

        struct uinput_setup us{};
        us.id.bustype = BUS_USB;
        us.id.vendor = 0x1d6b;
        us.id.product = 0x0104;
        std::strncpy(us.name, "deskpilot virtual input", UINPUT_MAX_NAME_SIZE - 1);
        if (ioctl(fd_, UI_DEV_SETUP, &us) < 0) throw std::runtime_error("UI_DEV_SETUP failed");
        if (ioctl(fd_, UI_DEV_CREATE) < 0) throw std::runtime_error("UI_DEV_CREATE failed");
    } catch (...) {
        close(fd_);
        fd_ = -1;
        throw;
    }
    // Give the input stack time to pick up the new device.
    sleep_ms(200);
    if (auto p = query_pointer()) { cur_x_ = p->first; cur_y_ = p->second; }
}

UinputInjector::~UinputInjector(){
    if (fd_ >= 0) {
        ioctl(fd_, UI_DEV_DESTROY);
        close(fd_);
    }
}

void UinputInjector::emit(int type, int code, int value){
    struct input_event ev{};
    ev.type = (unsigned short)type;
    ev.code = (unsigned short)code;
    ev.value = value;
    if (write(fd_, &ev, sizeof(ev)) != (ssize_t)sizeof(ev))
        throw std::runtime_error(std::string("uinput write: ") + std::strerror(errno));
}

void UinputInjector::sync(){ emit(EV_SYN, SYN_REPORT, 0); }

int UinputInjector::to_px(int v, int extent) const {
    return (int)((v / 1000.0) * extent);
}

void UinputInjector::move_abs(int px, int py){
    emit(EV_ABS, ABS_X, px);
    emit(EV_ABS, ABS_Y, py);
    sync();
    cur_x_ = px; cur_y_ = py;
}

// Smoothstep-eased path from the current position.
void UinputInjector::smooth_move(int px, int py){
    int sx = cur_x_, sy = cur_y_;
    int dx = px - sx, dy = py - sy;
    for (int i = 0; i <= kMoveSteps; ++i) {
        double t = (double)i / kMoveSteps;
        t = t * t * (3.0 - 2.0 * t);
        move_abs((int)(sx + dx * t), (int)(sy + dy * t));
        sleep_ms(kStepDelayMs);
    }
}

void UinputInjector::button(int code){
    emit(EV_KEY, code, 1); sync();
    sleep_ms(20);
    emit(EV_KEY, code, 0); sync();
}

void UinputInjector::click_at(int x, int y, int code){
    smooth_move(to_px(x, w_), to_px(y, h_));
    sleep_ms(kClickDelayMs);
    button(code);
}

void UinputInjector::type_text(const std::string& text){
    for (const KeyStroke& ks : keystrokes_for(text)) {
        if (ks.shift) { emit(EV_KEY, KEY_LEFTSHIFT, 1); sync(); }
        emit(EV_KEY, ks.code, 1); sync();
        emit(EV_KEY, ks.code, 0); sync();
        if (ks.shift) { emit(EV_KEY, KEY_LEFTSHIFT, 0); sync(); }
        sleep_ms(5);
    }
}

void UinputInjector::perform(const Action& a){
    switch (a.op) {
        case Op::Click:
            click_at(a.coords[0], a.coords[1], BTN_LEFT);
            break;
        case Op::RightClick:
            click_at(a.coords[0], a.coords[1], BTN_RIGHT);
            break;
        case Op::DoubleClick:
            click_at(a.coords[0], a.coords[1], BTN_LEFT);
            sleep_ms(60);
            click_at(a.coords[0], a.coords[1], BTN_LEFT);
            break;
        case Op::Drag:
            smooth_move(to_px(a.coords[0], w_), to_px(a.coords[1], h_));
            sleep_ms(80);
            emit(EV_KEY, BTN_LEFT, 1); sync();
            sleep_ms(60);
            smooth_move(to_px(a.coords[2], w_), to_px(a.coords[3], h_));
            sleep_ms(60);
            emit(EV_KEY, BTN_LEFT, 0); sync();
            break;
        case Op::Write:
            type_text(a.text);
            break;
        default:
            break;
    }
}
