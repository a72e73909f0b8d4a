#pragma once
#include "execution.hpp"
#include <string>
#include <vector>

struct KeyStroke {
    int code;
    bool shift;
};

// Key presses typing `text` on a US layout; '\r' is dropped. Throws
// std::runtime_error naming the first character without a key, so nothing
// is typed when part of the text cannot be.
std::vector<KeyStroke> keystrokes_for(const std::string& text);

// Synthesizes pointer and key events through a /dev/uinput virtual device
// with an absolute pointer spanning the screen.
class UinputInjector : public InputInjector {
public:
    // Throws std::runtime_error if the device cannot be created.
    UinputInjector(int screen_w, int screen_h);
    ~UinputInjector() override;
    UinputInjector(const UinputInjector&) = delete;
    UinputInjector& operator=(const UinputInjector&) = delete;

    void perform(const Action& a) override;

private:
    void emit(int type, int code, int value);
    void sync();
    void move_abs(int px, int py);
    void smooth_move(int px, int py);
    void button(int code);
    void click_at(int x, int y, int code);
    void type_text(const std::string& text);
    int to_px(int v, int extent) const;

    int fd_ = -1;
    int w_, h_;
    int cur_x_, cur_y_;
};
