#pragma once
#include <vector>
#include <string>
#include <optional>
#include <cstdint>

enum class MarkKind { Click, DoubleClick, RightClick, Drag };

// Normalized [0,1000] coordinates. Point marks use x1/y1 only.
struct Mark {
    MarkKind kind = MarkKind::Click;
    int x1 = 0, y1 = 0;
    int x2 = 0, y2 = 0;

    static Mark point(MarkKind k, int x, int y) { return {k, x, y, 0, 0}; }
    static Mark drag(int x1, int y1, int x2, int y2) { return {MarkKind::Drag, x1, y1, x2, y2}; }

    bool operator==(const Mark& o) const {
        return kind == o.kind && x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
    }
};

struct CursorState {
    std::optional<int> last_x, last_y;
    std::optional<int> prev_x, prev_y;
    uint64_t generation = 0;

    bool has_last() const { return last_x && last_y; }
    bool has_prev() const { return prev_x && prev_y; }
};

const char* mark_kind_name(MarkKind k);
std::optional<MarkKind> mark_kind_from_name(const std::string& s);

// Marks for the pointer actions among canonical action lines; other
// operations produce none.
std::vector<Mark> marks_from_actions(const std::vector<std::string>& actions);

// prev <- last, then last <- the final click point or drag endpoint in
// `actions`. The generation is left for the publisher to bump.
CursorState advance_cursor(CursorState st, const std::vector<std::string>& actions);
