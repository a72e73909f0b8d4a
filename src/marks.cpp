#include "marks.hpp"
#include "invocation.hpp"

const char* mark_kind_name(MarkKind k) {
    switch (k) {
        case MarkKind::Click: return "click";
        case MarkKind::DoubleClick: return "double_click";
        case MarkKind::RightClick: return "right_click";
        case MarkKind::Drag: return "drag";
    }
    return "click";
}

std::optional<MarkKind> mark_kind_from_name(const std::string& s) {
    if (s == "click") return MarkKind::Click;
    if (s == "double_click") return MarkKind::DoubleClick;
    if (s == "right_click") return MarkKind::RightClick;
    if (s == "drag") return MarkKind::Drag;
    return std::nullopt;
}

static bool numeric_args(const Invocation& inv, std::vector<int>& out) {
    out.clear();
    for (const auto& a : inv.args) {
        if (a.type != Literal::Number) return false;
        out.push_back((int)a.num);
    }
    return true;
}

std::vector<Mark> marks_from_actions(const std::vector<std::string>& actions) {
    std::vector<Mark> marks;
    std::vector<int> v;
    for (const auto& line : actions) {
        auto inv = parse_invocation(line);
        if (!inv || !numeric_args(*inv, v)) continue;
        switch (inv->op) {
            case Op::Click:
                if (v.size() >= 2) marks.push_back(Mark::point(MarkKind::Click, v[0], v[1]));
                break;
            case Op::DoubleClick:
                if (v.size() >= 2) marks.push_back(Mark::point(MarkKind::DoubleClick, v[0], v[1]));
                break;
            case Op::RightClick:
                if (v.size() >= 2) marks.push_back(Mark::point(MarkKind::RightClick, v[0], v[1]));
                break;
            case Op::Drag:
                if (v.size() >= 4) marks.push_back(Mark::drag(v[0], v[1], v[2], v[3]));
                break;
            default:
                break;
        }
    }
    return marks;
}

CursorState advance_cursor(CursorState st, const std::vector<std::string>& actions) {
    st.prev_x = st.last_x;
    st.prev_y = st.last_y;
    for (const auto& m : marks_from_actions(actions)) {
        if (m.kind == MarkKind::Drag) { st.last_x = m.x2; st.last_y = m.y2; }
        else { st.last_x = m.x1; st.last_y = m.y1; }
    }
    return st;
}
