#include "mark_store.hpp"
#include "util.hpp"
#include "log.hpp"

extern "C" {
#include <json-c/json.h>
}

RunFiles RunFiles::in(const std::string& run_dir) {
    std::string d = run_dir.empty() ? "." : run_dir;
    return {
        join_path(d, "marks.json"),
        join_path(d, "cursor_state.json"),
        join_path(d, "virtual_canvas.bmp"),
        join_path(d, "memory.json"),
        join_path(d, "state.json"),
    };
}

std::string marks_to_json(const std::vector<Mark>& marks){
    std::string j = "[";
    bool first = true;
    for (const auto& m: marks){
        if(!first) j += ",";
        first = false;
        j += "{\"type\":\""; j += mark_kind_name(m.kind); j += "\",";
        if (m.kind == MarkKind::Drag){
            j += "\"x1\":"+std::to_string(m.x1)+",\"y1\":"+std::to_string(m.y1)+",";
            j += "\"x2\":"+std::to_string(m.x2)+",\"y2\":"+std::to_string(m.y2);
        } else {
            j += "\"x\":"+std::to_string(m.x1)+",\"y\":"+std::to_string(m.y1);
        }
        j += "}";
    }
    j += "]";
    return j;
}

static bool get_int(json_object* o, const char* k, int& out){
    json_object* v=nullptr;
    if (!json_object_object_get_ex(o,k,&v) || !json_object_is_type(v, json_type_int)) return false;
    out = json_object_get_int(v);
    return true;
}

bool parse_marks_json(const std::string& body, std::vector<Mark>& out){
    json_object* root = json_tokener_parse(body.c_str());
    if (!root) return false;
    if (!json_object_is_type(root, json_type_array)){ json_object_put(root); return false; }
    size_t n = json_object_array_length(root);
    out.clear(); out.reserve(n);
    for (size_t i=0;i<n;i++){
        json_object* jm = json_object_array_get_idx(root, i);
        json_object* jt = nullptr;
        if (!json_object_is_type(jm, json_type_object) || !json_object_object_get_ex(jm,"type",&jt)) continue;
        auto kind = mark_kind_from_name(json_object_get_string(jt));
        if (!kind) continue;
        Mark m{};
        m.kind = *kind;
        if (*kind == MarkKind::Drag){
            if (!get_int(jm,"x1",m.x1) || !get_int(jm,"y1",m.y1) ||
                !get_int(jm,"x2",m.x2) || !get_int(jm,"y2",m.y2)) continue;
        } else {
            if (!get_int(jm,"x",m.x1) || !get_int(jm,"y",m.y1)) continue;
        }
        out.push_back(m);
    }
    json_object_put(root);
    return true;
}

static std::string opt_json(const std::optional<int>& v){
    return v ? std::to_string(*v) : std::string("null");
}

std::string cursor_to_json(const CursorState& st){
    std::string j = "{";
    j += "\"last_x\":"+opt_json(st.last_x)+",";
    j += "\"last_y\":"+opt_json(st.last_y)+",";
    j += "\"prev_x\":"+opt_json(st.prev_x)+",";
    j += "\"prev_y\":"+opt_json(st.prev_y)+",";
    j += "\"generation\":"+std::to_string(st.generation);
    j += "}";
    return j;
}

bool parse_cursor_json(const std::string& body, CursorState& out){
    json_object* root = json_tokener_parse(body.c_str());
    if (!root) return false;
    if (!json_object_is_type(root, json_type_object)){ json_object_put(root); return false; }
    CursorState st{};
    int v = 0;
    if (get_int(root,"last_x",v)) st.last_x = v;
    if (get_int(root,"last_y",v)) st.last_y = v;
    if (get_int(root,"prev_x",v)) st.prev_x = v;
    if (get_int(root,"prev_y",v)) st.prev_y = v;
    json_object* jg = nullptr;
    if (json_object_object_get_ex(root,"generation",&jg) && json_object_is_type(jg, json_type_int))
        st.generation = (uint64_t)json_object_get_int64(jg);
    json_object_put(root);
    out = st;
    return true;
}

std::vector<Mark> load_marks(const std::string& path){
    std::vector<Mark> marks;
    std::string body;
    if (!try_read_file(path, body)) return marks;
    if (!parse_marks_json(body, marks)) {
        log_msg("marks", "ignoring unparsable %s", path.c_str());
        marks.clear();
    }
    return marks;
}

CursorState load_cursor_state(const std::string& path){
    CursorState st{};
    std::string body;
    if (!try_read_file(path, body)) return st;
    if (!parse_cursor_json(body, st)) {
        log_msg("marks", "ignoring unparsable %s", path.c_str());
        st = CursorState{};
    }
    return st;
}

bool save_marks(const std::string& path, const std::vector<Mark>& marks){
    if (write_file_atomic(path, marks_to_json(marks))) return true;
    log_msg("marks", "failed to write %s", path.c_str());
    return false;
}

bool save_cursor_state(const std::string& path, const CursorState& st){
    if (write_file_atomic(path, cursor_to_json(st))) return true;
    log_msg("marks", "failed to write %s", path.c_str());
    return false;
}
