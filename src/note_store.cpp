#include "note_store.hpp"
#include "util.hpp"
#include "log.hpp"

extern "C" {
#include <json-c/json.h>
}

NoteStore::NoteStore(std::string path): path_(std::move(path)) {}

std::vector<std::string> NoteStore::load() const {
    std::vector<std::string> items;
    std::string body;
    if (!try_read_file(path_, body)) return items;
    json_object* root = json_tokener_parse(body.c_str());
    if (!root) return items;
    if (json_object_is_type(root, json_type_array)){
        size_t n = json_object_array_length(root);
        for (size_t i=0;i<n;i++){
            json_object* v = json_object_array_get_idx(root, i);
            if (json_object_is_type(v, json_type_string)) items.push_back(json_object_get_string(v));
        }
    }
    json_object_put(root);
    return items;
}

bool NoteStore::append(const std::string& note){
    auto items = load();
    items.push_back(note);
    std::string j = "[\n";
    for (size_t i=0;i<items.size();i++){
        j += "  \"" + escape_json(items[i]) + "\"";
        j += i+1<items.size() ? ",\n" : "\n";
    }
    j += "]";
    if (write_file_atomic(path_, j)) return true;
    log_msg("notes", "failed to write %s", path_.c_str());
    return false;
}

std::string NoteStore::recall() const {
    auto items = load();
    if (items.empty()) return "(no memories yet)";
    std::string out;
    for (const auto& s: items){
        if (!out.empty()) out += "\n";
        out += "- " + s;
    }
    return out;
}
