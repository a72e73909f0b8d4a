#include "config.hpp"
#include "util.hpp"
#include "log.hpp"
#include <cstdlib>
#include <stdexcept>

extern "C" {
#include <json-c/json.h>
}

std::string default_cfg_path(){
    const char* env = std::getenv("DESKPILOT_CONFIG");
    return env && *env ? env : "config.json";
}

AppCfg load_cfg(const std::string& path){
    AppCfg c{};
    std::string s;
    if (!try_read_file(path, s)) return c;
    json_object* root = json_tokener_parse(s.c_str());
    if (!root || !json_object_is_type(root, json_type_object)) {
        if (root) json_object_put(root);
        throw std::runtime_error("config.json parse error");
    }

    auto getS=[&](const char* k, const std::string& def)->std::string{
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,k,&v)) return def;
        const char* t = json_object_get_string(v);
        return t? std::string(t) : def;
    };
    auto getI=[&](const char* k, int def)->int{
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,k,&v)) return def;
        return json_object_get_int(v);
    };
    auto getD=[&](const char* k, double def)->double{
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,k,&v)) return def;
        return json_object_get_double(v);
    };
    auto getB=[&](const char* k, bool def)->bool{
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,k,&v)) return def;
        return json_object_get_boolean(v) != 0;
    };

    c.model = getS("model", c.model);
    c.api_url = getS("api_url", c.api_url);
    c.temperature = getD("temperature", c.temperature);
    c.top_p = getD("top_p", c.top_p);
    c.max_tokens = getI("max_tokens", c.max_tokens);
    c.width = getI("width", c.width);
    c.height = getI("height", c.height);
    c.execute_actions = getB("execute_actions", c.execute_actions);
    c.physical_execution = getB("physical_execution", c.physical_execution);
    c.overlay_debug = getB("overlay_debug", c.overlay_debug);
    c.virtual_canvas = getB("virtual_canvas", c.virtual_canvas);
    c.loop_delay = getD("loop_delay", c.loop_delay);
    c.capture_delay = getD("capture_delay", c.capture_delay);
    c.screen_width = getI("screen_width", c.screen_width);
    c.screen_height = getI("screen_height", c.screen_height);

    json_object_put(root);
    return c;
}

AppCfg load_cfg_or_defaults(const std::string& path, const char* log_tag){
    try {
        return load_cfg(path);
    } catch (const std::exception& ex) {
        log_msg(log_tag, "%s: %s, using defaults", path.c_str(), ex.what());
        return AppCfg{};
    }
}

bool physical_enabled(const AppCfg& c){
    return c.physical_execution && !c.overlay_debug && !c.virtual_canvas;
}
