#pragma once
#include <string>

struct AppCfg {
    std::string model = "qwen3-vl-2b-instruct-1m";
    std::string api_url = "http://localhost:1234/v1/chat/completions";
    double temperature = 0.7;
    double top_p = 0.9;
    int max_tokens = 300;
    int width = 512;
    int height = 288;
    bool execute_actions = true;
    bool physical_execution = false;
    bool overlay_debug = true;
    bool virtual_canvas = true;
    double loop_delay = 2.0;
    double capture_delay = 1.0;
    // 0 = ask the X server.
    int screen_width = 0;
    int screen_height = 0;
};

// Path from $DESKPILOT_CONFIG, else "config.json".
std::string default_cfg_path();

// Missing file -> defaults. Unparsable file -> std::runtime_error.
AppCfg load_cfg(const std::string& path);

// load_cfg that logs and falls back to defaults instead of throwing.
AppCfg load_cfg_or_defaults(const std::string& path, const char* log_tag);

// Input is only synthesized when physical execution is on and neither the
// overlay isolation mode nor the virtual canvas is active.
bool physical_enabled(const AppCfg& c);
