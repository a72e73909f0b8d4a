#include "agent_loop.hpp"
#include "canvas.hpp"
#include "mark_store.hpp"
#include "x11_display.hpp"
#include "util.hpp"
#include "log.hpp"
#include <chrono>
#include <cstdarg>
#include <cstdlib>
#include <ctime>
#include <thread>
#include <cerrno>
#include <sys/stat.h>

extern "C" {
#include <json-c/json.h>
}

static void log_main(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
static void log_main(const char* fmt, ...){
    char body[2048];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(body, sizeof(body), fmt, ap);
    va_end(ap);
    std::string tag = "main][" + clock_hms();
    log_msg(tag.c_str(), "%s", body);
}

static std::string iso_now(){
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmv);
    return buf;
}

static bool make_dirs(const std::string& path){
    std::string cur;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        cur = path.substr(0, pos);
        if (cur.empty()) continue;
        if (::mkdir(cur.c_str(), 0755) != 0 && errno != EEXIST) return false;
    }
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string resolve_run_dir(){
    const char* env = std::getenv("DESKPILOT_RUN_DIR");
    if (env && *env) {
        struct stat st{};
        if (::stat(env, &st) == 0 && S_ISDIR(st.st_mode)) return env;
    }
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    char name[64];
    std::strftime(name, sizeof(name), "runs/run_%Y%m%d_%H%M%S", &tmv);
    return make_dirs(name) ? name : "";
}

LoopState load_loop_state(const std::string& path){
    LoopState st;
    std::string s;
    if (!try_read_file(path, s)) return st;
    json_object* root = json_tokener_parse(s.c_str());
    if (!root) return st;
    if (json_object_is_type(root, json_type_object)) {
        json_object* v=nullptr;
        if (json_object_object_get_ex(root,"story",&v)) {
            const char* t = json_object_get_string(v);
            st.story = t ? t : "";
        }
        if (json_object_object_get_ex(root,"turn",&v)) st.turn = json_object_get_int(v);
    }
    json_object_put(root);
    return st;
}

static std::string str_array(const std::vector<std::string>& v){
    std::string j = "[";
    for (size_t i=0;i<v.size();i++){
        j += i ? ",\n    " : "\n    ";
        j += "\"" + escape_json(v[i]) + "\"";
    }
    return j + (v.empty() ? "]" : "\n  ]");
}

bool save_loop_state(const std::string& path, const LoopState& st, const TurnResult& last){
    std::string j = "{\n";
    j += "  \"turn\": " + std::to_string(st.turn) + ",\n";
    j += "  \"story\": \"" + escape_json(st.story) + "\",\n";
    j += "  \"prev_story\": \"" + escape_json(st.prev_story) + "\",\n";
    j += "  \"executed\": " + str_array(last.executed) + ",\n";
    j += "  \"extracted_code\": " + str_array(last.extracted_code) + ",\n";
    j += "  \"malformed\": " + str_array(last.malformed) + ",\n";
    j += "  \"ignored\": " + str_array(last.ignored) + ",\n";
    j += "  \"timestamp\": \"" + iso_now() + "\"\n";
    j += "}";
    return write_file_atomic(path, j);
}

AgentLoop::AgentLoop(std::string run_dir, std::string exe, std::string cfg_path)
    : run_dir_(std::move(run_dir)), exe_(std::move(exe)), cfg_path_(std::move(cfg_path)) {
    state_path_ = join_path(run_dir_, "state.json");
    turn_fn_ = [this](const std::string& raw, const std::string& dir) {
        return request_turn(exe_, raw, dir);
    };
    client_factory_ = [](const AppCfg& c) -> std::unique_ptr<InferenceClient> {
        InferenceCfg ic;
        ic.api_url = c.api_url;
        ic.model = c.model;
        ic.temperature = c.temperature;
        ic.top_p = c.top_p;
        ic.max_tokens = c.max_tokens;
        return std::make_unique<HttpInferenceClient>(ic);
    };
}

AgentLoop::~AgentLoop(){ shutdown(); }

void AgentLoop::start(){
    state_ = load_loop_state(state_path_);
    log_main("Starting agent loop. Run dir: %s", run_dir_.c_str());
    log_main("Resuming from turn %d, story length: %zu chars",
             state_.turn, state_.story.size());

    AppCfg cfg = load_cfg_or_defaults(cfg_path_, "main");
    virtual_canvas_ = cfg.virtual_canvas;
    if (virtual_canvas_) {
        std::string canvas = RunFiles::in(run_dir_).canvas;
        if (file_exists(canvas)) {
            log_main("Virtual canvas already exists: %s", canvas.c_str());
        } else {
            ScreenSize sz{cfg.screen_width, cfg.screen_height};
            if (sz.w <= 0 || sz.h <= 0) sz = query_screen_size();
            if (ensure_canvas(canvas, sz.w, sz.h))
                log_main("Created virtual canvas: %dx%d (%lld bytes) at %s", sz.w, sz.h,
                         (long long)sz.w * sz.h * 4, canvas.c_str());
            else
                log_main("ERROR: could not create virtual canvas at %s", canvas.c_str());
        }
        log_main("VIRTUAL_CANVAS mode: overlay process will NOT be started");
    } else {
        start_overlay(cfg);
    }
}

void AgentLoop::start_overlay(const AppCfg& cfg){
    if (!overlay_enabled_) return;
    if (overlay_ && overlay_->running()) return;
    const char* flag = cfg.overlay_debug ? "1" : "0";
    auto child = std::make_unique<ChildProcess>();
    if (!child->spawn({exe_, "overlay", run_dir_, flag})) {
        log_main("Failed to start overlay process");
        overlay_.reset();
        return;
    }
    log_main("Overlay process started (pid=%d, debug=%s)", (int)child->pid(), flag);
    overlay_ = std::move(child);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
}

void AgentLoop::check_overlay(const AppCfg& cfg){
    if (!overlay_) return;
    int rc = 0;
    if (overlay_->running(&rc)) return;
    log_main("Overlay process exited with code %d, restarting...", rc);
    overlay_.reset();
    start_overlay(cfg);
}

void AgentLoop::shutdown(){
    if (overlay_ && overlay_->running()) {
        log_main("Terminating overlay process...");
        overlay_->stop(3000);
        log_main("Overlay process stopped");
    }
    overlay_.reset();
}

void AgentLoop::step(){
    state_.turn += 1;
    AppCfg cfg = load_cfg_or_defaults(cfg_path_, "main");
    if (!virtual_canvas_) check_overlay(cfg);

    state_.prev_story = state_.story;
    log_main("--- Turn %d ---", state_.turn);

    TurnResult er = turn_fn_(state_.prev_story, run_dir_);
    log_main("Executed: %zu actions | Feedback: %.150s", er.executed.size(), er.feedback.c_str());
    log_main("Screenshot: %s (%zu chars)", er.screenshot_b64.empty() ? "MISSING" : "present",
             er.screenshot_b64.size());

    std::string raw;
    try {
        std::unique_ptr<InferenceClient> client = client_factory_(cfg);
        raw = client->complete(state_.prev_story, er.feedback, er.screenshot_b64);
    } catch (const std::exception& ex) {
        log_main("Inference failed: %s", ex.what());
        raw.clear();
    }
    if (trim(raw).empty()) {
        log_main("WARNING: model returned empty response, injecting click(500, 500)");
        raw = "click(500, 500)";
    }

    state_.story = raw;
    if (!save_loop_state(state_path_, state_, er))
        log_main("WARNING: could not write %s", state_path_.c_str());
    log_main("Story updated: %zu chars", state_.story.size());
}

static void sleep_unless_stopped(double seconds, const std::atomic<bool>& stop){
    auto until = std::chrono::steady_clock::now() +
                 std::chrono::milliseconds((long long)(seconds * 1000.0));
    while (!stop.load() && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

void AgentLoop::run(const std::atomic<bool>& stop){
    while (!stop.load()) {
        step();
        AppCfg cfg = load_cfg_or_defaults(cfg_path_, "main");
        sleep_unless_stopped(cfg.loop_delay > 1.0 ? cfg.loop_delay : 1.0, stop);
    }
}
