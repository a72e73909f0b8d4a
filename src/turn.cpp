#include "turn.hpp"
#include "invocation.hpp"
#include "frame_source.hpp"
#include "sync_protocol.hpp"
#include "x11_display.hpp"
#include "subprocess.hpp"
#include "util.hpp"
#include "log.hpp"

extern "C" {
#include <json-c/json.h>
}

static const int kCaptureTimeoutMs = 60000;
static const int kExecuteTimeoutMs = 120000;

ExecMode exec_mode(const AppCfg& cfg){
    if (!cfg.execute_actions) return ExecMode::Disabled;
    return physical_enabled(cfg) ? ExecMode::Effectful : ExecMode::Logical;
}

TurnResult run_turn(const std::string& raw, const std::string& run_dir, const AppCfg& cfg,
                    InputInjector* injector, const FrameFn& frame){
    TurnResult r;
    ExecutionContext ctx;
    ctx.mode = exec_mode(cfg);
    ctx.run_dir = run_dir;

    r.extracted_code = extract_invocations(trim(raw));
    log_msg("execute", "Extracted %zu executable lines from story", r.extracted_code.size());

    ExecutionRegistry registry(injector);
    registry.run(r.extracted_code, ctx);
    log_msg("execute", "Executed %zu actions, %zu ignored, %zu errors",
            ctx.executed.size(), ctx.ignored.size(), ctx.errors.size());

    if (frame) r.screenshot_b64 = frame(ctx.executed);
    r.feedback = build_feedback(ctx, !r.screenshot_b64.empty());
    r.executed = std::move(ctx.executed);
    r.ignored = std::move(ctx.ignored);
    r.malformed = std::move(ctx.errors);
    return r;
}

std::string build_feedback(const ExecutionContext& ctx, bool has_screenshot){
    std::vector<std::string> parts;
    for (const auto& a : ctx.executed) parts.push_back(a + " -> OK");
    for (const auto& o : ctx.outputs) parts.push_back(o);
    for (const auto& a : ctx.ignored) parts.push_back(a + " -> IGNORED (execution disabled)");
    for (const auto& e : ctx.errors) parts.push_back(with_hint(e));
    if (ctx.executed.empty() && ctx.errors.empty() && ctx.ignored.empty())
        parts.push_back("No actions found in your story. You can use: " + operation_list());
    if (!has_screenshot) parts.push_back("(Screenshot capture failed)");

    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += "\n";
        out += p;
    }
    return out;
}

FrameResult capture_frame(const std::vector<std::string>& actions, const std::string& run_dir, const AppCfg& cfg){
    FrameResult r;
    r.applied = actions;
    RunFiles files = RunFiles::in(run_dir);
    if (cfg.virtual_canvas) {
        ScreenSize sz{cfg.screen_width, cfg.screen_height};
        if (sz.w <= 0 || sz.h <= 0) sz = query_screen_size();
        VirtualCanvasSource src(files, sz.w, sz.h);
        r.screenshot_b64 = produce_frame_b64(src, actions, cfg.width, cfg.height);
    } else {
        PosixSemaphoreChannel channel(kRefreshChannelName, PosixSemaphoreChannel::Writer);
        ScreenCaptureSource src(files, &channel, cfg.overlay_debug, cfg.capture_delay);
        r.screenshot_b64 = produce_frame_b64(src, actions, cfg.width, cfg.height);
    }
    if (r.screenshot_b64.empty()) r.error = "no frame produced";
    return r;
}

void relay_stderr(const char* tag, const std::string& err){
    for (const auto& line : split_lines(trim(err))) {
        if (!line.empty()) log_msg(tag, "%s", line.c_str());
    }
}

std::string request_frame(const std::string& exe, const std::vector<std::string>& actions,
                          const std::string& run_dir){
    ProcResult p = run_process({exe, "capture"}, frame_request_to_json(actions, run_dir), kCaptureTimeoutMs);
    relay_stderr("execute][capture", p.err);
    if (!p.started) { log_msg("execute", "ERROR: capture failed to start"); return ""; }
    if (p.timed_out) { log_msg("execute", "ERROR: capture timed out after 60s"); return ""; }
    if (p.exit_code != 0) log_msg("execute", "[capture] exited with code %d", p.exit_code);
    if (trim(p.out).empty()) {
        log_msg("execute", "[capture] WARNING: empty stdout -- no screenshot produced");
        return "";
    }
    FrameResult fr;
    if (!parse_frame_result_json(p.out, fr)) {
        log_msg("execute", "[capture] JSON parse failed. stdout preview: %.300s", p.out.c_str());
        return "";
    }
    if (fr.screenshot_b64.empty()) {
        log_msg("execute", "[capture] WARNING: screenshot_b64 is empty%s%s",
                fr.error.empty() ? "" : ": ", fr.error.c_str());
    } else {
        log_msg("execute", "[capture] screenshot captured: %zu chars base64", fr.screenshot_b64.size());
    }
    return fr.screenshot_b64;
}

TurnResult request_turn(const std::string& exe, const std::string& raw, const std::string& run_dir){
    TurnResult r;
    ProcResult p = run_process({exe, "execute"}, turn_request_to_json(raw, run_dir), kExecuteTimeoutMs);
    relay_stderr("main][executor", p.err);
    if (!p.started) { log_msg("main", "ERROR: executor failed to start"); return r; }
    if (p.timed_out) { log_msg("main", "ERROR: executor timed out after 120s"); return r; }
    if (p.exit_code != 0) log_msg("main", "[executor] exited with code %d", p.exit_code);
    if (trim(p.out).empty()) {
        log_msg("main", "[executor] WARNING: empty stdout -- no screenshot or feedback");
        return r;
    }
    if (!parse_turn_result_json(p.out, r)) {
        log_msg("main", "[executor] JSON parse failed. stdout preview: %.300s", p.out.c_str());
        return TurnResult{};
    }
    if (r.screenshot_b64.empty()) log_msg("main", "[executor] WARNING: screenshot_b64 is empty in response");
    return r;
}

static std::string str_array(const std::vector<std::string>& v){
    std::string j = "[";
    for (size_t i=0;i<v.size();i++){
        if (i) j += ",";
        j += "\"" + escape_json(v[i]) + "\"";
    }
    return j + "]";
}

static void read_str_array(json_object* root, const char* k, std::vector<std::string>& out){
    json_object* v=nullptr;
    out.clear();
    if (!json_object_object_get_ex(root,k,&v) || !json_object_is_type(v, json_type_array)) return;
    size_t n = json_object_array_length(v);
    for (size_t i=0;i<n;i++){
        const char* s = json_object_get_string(json_object_array_get_idx(v, i));
        out.push_back(s ? s : "");
    }
}

static std::string read_str(json_object* root, const char* k){
    json_object* v=nullptr;
    if (!json_object_object_get_ex(root,k,&v)) return "";
    const char* s = json_object_get_string(v);
    return s ? s : "";
}

// json-c with an object root, or nullptr.
static json_object* parse_object(const std::string& body){
    json_object* root = json_tokener_parse(body.c_str());
    if (root && !json_object_is_type(root, json_type_object)) {
        json_object_put(root);
        return nullptr;
    }
    return root;
}

std::string turn_result_to_json(const TurnResult& r){
    std::string j = "{";
    j += "\"executed\":" + str_array(r.executed) + ",";
    j += "\"extracted_code\":" + str_array(r.extracted_code) + ",";
    j += "\"malformed\":" + str_array(r.malformed) + ",";
    j += "\"ignored\":" + str_array(r.ignored) + ",";
    j += "\"screenshot_b64\":\"" + escape_json(r.screenshot_b64) + "\",";
    j += "\"feedback\":\"" + escape_json(r.feedback) + "\"";
    return j + "}";
}

bool parse_turn_result_json(const std::string& body, TurnResult& out){
    json_object* root = parse_object(body);
    if (!root) return false;
    read_str_array(root, "executed", out.executed);
    read_str_array(root, "extracted_code", out.extracted_code);
    read_str_array(root, "malformed", out.malformed);
    read_str_array(root, "ignored", out.ignored);
    out.screenshot_b64 = read_str(root, "screenshot_b64");
    out.feedback = read_str(root, "feedback");
    json_object_put(root);
    return true;
}

std::string turn_request_to_json(const std::string& raw, const std::string& run_dir){
    return "{\"raw\":\"" + escape_json(raw) + "\",\"run_dir\":\"" + escape_json(run_dir) + "\"}";
}

bool parse_turn_request(const std::string& body, std::string& raw, std::string& run_dir){
    json_object* root = parse_object(trim(body).empty() ? "{}" : body);
    if (!root) return false;
    raw = read_str(root, "raw");
    run_dir = read_str(root, "run_dir");
    json_object_put(root);
    return true;
}

std::string frame_result_to_json(const FrameResult& r){
    std::string j = "{";
    j += "\"screenshot_b64\":\"" + escape_json(r.screenshot_b64) + "\",";
    j += "\"applied\":" + str_array(r.applied);
    if (!r.error.empty()) j += ",\"error\":\"" + escape_json(r.error) + "\"";
    return j + "}";
}

bool parse_frame_result_json(const std::string& body, FrameResult& out){
    json_object* root = parse_object(body);
    if (!root) return false;
    out.screenshot_b64 = read_str(root, "screenshot_b64");
    read_str_array(root, "applied", out.applied);
    out.error = read_str(root, "error");
    json_object_put(root);
    return true;
}

std::string frame_request_to_json(const std::vector<std::string>& actions, const std::string& run_dir){
    return "{\"actions\":" + str_array(actions) + ",\"run_dir\":\"" + escape_json(run_dir) + "\"}";
}

bool parse_frame_request(const std::string& body, std::vector<std::string>& actions, std::string& run_dir){
    json_object* root = parse_object(trim(body).empty() ? "{}" : body);
    if (!root) return false;
    read_str_array(root, "actions", actions);
    run_dir = read_str(root, "run_dir");
    json_object_put(root);
    return true;
}
