#pragma once
#include "config.hpp"
#include "execution.hpp"
#include <functional>
#include <string>
#include <vector>

// Output of one execute request.
struct TurnResult {
    std::vector<std::string> executed;
    std::vector<std::string> extracted_code;
    std::vector<std::string> malformed;
    std::vector<std::string> ignored;
    std::string screenshot_b64;
    std::string feedback;
};

struct FrameResult {
    std::string screenshot_b64;
    std::vector<std::string> applied;
    std::string error;
};

// Maps executed actions to a base64 PNG ("" when no frame).
using FrameFn = std::function<std::string(const std::vector<std::string>& actions)>;

ExecMode exec_mode(const AppCfg& cfg);

// Extract, execute, then ask `frame` for the screenshot.
TurnResult run_turn(const std::string& raw, const std::string& run_dir, const AppCfg& cfg,
                    InputInjector* injector, const FrameFn& frame);

std::string build_feedback(const ExecutionContext& ctx, bool has_screenshot);

// Frame for the given actions, using the strategy the config selects.
FrameResult capture_frame(const std::vector<std::string>& actions, const std::string& run_dir, const AppCfg& cfg);

// Runs `<exe> capture` as a child with a 60 s limit; "" on any failure.
std::string request_frame(const std::string& exe, const std::vector<std::string>& actions,
                          const std::string& run_dir);

// Runs `<exe> execute` as a child with a 120 s limit. Empty result on failure.
TurnResult request_turn(const std::string& exe, const std::string& raw, const std::string& run_dir);

std::string turn_result_to_json(const TurnResult& r);
bool parse_turn_result_json(const std::string& body, TurnResult& out);
bool parse_turn_request(const std::string& body, std::string& raw, std::string& run_dir);
std::string turn_request_to_json(const std::string& raw, const std::string& run_dir);

std::string frame_result_to_json(const FrameResult& r);
bool parse_frame_result_json(const std::string& body, FrameResult& out);
bool parse_frame_request(const std::string& body, std::vector<std::string>& actions, std::string& run_dir);
std::string frame_request_to_json(const std::vector<std::string>& actions, const std::string& run_dir);

// Relays a child's stderr line by line under `tag`.
void relay_stderr(const char* tag, const std::string& err);
