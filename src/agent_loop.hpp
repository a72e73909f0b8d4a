#pragma once
#include "turn.hpp"
#include "inference_client.hpp"
#include "subprocess.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>

struct LoopState {
    int turn = 0;
    std::string story;
    std::string prev_story;
};

// Missing or unreadable state.json -> a fresh state.
LoopState load_loop_state(const std::string& path);
bool save_loop_state(const std::string& path, const LoopState& st, const TurnResult& last);

// Run directory from $DESKPILOT_RUN_DIR, else runs/run_YYYYmmdd_HHMMSS
// (created). Empty string when it cannot be created.
std::string resolve_run_dir();

class AgentLoop {
public:
    using TurnFn = std::function<TurnResult(const std::string& raw, const std::string& run_dir)>;
    using ClientFactory = std::function<std::unique_ptr<InferenceClient>(const AppCfg&)>;

    // `exe` is re-invoked for the `execute` and `overlay` subcommands.
    AgentLoop(std::string run_dir, std::string exe, std::string cfg_path);
    ~AgentLoop();

    // Replaces the `execute` subprocess and the HTTP client (embedding, tests).
    void set_turn_fn(TurnFn fn) { turn_fn_ = std::move(fn); }
    void set_client_factory(ClientFactory f) { client_factory_ = std::move(f); }
    void set_overlay_enabled(bool on) { overlay_enabled_ = on; }

    // Loads state.json and prepares the canvas or the overlay.
    void start();
    // One turn: execute the previous story, ask the model, persist.
    void step();
    // step() until `stop` is set, sleeping max(loop_delay, 1) s in between.
    void run(const std::atomic<bool>& stop);
    void shutdown();

    const LoopState& state() const { return state_; }
    const std::string& run_dir() const { return run_dir_; }

private:
    void start_overlay(const AppCfg& cfg);
    void check_overlay(const AppCfg& cfg);

    std::string run_dir_;
    std::string exe_;
    std::string cfg_path_;
    std::string state_path_;
    LoopState state_;
    bool virtual_canvas_ = true;
    bool overlay_enabled_ = true;
    std::unique_ptr<ChildProcess> overlay_;
    TurnFn turn_fn_;
    ClientFactory client_factory_;
};
