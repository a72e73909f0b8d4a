#include <cstdio>
#include <csignal>
#include <cstring>
#include <atomic>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "turn.hpp"
#include "agent_loop.hpp"
#include "overlay.hpp"
#include "uinput_injector.hpp"
#include "x11_display.hpp"
#include "subprocess.hpp"
#include "util.hpp"
#include "log.hpp"

static std::atomic<bool> g_stop{false};

static void on_signal(int){ g_stop = true; }

static std::string read_stdin(){
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

static void emit(const std::string& doc){
    fwrite(doc.data(), 1, doc.size(), stdout);
    fputc('\n', stdout);
    fflush(stdout);
}

static int usage(){
    fprintf(stderr,
        "usage: deskpilot run [run_dir]\n"
        "       deskpilot execute          (turn request on stdin)\n"
        "       deskpilot capture          (frame request on stdin)\n"
        "       deskpilot overlay <run_dir> <0|1>\n");
    return 2;
}

static int cmd_execute(){
    TurnResult r;
    try {
        std::string raw, run_dir;
        if (!parse_turn_request(read_stdin(), raw, run_dir))
            throw std::runtime_error("malformed turn request");
        AppCfg cfg = load_cfg_or_defaults(default_cfg_path(), "execute");

        std::unique_ptr<UinputInjector> injector;
        if (exec_mode(cfg) == ExecMode::Effectful) {
            ScreenSize sz = query_screen_size();
            try {
                injector = std::make_unique<UinputInjector>(sz.w, sz.h);
            } catch (const std::exception& ex) {
                log_msg("execute", "input injection unavailable: %s", ex.what());
            }
        }

        std::string exe = self_exe_path();
        r = run_turn(raw, run_dir, cfg, injector.get(),
                     [&](const std::vector<std::string>& actions) {
                         return request_frame(exe, actions, run_dir);
                     });
    } catch (const std::exception& ex) {
        log_msg("execute", "ERROR: %s", ex.what());
        r.feedback = std::string("Execution failed: ") + ex.what();
    }
    emit(turn_result_to_json(r));
    return 0;
}

static int cmd_capture(){
    FrameResult r;
    try {
        std::vector<std::string> actions;
        std::string run_dir;
        if (!parse_frame_request(read_stdin(), actions, run_dir))
            throw std::runtime_error("malformed frame request");
        AppCfg cfg = load_cfg_or_defaults(default_cfg_path(), "capture");
        r = capture_frame(actions, run_dir, cfg);
    } catch (const std::exception& ex) {
        log_msg("capture", "ERROR: %s", ex.what());
        r.screenshot_b64.clear();
        r.error = ex.what();
    }
    emit(frame_result_to_json(r));
    return 0;
}

static int cmd_overlay(int argc, char** argv){
    if (argc < 3) return usage();
    std::string run_dir = argv[2];
    bool blocks = argc > 3 && std::strcmp(argv[3], "1") == 0;
    try {
        return run_overlay(run_dir, blocks);
    } catch (const std::exception& ex) {
        log_msg("overlay", "ERROR: %s", ex.what());
        return 1;
    }
}

static int cmd_run(int argc, char** argv){
    std::string run_dir;
    if (argc > 2) run_dir = argv[2];
    else run_dir = resolve_run_dir();
    if (run_dir.empty()) {
        log_msg("main", "ERROR: cannot create run directory");
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    AgentLoop loop(run_dir, self_exe_path(), default_cfg_path());
    try {
        loop.start();
        loop.run(g_stop);
    } catch (const std::exception& ex) {
        log_msg("main", "FATAL: %s", ex.what());
        loop.shutdown();
        return 1;
    }
    loop.shutdown();
    fprintf(stderr, "\n[main] Interrupted by user.\n");
    return 0;
}

int main(int argc, char** argv){
    if (argc < 2) return usage();
    std::string cmd = argv[1];
    if (cmd == "execute") return cmd_execute();
    if (cmd == "capture") return cmd_capture();
    if (cmd == "overlay") return cmd_overlay(argc, argv);
    if (cmd == "run") return cmd_run(argc, argv);
    return usage();
}
