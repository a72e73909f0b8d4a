#pragma once
#include <string>
#include <vector>
#include <sys/types.h>

struct ProcResult {
    bool started = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Runs argv[0] with `input` on stdin, collecting stdout/stderr. The child is
// killed once timeout_ms has elapsed.
ProcResult run_process(const std::vector<std::string>& argv, const std::string& input, int timeout_ms);

// A long-lived child (the overlay). stdout goes to /dev/null, stderr is inherited.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool spawn(const std::vector<std::string>& argv);
    // Reaps the child if it exited; `exit_code` receives its status.
    bool running(int* exit_code = nullptr);
    // SIGTERM, then SIGKILL after grace_ms.
    void stop(int grace_ms = 3000);
    pid_t pid() const { return pid_; }

private:
    pid_t pid_ = -1;
};

// Absolute path of the running executable.
std::string self_exe_path();
