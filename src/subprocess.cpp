#include "subprocess.hpp"
#include "log.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

static std::vector<char*> c_argv(const std::vector<std::string>& argv){
    std::vector<char*> v;
    for (const auto& a : argv) v.push_back(const_cast<char*>(a.c_str()));
    v.push_back(nullptr);
    return v;
}

static int decode_status(int status){
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ProcResult run_process(const std::vector<std::string>& argv, const std::string& input, int timeout_ms){
    ProcResult r;
    if (argv.empty()) return r;
    std::signal(SIGPIPE, SIG_IGN);
    int in_p[2], out_p[2], err_p[2];
    if (pipe(in_p) != 0) return r;
    if (pipe(out_p) != 0) { close(in_p[0]); close(in_p[1]); return r; }
    if (pipe(err_p) != 0) {
        close(in_p[0]); close(in_p[1]); close(out_p[0]); close(out_p[1]);
        return r;
    }
    auto args = c_argv(argv);
    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {in_p[0], in_p[1], out_p[0], out_p[1], err_p[0], err_p[1]}) close(fd);
        log_msg("proc", "fork failed: %s", std::strerror(errno));
        return r;
    }
    if (pid == 0) {
        dup2(in_p[0], 0); dup2(out_p[1], 1); dup2(err_p[1], 2);
        for (int fd : {in_p[0], in_p[1], out_p[0], out_p[1], err_p[0], err_p[1]}) close(fd);
        execv(args[0], args.data());
        _exit(127);
    }
    r.started = true;
    close(in_p[0]); close(out_p[1]); close(err_p[1]);
    fcntl(in_p[1], F_SETFL, O_NONBLOCK);

    size_t written = 0;
    int in_fd = in_p[1];
    if (input.empty()) { close(in_fd); in_fd = -1; }
    bool out_open = true, err_open = true;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[65536];

    while (out_open || err_open) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) { r.timed_out = true; break; }
        pollfd fds[3]; int n = 0;
        int out_i = -1, err_i = -1, in_i = -1;
        if (out_open) { fds[n] = {out_p[0], POLLIN, 0}; out_i = n++; }
        if (err_open) { fds[n] = {err_p[0], POLLIN, 0}; err_i = n++; }
        if (in_fd >= 0) { fds[n] = {in_fd, POLLOUT, 0}; in_i = n++; }
        int pr = poll(fds, (nfds_t)n, (int)left);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (out_i >= 0 && (fds[out_i].revents & (POLLIN|POLLHUP|POLLERR))) {
            ssize_t k = read(out_p[0], buf, sizeof(buf));
            if (k > 0) r.out.append(buf, (size_t)k); else out_open = false;
        }
        if (err_i >= 0 && (fds[err_i].revents & (POLLIN|POLLHUP|POLLERR))) {
            ssize_t k = read(err_p[0], buf, sizeof(buf));
            if (k > 0) r.err.append(buf, (size_t)k); else err_open = false;
        }
        if (in_i >= 0 && (fds[in_i].revents & (POLLOUT|POLLERR|POLLHUP))) {
            ssize_t k = write(in_fd, input.data() + written, input.size() - written);
            if (k > 0) written += (size_t)k;
            if (k < 0 && errno != EAGAIN) written = input.size();
            if (written >= input.size()) { close(in_fd); in_fd = -1; }
        }
    }
    if (in_fd >= 0) close(in_fd);
    close(out_p[0]); close(err_p[0]);

    int status = 0;
    while (!r.timed_out) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) { r.exit_code = decode_status(status); return r; }
        if (w < 0 && errno != EINTR) return r;
        if (std::chrono::steady_clock::now() >= deadline) { r.timed_out = true; break; }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    return r;
}

ChildProcess::~ChildProcess(){
    if (pid_ > 0) stop(1000);
}

bool ChildProcess::spawn(const std::vector<std::string>& argv){
    if (argv.empty()) return false;
    auto args = c_argv(argv);
    pid_t pid = fork();
    if (pid < 0) {
        log_msg("proc", "fork failed: %s", std::strerror(errno));
        return false;
    }
    if (pid == 0) {
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) { dup2(devnull, 1); close(devnull); }
        execv(args[0], args.data());
        _exit(127);
    }
    pid_ = pid;
    return true;
}

bool ChildProcess::running(int* exit_code){
    if (pid_ <= 0) return false;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    if (exit_code) *exit_code = r == pid_ ? decode_status(status) : -1;
    pid_ = -1;
    return false;
}

void ChildProcess::stop(int grace_ms){
    if (!running()) return;
    kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!running()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    kill(pid_, SIGKILL);
    int status = 0;
    waitpid(pid_, &status, 0);
    pid_ = -1;
}

std::string self_exe_path(){
    char buf[4096];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return "deskpilot";
    buf[n] = '\0';
    return buf;
}
