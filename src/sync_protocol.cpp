#include "sync_protocol.hpp"
#include "util.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <thread>

const char* const kRefreshChannelName = "/deskpilot_overlay_refresh";

PosixSemaphoreChannel::PosixSemaphoreChannel(std::string name, Role role)
    : name_(std::move(name)), role_(role) {
    if (role_ == Reader) {
        sem_ = sem_open(name_.c_str(), O_CREAT, 0600, 0);
        if (sem_ == SEM_FAILED)
            log_msg("sync", "sem_open(%s) failed: %s, polling only", name_.c_str(), std::strerror(errno));
    }
}

PosixSemaphoreChannel::~PosixSemaphoreChannel(){
    if (sem_ != SEM_FAILED) sem_close(sem_);
    if (role_ == Reader && sem_ != SEM_FAILED) sem_unlink(name_.c_str());
}

bool PosixSemaphoreChannel::notify(){
    sem_t* s = sem_open(name_.c_str(), 0);
    if (s == SEM_FAILED) {
        log_msg("sync", "refresh channel not found (overlay process may not be running)");
        return false;
    }
    bool ok = sem_post(s) == 0;
    sem_close(s);
    if (ok) log_msg("sync", "signaled overlay refresh");
    return ok;
}

bool PosixSemaphoreChannel::wait(int timeout_ms){
    if (sem_ == SEM_FAILED) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return false;
    }
    timespec ts{};
    clock_gettime(CLOCK_REALTIME, &ts);
    ts.tv_sec += timeout_ms / 1000;
    ts.tv_nsec += (long)(timeout_ms % 1000) * 1000000L;
    if (ts.tv_nsec >= 1000000000L) { ts.tv_sec += 1; ts.tv_nsec -= 1000000000L; }
    int rc;
    while ((rc = sem_timedwait(sem_, &ts)) != 0 && errno == EINTR) {}
    if (rc != 0) return false;
    while (sem_trywait(sem_) == 0) {}
    return true;
}

bool LocalChannel::notify(){
    {
        std::lock_guard<std::mutex> lk(mu_);
        set_ = true;
    }
    cv_.notify_all();
    return true;
}

bool LocalChannel::wait(int timeout_ms){
    std::unique_lock<std::mutex> lk(mu_);
    bool got = cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [this]{ return set_; });
    set_ = false;
    return got;
}

SyncPublisher::SyncPublisher(RunFiles files, NotifyChannel* channel)
    : files_(std::move(files)), channel_(channel) {}

bool SyncPublisher::publish(const std::vector<Mark>* marks, CursorState& cursor){
    cursor.generation += 1;
    if (marks && !save_marks(files_.marks, *marks)) return false;
    if (!save_cursor_state(files_.cursor, cursor)) return false;
    if (channel_) channel_->notify();
    return true;
}

SyncReader::SyncReader(RunFiles files, NotifyChannel* channel, int poll_interval_ms)
    : files_(std::move(files)), channel_(channel), poll_interval_(poll_interval_ms) {}

// The generation is authoritative; mtimes catch files replaced by a writer
// that did not bump it.
bool SyncReader::state_changed(){
    CursorState st = load_cursor_state(files_.cursor);
    int64_t mm = file_mtime_ns(files_.marks), cm = file_mtime_ns(files_.cursor);
    bool changed = !checked_once_ || st.generation != last_generation_ ||
                   mm != last_marks_mtime_ || cm != last_cursor_mtime_;
    checked_once_ = true;
    last_generation_ = st.generation;
    last_marks_mtime_ = mm;
    last_cursor_mtime_ = cm;
    return changed;
}

void SyncReader::reload(){
    marks_ = load_marks(files_.marks);
    cursor_ = load_cursor_state(files_.cursor);
}

SyncReader::Wake SyncReader::poll(int slice_ms){
    bool signaled = false;
    if (channel_) signaled = channel_->wait(slice_ms);
    else std::this_thread::sleep_for(std::chrono::milliseconds(slice_ms));

    auto now = std::chrono::steady_clock::now();
    if (!signaled && checked_once_ && now - last_check_ < poll_interval_) return Wake::Idle;
    last_check_ = now;

    bool changed = state_changed();
    if (signaled) { reload(); return Wake::Signaled; }
    if (changed) { reload(); return Wake::Changed; }
    return Wake::Idle;
}
