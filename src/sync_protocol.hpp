#pragma once
#include "mark_store.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include <semaphore.h>

extern const char* const kRefreshChannelName;

// Payload-free wakeup between the capture side and the overlay.
class NotifyChannel {
public:
    virtual ~NotifyChannel() = default;
    // Best effort. Returns false when nobody is listening.
    virtual bool notify() = 0;
    // Blocks up to timeout_ms. True if signaled; all pending signals are
    // consumed, so a burst of notifies produces one wake.
    virtual bool wait(int timeout_ms) = 0;
};

// Named POSIX semaphore. The reader side creates the object and unlinks it
// on destruction; the writer side only ever opens an existing one.
class PosixSemaphoreChannel : public NotifyChannel {
public:
    enum Role { Writer, Reader };
    PosixSemaphoreChannel(std::string name, Role role);
    ~PosixSemaphoreChannel() override;
    PosixSemaphoreChannel(const PosixSemaphoreChannel&) = delete;
    PosixSemaphoreChannel& operator=(const PosixSemaphoreChannel&) = delete;

    bool notify() override;
    bool wait(int timeout_ms) override;
    // Reader only: false when the semaphore could not be created.
    bool ready() const { return sem_ != SEM_FAILED; }

private:
    std::string name_;
    Role role_;
    sem_t* sem_ = SEM_FAILED;
};

// In-process manual-reset event, for embedding and tests.
class LocalChannel : public NotifyChannel {
public:
    bool notify() override;
    bool wait(int timeout_ms) override;
private:
    std::mutex mu_;
    std::condition_variable cv_;
    bool set_ = false;
};

// Capture side. Persists state, then signals.
class SyncPublisher {
public:
    SyncPublisher(RunFiles files, NotifyChannel* channel);

    // Bumps cursor.generation, writes the mark list (when given) and then
    // the cursor state, and notifies the overlay. A failed write leaves the
    // previous file in place and skips the notify.
    bool publish(const std::vector<Mark>* marks, CursorState& cursor);

private:
    RunFiles files_;
    NotifyChannel* channel_;
};

// Overlay side. Decides when the persisted state needs a redraw.
class SyncReader {
public:
    enum class Wake { Idle, Signaled, Changed };

    // channel may be null (poll only).
    SyncReader(RunFiles files, NotifyChannel* channel, int poll_interval_ms = 2000);

    // Waits at most slice_ms for a signal. Files are re-checked after a
    // signal and whenever poll_interval_ms has passed since the last check.
    // On Signaled/Changed the snapshot has been reloaded.
    Wake poll(int slice_ms);

    const std::vector<Mark>& marks() const { return marks_; }
    const CursorState& cursor() const { return cursor_; }

private:
    bool state_changed();
    void reload();

    RunFiles files_;
    NotifyChannel* channel_;
    std::chrono::milliseconds poll_interval_;
    std::chrono::steady_clock::time_point last_check_;
    bool checked_once_ = false;
    uint64_t last_generation_ = 0;
    int64_t last_marks_mtime_ = 0;
    int64_t last_cursor_mtime_ = 0;
    std::vector<Mark> marks_;
    CursorState cursor_;
};
