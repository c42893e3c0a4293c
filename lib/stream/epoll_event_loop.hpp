// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace flowtap {

/// Internal timer entry for scheduled callbacks.
struct TimerEntry {
    int fd;                             ///< timerfd file descriptor.
    std::function<void()> callback;     ///< User callback to invoke on expiry.
};

/// Epoll-based event loop for deferred work and timer scheduling.
///
/// Multiplexes one-shot timers (one timerfd each) and a cross-thread
/// wakeup eventfd on a single thread. Create one instance per thread that
/// drives materializations, and run it with Run(), Poll() or PollUntil().
///
/// Thread safety: the loop itself runs on a single thread. Defer(),
/// Schedule(), Stop() and Wake() may be called from any thread.
class EpollEventLoop : public IEventLoop {
public:
    /// Create an epoll instance and an internal eventfd for cross-thread wakeups.
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    /// Queue a callback to run on the event-loop thread.
    void Defer(std::function<void()> fn) override;

    /// Schedule a one-shot callback after @p delay milliseconds.
    void Schedule(std::chrono::milliseconds delay, TimerCallback fn) override;

    /// @return True if the calling thread is the event-loop thread.
    bool IsInEventLoopThread() const override;

    /// Poll for events with the given timeout (milliseconds). -1 blocks.
    /// The wait is skipped when deferred work is already queued.
    void Poll(int timeout_ms);

    /// Poll in short slices until done() holds or @p deadline elapses.
    /// @return The final value of done().
    bool PollUntil(const std::function<bool()>& done,
                   std::chrono::milliseconds deadline = std::chrono::seconds(5));

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the loop to exit after the current poll completes.
    void Stop();

    /// Wake the event loop from another thread (e.g. after Defer()).
    void Wake();

    /// @return Number of timers that have not fired yet.
    std::size_t PendingTimers() const;

private:
    void ProcessDeferredCallbacks();
    bool HasDeferredCallbacks() const;
    void HandleTimerExpired(int timer_fd);

    enum class State { Idle, Running, Stopped };

    int epoll_fd_;
    int wake_fd_ = -1;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::thread::id> loop_thread_id_{};

    mutable std::mutex deferred_mutex_;
    std::vector<std::function<void()>> deferred_callbacks_;

    // Active timers (protected by deferred_mutex_)
    std::vector<std::unique_ptr<TimerEntry>> timers_;

    static constexpr int kMaxEvents = 64;
    static constexpr int kPollSliceMs = 5;
};

}  // namespace flowtap
