// SPDX-License-Identifier: MIT

#include "lib/stream/epoll_event_loop.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace flowtap {

EpollEventLoop::EpollEventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw std::runtime_error(std::string("epoll_create1 failed: ") +
                                 std::strerror(errno));
    }

    // Create eventfd for cross-thread wakeup
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        close(epoll_fd_);
        throw std::runtime_error(std::string("eventfd failed: ") +
                                 std::strerror(errno));
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        close(wake_fd_);
        close(epoll_fd_);
        throw std::runtime_error(std::string("epoll_ctl ADD wake_fd failed: ") +
                                 std::strerror(errno));
    }
}

EpollEventLoop::~EpollEventLoop() {
    DetachHandles();

    // Pending timers are dropped without firing
    for (auto& entry : timers_) {
        if (entry && entry->fd >= 0) {
            close(entry->fd);
        }
    }
    timers_.clear();

    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }

    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        deferred_callbacks_.push_back(std::move(fn));
    }

    // Wake up the event loop if called from another thread
    if (!IsInEventLoopThread()) {
        Wake();
    }
}

void EpollEventLoop::Schedule(std::chrono::milliseconds delay, TimerCallback fn) {
    int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        throw std::runtime_error(std::string("timerfd_create failed: ") +
                                 std::strerror(errno));
    }

    // A zero it_value disarms a timerfd, so clamp to 1ns
    itimerspec ts{};
    auto count = std::max<std::chrono::milliseconds::rep>(delay.count(), 0);
    ts.it_value.tv_sec = count / 1000;
    ts.it_value.tv_nsec = (count % 1000) * 1000000;
    if (count == 0) ts.it_value.tv_nsec = 1;

    if (timerfd_settime(tfd, 0, &ts, nullptr) < 0) {
        close(tfd);
        throw std::runtime_error(std::string("timerfd_settime failed: ") +
                                 std::strerror(errno));
    }

    auto entry = std::make_unique<TimerEntry>();
    entry->fd = tfd;
    entry->callback = std::move(fn);

    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        timers_.push_back(std::move(entry));
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = tfd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, tfd, &ev) < 0) {
        int err = errno;
        {
            std::lock_guard<std::mutex> lock(deferred_mutex_);
            std::erase_if(timers_, [tfd](const auto& e) { return e->fd == tfd; });
        }
        close(tfd);
        throw std::runtime_error(std::string("epoll_ctl ADD timerfd failed: ") +
                                 std::strerror(err));
    }
}

void EpollEventLoop::HandleTimerExpired(int timer_fd) {
    // Read the timer to clear it (required for timerfd)
    uint64_t expirations = 0;
    [[maybe_unused]] ssize_t n = read(timer_fd, &expirations, sizeof(expirations));

    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        auto it = std::find_if(timers_.begin(), timers_.end(),
            [timer_fd](const auto& e) { return e->fd == timer_fd; });
        if (it != timers_.end()) {
            callback = std::move((*it)->callback);
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, timer_fd, nullptr);
            close(timer_fd);
            timers_.erase(it);
        }
    }

    // Execute callback outside the lock
    if (callback) {
        callback();
    }
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
}

std::size_t EpollEventLoop::PendingTimers() const {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    return timers_.size();
}

bool EpollEventLoop::HasDeferredCallbacks() const {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    return !deferred_callbacks_.empty();
}

void EpollEventLoop::Poll(int timeout_ms) {
    loop_thread_id_.store(std::this_thread::get_id());

    ProcessDeferredCallbacks();

    // Work queued by the callbacks above must not wait for a timer
    if (HasDeferredCallbacks()) {
        timeout_ms = 0;
    }

    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);

    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        throw std::runtime_error(std::string("epoll_wait failed: ") +
                                 std::strerror(errno));
    }

    for (int i = 0; i < nfds; ++i) {
        int fd = events[i].data.fd;
        if (fd == wake_fd_) {
            uint64_t val;
            [[maybe_unused]] ssize_t n = read(wake_fd_, &val, sizeof(val));
        } else {
            HandleTimerExpired(fd);
        }
    }

    ProcessDeferredCallbacks();
}

bool EpollEventLoop::PollUntil(const std::function<bool()>& done,
                               std::chrono::milliseconds deadline) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= until) {
            return done();
        }
        Poll(kPollSliceMs);
    }
    return true;
}

void EpollEventLoop::Run() {
    // Only run if we're in Idle state (not already Stopped)
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;
    }
    while (state_.load() == State::Running) {
        Poll(100);  // 100ms timeout to check state_ periodically
    }
}

void EpollEventLoop::Stop() {
    state_.store(State::Stopped);
    Wake();  // Interrupt epoll_wait so Run() exits immediately
}

void EpollEventLoop::Wake() {
    uint64_t val = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &val, sizeof(val));
}

void EpollEventLoop::ProcessDeferredCallbacks() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        callbacks.swap(deferred_callbacks_);
    }

    for (auto& cb : callbacks) {
        if (cb) {
            cb();
        }
    }
}

}  // namespace flowtap
