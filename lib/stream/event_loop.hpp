// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace flowtap {

class IEventLoop;

namespace detail {

// Shared between a loop and every LoopHandle to it; `loop` is cleared
// under `mutex` before the loop is destroyed.
struct LoopAnchor {
    std::mutex mutex;
    IEventLoop* loop = nullptr;
};

}  // namespace detail

/// Weak, copyable reference to an event loop.
///
/// Defer() posts to the loop while it exists and drops the callback once
/// the loop has been destroyed. Use it for callbacks that may fire from
/// another thread or after a run has ended.
class LoopHandle {
public:
    LoopHandle() = default;

    void Defer(std::function<void()> fn) const;

    /// @return True once the loop is gone (or for a default handle).
    bool Expired() const;

private:
    friend class IEventLoop;
    explicit LoopHandle(std::weak_ptr<detail::LoopAnchor> anchor) : anchor_(std::move(anchor)) {}

    std::weak_ptr<detail::LoopAnchor> anchor_;
};

/// Scheduling substrate that runs live stages.
///
/// Implement this to drive flowtap from an existing event loop
/// (libuv, asio, etc.). The built-in EventLoop class wraps an epoll
/// implementation behind this interface.
///
/// Every signal exchanged between two live stages is posted with Defer(),
/// so one materialization is fully serialized on its loop thread.
/// All callbacks are invoked on the event loop thread.
class IEventLoop {
public:
    using TimerCallback = std::function<void()>;

    IEventLoop() : anchor_(std::make_shared<detail::LoopAnchor>()) { anchor_->loop = this; }
    virtual ~IEventLoop() { DetachHandles(); }

    IEventLoop(const IEventLoop&) = delete;
    IEventLoop& operator=(const IEventLoop&) = delete;

    /// Schedule a callback for the next event loop iteration.
    /// Callbacks deferred from one thread run in the order they were deferred.
    virtual void Defer(std::function<void()> fn) = 0;

    /// Schedule a callback after a delay.
    /// @param delay  Minimum time before callback fires
    /// @param fn     Callback to invoke
    virtual void Schedule(std::chrono::milliseconds delay, TimerCallback fn) = 0;

    /// Return true if the caller is on the event loop thread.
    virtual bool IsInEventLoopThread() const = 0;

    /// Weak handle to this loop.
    LoopHandle Handle() const { return LoopHandle(anchor_); }

protected:
    /// Turn every LoopHandle into a no-op. Implementations call this first
    /// thing in their destructor, while Defer() still works.
    void DetachHandles() {
        std::lock_guard<std::mutex> lock(anchor_->mutex);
        anchor_->loop = nullptr;
    }

private:
    std::shared_ptr<detail::LoopAnchor> anchor_;
};

inline void LoopHandle::Defer(std::function<void()> fn) const {
    auto anchor = anchor_.lock();
    if (!anchor) return;
    std::lock_guard<std::mutex> lock(anchor->mutex);
    if (anchor->loop) anchor->loop->Defer(std::move(fn));
}

inline bool LoopHandle::Expired() const {
    auto anchor = anchor_.lock();
    if (!anchor) return true;
    std::lock_guard<std::mutex> lock(anchor->mutex);
    return anchor->loop == nullptr;
}

/// Type-erased event loop using epoll internally.
///
/// Provides implicit conversion to IEventLoop& so it can be handed
/// directly to a Materializer:
/// @code
/// EventLoop loop;
/// Materializer mat(loop);
/// auto done = Source<int>::FromCollection({1, 2, 3}).Consume(mat);
/// loop.PollUntil([&] { return done.IsDone(); });
/// @endcode
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    /// Dispatch deferred callbacks and wait up to timeout_ms for timers.
    /// @param timeout_ms  Max wait for this iteration (-1 = infinite)
    void Poll(int timeout_ms = -1);

    /// Poll until done() returns true or the deadline passes.
    /// @return The final value of done().
    bool PollUntil(const std::function<bool()>& done,
                   std::chrono::milliseconds deadline = std::chrono::seconds(5));

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the event loop to stop after the current iteration.
    void Stop();

    /// Implicit conversion to IEventLoop&.
    operator IEventLoop&();
    /// @copydoc operator IEventLoop&()
    operator const IEventLoop&() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace flowtap
