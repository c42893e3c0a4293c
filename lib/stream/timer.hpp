// SPDX-License-Identifier: MIT

// lib/stream/timer.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "lib/stream/event_loop.hpp"

namespace flowtap {

/// One-shot or periodic timer built on IEventLoop::Schedule().
///
/// Safe to destroy while armed: pending expirations are discarded.
/// Each Start() bumps a generation counter, so a restart also discards
/// expirations scheduled by the previous arming.
///
/// @code
/// Timer ticker(loop);
/// ticker.OnTimer([] { emit_tick(); });
/// ticker.Start(std::chrono::milliseconds(0), std::chrono::milliseconds(50));
/// @endcode
class Timer {
public:
    using Callback = std::function<void()>;

    /// @param loop  Event loop that drives this timer
    explicit Timer(IEventLoop& loop)
        : loop_(loop), generation_(std::make_shared<uint64_t>(0)) {}

    ~Timer() {
        ++*generation_;
        armed_ = false;
    }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&) = delete;
    Timer& operator=(Timer&&) = delete;

    /// Set the callback invoked on each expiration.
    void OnTimer(Callback cb) { callback_ = std::move(cb); }

    /// Arm the timer.
    /// @param delay     Initial delay before the first expiration
    /// @param interval  Repeat interval (zero = one-shot)
    void Start(std::chrono::milliseconds delay,
               std::chrono::milliseconds interval = std::chrono::milliseconds::zero()) {
        ++*generation_;
        interval_ = interval;
        armed_ = true;
        ScheduleNext(delay);
    }

    /// Disarm the timer. No further callbacks will fire.
    void Stop() {
        ++*generation_;
        armed_ = false;
        interval_ = std::chrono::milliseconds::zero();
    }

    /// Return true if the timer is armed.
    bool IsArmed() const { return armed_; }

    /// Number of expirations delivered since construction.
    uint64_t Expirations() const { return expirations_; }

private:
    void ScheduleNext(std::chrono::milliseconds delay) {
        // The generation cell outlives the Timer if a callback is still queued
        std::weak_ptr<uint64_t> cell = generation_;
        uint64_t armed_generation = *generation_;
        Timer* self = this;
        loop_.Schedule(delay, [cell, armed_generation, self]() {
            auto gen = cell.lock();
            if (gen && *gen == armed_generation) {
                self->Fire();
            }
        });
    }

    void Fire() {
        if (!armed_) return;
        ++expirations_;

        if (interval_ > std::chrono::milliseconds::zero()) {
            ScheduleNext(interval_);
        } else {
            armed_ = false;
        }

        if (callback_) {
            callback_();
        }
    }

    IEventLoop& loop_;
    Callback callback_;
    std::chrono::milliseconds interval_{0};
    bool armed_ = false;
    uint64_t expirations_ = 0;
    std::shared_ptr<uint64_t> generation_;
};

}  // namespace flowtap
