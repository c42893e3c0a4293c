// SPDX-License-Identifier: MIT

// lib/stream/async_value.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"

namespace flowtap {

/// Unit result for runs that produce no value.
struct Done {
    bool operator==(const Done&) const = default;
};

/// One-shot asynchronous result: set exactly once, observed many times.
///
/// Copies share one state. The first TrySet()/TryFail() wins; later
/// attempts are ignored and return false. Callbacks registered with
/// OnComplete() run exactly once, on the thread that completes the value,
/// or immediately on the caller's thread if it is already complete.
///
/// Thread safety: all members may be called from any thread.
template<typename T>
class AsyncValue {
public:
    using Result = std::expected<T, Error>;
    using Callback = std::function<void(const Result&)>;

    AsyncValue() : state_(std::make_shared<State>()) {}

    static AsyncValue Ready(T value) {
        AsyncValue v;
        v.TrySet(std::move(value));
        return v;
    }

    static AsyncValue Failed(Error e) {
        AsyncValue v;
        v.TryFail(std::move(e));
        return v;
    }

    bool TrySet(T value) { return Complete(Result(std::move(value))); }

    bool TryFail(Error e) { return Complete(Result(std::unexpected(std::move(e)))); }

    bool IsReady() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->result.has_value();
    }

    /// Current result, or nullopt while pending.
    std::optional<Result> Peek() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->result;
    }

    void OnComplete(Callback cb) {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (!state_->result) {
            state_->callbacks.push_back(std::move(cb));
            return;
        }
        Result copy = *state_->result;
        lock.unlock();
        cb(copy);
    }

    /// Block until the value is complete. Only meaningful when whoever
    /// completes it runs on another thread.
    Result Wait() const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this] { return state_->result.has_value(); });
        return *state_->result;
    }

    /// Bounded Wait(); nullopt on timeout.
    std::optional<Result> WaitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (!state_->cv.wait_for(lock, timeout, [this] { return state_->result.has_value(); })) {
            return std::nullopt;
        }
        return *state_->result;
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<Result> result;
        std::vector<Callback> callbacks;
    };

    bool Complete(Result r) {
        std::vector<Callback> callbacks;
        Result copy = r;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->result) return false;
            state_->result.emplace(std::move(r));
            callbacks.swap(state_->callbacks);
        }
        state_->cv.notify_all();
        for (auto& cb : callbacks) {
            cb(copy);
        }
        return true;
    }

    std::shared_ptr<State> state_;
};

}  // namespace flowtap
