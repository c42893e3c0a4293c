// SPDX-License-Identifier: MIT

// src/completion_handle.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "lib/stream/async_value.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/stage.hpp"

namespace flowtap {

/// Handle to one running materialization.
///
/// Resolves exactly once: with the sink's value when the stream completes,
/// or with the first error that reached the sink. Copies refer to the same
/// run. All members are thread-safe.
template<typename R>
class CompletionHandle {
public:
    using Outcome = typename AsyncValue<R>::Result;

    CompletionHandle(AsyncValue<R> value, std::function<void()> cancel,
                     std::shared_ptr<StageRegistry> stages)
        : value_(std::move(value)),
          cancel_(std::make_shared<std::function<void()>>(std::move(cancel))),
          stages_(std::move(stages)) {}

    bool IsDone() const { return value_.IsReady(); }

    /// Outcome, or nullopt while the run is still going.
    std::optional<Outcome> Result() const { return value_.Peek(); }

    /// Invoke `cb` once with the outcome; immediately if already done.
    void OnComplete(typename AsyncValue<R>::Callback cb) { value_.OnComplete(std::move(cb)); }

    /// Block until done. The loop must be driven by another thread.
    Outcome Wait() const { return value_.Wait(); }

    std::optional<Outcome> WaitFor(std::chrono::milliseconds timeout) const {
        return value_.WaitFor(timeout);
    }

    /// Stop the run from the sink end. Cancellation travels upstream; the
    /// handle resolves with ErrorCode::Cancelled unless already done.
    void Cancel() {
        if (*cancel_) (*cancel_)();
    }

    /// Name and state of every live stage of the run, in creation order.
    std::vector<StageSnapshot> Stages() const {
        if (!stages_) return {};
        return stages_->Snapshot();
    }

private:
    AsyncValue<R> value_;
    std::shared_ptr<std::function<void()>> cancel_;
    std::shared_ptr<StageRegistry> stages_;
};

}  // namespace flowtap
