// SPDX-License-Identifier: MIT

// lib/stream/sink.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "lib/stream/error.hpp"
#include "lib/stream/subscription.hpp"

namespace flowtap {

/// Concept for anything that can be attached to a Publisher<T>.
template<typename S, typename T>
concept SubscriberOf = std::derived_from<S, Subscriber<T>>;

/// Concrete subscriber that dispatches signals through user-provided callbacks.
///
/// On subscription it requests `initial_request` elements (0 = none; the
/// owner calls Request() later). All callbacks are guarded by an atomic
/// validity flag: once Invalidate() is called the subscription is cancelled
/// and later signals are dropped, so the owner may go away before the
/// producer does.
template<typename T>
class CallbackSubscriber : public Subscriber<T> {
public:
    /// @param on_next          Invoked for each element.
    /// @param on_error         Invoked when the stream fails.
    /// @param on_complete      Invoked when the stream ends normally.
    /// @param initial_request  Demand issued from OnSubscribe.
    CallbackSubscriber(
        std::function<void(T)> on_next,
        std::function<void(const Error&)> on_error,
        std::function<void()> on_complete,
        int64_t initial_request = kUnboundedDemand
    ) : on_next_(std::move(on_next)),
        on_error_(std::move(on_error)),
        on_complete_(std::move(on_complete)),
        initial_request_(initial_request) {}

    void OnSubscribe(std::shared_ptr<Subscription> subscription) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subscription_ = subscription;
        }
        if (!valid_.load(std::memory_order_acquire)) {
            subscription->Cancel();
            return;
        }
        if (initial_request_ > 0) subscription->Request(initial_request_);
    }

    void OnNext(T element) override {
        if (valid_.load(std::memory_order_acquire) && on_next_) on_next_(std::move(element));
    }

    void OnError(const Error& e) override {
        if (valid_.load(std::memory_order_acquire) && on_error_) on_error_(e);
    }

    void OnComplete() override {
        if (valid_.load(std::memory_order_acquire) && on_complete_) on_complete_();
    }

    /// Issue more demand. Ignored before OnSubscribe.
    void Request(int64_t n) {
        if (auto s = CurrentSubscription()) s->Request(n);
    }

    /// Cancel the subscription. Ignored before OnSubscribe.
    void Cancel() {
        if (auto s = CurrentSubscription()) s->Cancel();
    }

    bool IsSubscribed() const { return CurrentSubscription() != nullptr; }

    /// Atomically disable all future callback dispatches and cancel.
    void Invalidate() {
        valid_.store(false, std::memory_order_release);
        Cancel();
    }

private:
    std::shared_ptr<Subscription> CurrentSubscription() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscription_;
    }

    std::function<void(T)> on_next_;
    std::function<void(const Error&)> on_error_;
    std::function<void()> on_complete_;
    int64_t initial_request_;
    std::atomic<bool> valid_{true};
    mutable std::mutex mutex_;
    std::shared_ptr<Subscription> subscription_;
};

static_assert(SubscriberOf<CallbackSubscriber<int>, int>,
              "CallbackSubscriber<int> must satisfy SubscriberOf");

}  // namespace flowtap
