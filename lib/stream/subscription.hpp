// SPDX-License-Identifier: MIT

// lib/stream/subscription.hpp
#pragma once

#include <concepts>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <type_traits>

#include "lib/stream/error.hpp"

namespace flowtap {

/// Demand at or above this value is treated as unbounded and never decremented.
inline constexpr int64_t kUnboundedDemand = std::numeric_limits<int64_t>::max();

/// Elements must be copyable: collection taps replay them and fan-out
/// stages hand one element to several subscribers.
template<typename T>
concept StreamElement = std::is_object_v<T> && std::copy_constructible<T> && std::movable<T>;

/// Demand controller handed to a consumer in OnSubscribe().
///
/// Request semantics:
/// - Request(n) adds n to the outstanding demand; the producer may then
///   deliver up to that many elements.
/// - n <= 0 is a protocol violation; the consumer receives
///   ErrorCode::InvalidDemand and the producer is cancelled.
/// - Sums saturate at kUnboundedDemand.
///
/// Thread safety: Request() and Cancel() may be called from any thread.
class Subscription {
public:
    virtual ~Subscription() = default;

    /// Authorize the producer to deliver up to n more elements.
    virtual void Request(int64_t n) = 0;

    /// Stop the flow of elements. Idempotent; needs no acknowledgement.
    virtual void Cancel() = 0;
};

/// Consumer side of one edge.
///
/// Signals arrive in the order OnSubscribe, OnNext*, then at most one of
/// OnError / OnComplete. After a terminal signal nothing else is delivered.
template<typename T>
class Subscriber {
public:
    virtual ~Subscriber() = default;

    virtual void OnSubscribe(std::shared_ptr<Subscription> subscription) = 0;
    virtual void OnNext(T element) = 0;
    virtual void OnError(const Error& e) = 0;
    virtual void OnComplete() = 0;
};

/// Producer side of one or more edges.
template<typename T>
class Publisher {
public:
    virtual ~Publisher() = default;

    /// Attach a subscriber.
    ///
    /// A rejected subscriber (e.g. the second one on a single-subscriber
    /// publisher) gets an error result here and, in addition, OnSubscribe
    /// followed by OnError on the publisher's loop.
    virtual std::expected<void, Error> Subscribe(std::shared_ptr<Subscriber<T>> subscriber) = 0;
};

/// A stage that is both a consumer of In and a producer of Out.
template<typename In, typename Out>
class Processor : public Subscriber<In>, public Publisher<Out> {};

/// Subscription handed to rejected subscribers; ignores all calls.
class NoopSubscription : public Subscription {
public:
    void Request(int64_t) override {}
    void Cancel() override {}
};

/// Add two demand values, saturating at kUnboundedDemand.
constexpr int64_t add_demand(int64_t a, int64_t b) {
    if (a >= kUnboundedDemand - b) return kUnboundedDemand;
    return a + b;
}

}  // namespace flowtap
