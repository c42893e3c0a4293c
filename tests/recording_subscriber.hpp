// SPDX-License-Identifier: MIT

// tests/recording_subscriber.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/subscription.hpp"

namespace flowtap {

// Subscriber that records every signal and checks the signal order.
// Requests `initial_request` from OnSubscribe (0 = none).
template<typename T>
struct RecordingSubscriber : Subscriber<T> {
    explicit RecordingSubscriber(int64_t initial_request = kUnboundedDemand)
        : initial_request(initial_request) {}

    void OnSubscribe(std::shared_ptr<Subscription> s) override {
        ++subscribe_calls;
        subscription = s;
        if (initial_request > 0) s->Request(initial_request);
    }
    void OnNext(T element) override {
        if (Terminated()) ++after_terminal;
        received.push_back(std::move(element));
    }
    void OnError(const Error& e) override {
        if (Terminated()) ++after_terminal;
        error = e;
    }
    void OnComplete() override {
        if (Terminated()) ++after_terminal;
        completed = true;
    }

    bool Terminated() const { return completed || error.has_value(); }

    void Request(int64_t n) { subscription->Request(n); }
    void Cancel() { subscription->Cancel(); }

    int64_t initial_request;
    std::shared_ptr<Subscription> subscription;
    int subscribe_calls = 0;
    std::vector<T> received;
    std::optional<Error> error;
    bool completed = false;
    int after_terminal = 0;
};

}  // namespace flowtap
