// SPDX-License-Identifier: MIT

// lib/stream/signal.hpp
#pragma once

#include <type_traits>
#include <utility>
#include <variant>

#include "lib/stream/error.hpp"
#include "lib/stream/subscription.hpp"

namespace flowtap {

/// One element travelling downstream.
template<typename T>
struct Next {
    T value;
};

/// Normal end of stream.
struct Complete {};

/// Abnormal end of stream.
struct Failure {
    Error error;
};

/// Tagged event carried over a demand channel.
template<typename T>
using Signal = std::variant<Next<T>, Complete, Failure>;

template<typename T>
constexpr bool is_terminal(const Signal<T>& s) {
    return !std::holds_alternative<Next<T>>(s);
}

/// Deliver one signal to a subscriber by synchronous dispatch.
template<typename T>
void Dispatch(Subscriber<T>& subscriber, Signal<T>&& signal) {
    std::visit([&subscriber](auto&& s) {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, Next<T>>) {
            subscriber.OnNext(std::move(s.value));
        } else if constexpr (std::is_same_v<S, Complete>) {
            subscriber.OnComplete();
        } else {
            subscriber.OnError(s.error);
        }
    }, std::move(signal));
}

}  // namespace flowtap
