// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace flowtap {

/// Error codes for all composition, materialization and stream operations.
enum class ErrorCode {
    // Composition
    AlreadyClosed,         ///< Graph already has a sink attached
    SubscriberRejected,    ///< Second subscriber on a single-subscriber publisher
    InvalidSettings,       ///< Buffer sizes or materializer settings out of range
    InvalidState,          ///< Operation not valid in the current graph/stage state

    // Demand
    InvalidDemand,         ///< Request(n) called with n <= 0

    // Element processing
    StageFailed,           ///< Transformation or sink function threw

    // Producer
    ProducerFailed,        ///< Tap could not produce (thunk or iterator threw)
    FutureFailed,          ///< Future-backed tap completed with a failure

    // Fan-out
    SubscriberDropped,     ///< Subscriber fell further behind than the fan-out buffer allows

    // Lifecycle
    Cancelled,             ///< Run cancelled before it completed
};

/// Error payload delivered to OnError callbacks and completion handles.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "composition").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::AlreadyClosed:
        case ErrorCode::SubscriberRejected:
        case ErrorCode::InvalidSettings:
        case ErrorCode::InvalidState:
            return "composition";
        case ErrorCode::InvalidDemand:
            return "demand";
        case ErrorCode::StageFailed:
            return "processing";
        case ErrorCode::ProducerFailed:
        case ErrorCode::FutureFailed:
            return "producer";
        case ErrorCode::SubscriberDropped:
            return "fanout";
        case ErrorCode::Cancelled:
            return "lifecycle";
    }
    return "unknown";
}

/// Composition errors are reported synchronously, never through a running stream.
constexpr bool is_composition_error(ErrorCode code) {
    return error_category(code) == "composition";
}

}  // namespace flowtap
