// SPDX-License-Identifier: MIT

// src/graph.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/error.hpp"

namespace flowtap {

enum class StageKind {
    Tap,
    Transform,
    Sink,
};

constexpr std::string_view stage_kind_name(StageKind k) {
    switch (k) {
        case StageKind::Tap: return "tap";
        case StageKind::Transform: return "transform";
        case StageKind::Sink: return "sink";
    }
    return "unknown";
}

/// Descriptor of one position in a graph: what it is, not a running instance.
struct StageInfo {
    StageKind kind;
    std::string name;     // user-facing name, e.g. "double"
    std::string variant;  // tap/sink variant, e.g. "collection"; empty for transforms

    bool operator==(const StageInfo&) const = default;
};

/// Untyped, immutable description of a linear pipeline.
///
/// Every operation returns a new description and leaves the receiver
/// untouched. The typed Source/Flow/Sink layer rules out the composition
/// errors below at compile time; this class reports them at runtime for
/// callers that build descriptions dynamically.
///
/// Shape: [tap] transform* [sink]. Without a tap the description is a
/// flow fragment; with a sink it is closed and cannot be extended.
class GraphDescription {
public:
    GraphDescription() = default;

    static GraphDescription FromTap(std::string name, std::string variant) {
        GraphDescription g;
        g.tap_ = StageInfo{StageKind::Tap, std::move(name), std::move(variant)};
        return g;
    }

    /// Append one transform descriptor.
    std::expected<GraphDescription, Error> Append(std::string name) const {
        if (IsClosed()) return std::unexpected(ClosedError("append to"));
        GraphDescription g = *this;
        g.stages_.push_back(StageInfo{StageKind::Transform, std::move(name), {}});
        return g;
    }

    /// Append every transform of `fragment`, which must be an open, tap-less
    /// flow description.
    std::expected<GraphDescription, Error> Concat(const GraphDescription& fragment) const {
        if (IsClosed()) return std::unexpected(ClosedError("extend"));
        if (fragment.HasTap()) {
            return std::unexpected(Error{ErrorCode::InvalidState,
                fmt::format("cannot append a description that already has tap '{}'",
                            fragment.tap_->name)});
        }
        GraphDescription g = *this;
        g.stages_.insert(g.stages_.end(), fragment.stages_.begin(), fragment.stages_.end());
        if (fragment.sink_) g.sink_ = fragment.sink_;
        return g;
    }

    /// Prefix this tap-less description with `tap`.
    std::expected<GraphDescription, Error> WithTap(std::string name, std::string variant) const {
        if (HasTap()) {
            return std::unexpected(Error{ErrorCode::InvalidState,
                fmt::format("description already has tap '{}'", tap_->name)});
        }
        GraphDescription g = *this;
        g.tap_ = StageInfo{StageKind::Tap, std::move(name), std::move(variant)};
        return g;
    }

    /// Attach the sink descriptor, closing the description.
    std::expected<GraphDescription, Error> Close(std::string name, std::string variant) const {
        if (IsClosed()) return std::unexpected(ClosedError("close"));
        GraphDescription g = *this;
        g.sink_ = StageInfo{StageKind::Sink, std::move(name), std::move(variant)};
        return g;
    }

    bool IsClosed() const { return sink_.has_value(); }
    bool HasTap() const { return tap_.has_value(); }
    bool IsRunnable() const { return HasTap() && IsClosed(); }

    const std::optional<StageInfo>& Tap() const { return tap_; }
    const std::vector<StageInfo>& Stages() const { return stages_; }
    const std::optional<StageInfo>& Sink() const { return sink_; }

    /// Tap, transforms and sink in declaration order.
    std::vector<StageInfo> All() const {
        std::vector<StageInfo> out;
        out.reserve(stages_.size() + 2);
        if (tap_) out.push_back(*tap_);
        out.insert(out.end(), stages_.begin(), stages_.end());
        if (sink_) out.push_back(*sink_);
        return out;
    }

    std::size_t Size() const {
        return stages_.size() + (tap_ ? 1 : 0) + (sink_ ? 1 : 0);
    }

    /// e.g. "collection(numbers) -> double -> collect(out)"
    std::string ToString() const {
        std::string out;
        for (const auto& info : All()) {
            if (!out.empty()) out += " -> ";
            if (info.variant.empty()) {
                out += info.name;
            } else {
                out += fmt::format("{}({})", info.variant, info.name);
            }
        }
        return out;
    }

    bool operator==(const GraphDescription&) const = default;

private:
    Error ClosedError(std::string_view what) const {
        return Error{ErrorCode::AlreadyClosed,
            fmt::format("cannot {} a closed description (sink '{}')", what, sink_->name)};
    }

    std::optional<StageInfo> tap_;
    std::vector<StageInfo> stages_;
    std::optional<StageInfo> sink_;
};

}  // namespace flowtap
