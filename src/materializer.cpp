// SPDX-License-Identifier: MIT

// src/materializer.cpp
#include "src/materializer.hpp"

#include <cstdio>
#include <exception>
#include <utility>

#include <fmt/format.h>

namespace flowtap {

std::expected<void, Error> MaterializerSettings::Validate() const {
    if (input_buffer_size <= 0) {
        return std::unexpected(Error{ErrorCode::InvalidSettings,
            fmt::format("input_buffer_size must be positive, got {}", input_buffer_size)});
    }
    if (auto r = ValidateFanoutBuffers(fanout_initial_buffer_size, fanout_max_buffer_size); !r) {
        return r;
    }
    if (name_prefix.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidSettings, "name_prefix must not be empty"});
    }
    return {};
}

std::expected<void, Error> ValidateFanoutBuffers(std::size_t initial, std::size_t maximum) {
    if (initial == 0) {
        return std::unexpected(Error{ErrorCode::InvalidSettings,
            "fan-out initial buffer size must be positive"});
    }
    if (initial > maximum) {
        return std::unexpected(Error{ErrorCode::InvalidSettings,
            fmt::format("fan-out initial buffer size {} exceeds maximum {}", initial, maximum)});
    }
    return {};
}

std::string MaterializationContext::StageName(std::string_view descriptor) {
    return fmt::format("{}-{}-{}-{}", settings_.name_prefix, run_id_, next_index_++, descriptor);
}

Materializer::Materializer(IEventLoop& loop, MaterializerSettings settings)
    : Materializer(PrivateTag{}, loop, std::move(settings)) {
    if (auto r = settings_.Validate(); !r) {
        FatalInvariant("Materializer", r.error());
    }
}

Materializer::Materializer(PrivateTag, IEventLoop& loop, MaterializerSettings settings)
    : loop_(loop),
      settings_(std::move(settings)),
      next_run_(std::make_shared<std::atomic<uint64_t>>(0)) {}

std::expected<Materializer, Error> Materializer::Create(IEventLoop& loop,
                                                        MaterializerSettings settings) {
    if (auto r = settings.Validate(); !r) {
        return std::unexpected(r.error());
    }
    return Materializer(PrivateTag{}, loop, std::move(settings));
}

MaterializationContext Materializer::NewContext() const {
    uint64_t run = next_run_->fetch_add(1, std::memory_order_relaxed);
    return MaterializationContext(loop_, settings_, run);
}

void FatalInvariant(std::string_view where, const Error& e) {
    std::fprintf(stderr, "%.*s: %.*s\n",
                 static_cast<int>(where.size()), where.data(),
                 static_cast<int>(e.message.size()), e.message.data());
    std::terminate();
}

}  // namespace flowtap
