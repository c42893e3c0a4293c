// SPDX-License-Identifier: MIT

// src/materializer.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/stage.hpp"

namespace flowtap {

/// Tunables applied to every run started through one Materializer.
struct MaterializerSettings {
    int64_t input_buffer_size = 16;           ///< Max upstream demand a stage keeps outstanding
    std::size_t fanout_initial_buffer_size = 4;  ///< Default fan-out prefetch
    std::size_t fanout_max_buffer_size = 16;     ///< Default fan-out per-subscriber backlog cap
    std::string name_prefix = "flow";         ///< Prefix of live stage names

    static MaterializerSettings Defaults() { return MaterializerSettings{}; }

    /// Preset for tests that want to observe demand one element at a time.
    static MaterializerSettings Unbuffered() {
        return MaterializerSettings{
            .input_buffer_size = 1,
            .fanout_initial_buffer_size = 1,
            .fanout_max_buffer_size = 1,
            .name_prefix = "flow",
        };
    }

    std::expected<void, Error> Validate() const;
};

/// Validate fan-out buffer bounds: 0 < initial <= maximum.
std::expected<void, Error> ValidateFanoutBuffers(std::size_t initial, std::size_t maximum);

/// State shared by every live stage of one run: loop, settings, naming
/// and the stage registry. Lives as long as anything of the run
/// references it.
class MaterializationContext {
public:
    MaterializationContext(IEventLoop& loop, const MaterializerSettings& settings, uint64_t run_id)
        : loop_(loop), settings_(settings), run_id_(run_id),
          registry_(std::make_shared<StageRegistry>()) {}

    IEventLoop& Loop() const { return loop_; }
    const MaterializerSettings& Settings() const { return settings_; }
    uint64_t RunId() const { return run_id_; }
    const std::shared_ptr<StageRegistry>& Registry() const { return registry_; }

    /// Next live stage name: "{prefix}-{run}-{index}-{descriptor}".
    std::string StageName(std::string_view descriptor);

    void Register(std::shared_ptr<LiveStage> stage) { registry_->Add(std::move(stage)); }

private:
    IEventLoop& loop_;
    MaterializerSettings settings_;
    uint64_t run_id_;
    std::size_t next_index_ = 0;
    std::shared_ptr<StageRegistry> registry_;
};

/// Injected scheduling provider: turns descriptions into running networks
/// on one event loop.
///
/// The loop must outlive every run started through this materializer.
/// Copies share the run counter. Thread safety: NewContext() may be
/// called from any thread.
class Materializer {
public:
    /// Settings are checked; out-of-range values print a diagnostic and
    /// terminate. Use Create() to get the failure as a value.
    explicit Materializer(IEventLoop& loop,
                          MaterializerSettings settings = MaterializerSettings::Defaults());

    static std::expected<Materializer, Error> Create(
        IEventLoop& loop, MaterializerSettings settings = MaterializerSettings::Defaults());

    IEventLoop& Loop() const { return loop_; }
    const MaterializerSettings& Settings() const { return settings_; }

    /// Fresh context for one run.
    MaterializationContext NewContext() const;

    /// Number of runs started so far.
    uint64_t Runs() const { return next_run_->load(std::memory_order_relaxed); }

private:
    struct PrivateTag {};
    Materializer(PrivateTag, IEventLoop& loop, MaterializerSettings settings);

    IEventLoop& loop_;
    MaterializerSettings settings_;
    std::shared_ptr<std::atomic<uint64_t>> next_run_;
};

/// Report a broken internal invariant and terminate.
[[noreturn]] void FatalInvariant(std::string_view where, const Error& e);

/// Value of a composition step that cannot fail for well-typed graphs.
template<typename T>
T Unwrap(std::expected<T, Error> r, std::string_view where) {
    if (!r) FatalInvariant(where, r.error());
    return std::move(*r);
}

inline void Unwrap(std::expected<void, Error> r, std::string_view where) {
    if (!r) FatalInvariant(where, r.error());
}

}  // namespace flowtap
