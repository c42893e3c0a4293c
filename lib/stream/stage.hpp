// SPDX-License-Identifier: MIT

// lib/stream/stage.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace flowtap {

// Live stage state machine:
//
//   Idle <-> Demanding -> Processing -> Idle/Demanding
//     |          |            |
//     +----------+------------+-> Completing -> Completed
//     +----------+------------+-> Failed
//     +----------+------------+-> Cancelled
//
// Completed, Failed and Cancelled are terminal and sticky.
enum class StageState {
    Idle,        // No outstanding upstream demand
    Demanding,   // Requested elements from upstream, awaiting delivery
    Processing,  // Running the transformation on a received element
    Completing,  // Upstream finished; draining buffered output
    Completed,   // Completion forwarded downstream
    Failed,      // Error forwarded downstream
    Cancelled,   // Downstream lost interest; cancellation forwarded upstream
};

constexpr std::string_view stage_state_name(StageState s) {
    switch (s) {
        case StageState::Idle: return "idle";
        case StageState::Demanding: return "demanding";
        case StageState::Processing: return "processing";
        case StageState::Completing: return "completing";
        case StageState::Completed: return "completed";
        case StageState::Failed: return "failed";
        case StageState::Cancelled: return "cancelled";
    }
    return "unknown";
}

constexpr bool is_terminal_state(StageState s) {
    return s == StageState::Completed || s == StageState::Failed ||
           s == StageState::Cancelled;
}

/// Introspection view of a running stage.
///
/// State() is thread-safe; it may be read while the loop runs elsewhere.
class LiveStage {
public:
    virtual ~LiveStage() = default;

    virtual const std::string& Name() const = 0;
    virtual StageState State() const = 0;
};

/// Point-in-time copy of a live stage's identity and state.
struct StageSnapshot {
    std::string name;
    StageState state;
};

/// Collects the live stages of one materialization, in creation order.
///
/// Stages register themselves while the network is being wired; some
/// (tap producers) only come into existence when their publisher is
/// subscribed, which may happen later and on another thread.
class StageRegistry {
public:
    void Add(std::shared_ptr<LiveStage> stage) {
        std::lock_guard<std::mutex> lock(mutex_);
        stages_.push_back(std::move(stage));
    }

    std::vector<StageSnapshot> Snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StageSnapshot> out;
        out.reserve(stages_.size());
        for (const auto& s : stages_) {
            out.push_back(StageSnapshot{s->Name(), s->State()});
        }
        return out;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stages_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<LiveStage>> stages_;
};

// CRTP base for live stages - state machine plus reentrancy-safe release.
//
// A stage may be told to terminate (cancel from downstream, error from
// upstream) while one of its own callbacks is still on the stack. Release
// of resources is therefore deferred until the outermost ProcessingGuard
// is gone, and then posted to the loop.
//
// Derived classes must implement:
// - DoRelease() - drop upstream subscription, buffers and user state
// and must inherit std::enable_shared_from_this<Derived>.
template<typename Derived>
class StageBase : public LiveStage {
public:
    StageBase(IEventLoop& loop, std::string name)
        : loop_(loop), name_(std::move(name)) {}

    // RAII guard for reentrancy-safe processing
    // Move-safe via active flag to prevent double-decrement
    class ProcessingGuard {
    public:
        explicit ProcessingGuard(StageBase& s) : stage_(&s), active_(true) {
            ++stage_->processing_count_;
        }
        ~ProcessingGuard() {
            if (active_) {
                if (--stage_->processing_count_ == 0 && stage_->release_pending_) {
                    stage_->ScheduleRelease();
                }
            }
        }
        ProcessingGuard(const ProcessingGuard&) = delete;
        ProcessingGuard& operator=(const ProcessingGuard&) = delete;
        ProcessingGuard(ProcessingGuard&& other) noexcept
            : stage_(other.stage_), active_(other.active_) {
            other.active_ = false;
        }
        ProcessingGuard& operator=(ProcessingGuard&&) = delete;
    private:
        StageBase* stage_;
        bool active_;
    };

    // Combines the terminal-state check with guard creation
    [[nodiscard]] std::optional<ProcessingGuard> TryGuard() {
        if (is_terminal_state(State())) return std::nullopt;
        return ProcessingGuard{*this};
    }

    const std::string& Name() const override { return name_; }

    StageState State() const override {
        return state_.load(std::memory_order_acquire);
    }

    bool IsTerminated() const { return is_terminal_state(State()); }

    // Move to `next`. Returns false (and changes nothing) once terminal.
    bool TransitionTo(StageState next) {
        StageState current = state_.load(std::memory_order_acquire);
        if (is_terminal_state(current)) return false;
        state_.store(next, std::memory_order_release);
        return true;
    }

    // Enter a terminal state and schedule DoRelease(). Idempotent.
    bool Terminate(StageState terminal) {
        if (!TransitionTo(terminal)) return false;
        RequestRelease();
        return true;
    }

    bool IsReleased() const { return released_; }

protected:
    void RequestRelease() {
        if (release_scheduled_) return;
        if (processing_count_ > 0) {
            release_pending_ = true;
            return;
        }
        ScheduleRelease();
    }

    void ScheduleRelease() {
        if (release_scheduled_) return;
        release_scheduled_ = true;
        release_pending_ = false;

        auto self = static_cast<Derived*>(this)->weak_from_this().lock();
        if (!self) {
            // Object is already being destroyed, nothing left to release
            return;
        }
        loop_.Defer([self]() {
            self->released_ = true;
            self->DoRelease();
        });
    }

    IEventLoop& loop_;

private:
    std::string name_;
    std::atomic<StageState> state_{StageState::Idle};
    int processing_count_ = 0;
    bool release_pending_ = false;
    bool release_scheduled_ = false;
    bool released_ = false;
};

}  // namespace flowtap
