// SPDX-License-Identifier: MIT

// src/transform_stage.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/demand_channel.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/stage.hpp"
#include "lib/stream/subscription.hpp"
#include "src/transformer.hpp"

namespace flowtap {

// TransformStage<In, Out> - live stage running one Transformer.
//
// Consumes one upstream edge and produces one downstream edge (single
// subscriber). Demand rule: the stage asks upstream for
//
//   min(downstream demand - buffered output, input_buffer_size)
//
// minus what it already has outstanding. With no downstream subscriber, or
// no downstream demand, it never requests anything.
//
// Error handling:
// - transformer throws   -> error downstream, cancel upstream (Failed)
// - upstream error       -> error downstream (Failed)
// - downstream cancel    -> cancel upstream (Cancelled)
//
// Thread safety: Subscribe() may be called from any thread; everything else
// runs on the loop thread.
template<StreamElement In, StreamElement Out>
class TransformStage
    : public Processor<In, Out>,
      public DemandListener,
      public StageBase<TransformStage<In, Out>>,
      public std::enable_shared_from_this<TransformStage<In, Out>> {
    struct PrivateTag {};
    using Base = StageBase<TransformStage<In, Out>>;
    friend Base;

public:
    static std::shared_ptr<TransformStage> Create(
        IEventLoop& loop,
        std::string name,
        std::unique_ptr<Transformer<In, Out>> transformer,
        int64_t input_buffer_size) {
        return std::make_shared<TransformStage>(
            PrivateTag{}, loop, std::move(name), std::move(transformer), input_buffer_size);
    }

    TransformStage(PrivateTag, IEventLoop& loop, std::string name,
                   std::unique_ptr<Transformer<In, Out>> transformer,
                   int64_t input_buffer_size)
        : Base(loop, std::move(name)),
          transformer_(std::move(transformer)),
          input_buffer_size_(std::max<int64_t>(input_buffer_size, 1)) {}

    // =========================================================================
    // Publisher<Out>
    // =========================================================================

    std::expected<void, Error> Subscribe(std::shared_ptr<Subscriber<Out>> subscriber) override {
        if (!subscriber) {
            return std::unexpected(Error{ErrorCode::InvalidState,
                fmt::format("stage '{}': null subscriber", this->Name())});
        }
        if (has_subscriber_.exchange(true)) {
            Error e{ErrorCode::SubscriberRejected,
                fmt::format("stage '{}' supports a single subscriber", this->Name())};
            RejectSubscriber(this->loop_, std::move(subscriber), e);
            return std::unexpected(e);
        }
        auto self = this->shared_from_this();
        this->loop_.Defer([self, subscriber = std::move(subscriber)]() mutable {
            self->AttachDownstream(std::move(subscriber));
        });
        return {};
    }

    // =========================================================================
    // Subscriber<In>
    // =========================================================================

    void OnSubscribe(std::shared_ptr<Subscription> subscription) override {
        if (upstream_ || this->IsTerminated()) {
            subscription->Cancel();
            return;
        }
        upstream_ = std::move(subscription);
        RequestUpstream();
    }

    void OnNext(In element) override {
        auto guard = this->TryGuard();
        if (!guard) return;
        if (this->State() == StageState::Completing) return;  // stray after early finish

        if (upstream_outstanding_ <= 0) {
            FailStage(Error{ErrorCode::InvalidState,
                fmt::format("stage '{}' received an element it did not request", this->Name())});
            return;
        }
        --upstream_outstanding_;
        this->TransitionTo(StageState::Processing);

        std::vector<Out> out;
        try {
            out = transformer_->OnNext(std::move(element));
        } catch (const std::exception& e) {
            FailStage(Error{ErrorCode::StageFailed,
                fmt::format("stage '{}' failed: {}", this->Name(), e.what())});
            return;
        } catch (...) {
            FailStage(Error{ErrorCode::StageFailed,
                fmt::format("stage '{}' failed with a non-standard exception", this->Name())});
            return;
        }
        Buffer(std::move(out));

        if (transformer_->IsComplete()) {
            CancelUpstream();
            BeginCompletion();
            return;
        }
        Flush();
        RequestUpstream();
    }

    void OnError(const Error& e) override {
        auto guard = this->TryGuard();
        if (!guard) return;
        if (this->State() == StageState::Completing) return;
        upstream_.reset();
        error_ = e;
        if (downstream_) downstream_->Fail(e);
        this->Terminate(StageState::Failed);
    }

    void OnComplete() override {
        auto guard = this->TryGuard();
        if (!guard) return;
        if (this->State() == StageState::Completing) return;
        upstream_.reset();
        BeginCompletion();
    }

    // =========================================================================
    // DemandListener (downstream edge)
    // =========================================================================

    void OnDemand() override {
        auto guard = this->TryGuard();
        if (!guard) return;
        Flush();
        RequestUpstream();
    }

    void OnCancel() override {
        auto guard = this->TryGuard();
        if (!guard) return;
        CancelUpstream();
        this->Terminate(StageState::Cancelled);
    }

    // =========================================================================
    // Introspection
    // =========================================================================

    int64_t UpstreamOutstanding() const { return upstream_outstanding_; }
    std::size_t Buffered() const { return out_buffer_.size(); }

private:
    void AttachDownstream(std::shared_ptr<Subscriber<Out>> subscriber) {
        auto guard = this->TryGuard();
        downstream_ = DemandChannel<Out>::Create(this->loop_, std::move(subscriber),
                                                 this->shared_from_this());
        downstream_->Open();
        if (!guard) {
            // Terminated before anyone subscribed: replay the outcome
            if (this->State() == StageState::Failed && error_) {
                downstream_->Fail(*error_);
            } else {
                downstream_->Complete();
            }
            downstream_.reset();
            return;
        }
        Flush();
    }

    void RequestUpstream() {
        if (!upstream_ || this->IsTerminated() ||
            this->State() == StageState::Completing) {
            return;
        }
        int64_t downstream_demand = downstream_ ? downstream_->Demand() : 0;
        int64_t buffered = static_cast<int64_t>(out_buffer_.size());
        int64_t want = std::min(downstream_demand - buffered, input_buffer_size_);
        if (want > upstream_outstanding_) {
            int64_t n = want - upstream_outstanding_;
            upstream_outstanding_ += n;
            upstream_->Request(n);
        }
        this->TransitionTo(upstream_outstanding_ > 0 ? StageState::Demanding
                                                     : StageState::Idle);
    }

    void Buffer(std::vector<Out>&& out) {
        for (auto& e : out) {
            out_buffer_.push_back(std::move(e));
        }
    }

    // Move buffered output into the downstream channel as far as demand allows.
    void Flush() {
        while (!out_buffer_.empty() && downstream_ && downstream_->Demand() > 0) {
            if (!downstream_->Emit(std::move(out_buffer_.front()))) break;
            out_buffer_.pop_front();
        }
        if (this->State() == StageState::Completing && out_buffer_.empty() && downstream_) {
            downstream_->Complete();
            this->Terminate(StageState::Completed);
        }
    }

    void BeginCompletion() {
        this->TransitionTo(StageState::Completing);
        std::vector<Out> trailing;
        try {
            trailing = transformer_->OnTermination();
        } catch (const std::exception& e) {
            FailStage(Error{ErrorCode::StageFailed,
                fmt::format("stage '{}' failed on completion: {}", this->Name(), e.what())});
            return;
        } catch (...) {
            FailStage(Error{ErrorCode::StageFailed,
                fmt::format("stage '{}' failed on completion with a non-standard exception",
                            this->Name())});
            return;
        }
        Buffer(std::move(trailing));
        Flush();
    }

    void FailStage(Error e) {
        CancelUpstream();
        out_buffer_.clear();
        if (downstream_) downstream_->Fail(e);
        error_ = std::move(e);
        this->Terminate(StageState::Failed);
    }

    void CancelUpstream() {
        upstream_outstanding_ = 0;
        if (auto up = std::move(upstream_)) up->Cancel();
    }

    void DoRelease() {
        upstream_.reset();
        downstream_.reset();
        out_buffer_.clear();
        if (transformer_) {
            transformer_->Cleanup();
            transformer_.reset();
        }
    }

    std::unique_ptr<Transformer<In, Out>> transformer_;
    int64_t input_buffer_size_;

    std::atomic<bool> has_subscriber_{false};
    std::shared_ptr<Subscription> upstream_;
    std::shared_ptr<DemandChannel<Out>> downstream_;
    std::deque<Out> out_buffer_;
    int64_t upstream_outstanding_ = 0;
    std::optional<Error> error_;
};

}  // namespace flowtap
