// SPDX-License-Identifier: MIT

// src/fanout_stage.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
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

namespace flowtap {

// FanoutStage<T> - one upstream edge, any number of downstream subscribers.
//
// Elements are kept once in a shared buffer; every subscriber has a cursor
// into it. The buffer is only ever touched on the loop thread, which is the
// single arbitration point between subscribers.
//
// Policy when a subscriber falls behind: upstream demand follows the
// fastest subscriber, and a subscriber whose backlog (elements buffered for
// it but not yet delivered) exceeds max_buffer_size is dropped with
// ErrorCode::SubscriberDropped. Faster subscribers are never blocked by a
// slow one and the buffer never exceeds max_buffer_size + 1 elements.
//
// initial_buffer_size bounds how far ahead of the fastest subscriber the
// stage prefetches from upstream.
//
// Subscribers that join late see elements from the moment they join. When
// the last subscriber leaves (cancel or drop) upstream is cancelled.
template<StreamElement T>
class FanoutStage
    : public Subscriber<T>,
      public Publisher<T>,
      public StageBase<FanoutStage<T>>,
      public std::enable_shared_from_this<FanoutStage<T>> {
    struct PrivateTag {};
    using Base = StageBase<FanoutStage<T>>;
    friend Base;

    // Producer endpoint of one subscriber's channel
    struct Outlet : DemandListener {
        std::weak_ptr<FanoutStage> stage;
        std::shared_ptr<DemandChannel<T>> channel;
        uint64_t cursor = 0;   // absolute index of next element to deliver

        void OnDemand() override {
            if (auto s = stage.lock()) s->HandleDemand(this);
        }
        void OnCancel() override {
            if (auto s = stage.lock()) s->HandleCancel(this);
        }
    };

public:
    static std::shared_ptr<FanoutStage> Create(
        IEventLoop& loop, std::string name,
        std::size_t initial_buffer_size, std::size_t max_buffer_size) {
        return std::make_shared<FanoutStage>(
            PrivateTag{}, loop, std::move(name), initial_buffer_size, max_buffer_size);
    }

    FanoutStage(PrivateTag, IEventLoop& loop, std::string name,
                std::size_t initial_buffer_size, std::size_t max_buffer_size)
        : Base(loop, std::move(name)),
          initial_buffer_size_(static_cast<int64_t>(std::max<std::size_t>(initial_buffer_size, 1))),
          max_buffer_size_(std::max<std::size_t>(max_buffer_size, 1)) {}

    // =========================================================================
    // Publisher<T>
    // =========================================================================

    std::expected<void, Error> Subscribe(std::shared_ptr<Subscriber<T>> subscriber) override {
        if (!subscriber) {
            return std::unexpected(Error{ErrorCode::InvalidState,
                fmt::format("stage '{}': null subscriber", this->Name())});
        }
        auto self = this->shared_from_this();
        this->loop_.Defer([self, subscriber = std::move(subscriber)]() mutable {
            self->AddOutlet(std::move(subscriber));
        });
        return {};
    }

    // =========================================================================
    // Subscriber<T> (upstream edge)
    // =========================================================================

    void OnSubscribe(std::shared_ptr<Subscription> subscription) override {
        if (upstream_ || this->IsTerminated()) {
            subscription->Cancel();
            return;
        }
        upstream_ = std::move(subscription);
        RequestUpstream();
    }

    void OnNext(T element) override {
        auto guard = this->TryGuard();
        if (!guard || upstream_done_) return;
        if (upstream_outstanding_ > 0) --upstream_outstanding_;
        this->TransitionTo(StageState::Processing);

        buffer_.push_back(std::move(element));
        for (auto& outlet : outlets_) {
            Deliver(*outlet);
        }
        DropSlowSubscribers();
        Trim();
        RequestUpstream();
    }

    void OnError(const Error& e) override {
        auto guard = this->TryGuard();
        if (!guard || upstream_done_) return;
        upstream_done_ = true;
        upstream_.reset();
        error_ = e;
        // Errors overtake buffered elements
        for (auto& outlet : outlets_) {
            outlet->channel->Fail(e);
        }
        outlets_.clear();
        buffer_.clear();
        this->Terminate(StageState::Failed);
    }

    void OnComplete() override {
        auto guard = this->TryGuard();
        if (!guard || upstream_done_) return;
        upstream_done_ = true;
        upstream_.reset();
        this->TransitionTo(StageState::Completing);
        CompleteCaughtUp();
    }

    // =========================================================================
    // Introspection
    // =========================================================================

    std::size_t SubscriberCount() const { return outlets_.size(); }
    std::size_t Buffered() const { return buffer_.size(); }
    std::size_t DroppedCount() const { return dropped_; }

private:
    void AddOutlet(std::shared_ptr<Subscriber<T>> subscriber) {
        auto outlet = std::make_shared<Outlet>();
        outlet->stage = this->weak_from_this();
        outlet->cursor = End();
        outlet->channel = DemandChannel<T>::Create(this->loop_, std::move(subscriber), outlet);
        outlet->channel->Open();

        if (this->IsTerminated()) {
            if (this->State() == StageState::Failed && error_) {
                outlet->channel->Fail(*error_);
            } else {
                outlet->channel->Complete();
            }
            return;
        }
        if (upstream_done_) {
            // Nothing further will be buffered for a late subscriber
            outlet->channel->Complete();
            return;
        }
        had_subscriber_ = true;
        outlets_.push_back(std::move(outlet));
    }

    void HandleDemand(Outlet* outlet) {
        auto guard = this->TryGuard();
        if (!guard) return;
        if (Find(outlet) == outlets_.end()) return;
        Deliver(*outlet);
        CompleteCaughtUp();
        Trim();
        RequestUpstream();
    }

    void HandleCancel(Outlet* outlet) {
        auto guard = this->TryGuard();
        if (!guard) return;
        auto it = Find(outlet);
        if (it == outlets_.end()) return;
        outlets_.erase(it);
        AfterRemoval();
    }

    void Deliver(Outlet& outlet) {
        while (outlet.cursor < End() && outlet.channel->Demand() > 0) {
            if (!outlet.channel->Emit(buffer_[outlet.cursor - base_])) break;
            ++outlet.cursor;
        }
    }

    void DropSlowSubscribers() {
        auto slow = [this](const std::shared_ptr<Outlet>& o) {
            return End() - o->cursor > max_buffer_size_;
        };
        bool dropped_any = false;
        for (auto& outlet : outlets_) {
            if (!slow(outlet)) continue;
            outlet->channel->Fail(Error{ErrorCode::SubscriberDropped,
                fmt::format("stage '{}': subscriber fell {} elements behind (max {})",
                            this->Name(), End() - outlet->cursor, max_buffer_size_)});
            ++dropped_;
            dropped_any = true;
        }
        if (!dropped_any) return;
        std::erase_if(outlets_, slow);
        AfterRemoval();
    }

    // Complete every subscriber that has seen the whole stream
    void CompleteCaughtUp() {
        if (!upstream_done_) return;
        std::erase_if(outlets_, [this](const std::shared_ptr<Outlet>& o) {
            if (o->cursor < End()) return false;
            o->channel->Complete();
            return true;
        });
        if (outlets_.empty()) {
            buffer_.clear();
            this->Terminate(StageState::Completed);
        }
    }

    void AfterRemoval() {
        Trim();
        if (!outlets_.empty() || !had_subscriber_) return;
        if (upstream_done_) {
            this->Terminate(StageState::Completed);
            return;
        }
        CancelUpstream();
        this->Terminate(StageState::Cancelled);
    }

    // Drop elements every remaining subscriber has already received
    void Trim() {
        uint64_t min_cursor = End();
        for (const auto& o : outlets_) {
            min_cursor = std::min(min_cursor, o->cursor);
        }
        while (base_ < min_cursor) {
            buffer_.pop_front();
            ++base_;
        }
    }

    void RequestUpstream() {
        if (!upstream_ || upstream_done_ || this->IsTerminated()) return;
        int64_t want = 0;
        for (const auto& o : outlets_) {
            int64_t backlog = static_cast<int64_t>(End() - o->cursor);
            want = std::max(want, o->channel->Demand() - backlog);
        }
        want = std::min(want, initial_buffer_size_);
        if (want > upstream_outstanding_) {
            int64_t n = want - upstream_outstanding_;
            upstream_outstanding_ += n;
            upstream_->Request(n);
        }
        this->TransitionTo(upstream_outstanding_ > 0 ? StageState::Demanding
                                                     : StageState::Idle);
    }

    void CancelUpstream() {
        upstream_outstanding_ = 0;
        if (auto up = std::move(upstream_)) up->Cancel();
    }

    auto Find(Outlet* outlet) {
        return std::find_if(outlets_.begin(), outlets_.end(),
            [outlet](const std::shared_ptr<Outlet>& o) { return o.get() == outlet; });
    }

    uint64_t End() const { return base_ + buffer_.size(); }

    void DoRelease() {
        upstream_.reset();
        outlets_.clear();
        buffer_.clear();
    }

    int64_t initial_buffer_size_;
    std::size_t max_buffer_size_;

    std::shared_ptr<Subscription> upstream_;
    std::vector<std::shared_ptr<Outlet>> outlets_;
    std::deque<T> buffer_;
    uint64_t base_ = 0;  // absolute index of buffer_.front()
    int64_t upstream_outstanding_ = 0;
    bool upstream_done_ = false;
    bool had_subscriber_ = false;
    std::size_t dropped_ = 0;
    std::optional<Error> error_;
};

}  // namespace flowtap
