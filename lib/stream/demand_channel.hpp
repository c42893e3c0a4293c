// SPDX-License-Identifier: MIT

// lib/stream/demand_channel.hpp
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/signal.hpp"
#include "lib/stream/subscription.hpp"

namespace flowtap {

/// Producer-side callbacks of a DemandChannel.
///
/// Both are invoked on the event loop thread. OnDemand() is coalesced:
/// several Request() calls between two loop iterations produce one call,
/// and the producer reads the current total with DemandChannel::Demand().
class DemandListener {
public:
    virtual ~DemandListener() = default;

    /// Outstanding demand grew.
    virtual void OnDemand() = 0;

    /// The consumer cancelled, or broke the demand protocol.
    virtual void OnCancel() = 0;
};

/// DemandChannel<T> - the unit of backpressure between one producer and
/// one consumer.
///
/// The channel is the Subscription the consumer sees. It holds:
/// - the outstanding demand (>= 0, saturating at kUnboundedDemand)
/// - a FIFO of signals accepted from the producer but not yet delivered;
///   it never holds more elements than the consumer requested, and at most
///   one terminal signal, always last
/// - the cancellation flag
///
/// Delivery to the consumer is posted to the event loop, so a producer
/// never re-enters its consumer from inside Emit().
///
/// Ownership: the channel holds both endpoints strongly and drops them once
/// the terminal signal is delivered or the consumer cancels. Until then the
/// pair keeps each other alive, which is what keeps a running pipeline
/// alive without an owner.
///
/// Thread safety: every member is guarded by one mutex; Request()/Cancel()
/// may come from any thread. Endpoint callbacks run on the loop thread.
template<typename T>
class DemandChannel : public Subscription,
                      public std::enable_shared_from_this<DemandChannel<T>> {
    struct PrivateTag {};

public:
    static std::shared_ptr<DemandChannel> Create(
        IEventLoop& loop,
        std::shared_ptr<Subscriber<T>> consumer,
        std::shared_ptr<DemandListener> producer) {
        return std::make_shared<DemandChannel>(
            PrivateTag{}, loop, std::move(consumer), std::move(producer));
    }

    DemandChannel(PrivateTag, IEventLoop& loop,
                  std::shared_ptr<Subscriber<T>> consumer,
                  std::shared_ptr<DemandListener> producer)
        : loop_(loop.Handle()),
          consumer_(std::move(consumer)),
          producer_(std::move(producer)) {}

    DemandChannel(const DemandChannel&) = delete;
    DemandChannel& operator=(const DemandChannel&) = delete;

    /// Post OnSubscribe to the consumer. Signals accepted before it is
    /// delivered are held back until after it.
    void Open() {
        auto self = this->shared_from_this();
        loop_.Defer([self]() { self->DeliverSubscribe(); });
    }

    // =========================================================================
    // Consumer side (Subscription)
    // =========================================================================

    void Request(int64_t n) override {
        bool notify = false;
        bool drain = false;
        std::shared_ptr<DemandListener> cancelled_producer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_ || terminated_) return;
            if (n <= 0) {
                terminated_ = true;
                pending_.push_back(Failure{Error{ErrorCode::InvalidDemand,
                    fmt::format("request({}) must be positive", n)}});
                drain = MarkDrainLocked();
                cancelled_producer = producer_;
            } else {
                demand_ = add_demand(demand_, n);
                total_requested_ = add_demand(total_requested_, n);
                if (!notify_scheduled_) {
                    notify_scheduled_ = true;
                    notify = true;
                }
            }
        }

        auto self = this->shared_from_this();
        if (notify) loop_.Defer([self]() { self->NotifyDemand(); });
        if (drain) loop_.Defer([self]() { self->Drain(); });
        if (cancelled_producer) {
            loop_.Defer([p = std::move(cancelled_producer)]() { p->OnCancel(); });
        }
    }

    void Cancel() override {
        std::shared_ptr<DemandListener> producer;
        std::shared_ptr<Subscriber<T>> consumer;
        bool notify_producer = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) return;
            cancelled_ = true;
            pending_.clear();
            notify_producer = !terminated_;
            consumer = std::move(consumer_);
            producer = std::move(producer_);
        }
        if (notify_producer && producer) {
            loop_.Defer([p = std::move(producer)]() { p->OnCancel(); });
        }
    }

    // =========================================================================
    // Producer side
    // =========================================================================

    /// Outstanding demand; 0 once the channel is closed.
    int64_t Demand() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || terminated_) return 0;
        return demand_;
    }

    /// Accept one element for delivery.
    /// @return false (element dropped) when there is no demand or the
    ///         channel is closed.
    bool Emit(T value) {
        bool drain = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_ || terminated_ || demand_ == 0) return false;
            if (demand_ != kUnboundedDemand) --demand_;
            pending_.push_back(Next<T>{std::move(value)});
            drain = MarkDrainLocked();
        }
        if (drain) ScheduleDrain();
        return true;
    }

    /// Record normal completion. Returns false if a terminal signal was
    /// already recorded or the consumer cancelled.
    bool Complete() { return Terminate(flowtap::Complete{}); }

    /// Record failure. Same at-most-once rule as Complete().
    bool Fail(Error e) { return Terminate(Failure{std::move(e)}); }

    bool IsCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    bool IsTerminated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminated_;
    }

    /// True once no further element can be accepted.
    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_ || terminated_;
    }

    /// Sum of all positive Request() amounts (saturating).
    int64_t TotalRequested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_requested_;
    }

    /// Number of OnNext calls made on the consumer.
    int64_t TotalDelivered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_delivered_;
    }

private:
    bool Terminate(Signal<T> terminal) {
        bool drain = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_ || terminated_) return false;
            terminated_ = true;
            pending_.push_back(std::move(terminal));
            drain = MarkDrainLocked();
        }
        if (drain) ScheduleDrain();
        return true;
    }

    bool MarkDrainLocked() {
        if (drain_scheduled_ || !subscribed_) return false;
        drain_scheduled_ = true;
        return true;
    }

    void ScheduleDrain() {
        auto self = this->shared_from_this();
        loop_.Defer([self]() { self->Drain(); });
    }

    void DeliverSubscribe() {
        std::shared_ptr<Subscriber<T>> consumer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subscribed_ = true;
            consumer = consumer_;
        }
        if (consumer) consumer->OnSubscribe(this->shared_from_this());
        Drain();
    }

    void NotifyDemand() {
        std::shared_ptr<DemandListener> producer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            notify_scheduled_ = false;
            if (cancelled_ || terminated_) return;
            producer = producer_;
        }
        if (producer) producer->OnDemand();
    }

    // Deliver queued signals in FIFO order. Re-checks cancellation before
    // every element so a Cancel() from inside OnNext() stops delivery.
    void Drain() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            drain_scheduled_ = false;
        }
        for (;;) {
            std::shared_ptr<Subscriber<T>> consumer;
            std::shared_ptr<Subscriber<T>> released_consumer;
            std::shared_ptr<DemandListener> released_producer;
            std::optional<Signal<T>> signal;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (cancelled_ || !subscribed_ || pending_.empty()) return;
                signal.emplace(std::move(pending_.front()));
                pending_.pop_front();
                consumer = consumer_;
                if (is_terminal(*signal)) {
                    released_consumer = std::move(consumer_);
                    released_producer = std::move(producer_);
                } else {
                    ++total_delivered_;
                }
            }
            if (consumer) Dispatch(*consumer, std::move(*signal));
        }
    }

    // Request() and Cancel() may come from any thread, even after the loop is destroyed
    LoopHandle loop_;

    mutable std::mutex mutex_;
    std::shared_ptr<Subscriber<T>> consumer_;
    std::shared_ptr<DemandListener> producer_;
    std::deque<Signal<T>> pending_;
    int64_t demand_ = 0;
    int64_t total_requested_ = 0;
    int64_t total_delivered_ = 0;
    bool subscribed_ = false;
    bool terminated_ = false;
    bool cancelled_ = false;
    bool drain_scheduled_ = false;
    bool notify_scheduled_ = false;
};

/// Tell a subscriber it was refused: OnSubscribe with a no-op subscription,
/// then OnError, both posted to the loop.
template<typename T>
void RejectSubscriber(IEventLoop& loop, std::shared_ptr<Subscriber<T>> subscriber, Error e) {
    loop.Defer([subscriber = std::move(subscriber), e = std::move(e)]() {
        subscriber->OnSubscribe(std::make_shared<NoopSubscription>());
        subscriber->OnError(e);
    });
}

}  // namespace flowtap
