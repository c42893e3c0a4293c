// SPDX-License-Identifier: MIT

// src/tap.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/async_value.hpp"
#include "lib/stream/demand_channel.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/stage.hpp"
#include "lib/stream/subscription.hpp"
#include "lib/stream/timer.hpp"

namespace flowtap {

/// Pull-style cursor for FromIterator().
template<typename T>
class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool HasNext() = 0;
    virtual T Next() = 0;
};

/// Iterator over a [begin, end) range of a standard container.
/// The range must outlive every run of the source.
template<std::input_iterator It>
class RangeIterator : public Iterator<std::iter_value_t<It>> {
public:
    RangeIterator(It begin, It end) : cur_(std::move(begin)), end_(std::move(end)) {}

    bool HasNext() override { return cur_ != end_; }

    std::iter_value_t<It> Next() override {
        std::iter_value_t<It> v = *cur_;
        ++cur_;
        return v;
    }

private:
    It cur_;
    It end_;
};

/// One cursor shared by every run of an iterator tap. Runs on different
/// loops may pull concurrently, so access is serialized.
template<typename T>
class SharedCursor {
public:
    explicit SharedCursor(std::shared_ptr<Iterator<T>> it) : it_(std::move(it)) {}

    /// Next element, or nullopt when exhausted. Propagates iterator throws.
    std::optional<T> Pull() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!it_ || !it_->HasNext()) return std::nullopt;
        return it_->Next();
    }

    bool Exhausted() {
        std::lock_guard<std::mutex> lock(mutex_);
        return !it_ || !it_->HasNext();
    }

private:
    std::mutex mutex_;
    std::shared_ptr<Iterator<T>> it_;
};

/// Element-producing function shared by every run of a thunk tap.
template<typename T>
class SharedThunk {
public:
    using Fn = std::function<std::optional<T>()>;

    explicit SharedThunk(Fn fn) : fn_(std::move(fn)) {}

    std::optional<T> Call() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        return fn_();
    }

    /// Number of times the function has been invoked, across all runs.
    uint64_t Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    Fn fn_;
    uint64_t calls_ = 0;
};

// ============================================================================
// Tap descriptors
// ============================================================================

template<typename T>
struct CollectionTap {
    std::shared_ptr<const std::vector<T>> elements;
};

template<typename T>
struct IteratorTap {
    std::shared_ptr<SharedCursor<T>> cursor;
};

template<typename T>
struct ThunkTap {
    std::shared_ptr<SharedThunk<T>> thunk;
};

template<typename T>
struct FutureTap {
    AsyncValue<T> future;
};

template<typename T>
struct TickTap {
    std::chrono::milliseconds initial_delay;
    std::chrono::milliseconds interval;  // zero = single tick
    std::shared_ptr<std::function<T()>> tick;
};

template<typename T>
struct PublisherTap {
    std::shared_ptr<Publisher<T>> publisher;
};

template<typename T>
using TapDescriptor = std::variant<CollectionTap<T>, IteratorTap<T>, ThunkTap<T>,
                                   FutureTap<T>, TickTap<T>, PublisherTap<T>>;

template<typename T>
constexpr std::string_view tap_kind(const TapDescriptor<T>& tap) {
    switch (tap.index()) {
        case 0: return "collection";
        case 1: return "iterator";
        case 2: return "thunk";
        case 3: return "future";
        case 4: return "tick";
        case 5: return "publisher";
    }
    return "unknown";
}

// ============================================================================
// Tap producers
// ============================================================================

// TapProducer<T> - producer end of the channel between a tap and its
// subscriber. One instance per subscription.
//
// Subclasses implement Produce(n), called on the loop thread whenever the
// subscriber's outstanding demand is n > 0. They must Emit() at most n
// elements and may finish the stream from any hook. n is capped at
// kMaxEmitPerTurn; when a turn uses its whole allowance and demand is
// left, the producer re-posts itself, so unbounded demand never keeps the
// loop from delivering elements or processing a cancel.
template<StreamElement T>
class TapProducer
    : public DemandListener,
      public StageBase<TapProducer<T>>,
      public std::enable_shared_from_this<TapProducer<T>> {
    using Base = StageBase<TapProducer<T>>;
    friend Base;

public:
    static constexpr int64_t kMaxEmitPerTurn = 256;

    TapProducer(IEventLoop& loop, std::string name) : Base(loop, std::move(name)) {}

    /// Bind to `subscriber` and post OnSubscribe. Called once.
    void Start(std::shared_ptr<Subscriber<T>> subscriber) {
        channel_ = DemandChannel<T>::Create(this->loop_, std::move(subscriber),
                                            this->shared_from_this());
        channel_->Open();
        auto self = this->shared_from_this();
        this->loop_.Defer([self]() {
            auto guard = self->TryGuard();
            if (!guard) return;
            self->OnStart();
        });
    }

    void OnDemand() override {
        auto guard = this->TryGuard();
        if (!guard) return;
        int64_t n = Demand();
        if (n <= 0) return;
        int64_t allowance = std::min(n, kMaxEmitPerTurn);
        this->TransitionTo(StageState::Processing);
        emitted_this_turn_ = 0;
        Produce(allowance);
        if (this->IsTerminated()) return;
        if (Demand() <= 0) {
            this->TransitionTo(StageState::Idle);
            return;
        }
        this->TransitionTo(StageState::Demanding);
        if (emitted_this_turn_ >= allowance) ScheduleResume();
    }

    void OnCancel() override {
        auto guard = this->TryGuard();
        if (!guard) return;
        this->Terminate(StageState::Cancelled);
    }

protected:
    virtual void OnStart() {}
    virtual void Produce(int64_t n) = 0;
    virtual void OnStop() {}

    int64_t Demand() const { return channel_ ? channel_->Demand() : 0; }

    bool Emit(T value) {
        if (!channel_ || !channel_->Emit(std::move(value))) return false;
        ++emitted_this_turn_;
        return true;
    }

    void CompleteStream() {
        if (channel_) channel_->Complete();
        this->Terminate(StageState::Completed);
    }

    void FailStream(Error e) {
        if (channel_) channel_->Fail(std::move(e));
        this->Terminate(StageState::Failed);
    }

private:
    void ScheduleResume() {
        if (resume_scheduled_) return;
        resume_scheduled_ = true;
        auto self = this->shared_from_this();
        this->loop_.Defer([self]() {
            self->resume_scheduled_ = false;
            self->OnDemand();
        });
    }

    void DoRelease() {
        OnStop();
        channel_.reset();
    }

    std::shared_ptr<DemandChannel<T>> channel_;
    int64_t emitted_this_turn_ = 0;
    bool resume_scheduled_ = false;
};

template<StreamElement T>
class CollectionProducer : public TapProducer<T> {
public:
    CollectionProducer(IEventLoop& loop, std::string name,
                       std::shared_ptr<const std::vector<T>> elements)
        : TapProducer<T>(loop, std::move(name)), elements_(std::move(elements)) {}

protected:
    void OnStart() override {
        if (!elements_ || elements_->empty()) this->CompleteStream();
    }

    void Produce(int64_t n) override {
        if (!elements_) return;
        while (n > 0 && index_ < elements_->size()) {
            if (!this->Emit((*elements_)[index_])) return;
            ++index_;
            --n;
        }
        if (index_ == elements_->size()) this->CompleteStream();
    }

    void OnStop() override { elements_.reset(); }

private:
    std::shared_ptr<const std::vector<T>> elements_;
    std::size_t index_ = 0;
};

template<StreamElement T>
class IteratorProducer : public TapProducer<T> {
public:
    IteratorProducer(IEventLoop& loop, std::string name,
                     std::shared_ptr<SharedCursor<T>> cursor)
        : TapProducer<T>(loop, std::move(name)), cursor_(std::move(cursor)) {}

protected:
    void OnStart() override {
        try {
            if (cursor_->Exhausted()) this->CompleteStream();
        } catch (const std::exception& e) {
            Fail(e.what());
        } catch (...) {
            Fail("non-standard exception");
        }
    }

    // Completes as soon as the cursor runs dry, without waiting for
    // demand beyond the last element.
    void Produce(int64_t n) override {
        try {
            while (n > 0) {
                std::optional<T> next = cursor_->Pull();
                if (!next) {
                    this->CompleteStream();
                    return;
                }
                if (!this->Emit(std::move(*next))) return;
                --n;
            }
            if (cursor_->Exhausted()) this->CompleteStream();
        } catch (const std::exception& e) {
            Fail(e.what());
        } catch (...) {
            Fail("non-standard exception");
        }
    }

private:
    void Fail(const char* what) {
        this->FailStream(Error{ErrorCode::ProducerFailed,
            fmt::format("iterator of '{}' threw: {}", this->Name(), what)});
    }

    std::shared_ptr<SharedCursor<T>> cursor_;
};

template<StreamElement T>
class ThunkProducer : public TapProducer<T> {
public:
    ThunkProducer(IEventLoop& loop, std::string name, std::shared_ptr<SharedThunk<T>> thunk)
        : TapProducer<T>(loop, std::move(name)), thunk_(std::move(thunk)) {}

protected:
    // One call per unit of demand; the stream ends at the first nullopt
    // and the function is never called again by this producer.
    void Produce(int64_t n) override {
        while (n > 0) {
            std::optional<T> next;
            try {
                next = thunk_->Call();
            } catch (const std::exception& e) {
                Fail(e.what());
                return;
            } catch (...) {
                Fail("non-standard exception");
                return;
            }
            if (!next) {
                this->CompleteStream();
                return;
            }
            if (!this->Emit(std::move(*next))) return;
            --n;
        }
    }

private:
    void Fail(const char* what) {
        this->FailStream(Error{ErrorCode::ProducerFailed,
            fmt::format("thunk of '{}' threw: {}", this->Name(), what)});
    }

    std::shared_ptr<SharedThunk<T>> thunk_;
};

template<StreamElement T>
class FutureProducer : public TapProducer<T> {
public:
    FutureProducer(IEventLoop& loop, std::string name, AsyncValue<T> future)
        : TapProducer<T>(loop, std::move(name)), future_(std::move(future)) {}

protected:
    void OnStart() override {
        std::weak_ptr<TapProducer<T>> weak = this->weak_from_this();
        // May complete on a foreign thread, or after both this run and its
        // loop are gone; only the weak handles are captured
        future_.OnComplete([weak, loop = this->loop_.Handle()](
                               const typename AsyncValue<T>::Result& r) {
            if (weak.expired()) return;
            loop.Defer([weak, r]() {
                auto self = weak.lock();
                if (!self) return;
                static_cast<FutureProducer*>(self.get())->Resolve(r);
            });
        });
    }

    void Produce(int64_t) override { TryDeliver(); }

    void OnStop() override { future_ = AsyncValue<T>(); }

private:
    void Resolve(const typename AsyncValue<T>::Result& r) {
        auto guard = this->TryGuard();
        if (!guard) return;
        if (!r) {
            this->FailStream(Error{ErrorCode::FutureFailed,
                fmt::format("future of '{}' failed: {}", this->Name(), r.error().message)});
            return;
        }
        result_ = *r;
        TryDeliver();
    }

    void TryDeliver() {
        if (!result_ || this->Demand() <= 0) return;
        this->Emit(std::move(*result_));
        result_.reset();
        this->CompleteStream();
    }

    AsyncValue<T> future_;
    std::optional<T> result_;
};

template<StreamElement T>
class TickProducer : public TapProducer<T> {
public:
    TickProducer(IEventLoop& loop, std::string name, TickTap<T> tap)
        : TapProducer<T>(loop, std::move(name)), tap_(std::move(tap)), timer_(loop) {}

    uint64_t DroppedTicks() const { return dropped_ticks_; }

protected:
    void OnStart() override {
        timer_.OnTimer([this]() { Tick(); });
        timer_.Start(tap_.initial_delay, tap_.interval);
    }

    // Ticks are driven by the timer, not by demand
    void Produce(int64_t) override {}

    void OnStop() override { timer_.Stop(); }

private:
    void Tick() {
        auto guard = this->TryGuard();
        if (!guard) return;
        if (this->Demand() <= 0) {
            ++dropped_ticks_;
        } else {
            try {
                this->Emit((*tap_.tick)());
            } catch (const std::exception& e) {
                Fail(e.what());
                return;
            } catch (...) {
                Fail("non-standard exception");
                return;
            }
        }
        if (!timer_.IsArmed()) this->CompleteStream();
    }

    void Fail(const char* what) {
        this->FailStream(Error{ErrorCode::ProducerFailed,
            fmt::format("tick function of '{}' threw: {}", this->Name(), what)});
    }

    TickTap<T> tap_;
    Timer timer_;
    uint64_t dropped_ticks_ = 0;
};

// ============================================================================
// Loop binding for external publishers
// ============================================================================

// Re-posts every signal of a foreign publisher onto the loop, so the
// downstream stage only ever runs on its own loop thread.
template<StreamElement T>
class LoopBoundSubscriber : public Subscriber<T>,
                            public std::enable_shared_from_this<LoopBoundSubscriber<T>> {
public:
    LoopBoundSubscriber(IEventLoop& loop, std::shared_ptr<Subscriber<T>> target)
        : loop_(loop.Handle()), target_(std::move(target)) {}

    void OnSubscribe(std::shared_ptr<Subscription> s) override {
        Post([s = std::move(s)](Subscriber<T>& t) mutable { t.OnSubscribe(std::move(s)); });
    }
    void OnNext(T element) override {
        Post([e = std::move(element)](Subscriber<T>& t) mutable { t.OnNext(std::move(e)); });
    }
    void OnError(const Error& e) override {
        Post([e](Subscriber<T>& t) { t.OnError(e); });
    }
    void OnComplete() override {
        Post([](Subscriber<T>& t) { t.OnComplete(); });
    }

private:
    template<typename F>
    void Post(F&& fn) {
        auto self = this->shared_from_this();
        loop_.Defer([self, fn = std::forward<F>(fn)]() mutable { fn(*self->target_); });
    }

    // The foreign publisher may signal after the loop is destroyed
    LoopHandle loop_;
    std::shared_ptr<Subscriber<T>> target_;
};

template<StreamElement T>
class LoopBoundPublisher : public Publisher<T> {
public:
    LoopBoundPublisher(IEventLoop& loop, std::shared_ptr<Publisher<T>> inner)
        : loop_(loop), inner_(std::move(inner)) {}

    std::expected<void, Error> Subscribe(std::shared_ptr<Subscriber<T>> subscriber) override {
        if (!inner_) {
            return std::unexpected(Error{ErrorCode::InvalidState, "null external publisher"});
        }
        return inner_->Subscribe(
            std::make_shared<LoopBoundSubscriber<T>>(loop_, std::move(subscriber)));
    }

private:
    IEventLoop& loop_;
    std::shared_ptr<Publisher<T>> inner_;
};

// ============================================================================
// TapPublisher
// ============================================================================

// Publisher for a built-in tap. Every Subscribe() starts a fresh producer,
// registered with the run's StageRegistry for introspection.
template<StreamElement T>
class TapPublisher : public Publisher<T> {
public:
    TapPublisher(IEventLoop& loop, std::string name, TapDescriptor<T> tap,
                 std::shared_ptr<StageRegistry> registry)
        : loop_(loop), name_(std::move(name)), tap_(std::move(tap)),
          registry_(std::move(registry)) {}

    std::expected<void, Error> Subscribe(std::shared_ptr<Subscriber<T>> subscriber) override {
        if (!subscriber) {
            return std::unexpected(Error{ErrorCode::InvalidState,
                fmt::format("tap '{}': null subscriber", name_)});
        }
        std::string name;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            name = subscriptions_ == 0 ? name_ : fmt::format("{}#{}", name_, subscriptions_);
            ++subscriptions_;
        }
        std::shared_ptr<TapProducer<T>> producer = MakeProducer(std::move(name));
        if (!producer) {
            return std::unexpected(Error{ErrorCode::InvalidState,
                fmt::format("tap '{}' has no built-in producer", name_)});
        }
        if (registry_) registry_->Add(producer);
        producer->Start(std::move(subscriber));
        return {};
    }

    const std::string& Name() const { return name_; }

private:
    std::shared_ptr<TapProducer<T>> MakeProducer(std::string name) {
        return std::visit([&](const auto& tap) -> std::shared_ptr<TapProducer<T>> {
            using Tap = std::decay_t<decltype(tap)>;
            if constexpr (std::is_same_v<Tap, CollectionTap<T>>) {
                return std::make_shared<CollectionProducer<T>>(loop_, std::move(name), tap.elements);
            } else if constexpr (std::is_same_v<Tap, IteratorTap<T>>) {
                return std::make_shared<IteratorProducer<T>>(loop_, std::move(name), tap.cursor);
            } else if constexpr (std::is_same_v<Tap, ThunkTap<T>>) {
                return std::make_shared<ThunkProducer<T>>(loop_, std::move(name), tap.thunk);
            } else if constexpr (std::is_same_v<Tap, FutureTap<T>>) {
                return std::make_shared<FutureProducer<T>>(loop_, std::move(name), tap.future);
            } else if constexpr (std::is_same_v<Tap, TickTap<T>>) {
                return std::make_shared<TickProducer<T>>(loop_, std::move(name), tap);
            } else {
                // External publishers are wrapped by MakeTapPublisher() instead
                return nullptr;
            }
        }, tap_);
    }

    IEventLoop& loop_;
    std::string name_;
    TapDescriptor<T> tap_;
    std::shared_ptr<StageRegistry> registry_;

    std::mutex mutex_;
    uint64_t subscriptions_ = 0;
};

/// Publisher serving `tap` on `loop`. External publishers are re-bound to
/// the loop; every other kind gets a TapPublisher.
template<StreamElement T>
std::shared_ptr<Publisher<T>> MakeTapPublisher(IEventLoop& loop, std::string name,
                                               TapDescriptor<T> tap,
                                               std::shared_ptr<StageRegistry> registry) {
    if (auto* external = std::get_if<PublisherTap<T>>(&tap)) {
        return std::make_shared<LoopBoundPublisher<T>>(loop, external->publisher);
    }
    return std::make_shared<TapPublisher<T>>(loop, std::move(name), std::move(tap),
                                             std::move(registry));
}

}  // namespace flowtap
