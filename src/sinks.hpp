// SPDX-License-Identifier: MIT

// src/sinks.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/async_value.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/stage.hpp"
#include "lib/stream/subscription.hpp"
#include "src/completion_handle.hpp"
#include "src/graph.hpp"
#include "src/materializer.hpp"
#include "src/node.hpp"

namespace flowtap {

/// Per-run accumulator of a sink. A fresh instance is created for every
/// run; it only ever runs on that run's loop thread.
template<typename In, typename R>
class SinkLogic {
public:
    virtual ~SinkLogic() = default;

    virtual void OnNext(In element) = 0;

    /// Result of the run once upstream completed.
    virtual R Finish() = 0;
};

template<typename In, typename R>
using SinkLogicFactory = std::function<std::unique_ptr<SinkLogic<In, R>>()>;

template<typename In>
class CollectLogic : public SinkLogic<In, std::vector<In>> {
public:
    void OnNext(In element) override { out_.push_back(std::move(element)); }
    std::vector<In> Finish() override { return std::move(out_); }

private:
    std::vector<In> out_;
};

template<typename In, typename Acc, typename F>
class FoldLogic : public SinkLogic<In, Acc> {
public:
    FoldLogic(Acc zero, F fn) : acc_(std::move(zero)), fn_(std::move(fn)) {}

    void OnNext(In element) override { acc_ = fn_(std::move(acc_), std::move(element)); }
    Acc Finish() override { return std::move(acc_); }

private:
    Acc acc_;
    F fn_;
};

template<typename In, typename F>
class ForeachLogic : public SinkLogic<In, Done> {
public:
    explicit ForeachLogic(F fn) : fn_(std::move(fn)) {}

    void OnNext(In element) override { fn_(std::move(element)); }
    Done Finish() override { return Done{}; }

private:
    F fn_;
};

template<typename In>
class IgnoreLogic : public SinkLogic<In, Done> {
public:
    void OnNext(In) override {}
    Done Finish() override { return Done{}; }
};

// SinkStage<In, R> - terminal live stage driving one SinkLogic.
//
// Requests `batch` elements up front and tops the outstanding demand back
// up to `batch` whenever it falls to half of it or below.
//
// Cancel() may be called from any thread; the rest runs on the loop.
template<StreamElement In, typename R>
class SinkStage
    : public Subscriber<In>,
      public StageBase<SinkStage<In, R>>,
      public std::enable_shared_from_this<SinkStage<In, R>> {
    struct PrivateTag {};
    using Base = StageBase<SinkStage<In, R>>;
    friend Base;

public:
    static std::shared_ptr<SinkStage> Create(IEventLoop& loop, std::string name,
                                             std::unique_ptr<SinkLogic<In, R>> logic,
                                             int64_t batch) {
        return std::make_shared<SinkStage>(PrivateTag{}, loop, std::move(name),
                                           std::move(logic), batch);
    }

    SinkStage(PrivateTag, IEventLoop& loop, std::string name,
              std::unique_ptr<SinkLogic<In, R>> logic, int64_t batch)
        : Base(loop, std::move(name)),
          logic_(std::move(logic)),
          batch_(std::max<int64_t>(batch, 1)),
          handle_(loop.Handle()) {}

    AsyncValue<R> Result() const { return result_; }

    void OnSubscribe(std::shared_ptr<Subscription> subscription) override {
        if (upstream_ || this->IsTerminated()) {
            subscription->Cancel();
            return;
        }
        upstream_ = std::move(subscription);
        Refill();
    }

    void OnNext(In element) override {
        auto guard = this->TryGuard();
        if (!guard) return;
        if (outstanding_ <= 0) {
            Fail(Error{ErrorCode::InvalidState,
                fmt::format("sink '{}' received an element it did not request", this->Name())});
            return;
        }
        --outstanding_;
        ++received_;
        this->TransitionTo(StageState::Processing);
        try {
            logic_->OnNext(std::move(element));
        } catch (const std::exception& e) {
            Fail(Error{ErrorCode::StageFailed,
                fmt::format("sink '{}' failed: {}", this->Name(), e.what())});
            return;
        } catch (...) {
            Fail(Error{ErrorCode::StageFailed,
                fmt::format("sink '{}' failed with a non-standard exception", this->Name())});
            return;
        }
        Refill();
    }

    void OnError(const Error& e) override {
        auto guard = this->TryGuard();
        if (!guard) return;
        upstream_.reset();
        result_.TryFail(e);
        this->Terminate(StageState::Failed);
    }

    void OnComplete() override {
        auto guard = this->TryGuard();
        if (!guard) return;
        upstream_.reset();
        this->TransitionTo(StageState::Completing);
        try {
            result_.TrySet(logic_->Finish());
        } catch (const std::exception& e) {
            result_.TryFail(Error{ErrorCode::StageFailed,
                fmt::format("sink '{}' failed on completion: {}", this->Name(), e.what())});
            this->Terminate(StageState::Failed);
            return;
        } catch (...) {
            result_.TryFail(Error{ErrorCode::StageFailed,
                fmt::format("sink '{}' failed on completion with a non-standard exception",
                            this->Name())});
            this->Terminate(StageState::Failed);
            return;
        }
        this->Terminate(StageState::Completed);
    }

    /// Cancel the run from this end. A no-op once the loop is gone.
    void Cancel() {
        auto self = this->shared_from_this();
        handle_.Defer([self]() {
            auto guard = self->TryGuard();
            if (!guard) return;
            self->CancelUpstream();
            self->result_.TryFail(Error{ErrorCode::Cancelled,
                fmt::format("run cancelled at sink '{}'", self->Name())});
            self->Terminate(StageState::Cancelled);
        });
    }

    int64_t Received() const { return received_; }
    int64_t Outstanding() const { return outstanding_; }

private:
    void Refill() {
        if (!upstream_ || this->IsTerminated()) return;
        if (outstanding_ <= batch_ / 2) {
            int64_t n = batch_ - outstanding_;
            outstanding_ += n;
            upstream_->Request(n);
        }
        this->TransitionTo(StageState::Demanding);
    }

    void Fail(Error e) {
        CancelUpstream();
        result_.TryFail(std::move(e));
        this->Terminate(StageState::Failed);
    }

    void CancelUpstream() {
        outstanding_ = 0;
        if (auto up = std::move(upstream_)) up->Cancel();
    }

    void DoRelease() {
        upstream_.reset();
        logic_.reset();
    }

    std::unique_ptr<SinkLogic<In, R>> logic_;
    int64_t batch_;
    std::shared_ptr<Subscription> upstream_;
    int64_t outstanding_ = 0;
    int64_t received_ = 0;
    AsyncValue<R> result_;
    LoopHandle handle_;
};

// ForwardingSubscriber<In> - hands a run's output to a caller-supplied
// subscriber, which keeps full control of demand. Resolves the run's
// handle when the caller's subscriber sees a terminal signal.
template<StreamElement In>
class ForwardingSubscriber
    : public Subscriber<In>,
      public LiveStage,
      public std::enable_shared_from_this<ForwardingSubscriber<In>> {
public:
    ForwardingSubscriber(IEventLoop& loop, std::string name,
                         std::shared_ptr<Subscriber<In>> target)
        : loop_(loop.Handle()), name_(std::move(name)), target_(std::move(target)) {}

    AsyncValue<Done> Result() const { return result_; }

    void OnSubscribe(std::shared_ptr<Subscription> subscription) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subscription_ = subscription;
        }
        state_.store(StageState::Demanding, std::memory_order_release);
        target_->OnSubscribe(std::move(subscription));
    }

    void OnNext(In element) override {
        if (is_terminal_state(State())) return;
        target_->OnNext(std::move(element));
    }

    void OnError(const Error& e) override {
        if (!Finish(StageState::Failed)) return;
        target_->OnError(e);
        result_.TryFail(e);
    }

    void OnComplete() override {
        if (!Finish(StageState::Completed)) return;
        target_->OnComplete();
        result_.TrySet(Done{});
    }

    void Cancel() {
        auto self = this->shared_from_this();
        loop_.Defer([self]() {
            if (!self->Finish(StageState::Cancelled)) return;
            std::shared_ptr<Subscription> s;
            {
                std::lock_guard<std::mutex> lock(self->mutex_);
                s = std::move(self->subscription_);
            }
            if (s) s->Cancel();
            self->result_.TryFail(Error{ErrorCode::Cancelled,
                fmt::format("run cancelled at sink '{}'", self->name_)});
        });
    }

    const std::string& Name() const override { return name_; }
    StageState State() const override { return state_.load(std::memory_order_acquire); }

private:
    bool Finish(StageState terminal) {
        StageState current = state_.load(std::memory_order_acquire);
        while (!is_terminal_state(current)) {
            if (state_.compare_exchange_weak(current, terminal, std::memory_order_acq_rel)) {
                return true;
            }
        }
        return false;
    }

    LoopHandle loop_;
    std::string name_;
    std::shared_ptr<Subscriber<In>> target_;
    std::atomic<StageState> state_{StageState::Idle};
    std::mutex mutex_;
    std::shared_ptr<Subscription> subscription_;
    AsyncValue<Done> result_;
};

template<StreamElement In, typename R>
class LogicSinkNode : public SinkNode<In, R> {
public:
    LogicSinkNode(std::string name, SinkLogicFactory<In, R> factory)
        : name_(std::move(name)), factory_(std::move(factory)) {}

    CompletionHandle<R> Attach(std::shared_ptr<Publisher<In>> upstream,
                               MaterializationContext& ctx) const override {
        auto stage = SinkStage<In, R>::Create(ctx.Loop(), ctx.StageName(name_), factory_(),
                                              ctx.Settings().input_buffer_size);
        SubscribeInternal<In>(*upstream, stage);
        ctx.Register(stage);
        std::weak_ptr<SinkStage<In, R>> weak = stage;
        return CompletionHandle<R>(stage->Result(), [weak]() {
            if (auto s = weak.lock()) s->Cancel();
        }, ctx.Registry());
    }

private:
    std::string name_;
    SinkLogicFactory<In, R> factory_;
};

template<StreamElement In>
class SubscriberSinkNode : public SinkNode<In, Done> {
public:
    SubscriberSinkNode(std::string name, std::shared_ptr<Subscriber<In>> target)
        : name_(std::move(name)), target_(std::move(target)) {}

    CompletionHandle<Done> Attach(std::shared_ptr<Publisher<In>> upstream,
                                  MaterializationContext& ctx) const override {
        auto forward = std::make_shared<ForwardingSubscriber<In>>(
            ctx.Loop(), ctx.StageName(name_), target_);
        SubscribeInternal<In>(*upstream, forward);
        ctx.Register(forward);
        std::weak_ptr<ForwardingSubscriber<In>> weak = forward;
        return CompletionHandle<Done>(forward->Result(), [weak]() {
            if (auto f = weak.lock()) f->Cancel();
        }, ctx.Registry());
    }

private:
    std::string name_;
    std::shared_ptr<Subscriber<In>> target_;
};

/// Terminating consumer of a description, producing a value of type R per run.
///
/// @code
/// auto sum = Sink<int>::Fold(0, [](int acc, int x) { return acc + x; });
/// auto handle = Source<int>::FromCollection({1, 2, 3}).Connect(sum).Run(mat);
/// @endcode
template<StreamElement In, typename R = Done>
class Sink {
public:
    Sink(std::shared_ptr<const SinkNode<In, R>> node, GraphDescription graph)
        : node_(std::move(node)), graph_(std::move(graph)) {}

    static Sink<In, std::vector<In>> Collect(std::string name = "collect") {
        return Make<std::vector<In>>(std::move(name), "collect", [] {
            return std::make_unique<CollectLogic<In>>();
        });
    }

    template<typename Acc, typename F>
        requires std::invocable<F, Acc, In>
    static Sink<In, Acc> Fold(Acc zero, F fn, std::string name = "fold") {
        return Make<Acc>(std::move(name), "fold", [zero = std::move(zero), fn = std::move(fn)] {
            return std::make_unique<FoldLogic<In, Acc, F>>(zero, fn);
        });
    }

    template<typename F>
        requires std::invocable<F, In>
    static Sink<In, Done> Foreach(F fn, std::string name = "foreach") {
        return Make<Done>(std::move(name), "foreach", [fn = std::move(fn)] {
            return std::make_unique<ForeachLogic<In, F>>(fn);
        });
    }

    static Sink<In, Done> Ignore(std::string name = "ignore") {
        return Make<Done>(std::move(name), "ignore", [] {
            return std::make_unique<IgnoreLogic<In>>();
        });
    }

    /// Hand the run's output to `subscriber`, which drives demand itself.
    static Sink<In, Done> FromSubscriber(std::shared_ptr<Subscriber<In>> subscriber,
                                         std::string name = "subscriber") {
        GraphDescription graph = Unwrap(GraphDescription{}.Close(name, "subscriber"), "Sink");
        return Sink<In, Done>(
            std::make_shared<SubscriberSinkNode<In>>(std::move(name), std::move(subscriber)),
            std::move(graph));
    }

    const std::shared_ptr<const SinkNode<In, R>>& Node() const { return node_; }

    /// Tap-less closed description: prefix stages, then the sink.
    const GraphDescription& Graph() const { return graph_; }

private:
    template<typename R2>
    static Sink<In, R2> Make(std::string name, std::string variant,
                             SinkLogicFactory<In, R2> factory) {
        GraphDescription graph = Unwrap(GraphDescription{}.Close(name, std::move(variant)), "Sink");
        return Sink<In, R2>(
            std::make_shared<LogicSinkNode<In, R2>>(std::move(name), std::move(factory)),
            std::move(graph));
    }

    std::shared_ptr<const SinkNode<In, R>> node_;
    GraphDescription graph_;
};

}  // namespace flowtap
