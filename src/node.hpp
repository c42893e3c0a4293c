// SPDX-License-Identifier: MIT

// src/node.hpp
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "lib/stream/subscription.hpp"
#include "src/completion_handle.hpp"
#include "src/materializer.hpp"
#include "src/tap.hpp"
#include "src/transform_stage.hpp"
#include "src/transformer.hpp"

namespace flowtap {

// Typed, immutable node tree behind Source/Flow/Sink.
//
// Nodes are pure descriptions shared between every value built from them.
// Materializing walks the tree from the tap towards the sink and creates
// one live stage per transform node, each subscribed to the publisher of
// the node before it.

/// Head of an open description.
template<typename Out>
class SourceNode {
public:
    virtual ~SourceNode() = default;

    virtual std::shared_ptr<Publisher<Out>> Materialize(MaterializationContext& ctx) const = 0;
};

/// Middle section; consumes a publisher and returns the section's output.
template<typename In, typename Out>
class FlowNode {
public:
    virtual ~FlowNode() = default;

    virtual std::shared_ptr<Publisher<Out>> Attach(std::shared_ptr<Publisher<In>> upstream,
                                                   MaterializationContext& ctx) const = 0;
};

/// Tail; consumes a publisher and returns the run's handle.
template<typename In, typename R>
class SinkNode {
public:
    virtual ~SinkNode() = default;

    virtual CompletionHandle<R> Attach(std::shared_ptr<Publisher<In>> upstream,
                                       MaterializationContext& ctx) const = 0;
};

/// Subscribe an internal stage; internal publishers never refuse one.
template<typename T>
void SubscribeInternal(Publisher<T>& upstream, std::shared_ptr<Subscriber<T>> subscriber) {
    Unwrap(upstream.Subscribe(std::move(subscriber)), "SubscribeInternal");
}

template<StreamElement T>
class TapNode : public SourceNode<T> {
public:
    TapNode(std::string name, TapDescriptor<T> tap)
        : name_(std::move(name)), tap_(std::move(tap)) {}

    std::shared_ptr<Publisher<T>> Materialize(MaterializationContext& ctx) const override {
        return MakeTapPublisher<T>(ctx.Loop(), ctx.StageName(name_), tap_, ctx.Registry());
    }

private:
    std::string name_;
    TapDescriptor<T> tap_;
};

template<StreamElement In, StreamElement Out>
class ViaNode : public SourceNode<Out> {
public:
    ViaNode(std::shared_ptr<const SourceNode<In>> source,
            std::shared_ptr<const FlowNode<In, Out>> flow)
        : source_(std::move(source)), flow_(std::move(flow)) {}

    std::shared_ptr<Publisher<Out>> Materialize(MaterializationContext& ctx) const override {
        return flow_->Attach(source_->Materialize(ctx), ctx);
    }

private:
    std::shared_ptr<const SourceNode<In>> source_;
    std::shared_ptr<const FlowNode<In, Out>> flow_;
};

template<StreamElement T>
class EmptyFlowNode : public FlowNode<T, T> {
public:
    std::shared_ptr<Publisher<T>> Attach(std::shared_ptr<Publisher<T>> upstream,
                                         MaterializationContext&) const override {
        return upstream;
    }
};

template<StreamElement In, StreamElement Out>
class StageNode : public FlowNode<In, Out> {
public:
    StageNode(std::string name, TransformerFactory<In, Out> factory)
        : name_(std::move(name)), factory_(std::move(factory)) {}

    std::shared_ptr<Publisher<Out>> Attach(std::shared_ptr<Publisher<In>> upstream,
                                           MaterializationContext& ctx) const override {
        auto stage = TransformStage<In, Out>::Create(
            ctx.Loop(), ctx.StageName(name_), factory_(), ctx.Settings().input_buffer_size);
        SubscribeInternal<In>(*upstream, stage);
        ctx.Register(stage);
        return stage;
    }

private:
    std::string name_;
    TransformerFactory<In, Out> factory_;
};

template<StreamElement A, StreamElement B, StreamElement C>
class ChainNode : public FlowNode<A, C> {
public:
    ChainNode(std::shared_ptr<const FlowNode<A, B>> first,
              std::shared_ptr<const FlowNode<B, C>> second)
        : first_(std::move(first)), second_(std::move(second)) {}

    std::shared_ptr<Publisher<C>> Attach(std::shared_ptr<Publisher<A>> upstream,
                                         MaterializationContext& ctx) const override {
        return second_->Attach(first_->Attach(std::move(upstream), ctx), ctx);
    }

private:
    std::shared_ptr<const FlowNode<A, B>> first_;
    std::shared_ptr<const FlowNode<B, C>> second_;
};

template<StreamElement In, StreamElement Mid, typename R>
class PrefixedSinkNode : public SinkNode<In, R> {
public:
    PrefixedSinkNode(std::shared_ptr<const FlowNode<In, Mid>> flow,
                     std::shared_ptr<const SinkNode<Mid, R>> sink)
        : flow_(std::move(flow)), sink_(std::move(sink)) {}

    CompletionHandle<R> Attach(std::shared_ptr<Publisher<In>> upstream,
                               MaterializationContext& ctx) const override {
        return sink_->Attach(flow_->Attach(std::move(upstream), ctx), ctx);
    }

private:
    std::shared_ptr<const FlowNode<In, Mid>> flow_;
    std::shared_ptr<const SinkNode<Mid, R>> sink_;
};

}  // namespace flowtap
