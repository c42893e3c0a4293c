// SPDX-License-Identifier: MIT

// src/flow.hpp
#pragma once

#include <concepts>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "lib/stream/subscription.hpp"
#include "src/graph.hpp"
#include "src/materializer.hpp"
#include "src/node.hpp"
#include "src/sinks.hpp"
#include "src/transformer.hpp"

namespace flowtap {

/// Open middle section of a pipeline, from In to Out. Immutable: every
/// combinator returns a new Flow and leaves the receiver untouched.
///
/// @code
/// auto parse = Flow<std::string>::Empty()
///     .Map("parse", [](std::string s) { return std::stoi(s); })
///     .Filter("positive", [](const int& x) { return x > 0; });
/// @endcode
template<StreamElement In, StreamElement Out = In>
class Flow {
public:
    Flow(std::shared_ptr<const FlowNode<In, Out>> node, GraphDescription graph)
        : node_(std::move(node)), graph_(std::move(graph)) {}

    /// Flow that passes elements through unchanged and creates no stage.
    static Flow<In, In> Empty() {
        return Flow<In, In>(std::make_shared<EmptyFlowNode<In>>(), GraphDescription{});
    }

    /// Single-stage flow running a fresh transformer per run.
    static Flow<In, Out> FromTransformer(std::string name, TransformerFactory<In, Out> factory) {
        GraphDescription graph = Unwrap(GraphDescription{}.Append(name), "Flow");
        return Flow<In, Out>(
            std::make_shared<StageNode<In, Out>>(std::move(name), std::move(factory)),
            std::move(graph));
    }

    template<StreamElement Next>
    Flow<In, Next> Connect(const Flow<Out, Next>& next) const {
        return Flow<In, Next>(
            std::make_shared<ChainNode<In, Out, Next>>(node_, next.Node()),
            Unwrap(graph_.Concat(next.Graph()), "Flow::Connect"));
    }

    /// Prefix `sink` with this flow's stages.
    template<typename R>
    Sink<In, R> Connect(const Sink<Out, R>& sink) const {
        return Sink<In, R>(
            std::make_shared<PrefixedSinkNode<In, Out, R>>(node_, sink.Node()),
            Unwrap(graph_.Concat(sink.Graph()), "Flow::Connect"));
    }

    template<StreamElement Next>
    Flow<In, Next> Transform(std::string name, TransformerFactory<Out, Next> factory) const {
        return Connect(Flow<Out, Next>::FromTransformer(std::move(name), std::move(factory)));
    }

    template<typename F>
        requires std::invocable<F, Out>
    auto Map(std::string name, F fn) const {
        using Next = std::decay_t<std::invoke_result_t<F, Out>>;
        return Transform<Next>(std::move(name), map_factory<Out>(std::move(fn)));
    }

    template<typename P>
        requires std::predicate<P, const Out&>
    Flow<In, Out> Filter(std::string name, P pred) const {
        return Transform<Out>(std::move(name), filter_factory<Out>(std::move(pred)));
    }

    const std::shared_ptr<const FlowNode<In, Out>>& Node() const { return node_; }
    const GraphDescription& Graph() const { return graph_; }

private:
    std::shared_ptr<const FlowNode<In, Out>> node_;
    GraphDescription graph_;
};

}  // namespace flowtap
