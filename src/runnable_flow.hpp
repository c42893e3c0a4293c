// SPDX-License-Identifier: MIT

// src/runnable_flow.hpp
#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "src/completion_handle.hpp"
#include "src/graph.hpp"
#include "src/materializer.hpp"
#include "src/node.hpp"

namespace flowtap {

/// Closed description: a tap, its stages and a sink. Running it is the only
/// thing it can do; it has no Connect(). Every Run() builds an independent
/// network, so one RunnableFlow may be run any number of times,
/// concurrently and on different materializers.
template<typename R>
class RunnableFlow {
public:
    template<typename Out>
    RunnableFlow(std::shared_ptr<const SourceNode<Out>> source,
                 std::shared_ptr<const SinkNode<Out, R>> sink,
                 GraphDescription graph)
        : materialize_([source = std::move(source), sink = std::move(sink)](
                           MaterializationContext& ctx) {
              return sink->Attach(source->Materialize(ctx), ctx);
          }),
          graph_(std::move(graph)) {}

    /// Materialize and start the pipeline. Elements start flowing once the
    /// materializer's loop is polled.
    CompletionHandle<R> Run(const Materializer& materializer) const {
        MaterializationContext ctx = materializer.NewContext();
        return materialize_(ctx);
    }

    const GraphDescription& Graph() const { return graph_; }

private:
    std::function<CompletionHandle<R>(MaterializationContext&)> materialize_;
    GraphDescription graph_;
};

}  // namespace flowtap
