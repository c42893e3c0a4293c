// SPDX-License-Identifier: MIT

// src/source.hpp
#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "lib/stream/async_value.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/subscription.hpp"
#include "src/completion_handle.hpp"
#include "src/fanout_stage.hpp"
#include "src/flow.hpp"
#include "src/graph.hpp"
#include "src/materializer.hpp"
#include "src/node.hpp"
#include "src/runnable_flow.hpp"
#include "src/sinks.hpp"
#include "src/tap.hpp"
#include "src/transformer.hpp"

namespace flowtap {

/// Open description with a tap at its head, producing Out.
///
/// Building a Source has no side effects; nothing runs until one of the
/// materializing members (Connect(sink).Run, ToPublisher, ToFanoutPublisher,
/// PublishTo, Consume) is called with a Materializer.
///
/// @code
/// EventLoop loop;
/// Materializer mat(loop);
/// auto handle = Source<int>::FromCollection({1, 2, 3})
///     .Map("double", [](int x) { return x * 2; })
///     .Connect(Sink<int>::Collect())
///     .Run(mat);
/// loop.PollUntil([&] { return handle.IsDone(); });
/// @endcode
template<StreamElement Out>
class Source {
public:
    Source(std::shared_ptr<const SourceNode<Out>> node, GraphDescription graph)
        : node_(std::move(node)), graph_(std::move(graph)) {}

    // =========================================================================
    // Taps
    // =========================================================================

    /// Replays `elements` from the start for every subscriber.
    static Source FromCollection(std::vector<Out> elements, std::string name = "collection") {
        return FromTap(std::move(name),
            CollectionTap<Out>{std::make_shared<const std::vector<Out>>(std::move(elements))});
    }

    /// One cursor shared by every run: the iterator is exhausted once.
    static Source FromIterator(std::shared_ptr<Iterator<Out>> iterator,
                               std::string name = "iterator") {
        return FromTap(std::move(name),
            IteratorTap<Out>{std::make_shared<SharedCursor<Out>>(std::move(iterator))});
    }

    /// Iterator source over [begin, end), which must outlive every run.
    template<std::input_iterator It>
        requires std::same_as<std::iter_value_t<It>, Out>
    static Source FromRange(It begin, It end, std::string name = "range") {
        return FromIterator(std::make_shared<RangeIterator<It>>(std::move(begin), std::move(end)),
                            std::move(name));
    }

    /// Calls `thunk` once per unit of demand until it returns nullopt.
    static Source FromThunk(std::function<std::optional<Out>()> thunk,
                            std::string name = "thunk") {
        return FromTap(std::move(name),
            ThunkTap<Out>{std::make_shared<SharedThunk<Out>>(std::move(thunk))});
    }

    /// At most one element, once `future` resolves.
    static Source FromFuture(AsyncValue<Out> future, std::string name = "future") {
        return FromTap(std::move(name), FutureTap<Out>{std::move(future)});
    }

    /// Calls `tick` every `interval` after `initial_delay`, but only when
    /// there is demand; ticks without demand are dropped. A zero interval
    /// gives a single tick.
    static Source FromTick(std::chrono::milliseconds initial_delay,
                           std::chrono::milliseconds interval,
                           std::function<Out()> tick, std::string name = "tick") {
        return FromTap(std::move(name), TickTap<Out>{
            initial_delay, interval, std::make_shared<std::function<Out()>>(std::move(tick))});
    }

    /// Existing publisher. It may signal from any thread.
    static Source FromPublisher(std::shared_ptr<Publisher<Out>> publisher,
                                std::string name = "publisher") {
        return FromTap(std::move(name), PublisherTap<Out>{std::move(publisher)});
    }

    // =========================================================================
    // Composition
    // =========================================================================

    template<StreamElement Next>
    Source<Next> Connect(const Flow<Out, Next>& flow) const {
        return Source<Next>(std::make_shared<ViaNode<Out, Next>>(node_, flow.Node()),
                            Unwrap(graph_.Concat(flow.Graph()), "Source::Connect"));
    }

    template<typename R>
    RunnableFlow<R> Connect(const Sink<Out, R>& sink) const {
        return RunnableFlow<R>(node_, sink.Node(),
                               Unwrap(graph_.Concat(sink.Graph()), "Source::Connect"));
    }

    template<StreamElement Next>
    Source<Next> Transform(std::string name, TransformerFactory<Out, Next> factory) const {
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
    Source Filter(std::string name, P pred) const {
        return Transform<Out>(std::move(name), filter_factory<Out>(std::move(pred)));
    }

    // =========================================================================
    // Materialization
    // =========================================================================

    /// Run the pipeline and expose its output to exactly one subscriber.
    /// A second Subscribe() fails with ErrorCode::SubscriberRejected.
    std::shared_ptr<Publisher<Out>> ToPublisher(const Materializer& materializer) const {
        MaterializationContext ctx = materializer.NewContext();
        return MaterializeSingle(ctx);
    }

    /// Run the pipeline and share its output between any number of
    /// subscribers. Requires 0 < initial_buffer_size <= max_buffer_size.
    std::expected<std::shared_ptr<Publisher<Out>>, Error> ToFanoutPublisher(
        std::size_t initial_buffer_size, std::size_t max_buffer_size,
        const Materializer& materializer) const {
        if (auto r = ValidateFanoutBuffers(initial_buffer_size, max_buffer_size); !r) {
            return std::unexpected(r.error());
        }
        MaterializationContext ctx = materializer.NewContext();
        std::shared_ptr<Publisher<Out>> upstream = node_->Materialize(ctx);
        auto fanout = FanoutStage<Out>::Create(ctx.Loop(), ctx.StageName("fanout"),
                                               initial_buffer_size, max_buffer_size);
        SubscribeInternal<Out>(*upstream, fanout);
        ctx.Register(fanout);
        return std::shared_ptr<Publisher<Out>>(fanout);
    }

    /// ToFanoutPublisher() with the materializer's default buffer sizes.
    std::expected<std::shared_ptr<Publisher<Out>>, Error> ToFanoutPublisher(
        const Materializer& materializer) const {
        return ToFanoutPublisher(materializer.Settings().fanout_initial_buffer_size,
                                 materializer.Settings().fanout_max_buffer_size, materializer);
    }

    /// Run the pipeline into `subscriber`, which drives demand itself.
    CompletionHandle<Done> PublishTo(std::shared_ptr<Subscriber<Out>> subscriber,
                                     const Materializer& materializer) const {
        return Connect(Sink<Out>::FromSubscriber(std::move(subscriber))).Run(materializer);
    }

    /// Run the pipeline for its side effects, discarding every element.
    CompletionHandle<Done> Consume(const Materializer& materializer) const {
        return Connect(Sink<Out>::Ignore()).Run(materializer);
    }

    const std::shared_ptr<const SourceNode<Out>>& Node() const { return node_; }
    const GraphDescription& Graph() const { return graph_; }

private:
    static Source FromTap(std::string name, TapDescriptor<Out> tap) {
        std::string variant(tap_kind<Out>(tap));
        return Source(std::make_shared<TapNode<Out>>(name, std::move(tap)),
                      GraphDescription::FromTap(std::move(name), std::move(variant)));
    }

    // A tap publisher serves every subscriber; put a single-subscriber
    // stage in front of it when the description has no stage of its own.
    std::shared_ptr<Publisher<Out>> MaterializeSingle(MaterializationContext& ctx) const {
        std::shared_ptr<Publisher<Out>> out = node_->Materialize(ctx);
        if (!graph_.Stages().empty()) return out;
        StageNode<Out, Out> identity("identity", identity_factory<Out>());
        return identity.Attach(std::move(out), ctx);
    }

    std::shared_ptr<const SourceNode<Out>> node_;
    GraphDescription graph_;
};

}  // namespace flowtap
