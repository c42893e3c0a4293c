// SPDX-License-Identifier: MIT

// tests/transform_stage_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/stage.hpp"
#include "recording_subscriber.hpp"
#include "src/tap.hpp"
#include "src/transform_stage.hpp"
#include "src/transformer.hpp"

using namespace flowtap;
using namespace std::chrono_literals;

namespace {

// Emits each element twice and a trailing sentinel on completion
class DuplicateTransformer : public Transformer<int, int> {
public:
    explicit DuplicateTransformer(int* cleanups) : cleanups_(cleanups) {}

    std::vector<int> OnNext(int v) override { return {v, v}; }
    std::vector<int> OnTermination() override { return {-1}; }
    void Cleanup() override { ++*cleanups_; }

private:
    int* cleanups_;
};

// Passes elements through until it has seen `limit` of them
class TakeTransformer : public Transformer<int, int> {
public:
    explicit TakeTransformer(int limit) : limit_(limit) {}

    std::vector<int> OnNext(int v) override {
        ++seen_;
        return {v};
    }
    bool IsComplete() const override { return seen_ >= limit_; }

private:
    int limit_;
    int seen_ = 0;
};

class ThrowingTransformer : public Transformer<int, int> {
public:
    std::vector<int> OnNext(int v) override {
        if (v == 3) throw std::invalid_argument("three is not allowed");
        return {v};
    }
};

class OpaqueThrowTransformer : public Transformer<int, int> {
public:
    struct Opaque {};

    std::vector<int> OnNext(int v) override {
        if (v == 2) throw Opaque{};
        return {v};
    }
};

}  // namespace

class TransformStageTest : public ::testing::Test {
protected:
    // Infinite counting thunk upstream: 1, 2, 3, ...
    std::shared_ptr<Publisher<int>> CountingUpstream() {
        return MakeTapPublisher<int>(loop, "counter",
            ThunkTap<int>{std::make_shared<SharedThunk<int>>(
                [this]() -> std::optional<int> { return ++calls; })},
            registry);
    }

    std::shared_ptr<Publisher<int>> CollectionUpstream(std::vector<int> v) {
        return MakeTapPublisher<int>(loop, "collection",
            CollectionTap<int>{std::make_shared<const std::vector<int>>(std::move(v))}, registry);
    }

    template<typename T>
    std::shared_ptr<TransformStage<int, int>> Stage(std::unique_ptr<T> t, int64_t buffer = 16) {
        auto stage = TransformStage<int, int>::Create(loop, "stage", std::move(t), buffer);
        return stage;
    }

    void Settle() { loop.PollUntil([] { return false; }, 20ms); }

    StageState UpstreamState() { return registry->Snapshot().at(0).state; }

    EpollEventLoop loop;
    std::shared_ptr<StageRegistry> registry = std::make_shared<StageRegistry>();
    int calls = 0;
};

TEST_F(TransformStageTest, NoDemandWithoutDownstream) {
    auto stage = Stage(std::make_unique<IdentityTransformer<int>>());
    auto upstream = CountingUpstream();
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    Settle();
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(stage->UpstreamOutstanding(), 0);
    EXPECT_EQ(stage->State(), StageState::Idle);
}

TEST_F(TransformStageTest, RequestsOnlyWhatDownstreamAsked) {
    auto stage = Stage(std::make_unique<IdentityTransformer<int>>());
    auto upstream = CountingUpstream();
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    auto sub = std::make_shared<RecordingSubscriber<int>>(3);
    ASSERT_TRUE(stage->Subscribe(sub).has_value());

    ASSERT_TRUE(loop.PollUntil([&] { return sub->received.size() == 3; }, 2s));
    Settle();
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sub->received, (std::vector<int>{1, 2, 3}));

    sub->Request(2);
    ASSERT_TRUE(loop.PollUntil([&] { return sub->received.size() == 5; }, 2s));
    Settle();
    EXPECT_EQ(calls, 5);
    sub->Cancel();
}

TEST_F(TransformStageTest, OutstandingCappedByInputBuffer) {
    auto stage = Stage(std::make_unique<IdentityTransformer<int>>(), 2);
    auto upstream = CollectionUpstream({1, 2, 3, 4, 5});
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    auto sub = std::make_shared<RecordingSubscriber<int>>(kUnboundedDemand);
    ASSERT_TRUE(stage->Subscribe(sub).has_value());
    loop.Poll(0);
    loop.Poll(0);
    EXPECT_LE(stage->UpstreamOutstanding(), 2);

    ASSERT_TRUE(loop.PollUntil([&] { return sub->completed; }, 2s));
    EXPECT_EQ(sub->received, (std::vector<int>{1, 2, 3, 4, 5}));
    EXPECT_EQ(stage->State(), StageState::Completed);
}

TEST_F(TransformStageTest, ExpansionHonoursDownstreamDemand) {
    int cleanups = 0;
    auto stage = Stage(std::make_unique<DuplicateTransformer>(&cleanups));
    auto upstream = CollectionUpstream({1, 2});
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    auto sub = std::make_shared<RecordingSubscriber<int>>(3);
    ASSERT_TRUE(stage->Subscribe(sub).has_value());
    Settle();
    EXPECT_EQ(sub->received, (std::vector<int>{1, 1, 2}));
    EXPECT_FALSE(sub->completed);

    sub->Request(10);
    ASSERT_TRUE(loop.PollUntil([&] { return sub->completed; }, 2s));
    EXPECT_EQ(sub->received, (std::vector<int>{1, 1, 2, 2, -1}));

    Settle();
    EXPECT_TRUE(stage->IsReleased());
    EXPECT_EQ(cleanups, 1);
}

TEST_F(TransformStageTest, SecondSubscriberRejected) {
    auto stage = Stage(std::make_unique<IdentityTransformer<int>>());
    auto upstream = CollectionUpstream({1, 2, 3});
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    auto first = std::make_shared<RecordingSubscriber<int>>(kUnboundedDemand);
    auto second = std::make_shared<RecordingSubscriber<int>>(kUnboundedDemand);
    ASSERT_TRUE(stage->Subscribe(first).has_value());
    auto rejected = stage->Subscribe(second);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::SubscriberRejected);

    ASSERT_TRUE(loop.PollUntil([&] { return first->completed; }, 2s));
    EXPECT_EQ(first->received, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(second->subscribe_calls, 1);
    ASSERT_TRUE(second->error.has_value());
    EXPECT_EQ(second->error->code, ErrorCode::SubscriberRejected);
    EXPECT_TRUE(second->received.empty());
}

TEST_F(TransformStageTest, ThrowFailsDownstreamAndCancelsUpstream) {
    auto stage = Stage(std::make_unique<ThrowingTransformer>());
    auto upstream = CountingUpstream();
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    auto sub = std::make_shared<RecordingSubscriber<int>>(kUnboundedDemand);
    ASSERT_TRUE(stage->Subscribe(sub).has_value());

    ASSERT_TRUE(loop.PollUntil([&] { return sub->error.has_value(); }, 2s));
    EXPECT_EQ(sub->error->code, ErrorCode::StageFailed);
    EXPECT_NE(sub->error->message.find("three is not allowed"), std::string::npos);
    EXPECT_EQ(stage->State(), StageState::Failed);

    ASSERT_TRUE(loop.PollUntil([&] { return UpstreamState() == StageState::Cancelled; }, 2s));
    int calls_at_cancel = calls;
    Settle();
    EXPECT_EQ(calls, calls_at_cancel);
    EXPECT_EQ(sub->after_terminal, 0);
}

TEST_F(TransformStageTest, EarlyCompletionCancelsUpstream) {
    auto stage = Stage(std::make_unique<TakeTransformer>(2));
    auto upstream = CountingUpstream();
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    auto sub = std::make_shared<RecordingSubscriber<int>>(kUnboundedDemand);
    ASSERT_TRUE(stage->Subscribe(sub).has_value());

    ASSERT_TRUE(loop.PollUntil([&] { return sub->completed; }, 2s));
    EXPECT_EQ(sub->received, (std::vector<int>{1, 2}));
    ASSERT_TRUE(loop.PollUntil([&] { return UpstreamState() == StageState::Cancelled; }, 2s));
}

TEST_F(TransformStageTest, DownstreamCancelPropagatesUpstream) {
    auto stage = Stage(std::make_unique<IdentityTransformer<int>>());
    auto upstream = CountingUpstream();
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    auto sub = std::make_shared<RecordingSubscriber<int>>(2);
    ASSERT_TRUE(stage->Subscribe(sub).has_value());
    ASSERT_TRUE(loop.PollUntil([&] { return sub->received.size() == 2; }, 2s));

    sub->Cancel();
    ASSERT_TRUE(loop.PollUntil([&] { return stage->IsReleased(); }, 2s));
    EXPECT_EQ(stage->State(), StageState::Cancelled);
    ASSERT_TRUE(loop.PollUntil([&] { return UpstreamState() == StageState::Cancelled; }, 2s));

    int calls_at_cancel = calls;
    Settle();
    EXPECT_EQ(calls, calls_at_cancel);
}

TEST_F(TransformStageTest, UpstreamFailureReachesSubscriber) {
    auto stage = Stage(std::make_unique<IdentityTransformer<int>>());
    auto upstream = MakeTapPublisher<int>(loop, "broken",
        FutureTap<int>{AsyncValue<int>::Failed(Error{ErrorCode::ProducerFailed, "x"})}, registry);
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    auto sub = std::make_shared<RecordingSubscriber<int>>(1);
    ASSERT_TRUE(stage->Subscribe(sub).has_value());
    ASSERT_TRUE(loop.PollUntil([&] { return sub->error.has_value(); }, 2s));
    EXPECT_EQ(sub->error->code, ErrorCode::FutureFailed);
    EXPECT_EQ(stage->State(), StageState::Failed);
}

TEST_F(TransformStageTest, NonStandardThrowFailsStage) {
    auto stage = Stage(std::make_unique<OpaqueThrowTransformer>());
    auto upstream = CountingUpstream();
    ASSERT_TRUE(upstream->Subscribe(stage).has_value());

    auto sub = std::make_shared<RecordingSubscriber<int>>(kUnboundedDemand);
    ASSERT_TRUE(stage->Subscribe(sub).has_value());

    ASSERT_TRUE(loop.PollUntil([&] { return sub->error.has_value(); }, 2s));
    EXPECT_EQ(sub->error->code, ErrorCode::StageFailed);
    EXPECT_EQ(sub->received, (std::vector<int>{1}));
    EXPECT_EQ(stage->State(), StageState::Failed);
    ASSERT_TRUE(loop.PollUntil([&] { return UpstreamState() == StageState::Cancelled; }, 2s));
}
