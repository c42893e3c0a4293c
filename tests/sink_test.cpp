// SPDX-License-Identifier: MIT

// tests/sink_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

#include "lib/stream/demand_channel.hpp"
#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/sink.hpp"

using namespace flowtap;

namespace {

struct NullListener : DemandListener {
    void OnDemand() override {}
    void OnCancel() override { ++cancel_calls; }
    int cancel_calls = 0;
};

}  // namespace

TEST(CallbackSubscriberTest, ForwardsSignals) {
    EpollEventLoop loop;

    std::vector<int> received;
    bool completed = false;
    auto sub = std::make_shared<CallbackSubscriber<int>>(
        [&](int v) { received.push_back(v); },
        [](const Error&) {},
        [&]() { completed = true; });
    auto listener = std::make_shared<NullListener>();
    auto channel = DemandChannel<int>::Create(loop, sub, listener);
    channel->Open();
    loop.Poll(0);

    EXPECT_TRUE(sub->IsSubscribed());
    EXPECT_EQ(channel->Demand(), kUnboundedDemand);

    channel->Emit(1);
    channel->Emit(2);
    channel->Complete();
    loop.Poll(0);

    EXPECT_EQ(received, (std::vector<int>{1, 2}));
    EXPECT_TRUE(completed);
}

TEST(CallbackSubscriberTest, ZeroInitialRequestWaitsForOwner) {
    EpollEventLoop loop;

    auto sub = std::make_shared<CallbackSubscriber<int>>(
        [](int) {}, [](const Error&) {}, []() {}, 0);
    auto channel = DemandChannel<int>::Create(loop, sub, std::make_shared<NullListener>());

    sub->Request(3);  // Ignored before OnSubscribe
    channel->Open();
    loop.Poll(0);
    EXPECT_EQ(channel->Demand(), 0);

    sub->Request(3);
    EXPECT_EQ(channel->Demand(), 3);
}

TEST(CallbackSubscriberTest, InvalidateCancelsAndSilences) {
    EpollEventLoop loop;

    int calls = 0;
    std::optional<Error> error;
    auto sub = std::make_shared<CallbackSubscriber<int>>(
        [&](int) { ++calls; },
        [&](const Error& e) { error = e; },
        []() {});
    auto listener = std::make_shared<NullListener>();
    auto channel = DemandChannel<int>::Create(loop, sub, listener);
    channel->Open();
    loop.Poll(0);

    channel->Emit(1);
    sub->Invalidate();
    loop.Poll(0);

    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(listener->cancel_calls, 1);
}
