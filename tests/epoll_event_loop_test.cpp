// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/event_loop.hpp"

using namespace flowtap;
using namespace std::chrono_literals;

TEST(EpollEventLoopTest, DeferredCallbacksRunInOrder) {
    EpollEventLoop loop;

    std::vector<int> order;
    loop.Defer([&]() { order.push_back(1); });
    loop.Defer([&]() { order.push_back(2); });
    loop.Defer([&]() { order.push_back(3); });

    loop.Poll(0);

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EpollEventLoopTest, DeferFromCallbackRunsOnLaterIteration) {
    EpollEventLoop loop;

    std::vector<int> order;
    loop.Defer([&]() {
        order.push_back(1);
        loop.Defer([&]() { order.push_back(3); });
    });
    loop.Defer([&]() { order.push_back(2); });

    // The nested callback runs in the trailing dispatch of the same Poll
    loop.Poll(0);

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EpollEventLoopTest, ScheduleFiresAfterDelay) {
    EpollEventLoop loop;

    bool fired = false;
    auto start = std::chrono::steady_clock::now();
    loop.Schedule(20ms, [&]() { fired = true; });
    EXPECT_EQ(loop.PendingTimers(), 1u);

    ASSERT_TRUE(loop.PollUntil([&] { return fired; }, 2s));

    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
    EXPECT_EQ(loop.PendingTimers(), 0u);
}

TEST(EpollEventLoopTest, ZeroDelayScheduleStillFires) {
    EpollEventLoop loop;

    bool fired = false;
    loop.Schedule(0ms, [&]() { fired = true; });

    EXPECT_TRUE(loop.PollUntil([&] { return fired; }, 1s));
}

TEST(EpollEventLoopTest, IsInEventLoopThread) {
    EpollEventLoop loop;

    bool inside = false;
    loop.Defer([&]() { inside = loop.IsInEventLoopThread(); });
    loop.Poll(0);
    EXPECT_TRUE(inside);

    bool other_thread = true;
    std::thread t([&]() { other_thread = loop.IsInEventLoopThread(); });
    t.join();
    EXPECT_FALSE(other_thread);
}

TEST(EpollEventLoopTest, DeferFromOtherThreadWakesLoop) {
    EpollEventLoop loop;

    std::atomic<bool> ran{false};
    std::thread runner([&]() { loop.Run(); });

    // Give Run() a chance to block in epoll_wait
    std::this_thread::sleep_for(20ms);
    loop.Defer([&]() {
        ran = true;
        loop.Stop();
    });

    runner.join();
    EXPECT_TRUE(ran);
}

TEST(EpollEventLoopTest, PollUntilTimesOut) {
    EpollEventLoop loop;

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(loop.PollUntil([] { return false; }, 30ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
}

TEST(EpollEventLoopTest, DestroyWithPendingTimers) {
    bool fired = false;
    {
        EpollEventLoop loop;
        loop.Schedule(1000ms, [&]() { fired = true; });
        EXPECT_EQ(loop.PendingTimers(), 1u);
    }
    EXPECT_FALSE(fired);
}

TEST(EventLoopTest, WrapperDispatchesThroughInterface) {
    EventLoop loop;
    IEventLoop& iface = loop;

    int count = 0;
    iface.Defer([&]() { ++count; });
    iface.Schedule(5ms, [&]() { ++count; });

    EXPECT_TRUE(loop.PollUntil([&] { return count == 2; }, 1s));
}

TEST(LoopHandleTest, DefersWhileLoopAlive) {
    EpollEventLoop loop;
    LoopHandle handle = loop.Handle();
    EXPECT_FALSE(handle.Expired());

    int count = 0;
    handle.Defer([&]() { ++count; });
    loop.Poll(0);
    EXPECT_EQ(count, 1);
}

TEST(LoopHandleTest, DropsCallbacksAfterLoopDestroyed) {
    LoopHandle handle;
    EXPECT_TRUE(handle.Expired());

    bool ran = false;
    {
        EpollEventLoop loop;
        handle = loop.Handle();
    }
    EXPECT_TRUE(handle.Expired());
    handle.Defer([&]() { ran = true; });
    EXPECT_FALSE(ran);
}

TEST(LoopHandleTest, DeferFromOtherThreadAfterDestruction) {
    LoopHandle handle;
    {
        EventLoop loop;
        IEventLoop& iface = loop;
        handle = iface.Handle();
    }
    std::atomic<bool> ran{false};
    std::thread t([&]() { handle.Defer([&]() { ran = true; }); });
    t.join();
    EXPECT_FALSE(ran.load());
}
