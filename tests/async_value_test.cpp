// SPDX-License-Identifier: MIT

// tests/async_value_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "lib/stream/async_value.hpp"

using namespace flowtap;
using namespace std::chrono_literals;

TEST(AsyncValueTest, StartsPending) {
    AsyncValue<int> v;
    EXPECT_FALSE(v.IsReady());
    EXPECT_FALSE(v.Peek().has_value());
}

TEST(AsyncValueTest, FirstCompletionWins) {
    AsyncValue<int> v;
    EXPECT_TRUE(v.TrySet(1));
    EXPECT_FALSE(v.TrySet(2));
    EXPECT_FALSE(v.TryFail(Error{ErrorCode::Cancelled, "late"}));

    auto r = v.Peek();
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->has_value());
    EXPECT_EQ(**r, 1);
}

TEST(AsyncValueTest, CopiesShareState) {
    AsyncValue<std::string> a;
    AsyncValue<std::string> b = a;
    a.TrySet("shared");
    ASSERT_TRUE(b.IsReady());
    EXPECT_EQ(b.Peek()->value(), "shared");
}

TEST(AsyncValueTest, CallbackRunsOnCompletion) {
    AsyncValue<int> v;
    int seen = 0;
    int calls = 0;
    v.OnComplete([&](const AsyncValue<int>::Result& r) {
        ++calls;
        seen = *r;
    });
    EXPECT_EQ(calls, 0);

    v.TrySet(42);
    v.TrySet(43);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen, 42);
}

TEST(AsyncValueTest, CallbackOnReadyValueRunsImmediately) {
    auto v = AsyncValue<int>::Failed(Error{ErrorCode::FutureFailed, "boom"});
    bool failed = false;
    v.OnComplete([&](const AsyncValue<int>::Result& r) {
        failed = !r && r.error().code == ErrorCode::FutureFailed;
    });
    EXPECT_TRUE(failed);
}

TEST(AsyncValueTest, WaitBlocksUntilOtherThreadCompletes) {
    AsyncValue<int> v;
    std::thread t([v]() mutable {
        std::this_thread::sleep_for(10ms);
        v.TrySet(7);
    });
    auto r = v.Wait();
    t.join();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 7);
}

TEST(AsyncValueTest, WaitForTimesOut) {
    AsyncValue<int> v;
    EXPECT_FALSE(v.WaitFor(10ms).has_value());
    EXPECT_EQ(AsyncValue<int>::Ready(3).WaitFor(10ms)->value(), 3);
}
