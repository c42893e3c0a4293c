// SPDX-License-Identifier: MIT

// tests/stage_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/stage.hpp"

using namespace flowtap;

// Minimal stage exercising StageBase
class TestStage
    : public StageBase<TestStage>
    , public std::enable_shared_from_this<TestStage> {
    friend StageBase<TestStage>;

public:
    TestStage(IEventLoop& loop, std::string name) : StageBase(loop, std::move(name)) {}

    int process_count = 0;
    int release_count = 0;

    void Process() {
        auto guard = TryGuard();
        if (!guard) return;
        ++process_count;
    }

private:
    void DoRelease() { ++release_count; }
};

TEST(StageStateTest, Names) {
    EXPECT_EQ(stage_state_name(StageState::Idle), "idle");
    EXPECT_EQ(stage_state_name(StageState::Demanding), "demanding");
    EXPECT_EQ(stage_state_name(StageState::Completing), "completing");
    EXPECT_EQ(stage_state_name(StageState::Cancelled), "cancelled");
}

TEST(StageStateTest, TerminalStates) {
    EXPECT_FALSE(is_terminal_state(StageState::Idle));
    EXPECT_FALSE(is_terminal_state(StageState::Demanding));
    EXPECT_FALSE(is_terminal_state(StageState::Processing));
    EXPECT_FALSE(is_terminal_state(StageState::Completing));
    EXPECT_TRUE(is_terminal_state(StageState::Completed));
    EXPECT_TRUE(is_terminal_state(StageState::Failed));
    EXPECT_TRUE(is_terminal_state(StageState::Cancelled));
}

TEST(StageBaseTest, StartsIdleWithName) {
    EpollEventLoop loop;
    auto stage = std::make_shared<TestStage>(loop, "flow-0-1-double");
    EXPECT_EQ(stage->Name(), "flow-0-1-double");
    EXPECT_EQ(stage->State(), StageState::Idle);
    EXPECT_FALSE(stage->IsTerminated());
}

TEST(StageBaseTest, TerminalStateIsSticky) {
    EpollEventLoop loop;
    auto stage = std::make_shared<TestStage>(loop, "s");

    EXPECT_TRUE(stage->TransitionTo(StageState::Demanding));
    EXPECT_TRUE(stage->Terminate(StageState::Cancelled));
    EXPECT_FALSE(stage->Terminate(StageState::Completed));
    EXPECT_FALSE(stage->TransitionTo(StageState::Idle));
    EXPECT_EQ(stage->State(), StageState::Cancelled);
}

TEST(StageBaseTest, TryGuardRejectsWhenTerminated) {
    EpollEventLoop loop;
    auto stage = std::make_shared<TestStage>(loop, "s");

    stage->Process();
    EXPECT_EQ(stage->process_count, 1);

    stage->Terminate(StageState::Failed);
    stage->Process();  // Should be rejected
    EXPECT_EQ(stage->process_count, 1);
}

TEST(StageBaseTest, ReleaseRunsOnceOnLoop) {
    EpollEventLoop loop;
    auto stage = std::make_shared<TestStage>(loop, "s");

    stage->Terminate(StageState::Completed);
    EXPECT_EQ(stage->release_count, 0);
    EXPECT_FALSE(stage->IsReleased());

    loop.Poll(0);
    EXPECT_EQ(stage->release_count, 1);
    EXPECT_TRUE(stage->IsReleased());

    stage->Terminate(StageState::Cancelled);
    loop.Poll(0);
    EXPECT_EQ(stage->release_count, 1);
}

TEST(StageBaseTest, ProcessingGuardDefersRelease) {
    EpollEventLoop loop;
    auto stage = std::make_shared<TestStage>(loop, "s");

    {
        auto guard = stage->TryGuard();
        ASSERT_TRUE(guard.has_value());

        stage->Terminate(StageState::Cancelled);  // Guard still active
        EXPECT_TRUE(stage->IsTerminated());
        loop.Poll(0);
        EXPECT_EQ(stage->release_count, 0);  // Not yet
    }
    // Guard destroyed, release posted to the loop

    loop.Poll(0);
    EXPECT_EQ(stage->release_count, 1);
}

TEST(StageRegistryTest, SnapshotInOrder) {
    EpollEventLoop loop;
    auto a = std::make_shared<TestStage>(loop, "a");
    auto b = std::make_shared<TestStage>(loop, "b");

    StageRegistry registry;
    registry.Add(a);
    registry.Add(b);
    b->Terminate(StageState::Completed);

    auto snapshot = registry.Snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(registry.Size(), 2u);
    EXPECT_EQ(snapshot[0].name, "a");
    EXPECT_EQ(snapshot[0].state, StageState::Idle);
    EXPECT_EQ(snapshot[1].name, "b");
    EXPECT_EQ(snapshot[1].state, StageState::Completed);
}
