// SPDX-License-Identifier: MIT

// tests/graph_test.cpp
#include <gtest/gtest.h>

#include "src/graph.hpp"

using namespace flowtap;

TEST(GraphDescriptionTest, EmptyDescriptionIsOpenFragment) {
    GraphDescription g;
    EXPECT_FALSE(g.HasTap());
    EXPECT_FALSE(g.IsClosed());
    EXPECT_FALSE(g.IsRunnable());
    EXPECT_EQ(g.Size(), 0u);
    EXPECT_EQ(g.ToString(), "");
}

TEST(GraphDescriptionTest, AppendKeepsDeclarationOrder) {
    auto g = GraphDescription::FromTap("numbers", "collection")
                 .Append("double")
                 .and_then([](const GraphDescription& d) { return d.Append("positive"); });
    ASSERT_TRUE(g.has_value());
    ASSERT_EQ(g->Stages().size(), 2u);
    EXPECT_EQ(g->Stages()[0].name, "double");
    EXPECT_EQ(g->Stages()[1].name, "positive");
    EXPECT_EQ(g->Stages()[0].kind, StageKind::Transform);
    EXPECT_EQ(g->ToString(), "collection(numbers) -> double -> positive");
}

TEST(GraphDescriptionTest, OperationsLeaveReceiverUntouched) {
    auto base = GraphDescription::FromTap("numbers", "collection");
    auto before = base;

    auto appended = base.Append("double");
    auto closed = base.Close("out", "collect");
    ASSERT_TRUE(appended.has_value());
    ASSERT_TRUE(closed.has_value());

    EXPECT_EQ(base, before);
    EXPECT_TRUE(base.Stages().empty());
    EXPECT_FALSE(base.IsClosed());
    EXPECT_NE(*appended, base);
}

TEST(GraphDescriptionTest, CloseMakesRunnable) {
    auto g = GraphDescription::FromTap("numbers", "collection")
                 .Append("double")
                 .and_then([](const GraphDescription& d) { return d.Close("out", "collect"); });
    ASSERT_TRUE(g.has_value());
    EXPECT_TRUE(g->IsClosed());
    EXPECT_TRUE(g->IsRunnable());
    EXPECT_EQ(g->Size(), 3u);
    ASSERT_TRUE(g->Sink().has_value());
    EXPECT_EQ(g->Sink()->kind, StageKind::Sink);
    EXPECT_EQ(g->ToString(), "collection(numbers) -> double -> collect(out)");

    auto all = g->All();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all.front().kind, StageKind::Tap);
    EXPECT_EQ(all.back().name, "out");
}

TEST(GraphDescriptionTest, ClosedDescriptionRejectsExtension) {
    auto closed = GraphDescription::FromTap("numbers", "collection").Close("out", "collect");
    ASSERT_TRUE(closed.has_value());

    auto appended = closed->Append("late");
    ASSERT_FALSE(appended.has_value());
    EXPECT_EQ(appended.error().code, ErrorCode::AlreadyClosed);
    EXPECT_TRUE(is_composition_error(appended.error().code));

    auto reclosed = closed->Close("again", "ignore");
    ASSERT_FALSE(reclosed.has_value());
    EXPECT_EQ(reclosed.error().code, ErrorCode::AlreadyClosed);

    auto concat = closed->Concat(*GraphDescription{}.Append("x"));
    ASSERT_FALSE(concat.has_value());
    EXPECT_EQ(concat.error().code, ErrorCode::AlreadyClosed);
}

TEST(GraphDescriptionTest, ClosedSinkFragmentIsNotRunnableWithoutTap) {
    auto sink = GraphDescription{}.Close("out", "collect");
    ASSERT_TRUE(sink.has_value());
    EXPECT_TRUE(sink->IsClosed());
    EXPECT_FALSE(sink->IsRunnable());

    auto runnable = sink->WithTap("numbers", "collection");
    ASSERT_TRUE(runnable.has_value());
    EXPECT_TRUE(runnable->IsRunnable());
}

TEST(GraphDescriptionTest, SecondTapRejected) {
    auto g = GraphDescription::FromTap("a", "collection");
    auto again = g.WithTap("b", "thunk");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);

    auto fragment_with_tap = GraphDescription::FromTap("b", "thunk");
    auto concat = g.Concat(fragment_with_tap);
    ASSERT_FALSE(concat.has_value());
    EXPECT_EQ(concat.error().code, ErrorCode::InvalidState);
}

TEST(GraphDescriptionTest, ConcatAppendsStagesAndSink) {
    auto flow = GraphDescription{}.Append("double")
                    .and_then([](const GraphDescription& d) { return d.Append("inc"); });
    auto sink = GraphDescription{}.Close("sum", "fold");
    ASSERT_TRUE(flow.has_value());
    ASSERT_TRUE(sink.has_value());

    auto g = GraphDescription::FromTap("numbers", "collection")
                 .Concat(*flow)
                 .and_then([&](const GraphDescription& d) { return d.Concat(*sink); });
    ASSERT_TRUE(g.has_value());
    EXPECT_EQ(g->ToString(), "collection(numbers) -> double -> inc -> fold(sum)");
    EXPECT_TRUE(g->IsRunnable());
}

TEST(GraphDescriptionTest, StageKindNames) {
    EXPECT_EQ(stage_kind_name(StageKind::Tap), "tap");
    EXPECT_EQ(stage_kind_name(StageKind::Transform), "transform");
    EXPECT_EQ(stage_kind_name(StageKind::Sink), "sink");
}
