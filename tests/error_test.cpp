// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace flowtap;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::StageFailed, "stage 'parse' failed: bad input"};
    EXPECT_EQ(err.code, ErrorCode::StageFailed);
    EXPECT_EQ(err.message, "stage 'parse' failed: bad input");
}

TEST(ErrorTest, CategoryString) {
    // Composition category
    EXPECT_EQ(error_category(ErrorCode::AlreadyClosed), "composition");
    EXPECT_EQ(error_category(ErrorCode::SubscriberRejected), "composition");
    EXPECT_EQ(error_category(ErrorCode::InvalidSettings), "composition");
    EXPECT_EQ(error_category(ErrorCode::InvalidState), "composition");

    EXPECT_EQ(error_category(ErrorCode::InvalidDemand), "demand");
    EXPECT_EQ(error_category(ErrorCode::StageFailed), "processing");

    // Producer category
    EXPECT_EQ(error_category(ErrorCode::ProducerFailed), "producer");
    EXPECT_EQ(error_category(ErrorCode::FutureFailed), "producer");

    EXPECT_EQ(error_category(ErrorCode::SubscriberDropped), "fanout");
    EXPECT_EQ(error_category(ErrorCode::Cancelled), "lifecycle");
}

TEST(ErrorTest, CompositionErrors) {
    EXPECT_TRUE(is_composition_error(ErrorCode::AlreadyClosed));
    EXPECT_TRUE(is_composition_error(ErrorCode::SubscriberRejected));
    EXPECT_FALSE(is_composition_error(ErrorCode::StageFailed));
    EXPECT_FALSE(is_composition_error(ErrorCode::SubscriberDropped));
}

TEST(ErrorTest, CategoryIsConstexpr) {
    static_assert(error_category(ErrorCode::InvalidDemand) == "demand");
    static_assert(is_composition_error(ErrorCode::InvalidSettings));
    SUCCEED();
}
