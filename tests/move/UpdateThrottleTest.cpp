#include <gtest/gtest.h>
#include <blockshift/move/UpdateThrottle.h>

using namespace blockshift;
using std::chrono::milliseconds;

class UpdateThrottleTest : public ::testing::Test {
protected:
    UpdateThrottle throttle_{milliseconds(16)};
    TimePoint t0_{};
};

TEST_F(UpdateThrottleTest, FirstOffer_AppliesImmediately) {
    EXPECT_TRUE(throttle_.offer({1.0f, 1.0f}, t0_));
    EXPECT_FALSE(throttle_.hasPending());
}

TEST_F(UpdateThrottleTest, OfferInsideWindow_BecomesPending) {
    throttle_.offer({1.0f, 1.0f}, t0_);

    EXPECT_FALSE(throttle_.offer({2.0f, 2.0f}, t0_ + milliseconds(5)));
    EXPECT_FALSE(throttle_.offer({3.0f, 3.0f}, t0_ + milliseconds(10)));
    EXPECT_TRUE(throttle_.hasPending());
}

TEST_F(UpdateThrottleTest, TakeDue_DeliversLatestAfterWindow) {
    throttle_.offer({1.0f, 1.0f}, t0_);
    throttle_.offer({2.0f, 2.0f}, t0_ + milliseconds(5));
    throttle_.offer({3.0f, 3.0f}, t0_ + milliseconds(10));

    EXPECT_FALSE(throttle_.takeDue(t0_ + milliseconds(15)).has_value());

    auto due = throttle_.takeDue(t0_ + milliseconds(16));
    ASSERT_TRUE(due.has_value());
    EXPECT_EQ(*due, (Point{3.0f, 3.0f}));
    EXPECT_FALSE(throttle_.hasPending());
}

TEST_F(UpdateThrottleTest, TakeDue_RestartsWindow) {
    throttle_.offer({1.0f, 1.0f}, t0_);
    throttle_.offer({2.0f, 2.0f}, t0_ + milliseconds(5));
    throttle_.takeDue(t0_ + milliseconds(20));

    EXPECT_FALSE(throttle_.offer({4.0f, 4.0f}, t0_ + milliseconds(30)));
    EXPECT_TRUE(throttle_.offer({5.0f, 5.0f}, t0_ + milliseconds(36)));
}

TEST_F(UpdateThrottleTest, Flush_ReturnsPendingRegardlessOfTime) {
    throttle_.offer({1.0f, 1.0f}, t0_);
    throttle_.offer({2.0f, 2.0f}, t0_ + milliseconds(1));

    auto flushed = throttle_.flush();

    ASSERT_TRUE(flushed.has_value());
    EXPECT_EQ(*flushed, (Point{2.0f, 2.0f}));
    EXPECT_FALSE(throttle_.flush().has_value());
}

TEST_F(UpdateThrottleTest, Reset_DropsPendingAndWindow) {
    throttle_.offer({1.0f, 1.0f}, t0_);
    throttle_.offer({2.0f, 2.0f}, t0_ + milliseconds(1));

    throttle_.reset();

    EXPECT_FALSE(throttle_.hasPending());
    EXPECT_TRUE(throttle_.offer({3.0f, 3.0f}, t0_ + milliseconds(2)));
}

TEST_F(UpdateThrottleTest, EveryWindowDeliversAtLeastOneUpdate) {
    int applied = 0;
    TimePoint now = t0_;
    for (int i = 0; i < 100; ++i) {
        now += milliseconds(4);
        if (throttle_.offer({static_cast<float>(i), 0.0f}, now)) {
            ++applied;
        }
        if (throttle_.takeDue(now)) {
            ++applied;
        }
    }
    // 400ms of input at a 16ms interval
    EXPECT_GE(applied, 24);
    EXPECT_LE(applied, 26);
}
