#include <gtest/gtest.h>
#include "../src/sink/rotation_policy.hpp"
#include <chrono>
#include <thread>

using std::chrono::milliseconds;
using std::chrono::system_clock;

TEST(RotationPolicyTest, SizeThreshold) {
    RotationPolicy policy(3, -1, -1);

    EXPECT_FALSE(policy.shouldRotateBySize(0));
    EXPECT_FALSE(policy.shouldRotateBySize(2));
    EXPECT_TRUE(policy.shouldRotateBySize(3));
    EXPECT_TRUE(policy.shouldRotateBySize(10));
    EXPECT_EQ(policy.getFlushSize(), 3u);
}

TEST(RotationPolicyTest, IntervalThreshold) {
    RotationPolicy policy(100, 1000, -1);
    auto first = system_clock::time_point(milliseconds(5000));

    EXPECT_FALSE(policy.shouldRotateByInterval(first, first));
    EXPECT_FALSE(policy.shouldRotateByInterval(first, first + milliseconds(999)));
    EXPECT_TRUE(policy.shouldRotateByInterval(first, first + milliseconds(1000)));
}

TEST(RotationPolicyTest, IntervalDisabled) {
    RotationPolicy policy(100, -1, -1);
    auto first = system_clock::time_point(milliseconds(0));

    EXPECT_FALSE(policy.shouldRotateByInterval(first, first + std::chrono::hours(24)));
}

TEST(RotationPolicyTest, ScheduleThreshold) {
    RotationPolicy policy(100, -1, 50);

    EXPECT_FALSE(policy.shouldRotateBySchedule());
    std::this_thread::sleep_for(milliseconds(80));
    EXPECT_TRUE(policy.shouldRotateBySchedule());

    policy.reset();
    EXPECT_FALSE(policy.shouldRotateBySchedule());
}

TEST(RotationPolicyTest, ScheduleDisabled) {
    RotationPolicy policy(100, -1, 0);

    std::this_thread::sleep_for(milliseconds(10));
    EXPECT_FALSE(policy.shouldRotateBySchedule());
}

TEST(RotationPolicyTest, TimeSinceReset) {
    RotationPolicy policy(10, -1, -1);

    auto time1 = policy.getTimeSinceReset();
    std::this_thread::sleep_for(milliseconds(20));
    auto time2 = policy.getTimeSinceReset();

    EXPECT_GE(time2.count(), time1.count());
    EXPECT_GE(time2.count(), 20);
}
