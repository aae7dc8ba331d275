#include <gtest/gtest.h>

#include "dispatch/rate_window.hpp"

#include <string>

// ============================================================================
// RateWindow
// ============================================================================

TEST(RateWindowTest, AdmitsUpToCeiling) {
    RateWindow window(60000, 3);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(window.hasRoom(i));
        window.record(i);
    }
    EXPECT_FALSE(window.hasRoom(10));
    EXPECT_EQ(window.countWithin(10), 3);
}

TEST(RateWindowTest, EntryExpiresAtExactlyWindowLength) {
    RateWindow window(60000, 1);
    window.record(1000);
    EXPECT_FALSE(window.hasRoom(60999));
    EXPECT_TRUE(window.hasRoom(61000));
}

TEST(RateWindowTest, WaitPointsAtBlockingEntry) {
    RateWindow window(60000, 2);
    window.record(0);
    window.record(10000);
    // Room appears once the entry at t=0 ages out.
    EXPECT_EQ(window.msUntilSlot(30000), 30000);
    window.setCeiling(1);
    // With ceiling 1 both entries must go; t=10000 is the blocker.
    EXPECT_EQ(window.msUntilSlot(30000), 40000);
}

TEST(RateWindowTest, NoWaitWhenRoomAvailable) {
    RateWindow window(60000, 2);
    window.record(0);
    EXPECT_EQ(window.msUntilSlot(5), 0);
}

// ============================================================================
// DualRateLimiter
// ============================================================================

TEST(DualRateLimiterTest, RecordsInBothWindowsOnlyOnAdmission) {
    DualRateLimiter limiter(2, 3);
    EXPECT_TRUE(limiter.tryAdmit(0));
    EXPECT_TRUE(limiter.tryAdmit(1));
    EXPECT_FALSE(limiter.tryAdmit(2));
    EXPECT_EQ(limiter.recentMinute(2), 2);
    EXPECT_EQ(limiter.recentHour(2), 2);
}

TEST(DualRateLimiterTest, RetryDelayIsLaterOfSaturatedWindows) {
    DualRateLimiter limiter(5, 5);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(limiter.tryAdmit(i * 1000));
    }
    // Minute window frees at 60000, hour window at 3600000.
    EXPECT_EQ(limiter.retryDelayMs(4000), 3600000 - 4000);
    EXPECT_FALSE(limiter.tryAdmit(61000));
}

TEST(DualRateLimiterTest, MinuteWindowAloneBlocks) {
    DualRateLimiter limiter(1, 30);
    ASSERT_TRUE(limiter.tryAdmit(0));
    EXPECT_EQ(limiter.retryDelayMs(15000), 45000);
    EXPECT_TRUE(limiter.tryAdmit(60000));
}

TEST(DualRateLimiterTest, HourWindowNeverExceeded) {
    DualRateLimiter limiter(5, 30);
    int admitted = 0;
    for (long long t = 0; t < 3600000; t += 1000) {
        if (limiter.tryAdmit(t)) ++admitted;
        ASSERT_LE(limiter.recentMinute(t), 5);
        ASSERT_LE(limiter.recentHour(t), 30);
    }
    EXPECT_EQ(admitted, 30);
}

TEST(DualRateLimiterTest, ValidationRejectsNonPositiveCeilings) {
    std::string err;
    EXPECT_FALSE(DualRateLimiter::validate(0, 30, err));
    EXPECT_FALSE(err.empty());
    err.clear();
    EXPECT_FALSE(DualRateLimiter::validate(5, -1, err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(DualRateLimiter::validate(5, 30, err));
}

TEST(DualRateLimiterTest, ReconfigureKeepsHistory) {
    DualRateLimiter limiter(2, 30);
    ASSERT_TRUE(limiter.tryAdmit(0));
    ASSERT_TRUE(limiter.tryAdmit(1));
    std::string err;
    ASSERT_TRUE(limiter.reconfigure(3, 30, err));
    EXPECT_TRUE(limiter.tryAdmit(2));
    EXPECT_FALSE(limiter.tryAdmit(3));
    EXPECT_FALSE(limiter.reconfigure(0, 30, err));
}
