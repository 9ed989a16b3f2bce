#include <gtest/gtest.h>
#include "Cancellation.hpp"

#include <chrono>
#include <future>
#include <limits>
#include <thread>

using namespace http_pipeline;

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    EXPECT_TRUE(token.sleepFor(0.001));
}

TEST(CancellationTest, CancelIsSharedAndIdempotent) {
    CancellationSource source;
    CancellationToken token = source.token();
    CancellationSource copy = source;

    EXPECT_FALSE(token.isCancelled());
    copy.cancel();
    copy.cancel();
    EXPECT_TRUE(source.isCancelled());
    EXPECT_TRUE(token.isCancelled());
    EXPECT_FALSE(token.sleepFor(10));
}

TEST(CancellationTest, CancelWakesSleeper) {
    CancellationSource source;
    CancellationToken token = source.token();

    auto start = std::chrono::steady_clock::now();
    auto sleeper = std::async(std::launch::async, [token]() { return token.sleepFor(30); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    source.cancel();

    EXPECT_FALSE(sleeper.get());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(CancellationTest, UncancelledSleepCompletes) {
    CancellationSource source;
    EXPECT_TRUE(source.token().sleepFor(0.01));
}

TEST(CancellationTest, HugeSleepsStillSleep) {
    for (double seconds : {1e11, 1e300, std::numeric_limits<double>::infinity()}) {
        CancellationSource source;
        CancellationToken token = source.token();

        auto sleeper = std::async(std::launch::async, [token, seconds]() { return token.sleepFor(seconds); });
        EXPECT_EQ(sleeper.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout) << seconds;

        source.cancel();
        EXPECT_FALSE(sleeper.get());
    }
}

TEST(CancellationTest, NanAndNegativeDoNotSleep) {
    CancellationSource source;
    CancellationToken token = source.token();

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.sleepFor(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_TRUE(token.sleepFor(-5));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}
