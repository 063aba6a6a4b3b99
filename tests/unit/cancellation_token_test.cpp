#include "sync/cancellation_token.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace lcdlink::sync;
using namespace std::chrono_literals;

TEST(CancellationTokenTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.wait_for(30ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(CancellationTokenTest, CancelIsVisibleToAllTokens) {
    CancellationSource source;
    auto a = source.token();
    auto b = source.token();

    EXPECT_FALSE(a.is_cancelled());
    source.cancel();
    EXPECT_TRUE(source.is_cancelled());
    EXPECT_TRUE(a.is_cancelled());
    EXPECT_TRUE(b.is_cancelled());

    // Already cancelled: no wait
    EXPECT_TRUE(a.wait_for(1000ms));
}

TEST(CancellationTokenTest, CancelWakesWaiter) {
    CancellationSource source;
    auto token = source.token();

    std::thread canceller([&source]() {
        std::this_thread::sleep_for(30ms);
        source.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_until(std::chrono::steady_clock::now() + 5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    canceller.join();
}

TEST(CancellationTokenTest, WaitUntilPastDeadlineReturnsImmediately) {
    CancellationSource source;
    auto token = source.token();
    EXPECT_FALSE(token.wait_until(std::chrono::steady_clock::now() - 10ms));
}

TEST(CancellationTokenTest, TokenOutlivesSource) {
    CancellationToken token;
    {
        CancellationSource source;
        token = source.token();
        source.cancel();
    }
    EXPECT_TRUE(token.is_cancelled());
}
