#include "torgrab/scheduler/Backoff.hpp"

#include <gtest/gtest.h>

using namespace torgrab::scheduler;
using namespace std::chrono_literals;

TEST(BackoffTest, DoublesUntilCap) {
    Backoff backoff{BackoffOptions{100ms, 1000ms, 0ms}};

    EXPECT_EQ(backoff.delay(0, 1), 100ms);
    EXPECT_EQ(backoff.delay(1, 1), 200ms);
    EXPECT_EQ(backoff.delay(2, 1), 400ms);
    EXPECT_EQ(backoff.delay(3, 1), 800ms);
    EXPECT_EQ(backoff.delay(4, 1), 1000ms);
    EXPECT_EQ(backoff.delay(40, 1), 1000ms);
}

TEST(BackoffTest, MonotoneForFixedSeed) {
    Backoff backoff{BackoffOptions{50ms, 5000ms, 500ms}};

    for (std::uint64_t seed : {0ull, 7ull, 42ull, 0xdeadbeefull}) {
        auto previous = backoff.delay(0, seed);
        for (unsigned attempt = 1; attempt < 20; ++attempt) {
            auto current = backoff.delay(attempt, seed);
            EXPECT_GE(current, previous) << "seed " << seed << " attempt " << attempt;
            previous = current;
        }
    }
}

TEST(BackoffTest, JitterStaysInRange) {
    Backoff backoff{BackoffOptions{100ms, 100ms, 30ms}};

    for (std::uint64_t seed = 0; seed < 200; ++seed) {
        auto delay = backoff.delay(3, seed);
        EXPECT_GE(delay, 100ms);
        EXPECT_LE(delay, 130ms);
    }
}

TEST(BackoffTest, CapBelowBaseIsRaised) {
    Backoff backoff{BackoffOptions{500ms, 100ms, 0ms}};

    EXPECT_EQ(backoff.options().cap, 500ms);
    EXPECT_EQ(backoff.delay(5, 0), 500ms);
}
