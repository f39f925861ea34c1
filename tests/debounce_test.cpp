#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "spatialbook/debounce.hpp"

using Clock = std::chrono::steady_clock;

TEST(PendingDebounce, FlushesAfterInterval) {
    spatialbook::PendingDebounce debounce(std::chrono::milliseconds(100));
    const auto                   t0 = Clock::time_point{};

    debounce.mark(t0);
    EXPECT_FALSE(debounce.flush(t0 + std::chrono::milliseconds(50)));
    EXPECT_TRUE(debounce.flush(t0 + std::chrono::milliseconds(100)));
    EXPECT_FALSE(debounce.flush(t0 + std::chrono::milliseconds(200)));
}

TEST(PendingDebounce, SteadyStreamDefersUntilQuiet) {
    spatialbook::PendingDebounce debounce(std::chrono::milliseconds(1000));
    const auto                   t0    = Clock::time_point{};
    int                          saves = 0;

    for (int ms = 0; ms < 5000; ms += 100) {
        debounce.mark(t0 + std::chrono::milliseconds(ms));
        if (debounce.flush(t0 + std::chrono::milliseconds(ms + 50))) {
            ++saves;
        }
    }
    EXPECT_EQ(saves, 0);

    const auto last = t0 + std::chrono::milliseconds(4900);
    ASSERT_TRUE(debounce.deadline().has_value());
    EXPECT_EQ(*debounce.deadline(), last + std::chrono::milliseconds(1000));
    EXPECT_FALSE(debounce.flush(last + std::chrono::milliseconds(999)));
    EXPECT_TRUE(debounce.flush(last + std::chrono::milliseconds(1000)));
    EXPECT_FALSE(debounce.pending());
}

TEST(PendingDebounce, CancelledTimerNeverFires) {
    spatialbook::PendingDebounce debounce(std::chrono::milliseconds(100));
    const auto                   t0 = Clock::time_point{};

    debounce.mark(t0);
    debounce.cancel();

    EXPECT_FALSE(debounce.flush(t0 + std::chrono::seconds(5)));
    EXPECT_FALSE(debounce.deadline().has_value());
}

TEST(KeyedDebounce, BurstCollapsesToLastValue) {
    spatialbook::KeyedDebounce<int, int> debounce(std::chrono::milliseconds(1000));
    const auto                           t0 = Clock::time_point{};

    for (int i = 0; i < 50; ++i) {
        debounce.record(7, i, t0 + std::chrono::milliseconds(i * 20));
        EXPECT_TRUE(debounce.flush(t0 + std::chrono::milliseconds(i * 20)).empty());
    }

    const auto last = t0 + std::chrono::milliseconds(49 * 20);
    EXPECT_TRUE(debounce.flush(last + std::chrono::milliseconds(999)).empty());
    const auto due = debounce.flush(last + std::chrono::milliseconds(1000));

    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due.front().first, 7);
    EXPECT_EQ(due.front().second, 49);
    EXPECT_EQ(debounce.size(), 0u);
}

TEST(KeyedDebounce, KeysAreIndependent) {
    spatialbook::KeyedDebounce<int, std::string> debounce(std::chrono::milliseconds(100));
    const auto                                   t0 = Clock::time_point{};

    debounce.record(1, "a", t0);
    debounce.record(2, "b", t0 + std::chrono::milliseconds(80));
    ASSERT_TRUE(debounce.next_deadline().has_value());
    EXPECT_EQ(*debounce.next_deadline(), t0 + std::chrono::milliseconds(100));

    const auto first = debounce.flush(t0 + std::chrono::milliseconds(100));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first.front().second, "a");

    const auto second = debounce.flush(t0 + std::chrono::milliseconds(180));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second.front().second, "b");
}

TEST(KeyedDebounce, CancelAndFlushAll) {
    spatialbook::KeyedDebounce<int, int> debounce(std::chrono::milliseconds(100));
    const auto                           t0 = Clock::time_point{};

    debounce.record(1, 10, t0);
    debounce.record(2, 20, t0);
    EXPECT_TRUE(debounce.cancel(1));
    EXPECT_FALSE(debounce.cancel(1));

    const auto rest = debounce.flush_all();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest.front().second, 20);
    EXPECT_FALSE(debounce.next_deadline().has_value());
}
