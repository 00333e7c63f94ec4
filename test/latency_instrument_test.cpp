#include "utils/LatencyInstrument.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace tcsim {

TEST(LatencyInstrumentTest, StopWithoutStartReturnsZero) {
    LatencyInstrument lat;
    EXPECT_DOUBLE_EQ(lat.stop("never_started"), 0.0);
    EXPECT_EQ(lat.stats("never_started").count, 0u);
    EXPECT_TRUE(lat.history("never_started").empty());
}

TEST(LatencyInstrumentTest, MeasuresElapsedTime) {
    LatencyInstrument lat;
    lat.start("sleep");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const double ms = lat.stop("sleep");

    EXPECT_GE(ms, 5.0);
    ASSERT_EQ(lat.history("sleep").size(), 1u);
    EXPECT_DOUBLE_EQ(lat.history("sleep")[0], ms);

    // A second stop has no matching start.
    EXPECT_DOUBLE_EQ(lat.stop("sleep"), 0.0);
    EXPECT_EQ(lat.history("sleep").size(), 1u);
}

// The oldest samples go first once max_samples is exceeded.
TEST(LatencyInstrumentTest, HistoryIsBoundedToMostRecent) {
    constexpr std::size_t kMax = 100;
    LatencyInstrument lat(kMax);

    std::vector<double> all;
    for (std::size_t i = 0; i < kMax + 50; ++i) {
        lat.start("op");
        all.push_back(lat.stop("op"));
    }

    const std::vector<double> hist = lat.history("op");
    ASSERT_EQ(hist.size(), kMax);
    EXPECT_EQ(hist, std::vector<double>(all.begin() + 50, all.end()));
    EXPECT_EQ(lat.stats("op").count, kMax);
}

TEST(LatencyInstrumentTest, PercentilesFallBackToMaxOnSmallSamples) {
    LatencyInstrument lat;
    for (int i = 0; i < 5; ++i) {
        lat.start("op");
        lat.stop("op");
    }
    const LatencyStats s = lat.stats("op");

    EXPECT_EQ(s.count, 5u);
    EXPECT_DOUBLE_EQ(s.p95, s.max);
    EXPECT_DOUBLE_EQ(s.p99, s.max);
    EXPECT_LE(s.min, s.median);
    EXPECT_LE(s.median, s.max);
    EXPECT_LE(s.min, s.mean);
    EXPECT_LE(s.mean, s.max);
}

TEST(LatencyInstrumentTest, PercentilesOnLargerSamples) {
    LatencyInstrument lat;
    for (int i = 0; i < 200; ++i) {
        lat.start("op");
        lat.stop("op");
    }
    const LatencyStats s = lat.stats("op");
    const auto hist = lat.history("op");

    std::vector<double> sorted(hist.begin(), hist.end());
    std::sort(sorted.begin(), sorted.end());
    EXPECT_DOUBLE_EQ(s.p95, sorted[189]); // int(0.95 * 200) - 1
    EXPECT_DOUBLE_EQ(s.p99, sorted[197]); // int(0.99 * 200) - 1
    EXPECT_DOUBLE_EQ(s.median, (sorted[99] + sorted[100]) / 2.0);
}

TEST(LatencyInstrumentTest, ResetOneOrAll) {
    LatencyInstrument lat;
    for (const std::string name: {"a", "b"}) {
        lat.start(name);
        lat.stop(name);
    }
    ASSERT_EQ(lat.all_stats().size(), 2u);

    lat.reset("a");
    EXPECT_EQ(lat.stats("a").count, 0u);
    EXPECT_EQ(lat.stats("b").count, 1u);

    lat.reset();
    EXPECT_TRUE(lat.all_stats().empty());
}

// Concurrent timers under the same name are matched per thread.
TEST(LatencyInstrumentTest, ConcurrentSameNameDoesNotCrossContaminate) {
    LatencyInstrument lat;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&lat] {
            for (int i = 0; i < kPerThread; ++i) {
                lat.start("shared");
                lat.stop("shared");
            }
        });
    }
    for (auto &w: workers) w.join();

    EXPECT_EQ(lat.stats("shared").count, static_cast<std::size_t>(kThreads * kPerThread));
}

// Each thread owns one operation name; counts and histories stay with their own name.
TEST(LatencyInstrumentTest, ConcurrentDistinctNamesStaySeparate) {
    LatencyInstrument lat;
    constexpr int kThreads = 4;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&lat, t] {
            const std::string name = "op_" + std::to_string(t);
            for (int i = 0; i < (t + 1) * 50; ++i) {
                lat.start(name);
                lat.stop(name);
            }
        });
    }
    for (auto &w: workers) w.join();

    const auto all = lat.all_stats();
    ASSERT_EQ(all.size(), static_cast<std::size_t>(kThreads));
    for (int t = 0; t < kThreads; ++t) {
        const std::string name = "op_" + std::to_string(t);
        EXPECT_EQ(lat.stats(name).count, static_cast<std::size_t>((t + 1) * 50)) << name;
        EXPECT_EQ(lat.history(name).size(), static_cast<std::size_t>((t + 1) * 50)) << name;
    }
}

TEST(LatencyInstrumentTest, RejectsZeroCapacity) {
    EXPECT_THROW(LatencyInstrument{0}, std::invalid_argument);
}

} // namespace tcsim
