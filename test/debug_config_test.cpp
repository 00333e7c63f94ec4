#include "utils/DebugConfigUtils.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <string>

namespace tcsim {
namespace {

/// Restores the process-wide switches after each test.
class DebugConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        debug::enabled = false;
        debug::raw = false;
        debug::every = 200;
        debug::raw_max = 512;
        debug::excerpt_max = 100;
        debug::top_levels = 3;
    }
};

std::size_t countLines(const std::string &s) {
    return static_cast<std::size_t>(std::count(s.begin(), s.end(), '\n'));
}

} // namespace

TEST_F(DebugConfigTest, DiscardLogIsExcerptedWithoutDebug) {
    const std::string frame(300, 'x');
    debug::excerpt_max = 10;

    ::testing::internal::CaptureStderr();
    debug::log_discard("OrderbookStream", "Failed to parse message", frame);
    const std::string out = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(out, "[OrderbookStream] Failed to parse message: xxxxxxxxxx\n");
}

TEST_F(DebugConfigTest, DiscardLogAppendsRawOnlyWithDebugAndRaw) {
    const std::string frame = R"({"event":"subscribe"})";

    debug::raw = true; // master switch still off
    ::testing::internal::CaptureStderr();
    debug::log_discard("OrderbookStream", "Received message without orderbook data", frame);
    EXPECT_EQ(::testing::internal::GetCapturedStderr().find("raw="), std::string::npos);

    debug::enabled = true;
    debug::raw_max = 8;
    ::testing::internal::CaptureStderr();
    debug::log_discard("OrderbookStream", "Received message without orderbook data", frame);
    const std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("  raw=\"{\"event\"\"\n"), std::string::npos) << out;
}

TEST_F(DebugConfigTest, SamplingFollowsEvery) {
    debug::every = 3;
    std::uint64_t counter = 0;
    int hits = 0;
    for (int i = 0; i < 9; ++i) hits += debug::dbg_sample(counter) ? 1 : 0;
    EXPECT_EQ(hits, 3);

    debug::every = 0;
    EXPECT_FALSE(debug::dbg_sample(counter));
}

// One header line plus one ladder row per level, capped by the deeper side.
TEST_F(DebugConfigTest, BookDumpPrintsLadderRows) {
    const OrderBookSnapshot book({{101.0, 1.0}, {102.0, 2.0}, {103.0, 3.0}}, {{100.0, 4.0}},
                                 OrderBookSnapshot::Clock::now(), 0.25, 7);

    debug::top_levels = 2;
    ::testing::internal::CaptureStderr();
    debug::dbg_book("OrderbookStream", book);
    std::string out = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(out.rfind("[OrderbookStream][BOOK#7] asks=3 bids=1", 0), 0u) << out;
    EXPECT_NE(out.find("spread=1"), std::string::npos);
    EXPECT_EQ(countLines(out), 3u);

    debug::top_levels = 10;
    ::testing::internal::CaptureStderr();
    debug::dbg_book("OrderbookStream", book);
    out = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(countLines(out), 4u);
}

} // namespace tcsim
