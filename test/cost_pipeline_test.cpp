#include "sim/CostEstimationPipeline.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "book_fixtures.h"
#include "mocks/mock_snapshot_source.h"

#include <cmath>
#include <memory>
#include <string>

using ::testing::Return;

namespace tcsim {
namespace {

TradeRequest marketBuy(double qty) {
    TradeRequest req;
    req.order_type = OrderType::MARKET;
    req.side = TradeSide::BUY;
    req.quantity = qty;
    req.fee_tier = "Tier 1";
    req.slippage_tolerance_pct = 0.5;
    req.volatility = 0.05;
    return req;
}

class CostPipelineTest : public ::testing::Test {
protected:
    StaticSnapshotSource source{test::fixtureBook()};
    CostEstimationPipeline pipeline{source};
};

} // namespace

TEST_F(CostPipelineTest, SummaryOfFixtureBook) {
    const BookSummary s = pipeline.summary();

    ASSERT_TRUE(s.success);
    EXPECT_EQ(s.status, "Active");
    EXPECT_DOUBLE_EQ(s.best_ask, 29880.0);
    EXPECT_DOUBLE_EQ(s.best_bid, 29875.0);
    EXPECT_DOUBLE_EQ(s.spread, 5.0);
    EXPECT_DOUBLE_EQ(s.mid_price, 29877.5);
    EXPECT_DOUBLE_EQ(s.spread_pct, 0.0167); // 5 / 29875 * 100, 4 decimals
    EXPECT_GT(s.ask_depth, s.bid_depth);
    EXPECT_LT(s.book_imbalance, 0.0);
    EXPECT_GE(s.book_imbalance, -1.0);
}

TEST_F(CostPipelineTest, MarketBuyEndToEnd) {
    const TradeEstimate e = pipeline.estimate(marketBuy(1.0));

    ASSERT_TRUE(e.success) << e.reason;
    EXPECT_DOUBLE_EQ(e.reference_price, 29880.0);
    EXPECT_DOUBLE_EQ(e.mid_price, 29877.5);
    EXPECT_DOUBLE_EQ(e.notional, 29877.5);
    EXPECT_GE(e.execution.price, 29880.0);

    // 1.0 fits in the top ask level: no slippage, so the premium over the ask is pure impact.
    EXPECT_EQ(e.slippage.estimated_slippage_pct, 0.0);
    EXPECT_NEAR(e.execution.price, 29880.0 + e.market_impact.total_impact, 1e-9);
    EXPECT_NEAR(e.execution.cost, 1.0 * e.execution.price, 1e-9);
    EXPECT_NEAR(e.execution.total_cost, e.execution.cost + e.fees.total, 1e-9);
    EXPECT_NEAR(e.execution.total_cost_pct, (e.execution.total_cost / e.notional - 1.0) * 100.0, 1e-9);
    EXPECT_GT(e.execution.total_cost_pct, 0.0);

    EXPECT_GE(e.maker_ratio, 0.0);
    EXPECT_LE(e.maker_ratio, 0.2);
    EXPECT_EQ(e.fees.tier, "Tier 1");
    EXPECT_EQ(e.request.quantity, 1.0);
}

// Selling subtracts slippage, impact and fees; a positive cost pct still means worse than mid.
TEST_F(CostPipelineTest, MarketSellEndToEnd) {
    TradeRequest req = marketBuy(2.0);
    req.side = TradeSide::SELL;
    const TradeEstimate e = pipeline.estimate(req);

    ASSERT_TRUE(e.success);
    EXPECT_DOUBLE_EQ(e.reference_price, 29875.0);
    EXPECT_LT(e.execution.price, 29875.0);

    const double slip_amount = e.slippage.estimated_slippage_pct / 100.0 * 29875.0;
    EXPECT_NEAR(e.execution.price, 29875.0 - slip_amount - e.market_impact.total_impact, 1e-9);
    EXPECT_NEAR(e.execution.total_cost, e.execution.cost - e.fees.total, 1e-9);
    EXPECT_GT(e.execution.total_cost_pct, 0.0);
}

TEST_F(CostPipelineTest, LimitOrderUsesFixedMakerRatio) {
    TradeRequest req = marketBuy(1.0);
    req.order_type = OrderType::LIMIT;

    const TradeEstimate e = pipeline.estimate(req);
    ASSERT_TRUE(e.success);
    EXPECT_DOUBLE_EQ(e.maker_ratio, 0.8);
    EXPECT_NEAR(e.fees.total, e.notional * (0.8 * 0.0008 + 0.2 * 0.0010), 1e-9);
}

// The uncapped slippage drives the price; the capped figure is only reported.
TEST_F(CostPipelineTest, ExecutionUsesUncappedSlippage) {
    TradeRequest req = marketBuy(10.0);
    req.slippage_tolerance_pct = 0.0;

    const TradeEstimate e = pipeline.estimate(req);
    ASSERT_TRUE(e.success);
    EXPECT_TRUE(e.slippage.exceeds_tolerance);
    EXPECT_DOUBLE_EQ(e.slippage.capped_slippage_pct, 0.0);

    const double slip_amount = e.slippage.estimated_slippage_pct / 100.0 * 29880.0;
    EXPECT_NEAR(e.execution.price, 29880.0 + slip_amount + e.market_impact.total_impact, 1e-9);
}

TEST_F(CostPipelineTest, RecordsStageLatencies) {
    for (int i = 0; i < 3; ++i) pipeline.estimate(marketBuy(1.0));

    const auto stats = pipeline.latency_stats();
    for (const char *op: {CostEstimationPipeline::kOpTotal, CostEstimationPipeline::kOpSnapshot,
                          CostEstimationPipeline::kOpMakerTaker, CostEstimationPipeline::kOpFee,
                          CostEstimationPipeline::kOpSlippage, CostEstimationPipeline::kOpImpact}) {
        ASSERT_TRUE(stats.contains(op)) << op;
        EXPECT_EQ(stats.at(op).count, 3u) << op;
    }
}

TEST(CostPipelineEmptyBookTest, EstimateFailsWithReason) {
    StaticSnapshotSource source{test::emptyBook()};
    CostEstimationPipeline pipeline{source};

    TradeEstimate e;
    EXPECT_NO_THROW(e = pipeline.estimate(marketBuy(1.0)));
    EXPECT_FALSE(e.success);
    EXPECT_NE(e.reason.find("empty orderbook"), std::string::npos);

    const BookSummary s = pipeline.summary();
    EXPECT_FALSE(s.success);
    EXPECT_EQ(s.status, "No data");
}

// One side missing is as good as empty.
TEST(CostPipelineEmptyBookTest, OneSidedBookFails) {
    StaticSnapshotSource source{OrderBookSnapshot({{29880.0, 1.5}}, {})};
    CostEstimationPipeline pipeline{source};

    EXPECT_FALSE(pipeline.estimate(marketBuy(1.0)).success);
}

TEST(CostPipelineEdgeBookTest, ZeroPricedBidGivesFiniteSellEstimate) {
    StaticSnapshotSource source{OrderBookSnapshot({{1.0, 1.0}}, {{0.0, 5.0}})};
    CostEstimationPipeline pipeline{source};

    TradeRequest req = marketBuy(1.0);
    req.side = TradeSide::SELL;
    const TradeEstimate e = pipeline.estimate(req);

    ASSERT_TRUE(e.success);
    EXPECT_DOUBLE_EQ(e.reference_price, 0.0);
    EXPECT_TRUE(std::isfinite(e.slippage.estimated_slippage_pct));
    EXPECT_TRUE(std::isfinite(e.market_impact.total_impact));
    EXPECT_TRUE(std::isfinite(e.execution.price));
    EXPECT_TRUE(std::isfinite(e.execution.total_cost));
    EXPECT_TRUE(std::isfinite(e.execution.total_cost_pct));
}

// Each estimate pulls exactly one snapshot and every stage sees that one book.
TEST(CostPipelineSourceTest, PullsSnapshotOncePerEstimate) {
    MockSnapshotSource source;
    auto book = std::make_shared<const OrderBookSnapshot>(
        OrderBookSnapshot({{29880.0, 1.5}, {29881.5, 0.75}}, {{29875.0, 1.2}},
                          OrderBookSnapshot::Clock::now(), 0.1, 42));

    EXPECT_CALL(source, snapshot()).Times(2).WillRepeatedly(Return(book));

    CostEstimationPipeline pipeline{source};
    const TradeEstimate a = pipeline.estimate(marketBuy(1.0));
    const TradeEstimate b = pipeline.estimate(marketBuy(0.5));

    EXPECT_EQ(a.snapshot_sequence, 42u);
    EXPECT_EQ(b.snapshot_sequence, 42u);
}

TEST(CostPipelineSourceTest, NullSnapshotIsTreatedAsEmpty) {
    MockSnapshotSource source;
    EXPECT_CALL(source, snapshot()).WillRepeatedly(Return(nullptr));

    CostEstimationPipeline pipeline{source};
    EXPECT_FALSE(pipeline.estimate(marketBuy(1.0)).success);
    EXPECT_FALSE(pipeline.summary().success);
}

} // namespace tcsim
