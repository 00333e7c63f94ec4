#include "sim/TradeInputValidator.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <string>

namespace tcsim {
namespace {

bool hasError(const ValidationResult &r, const std::string &field, const std::string &needle) {
    return std::any_of(r.errors.begin(), r.errors.end(), [&](const FieldError &e) {
        return e.field == field && e.message.find(needle) != std::string::npos;
    });
}

TradeInputs validInputs() {
    TradeInputs in;
    in.order_type = "Market";
    in.side = "buy";
    in.quantity = "1.0";
    in.fee_tier = "Tier 1";
    in.slippage_tolerance = "0.5";
    in.volatility = "0.05";
    return in;
}

} // namespace

TEST(TradeInputValidatorTest, BuildsRequestFromValidInputs) {
    TradeInputs in = validInputs();
    in.order_type = "stop-limit";
    in.side = " SELL ";
    in.quantity = " 2.5 ";

    const ValidationResult r = TradeInputValidator{}.validate(in);
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.request.has_value());
    EXPECT_EQ(r.request->order_type, OrderType::STOP_LIMIT);
    EXPECT_EQ(r.request->side, TradeSide::SELL);
    EXPECT_DOUBLE_EQ(r.request->quantity, 2.5);
    EXPECT_DOUBLE_EQ(r.request->slippage_tolerance_pct, 0.5);
    EXPECT_EQ(r.request->fee_tier, "Tier 1");
    EXPECT_EQ(r.request->asset, "BTC-USDT-SWAP");
}

TEST(TradeInputValidatorTest, RejectsNonPositiveQuantity) {
    for (const char *q: {"0", "-1", "-0.0001"}) {
        TradeInputs in = validInputs();
        in.quantity = q;
        const ValidationResult r = TradeInputValidator{}.validate(in);

        EXPECT_FALSE(r.ok()) << q;
        EXPECT_FALSE(r.request.has_value());
        EXPECT_TRUE(hasError(r, "quantity", "Quantity must be positive")) << q;
    }
}

TEST(TradeInputValidatorTest, RejectsNonNumericFields) {
    TradeInputs in = validInputs();
    in.quantity = "one";
    in.slippage_tolerance = "0.5%";
    in.volatility = "";

    const ValidationResult r = TradeInputValidator{}.validate(in);
    EXPECT_EQ(r.errors.size(), 3u);
    EXPECT_TRUE(hasError(r, "quantity", "Invalid quantity"));
    EXPECT_TRUE(hasError(r, "slippage_tolerance", "must be a number"));
    EXPECT_TRUE(hasError(r, "volatility", "must be a number"));
}

TEST(TradeInputValidatorTest, RejectsNegativeToleranceAndVolatility) {
    TradeInputs in = validInputs();
    in.slippage_tolerance = "-0.1";
    in.volatility = "-0.2";

    const ValidationResult r = TradeInputValidator{}.validate(in);
    EXPECT_TRUE(hasError(r, "slippage_tolerance", "Slippage tolerance cannot be negative"));
    EXPECT_TRUE(hasError(r, "volatility", "Volatility cannot be negative"));
}

// Zero tolerance and zero volatility are valid edges.
TEST(TradeInputValidatorTest, AcceptsZeroToleranceAndVolatility) {
    TradeInputs in = validInputs();
    in.slippage_tolerance = "0";
    in.volatility = "0";

    EXPECT_TRUE(TradeInputValidator{}.validate(in).ok());
}

TEST(TradeInputValidatorTest, RejectsUnknownOrderTypeAndSide) {
    TradeInputs in = validInputs();
    in.order_type = "Iceberg";
    in.side = "hold";

    const ValidationResult r = TradeInputValidator{}.validate(in);
    EXPECT_TRUE(hasError(r, "order_type", "Iceberg"));
    EXPECT_TRUE(hasError(r, "side", "buy"));
}

// The fee tier is resolved (with fallback) by the fee model, not rejected here.
TEST(TradeInputValidatorTest, UnknownFeeTierPassesThrough) {
    TradeInputs in = validInputs();
    in.fee_tier = "Diamond";

    const ValidationResult r = TradeInputValidator{}.validate(in);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.request->fee_tier, "Diamond");
}

} // namespace tcsim
