#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tcsim {
    enum class OrderType : std::uint8_t { MARKET, LIMIT, STOP_LIMIT, TAKE_PROFIT, UNKNOWN };

    enum class TradeSide : std::uint8_t { BUY, SELL };

    const char *to_string(OrderType t);

    const char *to_string(TradeSide s);

    /// Case-insensitive: "market", "Limit", "stop-limit", "Take-Profit". UNKNOWN otherwise.
    OrderType parse_order_type(std::string_view s);

    /// "buy" / "sell", case-insensitive.
    std::optional<TradeSide> parse_side(std::string_view s);

    /// One user action. Built by TradeInputValidator, consumed once by the pipeline.
    struct TradeRequest {
        std::string asset{"BTC-USDT-SWAP"};
        OrderType order_type{OrderType::MARKET};
        TradeSide side{TradeSide::BUY};
        double quantity{0.0}; ///< base currency, > 0
        std::string fee_tier{"Tier 1"};
        double slippage_tolerance_pct{0.5}; ///< >= 0
        double volatility{0.05}; ///< daily, fraction, >= 0
    };
} // namespace tcsim
