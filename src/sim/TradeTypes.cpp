#include "sim/TradeTypes.hpp"

#include <boost/algorithm/string.hpp>

namespace tcsim {
    const char *to_string(OrderType t) {
        switch (t) {
            case OrderType::MARKET: return "Market";
            case OrderType::LIMIT: return "Limit";
            case OrderType::STOP_LIMIT: return "Stop-Limit";
            case OrderType::TAKE_PROFIT: return "Take-Profit";
            default: return "Unknown";
        }
    }

    const char *to_string(TradeSide s) {
        return s == TradeSide::BUY ? "buy" : "sell";
    }

    OrderType parse_order_type(std::string_view s) {
        const std::string v = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(s)));

        if (v == "market") return OrderType::MARKET;
        if (v == "limit") return OrderType::LIMIT;
        if (v == "stop-limit") return OrderType::STOP_LIMIT;
        if (v == "take-profit") return OrderType::TAKE_PROFIT;
        return OrderType::UNKNOWN;
    }

    std::optional<TradeSide> parse_side(std::string_view s) {
        const std::string v = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(s)));

        if (v == "buy") return TradeSide::BUY;
        if (v == "sell") return TradeSide::SELL;
        return std::nullopt;
    }
} // namespace tcsim
