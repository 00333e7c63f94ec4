#pragma once

#include "orderbook/OrderBookSnapshot.hpp"
#include "sim/TradeTypes.hpp"

namespace tcsim {
    /**
     * Expected share of the order that fills passively (maker), in [0, 1].
     *
     * Non-market orders use fixed shares. Market orders use a top-of-book
     * heuristic: tighter spreads and trades small relative to the best ask
     * raise the maker share, which is capped at kMarketCap.
     */
    class MakerTakerEstimator {
    public:
        static constexpr double kLimitRatio = 0.8;
        static constexpr double kConditionalRatio = 0.5; // Stop-Limit, Take-Profit
        static constexpr double kMarketBase = 0.05;
        static constexpr double kMarketCap = 0.2;
        static constexpr double kSpreadFloor = 0.0001;
        static constexpr double kVolumePenalty = 0.1;

        [[nodiscard]] double estimate(const OrderBookSnapshot &book, double quantity, OrderType type) const;

    private:
        [[nodiscard]] double marketRatio(const OrderBookSnapshot &book, double quantity) const;
    };
} // namespace tcsim
