#pragma once

#include <cstddef>

#include "orderbook/OrderBookSnapshot.hpp"
#include "sim/TradeTypes.hpp"

namespace tcsim {
    struct SlippageEstimate {
        double estimated_slippage_pct{0.0}; ///< uncapped; positive = adverse
        double capped_slippage_pct{0.0}; ///< min(estimate, tolerance) for display and risk checks
        double max_tolerance_pct{0.0};
        bool exceeds_tolerance{false};

        double reference_price{0.0}; ///< best price on the walked side
        double avg_execution_price{0.0};
        double filled_from_book{0.0}; ///< quantity matched against visible levels
        double unfilled_quantity{0.0}; ///< remainder charged at the worst visible price
        std::size_t levels_consumed{0};
    };

    /**
     * Walks the side the order takes from (asks for a buy, bids for a sell),
     * best price first, until the quantity is filled.
     *
     * Quantity beyond the visible depth is charged at the last level's price,
     * i.e. the book is treated as infinitely deep at its worst quote. That is a
     * modelling simplification, not something an exchange guarantees.
     */
    class SlippageEstimator {
    public:
        [[nodiscard]] SlippageEstimate estimate(const OrderBookSnapshot &book,
                                                double quantity,
                                                TradeSide side,
                                                double tolerance_pct) const;
    };
} // namespace tcsim
