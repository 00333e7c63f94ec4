#pragma once

#include "orderbook/OrderBookSnapshot.hpp"
#include "sim/TradeTypes.hpp"

namespace tcsim {
    struct MarketImpactConfig {
        double permanent_impact_factor{2.5e-6};
        double temporary_impact_factor{1.5e-5};
        bool volatility_scaling{true};
        double execution_timeframe_seconds{1.0};
    };

    struct MarketImpactEstimate {
        double permanent_impact{0.0};
        double temporary_impact{0.0};
        double total_impact{0.0}; ///< quote currency
        double impact_bps{0.0}; ///< total_impact / mid * 1e4

        double mid_price{0.0};
        double notional{0.0};
        double market_depth{0.0}; ///< notional resting within 1% of mid, both sides
        double volatility_scale{1.0};
        double depth_scale{1.0};
    };

    /**
     * Almgren-Chriss style closed form:
     *   permanent = k_p * s_vol * s_depth * notional
     *   temporary = k_t * s_vol * s_depth * notional * sqrt(1 / T)
     *
     * s_vol scales the daily volatility to the execution window T, clamped to [0.5, 2].
     * s_depth = notional / depth near mid, clamped to [0.5, 3]; thin books amplify impact.
     */
    class MarketImpactEstimator {
    public:
        static constexpr double kDepthBand = 0.01;
        static constexpr double kSecondsPerDay = 86400.0;
        static constexpr double kVolReference = 0.01;

        explicit MarketImpactEstimator(MarketImpactConfig cfg = {});

        /// Side does not change the estimate; the model is symmetric.
        [[nodiscard]] MarketImpactEstimate estimate(const OrderBookSnapshot &book,
                                                    double quantity,
                                                    TradeSide side,
                                                    double volatility) const;

        /// Σ price * size of asks <= mid * (1 + band) plus bids >= mid * (1 - band).
        [[nodiscard]] static double depthNearMid(const OrderBookSnapshot &book, double mid);

    private:
        MarketImpactConfig cfg_;
    };
} // namespace tcsim
