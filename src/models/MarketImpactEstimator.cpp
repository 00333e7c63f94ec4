#include "models/MarketImpactEstimator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace tcsim {
    MarketImpactEstimator::MarketImpactEstimator(MarketImpactConfig cfg) : cfg_(cfg) {
        if (!(cfg_.execution_timeframe_seconds > 0.0))
            throw std::invalid_argument("MarketImpactEstimator: execution_timeframe_seconds must be > 0");
        if (cfg_.permanent_impact_factor < 0.0 || cfg_.temporary_impact_factor < 0.0)
            throw std::invalid_argument("MarketImpactEstimator: impact factors must be >= 0");
    }

    double MarketImpactEstimator::depthNearMid(const OrderBookSnapshot &book, double mid) {
        const double ask_limit = mid * (1.0 + kDepthBand);
        const double bid_limit = mid * (1.0 - kDepthBand);

        double depth = 0.0;
        // Both sides are sorted best-first, so stop at the first level outside the band.
        for (const PriceLevel &a: book.asks()) {
            if (a.price > ask_limit) break;
            depth += a.price * a.size;
        }
        for (const PriceLevel &b: book.bids()) {
            if (b.price < bid_limit) break;
            depth += b.price * b.size;
        }
        return depth;
    }

    MarketImpactEstimate MarketImpactEstimator::estimate(const OrderBookSnapshot &book,
                                                         double quantity,
                                                         TradeSide /*side*/,
                                                         double volatility) const {
        MarketImpactEstimate out;

        const auto mid = book.mid_price();
        if (!mid) {
            std::cerr << "[MarketImpactEstimator] Empty orderbook, reporting zero impact\n";
            return out;
        }

        out.mid_price = *mid;
        out.notional = quantity * out.mid_price;
        out.market_depth = depthNearMid(book, out.mid_price);

        if (cfg_.volatility_scaling) {
            const double timeframe_vol = volatility * std::sqrt(cfg_.execution_timeframe_seconds / kSecondsPerDay);
            out.volatility_scale = std::clamp(timeframe_vol / kVolReference, 0.5, 2.0);
        }

        out.depth_scale = out.market_depth > 0.0
                              ? std::clamp(out.notional / out.market_depth, 0.5, 3.0)
                              : 3.0;

        const double scale = out.volatility_scale * out.depth_scale;
        out.permanent_impact = cfg_.permanent_impact_factor * scale * out.notional;
        out.temporary_impact = cfg_.temporary_impact_factor * scale * out.notional
                               * std::sqrt(1.0 / cfg_.execution_timeframe_seconds);
        out.total_impact = out.permanent_impact + out.temporary_impact;
        out.impact_bps = out.mid_price > 0.0 ? out.total_impact / out.mid_price * 1e4 : 0.0;
        return out;
    }
} // namespace tcsim
