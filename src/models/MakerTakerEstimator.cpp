#include "models/MakerTakerEstimator.hpp"

#include <algorithm>

namespace tcsim {
    double MakerTakerEstimator::estimate(const OrderBookSnapshot &book, double quantity, OrderType type) const {
        switch (type) {
            case OrderType::MARKET: return marketRatio(book, quantity);
            case OrderType::LIMIT: return kLimitRatio;
            case OrderType::STOP_LIMIT:
            case OrderType::TAKE_PROFIT: return kConditionalRatio;
            default: return 0.0;
        }
    }

    double MakerTakerEstimator::marketRatio(const OrderBookSnapshot &book, double quantity) const {
        if (book.empty()) return 0.0; // all taker

        const PriceLevel &ask = *book.best_ask();
        const PriceLevel &bid = *book.best_bid();

        const double spread_pct = bid.price > 0.0 ? (ask.price - bid.price) / bid.price : 0.0;
        const double vol_ratio = ask.size > 0.0 ? std::min(quantity / ask.size, 1.0) : 1.0;
        const double spread_factor = std::min(kSpreadFloor / std::max(spread_pct, kSpreadFloor), kMarketCap);

        return std::clamp(kMarketBase + spread_factor - vol_ratio * kVolumePenalty, 0.0, kMarketCap);
    }
} // namespace tcsim
