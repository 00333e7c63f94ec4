#include "models/SlippageEstimator.hpp"

#include <algorithm>
#include <iostream>

namespace tcsim {
    SlippageEstimate SlippageEstimator::estimate(const OrderBookSnapshot &book,
                                                 double quantity,
                                                 TradeSide side,
                                                 double tolerance_pct) const {
        SlippageEstimate out;
        out.max_tolerance_pct = tolerance_pct;

        const BookSide &levels = book.side(side == TradeSide::BUY ? Side::ASK : Side::BID);
        if (levels.empty()) {
            std::cerr << "[SlippageEstimator] Empty " << (side == TradeSide::BUY ? "ask" : "bid")
                    << " side, reporting zero slippage\n";
            return out;
        }

        out.reference_price = levels.front().price;
        out.avg_execution_price = out.reference_price;
        if (quantity <= 0.0) return out;

        // A percentage off a zero-priced top level is undefined.
        if (out.reference_price <= 0.0) {
            std::cerr << "[SlippageEstimator] Zero-priced top of book on the "
                    << (side == TradeSide::BUY ? "ask" : "bid") << " side, reporting zero slippage\n";
            return out;
        }

        /// Accumulate the deviation from the reference instead of raw notional, so a
        /// fill inside the top level is exactly zero slippage.
        double remaining = quantity;
        double deviation_notional = 0.0;
        for (const PriceLevel &lvl: levels) {
            if (remaining <= 0.0) break;

            const double take = std::min(remaining, lvl.size);
            deviation_notional += take * (lvl.price - out.reference_price);
            remaining -= take;
            ++out.levels_consumed;
        }

        if (remaining > 0.0) {
            deviation_notional += remaining * (levels.back().price - out.reference_price);
            out.unfilled_quantity = remaining;
        }
        out.filled_from_book = quantity - out.unfilled_quantity;

        out.avg_execution_price = out.reference_price + deviation_notional / quantity;

        const double signed_pct = (out.avg_execution_price - out.reference_price) / out.reference_price * 100.0;
        out.estimated_slippage_pct = side == TradeSide::BUY ? signed_pct : -signed_pct;

        out.capped_slippage_pct = std::min(out.estimated_slippage_pct, tolerance_pct);
        out.exceeds_tolerance = out.estimated_slippage_pct > tolerance_pct;
        return out;
    }
} // namespace tcsim
