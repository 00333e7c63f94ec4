#include "orderbook/OrderBookSnapshot.hpp"
#include "orderbook/OrderBookUtils.hpp"

#include <utility>

namespace tcsim {
    OrderBookSnapshot::OrderBookSnapshot(BookSide asks,
                                         BookSide bids,
                                         Clock::time_point captured_at,
                                         double parse_latency_ms,
                                         std::uint64_t sequence,
                                         std::optional<std::int64_t> exchange_ts_ms)
        : asks_(std::move(asks)),
          bids_(std::move(bids)),
          captured_at_(captured_at),
          parse_latency_ms_(parse_latency_ms),
          sequence_(sequence),
          exchange_ts_ms_(exchange_ts_ms) {
        /// Cheap when the stream already normalized both sides.
        normalizeSide(asks_, Side::ASK);
        normalizeSide(bids_, Side::BID);
    }

    std::optional<double> OrderBookSnapshot::mid_price() const noexcept {
        if (empty()) return std::nullopt;
        return (asks_.front().price + bids_.front().price) / 2.0;
    }
} // namespace tcsim
