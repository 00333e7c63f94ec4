#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "orderbook/OrderBookSnapshot.hpp"

namespace tcsim {
    enum class FeedParseResult : std::uint8_t {
        OK,
        MISSING_FIELDS, // valid JSON, but no asks/bids pair
        MALFORMED // not JSON, or a level that is not numeric
    };

    /// One full-depth book as it arrived on the wire, before normalization.
    struct BookFrame {
        BookSide asks;
        BookSide bids;
        std::optional<std::int64_t> exchange_ts_ms;

        void reset() {
            asks.clear();
            bids.clear();
            exchange_ts_ms.reset();
        }
    };

    /**
     * Decodes full-replacement L2 frames.
     *
     * Accepted shapes:
     *   {"asks": [["29880.0","1.5"], ...], "bids": [...], "ts": "..."}
     *   {"arg": {...}, "data": [{"asks": [...], "bids": [...], "ts": "..."}]}   (OKX v5 envelope)
     *
     * Price/size columns may be strings or numbers; extra columns are ignored.
     */
    struct BookFeedAdapter {
        FeedParseResult parse(std::string_view msg, BookFrame &out) const noexcept;
    };
} // namespace tcsim
