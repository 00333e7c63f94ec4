#pragma once

#include <optional>
#include <string>

#include "orderbook/OrderBookSnapshot.hpp"

namespace tcsim {
    /// "29880.5" -> 29880.5; nullopt when the text is not a complete finite number.
    std::optional<double> parseDecimal(const std::string &s);

    /**
     * Drops unusable levels and sorts one side in place.
     *  - asks: ascending price (best first)
     *  - bids: descending price (best first)
     * Skips the sort when the side already satisfies the ordering.
     */
    void normalizeSide(BookSide &levels, Side side);

    [[nodiscard]] bool isSorted(const BookSide &levels, Side side);

    /// Σ price * size over the whole side.
    [[nodiscard]] double notionalDepth(const BookSide &levels);

    /// Σ size over the whole side.
    [[nodiscard]] double sizeDepth(const BookSide &levels);

    /// Round half away from zero to `decimals` places (display helper).
    [[nodiscard]] double roundTo(double value, int decimals);
} // namespace tcsim
