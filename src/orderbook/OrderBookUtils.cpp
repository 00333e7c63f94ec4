#include "orderbook/OrderBookUtils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tcsim {
    std::optional<double> parseDecimal(const std::string &s) {
        if (s.empty()) return std::nullopt;
        try {
            std::size_t consumed = 0;
            const double v = std::stod(s, &consumed);
            if (consumed != s.size() || !std::isfinite(v)) return std::nullopt;
            return v;
        } catch (const std::invalid_argument &) {
            return std::nullopt;
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
    }

    bool isSorted(const BookSide &levels, Side side) {
        if (side == Side::ASK) {
            return std::is_sorted(levels.begin(), levels.end(),
                                  [](const PriceLevel &x, const PriceLevel &y) { return x.price < y.price; });
        }
        return std::is_sorted(levels.begin(), levels.end(),
                              [](const PriceLevel &x, const PriceLevel &y) { return x.price > y.price; });
    }

    void normalizeSide(BookSide &levels, Side side) {
        /// 1) Remove zero-size and garbage levels so they never reach depth sums or top of book
        std::erase_if(levels, [](const PriceLevel &l) {
            return !std::isfinite(l.price) || !std::isfinite(l.size) || l.price < 0.0 || l.isEmpty();
        });

        if (isSorted(levels, side)) return;

        /// 2) Asks ascending, bids descending (stable: equal prices keep feed order)
        if (side == Side::ASK) {
            std::stable_sort(levels.begin(), levels.end(),
                             [](const PriceLevel &x, const PriceLevel &y) { return x.price < y.price; });
        } else {
            std::stable_sort(levels.begin(), levels.end(),
                             [](const PriceLevel &x, const PriceLevel &y) { return x.price > y.price; });
        }
    }

    double notionalDepth(const BookSide &levels) {
        double total = 0.0;
        for (const PriceLevel &l: levels) total += l.price * l.size;
        return total;
    }

    double sizeDepth(const BookSide &levels) {
        double total = 0.0;
        for (const PriceLevel &l: levels) total += l.size;
        return total;
    }

    double roundTo(double value, int decimals) {
        const double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }
} // namespace tcsim
