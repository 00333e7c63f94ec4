#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tcsim {
    struct PriceLevel {
        double price{0.0};
        double size{0.0};

        [[nodiscard]] bool isEmpty() const { return size <= 0.0; }
    };

    enum class Side {
        BID,
        ASK
    };

    using BookSide = std::vector<PriceLevel>;

    /**
     * Immutable view of both book sides at one instant.
     *
     * Invariants (established by the constructor, whatever the input order):
     *  - asks sorted non-decreasing by price, bids non-increasing by price
     *  - no level with size 0, negative or non-finite price/size
     *
     * A new snapshot fully replaces the previous one; the feed sends full
     * books, so there is no incremental apply here.
     */
    class OrderBookSnapshot {
    public:
        using Clock = std::chrono::system_clock;

        OrderBookSnapshot() = default;

        OrderBookSnapshot(BookSide asks,
                          BookSide bids,
                          Clock::time_point captured_at = Clock::now(),
                          double parse_latency_ms = 0.0,
                          std::uint64_t sequence = 0,
                          std::optional<std::int64_t> exchange_ts_ms = std::nullopt);

        [[nodiscard]] const BookSide &asks() const noexcept { return asks_; }
        [[nodiscard]] const BookSide &bids() const noexcept { return bids_; }

        /// nullptr when the index is past the side's depth.
        [[nodiscard]] const PriceLevel *ask_ptr(std::size_t i) const noexcept {
            return i < asks_.size() ? &asks_[i] : nullptr;
        }

        [[nodiscard]] const PriceLevel *bid_ptr(std::size_t i) const noexcept {
            return i < bids_.size() ? &bids_[i] : nullptr;
        }

        [[nodiscard]] const PriceLevel *best_ask() const noexcept { return ask_ptr(0); }
        [[nodiscard]] const PriceLevel *best_bid() const noexcept { return bid_ptr(0); }

        [[nodiscard]] const BookSide &side(Side s) const noexcept { return s == Side::BID ? bids_ : asks_; }

        /// True when either side has no levels; estimates need both.
        [[nodiscard]] bool empty() const noexcept { return asks_.empty() || bids_.empty(); }

        /// (best_ask + best_bid) / 2, or nullopt on an empty book.
        [[nodiscard]] std::optional<double> mid_price() const noexcept;

        [[nodiscard]] Clock::time_point captured_at() const noexcept { return captured_at_; }

        /// Local parse + sort time of the frame this book came from (not network transit).
        [[nodiscard]] double parse_latency_ms() const noexcept { return parse_latency_ms_; }

        [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }

        [[nodiscard]] std::optional<std::int64_t> exchange_ts_ms() const noexcept { return exchange_ts_ms_; }

    private:
        BookSide asks_;
        BookSide bids_;
        Clock::time_point captured_at_{};
        double parse_latency_ms_{0.0};
        std::uint64_t sequence_{0};
        std::optional<std::int64_t> exchange_ts_ms_;
    };
} // namespace tcsim
