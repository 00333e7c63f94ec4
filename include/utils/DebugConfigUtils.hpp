#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string_view>

#include "orderbook/OrderBookSnapshot.hpp"

/**
 * Process-wide diagnostics switches for the feed path.
 *
 * Set once from the command line before the stream starts; read with relaxed
 * loads on the stream thread.
 */
namespace tcsim::debug {
    inline std::atomic<bool> enabled{false}; // master switch for per-book output
    inline std::atomic<bool> raw{false}; // append the raw frame to discard logs
    inline std::atomic<int> every{200}; // print 1/N published books
    inline std::atomic<int> raw_max{512}; // raw frame truncation (debug)
    inline std::atomic<int> excerpt_max{100}; // frame truncation in always-on logs
    inline std::atomic<int> top_levels{3}; // ladder depth in book dumps

    inline bool dbg_on() noexcept {
        return enabled.load(std::memory_order_relaxed);
    }

    inline bool dbg_sample(std::uint64_t &counter) noexcept {
        const int n = every.load(std::memory_order_relaxed);
        return n > 0 && (++counter % static_cast<std::uint64_t>(n) == 0);
    }

    inline std::string_view clip(std::string_view msg, int max_chars) noexcept {
        if (max_chars <= 0) return {};
        return msg.size() > static_cast<std::size_t>(max_chars) ? msg.substr(0, static_cast<std::size_t>(max_chars)) : msg;
    }

    inline std::string_view excerpt(std::string_view msg) noexcept {
        return clip(msg, excerpt_max.load(std::memory_order_relaxed));
    }

    /// A dropped frame is always reported; with --debug --debug_raw the longer raw copy follows.
    inline void log_discard(std::string_view component, std::string_view what, std::string_view msg) {
        std::cerr << "[" << component << "] " << what << ": " << excerpt(msg) << "\n";
        if (!dbg_on() || !raw.load(std::memory_order_relaxed)) return;

        const std::string_view body = clip(msg, raw_max.load(std::memory_order_relaxed));
        if (!body.empty()) std::cerr << "  raw=\"" << body << "\"\n";
    }

    /// Header line plus an ask/bid ladder of the top levels, best first on both sides.
    inline void dbg_book(std::string_view component, const OrderBookSnapshot &snap) {
        std::cerr << "[" << component << "][BOOK#" << snap.sequence() << "] "
                << "asks=" << snap.asks().size() << " bids=" << snap.bids().size()
                << " parse_ms=" << snap.parse_latency_ms();
        if (!snap.empty()) std::cerr << " spread=" << snap.best_ask()->price - snap.best_bid()->price;
        std::cerr << "\n";

        const int top = top_levels.load(std::memory_order_relaxed);
        const auto rows = std::min<std::size_t>(top > 0 ? static_cast<std::size_t>(top) : 0,
                                                std::max(snap.asks().size(), snap.bids().size()));
        for (std::size_t i = 0; i < rows; ++i) {
            std::cerr << "  " << i << "  ";
            if (i < snap.bids().size()) {
                std::cerr << std::setw(12) << snap.bids()[i].size << " @ " << std::setw(12) << snap.bids()[i].price;
            } else {
                std::cerr << std::setw(27) << "";
            }
            std::cerr << "  |  ";
            if (i < snap.asks().size()) std::cerr << snap.asks()[i].price << " x " << snap.asks()[i].size;
            std::cerr << "\n";
        }
    }
} // namespace tcsim::debug
