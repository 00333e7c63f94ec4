#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tcsim {
    struct LatencyStats {
        std::size_t count{0};
        double min{0.0};
        double max{0.0};
        double mean{0.0};
        double median{0.0};
        double p95{0.0}; ///< max until 20 samples exist
        double p99{0.0}; ///< max until 100 samples exist
    };

    /**
     * Per-operation elapsed-time history in milliseconds.
     *
     * - start(name) / stop(name) pairs are matched per calling thread, so two
     *   threads timing the same operation do not clobber each other's start time.
     * - Each operation keeps at most max_samples values; the oldest is dropped first.
     * - All members are safe to call concurrently.
     */
    class LatencyInstrument {
    public:
        using Clock = std::chrono::steady_clock;

        explicit LatencyInstrument(std::size_t max_samples = 1000);

        void start(const std::string &name);

        /// Elapsed ms since the matching start(); 0 (and a warning) without one.
        double stop(const std::string &name);

        [[nodiscard]] LatencyStats stats(const std::string &name) const;

        [[nodiscard]] std::map<std::string, LatencyStats> all_stats() const;

        /// Oldest first.
        [[nodiscard]] std::vector<double> history(const std::string &name) const;

        /// Clears every operation.
        void reset();

        void reset(const std::string &name);

        [[nodiscard]] std::size_t max_samples() const noexcept { return max_samples_; }

    private:
        [[nodiscard]] LatencyStats stats_locked_(const std::deque<double> &samples) const;

        using StartKey = std::pair<std::string, std::thread::id>;

        const std::size_t max_samples_;
        mutable std::mutex mtx_;
        std::map<StartKey, Clock::time_point> started_;
        std::unordered_map<std::string, std::deque<double> > history_;
    };
} // namespace tcsim
