#include "utils/LatencyInstrument.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace tcsim {
    LatencyInstrument::LatencyInstrument(std::size_t max_samples) : max_samples_(max_samples) {
        if (max_samples_ == 0) throw std::invalid_argument("LatencyInstrument: max_samples must be positive");
    }

    void LatencyInstrument::start(const std::string &name) {
        const auto now = Clock::now();
        std::lock_guard<std::mutex> lk(mtx_);
        started_[StartKey{name, std::this_thread::get_id()}] = now;
    }

    double LatencyInstrument::stop(const std::string &name) {
        const auto now = Clock::now();
        std::lock_guard<std::mutex> lk(mtx_);

        const auto it = started_.find(StartKey{name, std::this_thread::get_id()});
        if (it == started_.end()) {
            std::cerr << "[LatencyInstrument] No start time found for operation: " << name << "\n";
            return 0.0;
        }

        const double elapsed_ms = std::chrono::duration<double, std::milli>(now - it->second).count();
        started_.erase(it);

        auto &samples = history_[name];
        samples.push_back(elapsed_ms);
        while (samples.size() > max_samples_) samples.pop_front();

        return elapsed_ms;
    }

    LatencyStats LatencyInstrument::stats_locked_(const std::deque<double> &samples) const {
        LatencyStats s;
        if (samples.empty()) return s;

        std::vector<double> sorted(samples.begin(), samples.end());
        std::sort(sorted.begin(), sorted.end());

        const std::size_t n = sorted.size();
        s.count = n;
        s.min = sorted.front();
        s.max = sorted.back();
        s.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(n);
        s.median = (n % 2 == 1) ? sorted[n / 2] : (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;

        // Tail percentiles are noise on tiny samples; report the max until there is enough data.
        s.p95 = n >= 20 ? sorted[static_cast<std::size_t>(0.95 * static_cast<double>(n)) - 1] : s.max;
        s.p99 = n >= 100 ? sorted[static_cast<std::size_t>(0.99 * static_cast<double>(n)) - 1] : s.max;
        return s;
    }

    LatencyStats LatencyInstrument::stats(const std::string &name) const {
        std::lock_guard<std::mutex> lk(mtx_);
        const auto it = history_.find(name);
        if (it == history_.end()) return LatencyStats{};
        return stats_locked_(it->second);
    }

    std::map<std::string, LatencyStats> LatencyInstrument::all_stats() const {
        std::lock_guard<std::mutex> lk(mtx_);
        std::map<std::string, LatencyStats> out;
        for (const auto &[name, samples]: history_) out.emplace(name, stats_locked_(samples));
        return out;
    }

    std::vector<double> LatencyInstrument::history(const std::string &name) const {
        std::lock_guard<std::mutex> lk(mtx_);
        const auto it = history_.find(name);
        if (it == history_.end()) return {};
        return {it->second.begin(), it->second.end()};
    }

    void LatencyInstrument::reset() {
        std::lock_guard<std::mutex> lk(mtx_);
        history_.clear();
        started_.clear();
    }

    void LatencyInstrument::reset(const std::string &name) {
        std::lock_guard<std::mutex> lk(mtx_);
        history_.erase(name);
        std::erase_if(started_, [&name](const auto &kv) { return kv.first.first == name; });
    }
} // namespace tcsim
