#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

#include "abstract/SnapshotSource.hpp"
#include "models/FeeModel.hpp"
#include "models/MakerTakerEstimator.hpp"
#include "models/MarketImpactEstimator.hpp"
#include "models/SlippageEstimator.hpp"
#include "sim/TradeTypes.hpp"
#include "utils/LatencyInstrument.hpp"

namespace tcsim {
    struct ExecutionEstimate {
        double price{0.0}; ///< reference +/- slippage +/- impact
        double cost{0.0}; ///< quantity * price
        double total_cost{0.0}; ///< cost + fees (buy) or cost - fees (sell)
        double total_cost_pct{0.0}; ///< > 0 means worse than mid notional, either side
    };

    /// Milliseconds per stage of one estimate() call.
    struct StageLatencies {
        double total{0.0};
        double snapshot{0.0};
        double maker_taker{0.0};
        double fee{0.0};
        double slippage{0.0};
        double impact{0.0};
    };

    struct TradeEstimate {
        bool success{false};
        std::string reason; ///< set when success == false

        TradeRequest request;
        std::uint64_t snapshot_sequence{0};
        double reference_price{0.0}; ///< best ask for a buy, best bid for a sell
        double mid_price{0.0};
        double notional{0.0}; ///< quantity * mid

        double maker_ratio{0.0};
        FeeBreakdown fees;
        SlippageEstimate slippage;
        MarketImpactEstimate market_impact;
        ExecutionEstimate execution;
        StageLatencies latencies;

        std::chrono::system_clock::time_point timestamp{};
    };

    /// Display-rounded view of the current book.
    struct BookSummary {
        bool success{false};
        std::string reason;
        std::string status{"No data"};

        double best_ask{0.0};
        double best_bid{0.0};
        double mid_price{0.0};
        double spread{0.0};
        double spread_pct{0.0}; ///< percent of best bid
        double ask_depth{0.0}; ///< Σ price * size
        double bid_depth{0.0};
        double book_imbalance{0.0}; ///< (bid - ask) / (bid + ask), in [-1, 1]
        double last_latency_ms{0.0};
        std::uint64_t sequence{0};
    };

    /**
     * @brief Turns one snapshot pull plus one TradeRequest into a TradeEstimate.
     *
     * The snapshot source is injected and must outlive the pipeline. Every
     * stage reads the same snapshot, so a concurrent book update cannot mix
     * two books into one estimate. Concurrent estimate() calls are safe; they
     * share only the LatencyInstrument.
     */
    class CostEstimationPipeline {
    public:
        static constexpr const char *kEmptyBookReason = "empty orderbook";

        // Stage names recorded in the LatencyInstrument.
        static constexpr const char *kOpTotal = "trade_estimate";
        static constexpr const char *kOpSnapshot = "snapshot_pull";
        static constexpr const char *kOpMakerTaker = "maker_taker_estimation";
        static constexpr const char *kOpFee = "fee_calculation";
        static constexpr const char *kOpSlippage = "slippage_estimation";
        static constexpr const char *kOpImpact = "market_impact_estimation";

        explicit CostEstimationPipeline(const ISnapshotSource &source,
                                        MarketImpactConfig impact_cfg = {},
                                        std::size_t max_samples = 1000);

        /// Never throws for a valid request; an empty book yields success == false.
        TradeEstimate estimate(const TradeRequest &req);

        [[nodiscard]] BookSummary summary() const;

        [[nodiscard]] std::map<std::string, LatencyStats> latency_stats() const { return latency_.all_stats(); }

    private:
        static ExecutionEstimate execution_(TradeSide side,
                                            double quantity,
                                            double reference_price,
                                            double notional,
                                            const SlippageEstimate &slippage,
                                            const MarketImpactEstimate &impact,
                                            const FeeBreakdown &fees);

        const ISnapshotSource &source_;

        MakerTakerEstimator maker_taker_;
        FeeModel fees_;
        SlippageEstimator slippage_;
        MarketImpactEstimator impact_;

        LatencyInstrument latency_;
    };
} // namespace tcsim
