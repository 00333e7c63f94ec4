#include "sim/CostEstimationPipeline.hpp"

#include <iostream>
#include <memory>

#include "orderbook/OrderBookUtils.hpp"

namespace tcsim {
    CostEstimationPipeline::CostEstimationPipeline(const ISnapshotSource &source,
                                                   MarketImpactConfig impact_cfg,
                                                   std::size_t max_samples)
        : source_(source), impact_(impact_cfg), latency_(max_samples) {
    }

    TradeEstimate CostEstimationPipeline::estimate(const TradeRequest &req) {
        TradeEstimate out;
        out.request = req;
        out.timestamp = std::chrono::system_clock::now();

        latency_.start(kOpTotal);

        latency_.start(kOpSnapshot);
        const std::shared_ptr<const OrderBookSnapshot> snap = source_.snapshot();
        out.latencies.snapshot = latency_.stop(kOpSnapshot);

        if (!snap || snap->empty()) {
            std::cerr << "[Pipeline] Cannot estimate trade: empty orderbook\n";
            out.reason = kEmptyBookReason;
            out.latencies.total = latency_.stop(kOpTotal);
            return out;
        }

        const OrderBookSnapshot &book = *snap;
        out.snapshot_sequence = book.sequence();
        out.mid_price = *book.mid_price();
        out.notional = req.quantity * out.mid_price;
        out.reference_price = req.side == TradeSide::BUY ? book.best_ask()->price : book.best_bid()->price;

        latency_.start(kOpMakerTaker);
        out.maker_ratio = maker_taker_.estimate(book, req.quantity, req.order_type);
        out.latencies.maker_taker = latency_.stop(kOpMakerTaker);

        latency_.start(kOpFee);
        out.fees = fees_.calculate(out.notional, out.maker_ratio, req.fee_tier);
        out.latencies.fee = latency_.stop(kOpFee);

        latency_.start(kOpSlippage);
        out.slippage = slippage_.estimate(book, req.quantity, req.side, req.slippage_tolerance_pct);
        out.latencies.slippage = latency_.stop(kOpSlippage);

        latency_.start(kOpImpact);
        out.market_impact = impact_.estimate(book, req.quantity, req.side, req.volatility);
        out.latencies.impact = latency_.stop(kOpImpact);

        out.execution = execution_(req.side, req.quantity, out.reference_price, out.notional,
                                   out.slippage, out.market_impact, out.fees);

        out.latencies.total = latency_.stop(kOpTotal);
        out.success = true;
        return out;
    }

    ExecutionEstimate CostEstimationPipeline::execution_(TradeSide side,
                                                         double quantity,
                                                         double reference_price,
                                                         double notional,
                                                         const SlippageEstimate &slippage,
                                                         const MarketImpactEstimate &impact,
                                                         const FeeBreakdown &fees) {
        ExecutionEstimate ex;

        // Uncapped slippage: the tolerance cap is a display bound, not a price.
        const double slippage_amount = slippage.estimated_slippage_pct / 100.0 * reference_price;
        const double adjustment = slippage_amount + impact.total_impact;

        if (side == TradeSide::BUY) {
            ex.price = reference_price + adjustment;
            ex.cost = quantity * ex.price;
            ex.total_cost = ex.cost + fees.total;
            ex.total_cost_pct = notional > 0.0 ? (ex.total_cost / notional - 1.0) * 100.0 : 0.0;
        } else {
            ex.price = reference_price - adjustment;
            ex.cost = quantity * ex.price;
            ex.total_cost = ex.cost - fees.total;
            ex.total_cost_pct = notional > 0.0 ? (1.0 - ex.total_cost / notional) * 100.0 : 0.0;
        }
        return ex;
    }

    BookSummary CostEstimationPipeline::summary() const {
        BookSummary out;

        const std::shared_ptr<const OrderBookSnapshot> snap = source_.snapshot();
        if (!snap || snap->empty()) {
            out.reason = kEmptyBookReason;
            return out;
        }

        const double best_ask = snap->best_ask()->price;
        const double best_bid = snap->best_bid()->price;
        const double spread = best_ask - best_bid;
        const double ask_depth = notionalDepth(snap->asks());
        const double bid_depth = notionalDepth(snap->bids());
        const double depth = ask_depth + bid_depth;

        out.success = true;
        out.status = "Active";
        out.best_ask = roundTo(best_ask, 2);
        out.best_bid = roundTo(best_bid, 2);
        out.mid_price = roundTo((best_ask + best_bid) / 2.0, 2);
        out.spread = roundTo(spread, 2);
        out.spread_pct = best_bid > 0.0 ? roundTo(spread / best_bid * 100.0, 4) : 0.0;
        out.ask_depth = roundTo(ask_depth, 2);
        out.bid_depth = roundTo(bid_depth, 2);
        out.book_imbalance = depth > 0.0 ? roundTo((bid_depth - ask_depth) / depth, 4) : 0.0;
        out.last_latency_ms = roundTo(snap->parse_latency_ms(), 2);
        out.sequence = snap->sequence();
        return out;
    }
} // namespace tcsim
