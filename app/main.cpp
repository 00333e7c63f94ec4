#include "CmdLine.hpp"                   // CmdOptions, parse_cmdline
#include "md/OrderbookStream.hpp"        // OrderbookStream, ConnectionError
#include "sim/CostEstimationPipeline.hpp"
#include "sim/TradeInputValidator.hpp"
#include "utils/DebugConfigUtils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <csignal>
#include <functional>
#include <iomanip>
#include <map>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace {
    void print_summary(const tcsim::BookSummary &s) {
        if (!s.success) {
            std::cout << "[Book] " << s.status << " (" << s.reason << ")\n";
            return;
        }
        std::cout << std::fixed << std::setprecision(2)
                << "[Book] #" << s.sequence
                << " ask=" << s.best_ask << " bid=" << s.best_bid
                << " mid=" << s.mid_price << " spread=" << s.spread
                << std::setprecision(4) << " (" << s.spread_pct << "%)"
                << std::setprecision(2) << " depth ask=" << s.ask_depth << " bid=" << s.bid_depth
                << std::setprecision(4) << " imbalance=" << s.book_imbalance
                << std::setprecision(3) << " parse=" << s.last_latency_ms << "ms\n";
    }

    void print_estimate(const tcsim::TradeEstimate &e) {
        if (!e.success) {
            std::cout << "[Estimate] failed: " << e.reason << "\n";
            return;
        }
        const auto &r = e.request;
        std::cout << std::fixed << std::setprecision(4)
                << "[Estimate] " << tcsim::to_string(r.order_type) << " " << tcsim::to_string(r.side)
                << " " << r.quantity << " " << r.asset << " @ ref " << e.reference_price << "\n"
                << "  maker ratio     : " << e.maker_ratio << "\n"
                << "  fees (" << e.fees.tier << ")  : " << e.fees.total << " (" << e.fees.fee_pct << "%)\n"
                << "  slippage        : " << e.slippage.estimated_slippage_pct << "% (capped "
                << e.slippage.capped_slippage_pct << "%, tolerance " << e.slippage.max_tolerance_pct << "%"
                << (e.slippage.exceeds_tolerance ? ", EXCEEDED" : "") << ")\n"
                << "  market impact   : " << e.market_impact.total_impact << " (" << e.market_impact.impact_bps
                << " bps)\n"
                << "  execution price : " << e.execution.price << "\n"
                << "  total cost      : " << e.execution.total_cost << " (" << e.execution.total_cost_pct << "%)\n"
                << std::setprecision(3)
                << "  latency         : " << e.latencies.total << " ms\n";
    }

    void print_latency(const std::map<std::string, tcsim::LatencyStats> &all) {
        std::cout << "[Latency] per operation (ms):\n" << std::fixed << std::setprecision(4);
        for (const auto &[name, s]: all) {
            std::cout << "  " << std::left << std::setw(26) << name << std::right
                    << " n=" << s.count << " mean=" << s.mean << " median=" << s.median
                    << " p95=" << s.p95 << " p99=" << s.p99 << " max=" << s.max << "\n";
        }
    }
}

int main(int argc, char **argv) {
    CmdOptions options;
    if (!parse_cmdline(argc, argv, options)) {
        // parse_cmdline already printed error/help on failure
        return 1;
    }

    if (options.show_help) {
        return 0;
    }

    // ---------------------------------------------------------------------
    // 1) Validate inputs
    // ---------------------------------------------------------------------
    const tcsim::ValidationResult input = tcsim::TradeInputValidator{}.validate(options.trade);
    if (!input.ok()) {
        for (const auto &e: input.errors) std::cerr << "Error: " << e.message << "\n";
        return 1;
    }

    if (const auto problems = options.stream.validate(); !problems.empty()) {
        for (const auto &p: problems) std::cerr << "Error: " << p << "\n";
        return 1;
    }

    tcsim::debug::enabled.store(options.debug);
    tcsim::debug::raw.store(options.debug_raw);
    tcsim::debug::every.store(options.debug_every);
    tcsim::debug::top_levels.store(options.debug_levels);

    std::cout << "[TCSIM] Starting\n"
            << "  ws_url      = " << options.stream.ws_url << "\n"
            << "  max_retries = " << options.stream.max_retries << "\n"
            << "  retry_delay = " << options.stream.retry_delay << "s\n"
            << "  request     = " << tcsim::to_string(input.request->order_type) << " "
            << tcsim::to_string(input.request->side) << " " << input.request->quantity << " "
            << input.request->asset << " (" << input.request->fee_tier << ")\n";

    // ---------------------------------------------------------------------
    // 2) Feed + pipeline
    // ---------------------------------------------------------------------
    tcsim::OrderbookStream stream(options.stream);
    stream.set_on_fatal([](std::string_view why) {
        std::cerr << "[TCSIM] Feed lost: " << why << "\n";
    });

    std::unique_ptr<tcsim::CostEstimationPipeline> pipeline;
    try {
        pipeline = std::make_unique<tcsim::CostEstimationPipeline>(stream, options.impact, options.max_samples);
    } catch (const std::invalid_argument &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    try {
        if (stream.start() != tcsim::Status::OK) {
            std::cerr << "start() failed\n";
            return 1;
        }
    } catch (const tcsim::ConnectionError &e) {
        std::cerr << "[TCSIM] " << e.what() << "\n";
        return 2;
    }

    // ---------------------------------------------------------------------
    // 3) Display loop
    // ---------------------------------------------------------------------
    boost::asio::io_context ioc;
    boost::asio::steady_timer tick(ioc);
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);

    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(options.interval));
    int rounds = 0;

    signals.async_wait([&](const boost::system::error_code &ec, int sig) {
        if (ec) return;
        std::cout << "[TCSIM] Signal " << sig << ", shutting down\n";
        tick.cancel();
    });

    std::function<void()> round = [&] {
        print_summary(pipeline->summary());
        print_estimate(pipeline->estimate(*input.request));

        if (!stream.is_running() && stream.stats().state == tcsim::StreamState::FAILED) {
            signals.cancel();
            return;
        }
        if (options.iterations > 0 && ++rounds >= options.iterations) {
            signals.cancel();
            return;
        }

        tick.expires_after(period);
        tick.async_wait([&](const boost::system::error_code &ec) {
            if (ec) {
                signals.cancel();
                return;
            }
            round();
        });
    };

    round();
    ioc.run();

    // ---------------------------------------------------------------------
    // 4) Shutdown
    // ---------------------------------------------------------------------
    print_latency(pipeline->latency_stats());

    const tcsim::StreamStats st = stream.stats();
    std::cout << "[TCSIM] messages=" << st.messages << " published=" << st.published
            << " discarded=" << st.discarded << " reconnects=" << st.reconnects
            << " state=" << tcsim::to_string(st.state) << "\n";

    stream.stop();
    return st.state == tcsim::StreamState::FAILED ? 2 : 0;
}
