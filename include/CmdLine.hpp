#pragma once

#include "abstract/FeedHandler.hpp"
#include "models/MarketImpactEstimator.hpp"
#include "sim/TradeInputValidator.hpp"

#include <boost/program_options.hpp>
#include <cstddef>
#include <string>
#include <iostream>

struct CmdOptions {
    tcsim::StreamConfig stream; // --ws_url, --max_retries, ...
    tcsim::MarketImpactConfig impact; // --permanent_impact, ...
    tcsim::TradeInputs trade; // raw strings, validated later

    std::size_t max_samples{1000};
    double interval{1.0}; // seconds between estimates
    int iterations{0}; // 0 = until SIGINT/SIGTERM

    bool debug{false};
    bool debug_raw{false};
    int debug_every{200}; // print 1/N published books
    int debug_levels{3}; // ladder depth in book dumps

    bool show_help{false};
};

inline bool parse_cmdline(int argc, char **argv, CmdOptions &out) {
    namespace po = boost::program_options;

    const tcsim::StreamConfig sd;
    const tcsim::MarketImpactConfig md;
    const tcsim::TradeInputs td;

    po::options_description feed("Feed");
    feed.add_options()
            ("help,h", "Show this help message")
            ("ws_url", po::value<std::string>()->default_value(sd.ws_url),
             "Order-book websocket endpoint (wss://)")
            ("max_retries", po::value<int>()->default_value(sd.max_retries),
             "Connection attempts before giving up")
            ("retry_delay", po::value<double>()->default_value(sd.retry_delay),
             "Seconds between connection attempts")
            ("connect_timeout", po::value<double>()->default_value(sd.connect_timeout),
             "Seconds allowed for resolve + TLS + websocket upgrade")
            ("read_timeout", po::value<double>()->default_value(sd.read_timeout),
             "Reconnect when no frame arrives for this many seconds (0 = off)")
            ("subscribe", po::value<std::string>()->default_value(""),
             "Optional text frame sent after the websocket opens")
            ("debug", po::bool_switch(&out.debug), "Per-message debug output")
            ("debug_raw", po::bool_switch(&out.debug_raw), "Print truncated raw frames (with --debug)")
            ("debug_every", po::value<int>(&out.debug_every)->default_value(out.debug_every),
             "Dump every Nth published book (with --debug)")
            ("debug_levels", po::value<int>(&out.debug_levels)->default_value(out.debug_levels),
             "Levels per side in book dumps (with --debug)");

    po::options_description trade("Trade");
    trade.add_options()
            ("asset", po::value<std::string>()->default_value(td.asset), "Instrument label")
            ("order_type", po::value<std::string>()->default_value(td.order_type),
             "Market, Limit, Stop-Limit, Take-Profit")
            ("side", po::value<std::string>()->default_value(td.side), "buy or sell")
            ("quantity,q", po::value<std::string>()->required(), "Base-currency quantity (> 0)")
            ("fee_tier", po::value<std::string>()->default_value(td.fee_tier),
             "Tier 1, Tier 2, Tier 3, Custom")
            ("slippage_tolerance", po::value<std::string>()->default_value(td.slippage_tolerance),
             "Max acceptable slippage in percent (>= 0)")
            ("volatility", po::value<std::string>()->default_value(td.volatility),
             "Daily volatility as a fraction (>= 0)");

    po::options_description model("Model / display");
    model.add_options()
            ("permanent_impact", po::value<double>()->default_value(md.permanent_impact_factor),
             "Permanent impact coefficient")
            ("temporary_impact", po::value<double>()->default_value(md.temporary_impact_factor),
             "Temporary impact coefficient")
            ("no_volatility_scaling", "Disable volatility scaling of impact")
            ("timeframe", po::value<double>()->default_value(md.execution_timeframe_seconds),
             "Execution timeframe in seconds")
            ("max_samples", po::value<std::size_t>()->default_value(1000),
             "Latency samples kept per operation")
            ("interval", po::value<double>()->default_value(1.0), "Seconds between estimates")
            ("iterations", po::value<int>()->default_value(0), "Number of estimates (0 = until Ctrl-C)");

    po::options_description desc("Options");
    desc.add(feed).add(trade).add(model);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Usage: " << argv[0]
                    << " --quantity Q [--side buy|sell] [--order_type Market] "
                    "[--fee_tier \"Tier 1\"] [--ws_url wss://...]\n\n";
            std::cout << desc << "\n";
            out.show_help = true;
            return true;
        }

        // Enforce required options
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "Error parsing command line: " << e.what() << "\n\n";
        std::cerr << desc << "\n";
        return false;
    }

    out.stream.ws_url = vm["ws_url"].as<std::string>();
    out.stream.max_retries = vm["max_retries"].as<int>();
    out.stream.retry_delay = vm["retry_delay"].as<double>();
    out.stream.connect_timeout = vm["connect_timeout"].as<double>();
    out.stream.read_timeout = vm["read_timeout"].as<double>();
    out.stream.subscribe_frame = vm["subscribe"].as<std::string>();

    out.trade.asset = vm["asset"].as<std::string>();
    out.trade.order_type = vm["order_type"].as<std::string>();
    out.trade.side = vm["side"].as<std::string>();
    out.trade.quantity = vm["quantity"].as<std::string>();
    out.trade.fee_tier = vm["fee_tier"].as<std::string>();
    out.trade.slippage_tolerance = vm["slippage_tolerance"].as<std::string>();
    out.trade.volatility = vm["volatility"].as<std::string>();

    out.impact.permanent_impact_factor = vm["permanent_impact"].as<double>();
    out.impact.temporary_impact_factor = vm["temporary_impact"].as<double>();
    out.impact.volatility_scaling = !vm.contains("no_volatility_scaling");
    out.impact.execution_timeframe_seconds = vm["timeframe"].as<double>();

    out.max_samples = vm["max_samples"].as<std::size_t>();
    out.interval = vm["interval"].as<double>();
    out.iterations = vm["iterations"].as<int>();

    if (out.max_samples == 0 || out.interval <= 0.0 || out.iterations < 0) {
        std::cerr << "Error: --max_samples and --interval must be > 0, --iterations >= 0\n";
        return false;
    }
    if (out.impact.execution_timeframe_seconds <= 0.0) {
        std::cerr << "Error: --timeframe must be > 0\n";
        return false;
    }

    return true;
}
