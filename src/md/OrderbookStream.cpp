#include "md/OrderbookStream.hpp"

#include <boost/asio/post.hpp>

#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

#include "client_connection_handlers/WsClient.hpp"
#include "orderbook/OrderBookUtils.hpp"
#include "utils/DebugConfigUtils.hpp"

namespace tcsim {
    namespace {
        std::chrono::milliseconds secondsToMs(double seconds) {
            return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
        }
    }

    OrderbookStream::OrderbookStream(StreamConfig cfg, TransportFactory factory)
        : cfg_(std::move(cfg)),
          factory_(std::move(factory)),
          retry_timer_(ioc_),
          watchdog_(ioc_) {
        if (!factory_) {
            factory_ = [](boost::asio::io_context &ioc) -> std::shared_ptr<IWsTransport> {
                return WsClient::create(ioc);
            };
        }
        latest_.store(std::make_shared<const OrderBookSnapshot>(), std::memory_order_release);
    }

    OrderbookStream::~OrderbookStream() {
        stop();
    }

    Status OrderbookStream::start() {
        if (running_.exchange(true)) {
            std::cerr << "[OrderbookStream] start() ignored: already running\n";
            return Status::ERROR;
        }

        /// A run that ended in FAILED leaves a finished but joinable thread behind.
        if (io_thread_.joinable()) io_thread_.join();

        const auto problems = cfg_.validate();
        if (!problems.empty()) {
            for (const auto &p: problems) std::cerr << "[OrderbookStream] invalid config: " << p << "\n";
            running_.store(false);
            return Status::ERROR;
        }

        /// Resolve once (Cold Path)
        rt_.ws = *parse_ws_url(cfg_.ws_url);
        rt_.retry_delay = secondsToMs(cfg_.retry_delay);
        rt_.connect_timeout = secondsToMs(cfg_.connect_timeout);
        rt_.read_timeout = secondsToMs(cfg_.read_timeout);

        ioc_.restart();
        work_.emplace(boost::asio::make_work_guard(ioc_));

        connected_ = std::promise<void>{};
        auto connected = connected_.get_future();
        initial_connect_ = true;
        attempt_ = 0;
        opened_ = false;
        state_.store(StreamState::CONNECTING);

        boost::asio::post(ioc_, [this] { connectWS(); });
        io_thread_ = std::thread([this] { ioc_.run(); });

        try {
            connected.get();
        } catch (const ConnectionError &) {
            // give_up_() already released the work guard; the loop drains and exits.
            io_thread_.join();
            throw;
        }

        std::cout << "[OrderbookStream] streaming " << cfg_.ws_url << "\n";
        return Status::OK;
    }

    Status OrderbookStream::stop() {
        const bool was_running = running_.exchange(false);

        if (io_thread_.joinable()) {
            if (std::this_thread::get_id() == io_thread_.get_id()) {
                std::cerr << "[OrderbookStream] stop() called on the stream thread; not joining\n";
                shutdown_on_stream_thread_();
                return was_running ? Status::OK : Status::ERROR;
            }
            boost::asio::post(ioc_, [this] { shutdown_on_stream_thread_(); });
            io_thread_.join();
        }

        if (!was_running) return Status::ERROR;

        state_.store(StreamState::STOPPED);
        std::cout << "[OrderbookStream] stopped after " << published_.load() << " snapshots\n";
        return Status::OK;
    }

    StreamStats OrderbookStream::stats() const {
        StreamStats s;
        s.state = state_.load();
        s.messages = messages_.load(std::memory_order_relaxed);
        s.published = published_.load(std::memory_order_relaxed);
        s.discarded = discarded_.load(std::memory_order_relaxed);
        s.reconnects = reconnects_.load(std::memory_order_relaxed);
        s.last_parse_latency_ms = last_latency_ms_.load(std::memory_order_relaxed);
        s.avg_parse_latency_ms = avg_latency_ms_.load(std::memory_order_relaxed);
        return s;
    }

    void OrderbookStream::connectWS() {
        if (!running_.load()) return;

        ++attempt_;
        const std::uint64_t gen = ++conn_gen_;
        opened_ = false;

        ws_ = factory_(ioc_);
        ws_->set_logger([this](std::string_view m) { log_(m); });
        ws_->set_connect_timeout(rt_.connect_timeout);
        ws_->set_idle_timeout(rt_.read_timeout);
        ws_->set_on_open([this, gen] { onWSOpen(gen); });
        ws_->set_on_raw_message([this, gen](const char *data, std::size_t len) { onWSMessage(gen, data, len); });
        ws_->set_on_close([this, gen] { onWSClose_(gen); });

        std::cout << "[OrderbookStream] Connecting to " << cfg_.ws_url
                << " (attempt " << attempt_ << "/" << cfg_.max_retries << ")\n";
        ws_->connect(rt_.ws.host, rt_.ws.port, rt_.ws.target);
    }

    void OrderbookStream::onWSOpen(std::uint64_t gen) {
        if (gen != conn_gen_ || !running_.load()) return;

        opened_ = true;
        attempt_ = 0;
        last_frame_at_ = std::chrono::steady_clock::now();
        state_.store(StreamState::STREAMING);

        if (!cfg_.subscribe_frame.empty()) {
            ws_->send_text(cfg_.subscribe_frame);
        }

        arm_watchdog_();

        if (initial_connect_) {
            initial_connect_ = false;
            std::cout << "[OrderbookStream] Connection established\n";
            connected_.set_value();
        } else {
            std::cout << "[OrderbookStream] Reconnected (reconnect #" << reconnects_.load() << ")\n";
        }
    }

    void OrderbookStream::onWSClose_(std::uint64_t gen) {
        if (gen != conn_gen_) return;

        watchdog_.cancel();
        const bool was_open = opened_;
        opened_ = false;

        if (!running_.load()) {
            if (state_.load() != StreamState::FAILED) state_.store(StreamState::STOPPED);
            return;
        }

        if (was_open) {
            std::cerr << "[OrderbookStream] WebSocket connection closed, reconnecting\n";
            reconnects_.fetch_add(1, std::memory_order_relaxed);
            attempt_ = 0;
            state_.store(StreamState::RECONNECTING);
            // Posted, not called: the old transport is still unwinding its close path.
            boost::asio::post(ioc_, [this] { connectWS(); });
            return;
        }

        std::cerr << "[OrderbookStream] Connection attempt " << attempt_ << " failed\n";
        if (attempt_ >= cfg_.max_retries) {
            give_up_();
            return;
        }
        schedule_retry_();
    }

    void OrderbookStream::schedule_retry_() {
        state_.store(initial_connect_ ? StreamState::CONNECTING : StreamState::RECONNECTING);

        retry_timer_.expires_after(rt_.retry_delay);
        retry_timer_.async_wait([this](const boost::system::error_code &ec) {
            if (ec) return; // canceled by stop()
            connectWS();
        });
    }

    void OrderbookStream::give_up_() {
        const std::string msg = "Failed to connect after " + std::to_string(cfg_.max_retries) + " attempts";
        std::cerr << "[OrderbookStream] Max retries (" << cfg_.max_retries << ") reached. Giving up.\n";

        state_.store(StreamState::FAILED);
        running_.store(false);
        work_.reset();

        if (initial_connect_) {
            initial_connect_ = false;
            connected_.set_exception(std::make_exception_ptr(ConnectionError(msg)));
            return;
        }

        if (on_fatal_) on_fatal_(msg);
    }

    void OrderbookStream::onWSMessage(std::uint64_t gen, const char *data, std::size_t len) {
        if (gen != conn_gen_ || !running_.load() || len == 0) return;

        const auto recv_ts = std::chrono::steady_clock::now();
        last_frame_at_ = recv_ts;
        messages_.fetch_add(1, std::memory_order_relaxed);

        const std::string_view msg{data, len};

        BookFrame frame;
        switch (adapter_.parse(msg, frame)) {
            case FeedParseResult::MALFORMED:
                discarded_.fetch_add(1, std::memory_order_relaxed);
                debug::log_discard("OrderbookStream", "Failed to parse message", msg);
                return;
            case FeedParseResult::MISSING_FIELDS:
                discarded_.fetch_add(1, std::memory_order_relaxed);
                debug::log_discard("OrderbookStream", "Received message without orderbook data", msg);
                return;
            case FeedParseResult::OK:
                break;
        }

        publish_(std::move(frame), recv_ts);
    }

    void OrderbookStream::publish_(BookFrame &&frame, std::chrono::steady_clock::time_point recv_ts) {
        /// 1) Build the new book off to the side
        normalizeSide(frame.asks, Side::ASK);
        normalizeSide(frame.bids, Side::BID);

        const std::uint64_t seq = published_.load(std::memory_order_relaxed) + 1;
        const double latency_ms =
                std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - recv_ts).count();

        auto snap = std::make_shared<const OrderBookSnapshot>(std::move(frame.asks),
                                                              std::move(frame.bids),
                                                              OrderBookSnapshot::Clock::now(),
                                                              latency_ms,
                                                              seq,
                                                              frame.exchange_ts_ms);

        /// 2) Swap the published pointer; readers holding the old book keep it alive
        latest_.store(snap, std::memory_order_release);
        published_.store(seq, std::memory_order_relaxed);

        /// 3) Metrics
        total_latency_ms_ += latency_ms;
        last_latency_ms_.store(latency_ms, std::memory_order_relaxed);
        avg_latency_ms_.store(total_latency_ms_ / static_cast<double>(seq), std::memory_order_relaxed);

        if (seq % 100 == 0) {
            std::cout << "[OrderbookStream] Processed " << seq << " messages. "
                    << std::fixed << std::setprecision(2)
                    << "Current latency: " << latency_ms << "ms, "
                    << "Average latency: " << avg_latency_ms_.load(std::memory_order_relaxed) << "ms\n"
                    << std::defaultfloat;
        }

        if (debug::dbg_on() && debug::dbg_sample(dbg_counter_)) debug::dbg_book("OrderbookStream", *snap);
    }

    void OrderbookStream::arm_watchdog_() {
        if (rt_.read_timeout.count() <= 0) return;

        const std::uint64_t gen = conn_gen_;
        watchdog_.expires_at(last_frame_at_ + rt_.read_timeout);
        watchdog_.async_wait([this, gen](const boost::system::error_code &ec) {
            if (ec) return; // canceled
            if (gen != conn_gen_ || !opened_ || !running_.load()) return;

            const auto idle = std::chrono::steady_clock::now() - last_frame_at_;
            if (idle < rt_.read_timeout) {
                arm_watchdog_();
                return;
            }

            std::cerr << "[OrderbookStream] no frame for "
                    << std::chrono::duration_cast<std::chrono::milliseconds>(idle).count()
                    << "ms, dropping connection\n";
            // The close callback takes the reconnect path.
            ws_->cancel();
        });
    }

    void OrderbookStream::shutdown_on_stream_thread_() {
        retry_timer_.cancel();
        watchdog_.cancel();
        if (ws_) ws_->close();
        work_.reset();
    }

    void OrderbookStream::log_(std::string_view msg) const {
        std::cerr << msg << "\n";
    }
} // namespace tcsim
