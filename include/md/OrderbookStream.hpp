#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>
#include <utility>

#include "abstract/FeedHandler.hpp"
#include "abstract/SnapshotSource.hpp"
#include "abstract/WsTransport.hpp"
#include "md/BookFeedAdapter.hpp"
#include "utils/UrlUtils.hpp"

namespace tcsim {
    /**
     * Keeps one up-to-date OrderBookSnapshot from a full-depth websocket feed.
     *
     * Threading:
     *   - The stream owns an io_context and runs it on its own thread; every
     *     transport callback, timer and state change happens there.
     *   - snapshot() and stats() may be called from any thread. The writer builds
     *     each snapshot off to the side and swaps the shared pointer; readers
     *     never see a half-built book.
     *
     * Connection policy:
     *   - Each connect attempt uses a fresh transport; up to max_retries attempts
     *     with retry_delay between them.
     *   - Initial connect exhausted -> start() throws ConnectionError.
     *   - Unexpected close while running -> reconnect (same retry budget). If that
     *     budget is exhausted the stream moves to FAILED and calls the fatal handler.
     *   - Reconnects are posted back onto the io_context, never nested inside the
     *     previous connection's callbacks.
     */
    class OrderbookStream final : public IOrderbookFeed, public ISnapshotSource {
    public:
        using TransportFactory = std::function<std::shared_ptr<IWsTransport>(boost::asio::io_context &)>;
        using FatalHandler = std::function<void(std::string_view)>;

        /// Default factory creates a TLS WsClient.
        explicit OrderbookStream(StreamConfig cfg, TransportFactory factory = {});

        ~OrderbookStream() override;

        OrderbookStream(const OrderbookStream &) = delete;

        OrderbookStream &operator=(const OrderbookStream &) = delete;

        /// Blocks until connected or the retry budget is spent (throws ConnectionError).
        /// start() and stop() belong to one controlling thread; do not race them.
        Status start() override;

        /// Must not be called from the stream's own callbacks.
        Status stop() override;

        [[nodiscard]] bool is_running() const override { return running_.load(); }

        [[nodiscard]] StreamStats stats() const override;

        [[nodiscard]] std::shared_ptr<const OrderBookSnapshot> snapshot() const override {
            return latest_.load(std::memory_order_acquire);
        }

        /// Called on the stream thread when a reconnect gives up.
        void set_on_fatal(FatalHandler h) { on_fatal_ = std::move(h); }

    private:
        void connectWS();

        void onWSOpen(std::uint64_t gen);

        void onWSMessage(std::uint64_t gen, const char *data, std::size_t len);

        void onWSClose_(std::uint64_t gen);

        void schedule_retry_();

        void give_up_();

        void publish_(BookFrame &&frame, std::chrono::steady_clock::time_point recv_ts);

        void arm_watchdog_();

        void shutdown_on_stream_thread_();

        void log_(std::string_view msg) const;

    private:
        /// Cold-path resolved runtime (no config reads in hot path):
        struct RuntimeResolved {
            EndPoint ws;
            std::chrono::milliseconds retry_delay{0};
            std::chrono::milliseconds connect_timeout{0};
            std::chrono::milliseconds read_timeout{0};
        };

        StreamConfig cfg_;
        RuntimeResolved rt_;
        TransportFactory factory_;
        BookFeedAdapter adapter_;

        boost::asio::io_context ioc_;
        std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type> > work_;
        std::thread io_thread_;

        std::shared_ptr<IWsTransport> ws_;
        std::uint64_t conn_gen_{0}; ///< bumps per connect; stale callbacks are dropped
        bool opened_{false};
        bool initial_connect_{true};
        int attempt_{0};

        std::promise<void> connected_;

        boost::asio::steady_timer retry_timer_;
        boost::asio::steady_timer watchdog_;
        std::chrono::steady_clock::time_point last_frame_at_{};

        std::atomic<std::shared_ptr<const OrderBookSnapshot> > latest_;

        std::atomic<bool> running_{false};
        std::atomic<StreamState> state_{StreamState::DISCONNECTED};

        std::atomic<std::uint64_t> messages_{0};
        std::atomic<std::uint64_t> published_{0};
        std::atomic<std::uint64_t> discarded_{0};
        std::atomic<std::uint64_t> reconnects_{0};
        std::atomic<double> last_latency_ms_{0.0};
        std::atomic<double> avg_latency_ms_{0.0};
        double total_latency_ms_{0.0}; // stream thread only
        std::uint64_t dbg_counter_{0};

        FatalHandler on_fatal_;
    };
} // namespace tcsim
