#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tcsim {
    /**
     * @brief Return code for stream lifecycle operations.
     *
     * Semantics:
     *  - OK    : Operation completed (start: connected and receiving; stop: shut down).
     *  - ERROR : Precondition failed (e.g., already started, invalid config).
     *
     * Note: Runtime feed problems are reported via logs and stats(), not through this enum.
     */
    enum class Status { OK, ERROR };

    /**
     * @brief Raised by OrderbookStream::start() when the initial connection
     *        exhausts its retry budget. The stream is not started.
     */
    class ConnectionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class StreamState : std::uint8_t {
        DISCONNECTED,
        CONNECTING,
        STREAMING,
        RECONNECTING,
        STOPPED,
        FAILED
    };

    inline const char *to_string(StreamState s) {
        switch (s) {
            case StreamState::DISCONNECTED: return "DISCONNECTED";
            case StreamState::CONNECTING: return "CONNECTING";
            case StreamState::STREAMING: return "STREAMING";
            case StreamState::RECONNECTING: return "RECONNECTING";
            case StreamState::STOPPED: return "STOPPED";
            case StreamState::FAILED: return "FAILED";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief Configuration of the order-book feed.
     *
     * Durations are in seconds to match the command line; they are converted to
     * chrono durations once, at start().
     */
    struct StreamConfig {
        std::string ws_url{"wss://ws.gomarket-cpp.goquant.io/ws/l2-orderbook/okx/BTC-USDT-SWAP"};

        int max_retries{5}; ///< connection attempts before giving up
        double retry_delay{2.0}; ///< fixed delay between attempts
        double connect_timeout{5.0}; ///< resolve + TCP + TLS + WS upgrade budget
        double read_timeout{30.0}; ///< stall watchdog, 0 = disabled

        std::string subscribe_frame; ///< optional text frame sent after open, "" = none

        /// Returns one message per problem; empty when the config is usable.
        [[nodiscard]] std::vector<std::string> validate() const;
    };

    /// Counters published by the stream; safe to read from any thread.
    struct StreamStats {
        StreamState state{StreamState::DISCONNECTED};
        std::uint64_t messages{0}; ///< frames received
        std::uint64_t published{0}; ///< snapshots published
        std::uint64_t discarded{0}; ///< malformed or incomplete frames
        std::uint64_t reconnects{0};
        double last_parse_latency_ms{0.0};
        double avg_parse_latency_ms{0.0};
    };

    /**
     * @brief Abstract interface of a live order-book feed.
     *
     * Lifecycle:
     *   1) start() : connect (with retries) and begin receiving on the feed's own execution context.
     *   2) stop()  : close the connection and join the execution context. Idempotent.
     *
     * Contract:
     *   - start() may be called again after stop().
     *   - stop() must not throw.
     */
    struct IOrderbookFeed {
        virtual ~IOrderbookFeed() = default;

        virtual Status start() = 0;

        virtual Status stop() = 0;

        [[nodiscard]] virtual bool is_running() const = 0;

        [[nodiscard]] virtual StreamStats stats() const = 0;
    };
} // namespace tcsim
