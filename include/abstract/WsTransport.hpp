#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace tcsim {
    /**
     * @brief Message-oriented client connection used by OrderbookStream.
     *
     * Callback contract:
     *   - on_open fires once the connection is ready to receive.
     *   - on_close fires exactly once per connect(), whether the connect attempt
     *     failed or an established connection went away.
     *   - All callbacks run on the owner's io_context.
     */
    struct IWsTransport {
        using RawMessageHandler = std::function<void(const char *, std::size_t)>;
        using CloseHandler = std::function<void()>;
        using OpenHandler = std::function<void()>;
        using LogFn = std::function<void(std::string_view)>;

        virtual ~IWsTransport() = default;

        virtual void set_on_raw_message(RawMessageHandler h) = 0;

        virtual void set_on_close(CloseHandler h) = 0;

        virtual void set_on_open(OpenHandler h) = 0;

        virtual void set_logger(LogFn fn) = 0;

        virtual void set_connect_timeout(std::chrono::milliseconds t) = 0;

        /// Transport-level keepalive; 0 leaves the library default.
        virtual void set_idle_timeout(std::chrono::milliseconds t) = 0;

        virtual void connect(std::string host, std::string port, std::string target) = 0;

        virtual void send_text(std::string text) = 0;

        /// Graceful close handshake.
        virtual void close() = 0;

        /// Hard close without handshake (stalled peers).
        virtual void cancel() = 0;
    };
} // namespace tcsim
