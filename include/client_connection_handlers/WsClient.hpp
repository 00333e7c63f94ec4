#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "abstract/WsTransport.hpp"

namespace tcsim {
    /**
     * TLS websocket client on a strand of the caller's io_context.
     *
     * One instance serves one connection: OrderbookStream creates a fresh client
     * per connect attempt, so no state has to survive a failed TLS session.
     *
     * Connect chain: resolve -> tcp -> SNI + TLS (peer and hostname verified)
     * -> websocket upgrade, all under one connect deadline. After the upgrade
     * Beast's own timeouts (idle ping) take over.
     */
    class WsClient final : public IWsTransport, public std::enable_shared_from_this<WsClient> {
        struct Private {
            explicit Private() = default;
        };

    public:
        /// Handlers capture shared_from_this(), so instances only live in a shared_ptr.
        static std::shared_ptr<WsClient> create(boost::asio::io_context &ioc) {
            return std::make_shared<WsClient>(Private{}, ioc);
        }

        WsClient(Private, boost::asio::io_context &ioc);

        WsClient(const WsClient &) = delete;

        WsClient &operator=(const WsClient &) = delete;

        void set_on_raw_message(RawMessageHandler h) override { on_message_ = std::move(h); }

        void set_on_close(CloseHandler h) override { on_close_ = std::move(h); }

        void set_on_open(OpenHandler h) override { on_open_ = std::move(h); }

        void set_logger(LogFn fn) override { logger_ = std::move(fn); }

        void set_connect_timeout(std::chrono::milliseconds t) override { connect_timeout_ = t; }

        void set_idle_timeout(std::chrono::milliseconds t) override { idle_timeout_ = t; }

        void connect(std::string host, std::string port, std::string target) override;

        void send_text(std::string text) override;

        void close() override;

        void cancel() override;

    private:
        using tcp = boost::asio::ip::tcp;
        using error_code = boost::beast::error_code;
        using tls_stream = boost::beast::ssl_stream<tcp::socket>;
        using ws_stream = boost::beast::websocket::stream<tls_stream>;

        // Connect chain (strand)
        void on_resolve(error_code ec, const tcp::resolver::results_type &results);

        void on_tcp_connect(error_code ec, const tcp::endpoint &ep);

        void on_tls_handshake(error_code ec);

        void on_ws_handshake(error_code ec);

        void on_deadline(error_code ec);

        // Session (strand)
        void read_next();

        void on_read(error_code ec, std::size_t bytes);

        void flush_outbox();

        void on_write(error_code ec, std::size_t bytes);

        void on_graceful_close(error_code ec);

        /// Failure path: log once, drop the socket, report the close.
        void teardown(std::string_view reason);

        void hard_stop();

        void fire_close();

        void log(std::string_view msg) const {
            if (logger_) logger_(msg);
        }

    private:
        boost::asio::strand<boost::asio::io_context::executor_type> strand_;
        boost::asio::ssl::context tls_ctx_{boost::asio::ssl::context::tls_client};

        ws_stream ws_;
        tcp::resolver resolver_;
        boost::asio::steady_timer deadline_;

        boost::beast::flat_buffer rx_;
        std::string frame_; // reused capacity for the delivered payload
        std::deque<std::string> outbox_;
        bool writing_{false};

        std::string host_;
        std::string port_;
        std::string target_;

        bool open_{false};
        bool shutting_down_{false};
        std::atomic_bool close_fired_{false};

        std::chrono::milliseconds connect_timeout_{5000};
        std::chrono::milliseconds idle_timeout_{0}; // 0 = Beast's suggested client default

        OpenHandler on_open_;
        RawMessageHandler on_message_;
        CloseHandler on_close_;
        LogFn logger_;
    };
} // namespace tcsim
