#include "client_connection_handlers/WsClient.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <exception>

namespace tcsim {
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace ssl = boost::asio::ssl;

    WsClient::WsClient(Private, boost::asio::io_context &ioc)
        : strand_(boost::asio::make_strand(ioc)),
          ws_(strand_, tls_ctx_),
          resolver_(strand_),
          deadline_(strand_) {
        tls_ctx_.set_default_verify_paths();
        tls_ctx_.set_verify_mode(ssl::verify_peer);

        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type &req) {
            req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " tcsim-wsclient");
        }));
    }

    void WsClient::connect(std::string host, std::string port, std::string target) {
        boost::asio::dispatch(strand_, [self = shared_from_this(),
                                  host = std::move(host),
                                  port = std::move(port),
                                  target = std::move(target)]() mutable {
            self->host_ = std::move(host);
            self->port_ = std::move(port);
            self->target_ = std::move(target);

            // Keepalive: Beast pings at idle/2 and fails the read at idle.
            auto opt = websocket::stream_base::timeout::suggested(beast::role_type::client);
            if (self->idle_timeout_.count() > 0) {
                opt.idle_timeout = self->idle_timeout_;
                opt.keep_alive_pings = true;
            }
            self->ws_.set_option(opt);

            self->ws_.next_layer().set_verify_callback(ssl::host_name_verification(self->host_));

            self->deadline_.expires_after(self->connect_timeout_);
            self->deadline_.async_wait(beast::bind_front_handler(&WsClient::on_deadline, self));

            self->resolver_.async_resolve(self->host_, self->port_,
                                          beast::bind_front_handler(&WsClient::on_resolve, self));
        });
    }

    void WsClient::on_resolve(error_code ec, const tcp::resolver::results_type &results) {
        if (ec) return teardown("resolve " + host_ + ": " + ec.message());

        boost::asio::async_connect(beast::get_lowest_layer(ws_), results,
                                   beast::bind_front_handler(&WsClient::on_tcp_connect, shared_from_this()));
    }

    void WsClient::on_tcp_connect(error_code ec, const tcp::endpoint &) {
        if (ec) return teardown("tcp connect: " + ec.message());

        if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_.c_str())) {
            const error_code sni{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
            return teardown("sni: " + sni.message());
        }

        ws_.next_layer().async_handshake(ssl::stream_base::client,
                                         beast::bind_front_handler(&WsClient::on_tls_handshake, shared_from_this()));
    }

    void WsClient::on_tls_handshake(error_code ec) {
        if (ec) return teardown("tls handshake: " + ec.message());

        ws_.async_handshake(host_, target_,
                            beast::bind_front_handler(&WsClient::on_ws_handshake, shared_from_this()));
    }

    void WsClient::on_ws_handshake(error_code ec) {
        if (ec) return teardown("ws handshake: " + ec.message());

        deadline_.cancel();
        ws_.text(true);
        open_ = true;

        if (on_open_) {
            try {
                on_open_();
            } catch (const std::exception &e) {
                log(std::string("[WsClient] open handler threw: ") + e.what());
            }
        }

        flush_outbox(); // frames queued by the open handler
        read_next();
    }

    void WsClient::on_deadline(error_code ec) {
        if (ec || open_ || shutting_down_) return; // disarmed, or already past the upgrade
        teardown("connect timed out after " + std::to_string(connect_timeout_.count()) + "ms");
    }

    void WsClient::read_next() {
        ws_.async_read(rx_, beast::bind_front_handler(&WsClient::on_read, shared_from_this()));
    }

    void WsClient::on_read(error_code ec, std::size_t) {
        if (ec) {
            if (ec == websocket::error::closed) return teardown("closed by peer");
            return teardown("read: " + ec.message());
        }

        frame_.assign(beast::buffers_to_string(rx_.data()));
        rx_.consume(rx_.size());

        if (on_message_) {
            try {
                on_message_(frame_.data(), frame_.size());
            } catch (const std::exception &e) {
                log(std::string("[WsClient] message handler threw: ") + e.what());
            }
        }

        if (!shutting_down_) read_next();
    }

    void WsClient::send_text(std::string text) {
        boost::asio::dispatch(strand_, [self = shared_from_this(), text = std::move(text)]() mutable {
            if (self->shutting_down_) return;
            self->outbox_.push_back(std::move(text));
            if (self->open_) self->flush_outbox();
        });
    }

    void WsClient::flush_outbox() {
        if (writing_ || outbox_.empty()) return;
        writing_ = true;
        ws_.async_write(boost::asio::buffer(outbox_.front()),
                        beast::bind_front_handler(&WsClient::on_write, shared_from_this()));
    }

    void WsClient::on_write(error_code ec, std::size_t) {
        writing_ = false;
        if (ec) return teardown("write: " + ec.message());

        outbox_.pop_front();
        flush_outbox();
    }

    void WsClient::close() {
        boost::asio::dispatch(strand_, [self = shared_from_this()] {
            if (self->shutting_down_) return;
            self->shutting_down_ = true;

            if (!self->open_) {
                self->hard_stop();
                self->fire_close();
                return;
            }

            self->ws_.async_close(websocket::close_code::normal,
                                  beast::bind_front_handler(&WsClient::on_graceful_close, self));
        });
    }

    void WsClient::on_graceful_close(error_code ec) {
        if (ec) log("[WsClient] close: " + ec.message());
        open_ = false;
        hard_stop();
        fire_close();
    }

    void WsClient::cancel() {
        boost::asio::dispatch(strand_, [self = shared_from_this()] {
            if (self->shutting_down_) return;
            self->shutting_down_ = true;
            self->open_ = false;
            self->hard_stop();
            self->fire_close();
        });
    }

    void WsClient::teardown(std::string_view reason) {
        // close()/cancel() already owns the shutdown; the aborted operation just lands here.
        if (shutting_down_) {
            fire_close();
            return;
        }
        shutting_down_ = true;
        open_ = false;

        log(std::string("[WsClient] ") + std::string(reason));
        hard_stop();
        fire_close();
    }

    void WsClient::hard_stop() {
        error_code ignored;
        deadline_.cancel();
        resolver_.cancel();

        auto &sock = beast::get_lowest_layer(ws_);
        sock.cancel(ignored);
        sock.close(ignored);
    }

    void WsClient::fire_close() {
        if (close_fired_.exchange(true, std::memory_order_acq_rel)) return;
        if (!on_close_) return;

        try {
            on_close_();
        } catch (const std::exception &e) {
            log(std::string("[WsClient] close handler threw: ") + e.what());
        }
    }
} // namespace tcsim
