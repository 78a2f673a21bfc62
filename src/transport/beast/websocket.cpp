#include "livestand/transport/beast/websocket.hpp"
#include "livestand/config.hpp"
#include "lcr/log/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <exception>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>


namespace livestand {
namespace transport {
namespace beast {

namespace asio      = boost::asio;
namespace ssl       = boost::asio::ssl;
namespace bb        = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;

namespace {

constexpr const char* USER_AGENT = "Livestand/1.0";

enum class Stage {
    Resolve,
    Connect,
    Tls,
    Upgrade
};

constexpr const char* to_string(Stage s) noexcept {
    switch (s) {
        case Stage::Resolve: return "resolve";
        case Stage::Connect: return "connect";
        case Stage::Tls:     return "TLS handshake";
        case Stage::Upgrade: return "WebSocket upgrade";
        default:             return "unknown";
    }
}

Error map_read_error(const boost::system::error_code& ec) noexcept {
    if (ec == asio::error::operation_aborted) {
        return Error::Cancelled;
    }
    if (ec == bb::error::timeout) {
        return Error::Timeout;
    }
    if (ec == asio::error::eof || ec == asio::error::connection_reset || ec == ssl::error::stream_truncated) {
        return Error::RemoteClosed;
    }
    return Error::TransportFailure;
}

} // namespace

// ============================================================================
// Impl
// ============================================================================

class WebSocket::Impl {
    using plain_stream_t  = websocket::stream<bb::tcp_stream>;
    using secure_stream_t = websocket::stream<bb::ssl_stream<bb::tcp_stream>>;

public:
    Impl()
        : ssl_ctx_(ssl::context::tls_client)
    {
        boost::system::error_code ec;
        ssl_ctx_.set_default_verify_paths(ec);
        if (ec) {
            LS_WARN("[WS] Could not load default CA paths: " << ec.message());
        }
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }

    ~Impl() {
        close();
        if (io_thread_.joinable()) {
            if (io_thread_.get_id() == std::this_thread::get_id()) {
                io_thread_.detach();
            }
            else {
                io_thread_.join();
            }
        }
    }

    // Runs the whole open sequence on ioc_ from the calling thread, bounded
    // by connect_timeout_. On expiry the pending stage is cancelled.
    // Name resolution runs on Asio's internal resolver thread and cannot be
    // interrupted; a timed-out connect still waits for it to return.
    Error connect(const std::string& host, const std::string& port, const std::string& path, bool secure) noexcept {
        if (running_.load(std::memory_order_acquire) || io_thread_.joinable()) {
            LS_ERROR("[WS] connect() called on an active WebSocket");
            return Error::InvalidState;
        }
        std::shared_ptr<ConnectOp> op;
        try {
            ioc_.restart();
            op = std::make_shared<ConnectOp>(ioc_, host, port, path);
            if (secure) {
                secure_ = std::make_unique<secure_stream_t>(ioc_, ssl_ctx_);
                // SNI
                if (!SSL_set_tlsext_host_name(secure_->next_layer().native_handle(), host.c_str())) {
                    op->stage = Stage::Tls;
                    boost::system::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
                    throw boost::system::system_error{ec};
                }
                start_open_(*secure_, op);
            }
            else {
                plain_ = std::make_unique<plain_stream_t>(ioc_);
                start_open_(*plain_, op);
            }

            op->deadline.expires_after(connect_timeout_);
            op->deadline.async_wait([this, o = op](const boost::system::error_code& ec) {
                if (ec || o->done) {
                    return;
                }
                o->timed_out = true;
                o->resolver.cancel();
                with_stream_([](auto& ws) { bb::get_lowest_layer(ws).cancel(); });
            });

            ioc_.run();
        }
        catch (const boost::system::system_error& e) {
            const Stage stage = op ? op->stage : Stage::Resolve;
            abandon_(op);
            LS_ERROR("[WS] " << to_string(stage) << " failed for " << host << ":" << port << ": " << e.code().message());
            reset_streams_();
            return (stage == Stage::Resolve || stage == Stage::Connect) ? Error::ConnectionFailed : Error::HandshakeFailed;
        }
        catch (const std::exception& e) {
            LS_ERROR("[WS] Connect to " << host << ":" << port << " failed: " << e.what());
            abandon_(op);
            reset_streams_();
            return Error::TransportFailure;
        }

        if (op->timed_out || !op->done) {
            LS_ERROR("[WS] " << to_string(op->stage) << " timed out after " << connect_timeout_.count()
                     << " ms for " << host << ":" << port);
            reset_streams_();
            return Error::Timeout;
        }
        if (op->ec) {
            LS_ERROR("[WS] " << to_string(op->stage) << " failed for " << host << ":" << port << ": " << op->ec.message());
            reset_streams_();
            return (op->stage == Stage::Resolve || op->stage == Stage::Connect) ? Error::ConnectionFailed : Error::HandshakeFailed;
        }

        with_stream_([](auto& ws) {
            ws.text(true);
            ws.set_option(websocket::stream_base::timeout::suggested(bb::role_type::client));
        });

        LS_DEBUG("[WS] Connected to " << (secure ? "wss://" : "ws://") << host << ":" << port << path);
        closed_.store(false, std::memory_order_release);
        running_.store(true, std::memory_order_release);
        ioc_.restart();
        start_read_();
        io_thread_ = std::thread([this]() { run_(); });
        return Error::None;
    }

    // Queues one text frame on the IO thread. Write failures are reported
    // via the error callback.
    bool send(const std::string& msg) noexcept {
        if (!running_.load(std::memory_order_acquire)) {
            LS_ERROR("[WS] send() called on unconnected WebSocket");
            return false;
        }
        LS_TRACE("[WS] Sending message ... (size " << msg.size() << ")");
        try {
            asio::post(ioc_, [this, msg]() {
                write_queue_.push_back(msg);
                if (write_queue_.size() == 1) {
                    do_write_();
                }
            });
        }
        catch (const std::exception& e) {
            LS_ERROR("[WS] send() failed: " << e.what());
            return false;
        }
        return true;
    }

    void close() noexcept {
        if (running_.exchange(false, std::memory_order_acq_rel)) {
            LS_TRACE("[WS] Closing WebSocket ...");
            if (io_thread_.joinable() && io_thread_.get_id() == std::this_thread::get_id()) {
                close_socket_();
            }
            else {
                try {
                    asio::post(ioc_, [this]() { close_socket_(); });
                }
                catch (const std::exception& e) {
                    LS_ERROR("[WS] Failed to schedule close: " << e.what());
                    ioc_.stop();
                }
            }
        }
        if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()) {
            io_thread_.join();
            plain_.reset();
            secure_.reset();
            write_queue_.clear();
        }
        signal_close_();
    }

    void set_message_callback(MessageCallback cb) { on_message_ = std::move(cb); }
    void set_close_callback(CloseCallback cb)     { on_close_   = std::move(cb); }
    void set_error_callback(ErrorCallback cb)     { on_error_   = std::move(cb); }

    void set_connect_timeout(std::chrono::milliseconds timeout) noexcept { connect_timeout_ = timeout; }

private:
    // State of one connect() call, shared by its handlers
    struct ConnectOp {
        ConnectOp(asio::io_context& ioc, const std::string& h, const std::string& p, const std::string& t)
            : resolver(ioc)
            , deadline(ioc)
            , host(h)
            , port(p)
            , authority(h + ":" + p)
            , path(t)
        {}

        tcp::resolver      resolver;
        asio::steady_timer deadline;
        std::string        host;
        std::string        port;
        std::string        authority;
        std::string        path;

        Stage                     stage = Stage::Resolve;
        boost::system::error_code ec;
        bool                      done      = false;
        bool                      timed_out = false;
        bool                      abandoned = false;   // handlers left in ioc_ after an exception

        bool stopped() const noexcept { return timed_out || abandoned; }

        void finish(Stage s, const boost::system::error_code& e) {
            stage = s;
            ec    = e;
            done  = true;
            deadline.cancel();
        }
    };

    // resolve -> TCP connect -> [TLS handshake] -> WebSocket upgrade
    template<class Stream>
    void start_open_(Stream& ws, const std::shared_ptr<ConnectOp>& op) {
        Stream* s = &ws;
        op->resolver.async_resolve(op->host, op->port,
            [this, s, o = op](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec || o->stopped()) {
                    o->finish(Stage::Resolve, ec);
                    return;
                }
                o->stage = Stage::Connect;
                bb::get_lowest_layer(*s).async_connect(results,
                    [this, s, o](const boost::system::error_code& ec, const tcp::endpoint&) {
                        if (ec || o->stopped()) {
                            o->finish(Stage::Connect, ec);
                            return;
                        }
                        if constexpr (std::is_same_v<Stream, secure_stream_t>) {
                            o->stage = Stage::Tls;
                            s->next_layer().async_handshake(ssl::stream_base::client,
                                [this, s, o](const boost::system::error_code& ec) {
                                    if (ec || o->stopped()) {
                                        o->finish(Stage::Tls, ec);
                                        return;
                                    }
                                    start_upgrade_(*s, o);
                                });
                        }
                        else {
                            start_upgrade_(*s, o);
                        }
                    });
            });
    }

    template<class Stream>
    void start_upgrade_(Stream& ws, const std::shared_ptr<ConnectOp>& op) {
        op->stage = Stage::Upgrade;
        ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(bb::http::field::user_agent, USER_AGENT);
        }));
        ws.async_handshake(op->authority, op->path, [o = op](const boost::system::error_code& ec) {
            o->finish(Stage::Upgrade, ec);
        });
    }

    // Stops a sequence whose handlers may still be queued on ioc_
    void abandon_(const std::shared_ptr<ConnectOp>& op) noexcept {
        if (!op) {
            return;
        }
        op->abandoned = true;
        boost::system::error_code ec;
        op->resolver.cancel();
        with_stream_([&ec](auto& ws) { bb::get_lowest_layer(ws).socket().close(ec); });
    }

    void reset_streams_() noexcept {
        plain_.reset();
        secure_.reset();
    }

    template<class F>
    void with_stream_(F&& f) {
        if (secure_) {
            f(*secure_);
        }
        else if (plain_) {
            f(*plain_);
        }
    }

    void run_() noexcept {
        try {
            ioc_.run();
        }
        catch (const std::exception& e) {
            LS_ERROR("[WS] IO thread failed: " << e.what());
            running_.store(false, std::memory_order_release);
            if (on_error_) {
                on_error_(Error::TransportFailure);
            }
            signal_close_();
        }
    }

    void start_read_() {
        with_stream_([this](auto& ws) {
            ws.async_read(buffer_, [this](boost::system::error_code ec, std::size_t) {
                on_read_(ec);
            });
        });
    }

    void on_read_(const boost::system::error_code& ec) {
        if (ec) {
            // Local close: running_ was cleared by close()
            if (!running_.exchange(false, std::memory_order_acq_rel)) {
                LS_TRACE("[WS] Receive cancelled (local shutdown)");
                signal_close_();
                return;
            }
            if (ec == websocket::error::closed) {
                LS_INFO("[WS] Received WebSocket close frame.");
            }
            else {
                auto error = map_read_error(ec);
                LS_WARN("[WS] Receive failed: " << ec.message() << " (" << to_string(error) << ")");
                if (on_error_) {
                    on_error_(error);
                }
            }
            close_socket_();
            signal_close_();
            return;
        }
        if (on_message_) {
            auto data = buffer_.cdata();
            on_message_(std::string_view(static_cast<const char*>(data.data()), data.size()));
        }
        buffer_.consume(buffer_.size());
        start_read_();
    }

    void do_write_() {
        with_stream_([this](auto& ws) {
            ws.async_write(asio::buffer(write_queue_.front()), [this](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    if (running_.load(std::memory_order_acquire)) {
                        LS_ERROR("[WS] Write failed: " << ec.message());
                        if (on_error_) {
                            on_error_(Error::TransportFailure);
                        }
                    }
                    write_queue_.clear();
                    return;
                }
                write_queue_.pop_front();
                if (!write_queue_.empty()) {
                    do_write_();
                }
            });
        });
    }

    // Unblocks the pending read; runs on the IO thread
    void close_socket_() noexcept {
        with_stream_([](auto& ws) {
            boost::system::error_code ec;
            auto& socket = bb::get_lowest_layer(ws).socket();
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        });
    }

    void signal_close_() noexcept {
        if (closed_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        if (on_close_) {
            on_close_();
        }
    }

private:
    asio::io_context ioc_;
    ssl::context     ssl_ctx_;

    std::unique_ptr<plain_stream_t>  plain_;
    std::unique_ptr<secure_stream_t> secure_;

    bb::flat_buffer         buffer_;
    std::deque<std::string> write_queue_;   // IO thread only

    std::chrono::milliseconds connect_timeout_ = config::CONNECT_TIMEOUT;

    std::thread       io_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};

    MessageCallback on_message_;
    CloseCallback   on_close_;
    ErrorCallback   on_error_;
};

// ============================================================================
// WebSocket
// ============================================================================

WebSocket::WebSocket()
    : impl_(std::make_unique<Impl>())
{}

WebSocket::~WebSocket() = default;

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path, bool secure) noexcept {
    return impl_->connect(host, port, path, secure);
}

bool WebSocket::send(const std::string& msg) noexcept {
    return impl_->send(msg);
}

void WebSocket::close() noexcept {
    impl_->close();
}

void WebSocket::set_message_callback(MessageCallback cb) {
    impl_->set_message_callback(std::move(cb));
}

void WebSocket::set_close_callback(CloseCallback cb) {
    impl_->set_close_callback(std::move(cb));
}

void WebSocket::set_error_callback(ErrorCallback cb) {
    impl_->set_error_callback(std::move(cb));
}

void WebSocket::set_connect_timeout(std::chrono::milliseconds timeout) noexcept {
    impl_->set_connect_timeout(timeout);
}

} // namespace beast
} // namespace transport
} // namespace livestand
