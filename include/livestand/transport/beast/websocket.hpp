#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "livestand/transport/concepts.hpp"
#include "livestand/transport/error.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast)
================================================================================

Portable single-connection WebSocket primitive built on Boost.Beast, over
plain TCP (ws://) or TLS via OpenSSL (wss://).

  • connect() runs resolve, TCP, TLS + SNI and the WebSocket upgrade on
    the calling thread, bounded by a deadline (config::CONNECT_TIMEOUT
    unless set_connect_timeout() overrides it); expiry returns Timeout
  • One receive thread per successful connect()
  • Errors are reported through the error callback before the close
    callback, and close is signalled exactly once
  • close() is idempotent and may be called from any thread, including
    from inside a callback

Boost and OpenSSL headers stay in the implementation file.

================================================================================
*/

namespace livestand {
namespace transport {
namespace beast {

class WebSocket {
public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& path, bool secure) noexcept;

    [[nodiscard]]
    bool send(const std::string& msg) noexcept;

    void close() noexcept;

    void set_message_callback(MessageCallback cb);
    void set_close_callback(CloseCallback cb);
    void set_error_callback(ErrorCallback cb);

    void set_connect_timeout(std::chrono::milliseconds timeout) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

static_assert(livestand::transport::WebSocketConcept<WebSocket>);

} // namespace beast
} // namespace transport
} // namespace livestand
