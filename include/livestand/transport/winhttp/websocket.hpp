#pragma once

#include <string>
#include <string_view>
#include <thread>
#include <functional>
#include <atomic>
#include <vector>
#include <charconv>

#include "livestand/transport/concepts.hpp"
#include "livestand/transport/error.hpp"
#include "livestand/transport/winhttp/real_api.hpp"
#include "lcr/log/logger.hpp"

#include <windows.h>
#include <winhttp.h>
#include <winerror.h>

/*
================================================================================
WebSocket Transport (WinHTTP)
================================================================================

Single-connection WebSocket primitive on top of WinHTTP.

  • No retries and no reconnection: the ConnectionManager owns that policy
  • ws:// and wss:// (WINHTTP_FLAG_SECURE only for secure targets)
  • One receive thread per successful connect(); fragmented frames are
    reassembled before the message callback fires
  • Errors are reported through the error callback before the close
    callback, and close is signalled exactly once
  • WinHTTP WebSocket calls go through the ApiConcept policy so the receive
    loop can run against a fake backend in unit tests

================================================================================
*/


namespace livestand {
namespace transport {
namespace winhttp {

// UTF-8 to UTF-16 for the WinHTTP wide-string API
inline std::wstring to_wide(const std::string& utf8) {
    if (utf8.empty()) return L"";
    int size = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), (int)utf8.size(), NULL, 0);
    std::wstring out(size, 0);
    MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), (int)utf8.size(), &out[0], size);
    return out;
}

template<ApiConcept Api = RealApi>
class WebSocketImpl {
    // Snapshots of a full 16-team roster stay well below this size; larger
    // messages arrive as fragments and are reassembled
    constexpr static size_t RX_BUFFER_SIZE = 16 * 1024;

public:
    WebSocketImpl() noexcept = default;

    WebSocketImpl(const WebSocketImpl&) = delete;
    WebSocketImpl& operator=(const WebSocketImpl&) = delete;

    ~WebSocketImpl() {
        close();
        if (hSession_) {
            WinHttpCloseHandle(hSession_);
            hSession_ = nullptr;
        }
    }

    [[nodiscard]]
    inline Error connect(const std::string& host, const std::string& port, const std::string& path, bool secure) noexcept {
        INTERNET_PORT port_number = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), port_number);
        if (ec != std::errc{} || ptr != port.data() + port.size()) {
            LS_ERROR("[WS] Invalid port '" << port << "'");
            return Error::InvalidUrl;
        }

        hSession_ = WinHttpOpen(
            L"Livestand/1.0",
            WINHTTP_ACCESS_TYPE_DEFAULT_PROXY,
            WINHTTP_NO_PROXY_NAME,
            WINHTTP_NO_PROXY_BYPASS,
            0
        );
        if (!hSession_) {
            LS_ERROR("[WS] WinHttpOpen failed");
            return Error::TransportFailure;
        }

        hConnect_ = WinHttpConnect(hSession_, to_wide(host).c_str(), port_number, 0);
        if (!hConnect_) {
            LS_ERROR("[WS] WinHttpConnect failed");
            return Error::ConnectionFailed;
        }

        hRequest_ = WinHttpOpenRequest(
            hConnect_,
            L"GET",
            to_wide(path).c_str(),
            nullptr,
            WINHTTP_NO_REFERER,
            WINHTTP_DEFAULT_ACCEPT_TYPES,
            secure ? WINHTTP_FLAG_SECURE : 0
        );
        if (!hRequest_) {
            LS_ERROR("[WS] WinHttpOpenRequest failed");
            return Error::TransportFailure;
        }

        if (!WinHttpSetOption(hRequest_, WINHTTP_OPTION_UPGRADE_TO_WEB_SOCKET, nullptr, 0)) {
            LS_ERROR("[WS] WinHttpSetOption failed");
            return Error::ProtocolError;
        }

        if (!WinHttpSendRequest(hRequest_, nullptr, 0, nullptr, 0, 0, 0)) {
            LS_ERROR("[WS] WinHttpSendRequest failed");
            return Error::ConnectionFailed;
        }

        if (!WinHttpReceiveResponse(hRequest_, nullptr)) {
            LS_ERROR("[WS] WinHttpReceiveResponse failed");
            return Error::HandshakeFailed;
        }

        hWebSocket_ = WinHttpWebSocketCompleteUpgrade(hRequest_, 0);
        if (!hWebSocket_) {
            LS_ERROR("[WS] WinHttpWebSocketCompleteUpgrade failed");
            return Error::HandshakeFailed;
        }

        LS_DEBUG("[WS] Connected to " << (secure ? "wss://" : "ws://") << host << ":" << port << path);
        running_.store(true, std::memory_order_relaxed);
        recv_thread_ = std::thread(&WebSocketImpl::receive_loop_, this);
        return Error::None;
    }

    // Sends one text frame. Failures are also reported via the error callback.
    [[nodiscard]]
    inline bool send(const std::string& msg) noexcept {
        if (!hWebSocket_) {
            LS_ERROR("[WS] send() called on unconnected WebSocket");
            return false;
        }
        LS_TRACE("[WS:API] Sending message ... (size " << msg.size() << ")");
        const bool ok = api_.websocket_send(
                   hWebSocket_,
                   WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE,
                   (void*)msg.data(),
                   (DWORD)msg.size()) == ERROR_SUCCESS;
        if (!ok) [[unlikely]] {
            LS_ERROR("[WS] websocket_send() failed");
            if (on_error_) {
                on_error_(Error::TransportFailure);
            }
        }
        return ok;
    }

    inline void close() noexcept {
        if (hWebSocket_) {
            LS_TRACE("[WS:API] Closing WebSocket ...");
            api_.websocket_close(hWebSocket_);
        }
        running_.store(false, std::memory_order_release);
        signal_close_();
        if (recv_thread_.joinable()) {
            if (recv_thread_.get_id() == std::this_thread::get_id()) {
                recv_thread_.detach();
            }
            else {
                recv_thread_.join();
            }
        }
        if (hWebSocket_) { WinHttpCloseHandle(hWebSocket_); hWebSocket_ = nullptr; }
        if (hRequest_)   { WinHttpCloseHandle(hRequest_);   hRequest_ = nullptr; }
        if (hConnect_)   { WinHttpCloseHandle(hConnect_);   hConnect_ = nullptr; }
        LS_TRACE("[WS] WebSocket closed.");
    }

    // Invoked on each complete message, from the receive thread
    inline void set_message_callback(MessageCallback cb) noexcept {
        on_message_ = std::move(cb);
    }

    // Close is always signalled exactly once
    inline void set_close_callback(CloseCallback cb) noexcept {
        on_close_ = std::move(cb);
    }

    // Error callbacks are delivered before close callbacks
    inline void set_error_callback(ErrorCallback cb) noexcept {
        on_error_ = std::move(cb);
    }

private:
    inline void receive_loop_() noexcept {
#ifdef LS_UNIT_TEST
        if (receive_started_flag_) {
            receive_started_flag_->store(true, std::memory_order_release);
        }
#endif // LS_UNIT_TEST
        std::vector<char> buffer(RX_BUFFER_SIZE);
        while (running_.load(std::memory_order_acquire)) {
            DWORD bytes = 0;
            WINHTTP_WEB_SOCKET_BUFFER_TYPE type;
            DWORD result = api_.websocket_receive(
                hWebSocket_,
                buffer.data(),
                (DWORD)buffer.size(),
                &bytes,
                &type
            );
            // Abnormal termination
            if (result != ERROR_SUCCESS) [[unlikely]] {
                auto error = handle_receive_error_(result);
                if (on_error_) {
                    on_error_(error);
                }
                running_.store(false, std::memory_order_release);
                signal_close_();
                break;
            }
            // Normal termination
            if (type == WINHTTP_WEB_SOCKET_CLOSE_BUFFER_TYPE) {
                LS_INFO("[WS] Received WebSocket close frame.");
                running_.store(false, std::memory_order_release);
                signal_close_();
                break;
            }
            // Final frame of a message
            if (type == WINHTTP_WEB_SOCKET_BINARY_MESSAGE_BUFFER_TYPE || type == WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE) [[likely]] {
                if (message_buffer_.empty()) {
                    if (on_message_) {
                        on_message_(std::string_view(buffer.data(), bytes));
                    }
                }
                else {
                    message_buffer_.append(buffer.data(), bytes);
                    if (on_message_) {
                        on_message_(std::string_view(message_buffer_.data(), message_buffer_.size()));
                    }
                    message_buffer_.clear();
                }
            }
            // Fragment
            else if (type == WINHTTP_WEB_SOCKET_BINARY_FRAGMENT_BUFFER_TYPE || type == WINHTTP_WEB_SOCKET_UTF8_FRAGMENT_BUFFER_TYPE) {
                LS_DEBUG("[WS] Received message fragment (size " << bytes << ")");
                message_buffer_.append(buffer.data(), bytes);
            }
        }
    }

    inline Error handle_receive_error_(DWORD error) noexcept {
        switch (error) {
        case ERROR_WINHTTP_OPERATION_CANCELLED:
            LS_TRACE("[WS] Receive cancelled (local shutdown)");
            return Error::LocalShutdown;

        case ERROR_WINHTTP_CONNECTION_ERROR:
            LS_INFO("[WS] Connection closed by peer");
            return Error::RemoteClosed;

        case ERROR_WINHTTP_TIMEOUT:
            LS_WARN("[WS] Receive timeout");
            return Error::Timeout;

        case ERROR_WINHTTP_CANNOT_CONNECT:
            LS_ERROR("[WS] Cannot connect to remote host");
            return Error::ConnectionFailed;

        default:
            LS_ERROR("[WS] Receive failed with error code " << error);
            return Error::TransportFailure;
        }
    }

    inline void signal_close_() noexcept {
        message_buffer_.clear();
        if (closed_.exchange(true)) {
            return;
        }
        if (on_close_) {
            on_close_();
        }
    }

private:
    Api api_;

    std::string message_buffer_{};

    HINTERNET hSession_   = nullptr;
    HINTERNET hConnect_   = nullptr;
    HINTERNET hRequest_   = nullptr;
    HINTERNET hWebSocket_ = nullptr;

    std::thread recv_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};

    MessageCallback on_message_;
    CloseCallback   on_close_;
    ErrorCallback   on_error_;

#ifdef LS_UNIT_TEST
public:
    Api& test_api() noexcept {
        return api_;
    }

    // Starts the receive loop on a fake handle, without connect()
    void test_start_receive_loop() noexcept {
        LS_TRACE("[WS:TEST] Connecting WebSocket (simulated) ...");
        hWebSocket_ = reinterpret_cast<HINTERNET>(1);
        running_.store(true, std::memory_order_release);
        recv_thread_ = std::thread(&WebSocketImpl::receive_loop_, this);
    }

    // Set to true once receive_loop_() runs, so tests wait on real state
    void set_receive_started_flag(std::atomic<bool>* flag) noexcept {
        receive_started_flag_ = flag;
    }

private:
    std::atomic<bool>* receive_started_flag_ = nullptr;
#endif // LS_UNIT_TEST

};

using WebSocket = WebSocketImpl<RealApi>;
static_assert(livestand::transport::WebSocketConcept<WebSocket>);

} // namespace winhttp
} // namespace transport
} // namespace livestand
