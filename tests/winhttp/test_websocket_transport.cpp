/*
================================================================================
 transport::winhttp::WebSocket — Unit Tests
================================================================================

Scope:
------
Receive loop, close signalling and send behavior of the WinHTTP transport,
without WinHTTP, the network or a server. The real implementation
(WebSocketImpl<Api>) runs against a fake WebSocket API injected as a
compile-time policy; frames, fragment boundaries and error codes are scripted.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

W1. A close frame signals close exactly once, also across repeated close()
W2. Receive errors are mapped and reported before the close callback
W3. Complete messages are delivered once each, in order
W4. Fragments are reassembled into one message
W5. send() forwards one UTF-8 frame; a failed send is reported as an error

================================================================================
*/

#include <atomic>
#include <iostream>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <cstring>

#include "livestand/transport/winhttp/websocket.hpp"
#include "common/test_check.hpp"

using namespace livestand::transport;
using namespace livestand::transport::winhttp;


// -----------------------------------------------------------------------------
// Fake WinHTTP WebSocket API
// -----------------------------------------------------------------------------
struct FakeApi {
    struct Frame {
        DWORD                          result;
        WINHTTP_WEB_SOCKET_BUFFER_TYPE type;
        std::string                    bytes;
    };

    std::queue<Frame> frames;

    std::atomic<int> receive_count{0};
    int send_count  = 0;
    int close_count = 0;

    DWORD                          send_result = ERROR_SUCCESS;
    WINHTTP_WEB_SOCKET_BUFFER_TYPE last_send_type{};
    std::string                    last_sent;

    void push(WINHTTP_WEB_SOCKET_BUFFER_TYPE type, std::string bytes = {}) {
        frames.push(Frame{ERROR_SUCCESS, type, std::move(bytes)});
    }

    void push_error(DWORD result) {
        frames.push(Frame{result, WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE, {}});
    }

    DWORD websocket_receive(HINTERNET, void* buffer, DWORD size, DWORD* bytes, WINHTTP_WEB_SOCKET_BUFFER_TYPE* type) {
        ++receive_count;
        if (frames.empty()) {
            return ERROR_INVALID_HANDLE;
        }
        Frame f = std::move(frames.front());
        frames.pop();
        const DWORD n = static_cast<DWORD>(f.bytes.size()) < size ? static_cast<DWORD>(f.bytes.size()) : size;
        std::memcpy(buffer, f.bytes.data(), n);
        *bytes = n;
        *type  = f.type;
        return f.result;
    }

    DWORD websocket_send(HINTERNET, WINHTTP_WEB_SOCKET_BUFFER_TYPE type, void* buffer, DWORD size) {
        ++send_count;
        last_send_type = type;
        last_sent.assign(static_cast<const char*>(buffer), size);
        return send_result;
    }

    void websocket_close(HINTERNET) {
        ++close_count;
    }
};
static_assert(ApiConcept<FakeApi>, "FakeApi must model ApiConcept");

using TestWebSocket = WebSocketImpl<FakeApi>;

// Thread-safe event log written from the receive thread
struct EventLog {
    std::mutex               mutex;
    std::vector<std::string> events;
    std::atomic<int>         count{0};

    void add(std::string e) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(std::move(e));
        count.fetch_add(1, std::memory_order_release);
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    void wait_for(int n) {
        while (count.load(std::memory_order_acquire) < n) {
            std::this_thread::yield();
        }
    }
};

static void attach(TestWebSocket& ws, EventLog& log) {
    ws.set_message_callback([&log](std::string_view msg) { log.add("msg:" + std::string(msg)); });
    ws.set_error_callback([&log](Error err) { log.add("error:" + std::string(to_string(err))); });
    ws.set_close_callback([&log]() { log.add("close"); });
}


// -----------------------------------------------------------------------------
// W1. Close frame
// -----------------------------------------------------------------------------
void test_close_frame_signals_once() {
    std::cout << "[TEST] W1: close frame signals close once\n";
    TestWebSocket ws;
    EventLog log;
    attach(ws, log);

    std::atomic<bool> receive_started{false};
    ws.set_receive_started_flag(&receive_started);

    ws.test_api().push(WINHTTP_WEB_SOCKET_CLOSE_BUFFER_TYPE);
    ws.test_start_receive_loop();

    log.wait_for(1);
    TEST_CHECK(receive_started.load(std::memory_order_acquire));

    ws.close();
    ws.close();

    auto events = log.snapshot();
    TEST_CHECK(events.size() == 1);
    TEST_CHECK(events[0] == "close");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W2. Receive errors
// -----------------------------------------------------------------------------
void test_receive_error_then_close() {
    std::cout << "[TEST] W2: receive error is reported before close\n";
    {
        TestWebSocket ws;
        EventLog log;
        attach(ws, log);

        ws.test_api().push_error(ERROR_WINHTTP_CONNECTION_ERROR);
        ws.test_start_receive_loop();

        log.wait_for(2);
        ws.close();

        auto events = log.snapshot();
        TEST_CHECK(events.size() == 2);
        TEST_CHECK(events[0] == "error:" + std::string(to_string(Error::RemoteClosed)));
        TEST_CHECK(events[1] == "close");
    }
    {
        TestWebSocket ws;
        EventLog log;
        attach(ws, log);

        ws.test_api().push_error(ERROR_WINHTTP_TIMEOUT);
        ws.test_start_receive_loop();

        log.wait_for(2);
        ws.close();

        auto events = log.snapshot();
        TEST_CHECK(events[0] == "error:" + std::string(to_string(Error::Timeout)));
        TEST_CHECK(events[1] == "close");
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W3. Complete messages
// -----------------------------------------------------------------------------
void test_messages_in_order() {
    std::cout << "[TEST] W3: complete messages are delivered in order\n";
    TestWebSocket ws;
    EventLog log;
    attach(ws, log);

    ws.test_api().push(WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE, R"({"code":201})");
    ws.test_api().push(WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE, R"({"code":200,"data":"x"})");
    ws.test_api().push(WINHTTP_WEB_SOCKET_CLOSE_BUFFER_TYPE);
    ws.test_start_receive_loop();

    log.wait_for(3);
    ws.close();

    auto events = log.snapshot();
    TEST_CHECK(events.size() == 3);
    TEST_CHECK(events[0] == R"(msg:{"code":201})");
    TEST_CHECK(events[1] == R"(msg:{"code":200,"data":"x"})");
    TEST_CHECK(events[2] == "close");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W4. Fragment reassembly
// -----------------------------------------------------------------------------
void test_fragments_reassembled() {
    std::cout << "[TEST] W4: fragments are reassembled\n";
    TestWebSocket ws;
    EventLog log;
    attach(ws, log);

    ws.test_api().push(WINHTTP_WEB_SOCKET_UTF8_FRAGMENT_BUFFER_TYPE, R"({"code":200,)");
    ws.test_api().push(WINHTTP_WEB_SOCKET_UTF8_FRAGMENT_BUFFER_TYPE, R"("data":)");
    ws.test_api().push(WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE, R"("abc"})");
    ws.test_api().push(WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE, "next");
    ws.test_api().push(WINHTTP_WEB_SOCKET_CLOSE_BUFFER_TYPE);
    ws.test_start_receive_loop();

    log.wait_for(3);
    ws.close();

    auto events = log.snapshot();
    TEST_CHECK(events.size() == 3);
    TEST_CHECK(events[0] == R"(msg:{"code":200,"data":"abc"})");
    TEST_CHECK(events[1] == "msg:next");
    TEST_CHECK(events[2] == "close");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W5. send()
// -----------------------------------------------------------------------------
void test_send() {
    std::cout << "[TEST] W5: send() forwards one text frame\n";
    {
        TestWebSocket ws;
        EventLog log;
        attach(ws, log);

        // Unconnected
        TEST_CHECK(!ws.send("early"));
        TEST_CHECK(ws.test_api().send_count == 0);

        ws.test_api().push(WINHTTP_WEB_SOCKET_CLOSE_BUFFER_TYPE);
        ws.test_start_receive_loop();
        log.wait_for(1);

        TEST_CHECK(ws.send(R"({"access_token":"tok"})"));
        TEST_CHECK(ws.test_api().send_count == 1);
        TEST_CHECK(ws.test_api().last_send_type == WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE);
        TEST_CHECK(ws.test_api().last_sent == R"({"access_token":"tok"})");
        ws.close();
    }
    {
        TestWebSocket ws;
        EventLog log;
        attach(ws, log);

        ws.test_api().send_result = ERROR_WINHTTP_CONNECTION_ERROR;
        ws.test_api().push(WINHTTP_WEB_SOCKET_CLOSE_BUFFER_TYPE);
        ws.test_start_receive_loop();
        log.wait_for(1);

        TEST_CHECK(!ws.send("hello"));
        TEST_CHECK(ws.test_api().send_count == 1);
        ws.close();

        auto events = log.snapshot();
        TEST_CHECK(events.size() == 2);
        TEST_CHECK(events[0] == "close");
        TEST_CHECK(events[1] == "error:" + std::string(to_string(Error::TransportFailure)));
    }

    std::cout << "[TEST] OK\n";
}


int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_close_frame_signals_once();
    test_receive_error_then_close();
    test_messages_in_order();
    test_fragments_reassembled();
    test_send();

    std::cout << "\n[WINHTTP TRANSPORT TESTS PASSED]\n";
    return 0;
}
