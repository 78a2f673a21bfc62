#pragma once

#include <windows.h>
#include <winhttp.h>
#include <concepts>


namespace livestand {
namespace transport {
namespace winhttp {

// -------------------------------------------------------------------------
// ApiConcept defines the WinHTTP WebSocket calls made after the upgrade.
// Injected as a compile-time policy so the receive loop can be tested
// against a fake backend.
// -------------------------------------------------------------------------

template<class T>
concept ApiConcept = requires(
    T api,
    HINTERNET ws,
    void* buffer,
    DWORD size,
    DWORD* bytes,
    WINHTTP_WEB_SOCKET_BUFFER_TYPE* type
) {
    { api.websocket_receive(ws, buffer, size, bytes, type) } -> std::same_as<DWORD>;
    { api.websocket_send(ws, WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE, buffer, size) } -> std::same_as<DWORD>;
    { api.websocket_close(ws) } -> std::same_as<void>;
};

} // namespace winhttp
} // namespace transport
} // namespace livestand
