#pragma once
#include "ff1/net/NetConfig.hpp"

#include <memory>
#include <string>

namespace ff1::net {

/**
 * @brief Client side of a single WebSocket connection, driven synchronously.
 *
 * `connect` (resolve + TCP connect + upgrade handshake) is bounded by one
 * deadline. `read` blocks until the next message arrives; the overload with a
 * timeout acts as an idle watchdog and closes the connection when it fires.
 * A clean close initiated by the peer is reported as
 * `websocket::error::closed`, distinct from drops (`eof`, `connection_reset`).
 *
 * `close()` may be called from any thread to abandon the connection; a read
 * blocked in another thread completes with `operation_aborted`.
 */
class WebSocketClient {
public:
    WebSocketClient();
    ~WebSocketClient();

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    error_code connect(const std::string& host, unsigned short port,
                       const std::string& target, milliseconds timeout);

    error_code read(std::string& message);
    error_code read(std::string& message, milliseconds idleTimeout);

    void close();

private:
    struct Session;
    std::shared_ptr<Session> session_;
};

} // namespace ff1::net
