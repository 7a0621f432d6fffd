#pragma once

#include "ff1/client/StatusRecords.hpp"
#include "ff1/core/Expected.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace ff1::net {
class WebSocketClient;
}

namespace ff1::client {

/**
 * @brief Pull-based, non-restartable sequence of PlayerStatus records.
 *
 * Each `next()` blocks for the next frame pushed by the device and returns:
 * - a record, when a frame decoded cleanly;
 * - `std::nullopt`, when the device closed the connection cleanly (and on
 *   every call after the sequence has finished);
 * - an error: TransportError if the connection dropped, DecodeError if a
 *   frame was malformed, Timeout if the optional idle watchdog fired.
 *
 * Any error finishes the sequence. A malformed frame is never skipped.
 * Destroying the stream, or calling `close()`, releases the socket; there is
 * no close handshake with the device.
 */
class StatusStream {
public:
    ~StatusStream();
    StatusStream(StatusStream&&) noexcept;
    StatusStream& operator=(StatusStream&&) noexcept;

    StatusStream(const StatusStream&) = delete;
    StatusStream& operator=(const StatusStream&) = delete;

    expected<std::optional<PlayerStatus>> next();

    void close();
    bool finished() const { return finished_; }

private:
    friend class ControlClient;
    StatusStream(std::unique_ptr<net::WebSocketClient> socket,
                 std::string host,
                 std::optional<std::chrono::milliseconds> idleTimeout);

    std::unique_ptr<net::WebSocketClient> socket_;
    std::string host_;
    std::optional<std::chrono::milliseconds> idleTimeout_;
    bool finished_ = false;
};

} // namespace ff1::client
