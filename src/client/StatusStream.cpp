#include "ff1/client/StatusStream.hpp"

#include "ff1/client/FeedErrors.hpp"
#include "ff1/client/status_schema.hpp"
#include "ff1/log/Log.hpp"
#include "ff1/net/WebSocketClient.hpp"

#include <utility>

namespace ff1::client {

namespace asio = ff1::net::asio;
namespace websocket = ff1::net::websocket;

std::optional<Error> classifyFeedError(const net::error_code& ec,
                                       const std::string& host,
                                       std::optional<std::chrono::milliseconds> idleTimeout) {
    if (ec == websocket::error::closed) {
        return std::nullopt;
    }
    if (ec == asio::error::timed_out && idleTimeout) {
        return Error::timedOut(host, *idleTimeout, "no status frame within the idle timeout");
    }
    return Error::transport(host, "notification feed dropped: " + ec.message());
}

StatusStream::StatusStream(std::unique_ptr<net::WebSocketClient> socket,
                           std::string host,
                           std::optional<std::chrono::milliseconds> idleTimeout)
: socket_(std::move(socket))
, host_(std::move(host))
, idleTimeout_(idleTimeout)
{}

StatusStream::~StatusStream() {
    close();
}

StatusStream::StatusStream(StatusStream&&) noexcept = default;
StatusStream& StatusStream::operator=(StatusStream&&) noexcept = default;

void StatusStream::close() {
    if (socket_) {
        socket_->close();
    }
    finished_ = true;
}

expected<std::optional<PlayerStatus>> StatusStream::next() {
    if (finished_ || !socket_) {
        return std::optional<PlayerStatus>{};
    }

    std::string frame;
    const auto ec = idleTimeout_ ? socket_->read(frame, *idleTimeout_) : socket_->read(frame);
    if (ec) {
        close();
        if (auto error = classifyFeedError(ec, host_, idleTimeout_)) {
            return unexpected(std::move(*error));
        }
        logInfo("[StatusStream] ", host_, " closed the notification feed\n");
        return std::optional<PlayerStatus>{};
    }

    auto wire = nlohmann::json::parse(frame, nullptr, false);
    if (wire.is_discarded()) {
        close();
        return unexpected(Error::decode("status frame is not valid JSON"));
    }
    auto status = schema::decodePlayerStatus(wire);
    if (!status) {
        close();
        return unexpected(Error::decode("status frame " + status.error().where + ": " + status.error().what));
    }
    return std::optional<PlayerStatus>{std::move(*status)};
}

} // namespace ff1::client
