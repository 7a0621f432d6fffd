#include "ff1/client/ControlClient.hpp"

#include "ff1/client/Commands.hpp"
#include "ff1/client/status_schema.hpp"
#include "ff1/log/Log.hpp"
#include "ff1/net/HttpClient.hpp"
#include "ff1/net/WebSocketClient.hpp"

#include <cctype>
#include <memory>
#include <sstream>
#include <utility>

namespace ff1::client {

using nlohmann::json;
namespace asio = ff1::net::asio;

namespace {

std::string percentEncode(std::string_view text) {
    std::ostringstream os;
    os << std::hex << std::uppercase;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            os << static_cast<char>(c);
        } else {
            os << '%' << ((c >> 4) & 0xF) << (c & 0xF);
        }
    }
    return os.str();
}

std::string withTopic(std::string_view path, const DeviceDescriptor& device) {
    std::string target(path);
    if (device.topicId) {
        target += "?";
        target += config::FF1_TOPIC_QUERY_PARAM;
        target += "=";
        target += percentEncode(*device.topicId);
    }
    return target;
}

Error networkError(const DeviceDescriptor& device,
                   const net::error_code& ec,
                   std::chrono::milliseconds timeout,
                   std::string_view what) {
    if (ec == asio::error::timed_out) {
        return Error::timedOut(device.host, timeout, std::string(what) + " timed out");
    }
    return Error::transport(device.host, std::string(what) + " failed: " + ec.message());
}

// One POST of @p envelope to /api/cast. Transport-level success only.
expected<net::HttpResponse> postEnvelope(const DeviceDescriptor& device,
                                         const CommandEnvelope& envelope,
                                         std::chrono::milliseconds timeout) {
    net::HttpRequest request;
    request.host = device.host;
    request.port = device.port;
    request.target = withTopic(config::FF1_CAST_PATH, device);
    if (device.credential) {
        request.headers.emplace_back(std::string(config::FF1_API_KEY_HEADER), *device.credential);
    }
    request.body = encodeEnvelope(envelope).dump();

    net::HttpClient http(timeout);
    net::HttpResponse response;
    if (auto ec = http.post(request, response); ec) {
        return unexpected(networkError(device, ec, timeout, "command '" + envelope.command + "'"));
    }
    if (response.status < 200 || response.status >= 300) {
        return unexpected(Error::transport(device.host,
            "command '" + envelope.command + "' rejected with HTTP " + std::to_string(response.status),
            static_cast<int>(response.status)));
    }
    return response;
}

} // namespace

ControlClient::ControlClient(DeviceDescriptor device, ClientOptions options)
: device_(std::move(device))
, options_(options)
{}

expected<json> ControlClient::send(std::string_view command, std::optional<json> request) const {
    CommandEnvelope envelope{std::string(command), std::move(request)};

    logInfo("[ControlClient] ", device_.label(), " <- ", envelope.command, "\n");

    auto response = postEnvelope(device_, envelope, options_.callTimeout);
    if (!response) {
        return unexpected(response.error());
    }

    json body = json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        return unexpected(Error::decode("response to '" + envelope.command + "' is not valid JSON"));
    }
    if (!body.is_object()) {
        return unexpected(Error::decode("response to '" + envelope.command + "' is not a JSON object"));
    }
    return body;
}

expected<json> ControlClient::rotate(bool clockwise) const {
    return send(command::ROTATE, json{{"clockwise", clockwise}});
}

expected<json> ControlClient::setVolume(int percent) const {
    return send(command::SET_VOLUME, json{{"percent", percent}});
}

expected<json> ControlClient::toggleMute() const {
    return send(command::TOGGLE_MUTE);
}

expected<json> ControlClient::sendKey(int code) const {
    return send(command::KEYBOARD_EVENT, json{{"code", code}});
}

expected<json> ControlClient::reboot() const {
    return send(command::REBOOT);
}

expected<json> ControlClient::shutdown() const {
    return send(command::SHUTDOWN);
}

expected<json> ControlClient::updateFirmware() const {
    return send(command::UPDATE);
}

expected<json> ControlClient::displayPlaylistUrl(const std::string& playlistUrl) const {
    if (playlistUrl.empty()) {
        return unexpected(Error::invalidArgument("playlist URL is empty"));
    }
    return send(command::DISPLAY_PLAYLIST, json{{"playlistUrl", playlistUrl}});
}

expected<json> ControlClient::displayPlaylist(const json& playlist) const {
    if (!playlist.is_object() || playlist.empty()) {
        return unexpected(Error::invalidArgument("playlist must be a non-empty JSON object"));
    }
    return send(command::DISPLAY_PLAYLIST, json{
        {"dp1_call", playlist},
        {"intent", {{"action", "now_display"}}},
    });
}

expected<DeviceStatus> ControlClient::getDeviceStatus() const {
    auto body = send(command::DEVICE_STATUS);
    if (!body) {
        return unexpected(body.error());
    }
    auto status = schema::decodeDeviceStatus(*body);
    if (!status) {
        return unexpected(Error::decode("device status " + status.error().where + ": " + status.error().what));
    }
    return std::move(*status);
}

expected<PlayerStatus> ControlClient::getPlayerStatus() const {
    auto stream = openStatusStream(options_.statusFrameTimeout);
    if (!stream) {
        return unexpected(stream.error());
    }
    auto first = stream->next();
    if (!first) {
        return unexpected(first.error());
    }
    if (!*first) {
        return unexpected(Error::transport(device_.host, "notification feed closed before the first status"));
    }
    return std::move(**first);
}

expected<StatusStream> ControlClient::watchPlayerStatus() const {
    return openStatusStream(options_.streamIdleTimeout);
}

expected<StatusStream>
ControlClient::openStatusStream(std::optional<std::chrono::milliseconds> idleTimeout) const {
    auto socket = std::make_unique<net::WebSocketClient>();
    const auto target = withTopic(config::FF1_NOTIFICATION_PATH, device_);
    if (auto ec = socket->connect(device_.host, device_.port, target, options_.callTimeout); ec) {
        return unexpected(networkError(device_, ec, options_.callTimeout, "notification connect"));
    }
    return StatusStream(std::move(socket), device_.host, idleTimeout);
}

expected<void> ControlClient::probe(const DeviceDescriptor& device, std::chrono::milliseconds timeout) {
    auto response = postEnvelope(device, CommandEnvelope{std::string(command::DEVICE_STATUS), json::object()}, timeout);
    if (!response) {
        return unexpected(response.error());
    }
    if (response->status != 200) {
        return unexpected(Error::transport(device.host,
            "probe answered HTTP " + std::to_string(response->status),
            static_cast<int>(response->status)));
    }
    return {};
}

} // namespace ff1::client
