#pragma once

#include "ff1/client/CommandEnvelope.hpp"
#include "ff1/client/StatusRecords.hpp"
#include "ff1/client/StatusStream.hpp"
#include "ff1/core/Expected.hpp"
#include "ff1/core/FF1Config.hpp"
#include "ff1/device/DeviceDescriptor.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ff1::client {

using ff1::device::DeviceDescriptor;

struct ClientOptions {
    /// Bound on each request/response exchange (resolve, connect, write, read).
    std::chrono::milliseconds callTimeout = config::FF1_CALL_TIMEOUT;
    /// How long getPlayerStatus() waits for the first notification frame.
    std::chrono::milliseconds statusFrameTimeout = config::FF1_STATUS_FRAME_TIMEOUT;
    /// Idle watchdog for watchPlayerStatus(); unset means wait indefinitely.
    std::optional<std::chrono::milliseconds> streamIdleTimeout;
};

/**
 * @brief Command and status client for one resolved FF1.
 *
 * Every command is one POST of a CommandEnvelope to `/api/cast`, carrying the
 * descriptor's credential (API-KEY header) and topic (topicID query
 * parameter) when set. The JSON object the device answers is returned as-is;
 * command-level failures reported inside it are the caller's to interpret.
 * Nothing is retried: reboot, shutdown and updates are not safe to replay.
 *
 * Failures: Timeout when the per-call deadline expires, TransportError for
 * connection failures and non-2xx answers, DecodeError when the body is not a
 * JSON object (or does not match the expected status record).
 */
class ControlClient {
public:
    explicit ControlClient(DeviceDescriptor device, ClientOptions options = {});

    const DeviceDescriptor& device() const { return device_; }
    const ClientOptions& options() const { return options_; }

    // Dispatch -----------------------------------------------------------------
    expected<nlohmann::json> send(std::string_view command,
                                  std::optional<nlohmann::json> request = std::nullopt) const;

    // Device control -----------------------------------------------------------
    expected<nlohmann::json> rotate(bool clockwise = true) const;
    expected<nlohmann::json> setVolume(int percent) const;
    expected<nlohmann::json> toggleMute() const;
    expected<nlohmann::json> sendKey(int code) const;
    expected<nlohmann::json> reboot() const;
    expected<nlohmann::json> shutdown() const;
    expected<nlohmann::json> updateFirmware() const;

    // Playback -----------------------------------------------------------------
    /// Ask the device to fetch and play the DP1 playlist at @p playlistUrl.
    expected<nlohmann::json> displayPlaylistUrl(const std::string& playlistUrl) const;
    /// Play an inline DP1 playlist document.
    expected<nlohmann::json> displayPlaylist(const nlohmann::json& playlist) const;

    // Status -------------------------------------------------------------------
    expected<DeviceStatus> getDeviceStatus() const;
    /// First record of the notification feed, bounded by the call and frame timeouts.
    expected<PlayerStatus> getPlayerStatus() const;
    expected<StatusStream> watchPlayerStatus() const;

    /**
     * @brief Lightweight liveness check used by discovery.
     *
     * Posts `getDeviceStatus` with an empty payload and succeeds only on an
     * HTTP 200 answer within @p timeout. The body is not decoded.
     */
    static expected<void> probe(const DeviceDescriptor& device, std::chrono::milliseconds timeout);

private:
    expected<StatusStream> openStatusStream(std::optional<std::chrono::milliseconds> idleTimeout) const;

    DeviceDescriptor device_;
    ClientOptions options_;
};

} // namespace ff1::client
