#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ff1::client {

struct MacAddresses {
    std::string ethernet;
    std::string wireless;
};

/// Snapshot returned by `getDeviceStatus`.
struct DeviceStatus {
    std::string rotation;
    std::string wifiNetwork;
    std::string installedVersion;
    std::string latestVersion;
    bool analyticsDisabled = false;
    bool betaFeaturesEnabled = false;
    MacAddresses mac{};
    int volume = 0;
    bool muted = false;

    std::string describe() const;
};

struct DisplaySettings {
    std::string scaling;
    std::string orientation;
};

struct PlayerItem {
    std::string id;
    std::string title;
    int durationSeconds = 0;
    std::string license;
};

/// Snapshot pushed on the notification feed.
struct PlayerStatus {
    std::string castCommand;
    std::string playlistUrl;
    std::optional<nlohmann::json> playlist;  ///< Absent unless the device reports one.
    int index = 0;
    bool paused = false;
    std::vector<PlayerItem> items;
    bool ok = true;
    std::string error;
    DisplaySettings settings{};

    std::string describe() const;
};

bool operator==(const MacAddresses& a, const MacAddresses& b);
bool operator==(const DeviceStatus& a, const DeviceStatus& b);
bool operator==(const DisplaySettings& a, const DisplaySettings& b);
bool operator==(const PlayerItem& a, const PlayerItem& b);
bool operator==(const PlayerStatus& a, const PlayerStatus& b);

inline bool operator!=(const DeviceStatus& a, const DeviceStatus& b) { return !(a == b); }
inline bool operator!=(const PlayerStatus& a, const PlayerStatus& b) { return !(a == b); }

} // namespace ff1::client
