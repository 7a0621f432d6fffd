#include "ff1/client/StatusRecords.hpp"

#include <sstream>
#include <tuple>

namespace ff1::client {

bool operator==(const MacAddresses& a, const MacAddresses& b) {
    return std::tie(a.ethernet, a.wireless) == std::tie(b.ethernet, b.wireless);
}

bool operator==(const DeviceStatus& a, const DeviceStatus& b) {
    return std::tie(a.rotation, a.wifiNetwork, a.installedVersion, a.latestVersion,
                    a.analyticsDisabled, a.betaFeaturesEnabled, a.mac, a.volume, a.muted)
        == std::tie(b.rotation, b.wifiNetwork, b.installedVersion, b.latestVersion,
                    b.analyticsDisabled, b.betaFeaturesEnabled, b.mac, b.volume, b.muted);
}

bool operator==(const DisplaySettings& a, const DisplaySettings& b) {
    return std::tie(a.scaling, a.orientation) == std::tie(b.scaling, b.orientation);
}

bool operator==(const PlayerItem& a, const PlayerItem& b) {
    return std::tie(a.id, a.title, a.durationSeconds, a.license)
        == std::tie(b.id, b.title, b.durationSeconds, b.license);
}

bool operator==(const PlayerStatus& a, const PlayerStatus& b) {
    return std::tie(a.castCommand, a.playlistUrl, a.playlist, a.index, a.paused,
                    a.items, a.ok, a.error, a.settings)
        == std::tie(b.castCommand, b.playlistUrl, b.playlist, b.index, b.paused,
                    b.items, b.ok, b.error, b.settings);
}

std::string DeviceStatus::describe() const {
    std::ostringstream os;
    os << "rotation=" << rotation
       << " wifi=" << wifiNetwork
       << " version=" << installedVersion
       << (installedVersion != latestVersion && !latestVersion.empty() ? " (update " + latestVersion + ")" : "")
       << " volume=" << volume << (muted ? " muted" : "");
    return os.str();
}

std::string PlayerStatus::describe() const {
    std::ostringstream os;
    os << "cast=" << castCommand
       << " index=" << index << '/' << items.size()
       << (paused ? " paused" : " playing");
    if (!ok) {
        os << " error=" << error;
    }
    return os.str();
}

} // namespace ff1::client
