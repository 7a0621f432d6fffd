#pragma once
// Wire <-> record translation tables for the FF1 status payloads.
// The device speaks camelCase; the records use their own member names. These
// tables are the only place the wire names appear.

#include "ff1/client/StatusRecords.hpp"
#include "ff1/schema/json_schema.hpp"

namespace ff1::client::schema {

namespace fsch = ::ff1::schema;

// --- DeviceStatus ------------------------------------------------------------
inline const auto macAddressesSchema = fsch::makeSchema<MacAddresses>(std::make_tuple(
    fsch::field<&MacAddresses::ethernet>("eth0" , fsch::Text{}),
    fsch::field<&MacAddresses::wireless>("wlan0", fsch::Text{})
));

inline const auto deviceStatusSchema = fsch::makeSchema<DeviceStatus>(std::make_tuple(
    fsch::field<&DeviceStatus::rotation           >("screenRotation"     , fsch::Text{}),
    fsch::field<&DeviceStatus::wifiNetwork        >("connectedWifi"      , fsch::Text{}),
    fsch::field<&DeviceStatus::installedVersion   >("installedVersion"   , fsch::Text{}),
    fsch::field<&DeviceStatus::latestVersion      >("latestVersion"      , fsch::Text{}),
    fsch::field<&DeviceStatus::analyticsDisabled  >("analyticsDisabled"  , fsch::Flag{}),
    fsch::field<&DeviceStatus::betaFeaturesEnabled>("betaFeaturesEnabled", fsch::Flag{}),
    fsch::field<&DeviceStatus::mac                >("macInfo"            , fsch::record(macAddressesSchema)),
    fsch::field<&DeviceStatus::volume             >("volume"             , fsch::Integer<int>{}),
    fsch::field<&DeviceStatus::muted              >("isMuted"            , fsch::Flag{})
));

// --- PlayerStatus ------------------------------------------------------------
inline const auto displaySettingsSchema = fsch::makeSchema<DisplaySettings>(std::make_tuple(
    fsch::field<&DisplaySettings::scaling    >("scaling"    , fsch::Text{}),
    fsch::field<&DisplaySettings::orientation>("orientation", fsch::Text{})
));

inline const auto playerItemSchema = fsch::makeSchema<PlayerItem>(std::make_tuple(
    fsch::field<&PlayerItem::id             >("id"      , fsch::Text{}),
    fsch::field<&PlayerItem::title          >("title"   , fsch::Text{}),
    fsch::field<&PlayerItem::durationSeconds>("duration", fsch::Integer<int>{}),
    fsch::field<&PlayerItem::license        >("license" , fsch::Text{})
));

inline const auto playerStatusSchema = fsch::makeSchema<PlayerStatus>(std::make_tuple(
    fsch::field<&PlayerStatus::castCommand>("castCommand"   , fsch::Text{}),
    fsch::field<&PlayerStatus::playlistUrl>("playlistURL"   , fsch::Text{}),
    fsch::field<&PlayerStatus::playlist   >("playlist"      , fsch::optionalOf(fsch::AnyObject{})),
    fsch::field<&PlayerStatus::index      >("index"         , fsch::Integer<int>{}),
    fsch::field<&PlayerStatus::paused     >("isPaused"      , fsch::Flag{}),
    fsch::field<&PlayerStatus::items      >("items"         , fsch::listOf(fsch::record(playerItemSchema))),
    fsch::field<&PlayerStatus::ok         >("ok"            , fsch::Flag{}),
    fsch::field<&PlayerStatus::error      >("error"         , fsch::Text{}),
    fsch::field<&PlayerStatus::settings   >("deviceSettings", fsch::record(displaySettingsSchema))
));

// --- Convenience helpers -----------------------------------------------------
inline fsch::expected<DeviceStatus, fsch::DecodeError>
decodeDeviceStatus(const fsch::json& wire) {
    return fsch::decode(deviceStatusSchema, wire);
}

inline fsch::json encodeDeviceStatus(const DeviceStatus& status) {
    return fsch::encode(deviceStatusSchema, status);
}

inline fsch::expected<PlayerStatus, fsch::DecodeError>
decodePlayerStatus(const fsch::json& wire) {
    return fsch::decode(playerStatusSchema, wire);
}

inline fsch::json encodePlayerStatus(const PlayerStatus& status) {
    return fsch::encode(playerStatusSchema, status);
}

} // namespace ff1::client::schema
