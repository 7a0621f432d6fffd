#pragma once

#include <string_view>

/// Command names understood by feral-controld's `/api/cast` endpoint.
namespace ff1::command {

constexpr std::string_view KEYBOARD_EVENT = "sendKeyboardEvent";
constexpr std::string_view ROTATE = "rotate";
constexpr std::string_view SHUTDOWN = "shutdown";
constexpr std::string_view REBOOT = "reboot";
constexpr std::string_view DEVICE_STATUS = "getDeviceStatus";
constexpr std::string_view UPDATE = "updateToLatestVersion";
constexpr std::string_view SET_VOLUME = "setVolume";
constexpr std::string_view TOGGLE_MUTE = "toggleMute";
constexpr std::string_view DISPLAY_PLAYLIST = "displayPlaylist";

} // namespace ff1::command
