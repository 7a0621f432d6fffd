#pragma once

#include <chrono>
#include <string_view>

namespace ff1::config {

/**
 * @brief Constants that define the FF1 control-service protocol and defaults.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short FF1_DEFAULT_PORT = 1111;
constexpr std::string_view FF1_CAST_PATH = "/api/cast";
constexpr std::string_view FF1_NOTIFICATION_PATH = "/api/notification";
constexpr std::string_view FF1_API_KEY_HEADER = "API-KEY";
constexpr std::string_view FF1_TOPIC_QUERY_PARAM = "topicID";

// Timeouts --------------------------------------------------------------------
constexpr std::chrono::milliseconds FF1_CALL_TIMEOUT{30000};
constexpr std::chrono::milliseconds FF1_PROBE_TIMEOUT{3000};
constexpr std::chrono::milliseconds FF1_STATUS_FRAME_TIMEOUT{10000};

// Discovery -------------------------------------------------------------------
// Devices name themselves FF1-XXXXXXXX (derived from the MAC address).
constexpr std::string_view FF1_HOSTNAME_PREFIX = "ff1-";

// Configuration files ---------------------------------------------------------
constexpr std::string_view FF1_CONFIG_ENV = "FF1_CONFIG";
constexpr std::string_view FF1_PROJECT_CONFIG_FILE = "ff1.json";
constexpr std::string_view FF1_USER_CONFIG_FILE = ".config/ff1/config.json";

} // namespace ff1::config
