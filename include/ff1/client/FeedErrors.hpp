#pragma once

#include "ff1/core/Error.hpp"
#include "ff1/net/NetConfig.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace ff1::client {

/**
 * @brief Classify a failed read on the notification feed.
 *
 * Returns nullopt for a clean close by the device (the sequence simply ends).
 * `timed_out` is a Timeout only when @p idleTimeout armed the watchdog; a
 * socket-level timeout on an unwatched feed is a dropped connection.
 */
std::optional<Error> classifyFeedError(const net::error_code& ec,
                                       const std::string& host,
                                       std::optional<std::chrono::milliseconds> idleTimeout);

} // namespace ff1::client
