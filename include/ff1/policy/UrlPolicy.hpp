#pragma once

#include "ff1/core/Expected.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ff1::policy {

/// Pieces of an absolute URL, as far as playback validation needs them.
struct UrlParts {
    std::string scheme;    ///< Lower-cased.
    std::string userinfo;  ///< Text before '@' in the authority, if any.
    std::string host;      ///< Lower-cased, IPv6 brackets removed.
    std::string path;      ///< Starts with '/', or empty.
};

/// Split `scheme://[userinfo@]host[:port][/path][?query][#fragment]`.
std::optional<UrlParts> splitUrl(std::string_view url);

struct UrlPolicyOptions {
    bool enabled = false;     ///< FF1_ENABLE_URL_VALIDATION
    bool allowLocal = false;  ///< FF1_UNSAFE_ALLOW_LOCAL_URLS

    static UrlPolicyOptions fromEnvironment();
};

/// Reads a boolean environment flag; `1`, `true`, `yes`, `on` (any case) are true.
bool envFlag(const char* name, bool fallback = false);

/**
 * @brief Check a URL the device will fetch on the caller's behalf.
 *
 * A no-op unless `options.enabled`. When enabled: http/https only, a host is
 * required, embedded credentials are rejected, and (unless `allowLocal`)
 * localhost, `.local` / `.localdomain` names and private, loopback,
 * link-local, multicast, reserved or unspecified addresses are blocked.
 * Failures are InvalidArgument errors whose message is the reason.
 */
expected<void> validatePlaybackUrl(const std::string& url, const UrlPolicyOptions& options);

/**
 * @brief Check a DP1 playlist document and each item's source URL.
 *
 * Also a no-op unless enabled. Shape errors and the first bad item (by index)
 * are reported as InvalidArgument.
 */
expected<void> validatePlaylistPayload(const nlohmann::json& playlist, const UrlPolicyOptions& options);

/// Injectable policy placed in front of display commands by the caller.
using UrlPolicy = std::function<expected<void>(const std::string& url)>;

UrlPolicy makeUrlPolicy(UrlPolicyOptions options);

} // namespace ff1::policy
