#pragma once

#include "ff1/core/FF1Config.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ff1::device {

/**
 * @brief Resolved identity of one controllable FF1.
 *
 * Identity is by host: two descriptors naming the same host compare equal
 * whatever their labels, ports or credentials.
 */
struct DeviceDescriptor {
    std::optional<std::string> name;
    std::string host;
    unsigned short port = config::FF1_DEFAULT_PORT;
    std::optional<std::string> credential;  ///< Sent as the API-KEY header.
    std::optional<std::string> topicId;     ///< Sent as the topicID query parameter.

    /// Display label: the name when set, otherwise the host.
    const std::string& label() const { return name ? *name : host; }
};

inline bool operator==(const DeviceDescriptor& a, const DeviceDescriptor& b) {
    return a.host == b.host;
}

inline bool operator!=(const DeviceDescriptor& a, const DeviceDescriptor& b) {
    return !(a == b);
}

struct HostSpec {
    std::string host;
    unsigned short port = config::FF1_DEFAULT_PORT;
};

/**
 * @brief Parse a user- or config-supplied host reference.
 *
 * Accepts a bare host name or IP, `host:port`, `[ipv6]:port`, or a URL such as
 * `http://192.168.1.100:1111/api` (scheme and path are stripped). Returns
 * nullopt when the host is not syntactically valid or the port is not a
 * number in 1-65535.
 */
std::optional<HostSpec> parseHostSpec(std::string_view text);

/// RFC 1123 host name or an IPv4 / IPv6 literal.
bool isValidHost(std::string_view host);

} // namespace ff1::device
