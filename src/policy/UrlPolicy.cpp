#include "ff1/policy/UrlPolicy.hpp"

#include "ff1/net/NetConfig.hpp"
#include "ff1/playlist/Playlist.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>

namespace ff1::policy {

namespace {

namespace ip = ff1::net::asio::ip;

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool endsWith(const std::string& text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct Ipv4Range {
    std::uint32_t network;
    int prefix;
};

constexpr std::uint32_t v4(unsigned a, unsigned b, unsigned c, unsigned d) {
    return (a << 24) | (b << 16) | (c << 8) | d;
}

// Non-public IPv4 space: this-network, private, loopback, link-local,
// IETF protocol assignments, documentation, benchmarking, multicast, reserved.
constexpr std::array<Ipv4Range, 13> kBlockedV4{{
    {v4(0, 0, 0, 0), 8},
    {v4(10, 0, 0, 0), 8},
    {v4(127, 0, 0, 0), 8},
    {v4(169, 254, 0, 0), 16},
    {v4(172, 16, 0, 0), 12},
    {v4(192, 0, 0, 0), 24},
    {v4(192, 0, 2, 0), 24},
    {v4(192, 168, 0, 0), 16},
    {v4(198, 18, 0, 0), 15},
    {v4(198, 51, 100, 0), 24},
    {v4(203, 0, 113, 0), 24},
    {v4(224, 0, 0, 0), 4},
    {v4(240, 0, 0, 0), 4},
}};

bool isBlocked(const ip::address_v4& addr) {
    const auto value = addr.to_uint();
    for (const auto& range : kBlockedV4) {
        const std::uint32_t mask = range.prefix == 0 ? 0 : ~std::uint32_t{0} << (32 - range.prefix);
        if ((value & mask) == range.network) {
            return true;
        }
    }
    return false;
}

// Non-public ranges inside 2000::/3 global unicast: IETF protocol
// assignments (Teredo, ORCHID, benchmarking), documentation, 6to4.
constexpr std::array<Ipv4Range, 4> kBlockedV6Global{{
    {v4(0x20, 0x01, 0x00, 0x00), 23},
    {v4(0x20, 0x01, 0x00, 0x10), 28},
    {v4(0x20, 0x01, 0x0D, 0xB8), 32},
    {v4(0x20, 0x02, 0x00, 0x00), 16},
}};

bool isBlocked(const ip::address_v6& addr) {
    if (addr.is_v4_mapped()) {
        return isBlocked(ip::make_address_v4(ip::v4_mapped, addr));
    }
    const auto bytes = addr.to_bytes();
    // Outside 2000::/3: ::/8 (v4-compatible, NAT64 64:ff9b::/96), 100::/64
    // discard, fc00::/7, fe80::/10, fec0::/10, ff00::/8 and unassigned space.
    if ((bytes[0] & 0xE0) != 0x20) {
        return true;
    }
    const auto leading = v4(bytes[0], bytes[1], bytes[2], bytes[3]);
    for (const auto& range : kBlockedV6Global) {
        const std::uint32_t mask = ~std::uint32_t{0} << (32 - range.prefix);
        if ((leading & mask) == range.network) {
            return true;
        }
    }
    return false;
}

expected<void> reject(std::string reason) {
    return unexpected(Error::invalidArgument(std::move(reason)));
}

} // namespace

std::optional<UrlParts> splitUrl(std::string_view url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos || schemeEnd == 0) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = lower(url.substr(0, schemeEnd));

    auto rest = url.substr(schemeEnd + 3);
    const auto authorityEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authorityEnd);
    if (authorityEnd != std::string_view::npos) {
        auto tail = rest.substr(authorityEnd);
        const auto pathEnd = tail.find_first_of("?#");
        parts.path = std::string(tail.substr(0, pathEnd));
    }

    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        parts.userinfo = std::string(authority.substr(0, at));
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        parts.host = lower(authority.substr(1, close - 1));
    } else {
        parts.host = lower(authority.substr(0, authority.find(':')));
    }
    return parts;
}

bool envFlag(const char* name, bool fallback) {
    const char* raw = std::getenv(name);
    if (!raw) {
        return fallback;
    }
    const auto value = lower(raw);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

UrlPolicyOptions UrlPolicyOptions::fromEnvironment() {
    UrlPolicyOptions options;
    options.enabled = envFlag("FF1_ENABLE_URL_VALIDATION");
    options.allowLocal = envFlag("FF1_UNSAFE_ALLOW_LOCAL_URLS");
    return options;
}

expected<void> validatePlaybackUrl(const std::string& url, const UrlPolicyOptions& options) {
    if (!options.enabled) {
        return {};
    }

    auto parts = splitUrl(url);
    if (!parts) {
        return reject("URL is not absolute: " + url);
    }
    if (parts->scheme != "http" && parts->scheme != "https") {
        return reject("Unsupported URL scheme '" + parts->scheme + "'; only http and https are allowed");
    }
    if (parts->host.empty()) {
        return reject("URL has no host: " + url);
    }
    if (!parts->userinfo.empty()) {
        return reject("URLs with embedded credentials are not allowed");
    }
    if (options.allowLocal) {
        return {};
    }

    const auto& host = parts->host;
    if (host == "localhost" || host == "localhost.localdomain" ||
        endsWith(host, ".local") || endsWith(host, ".localdomain")) {
        return reject("Local hostnames are blocked: " + host);
    }

    net::error_code ec;
    const auto addr = ip::make_address(host, ec);
    if (!ec) {
        const bool blocked = addr.is_v4() ? isBlocked(addr.to_v4()) : isBlocked(addr.to_v6());
        if (blocked) {
            return reject("Private or reserved addresses are blocked: " + host);
        }
    }
    return {};
}

expected<void> validatePlaylistPayload(const nlohmann::json& document, const UrlPolicyOptions& options) {
    if (!options.enabled) {
        return {};
    }

    auto parsed = playlist::parsePlaylist(document);
    if (!parsed) {
        return unexpected(parsed.error());
    }
    const auto& items = parsed->items;
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto ok = validatePlaybackUrl(items[i].source, options);
        if (!ok) {
            return reject("Playlist item at index " + std::to_string(i) +
                          " has invalid source URL: " + ok.error().message);
        }
    }
    return {};
}

UrlPolicy makeUrlPolicy(UrlPolicyOptions options) {
    return [options](const std::string& url) { return validatePlaybackUrl(url, options); };
}

} // namespace ff1::policy
