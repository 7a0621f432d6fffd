#include "ff1/device/DeviceDescriptor.hpp"

#include "ff1/net/NetConfig.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ff1::device {

namespace {

bool startsWith(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::optional<unsigned short> parsePort(std::string_view text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<unsigned short>(value);
}

bool isIpLiteral(std::string_view host) {
    net::error_code ec;
    net::asio::ip::make_address(std::string(host), ec);
    return !ec;
}

bool isHostName(std::string_view host) {
    if (host.empty() || host.size() > 253) {
        return false;
    }
    std::size_t labelStart = 0;
    while (labelStart <= host.size()) {
        auto dot = host.find('.', labelStart);
        if (dot == std::string_view::npos) dot = host.size();
        auto label = host.substr(labelStart, dot - labelStart);
        if (label.empty() || label.size() > 63) {
            // A single trailing dot (fully qualified form) is allowed.
            return label.empty() && dot == host.size() && labelStart > 0;
        }
        if (label.front() == '-' || label.back() == '-') {
            return false;
        }
        const bool charsOk = std::all_of(label.begin(), label.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
        });
        if (!charsOk) {
            return false;
        }
        labelStart = dot + 1;
    }
    return true;
}

} // namespace

bool isValidHost(std::string_view host) {
    return isIpLiteral(host) || isHostName(host);
}

std::optional<HostSpec> parseHostSpec(std::string_view text) {
    if (startsWith(text, "http://")) {
        text.remove_prefix(7);
    } else if (startsWith(text, "https://")) {
        text.remove_prefix(8);
    }
    if (auto slash = text.find('/'); slash != std::string_view::npos) {
        text = text.substr(0, slash);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    HostSpec spec;
    if (text.front() == '[') {
        const auto close = text.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        spec.host = std::string(text.substr(1, close - 1));
        auto rest = text.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return std::nullopt;
            auto port = parsePort(rest.substr(1));
            if (!port) return std::nullopt;
            spec.port = *port;
        }
        if (!isIpLiteral(spec.host)) {
            return std::nullopt;
        }
        return spec;
    }

    const auto colons = std::count(text.begin(), text.end(), ':');
    if (colons == 1) {
        const auto colon = text.find(':');
        auto port = parsePort(text.substr(colon + 1));
        if (!port) return std::nullopt;
        spec.host = std::string(text.substr(0, colon));
        spec.port = *port;
    } else {
        // Zero colons, or a bare IPv6 literal.
        spec.host = std::string(text);
    }

    if (!isValidHost(spec.host)) {
        return std::nullopt;
    }
    return spec;
}

} // namespace ff1::device
