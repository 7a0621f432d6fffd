#pragma once

#include "ff1/device/DeviceDescriptor.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ff1::device {

struct ArpEntry {
    std::string hostname;  ///< As printed, e.g. "ff1-abc12345.localdomain" or "?".
    std::string ip;
    std::string mac;
};

/**
 * @brief Source of the host's address-resolution table.
 *
 * Abstract so the resolver can be exercised against a fixed table.
 */
class ArpTable {
public:
    virtual ~ArpTable() = default;
    virtual std::vector<ArpEntry> entries() = 0;
};

/**
 * @brief Reads the live table by running `arp -a`.
 *
 * The table is populated by ordinary network activity (DHCP, mDNS), so no
 * scanning is needed. A missing `arp` binary or a failing command yields an
 * empty table.
 */
class SystemArpTable : public ArpTable {
public:
    std::vector<ArpEntry> entries() override;
};

/// Parse BSD/Linux `arp -a` output: `hostname (a.b.c.d) at mac ...` per line.
std::vector<ArpEntry> parseArpOutput(std::string_view text);

/**
 * @brief Keep entries whose first hostname label starts with `ff1-`.
 *
 * Matching is case-insensitive; results are deduplicated by IP in table order
 * and labelled with the upper-cased first label (`FF1-ABC12345`).
 */
std::vector<DeviceDescriptor> matchDeviceHostnames(const std::vector<ArpEntry>& entries);

} // namespace ff1::device
