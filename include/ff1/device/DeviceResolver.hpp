#pragma once

#include "ff1/core/Expected.hpp"
#include "ff1/core/FF1Config.hpp"
#include "ff1/device/ArpTable.hpp"
#include "ff1/device/DeviceConfigSet.hpp"
#include "ff1/device/DeviceDescriptor.hpp"
#include "ff1/device/LivenessProbe.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ff1::device {

struct ResolverOptions {
    std::chrono::milliseconds probeTimeout = config::FF1_PROBE_TIMEOUT;
};

/**
 * @brief Picks exactly one device for an invocation.
 *
 * Precedence (each step runs only when the previous produced nothing):
 * 1. Explicit target: configured name/host match, else a syntactically valid
 *    host is used as-is (no reachability check), else NotFound.
 * 2. Configuration: one entry is used; several are Ambiguous. Configuration
 *    is authoritative and never disambiguated by a network scan.
 * 3. Discovery (empty configuration only): `ff1-` hosts from the ARP table,
 *    each confirmed by a concurrent liveness probe. One live host is used,
 *    none is NotFound, several are Ambiguous.
 *
 * The resolver keeps no state between calls; every call re-scans.
 */
class DeviceResolver {
public:
    explicit DeviceResolver(DeviceConfigSet config, ResolverOptions options = {});
    DeviceResolver(DeviceConfigSet config,
                   std::shared_ptr<ArpTable> arpTable,
                   std::shared_ptr<LivenessProbe> probe,
                   ResolverOptions options = {});

    expected<DeviceDescriptor> resolve(const std::optional<std::string>& explicitTarget = std::nullopt) const;

    /// Configured devices when any exist, otherwise the live discovered ones.
    std::vector<DeviceDescriptor> discover() const;

    /// ARP candidates that answered their liveness probe, in table order.
    std::vector<DeviceDescriptor> scanNetwork() const;

    const DeviceConfigSet& config() const { return config_; }

private:
    expected<DeviceDescriptor> resolveExplicit(const std::string& target) const;

    DeviceConfigSet config_;
    std::shared_ptr<ArpTable> arpTable_;
    std::shared_ptr<LivenessProbe> probe_;
    ResolverOptions options_;
};

} // namespace ff1::device
