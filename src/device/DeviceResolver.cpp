#include "ff1/device/DeviceResolver.hpp"

#include "ff1/log/Log.hpp"

#include <future>
#include <utility>

namespace ff1::device {

namespace {

std::vector<Candidate> toCandidates(const std::vector<DeviceDescriptor>& devices) {
    std::vector<Candidate> out;
    out.reserve(devices.size());
    for (const auto& d : devices) {
        out.push_back(Candidate{d.label(), d.host});
    }
    return out;
}

} // namespace

DeviceResolver::DeviceResolver(DeviceConfigSet config, ResolverOptions options)
: DeviceResolver(std::move(config),
                 std::make_shared<SystemArpTable>(),
                 std::make_shared<HttpLivenessProbe>(),
                 options)
{}

DeviceResolver::DeviceResolver(DeviceConfigSet config,
                               std::shared_ptr<ArpTable> arpTable,
                               std::shared_ptr<LivenessProbe> probe,
                               ResolverOptions options)
: config_(std::move(config))
, arpTable_(std::move(arpTable))
, probe_(std::move(probe))
, options_(options)
{}

expected<DeviceDescriptor>
DeviceResolver::resolve(const std::optional<std::string>& explicitTarget) const {
    if (explicitTarget && !explicitTarget->empty()) {
        return resolveExplicit(*explicitTarget);
    }

    if (config_.size() == 1) {
        const auto& only = config_.devices().front();
        logInfo("[DeviceResolver] using configured device ", only.label(), " (", only.host, ")\n");
        return only;
    }
    if (config_.size() > 1) {
        return unexpected(Error::ambiguous(
            "multiple FF1 devices configured; pass a device name or host to select one",
            toCandidates(config_.devices())));
    }

    auto live = scanNetwork();
    if (live.empty()) {
        return unexpected(Error::notFound(
            "no FF1 devices found; ensure the device is on the network or create ff1.json"));
    }
    if (live.size() > 1) {
        return unexpected(Error::ambiguous(
            "multiple FF1 devices found on the network; pass a device name or host to select one",
            toCandidates(live)));
    }

    logInfo("[DeviceResolver] discovered ", live.front().label(), " at ", live.front().host, "\n");
    return live.front();
}

expected<DeviceDescriptor>
DeviceResolver::resolveExplicit(const std::string& target) const {
    if (const auto* configured = config_.find(target)) {
        return *configured;
    }

    auto spec = parseHostSpec(target);
    if (!spec) {
        return unexpected(Error::notFound(
            "'" + target + "' is neither a configured device nor a valid host",
            toCandidates(config_.devices())));
    }

    // Same host and port as a configured device, spelled differently
    // (URL form, explicit default port): keep its credential and topic.
    // Any other port addresses a different service and is synthesized.
    for (const auto& d : config_.devices()) {
        if (d.host == spec->host && d.port == spec->port) {
            return d;
        }
    }

    DeviceDescriptor synthesized;
    synthesized.host = spec->host;
    synthesized.port = spec->port;
    return synthesized;
}

std::vector<DeviceDescriptor> DeviceResolver::discover() const {
    if (!config_.empty()) {
        return config_.devices();
    }
    return scanNetwork();
}

std::vector<DeviceDescriptor> DeviceResolver::scanNetwork() const {
    auto candidates = matchDeviceHostnames(arpTable_->entries());
    if (candidates.empty()) {
        logInfo("[DeviceResolver] no ", config::FF1_HOSTNAME_PREFIX, "* hosts in the ARP table\n");
        return {};
    }

    // Probes are independent: a slow host only delays its own future.
    std::vector<std::future<bool>> probes;
    probes.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        probes.push_back(std::async(std::launch::async,
            [probe = probe_, candidate, timeout = options_.probeTimeout] {
                return probe->isLive(candidate, timeout);
            }));
    }

    std::vector<DeviceDescriptor> live;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (probes[i].get()) {
            live.push_back(candidates[i]);
        } else {
            logInfo("[DeviceResolver] dropping unresponsive candidate ", candidates[i].host, "\n");
        }
    }
    return live;
}

} // namespace ff1::device
