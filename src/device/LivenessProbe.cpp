#include "ff1/device/LivenessProbe.hpp"

#include "ff1/client/ControlClient.hpp"
#include "ff1/log/Log.hpp"

namespace ff1::device {

bool HttpLivenessProbe::isLive(const DeviceDescriptor& candidate, std::chrono::milliseconds timeout) {
    auto result = client::ControlClient::probe(candidate, timeout);
    if (!result) {
        logInfo("[HttpLivenessProbe] ", candidate.host, " not live: ", result.error().describe(), "\n");
        return false;
    }
    return true;
}

} // namespace ff1::device
