#pragma once

#include "ff1/device/DeviceDescriptor.hpp"

#include <chrono>

namespace ff1::device {

/**
 * @brief Confirms a discovered host is actually running the control service.
 *
 * Implementations must return within roughly @p timeout and must be safe to
 * call from several threads at once (probes run concurrently).
 */
class LivenessProbe {
public:
    virtual ~LivenessProbe() = default;
    virtual bool isLive(const DeviceDescriptor& candidate, std::chrono::milliseconds timeout) = 0;
};

/// Sends a `getDeviceStatus` command and accepts only an HTTP 200 answer.
class HttpLivenessProbe : public LivenessProbe {
public:
    bool isLive(const DeviceDescriptor& candidate, std::chrono::milliseconds timeout) override;
};

} // namespace ff1::device
