#pragma once

#include "ff1/core/Expected.hpp"
#include "ff1/device/DeviceDescriptor.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace ff1::device {

/**
 * @brief Ordered, immutable list of configured devices.
 *
 * File shape:
 * @code
 * { "devices": [ { "name": "Living Room", "host": "192.168.1.100",
 *                  "apiKey": "...", "topicID": "..." } ] }
 * @endcode
 * Entries without a usable host are skipped with a logged error. A missing
 * file yields an empty set; unparsable JSON or a wrong top-level shape is a
 * ConfigError.
 */
class DeviceConfigSet {
public:
    DeviceConfigSet() = default;
    explicit DeviceConfigSet(std::vector<DeviceDescriptor> devices);

    /// Load from the first existing well-known location (see findConfigFile).
    static expected<DeviceConfigSet> load();
    static expected<DeviceConfigSet> loadFile(const std::filesystem::path& path);
    static expected<DeviceConfigSet> parse(std::string_view text, std::string_view source = "<memory>");

    /**
     * Search order: `$FF1_CONFIG` (when it names an existing file),
     * `./ff1.json`, then `~/.config/ff1/config.json`.
     */
    static std::optional<std::filesystem::path> findConfigFile();

    const std::vector<DeviceDescriptor>& devices() const { return devices_; }
    std::size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }

    /// First device (in file order) whose name or host equals @p target exactly.
    const DeviceDescriptor* find(std::string_view target) const;

private:
    std::vector<DeviceDescriptor> devices_;
};

} // namespace ff1::device
