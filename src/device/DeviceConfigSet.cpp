#include "ff1/device/DeviceConfigSet.hpp"

#include "ff1/log/Log.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace ff1::device {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

std::optional<std::string> optionalString(const json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool isRegularFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace

DeviceConfigSet::DeviceConfigSet(std::vector<DeviceDescriptor> devices)
: devices_(std::move(devices))
{}

std::optional<fs::path> DeviceConfigSet::findConfigFile() {
    if (const char* env = std::getenv(std::string(config::FF1_CONFIG_ENV).c_str()); env && *env) {
        fs::path p(env);
        if (isRegularFile(p)) {
            return p;
        }
        logError("[DeviceConfigSet] ", config::FF1_CONFIG_ENV, "=", env, " does not exist; ignoring\n");
    }

    std::error_code ec;
    auto local = fs::current_path(ec) / std::string(config::FF1_PROJECT_CONFIG_FILE);
    if (!ec && isRegularFile(local)) {
        return local;
    }

    if (const char* home = std::getenv("HOME"); home && *home) {
        auto user = fs::path(home) / std::string(config::FF1_USER_CONFIG_FILE);
        if (isRegularFile(user)) {
            return user;
        }
    }
    return std::nullopt;
}

expected<DeviceConfigSet> DeviceConfigSet::load() {
    auto path = findConfigFile();
    if (!path) {
        logInfo("[DeviceConfigSet] no configuration file found\n");
        return DeviceConfigSet{};
    }
    return loadFile(*path);
}

expected<DeviceConfigSet> DeviceConfigSet::loadFile(const fs::path& path) {
    if (!isRegularFile(path)) {
        return DeviceConfigSet{};
    }
    std::ifstream in(path);
    if (!in) {
        return unexpected(Error::config("cannot read " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), path.string());
}

expected<DeviceConfigSet> DeviceConfigSet::parse(std::string_view text, std::string_view source) {
    json doc;
    try {
        doc = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return unexpected(Error::config(std::string(source) + ": " + e.what()));
    }

    if (!doc.is_object()) {
        return unexpected(Error::config(std::string(source) + ": top level must be an object"));
    }

    std::vector<DeviceDescriptor> devices;
    auto list = doc.find("devices");
    if (list == doc.end() || list->is_null()) {
        return DeviceConfigSet{};
    }
    if (!list->is_array()) {
        return unexpected(Error::config(std::string(source) + ": \"devices\" must be an array"));
    }

    for (std::size_t i = 0; i < list->size(); ++i) {
        const auto& entry = (*list)[i];
        if (!entry.is_object()) {
            logError("[DeviceConfigSet] ", source, ": devices[", i, "] is not an object; skipping\n");
            continue;
        }
        auto rawHost = optionalString(entry, "host");
        if (!rawHost) {
            logError("[DeviceConfigSet] ", source, ": devices[", i, "] has no host; skipping\n");
            continue;
        }
        auto spec = parseHostSpec(*rawHost);
        if (!spec) {
            logError("[DeviceConfigSet] ", source, ": devices[", i, "] has invalid host '",
                     *rawHost, "'; skipping\n");
            continue;
        }

        DeviceDescriptor d;
        d.host = spec->host;
        d.port = spec->port;
        d.name = optionalString(entry, "name");
        d.credential = optionalString(entry, "apiKey");
        d.topicId = optionalString(entry, "topicID");
        devices.push_back(std::move(d));
    }

    logInfo("[DeviceConfigSet] loaded ", devices.size(), " device(s) from ", source, "\n");
    return DeviceConfigSet{std::move(devices)};
}

const DeviceDescriptor* DeviceConfigSet::find(std::string_view target) const {
    for (const auto& d : devices_) {
        if ((d.name && *d.name == target) || d.host == target) {
            return &d;
        }
    }
    return nullptr;
}

} // namespace ff1::device
