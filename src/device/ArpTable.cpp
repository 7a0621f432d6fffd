#include "ff1/device/ArpTable.hpp"

#include "ff1/log/Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <memory>
#include <regex>
#include <set>

namespace ff1::device {

namespace {

const std::regex& arpLinePattern() {
    static const std::regex pattern(R"(^(\S+)\s+\((\d+\.\d+\.\d+\.\d+)\)\s+at\s+(\S+))");
    return pattern;
}

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

struct PipeCloser {
    void operator()(FILE* f) const { if (f) ::pclose(f); }
};

} // namespace

std::vector<ArpEntry> parseArpOutput(std::string_view text) {
    std::vector<ArpEntry> out;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        const std::string line(text.substr(start, end - start));
        start = end + 1;

        std::smatch m;
        if (std::regex_search(line, m, arpLinePattern())) {
            out.push_back(ArpEntry{m[1].str(), m[2].str(), m[3].str()});
        }
    }
    return out;
}

std::vector<DeviceDescriptor> matchDeviceHostnames(const std::vector<ArpEntry>& entries) {
    std::vector<DeviceDescriptor> out;
    std::set<std::string> seen;
    for (const auto& entry : entries) {
        const auto firstLabel = std::string_view(entry.hostname).substr(0, entry.hostname.find('.'));
        if (lower(firstLabel).rfind(config::FF1_HOSTNAME_PREFIX, 0) != 0) {
            continue;
        }
        if (!seen.insert(entry.ip).second) {
            continue;
        }
        DeviceDescriptor d;
        d.host = entry.ip;
        d.name = upper(firstLabel);
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<ArpEntry> SystemArpTable::entries() {
    std::unique_ptr<FILE, PipeCloser> pipe(::popen("arp -a 2>/dev/null", "r"));
    if (!pipe) {
        logError("[SystemArpTable] could not run arp\n");
        return {};
    }

    std::string output;
    std::array<char, 512> chunk{};
    while (std::fgets(chunk.data(), static_cast<int>(chunk.size()), pipe.get())) {
        output += chunk.data();
    }

    auto parsed = parseArpOutput(output);
    logInfo("[SystemArpTable] ", parsed.size(), " ARP entries\n");
    return parsed;
}

} // namespace ff1::device
