#include "ff1/device/DeviceConfigSet.hpp"

#include "TestAssert.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace ff1::device;
namespace fs = std::filesystem;

static void testParseHostSpec() {
    auto plain = parseHostSpec("192.168.1.100");
    ASSERT_TRUE(plain && plain->host == "192.168.1.100" && plain->port == 1111, "bare IPv4 uses default port");

    auto url = parseHostSpec("http://192.168.1.100:8080/api/cast");
    ASSERT_TRUE(url.has_value(), "URL form parses");
    ASSERT_EQ(url->host, std::string("192.168.1.100"), "scheme and path stripped");
    ASSERT_EQ(url->port, static_cast<unsigned short>(8080), "explicit port");

    auto name = parseHostSpec("ff1-ab12cd34.local:1111");
    ASSERT_TRUE(name && name->host == "ff1-ab12cd34.local", "hostname with port");

    auto v6 = parseHostSpec("[fe80::1]:2222");
    ASSERT_TRUE(v6 && v6->host == "fe80::1" && v6->port == 2222, "bracketed IPv6 with port");

    auto bareV6 = parseHostSpec("2001:db8::5");
    ASSERT_TRUE(bareV6 && bareV6->host == "2001:db8::5", "bare IPv6 literal");

    ASSERT_TRUE(!parseHostSpec("host:0"), "port 0 rejected");
    ASSERT_TRUE(!parseHostSpec("host:70000"), "port above 65535 rejected");
    ASSERT_TRUE(!parseHostSpec("host:abc"), "non-numeric port rejected");
    ASSERT_TRUE(!parseHostSpec("Living Room"), "space is not a host");
    ASSERT_TRUE(!parseHostSpec(""), "empty rejected");
    ASSERT_TRUE(!parseHostSpec("-bad-.example"), "label may not start with a dash");
}

static void testParseTwoDevices() {
    auto set = DeviceConfigSet::parse(R"({
        "devices": [
            {"name": "Living Room", "host": "http://192.168.1.100:1111", "apiKey": "k1", "topicID": "t1"},
            {"name": "Studio", "host": "192.168.1.101"}
        ]
    })");
    ASSERT_TRUE(set.has_value(), "config parses");
    ASSERT_EQ(set->size(), std::size_t{2}, "two devices");

    const auto& first = set->devices()[0];
    ASSERT_EQ(first.host, std::string("192.168.1.100"), "protocol and port stripped from host");
    ASSERT_TRUE(first.credential && *first.credential == "k1", "apiKey kept");
    ASSERT_TRUE(first.topicId && *first.topicId == "t1", "topicID kept");

    const auto& second = set->devices()[1];
    ASSERT_TRUE(!second.credential && !second.topicId, "optional fields absent");
    ASSERT_EQ(second.label(), std::string("Studio"), "label is the name");

    ASSERT_TRUE(set->find("Studio") == &set->devices()[1], "find by name");
    ASSERT_TRUE(set->find("192.168.1.100") == &set->devices()[0], "find by host");
    ASSERT_TRUE(set->find("studio") == nullptr, "name match is case-sensitive");
}

static void testSkipsBadEntries() {
    ff1::setErrorLogHandler(ff1::log::discardingLogHandler());
    auto set = DeviceConfigSet::parse(R"({
        "devices": [
            {"name": "No Host"},
            {"name": "Bad Port", "host": "192.168.1.5:99999"},
            "not-an-object",
            {"name": "IPv6", "host": "[fd00::10]:1111"},
            {"host": "10.0.0.9", "name": ""}
        ]
    })");
    ff1::resetLogHandlers();
    ASSERT_TRUE(set.has_value(), "bad entries do not fail the file");
    ASSERT_EQ(set->size(), std::size_t{2}, "only usable entries kept");
    ASSERT_EQ(set->devices()[0].host, std::string("fd00::10"), "IPv6 brackets removed");
    ASSERT_TRUE(!set->devices()[1].name, "empty name treated as absent");
}

static void testMalformed() {
    auto broken = DeviceConfigSet::parse("{ devices: [", "broken.json");
    ASSERT_TRUE(!broken, "malformed JSON fails");
    ASSERT_TRUE(broken.error().kind == ff1::ErrorKind::ConfigError, "ConfigError kind");

    auto array = DeviceConfigSet::parse("[]");
    ASSERT_TRUE(!array && array.error().kind == ff1::ErrorKind::ConfigError, "non-object root");

    auto devicesObject = DeviceConfigSet::parse(R"({"devices": {}})");
    ASSERT_TRUE(!devicesObject && devicesObject.error().kind == ff1::ErrorKind::ConfigError, "devices must be an array");

    auto noDevices = DeviceConfigSet::parse("{}");
    ASSERT_TRUE(noDevices && noDevices->empty(), "no devices key is an empty set");
}

static void testLoadFile() {
    const auto dir = fs::temp_directory_path() / "ff1ctl_config_test";
    fs::create_directories(dir);

    auto missing = DeviceConfigSet::loadFile(dir / "does-not-exist.json");
    ASSERT_TRUE(missing && missing->empty(), "missing file is an empty set");

    const auto path = dir / "ff1.json";
    {
        std::ofstream out(path);
        out << R"({"devices": [{"name": "Desk", "host": "192.168.7.20"}]})";
    }
    auto loaded = DeviceConfigSet::loadFile(path);
    ASSERT_TRUE(loaded && loaded->size() == 1, "file loads");

    ::setenv("FF1_CONFIG", path.string().c_str(), 1);
    auto found = DeviceConfigSet::findConfigFile();
    ASSERT_TRUE(found && *found == path, "FF1_CONFIG takes precedence");
    auto viaEnv = DeviceConfigSet::load();
    ASSERT_TRUE(viaEnv && viaEnv->size() == 1 && viaEnv->devices()[0].host == "192.168.7.20", "load via FF1_CONFIG");
    ::unsetenv("FF1_CONFIG");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

int main() {
    testParseHostSpec();
    testParseTwoDevices();
    testSkipsBadEntries();
    testMalformed();
    testLoadFile();
    return finishTests("DeviceConfigSet");
}
