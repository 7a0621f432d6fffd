#include "ff1/device/DeviceResolver.hpp"

#include "TestAssert.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

using namespace ff1::device;
using ff1::ErrorKind;

namespace {

class FakeArpTable : public ArpTable {
public:
    explicit FakeArpTable(std::vector<ArpEntry> entries) : entries_(std::move(entries)) {}

    std::vector<ArpEntry> entries() override {
        ++reads;
        return entries_;
    }

    std::atomic<int> reads{0};

private:
    std::vector<ArpEntry> entries_;
};

class FakeProbe : public LivenessProbe {
public:
    explicit FakeProbe(std::set<std::string> liveHosts) : live_(std::move(liveHosts)) {}

    bool isLive(const DeviceDescriptor& candidate, std::chrono::milliseconds) override {
        ++calls;
        std::lock_guard<std::mutex> lock(mutex_);
        return live_.count(candidate.host) > 0;
    }

    std::atomic<int> calls{0};

private:
    std::mutex mutex_;
    std::set<std::string> live_;
};

// Live hosts answer at once; every other candidate stalls for the whole
// timeout before reporting failure, like a host that never answers.
class StallingLiveness : public LivenessProbe {
public:
    explicit StallingLiveness(std::set<std::string> liveHosts) : live_(std::move(liveHosts)) {}

    bool isLive(const DeviceDescriptor& candidate, std::chrono::milliseconds timeout) override {
        ++calls;
        if (live_.count(candidate.host) > 0) {
            return true;
        }
        std::this_thread::sleep_for(timeout);
        return false;
    }

    std::atomic<int> calls{0};

private:
    const std::set<std::string> live_;
};

DeviceDescriptor configured(const std::string& name, const std::string& host,
                            std::optional<std::string> key = std::nullopt) {
    DeviceDescriptor d;
    d.name = name;
    d.host = host;
    d.credential = std::move(key);
    return d;
}

struct Fixture {
    explicit Fixture(std::vector<DeviceDescriptor> devices = {},
                     std::vector<ArpEntry> arp = {},
                     std::set<std::string> live = {})
    : arp(std::make_shared<FakeArpTable>(std::move(arp)))
    , probe(std::make_shared<FakeProbe>(std::move(live)))
    , resolver(DeviceConfigSet(std::move(devices)), this->arp, this->probe)
    {}

    std::shared_ptr<FakeArpTable> arp;
    std::shared_ptr<FakeProbe> probe;
    DeviceResolver resolver;
};

} // namespace

static void testArpParsing() {
    const char* output =
        "? (192.168.1.1) at 00:11:22:33:44:55 [ether] on wlan0\n"
        "ff1-ab12cd34.localdomain (192.168.1.50) at aa:bb:cc:dd:ee:ff [ether] on wlan0\n"
        "garbage line without the shape\n"
        "FF1-XYZ (192.168.1.51) at aa:bb:cc:dd:ee:00 on en0 ifscope [ethernet]\n";
    auto entries = parseArpOutput(output);
    ASSERT_EQ(entries.size(), std::size_t{3}, "three well-formed lines");
    ASSERT_EQ(entries[1].hostname, std::string("ff1-ab12cd34.localdomain"), "hostname");
    ASSERT_EQ(entries[1].ip, std::string("192.168.1.50"), "ip");
    ASSERT_EQ(entries[1].mac, std::string("aa:bb:cc:dd:ee:ff"), "mac");
}

static void testHostnameMatching() {
    std::vector<ArpEntry> entries{
        {"?", "192.168.1.1", "x"},
        {"ff1-ab12cd34.localdomain", "192.168.1.50", "x"},
        {"FF1-AB12CD34", "192.168.1.50", "x"},
        {"router.ff1-lan", "192.168.1.2", "x"},
        {"Ff1-Second.lan", "192.168.1.60", "x"},
        {"xff1-nope", "192.168.1.70", "x"},
    };
    auto matches = matchDeviceHostnames(entries);
    ASSERT_EQ(matches.size(), std::size_t{2}, "prefix on first label only, deduplicated by IP");
    ASSERT_EQ(matches[0].host, std::string("192.168.1.50"), "first match");
    ASSERT_EQ(*matches[0].name, std::string("FF1-AB12CD34"), "upper-cased first label");
    ASSERT_EQ(*matches[1].name, std::string("FF1-SECOND"), "case-insensitive prefix");
}

static void testSingleConfiguredDevice() {
    Fixture f({configured("Living Room", "192.168.1.100")});
    auto d = f.resolver.resolve();
    ASSERT_TRUE(d.has_value(), "resolves");
    ASSERT_EQ(d->host, std::string("192.168.1.100"), "configured host");
    ASSERT_EQ(f.arp->reads.load(), 0, "no ARP access");
    ASSERT_EQ(f.probe->calls.load(), 0, "no probe");
}

static void testMultipleConfiguredDevices() {
    Fixture f({configured("A", "10.0.0.1"), configured("B", "10.0.0.2"), configured("C", "10.0.0.3")},
              {{"ff1-live", "10.0.0.9", "x"}}, {"10.0.0.9"});
    auto d = f.resolver.resolve();
    ASSERT_TRUE(!d, "ambiguous");
    ASSERT_TRUE(d.error().kind == ErrorKind::Ambiguous, "Ambiguous kind");
    ASSERT_EQ(d.error().candidates.size(), std::size_t{3}, "all configured candidates listed");
    ASSERT_EQ(d.error().candidates[1].name, std::string("B"), "in configuration order");
    ASSERT_EQ(f.arp->reads.load(), 0, "configuration is not disambiguated by a scan");
}

static void testExplicitConfiguredMatch() {
    Fixture f({configured("A", "10.0.0.1", std::string("key-a")), configured("B", "10.0.0.2")});

    auto byName = f.resolver.resolve(std::string("A"));
    ASSERT_TRUE(byName && byName->credential && *byName->credential == "key-a", "match by name keeps credential");

    auto byHost = f.resolver.resolve(std::string("10.0.0.2"));
    ASSERT_TRUE(byHost && byHost->name && *byHost->name == "B", "match by host");

    auto byHostPort = f.resolver.resolve(std::string("10.0.0.1:1111"));
    ASSERT_TRUE(byHostPort && byHostPort->credential, "host with the configured port maps to the configured device");

    auto byUrl = f.resolver.resolve(std::string("http://10.0.0.1/api"));
    ASSERT_TRUE(byUrl && byUrl->name && *byUrl->name == "A", "URL form with the default port maps too");

    auto otherPort = f.resolver.resolve(std::string("10.0.0.1:2222"));
    ASSERT_TRUE(otherPort.has_value(), "other port resolves");
    ASSERT_EQ(otherPort->port, static_cast<unsigned short>(2222), "typed port kept");
    ASSERT_TRUE(!otherPort->credential && !otherPort->topicId && !otherPort->name,
                "other port is a synthesized descriptor");
    ASSERT_EQ(f.probe->calls.load(), 0, "explicit targets are not checked for liveness");

    ASSERT_EQ(f.probe->calls.load(), 0, "no probe for explicit targets");
}

static void testExplicitRawHost() {
    Fixture f({configured("A", "10.0.0.1", std::string("key-a"))});
    auto d = f.resolver.resolve(std::string("192.168.5.5:8080"));
    ASSERT_TRUE(d.has_value(), "synthesized");
    ASSERT_EQ(d->host, std::string("192.168.5.5"), "host");
    ASSERT_EQ(d->port, static_cast<unsigned short>(8080), "port");
    ASSERT_TRUE(!d->credential && !d->topicId && !d->name, "no credential, topic or name");
    ASSERT_EQ(f.probe->calls.load(), 0, "no reachability check");
    ASSERT_EQ(f.arp->reads.load(), 0, "no scan");
}

static void testExplicitInvalid() {
    Fixture f({configured("A", "10.0.0.1")});
    auto d = f.resolver.resolve(std::string("Kitchen Display"));
    ASSERT_TRUE(!d && d.error().kind == ErrorKind::NotFound, "unknown name is NotFound");
    ASSERT_EQ(d.error().candidates.size(), std::size_t{1}, "configured devices offered");
}

static void testDiscoverySingleLive() {
    Fixture f({}, {{"FF1-AB12CD34", "10.0.0.5", "aa:bb"}}, {"10.0.0.5"});
    auto d = f.resolver.resolve();
    ASSERT_TRUE(d.has_value(), "discovered");
    ASSERT_EQ(d->host, std::string("10.0.0.5"), "discovered host");
    ASSERT_EQ(d->port, static_cast<unsigned short>(1111), "default port");
    ASSERT_EQ(f.probe->calls.load(), 1, "probed once");
}

static void testDiscoveryNoneLive() {
    Fixture f({}, {{"ff1-one", "10.0.0.5", "x"}, {"ff1-two", "10.0.0.6", "x"}}, {});
    auto d = f.resolver.resolve();
    ASSERT_TRUE(!d && d.error().kind == ErrorKind::NotFound, "zero live is NotFound");
    ASSERT_EQ(f.probe->calls.load(), 2, "every candidate probed once, no retry");

    Fixture empty;
    auto none = empty.resolver.resolve();
    ASSERT_TRUE(!none && none.error().kind == ErrorKind::NotFound, "empty table is NotFound");
    ASSERT_EQ(empty.probe->calls.load(), 0, "nothing to probe");
}

static void testDiscoveryTwoLive() {
    Fixture f({},
              {{"ff1-one", "10.0.0.5", "x"}, {"printer", "10.0.0.7", "x"}, {"ff1-two", "10.0.0.6", "x"}},
              {"10.0.0.5", "10.0.0.6"});
    auto d = f.resolver.resolve();
    ASSERT_TRUE(!d && d.error().kind == ErrorKind::Ambiguous, "two live is Ambiguous");
    ASSERT_EQ(d.error().candidates.size(), std::size_t{2}, "both listed");
    ASSERT_EQ(d.error().candidates[0].host, std::string("10.0.0.5"), "ARP order");
    ASSERT_EQ(d.error().candidates[1].host, std::string("10.0.0.6"), "ARP order");
}

static void testDiscoverDropsDeadCandidates() {
    Fixture f({}, {{"ff1-one", "10.0.0.5", "x"}, {"ff1-two", "10.0.0.6", "x"}}, {"10.0.0.6"});
    auto list = f.resolver.discover();
    ASSERT_EQ(list.size(), std::size_t{1}, "only live candidates");
    ASSERT_EQ(list[0].host, std::string("10.0.0.6"), "live host");

    Fixture configuredOnly({configured("A", "10.0.0.1"), configured("B", "10.0.0.2")});
    ASSERT_EQ(configuredOnly.resolver.discover().size(), std::size_t{2}, "configured devices returned");
    ASSERT_EQ(configuredOnly.arp->reads.load(), 0, "no scan when configured");
}

static void testSlowCandidatesDoNotSerialize() {
    constexpr auto timeout = std::chrono::milliseconds(400);
    auto arp = std::make_shared<FakeArpTable>(std::vector<ArpEntry>{
        {"ff1-dead1", "10.0.0.11", "x"},
        {"ff1-dead2", "10.0.0.12", "x"},
        {"ff1-live", "10.0.0.13", "x"},
        {"ff1-dead3", "10.0.0.14", "x"},
    });
    auto liveness = std::make_shared<StallingLiveness>(std::set<std::string>{"10.0.0.13"});
    ResolverOptions options;
    options.probeTimeout = timeout;
    DeviceResolver resolver(DeviceConfigSet{}, arp, liveness, options);

    const auto started = std::chrono::steady_clock::now();
    auto d = resolver.resolve();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(d.has_value(), "live host resolves despite stalled candidates");
    if (d) {
        ASSERT_EQ(d->host, std::string("10.0.0.13"), "live host chosen");
    }
    ASSERT_EQ(liveness->calls.load(), 4, "each candidate checked once");
    ASSERT_TRUE(elapsed >= timeout, "waited for the stalled candidates to finish");
    ASSERT_TRUE(elapsed < timeout * 2, "liveness checks overlap instead of adding up");
}

static void testNoCachingBetweenCalls() {
    Fixture f({}, {{"ff1-one", "10.0.0.5", "x"}}, {"10.0.0.5"});
    (void)f.resolver.resolve();
    (void)f.resolver.resolve();
    ASSERT_EQ(f.arp->reads.load(), 2, "each resolution re-scans");
}

static void testDescriptorIdentity() {
    DeviceDescriptor a = configured("Living Room", "10.0.0.1", std::string("k"));
    DeviceDescriptor b;
    b.host = "10.0.0.1";
    ASSERT_TRUE(a == b, "same host is the same device");
    b.host = "10.0.0.2";
    ASSERT_TRUE(a != b, "different host");
}

int main() {
    ff1::setInfoLogHandler(ff1::log::discardingLogHandler());
    testArpParsing();
    testHostnameMatching();
    testSingleConfiguredDevice();
    testMultipleConfiguredDevices();
    testExplicitConfiguredMatch();
    testExplicitRawHost();
    testExplicitInvalid();
    testDiscoverySingleLive();
    testDiscoveryNoneLive();
    testDiscoveryTwoLive();
    testDiscoverDropsDeadCandidates();
    testSlowCandidatesDoNotSerialize();
    testNoCachingBetweenCalls();
    testDescriptorIdentity();
    ff1::resetLogHandlers();
    return finishTests("DeviceResolver");
}
