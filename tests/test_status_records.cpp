#include "ff1/client/status_schema.hpp"

#include "TestAssert.hpp"

using namespace ff1::client;
using nlohmann::json;

static json sampleDeviceStatusWire() {
    return json::parse(R"({
        "screenRotation": "landscape",
        "connectedWifi": "HomeNet",
        "installedVersion": "1.4.0",
        "latestVersion": "1.5.0",
        "analyticsDisabled": true,
        "betaFeaturesEnabled": false,
        "macInfo": {"eth0": "aa:bb:cc:dd:ee:01", "wlan0": "aa:bb:cc:dd:ee:02"},
        "volume": 42,
        "isMuted": true
    })");
}

static json samplePlayerStatusWire() {
    return json::parse(R"({
        "castCommand": "displayPlaylist",
        "playlistURL": "https://example.com/playlist.json",
        "playlist": {"id": "p1", "items": []},
        "index": 1,
        "isPaused": false,
        "items": [
            {"id": "a", "title": "First", "duration": 300, "license": "open"},
            {"id": "b", "title": "Second", "duration": 60, "license": "token"}
        ],
        "ok": true,
        "error": "",
        "deviceSettings": {"scaling": "fit", "orientation": "portrait"}
    })");
}

static void testDeviceStatusDecode() {
    auto status = schema::decodeDeviceStatus(sampleDeviceStatusWire());
    ASSERT_TRUE(status.has_value(), "device status decodes");
    ASSERT_EQ(status->rotation, std::string("landscape"), "screenRotation -> rotation");
    ASSERT_EQ(status->wifiNetwork, std::string("HomeNet"), "connectedWifi -> wifiNetwork");
    ASSERT_EQ(status->mac.wireless, std::string("aa:bb:cc:dd:ee:02"), "macInfo.wlan0");
    ASSERT_EQ(status->volume, 42, "volume");
    ASSERT_TRUE(status->muted, "isMuted");
    ASSERT_TRUE(status->analyticsDisabled, "analyticsDisabled");
}

static void testDeviceStatusRoundTrip() {
    const auto wire = sampleDeviceStatusWire();
    auto status = schema::decodeDeviceStatus(wire);
    ASSERT_TRUE(status.has_value(), "decode");
    ASSERT_TRUE(schema::encodeDeviceStatus(*status) == wire, "encode reproduces the wire fields");

    auto again = schema::decodeDeviceStatus(schema::encodeDeviceStatus(*status));
    ASSERT_TRUE(again && *again == *status, "decode(encode(x)) == x");
}

static void testPlayerStatusRoundTrip() {
    const auto wire = samplePlayerStatusWire();
    auto status = schema::decodePlayerStatus(wire);
    ASSERT_TRUE(status.has_value(), "player status decodes");
    ASSERT_EQ(status->playlistUrl, std::string("https://example.com/playlist.json"), "playlistURL");
    ASSERT_EQ(status->items.size(), std::size_t{2}, "items");
    ASSERT_EQ(status->items[1].durationSeconds, 60, "item duration");
    ASSERT_EQ(status->settings.orientation, std::string("portrait"), "deviceSettings.orientation");
    ASSERT_TRUE(status->playlist.has_value(), "playlist object kept");

    ASSERT_TRUE(schema::encodePlayerStatus(*status) == wire, "encode reproduces the wire fields");
    auto again = schema::decodePlayerStatus(schema::encodePlayerStatus(*status));
    ASSERT_TRUE(again && *again == *status, "decode(encode(x)) == x");
}

static void testDefaults() {
    auto status = schema::decodePlayerStatus(json::object());
    ASSERT_TRUE(status.has_value(), "empty object decodes");
    ASSERT_TRUE(status->ok, "ok defaults to true");
    ASSERT_TRUE(!status->paused, "isPaused defaults to false");
    ASSERT_TRUE(!status->playlist.has_value(), "playlist absent");
    ASSERT_TRUE(status->items.empty(), "no items");

    auto wire = schema::encodePlayerStatus(*status);
    ASSERT_TRUE(!wire.contains("playlist"), "absent playlist is omitted on the wire");

    auto nullPlaylist = schema::decodePlayerStatus(json{{"playlist", nullptr}});
    ASSERT_TRUE(nullPlaylist && !nullPlaylist->playlist, "null playlist decodes as absent");
}

static void testTypeErrors() {
    auto badVolume = schema::decodeDeviceStatus(json{{"volume", "loud"}});
    ASSERT_TRUE(!badVolume, "string volume rejected");
    ASSERT_EQ(badVolume.error().where, std::string("volume"), "error names the field");

    auto badItem = schema::decodePlayerStatus(json::parse(R"({"items": [{"id": "a"}, {"duration": "long"}]})"));
    ASSERT_TRUE(!badItem, "bad nested item rejected");
    ASSERT_EQ(badItem.error().where, std::string("items[1].duration"), "path into the array");

    auto notObject = schema::decodePlayerStatus(json::array());
    ASSERT_TRUE(!notObject, "non-object rejected");

    auto unknown = schema::decodeDeviceStatus(json{{"volume", 5}, {"somethingNew", 1}});
    ASSERT_TRUE(unknown && unknown->volume == 5, "unknown fields ignored");
}

int main() {
    testDeviceStatusDecode();
    testDeviceStatusRoundTrip();
    testPlayerStatusRoundTrip();
    testDefaults();
    testTypeErrors();
    return finishTests("StatusRecords");
}
