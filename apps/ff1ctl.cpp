#include "ff1/client/ControlClient.hpp"
#include "ff1/client/status_schema.hpp"
#include "ff1/device/DeviceConfigSet.hpp"
#include "ff1/device/DeviceResolver.hpp"
#include "ff1/log/Log.hpp"
#include "ff1/playlist/Playlist.hpp"
#include "ff1/policy/UrlPolicy.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace ff1;
using nlohmann::json;

namespace {

constexpr int kExitUsage = 64;
constexpr const char* kBuildUsage =
    "usage: ff1ctl build URL... [--title T] [--duration S] [--scaling MODE] [--background COLOR] [--play]";

struct Invocation {
    bool pretty = false;
    bool verbose = false;
    std::optional<std::string> device;
    std::string command;
    std::vector<std::string> args;
    // build, play
    playlist::BuildOptions build;
    bool playAfterBuild = false;
    // rotate
    bool counterClockwise = false;
};

void printUsage(std::ostream& os) {
    os << "usage: ff1ctl [--pretty] [--verbose] <command> [--device NAME|HOST] [args]\n"
          "\n"
          "commands:\n"
          "  discover                   list configured or discovered devices\n"
          "  status                     device status\n"
          "  player                     current player status\n"
          "  watch                      stream player status until the device closes the feed\n"
          "  play URL [--duration S]    display a single artwork URL as a one-item playlist\n"
          "  playlist URL|FILE|-        display a playlist by URL, from a file, or from stdin\n"
          "  build URL... [--title T] [--duration S] [--scaling fit|fill|stretch|auto]\n"
          "               [--background COLOR] [--play]\n"
          "                             build a DP1 playlist (and display it with --play)\n"
          "  rotate [--ccw]             rotate the screen\n"
          "  volume N                   set volume to N percent\n"
          "  mute                       toggle mute\n"
          "  key CODE                   send a keyboard event\n"
          "  reboot | shutdown | update\n"
          "\n"
          "environment: FF1_CONFIG, FF1_ENABLE_URL_VALIDATION, FF1_UNSAFE_ALLOW_LOCAL_URLS\n";
}

int exitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigError:     return 2;
        case ErrorKind::NotFound:        return 3;
        case ErrorKind::Ambiguous:       return 4;
        case ErrorKind::Timeout:         return 5;
        case ErrorKind::TransportError:  return 6;
        case ErrorKind::DecodeError:     return 7;
        case ErrorKind::InvalidArgument: return kExitUsage;
    }
    return 1;
}

json errorToJson(const Error& error) {
    json out{{"error", toString(error.kind)}, {"message", error.message}};
    if (!error.candidates.empty()) {
        json list = json::array();
        for (const auto& c : error.candidates) {
            list.push_back({{"name", c.name}, {"host", c.host}});
        }
        out["candidates"] = std::move(list);
    }
    if (!error.host.empty()) {
        out["host"] = error.host;
    }
    if (error.timeout) {
        out["timeoutMs"] = error.timeout->count();
    }
    if (error.httpStatus != 0) {
        out["httpStatus"] = error.httpStatus;
    }
    return out;
}

json deviceToJson(const device::DeviceDescriptor& d) {
    json out{{"host", d.host}, {"port", d.port}};
    if (d.name) {
        out["name"] = *d.name;
    }
    if (d.topicId) {
        out["topicID"] = *d.topicId;
    }
    return out;
}

class Output {
public:
    explicit Output(bool pretty) : indent_(pretty ? 2 : -1) {}

    int print(const json& value) const {
        std::cout << value.dump(indent_) << std::endl;
        return 0;
    }

    int fail(const Error& error) const {
        std::cerr << errorToJson(error).dump(indent_) << std::endl;
        return exitCodeFor(error.kind);
    }

    template<typename T>
    int result(const expected<T>& value) const {
        if (!value) {
            return fail(value.error());
        }
        return print(*value);
    }

private:
    int indent_;
};

std::optional<int> parseInt(const std::string& text) {
    std::istringstream is(text);
    int value = 0;
    if (!(is >> value) || !is.eof()) {
        return std::nullopt;
    }
    return value;
}

expected<Invocation> parseArgs(int argc, char** argv) {
    Invocation inv;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto nextValue = [&](const char* flag) -> expected<std::string> {
            if (i + 1 >= argc) {
                return unexpected(Error::invalidArgument(std::string(flag) + " needs a value"));
            }
            return std::string(argv[++i]);
        };

        if (arg == "--pretty") {
            inv.pretty = true;
        } else if (arg == "--verbose" || arg == "-v") {
            inv.verbose = true;
        } else if (arg == "--device" || arg == "-d") {
            auto v = nextValue("--device");
            if (!v) return unexpected(v.error());
            inv.device = *v;
        } else if (arg == "--title") {
            auto v = nextValue("--title");
            if (!v) return unexpected(v.error());
            inv.build.title = *v;
        } else if (arg == "--duration") {
            auto v = nextValue("--duration");
            if (!v) return unexpected(v.error());
            auto seconds = parseInt(*v);
            if (!seconds || *seconds <= 0) {
                return unexpected(Error::invalidArgument("--duration must be a positive number of seconds"));
            }
            inv.build.duration = *seconds;
        } else if (arg == "--scaling") {
            auto v = nextValue("--scaling");
            if (!v) return unexpected(v.error());
            if (!playlist::isScalingMode(*v)) {
                return unexpected(Error::invalidArgument("--scaling must be one of fit, fill, stretch, auto"));
            }
            inv.build.scaling = *v;
        } else if (arg == "--background") {
            auto v = nextValue("--background");
            if (!v) return unexpected(v.error());
            inv.build.background = *v;
        } else if (arg == "--play") {
            inv.playAfterBuild = true;
        } else if (arg == "--ccw") {
            inv.counterClockwise = true;
        } else if (arg == "--help" || arg == "-h") {
            inv.command = "help";
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            return unexpected(Error::invalidArgument("unknown option " + arg));
        } else if (inv.command.empty()) {
            inv.command = arg;
        } else {
            inv.args.push_back(arg);
        }
    }
    if (inv.command.empty()) {
        return unexpected(Error::invalidArgument("no command given"));
    }
    return inv;
}

expected<void> expectArgs(const Invocation& inv, std::size_t count, const char* usage) {
    if (inv.args.size() != count) {
        return unexpected(Error::invalidArgument("usage: ff1ctl " + inv.command + (usage[0] ? " " : "") + usage));
    }
    return {};
}

expected<json> readPlaylistDocument(const std::string& source) {
    std::string text;
    if (source == "-") {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(source);
        if (!in) {
            return unexpected(Error::invalidArgument("cannot open playlist file " + source));
        }
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return unexpected(Error::invalidArgument("playlist " + source + " is not valid JSON"));
    }
    return doc;
}

bool looksLikeUrl(const std::string& text) {
    return text.rfind("http://", 0) == 0 || text.rfind("https://", 0) == 0;
}

int runDeviceCommand(const Invocation& inv, const Output& out, const client::ControlClient& client) {
    const auto urlOptions = policy::UrlPolicyOptions::fromEnvironment();
    const auto checkUrl = policy::makeUrlPolicy(urlOptions);

    const auto& cmd = inv.command;
    if (cmd == "status") {
        auto status = client.getDeviceStatus();
        if (!status) return out.fail(status.error());
        logInfo("[ff1ctl] ", status->describe(), "\n");
        return out.print(client::schema::encodeDeviceStatus(*status));
    }
    if (cmd == "player") {
        auto status = client.getPlayerStatus();
        if (!status) return out.fail(status.error());
        logInfo("[ff1ctl] ", status->describe(), "\n");
        return out.print(client::schema::encodePlayerStatus(*status));
    }
    if (cmd == "watch") {
        auto stream = client.watchPlayerStatus();
        if (!stream) return out.fail(stream.error());
        while (true) {
            auto record = stream->next();
            if (!record) return out.fail(record.error());
            if (!*record) return 0;
            logInfo("[ff1ctl] ", (*record)->describe(), "\n");
            out.print(client::schema::encodePlayerStatus(**record));
        }
    }
    if (cmd == "play") {
        if (auto ok = expectArgs(inv, 1, "URL"); !ok) return out.fail(ok.error());
        if (auto ok = checkUrl(inv.args[0]); !ok) return out.fail(ok.error());
        auto doc = playlist::toJson(playlist::quickPlay(inv.args[0], inv.build.duration));
        if (auto ok = policy::validatePlaylistPayload(doc, urlOptions); !ok) return out.fail(ok.error());
        return out.result(client.displayPlaylist(doc));
    }
    if (cmd == "playlist") {
        if (auto ok = expectArgs(inv, 1, "URL|FILE|-"); !ok) return out.fail(ok.error());
        const auto& source = inv.args[0];
        if (looksLikeUrl(source)) {
            if (auto ok = checkUrl(source); !ok) return out.fail(ok.error());
            return out.result(client.displayPlaylistUrl(source));
        }
        auto doc = readPlaylistDocument(source);
        if (!doc) return out.fail(doc.error());
        if (auto ok = policy::validatePlaylistPayload(*doc, urlOptions); !ok) return out.fail(ok.error());
        return out.result(client.displayPlaylist(*doc));
    }
    if (cmd == "build") {
        if (inv.args.empty()) {
            return out.fail(Error::invalidArgument(kBuildUsage));
        }
        auto doc = playlist::toJson(playlist::buildPlaylist(inv.args, inv.build));
        if (auto ok = policy::validatePlaylistPayload(doc, urlOptions); !ok) return out.fail(ok.error());
        return out.result(client.displayPlaylist(doc));
    }
    if (cmd == "rotate") {
        if (auto ok = expectArgs(inv, 0, "[--ccw]"); !ok) return out.fail(ok.error());
        return out.result(client.rotate(!inv.counterClockwise));
    }
    if (cmd == "volume") {
        if (auto ok = expectArgs(inv, 1, "PERCENT"); !ok) return out.fail(ok.error());
        auto percent = parseInt(inv.args[0]);
        if (!percent || *percent < 0 || *percent > 100) {
            return out.fail(Error::invalidArgument("volume must be an integer between 0 and 100"));
        }
        return out.result(client.setVolume(*percent));
    }
    if (cmd == "mute") {
        return out.result(client.toggleMute());
    }
    if (cmd == "key") {
        if (auto ok = expectArgs(inv, 1, "CODE"); !ok) return out.fail(ok.error());
        auto code = parseInt(inv.args[0]);
        if (!code) return out.fail(Error::invalidArgument("key code must be an integer"));
        return out.result(client.sendKey(*code));
    }
    if (cmd == "reboot") {
        return out.result(client.reboot());
    }
    if (cmd == "shutdown") {
        return out.result(client.shutdown());
    }
    if (cmd == "update") {
        return out.result(client.updateFirmware());
    }
    return out.fail(Error::invalidArgument("unknown command '" + cmd + "'"));
}

} // namespace

int main(int argc, char** argv) {
    auto inv = parseArgs(argc, argv);
    if (!inv) {
        std::cerr << "ff1ctl: " << inv.error().message << "\n\n";
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (inv->command == "help") {
        printUsage(std::cout);
        return 0;
    }

    if (!inv->verbose) {
        setInfoLogHandler(ff1::log::discardingLogHandler());
    }

    const Output out(inv->pretty);

    // build without --play needs no device.
    if (inv->command == "build" && !inv->playAfterBuild) {
        if (inv->args.empty()) {
            return out.fail(Error::invalidArgument(kBuildUsage));
        }
        return out.print(playlist::toJson(playlist::buildPlaylist(inv->args, inv->build)));
    }

    auto config = device::DeviceConfigSet::load();
    if (!config) {
        return out.fail(config.error());
    }
    device::DeviceResolver resolver(std::move(*config));

    if (inv->command == "discover") {
        json list = json::array();
        for (const auto& d : resolver.discover()) {
            list.push_back(deviceToJson(d));
        }
        return out.print(list);
    }

    auto target = resolver.resolve(inv->device);
    if (!target) {
        return out.fail(target.error());
    }
    logInfo("[ff1ctl] target ", target->label(), " (", target->host, ":", target->port, ")\n");

    client::ControlClient client(std::move(*target));
    return runDeviceCommand(*inv, out, client);
}
