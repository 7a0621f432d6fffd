#include "ff1/playlist/Playlist.hpp"

#include "ff1/policy/UrlPolicy.hpp"
#include "ff1/schema/json_schema.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cctype>
#include <chrono>
#include <ctime>

namespace ff1::playlist {

namespace {

namespace fsch = ::ff1::schema;

const auto displaySchema = fsch::makeSchema<DisplayConfig>(std::make_tuple(
    fsch::field<&DisplayConfig::scaling   >("scaling"   , fsch::optionalOf(fsch::Text{})),
    fsch::field<&DisplayConfig::background>("background", fsch::optionalOf(fsch::Text{})),
    fsch::field<&DisplayConfig::autoPlay  >("autoPlay"  , fsch::optionalOf(fsch::Flag{})),
    fsch::field<&DisplayConfig::loop      >("loop"      , fsch::optionalOf(fsch::Flag{}))
));

const auto defaultsSchema = fsch::makeSchema<PlaylistDefaults>(std::make_tuple(
    fsch::field<&PlaylistDefaults::display >("display" , fsch::optionalOf(fsch::record(displaySchema))),
    fsch::field<&PlaylistDefaults::license >("license" , fsch::optionalOf(fsch::Text{})),
    fsch::field<&PlaylistDefaults::duration>("duration", fsch::optionalOf(fsch::Integer<int>{}))
));

const auto itemSchema = fsch::makeSchema<PlaylistItem>(std::make_tuple(
    fsch::required<&PlaylistItem::id     >("id"      , fsch::Text{}),
    fsch::field   <&PlaylistItem::title  >("title"   , fsch::Text{}),
    fsch::required<&PlaylistItem::source >("source"  , fsch::Text{}),
    fsch::required<&PlaylistItem::duration>("duration", fsch::Integer<int>{}),
    fsch::field   <&PlaylistItem::license>("license" , fsch::Text{}),
    fsch::field   <&PlaylistItem::ref    >("ref"     , fsch::optionalOf(fsch::Text{})),
    fsch::field   <&PlaylistItem::display>("display" , fsch::optionalOf(fsch::record(displaySchema)))
));

const auto playlistSchema = fsch::makeSchema<Playlist>(std::make_tuple(
    fsch::field   <&Playlist::dpVersion>("dpVersion", fsch::Text{}),
    fsch::required<&Playlist::id       >("id"       , fsch::Text{}),
    fsch::required<&Playlist::slug     >("slug"     , fsch::Text{}),
    fsch::required<&Playlist::title    >("title"    , fsch::Text{}),
    fsch::required<&Playlist::created  >("created"  , fsch::Text{}),
    fsch::field   <&Playlist::defaults >("defaults" , fsch::optionalOf(fsch::record(defaultsSchema))),
    fsch::required<&Playlist::items    >("items"    , fsch::listOf(fsch::record(itemSchema))),
    fsch::field   <&Playlist::signature>("signature", fsch::optionalOf(fsch::Text{}))
));

std::string newId(boost::uuids::random_generator& gen) {
    return boost::uuids::to_string(gen());
}

std::string utcNow() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string itemTitle(const std::string& source) {
    auto url = policy::splitUrl(source);
    const std::string path = url ? url->path : source;
    const auto slash = path.find_last_of('/');
    auto last = slash == std::string::npos ? path : path.substr(slash + 1);
    return last.empty() ? "Untitled" : last;
}

} // namespace

std::string slugify(const std::string& title) {
    std::string slug;
    bool pendingDash = false;
    for (unsigned char c : title) {
        const char lc = static_cast<char>(std::tolower(c));
        const bool keep = std::isalnum(static_cast<unsigned char>(lc)) || lc == '_' || lc == '-';
        if (!keep || lc == '-') {
            pendingDash = true;
            continue;
        }
        if (pendingDash && !slug.empty()) {
            slug += '-';
        }
        pendingDash = false;
        slug += lc;
    }
    if (slug.size() > 64) {
        slug.resize(64);
    }
    return slug;
}

Playlist buildPlaylist(const std::vector<std::string>& sources, const BuildOptions& options) {
    boost::uuids::random_generator gen;

    Playlist pl;
    pl.id = newId(gen);
    pl.slug = slugify(options.title);
    pl.title = options.title;
    pl.created = utcNow();

    PlaylistDefaults defaults;
    defaults.display = DisplayConfig{options.scaling, options.background, std::nullopt, std::nullopt};
    defaults.license = options.license;
    defaults.duration = options.duration;
    pl.defaults = defaults;

    for (const auto& source : sources) {
        PlaylistItem item;
        item.id = newId(gen);
        item.title = itemTitle(source);
        item.source = source;
        item.duration = options.duration;
        item.license = options.license;
        pl.items.push_back(std::move(item));
    }
    return pl;
}

Playlist quickPlay(const std::string& source, int duration) {
    BuildOptions options;
    options.title = "Quick Play";
    options.duration = duration;
    return buildPlaylist({source}, options);
}

bool isScalingMode(const std::string& mode) {
    return mode == "fit" || mode == "fill" || mode == "stretch" || mode == "auto";
}

nlohmann::json toJson(const Playlist& playlist) {
    return fsch::encode(playlistSchema, playlist);
}

expected<Playlist> parsePlaylist(const nlohmann::json& document) {
    auto parsed = fsch::decode(playlistSchema, document);
    if (!parsed) {
        return unexpected(Error::invalidArgument(
            "invalid DP1 playlist: " + parsed.error().where + ": " + parsed.error().what));
    }
    return std::move(*parsed);
}

} // namespace ff1::playlist
