#pragma once

#include "ff1/core/Expected.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ff1::playlist {

struct DisplayConfig {
    std::optional<std::string> scaling;
    std::optional<std::string> background;
    std::optional<bool> autoPlay;
    std::optional<bool> loop;
};

struct PlaylistDefaults {
    std::optional<DisplayConfig> display;
    std::optional<std::string> license;
    std::optional<int> duration;
};

struct PlaylistItem {
    std::string id;
    std::string title;
    std::string source;
    int duration = 0;
    std::string license = "open";
    std::optional<std::string> ref;
    std::optional<DisplayConfig> display;
};

/// DP1 playlist document as understood by the FF1 player.
struct Playlist {
    std::string dpVersion = "1.0.0";
    std::string id;
    std::string slug;
    std::string title;
    std::string created;
    std::optional<PlaylistDefaults> defaults;
    std::vector<PlaylistItem> items;
    std::optional<std::string> signature;
};

struct BuildOptions {
    std::string title = "Untitled Playlist";
    int duration = 300;
    std::string scaling = "fit";
    std::string background = "#000000";
    std::string license = "open";
};

/**
 * @brief Build a DP1 playlist with one item per artwork URL.
 *
 * Ids are random UUIDs, `created` is the current UTC time, and each item is
 * titled with the last path segment of its URL ("Untitled" when empty).
 */
Playlist buildPlaylist(const std::vector<std::string>& sources, const BuildOptions& options = {});

/// One-item "Quick Play" playlist used to put a single artwork on screen.
Playlist quickPlay(const std::string& source, int duration = 300);

/// True for the display scaling modes the player accepts: fit, fill, stretch, auto.
bool isScalingMode(const std::string& mode);

/// Lower-case slug: runs of characters outside [a-z0-9_-] become '-', max 64 chars.
std::string slugify(const std::string& title);

/// Wire form; absent optional fields are omitted.
nlohmann::json toJson(const Playlist& playlist);

/// Checks the DP1 shape (required fields and types); unknown fields are ignored.
expected<Playlist> parsePlaylist(const nlohmann::json& document);

} // namespace ff1::playlist
