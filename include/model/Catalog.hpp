#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lorchestre::model {

// Stand-in for any tag that is missing (title, album, primary artist)
inline constexpr std::string_view UNKNOWN = "@UNKNOWN@";

struct LyricLine {
    int64_t start_time_ms = 0;
    std::string text;

    bool operator==(const LyricLine&) const = default;
};

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    // Rec. 709 relative luminance on 0-255 components
    [[nodiscard]] double luminance() const {
        return 0.2126 * r + 0.7152 * g + 0.0722 * b;
    }

    [[nodiscard]] bool is_light() const { return luminance() > 180.0; }

    bool operator==(const Color&) const = default;
};

struct Track {
    std::string id;
    std::string title = std::string(UNKNOWN);
    std::vector<std::string> artists;
    uint32_t track_number = 0;
    std::string album = std::string(UNKNOWN);
    std::optional<std::string> album_artist;
    std::optional<uint32_t> album_year;
    std::string album_id;

    // Natural key: absolute path of the audio file
    std::string file_path;
    std::string mime = "application/octet-stream";

    // Cover artwork lives at {cache}/covers/{album_id}{cover_ext}
    std::optional<std::string> cover_ext;
    std::optional<Color> color;
    std::optional<bool> is_light;

    std::vector<LyricLine> lyrics;
    uint64_t duration = 0;  // seconds
    uint32_t bitrate = 0;   // kbps
    std::chrono::system_clock::time_point created_at{};

    // First artist, or the unknown sentinel when the file has none
    [[nodiscard]] std::string primary_artist() const {
        return artists.empty() ? std::string(UNKNOWN) : artists.front();
    }

    bool operator==(const Track&) const = default;
};

struct Album {
    std::string name;
    std::string artist;
    std::vector<Track> tracks;
    std::optional<uint32_t> year;
    std::string id;

    [[nodiscard]] std::optional<Track> find_track(std::string_view track_id) const;

    // Drops every track backed by file_path, returns how many were removed
    size_t remove_track(std::string_view file_path);

    bool operator==(const Album&) const = default;
};

struct Playlist {
    std::string name;
    std::string path;
    std::vector<Track> tracks;

    [[nodiscard]] std::optional<Track> find_track(std::string_view track_id) const;

    bool operator==(const Playlist&) const = default;
};

/// Catalog is the unit of publication.
///
/// A published Catalog is only ever handed out as shared_ptr<const Catalog>;
/// the mutating members below are used while a new value is being assembled
/// (full rebuild or a copy taken for an incremental update), never on a
/// snapshot that readers can see.
///
/// Invariant after any mutation: no Album has an empty track list.
struct Catalog {
    std::vector<Album> albums;
    std::vector<Playlist> playlists;

    [[nodiscard]] std::optional<Album> find_album(std::string_view album_id) const;

    // Albums are searched first, then playlists
    [[nodiscard]] std::optional<Track> find_track(std::string_view track_id) const;

    [[nodiscard]] size_t track_count() const;

    // Appends to the album with the same album_id, or opens a new album
    void add_track(Track track);
    void add_playlist(Playlist playlist);

    // Strips the path from every album, then prunes albums left empty
    void remove_track(std::string_view file_path);
    void remove_playlist(std::string_view path);

    bool operator==(const Catalog&) const = default;
};

// New album seeded from its first track (artist and year come from it)
[[nodiscard]] Album make_album(Track first);

}  // namespace lorchestre::model
