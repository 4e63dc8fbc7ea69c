#pragma once

#include "model/Catalog.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lorchestre::backend {

class TrackExtractor;

class PlaylistReadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PlaylistEntry {
    std::string path;                  // Absolute, lexically normalized
    std::optional<std::string> title;  // Display title from #EXTINF, if any

    bool operator==(const PlaylistEntry&) const = default;
};

struct PlaylistFile {
    std::string name;
    std::vector<PlaylistEntry> entries;
};

/**
 * M3U / extended M3U8 playlists.
 *
 *   #EXTM3U
 *   #PLAYLIST:Road trip
 *   #EXTINF:215,Artist - Title
 *   ../Albums/Foo/01.flac
 *
 * Relative entries resolve against the playlist's directory, file:// URIs are
 * unwrapped and other URLs are ignored. The name comes from #PLAYLIST:, else
 * the file stem.
 */
class PlaylistParser {
public:
    explicit PlaylistParser(TrackExtractor& extractor);

    /**
     * Reads the playlist and extracts every entry with the shared
     * TrackExtractor. Entries that cannot be read are logged and skipped.
     * Throws PlaylistReadError when the playlist itself cannot be read.
     */
    [[nodiscard]] model::Playlist parse(const std::string& path) const;

    // File-level parse only, no tag reading
    [[nodiscard]] static PlaylistFile read(const std::string& path);

    [[nodiscard]] static PlaylistFile parse_text(std::string_view text,
                                                 const std::filesystem::path& base_dir,
                                                 std::string fallback_name);

private:
    TrackExtractor& extractor_;
};

}  // namespace lorchestre::backend
