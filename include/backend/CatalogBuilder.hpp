#pragma once

#include "backend/PlaylistParser.hpp"
#include "backend/TrackExtractor.hpp"
#include "model/Catalog.hpp"
#include <string>
#include <vector>

namespace lorchestre::backend {

struct BuildResult {
    model::Catalog catalog;
    std::vector<Diagnostic> diagnostics;  // Audio failures first, then playlists
};

/**
 * Assembles a Catalog from resolved media paths.
 *
 * Albums are keyed by album id and ordered by the first track seen for
 * each; that first track also decides the album's artist and year.
 */
class CatalogBuilder {
public:
    CatalogBuilder(TrackExtractor& extractor, PlaylistParser& playlists);

    [[nodiscard]] static std::vector<model::Album> group_albums(std::vector<model::Track> tracks);

    [[nodiscard]] BuildResult build(const std::vector<std::string>& audio_files,
                                    const std::vector<std::string>& playlist_files) const;

    // Playlist files become playlists, anything else one track.
    // Throws TagReadError / PlaylistReadError and leaves catalog untouched.
    void add_media(model::Catalog& catalog, const std::string& path) const;

    // Removes the playlist, or the track and any album it leaves empty
    static void remove_media(model::Catalog& catalog, const std::string& path);

private:
    TrackExtractor& extractor_;
    PlaylistParser& playlists_;
};

}  // namespace lorchestre::backend
