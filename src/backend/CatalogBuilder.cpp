#include "backend/CatalogBuilder.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <unordered_map>

namespace lorchestre::backend {

CatalogBuilder::CatalogBuilder(TrackExtractor& extractor, PlaylistParser& playlists)
    : extractor_(extractor), playlists_(playlists) {}

std::vector<model::Album> CatalogBuilder::group_albums(std::vector<model::Track> tracks) {
    std::vector<model::Album> albums;
    std::unordered_map<std::string, size_t> index;  // album id -> position in albums

    for (auto& track : tracks) {
        auto it = index.find(track.album_id);
        if (it != index.end()) {
            albums[it->second].tracks.push_back(std::move(track));
            continue;
        }
        index.emplace(track.album_id, albums.size());
        albums.push_back(model::make_album(std::move(track)));
    }
    return albums;
}

BuildResult CatalogBuilder::build(const std::vector<std::string>& audio_files,
                                  const std::vector<std::string>& playlist_files) const {
    BuildResult result;

    ExtractionBatch batch = extractor_.extract_all(audio_files);
    result.catalog.albums = group_albums(std::move(batch.tracks));
    result.diagnostics = std::move(batch.diagnostics);

    for (const auto& path : playlist_files) {
        try {
            result.catalog.add_playlist(playlists_.parse(path));
        } catch (const std::exception& e) {
            util::Logger::warn("CatalogBuilder: Skipping playlist: " + std::string(e.what()));
            result.diagnostics.push_back(Diagnostic{path, e.what()});
        }
    }

    util::Logger::info("CatalogBuilder: Built " + std::to_string(result.catalog.albums.size()) +
                       " albums, " + std::to_string(result.catalog.playlists.size()) + " playlists, " +
                       std::to_string(result.diagnostics.size()) + " skipped");
    return result;
}

void CatalogBuilder::add_media(model::Catalog& catalog, const std::string& path) const {
    if (util::Platform::is_playlist_file(path)) {
        catalog.add_playlist(playlists_.parse(path));
    } else {
        catalog.add_track(extractor_.extract(path));
    }
}

void CatalogBuilder::remove_media(model::Catalog& catalog, const std::string& path) {
    if (util::Platform::is_playlist_file(path)) {
        catalog.remove_playlist(path);
    } else {
        catalog.remove_track(path);
    }
}

}  // namespace lorchestre::backend
