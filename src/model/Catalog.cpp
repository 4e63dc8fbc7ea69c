#include "model/Catalog.hpp"
#include <algorithm>

namespace lorchestre::model {

std::optional<Track> Album::find_track(std::string_view track_id) const {
    for (const auto& track : tracks) {
        if (track.id == track_id) {
            return track;
        }
    }
    return std::nullopt;
}

size_t Album::remove_track(std::string_view file_path) {
    return std::erase_if(tracks, [&](const Track& t) { return t.file_path == file_path; });
}

std::optional<Track> Playlist::find_track(std::string_view track_id) const {
    for (const auto& track : tracks) {
        if (track.id == track_id) {
            return track;
        }
    }
    return std::nullopt;
}

Album make_album(Track first) {
    Album album;
    album.id = first.album_id;
    album.name = first.album;
    album.artist = first.album_artist.value_or(first.primary_artist());
    album.year = first.album_year;
    album.tracks.push_back(std::move(first));
    return album;
}

std::optional<Album> Catalog::find_album(std::string_view album_id) const {
    for (const auto& album : albums) {
        if (album.id == album_id) {
            return album;
        }
    }
    return std::nullopt;
}

std::optional<Track> Catalog::find_track(std::string_view track_id) const {
    for (const auto& album : albums) {
        if (auto track = album.find_track(track_id)) {
            return track;
        }
    }
    for (const auto& playlist : playlists) {
        if (auto track = playlist.find_track(track_id)) {
            return track;
        }
    }
    return std::nullopt;
}

size_t Catalog::track_count() const {
    size_t count = 0;
    for (const auto& album : albums) {
        count += album.tracks.size();
    }
    return count;
}

void Catalog::add_track(Track track) {
    auto it = std::find_if(albums.begin(), albums.end(),
                           [&](const Album& a) { return a.id == track.album_id; });
    if (it != albums.end()) {
        it->tracks.push_back(std::move(track));
        return;
    }
    albums.push_back(make_album(std::move(track)));
}

void Catalog::add_playlist(Playlist playlist) {
    playlists.push_back(std::move(playlist));
}

void Catalog::remove_track(std::string_view file_path) {
    for (auto& album : albums) {
        album.remove_track(file_path);
    }
    std::erase_if(albums, [](const Album& a) { return a.tracks.empty(); });
}

void Catalog::remove_playlist(std::string_view path) {
    std::erase_if(playlists, [&](const Playlist& p) { return p.path == path; });
}

}  // namespace lorchestre::model
