#include "server/JsonCodec.hpp"
#include <chrono>

namespace lorchestre::model {

namespace {
    template <typename T>
    nlohmann::json optional_json(const std::optional<T>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }
}

void to_json(nlohmann::json& j, const LyricLine& line) {
    j = nlohmann::json{{"start_time", line.start_time_ms}, {"text", line.text}};
}

void to_json(nlohmann::json& j, const Color& color) {
    j = nlohmann::json{{"r", color.r}, {"g", color.g}, {"b", color.b}};
}

void to_json(nlohmann::json& j, const Track& track) {
    auto since_epoch = track.created_at.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);

    j = nlohmann::json{
        {"id", track.id},
        {"title", track.title},
        {"artists", track.artists},
        {"track", track.track_number},
        {"album", track.album},
        {"album_artist", optional_json(track.album_artist)},
        {"album_id", track.album_id},
        {"album_year", optional_json(track.album_year)},
        {"cover_ext", optional_json(track.cover_ext)},
        {"mime", track.mime},
        {"lyrics", track.lyrics},
        {"color", optional_json(track.color)},
        {"is_light", optional_json(track.is_light)},
        {"file_path", track.file_path},
        {"duration", track.duration},
        {"bitrate", track.bitrate},
        {"created_at", {{"secs_since_epoch", secs.count()}, {"nanos_since_epoch", nanos.count()}}},
    };
}

void to_json(nlohmann::json& j, const Album& album) {
    j = nlohmann::json{
        {"id", album.id},
        {"name", album.name},
        {"artist", album.artist},
        {"year", optional_json(album.year)},
        {"tracks", album.tracks},
    };
}

void to_json(nlohmann::json& j, const Playlist& playlist) {
    j = nlohmann::json{{"name", playlist.name}, {"path", playlist.path}, {"tracks", playlist.tracks}};
}

void to_json(nlohmann::json& j, const Catalog& catalog) {
    j = nlohmann::json{{"albums", catalog.albums}, {"playlists", catalog.playlists}};
}

}  // namespace lorchestre::model

namespace lorchestre::backend {

void to_json(nlohmann::json& j, const Diagnostic& diagnostic) {
    j = nlohmann::json{{"path", diagnostic.path}, {"message", diagnostic.message}};
}

void to_json(nlohmann::json& j, const RebuildReport& report) {
    j = nlohmann::json{
        {"seq", report.seq},
        {"albums", report.albums},
        {"playlists", report.playlists},
        {"tracks", report.tracks},
        {"reused_cache", report.reused_cache},
        {"diagnostics", report.diagnostics},
    };
}

}  // namespace lorchestre::backend
