#include "backend/CatalogService.hpp"
#include "util/Logger.hpp"
#include <chrono>

namespace lorchestre::backend {

CatalogService::CatalogService(std::filesystem::path music_root, std::filesystem::path cache_dir,
                               TagReader reader, ColorProbe probe, size_t workers)
    : music_root_(std::move(music_root)),
      covers_(cache_dir, std::move(probe)),
      extractor_(covers_, std::move(reader), workers),
      playlists_(extractor_),
      builder_(extractor_, playlists_),
      resolver_(cache_dir),
      store_() {}

RebuildReport CatalogService::rebuild() {
    RebuildReport report;
    std::shared_ptr<const model::Catalog> published;
    {
        std::lock_guard<std::mutex> lock(rebuild_mutex_);
        auto start = std::chrono::steady_clock::now();
        util::Logger::info("CatalogService: Rebuilding catalog from " + music_root_.string());

        Resolution resolution = resolver_.resolve(music_root_);
        BuildResult built = builder_.build(resolution.audio_files(), resolution.playlist_files());

        report.albums = built.catalog.albums.size();
        report.playlists = built.catalog.playlists.size();
        report.tracks = built.catalog.track_count();
        report.reused_cache = resolution.reused_cache;
        report.diagnostics = std::move(built.diagnostics);
        report.seq = store_.publish(std::move(built.catalog));
        published = store_.current();

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        util::Logger::info("CatalogService: Published snapshot " + std::to_string(report.seq) + " (" +
                           std::to_string(report.albums) + " albums, " +
                           std::to_string(report.tracks) + " tracks, " +
                           std::to_string(report.playlists) + " playlists) in " +
                           std::to_string(elapsed) + "ms");
    }

    notify(published);
    return report;
}

uint64_t CatalogService::add_media(const std::string& path) {
    uint64_t seq = 0;
    std::shared_ptr<const model::Catalog> published;
    {
        std::lock_guard<std::mutex> lock(rebuild_mutex_);
        seq = store_.update([&](model::Catalog& catalog) { builder_.add_media(catalog, path); });
        published = store_.current();
    }
    util::Logger::info("CatalogService: Added " + path);
    notify(published);
    return seq;
}

uint64_t CatalogService::remove_media(const std::string& path) {
    uint64_t seq = 0;
    std::shared_ptr<const model::Catalog> published;
    {
        std::lock_guard<std::mutex> lock(rebuild_mutex_);
        seq = store_.update([&](model::Catalog& catalog) { CatalogBuilder::remove_media(catalog, path); });
        published = store_.current();
    }
    util::Logger::info("CatalogService: Removed " + path);
    notify(published);
    return seq;
}

std::shared_ptr<const model::Catalog> CatalogService::snapshot() const {
    return store_.current();
}

uint64_t CatalogService::seq() const {
    return store_.seq();
}

std::optional<model::Track> CatalogService::find_track(const std::string& id) const {
    return store_.current()->find_track(id);
}

std::optional<model::Album> CatalogService::find_album(const std::string& id) const {
    return store_.current()->find_album(id);
}

events::UpdateNotifier::ListenerId CatalogService::subscribe(events::UpdateNotifier::Listener listener) {
    return notifier_.subscribe(std::move(listener));
}

void CatalogService::unsubscribe(events::UpdateNotifier::ListenerId id) {
    notifier_.unsubscribe(id);
}

size_t CatalogService::subscriber_count() const {
    return notifier_.listener_count();
}

void CatalogService::notify(const std::shared_ptr<const model::Catalog>& published) {
    notifier_.broadcast(published);
}

}  // namespace lorchestre::backend
