#pragma once

#include "backend/CatalogBuilder.hpp"
#include "backend/CatalogStore.hpp"
#include "backend/CoverCache.hpp"
#include "backend/FingerprintResolver.hpp"
#include "backend/PlaylistParser.hpp"
#include "backend/TrackExtractor.hpp"
#include "events/UpdateNotifier.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lorchestre::backend {

struct RebuildReport {
    uint64_t seq = 0;
    size_t albums = 0;
    size_t playlists = 0;
    size_t tracks = 0;
    bool reused_cache = false;
    std::vector<Diagnostic> diagnostics;
};

/**
 * Owns the synchronization pipeline and the published catalog.
 *
 * rebuild(): resolve -> extract -> build -> publish -> notify. At most one
 * rebuild or incremental edit runs at a time; readers are never blocked by
 * one except for the pointer swap. If a rebuild throws, the previous
 * catalog stays published and the exception reaches the caller.
 *
 * Subscribers are notified after the edit lock is released: a listener that
 * is slow to return delays only the caller that published, never the next
 * rebuild or edit.
 */
class CatalogService {
public:
    CatalogService(std::filesystem::path music_root, std::filesystem::path cache_dir,
                   TagReader reader = MetadataParser::read_tags,
                   ColorProbe probe = CoverCache::decode_dominant_color,
                   size_t workers = 0);

    CatalogService(const CatalogService&) = delete;
    CatalogService& operator=(const CatalogService&) = delete;

    RebuildReport rebuild();

    // Incremental edits, returning the new sequence number. add_media throws
    // TagReadError / PlaylistReadError and publishes nothing on failure.
    uint64_t add_media(const std::string& path);
    uint64_t remove_media(const std::string& path);

    [[nodiscard]] std::shared_ptr<const model::Catalog> snapshot() const;
    [[nodiscard]] uint64_t seq() const;
    [[nodiscard]] std::optional<model::Track> find_track(const std::string& id) const;
    [[nodiscard]] std::optional<model::Album> find_album(const std::string& id) const;

    events::UpdateNotifier::ListenerId subscribe(events::UpdateNotifier::Listener listener);
    void unsubscribe(events::UpdateNotifier::ListenerId id);
    [[nodiscard]] size_t subscriber_count() const;

    [[nodiscard]] const CoverCache& covers() const { return covers_; }
    [[nodiscard]] const std::filesystem::path& music_root() const { return music_root_; }

private:
    void notify(const std::shared_ptr<const model::Catalog>& published);

    std::filesystem::path music_root_;

    CoverCache covers_;
    TrackExtractor extractor_;
    PlaylistParser playlists_;
    CatalogBuilder builder_;
    FingerprintResolver resolver_;
    CatalogStore store_;
    events::UpdateNotifier notifier_;

    std::mutex rebuild_mutex_;
};

}  // namespace lorchestre::backend
