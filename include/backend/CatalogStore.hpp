#pragma once

#include "model/Catalog.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace lorchestre::backend {

/**
 * Holds the published Catalog.
 *
 * Readers take a shared lock just long enough to copy the shared_ptr; a
 * reader keeps whatever snapshot it got alive for as long as it holds it.
 * Writers are serialized. The new snapshot is fully built before the
 * exclusive lock is taken, so the swap is the only exclusive step and
 * readers never see a half-built catalog.
 */
class CatalogStore {
public:
    CatalogStore();

    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    [[nodiscard]] std::shared_ptr<const model::Catalog> current() const;

    // Replaces the snapshot, returns its sequence number
    uint64_t publish(model::Catalog catalog);

    // Copy-on-write: fn edits a copy of the current catalog which is then
    // published. If fn throws nothing is published.
    uint64_t update(const std::function<void(model::Catalog&)>& fn);

    // 0 until the first publish
    [[nodiscard]] uint64_t seq() const;

private:
    uint64_t swap_in(std::shared_ptr<const model::Catalog> next);

    mutable std::shared_mutex mutex_;
    std::mutex write_mutex_;
    std::shared_ptr<const model::Catalog> current_;
    uint64_t seq_ = 0;
};

}  // namespace lorchestre::backend
