#pragma once

#include "model/Catalog.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace lorchestre::events {

/**
 * Fan-out of newly published catalogs.
 *
 * A listener returns false once its peer has gone away; it is then dropped,
 * as is one that throws. Listeners run on the broadcasting thread, outside
 * the notifier's lock, so they may subscribe or unsubscribe from inside.
 */
class UpdateNotifier {
public:
    using Listener = std::function<bool(const std::shared_ptr<const model::Catalog>&)>;
    using ListenerId = uint64_t;

    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

    // Returns how many listeners accepted the snapshot
    size_t broadcast(const std::shared_ptr<const model::Catalog>& snapshot);

    [[nodiscard]] size_t listener_count() const;

private:
    mutable std::mutex mutex_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_id_ = 1;
};

}  // namespace lorchestre::events
