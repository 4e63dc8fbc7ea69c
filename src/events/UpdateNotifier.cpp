#include "events/UpdateNotifier.hpp"
#include "util/Logger.hpp"
#include <vector>

namespace lorchestre::events {

UpdateNotifier::ListenerId UpdateNotifier::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    util::Logger::debug("UpdateNotifier: Listener " + std::to_string(id) + " subscribed");
    return id;
}

void UpdateNotifier::unsubscribe(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

size_t UpdateNotifier::broadcast(const std::shared_ptr<const model::Catalog>& snapshot) {
    // Copy handlers to avoid holding lock during execution
    std::vector<std::pair<ListenerId, Listener>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers.assign(listeners_.begin(), listeners_.end());
    }

    size_t delivered = 0;
    std::vector<ListenerId> dropped;
    for (const auto& [id, handler] : handlers) {
        try {
            if (handler(snapshot)) {
                ++delivered;
            } else {
                dropped.push_back(id);
            }
        } catch (const std::exception& e) {
            util::Logger::warn("UpdateNotifier: Listener " + std::to_string(id) + " failed: " + e.what());
            dropped.push_back(id);
        }
    }

    if (!dropped.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto id : dropped) {
            listeners_.erase(id);
        }
    }

    util::Logger::debug("UpdateNotifier: Delivered to " + std::to_string(delivered) +
                        ", dropped " + std::to_string(dropped.size()));
    return delivered;
}

size_t UpdateNotifier::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

}  // namespace lorchestre::events
