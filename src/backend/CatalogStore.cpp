#include "backend/CatalogStore.hpp"
#include "util/Logger.hpp"
#include <utility>

namespace lorchestre::backend {

CatalogStore::CatalogStore() : current_(std::make_shared<const model::Catalog>()) {}

std::shared_ptr<const model::Catalog> CatalogStore::current() const {
    std::shared_lock lock(mutex_);
    return current_;
}

uint64_t CatalogStore::seq() const {
    std::shared_lock lock(mutex_);
    return seq_;
}

uint64_t CatalogStore::publish(model::Catalog catalog) {
    auto next = std::make_shared<const model::Catalog>(std::move(catalog));
    std::lock_guard<std::mutex> writer(write_mutex_);
    return swap_in(std::move(next));
}

uint64_t CatalogStore::update(const std::function<void(model::Catalog&)>& fn) {
    std::lock_guard<std::mutex> writer(write_mutex_);

    // Published values are never mutated: edit a private copy
    model::Catalog copy = *current();
    fn(copy);
    return swap_in(std::make_shared<const model::Catalog>(std::move(copy)));
}

uint64_t CatalogStore::swap_in(std::shared_ptr<const model::Catalog> next) {
    std::shared_ptr<const model::Catalog> previous;
    uint64_t seq;
    {
        std::unique_lock lock(mutex_);
        previous = std::exchange(current_, std::move(next));
        seq = ++seq_;
    }
    // previous is released here, outside the lock, if no reader still holds it
    util::Logger::debug("CatalogStore: Published snapshot " + std::to_string(seq));
    return seq;
}

}  // namespace lorchestre::backend
