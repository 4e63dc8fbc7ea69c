#include "server/EventStream.hpp"
#include "util/Logger.hpp"

namespace lorchestre::server {

EventStream::EventStream(size_t max_pending) : max_pending_(max_pending) {}

bool EventStream::push(std::string frame) {
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (frames_.size() >= max_pending_) {
            util::Logger::warn("EventStream: Client fell " + std::to_string(frames_.size()) +
                               " frames behind, closing");
            closed_ = true;
            frames_.clear();
        } else {
            frames_.push_back(std::move(frame));
            accepted = true;
        }
    }
    cv_.notify_all();
    return accepted;
}

void EventStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        frames_.clear();
    }
    cv_.notify_all();
}

bool EventStream::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventStream::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

std::vector<std::string> EventStream::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return closed_ || !frames_.empty(); });

    std::vector<std::string> out;
    if (closed_) {
        return out;
    }
    out.reserve(frames_.size());
    for (auto& frame : frames_) {
        out.push_back(std::move(frame));
    }
    frames_.clear();
    return out;
}

}  // namespace lorchestre::server
