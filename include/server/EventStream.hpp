#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace lorchestre::server {

/**
 * Outgoing frames of one /events connection.
 *
 * The broadcasting thread only queues; the connection thread drains and
 * writes. A client that stops reading lets the queue fill up, at which
 * point push() closes the stream instead of waiting on it.
 */
class EventStream {
public:
    static constexpr size_t DEFAULT_MAX_PENDING = 8;

    explicit EventStream(size_t max_pending = DEFAULT_MAX_PENDING);

    // False if the stream is closed, or was just closed because max_pending
    // frames are already waiting
    bool push(std::string frame);

    // Wakes a waiting connection thread; later pushes are refused
    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] size_t pending() const;

    // Blocks until a frame is queued, the stream closes or timeout elapses.
    // Returns every queued frame in order; empty on timeout or close.
    std::vector<std::string> wait(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    size_t max_pending_;
    bool closed_ = false;
};

}  // namespace lorchestre::server
