#pragma once

#include "backend/CatalogService.hpp"
#include "server/EventStream.hpp"
#include "server/Http.hpp"
#include "server/Routes.hpp"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lorchestre::server {

/**
 * Minimal HTTP/1.1 server over standalone asio.
 *
 * Accepts on its own thread (async_accept on a private io_context) and
 * serves each connection on a dedicated thread with blocking I/O, one
 * request per connection. GET /events keeps the connection open and
 * subscribes it to catalog updates until the peer goes away; updates are
 * queued per connection, so a client that stops reading is dropped rather
 * than stalling the publisher.
 */
class HttpServer {
public:
    HttpServer(std::string host, uint16_t port, backend::CatalogService& service);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts accepting; throws asio::system_error if binding fails
    void start();

    // Closes the listener and every open connection, then joins all threads
    void stop();

    // Bound port, useful when constructed with port 0
    [[nodiscard]] uint16_t port() const;

private:
    using Socket = asio::ip::tcp::socket;

    static constexpr size_t MAX_HEAD_SIZE = 16 * 1024;
    static constexpr size_t FILE_CHUNK_SIZE = 64 * 1024;
    static constexpr std::chrono::milliseconds PEER_CHECK_INTERVAL{500};

    struct Connection {
        std::shared_ptr<Socket> socket;
        std::thread thread;
        std::shared_ptr<EventStream> events;  // set while serving /events
    };

    void do_accept();
    void spawn_connection(Socket socket);
    void serve(uint64_t id, const std::shared_ptr<Socket>& socket);
    void reap_finished();

    // Reads up to the blank line; nullopt on EOF, error or oversize
    std::optional<std::string> read_head(Socket& socket) const;
    bool send_response(Socket& socket, const HttpResponse& response, bool head_only) const;
    void stream_events(uint64_t id, const std::shared_ptr<Socket>& socket, const HttpResponse& response);

    std::string host_;
    uint16_t port_;
    backend::CatalogService& service_;
    Routes routes_;

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};

    std::mutex connections_mutex_;
    std::map<uint64_t, Connection> connections_;
    std::vector<uint64_t> finished_;
    uint64_t next_connection_id_ = 1;
};

}  // namespace lorchestre::server
