#include "server/HttpServer.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sys/socket.h>

namespace lorchestre::server {

namespace {
    // Event stream clients never send; a zero-length peek means they hung up
    bool peer_closed(asio::ip::tcp::socket& socket) {
        char byte;
        ssize_t n = ::recv(socket.native_handle(), &byte, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n == 0) return true;
        return n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
    }
}

HttpServer::HttpServer(std::string host, uint16_t port, backend::CatalogService& service)
    : host_(std::move(host)), port_(port), service_(service), routes_(service), acceptor_(io_) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    asio::ip::tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(host_, std::to_string(port_));
    asio::ip::tcp::endpoint endpoint = endpoints.begin()->endpoint();

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    running_ = true;
    do_accept();
    accept_thread_ = std::thread([this]() {
        asio::error_code ec;
        io_.run(ec);
        if (ec) {
            util::Logger::error("HttpServer: Accept loop stopped: " + ec.message());
        }
    });

    util::Logger::info("HttpServer: Listening on " + endpoint.address().to_string() + ":" +
                       std::to_string(port_));
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    util::Logger::info("HttpServer: Stopping");

    asio::post(io_, [this]() {
        asio::error_code ec;
        acceptor_.close(ec);
    });
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // Wake every blocked read, then join
    std::map<uint64_t, Connection> remaining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        remaining.swap(connections_);
        finished_.clear();
    }
    for (auto& [id, conn] : remaining) {
        if (conn.events) {
            conn.events->close();
        }
        asio::error_code ec;
        conn.socket->shutdown(Socket::shutdown_both, ec);
    }
    for (auto& [id, conn] : remaining) {
        if (conn.thread.joinable()) {
            conn.thread.join();
        }
    }
}

uint16_t HttpServer::port() const {
    return port_;
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, Socket socket) {
        if (!acceptor_.is_open()) {
            return;
        }
        if (ec) {
            util::Logger::warn("HttpServer: Accept failed: " + ec.message());
        } else {
            spawn_connection(std::move(socket));
        }
        do_accept();
    });
}

void HttpServer::spawn_connection(Socket socket) {
    reap_finished();

    auto shared = std::make_shared<Socket>(std::move(socket));
    std::lock_guard<std::mutex> lock(connections_mutex_);
    uint64_t id = next_connection_id_++;
    Connection& conn = connections_[id];
    conn.socket = shared;
    conn.thread = std::thread([this, id, shared]() { serve(id, shared); });
}

void HttpServer::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (uint64_t id : finished_) {
            auto it = connections_.find(id);
            if (it != connections_.end()) {
                done.push_back(std::move(it->second.thread));
                connections_.erase(it);
            }
        }
        finished_.clear();
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

void HttpServer::serve(uint64_t id, const std::shared_ptr<Socket>& socket) {
    if (auto head = read_head(*socket)) {
        HttpResponse response;
        std::optional<HttpRequest> request = parse_request_head(*head);
        if (!request) {
            response = HttpResponse::text(400, "bad request");
            Routes::apply_cors(response);
        } else {
            util::Logger::debug("HttpServer: " + request->method + " " + request->target);
            response = routes_.handle(*request);
        }

        if (response.event_stream) {
            stream_events(id, socket, response);
        } else {
            response.set_header("Connection", "close");
            send_response(*socket, response, request && request->method == "HEAD");
        }
    }

    asio::error_code ec;
    socket->shutdown(Socket::shutdown_both, ec);
    socket->close(ec);

    std::lock_guard<std::mutex> lock(connections_mutex_);
    finished_.push_back(id);
}

std::optional<std::string> HttpServer::read_head(Socket& socket) const {
    std::string data;
    char buffer[4096];
    while (true) {
        size_t end = data.find("\r\n\r\n");
        if (end != std::string::npos) {
            data.resize(end + 2);
            return data;
        }
        if (data.size() > MAX_HEAD_SIZE) {
            util::Logger::warn("HttpServer: Request head too large, dropping connection");
            return std::nullopt;
        }

        asio::error_code ec;
        size_t n = socket.read_some(asio::buffer(buffer), ec);
        if (ec) {
            if (ec != asio::error::eof) {
                util::Logger::debug("HttpServer: Read failed: " + ec.message());
            }
            return std::nullopt;
        }
        data.append(buffer, n);
    }
}

bool HttpServer::send_response(Socket& socket, const HttpResponse& response, bool head_only) const {
    asio::error_code ec;
    std::string head = serialize_head(response);
    asio::write(socket, asio::buffer(head), ec);
    if (ec) {
        util::Logger::debug("HttpServer: Write failed: " + ec.message());
        return false;
    }
    if (head_only) {
        return true;
    }

    if (!response.file) {
        asio::write(socket, asio::buffer(response.body), ec);
        return !ec;
    }

    const FileBody& body = *response.file;
    std::ifstream in(body.path, std::ios::binary);
    if (!in) {
        util::Logger::warn("HttpServer: Cannot open " + body.path);
        return false;
    }
    in.seekg(static_cast<std::streamoff>(body.offset));

    std::vector<char> chunk(FILE_CHUNK_SIZE);
    uint64_t remaining = body.length;
    while (remaining > 0 && in) {
        auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, chunk.size()));
        in.read(chunk.data(), want);
        std::streamsize got = in.gcount();
        if (got <= 0) break;

        asio::write(socket, asio::buffer(chunk.data(), static_cast<size_t>(got)), ec);
        if (ec) {
            // Players drop the connection when seeking; not an error
            util::Logger::debug("HttpServer: Client closed during transfer: " + ec.message());
            return false;
        }
        remaining -= static_cast<uint64_t>(got);
    }
    if (remaining > 0) {
        util::Logger::warn("HttpServer: Short read on " + body.path);
        return false;
    }
    return true;
}

void HttpServer::stream_events(uint64_t id, const std::shared_ptr<Socket>& socket,
                               const HttpResponse& response) {
    auto stream = std::make_shared<EventStream>();
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;  // stop() already took this connection
        }
        it->second.events = stream;
    }

    // Subscribed before the preamble goes out: a client that has read
    // ": connected" sees every later update
    auto listener = service_.subscribe([stream, socket](const std::shared_ptr<const model::Catalog>& catalog) {
        if (stream->push(Routes::newmedia_event(*catalog))) {
            return true;
        }
        // The connection thread may be stuck in a write to this client
        asio::error_code ec;
        socket->shutdown(Socket::shutdown_both, ec);
        return false;
    });

    asio::error_code ec;
    std::string head = serialize_head(response) + ": connected\n\n";
    asio::write(*socket, asio::buffer(head), ec);
    if (!ec) {
        util::Logger::info("HttpServer: Event stream opened (listener " + std::to_string(listener) + ")");
    }

    while (!ec && !stream->closed()) {
        auto frames = stream->wait(PEER_CHECK_INTERVAL);
        if (frames.empty()) {
            if (peer_closed(*socket)) break;
            continue;
        }
        for (const auto& frame : frames) {
            asio::write(*socket, asio::buffer(frame), ec);
            if (ec) break;
        }
    }

    stream->close();
    service_.unsubscribe(listener);
    util::Logger::info("HttpServer: Event stream closed (listener " + std::to_string(listener) + ")");
}

}  // namespace lorchestre::server
