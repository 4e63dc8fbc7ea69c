#include "../framework/SimpleTest.hpp"
#include "../framework/FakeMedia.hpp"
#include "../framework/TestFiles.hpp"
#include "backend/CatalogService.hpp"
#include "server/ByteRange.hpp"
#include "server/EventStream.hpp"
#include "server/Http.hpp"
#include "server/HttpServer.hpp"
#include "server/JsonCodec.hpp"
#include "server/Routes.hpp"
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

using namespace lorchestre::server;
using lorchestre::backend::CatalogService;
using lorchestre::test::FakeProbe;
using lorchestre::test::FakeTags;
using lorchestre::test::TempDir;

namespace {
    HttpRequest request(const std::string& method, const std::string& target,
                        std::map<std::string, std::string> headers = {}) {
        HttpRequest req;
        req.method = method;
        req.target = target;
        req.path = target.substr(0, target.find('?'));
        req.headers = std::move(headers);
        return req;
    }

    bool starts_with(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    bool contains(const std::string& s, const std::string& part) {
        return s.find(part) != std::string::npos;
    }

    // One audio file of ten bytes with an embedded cover, already rebuilt
    struct Fixture {
        TempDir music;
        TempDir cache;
        FakeTags fake;
        FakeProbe probe;
        std::unique_ptr<CatalogService> service;

        Fixture() {
            auto song = (music / "artist/album/01.mp3").string();
            lorchestre::test::write_file(song, "0123456789");
            fake.set(song, lorchestre::test::with_cover(lorchestre::test::tags("Song", "Artist", "Album", 1), "jpegdata"));
            service = std::make_unique<CatalogService>(music.path(), cache.path(), fake.reader(), probe.probe(), 2);
            service->rebuild();
        }

        lorchestre::model::Track track() const { return service->snapshot()->albums.at(0).tracks.at(0); }
    };

    std::string exchange(uint16_t port, const std::string& raw_request) {
        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        asio::write(socket, asio::buffer(raw_request));

        std::string out;
        char buffer[4096];
        asio::error_code ec;
        while (!ec) {
            size_t n = socket.read_some(asio::buffer(buffer), ec);
            out.append(buffer, n);
        }
        return out;
    }

    // Reads from socket into data until marker shows up
    bool read_until(asio::ip::tcp::socket& socket, std::string& data, const std::string& marker) {
        char buffer[4096];
        while (data.find(marker) == std::string::npos) {
            asio::error_code ec;
            size_t n = socket.read_some(asio::buffer(buffer), ec);
            if (ec) return false;
            data.append(buffer, n);
        }
        return true;
    }
}

// ---- ByteRange ----

TEST_CASE(test_range_absent_is_full) {
    auto r = ByteRange::parse(std::nullopt, 100);
    ASSERT_TRUE(r.kind == ByteRange::Kind::Full);
    ASSERT_EQ(r.first, 0u);
    ASSERT_EQ(r.last, 99u);
    ASSERT_EQ(r.length(), 100u);
}

TEST_CASE(test_range_closed) {
    auto r = ByteRange::parse("bytes=10-19", 100);
    ASSERT_TRUE(r.kind == ByteRange::Kind::Partial);
    ASSERT_EQ(r.first, 10u);
    ASSERT_EQ(r.last, 19u);
    ASSERT_EQ(r.length(), 10u);
}

TEST_CASE(test_range_end_is_clamped) {
    auto r = ByteRange::parse("bytes=90-500", 100);
    ASSERT_TRUE(r.kind == ByteRange::Kind::Partial);
    ASSERT_EQ(r.last, 99u);
    ASSERT_EQ(r.length(), 10u);
}

TEST_CASE(test_range_open_ended) {
    auto r = ByteRange::parse("bytes=40-", 100);
    ASSERT_TRUE(r.kind == ByteRange::Kind::Partial);
    ASSERT_EQ(r.first, 40u);
    ASSERT_EQ(r.last, 99u);
}

TEST_CASE(test_range_suffix) {
    auto r = ByteRange::parse("bytes=-30", 100);
    ASSERT_TRUE(r.kind == ByteRange::Kind::Partial);
    ASSERT_EQ(r.first, 70u);
    ASSERT_EQ(r.last, 99u);

    auto whole = ByteRange::parse("bytes=-500", 100);
    ASSERT_EQ(whole.first, 0u);
    ASSERT_EQ(whole.length(), 100u);
}

TEST_CASE(test_range_unsatisfiable) {
    ASSERT_TRUE(ByteRange::parse("bytes=100-", 100).kind == ByteRange::Kind::Unsatisfiable);
    ASSERT_TRUE(ByteRange::parse("bytes=250-300", 100).kind == ByteRange::Kind::Unsatisfiable);
    ASSERT_TRUE(ByteRange::parse("bytes=-0", 100).kind == ByteRange::Kind::Unsatisfiable);
    ASSERT_TRUE(ByteRange::parse("bytes=0-", 0).kind == ByteRange::Kind::Unsatisfiable);
}

TEST_CASE(test_range_ignored_forms) {
    ASSERT_TRUE(ByteRange::parse("bytes=0-1,5-6", 100).kind == ByteRange::Kind::Full);
    ASSERT_TRUE(ByteRange::parse("items=0-1", 100).kind == ByteRange::Kind::Full);
    ASSERT_TRUE(ByteRange::parse("bytes=abc", 100).kind == ByteRange::Kind::Full);
    ASSERT_TRUE(ByteRange::parse("bytes=9-3", 100).kind == ByteRange::Kind::Full);
}

// ---- HTTP framing ----

TEST_CASE(test_parse_request_head) {
    auto req = parse_request_head("GET /audio/abc?x=1 HTTP/1.1\r\nHost: localhost\r\nRange:  bytes=0-1 \r\n");
    ASSERT_TRUE(req.has_value());
    ASSERT_EQ(req->method, std::string("GET"));
    ASSERT_EQ(req->target, std::string("/audio/abc?x=1"));
    ASSERT_EQ(req->path, std::string("/audio/abc"));
    ASSERT_EQ(req->header("range"), std::optional<std::string>("bytes=0-1"));
    ASSERT_EQ(req->header("host"), std::optional<std::string>("localhost"));
    ASSERT_FALSE(req->header("accept").has_value());
}

TEST_CASE(test_parse_request_head_rejects_garbage) {
    ASSERT_FALSE(parse_request_head("GARBAGE").has_value());
    ASSERT_FALSE(parse_request_head("GET nopath HTTP/1.1\r\n").has_value());
    ASSERT_FALSE(parse_request_head("GET / SPDY/3\r\n").has_value());
    ASSERT_FALSE(parse_request_head("GET / HTTP/1.1\r\nno colon here\r\n").has_value());
}

TEST_CASE(test_serialize_head) {
    auto resp = HttpResponse::text(404, "abc");
    std::string head = serialize_head(resp);

    ASSERT_TRUE(starts_with(head, "HTTP/1.1 404 Not Found\r\n"));
    ASSERT_TRUE(contains(head, "Content-Type: text/plain; charset=utf-8\r\n"));
    ASSERT_TRUE(contains(head, "Content-Length: 3\r\n"));
    ASSERT_EQ(head.substr(head.size() - 4), std::string("\r\n\r\n"));
}

TEST_CASE(test_serialize_head_file_and_stream) {
    HttpResponse file_resp;
    file_resp.status = 206;
    file_resp.file = FileBody{"/x", 10, 42};
    ASSERT_TRUE(contains(serialize_head(file_resp), "Content-Length: 42\r\n"));

    HttpResponse stream;
    stream.event_stream = true;
    ASSERT_FALSE(contains(serialize_head(stream), "Content-Length"));
}

TEST_CASE(test_set_header_replaces_case_insensitively) {
    HttpResponse resp;
    resp.set_header("Content-Type", "a");
    resp.set_header("content-type", "b");
    ASSERT_EQ(resp.headers.size(), 1u);
    ASSERT_EQ(resp.header("CONTENT-TYPE"), std::optional<std::string>("b"));
}

// ---- JSON shape ----

TEST_CASE(test_track_json_keys) {
    lorchestre::model::Track t;
    t.id = "t1";
    t.artists = {"A", "B"};
    t.album_id = "al";
    t.file_path = "/m/x.mp3";
    t.color = lorchestre::model::Color{1, 2, 3};
    t.is_light = false;
    t.lyrics = {{1500, "hello"}};
    t.created_at = std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::seconds(1700000000) + std::chrono::nanoseconds(5000)));

    nlohmann::json j = t;
    ASSERT_EQ(j["id"], "t1");
    ASSERT_EQ(j["title"], "@UNKNOWN@");
    ASSERT_EQ(j["artists"].size(), 2u);
    ASSERT_EQ(j["track"], 0);
    ASSERT_TRUE(j["album_artist"].is_null());
    ASSERT_TRUE(j["album_year"].is_null());
    ASSERT_TRUE(j["cover_ext"].is_null());
    ASSERT_EQ(j["color"]["b"], 3);
    ASSERT_EQ(j["is_light"], false);
    ASSERT_EQ(j["lyrics"][0]["start_time"], 1500);
    ASSERT_EQ(j["lyrics"][0]["text"], "hello");
    ASSERT_EQ(j["file_path"], "/m/x.mp3");
    ASSERT_EQ(j["created_at"]["secs_since_epoch"], 1700000000);
    ASSERT_EQ(j["created_at"]["nanos_since_epoch"], 5000);
    ASSERT_TRUE(j.contains("duration"));
    ASSERT_TRUE(j.contains("bitrate"));
    ASSERT_TRUE(j.contains("mime"));
}

TEST_CASE(test_catalog_json_shape) {
    lorchestre::model::Catalog c;
    nlohmann::json j = c;
    ASSERT_TRUE(j["albums"].is_array());
    ASSERT_TRUE(j["playlists"].is_array());
    ASSERT_EQ(j.size(), 2u);
}

// ---- Routes ----

TEST_CASE(test_route_index) {
    Fixture fx;
    Routes routes(*fx.service);
    auto resp = routes.handle(request("GET", "/"));
    ASSERT_EQ(resp.status, 200);
    ASSERT_TRUE(starts_with(resp.body, "OK lorchestre v"));
    ASSERT_EQ(resp.header("Access-Control-Allow-Origin"), std::optional<std::string>("*"));
}

TEST_CASE(test_route_media) {
    Fixture fx;
    Routes routes(*fx.service);
    auto resp = routes.handle(request("GET", "/media"));
    ASSERT_EQ(resp.status, 200);
    ASSERT_EQ(resp.header("Content-Type"), std::optional<std::string>("application/json"));

    auto j = nlohmann::json::parse(resp.body);
    ASSERT_EQ(j["albums"].size(), 1u);
    ASSERT_EQ(j["albums"][0]["name"], "Album");
    ASSERT_EQ(j["albums"][0]["tracks"][0]["cover_ext"], ".jpg");
}

TEST_CASE(test_route_album) {
    Fixture fx;
    Routes routes(*fx.service);
    auto id = fx.track().album_id;

    auto found = routes.handle(request("GET", "/album/" + id));
    ASSERT_EQ(found.status, 200);
    ASSERT_EQ(nlohmann::json::parse(found.body)["id"], id);

    auto missing = routes.handle(request("GET", "/album/nope"));
    ASSERT_EQ(missing.status, 404);
    ASSERT_EQ(missing.body, std::string("no album found with the id of nope"));
}

TEST_CASE(test_route_audio_full) {
    Fixture fx;
    Routes routes(*fx.service);
    auto resp = routes.handle(request("GET", "/audio/" + fx.track().id));

    ASSERT_EQ(resp.status, 200);
    ASSERT_EQ(resp.header("Accept-Ranges"), std::optional<std::string>("bytes"));
    ASSERT_EQ(resp.header("Content-Type"), std::optional<std::string>("audio/mpeg"));
    ASSERT_TRUE(resp.file.has_value());
    ASSERT_EQ(resp.file->offset, 0u);
    ASSERT_EQ(resp.file->length, 10u);
}

TEST_CASE(test_route_audio_partial) {
    Fixture fx;
    Routes routes(*fx.service);
    auto resp = routes.handle(request("GET", "/audio/" + fx.track().id, {{"range", "bytes=2-5"}}));

    ASSERT_EQ(resp.status, 206);
    ASSERT_EQ(resp.header("Content-Range"), std::optional<std::string>("bytes 2-5/10"));
    ASSERT_EQ(resp.file->offset, 2u);
    ASSERT_EQ(resp.file->length, 4u);
    ASSERT_EQ(resp.content_length(), 4u);
}

TEST_CASE(test_route_audio_unsatisfiable) {
    Fixture fx;
    Routes routes(*fx.service);
    auto resp = routes.handle(request("GET", "/audio/" + fx.track().id, {{"range", "bytes=20-"}}));

    ASSERT_EQ(resp.status, 416);
    ASSERT_EQ(resp.header("Content-Range"), std::optional<std::string>("bytes */10"));
    ASSERT_FALSE(resp.file.has_value());
}

TEST_CASE(test_route_audio_unknown) {
    Fixture fx;
    Routes routes(*fx.service);
    auto resp = routes.handle(request("GET", "/audio/nope"));
    ASSERT_EQ(resp.status, 404);
    ASSERT_EQ(resp.body, std::string("no song found with the id of nope"));
}

TEST_CASE(test_route_cover) {
    Fixture fx;
    Routes routes(*fx.service);
    auto handle = fx.track().album_id + ".jpg";

    auto resp = routes.handle(request("GET", "/cover/" + handle));
    ASSERT_EQ(resp.status, 200);
    ASSERT_EQ(resp.header("Content-Type"), std::optional<std::string>("image/jpeg"));
    ASSERT_EQ(resp.header("Cache-Control"), std::optional<std::string>("public, max-age=2419200, immutable"));
    ASSERT_EQ(resp.file->length, 8u);

    auto missing = routes.handle(request("GET", "/cover/nothing.jpg"));
    ASSERT_EQ(missing.status, 404);
    ASSERT_EQ(missing.body, std::string("no cover found for nothing.jpg"));

    ASSERT_EQ(routes.handle(request("GET", "/cover/" + handle + ".color")).status, 404);
}

TEST_CASE(test_route_update_music) {
    Fixture fx;
    Routes routes(*fx.service);
    auto resp = routes.handle(request("PUT", "/updatemusic"));
    ASSERT_EQ(resp.status, 200);

    auto j = nlohmann::json::parse(resp.body);
    ASSERT_EQ(j["albums"], 1);
    ASSERT_EQ(j["tracks"], 1);
    ASSERT_EQ(j["reused_cache"], true);
    ASSERT_EQ(j["seq"], 2);
}

TEST_CASE(test_route_events_and_misc) {
    Fixture fx;
    Routes routes(*fx.service);

    auto events = routes.handle(request("GET", "/events"));
    ASSERT_TRUE(events.event_stream);
    ASSERT_EQ(events.header("Content-Type"), std::optional<std::string>("text/event-stream"));

    auto options = routes.handle(request("OPTIONS", "/media"));
    ASSERT_EQ(options.status, 204);
    ASSERT_EQ(options.header("Access-Control-Allow-Origin"), std::optional<std::string>("*"));

    ASSERT_EQ(routes.handle(request("GET", "/nowhere")).status, 404);
    ASSERT_EQ(routes.handle(request("POST", "/media")).status, 405);
    ASSERT_EQ(routes.handle(request("GET", "/updatemusic")).status, 404);
}

TEST_CASE(test_newmedia_event_frame) {
    Fixture fx;
    std::string frame = Routes::newmedia_event(*fx.service->snapshot());

    ASSERT_TRUE(starts_with(frame, "event: newmedia\ndata: "));
    ASSERT_EQ(frame.substr(frame.size() - 2), std::string("\n\n"));
    auto payload = frame.substr(22, frame.size() - 24);
    ASSERT_EQ(nlohmann::json::parse(payload)["albums"].size(), 1u);
}

// ---- EventStream ----

TEST_CASE(test_event_stream_delivers_in_order) {
    EventStream stream(4);
    ASSERT_TRUE(stream.push("a"));
    ASSERT_TRUE(stream.push("b"));
    ASSERT_EQ(stream.pending(), 2u);

    auto frames = stream.wait(std::chrono::milliseconds(0));
    ASSERT_EQ(frames.size(), 2u);
    ASSERT_EQ(frames[0], std::string("a"));
    ASSERT_EQ(frames[1], std::string("b"));
    ASSERT_EQ(stream.pending(), 0u);
    ASSERT_TRUE(stream.wait(std::chrono::milliseconds(10)).empty());
    ASSERT_FALSE(stream.closed());
}

TEST_CASE(test_event_stream_closes_when_client_falls_behind) {
    EventStream stream(2);
    ASSERT_TRUE(stream.push("1"));
    ASSERT_TRUE(stream.push("2"));
    ASSERT_FALSE(stream.push("3"));
    ASSERT_TRUE(stream.closed());
    ASSERT_EQ(stream.pending(), 0u);
    ASSERT_FALSE(stream.push("4"));
    ASSERT_TRUE(stream.wait(std::chrono::milliseconds(0)).empty());
}

TEST_CASE(test_event_stream_close_wakes_waiter) {
    EventStream stream;
    auto start = std::chrono::steady_clock::now();
    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stream.close();
    });
    auto frames = stream.wait(std::chrono::seconds(30));
    closer.join();

    ASSERT_TRUE(frames.empty());
    ASSERT_TRUE(stream.closed());
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

// ---- HttpServer over loopback ----

TEST_CASE(test_server_serves_requests) {
    Fixture fx;
    HttpServer server("127.0.0.1", 0, *fx.service);
    server.start();
    ASSERT_TRUE(server.port() != 0);

    std::string index = exchange(server.port(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    ASSERT_TRUE(starts_with(index, "HTTP/1.1 200 OK\r\n"));
    ASSERT_TRUE(contains(index, "\r\n\r\nOK lorchestre v"));

    std::string partial = exchange(server.port(),
                                   "GET /audio/" + fx.track().id + " HTTP/1.1\r\nRange: bytes=3-6\r\n\r\n");
    ASSERT_TRUE(starts_with(partial, "HTTP/1.1 206 Partial Content\r\n"));
    ASSERT_EQ(partial.substr(partial.size() - 4), std::string("3456"));

    std::string head = exchange(server.port(), "HEAD /audio/" + fx.track().id + " HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(contains(head, "Content-Length: 10\r\n"));
    ASSERT_EQ(head.substr(head.size() - 4), std::string("\r\n\r\n"));

    std::string bad = exchange(server.port(), "NONSENSE\r\n\r\n");
    ASSERT_TRUE(starts_with(bad, "HTTP/1.1 400 Bad Request\r\n"));

    server.stop();
}

TEST_CASE(test_server_pushes_newmedia_events) {
    Fixture fx;
    HttpServer server("127.0.0.1", 0, *fx.service);
    server.start();

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server.port()));
    asio::write(socket, asio::buffer(std::string("GET /events HTTP/1.1\r\n\r\n")));

    std::string data;
    ASSERT_TRUE(read_until(socket, data, ": connected\n\n"));
    ASSERT_TRUE(contains(data, "Content-Type: text/event-stream\r\n"));

    fx.service->rebuild();
    ASSERT_TRUE(read_until(socket, data, "event: newmedia\ndata: "));

    asio::error_code ec;
    socket.close(ec);
    server.stop();
}

TEST_CASE(test_server_drops_event_client_that_hangs_up) {
    Fixture fx;
    HttpServer server("127.0.0.1", 0, *fx.service);
    server.start();
    ASSERT_EQ(fx.service->subscriber_count(), 0u);

    {
        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server.port()));
        asio::write(socket, asio::buffer(std::string("GET /events HTTP/1.1\r\n\r\n")));
        std::string data;
        ASSERT_TRUE(read_until(socket, data, ": connected\n\n"));
        ASSERT_EQ(fx.service->subscriber_count(), 1u);
    }

    // Noticed without any update being published
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (fx.service->subscriber_count() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_EQ(fx.service->subscriber_count(), 0u);
    ASSERT_EQ(fx.service->rebuild().seq, 2u);

    server.stop();
}

int main() {
    return lorchestre::test::TestRunner::instance().run_all();
}
