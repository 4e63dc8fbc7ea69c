#include "server/Routes.hpp"
#include "server/ByteRange.hpp"
#include "server/JsonCodec.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <filesystem>

namespace lorchestre::server {

namespace {
    constexpr std::string_view VERSION = LORCHESTRE_VERSION;
    constexpr std::string_view COVER_CACHE_CONTROL = "public, max-age=2419200, immutable";

    // "/album/abc" with prefix "/album/" -> "abc"; empty when it does not match
    std::string tail_after(const std::string& path, std::string_view prefix) {
        if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
            return "";
        }
        std::string tail = path.substr(prefix.size());
        if (tail.find('/') != std::string::npos) return "";
        return tail;
    }
}

Routes::Routes(backend::CatalogService& service) : service_(service) {}

void Routes::apply_cors(HttpResponse& response) {
    response.set_header("Access-Control-Allow-Origin", "*");
}

std::string Routes::newmedia_event(const model::Catalog& catalog) {
    return "event: newmedia\ndata: " + nlohmann::json(catalog).dump() + "\n\n";
}

HttpResponse Routes::handle(const HttpRequest& request) {
    HttpResponse response;
    const std::string& path = request.path;

    if (request.method == "OPTIONS") {
        response.status = 204;
        response.set_header("Access-Control-Allow-Methods", "GET, PUT, OPTIONS");
        response.set_header("Access-Control-Allow-Headers", "*");
    } else if (request.method == "GET" || request.method == "HEAD") {
        if (path == "/") {
            response = index();
        } else if (path == "/media") {
            response = media();
        } else if (path == "/events") {
            response = events();
        } else if (auto id = tail_after(path, "/album/"); !id.empty()) {
            response = album(id);
        } else if (auto id = tail_after(path, "/audio/"); !id.empty()) {
            response = audio(id, request);
        } else if (auto handle = tail_after(path, "/cover/"); !handle.empty()) {
            response = cover(handle);
        } else {
            response = HttpResponse::text(404, "not found");
        }
    } else if (request.method == "PUT" && path == "/updatemusic") {
        response = update_music();
    } else {
        response = HttpResponse::text(405, "method not allowed");
    }

    apply_cors(response);
    return response;
}

HttpResponse Routes::index() const {
    return HttpResponse::text(200, "OK lorchestre v" + std::string(VERSION));
}

HttpResponse Routes::media() const {
    auto snapshot = service_.snapshot();
    return HttpResponse::json(200, nlohmann::json(*snapshot).dump());
}

HttpResponse Routes::album(const std::string& id) const {
    auto found = service_.find_album(id);
    if (!found) {
        return HttpResponse::text(404, "no album found with the id of " + id);
    }
    return HttpResponse::json(200, nlohmann::json(*found).dump());
}

HttpResponse Routes::audio(const std::string& id, const HttpRequest& request) const {
    auto track = service_.find_track(id);
    if (!track) {
        return HttpResponse::text(404, "no song found with the id of " + id);
    }

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(track->file_path, ec);
    if (ec) {
        util::Logger::warn("Routes: Audio file vanished: " + track->file_path + " (" + ec.message() + ")");
        return HttpResponse::text(404, "no song found with the id of " + id);
    }

    auto range_header = request.header("range");
    ByteRange range = ByteRange::parse(range_header ? std::optional<std::string_view>(*range_header)
                                                    : std::nullopt,
                                       size);

    HttpResponse response;
    response.set_header("Accept-Ranges", "bytes");

    if (range.kind == ByteRange::Kind::Unsatisfiable) {
        response.status = 416;
        response.set_header("Content-Range", "bytes */" + std::to_string(size));
        return response;
    }

    response.set_header("Content-Type", track->mime);
    if (range.kind == ByteRange::Kind::Partial) {
        response.status = 206;
        response.set_header("Content-Range", "bytes " + std::to_string(range.first) + "-" +
                                                 std::to_string(range.last) + "/" + std::to_string(size));
        response.file = FileBody{track->file_path, range.first, range.length()};
    } else {
        response.status = 200;
        response.file = FileBody{track->file_path, 0, size};
    }
    return response;
}

HttpResponse Routes::cover(const std::string& handle) const {
    auto path = service_.covers().find(handle);
    if (!path) {
        return HttpResponse::text(404, "no cover found for " + handle);
    }

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(*path, ec);
    if (ec) {
        return HttpResponse::text(404, "no cover found for " + handle);
    }

    HttpResponse response;
    response.status = 200;
    response.set_header("Content-Type", util::Platform::guess_mime_type(*path));
    response.set_header("Cache-Control", std::string(COVER_CACHE_CONTROL));
    response.file = FileBody{path->string(), 0, size};
    return response;
}

HttpResponse Routes::update_music() {
    try {
        backend::RebuildReport report = service_.rebuild();
        return HttpResponse::json(200, nlohmann::json(report).dump());
    } catch (const std::exception& e) {
        util::Logger::error("Routes: Rebuild failed: " + std::string(e.what()));
        return HttpResponse::text(500, std::string("rebuild failed: ") + e.what());
    }
}

HttpResponse Routes::events() const {
    HttpResponse response;
    response.status = 200;
    response.event_stream = true;
    response.set_header("Content-Type", "text/event-stream");
    response.set_header("Cache-Control", "no-cache");
    response.set_header("Connection", "keep-alive");
    return response;
}

}  // namespace lorchestre::server
