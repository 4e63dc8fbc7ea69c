#pragma once

#include "backend/CatalogService.hpp"
#include "server/Http.hpp"
#include <string>

namespace lorchestre::server {

/**
 * Request dispatch for the daemon's HTTP surface. Handlers only read the
 * published catalog, except PUT /updatemusic which runs a rebuild.
 *
 *   GET  /                 liveness text
 *   GET  /media            whole catalog
 *   GET  /album/{id}       one album
 *   GET  /audio/{id}       audio bytes, Range aware
 *   GET  /cover/{handle}   cached cover image
 *   PUT  /updatemusic      rebuild, returns the report
 *   GET  /events           Server-Sent Events, handed back to the server
 */
class Routes {
public:
    explicit Routes(backend::CatalogService& service);

    [[nodiscard]] HttpResponse handle(const HttpRequest& request);

    // Adds the permissive CORS headers every response carries
    static void apply_cors(HttpResponse& response);

    // SSE frame for one published catalog
    [[nodiscard]] static std::string newmedia_event(const model::Catalog& catalog);

private:
    HttpResponse index() const;
    HttpResponse media() const;
    HttpResponse album(const std::string& id) const;
    HttpResponse audio(const std::string& id, const HttpRequest& request) const;
    HttpResponse cover(const std::string& handle) const;
    HttpResponse update_music();
    HttpResponse events() const;

    backend::CatalogService& service_;
};

}  // namespace lorchestre::server
