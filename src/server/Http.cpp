#include "server/Http.hpp"
#include <algorithm>
#include <cctype>

namespace lorchestre::server {

namespace {
    std::string_view trim(std::string_view str) {
        size_t first = str.find_first_not_of(" \t");
        if (first == std::string_view::npos) return {};
        size_t last = str.find_last_not_of(" \t");
        return str.substr(first, last - first + 1);
    }

    std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    bool iequals(std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }
}

HttpResponse HttpResponse::text(int status, std::string body) {
    HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    r.set_header("Content-Type", "text/plain; charset=utf-8");
    return r;
}

HttpResponse HttpResponse::json(int status, std::string body) {
    HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    r.set_header("Content-Type", "application/json");
    return r;
}

void HttpResponse::set_header(std::string name, std::string value) {
    for (auto& [n, v] : headers) {
        if (iequals(n, name)) {
            v = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    for (const auto& [n, v] : headers) {
        if (iequals(n, name)) return v;
    }
    return std::nullopt;
}

uint64_t HttpResponse::content_length() const {
    return file ? file->length : body.size();
}

std::string_view reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 416: return "Range Not Satisfiable";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

std::optional<HttpRequest> parse_request_head(std::string_view head) {
    HttpRequest req;

    size_t line_end = head.find("\r\n");
    std::string_view request_line = head.substr(0, line_end);

    size_t sp1 = request_line.find(' ');
    if (sp1 == std::string_view::npos) return std::nullopt;
    size_t sp2 = request_line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos) return std::nullopt;

    req.method = std::string(request_line.substr(0, sp1));
    req.target = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
    std::string_view version = request_line.substr(sp2 + 1);
    if (req.method.empty() || req.target.empty() || req.target.front() != '/' ||
        version.substr(0, 5) != "HTTP/") {
        return std::nullopt;
    }
    req.path = req.target.substr(0, req.target.find('?'));

    size_t pos = line_end == std::string_view::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t end = head.find("\r\n", pos);
        if (end == std::string_view::npos) end = head.size();
        std::string_view line = head.substr(pos, end - pos);
        pos = end + 2;
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) return std::nullopt;
        req.headers[to_lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    }
    return req;
}

std::string serialize_head(const HttpResponse& response) {
    std::string out = "HTTP/1.1 " + std::to_string(response.status) + " " +
                      std::string(reason_phrase(response.status)) + "\r\n";
    for (const auto& [name, value] : response.headers) {
        out += name + ": " + value + "\r\n";
    }
    if (!response.event_stream && !response.header("Content-Length")) {
        out += "Content-Length: " + std::to_string(response.content_length()) + "\r\n";
    }
    out += "\r\n";
    return out;
}

}  // namespace lorchestre::server
