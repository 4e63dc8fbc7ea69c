#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lorchestre::server {

struct HttpRequest {
    std::string method;
    std::string target;  // As sent, including any query
    std::string path;    // target without the query string
    std::map<std::string, std::string> headers;  // Lowercased names

    [[nodiscard]] std::optional<std::string> header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

// Body bytes are streamed from this file region instead of HttpResponse::body
struct FileBody {
    std::string path;
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::optional<FileBody> file;
    bool event_stream = false;  // Connection turns into a Server-Sent Events channel

    [[nodiscard]] static HttpResponse text(int status, std::string body);
    [[nodiscard]] static HttpResponse json(int status, std::string body);

    void set_header(std::string name, std::string value);
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    [[nodiscard]] uint64_t content_length() const;
};

[[nodiscard]] std::string_view reason_phrase(int status);

// "GET /x HTTP/1.1\r\nHost: a\r\n..." up to (not including) the blank line
[[nodiscard]] std::optional<HttpRequest> parse_request_head(std::string_view head);

// Status line and headers, terminated by the blank line. Content-Length is
// added unless the response is an event stream.
[[nodiscard]] std::string serialize_head(const HttpResponse& response);

}  // namespace lorchestre::server
