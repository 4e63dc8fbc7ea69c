#include "server/ByteRange.hpp"
#include <algorithm>
#include <charconv>

namespace lorchestre::server {

namespace {
    std::string_view trim(std::string_view str) {
        size_t first = str.find_first_not_of(" \t");
        if (first == std::string_view::npos) return {};
        size_t last = str.find_last_not_of(" \t");
        return str.substr(first, last - first + 1);
    }

    std::optional<uint64_t> parse_u64(std::string_view s) {
        if (s.empty()) return std::nullopt;
        uint64_t v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
        return v;
    }

    ByteRange full(uint64_t file_size) {
        ByteRange r;
        r.kind = ByteRange::Kind::Full;
        r.first = 0;
        r.last = file_size ? file_size - 1 : 0;
        return r;
    }
}

ByteRange ByteRange::parse(std::optional<std::string_view> header, uint64_t file_size) {
    if (!header) return full(file_size);

    std::string_view value = trim(*header);
    constexpr std::string_view unit = "bytes=";
    if (value.substr(0, unit.size()) != unit) return full(file_size);
    value = trim(value.substr(unit.size()));
    if (value.find(',') != std::string_view::npos) return full(file_size);

    size_t dash = value.find('-');
    if (dash == std::string_view::npos) return full(file_size);

    std::string_view first_s = trim(value.substr(0, dash));
    std::string_view last_s = trim(value.substr(dash + 1));

    ByteRange r;
    r.kind = Kind::Partial;

    if (first_s.empty()) {
        // Suffix range
        auto n = parse_u64(last_s);
        if (!n) return full(file_size);
        if (*n == 0 || file_size == 0) {
            r.kind = Kind::Unsatisfiable;
            return r;
        }
        uint64_t count = std::min(*n, file_size);
        r.first = file_size - count;
        r.last = file_size - 1;
        return r;
    }

    auto first = parse_u64(first_s);
    if (!first) return full(file_size);

    if (*first >= file_size) {
        r.kind = Kind::Unsatisfiable;
        return r;
    }
    r.first = *first;

    if (last_s.empty()) {
        r.last = file_size - 1;
        return r;
    }

    auto last = parse_u64(last_s);
    if (!last || *last < *first) return full(file_size);
    r.last = std::min(*last, file_size - 1);
    return r;
}

}  // namespace lorchestre::server
