#include "util/LrcParser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace lorchestre::util {

namespace {
    bool is_digit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    int64_t parse_number(std::string_view digits, std::string_view stamp) {
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(), is_digit)) {
            throw LrcParseError("invalid timestamp [" + std::string(stamp) + "]");
        }
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc{}) {
            throw LrcParseError("timestamp out of range [" + std::string(stamp) + "]");
        }
        return value;
    }

    void strip_cr(std::string_view& line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
    }
}

int64_t LrcParser::parse_timestamp(std::string_view stamp) {
    size_t colon = stamp.find(':');
    if (colon == std::string_view::npos) {
        throw LrcParseError("missing ':' in timestamp [" + std::string(stamp) + "]");
    }

    std::string_view minutes = stamp.substr(0, colon);
    std::string_view rest = stamp.substr(colon + 1);
    std::string_view seconds = rest;
    std::string_view fraction;

    size_t sep = rest.find_first_of(".:");
    if (sep != std::string_view::npos) {
        seconds = rest.substr(0, sep);
        fraction = rest.substr(sep + 1);
        if (fraction.empty() || fraction.size() > 3) {
            throw LrcParseError("invalid fraction in timestamp [" + std::string(stamp) + "]");
        }
    }

    int64_t mm = parse_number(minutes, stamp);
    int64_t ss = parse_number(seconds, stamp);
    if (ss >= 60) {
        throw LrcParseError("seconds out of range in timestamp [" + std::string(stamp) + "]");
    }

    int64_t ms = 0;
    if (!fraction.empty()) {
        ms = parse_number(fraction, stamp);
        // ".5" is 500 ms, ".05" is 50 ms, ".005" is 5 ms
        for (size_t i = fraction.size(); i < 3; ++i) {
            ms *= 10;
        }
    }

    return (mm * 60 + ss) * 1000 + ms;
}

std::vector<model::LyricLine> LrcParser::parse(std::string_view text) {
    std::vector<model::LyricLine> lines;

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(pos, end - pos);
        pos = end + 1;
        strip_cr(line);

        std::vector<int64_t> stamps;
        while (line.size() >= 2 && line.front() == '[' && is_digit(line[1])) {
            size_t close = line.find(']');
            if (close == std::string_view::npos) {
                throw LrcParseError("unterminated timestamp in line: " + std::string(line));
            }
            stamps.push_back(parse_timestamp(line.substr(1, close - 1)));
            line.remove_prefix(close + 1);
        }

        for (int64_t start : stamps) {
            lines.push_back(model::LyricLine{start, std::string(line)});
        }
    }

    std::stable_sort(lines.begin(), lines.end(),
                     [](const model::LyricLine& a, const model::LyricLine& b) {
                         return a.start_time_ms < b.start_time_ms;
                     });
    return lines;
}

std::string LrcParser::strip_untimed_lines(std::string_view text) {
    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(pos, end - pos);
        pos = end + 1;
        strip_cr(line);

        if (line.size() >= 2 && line[0] == '[' && is_digit(line[1])) {
            if (!out.empty()) out += '\n';
            out.append(line);
        }
    }
    return out;
}

}  // namespace lorchestre::util
