#include "backend/PlaylistParser.hpp"
#include "backend/TrackExtractor.hpp"
#include "util/Logger.hpp"
#include <fstream>
#include <sstream>

namespace lorchestre::backend {

namespace fs = std::filesystem;

namespace {
    std::string_view trim(std::string_view str) {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) return {};
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    bool starts_with(std::string_view s, std::string_view prefix) {
        return s.substr(0, prefix.size()) == prefix;
    }

    // "#EXTINF:215,Artist - Title" -> "Artist - Title"
    std::optional<std::string> extinf_title(std::string_view line) {
        size_t comma = line.find(',');
        if (comma == std::string_view::npos) return std::nullopt;
        std::string_view title = trim(line.substr(comma + 1));
        if (title.empty()) return std::nullopt;
        return std::string(title);
    }
}

PlaylistParser::PlaylistParser(TrackExtractor& extractor) : extractor_(extractor) {}

model::Playlist PlaylistParser::parse(const std::string& path) const {
    PlaylistFile file = read(path);

    model::Playlist playlist;
    playlist.name = std::move(file.name);
    playlist.path = path;
    playlist.tracks.reserve(file.entries.size());

    for (const auto& entry : file.entries) {
        try {
            model::Track track = extractor_.extract(entry.path);
            if (track.title == model::UNKNOWN && entry.title) {
                track.title = *entry.title;
            }
            playlist.tracks.push_back(std::move(track));
        } catch (const std::exception& e) {
            util::Logger::warn("PlaylistParser: Skipping entry of " + path + ": " + e.what());
        }
    }

    util::Logger::debug("PlaylistParser: " + playlist.name + " has " +
                        std::to_string(playlist.tracks.size()) + " of " +
                        std::to_string(file.entries.size()) + " entries");
    return playlist;
}

PlaylistFile PlaylistParser::read(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PlaylistReadError("cannot open playlist " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw PlaylistReadError("read error on playlist " + path);
    }

    fs::path p(path);
    return parse_text(buffer.str(), p.parent_path(), p.stem().string());
}

PlaylistFile PlaylistParser::parse_text(std::string_view text, const fs::path& base_dir,
                                        std::string fallback_name) {
    PlaylistFile file;
    std::optional<std::string> pending_title;

    // UTF-8 byte order mark
    if (starts_with(text, "\xEF\xBB\xBF")) {
        text.remove_prefix(3);
    }

    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = trim(text.substr(pos, end - pos));
        pos = end + 1;

        if (line.empty()) continue;

        if (line.front() == '#') {
            if (starts_with(line, "#PLAYLIST:")) {
                std::string_view name = trim(line.substr(10));
                if (!name.empty()) file.name = std::string(name);
            } else if (starts_with(line, "#EXTINF:")) {
                pending_title = extinf_title(line);
            }
            continue;
        }

        std::string_view location = line;
        if (starts_with(location, "file://")) {
            location.remove_prefix(7);
        } else if (location.find("://") != std::string_view::npos) {
            util::Logger::debug("PlaylistParser: Ignoring remote entry " + std::string(location));
            pending_title.reset();
            continue;
        }

        fs::path entry(location);
        if (entry.is_relative()) {
            entry = base_dir / entry;
        }
        file.entries.push_back(PlaylistEntry{entry.lexically_normal().string(), std::move(pending_title)});
        pending_title.reset();
    }

    if (file.name.empty()) {
        file.name = std::move(fallback_name);
    }
    return file;
}

}  // namespace lorchestre::backend
