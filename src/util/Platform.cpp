#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <algorithm>
#include <unordered_map>

namespace lorchestre::util {

namespace {

const std::unordered_map<std::string, std::string>& mime_table() {
    static const std::unordered_map<std::string, std::string> table = {
        {".aac", "audio/aac"},
        {".aif", "audio/aiff"},
        {".aifc", "audio/aiff"},
        {".aiff", "audio/aiff"},
        {".ape", "audio/ape"},
        {".flac", "audio/flac"},
        {".m4a", "audio/m4a"},
        {".mid", "audio/midi"},
        {".midi", "audio/midi"},
        {".mka", "audio/x-matroska"},
        {".mp2", "audio/mpeg"},
        {".mp3", "audio/mpeg"},
        {".mpc", "audio/x-musepack"},
        {".oga", "audio/ogg"},
        {".ogg", "audio/ogg"},
        {".opus", "audio/opus"},
        {".spx", "audio/ogg"},
        {".wav", "audio/wav"},
        {".weba", "audio/webm"},
        {".wma", "audio/x-ms-wma"},
        {".wv", "audio/wavpack"},
        {".m3u", "audio/x-mpegurl"},
        {".m3u8", "application/vnd.apple.mpegurl"},
        {".lrc", "text/plain"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
    };
    return table;
}

}  // namespace

std::filesystem::path Platform::get_music_directory() {
    lorchestre::util::Logger::debug("Platform: Detecting music directory");
    auto home = std::getenv("HOME");
    if (home) {
        auto path = std::filesystem::path(home) / "MUSIC";
        if (std::filesystem::exists(path)) {
            lorchestre::util::Logger::info("Platform: Music directory found: " + path.string());
            return path;
        }
        path = std::filesystem::path(home) / "Music";
        lorchestre::util::Logger::info("Platform: Using default music directory: " + path.string());
        return path;
    }
    lorchestre::util::Logger::warn("Platform: HOME env var not set, using fallback: ./Music");
    return "./Music";
}

std::filesystem::path Platform::get_config_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "lorchestre";
    }
    lorchestre::util::Logger::warn("Platform: HOME env var not set, using fallback: .config/lorchestre");
    return ".config/lorchestre";
}

std::filesystem::path Platform::get_cache_directory() {
    const char* xdg_cache = std::getenv("XDG_CACHE_HOME");
    if (xdg_cache && *xdg_cache) {
        return std::filesystem::path(xdg_cache) / "lorchestre";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".cache" / "lorchestre";
    }
    lorchestre::util::Logger::warn("Platform: HOME env var not set, using fallback: /tmp/lorchestre_cache");
    return "/tmp/lorchestre_cache";
}

std::string Platform::lower_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

std::string Platform::guess_mime_type(const std::filesystem::path& path) {
    const auto& table = mime_table();
    auto it = table.find(lower_extension(path));
    if (it != table.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

bool Platform::is_audio_file(const std::filesystem::path& path) {
    return guess_mime_type(path).starts_with("audio/") && !is_playlist_file(path);
}

bool Platform::is_playlist_file(const std::filesystem::path& path) {
    auto ext = lower_extension(path);
    return ext == ".m3u" || ext == ".m3u8";
}

}  // namespace lorchestre::util
