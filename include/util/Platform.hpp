#pragma once

#include <filesystem>
#include <string>

namespace lorchestre::util {

class Platform {
public:
    static std::filesystem::path get_music_directory();
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_cache_directory();

    // MIME type guessed from the extension, "application/octet-stream" if unknown
    static std::string guess_mime_type(const std::filesystem::path& path);

    // Guessed MIME type falls under audio/*
    static bool is_audio_file(const std::filesystem::path& path);

    // .m3u or .m3u8
    static bool is_playlist_file(const std::filesystem::path& path);

    // Lowercased extension including the dot
    static std::string lower_extension(const std::filesystem::path& path);
};

}  // namespace lorchestre::util
