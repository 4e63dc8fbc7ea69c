#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lorchestre::backend {

// Raised when a file cannot be opened or parsed as audio by any backend
class TagReadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Embedded front cover, bytes exactly as stored in the container
struct CoverArt {
    std::vector<uint8_t> bytes;
    std::string mime;  // "image/jpeg", "image/png", ...
    std::string ext;   // ".jpeg", ".png", ...
};

// Tags and stream properties of one audio file, before any catalog logic
struct RawTags {
    std::optional<std::string> title;
    std::vector<std::string> artists;  // Split on ';', trimmed, empties dropped
    std::optional<std::string> album;
    std::optional<std::string> album_artist;
    std::optional<uint32_t> track_number;
    std::optional<uint32_t> year;
    uint64_t duration_s = 0;
    uint32_t bitrate_kbps = 0;
    std::string mime = "application/octet-stream";
    std::optional<CoverArt> cover;
};

/**
 * Tag reader over the native decoding libraries.
 *
 *   MP3              libmpg123 (ID3v2 text frames and APIC, ID3v1 fallback)
 *   FLAC, OGG, WAV   libsndfile for tags and properties, libavformat
 *                    for the attached picture and album artist
 *   everything else  libavformat (MP4/M4A, AAC, Opus, AIFF, ...)
 *
 * A backend that cannot open the file hands over to libavformat; only when
 * that fails too is TagReadError thrown.
 */
class MetadataParser {
public:
    [[nodiscard]] static RawTags read_tags(const std::string& path);

    // "A; B ;;C" -> {"A", "B", "C"}
    [[nodiscard]] static std::vector<std::string> split_artists(std::string_view value);

    // "01/12", "3 of 9", "7" -> leading number; nullopt if there is none
    [[nodiscard]] static std::optional<uint32_t> parse_track_number(std::string_view value);

    // "2019", "2019-03-01" -> 2019
    [[nodiscard]] static std::optional<uint32_t> parse_year(std::string_view value);

    // Image MIME type -> cache file extension, ".png" when unknown
    [[nodiscard]] static std::string cover_extension(std::string_view image_mime);

private:
    static std::optional<RawTags> parse_mp3(const std::string& path);
    static std::optional<RawTags> parse_sndfile(const std::string& path);
    static std::optional<RawTags> parse_container(const std::string& path);

    // Fills the cover and album artist libsndfile cannot report
    static void supplement_from_container(const std::string& path, RawTags& tags);

    static bool is_sndfile_extension(const std::string& ext);
};

}  // namespace lorchestre::backend
