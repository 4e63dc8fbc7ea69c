#pragma once

#include "backend/CoverCache.hpp"
#include "backend/MetadataParser.hpp"
#include "model/Catalog.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace lorchestre::backend {

// Reads tags from one audio file; throws TagReadError when it cannot
using TagReader = std::function<RawTags(const std::string& path)>;

// A file that was skipped, and why
struct Diagnostic {
    std::string path;
    std::string message;

    bool operator==(const Diagnostic&) const = default;
};

struct ExtractionBatch {
    std::vector<model::Track> tracks;       // Input order, failures omitted
    std::vector<Diagnostic> diagnostics;    // Input order
};

/**
 * Turns audio files into catalog Tracks.
 *
 * Per file: read tags, fill defaults, derive the album id, push the embedded
 * cover through the CoverCache (which returns its colour) and attach timed
 * lyrics from a sibling .lrc file.
 */
class TrackExtractor {
public:
    explicit TrackExtractor(CoverCache& covers, TagReader reader = MetadataParser::read_tags,
                            size_t workers = 0);

    // Throws TagReadError when the container cannot be read
    [[nodiscard]] model::Track extract(const std::string& path) const;

    /**
     * Parallel extract() over a worker pool (hardware_concurrency() threads
     * unless a count was given). A failing file never aborts the batch: it
     * is logged, left out of tracks and recorded in diagnostics.
     */
    [[nodiscard]] ExtractionBatch extract_all(const std::vector<std::string>& paths) const;

    // Timed lines of <stem>.lrc next to the audio file, empty when absent or unreadable
    [[nodiscard]] static std::vector<model::LyricLine> load_lyrics(const std::filesystem::path& audio_path);

    // Birth time if the filesystem records it, else mtime, else the epoch
    [[nodiscard]] static std::chrono::system_clock::time_point creation_time(const std::string& path);

private:
    size_t worker_count(size_t jobs) const;

    CoverCache& covers_;
    TagReader reader_;
    size_t workers_;
};

}  // namespace lorchestre::backend
