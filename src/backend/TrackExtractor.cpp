#include "backend/TrackExtractor.hpp"
#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include "util/LrcParser.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <fcntl.h>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <sys/stat.h>
#include <thread>

namespace lorchestre::backend {

namespace fs = std::filesystem;

namespace {
    std::chrono::system_clock::time_point to_time_point(const struct statx_timestamp& ts) {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
    }
}

TrackExtractor::TrackExtractor(CoverCache& covers, TagReader reader, size_t workers)
    : covers_(covers), reader_(std::move(reader)), workers_(workers) {}

model::Track TrackExtractor::extract(const std::string& path) const {
    RawTags raw = reader_(path);

    model::Track track;
    track.id = util::ContentHasher::random_id();
    track.file_path = path;

    if (raw.title) track.title = std::move(*raw.title);
    track.artists = std::move(raw.artists);
    if (raw.album) track.album = std::move(*raw.album);
    track.album_artist = std::move(raw.album_artist);
    track.track_number = raw.track_number.value_or(0);
    track.album_year = raw.year;
    track.mime = std::move(raw.mime);
    track.duration = raw.duration_s;
    track.bitrate = raw.bitrate_kbps;
    track.created_at = creation_time(path);

    track.album_id = util::ContentHasher::album_id(track.album, track.primary_artist());

    if (raw.cover && !raw.cover->bytes.empty()) {
        std::string ext = raw.cover->ext.empty() ? MetadataParser::cover_extension(raw.cover->mime)
                                                 : raw.cover->ext;
        auto color = covers_.resolve(track.album_id, ext, raw.cover->bytes);

        std::error_code ec;
        if (fs::is_regular_file(covers_.path_for(track.album_id, ext), ec)) {
            track.cover_ext = ext;
        }
        if (color) {
            track.color = color;
            track.is_light = color->is_light();
        }
    }

    track.lyrics = load_lyrics(path);
    return track;
}

ExtractionBatch TrackExtractor::extract_all(const std::vector<std::string>& paths) const {
    ExtractionBatch batch;
    const size_t num_files = paths.size();
    if (num_files == 0) {
        return batch;
    }

    const size_t num_threads = worker_count(num_files);
    util::Logger::info("TrackExtractor: Parsing " + std::to_string(num_files) +
                       " files with " + std::to_string(num_threads) + " threads");

    std::atomic<size_t> work_index{0};
    std::vector<std::optional<model::Track>> results(num_files);
    std::vector<std::string> errors(num_files);

    // Anything that is not a std::exception aborts the batch and is
    // rethrown on the calling thread once the workers are joined
    std::mutex abort_mutex;
    std::exception_ptr abort;

    std::vector<std::thread> workers;
    workers.reserve(num_threads);
    for (size_t t = 0; t < num_threads; ++t) {
        workers.emplace_back([&]() {
            while (true) {
                size_t idx = work_index.fetch_add(1);
                if (idx >= num_files) break;

                try {
                    results[idx] = extract(paths[idx]);
                } catch (const std::exception& e) {
                    errors[idx] = e.what();
                } catch (...) {
                    std::lock_guard<std::mutex> lock(abort_mutex);
                    if (!abort) abort = std::current_exception();
                    work_index.store(num_files);
                }
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }
    if (abort) {
        util::Logger::error("TrackExtractor: Extraction aborted");
        std::rethrow_exception(abort);
    }

    // Merge results in input order (single-threaded)
    batch.tracks.reserve(num_files);
    for (size_t i = 0; i < num_files; ++i) {
        if (results[i]) {
            batch.tracks.push_back(std::move(*results[i]));
        } else {
            util::Logger::warn("TrackExtractor: Skipping " + paths[i] + ": " + errors[i]);
            batch.diagnostics.push_back(Diagnostic{paths[i], std::move(errors[i])});
        }
    }

    util::Logger::info("TrackExtractor: Extracted " + std::to_string(batch.tracks.size()) +
                       " tracks, skipped " + std::to_string(batch.diagnostics.size()));
    return batch;
}

std::vector<model::LyricLine> TrackExtractor::load_lyrics(const fs::path& audio_path) {
    fs::path lrc_path = audio_path;
    lrc_path.replace_extension(".lrc");

    std::error_code ec;
    if (!fs::is_regular_file(lrc_path, ec)) {
        return {};
    }

    std::ifstream in(lrc_path, std::ios::binary);
    if (!in) {
        util::Logger::warn("TrackExtractor: Cannot open lyrics " + lrc_path.string());
        return {};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        util::Logger::warn("TrackExtractor: Read error on lyrics " + lrc_path.string());
        return {};
    }

    try {
        return util::LrcParser::parse(util::LrcParser::strip_untimed_lines(buffer.str()));
    } catch (const util::LrcParseError& e) {
        util::Logger::warn("TrackExtractor: Ignoring lyrics " + lrc_path.string() + ": " + e.what());
        return {};
    }
}

std::chrono::system_clock::time_point TrackExtractor::creation_time(const std::string& path) {
    struct statx stx {};
    if (::statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME | STATX_MTIME, &stx) != 0) {
        return std::chrono::system_clock::time_point{};
    }
    if (stx.stx_mask & STATX_BTIME) {
        return to_time_point(stx.stx_btime);
    }
    if (stx.stx_mask & STATX_MTIME) {
        return to_time_point(stx.stx_mtime);
    }
    return std::chrono::system_clock::time_point{};
}

size_t TrackExtractor::worker_count(size_t jobs) const {
    size_t n = workers_ ? workers_ : std::thread::hardware_concurrency();
    return std::clamp<size_t>(n, 1, jobs);
}

}  // namespace lorchestre::backend
