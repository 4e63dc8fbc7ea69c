#include "backend/FingerprintResolver.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <fstream>

namespace lorchestre::backend {

namespace fs = std::filesystem;

namespace {
    // Writes next to the target and renames over it
    bool write_atomically(const fs::path& target, const std::string& contents) {
        fs::path tmp = target;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) return false;
            out << contents;
            if (!out.flush()) return false;
        }
        std::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            fs::remove(tmp, ec);
            return false;
        }
        return true;
    }
}

std::vector<std::string> Resolution::audio_files() const {
    std::vector<std::string> out;
    for (const auto& f : files) {
        if (!util::Platform::is_playlist_file(f)) out.push_back(f);
    }
    return out;
}

std::vector<std::string> Resolution::playlist_files() const {
    std::vector<std::string> out;
    for (const auto& f : files) {
        if (util::Platform::is_playlist_file(f)) out.push_back(f);
    }
    return out;
}

FingerprintResolver::FingerprintResolver(fs::path cache_dir) : cache_dir_(std::move(cache_dir)) {}

Resolution FingerprintResolver::resolve(const fs::path& root) const {
    std::string digest = util::DirectoryScanner::fingerprint(root);

    if (auto stored = load(); stored && stored->digest == digest) {
        util::Logger::info("FingerprintResolver: Library unchanged, reusing " +
                           std::to_string(stored->files.size()) + " cached paths");
        return Resolution{std::move(stored->files), std::move(digest), true};
    }

    util::Logger::info("FingerprintResolver: Library changed, enumerating " + root.string());
    auto scan = util::DirectoryScanner::scan_directory(root);

    Resolution resolution;
    resolution.files = std::move(scan.audio_files);
    resolution.files.insert(resolution.files.end(),
                            std::make_move_iterator(scan.playlist_files.begin()),
                            std::make_move_iterator(scan.playlist_files.end()));
    resolution.digest = std::move(scan.tree_digest);
    resolution.reused_cache = false;

    persist(resolution.digest, resolution.files);
    return resolution;
}

std::optional<FingerprintResolver::Stored> FingerprintResolver::load() const {
    std::ifstream digest_in(digest_path());
    std::ifstream files_in(files_path());
    if (!digest_in || !files_in) {
        util::Logger::debug("FingerprintResolver: No fingerprint cache in " + cache_dir_.string());
        return std::nullopt;
    }

    Stored stored;
    if (!std::getline(digest_in, stored.digest) || stored.digest.empty()) {
        util::Logger::warn("FingerprintResolver: Empty digest file, treating as a miss");
        return std::nullopt;
    }

    std::string line;
    while (std::getline(files_in, line)) {
        if (!line.empty()) {
            stored.files.push_back(std::move(line));
        }
    }
    if (files_in.bad()) {
        util::Logger::warn("FingerprintResolver: Read error on " + files_path().string());
        return std::nullopt;
    }
    return stored;
}

void FingerprintResolver::persist(const std::string& digest, const std::vector<std::string>& files) const {
    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec && !fs::is_directory(cache_dir_)) {
        util::Logger::warn("FingerprintResolver: Cannot create " + cache_dir_.string() + ": " + ec.message());
        return;
    }

    std::string listing;
    for (const auto& f : files) {
        listing += f;
        listing += '\n';
    }

    // List before digest: a stored digest never outlives the list it describes
    if (!write_atomically(files_path(), listing) || !write_atomically(digest_path(), digest + "\n")) {
        util::Logger::warn("FingerprintResolver: Failed to persist fingerprint cache in " + cache_dir_.string());
        return;
    }
    util::Logger::debug("FingerprintResolver: Persisted " + std::to_string(files.size()) + " paths");
}

}  // namespace lorchestre::backend
