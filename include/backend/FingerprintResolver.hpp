#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lorchestre::backend {

struct Resolution {
    std::vector<std::string> files;  // Audio files first, then playlists
    std::string digest;
    bool reused_cache = false;

    [[nodiscard]] std::vector<std::string> audio_files() const;
    [[nodiscard]] std::vector<std::string> playlist_files() const;
};

/**
 * Skips directory enumeration when the library has not changed.
 *
 * The fingerprint is DirectoryScanner::fingerprint(root). The last
 * enumeration is kept in {cache_dir}/library.digest and
 * {cache_dir}/library.files (one path per line); a matching digest returns
 * the stored list untouched. Any problem with those files counts as a miss.
 */
class FingerprintResolver {
public:
    explicit FingerprintResolver(std::filesystem::path cache_dir);

    [[nodiscard]] Resolution resolve(const std::filesystem::path& root) const;

    [[nodiscard]] std::filesystem::path digest_path() const { return cache_dir_ / "library.digest"; }
    [[nodiscard]] std::filesystem::path files_path() const { return cache_dir_ / "library.files"; }

private:
    struct Stored {
        std::string digest;
        std::vector<std::string> files;
    };

    std::optional<Stored> load() const;

    // Failures are logged, never thrown
    void persist(const std::string& digest, const std::vector<std::string>& files) const;

    std::filesystem::path cache_dir_;
};

}  // namespace lorchestre::backend
