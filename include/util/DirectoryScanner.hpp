#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace lorchestre::util {

/**
 * DirectoryScanner: recursive media discovery using the getdents64 syscall.
 *
 * Uses d_type from getdents64 to avoid a stat() per entry, falling back to
 * fstatat() only when the filesystem reports DT_UNKNOWN or a symlink.
 * Symlinked directories are not followed. Unreadable directories are logged
 * and skipped.
 */
class DirectoryScanner {
public:
    struct ScanResult {
        std::vector<std::string> audio_files;     // Absolute paths, enumeration order
        std::vector<std::string> playlist_files;  // Absolute paths, enumeration order
        std::string tree_digest;                  // Same value fingerprint() returns
    };

    /**
     * Full enumeration: every regular file classified by guessed MIME type.
     *
     * @param root_dir Root directory to scan recursively
     */
    [[nodiscard]] static ScanResult scan_directory(const std::filesystem::path& root_dir);

    /**
     * MD5 over the concatenation of every candidate media path (audio and
     * playlist) in enumeration order. Streams the walk into the digest without
     * building path lists.
     */
    [[nodiscard]] static std::string fingerprint(const std::filesystem::path& root_dir);

    // Audio or playlist candidate
    [[nodiscard]] static bool is_media_candidate(const std::string& path);

private:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;

    using Visitor = std::function<void(const std::string& path)>;

    // Calls visit for every regular file below dir_path
    static void walk(const std::string& dir_path, const Visitor& visit);

    static std::string normalize_root(const std::filesystem::path& root_dir);
};

}  // namespace lorchestre::util
