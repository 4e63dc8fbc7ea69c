#include "util/DirectoryScanner.hpp"
#include "util/ContentHasher.hpp"
#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <cerrno>
#include <cstring>

namespace lorchestre::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

bool DirectoryScanner::is_media_candidate(const std::string& path) {
    return Platform::is_audio_file(path) || Platform::is_playlist_file(path);
}

std::string DirectoryScanner::normalize_root(const std::filesystem::path& root_dir) {
    // Strip trailing slashes to prevent // in paths
    std::string root_str = root_dir.string();
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }
    return root_str;
}

DirectoryScanner::ScanResult DirectoryScanner::scan_directory(const std::filesystem::path& root_dir) {
    ScanResult result;
    ContentHasher::Md5Stream digest;

    std::string root_str = normalize_root(root_dir);
    util::Logger::info("DirectoryScanner: Starting getdents64 scan of " + root_str);

    walk(root_str, [&](const std::string& path) {
        if (Platform::is_playlist_file(path)) {
            result.playlist_files.push_back(path);
            digest.update(path);
        } else if (Platform::is_audio_file(path)) {
            result.audio_files.push_back(path);
            digest.update(path);
        }
    });

    result.tree_digest = digest.hex();

    util::Logger::info("DirectoryScanner: Found " + std::to_string(result.audio_files.size()) +
                      " audio files and " + std::to_string(result.playlist_files.size()) + " playlists");
    return result;
}

std::string DirectoryScanner::fingerprint(const std::filesystem::path& root_dir) {
    ContentHasher::Md5Stream digest;
    size_t count = 0;

    walk(normalize_root(root_dir), [&](const std::string& path) {
        if (is_media_candidate(path)) {
            digest.update(path);
            ++count;
        }
    });

    auto hex = digest.hex();
    util::Logger::debug("DirectoryScanner: Fingerprint over " + std::to_string(count) + " paths: " + hex);
    return hex;
}

void DirectoryScanner::walk(const std::string& dir_path, const Visitor& visit) {
    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        util::Logger::warn("DirectoryScanner: Skipping unreadable directory " + dir_path +
                           " (" + std::strerror(errno) + ")");
        return;
    }

    // One buffer per level: recursion happens while the parent buffer is still being consumed
    std::vector<char> buffer(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.data(), buffer.size());

        if (nread == -1) {
            util::Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            break;
        }

        if (nread == 0) {
            // End of directory
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.data() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            std::string full_path = dir_path + "/" + d->d_name;

            if (d->d_type == DT_REG) {
                visit(full_path);
            } else if (d->d_type == DT_DIR) {
                walk(full_path, visit);
            } else if (d->d_type == DT_UNKNOWN || d->d_type == DT_LNK) {
                struct stat entry_stat;
                if (fstatat(fd, d->d_name, &entry_stat, 0) != 0) {
                    continue;
                }
                if (S_ISREG(entry_stat.st_mode)) {
                    visit(full_path);
                } else if (S_ISDIR(entry_stat.st_mode) && d->d_type == DT_UNKNOWN) {
                    walk(full_path, visit);
                }
            }
        }
    }

    close(fd);
}

}  // namespace lorchestre::util
