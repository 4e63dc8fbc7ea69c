#include "backend/CoverCache.hpp"
#include "util/ColorQuantizer.hpp"
#include "util/ContentHasher.hpp"
#include "util/ImageDecoder.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>

namespace lorchestre::backend {

namespace fs = std::filesystem;

namespace {
    constexpr std::string_view SIDECAR_SUFFIX = ".color";

    fs::path sidecar_path(const fs::path& cover) {
        fs::path p = cover;
        p += SIDECAR_SUFFIX;
        return p;
    }
}

CoverCache::CoverCache(fs::path cache_dir, ColorProbe probe)
    : covers_dir_(std::move(cache_dir) / "covers"), probe_(std::move(probe)) {}

fs::path CoverCache::path_for(const std::string& key, const std::string& ext) const {
    return covers_dir_ / (key + ext);
}

std::shared_ptr<std::mutex> CoverCache::lock_for(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = file_locks_[file];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

std::optional<model::Color> CoverCache::resolve(const std::string& key, const std::string& ext,
                                                std::span<const uint8_t> bytes) {
    const std::string file = key + ext;
    const fs::path path = covers_dir_ / file;

    auto file_lock = lock_for(file);
    std::lock_guard<std::mutex> guard(*file_lock);

    std::error_code ec;
    bool present = fs::is_regular_file(path, ec);

    if (present) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = memo_.find(file);
            if (it != memo_.end()) {
                return it->second;
            }
        }
        if (auto color = read_sidecar(path)) {
            std::lock_guard<std::mutex> lock(mutex_);
            memo_[file] = color;
            return color;
        }
        util::Logger::debug("CoverCache: Colour unknown for cached " + file + ", decoding");
    } else {
        if (bytes.empty()) {
            util::Logger::warn("CoverCache: Empty cover data for " + file);
            return std::nullopt;
        }
        if (!ensure_directory() || !write_exclusive(path, bytes)) {
            return std::nullopt;
        }
        util::Logger::debug("CoverCache: Stored " + file + " (" + std::to_string(bytes.size() / 1024) + " KB)");
    }

    std::optional<model::Color> color = probe(path);
    if (color) {
        write_sidecar(path, *color);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    memo_[file] = color;
    return color;
}

std::optional<fs::path> CoverCache::find(const std::string& handle) const {
    if (handle.empty() || handle.front() == '.' ||
        handle.find('/') != std::string::npos || handle.find('\0') != std::string::npos) {
        return std::nullopt;
    }
    if (handle.size() >= SIDECAR_SUFFIX.size() &&
        handle.compare(handle.size() - SIDECAR_SUFFIX.size(), SIDECAR_SUFFIX.size(), SIDECAR_SUFFIX) == 0) {
        return std::nullopt;
    }

    fs::path path = covers_dir_ / handle;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    return path;
}

std::optional<model::Color> CoverCache::decode_dominant_color(const fs::path& path) {
    auto image = util::ImageDecoder::decode_file(path);
    if (!image) {
        return std::nullopt;
    }
    return util::ColorQuantizer::dominant_color(*image);
}

std::optional<model::Color> CoverCache::probe(const fs::path& cover) const {
    try {
        auto color = probe_(cover);
        if (!color) {
            util::Logger::warn("CoverCache: Could not extract a colour from " + cover.string());
        }
        return color;
    } catch (const std::exception& e) {
        util::Logger::warn("CoverCache: Colour probe failed for " + cover.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool CoverCache::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(covers_dir_, ec);
    // Another worker may have created it first
    if (ec && !fs::is_directory(covers_dir_)) {
        util::Logger::error("CoverCache: Cannot create " + covers_dir_.string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool CoverCache::write_exclusive(const fs::path& path, std::span<const uint8_t> bytes) const {
    fs::path tmp = path;
    tmp += ".tmp." + util::ContentHasher::random_id();

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        util::Logger::error("CoverCache: Cannot create " + tmp.string() + ": " + std::strerror(errno));
        return false;
    }

    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            util::Logger::error("CoverCache: Write failed for " + tmp.string() + ": " + std::strerror(errno));
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        util::Logger::error("CoverCache: Close failed for " + tmp.string() + ": " + std::strerror(errno));
        ::unlink(tmp.c_str());
        return false;
    }

    // link() fails with EEXIST if another process won the race; its copy is as good as ours
    bool ok = true;
    if (::link(tmp.c_str(), path.c_str()) != 0 && errno != EEXIST) {
        util::Logger::error("CoverCache: Cannot publish " + path.string() + ": " + std::strerror(errno));
        ok = false;
    }
    ::unlink(tmp.c_str());
    return ok;
}

std::optional<model::Color> CoverCache::read_sidecar(const fs::path& cover) const {
    std::ifstream in(sidecar_path(cover));
    if (!in) {
        return std::nullopt;
    }

    unsigned r = 0, g = 0, b = 0;
    if (!(in >> r >> g >> b) || r > 255 || g > 255 || b > 255) {
        util::Logger::warn("CoverCache: Ignoring malformed sidecar for " + cover.filename().string());
        return std::nullopt;
    }
    return model::Color{static_cast<uint8_t>(r), static_cast<uint8_t>(g), static_cast<uint8_t>(b)};
}

void CoverCache::write_sidecar(const fs::path& cover, const model::Color& color) const {
    fs::path target = sidecar_path(cover);
    fs::path tmp = target;
    tmp += ".tmp." + util::ContentHasher::random_id();

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            util::Logger::warn("CoverCache: Cannot write sidecar " + tmp.string());
            return;
        }
        out << static_cast<unsigned>(color.r) << ' ' << static_cast<unsigned>(color.g) << ' '
            << static_cast<unsigned>(color.b) << '\n';
        if (!out) {
            util::Logger::warn("CoverCache: Short write on sidecar " + tmp.string());
            std::error_code ec;
            fs::remove(tmp, ec);
            return;
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        util::Logger::warn("CoverCache: Cannot install sidecar " + target.string() + ": " + ec.message());
        fs::remove(tmp, ec);
    }
}

}  // namespace lorchestre::backend
