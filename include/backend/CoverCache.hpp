#pragma once

#include "model/Catalog.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

namespace lorchestre::backend {

// Decodes the image at a path and returns its dominant colour
using ColorProbe = std::function<std::optional<model::Color>(const std::filesystem::path&)>;

/**
 * Content-addressed on-disk cover cache.
 *
 * Layout: {cache_dir}/covers/{key}{ext}, with the dominant colour of each
 * file kept in a {key}{ext}.color sidecar. The key is the album id, so every
 * track of an album maps to one file and the image is decoded once.
 *
 * Files are created exclusively (written to a private temp name, then
 * link()ed into place) so concurrent writers never interleave bytes and the
 * first writer wins. Entries are never invalidated.
 *
 * Thread-safe: resolve() calls for the same file are serialized, calls for
 * different files run in parallel.
 */
class CoverCache {
public:
    explicit CoverCache(std::filesystem::path cache_dir, ColorProbe probe = decode_dominant_color);

    CoverCache(const CoverCache&) = delete;
    CoverCache& operator=(const CoverCache&) = delete;

    [[nodiscard]] std::filesystem::path path_for(const std::string& key, const std::string& ext) const;
    [[nodiscard]] const std::filesystem::path& covers_dir() const { return covers_dir_; }

    /**
     * Makes sure {key}{ext} exists and returns its dominant colour.
     *
     * hit:   file present, colour in memory or in the sidecar -> no write, no decode
     * stale: file present, colour unknown -> decode the cached file once
     * miss:  write bytes exclusively, decode, record the colour
     *
     * nullopt when the image cannot be written or decoded (logged).
     */
    std::optional<model::Color> resolve(const std::string& key, const std::string& ext,
                                        std::span<const uint8_t> bytes);

    // Cached file for an HTTP handle "{key}{ext}"; rejects anything that is not a plain cover name
    [[nodiscard]] std::optional<std::filesystem::path> find(const std::string& handle) const;

    // Default probe: stb_image decode + median cut, palette of one
    static std::optional<model::Color> decode_dominant_color(const std::filesystem::path& path);

private:
    bool ensure_directory() const;
    bool write_exclusive(const std::filesystem::path& path, std::span<const uint8_t> bytes) const;

    std::optional<model::Color> read_sidecar(const std::filesystem::path& cover) const;
    void write_sidecar(const std::filesystem::path& cover, const model::Color& color) const;

    std::optional<model::Color> probe(const std::filesystem::path& cover) const;

    // Per-file lock so two tracks of one album never decode the same cover twice
    std::shared_ptr<std::mutex> lock_for(const std::string& file);

    std::filesystem::path covers_dir_;
    ColorProbe probe_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::optional<model::Color>> memo_;  // file name -> colour
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> file_locks_;
};

}  // namespace lorchestre::backend
