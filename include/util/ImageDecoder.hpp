#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace lorchestre::util {

// Tightly packed RGB8 pixels, row-major
struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    [[nodiscard]] size_t pixel_count() const { return pixels.size() / 3; }
};

class ImageDecoder {
public:
    // JPEG, PNG, BMP or GIF (first frame); nullopt for anything stb_image rejects
    [[nodiscard]] static std::optional<RgbImage> decode_memory(std::span<const uint8_t> data);
    [[nodiscard]] static std::optional<RgbImage> decode_file(const std::filesystem::path& path);
};

}  // namespace lorchestre::util
