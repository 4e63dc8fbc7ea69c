#include "util/ImageDecoder.hpp"
#include "util/Logger.hpp"
#include <fstream>
#include <iterator>
#include <cstring>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
#define STBI_ONLY_BMP
#define STBI_ONLY_GIF
#include <stb/stb_image.h>

namespace lorchestre::util {

std::optional<RgbImage> ImageDecoder::decode_memory(std::span<const uint8_t> data) {
    if (data.empty()) {
        return std::nullopt;
    }

    int w = 0, h = 0, channels = 0;
    unsigned char* pixels = stbi_load_from_memory(data.data(), static_cast<int>(data.size()),
                                                  &w, &h, &channels, 3);
    if (!pixels) {
        Logger::warn(std::string("ImageDecoder: Cannot decode image (") + stbi_failure_reason() + ")");
        return std::nullopt;
    }

    RgbImage image;
    image.width = w;
    image.height = h;
    image.pixels.resize(static_cast<size_t>(w) * h * 3);
    std::memcpy(image.pixels.data(), pixels, image.pixels.size());
    stbi_image_free(pixels);
    return image;
}

std::optional<RgbImage> ImageDecoder::decode_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Logger::warn("ImageDecoder: Cannot open " + path.string());
        return std::nullopt;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return decode_memory(data);
}

}  // namespace lorchestre::util
