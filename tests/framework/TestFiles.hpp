#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lorchestre::test {

// Fresh directory under /tmp, removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "lorchestre_test_XXXXXX").string();
        if (!mkdtemp(tmpl.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = tmpl;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    std::filesystem::path path_;
};

// Creates parent directories as needed
inline void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * Uncompressed 24-bit BMP. fill(x, y) returns {r, g, b} for each pixel,
 * y = 0 being the top row.
 */
template <typename Fill>
std::vector<uint8_t> make_bmp(int width, int height, Fill fill) {
    const int row_size = (width * 3 + 3) & ~3;
    const uint32_t pixel_bytes = static_cast<uint32_t>(row_size * height);
    const uint32_t file_size = 54 + pixel_bytes;

    std::vector<uint8_t> out(file_size, 0);
    auto put16 = [&](size_t at, uint16_t v) {
        out[at] = v & 0xFF;
        out[at + 1] = (v >> 8) & 0xFF;
    };
    auto put32 = [&](size_t at, uint32_t v) {
        for (int i = 0; i < 4; ++i) out[at + i] = (v >> (8 * i)) & 0xFF;
    };

    out[0] = 'B';
    out[1] = 'M';
    put32(2, file_size);
    put32(10, 54);                               // Pixel data offset
    put32(14, 40);                               // BITMAPINFOHEADER
    put32(18, static_cast<uint32_t>(width));
    put32(22, static_cast<uint32_t>(height));    // Positive: bottom-up rows
    put16(26, 1);                                // Planes
    put16(28, 24);                               // Bits per pixel
    put32(34, pixel_bytes);

    for (int y = 0; y < height; ++y) {
        size_t row = 54 + static_cast<size_t>(height - 1 - y) * row_size;
        for (int x = 0; x < width; ++x) {
            auto [r, g, b] = fill(x, y);
            out[row + x * 3] = b;
            out[row + x * 3 + 1] = g;
            out[row + x * 3 + 2] = r;
        }
    }
    return out;
}

struct Rgb {
    uint8_t r, g, b;
};

inline std::vector<uint8_t> solid_bmp(int width, int height, Rgb c) {
    return make_bmp(width, height, [c](int, int) { return c; });
}

}  // namespace lorchestre::test
