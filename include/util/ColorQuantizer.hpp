#pragma once

#include "model/Catalog.hpp"
#include "util/ImageDecoder.hpp"
#include <array>
#include <optional>
#include <vector>

namespace lorchestre::util {

/**
 * Modified median cut quantization (MMCQ).
 *
 * Pixels are bucketed into a 5-bit-per-channel histogram, the colour space
 * box is split along its longest axis at the population median until
 * max_colors boxes exist, and each box contributes its population-weighted
 * mean. Near-white pixels (all channels > 250) are ignored.
 */
class ColorQuantizer {
public:
    /**
     * @param image    RGB8 pixels
     * @param max_colors palette size, at least 1
     * @param quality  sample every quality-th pixel, 1 = every pixel
     * @return palette ordered by population, empty if no pixel was sampled
     */
    [[nodiscard]] static std::vector<model::Color> palette(const RgbImage& image,
                                                           size_t max_colors,
                                                           size_t quality = 10);

    // Palette of one colour at quality 2
    [[nodiscard]] static std::optional<model::Color> dominant_color(const RgbImage& image);

private:
    static constexpr int SIGBITS = 5;
    static constexpr int RSHIFT = 8 - SIGBITS;
    static constexpr size_t HISTO_SIZE = size_t{1} << (3 * SIGBITS);

    using Histogram = std::vector<uint32_t>;

    struct VBox {
        std::array<int, 3> lo{};
        std::array<int, 3> hi{};
        uint64_t count = 0;

        [[nodiscard]] uint64_t volume() const;
    };

    static size_t index(int r, int g, int b) {
        return (static_cast<size_t>(r) << (2 * SIGBITS)) | (static_cast<size_t>(g) << SIGBITS) | static_cast<size_t>(b);
    }

    static uint64_t population(const VBox& box, const Histogram& histo);
    static model::Color average(const VBox& box, const Histogram& histo);

    // Splits box at the median of its longest axis; false if it is a single cell
    static bool split(const VBox& box, const Histogram& histo, VBox& left, VBox& right);
};

}  // namespace lorchestre::util
