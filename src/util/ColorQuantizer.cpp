#include "util/ColorQuantizer.hpp"
#include <algorithm>
#include <cmath>

namespace lorchestre::util {

uint64_t ColorQuantizer::VBox::volume() const {
    uint64_t v = 1;
    for (int c = 0; c < 3; ++c) {
        v *= static_cast<uint64_t>(hi[c] - lo[c] + 1);
    }
    return v;
}

uint64_t ColorQuantizer::population(const VBox& box, const Histogram& histo) {
    uint64_t total = 0;
    for (int r = box.lo[0]; r <= box.hi[0]; ++r) {
        for (int g = box.lo[1]; g <= box.hi[1]; ++g) {
            for (int b = box.lo[2]; b <= box.hi[2]; ++b) {
                total += histo[index(r, g, b)];
            }
        }
    }
    return total;
}

model::Color ColorQuantizer::average(const VBox& box, const Histogram& histo) {
    constexpr double mult = 1 << RSHIFT;
    double sums[3] = {0.0, 0.0, 0.0};
    uint64_t total = 0;

    for (int r = box.lo[0]; r <= box.hi[0]; ++r) {
        for (int g = box.lo[1]; g <= box.hi[1]; ++g) {
            for (int b = box.lo[2]; b <= box.hi[2]; ++b) {
                uint32_t h = histo[index(r, g, b)];
                if (h == 0) continue;
                total += h;
                sums[0] += h * (r + 0.5) * mult;
                sums[1] += h * (g + 0.5) * mult;
                sums[2] += h * (b + 0.5) * mult;
            }
        }
    }

    auto channel = [&](int c) -> uint8_t {
        double v = total ? sums[c] / static_cast<double>(total)
                         : mult * (box.lo[c] + box.hi[c] + 1) / 2.0;
        return static_cast<uint8_t>(std::clamp(static_cast<int>(v), 0, 255));
    };
    return model::Color{channel(0), channel(1), channel(2)};
}

bool ColorQuantizer::split(const VBox& box, const Histogram& histo, VBox& left, VBox& right) {
    int axis = 0;
    int longest = -1;
    for (int c = 0; c < 3; ++c) {
        int len = box.hi[c] - box.lo[c];
        if (len > longest) {
            longest = len;
            axis = c;
        }
    }
    if (longest == 0) {
        return false;
    }

    // Population of each slice along the axis
    std::vector<uint64_t> slices(static_cast<size_t>(box.hi[axis] - box.lo[axis] + 1), 0);
    for (int r = box.lo[0]; r <= box.hi[0]; ++r) {
        for (int g = box.lo[1]; g <= box.hi[1]; ++g) {
            for (int b = box.lo[2]; b <= box.hi[2]; ++b) {
                int coord[3] = {r, g, b};
                slices[static_cast<size_t>(coord[axis] - box.lo[axis])] += histo[index(r, g, b)];
            }
        }
    }

    uint64_t half = box.count / 2;
    uint64_t running = 0;
    int cut = box.lo[axis];
    for (size_t i = 0; i < slices.size(); ++i) {
        running += slices[i];
        cut = box.lo[axis] + static_cast<int>(i);
        if (running > half) break;
    }
    // Both halves must be non-empty ranges
    cut = std::min(cut, box.hi[axis] - 1);

    left = box;
    right = box;
    left.hi[axis] = cut;
    right.lo[axis] = cut + 1;
    left.count = population(left, histo);
    right.count = population(right, histo);
    return true;
}

std::vector<model::Color> ColorQuantizer::palette(const RgbImage& image, size_t max_colors, size_t quality) {
    std::vector<model::Color> colors;
    if (max_colors == 0 || image.pixels.size() < 3) {
        return colors;
    }
    quality = std::max<size_t>(quality, 1);

    Histogram histo(HISTO_SIZE, 0);
    VBox root;
    root.lo = {255, 255, 255};
    root.hi = {0, 0, 0};

    const size_t n = image.pixel_count();
    for (size_t i = 0; i < n; i += quality) {
        uint8_t r = image.pixels[i * 3];
        uint8_t g = image.pixels[i * 3 + 1];
        uint8_t b = image.pixels[i * 3 + 2];
        if (r > 250 && g > 250 && b > 250) continue;

        int q[3] = {r >> RSHIFT, g >> RSHIFT, b >> RSHIFT};
        histo[index(q[0], q[1], q[2])]++;
        for (int c = 0; c < 3; ++c) {
            root.lo[c] = std::min(root.lo[c], q[c]);
            root.hi[c] = std::max(root.hi[c], q[c]);
        }
        root.count++;
    }

    if (root.count == 0) {
        return colors;
    }

    std::vector<VBox> boxes{root};

    // First 3/4 of the boxes by population, the rest by population * volume
    auto grow = [&](size_t target, auto score) {
        while (boxes.size() < target) {
            auto it = std::max_element(boxes.begin(), boxes.end(),
                                       [&](const VBox& a, const VBox& b) { return score(a) < score(b); });
            VBox left, right;
            if (it->count == 0 || !split(*it, histo, left, right)) {
                break;
            }
            *it = left;
            boxes.push_back(right);
        }
    };
    grow(std::max<size_t>(1, static_cast<size_t>(std::ceil(0.75 * max_colors))),
         [](const VBox& b) { return static_cast<double>(b.count); });
    grow(max_colors, [](const VBox& b) { return static_cast<double>(b.count) * b.volume(); });

    std::erase_if(boxes, [](const VBox& b) { return b.count == 0; });
    std::stable_sort(boxes.begin(), boxes.end(),
                     [](const VBox& a, const VBox& b) { return a.count > b.count; });

    colors.reserve(boxes.size());
    for (const auto& box : boxes) {
        colors.push_back(average(box, histo));
    }
    return colors;
}

std::optional<model::Color> ColorQuantizer::dominant_color(const RgbImage& image) {
    auto colors = palette(image, 1, 2);
    if (colors.empty()) {
        return std::nullopt;
    }
    return colors.front();
}

}  // namespace lorchestre::util
