#pragma once

#include <cstddef>
#include <vector>

#include "raster.h"

namespace atlasfix::core {

constexpr unsigned char k_default_alpha_threshold = 10;
constexpr size_t k_default_min_part_pixels = 4;

struct Point {
    int x = 0;
    int y = 0;
};

// Inclusive bounding box.
struct Bounds {
    int min_x = 0;
    int max_x = 0;
    int min_y = 0;
    int max_y = 0;

    [[nodiscard]] int width() const { return max_x - min_x + 1; }
    [[nodiscard]] int height() const { return max_y - min_y + 1; }

    void include(int x, int y);
    void include(const Bounds& other);
};

struct Part {
    std::vector<Point> pixels;
    Bounds bounds;

    [[nodiscard]] size_t size() const { return pixels.size(); }
};

struct ExtractOptions {
    // A pixel is opaque when its alpha is strictly greater than this.
    unsigned char alpha_threshold = k_default_alpha_threshold;
    // Parts with fewer member pixels are dropped as noise.
    size_t min_part_pixels = k_default_min_part_pixels;
};

[[nodiscard]] bool is_opaque(const Raster& raster, int x, int y, unsigned char alpha_threshold);

// Scans the raster top-to-bottom, left-to-right and flood fills every
// unvisited opaque pixel into a 4-connected part. Parts come back in
// discovery order. The fill uses an explicit stack, never recursion.
std::vector<Part> extract_parts(const Raster& raster, const ExtractOptions& options = {});

} // namespace atlasfix::core
