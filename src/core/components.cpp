#include "components.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>

namespace atlasfix::core {

namespace {

Part flood_fill_part(const Raster& raster, int start_x, int start_y, unsigned char alpha_threshold,
                     std::vector<std::uint8_t>& visited) {
    const int width = raster.width;
    const int height = raster.height;

    Part part;
    part.bounds = Bounds{.min_x = start_x, .max_x = start_x, .min_y = start_y, .max_y = start_y};

    std::vector<std::pair<int, int>> stack;
    stack.emplace_back(start_x, start_y);
    visited[(static_cast<size_t>(start_y) * width) + start_x] = 1;

    const std::array<int, 4> dx = {-1, 1, 0, 0};
    const std::array<int, 4> dy = {0, 0, -1, 1};

    while (!stack.empty()) {
        auto [x, y] = stack.back();
        stack.pop_back();

        part.pixels.push_back(Point{.x = x, .y = y});
        part.bounds.include(x, y);

        for (size_t i = 0; i < dx.size(); ++i) {
            int nx = x + dx[i];
            int ny = y + dy[i];

            if (nx >= 0 && nx < width && ny >= 0 && ny < height
                && visited[(static_cast<size_t>(ny) * width) + nx] == 0U
                && is_opaque(raster, nx, ny, alpha_threshold)) {
                visited[(static_cast<size_t>(ny) * width) + nx] = 1;
                stack.emplace_back(nx, ny);
            }
        }
    }

    return part;
}

} // namespace

void Bounds::include(int x, int y) {
    min_x = std::min(min_x, x);
    max_x = std::max(max_x, x);
    min_y = std::min(min_y, y);
    max_y = std::max(max_y, y);
}

void Bounds::include(const Bounds& other) {
    min_x = std::min(min_x, other.min_x);
    max_x = std::max(max_x, other.max_x);
    min_y = std::min(min_y, other.min_y);
    max_y = std::max(max_y, other.max_y);
}

bool is_opaque(const Raster& raster, int x, int y, unsigned char alpha_threshold) {
    return raster.alpha(x, y) > alpha_threshold;
}

std::vector<Part> extract_parts(const Raster& raster, const ExtractOptions& options) {
    std::vector<Part> parts;
    if (raster.empty() || raster.channels <= k_alpha_channel) {
        return parts;
    }

    std::vector<std::uint8_t> visited(static_cast<size_t>(raster.width) * raster.height, 0);

    for (int y = 0; y < raster.height; ++y) {
        for (int x = 0; x < raster.width; ++x) {
            if (visited[(static_cast<size_t>(y) * raster.width) + x] == 0U
                && is_opaque(raster, x, y, options.alpha_threshold)) {
                Part part = flood_fill_part(raster, x, y, options.alpha_threshold, visited);
                if (part.size() >= options.min_part_pixels) {
                    parts.push_back(std::move(part));
                }
            }
        }
    }

    return parts;
}

} // namespace atlasfix::core
