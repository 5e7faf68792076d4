#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace atlasfix::core {

constexpr int k_alpha_channel = 3;
constexpr int k_rgba_channels = 4;

struct Raster {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<unsigned char> pixels;

    [[nodiscard]] bool empty() const {
        return width <= 0 || height <= 0 || channels <= 0;
    }

    [[nodiscard]] bool contains(int x, int y) const {
        return x >= 0 && x < width && y >= 0 && y < height;
    }

    [[nodiscard]] size_t offset(int x, int y) const {
        return ((static_cast<size_t>(y) * static_cast<size_t>(width)) + static_cast<size_t>(x))
               * static_cast<size_t>(channels);
    }

    [[nodiscard]] unsigned char alpha(int x, int y) const {
        return pixels[offset(x, y) + k_alpha_channel];
    }
};

// Fully transparent raster (all bytes zero) of the given shape.
Raster make_blank_raster(int width, int height, int channels);

// Copies every channel of one pixel from src to dst.
void copy_pixel(const Raster& src, int src_x, int src_y, Raster& dst, int dst_x, int dst_y);

void clear_pixel(Raster& raster, int x, int y);

bool is_valid_raster(const Raster& raster, std::string& error);

size_t count_pixels_above(const Raster& raster, unsigned char alpha_threshold);

} // namespace atlasfix::core
