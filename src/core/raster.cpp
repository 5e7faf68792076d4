#include "raster.h"

#include <algorithm>
#include <limits>

namespace atlasfix::core {

namespace {

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

bool expected_byte_count(int width, int height, int channels, size_t& out) {
    size_t pixel_count = 0;
    return checked_mul_size_t(static_cast<size_t>(width), static_cast<size_t>(height), pixel_count)
           && checked_mul_size_t(pixel_count, static_cast<size_t>(channels), out);
}

} // namespace

Raster make_blank_raster(int width, int height, int channels) {
    Raster raster;
    size_t byte_count = 0;
    if (width <= 0 || height <= 0 || channels <= 0
        || !expected_byte_count(width, height, channels, byte_count)) {
        return raster;
    }
    raster.width = width;
    raster.height = height;
    raster.channels = channels;
    raster.pixels.assign(byte_count, 0);
    return raster;
}

void copy_pixel(const Raster& src, int src_x, int src_y, Raster& dst, int dst_x, int dst_y) {
    const size_t src_offset = src.offset(src_x, src_y);
    const size_t dst_offset = dst.offset(dst_x, dst_y);
    const auto count = static_cast<size_t>(std::min(src.channels, dst.channels));
    std::copy_n(src.pixels.begin() + static_cast<std::ptrdiff_t>(src_offset), count,
                dst.pixels.begin() + static_cast<std::ptrdiff_t>(dst_offset));
}

void clear_pixel(Raster& raster, int x, int y) {
    const size_t offset = raster.offset(x, y);
    std::fill_n(raster.pixels.begin() + static_cast<std::ptrdiff_t>(offset),
                static_cast<size_t>(raster.channels), static_cast<unsigned char>(0));
}

bool is_valid_raster(const Raster& raster, std::string& error) {
    if (raster.empty()) {
        error = "raster has no pixels";
        return false;
    }
    size_t byte_count = 0;
    if (!expected_byte_count(raster.width, raster.height, raster.channels, byte_count)) {
        error = "raster size is too large";
        return false;
    }
    if (raster.pixels.size() != byte_count) {
        error = "raster buffer holds " + std::to_string(raster.pixels.size()) + " bytes, expected "
                + std::to_string(byte_count);
        return false;
    }
    return true;
}

size_t count_pixels_above(const Raster& raster, unsigned char alpha_threshold) {
    if (raster.channels <= k_alpha_channel) {
        return 0;
    }
    size_t count = 0;
    const auto stride = static_cast<size_t>(raster.channels);
    for (size_t i = k_alpha_channel; i < raster.pixels.size(); i += stride) {
        if (raster.pixels[i] > alpha_threshold) {
            ++count;
        }
    }
    return count;
}

} // namespace atlasfix::core
