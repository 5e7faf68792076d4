#include "png_io.h"

#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace atlasfix::core {

namespace {

constexpr int k_max_image_dimension = 32768;
constexpr size_t k_max_total_pixels = 100000000;
constexpr int k_max_png_channels = 4;

} // namespace

bool decode_png(const std::vector<unsigned char>& bytes, Raster& out, std::string& error) {
    if (bytes.empty()) {
        error = "Failed to decode image: empty input";
        return false;
    }
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        error = "Failed to decode image: input too large";
        return false;
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                &width, &height, &channels, 0);
    if (data == nullptr) {
        const char* reason = stbi_failure_reason();
        error = std::string("Failed to decode image: ") + (reason != nullptr ? reason : "unknown error");
        return false;
    }

    if (width <= 0 || height <= 0 || width > k_max_image_dimension || height > k_max_image_dimension) {
        error = "Invalid image dimensions: " + std::to_string(width) + "x" + std::to_string(height);
        stbi_image_free(data);
        return false;
    }

    size_t total_pixels = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (total_pixels > k_max_total_pixels) {
        error = "Image too large: " + std::to_string(total_pixels) + " pixels";
        stbi_image_free(data);
        return false;
    }

    Raster raster;
    raster.width = width;
    raster.height = height;
    raster.channels = channels;
    raster.pixels.assign(data, data + (total_pixels * static_cast<size_t>(channels)));
    stbi_image_free(data);

    out = std::move(raster);
    return true;
}

bool load_png(const std::filesystem::path& path, Raster& out, std::string& error) {
    std::vector<unsigned char> bytes;
    if (!read_binary_file(path, bytes, error)) {
        return false;
    }
    return decode_png(bytes, out, error);
}

bool encode_png(const Raster& raster, std::vector<unsigned char>& out, std::string& error) {
    if (!is_valid_raster(raster, error)) {
        return false;
    }
    if (raster.channels > k_max_png_channels) {
        error = "PNG output supports at most 4 channels, got " + std::to_string(raster.channels);
        return false;
    }

    std::vector<unsigned char> encoded;
    auto write_callback = [](void* context, void* data, int size) {
        auto* sink = static_cast<std::vector<unsigned char>*>(context);
        const auto* bytes = static_cast<const unsigned char*>(data);
        sink->insert(sink->end(), bytes, bytes + size);
    };

    if (stbi_write_png_to_func(write_callback, &encoded,
                               raster.width, raster.height, raster.channels,
                               raster.pixels.data(), raster.width * raster.channels) == 0) {
        error = "Failed to write PNG";
        return false;
    }

    out = std::move(encoded);
    return true;
}

bool write_png(const std::filesystem::path& path, const Raster& raster, std::string& error) {
    std::vector<unsigned char> encoded;
    if (!encode_png(raster, encoded, error)) {
        return false;
    }
    return write_binary_file(path, encoded, error);
}

bool read_binary_file(const std::filesystem::path& path, std::vector<unsigned char>& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    out = std::move(bytes);
    return true;
}

bool write_binary_file(const std::filesystem::path& path, const std::vector<unsigned char>& bytes, std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Failed to open file for writing: " + path.string();
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        error = "Failed to write file: " + path.string();
        return false;
    }
    return true;
}

} // namespace atlasfix::core
