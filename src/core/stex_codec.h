#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "raster.h"

namespace atlasfix::core {

// Uncompressed stream texture container: a 20-byte little-endian header
// followed by raw pixel rows.
//
//   offset  size  field
//   0       4     magic "GDST"
//   4       2     width
//   6       2     width (second slot, 0 when uncompressed)
//   8       2     height
//   10      2     height (second slot, 0 when uncompressed)
//   12      4     texture flags
//   16      4     image format id (low 8 bits) | feature flags
constexpr size_t k_stex_header_size = 20;
constexpr const char k_stex_magic[] = "GDST";

enum class ImageFormat : std::uint8_t {
    L8 = 0x00,
    LA8 = 0x01,
    R8 = 0x02,
    RG8 = 0x03,
    RGB8 = 0x04,
    RGBA8 = 0x05,
    RGB565 = 0x06,
    RGBA4444 = 0x07,
    RGBA5551 = 0x08,
};

constexpr std::uint32_t k_format_id_mask = 0x000000FFU;
constexpr std::uint32_t k_feature_flags_mask = 0xFFFFFF00U;

constexpr std::uint32_t k_feature_has_mipmaps = 0x00010000U;
constexpr std::uint32_t k_feature_stream = 0x00020000U;
constexpr std::uint32_t k_feature_detect_3d = 0x00040000U;
constexpr std::uint32_t k_feature_detect_srgb = 0x00080000U;
constexpr std::uint32_t k_feature_detect_normal = 0x00100000U;

constexpr std::uint32_t k_texture_flag_mipmaps = 0x01U;
constexpr std::uint32_t k_texture_flag_repeat = 0x02U;
constexpr std::uint32_t k_texture_flag_filter = 0x04U;
constexpr std::uint32_t k_texture_flag_anisotropic_filter = 0x08U;
constexpr std::uint32_t k_texture_flag_convert_to_linear = 0x10U;
constexpr std::uint32_t k_texture_flag_mirrored_repeat = 0x20U;
constexpr std::uint32_t k_texture_flag_video_surface = 0x40U;

struct StexHeader {
    std::uint16_t width = 0;
    std::uint16_t width_b = 0;
    std::uint16_t height = 0;
    std::uint16_t height_b = 0;
    std::uint32_t texture_flags = 0;
    std::uint32_t format = 0;

    [[nodiscard]] std::uint32_t image_format_id() const { return format & k_format_id_mask; }
    [[nodiscard]] std::uint32_t feature_flags() const { return format & k_feature_flags_mask; }
    [[nodiscard]] bool has_mipmaps() const { return (format & k_feature_has_mipmaps) != 0U; }
    [[nodiscard]] size_t expected_pixel_data_size() const;
};

// Unknown format ids report 4 bytes per pixel.
int bytes_per_pixel(std::uint32_t format_id);
const char* image_format_name(std::uint32_t format_id);
bool parse_image_format(const std::string& value, ImageFormat& out, std::string& error);

bool parse_stex_header(const std::vector<unsigned char>& bytes, StexHeader& out, std::string& error);
bool build_stex_header(int width, int height, ImageFormat format,
                       std::uint32_t texture_flags, std::uint32_t feature_flags,
                       std::vector<unsigned char>& out, std::string& error);

// Converts a 1-4 channel raster to the packed layout of the target format.
// Luminance uses integer Rec.601 weights; 16-bit formats are little endian.
bool convert_pixels(const Raster& raster, ImageFormat format, std::vector<unsigned char>& out, std::string& error);

struct ReplaceOptions {
    ImageFormat format = ImageFormat::RGBA8;
    // Defaults keep the existing texture flags and the existing feature
    // flags minus HAS_MIPMAPS (no mip chain is written).
    std::optional<std::uint32_t> texture_flags;
    std::optional<std::uint32_t> feature_flags;
};

struct ReplaceSummary {
    size_t original_size = 0;
    size_t new_size = 0;
    int original_width = 0;
    int original_height = 0;
    int new_width = 0;
    int new_height = 0;
    ImageFormat format = ImageFormat::RGBA8;
    int bytes_per_pixel = 0;
    size_t pixel_data_size = 0;
};

// Builds a new container holding image, carrying flags over from existing.
bool replace_stex_texture(const std::vector<unsigned char>& existing,
                          const Raster& image,
                          const ReplaceOptions& options,
                          std::vector<unsigned char>& out,
                          ReplaceSummary& summary,
                          std::string& error);

} // namespace atlasfix::core
