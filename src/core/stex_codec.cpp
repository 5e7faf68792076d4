#include "stex_codec.h"

#include <array>
#include <cstring>
#include <limits>
#include <utility>

#include "cli_parse.h"

namespace atlasfix::core {

namespace {

constexpr size_t k_magic_size = 4;
constexpr int k_max_dimension = std::numeric_limits<std::uint16_t>::max();
constexpr int k_max_channel_value = 255;

struct FormatInfo {
    ImageFormat format;
    const char* name;
    int bytes_per_pixel;
};

constexpr std::array<FormatInfo, 9> k_formats = {{
    {.format = ImageFormat::L8, .name = "L8", .bytes_per_pixel = 1},
    {.format = ImageFormat::LA8, .name = "LA8", .bytes_per_pixel = 2},
    {.format = ImageFormat::R8, .name = "R8", .bytes_per_pixel = 1},
    {.format = ImageFormat::RG8, .name = "RG8", .bytes_per_pixel = 2},
    {.format = ImageFormat::RGB8, .name = "RGB8", .bytes_per_pixel = 3},
    {.format = ImageFormat::RGBA8, .name = "RGBA8", .bytes_per_pixel = 4},
    {.format = ImageFormat::RGB565, .name = "RGB565", .bytes_per_pixel = 2},
    {.format = ImageFormat::RGBA4444, .name = "RGBA4444", .bytes_per_pixel = 2},
    {.format = ImageFormat::RGBA5551, .name = "RGBA5551", .bytes_per_pixel = 2},
}};

const FormatInfo* find_format(std::uint32_t format_id) {
    for (const FormatInfo& info : k_formats) {
        if (static_cast<std::uint32_t>(info.format) == format_id) {
            return &info;
        }
    }
    return nullptr;
}

std::uint16_t read_le16(const unsigned char* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t read_le32(const unsigned char* p) {
    return static_cast<std::uint32_t>(p[0])
           | (static_cast<std::uint32_t>(p[1]) << 8)
           | (static_cast<std::uint32_t>(p[2]) << 16)
           | (static_cast<std::uint32_t>(p[3]) << 24);
}

void write_le16(std::vector<unsigned char>& out, std::uint16_t v) {
    out.push_back(static_cast<unsigned char>(v & 0xFFU));
    out.push_back(static_cast<unsigned char>((v >> 8) & 0xFFU));
}

void write_le32(std::vector<unsigned char>& out, std::uint32_t v) {
    out.push_back(static_cast<unsigned char>(v & 0xFFU));
    out.push_back(static_cast<unsigned char>((v >> 8) & 0xFFU));
    out.push_back(static_cast<unsigned char>((v >> 16) & 0xFFU));
    out.push_back(static_cast<unsigned char>((v >> 24) & 0xFFU));
}

struct Rgba {
    unsigned char r, g, b, a;
};

// Expands 1 (grey), 2 (grey + alpha), 3 (RGB) or 4+ (RGBA...) channels.
Rgba read_rgba(const Raster& raster, size_t offset) {
    const unsigned char* p = raster.pixels.data() + offset;
    switch (raster.channels) {
        case 1:
            return Rgba{.r = p[0], .g = p[0], .b = p[0], .a = k_max_channel_value};
        case 2:
            return Rgba{.r = p[0], .g = p[0], .b = p[0], .a = p[1]};
        case 3:
            return Rgba{.r = p[0], .g = p[1], .b = p[2], .a = k_max_channel_value};
        default:
            return Rgba{.r = p[0], .g = p[1], .b = p[2], .a = p[3]};
    }
}

unsigned char luminance(const Rgba& c) {
    return static_cast<unsigned char>(((77 * c.r) + (150 * c.g) + (29 * c.b) + 128) >> 8);
}

} // namespace

size_t StexHeader::expected_pixel_data_size() const {
    return static_cast<size_t>(width) * static_cast<size_t>(height)
           * static_cast<size_t>(bytes_per_pixel(image_format_id()));
}

int bytes_per_pixel(std::uint32_t format_id) {
    const FormatInfo* info = find_format(format_id);
    return info != nullptr ? info->bytes_per_pixel : 4;
}

const char* image_format_name(std::uint32_t format_id) {
    const FormatInfo* info = find_format(format_id);
    return info != nullptr ? info->name : "UNKNOWN";
}

bool parse_image_format(const std::string& value, ImageFormat& out, std::string& error) {
    const std::string lower = to_lower_copy(value);
    for (const FormatInfo& info : k_formats) {
        if (lower == to_lower_copy(info.name)) {
            out = info.format;
            return true;
        }
    }
    error = "invalid image format '" + value + "'";
    return false;
}

bool parse_stex_header(const std::vector<unsigned char>& bytes, StexHeader& out, std::string& error) {
    if (bytes.size() < k_stex_header_size) {
        error = "Invalid STEX file: too small";
        return false;
    }
    if (std::memcmp(bytes.data(), k_stex_magic, k_magic_size) != 0) {
        error = "Invalid STEX magic: expected 'GDST', got '"
                + std::string(reinterpret_cast<const char*>(bytes.data()), k_magic_size) + "'";
        return false;
    }

    const unsigned char* p = bytes.data();
    StexHeader header;
    header.width = read_le16(p + 4);
    header.width_b = read_le16(p + 6);
    header.height = read_le16(p + 8);
    header.height_b = read_le16(p + 10);
    header.texture_flags = read_le32(p + 12);
    header.format = read_le32(p + 16);
    out = header;
    return true;
}

bool build_stex_header(int width, int height, ImageFormat format,
                       std::uint32_t texture_flags, std::uint32_t feature_flags,
                       std::vector<unsigned char>& out, std::string& error) {
    if (width <= 0 || height <= 0 || width > k_max_dimension || height > k_max_dimension) {
        error = "Texture dimensions out of range: " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }

    std::vector<unsigned char> header;
    header.reserve(k_stex_header_size);
    header.insert(header.end(), k_stex_magic, k_stex_magic + k_magic_size);
    write_le16(header, static_cast<std::uint16_t>(width));
    write_le16(header, 0);
    write_le16(header, static_cast<std::uint16_t>(height));
    write_le16(header, 0);
    write_le32(header, texture_flags);
    write_le32(header, static_cast<std::uint32_t>(format) | (feature_flags & k_feature_flags_mask));
    out = std::move(header);
    return true;
}

bool convert_pixels(const Raster& raster, ImageFormat format, std::vector<unsigned char>& out, std::string& error) {
    if (!is_valid_raster(raster, error)) {
        return false;
    }

    const size_t pixel_count = static_cast<size_t>(raster.width) * static_cast<size_t>(raster.height);
    const auto stride = static_cast<size_t>(raster.channels);
    const int bpp = bytes_per_pixel(static_cast<std::uint32_t>(format));

    std::vector<unsigned char> data;
    data.reserve(pixel_count * static_cast<size_t>(bpp));

    for (size_t i = 0; i < pixel_count; ++i) {
        const Rgba c = read_rgba(raster, i * stride);
        switch (format) {
            case ImageFormat::L8:
                data.push_back(luminance(c));
                break;
            case ImageFormat::LA8:
                data.push_back(luminance(c));
                data.push_back(c.a);
                break;
            case ImageFormat::R8:
                data.push_back(c.r);
                break;
            case ImageFormat::RG8:
                data.push_back(c.r);
                data.push_back(c.g);
                break;
            case ImageFormat::RGB8:
                data.push_back(c.r);
                data.push_back(c.g);
                data.push_back(c.b);
                break;
            case ImageFormat::RGBA8:
                data.push_back(c.r);
                data.push_back(c.g);
                data.push_back(c.b);
                data.push_back(c.a);
                break;
            case ImageFormat::RGB565:
                write_le16(data, static_cast<std::uint16_t>(((c.r >> 3) << 11) | ((c.g >> 2) << 5) | (c.b >> 3)));
                break;
            case ImageFormat::RGBA4444:
                write_le16(data, static_cast<std::uint16_t>(((c.r >> 4) << 12) | ((c.g >> 4) << 8)
                                                            | ((c.b >> 4) << 4) | (c.a >> 4)));
                break;
            case ImageFormat::RGBA5551:
                write_le16(data, static_cast<std::uint16_t>(((c.r >> 3) << 11) | ((c.g >> 3) << 6)
                                                            | ((c.b >> 3) << 1) | (c.a >= 128 ? 1 : 0)));
                break;
        }
    }

    out = std::move(data);
    return true;
}

bool replace_stex_texture(const std::vector<unsigned char>& existing,
                          const Raster& image,
                          const ReplaceOptions& options,
                          std::vector<unsigned char>& out,
                          ReplaceSummary& summary,
                          std::string& error) {
    StexHeader existing_header;
    if (!parse_stex_header(existing, existing_header, error)) {
        return false;
    }

    const std::uint32_t texture_flags = options.texture_flags.value_or(existing_header.texture_flags);
    const std::uint32_t feature_flags =
        options.feature_flags.value_or(existing_header.feature_flags() & ~k_feature_has_mipmaps);

    std::vector<unsigned char> container;
    if (!build_stex_header(image.width, image.height, options.format, texture_flags, feature_flags, container, error)) {
        return false;
    }

    std::vector<unsigned char> pixel_data;
    if (!convert_pixels(image, options.format, pixel_data, error)) {
        return false;
    }
    container.insert(container.end(), pixel_data.begin(), pixel_data.end());

    summary.original_size = existing.size();
    summary.new_size = container.size();
    summary.original_width = existing_header.width;
    summary.original_height = existing_header.height;
    summary.new_width = image.width;
    summary.new_height = image.height;
    summary.format = options.format;
    summary.bytes_per_pixel = bytes_per_pixel(static_cast<std::uint32_t>(options.format));
    summary.pixel_data_size = pixel_data.size();

    out = std::move(container);
    return true;
}

} // namespace atlasfix::core
