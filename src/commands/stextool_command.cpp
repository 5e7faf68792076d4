// stextool_command.cpp
// Inspects stream texture containers and swaps their pixel payload for a PNG.

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "commands.h"
#include "core/cli_parse.h"
#include "core/png_io.h"
#include "core/stex_codec.h"

namespace fs = std::filesystem;

namespace {

using atlasfix::core::ImageFormat;
using atlasfix::core::Raster;
using atlasfix::core::ReplaceOptions;
using atlasfix::core::ReplaceSummary;
using atlasfix::core::StexHeader;

struct ReplaceConfig {
    std::string texture_path;
    std::string image_path;
    std::string output_path;
    ReplaceOptions options;
};

void print_usage() {
    std::cout << "Usage: stextool info FILE\n"
              << "       stextool replace FILE IMAGE [OPTIONS]\n\n"
              << "info     Print the header of a GDST texture container\n"
              << "replace  Rebuild the container around the pixels of a PNG image\n\n"
              << "Replace options:\n"
              << "  --format NAME            L8, LA8, R8, RG8, RGB8, RGBA8, RGB565,\n"
              << "                           RGBA4444 or RGBA5551. Default: RGBA8\n"
              << "  --texture-flags N        Texture flags (decimal or 0x hex). Default: keep\n"
              << "  --feature-flags N        Feature flags (decimal or 0x hex). Default: keep,\n"
              << "                           without HAS_MIPMAPS\n"
              << "  -o, --output PATH        Output file. Default: overwrite FILE\n"
              << "  --help, -h               Show this help message\n";
}

std::string hex32(std::uint32_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

std::string describe_feature_flags(std::uint32_t flags) {
    std::string names;
    auto append = [&names](const char* name) {
        if (!names.empty()) {
            names += ",";
        }
        names += name;
    };
    if ((flags & atlasfix::core::k_feature_has_mipmaps) != 0U) {
        append("HAS_MIPMAPS");
    }
    if ((flags & atlasfix::core::k_feature_stream) != 0U) {
        append("STREAM");
    }
    if ((flags & atlasfix::core::k_feature_detect_3d) != 0U) {
        append("DETECT_3D");
    }
    if ((flags & atlasfix::core::k_feature_detect_srgb) != 0U) {
        append("DETECT_SRGB");
    }
    if ((flags & atlasfix::core::k_feature_detect_normal) != 0U) {
        append("DETECT_NORMAL");
    }
    return names.empty() ? "none" : names;
}

int run_info(const std::string& path) {
    std::vector<unsigned char> bytes;
    std::string error;
    if (!atlasfix::core::read_binary_file(path, bytes, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }
    StexHeader header;
    if (!atlasfix::core::parse_stex_header(bytes, header, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }

    const std::uint32_t format_id = header.image_format_id();
    std::cout << "file: " << path << "\n"
              << "size: " << bytes.size() << "\n"
              << "width: " << header.width << "\n"
              << "height: " << header.height << "\n"
              << "texture_flags: " << hex32(header.texture_flags) << "\n"
              << "format: " << atlasfix::core::image_format_name(format_id)
              << " (" << format_id << ", " << atlasfix::core::bytes_per_pixel(format_id) << " bytes per pixel)\n"
              << "feature_flags: " << hex32(header.feature_flags())
              << " (" << describe_feature_flags(header.feature_flags()) << ")\n";

    const size_t payload = bytes.size() - atlasfix::core::k_stex_header_size;
    const size_t expected = header.expected_pixel_data_size();
    if (!header.has_mipmaps() && payload != expected) {
        std::cerr << "Warning: Pixel data is " << payload << " bytes, expected " << expected << '\n';
    }
    return 0;
}

bool parse_replace_args(int argc, char** argv, ReplaceConfig& config, std::string& error) {
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--format" && i + 1 < argc) {
            if (!atlasfix::core::parse_image_format(argv[++i], config.options.format, error)) {
                return false;
            }
        } else if (arg == "--texture-flags" && i + 1 < argc) {
            std::uint32_t value = 0;
            if (!atlasfix::core::parse_uint32(argv[++i], value)) {
                error = std::string("Invalid --texture-flags value: ") + argv[i];
                return false;
            }
            config.options.texture_flags = value;
        } else if (arg == "--feature-flags" && i + 1 < argc) {
            std::uint32_t value = 0;
            if (!atlasfix::core::parse_uint32(argv[++i], value)) {
                error = std::string("Invalid --feature-flags value: ") + argv[i];
                return false;
            }
            config.options.feature_flags = value;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            config.output_path = argv[++i];
        } else if (arg.empty() || arg[0] == '-') {
            error = "Unknown option: " + arg;
            return false;
        } else if (config.texture_path.empty()) {
            config.texture_path = arg;
        } else if (config.image_path.empty()) {
            config.image_path = arg;
        } else {
            error = "Too many arguments";
            return false;
        }
    }
    if (config.texture_path.empty() || config.image_path.empty()) {
        error = "replace needs a texture file and an image file";
        return false;
    }
    if (config.output_path.empty()) {
        config.output_path = config.texture_path;
    }
    return true;
}

int run_replace(int argc, char** argv) {
    ReplaceConfig config;
    std::string error;
    if (!parse_replace_args(argc, argv, config, error)) {
        std::cerr << "Error: " << error << '\n';
        print_usage();
        return 1;
    }

    std::vector<unsigned char> existing;
    if (!atlasfix::core::read_binary_file(config.texture_path, existing, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }
    Raster image;
    if (!atlasfix::core::load_png(config.image_path, image, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }

    std::vector<unsigned char> container;
    ReplaceSummary summary;
    if (!atlasfix::core::replace_stex_texture(existing, image, config.options, container, summary, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }
    if (!atlasfix::core::write_binary_file(config.output_path, container, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }

    std::cerr << "stextool: " << fs::path(config.texture_path).filename().string()
              << " " << summary.original_width << "x" << summary.original_height
              << " (" << summary.original_size << " bytes) -> "
              << summary.new_width << "x" << summary.new_height << " "
              << atlasfix::core::image_format_name(static_cast<std::uint32_t>(summary.format))
              << " (" << summary.new_size << " bytes, " << summary.bytes_per_pixel << " bytes per pixel)\n";
    return 0;
}

} // namespace

int run_stextool(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }
    if (command == "info") {
        if (argc != 3) {
            std::cerr << "Error: info needs exactly one file" << '\n';
            return 1;
        }
        return run_info(argv[2]);
    }
    if (command == "replace") {
        return run_replace(argc, argv);
    }

    std::cerr << "Error: Unknown command: " << command << '\n';
    print_usage();
    return 1;
}
