// atlasfix_command.cpp
// Re-centers the nine illustrations of a 3x3 PNG atlas.

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <fcntl.h>
#include <stdio.h>
#ifndef _O_BINARY
#define _O_BINARY 0x8000
#endif
#ifndef _fileno
#define _fileno fileno
#endif
#ifndef _setmode
#define _setmode setmode
#endif
#endif
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "commands.h"
#include "core/atlas_engine.h"
#include "core/png_io.h"
#include "core/profiles.h"

namespace fs = std::filesystem;

namespace {

using atlasfix::core::AlignmentMode;
using atlasfix::core::EngineOptions;
using atlasfix::core::EngineReport;
using atlasfix::core::OwnershipFilter;
using atlasfix::core::Placement;
using atlasfix::core::ProfileDefinition;
using atlasfix::core::Raster;

struct FixConfig {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> mode_name;
    std::optional<std::string> profile_name;
    std::string profiles_config_path;
    bool list_profiles = false;
    bool verbose = false;
};

const char* filter_name(OwnershipFilter filter) {
    switch (filter) {
        case OwnershipFilter::Icon:
            return "icon";
        case OwnershipFilter::Generic:
            return "generic";
        case OwnershipFilter::Silhouette:
            return "silhouette";
    }
    return "unknown";
}

const char* placement_name(Placement placement) {
    return placement == Placement::Bottom ? "bottom" : "center";
}

void print_usage() {
    std::cout << "Usage: atlasfix [OPTIONS] [INPUT]\n\n"
              << "Re-center the illustrations of a 1024x1024 3x3 PNG atlas.\n"
              << "Reads INPUT (or stdin when INPUT is missing or '-') and writes a PNG.\n\n"
              << "Options:\n"
              << "  --mode MODE              icon (centered) or silhouette (bottom aligned,\n"
              << "                           fused silhouettes separated). Default: icon\n"
              << "  --profile NAME           Use a named profile instead of --mode\n"
              << "  --profiles-config PATH   Profiles file (default: ./" << atlasfix::core::k_profiles_config_filename
              << ", ~/" << atlasfix::core::k_user_profiles_config_relpath << ", "
              << atlasfix::core::k_global_profiles_config_path << ")\n"
              << "  --list-profiles          Print available profiles and exit\n"
              << "  -o, --output PATH        Write the PNG to PATH instead of stdout\n"
              << "  --verbose                Report parts, cuts and placements on stderr\n"
              << "  --help, -h               Show this help message\n\n"
              << "Examples:\n"
              << "  atlasfix --mode icon food.png -o food-fixed.png\n"
              << "  atlasfix --profile faces < faces.png > faces-fixed.png\n";
}

bool load_profiles(const FixConfig& config, std::vector<ProfileDefinition>& profiles, std::string& error) {
    profiles = atlasfix::core::builtin_profiles();

    std::optional<fs::path> config_path;
    if (!config.profiles_config_path.empty()) {
        config_path = fs::path(config.profiles_config_path);
    } else {
        config_path = atlasfix::core::find_default_profiles_config();
    }
    if (!config_path) {
        return true;
    }

    std::vector<ProfileDefinition> loaded;
    if (!atlasfix::core::load_profiles_config_from_file(*config_path, loaded, error)) {
        return false;
    }
    atlasfix::core::merge_profiles(profiles, loaded);
    return true;
}

bool resolve_options(const FixConfig& config, EngineOptions& options, std::string& label, std::string& error) {
    if (config.profile_name) {
        std::vector<ProfileDefinition> profiles;
        if (!load_profiles(config, profiles, error)) {
            return false;
        }
        const ProfileDefinition* profile = atlasfix::core::find_profile(profiles, *config.profile_name);
        if (profile == nullptr) {
            error = "Unknown profile: " + *config.profile_name;
            return false;
        }
        options = atlasfix::core::resolve_profile_options(*profile);
        label = "profile " + profile->name;
        return true;
    }

    AlignmentMode mode = AlignmentMode::Icon;
    if (config.mode_name && !atlasfix::core::parse_alignment_mode(*config.mode_name, mode, error)) {
        return false;
    }
    options = atlasfix::core::options_for_mode(mode);
    label = std::string("mode ") + atlasfix::core::alignment_mode_name(mode);
    return true;
}

bool read_input(const std::string& path, std::vector<unsigned char>& bytes, std::string& error) {
    if (path.empty() || path == "-") {
        bytes.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        if (bytes.empty()) {
            error = "No image data on stdin";
            return false;
        }
        return true;
    }
    if (!fs::exists(path) || !fs::is_regular_file(path)) {
        error = "Input file does not exist or is not a file: " + path;
        return false;
    }
    return atlasfix::core::read_binary_file(path, bytes, error);
}

bool write_output(const std::string& path, const std::vector<unsigned char>& bytes, std::string& error) {
    if (path.empty() || path == "-") {
        std::cout.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        std::cout.flush();
        if (!std::cout) {
            error = "Failed to write PNG to stdout";
            return false;
        }
        return true;
    }
    return atlasfix::core::write_binary_file(path, bytes, error);
}

void print_profiles(const FixConfig& config) {
    std::vector<ProfileDefinition> profiles;
    std::string error;
    if (!load_profiles(config, profiles, error)) {
        std::cerr << "Warning: " << error << "; showing built-in profiles only\n";
        profiles = atlasfix::core::builtin_profiles();
    }
    for (const ProfileDefinition& profile : profiles) {
        const EngineOptions options = atlasfix::core::resolve_profile_options(profile);
        std::cout << profile.name
                  << " filter=" << filter_name(options.filter)
                  << " placement=" << placement_name(options.placement)
                  << " separate_bridges=" << (options.separate_bridges ? "true" : "false")
                  << " alpha_threshold=" << static_cast<int>(options.alpha_threshold)
                  << " min_part_pixels=" << options.min_part_pixels << "\n";
    }
}

void report_run(const std::string& label, const EngineOptions& options, const EngineReport& report) {
    std::cerr << "atlasfix: " << label
              << " (filter " << filter_name(options.filter)
              << ", placement " << placement_name(options.placement)
              << ", bridges " << (options.separate_bridges ? "on" : "off") << ")\n";
    std::cerr << "atlasfix: " << report.part_count << " parts, "
              << report.rejected_parts << " rejected, "
              << report.cuts.size() << " bridge cuts\n";
    for (const auto& cut : report.cuts) {
        std::cerr << "atlasfix: cut "
                  << (cut.pass == atlasfix::core::SeparationPass::Rows ? "column" : "row")
                  << " " << cut.first_line << "-" << cut.last_line
                  << " (band " << cut.band << ", bridge " << cut.bridge_width << "px, "
                  << cut.erased_pixels << " pixels erased)\n";
    }
    for (const auto& placement : report.placements) {
        std::cerr << "atlasfix: cell " << placement.cell << " <- " << placement.part_count << " parts, "
                  << placement.group.width() << "x" << placement.group.height()
                  << " at " << placement.target_x << "," << placement.target_y << "\n";
    }
}

} // namespace

int run_atlasfix(int argc, char** argv) {
#ifdef _WIN32
    if (_setmode(_fileno(stdout), _O_BINARY) == -1) {
        std::cerr << "Failed to set stdout to binary mode\n";
    }
    if (_setmode(_fileno(stdin), _O_BINARY) == -1) {
        std::cerr << "Failed to set stdin to binary mode\n";
    }
#endif
    FixConfig config;
    bool show_help = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--mode" && i + 1 < argc) {
            config.mode_name = argv[++i];
        } else if (arg == "--profile" && i + 1 < argc) {
            config.profile_name = argv[++i];
        } else if (arg == "--profiles-config" && i + 1 < argc) {
            config.profiles_config_path = argv[++i];
        } else if (arg == "--list-profiles") {
            config.list_profiles = true;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            config.output_path = argv[++i];
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg != "-" && (arg.empty() || arg[0] == '-')) {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return 1;
        } else {
            if (config.input_path.empty()) {
                config.input_path = arg;
            } else {
                std::cerr << "Error: Too many arguments" << '\n';
                print_usage();
                return 1;
            }
        }
    }

    if (show_help) {
        print_usage();
        return 0;
    }

    if (config.list_profiles) {
        print_profiles(config);
        return 0;
    }

    if (config.mode_name && config.profile_name) {
        std::cerr << "Error: --mode and --profile cannot be combined" << '\n';
        return 1;
    }

    EngineOptions options;
    std::string label;
    std::string error;
    if (!resolve_options(config, options, label, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }

    std::vector<unsigned char> input_bytes;
    if (!read_input(config.input_path, input_bytes, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }

    Raster input;
    if (!atlasfix::core::decode_png(input_bytes, input, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }
    if (config.verbose) {
        std::cerr << "atlasfix: input " << input.width << "x" << input.height
                  << ", " << input.channels << " channels\n";
    }

    Raster output;
    EngineReport report;
    if (!atlasfix::core::process_atlas(input, options, output, error, &report)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }
    if (config.verbose) {
        report_run(label, options, report);
    }
    if (report.placements.empty()) {
        std::cerr << "Warning: No cell received any content" << '\n';
    }

    std::vector<unsigned char> png;
    if (!atlasfix::core::encode_png(output, png, error)
        || !write_output(config.output_path, png, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }

    return 0;
}
