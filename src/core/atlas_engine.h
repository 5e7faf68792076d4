#pragma once

#include <string>
#include <vector>

#include "bridge_separator.h"
#include "compositor.h"
#include "components.h"
#include "ownership.h"
#include "raster.h"

namespace atlasfix::core {

constexpr int k_atlas_size = 1024;

enum class AlignmentMode { Icon, Silhouette };

struct EngineOptions {
    OwnershipFilter filter = OwnershipFilter::Icon;
    Placement placement = Placement::Center;
    bool separate_bridges = false;
    unsigned char alpha_threshold = k_default_alpha_threshold;
    size_t min_part_pixels = k_default_min_part_pixels;
};

// What happened during one run; filled only when requested.
struct EngineReport {
    size_t part_count = 0;
    size_t rejected_parts = 0;
    std::vector<BridgeCut> cuts;
    std::vector<CellPlacement> placements;
};

EngineOptions options_for_mode(AlignmentMode mode);

bool parse_alignment_mode(const std::string& value, AlignmentMode& out, std::string& error);
const char* alignment_mode_name(AlignmentMode mode);

// Rejects anything but a 1024x1024 raster with an alpha channel.
bool validate_atlas(const Raster& input, std::string& error);

// Re-renders every cell of a 3x3 atlas. On failure nothing is written to
// output and error holds the reason. The input is never modified.
bool process_atlas(const Raster& input, AlignmentMode mode, Raster& output, std::string& error);
bool process_atlas(const Raster& input, const EngineOptions& options, Raster& output, std::string& error,
                   EngineReport* report = nullptr);

} // namespace atlasfix::core
