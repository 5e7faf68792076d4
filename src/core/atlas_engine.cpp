#include "atlas_engine.h"

#include <utility>

#include "cli_parse.h"
#include "grid.h"

namespace atlasfix::core {

EngineOptions options_for_mode(AlignmentMode mode) {
    EngineOptions options;
    if (mode == AlignmentMode::Silhouette) {
        options.filter = OwnershipFilter::Silhouette;
        options.placement = Placement::Bottom;
        options.separate_bridges = true;
    } else {
        options.filter = OwnershipFilter::Icon;
        options.placement = Placement::Center;
        options.separate_bridges = false;
    }
    return options;
}

bool parse_alignment_mode(const std::string& value, AlignmentMode& out, std::string& error) {
    const std::string lower = to_lower_copy(value);
    if (lower == "icon") {
        out = AlignmentMode::Icon;
        return true;
    }
    if (lower == "silhouette") {
        out = AlignmentMode::Silhouette;
        return true;
    }
    error = "Alignment mode must be \"icon\" or \"silhouette\"";
    return false;
}

const char* alignment_mode_name(AlignmentMode mode) {
    return mode == AlignmentMode::Silhouette ? "silhouette" : "icon";
}

bool validate_atlas(const Raster& input, std::string& error) {
    if (input.width != k_atlas_size || input.height != k_atlas_size) {
        error = "Input image must be 1024x1024 pixels";
        return false;
    }
    if (input.channels < k_rgba_channels) {
        error = "Input image must have an alpha channel";
        return false;
    }
    return is_valid_raster(input, error);
}

bool process_atlas(const Raster& input, AlignmentMode mode, Raster& output, std::string& error) {
    return process_atlas(input, options_for_mode(mode), output, error);
}

bool process_atlas(const Raster& input, const EngineOptions& options, Raster& output, std::string& error,
                   EngineReport* report) {
    if (!validate_atlas(input, error)) {
        return false;
    }

    const ExtractOptions extract{.alpha_threshold = options.alpha_threshold,
                                 .min_part_pixels = options.min_part_pixels};
    const Grid grid(input.width, input.height);

    // Separation erases pixels, so it works on a private copy.
    Raster working = input;
    std::vector<BridgeCut> cuts;
    if (options.separate_bridges) {
        SeparationOptions separation;
        separation.extract = extract;
        cuts = separate_bridges(working, separation);
    }

    const std::vector<Part> parts = extract_parts(working, extract);
    const CellAssignment assignment = resolve_ownership(parts, grid, options.filter);

    std::vector<CellPlacement> placements;
    Raster result = composite_cells(working, parts, assignment, grid, options.placement,
                                    report != nullptr ? &placements : nullptr);

    if (report != nullptr) {
        report->part_count = parts.size();
        report->rejected_parts = assignment.rejected;
        report->cuts = std::move(cuts);
        report->placements = std::move(placements);
    }

    output = std::move(result);
    return true;
}

} // namespace atlasfix::core
