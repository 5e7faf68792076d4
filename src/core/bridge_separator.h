#pragma once

#include <cstddef>
#include <vector>

#include "components.h"
#include "raster.h"

namespace atlasfix::core {

// Direction of one separation pass.
//   Rows:    walks the three row bands and cuts vertical lines (columns),
//            undoing silhouettes fused side by side.
//   Columns: walks the three column bands and cuts horizontal lines (rows),
//            undoing silhouettes fused on top of each other.
enum class SeparationPass { Rows, Columns };

struct BridgeCut {
    SeparationPass pass = SeparationPass::Rows;
    int band = 0;
    // Narrowest line found in the search window and the erased line range
    // around it, in raster coordinates along the cut axis.
    int line = 0;
    int first_line = 0;
    int last_line = 0;
    int bridge_width = 0;
    size_t erased_pixels = 0;
};

struct SeparationOptions {
    ExtractOptions extract;
    int min_cross_extent = 50;
    // Minimum share of a part's pixels that must fall inside a band, in percent.
    int min_band_mass_percent = 30;
    int search_radius = 20;
    // Width of one silhouette relative to a cell: parts are cut once they grow
    // past 1.5 (one cut) or 2.5 (two cuts) times this. At 0.8 a part must be
    // wider than 409 px on a 1024 atlas before it is cut, so every shape the
    // silhouette filter accepts (at most 400 px) stays whole.
    double single_extent_fraction = 0.8;
    // A neck narrower than both of its flanks is erased whole when it is at
    // most this long; otherwise only the narrowest line is erased.
    int max_neck_length = 60;
};

// Runs the row pass and then the column pass on the raster, erasing the
// narrowest bridge of every part that is too wide to be a single silhouette.
// A cut never reaches past the part's body: a part of uniform width loses a
// single line per cut. Parts with no member pixels inside a search window
// stay fused.
std::vector<BridgeCut> separate_bridges(Raster& raster, const SeparationOptions& options = {});

std::vector<BridgeCut> separate_bridges_pass(Raster& raster, SeparationPass pass, const SeparationOptions& options = {});

} // namespace atlasfix::core
