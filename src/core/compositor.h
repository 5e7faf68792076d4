#pragma once

#include <vector>

#include "components.h"
#include "grid.h"
#include "ownership.h"
#include "raster.h"

namespace atlasfix::core {

enum class Placement { Center, Bottom };

struct CellPlacement {
    int cell = 0;
    Bounds group;
    int target_x = 0;
    int target_y = 0;
    size_t part_count = 0;
};

// Top-left corner for a group of the given size inside the cell. Bottom
// placement may return a target above the cell when the group is taller.
CellPlacement place_group(const Cell& cell, const Bounds& group, Placement placement);

// Writes every approved part into a transparent raster shaped like source,
// moving each cell's group as one block so parts keep their relative layout.
// Pixels landing outside the raster are dropped.
Raster composite_cells(const Raster& source,
                       const std::vector<Part>& parts,
                       const CellAssignment& assignment,
                       const Grid& grid,
                       Placement placement,
                       std::vector<CellPlacement>* placements = nullptr);

} // namespace atlasfix::core
