#include "compositor.h"

namespace atlasfix::core {

namespace {

int floor_half(int value) {
    return value >= 0 ? value / 2 : -((-value + 1) / 2);
}

} // namespace

CellPlacement place_group(const Cell& cell, const Bounds& group, Placement placement) {
    CellPlacement result;
    result.group = group;
    result.target_x = cell.x + floor_half(cell.w - group.width());
    if (placement == Placement::Center) {
        result.target_y = cell.y + floor_half(cell.h - group.height());
    } else {
        result.target_y = cell.bottom() - group.height();
    }
    return result;
}

Raster composite_cells(const Raster& source,
                       const std::vector<Part>& parts,
                       const CellAssignment& assignment,
                       const Grid& grid,
                       Placement placement,
                       std::vector<CellPlacement>* placements) {
    Raster output = make_blank_raster(source.width, source.height, source.channels);

    for (int cell_index = 0; cell_index < k_cell_count; ++cell_index) {
        const std::vector<size_t>& approved = assignment.cells[static_cast<size_t>(cell_index)];
        if (approved.empty()) {
            continue;
        }

        Bounds group = parts[approved.front()].bounds;
        for (size_t idx : approved) {
            group.include(parts[idx].bounds);
        }

        CellPlacement cell_placement = place_group(grid.cell(cell_index), group, placement);
        cell_placement.cell = cell_index;
        cell_placement.part_count = approved.size();

        for (size_t idx : approved) {
            for (const Point& p : parts[idx].pixels) {
                const int new_x = cell_placement.target_x + (p.x - group.min_x);
                const int new_y = cell_placement.target_y + (p.y - group.min_y);
                if (output.contains(new_x, new_y)) {
                    copy_pixel(source, p.x, p.y, output, new_x, new_y);
                }
            }
        }

        if (placements != nullptr) {
            placements->push_back(cell_placement);
        }
    }

    return output;
}

} // namespace atlasfix::core
