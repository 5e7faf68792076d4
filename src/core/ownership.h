#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "components.h"
#include "grid.h"

namespace atlasfix::core {

// Which parts may own a cell at all.
//   Icon:       compact parts only (touching at most two cells).
//   Generic:    anything but border-spanning background (more than five cells).
//   Silhouette: cell-sized, cell-aligned shapes touching fewer than five cells.
enum class OwnershipFilter { Icon, Generic, Silhouette };

constexpr int k_icon_max_span = 2;
constexpr int k_generic_max_span = 5;
constexpr int k_silhouette_max_span = 4;
constexpr int k_silhouette_min_extent = 200;
constexpr int k_silhouette_max_extent = 400;
// Allowed overhang of a silhouette past its cell, in percent of the cell size.
constexpr int k_silhouette_cell_margin_percent = 20;

struct OwnershipRecord {
    std::array<size_t, k_cell_count> counts{};
    int span = 0;
    // Cell with the most member pixels; the first such cell in row-major
    // order on ties. -1 for a part with no pixels.
    int owner = -1;
};

struct CellAssignment {
    // Indices into the part list, in part discovery order.
    std::array<std::vector<size_t>, k_cell_count> cells;
    size_t rejected = 0;
};

OwnershipRecord measure_ownership(const Part& part, const Grid& grid);

[[nodiscard]] bool passes_filter(const Part& part, const OwnershipRecord& record, const Grid& grid, OwnershipFilter filter);

CellAssignment resolve_ownership(const std::vector<Part>& parts, const Grid& grid, OwnershipFilter filter);

} // namespace atlasfix::core
