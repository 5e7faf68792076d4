#include "ownership.h"

namespace atlasfix::core {

namespace {

bool within_extent(int extent) {
    return extent >= k_silhouette_min_extent && extent <= k_silhouette_max_extent;
}

// Every edge of the bounding box must stay inside the owner cell grown by the
// allowed margin.
bool aligned_to_cell(const Bounds& bounds, const Cell& cell) {
    const int margin_x = (cell.w * k_silhouette_cell_margin_percent) / 100;
    const int margin_y = (cell.h * k_silhouette_cell_margin_percent) / 100;
    return bounds.min_x >= cell.x - margin_x
           && bounds.max_x < cell.right() + margin_x
           && bounds.min_y >= cell.y - margin_y
           && bounds.max_y < cell.bottom() + margin_y;
}

} // namespace

OwnershipRecord measure_ownership(const Part& part, const Grid& grid) {
    OwnershipRecord record;
    for (const Point& p : part.pixels) {
        const int index = grid.cell_index_at(p.x, p.y);
        if (index >= 0) {
            ++record.counts[static_cast<size_t>(index)];
        }
    }

    size_t max_count = 0;
    for (int i = 0; i < k_cell_count; ++i) {
        const size_t count = record.counts[static_cast<size_t>(i)];
        if (count == 0) {
            continue;
        }
        ++record.span;
        if (count > max_count) {
            max_count = count;
            record.owner = i;
        }
    }
    return record;
}

bool passes_filter(const Part& part, const OwnershipRecord& record, const Grid& grid, OwnershipFilter filter) {
    if (record.owner < 0) {
        return false;
    }
    switch (filter) {
        case OwnershipFilter::Icon:
            return record.span <= k_icon_max_span;
        case OwnershipFilter::Generic:
            return record.span <= k_generic_max_span;
        case OwnershipFilter::Silhouette:
            return record.span <= k_silhouette_max_span
                   && within_extent(part.bounds.width())
                   && within_extent(part.bounds.height())
                   && aligned_to_cell(part.bounds, grid.cell(record.owner));
    }
    return false;
}

CellAssignment resolve_ownership(const std::vector<Part>& parts, const Grid& grid, OwnershipFilter filter) {
    CellAssignment assignment;
    for (size_t i = 0; i < parts.size(); ++i) {
        const OwnershipRecord record = measure_ownership(parts[i], grid);
        if (!passes_filter(parts[i], record, grid, filter)) {
            ++assignment.rejected;
            continue;
        }
        assignment.cells[static_cast<size_t>(record.owner)].push_back(i);
    }
    return assignment;
}

} // namespace atlasfix::core
