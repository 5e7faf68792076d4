#include "grid.h"

namespace atlasfix::core {

Grid::Grid(int width, int height) : width_(width), height_(height) {
    for (int i = 0; i <= k_grid_columns; ++i) {
        column_edges_[static_cast<size_t>(i)] = (i * width) / k_grid_columns;
    }
    for (int i = 0; i <= k_grid_rows; ++i) {
        row_edges_[static_cast<size_t>(i)] = (i * height) / k_grid_rows;
    }

    for (int row = 0; row < k_grid_rows; ++row) {
        for (int column = 0; column < k_grid_columns; ++column) {
            Cell& cell = cells_[static_cast<size_t>((row * k_grid_columns) + column)];
            cell.column = column;
            cell.row = row;
            cell.x = column_edges_[static_cast<size_t>(column)];
            cell.y = row_edges_[static_cast<size_t>(row)];
            cell.w = column_edges_[static_cast<size_t>(column) + 1] - cell.x;
            cell.h = row_edges_[static_cast<size_t>(row) + 1] - cell.y;
        }
    }

    // Per-axis lookups so per-pixel cell queries avoid testing nine rectangles.
    column_of_x_.assign(static_cast<size_t>(width > 0 ? width : 0), 0);
    for (int column = 0; column < k_grid_columns; ++column) {
        for (int x = column_edges_[static_cast<size_t>(column)]; x < column_edges_[static_cast<size_t>(column) + 1]; ++x) {
            column_of_x_[static_cast<size_t>(x)] = column;
        }
    }
    row_of_y_.assign(static_cast<size_t>(height > 0 ? height : 0), 0);
    for (int row = 0; row < k_grid_rows; ++row) {
        for (int y = row_edges_[static_cast<size_t>(row)]; y < row_edges_[static_cast<size_t>(row) + 1]; ++y) {
            row_of_y_[static_cast<size_t>(y)] = row;
        }
    }
}

int Grid::cell_index_at(int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return -1;
    }
    return (row_of_y_[static_cast<size_t>(y)] * k_grid_columns) + column_of_x_[static_cast<size_t>(x)];
}

} // namespace atlasfix::core
