#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace atlasfix::core {

constexpr int k_grid_columns = 3;
constexpr int k_grid_rows = 3;
constexpr int k_cell_count = k_grid_columns * k_grid_rows;

struct Cell {
    int column = 0;
    int row = 0;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    [[nodiscard]] int right() const { return x + w; }
    [[nodiscard]] int bottom() const { return y + h; }

    [[nodiscard]] bool contains(int px, int py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }
};

// 3x3 partition of a width x height raster. Cells are stored row-major and
// use floor(i * size / 3) edges, so 1024 splits into 341/341/342.
class Grid {
public:
    Grid(int width, int height);

    [[nodiscard]] const Cell& cell(int index) const { return cells_[static_cast<size_t>(index)]; }
    [[nodiscard]] const std::array<Cell, k_cell_count>& cells() const { return cells_; }

    // Index of the cell holding (x, y), or -1 outside the raster.
    [[nodiscard]] int cell_index_at(int x, int y) const;

    // Grid line positions along each axis, including both raster borders.
    [[nodiscard]] const std::array<int, k_grid_columns + 1>& column_edges() const { return column_edges_; }
    [[nodiscard]] const std::array<int, k_grid_rows + 1>& row_edges() const { return row_edges_; }

    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }

private:
    int width_ = 0;
    int height_ = 0;
    std::array<Cell, k_cell_count> cells_{};
    std::array<int, k_grid_columns + 1> column_edges_{};
    std::array<int, k_grid_rows + 1> row_edges_{};
    std::vector<int> column_of_x_;
    std::vector<int> row_of_y_;
};

} // namespace atlasfix::core
