#include "bridge_separator.h"

#include <algorithm>
#include <utility>

#include "grid.h"

namespace atlasfix::core {

namespace {

constexpr int k_band_count = 3;
constexpr double k_one_cut_ratio = 1.5;
constexpr double k_two_cut_ratio = 2.5;

struct SplitFraction {
    int numerator;
    int denominator;
};

// Coordinate along which cuts are searched (the part's "width" for this pass).
int along(const Point& p, SeparationPass pass) {
    return pass == SeparationPass::Rows ? p.x : p.y;
}

// Coordinate that decides band membership.
int across(const Point& p, SeparationPass pass) {
    return pass == SeparationPass::Rows ? p.y : p.x;
}

std::vector<SplitFraction> split_fractions(int extent, double single_extent) {
    const double ratio = static_cast<double>(extent) / single_extent;
    if (ratio < k_one_cut_ratio) {
        return {};
    }
    if (ratio < k_two_cut_ratio) {
        return {SplitFraction{.numerator = 1, .denominator = 2}};
    }
    return {SplitFraction{.numerator = 1, .denominator = 3}, SplitFraction{.numerator = 2, .denominator = 3}};
}

bool qualifies_for_band(const Part& part, SeparationPass pass, int band_begin, int band_end,
                        const SeparationOptions& options) {
    const int cross_extent = pass == SeparationPass::Rows ? part.bounds.height() : part.bounds.width();
    if (cross_extent <= options.min_cross_extent) {
        return false;
    }

    size_t in_band = 0;
    for (const Point& p : part.pixels) {
        const int c = across(p, pass);
        if (c >= band_begin && c < band_end) {
            ++in_band;
        }
    }
    return in_band * 100 >= part.size() * static_cast<size_t>(options.min_band_mass_percent);
}

void cut_part(Raster& raster, const Part& part, SeparationPass pass, int band, double single_extent,
              const SeparationOptions& options, std::vector<BridgeCut>& cuts) {
    const int line_min = pass == SeparationPass::Rows ? part.bounds.min_x : part.bounds.min_y;
    const int line_max = pass == SeparationPass::Rows ? part.bounds.max_x : part.bounds.max_y;
    const int extent = line_max - line_min + 1;

    const std::vector<SplitFraction> fractions = split_fractions(extent, single_extent);
    if (fractions.empty()) {
        return;
    }

    // Member pixels of this part on every line along the cut axis.
    std::vector<int> line_counts(static_cast<size_t>(extent), 0);
    for (const Point& p : part.pixels) {
        ++line_counts[static_cast<size_t>(along(p, pass) - line_min)];
    }
    auto count_at = [&](int line) -> int& {
        return line_counts[static_cast<size_t>(line - line_min)];
    };

    for (const SplitFraction& fraction : fractions) {
        const int expected = line_min + ((extent * fraction.numerator) / fraction.denominator);
        const int window_begin = std::max(line_min, expected - options.search_radius);
        const int window_end = std::min(line_max, expected + options.search_radius);

        int best_line = -1;
        int best_count = 0;
        for (int line = window_begin; line <= window_end; ++line) {
            const int count = count_at(line);
            if (count > 0 && (best_line < 0 || count < best_count)) {
                best_line = line;
                best_count = count;
            }
        }
        if (best_line < 0) {
            continue;
        }

        // Run of lines no wider than the narrowest one. It is only a neck when
        // wider lines of the same part close it on both sides.
        int first = best_line;
        while (first - 1 >= line_min && count_at(first - 1) > 0 && count_at(first - 1) <= best_count) {
            --first;
        }
        int last = best_line;
        while (last + 1 <= line_max && count_at(last + 1) > 0 && count_at(last + 1) <= best_count) {
            ++last;
        }
        const bool closed_left = first - 1 >= line_min && count_at(first - 1) > best_count;
        const bool closed_right = last + 1 <= line_max && count_at(last + 1) > best_count;
        if (!closed_left || !closed_right || last - first + 1 > options.max_neck_length) {
            first = best_line;
            last = best_line;
        }

        size_t erased = 0;
        for (const Point& p : part.pixels) {
            const int a = along(p, pass);
            if (a >= first && a <= last) {
                clear_pixel(raster, p.x, p.y);
                ++erased;
            }
        }
        for (int line = first; line <= last; ++line) {
            count_at(line) = 0;
        }

        cuts.push_back(BridgeCut{
            .pass = pass,
            .band = band,
            .line = best_line,
            .first_line = first,
            .last_line = last,
            .bridge_width = best_count,
            .erased_pixels = erased,
        });
    }
}

} // namespace

std::vector<BridgeCut> separate_bridges_pass(Raster& raster, SeparationPass pass, const SeparationOptions& options) {
    std::vector<BridgeCut> cuts;
    if (raster.empty() || raster.channels <= k_alpha_channel) {
        return cuts;
    }

    const int band_axis_size = pass == SeparationPass::Rows ? raster.height : raster.width;
    const int cut_axis_size = pass == SeparationPass::Rows ? raster.width : raster.height;
    const int band_size = band_axis_size / k_band_count;
    const double cell_size = static_cast<double>(cut_axis_size) / (pass == SeparationPass::Rows ? k_grid_columns : k_grid_rows);
    const double single_extent = cell_size * options.single_extent_fraction;

    for (int band = 0; band < k_band_count; ++band) {
        const int band_begin = band * band_size;
        const int band_end = band == k_band_count - 1 ? band_axis_size : band_begin + band_size;

        // Re-extract so cuts made for earlier bands are already visible.
        const std::vector<Part> parts = extract_parts(raster, options.extract);
        for (const Part& part : parts) {
            if (!qualifies_for_band(part, pass, band_begin, band_end, options)) {
                continue;
            }
            cut_part(raster, part, pass, band, single_extent, options, cuts);
        }
    }

    return cuts;
}

std::vector<BridgeCut> separate_bridges(Raster& raster, const SeparationOptions& options) {
    std::vector<BridgeCut> cuts = separate_bridges_pass(raster, SeparationPass::Rows, options);
    std::vector<BridgeCut> column_cuts = separate_bridges_pass(raster, SeparationPass::Columns, options);
    cuts.insert(cuts.end(), std::make_move_iterator(column_cuts.begin()), std::make_move_iterator(column_cuts.end()));
    return cuts;
}

} // namespace atlasfix::core
