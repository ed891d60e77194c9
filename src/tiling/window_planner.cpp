#include "habitat_seg/tiling/window_planner.hpp"
#include "habitat_seg/core/errors.hpp"

#include <algorithm>
#include <string>

namespace habitat_seg::tiling {

namespace {

bool axis_covered(const std::vector<int>& starts, int tile_len, int extent) {
    int covered_to = 0;
    for (int s : starts) {
        if (s > covered_to) return false;
        covered_to = std::max(covered_to, s + tile_len);
    }
    return covered_to >= extent;
}

} // namespace

WindowPlanner::WindowPlanner(int height, int width, int crop_size, int stride)
    : height_(height), width_(width), crop_size_(crop_size), stride_(stride) {
    if (height <= 0 || width <= 0) {
        throw ConfigError("image dimensions must be positive, got " +
                          std::to_string(height) + "x" + std::to_string(width));
    }
    if (crop_size <= 0 || (crop_size % 2) != 0) {
        throw ConfigError("crop_size must be a positive even integer, got " +
                          std::to_string(crop_size));
    }
    if (stride_ <= 0) {
        stride_ = crop_size / 2;
    }
    if (stride_ > crop_size) {
        throw ConfigError("stride must not exceed crop_size (" + std::to_string(stride_) +
                          " > " + std::to_string(crop_size) + ")");
    }

    row_starts_ = axis_starts(height_, crop_size_, stride_);
    col_starts_ = axis_starts(width_, crop_size_, stride_);
}

std::vector<int> WindowPlanner::axis_starts(int extent, int crop_size, int stride) {
    std::vector<int> starts;
    if (extent <= crop_size) {
        starts.push_back(0);
        return starts;
    }
    int s = 0;
    while (s + crop_size < extent) {
        starts.push_back(s);
        s += stride;
    }
    starts.push_back(extent - crop_size);
    return starts;
}

TileWindow WindowPlanner::at(size_t index) const {
    const size_t n_cols = col_starts_.size();
    const size_t r = index / n_cols;
    const size_t c = index % n_cols;

    TileWindow w;
    w.band_index = static_cast<int>(r);
    w.col_index = static_cast<int>(c);
    w.row_start = row_starts_[r];
    w.col_start = col_starts_[c];
    w.row_end = w.row_start + tile_height();
    w.col_end = w.col_start + tile_width();
    return w;
}

bool validate_full_coverage(const WindowPlanner& planner) {
    return axis_covered(planner.row_starts(), planner.tile_height(), planner.height()) &&
           axis_covered(planner.col_starts(), planner.tile_width(), planner.width());
}

} // namespace habitat_seg::tiling
