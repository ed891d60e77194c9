#pragma once

#include "habitat_seg/core/types.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <vector>

namespace habitat_seg::tiling {

// Enumerates the crop_size x crop_size windows covering an image in
// row-major order. Offsets advance by `stride`; the last row/column of tiles
// is shifted inward to end exactly at the image border instead of shrinking.
// Along an axis shorter than crop_size a single tile spans the whole axis.
//
// The planner holds no iteration state: windows are computed from their
// index, so iterating twice yields the same sequence.
class WindowPlanner {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = TileWindow;
        using difference_type = std::ptrdiff_t;
        using pointer = const TileWindow*;
        using reference = TileWindow;

        const_iterator() = default;
        const_iterator(const WindowPlanner* planner, size_t index)
            : planner_(planner), index_(index) {}

        TileWindow operator*() const { return planner_->at(index_); }
        const_iterator& operator++() { ++index_; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++index_; return tmp; }
        bool operator==(const const_iterator& o) const { return index_ == o.index_; }
        bool operator!=(const const_iterator& o) const { return index_ != o.index_; }

    private:
        const WindowPlanner* planner_ = nullptr;
        size_t index_ = 0;
    };

    // stride <= 0 selects crop_size / 2. Throws ConfigError on invalid input.
    WindowPlanner(int height, int width, int crop_size, int stride = 0);

    TileWindow at(size_t index) const;
    size_t size() const { return row_starts_.size() * col_starts_.size(); }

    int rows() const { return static_cast<int>(row_starts_.size()); }
    int cols() const { return static_cast<int>(col_starts_.size()); }

    const std::vector<int>& row_starts() const { return row_starts_; }
    const std::vector<int>& col_starts() const { return col_starts_; }

    int height() const { return height_; }
    int width() const { return width_; }
    int crop_size() const { return crop_size_; }
    int stride() const { return stride_; }

    // Tile extent actually inside the image along each axis
    int tile_height() const { return std::min(crop_size_, height_); }
    int tile_width() const { return std::min(crop_size_, width_); }

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, size()); }

    static std::vector<int> axis_starts(int extent, int crop_size, int stride);

private:
    int height_;
    int width_;
    int crop_size_;
    int stride_;
    std::vector<int> row_starts_;
    std::vector<int> col_starts_;
};

// True when the union of all planned windows covers [0,height) x [0,width).
bool validate_full_coverage(const WindowPlanner& planner);

} // namespace habitat_seg::tiling
