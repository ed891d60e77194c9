#pragma once

#include "habitat_seg/core/types.hpp"
#include "habitat_seg/tiling/label_decoder.hpp"

#include <cstdint>
#include <vector>

namespace habitat_seg::tiling {

// Bounded-height accumulator of weighted logits for a horizontal strip of
// the output raster.
//
// Storage is a ring buffer of register_height() = crop_size + stride rows
// (capped at the image height), holding one weighted-sum plane per class and
// one weight-sum plane. Tiles must arrive in planner (row-major) order: a
// tile may only touch rows that are still resident, and finalize_band()
// evicts rows permanently. Resident height therefore stays O(tile height)
// regardless of the image height.
class AccumulationRegister {
public:
    AccumulationRegister(int image_width, int image_height, int num_classes,
                         int crop_size, int stride, const LabelDecoder& decoder,
                         uint8_t nodata_value);

    // sums[k] += logits[k] * mask, weights += mask over the window's extent.
    // `logits` planes and `mask` may be larger than the window (padded reads);
    // their top-left window.height() x window.width() block is used.
    // Throws InternalConsistencyError for evicted or out-of-range rows.
    void accumulate(const TileWindow& window, const Planes& logits,
                    const Matrix2Df& weight_mask);

    // Decodes and evicts every resident row below `up_to_row` (clamped to the
    // image height). Pixels with zero accumulated weight get nodata_value.
    FinalizedBand finalize_band(int up_to_row);

    FinalizedBand finalize_all() { return finalize_band(image_height_); }

    int register_height() const { return register_height_; }
    int capacity_rows() const { return capacity_; }
    int base_row() const { return base_row_; }
    int resident_rows() const { return high_row_ > base_row_ ? high_row_ - base_row_ : 0; }
    int peak_resident_rows() const { return peak_resident_; }
    int64_t nodata_pixel_count() const { return nodata_pixels_; }
    int num_classes() const { return num_classes_; }
    bool complete() const { return base_row_ >= image_height_; }

private:
    int physical_row(int image_row) const { return image_row % capacity_; }

    int image_width_;
    int image_height_;
    int num_classes_;
    int register_height_;
    int capacity_;
    const LabelDecoder& decoder_;
    uint8_t nodata_value_;

    std::vector<Matrix2Df> sums_;
    Matrix2Df weights_;

    int base_row_ = 0;
    int high_row_ = 0;
    int peak_resident_ = 0;
    int64_t nodata_pixels_ = 0;
};

} // namespace habitat_seg::tiling
