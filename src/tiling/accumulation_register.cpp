#include "habitat_seg/tiling/accumulation_register.hpp"
#include "habitat_seg/core/errors.hpp"

#include <algorithm>
#include <string>

namespace habitat_seg::tiling {

AccumulationRegister::AccumulationRegister(int image_width, int image_height,
                                           int num_classes, int crop_size, int stride,
                                           const LabelDecoder& decoder,
                                           uint8_t nodata_value)
    : image_width_(image_width),
      image_height_(image_height),
      num_classes_(num_classes),
      decoder_(decoder),
      nodata_value_(nodata_value) {
    if (image_width <= 0 || image_height <= 0) {
        throw ConfigError("register needs a positive image size");
    }
    if (num_classes < 1) {
        throw ConfigError("num_classes must be >= 1, got " + std::to_string(num_classes));
    }
    if (crop_size <= 0) {
        throw ConfigError("crop_size must be positive");
    }
    if (stride <= 0) stride = crop_size / 2;

    register_height_ = crop_size + stride;
    capacity_ = std::min(register_height_, image_height_);

    sums_.assign(static_cast<size_t>(num_classes_), Matrix2Df::Zero(capacity_, image_width_));
    weights_ = Matrix2Df::Zero(capacity_, image_width_);
}

void AccumulationRegister::accumulate(const TileWindow& window, const Planes& logits,
                                      const Matrix2Df& weight_mask) {
    const int h = window.height();
    const int w = window.width();

    if (window.row_start < base_row_) {
        throw InternalConsistencyError(
            "tile at row " + std::to_string(window.row_start) +
            " arrived after rows up to " + std::to_string(base_row_) + " were finalized");
    }
    if (window.row_end > base_row_ + capacity_ || window.row_end > image_height_) {
        throw InternalConsistencyError(
            "tile rows [" + std::to_string(window.row_start) + "," + std::to_string(window.row_end) +
            ") exceed the resident register range [" + std::to_string(base_row_) + "," +
            std::to_string(base_row_ + capacity_) + ")");
    }
    if (h <= 0 || w <= 0 || window.col_start < 0 || window.col_end > image_width_) {
        throw InternalConsistencyError("tile columns out of image bounds");
    }
    if (static_cast<int>(logits.size()) != num_classes_) {
        throw InternalConsistencyError(
            "expected " + std::to_string(num_classes_) + " logit planes, got " +
            std::to_string(logits.size()));
    }
    if (weight_mask.rows() < h || weight_mask.cols() < w) {
        throw InternalConsistencyError("weight mask smaller than tile");
    }
    for (const auto& plane : logits) {
        if (plane.rows() < h || plane.cols() < w) {
            throw InternalConsistencyError("logit plane smaller than tile");
        }
    }

    for (int lr = 0; lr < h; ++lr) {
        const int pr = physical_row(window.row_start + lr);
        const auto mask_row = weight_mask.row(lr).head(w);
        for (int k = 0; k < num_classes_; ++k) {
            sums_[static_cast<size_t>(k)].row(pr).segment(window.col_start, w) +=
                logits[static_cast<size_t>(k)].row(lr).head(w).cwiseProduct(mask_row);
        }
        weights_.row(pr).segment(window.col_start, w) += mask_row;
    }

    high_row_ = std::max(high_row_, window.row_end);
    peak_resident_ = std::max(peak_resident_, resident_rows());
}

FinalizedBand AccumulationRegister::finalize_band(int up_to_row) {
    FinalizedBand band;
    band.row_start = base_row_;

    const int end = std::min(up_to_row, image_height_);
    if (end <= base_row_) {
        band.labels.resize(0, image_width_);
        return band;
    }

    band.labels.resize(end - base_row_, image_width_);
    std::vector<float> values(static_cast<size_t>(num_classes_));

    for (int row = base_row_; row < end; ++row) {
        const int pr = physical_row(row);
        const int out_r = row - base_row_;
        for (int c = 0; c < image_width_; ++c) {
            const float wsum = weights_(pr, c);
            if (wsum > 0.0f) {
                for (int k = 0; k < num_classes_; ++k) {
                    values[static_cast<size_t>(k)] = sums_[static_cast<size_t>(k)](pr, c) / wsum;
                }
                band.labels(out_r, c) = decoder_.decode(values.data(), num_classes_);
            } else {
                band.labels(out_r, c) = nodata_value_;
                ++nodata_pixels_;
            }
        }
        for (auto& plane : sums_) {
            plane.row(pr).setZero();
        }
        weights_.row(pr).setZero();
    }

    base_row_ = end;
    high_row_ = std::max(high_row_, base_row_);
    return band;
}

} // namespace habitat_seg::tiling
