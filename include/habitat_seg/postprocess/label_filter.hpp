#pragma once

#include "habitat_seg/config/configuration.hpp"
#include "habitat_seg/core/types.hpp"
#include "habitat_seg/io/band_writer.hpp"

namespace habitat_seg::postprocess {

// Median blur (blur_kernel_size > 1), then morphological open and close with
// a square kernel (morph_kernel_size > 1).
LabelMatrix filter_labels(const LabelMatrix& labels, const config::PostprocessConfig& cfg);

// Rows of context on each side a row needs for filter_labels to give the same
// result as filtering the whole raster.
int halo_rows(const config::PostprocessConfig& cfg);

// Decorator that runs filter_labels over a band stream. Only the halo plus
// the incoming band is held; filtered rows reach `inner` in the same
// contiguous order.
class PostprocessingBandWriter : public io::BandWriter {
public:
    PostprocessingBandWriter(io::BandWriter& inner, const config::PostprocessConfig& cfg);

    int buffered_rows() const { return static_cast<int>(pending_.rows()); }
    int peak_buffered_rows() const { return peak_buffered_; }

protected:
    void do_write_rows(int row_start, const LabelMatrix& labels) override;
    void do_close() override;

private:
    void emit_until(int row_end);

    io::BandWriter& inner_;
    config::PostprocessConfig cfg_;
    int halo_;

    LabelMatrix pending_;
    int pending_start_ = 0;
    int emitted_ = 0;
    int peak_buffered_ = 0;
};

} // namespace habitat_seg::postprocess
