#include "habitat_seg/postprocess/label_filter.hpp"
#include "habitat_seg/core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace habitat_seg::postprocess {

LabelMatrix filter_labels(const LabelMatrix& labels, const config::PostprocessConfig& cfg) {
    if (labels.size() == 0 || !cfg.enabled()) {
        return labels;
    }

    const int rows = static_cast<int>(labels.rows());
    const int cols = static_cast<int>(labels.cols());
    cv::Mat src(rows, cols, CV_8UC1, const_cast<uint8_t*>(labels.data()));
    cv::Mat work = src.clone();

    if (cfg.apply_median_blur()) {
        cv::medianBlur(work, work, cfg.blur_kernel_size);
    }
    if (cfg.apply_morphology()) {
        cv::Mat kernel = cv::getStructuringElement(
            cv::MORPH_RECT, cv::Size(cfg.morph_kernel_size, cfg.morph_kernel_size));
        cv::morphologyEx(work, work, cv::MORPH_OPEN, kernel);
        cv::morphologyEx(work, work, cv::MORPH_CLOSE, kernel);
    }

    LabelMatrix out(rows, cols);
    cv::Mat dst(rows, cols, CV_8UC1, out.data());
    work.copyTo(dst);
    return out;
}

int halo_rows(const config::PostprocessConfig& cfg) {
    int halo = 0;
    if (cfg.apply_median_blur()) halo += cfg.blur_kernel_size / 2;
    if (cfg.apply_morphology()) halo += 4 * (cfg.morph_kernel_size / 2);
    return halo;
}

PostprocessingBandWriter::PostprocessingBandWriter(io::BandWriter& inner,
                                                   const config::PostprocessConfig& cfg)
    : io::BandWriter(inner.height(), inner.width()),
      inner_(inner),
      cfg_(cfg),
      halo_(halo_rows(cfg)) {
    pending_.resize(0, inner.width());
}

void PostprocessingBandWriter::do_write_rows(int row_start, const LabelMatrix& labels) {
    if (!cfg_.enabled()) {
        inner_.write_rows(row_start, labels);
        emitted_ = row_start + static_cast<int>(labels.rows());
        return;
    }

    if (pending_.rows() == 0) {
        pending_start_ = row_start;
        pending_ = labels;
    } else {
        LabelMatrix joined(pending_.rows() + labels.rows(), pending_.cols());
        joined << pending_, labels;
        pending_.swap(joined);
    }
    peak_buffered_ = std::max(peak_buffered_, static_cast<int>(pending_.rows()));

    const int received = row_start + static_cast<int>(labels.rows());
    emit_until(received >= height() ? height() : received - halo_);
}

void PostprocessingBandWriter::emit_until(int row_end) {
    if (row_end <= emitted_) return;

    const int pending_end = pending_start_ + static_cast<int>(pending_.rows());
    const int ctx_start = std::max(0, emitted_ - halo_);
    const int ctx_end = std::min(height(), row_end + halo_);
    if (ctx_start < pending_start_ || ctx_end > pending_end) {
        throw InternalConsistencyError("post-processing context rows are not buffered");
    }

    const LabelMatrix block = pending_.middleRows(ctx_start - pending_start_, ctx_end - ctx_start);
    const LabelMatrix filtered = filter_labels(block, cfg_);
    inner_.write_rows(emitted_, filtered.middleRows(emitted_ - ctx_start, row_end - emitted_));
    emitted_ = row_end;

    const int keep_from = std::max(pending_start_, emitted_ - halo_);
    LabelMatrix rest = pending_.bottomRows(pending_end - keep_from);
    pending_.swap(rest);
    pending_start_ = keep_from;
}

void PostprocessingBandWriter::do_close() {
    if (cfg_.enabled() && complete()) {
        emit_until(height());
    }
    inner_.close();
}

} // namespace habitat_seg::postprocess
