#pragma once

#include "habitat_seg/core/types.hpp"

#include <fitsio.h>
#include <memory>
#include <opencv2/core.hpp>

namespace habitat_seg::io {

// Sequential sink for the uint8 label raster. Rows must arrive contiguous,
// non-overlapping and in increasing order starting at row 0; anything else
// throws PipelineError before reaching the backend.
class BandWriter {
public:
    BandWriter(int height, int width);
    virtual ~BandWriter() = default;

    void write_rows(int row_start, const LabelMatrix& labels);
    void close();

    int height() const { return height_; }
    int width() const { return width_; }
    int rows_written() const { return rows_written_; }
    bool complete() const { return rows_written_ == height_; }
    bool closed() const { return closed_; }

protected:
    virtual void do_write_rows(int row_start, const LabelMatrix& labels) = 0;
    virtual void do_close() {}

private:
    int height_;
    int width_;
    int rows_written_ = 0;
    bool closed_ = false;
};

// Streams rows into a BYTE_IMG primary HDU; an existing file is replaced.
class FitsBandWriter : public BandWriter {
public:
    FitsBandWriter(const fs::path& path, int height, int width);
    ~FitsBandWriter() override;

    FitsBandWriter(const FitsBandWriter&) = delete;
    FitsBandWriter& operator=(const FitsBandWriter&) = delete;

    const fs::path& path() const { return path_; }

protected:
    void do_write_rows(int row_start, const LabelMatrix& labels) override;
    void do_close() override;

private:
    fs::path path_;
    fitsfile* fptr_ = nullptr;
};

// Keeps the raster in a CV_8UC1 cv::Mat; with a path it is written with
// cv::imwrite on close (format from the extension).
class MatBandWriter : public BandWriter {
public:
    MatBandWriter(int height, int width, fs::path path = {});

    const cv::Mat& image() const { return image_; }
    const fs::path& path() const { return path_; }

protected:
    void do_write_rows(int row_start, const LabelMatrix& labels) override;
    void do_close() override;

private:
    cv::Mat image_;
    fs::path path_;
};

// Chooses FitsBandWriter for .fit/.fits/.fts, MatBandWriter otherwise.
std::unique_ptr<BandWriter> open_band_writer(const fs::path& path, int height, int width);

} // namespace habitat_seg::io
