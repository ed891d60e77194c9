#include "habitat_seg/io/band_writer.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/io/tile_reader.hpp"

#include <opencv2/imgcodecs.hpp>
#include <cstring>
#include <string>
#include <vector>

namespace habitat_seg::io {

BandWriter::BandWriter(int height, int width) : height_(height), width_(width) {
    if (height <= 0 || width <= 0) {
        throw ValidationError("output raster must have a positive size");
    }
}

void BandWriter::write_rows(int row_start, const LabelMatrix& labels) {
    if (closed_) {
        throw PipelineError("write to closed band writer");
    }
    if (labels.rows() == 0) {
        return;
    }
    if (labels.cols() != width_) {
        throw PipelineError("band has " + std::to_string(labels.cols()) + " columns, raster has " +
                            std::to_string(width_));
    }
    if (row_start != rows_written_) {
        throw PipelineError("band starts at row " + std::to_string(row_start) +
                            ", expected row " + std::to_string(rows_written_));
    }
    if (row_start + labels.rows() > height_) {
        throw PipelineError("band rows [" + std::to_string(row_start) + "," +
                            std::to_string(row_start + labels.rows()) + ") exceed raster height " +
                            std::to_string(height_));
    }

    do_write_rows(row_start, labels);
    rows_written_ += static_cast<int>(labels.rows());
}

void BandWriter::close() {
    if (closed_) return;
    closed_ = true;
    do_close();
}

// FITS

FitsBandWriter::FitsBandWriter(const fs::path& path, int height, int width)
    : BandWriter(height, width), path_(path) {
    int status = 0;
    const std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr_, filepath.c_str(), &status)) {
        fptr_ = nullptr;
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {width, height};
    fits_create_img(fptr_, BYTE_IMG, 2, naxes, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr_, &close_status);
        fptr_ = nullptr;
        throw FitsError("Cannot create FITS image: " + path.string());
    }
}

FitsBandWriter::~FitsBandWriter() {
    if (fptr_ != nullptr) {
        int status = 0;
        fits_close_file(fptr_, &status);
        fptr_ = nullptr;
    }
}

void FitsBandWriter::do_write_rows(int row_start, const LabelMatrix& labels) {
    std::vector<unsigned char> buffer(labels.data(), labels.data() + labels.size());
    long fpixel[2] = {1, row_start + 1};
    int status = 0;
    fits_write_pix(fptr_, TBYTE, fpixel, static_cast<LONGLONG>(buffer.size()), buffer.data(), &status);
    if (status) {
        char msg[FLEN_STATUS];
        fits_get_errstatus(status, msg);
        throw FitsError("Cannot write rows to " + path_.string() + ": " + msg);
    }
}

void FitsBandWriter::do_close() {
    if (fptr_ == nullptr) return;
    int status = 0;
    fits_close_file(fptr_, &status);
    fptr_ = nullptr;
    if (status) {
        throw FitsError("Cannot close FITS file: " + path_.string());
    }
}

// OpenCV

MatBandWriter::MatBandWriter(int height, int width, fs::path path)
    : BandWriter(height, width),
      image_(height, width, CV_8UC1, cv::Scalar(0)),
      path_(std::move(path)) {}

void MatBandWriter::do_write_rows(int row_start, const LabelMatrix& labels) {
    for (int r = 0; r < labels.rows(); ++r) {
        std::memcpy(image_.ptr<uint8_t>(row_start + r), labels.data() + static_cast<size_t>(r) * labels.cols(),
                    static_cast<size_t>(labels.cols()));
    }
}

void MatBandWriter::do_close() {
    if (path_.empty()) return;
    if (!cv::imwrite(path_.string(), image_)) {
        throw IOError("Cannot write image: " + path_.string());
    }
}

std::unique_ptr<BandWriter> open_band_writer(const fs::path& path, int height, int width) {
    if (is_fits_path(path)) {
        return std::make_unique<FitsBandWriter>(path, height, width);
    }
    return std::make_unique<MatBandWriter>(height, width, path);
}

} // namespace habitat_seg::io
