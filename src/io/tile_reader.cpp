#include "habitat_seg/io/tile_reader.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstring>

namespace habitat_seg::io {

Planes TileReader::read_window(int row_start, int col_start, int height, int width,
                               const std::vector<int>& band_order, float fill_value) const {
    if (height <= 0 || width <= 0) {
        throw ValidationError("read window must have a positive size");
    }

    std::vector<int> bands = band_order;
    if (bands.empty()) {
        for (int b = 1; b <= num_bands(); ++b) bands.push_back(b);
    }
    for (int b : bands) {
        if (b < 1 || b > num_bands()) {
            throw ValidationError("band " + std::to_string(b) + " out of range for image with " +
                                  std::to_string(num_bands()) + " bands");
        }
    }

    const int r0 = std::max(row_start, 0);
    const int r1 = std::min(row_start + height, this->height());
    const int c0 = std::max(col_start, 0);
    const int c1 = std::min(col_start + width, this->width());

    Planes out;
    out.reserve(bands.size());
    for (int b : bands) {
        Matrix2Df plane = Matrix2Df::Constant(height, width, fill_value);
        if (r1 > r0 && c1 > c0) {
            read_block(b - 1, r0, c0, r1 - r0, c1 - c0, plane, r0 - row_start, c0 - col_start);
        }
        out.push_back(std::move(plane));
    }
    return out;
}

bool is_fits_path(const fs::path& path) {
    const std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::unique_ptr<TileReader> open_tile_reader(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Input image not found: " + path.string());
    }
    if (is_fits_path(path)) {
        return std::make_unique<FitsTileReader>(path);
    }
    return std::make_unique<MatTileReader>(path);
}

// FITS

FitsTileReader::FitsTileReader(const fs::path& path) : path_(path) {
    int status = 0;
    if (fits_open_file(&fptr_, path.string().c_str(), READONLY, &status)) {
        fptr_ = nullptr;
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;
    fits_get_img_param(fptr_, 3, &bitpix, &naxis, naxes, &status);
    int equiv = bitpix;
    fits_get_img_equivtype(fptr_, &equiv, &status);
    if (status) {
        close();
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (naxis < 2 || naxis > 3) {
        close();
        throw FitsError("FITS image must have 2 or 3 axes, got " + std::to_string(naxis) + ": " +
                        path.string());
    }

    width_ = static_cast<int>(naxes[0]);
    height_ = static_cast<int>(naxes[1]);
    bands_ = naxis == 3 ? static_cast<int>(naxes[2]) : 1;

    switch (equiv) {
        case BYTE_IMG: pixel_type_ = PixelType::UINT8; break;
        case SHORT_IMG: pixel_type_ = PixelType::INT16; break;
        case USHORT_IMG: pixel_type_ = PixelType::UINT16; break;
        case FLOAT_IMG: pixel_type_ = PixelType::FLOAT32; break;
        case DOUBLE_IMG: pixel_type_ = PixelType::FLOAT64; break;
        default:
            close();
            throw FitsError("Unsupported FITS pixel type (BITPIX " + std::to_string(equiv) +
                            "), convert to 8 or 16 bit: " + path.string());
    }
}

FitsTileReader::~FitsTileReader() {
    close();
}

void FitsTileReader::close() {
    if (fptr_ != nullptr) {
        int status = 0;
        fits_close_file(fptr_, &status);
        fptr_ = nullptr;
    }
}

void FitsTileReader::read_block(int band, int row, int col, int rows, int cols,
                                Matrix2Df& dst, int dst_row, int dst_col) const {
    if (fptr_ == nullptr) {
        throw FitsError("read from closed FITS file: " + path_.string());
    }

    std::vector<float> buffer(static_cast<size_t>(rows) * static_cast<size_t>(cols));
    long fpixel[3] = {col + 1, row + 1, band + 1};
    long lpixel[3] = {col + cols, row + rows, band + 1};
    long inc[3] = {1, 1, 1};
    float nulval = 0.0f;
    int anynul = 0;
    int status = 0;

    fits_read_subset(fptr_, TFLOAT, fpixel, lpixel, inc, &nulval, buffer.data(), &anynul, &status);
    if (status) {
        char msg[FLEN_STATUS];
        fits_get_errstatus(status, msg);
        throw FitsError("Cannot read FITS subset of " + path_.string() + ": " + msg);
    }

    dst.block(dst_row, dst_col, rows, cols) = Eigen::Map<const Matrix2Df>(buffer.data(), rows, cols);
}

// OpenCV

MatTileReader::MatTileReader(const fs::path& path) {
    image_ = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (image_.empty()) {
        throw IOError("Cannot read image: " + path.string());
    }
    if (image_.channels() == 3) {
        cv::cvtColor(image_, image_, cv::COLOR_BGR2RGB);
    } else if (image_.channels() == 4) {
        cv::cvtColor(image_, image_, cv::COLOR_BGRA2RGBA);
    }
    init();
}

MatTileReader::MatTileReader(cv::Mat image) : image_(std::move(image)) {
    if (image_.empty()) {
        throw IOError("Empty image");
    }
    init();
}

void MatTileReader::init() {
    switch (image_.depth()) {
        case CV_8U: pixel_type_ = PixelType::UINT8; break;
        case CV_16U: pixel_type_ = PixelType::UINT16; break;
        case CV_16S: pixel_type_ = PixelType::INT16; break;
        case CV_32F: pixel_type_ = PixelType::FLOAT32; break;
        case CV_64F: pixel_type_ = PixelType::FLOAT64; break;
        default:
            throw IOError("Unsupported image depth " + std::to_string(image_.depth()) +
                          ", convert to 8 or 16 bit");
    }
}

void MatTileReader::read_block(int band, int row, int col, int rows, int cols,
                               Matrix2Df& dst, int dst_row, int dst_col) const {
    if (image_.empty()) {
        throw IOError("read from closed image");
    }

    const cv::Mat roi = image_(cv::Rect(col, row, cols, rows));
    cv::Mat channel;
    if (image_.channels() > 1) {
        cv::extractChannel(roi, channel, band);
    } else {
        channel = roi;
    }
    cv::Mat f32;
    channel.convertTo(f32, CV_32F);

    for (int r = 0; r < rows; ++r) {
        std::memcpy(&dst(dst_row + r, dst_col), f32.ptr<float>(r),
                    static_cast<size_t>(cols) * sizeof(float));
    }
}

} // namespace habitat_seg::io
