#pragma once

#include "habitat_seg/core/types.hpp"

#include <fitsio.h>
#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace habitat_seg::io {

// Random-access source raster. Windows may extend past the image; samples
// outside it are set to `fill_value` (boundless read).
class TileReader {
public:
    virtual ~TileReader() = default;

    virtual int height() const = 0;
    virtual int width() const = 0;
    virtual int num_bands() const = 0;
    virtual PixelType pixel_type() const = 0;

    // band_order is 1-based; empty selects every band in file order.
    // Throws ValidationError for band indices outside [1, num_bands].
    Planes read_window(int row_start, int col_start, int height, int width,
                       const std::vector<int>& band_order, float fill_value) const;

    virtual void close() {}

    ImageInfo info() const { return {height(), width(), num_bands(), pixel_type()}; }

protected:
    // Copies the in-image rectangle of 0-based `band` into `dst` at
    // (dst_row, dst_col).
    virtual void read_block(int band, int row, int col, int rows, int cols,
                            Matrix2Df& dst, int dst_row, int dst_col) const = 0;
};

// FITS image or cube (NAXIS3 = bands), read with CFITSIO subset reads.
class FitsTileReader : public TileReader {
public:
    explicit FitsTileReader(const fs::path& path);
    ~FitsTileReader() override;

    FitsTileReader(const FitsTileReader&) = delete;
    FitsTileReader& operator=(const FitsTileReader&) = delete;

    int height() const override { return height_; }
    int width() const override { return width_; }
    int num_bands() const override { return bands_; }
    PixelType pixel_type() const override { return pixel_type_; }

    void close() override;

protected:
    void read_block(int band, int row, int col, int rows, int cols,
                    Matrix2Df& dst, int dst_row, int dst_col) const override;

private:
    fs::path path_;
    fitsfile* fptr_ = nullptr;
    int height_ = 0;
    int width_ = 0;
    int bands_ = 1;
    PixelType pixel_type_ = PixelType::FLOAT32;
};

// Raster held in a cv::Mat (TIFF/PNG/JPEG via cv::imread, or supplied).
// Interleaved channels are exposed as bands in file order (RGB, not BGR).
class MatTileReader : public TileReader {
public:
    explicit MatTileReader(const fs::path& path);
    explicit MatTileReader(cv::Mat image);

    int height() const override { return image_.rows; }
    int width() const override { return image_.cols; }
    int num_bands() const override { return image_.channels(); }
    PixelType pixel_type() const override { return pixel_type_; }

    void close() override { image_.release(); }

protected:
    void read_block(int band, int row, int col, int rows, int cols,
                    Matrix2Df& dst, int dst_row, int dst_col) const override;

private:
    void init();

    cv::Mat image_;
    PixelType pixel_type_ = PixelType::UINT8;
};

bool is_fits_path(const fs::path& path);

// Chooses FitsTileReader for .fit/.fits/.fts, MatTileReader otherwise.
std::unique_ptr<TileReader> open_tile_reader(const fs::path& path);

} // namespace habitat_seg::io
