#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace habitat_seg {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using LabelMatrix = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// One plane per band (input) or per class (logits), CHW layout
using Planes = std::vector<Matrix2Df>;

// Source raster sample type
enum class PixelType {
    UINT8,
    UINT16,
    INT16,
    FLOAT32,
    FLOAT64
};

inline std::string pixel_type_to_string(PixelType t) {
    switch (t) {
        case PixelType::UINT8: return "uint8";
        case PixelType::UINT16: return "uint16";
        case PixelType::INT16: return "int16";
        case PixelType::FLOAT32: return "float32";
        case PixelType::FLOAT64: return "float64";
        default: return "unknown";
    }
}

// Largest representable value, used for "auto" input scaling
inline float pixel_type_max_value(PixelType t) {
    switch (t) {
        case PixelType::UINT8: return 255.0f;
        case PixelType::UINT16: return 65535.0f;
        case PixelType::INT16: return 32767.0f;
        default: return 1.0f;
    }
}

// Image-level facts handed to inference adapters before a run
struct ImageInfo {
    int height = 0;
    int width = 0;
    int num_bands = 0;
    PixelType pixel_type = PixelType::UINT8;
};

// Tile window in image coordinates; end bounds are exclusive
struct TileWindow {
    int row_start = 0;
    int row_end = 0;
    int col_start = 0;
    int col_end = 0;
    int band_index = 0;  // Grid row index
    int col_index = 0;   // Grid column index

    int height() const { return row_end - row_start; }
    int width() const { return col_end - col_start; }
};

// Which sides of a tile lie on the image border
struct EdgeFlags {
    bool top = false;
    bool bottom = false;
    bool left = false;
    bool right = false;

    int index() const {
        return (top ? 1 : 0) | (bottom ? 2 : 0) | (left ? 4 : 0) | (right ? 8 : 0);
    }
};

inline EdgeFlags edges_of(const TileWindow& w, int image_height, int image_width) {
    EdgeFlags e;
    e.top = w.row_start == 0;
    e.bottom = w.row_end >= image_height;
    e.left = w.col_start == 0;
    e.right = w.col_end >= image_width;
    return e;
}

// Window taper family
enum class WindowKind {
    BARTLETT_HANN,
    HANN,
    TRIANGULAR,
    BLACKMAN
};

inline std::string window_kind_to_string(WindowKind kind) {
    switch (kind) {
        case WindowKind::BARTLETT_HANN: return "bartlett_hann";
        case WindowKind::HANN: return "hann";
        case WindowKind::TRIANGULAR: return "triangular";
        case WindowKind::BLACKMAN: return "blackman";
        default: return "unknown";
    }
}

// Output of the accumulation register: finished rows of the label raster
struct FinalizedBand {
    int row_start = 0;
    LabelMatrix labels;

    int rows() const { return static_cast<int>(labels.rows()); }
    bool empty() const { return labels.rows() == 0; }
};

// Orchestrator state machine
enum class RunState {
    INIT = 0,
    STREAMING = 1,
    FINAL_FLUSH = 2,
    DONE = 3,
    FAILED = 4
};

inline std::string run_state_to_string(RunState state) {
    switch (state) {
        case RunState::INIT: return "INIT";
        case RunState::STREAMING: return "STREAMING";
        case RunState::FINAL_FLUSH: return "FINAL_FLUSH";
        case RunState::DONE: return "DONE";
        case RunState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline int run_state_to_int(RunState state) {
    return static_cast<int>(state);
}

} // namespace habitat_seg
