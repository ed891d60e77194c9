#include "habitat_seg/tiling/window_function.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace habitat_seg::tiling {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Every taper is sampled at pixel centres, t = (i + 0.5) / n, so both ends
// stay strictly positive and w[i] == w[n - 1 - i].
double sample_centre(int i, int n) {
    return (static_cast<double>(i) + 0.5) / n;
}

// Ha & Pearce (1989)
double bartlett_hann(int i, int n) {
    const double x = std::fabs(sample_centre(i, n) - 0.5);
    return 0.62 - 0.48 * x + 0.38 * std::cos(2.0 * kPi * x);
}

double hann(int i, int n) {
    return 0.5 * (1.0 - std::cos(2.0 * kPi * sample_centre(i, n)));
}

double triangular(int i, int n) {
    return 1.0 - std::fabs(2.0 * sample_centre(i, n) - 1.0);
}

double blackman(int i, int n) {
    const double t = sample_centre(i, n);
    return 0.42 - 0.5 * std::cos(2.0 * kPi * t) + 0.08 * std::cos(4.0 * kPi * t);
}

std::vector<float> flatten_halves(std::vector<float> w, bool low, bool high) {
    const size_t half = w.size() / 2;
    if (low) std::fill(w.begin(), w.begin() + static_cast<long>(half), 1.0f);
    if (high) std::fill(w.begin() + static_cast<long>(half), w.end(), 1.0f);
    return w;
}

} // namespace

WindowKind window_kind_from_string(const std::string& s) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "bartlett_hann" || norm == "bartlett-hann") return WindowKind::BARTLETT_HANN;
    if (norm == "hann") return WindowKind::HANN;
    if (norm == "triangular") return WindowKind::TRIANGULAR;
    if (norm == "blackman") return WindowKind::BLACKMAN;
    throw ConfigError("Unknown window function: " + s);
}

std::vector<float> make_window(int size, WindowKind kind) {
    if (size <= 0) {
        throw ValidationError("window size must be >= 1, got " + std::to_string(size));
    }
    if (size == 1) {
        return {1.0f};
    }

    std::vector<double> raw(static_cast<size_t>(size));
    for (int i = 0; i < size; ++i) {
        double v = 0.0;
        switch (kind) {
            case WindowKind::BARTLETT_HANN: v = bartlett_hann(i, size); break;
            case WindowKind::HANN: v = hann(i, size); break;
            case WindowKind::TRIANGULAR: v = triangular(i, size); break;
            case WindowKind::BLACKMAN: v = blackman(i, size); break;
        }
        raw[static_cast<size_t>(i)] = v;
    }

    const double peak = *std::max_element(raw.begin(), raw.end());
    std::vector<float> w(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        w[i] = peak > 0.0 ? static_cast<float>(raw[i] / peak) : 1.0f;
    }
    return w;
}

Matrix2Df make_2d_window(int size, WindowKind kind, const EdgeFlags& edges) {
    const std::vector<float> base = make_window(size, kind);
    const std::vector<float> wi = flatten_halves(base, edges.top, edges.bottom);
    const std::vector<float> wj = flatten_halves(base, edges.left, edges.right);

    Eigen::Map<const Eigen::VectorXf> vi(wi.data(), size);
    Eigen::Map<const Eigen::RowVectorXf> vj(wj.data(), size);
    Matrix2Df mask = vi * vj;
    return mask;
}

WindowCache::WindowCache(int size, WindowKind kind, bool edge_aware)
    : size_(size), kind_(kind), edge_aware_(edge_aware) {}

const Matrix2Df& WindowCache::get(const EdgeFlags& edges) {
    const EdgeFlags key = edge_aware_ ? edges : EdgeFlags{};
    auto& slot = cache_[static_cast<size_t>(key.index())];
    if (!slot) {
        slot = make_2d_window(size_, kind_, key);
    }
    return *slot;
}

} // namespace habitat_seg::tiling
