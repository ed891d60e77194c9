#pragma once

#include "habitat_seg/core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace habitat_seg::tiling {

// Parses a window_function config value; throws ConfigError on unknown names.
WindowKind window_kind_from_string(const std::string& s);

// Symmetric 1D taper of length `size`, peak normalized to 1.0.
// Sampled at pixel centres, so every entry including both ends is strictly
// positive and tiles that only abut still carry weight. size == 1 yields {1.0}.
std::vector<float> make_window(int size, WindowKind kind = WindowKind::BARTLETT_HANN);

// Separable 2D mask: outer product of make_window(size) with itself.
// Sides flagged in `edges` keep full weight over their outer half, so pixels
// on the image border are never weighted towards zero.
Matrix2Df make_2d_window(int size, WindowKind kind = WindowKind::BARTLETT_HANN,
                         const EdgeFlags& edges = EdgeFlags{});

// Per-run cache of the 16 edge variants of one mask size.
class WindowCache {
public:
    WindowCache(int size, WindowKind kind, bool edge_aware);

    const Matrix2Df& get(const EdgeFlags& edges);

    int size() const { return size_; }

private:
    int size_;
    WindowKind kind_;
    bool edge_aware_;
    std::array<std::optional<Matrix2Df>, 16> cache_;
};

} // namespace habitat_seg::tiling
