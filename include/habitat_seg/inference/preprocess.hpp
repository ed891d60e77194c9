#pragma once

#include "habitat_seg/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace habitat_seg::inference {

enum class Normalization {
    NONE,
    STANDARD,            // (x - mean[c]) / std[c]
    IMAGE,               // per tile mean/std over all channels
    IMAGE_PER_CHANNEL,   // per tile mean/std per channel
    MIN_MAX,             // per tile min/max over all channels
    MIN_MAX_PER_CHANNEL  // per tile min/max per channel
};

Normalization normalization_from_string(const std::string& s);
std::string normalization_to_string(Normalization n);

struct PreprocessParams {
    // nullopt = "auto": derived from the source pixel type
    std::optional<float> max_pixel_value;
    Normalization normalization = Normalization::STANDARD;
    std::vector<float> mean;
    std::vector<float> stddev;
};

float resolve_max_pixel_value(const PreprocessParams& params, PixelType pixel_type);

// Scales every tile by 1 / max_pixel_value and applies the normalization in
// place. Throws ValidationError if mean/std do not match the channel count.
void normalize_batch(std::vector<Planes>& batch, const PreprocessParams& params,
                     PixelType pixel_type);

enum class Activation {
    NONE,
    SIGMOID, // elementwise
    SOFTMAX  // across class planes, per pixel
};

Activation activation_from_string(const std::string& s);
std::string activation_to_string(Activation a);

// Applied to model outputs before blending, so overlapping tiles average
// probabilities rather than logits.
void apply_activation(Planes& logits, Activation activation);

// True when every sample of every plane equals the first one.
bool is_uniform_tile(const Planes& tile);

} // namespace habitat_seg::inference
