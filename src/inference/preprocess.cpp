#include "habitat_seg/inference/preprocess.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace habitat_seg::inference {

namespace {

constexpr float kEps = 1e-8f;

void scale_by_range(Planes& tile, float lo, float hi) {
    const float denom = (hi - lo) + kEps;
    for (auto& p : tile) {
        p = (p.array() - lo) / denom;
    }
}

void scale_by_moments(Matrix2Df& plane, float mean, float stddev) {
    plane = (plane.array() - mean) / (stddev + kEps);
}

} // namespace

Normalization normalization_from_string(const std::string& s) {
    const std::string v = core::to_lower(core::trim(s));
    if (v.empty() || v == "none" || v == "null") return Normalization::NONE;
    if (v == "standard") return Normalization::STANDARD;
    if (v == "image") return Normalization::IMAGE;
    if (v == "image_per_channel") return Normalization::IMAGE_PER_CHANNEL;
    if (v == "min_max") return Normalization::MIN_MAX;
    if (v == "min_max_per_channel") return Normalization::MIN_MAX_PER_CHANNEL;
    throw ConfigError("Unknown normalization: " + s);
}

std::string normalization_to_string(Normalization n) {
    switch (n) {
        case Normalization::NONE: return "none";
        case Normalization::STANDARD: return "standard";
        case Normalization::IMAGE: return "image";
        case Normalization::IMAGE_PER_CHANNEL: return "image_per_channel";
        case Normalization::MIN_MAX: return "min_max";
        case Normalization::MIN_MAX_PER_CHANNEL: return "min_max_per_channel";
        default: return "unknown";
    }
}

float resolve_max_pixel_value(const PreprocessParams& params, PixelType pixel_type) {
    if (params.max_pixel_value.has_value()) {
        if (!(*params.max_pixel_value > 0.0f)) {
            throw ValidationError("max_pixel_value must be > 0");
        }
        return *params.max_pixel_value;
    }
    return pixel_type_max_value(pixel_type);
}

void normalize_batch(std::vector<Planes>& batch, const PreprocessParams& params,
                     PixelType pixel_type) {
    const float inv_max = 1.0f / resolve_max_pixel_value(params, pixel_type);

    for (auto& tile : batch) {
        for (auto& p : tile) {
            p *= inv_max;
        }

        const size_t channels = tile.size();
        switch (params.normalization) {
            case Normalization::NONE:
                break;

            case Normalization::STANDARD: {
                if (params.mean.size() != channels || params.stddev.size() != channels) {
                    throw ValidationError(
                        "standard normalization needs " + std::to_string(channels) +
                        " mean/std values, got " + std::to_string(params.mean.size()) + "/" +
                        std::to_string(params.stddev.size()));
                }
                for (size_t c = 0; c < channels; ++c) {
                    if (params.stddev[c] == 0.0f) {
                        throw ValidationError("std must be non-zero (channel " + std::to_string(c) + ")");
                    }
                    tile[c] = (tile[c].array() - params.mean[c]) / params.stddev[c];
                }
                break;
            }

            case Normalization::IMAGE: {
                double sum = 0.0;
                double sum_sq = 0.0;
                double n = 0.0;
                for (const auto& p : tile) {
                    sum += p.cast<double>().sum();
                    sum_sq += p.cast<double>().squaredNorm();
                    n += static_cast<double>(p.size());
                }
                if (n <= 0.0) break;
                const double mean = sum / n;
                const double var = std::max(0.0, sum_sq / n - mean * mean);
                for (auto& p : tile) {
                    scale_by_moments(p, static_cast<float>(mean), static_cast<float>(std::sqrt(var)));
                }
                break;
            }

            case Normalization::IMAGE_PER_CHANNEL: {
                for (auto& p : tile) {
                    if (p.size() == 0) continue;
                    const double mean = p.cast<double>().mean();
                    const double var = (p.cast<double>().array() - mean).square().mean();
                    scale_by_moments(p, static_cast<float>(mean), static_cast<float>(std::sqrt(var)));
                }
                break;
            }

            case Normalization::MIN_MAX: {
                float lo = std::numeric_limits<float>::max();
                float hi = std::numeric_limits<float>::lowest();
                for (const auto& p : tile) {
                    if (p.size() == 0) continue;
                    lo = std::min(lo, p.minCoeff());
                    hi = std::max(hi, p.maxCoeff());
                }
                if (lo > hi) break;
                scale_by_range(tile, lo, hi);
                break;
            }

            case Normalization::MIN_MAX_PER_CHANNEL: {
                for (auto& p : tile) {
                    if (p.size() == 0) continue;
                    const float lo = p.minCoeff();
                    const float hi = p.maxCoeff();
                    p = (p.array() - lo) / ((hi - lo) + kEps);
                }
                break;
            }
        }
    }
}

Activation activation_from_string(const std::string& s) {
    const std::string v = core::to_lower(core::trim(s));
    if (v.empty() || v == "none" || v == "null") return Activation::NONE;
    if (v == "sigmoid") return Activation::SIGMOID;
    if (v == "softmax") return Activation::SOFTMAX;
    throw ConfigError("Unknown activation: " + s);
}

std::string activation_to_string(Activation a) {
    switch (a) {
        case Activation::NONE: return "none";
        case Activation::SIGMOID: return "sigmoid";
        case Activation::SOFTMAX: return "softmax";
        default: return "unknown";
    }
}

void apply_activation(Planes& logits, Activation activation) {
    if (activation == Activation::NONE || logits.empty()) return;

    if (activation == Activation::SIGMOID) {
        for (auto& p : logits) {
            p = 1.0f / (1.0f + (-p.array()).exp());
        }
        return;
    }

    // Softmax with the per-pixel max subtracted for stability
    Matrix2Df peak = logits.front();
    for (size_t k = 1; k < logits.size(); ++k) {
        peak = peak.cwiseMax(logits[k]);
    }
    Matrix2Df total = Matrix2Df::Zero(peak.rows(), peak.cols());
    for (auto& p : logits) {
        p = (p - peak).array().exp();
        total += p;
    }
    for (auto& p : logits) {
        p = p.cwiseQuotient(total);
    }
}

bool is_uniform_tile(const Planes& tile) {
    if (tile.empty() || tile.front().size() == 0) return true;
    const float first = tile.front()(0, 0);
    for (const auto& p : tile) {
        if ((p.array() != first).any()) return false;
    }
    return true;
}

} // namespace habitat_seg::inference
