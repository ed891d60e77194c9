#include "habitat_seg/tiling/label_decoder.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/utils.hpp"

#include <algorithm>

namespace habitat_seg::tiling {

namespace {

int argmax_lowest(const float* values, int n) {
    int best = 0;
    for (int k = 1; k < n; ++k) {
        if (values[k] > values[best]) best = k;
    }
    return best;
}

} // namespace

uint8_t ArgmaxDecoder::decode(const float* values, int num_classes) const {
    return static_cast<uint8_t>(argmax_lowest(values, num_classes));
}

void ArgmaxDecoder::encode(uint8_t label, float* values, int num_classes) const {
    std::fill(values, values + num_classes, 0.0f);
    const int k = std::min<int>(label, num_classes - 1);
    values[k] = 1.0f;
}

uint8_t BinaryDecoder::decode(const float* values, int num_classes) const {
    (void)num_classes;
    return values[0] > threshold_ ? 1 : 0;
}

void BinaryDecoder::encode(uint8_t label, float* values, int num_classes) const {
    std::fill(values, values + num_classes, threshold_);
    values[0] = label > 0 ? threshold_ + 1.0f : threshold_ - 1.0f;
}

PresenceSpeciesDecoder::PresenceSpeciesDecoder(int presence_channels)
    : presence_channels_(presence_channels) {
    if (presence_channels != 1 && presence_channels != 2) {
        throw ConfigError("presence_channels must be 1 or 2");
    }
}

uint8_t PresenceSpeciesDecoder::decode(const float* values, int num_classes) const {
    const int n_species = num_classes - presence_channels_;
    if (n_species < 1) {
        throw InferenceError("legacy model output needs at least one species channel");
    }
    const bool present = presence_channels_ == 1 ? values[0] > 0.0f : values[1] > values[0];
    if (!present) return 0;
    return static_cast<uint8_t>(argmax_lowest(values + presence_channels_, n_species) + 1);
}

void PresenceSpeciesDecoder::encode(uint8_t label, float* values, int num_classes) const {
    std::fill(values, values + num_classes, 0.0f);
    if (label == 0) {
        values[0] = presence_channels_ == 1 ? -1.0f : 1.0f;
        return;
    }
    if (presence_channels_ == 1) {
        values[0] = 1.0f;
    } else {
        values[1] = 1.0f;
    }
    const int species = std::min<int>(label - 1, num_classes - presence_channels_ - 1);
    values[presence_channels_ + species] = 1.0f;
}

std::unique_ptr<LabelDecoder> make_label_decoder(const std::string& kind,
                                                 float binary_threshold,
                                                 int presence_channels) {
    const std::string norm = core::to_lower(core::trim(kind));
    if (norm.empty() || norm == "argmax") {
        return std::make_unique<ArgmaxDecoder>();
    }
    if (norm == "binary") {
        return std::make_unique<BinaryDecoder>(binary_threshold);
    }
    if (norm == "legacy_presence_species") {
        return std::make_unique<PresenceSpeciesDecoder>(presence_channels);
    }
    throw ConfigError("Unknown decoder: " + kind);
}

} // namespace habitat_seg::tiling
