#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace habitat_seg::tiling {

// Maps the blended per-class values of one pixel to an output label.
class LabelDecoder {
public:
    virtual ~LabelDecoder() = default;

    virtual uint8_t decode(const float* values, int num_classes) const = 0;

    // Writes a value vector that decodes back to `label`. Used for tiles whose
    // prediction is known without running the model.
    virtual void encode(uint8_t label, float* values, int num_classes) const = 0;

    virtual std::string name() const = 0;
};

// Highest value wins; on exact ties the lowest class index wins.
class ArgmaxDecoder : public LabelDecoder {
public:
    uint8_t decode(const float* values, int num_classes) const override;
    void encode(uint8_t label, float* values, int num_classes) const override;
    std::string name() const override { return "argmax"; }
};

// Single channel output: label 1 where the value exceeds `threshold`.
// Use 0 for raw logits and 0.5 for probabilities.
class BinaryDecoder : public LabelDecoder {
public:
    explicit BinaryDecoder(float threshold = 0.0f) : threshold_(threshold) {}

    uint8_t decode(const float* values, int num_classes) const override;
    void encode(uint8_t label, float* values, int num_classes) const override;
    std::string name() const override { return "binary"; }

private:
    float threshold_;
};

// Legacy two-stage kelp models: leading presence channel(s) followed by
// species channels. label = presence * (argmax(species) + 1).
// presence_channels == 1: presence where the logit is > 0.
// presence_channels == 2: presence where channel 1 beats channel 0.
class PresenceSpeciesDecoder : public LabelDecoder {
public:
    explicit PresenceSpeciesDecoder(int presence_channels);

    uint8_t decode(const float* values, int num_classes) const override;
    void encode(uint8_t label, float* values, int num_classes) const override;
    std::string name() const override { return "legacy_presence_species"; }

    int presence_channels() const { return presence_channels_; }

private:
    int presence_channels_;
};

// kind: argmax | binary | legacy_presence_species
std::unique_ptr<LabelDecoder> make_label_decoder(const std::string& kind,
                                                 float binary_threshold = 0.0f,
                                                 int presence_channels = 1);

} // namespace habitat_seg::tiling
