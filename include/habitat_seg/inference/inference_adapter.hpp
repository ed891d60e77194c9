#pragma once

#include "habitat_seg/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace habitat_seg::inference {

// Maps a batch of input tiles (C planes each) to per-class logits (K planes
// each) of the same spatial size, in batch order.
class InferenceAdapter {
public:
    virtual ~InferenceAdapter() = default;

    virtual int num_classes() const = 0;
    virtual int input_channels() const = 0;

    // Square tile size fixed by the model, if any.
    virtual std::optional<int> preferred_tile_size() const { return std::nullopt; }

    // Called once per image before the first infer().
    virtual void prepare(const ImageInfo& info) { (void)info; }

    // Throws InferenceError on failure.
    virtual std::vector<Planes> infer(const std::vector<Planes>& batch) = 0;

    virtual std::string name() const = 0;
};

} // namespace habitat_seg::inference
