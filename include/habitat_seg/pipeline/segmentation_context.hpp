#pragma once

#include "habitat_seg/config/configuration.hpp"
#include "habitat_seg/inference/inference_adapter.hpp"
#include "habitat_seg/model/model_config.hpp"
#include "habitat_seg/tiling/label_decoder.hpp"

#include <memory>

namespace habitat_seg::pipeline {

// Everything a run needs, owned in one place: validated settings, the model
// description, the inference backend and the label decoder.
struct SegmentationContext {
    config::Config config;
    model::ModelConfig model;
    std::unique_ptr<inference::InferenceAdapter> adapter;
    std::unique_ptr<tiling::LabelDecoder> decoder;

    // Validates both configs, verifies the model checksum and opens an
    // ONNX Runtime session.
    static SegmentationContext create(const config::Config& cfg, const model::ModelConfig& model);

    // Same, with a caller-supplied backend.
    static SegmentationContext with_adapter(const config::Config& cfg, const model::ModelConfig& model,
                                            std::unique_ptr<inference::InferenceAdapter> adapter);
};

} // namespace habitat_seg::pipeline
